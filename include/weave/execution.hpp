#pragma once

// Non-deterministic computation runtime, split by layer:
//   - sender.hpp, factories.hpp, sync_wait.hpp: the base effect type
//   - journal.hpp: decision logs of individual branches
//   - branch.hpp: branching computations and their composition
//   - context.hpp, credit.hpp, channel.hpp: state shared by a run's workers
//   - dispatch.hpp, threads.hpp: credit-gated alternation
//   - run_loop.hpp, drivers.hpp: running a computation to exhaustion
//   - each.hpp, effects.hpp, replay.hpp: lifting sequences and effects,
//     checkpoint and replay

#include "execution/branch.hpp"     // empty, singleton, bind, then
#include "execution/debug_log.hpp"  // WEAVE_DEBUG_LOG
#include "execution/dispatch.hpp"   // alt
#include "execution/drivers.hpp"    // run_asyncly, to_list, *_recorded
#include "execution/each.hpp"       // each
#include "execution/effects.hpp"    // lift, record, pause_branch
#include "execution/factories.hpp"  // just, just_error
#include "execution/replay.hpp"     // play_recording, play_recordings
#include "execution/sync_wait.hpp"  // this_thread::sync_wait
#include "execution/threads.hpp"    // threads
