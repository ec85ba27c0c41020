#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "credit.hpp"
#include "debug_log.hpp"
#include "journal.hpp"

namespace weave::execution {

// [exec.context] State shared by every worker of one run: the registry of
// dispatched workers, the run's default credit pool, the stop source and the
// recording set collected by recorded runs.
class execution_context {
 public:
  execution_context() : credit_(std::make_shared<credit_pool>(unlimited)) {}

  explicit execution_context(std::size_t credit_limit)
      : credit_(std::make_shared<credit_pool>(credit_limit)) {}

  ~execution_context() {
    shutdown();
  }

  execution_context(const execution_context&)                    = delete;
  auto operator=(const execution_context&) -> execution_context& = delete;

  [[nodiscard]] auto credit() const noexcept -> const std::shared_ptr<credit_pool>& {
    return credit_;
  }

  // Starts `work` on a new worker thread and registers it as pending
  auto dispatch(std::function<void()> work) -> std::uint64_t {
    std::scoped_lock lock(mutex_);
    std::uint64_t    id = next_worker_id_++;
    pending_.emplace(id, std::thread(std::move(work)));
    WEAVE_DEBUG_LOG("dispatched worker %llu (%zu pending)", static_cast<unsigned long long>(id),
                    pending_.size());
    return id;
  }

  // Joins a worker whose contribution has been drained. Workers already
  // collected by shutdown() are skipped.
  void retire(std::uint64_t id) {
    std::thread worker;
    {
      std::scoped_lock lock(mutex_);
      auto             it = pending_.find(id);
      if (it == pending_.end()) {
        return;
      }
      worker = std::move(it->second);
      pending_.erase(it);
    }
    if (worker.joinable()) {
      worker.join();
    }
    WEAVE_DEBUG_LOG("retired worker %llu", static_cast<unsigned long long>(id));
  }

  [[nodiscard]] auto pending() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return pending_.size();
  }

  void request_stop() noexcept {
    stop_source_.request_stop();
  }

  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stop_source_.stop_requested();
  }

  [[nodiscard]] auto get_stop_token() const noexcept -> std::stop_token {
    return stop_source_.get_token();
  }

  // Stops every worker at its next step boundary and joins them
  void shutdown() noexcept {
    request_stop();
    while (true) {
      std::map<std::uint64_t, std::thread> workers;
      {
        std::scoped_lock lock(mutex_);
        workers.swap(pending_);
      }
      if (workers.empty()) {
        break;
      }
      WEAVE_DEBUG_LOG("joining %zu workers on shutdown", workers.size());
      for (auto& [id, worker] : workers) {
        if (worker.joinable()) {
          worker.join();
        }
      }
    }
  }

  // Starts a new run: clears the stop request, the recording set and the
  // recording mode left over from an earlier run on this context
  void begin_run(bool recording) {
    shutdown();
    std::scoped_lock lock(mutex_);
    stop_source_ = std::stop_source{};
    recording_   = recording;
    recordings_.clear();
  }

  [[nodiscard]] auto recording() const noexcept -> bool {
    return recording_;
  }

  // Adds the journal of a paused or pending branch to the recording set
  void save(journal j) {
    std::scoped_lock lock(mutex_);
    WEAVE_DEBUG_LOG("checkpointed branch with %zu journal entries", j.size());
    recordings_.push_back(std::move(j));
  }

  auto take_recordings() -> std::vector<journal> {
    std::scoped_lock lock(mutex_);
    return std::exchange(recordings_, {});
  }

 private:
  std::shared_ptr<credit_pool>         credit_;
  mutable std::mutex                   mutex_;
  std::map<std::uint64_t, std::thread> pending_;
  std::uint64_t                        next_worker_id_ = 0;
  std::stop_source                     stop_source_;
  bool                                 recording_ = false;
  std::vector<journal>                 recordings_;
};

// [exec.cursor] What one worker needs to advance a branch: the run's context,
// the credit pool in scope and the journal of the branch being advanced.
// Forwards the journal collaborator operations to that journal.
class cursor {
 public:
  explicit cursor(execution_context& ctx)
      : ctx_(&ctx), credit_(ctx.credit()), trail_(ctx.recording()) {}

  cursor(execution_context& ctx, std::shared_ptr<credit_pool> credit, recorder trail)
      : ctx_(&ctx), credit_(std::move(credit)), trail_(std::move(trail)) {}

  [[nodiscard]] auto context() const noexcept -> execution_context& {
    return *ctx_;
  }

  [[nodiscard]] auto credit() const noexcept -> const std::shared_ptr<credit_pool>& {
    return credit_;
  }

  void set_credit(std::shared_ptr<credit_pool> credit) noexcept {
    credit_ = std::move(credit);
  }

  [[nodiscard]] auto trail() noexcept -> recorder& {
    return trail_;
  }

  [[nodiscard]] auto trail() const noexcept -> const recorder& {
    return trail_;
  }

  [[nodiscard]] auto get_journal() const noexcept -> const journal& {
    return trail_.get_journal();
  }

  void put_journal(journal j) {
    trail_.put_journal(std::move(j));
  }

  void play(const journal& j) {
    trail_.play(j);
  }

 private:
  execution_context*           ctx_;
  std::shared_ptr<credit_pool> credit_;
  recorder                     trail_;
};

}  // namespace weave::execution
