#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <deque>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace weave::execution {

// Raised when a replayed journal does not fit the computation it is played
// against
class journal_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class entry_kind : std::uint8_t {
  choice,  // which side of an alternation the branch took
  effect,  // encoded result of a recorded effect
  pause,   // the branch was checkpointed here
};

inline auto to_string(entry_kind kind) -> std::string_view {
  switch (kind) {
    case entry_kind::choice:
      return "choice";
    case entry_kind::effect:
      return "effect";
    case entry_kind::pause:
      return "pause";
  }
  return "unknown";
}

inline constexpr std::string_view left_choice  = "L";
inline constexpr std::string_view right_choice = "R";

struct journal_entry {
  entry_kind  kind;
  std::string payload;

  auto operator==(const journal_entry&) const -> bool = default;
};

// Ordered decision log of one branch
class journal {
 public:
  using const_iterator = std::vector<journal_entry>::const_iterator;

  journal() = default;

  explicit journal(std::vector<journal_entry> entries) : entries_(std::move(entries)) {}

  void append(journal_entry entry) {
    entries_.push_back(std::move(entry));
  }

  [[nodiscard]] auto entries() const noexcept -> const std::vector<journal_entry>& {
    return entries_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return entries_.empty();
  }

  [[nodiscard]] auto begin() const noexcept -> const_iterator {
    return entries_.begin();
  }

  [[nodiscard]] auto end() const noexcept -> const_iterator {
    return entries_.end();
  }

  auto operator==(const journal&) const -> bool = default;

 private:
  std::vector<journal_entry> entries_;
};

// The journal a recorded run starts from
inline auto blank() -> journal {
  return journal{};
}

// Thrown by a paused branch; carries the journal needed to resume it. Not
// derived from std::exception.
struct branch_paused {
  journal recording;
};

// [journal.codec] Text encoding of recorded effect results. The primary
// template covers streamable types.
template <class T>
struct journal_codec {
  static auto encode(const T& value) -> std::string {
    std::ostringstream out;
    out << value;
    return out.str();
  }

  static auto decode(const std::string& text) -> T {
    std::istringstream in(text);
    T                  value{};
    if (!(in >> value)) {
      throw journal_error("cannot decode recorded effect '" + text + "'");
    }
    return value;
  }
};

template <class T>
  requires std::is_arithmetic_v<T>
struct journal_codec<T> {
  static auto encode(T value) -> std::string {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
      throw journal_error("cannot encode recorded effect");
    }
    return std::string(buffer, ptr);
  }

  static auto decode(const std::string& text) -> T {
    T value{};
    const char* last = text.data() + text.size();
    auto [ptr, ec]   = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
      throw journal_error("cannot decode recorded effect '" + text + "'");
    }
    return value;
  }
};

template <>
struct journal_codec<bool> {
  static auto encode(bool value) -> std::string {
    return value ? "1" : "0";
  }

  static auto decode(const std::string& text) -> bool {
    if (text == "1") {
      return true;
    }
    if (text == "0") {
      return false;
    }
    throw journal_error("cannot decode recorded effect '" + text + "'");
  }
};

template <>
struct journal_codec<std::string> {
  static auto encode(const std::string& value) -> std::string {
    return value;
  }

  static auto decode(const std::string& text) -> std::string {
    return text;
  }
};

// [journal.recorder] The journal collaborator for one branch: the log being
// written and the entries still to be replayed. Copying a recorder forks
// the branch's journal.
class recorder {
 public:
  recorder() = default;

  explicit recorder(bool recording) noexcept : recording_(recording) {}

  [[nodiscard]] auto get_journal() const noexcept -> const journal& {
    return log_;
  }

  void put_journal(journal j) {
    log_ = std::move(j);
  }

  // Replays `j` from the start: the log is rebuilt as entries are consumed
  void play(const journal& j) {
    replay_.assign(j.begin(), j.end());
    log_ = journal{};
  }

  [[nodiscard]] auto recording() const noexcept -> bool {
    return recording_;
  }

  [[nodiscard]] auto replaying() const noexcept -> bool {
    return !replay_.empty();
  }

  // Everything needed to bring a fresh branch back to this point
  [[nodiscard]] auto snapshot() const -> journal {
    journal j = log_;
    for (const auto& entry : replay_) {
      j.append(entry);
    }
    return j;
  }

  // Consumes the next replay entry, which must be of `kind`. Returns nullopt
  // once replay is over.
  auto take(entry_kind kind) -> std::optional<journal_entry> {
    if (replay_.empty()) {
      return std::nullopt;
    }
    if (replay_.front().kind != kind) {
      throw journal_error("journal replay expected " + std::string(to_string(kind))
                          + " entry, found " + std::string(to_string(replay_.front().kind)));
    }
    journal_entry entry = std::move(replay_.front());
    replay_.pop_front();
    note(entry);
    return entry;
  }

  void note(journal_entry entry) {
    if (recording_) {
      log_.append(std::move(entry));
    }
  }

 private:
  journal                   log_;
  std::deque<journal_entry> replay_;
  bool                      recording_ = false;
};

// Runs `fn` once and journals its result, or returns the journaled result
// while replaying
template <class T, class F>
auto record_effect(recorder& rec, F&& fn) -> T {
  if (auto entry = rec.take(entry_kind::effect)) {
    return journal_codec<T>::decode(entry->payload);
  }
  T value = std::invoke(std::forward<F>(fn));
  if (rec.recording()) {
    rec.note(journal_entry{entry_kind::effect, journal_codec<T>::encode(value)});
  }
  return value;
}

// Checkpoint: stops the branch with its journal when recording, continues
// when replaying past it or when nobody records
inline void pause_point(recorder& rec) {
  if (rec.take(entry_kind::pause)) {
    return;
  }
  if (!rec.recording()) {
    return;
  }
  rec.note(journal_entry{entry_kind::pause, {}});
  throw branch_paused{rec.get_journal()};
}

}  // namespace weave::execution
