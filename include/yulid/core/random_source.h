#pragma once

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace yulid::core {

// RandomSourceError signals that a random source can no longer produce values.
// It is never surfaced to callers of the codec: the codec turns it into a process abort.
class RandomSourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Abstract uniform-index source for dependency injection.
// Production code draws from the OS entropy pool; tests replay fixed sequences.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return a uniformly distributed index in [0, bound).
  // Contract: bound > 0. Throws RandomSourceError if the source is unusable.
  virtual std::size_t uniform_index(std::size_t bound) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source: std::random_device (getrandom / /dev/urandom on Linux) fed through
// std::uniform_int_distribution, which rejects out-of-range draws instead of reducing modulo.
// Thread-safe. Holds no device between calls.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  SystemRandomSource(const SystemRandomSource&) = default;
  SystemRandomSource& operator=(const SystemRandomSource&) = default;
  SystemRandomSource(SystemRandomSource&&) = default;
  SystemRandomSource& operator=(SystemRandomSource&&) = default;

  std::size_t uniform_index(std::size_t bound) override;
};

// Deterministic source: replays a fixed sequence, cycling when exhausted.
// For tests and demos where reproducible output is required.
// Each replayed value is reduced into [0, bound). Thread-safe.
class DeterministicRandomSource final : public IRandomSource {
 public:
  explicit DeterministicRandomSource(std::vector<std::size_t> sequence);
  ~DeterministicRandomSource() override = default;

  // Not copyable or movable (contains atomic cursor)
  DeterministicRandomSource(const DeterministicRandomSource&) = delete;
  DeterministicRandomSource& operator=(const DeterministicRandomSource&) = delete;
  DeterministicRandomSource(DeterministicRandomSource&&) = delete;
  DeterministicRandomSource& operator=(DeterministicRandomSource&&) = delete;

  std::size_t uniform_index(std::size_t bound) override;

  // Number of values drawn so far.
  [[nodiscard]] std::size_t draws() const { return cursor_.load(std::memory_order_relaxed); }

 private:
  std::vector<std::size_t> sequence_;
  std::atomic<std::size_t> cursor_{0};
};

// process_random_source returns the process-wide SystemRandomSource.
IRandomSource& process_random_source();

// fatal_random_source_failure reports the failure on stderr and aborts the process.
// A broken entropy source must never yield an identifier, so there is no recovery path.
[[noreturn]] void fatal_random_source_failure(std::string_view detail);

}  // namespace yulid::core
