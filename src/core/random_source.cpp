#include "yulid/core/random_source.h"

#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

namespace yulid::core {

std::size_t SystemRandomSource::uniform_index(std::size_t bound) {
  if (bound == 0) {
    throw RandomSourceError("uniform_index called with bound 0");
  }

  try {
    // A fresh device per draw: no shared state, nothing to lock.
    std::random_device device;
    std::uniform_int_distribution<std::size_t> distribution(0, bound - 1);
    return distribution(device);
  } catch (const std::exception& e) {
    // random_device reports construction and read failures as runtime_error/system_error.
    throw RandomSourceError(std::string("entropy source unavailable: ") + e.what());
  }
}

DeterministicRandomSource::DeterministicRandomSource(std::vector<std::size_t> sequence)
    : sequence_(std::move(sequence)) {}

std::size_t DeterministicRandomSource::uniform_index(std::size_t bound) {
  if (bound == 0) {
    throw RandomSourceError("uniform_index called with bound 0");
  }
  if (sequence_.empty()) {
    throw RandomSourceError("deterministic sequence is empty");
  }

  const auto i = cursor_.fetch_add(1, std::memory_order_relaxed);
  return sequence_[i % sequence_.size()] % bound;
}

IRandomSource& process_random_source() {
  static SystemRandomSource source;
  return source;
}

void fatal_random_source_failure(std::string_view detail) {
  std::cerr << "yulid: fatal: random source failure: " << detail << "\n";
  std::abort();
}

}  // namespace yulid::core
