#include "yulid/codec/yulid.h"
#include "yulid/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <cstddef>
#include <functional>

#include <sys/wait.h>
#include <unistd.h>

using namespace yulid::codec;

namespace {

class ThrowingRandomSource final : public yulid::core::IRandomSource {
 public:
  std::size_t uniform_index(std::size_t /*bound*/) override {
    throw yulid::core::RandomSourceError("entropy source unavailable");
  }
};

class ThrowingNonStandardRandomSource final : public yulid::core::IRandomSource {
 public:
  std::size_t uniform_index(std::size_t /*bound*/) override { throw 42; }
};

// Returns bound itself, one past the last valid index.
class OutOfRangeRandomSource final : public yulid::core::IRandomSource {
 public:
  std::size_t uniform_index(std::size_t bound) override { return bound; }
};

// Runs body in a child process and returns its wait status.
// The child exits with status 0 if body returns normally.
int run_in_child(const std::function<void()>& body) {
  const pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    body();
    _exit(0);
  }

  int status = 0;
  REQUIRE(waitpid(pid, &status, 0) == pid);
  return status;
}

bool aborted(int status) {
  return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

}  // namespace

TEST_CASE("create: throwing random source aborts the process", "[yulid][fatal]") {
  const int status = run_in_child([] {
    ThrowingRandomSource rng;
    (void)Yulid::create("JNDE", rng);
  });
  CHECK(aborted(status));
}

TEST_CASE("create: non-standard exception from random source aborts the process",
          "[yulid][fatal]") {
  const int status = run_in_child([] {
    ThrowingNonStandardRandomSource rng;
    (void)Yulid::create("JNDE", rng);
  });
  CHECK(aborted(status));
}

TEST_CASE("create: out-of-range index from random source aborts the process",
          "[yulid][fatal]") {
  const int status = run_in_child([] {
    OutOfRangeRandomSource rng;
    (void)Yulid::create("JNDE", rng);
  });
  CHECK(aborted(status));
}

TEST_CASE("create: invalid prefix returns an error before touching the random source",
          "[yulid][fatal]") {
  const int status = run_in_child([] {
    ThrowingRandomSource rng;
    const auto result = Yulid::create("jnde", rng);
    _exit(result.has_value() ? 1 : 0);
  });
  REQUIRE(WIFEXITED(status));
  CHECK(WEXITSTATUS(status) == 0);
}
