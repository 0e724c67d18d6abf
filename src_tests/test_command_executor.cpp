/**
 * @file test_command_executor.cpp
 * @brief Subprocess bridge tests against a real /bin/sh
 *
 * Covers:
 * - stdout capture and zero exit
 * - Non-zero exit -> ExecutionError with exit code and stderr text
 * - Environment overlay reaches the child without touching the parent
 * - Large interleaved stdout/stderr output does not deadlock
 * - The child runs in its own process group with an empty signal mask
 */

#include <catch2/catch_test_macros.hpp>

#include "vpncheck_engine/client_commands.hpp"
#include "vpncheck_engine/command_executor.hpp"
#include "vpncheck_engine/errors.hpp"

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using vpncheck::engine::CommandExecutor;
using vpncheck::engine::EnvOverrides;
using vpncheck::engine::ExecutionError;
using vpncheck::engine::shell_quote;

namespace {

class BlockedSignal {
public:
    explicit BlockedSignal(int sig) {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, sig);
        ::pthread_sigmask(SIG_BLOCK, &set, &previous_);
    }
    ~BlockedSignal() { ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr); }

    BlockedSignal(const BlockedSignal&) = delete;
    BlockedSignal& operator=(const BlockedSignal&) = delete;

private:
    sigset_t previous_{};
};

}  // namespace

TEST_CASE("CommandExecutor captures stdout of a successful command", "[exec]") {
    CommandExecutor executor;
    CHECK(executor.run("echo hello", {}) == "hello\n");
    CHECK(executor.run("true", {}).empty());
}

TEST_CASE("CommandExecutor reports non-zero exit with stderr", "[exec]") {
    CommandExecutor executor;
    try {
        (void)executor.run("echo partial; echo 'boom' >&2; exit 3", {});
        FAIL("expected ExecutionError");
    } catch (const ExecutionError& ex) {
        CHECK(ex.exit_code() == 3);
        CHECK(ex.stderr_text() == "boom\n");
        CHECK(std::string(ex.what()).find("exit code 3") != std::string::npos);
    }
}

TEST_CASE("CommandExecutor reports an unknown program as a failure", "[exec]") {
    CommandExecutor executor;
    CHECK_THROWS_AS(executor.run("/nonexistent/vpncheck-client account get", {}), ExecutionError);
}

TEST_CASE("CommandExecutor overlays environment variables for the child only", "[exec]") {
    CommandExecutor executor;
    const EnvOverrides env{{"VPNCHECK_TEST_PROXY", "socks5://127.0.0.1:1080"}};

    CHECK(executor.run("printf '%s' \"$VPNCHECK_TEST_PROXY\"", env) == "socks5://127.0.0.1:1080");
    CHECK(std::getenv("VPNCHECK_TEST_PROXY") == nullptr);
    CHECK(executor.run("printf '%s' \"${VPNCHECK_TEST_PROXY:-unset}\"", {}) == "unset");
}

TEST_CASE("CommandExecutor keeps the parent environment and lets overrides win", "[exec]") {
    ::setenv("VPNCHECK_TEST_INHERITED", "parent", 1);
    CommandExecutor executor;

    CHECK(executor.run("printf '%s' \"$VPNCHECK_TEST_INHERITED\"", {}) == "parent");
    CHECK(executor.run("printf '%s' \"$VPNCHECK_TEST_INHERITED\"", {{"VPNCHECK_TEST_INHERITED", "child"}}) ==
          "child");

    const auto env = CommandExecutor::build_environment({{"VPNCHECK_TEST_INHERITED", "child"}});
    CHECK(std::count(env.begin(), env.end(), std::string{"VPNCHECK_TEST_INHERITED=child"}) == 1);
    CHECK(std::count(env.begin(), env.end(), std::string{"VPNCHECK_TEST_INHERITED=parent"}) == 0);
    ::unsetenv("VPNCHECK_TEST_INHERITED");
}

TEST_CASE("CommandExecutor drains large stdout and stderr together", "[exec]") {
    CommandExecutor executor;
    // 200 KiB on each stream is well past a pipe buffer.
    const auto out = executor.run("head -c 204800 /dev/zero | tr '\\0' 'o'; head -c 204800 /dev/zero | tr '\\0' 'e' >&2",
                                  {});
    CHECK(out.size() == 204800);
    CHECK(out.find_first_not_of('o') == std::string::npos);
}

TEST_CASE("shell_quote keeps arguments literal", "[exec]") {
    CommandExecutor executor;
    CHECK(shell_quote("1234") == "'1234'");
    CHECK(executor.run("printf '%s' " + shell_quote("it's $HOME; rm -rf /"), {}) == "it's $HOME; rm -rf /");
}

TEST_CASE("CommandExecutor starts the child in its own process group", "[exec]") {
    CommandExecutor executor;
    // Field 5 of /proc/<pid>/stat is the process group id.
    std::istringstream out(executor.run("echo $$; cut -d' ' -f5 /proc/$$/stat", {}));
    long pid = 0;
    long pgid = 0;
    out >> pid >> pgid;

    REQUIRE(pid > 0);
    CHECK(pgid == pid);
    CHECK(pgid != static_cast<long>(::getpgrp()));
}

TEST_CASE("CommandExecutor clears a signal mask inherited from the caller", "[exec]") {
    BlockedSignal blocked(SIGUSR1);
    CommandExecutor executor;

    const auto hex = executor.run("sed -n 's/^SigBlk:[[:space:]]*//p' /proc/$$/status", {});
    REQUIRE_FALSE(hex.empty());
    const std::uint64_t mask = std::stoull(hex, nullptr, 16);
    CHECK((mask & (std::uint64_t{1} << (SIGUSR1 - 1))) == 0);
}
