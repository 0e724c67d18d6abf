#include "vpncheck_engine/command_executor.hpp"
#include "vpncheck_engine/errors.hpp"

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw vpncheck::engine::ExecutionError(
                std::string("pipe2 failed: ") + std::strerror(errno), -1, {});
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const noexcept { return fds_[0]; }
    int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() noexcept {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2]{-1, -1};
};

// Drains both pipes until EOF on each; polling keeps a chatty stderr from blocking stdout.
void drain(Pipe& out_pipe, Pipe& err_pipe, std::string& out_text, std::string& err_text) {
    char buffer[4096];
    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        pollfd fds[2]{};
        nfds_t count = 0;
        if (out_open) fds[count++] = pollfd{out_pipe.read_end(), POLLIN, 0};
        if (err_open) fds[count++] = pollfd{err_pipe.read_end(), POLLIN, 0};

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            const bool is_out = fds[i].fd == out_pipe.read_end();
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (is_out ? out_text : err_text).append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                (is_out ? out_open : err_open) = false;
            }
        }
    }
}

// Child side only: async-signal-safe calls.
void detach_from_caller_signals() {
    // Own process group: a terminal interrupt aimed at the caller does not reach the client.
    ::setpgid(0, 0);

    // Drop an interrupt that was raised while the caller had it blocked, then unblock everything.
    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    struct sigaction deflt{};
    deflt.sa_handler = SIG_DFL;
    sigemptyset(&deflt.sa_mask);
    for (const int sig : {SIGINT, SIGTERM}) {
        ::sigaction(sig, &ignore, nullptr);
        ::sigaction(sig, &deflt, nullptr);
    }

    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

}  // namespace

namespace vpncheck::engine {

CommandExecutor::CommandExecutor(Config cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> CommandExecutor::build_environment(const EnvOverrides& env_overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string kv{*entry};
        const auto pos = kv.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        merged[kv.substr(0, pos)] = kv.substr(pos + 1);
    }
    for (const auto& [key, value] : env_overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::string CommandExecutor::run(const std::string& command, const EnvOverrides& env_overrides) {
    // Everything the child touches is prepared before fork().
    auto env_storage = build_environment(env_overrides);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string shell = cfg_.shell;
    std::string dash_c = "-c";
    std::string command_copy = command;
    char* argv[] = {shell.data(), dash_c.data(), command_copy.data(), nullptr};

    Pipe out_pipe;
    Pipe err_pipe;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ExecutionError(std::string("fork failed: ") + std::strerror(errno), -1, {});
    }

    if (pid == 0) {
        detach_from_caller_signals();
        const int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
            ::close(dev_null);
        }
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        ::execve(shell.c_str(), argv, envp.data());
        _exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();

    std::string out_text;
    std::string err_text;
    drain(out_pipe, err_pipe, out_text, err_text);

    const int exit_code = wait_child(pid);
    if (exit_code != 0) {
        throw ExecutionError("Command '" + command + "' failed with exit code " + std::to_string(exit_code) +
                                 (err_text.empty() ? std::string{} : ": " + err_text),
                             exit_code, err_text);
    }
    return out_text;
}

}  // namespace vpncheck::engine
