#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mediagrab {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr auto kTermGrace = std::chrono::seconds(2);

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw SpawnError(std::string("pipe: ") + std::strerror(errno), false);
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept {
        if (fds_[0] >= 0) ::close(fds_[0]);
        fds_[0] = -1;
    }
    void close_write() noexcept {
        if (fds_[1] >= 0) ::close(fds_[1]);
        fds_[1] = -1;
    }

private:
    int fds_[2] = {-1, -1};
};

// reads what is available; returns false at end of stream
bool drain(const int fd, std::string& sink, const std::size_t limit) {
    char buf[8192];
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        const auto room = limit > sink.size() ? limit - sink.size() : 0;
        sink.append(buf, std::min(room, static_cast<std::size_t>(n)));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

void kill_group(const pid_t pid, const int sig) {
    if (::kill(-pid, sig) != 0) ::kill(pid, sig);
}

// reaps the child, escalating to SIGKILL when SIGTERM is ignored
int terminate_and_reap(const pid_t pid) {
    kill_group(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (waitpid(pid, &status, WNOHANG) == pid) return status;
        usleep(50 * 1000);
    }
    kill_group(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return status;
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) throw SpawnError("no program specified", false);

    Pipe out_pipe;
    Pipe err_pipe;

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.write_end(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.write_end(), STDERR_FILENO);

    // own process group, so a kill also reaches helpers such as ffmpeg
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, argv[0].c_str(), &actions, &attr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    out_pipe.close_write();
    err_pipe.close_write();

    if (rc != 0) {
        throw SpawnError("cannot start " + argv[0] + ": " + std::strerror(rc), rc == ENOENT);
    }
    Logger::log(LogLevel::Debug, "spawned " + argv[0] + " (pid " + std::to_string(pid) + ")", "process");

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (options.stop.stop_requested()) {
            result.cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2] = {
            {out_open ? out_pipe.read_end() : -1, POLLIN, 0},
            {err_open ? err_pipe.read_end() : -1, POLLIN, 0},
        };
        const int ready = ::poll(fds, 2, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Error, std::string("poll failed: ") + std::strerror(errno), "process");
            result.timed_out = true;
            break;
        }
        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(out_pipe.read_end(), result.out, options.max_output);
        }
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(err_pipe.read_end(), result.err, options.max_output);
        }
    }

    int status = 0;
    bool reaped = false;
    // output closed, the process may still be running
    while (!result.cancelled && !result.timed_out && !reaped) {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
        } else if (done < 0 && errno != EINTR) {
            throw SpawnError("waitpid: " + std::string(std::strerror(errno)), false);
        } else if (options.stop.stop_requested()) {
            result.cancelled = true;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
        } else {
            usleep(kPollIntervalMs * 1000);
        }
    }

    if (!reaped) {
        Logger::log(LogLevel::Warning,
                    argv[0] + (result.cancelled ? " cancelled" : " timed out") + ", killing pid " + std::to_string(pid),
                    "process");
        status = terminate_and_reap(pid);
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace mediagrab
