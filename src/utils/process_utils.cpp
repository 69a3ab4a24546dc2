/**
 * @file process_utils.cpp
 * @brief fork/exec child processes with pipe capture and deadlines
 *
 * **Lifecycle**:
 * ```
 * pipes -> fork -> child: setpgid, dup2, chdir, exec
 *               -> parent: exec-status pipe, poll loop, waitpid
 * ```
 *
 * Everything the child touches between fork and exec is prepared in the
 * parent beforehand; the child only makes async-signal-safe calls.
 *
 * An exec failure is reported through a close-on-exec pipe: zero bytes means
 * exec succeeded, sizeof(int) bytes carry the child's errno.
 *
 * @date 2025
 */

#include "scriptjail/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace scriptjail {
namespace utils {

namespace {

// Output still draining after a deadline kill is abandoned after this long
constexpr std::chrono::milliseconds kDrainGrace{2000};

/**
 * @brief Owning file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

void MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int ReapChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::warn("waitpid({}) failed: {}", pid, std::strerror(errno));
            return -1;
        }
    }
    return DecodeWaitStatus(status);
}

void KillGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        ::kill(pid, SIGKILL);
    }
}

} // anonymous namespace

ProcessResult RunProcess(const ProcessOptions& options) {
    if (options.argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    // Everything the child needs, built before fork()
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (options.env) {
        env_strings.reserve(options.env->size());
        for (const auto& [key, value] : *options.env) {
            env_strings.push_back(key + "=" + value);
        }
        for (auto& entry : env_strings) {
            envp.push_back(const_cast<char*>(entry.c_str()));
        }
        envp.push_back(nullptr);
    }

    const std::string working_dir = options.working_dir.string();

    FileDescriptor out_read, out_write;
    FileDescriptor err_read, err_write;
    FileDescriptor status_read, status_write;
    MakePipe(out_read, out_write);
    if (!options.merge_stderr) {
        MakePipe(err_read, err_write);
    }
    MakePipe(status_read, status_write);

    FileDescriptor dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.Valid()) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    spdlog::debug("Spawning: {} ({} args)", options.argv[0], options.argv.size() - 1);

    const auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child
        ::setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(dev_null.Get(), STDIN_FILENO);
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(options.merge_stderr ? out_write.Get() : err_write.Get(), STDERR_FILENO);

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int error = errno;
            (void)!::write(status_write.Get(), &error, sizeof(error));
            ::_exit(127);
        }

        if (options.env) {
            ::execvpe(argv[0], argv.data(), envp.data());
        } else {
            ::execvp(argv[0], argv.data());
        }

        int error = errno;
        (void)!::write(status_write.Get(), &error, sizeof(error));
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    out_write.Reset();
    err_write.Reset();
    status_write.Reset();

    int child_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_read.Get(), &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        ReapChild(pid);
        throw std::system_error(child_errno, std::generic_category(),
                                "failed to execute '" + options.argv[0] + "'");
    }

    ProcessResult result;

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start + *options.timeout;
    }
    std::optional<std::chrono::steady_clock::time_point> drain_deadline;

    struct Stream {
        FileDescriptor* fd;
        std::string* sink;
    };
    std::vector<Stream> streams{{&out_read, &result.stdout_output}};
    if (!options.merge_stderr) {
        streams.push_back({&err_read, &result.stderr_output});
    }

    char buffer[8192];
    for (;;) {
        std::vector<pollfd> fds;
        std::vector<Stream*> polled;
        for (auto& stream : streams) {
            if (stream.fd->Valid()) {
                fds.push_back(pollfd{stream.fd->Get(), POLLIN, 0});
                polled.push_back(&stream);
            }
        }
        if (fds.empty()) {
            break;
        }

        int wait_ms = -1;
        auto now = std::chrono::steady_clock::now();
        if (deadline && !result.timed_out) {
            if (now >= *deadline) {
                spdlog::warn("Deadline reached, killing process group {}", pid);
                result.timed_out = true;
                KillGroup(pid);
                drain_deadline = now + kDrainGrace;
                continue;
            }
            wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - now).count()) + 1;
        } else if (drain_deadline) {
            if (now >= *drain_deadline) {
                spdlog::warn("Abandoning output of process group {} after kill", pid);
                break;
            }
            wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                *drain_deadline - now).count()) + 1;
        }

        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int error = errno;
            KillGroup(pid);
            ReapChild(pid);
            throw std::system_error(error, std::generic_category(), "poll");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                polled[i]->sink->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                polled[i]->fd->Reset();
            }
        }
    }

    if (result.timed_out) {
        KillGroup(pid);
    }
    result.exit_code = ReapChild(pid);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("Process {} exited with {} after {} ms", pid, result.exit_code,
                  result.duration.count());

    return result;
}

std::map<std::string, std::string> CurrentEnvironment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (eq == nullptr || eq == *entry) {
            continue;
        }
        env.emplace(std::string(*entry, static_cast<std::size_t>(eq - *entry)), std::string(eq + 1));
    }
    return env;
}

std::optional<std::filesystem::path> FindExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(name);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t begin = 0;
    while (begin <= search.size()) {
        std::size_t end = search.find(':', begin);
        if (end == std::string::npos) {
            end = search.size();
        }
        std::string dir = search.substr(begin, end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return std::filesystem::absolute(candidate);
        }
        begin = end + 1;
    }

    return std::nullopt;
}

} // namespace utils
} // namespace scriptjail
