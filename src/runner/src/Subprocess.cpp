#include "Subprocess.hpp"
#include "LogUtils.hpp"
#include "ReefError.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

enum ChildStage : int {
    StageRedirect = 1,
    StageChdir = 2,
    StageExec = 3
};

// Wait status reported when the child was reaped by someone else
constexpr int kLostStatus = 255 << 8;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    void open(const char* what) {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw ReefError(ErrorCode::LaunchFailed,
                            std::string("cannot create ") + what + " pipe: " + std::strerror(errno));
        }
    }

    int take_read_end() {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }
};

// Parent environment with `overrides` replacing or adding entries
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string text(*entry);
        if (overrides.count(text.substr(0, text.find('=')))) continue;
        out.push_back(std::move(text));
    }
    for (const auto& [name, value] : overrides) {
        out.push_back(name + "=" + value);
    }
    return out;
}

std::vector<char*> c_strings(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& item : items) {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

// Child side only: async-signal-safe calls
[[noreturn]] void child_fail(int fd, int stage) {
    int report[2] = {stage, errno};
    if (::write(fd, report, sizeof(report)) < 0) {
        ::_exit(126);
    }
    ::_exit(127);
}

void emit(OutputStream stream, std::string line, const Subprocess::LineSink& sink) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    sink(stream, std::move(line));
}

}

std::unique_ptr<Subprocess> Subprocess::spawn(const CommandSpec& command) {
    if (command.program.empty()) {
        throw ReefError(ErrorCode::LaunchFailed, "no program given");
    }

    std::vector<std::string> arg_storage;
    arg_storage.push_back(command.program);
    arg_storage.insert(arg_storage.end(), command.args.begin(), command.args.end());
    std::vector<std::string> env_storage = build_environment(command.env);
    std::vector<char*> argv = c_strings(arg_storage);
    std::vector<char*> envp = c_strings(env_storage);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    out_pipe.open("stdout");
    if (!command.merge_stderr) {
        err_pipe.open("stderr");
    }
    exec_pipe.open("exec status");

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ReefError(ErrorCode::LaunchFailed, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        // The engine may block signals it handles on a watcher thread
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        const int err_target = command.merge_stderr ? out_pipe.fds[1] : err_pipe.fds[1];
        const int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd < 0 ||
            ::dup2(null_fd, STDIN_FILENO) < 0 ||
            ::dup2(out_pipe.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(err_target, STDERR_FILENO) < 0) {
            child_fail(exec_pipe.fds[1], StageRedirect);
        }
        if (!command.working_dir.empty() && ::chdir(command.working_dir.c_str()) != 0) {
            child_fail(exec_pipe.fds[1], StageChdir);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        child_fail(exec_pipe.fds[1], StageExec);
    }

    // Also set from the parent so the group exists before anyone signals it
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LogUtils::warn("setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    close_fd(out_pipe.fds[1]);
    close_fd(err_pipe.fds[1]);
    close_fd(exec_pipe.fds[1]);

    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(exec_pipe.fds[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        std::string what;
        switch (report[0]) {
            case StageChdir:    what = "cannot change directory to " + command.working_dir; break;
            case StageRedirect: what = "cannot redirect output of " + command.program; break;
            default:            what = "cannot execute " + command.program; break;
        }
        throw ReefError(ErrorCode::LaunchFailed, what + ": " + std::strerror(report[1]), command.program);
    }

    const int err_fd = command.merge_stderr ? -1 : err_pipe.take_read_end();
    return std::unique_ptr<Subprocess>(new Subprocess(pid, out_pipe.take_read_end(), err_fd));
}

Subprocess::Subprocess(int pid, int out_fd, int err_fd)
    : pid_(pid) {
    channels_[0].fd = out_fd;
    channels_[0].stream = OutputStream::Stdout;
    channels_[1].fd = err_fd;
    channels_[1].stream = OutputStream::Stderr;
}

Subprocess::~Subprocess() {
    if (!reaped_) {
        signal_group(SIGKILL);
        while (::waitpid(pid_, &status_, 0) < 0 && errno == EINTR) {
        }
    }
    for (auto& channel : channels_) {
        close_fd(channel.fd);
    }
}

void Subprocess::signal_group(int sig) {
    if (reaped_) {
        return;
    }
    if (::killpg(pid_, sig) != 0 && errno != ESRCH) {
        LogUtils::warn("killpg({}, {}) failed: {}", pid_, sig, std::strerror(errno));
    }
}

bool Subprocess::try_reap(int& status) {
    if (!reaped_) {
        pid_t r;
        do {
            r = ::waitpid(pid_, &status_, WNOHANG);
        } while (r < 0 && errno == EINTR);

        if (r == 0) {
            return false;
        }
        if (r < 0) {
            LogUtils::error("waitpid({}) failed: {}", pid_, std::strerror(errno));
            status_ = kLostStatus;
        }
        reaped_ = true;
    }
    status = status_;
    return true;
}

bool Subprocess::pump(int timeout_ms, const LineSink& sink) {
    pollfd fds[2];
    Channel* owners[2];
    nfds_t count = 0;
    for (auto& channel : channels_) {
        if (channel.fd >= 0) {
            fds[count].fd = channel.fd;
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            owners[count] = &channel;
            ++count;
        }
    }

    if (count == 0) {
        if (timeout_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        }
        return false;
    }

    const int ready = ::poll(fds, count, timeout_ms);
    if (ready < 0 && errno != EINTR) {
        LogUtils::warn("poll on output of pid {} failed: {}", pid_, std::strerror(errno));
    }
    if (ready <= 0) {
        return false;
    }

    bool progressed = false;
    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
            progressed = read_channel(*owners[i], sink) || progressed;
        }
    }
    return progressed;
}

void Subprocess::drain(const LineSink& sink) {
    while (pump(0, sink)) {
    }
    for (auto& channel : channels_) {
        if (channel.fd >= 0) {
            close_channel(channel, sink);
        }
    }
}

bool Subprocess::read_channel(Channel& channel, const LineSink& sink) {
    char buffer[16384];
    const ssize_t n = ::read(channel.fd, buffer, sizeof(buffer));
    if (n > 0) {
        channel.partial.append(buffer, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = channel.partial.find('\n', start)) != std::string::npos) {
            emit(channel.stream, channel.partial.substr(start, nl - start), sink);
            start = nl + 1;
        }
        channel.partial.erase(0, start);
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return false;
    }
    if (n < 0) {
        LogUtils::warn("read from pid {} failed: {}", pid_, std::strerror(errno));
    }
    close_channel(channel, sink);
    return true;
}

void Subprocess::close_channel(Channel& channel, const LineSink& sink) {
    if (!channel.partial.empty()) {
        emit(channel.stream, std::move(channel.partial), sink);
        channel.partial.clear();
    }
    close_fd(channel.fd);
}
