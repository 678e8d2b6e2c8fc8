#pragma once

#include "CommandSpec.hpp"
#include "Job.hpp"
#include <functional>
#include <memory>
#include <string>

// A forked child in its own process group with its output on pipes
class Subprocess {
public:
    using LineSink = std::function<void(OutputStream, std::string)>;

    // Fork and exec. Exec errors come back through a close-on-exec pipe, so
    // a returned process is really running the command.
    // Throws ReefError(LaunchFailed).
    static std::unique_ptr<Subprocess> spawn(const CommandSpec& command);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    int pid() const { return pid_; }

    // Signal the whole process group; no-op once reaped
    void signal_group(int sig);

    // Non-blocking waitpid; true once the child has exited, with its wait status
    bool try_reap(int& status);

    // Wait up to `timeout_ms` for output and hand complete lines to `sink`.
    // Returns false when nothing was read.
    bool pump(int timeout_ms, const LineSink& sink);

    // Read what is left in the pipes, flush partial lines, close them
    void drain(const LineSink& sink);

private:
    struct Channel {
        int fd = -1;
        OutputStream stream = OutputStream::Stdout;
        std::string partial;
    };

    Subprocess(int pid, int out_fd, int err_fd);

    bool read_channel(Channel& channel, const LineSink& sink);
    void close_channel(Channel& channel, const LineSink& sink);

    int pid_;
    bool reaped_ = false;
    int status_ = 0;
    Channel channels_[2];
};
