#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace devit {

struct SpawnOptions {
    bool pipe_stdin{false};     // otherwise stdin is /dev/null
    bool pipe_stdout{true};     // otherwise stdout is inherited
    bool new_process_group{true};
};

// Owns one spawned child and the parent ends of its pipes. stderr is always
// inherited. The destructor closes any fds still owned and kills and reaps a
// child that is still running.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // argv[0] is resolved via PATH. Returns false with *err set when the
    // executable cannot be found or pipe/fork fails.
    bool spawn(const std::vector<std::string>& argv, const SpawnOptions& opts, std::string* err);

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }

    // Transfer fd ownership to the caller (-1 if not piped or already taken).
    int take_stdin();
    int take_stdout();
    void close_stdin();

    // SIGKILL to the process group (if any) and to the pid.
    void kill_group();

    // Blocking reap. Returns the exit code (128+signal for signalled children).
    int wait();

    // Reap if the child exits within timeout. Returns false on expiry.
    bool wait_for(std::chrono::milliseconds timeout, int* exit_code);

private:
    void reset();

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    bool own_group_{false};
    bool reaped_{false};
    int exit_code_{-1};
};

// Buffered line reader over an fd it owns.
class FdLineReader {
public:
    explicit FdLineReader(int fd) : fd_(fd) {}
    ~FdLineReader();
    FdLineReader(const FdLineReader&) = delete;
    FdLineReader& operator=(const FdLineReader&) = delete;

    // Next line without its trailing '\n'. Returns false on EOF (err="eof")
    // or read error.
    bool read_line(std::string* line, std::string* err);

private:
    int fd_{-1};
    std::string buf_;
    bool eof_{false};
};

// Read until EOF. Returns false with *err on read error.
bool read_all_fd(int fd, std::string* out, std::string* err);

// Write everything, retrying on EINTR. Returns false with *err on failure.
// A closed reader is reported as EPIPE whatever the process's SIGPIPE
// disposition.
bool write_all_fd(int fd, const std::string& data, std::string* err);

// PATH lookup of an executable (names containing '/' are checked as-is).
std::optional<std::string> which(const std::string& name);

} // namespace devit
