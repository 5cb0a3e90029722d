#include "devit/proc.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <pthread.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace devit {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

static void close_fd(int* fd) {
    if (*fd >= 0) {
        (void)::close(*fd);
        *fd = -1;
    }
}

std::optional<std::string> which(const std::string& name) {
    if (name.empty()) return std::nullopt;
    auto is_exec = [](const std::string& p) {
        struct stat st{};
        if (::stat(p.c_str(), &st) != 0) return false;
        if (!S_ISREG(st.st_mode)) return false;
        return ::access(p.c_str(), X_OK) == 0;
    };
    if (name.find('/') != std::string::npos) {
        if (is_exec(name)) return name;
        return std::nullopt;
    }
    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (is_exec(cand)) return cand;
    }
    return std::nullopt;
}

ChildProcess::~ChildProcess() {
    reset();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), stdout_fd_(other.stdout_fd_),
      own_group_(other.own_group_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        reset();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        own_group_ = other.own_group_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

void ChildProcess::reset() {
    close_fd(&stdin_fd_);
    close_fd(&stdout_fd_);
    if (running()) {
        kill_group();
        (void)wait();
    }
    pid_ = -1;
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const SpawnOptions& opts, std::string* err) {
    reset();
    reaped_ = false;
    exit_code_ = -1;

    if (argv.empty() || argv[0].empty()) {
        if (err) *err = "empty argv";
        return false;
    }
    auto exe = which(argv[0]);
    if (!exe) {
        if (err) *err = argv[0] + " not found in PATH";
        return false;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    if (opts.pipe_stdin && ::pipe2(in_pipe, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (opts.pipe_stdout && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe(out) failed: ") + std::strerror(errno);
        close_fd(&in_pipe[0]); close_fd(&in_pipe[1]);
        return false;
    }

    // Built before fork: no allocation in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    cargv.push_back(const_cast<char*>(exe->c_str()));
    for (size_t i = 1; i < argv.size(); i++) cargv.push_back(const_cast<char*>(argv[i].c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        close_fd(&in_pipe[0]); close_fd(&in_pipe[1]);
        close_fd(&out_pipe[0]); close_fd(&out_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // child
        if (opts.pipe_stdin) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                (void)dup2(devnull, STDIN_FILENO);
                (void)::close(devnull);
            }
        }
        if (opts.pipe_stdout) (void)dup2(out_pipe[1], STDOUT_FILENO);

        // isolate process group so timeout can kill the whole subtree
        if (opts.new_process_group) (void)setpgid(0, 0);

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        // restore default SIGPIPE for the child even if the parent ignores it
        (void)signal(SIGPIPE, SIG_DFL);

        execv(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    if (opts.new_process_group) (void)setpgid(pid, pid);
    close_fd(&in_pipe[0]);
    close_fd(&out_pipe[1]);
    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    own_group_ = opts.new_process_group;
    return true;
}

int ChildProcess::take_stdin() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::take_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

void ChildProcess::close_stdin() {
    close_fd(&stdin_fd_);
}

void ChildProcess::kill_group() {
    if (!running()) return;
    if (own_group_) (void)::kill(-pid_, SIGKILL);
    (void)::kill(pid_, SIGKILL);
}

int ChildProcess::wait() {
    if (pid_ <= 0) return exit_code_;
    if (reaped_) return exit_code_;
    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid_, &status, 0);
        if (w == pid_) break;
        if (w < 0 && errno == EINTR) continue;
        // ECHILD: reaped elsewhere
        reaped_ = true;
        exit_code_ = 128;
        return exit_code_;
    }
    reaped_ = true;
    exit_code_ = decode_status(status);
    return exit_code_;
}

bool ChildProcess::wait_for(std::chrono::milliseconds timeout, int* exit_code) {
    if (!running()) {
        if (exit_code) *exit_code = exit_code_;
        return true;
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t w = ::waitpid(pid_, &status, WNOHANG);
        if (w == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            if (exit_code) *exit_code = exit_code_;
            return true;
        }
        if (w < 0 && errno != EINTR) {
            reaped_ = true;
            exit_code_ = 128;
            if (exit_code) *exit_code = exit_code_;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

FdLineReader::~FdLineReader() {
    close_fd(&fd_);
}

bool FdLineReader::read_line(std::string* line, std::string* err) {
    while (true) {
        size_t nl = buf_.find('\n');
        if (nl != std::string::npos) {
            if (line) *line = buf_.substr(0, nl);
            buf_.erase(0, nl + 1);
            return true;
        }
        if (eof_ || fd_ < 0) {
            if (!buf_.empty()) {
                // unterminated last line
                if (line) *line = buf_;
                buf_.clear();
                return true;
            }
            if (err) *err = "eof";
            return false;
        }
        char chunk[4096];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buf_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        if (errno == EINTR) continue;
        if (err) *err = std::string("read failed: ") + std::strerror(errno);
        return false;
    }
}

bool read_all_fd(int fd, std::string* out, std::string* err) {
    char buf[8192];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (out) out->append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return true;
        if (errno == EINTR) continue;
        if (err) *err = std::string("read failed: ") + std::strerror(errno);
        return false;
    }
}

bool write_all_fd(int fd, const std::string& data, std::string* err) {
    // SIGPIPE is blocked on this thread for the duration, so a reader that
    // went away shows up as EPIPE instead of killing the process.
    sigset_t pipe_set, old_set, pending;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    sigemptyset(&pending);
    (void)::pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);
    (void)::sigpending(&pending);
    const bool was_pending = sigismember(&pending, SIGPIPE) == 1;

    bool ok = true;
    int saved_errno = 0;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        ok = false;
        saved_errno = errno;
        break;
    }

    if (!ok && saved_errno == EPIPE && !was_pending) {
        const struct timespec zero{0, 0};
        while (::sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {}
    }
    (void)::pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

    if (!ok && err) *err = std::string("write failed: ") + std::strerror(saved_errno);
    return ok;
}

} // namespace devit
