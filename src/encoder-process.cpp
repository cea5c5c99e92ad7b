#include "encoder-process.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        signal(SIGPIPE, SIG_IGN);
    });
}

bool write_all_fd(int fd, const void * data, size_t n, std::string & err) {
    const char * p = static_cast<const char *>(data);
    while (n > 0) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            err = std::string("write failed: ") + std::strerror(errno);
            return false;
        }
        p += w;
        n -= (size_t) w;
    }
    return true;
}

fd_sink::~fd_sink() {
    close();
}

void fd_sink::reset(int fd) {
    close();
    fd_ = fd;
}

bool fd_sink::write(const uint8_t * data, size_t n, std::string & err) {
    if (fd_ < 0) {
        err = "pipe is closed";
        return false;
    }
    return write_all_fd(fd_, data, n, err);
}

void fd_sink::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

encoder_process::~encoder_process() {
    close_input();
    if (pid_ > 0) {
        kill();
    }
    close_output();
}

bool encoder_process::start(const std::vector<std::string> & argv, std::string & err) {
    if (pid_ > 0) {
        err = "encoder process already running";
        return false;
    }
    if (argv.empty() || argv.front().empty()) {
        err = "encoder command is empty";
        return false;
    }

    ignore_sigpipe();

    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto & a : argv) {
        c_argv.push_back(const_cast<char *>(a.c_str()));
    }
    c_argv.push_back(nullptr);

    // in_pipe: parent -> child stdin, out_pipe: child stdout -> parent,
    // exec_pipe: reports a failed exec (closed on successful exec).
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    };
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        // child: only async-signal-safe calls until exec
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        const int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
        }
        signal(SIGPIPE, SIG_DFL);
        execvp(c_argv[0], c_argv.data());
        const int e = errno;
        (void) ::write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t r = 0;
    do {
        r = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (r < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    pid_ = pid;
    exit_status_ = -1;
    stdin_.reset(in_pipe[1]);
    stdout_fd_ = out_pipe[0];

    if (r > 0) {
        err = "failed to run " + argv.front() + ": " + std::strerror(child_errno);
        close_input();
        reap(true);
        close_output();
        return false;
    }
    return true;
}

ssize_t encoder_process::read_output(uint8_t * buf, size_t cap) {
    if (stdout_fd_ < 0) {
        return 0;
    }
    for (;;) {
        const ssize_t r = ::read(stdout_fd_, buf, cap);
        if (r < 0 && errno == EINTR) {
            continue;
        }
        return r;
    }
}

bool encoder_process::reap(bool block) {
    if (pid_ <= 0) {
        return true;
    }
    int status = 0;
    pid_t r = 0;
    do {
        r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) {
        return false;
    }
    if (r == pid_) {
        exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    }
    pid_ = -1;
    return true;
}

bool encoder_process::wait_for(int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        if (reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void encoder_process::kill() {
    if (pid_ <= 0) {
        return;
    }
    ::kill(pid_, SIGKILL);
    reap(true);
}

void encoder_process::close_output() {
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
}
