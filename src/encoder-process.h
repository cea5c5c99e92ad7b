#pragma once

#include "stream-adapter.h"

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Write end of a pipe as a byte_sink.
class fd_sink : public byte_sink {
public:
    explicit fd_sink(int fd = -1) : fd_(fd) {}
    ~fd_sink() override;

    fd_sink(const fd_sink &) = delete;
    fd_sink & operator=(const fd_sink &) = delete;

    void reset(int fd);
    int fd() const { return fd_; }

    bool write(const uint8_t * data, size_t n, std::string & err) override;
    void close() override;

private:
    int fd_ = -1;
};

// Child process with piped stdin/stdout; stderr goes to /dev/null.
class encoder_process {
public:
    encoder_process() = default;
    ~encoder_process();

    encoder_process(const encoder_process &) = delete;
    encoder_process & operator=(const encoder_process &) = delete;

    bool start(const std::vector<std::string> & argv, std::string & err);

    byte_sink & input() { return stdin_; }
    void close_input() { stdin_.close(); }

    // Reads up to `cap` bytes of the child's stdout. Returns 0 at EOF, -1 on error.
    ssize_t read_output(uint8_t * buf, size_t cap);

    // Waits up to timeout_ms for the child to exit. False on timeout.
    bool wait_for(int timeout_ms);
    // SIGKILL and reap.
    void kill();

    bool running() const { return pid_ > 0; }
    pid_t pid() const { return pid_; }
    int exit_status() const { return exit_status_; }

private:
    pid_t pid_ = -1;
    int exit_status_ = -1;
    fd_sink stdin_;
    int stdout_fd_ = -1;

    bool reap(bool block);
    void close_output();
};

// Full write, retrying on EINTR and short writes.
bool write_all_fd(int fd, const void * data, size_t n, std::string & err);

// Makes writes to closed pipes fail with EPIPE instead of killing the process.
void ignore_sigpipe();
