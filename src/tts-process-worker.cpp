#include "tts-process-worker.h"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using json = nlohmann::ordered_json;

namespace {

enum frame_type : uint8_t {
    FRAME_REQUEST = 1,
    FRAME_STOP    = 2,
    FRAME_READY   = 3,
    FRAME_DATA    = 4,
    FRAME_END     = 5,
    FRAME_ERROR   = 6,
    FRAME_HELLO   = 7,
    FRAME_DONE    = 8,
};

enum frame_result {
    FRAME_RESULT_OK = 0,
    FRAME_RESULT_EOF,
    FRAME_RESULT_TIMEOUT,
    FRAME_RESULT_IO_ERROR,
};

static constexpr uint32_t k_frame_max_payload = 256u * 1024u * 1024u;

static const char * frame_type_to_cstr(uint8_t t) {
    switch (t) {
        case FRAME_REQUEST: return "REQUEST";
        case FRAME_STOP:    return "STOP";
        case FRAME_READY:   return "READY";
        case FRAME_DATA:    return "DATA";
        case FRAME_END:     return "END";
        case FRAME_ERROR:   return "ERROR";
        case FRAME_HELLO:   return "HELLO";
        case FRAME_DONE:    return "DONE";
    }
    return "?";
}

static bool write_frame(int fd, frame_type type, const std::string & payload, std::string & err) {
    uint8_t header[5];
    const uint32_t len = (uint32_t) payload.size();
    header[0] = type;
    std::memcpy(header + 1, &len, sizeof(len));
    if (!write_all_fd(fd, header, sizeof(header), err)) {
        return false;
    }
    return payload.empty() || write_all_fd(fd, payload.data(), payload.size(), err);
}

// timeout_ms < 0 waits forever.
static frame_result read_exact(int fd, void * buf, size_t n, int timeout_ms, std::string & err) {
    char * p = static_cast<char *>(buf);
    size_t got = 0;
    while (got < n) {
        if (timeout_ms >= 0) {
            pollfd pfd {fd, POLLIN, 0};
            const int pr = poll(&pfd, 1, timeout_ms);
            if (pr < 0) {
                if (errno == EINTR) {
                    continue;
                }
                err = std::string("poll failed: ") + std::strerror(errno);
                return FRAME_RESULT_IO_ERROR;
            }
            if (pr == 0) {
                return FRAME_RESULT_TIMEOUT;
            }
        }
        const ssize_t r = ::read(fd, p + got, n - got);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            err = std::string("read failed: ") + std::strerror(errno);
            return FRAME_RESULT_IO_ERROR;
        }
        if (r == 0) {
            return FRAME_RESULT_EOF;
        }
        got += (size_t) r;
    }
    return FRAME_RESULT_OK;
}

// Only the wait for the frame header is bounded by timeout_ms.
static frame_result read_frame(int fd, uint8_t & type, std::string & payload, int timeout_ms, std::string & err) {
    uint8_t header[5];
    frame_result r = read_exact(fd, header, sizeof(header), timeout_ms, err);
    if (r != FRAME_RESULT_OK) {
        return r;
    }
    uint32_t len = 0;
    std::memcpy(&len, header + 1, sizeof(len));
    if (len > k_frame_max_payload) {
        err = "frame too large: " + std::to_string(len);
        return FRAME_RESULT_IO_ERROR;
    }
    type = header[0];
    payload.resize(len);
    if (len == 0) {
        return FRAME_RESULT_OK;
    }
    r = read_exact(fd, &payload[0], len, -1, err);
    if (r == FRAME_RESULT_EOF) {
        err = "truncated frame";
        return FRAME_RESULT_IO_ERROR;
    }
    return r;
}

static void close_inherited_fds(const std::vector<int> & keep) {
    std::vector<int> fds;
    std::error_code ec;
    for (const auto & entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
        const std::string name = entry.path().filename().string();
        char * end = nullptr;
        const long fd = std::strtol(name.c_str(), &end, 10);
        if (end != nullptr && *end == '\0' && fd > STDERR_FILENO) {
            fds.push_back((int) fd);
        }
    }
    for (int fd : fds) {
        if (std::find(keep.begin(), keep.end(), fd) == keep.end()) {
            ::close(fd);
        }
    }
}

static bool parse_request(const std::string & raw, tts_request & req, std::string & err) {
    try {
        const json j = json::parse(raw);
        req.text = j.at("text").get<std::string>();
        req.voice = j.at("voice").get<std::string>();
        req.format = j.at("format").get<std::string>();
        req.chunk_size = j.at("chunk_size").get<size_t>();
        return true;
    } catch (const std::exception & e) {
        err = std::string("invalid request frame: ") + e.what();
        return false;
    }
}

// Body of the worker process. Returns when told to stop or when the parent is gone.
static void run_child(
        int request_fd,
        int stream_fd,
        int status_fd,
        const tts_engine_config & engine_cfg,
        const encoder_registry & encoders,
        const tts_worker_params & params,
        int32_t index) {
    std::string err;
    tts_synth_session session(encoders, params);
    if (!session.init(engine_cfg, err)) {
        std::string werr;
        (void) write_frame(status_fd, FRAME_HELLO, json({{"ok", false}, {"error", err}}).dump(), werr);
        return;
    }
    if (!write_frame(status_fd, FRAME_HELLO,
            json({{"ok", true}, {"version", session.engine_version()}, {"pid", (int) getpid()}}).dump(), err)) {
        return;
    }

    std::mutex stream_mtx;
    std::thread pump;
    bool parent_gone = false;

    auto send_stream = [&](frame_type type, const std::string & payload) {
        std::lock_guard<std::mutex> lock(stream_mtx);
        if (parent_gone) {
            return;
        }
        std::string werr;
        if (!write_frame(stream_fd, type, payload, werr)) {
            std::fprintf(stderr, "worker[%d]: stream %s frame lost: %s\n", index, frame_type_to_cstr(type), werr.c_str());
            parent_gone = true;
        }
    };

    for (;;) {
        uint8_t type = 0;
        std::string payload;
        if (read_frame(request_fd, type, payload, -1, err) != FRAME_RESULT_OK) {
            break;
        }
        if (type == FRAME_STOP) {
            break;
        }
        if (type != FRAME_REQUEST) {
            std::fprintf(stderr, "worker[%d]: unexpected %s frame on request pipe\n", index, frame_type_to_cstr(type));
            continue;
        }

        // the previous output has been consumed by now: the parent only sends a new
        // request once it has read the previous END
        if (pump.joinable()) {
            pump.join();
        }

        tts_request req;
        std::string gen_err;
        bool started = false;
        bool ok = parse_request(payload, req, gen_err);
        if (ok) {
            auto on_ready = [&](const std::shared_ptr<stream_adapter> & output, int32_t sample_rate) {
                send_stream(FRAME_READY, json({{"sample_rate", sample_rate}}).dump());
                pump = std::thread([&send_stream, output]() {
                    for (;;) {
                        std::string chunk = output->read();
                        if (chunk.empty()) {
                            send_stream(FRAME_END, std::string());
                            break;
                        }
                        send_stream(FRAME_DATA, chunk);
                    }
                });
            };
            ok = session.generate(req, on_ready, started, gen_err);
        }
        if (!ok && !started) {
            send_stream(FRAME_ERROR, gen_err);
        } else if (!ok) {
            std::fprintf(stderr, "worker[%d]: generate failed after the stream started: %s\n", index, gen_err.c_str());
        }

        std::string werr;
        if (!write_frame(status_fd, FRAME_DONE, std::string(), werr)) {
            break;
        }
    }

    if (pump.joinable()) {
        pump.join();
    }
    session.release();
}

} // namespace

//
// request_state / relay_source: parent side of one request's output
//

struct tts_process_worker::request_state {
    std::mutex mtx;
    std::condition_variable cv;
    std::shared_ptr<stream_adapter> output = std::make_shared<stream_adapter>();
    bool ready = false;       // READY received
    bool done = false;        // the relay saw the last frame of this request
    bool abandoned = false;   // nobody reads `output` any more
    std::string error;        // before READY: why there is no stream; after: why it was cut
};

class tts_process_worker::relay_source : public tts_stream_source {
public:
    relay_source(std::shared_ptr<request_state> st, tts_process_worker * worker)
        : st_(std::move(st)), worker_(worker) {}

    ~relay_source() override {
        if (!finished_) {
            // the relay still consumes this request's frames, and drops them
            std::lock_guard<std::mutex> lock(st_->mtx);
            st_->abandoned = true;
        }
        finish();
    }

    bool read(std::string & chunk, std::string & err) override {
        chunk.clear();
        if (finished_) {
            return true;
        }
        chunk = st_->output->read();
        if (!chunk.empty()) {
            return true;
        }
        std::string cut;
        {
            std::lock_guard<std::mutex> lock(st_->mtx);
            cut = st_->error;
        }
        finish();
        if (!cut.empty()) {
            err = cut;
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<request_state> st_;
    tts_process_worker * worker_;
    bool finished_ = false;

    void finish() {
        if (!finished_) {
            finished_ = true;
            worker_->finish_reading();
        }
    }
};

//
// tts_process_worker
//

tts_process_worker::tts_process_worker(tts_engine_config engine_cfg, encoder_registry encoders, tts_worker_params params, int32_t index)
    : engine_cfg_(std::move(engine_cfg)),
      encoders_(std::move(encoders)),
      params_(params),
      index_(index) {
}

tts_process_worker::~tts_process_worker() {
    shutdown(true);
    close_fds();
}

pid_t tts_process_worker::pid() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pid_;
}

bool tts_process_worker::start(std::string & err) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (pid_ > 0 || stopping_) {
            err = "worker already started";
            return false;
        }
    }

    ignore_sigpipe();

    int req_pipe[2] = {-1, -1};
    int stream_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_pair = [](int * p) {
        for (int i = 0; i < 2; ++i) {
            if (p[i] >= 0) {
                ::close(p[i]);
                p[i] = -1;
            }
        }
    };
    if (pipe2(req_pipe, O_CLOEXEC) != 0 || pipe2(stream_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(req_pipe);
        close_pair(stream_pipe);
        close_pair(status_pipe);
        return false;
    }

    std::fflush(stdout);
    std::fflush(stderr);

    const pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        close_pair(req_pipe);
        close_pair(stream_pipe);
        close_pair(status_pipe);
        return false;
    }

    if (pid == 0) {
        close_inherited_fds({req_pipe[0], stream_pipe[1], status_pipe[1]});
        run_child(req_pipe[0], stream_pipe[1], status_pipe[1], engine_cfg_, encoders_, params_, index_);
        std::fflush(stderr);
        _exit(0);
    }

    ::close(req_pipe[0]);
    ::close(stream_pipe[1]);
    ::close(status_pipe[1]);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pid_ = pid;
        request_fd_ = req_pipe[1];
    }
    stream_fd_ = stream_pipe[0];
    status_fd_ = status_pipe[0];

    uint8_t type = 0;
    std::string payload;
    std::string rerr;
    const frame_result r = read_frame(status_fd_, type, payload, params_.ready_timeout_ms, rerr);
    bool ok = r == FRAME_RESULT_OK && type == FRAME_HELLO;
    if (ok) {
        try {
            const json hello = json::parse(payload);
            if (!hello.value("ok", false)) {
                err = hello.value("error", std::string("engine initialization failed"));
                ok = false;
            } else {
                engine_version_ = hello.value("version", std::string());
            }
        } catch (const std::exception & e) {
            err = std::string("invalid HELLO frame: ") + e.what();
            ok = false;
        }
    } else {
        err = r == FRAME_RESULT_TIMEOUT ? std::string("worker process did not start in time")
            : r == FRAME_RESULT_EOF     ? std::string("worker process exited during startup")
            : rerr.empty()              ? std::string("unexpected frame during startup")
            : rerr;
    }
    if (!ok) {
        ::kill(pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            pid_ = -1;
        }
        close_fds();
        return false;
    }

    alive_.store(true);
    monitor_ = std::thread(&tts_process_worker::monitor_loop, this);
    std::fprintf(stderr, "worker[%d]: started pid=%d engine=%s\n", index_, (int) pid,
            engine_version_.empty() ? "unknown" : engine_version_.c_str());
    return true;
}

void tts_process_worker::monitor_loop() {
    for (;;) {
        uint8_t type = 0;
        std::string payload;
        std::string err;
        const frame_result r = read_frame(status_fd_, type, payload, -1, err);
        if (r != FRAME_RESULT_OK) {
            break;
        }
        if (type == FRAME_DONE) {
            finish_processing();
        } else {
            std::fprintf(stderr, "worker[%d]: unexpected %s frame on status pipe\n", index_, frame_type_to_cstr(type));
        }
    }
    alive_.store(false);
    processing_.store(false);
    notify_idle();
}

void tts_process_worker::relay_loop(std::shared_ptr<request_state> st) {
    std::string err;
    bool lost = false;
    for (;;) {
        uint8_t type = 0;
        std::string payload;
        const frame_result r = read_frame(stream_fd_, type, payload, -1, err);
        if (r != FRAME_RESULT_OK) {
            lost = r == FRAME_RESULT_EOF;
            break;
        }
        if (type == FRAME_READY) {
            {
                std::lock_guard<std::mutex> lock(st->mtx);
                st->ready = true;
            }
            st->cv.notify_all();
            continue;
        }
        if (type == FRAME_DATA) {
            bool drop = false;
            {
                std::lock_guard<std::mutex> lock(st->mtx);
                drop = st->abandoned;
            }
            if (!drop) {
                st->output->write(std::move(payload));
            }
            continue;
        }
        if (type == FRAME_END) {
            err.clear();
            break;
        }
        if (type == FRAME_ERROR) {
            err = payload.empty() ? std::string("engine produced no audio stream") : payload;
            break;
        }
        std::fprintf(stderr, "worker[%d]: unexpected %s frame in stream, skipped\n", index_, frame_type_to_cstr(type));
    }

    {
        std::lock_guard<std::mutex> lock(st->mtx);
        if (lost) {
            err = st->ready ? "worker process exited during the stream" : "worker process exited";
        }
        st->error = err;
        st->done = true;
    }
    st->output->end();
    st->cv.notify_all();
}

void tts_process_worker::join_relay() {
    std::thread relay;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        relay = std::move(relay_);
    }
    if (relay.joinable()) {
        relay.join();
    }
}

bool tts_process_worker::say(const tts_request & req, tts_stream & out, std::string & err) {
    // a stream still held in `out` belongs to an earlier request
    out.release();
    set_busy();

    auto fail = [&](const std::string & msg, bool request_sent) {
        err = msg;
        if (!request_sent) {
            processing_.store(false);
        }
        finish_reading();
        return false;
    };

    // frames of the previous request must all be read before new ones arrive
    join_relay();

    auto st = std::make_shared<request_state>();
    std::string send_err;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            send_err = "worker is shutting down";
        } else if (!alive_.load() || request_fd_ < 0) {
            send_err = "worker process is not running";
        } else {
            const json j = {
                {"text", req.text},
                {"voice", req.voice},
                {"format", req.format},
                {"chunk_size", req.chunk_size},
            };
            std::string werr;
            if (write_frame(request_fd_, FRAME_REQUEST, j.dump(), werr)) {
                relay_ = std::thread(&tts_process_worker::relay_loop, this, st);
            } else {
                send_err = "failed to send request to worker process: " + werr;
            }
        }
    }
    if (!send_err.empty()) {
        return fail(send_err, false);
    }

    std::unique_lock<std::mutex> lock(st->mtx);
    auto settled = [&]() { return st->ready || st->done; };
    if (params_.ready_timeout_ms < 0) {
        st->cv.wait(lock, settled);
    } else if (!st->cv.wait_for(lock, std::chrono::milliseconds(params_.ready_timeout_ms), settled)) {
        // the child may still answer; the relay drops whatever it sends
        st->abandoned = true;
        lock.unlock();
        return fail("timed out waiting for the audio stream", true);
    }
    if (!st->ready) {
        const std::string msg = st->error.empty() ? std::string("engine produced no audio stream") : st->error;
        lock.unlock();
        return fail(msg, true);
    }
    lock.unlock();

    out = tts_stream(std::make_unique<relay_source>(st, this));
    return true;
}

void tts_process_worker::shutdown(bool abort) {
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (pid_ <= 0 || stopping_) {
            return;
        }
        pid = pid_;
        stopping_ = true;
        if (request_fd_ >= 0) {
            std::string werr;
            if (!write_frame(request_fd_, FRAME_STOP, std::string(), werr)) {
                std::fprintf(stderr, "worker[%d]: failed to send STOP: %s\n", index_, werr.c_str());
            }
            ::close(request_fd_);
            request_fd_ = -1;
        }
    }
    if (abort) {
        ::kill(pid, SIGKILL);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params_.shutdown_timeout_ms);
    int status = 0;
    for (;;) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::fprintf(stderr, "warning: worker[%d] pid=%d did not stop within %d ms, killing it\n",
                    index_, (int) pid, params_.shutdown_timeout_ms);
            ::kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pid_ = -1;
    }

    if (monitor_.joinable()) {
        monitor_.join();
    }
    join_relay();
}

void tts_process_worker::close_fds() {
    for (int * fd : {&request_fd_, &stream_fd_, &status_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}
