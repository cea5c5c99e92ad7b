#include "tts-worker.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <utility>

const char * tts_say_status_to_cstr(tts_say_status s) {
    switch (s) {
        case TTS_SAY_OK:                 return "ok";
        case TTS_SAY_UNSUPPORTED_FORMAT: return "unsupported_format";
        case TTS_SAY_INVALID_REQUEST:    return "invalid_request";
        case TTS_SAY_BUSY:               return "busy";
        case TTS_SAY_FAILED:             return "failed";
    }
    return "unknown";
}

tts_say_status validate_request(const tts_request & req, const encoder_registry & encoders, std::string & err) {
    if (!encoders.supports(req.format)) {
        err = "Unsupported format: " + req.format;
        return TTS_SAY_UNSUPPORTED_FORMAT;
    }
    if (req.chunk_size == 0) {
        err = "chunk_size must be positive";
        return TTS_SAY_INVALID_REQUEST;
    }
    return TTS_SAY_OK;
}

//
// tts_stream
//

bool tts_stream::next(std::string & chunk) {
    chunk.clear();
    if (finished_ || !source_) {
        return false;
    }
    std::string err;
    if (!source_->read(chunk, err)) {
        error_ = err.empty() ? std::string("stream read failed") : err;
        chunk.clear();
        finished_ = true;
        source_.reset();
        return false;
    }
    if (chunk.empty()) {
        finished_ = true;
        source_.reset();
        return false;
    }
    return true;
}

bool tts_stream_to_file(tts_stream & stream, const std::string & path, std::string & err) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    std::string chunk;
    while (stream.next(chunk)) {
        file.write(chunk.data(), (std::streamsize) chunk.size());
        if (!file.good()) {
            err = "failed to write file: " + path;
            return false;
        }
    }
    if (!stream.error().empty()) {
        err = stream.error();
        return false;
    }
    file.flush();
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}

//
// tts_worker
//

void tts_worker::set_busy() {
    processing_.store(true);
    reading_.store(true);
}

void tts_worker::finish_processing() {
    processing_.store(false);
    notify_idle();
}

void tts_worker::finish_reading() {
    reading_.store(false);
    notify_idle();
}

void tts_worker::notify_idle() {
    if (on_idle_) {
        on_idle_();
    }
}

//
// tts_synth_session
//

tts_synth_session::tts_synth_session(encoder_registry encoders, tts_worker_params params)
    : encoders_(std::move(encoders)), params_(params) {
}

tts_synth_session::~tts_synth_session() {
    release();
}

void tts_synth_session::release() {
    close_stream(0);
    engine_.free();
}

bool tts_synth_session::init(const tts_engine_config & cfg, std::string & err) {
    return engine_.init(cfg, on_sample_rate, on_samples, this, err);
}

bool tts_synth_session::generate(const tts_request & req, const ready_fn & on_ready, bool & started, std::string & err) {
    request_ = &req;
    on_ready_ = &on_ready;
    started_ = false;
    stream_err_.clear();

    std::string gen_err;
    bool ok = engine_.set_voice(req.voice, gen_err);
    if (ok) {
        ok = engine_.generate(req.text, gen_err);
    }
    close_stream(params_.encoder_exit_timeout_ms);

    started = started_;
    if (!stream_err_.empty()) {
        err = stream_err_;
        ok = false;
    } else if (!ok) {
        err = gen_err;
    } else if (!started_) {
        err = abort_.load() ? "synthesis aborted" : "engine produced no audio stream";
        ok = false;
    }

    request_ = nullptr;
    on_ready_ = nullptr;
    return ok;
}

bool tts_synth_session::start_stream(int32_t sample_rate) {
    if (request_ == nullptr) {
        std::fprintf(stderr, "warning: sample rate announced outside of a request, ignored\n");
        return false;
    }
    if (started_) {
        // The header is already out; the stream cannot be restarted mid-request.
        if (sample_rate != sample_rate_) {
            std::fprintf(stderr, "warning: engine changed sample rate %d -> %d within one utterance, ignored\n",
                    sample_rate_, sample_rate);
        }
        return !abort_.load();
    }
    if (sample_rate <= 0) {
        stream_err_ = "engine announced invalid sample rate " + std::to_string(sample_rate);
        return false;
    }

    sample_rate_ = sample_rate;
    close_stream(0);

    if (!relay_.open(request_->format, encoders_, request_->chunk_size, stream_err_)) {
        return false;
    }
    if (!framer_.begin(relay_.input(), (uint32_t) sample_rate, stream_err_)) {
        relay_.close(0);
        return false;
    }
    started_ = true;
    (*on_ready_)(relay_.output(), sample_rate);
    return !abort_.load();
}

void tts_synth_session::close_stream(int timeout_ms) {
    framer_.close();
    relay_.close(timeout_ms);
}

bool tts_synth_session::on_sample_rate(int32_t sample_rate, void * user_data) {
    return static_cast<tts_synth_session *>(user_data)->start_stream(sample_rate);
}

bool tts_synth_session::on_samples(const int16_t * samples, size_t n_samples, void * user_data) {
    auto * self = static_cast<tts_synth_session *>(user_data);
    if (!self->framer_.is_open()) {
        // samples before the rate announcement (or after a failed start) have nowhere to go
        return !self->abort_.load() && self->stream_err_.empty();
    }
    std::string err;
    if (!self->framer_.write_samples(samples, n_samples, err)) {
        self->stream_err_ = "failed to write audio: " + err;
        return false;
    }
    return !self->abort_.load();
}

//
// tts_thread_worker
//

struct tts_thread_worker::pending_request {
    tts_request req;
    bool ready = false;
    bool done = false;
    std::string err;
    std::shared_ptr<stream_adapter> output;
};

class tts_thread_worker::adapter_source : public tts_stream_source {
public:
    adapter_source(std::shared_ptr<stream_adapter> output, tts_thread_worker * worker)
        : output_(std::move(output)), worker_(worker) {}

    ~adapter_source() override {
        finish();
    }

    bool read(std::string & chunk, std::string & /* err */) override {
        chunk = output_->read();
        if (chunk.empty()) {
            finish();
        }
        return true;
    }

private:
    std::shared_ptr<stream_adapter> output_;
    tts_thread_worker * worker_;
    bool finished_ = false;

    void finish() {
        if (!finished_) {
            finished_ = true;
            worker_->finish_reading();
        }
    }
};

tts_thread_worker::tts_thread_worker(tts_engine_config engine_cfg, encoder_registry encoders, tts_worker_params params)
    : engine_cfg_(std::move(engine_cfg)),
      params_(params),
      session_(std::make_unique<tts_synth_session>(std::move(encoders), params)) {
}

tts_thread_worker::~tts_thread_worker() {
    shutdown(true);
}

bool tts_thread_worker::start(std::string & err) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (started_) {
            err = "worker already started";
            return false;
        }
        started_ = true;
    }
    thread_ = std::thread(&tts_thread_worker::run, this);

    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&]() { return init_done_; });
    if (!init_err_.empty()) {
        err = init_err_;
        lock.unlock();
        thread_.join();
        return false;
    }
    return true;
}

void tts_thread_worker::run() {
    std::string err;
    const bool ok = session_->init(engine_cfg_, err);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        init_done_ = true;
        init_err_ = ok ? std::string() : (err.empty() ? std::string("engine initialization failed") : err);
        if (!ok) {
            stopping_ = true;
        }
    }
    cv_.notify_all();
    if (!ok) {
        return;
    }

    for (;;) {
        std::shared_ptr<pending_request> p;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&]() { return !queue_.empty(); });
            p = queue_.front();
            queue_.pop_front();
        }
        if (!p) {
            break;
        }

        auto on_ready = [&](const std::shared_ptr<stream_adapter> & output, int32_t /* sample_rate */) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                p->output = output;
                p->ready = true;
            }
            cv_.notify_all();
        };

        bool started = false;
        std::string gen_err;
        const bool gen_ok = session_->generate(p->req, on_ready, started, gen_err);
        if (!gen_ok) {
            std::fprintf(stderr, "worker: generate failed (format=%s voice=%s started=%d): %s\n",
                    p->req.format.c_str(), p->req.voice.c_str(), started ? 1 : 0, gen_err.c_str());
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            p->done = true;
            if (!gen_ok) {
                p->err = gen_err;
            }
        }
        cv_.notify_all();
        finish_processing();
    }
    session_->release();
}

bool tts_thread_worker::say(const tts_request & req, tts_stream & out, std::string & err) {
    // a stream still held in `out` belongs to an earlier request
    out.release();
    set_busy();

    auto p = std::make_shared<pending_request>();
    p->req = req;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!started_ || stopping_) {
            err = "worker is not running";
            processing_.store(false);
            reading_.store(false);
            notify_idle();
            return false;
        }
        queue_.push_back(p);
    }
    cv_.notify_all();

    std::unique_lock<std::mutex> lock(mtx_);
    const bool signalled = cv_.wait_for(lock, std::chrono::milliseconds(params_.ready_timeout_ms), [&]() {
        return p->ready || p->done;
    });
    if (!signalled || !p->ready) {
        err = !signalled ? std::string("timed out waiting for the audio stream")
                         : (p->err.empty() ? std::string("engine produced no audio stream") : p->err);
        lock.unlock();
        finish_reading();
        return false;
    }
    std::shared_ptr<stream_adapter> output = p->output;
    lock.unlock();

    out = tts_stream(std::make_unique<adapter_source>(std::move(output), this));
    return true;
}

void tts_thread_worker::shutdown(bool abort) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!started_) {
            return;
        }
        if (!stopping_) {
            stopping_ = true;
            queue_.push_back(nullptr);
        }
    }
    if (abort) {
        session_->set_abort(true);
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}
