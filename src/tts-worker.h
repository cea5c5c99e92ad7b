#pragma once

#include "encoder-registry.h"
#include "encoder-relay.h"
#include "stream-adapter.h"
#include "tts-engine.h"
#include "wav-stream-framer.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct tts_request {
    std::string text;
    std::string voice = "default";
    std::string format = k_native_format;
    size_t chunk_size = k_relay_default_read_size;
};

enum tts_say_status {
    TTS_SAY_OK = 0,
    TTS_SAY_UNSUPPORTED_FORMAT = 1,
    TTS_SAY_INVALID_REQUEST = 2,
    TTS_SAY_BUSY = 3,
    TTS_SAY_FAILED = 4,
};

const char * tts_say_status_to_cstr(tts_say_status s);

// Checks the parts of a request that do not need a worker.
tts_say_status validate_request(const tts_request & req, const encoder_registry & encoders, std::string & err);

struct tts_worker_params {
    int32_t ready_timeout_ms = 3600 * 1000;
    int32_t encoder_exit_timeout_ms = k_encoder_exit_timeout_ms;
    int32_t shutdown_timeout_ms = 30000;
};

// Where a stream's chunks come from. read() sets `chunk` to "" at the end and
// returns false on transport errors.
class tts_stream_source {
public:
    virtual ~tts_stream_source() = default;
    virtual bool read(std::string & chunk, std::string & err) = 0;
};

// Lazy, single-pass byte stream of one request.
class tts_stream {
public:
    tts_stream() = default;
    explicit tts_stream(std::unique_ptr<tts_stream_source> source) : source_(std::move(source)) {}

    tts_stream(tts_stream &&) = default;
    tts_stream & operator=(tts_stream &&) = default;

    // Next non-empty chunk. False at the end of the stream or on error.
    bool next(std::string & chunk);

    bool valid() const { return source_ != nullptr; }
    bool finished() const { return finished_; }
    const std::string & error() const { return error_; }

    // Ends the stream early and returns the worker to the pool.
    void release() { source_.reset(); }

private:
    std::unique_ptr<tts_stream_source> source_;
    bool finished_ = false;
    std::string error_;
};

// Writes every chunk of `stream` to `path`, in order.
bool tts_stream_to_file(tts_stream & stream, const std::string & path, std::string & err);

// One synthesis engine with its request loop. A worker serves one request at a time:
//   idle -> processing (request accepted) -> reading (output not fully consumed) -> idle
// The pool claims an idle worker with set_busy() before calling say().
class tts_worker {
public:
    virtual ~tts_worker() = default;

    virtual bool start(std::string & err) = 0;
    // Stops intake and waits for the worker to exit. With abort=true the engine is
    // asked to stop the utterance in progress.
    virtual void shutdown(bool abort = false) = 0;

    // Queues `req` and waits until the engine starts producing audio.
    virtual bool say(const tts_request & req, tts_stream & out, std::string & err) = 0;

    // False once the worker can no longer serve requests (e.g. its process died).
    virtual bool alive() const { return true; }

    bool busy() const { return processing_.load() || reading_.load(); }
    bool processing() const { return processing_.load(); }
    bool reading() const { return reading_.load(); }
    void set_busy();

    // Invoked from worker-owned threads whenever the worker may have become idle.
    void set_idle_callback(std::function<void()> cb) { on_idle_ = std::move(cb); }

protected:
    std::atomic<bool> processing_ {false};
    std::atomic<bool> reading_ {false};
    std::function<void()> on_idle_;

    void finish_processing();
    void finish_reading();
    void notify_idle();
};

// Drives one engine instance for one worker: applies a request's voice, replaces the
// output target when the engine announces a sample rate, frames the samples and
// closes the target when generation returns.
class tts_synth_session {
public:
    // Called from the engine thread when the stream of a request is ready.
    using ready_fn = std::function<void(const std::shared_ptr<stream_adapter> & output, int32_t sample_rate)>;

    tts_synth_session(encoder_registry encoders, tts_worker_params params);
    ~tts_synth_session();

    tts_synth_session(const tts_synth_session &) = delete;
    tts_synth_session & operator=(const tts_synth_session &) = delete;

    bool init(const tts_engine_config & cfg, std::string & err);
    // Closes the current target and frees the engine, on the engine's thread.
    void release();
    const std::string & engine_version() const { return engine_.version(); }

    // Runs the engine for `req` on the calling thread. Returns false when the
    // engine failed; `started` tells whether on_ready was called before that.
    bool generate(const tts_request & req, const ready_fn & on_ready, bool & started, std::string & err);

    void set_abort(bool abort) { abort_.store(abort); }
    const encoder_registry & encoders() const { return encoders_; }
    int32_t sample_rate() const { return sample_rate_; }

private:
    encoder_registry encoders_;
    tts_worker_params params_;
    tts_engine engine_;
    wav_stream_framer framer_;
    encoder_relay relay_;
    std::atomic<bool> abort_ {false};

    // per request
    const tts_request * request_ = nullptr;
    const ready_fn * on_ready_ = nullptr;
    int32_t sample_rate_ = 24000;
    bool started_ = false;
    std::string stream_err_;

    bool start_stream(int32_t sample_rate);
    void close_stream(int timeout_ms);

    static bool on_sample_rate(int32_t sample_rate, void * user_data);
    static bool on_samples(const int16_t * samples, size_t n_samples, void * user_data);
};

// Worker running its engine on one thread of the calling process.
class tts_thread_worker : public tts_worker {
public:
    tts_thread_worker(tts_engine_config engine_cfg, encoder_registry encoders, tts_worker_params params = {});
    ~tts_thread_worker() override;

    bool start(std::string & err) override;
    void shutdown(bool abort = false) override;
    bool say(const tts_request & req, tts_stream & out, std::string & err) override;

private:
    struct pending_request;
    class adapter_source;

    tts_engine_config engine_cfg_;
    tts_worker_params params_;
    std::unique_ptr<tts_synth_session> session_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<pending_request>> queue_;   // nullptr = stop
    bool started_ = false;
    bool stopping_ = false;
    bool init_done_ = false;
    std::string init_err_;
    std::thread thread_;

    void run();
};
