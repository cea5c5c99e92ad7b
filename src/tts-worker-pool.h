#pragma once

#include "tts-worker.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Builds (but does not start) the worker with the given index.
using tts_worker_factory = std::function<std::unique_ptr<tts_worker>(int32_t index, std::string & err)>;

struct tts_pool_params {
    int32_t n_workers = 1;
    int32_t admission_timeout_ms = 30000;

    tts_engine_config engine;
    tts_worker_params worker;

    // Default: one thread worker for n_workers == 1, process workers otherwise.
    tts_worker_factory factory;
};

// Fixed set of workers. say() hands a request to an idle worker, waiting up to the
// admission timeout for one to become idle.
//
// Streams returned by say() refer to their worker and must be released before the
// pool is destroyed.
class tts_worker_pool {
public:
    tts_worker_pool(encoder_registry encoders, tts_pool_params params);
    ~tts_worker_pool();

    tts_worker_pool(const tts_worker_pool &) = delete;
    tts_worker_pool & operator=(const tts_worker_pool &) = delete;

    bool start(std::string & err);
    // Blocks new requests and waits for every worker to exit. Requests already
    // accepted run to completion.
    void shutdown();

    tts_say_status say(const tts_request & req, tts_stream & out, std::string & err);
    tts_say_status to_file(const std::string & path, const tts_request & req, std::string & err);

    int32_t size() const;
    int32_t busy_count() const;
    const encoder_registry & encoders() const { return encoders_; }
    const tts_pool_params & params() const { return params_; }

private:
    encoder_registry encoders_;
    tts_pool_params params_;
    std::vector<std::unique_ptr<tts_worker>> workers_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    size_t rr_worker_ = 0;
    bool started_ = false;
    bool stopping_ = false;

    // Requires mtx_. Claims an idle worker, nullptr when none is free.
    tts_worker * claim_locked();
    bool any_alive_locked() const;
    void on_worker_idle();
};
