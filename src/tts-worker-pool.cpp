#include "tts-worker-pool.h"

#include "tts-process-worker.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <utility>

tts_worker_pool::tts_worker_pool(encoder_registry encoders, tts_pool_params params)
    : encoders_(std::move(encoders)), params_(std::move(params)) {
}

tts_worker_pool::~tts_worker_pool() {
    shutdown();
}

bool tts_worker_pool::start(std::string & err) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (started_) {
            err = "pool already started";
            return false;
        }
    }
    if (params_.n_workers < 1) {
        err = "n_workers must be at least 1";
        return false;
    }
    if (params_.admission_timeout_ms < 0) {
        err = "admission timeout must not be negative";
        return false;
    }

    tts_worker_factory factory = params_.factory;
    const char * kind = "custom";
    if (!factory) {
        if (params_.n_workers == 1) {
            kind = "thread";
            factory = [this](int32_t /* index */, std::string & /* err */) -> std::unique_ptr<tts_worker> {
                return std::make_unique<tts_thread_worker>(params_.engine, encoders_, params_.worker);
            };
        } else {
            kind = "process";
            factory = [this](int32_t index, std::string & /* err */) -> std::unique_ptr<tts_worker> {
                return std::make_unique<tts_process_worker>(params_.engine, encoders_, params_.worker, index);
            };
        }
    }

    std::vector<std::unique_ptr<tts_worker>> workers;
    workers.reserve((size_t) params_.n_workers);
    for (int32_t i = 0; i < params_.n_workers; ++i) {
        std::string w_err;
        std::unique_ptr<tts_worker> w = factory(i, w_err);
        if (!w) {
            err = "worker[" + std::to_string(i) + "]: " + (w_err.empty() ? std::string("factory returned no worker") : w_err);
            break;
        }
        w->set_idle_callback([this]() { on_worker_idle(); });
        if (!w->start(w_err)) {
            err = "worker[" + std::to_string(i) + "]: " + w_err;
            break;
        }
        workers.push_back(std::move(w));
    }
    if ((int32_t) workers.size() != params_.n_workers) {
        for (auto & w : workers) {
            w->shutdown(true);
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        workers_ = std::move(workers);
        started_ = true;
        stopping_ = false;
    }
    std::fprintf(stderr, "pool: started %d %s worker(s), formats:", params_.n_workers, kind);
    for (const auto & f : encoders_.formats()) {
        std::fprintf(stderr, " %s", f.c_str());
    }
    std::fprintf(stderr, "\n");
    return true;
}

void tts_worker_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!started_ || stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto & w : workers_) {
        w->shutdown();
    }
    std::fprintf(stderr, "pool: stopped\n");
}

void tts_worker_pool::on_worker_idle() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
    }
    cv_.notify_all();
}

tts_worker * tts_worker_pool::claim_locked() {
    const size_t n = workers_.size();
    for (size_t k = 0; k < n; ++k) {
        const size_t idx = (rr_worker_ + k) % n;
        tts_worker * w = workers_[idx].get();
        if (!w->busy() && w->alive()) {
            w->set_busy();
            rr_worker_ = (idx + 1) % n;
            return w;
        }
    }
    return nullptr;
}

bool tts_worker_pool::any_alive_locked() const {
    return std::any_of(workers_.begin(), workers_.end(), [](const std::unique_ptr<tts_worker> & w) {
        return w->alive();
    });
}

tts_say_status tts_worker_pool::say(const tts_request & req, tts_stream & out, std::string & err) {
    const tts_say_status vs = validate_request(req, encoders_, err);
    if (vs != TTS_SAY_OK) {
        return vs;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params_.admission_timeout_ms);

    tts_worker * worker = nullptr;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        for (;;) {
            if (!started_ || stopping_) {
                err = "pool is not running";
                return TTS_SAY_FAILED;
            }
            worker = claim_locked();
            if (worker != nullptr) {
                break;
            }
            if (!any_alive_locked()) {
                err = "no live workers";
                return TTS_SAY_FAILED;
            }
            if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
                worker = claim_locked();
                if (worker == nullptr) {
                    err = "Still busy";
                    return TTS_SAY_BUSY;
                }
                break;
            }
        }
    }

    // the worker releases its own busy state when say() fails
    if (!worker->say(req, out, err)) {
        return TTS_SAY_FAILED;
    }
    return TTS_SAY_OK;
}

tts_say_status tts_worker_pool::to_file(const std::string & path, const tts_request & req, std::string & err) {
    tts_stream stream;
    const tts_say_status st = say(req, stream, err);
    if (st != TTS_SAY_OK) {
        return st;
    }
    if (!tts_stream_to_file(stream, path, err)) {
        return TTS_SAY_FAILED;
    }
    return TTS_SAY_OK;
}

int32_t tts_worker_pool::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return (int32_t) workers_.size();
}

int32_t tts_worker_pool::busy_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    int32_t n = 0;
    for (const auto & w : workers_) {
        n += w->busy() ? 1 : 0;
    }
    return n;
}
