#include "tts-worker-pool.h"

#include "tts-process-worker.h"

#include "test-engine.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static tts_request make_req(const std::string & text, const std::string & format = "wav") {
    tts_request r;
    r.text = text;
    r.format = format;
    return r;
}

static double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

// Thread workers regardless of size, so the pool logic is tested without fork().
static tts_pool_params thread_pool_params(int32_t n, int32_t admission_timeout_ms) {
    tts_pool_params p;
    p.n_workers = n;
    p.admission_timeout_ms = admission_timeout_ms;
    p.engine = fake_engine_config();
    p.factory = [](int32_t /* index */, std::string & /* err */) -> std::unique_ptr<tts_worker> {
        return std::make_unique<tts_thread_worker>(fake_engine_config(), encoder_registry());
    };
    return p;
}

static tts_pool_params process_pool_params(int32_t n, int32_t admission_timeout_ms) {
    tts_pool_params p;
    p.n_workers = n;
    p.admission_timeout_ms = admission_timeout_ms;
    p.engine = fake_engine_config();
    p.worker.shutdown_timeout_ms = 5000;
    return p;
}

static void test_unsupported_format_never_engages_a_worker() {
    std::atomic<int> created {0};
    tts_pool_params p = thread_pool_params(1, 100);
    p.factory = [&](int32_t, std::string &) -> std::unique_ptr<tts_worker> {
        created++;
        return std::make_unique<tts_thread_worker>(fake_engine_config(), encoder_registry());
    };
    tts_worker_pool pool(encoder_registry(), p);
    std::string err;
    TEST_CHECK_MSG(pool.start(err), err);
    TEST_CHECK(created.load() == 1);

    tts_stream s;
    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK(pool.say(make_req("x", "mp3"), s, err) == TTS_SAY_UNSUPPORTED_FORMAT);
    TEST_CHECK(err == "Unsupported format: mp3");
    TEST_CHECK(seconds_since(t0) < 0.05);
    TEST_CHECK(pool.busy_count() == 0);
    TEST_CHECK(!s.valid());

    tts_request r = make_req("x");
    r.chunk_size = 0;
    TEST_CHECK(pool.say(r, s, err) == TTS_SAY_INVALID_REQUEST);
    TEST_CHECK(pool.busy_count() == 0);
}

static void test_busy_after_admission_timeout() {
    const int32_t n = 2;
    tts_worker_pool pool(encoder_registry(), thread_pool_params(n, 150));
    std::string err;
    TEST_CHECK(pool.start(err));
    TEST_CHECK(pool.size() == n);

    // hold every worker with an unread stream
    std::vector<tts_stream> held(n);
    for (int32_t i = 0; i < n; ++i) {
        TEST_CHECK(pool.say(make_req("held " + std::to_string(i)), held[i], err) == TTS_SAY_OK);
    }
    TEST_CHECK(pool.busy_count() == n);

    tts_stream extra;
    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK(pool.say(make_req("one too many"), extra, err) == TTS_SAY_BUSY);
    const double waited = seconds_since(t0);
    TEST_CHECK(err == "Still busy");
    TEST_CHECK_MSG(waited >= 0.14 && waited < 2.0, std::to_string(waited));
    TEST_CHECK(pool.busy_count() == n);

    // the rejected request left nothing claimed
    TEST_CHECK(collect_stream(held[0]) == fake_expected_wav("held 0"));
    held[1].release();
    tts_stream s;
    TEST_CHECK(pool.say(make_req("after"), s, err) == TTS_SAY_OK);
    TEST_CHECK(collect_stream(s) == fake_expected_wav("after"));
}

static void test_admitted_when_worker_frees_up() {
    tts_worker_pool pool(encoder_registry(), thread_pool_params(1, 5000));
    std::string err;
    TEST_CHECK(pool.start(err));

    tts_stream held;
    TEST_CHECK(pool.say(make_req("holding"), held, err) == TTS_SAY_OK);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        collect_stream(held);
    });

    tts_stream s;
    const auto t0 = std::chrono::steady_clock::now();
    TEST_CHECK_MSG(pool.say(make_req("waiting"), s, err) == TTS_SAY_OK, err);
    const double waited = seconds_since(t0);
    releaser.join();
    // woken by the worker, long before the admission timeout
    TEST_CHECK_MSG(waited >= 0.05 && waited < 2.0, std::to_string(waited));
    TEST_CHECK(collect_stream(s) == fake_expected_wav("waiting"));
}

static void test_concurrent_callers() {
    const int32_t n = 3;
    tts_worker_pool pool(encoder_registry(), thread_pool_params(n, 10000));
    std::string err;
    TEST_CHECK(pool.start(err));

    const int n_callers = 8;
    std::vector<std::thread> callers;
    std::vector<int> ok(n_callers, 0);
    for (int i = 0; i < n_callers; ++i) {
        callers.emplace_back([&, i]() {
            for (int k = 0; k < 5; ++k) {
                const std::string text = "caller " + std::to_string(i) + " turn " + std::to_string(k);
                tts_stream s;
                std::string e;
                if (pool.say(make_req(text), s, e) != TTS_SAY_OK) {
                    continue;
                }
                if (collect_stream(s) == fake_expected_wav(text)) {
                    ok[i]++;
                }
            }
        });
    }
    for (auto & t : callers) {
        t.join();
    }
    for (int i = 0; i < n_callers; ++i) {
        TEST_CHECK_MSG(ok[i] == 5, "caller " + std::to_string(i));
    }
    TEST_CHECK(pool.busy_count() == 0);
}

static void test_to_file() {
    tts_worker_pool pool(encoder_registry(), thread_pool_params(1, 1000));
    std::string err;
    TEST_CHECK(pool.start(err));

    const std::string text = "pool level file output";
    tts_stream s;
    TEST_CHECK(pool.say(make_req(text), s, err) == TTS_SAY_OK);
    const std::string streamed = collect_stream(s);

    const std::string path = temp_path("pool.wav");
    TEST_CHECK_MSG(pool.to_file(path, make_req(text), err) == TTS_SAY_OK, err);
    TEST_CHECK(read_file_bytes(path) == streamed);
    std::remove(path.c_str());

    TEST_CHECK(pool.to_file(path, make_req("!fail"), err) == TTS_SAY_FAILED);
    TEST_CHECK(err == "fake engine failure");
    TEST_CHECK(pool.to_file("/nonexistent-dir/x.wav", make_req(text), err) == TTS_SAY_FAILED);
}

static void test_shutdown_blocks_intake() {
    tts_worker_pool pool(encoder_registry(), thread_pool_params(2, 1000));
    std::string err;
    TEST_CHECK(pool.start(err));

    tts_stream in_flight;
    TEST_CHECK(pool.say(make_req("accepted before shutdown"), in_flight, err) == TTS_SAY_OK);
    pool.shutdown();

    // accepted work is not cancelled
    TEST_CHECK(collect_stream(in_flight) == fake_expected_wav("accepted before shutdown"));

    tts_stream s;
    TEST_CHECK(pool.say(make_req("late"), s, err) == TTS_SAY_FAILED);
    TEST_CHECK(!s.valid());
}

static void test_process_shutdown_keeps_accepted_stream() {
    tts_worker_pool pool(encoder_registry(), process_pool_params(2, 1000));
    std::string err;
    TEST_CHECK_MSG(pool.start(err), err);

    // more output than the worker's pipe can buffer, unread when shutdown starts
    const std::string text(100000, 'q');
    tts_stream in_flight;
    TEST_CHECK(pool.say(make_req(text), in_flight, err) == TTS_SAY_OK);

    const auto t0 = std::chrono::steady_clock::now();
    pool.shutdown();
    const double secs = seconds_since(t0);
    TEST_CHECK_MSG(secs < 4.0, std::to_string(secs));

    TEST_CHECK(collect_stream(in_flight) == fake_expected_wav(text));
    TEST_CHECK_MSG(in_flight.error().empty(), in_flight.error());

    tts_stream s;
    TEST_CHECK(pool.say(make_req("late"), s, err) == TTS_SAY_FAILED);
    TEST_CHECK(!s.valid());
}

static void test_process_shutdown_during_dispatch() {
    tts_worker_pool pool(encoder_registry(), process_pool_params(2, 200));
    std::string err;
    TEST_CHECK_MSG(pool.start(err), err);

    std::atomic<int> served {0};
    std::atomic<int> refused {0};
    std::atomic<int> corrupted {0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 2; ++i) {
        callers.emplace_back([&, i]() {
            for (int k = 0;; ++k) {
                const std::string text = "dispatch " + std::to_string(i) + " " + std::to_string(k);
                tts_stream s;
                std::string e;
                const tts_say_status st = pool.say(make_req(text), s, e);
                if (st == TTS_SAY_OK) {
                    if (collect_stream(s) == fake_expected_wav(text) && s.error().empty()) {
                        served++;
                    } else {
                        corrupted++;
                    }
                } else if (st == TTS_SAY_FAILED) {
                    refused++;
                    return;
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    pool.shutdown();
    for (auto & t : callers) {
        t.join();
    }

    // every accepted request completed; the rest were turned away cleanly
    TEST_CHECK(served.load() > 0);
    TEST_CHECK(corrupted.load() == 0);
    TEST_CHECK(refused.load() == 2);
}

static void test_start_failure() {
    tts_pool_params p = thread_pool_params(2, 100);
    p.factory = [](int32_t index, std::string & err) -> std::unique_ptr<tts_worker> {
        if (index == 1) {
            err = "no engine for this slot";
            return nullptr;
        }
        return std::make_unique<tts_thread_worker>(fake_engine_config(), encoder_registry());
    };
    tts_worker_pool pool(encoder_registry(), p);
    std::string err;
    TEST_CHECK(!pool.start(err));
    TEST_CHECK(err == "worker[1]: no engine for this slot");

    tts_stream s;
    TEST_CHECK(pool.say(make_req("x"), s, err) == TTS_SAY_FAILED);

    tts_worker_pool empty(encoder_registry(), thread_pool_params(0, 100));
    TEST_CHECK(!empty.start(err));
}

static void test_default_factory_uses_processes() {
    tts_pool_params p;
    p.n_workers = 2;
    p.admission_timeout_ms = 200;
    p.engine = fake_engine_config();
    tts_worker_pool pool(encoder_registry(), p);
    std::string err;
    TEST_CHECK_MSG(pool.start(err), err);

    // two workers in separate processes serve two streams at the same time
    tts_stream a;
    tts_stream b;
    TEST_CHECK(pool.say(make_req("first process"), a, err) == TTS_SAY_OK);
    TEST_CHECK(pool.say(make_req("second process"), b, err) == TTS_SAY_OK);
    tts_stream c;
    TEST_CHECK(pool.say(make_req("third"), c, err) == TTS_SAY_BUSY);

    TEST_CHECK(collect_stream(b) == fake_expected_wav("second process"));
    TEST_CHECK(collect_stream(a) == fake_expected_wav("first process"));
    pool.shutdown();
}

int main() {
    ignore_sigpipe();
    test_unsupported_format_never_engages_a_worker();
    test_busy_after_admission_timeout();
    test_admitted_when_worker_frees_up();
    test_concurrent_callers();
    test_to_file();
    test_shutdown_blocks_intake();
    test_start_failure();
    test_default_factory_uses_processes();
    test_process_shutdown_keeps_accepted_stream();
    test_process_shutdown_during_dispatch();
    return test_finish("test-worker-pool");
}
