#include "tts-engine.h"

#include "test-engine.h"

#include <string>
#include <vector>

struct capture {
    std::vector<int32_t> rates;
    std::vector<size_t> blocks;
    size_t n_samples = 0;
    size_t stop_after = 0;   // 0 = never stop
};

static bool on_rate(int32_t sample_rate, void * user_data) {
    static_cast<capture *>(user_data)->rates.push_back(sample_rate);
    return true;
}

static bool on_samples(const int16_t * /* samples */, size_t n_samples, void * user_data) {
    auto * c = static_cast<capture *>(user_data);
    c->blocks.push_back(n_samples);
    c->n_samples += n_samples;
    return c->stop_after == 0 || c->blocks.size() < c->stop_after;
}

static void test_tone_engine_is_the_fallback() {
    capture c;
    tts_engine e;
    std::string err;
    TEST_CHECK_MSG(e.init(tts_engine_config(), on_rate, on_samples, &c, err), err);
    TEST_CHECK(e.is_loaded());
    TEST_CHECK(e.version() == VOXFLOW_ENGINE_API_VERSION);

    TEST_CHECK(e.set_voice("default", err));
    TEST_CHECK_MSG(e.generate("ab c.", err), err);
    TEST_CHECK(c.rates.size() == 1 && c.rates[0] == 24000);
    // a, b, c: 80 ms each; space 60 ms; '.' 150 ms
    const size_t expected = (size_t) 24000 * (80 * 3 + 60 + 150) / 1000;
    TEST_CHECK_MSG(c.n_samples == expected, std::to_string(c.n_samples));
    for (size_t n : c.blocks) {
        TEST_CHECK(n > 0 && n <= 1024);
    }
}

static void test_tone_engine_voices() {
    capture c;
    tts_engine e;
    std::string err;
    TEST_CHECK(e.init(tts_engine_config(), on_rate, on_samples, &c, err));
    TEST_CHECK(e.set_voice("low", err));
    TEST_CHECK(e.set_voice("high", err));
    TEST_CHECK(!e.set_voice("nobody", err));
    TEST_CHECK(err.find("nobody") != std::string::npos);
}

static void test_continuation_flag_stops_generation() {
    capture c;
    c.stop_after = 2;
    tts_engine e;
    std::string err;
    TEST_CHECK(e.init(tts_engine_config(), on_rate, on_samples, &c, err));
    TEST_CHECK(e.generate("a long enough text to need many blocks", err));
    TEST_CHECK(c.blocks.size() == 2);
}

static void test_injected_vtable() {
    capture c;
    tts_engine e;
    std::string err;
    TEST_CHECK(e.init(fake_engine_config(), on_rate, on_samples, &c, err));
    TEST_CHECK(e.generate("hello", err));
    TEST_CHECK(c.rates.size() == 1 && c.rates[0] == k_fake_sample_rate);
    TEST_CHECK(c.n_samples == 5);

    TEST_CHECK(!e.generate("!fail", err));
    TEST_CHECK(err == "fake engine failure");
    TEST_CHECK(!e.set_voice("bad", err));
}

static void test_version_mismatch_is_a_warning() {
    capture c;
    tts_engine_config cfg;
    cfg.vtable = &k_fake_old_engine_vtable;
    tts_engine e;
    std::string err;
    TEST_CHECK_MSG(e.init(cfg, on_rate, on_samples, &c, err), err);
    TEST_CHECK(e.version() == "0.9.0");
    TEST_CHECK(e.generate("ok", err));
}

static void test_bad_engines() {
    capture c;
    std::string err;
    {
        tts_engine_config cfg;
        cfg.library = "/nonexistent/libvoxflow-engine-missing.so";
        tts_engine e;
        TEST_CHECK(!e.init(cfg, on_rate, on_samples, &c, err));
        TEST_CHECK(!e.is_loaded());
    }
    {
        static const voxflow_engine_vtable incomplete = {fake_version, fake_create, fake_destroy, nullptr, fake_generate};
        tts_engine_config cfg;
        cfg.vtable = &incomplete;
        tts_engine e;
        TEST_CHECK(!e.init(cfg, on_rate, on_samples, &c, err));
        TEST_CHECK(err == "engine vtable is incomplete");
    }
    {
        tts_engine e;
        TEST_CHECK(!e.generate("x", err));
    }
}

int main() {
    test_tone_engine_is_the_fallback();
    test_tone_engine_voices();
    test_continuation_flag_stops_generation();
    test_injected_vtable();
    test_version_mismatch_is_a_warning();
    test_bad_engines();
    return test_finish("test-tts-engine");
}
