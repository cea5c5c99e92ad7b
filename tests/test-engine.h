#pragma once

// Deterministic engine for tests: one 16-bit sample per byte of text, so the
// expected output of any request is known exactly.
//
// Texts with special meaning:
//   "!fail"          generate() fails before announcing a sample rate
//   "!silent"        generate() returns without announcing a sample rate
//   "!twice..."      the sample rate is announced twice (second time 22050)
//   "!endless"       samples until a callback asks to stop
// Voice "shift" adds 1 to every sample; voice "bad" is rejected.

#include "test-common.h"
#include "voxflow-engine.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <new>
#include <string>
#include <thread>
#include <vector>

static constexpr int32_t k_fake_sample_rate = 16000;
static constexpr size_t k_fake_block = 4;

struct fake_engine {
    voxflow_sample_rate_callback on_sample_rate = nullptr;
    voxflow_samples_callback on_samples = nullptr;
    void * user_data = nullptr;
    int16_t offset = 0;
};

static std::vector<int16_t> fake_samples(const std::string & text, const std::string & voice = "default") {
    std::vector<int16_t> out;
    out.reserve(text.size());
    const int16_t offset = voice == "shift" ? 1 : 0;
    for (char c : text) {
        out.push_back((int16_t) ((uint8_t) c + offset));
    }
    return out;
}

// Exact bytes of the native stream the fake engine produces for `text`.
static std::string fake_expected_wav(const std::string & text, const std::string & voice = "default") {
    std::string out = wav_header_bytes(k_fake_sample_rate);
    for (int16_t s : fake_samples(text, voice)) {
        out.push_back((char) (s & 0xff));
        out.push_back((char) ((s >> 8) & 0xff));
    }
    return out;
}

static const char * fake_version(void) {
    return VOXFLOW_ENGINE_API_VERSION;
}

static const char * fake_old_version(void) {
    return "0.9.0";
}

static void * fake_create(const voxflow_engine_init_params * params, char * err, size_t err_size) {
    if (params == nullptr || params->on_sample_rate == nullptr || params->on_samples == nullptr) {
        std::snprintf(err, err_size, "fake engine: callbacks are required");
        return nullptr;
    }
    auto * e = new (std::nothrow) fake_engine();
    if (e == nullptr) {
        return nullptr;
    }
    e->on_sample_rate = params->on_sample_rate;
    e->on_samples = params->on_samples;
    e->user_data = params->user_data;
    return e;
}

static void fake_destroy(void * engine) {
    delete static_cast<fake_engine *>(engine);
}

static bool fake_set_voice(void * engine, const char * voice, char * err, size_t err_size) {
    auto * e = static_cast<fake_engine *>(engine);
    if (std::strcmp(voice, "bad") == 0) {
        std::snprintf(err, err_size, "fake engine: unknown voice: %s", voice);
        return false;
    }
    e->offset = std::strcmp(voice, "shift") == 0 ? 1 : 0;
    return true;
}

static bool fake_generate(void * engine, const char * text, char * err, size_t err_size) {
    auto * e = static_cast<fake_engine *>(engine);
    const std::string t = text;

    if (t == "!fail") {
        std::snprintf(err, err_size, "fake engine failure");
        return false;
    }
    if (t == "!silent") {
        return true;
    }
    if (!e->on_sample_rate(k_fake_sample_rate, e->user_data)) {
        return true;
    }
    if (t == "!endless") {
        const int16_t block[k_fake_block] = {1, 2, 3, 4};
        while (e->on_samples(block, k_fake_block, e->user_data)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
    if (t.rfind("!twice", 0) == 0 && !e->on_sample_rate(22050, e->user_data)) {
        return true;
    }

    std::vector<int16_t> samples;
    samples.reserve(t.size());
    for (char c : t) {
        samples.push_back((int16_t) ((uint8_t) c + e->offset));
    }
    for (size_t i = 0; i < samples.size(); i += k_fake_block) {
        const size_t n = std::min(k_fake_block, samples.size() - i);
        if (!e->on_samples(samples.data() + i, n, e->user_data)) {
            return true;
        }
    }
    return true;
}

static const voxflow_engine_vtable k_fake_engine_vtable = {
    fake_version,
    fake_create,
    fake_destroy,
    fake_set_voice,
    fake_generate,
};

static const voxflow_engine_vtable k_fake_old_engine_vtable = {
    fake_old_version,
    fake_create,
    fake_destroy,
    fake_set_voice,
    fake_generate,
};

static tts_engine_config fake_engine_config() {
    tts_engine_config cfg;
    cfg.vtable = &k_fake_engine_vtable;
    return cfg;
}
