#define _USE_MATH_DEFINES

#include "tts-engine.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <new>
#include <string>
#include <vector>

namespace {

static constexpr int32_t k_tone_sample_rate = 24000;
static constexpr size_t k_tone_block = 1024;
static constexpr int32_t k_tone_symbol_ms = 80;
static constexpr int32_t k_tone_space_ms = 60;
static constexpr int32_t k_tone_pause_ms = 150;
static constexpr double k_tone_amplitude = 0.3 * 32767.0;

struct tone_voice {
    const char * name;
    double base_hz;
};

static const tone_voice k_tone_voices[] = {
    {"default", 220.0},
    {"low", 110.0},
    {"high", 440.0},
};

struct tone_engine {
    voxflow_sample_rate_callback on_sample_rate = nullptr;
    voxflow_samples_callback on_samples = nullptr;
    void * user_data = nullptr;
    double base_hz = 220.0;
};

static void set_err(char * err, size_t err_size, const std::string & msg) {
    if (err != nullptr && err_size > 0) {
        std::snprintf(err, err_size, "%s", msg.c_str());
    }
}

static const char * tone_version(void) {
    return VOXFLOW_ENGINE_API_VERSION;
}

static void * tone_create(const voxflow_engine_init_params * params, char * err, size_t err_size) {
    if (params == nullptr || params->on_sample_rate == nullptr || params->on_samples == nullptr) {
        set_err(err, err_size, "tone engine: callbacks are required");
        return nullptr;
    }
    auto * e = new (std::nothrow) tone_engine();
    if (e == nullptr) {
        set_err(err, err_size, "tone engine: out of memory");
        return nullptr;
    }
    e->on_sample_rate = params->on_sample_rate;
    e->on_samples = params->on_samples;
    e->user_data = params->user_data;
    return e;
}

static void tone_destroy(void * engine) {
    delete static_cast<tone_engine *>(engine);
}

static bool tone_set_voice(void * engine, const char * voice, char * err, size_t err_size) {
    auto * e = static_cast<tone_engine *>(engine);
    const std::string name = voice != nullptr && voice[0] != '\0' ? voice : "default";
    for (const auto & v : k_tone_voices) {
        if (name == v.name) {
            e->base_hz = v.base_hz;
            return true;
        }
    }
    set_err(err, err_size, "tone engine: unknown voice: " + name);
    return false;
}

// Buffers samples and hands them out in k_tone_block pieces.
struct tone_writer {
    tone_engine * e;
    std::vector<int16_t> block;

    bool push(int16_t s) {
        block.push_back(s);
        return block.size() < k_tone_block || flush();
    }

    bool flush() {
        if (block.empty()) {
            return true;
        }
        const bool more = e->on_samples(block.data(), block.size(), e->user_data);
        block.clear();
        return more;
    }
};

static bool tone_generate(void * engine, const char * text, char * /* err */, size_t /* err_size */) {
    auto * e = static_cast<tone_engine *>(engine);
    if (!e->on_sample_rate(k_tone_sample_rate, e->user_data)) {
        return true;
    }

    tone_writer w {e, {}};
    w.block.reserve(k_tone_block);

    for (const char * p = text != nullptr ? text : ""; *p != '\0'; ++p) {
        const unsigned char c = (unsigned char) *p;
        if ((c & 0xC0) == 0x80) {
            continue; // utf-8 continuation byte
        }

        int32_t ms = k_tone_symbol_ms;
        double hz = e->base_hz * (1.0 + (double) (c % 12) / 12.0);
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            ms = k_tone_space_ms;
            hz = 0.0;
        } else if (c < 0x80 && std::strchr(".,;:!?", (int) c) != nullptr) {
            ms = k_tone_pause_ms;
            hz = 0.0;
        }

        const int32_t n = k_tone_sample_rate * ms / 1000;
        for (int32_t i = 0; i < n; ++i) {
            double v = 0.0;
            if (hz > 0.0) {
                // short linear fade at both ends of each segment
                const double fade = std::min(1.0, std::min(i, n - 1 - i) / 120.0);
                v = k_tone_amplitude * fade * std::sin(2.0 * M_PI * hz * (double) i / k_tone_sample_rate);
            }
            if (!w.push((int16_t) std::lrint(v))) {
                return true;
            }
        }
    }
    w.flush();
    return true;
}

static const voxflow_engine_vtable k_tone_vtable = {
    tone_version,
    tone_create,
    tone_destroy,
    tone_set_voice,
    tone_generate,
};

} // namespace

const voxflow_engine_vtable * voxflow_tone_engine(void) {
    return &k_tone_vtable;
}
