#pragma once

#include "tts-worker.h"
#include "wav-stream-framer.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

static int g_test_failures = 0;

#define TEST_CHECK(cond)                                                                  \
    do {                                                                                  \
        if (!(cond)) {                                                                    \
            std::fprintf(stderr, "%s:%d: check failed: %s\n", __FILE__, __LINE__, #cond); \
            ++g_test_failures;                                                            \
        }                                                                                 \
    } while (0)

#define TEST_CHECK_MSG(cond, msg)                                                         \
    do {                                                                                  \
        if (!(cond)) {                                                                    \
            std::fprintf(stderr, "%s:%d: check failed: %s (%s)\n", __FILE__, __LINE__,   \
                    #cond, std::string(msg).c_str());                                     \
            ++g_test_failures;                                                            \
        }                                                                                 \
    } while (0)

static int test_finish(const char * name) {
    if (g_test_failures > 0) {
        std::fprintf(stderr, "%s: FAILED (%d check(s))\n", name, g_test_failures);
        return 1;
    }
    std::fprintf(stderr, "%s: OK\n", name);
    return 0;
}

// Drains a stream into one string. Chunks are counted in *n_chunks when given.
static std::string collect_stream(tts_stream & stream, size_t * n_chunks = nullptr) {
    std::string out;
    std::string chunk;
    size_t n = 0;
    while (stream.next(chunk)) {
        out += chunk;
        ++n;
    }
    if (n_chunks != nullptr) {
        *n_chunks = n;
    }
    return out;
}

static std::string read_file_bytes(const std::string & path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static std::string temp_path(const std::string & name) {
    return "/tmp/voxflow-test-" + std::to_string((long) getpid()) + "-" + name;
}

static std::string wav_header_bytes(uint32_t sample_rate) {
    wav_stream_format fmt;
    fmt.sample_rate = sample_rate;
    uint8_t header[k_wav_stream_header_size];
    build_wav_stream_header(header, fmt, k_wav_stream_placeholder_frames);
    return std::string(reinterpret_cast<const char *>(header), sizeof(header));
}

static uint32_t read_u32_le(const std::string & s, size_t off) {
    return (uint32_t) (uint8_t) s[off] |
           ((uint32_t) (uint8_t) s[off + 1] << 8) |
           ((uint32_t) (uint8_t) s[off + 2] << 16) |
           ((uint32_t) (uint8_t) s[off + 3] << 24);
}

static uint16_t read_u16_le(const std::string & s, size_t off) {
    return (uint16_t) ((uint8_t) s[off] | ((uint16_t) (uint8_t) s[off + 1] << 8));
}
