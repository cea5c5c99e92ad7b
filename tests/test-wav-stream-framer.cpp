#include "wav-stream-framer.h"

#include "test-common.h"

#include <string>
#include <vector>

static std::string drain(stream_adapter & a) {
    std::string out;
    for (;;) {
        const std::string chunk = a.read();
        if (chunk.empty()) {
            return out;
        }
        out += chunk;
    }
}

static void test_header_fields() {
    stream_adapter a;
    wav_stream_framer f;
    std::string err;
    TEST_CHECK_MSG(f.begin(a, 24000, err), err);
    f.close();

    const std::string h = drain(a);
    TEST_CHECK(h.size() == k_wav_stream_header_size);
    TEST_CHECK(h.compare(0, 4, "RIFF") == 0);
    TEST_CHECK(h.compare(8, 4, "WAVE") == 0);
    TEST_CHECK(h.compare(12, 4, "fmt ") == 0);
    TEST_CHECK(read_u32_le(h, 16) == 16);
    TEST_CHECK(read_u16_le(h, 20) == 1);        // PCM
    TEST_CHECK(read_u16_le(h, 22) == 1);        // mono
    TEST_CHECK(read_u32_le(h, 24) == 24000);
    TEST_CHECK(read_u32_le(h, 28) == 48000);    // byte rate
    TEST_CHECK(read_u16_le(h, 32) == 2);        // block align
    TEST_CHECK(read_u16_le(h, 34) == 16);
    TEST_CHECK(h.compare(36, 4, "data") == 0);

    const uint32_t data_size = k_wav_stream_placeholder_frames * 2;
    TEST_CHECK(read_u32_le(h, 40) == data_size);
    TEST_CHECK(read_u32_le(h, 4) == 36 + data_size);
}

static void test_samples_follow_header() {
    stream_adapter a;
    wav_stream_framer f;
    std::string err;
    TEST_CHECK(f.begin(a, 16000, err));

    const std::vector<int16_t> s1 = {1, -1, 256};
    const std::vector<int16_t> s2 = {32767};
    TEST_CHECK(f.write_samples(s1.data(), s1.size(), err));
    TEST_CHECK(f.write_samples(s2.data(), 0, err));
    TEST_CHECK(f.write_samples(s2.data(), s2.size(), err));
    TEST_CHECK(f.bytes_written() == k_wav_stream_header_size + 8);
    f.close();

    const std::string out = drain(a);
    TEST_CHECK(out.size() == k_wav_stream_header_size + 8);
    TEST_CHECK(out.compare(0, k_wav_stream_header_size, wav_header_bytes(16000)) == 0);
    TEST_CHECK(read_u16_le(out, 44) == 1);
    TEST_CHECK(read_u16_le(out, 46) == 0xFFFF);
    TEST_CHECK(read_u16_le(out, 48) == 256);
    TEST_CHECK(read_u16_le(out, 50) == 32767);
}

static void test_begin_once() {
    stream_adapter a;
    stream_adapter b;
    wav_stream_framer f;
    std::string err;
    TEST_CHECK(f.begin(a, 16000, err));
    TEST_CHECK(!f.begin(b, 22050, err));
    TEST_CHECK(!err.empty());
    TEST_CHECK(b.pending() == 0);
    TEST_CHECK(f.format().sample_rate == 16000);
}

static void test_invalid_use() {
    stream_adapter a;
    wav_stream_framer f;
    std::string err;
    const int16_t s = 7;
    TEST_CHECK(!f.write_samples(&s, 1, err));
    TEST_CHECK(!f.begin(a, 0, err));
    TEST_CHECK(!f.is_open());
    TEST_CHECK(a.pending() == 0);
}

static void test_close_is_idempotent() {
    stream_adapter a;
    {
        wav_stream_framer f;
        std::string err;
        TEST_CHECK(f.begin(a, 8000, err));
        f.close();
        f.close();
        TEST_CHECK(!f.is_open());
    }
    TEST_CHECK(drain(a).size() == k_wav_stream_header_size);
    TEST_CHECK(a.read().empty());
}

int main() {
    test_header_fields();
    test_samples_follow_header();
    test_begin_once();
    test_invalid_use();
    test_close_is_idempotent();
    return test_finish("test-wav-stream-framer");
}
