#pragma once

#include "stream-adapter.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Length written into the header of a streamed WAV, in frames. The real length is
// unknown while streaming and the target cannot seek, so the header is never
// patched; any real utterance is shorter than this.
static constexpr uint32_t k_wav_stream_placeholder_frames = 0x0FFFFFFF;

struct wav_stream_format {
    uint16_t num_channels = 1;
    uint16_t bytes_per_sample = 2;
    uint32_t sample_rate = 0;
};

// Writes a mono 16-bit WAV stream into an append-only byte_sink.
class wav_stream_framer {
public:
    wav_stream_framer() = default;
    ~wav_stream_framer();

    wav_stream_framer(const wav_stream_framer &) = delete;
    wav_stream_framer & operator=(const wav_stream_framer &) = delete;

    // Writes the header once. The framer does not own target; target must outlive
    // close().
    bool begin(byte_sink & target, uint32_t sample_rate, std::string & err);
    bool write_samples(const int16_t * samples, size_t n_samples, std::string & err);
    bool write_raw(const uint8_t * data, size_t n_bytes, std::string & err);

    // Closes the target. Safe to call repeatedly.
    void close();

    bool is_open() const { return target_ != nullptr; }
    const wav_stream_format & format() const { return format_; }
    uint64_t bytes_written() const { return bytes_written_; }

private:
    byte_sink * target_ = nullptr;
    wav_stream_format format_;
    uint64_t bytes_written_ = 0;
};

// Fills the 44-byte RIFF/WAVE header for a stream that declares n_frames frames.
void build_wav_stream_header(uint8_t * out, const wav_stream_format & fmt, uint32_t n_frames);

static constexpr size_t k_wav_stream_header_size = 44;
