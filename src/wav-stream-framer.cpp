#include "wav-stream-framer.h"

#include <cstring>

namespace {

#pragma pack(push, 1)
struct wav_header {
    char riff[4] = {'R', 'I', 'F', 'F'};
    uint32_t chunk_size = 0;
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    uint32_t fmt_chunk_size = 16;
    uint16_t audio_format = 1;
    uint16_t num_channels = 1;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 16;
    char data[4] = {'d', 'a', 't', 'a'};
    uint32_t data_size = 0;
};
#pragma pack(pop)

static_assert(sizeof(wav_header) == k_wav_stream_header_size, "unexpected wav header size");

} // namespace

void build_wav_stream_header(uint8_t * out, const wav_stream_format & fmt, uint32_t n_frames) {
    wav_header h;
    h.num_channels = fmt.num_channels;
    h.sample_rate = fmt.sample_rate;
    h.block_align = (uint16_t) (fmt.num_channels * fmt.bytes_per_sample);
    h.byte_rate = fmt.sample_rate * h.block_align;
    h.bits_per_sample = (uint16_t) (fmt.bytes_per_sample * 8);
    h.data_size = n_frames * h.block_align;
    h.chunk_size = 36 + h.data_size;
    std::memcpy(out, &h, sizeof(h));
}

wav_stream_framer::~wav_stream_framer() {
    close();
}

bool wav_stream_framer::begin(byte_sink & target, uint32_t sample_rate, std::string & err) {
    if (target_ != nullptr) {
        err = "wav stream already started";
        return false;
    }
    if (sample_rate == 0) {
        err = "invalid sample rate: 0";
        return false;
    }

    format_ = wav_stream_format();
    format_.sample_rate = sample_rate;
    bytes_written_ = 0;

    uint8_t header[k_wav_stream_header_size];
    build_wav_stream_header(header, format_, k_wav_stream_placeholder_frames);
    if (!target.write(header, sizeof(header), err)) {
        return false;
    }
    target_ = &target;
    bytes_written_ = sizeof(header);
    return true;
}

bool wav_stream_framer::write_samples(const int16_t * samples, size_t n_samples, std::string & err) {
    return write_raw(reinterpret_cast<const uint8_t *>(samples), n_samples * sizeof(int16_t), err);
}

bool wav_stream_framer::write_raw(const uint8_t * data, size_t n_bytes, std::string & err) {
    if (target_ == nullptr) {
        err = "wav stream is not open";
        return false;
    }
    if (n_bytes == 0) {
        return true;
    }
    if (!target_->write(data, n_bytes, err)) {
        return false;
    }
    bytes_written_ += n_bytes;
    return true;
}

void wav_stream_framer::close() {
    if (target_ == nullptr) {
        return;
    }
    target_->close();
    target_ = nullptr;
}
