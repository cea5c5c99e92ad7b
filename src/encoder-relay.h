#pragma once

#include "encoder-process.h"
#include "encoder-registry.h"
#include "stream-adapter.h"

#include <cstddef>
#include <memory>
#include <string>
#include <thread>

static constexpr size_t k_relay_default_read_size = 1024;
static constexpr int k_encoder_exit_timeout_ms = 5000;

// Output target of one utterance. For formats with an encoder, the WAV stream is
// piped into the encoder and a relay thread copies the encoder's stdout into the
// output channel. For the native format the output channel is the target itself.
class encoder_relay {
public:
    encoder_relay() = default;
    ~encoder_relay();

    encoder_relay(const encoder_relay &) = delete;
    encoder_relay & operator=(const encoder_relay &) = delete;

    bool open(const std::string & format, const encoder_registry & encoders, size_t read_size, std::string & err);

    // Where the framer writes. Valid between open() and close().
    byte_sink & input();
    // What the consumer reads. Outlives the relay.
    std::shared_ptr<stream_adapter> output() const { return output_; }

    // Ends the input, waits up to timeout_ms for the encoder to exit, kills it
    // otherwise. Never fails. Safe to call repeatedly.
    void close(int timeout_ms = k_encoder_exit_timeout_ms);

    bool is_open() const { return output_ != nullptr && open_; }
    bool has_encoder() const { return process_ != nullptr; }
    const std::string & format() const { return format_; }

private:
    std::string format_;
    std::shared_ptr<stream_adapter> output_;
    std::unique_ptr<encoder_process> process_;
    std::thread relay_thread_;
    bool open_ = false;

    static void relay_loop(encoder_process * process, std::shared_ptr<stream_adapter> out, size_t read_size);
};
