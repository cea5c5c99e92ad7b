#include "encoder-relay.h"

#include <cstdio>
#include <utility>
#include <vector>

encoder_relay::~encoder_relay() {
    close();
}

bool encoder_relay::open(const std::string & format, const encoder_registry & encoders, size_t read_size, std::string & err) {
    close();

    const encoder_spec * spec = encoders.find(format);
    if (spec == nullptr && format != k_native_format) {
        err = "Unsupported format: " + format;
        return false;
    }

    auto output = std::make_shared<stream_adapter>();
    if (spec != nullptr) {
        auto process = std::make_unique<encoder_process>();
        if (!process->start(spec->argv, err)) {
            return false;
        }
        process_ = std::move(process);
        relay_thread_ = std::thread(relay_loop, process_.get(), output, read_size > 0 ? read_size : k_relay_default_read_size);
    }

    format_ = format;
    output_ = std::move(output);
    open_ = true;
    return true;
}

byte_sink & encoder_relay::input() {
    if (process_) {
        return process_->input();
    }
    return *output_;
}

void encoder_relay::relay_loop(encoder_process * process, std::shared_ptr<stream_adapter> out, size_t read_size) {
    std::vector<uint8_t> buf(read_size);
    for (;;) {
        const ssize_t n = process->read_output(buf.data(), buf.size());
        if (n <= 0) {
            if (n < 0) {
                std::fprintf(stderr, "warning: encoder relay: read from encoder pid=%d failed\n", (int) process->pid());
            }
            break;
        }
        out->write(std::string(reinterpret_cast<const char *>(buf.data()), (size_t) n));
    }
    out->end();
}

void encoder_relay::close(int timeout_ms) {
    if (!open_) {
        return;
    }
    open_ = false;

    if (!process_) {
        output_->end();
        return;
    }

    process_->close_input();
    if (!process_->wait_for(timeout_ms)) {
        std::fprintf(stderr, "warning: encoder %s (pid=%d) did not exit within %d ms, killing it\n",
                format_.c_str(), (int) process_->pid(), timeout_ms);
        process_->kill();
    }
    if (relay_thread_.joinable()) {
        relay_thread_.join();
    }
    process_.reset();
}
