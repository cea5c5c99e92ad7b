#include "stream-adapter.h"

#include <utility>

void stream_adapter::write(std::string chunk) {
    if (chunk.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (ended_) {
            return;
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

bool stream_adapter::write(const uint8_t * data, size_t n, std::string & /* err */) {
    if (data != nullptr && n > 0) {
        write(std::string(reinterpret_cast<const char *>(data), n));
    }
    return true;
}

void stream_adapter::end() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (ended_) {
            return;
        }
        ended_ = true;
        chunks_.emplace_back();
    }
    cv_.notify_one();
}

void stream_adapter::close() {
    end();
}

std::string stream_adapter::read() {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!open_) {
        return std::string();
    }
    cv_.wait(lock, [&]() { return !chunks_.empty(); });

    if (chunks_.size() == 1) {
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        if (chunk.empty()) {
            open_ = false;
        }
        return chunk;
    }

    // Several chunks already queued: hand them over in one piece. If the end
    // marker is among them the channel closes and the next read returns "".
    std::string joined;
    while (!chunks_.empty()) {
        std::string chunk = std::move(chunks_.front());
        chunks_.pop_front();
        if (chunk.empty()) {
            open_ = false;
            break;
        }
        joined += chunk;
    }
    return joined;
}

bool stream_adapter::is_open() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
}

size_t stream_adapter::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = 0;
    for (const auto & chunk : chunks_) {
        n += chunk.size();
    }
    return n;
}
