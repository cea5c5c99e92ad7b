#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

// Append-only byte target. Implemented by the in-process channel and by the
// stdin pipe of an encoder subprocess.
class byte_sink {
public:
    virtual ~byte_sink() = default;

    virtual bool write(const uint8_t * data, size_t n, std::string & err) = 0;
    virtual void close() = 0;
};

// Ordered chunk channel between a push producer (engine callbacks, relay thread)
// and a pull consumer. An empty chunk is the end-of-stream marker.
// Single producer, single consumer.
class stream_adapter : public byte_sink {
public:
    stream_adapter() = default;

    stream_adapter(const stream_adapter &) = delete;
    stream_adapter & operator=(const stream_adapter &) = delete;

    // Never blocks. Empty chunks are dropped.
    void write(std::string chunk);
    bool write(const uint8_t * data, size_t n, std::string & err) override;

    // Enqueues the end marker unless the channel already ended.
    void end();
    void close() override;

    // Blocks until data is available. When more than one chunk is queued they are
    // returned joined. Returns "" once at end of stream and on every call after it.
    std::string read();

    bool is_open() const;
    size_t pending() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    bool ended_ = false;   // end() was called
    bool open_ = true;     // consumer has not seen the end marker yet
};
