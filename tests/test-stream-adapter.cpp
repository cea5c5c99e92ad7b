#include "stream-adapter.h"

#include "test-common.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

static void test_chunks_in_order_then_end() {
    stream_adapter a;
    a.write(std::string("ab"));
    a.write(std::string("cd"));
    a.write(std::string("e"));
    a.end();

    TEST_CHECK(a.read() == "abcde");
    TEST_CHECK(a.read().empty());
    TEST_CHECK(!a.is_open());
    // every read after the terminal chunk returns immediately
    for (int i = 0; i < 3; ++i) {
        TEST_CHECK(a.read().empty());
    }
}

static void test_end_is_idempotent() {
    stream_adapter a;
    a.write(std::string("x"));
    a.end();
    a.end();
    a.close();
    TEST_CHECK(a.pending() == 1);

    TEST_CHECK(a.read() == "x");
    TEST_CHECK(a.read().empty());
    TEST_CHECK(a.pending() == 0);
}

static void test_empty_and_late_writes_dropped() {
    stream_adapter a;
    a.write(std::string());
    std::string err;
    TEST_CHECK(a.write(nullptr, 0, err));
    TEST_CHECK(a.pending() == 0);

    a.end();
    a.write(std::string("late"));
    TEST_CHECK(a.read().empty());
}

static void test_single_chunk_read() {
    stream_adapter a;
    a.write(std::string("one"));
    TEST_CHECK(a.read() == "one");
    a.write(std::string("two"));
    TEST_CHECK(a.read() == "two");
    a.end();
    TEST_CHECK(a.read().empty());
}

static void test_concurrent_producer() {
    stream_adapter a;
    std::string expected;
    std::vector<std::string> parts;
    for (int i = 0; i < 500; ++i) {
        parts.push_back(std::to_string(i) + ",");
        expected += parts.back();
    }

    std::thread producer([&]() {
        std::string err;
        for (const auto & p : parts) {
            a.write(reinterpret_cast<const uint8_t *>(p.data()), p.size(), err);
            if (p.size() % 3 == 0) {
                std::this_thread::yield();
            }
        }
        a.close();
    });

    std::string got;
    for (;;) {
        const std::string chunk = a.read();
        if (chunk.empty()) {
            break;
        }
        got += chunk;
    }
    producer.join();

    TEST_CHECK(got == expected);
    TEST_CHECK(a.read().empty());
}

static void test_read_blocks_until_write() {
    stream_adapter a;
    std::string got;
    std::thread consumer([&]() { got = a.read(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    a.write(std::string("late start"));
    consumer.join();
    TEST_CHECK(got == "late start");
}

int main() {
    test_chunks_in_order_then_end();
    test_end_is_idempotent();
    test_empty_and_late_writes_dropped();
    test_single_chunk_read();
    test_concurrent_producer();
    test_read_blocks_until_write();
    return test_finish("test-stream-adapter");
}
