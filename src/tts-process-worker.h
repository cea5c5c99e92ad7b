#pragma once

#include "tts-worker.h"

#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Worker whose engine lives in a forked child process. The parent talks to the
// child over three pipes:
//   request (parent -> child): REQUEST / STOP frames
//   stream  (child -> parent): READY, DATA..., END for each request, or ERROR
//   status  (child -> parent): HELLO once after engine init, DONE after each request
// A monitor thread reads the status pipe and clears the processing state. A relay
// thread per request copies the stream frames into an in-memory channel, so the
// child never blocks on a slow or absent reader and can always finish and exit.
class tts_process_worker : public tts_worker {
public:
    tts_process_worker(tts_engine_config engine_cfg, encoder_registry encoders, tts_worker_params params = {}, int32_t index = 0);
    ~tts_process_worker() override;

    bool start(std::string & err) override;
    // abort=true kills the child instead of letting the current request finish.
    void shutdown(bool abort = false) override;
    bool say(const tts_request & req, tts_stream & out, std::string & err) override;
    bool alive() const override { return alive_.load(); }

    pid_t pid() const;
    const std::string & engine_version() const { return engine_version_; }

private:
    struct request_state;
    class relay_source;

    tts_engine_config engine_cfg_;
    encoder_registry encoders_;
    tts_worker_params params_;
    int32_t index_ = 0;

    // guards pid_, request_fd_, stopping_ and relay_
    mutable std::mutex mtx_;
    pid_t pid_ = -1;
    int request_fd_ = -1;
    bool stopping_ = false;
    std::thread relay_;

    int stream_fd_ = -1;
    int status_fd_ = -1;
    std::atomic<bool> alive_ {false};
    std::string engine_version_;

    std::thread monitor_;

    void monitor_loop();
    // Copies the stream frames of one request into `st` until END, ERROR or EOF.
    void relay_loop(std::shared_ptr<request_state> st);
    void join_relay();
    void close_fds();
};
