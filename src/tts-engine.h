#pragma once

#include "voxflow-engine.h"

#include <string>
#include <vector>

struct tts_engine_config {
    // Engine selection, first match wins: vtable, library, built-in tone engine.
    const voxflow_engine_vtable * vtable = nullptr;
    std::string library;

    std::string data_path;
    std::vector<std::string> resources;
};

// Owns one engine instance. Not thread-safe: all calls, including the callbacks
// the engine makes from generate(), happen on the owning thread.
class tts_engine {
public:
    tts_engine() = default;
    ~tts_engine();

    tts_engine(const tts_engine &) = delete;
    tts_engine & operator=(const tts_engine &) = delete;

    bool init(
            const tts_engine_config & cfg,
            voxflow_sample_rate_callback on_sample_rate,
            voxflow_samples_callback on_samples,
            void * user_data,
            std::string & err);
    void free();

    bool is_loaded() const { return handle_ != nullptr; }
    const std::string & version() const { return version_; }

    bool set_voice(const std::string & voice, std::string & err);
    bool generate(const std::string & text, std::string & err);

private:
    const voxflow_engine_vtable * api_ = nullptr;
    void * handle_ = nullptr;
    void * library_ = nullptr;   // dlopen handle
    std::string version_;
};

// Built-in engine: one sine segment per input character.
const voxflow_engine_vtable * voxflow_tone_engine(void);
