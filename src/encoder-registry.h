#pragma once

#include <map>
#include <string>
#include <vector>

static constexpr const char * k_native_format = "wav";
static constexpr const char * k_native_mime = "audio/wav";

struct encoder_spec {
    std::vector<std::string> argv;  // argv[0] is the binary
    std::string package;            // install hint shown when the binary is missing
    std::string mime;
};

// Formats that can be produced by piping the native WAV stream through an external
// encoder. Built once at startup and passed by value to workers and pools.
class encoder_registry {
public:
    encoder_registry() = default;

    // mp3 (lame) and opus (opusenc).
    static encoder_registry defaults();

    // Copy of `reg` without the encoders whose binary is not on PATH.
    static encoder_registry probe(const encoder_registry & reg);

    // Adds or replaces entries from a JSON object keyed by format name.
    bool merge_json(const std::string & raw, std::string & err);
    bool merge_json_file(const std::string & path, std::string & err);

    // Returns false and leaves the registry unchanged when `spec` names no binary
    // or `format` is empty or native.
    bool set(const std::string & format, encoder_spec spec);
    void remove(const std::string & format);

    // Encoder for `format`, nullptr for the native format and unknown formats.
    const encoder_spec * find(const std::string & format) const;

    bool supports(const std::string & format) const;
    std::string mime_type(const std::string & format) const;
    std::vector<std::string> formats() const;   // native format first

    const std::map<std::string, encoder_spec> & entries() const { return entries_; }

private:
    std::map<std::string, encoder_spec> entries_;
};

// Resolves `binary` the way execvp would. Empty string when not found.
std::string find_program_in_path(const std::string & binary);
