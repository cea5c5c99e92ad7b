#include "encoder-registry.h"

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::ordered_json;

encoder_registry encoder_registry::defaults() {
    encoder_registry reg;
    reg.set("mp3", {{"lame", "-htv", "--silent", "-", "-"}, "lame", "audio/mpeg"});
    reg.set("opus", {{"opusenc", "--quiet", "--discard-comments", "--ignorelength", "-", "-"}, "opus-tools", "audio/ogg"});
    return reg;
}

encoder_registry encoder_registry::probe(const encoder_registry & reg) {
    encoder_registry out;
    for (const auto & kv : reg.entries_) {
        if (kv.second.argv.empty()) {
            continue;
        }
        const std::string & binary = kv.second.argv.front();
        if (!find_program_in_path(binary).empty()) {
            out.entries_.insert(kv);
            continue;
        }
        std::fprintf(stderr, "Disable %s support - %s not found. Use apt install %s\n",
                kv.first.c_str(),
                binary.c_str(),
                kv.second.package.empty() ? binary.c_str() : kv.second.package.c_str());
    }
    return out;
}

static bool parse_encoder_entry(const std::string & format, const json & j, encoder_spec & out, std::string & err) {
    if (!j.is_object()) {
        err = "encoder '" + format + "' must be a JSON object";
        return false;
    }
    const auto it_argv = j.find("argv");
    if (it_argv == j.end() || !it_argv->is_array() || it_argv->empty()) {
        err = "encoder '" + format + "' requires non-empty array field 'argv'";
        return false;
    }
    for (const auto & a : *it_argv) {
        if (!a.is_string()) {
            err = "encoder '" + format + "' argv entries must be strings";
            return false;
        }
        out.argv.push_back(a.get<std::string>());
    }
    if (out.argv.front().empty()) {
        err = "encoder '" + format + "' has an empty binary name";
        return false;
    }

    const auto it_pkg = j.find("package");
    if (it_pkg != j.end() && !it_pkg->is_null()) {
        if (!it_pkg->is_string()) {
            err = "encoder '" + format + "' field 'package' must be string";
            return false;
        }
        out.package = it_pkg->get<std::string>();
    }
    const auto it_mime = j.find("mime");
    if (it_mime != j.end() && !it_mime->is_null()) {
        if (!it_mime->is_string()) {
            err = "encoder '" + format + "' field 'mime' must be string";
            return false;
        }
        out.mime = it_mime->get<std::string>();
    }
    if (out.mime.empty()) {
        out.mime = "application/octet-stream";
    }
    return true;
}

bool encoder_registry::merge_json(const std::string & raw, std::string & err) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const std::exception & e) {
        err = std::string("invalid encoders JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "encoders JSON must be an object keyed by format";
        return false;
    }

    std::map<std::string, encoder_spec> parsed;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty()) {
            err = "encoders JSON contains an empty format name";
            return false;
        }
        if (it.key() == k_native_format) {
            err = std::string("format '") + k_native_format + "' is native and cannot have an encoder";
            return false;
        }
        encoder_spec spec;
        if (!parse_encoder_entry(it.key(), it.value(), spec, err)) {
            return false;
        }
        parsed[it.key()] = std::move(spec);
    }

    for (auto & kv : parsed) {
        entries_[kv.first] = std::move(kv.second);
    }
    return true;
}

bool encoder_registry::merge_json_file(const std::string & path, std::string & err) {
    std::ifstream file(path);
    if (!file) {
        err = "failed to open file for read: " + path;
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (!merge_json(ss.str(), err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool encoder_registry::set(const std::string & format, encoder_spec spec) {
    if (format.empty() || format == k_native_format || spec.argv.empty() || spec.argv.front().empty()) {
        return false;
    }
    entries_[format] = std::move(spec);
    return true;
}

void encoder_registry::remove(const std::string & format) {
    entries_.erase(format);
}

const encoder_spec * encoder_registry::find(const std::string & format) const {
    auto it = entries_.find(format);
    return it == entries_.end() ? nullptr : &it->second;
}

bool encoder_registry::supports(const std::string & format) const {
    return format == k_native_format || entries_.count(format) > 0;
}

std::string encoder_registry::mime_type(const std::string & format) const {
    if (format == k_native_format) {
        return k_native_mime;
    }
    const encoder_spec * spec = find(format);
    return spec != nullptr ? spec->mime : std::string();
}

std::vector<std::string> encoder_registry::formats() const {
    std::vector<std::string> out;
    out.reserve(entries_.size() + 1);
    out.emplace_back(k_native_format);
    for (const auto & kv : entries_) {
        out.push_back(kv.first);
    }
    return out;
}

std::string find_program_in_path(const std::string & binary) {
    if (binary.empty()) {
        return std::string();
    }
    if (binary.find('/') != std::string::npos) {
        return access(binary.c_str(), X_OK) == 0 ? binary : std::string();
    }

    const char * path_env = std::getenv("PATH");
    const std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + binary;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::string();
}
