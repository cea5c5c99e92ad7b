#include "encoder-registry.h"
#include "tts-worker-pool.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::ordered_json;

struct server_config {
    std::string host = "127.0.0.1";
    int32_t port = 18090;

    int32_t n_workers = 1;
    int32_t admission_timeout_ms = 30000;
    int32_t ready_timeout_ms = 3600 * 1000;
    int32_t default_chunk_size = (int32_t) k_relay_default_read_size;

    std::string engine_lib;
    std::string data_path;
    std::vector<std::string> resources;
    std::string encoders_json;
    bool no_probe = false;

    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [options]\n\n"
        "Server:\n"
        "  --host HOST                     listen address (default: 127.0.0.1)\n"
        "  --port N                        listen port (default: 18090)\n\n"
        "Workers:\n"
        "  --parallel N, -np N             synthesis workers; >1 runs them as processes (default: 1)\n"
        "  --admission-timeout-ms N        wait for an idle worker before answering 503 (default: 30000)\n"
        "  --ready-timeout-ms N            wait for the engine to start an utterance (default: 3600000)\n"
        "  --chunk-size N                  default encoder read size in bytes (default: 1024)\n\n"
        "Engine:\n"
        "  --engine-lib FNAME              shared library exporting voxflow_engine_entry\n"
        "  --data-path DIR                 engine data directory\n"
        "  --resource PATH                 engine resource path (repeatable)\n\n"
        "Encoders:\n"
        "  --encoders-json FNAME           extra encoders as JSON\n"
        "  --no-probe                      keep encoders whose binary is not on PATH\n\n"
        "Endpoints:\n"
        "  GET  /health\n"
        "  GET  /formats\n"
        "  GET  /say?text=...&voice=...&format=...&chunk_size=...\n"
        "  POST /say  {\"text\": \"...\", \"voice\": \"...\", \"format\": \"...\", \"chunk_size\": N}\n",
        argv0);
}

static bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = (int32_t) v;
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, server_config & cfg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "--host") {
            if (!needs_value(i, argc)) return false;
            cfg.host = argv[++i];
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.port)) return false;
        } else if (arg == "-np" || arg == "--parallel") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_workers)) return false;
        } else if (arg == "--admission-timeout-ms") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.admission_timeout_ms)) return false;
        } else if (arg == "--ready-timeout-ms") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.ready_timeout_ms)) return false;
        } else if (arg == "--chunk-size") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.default_chunk_size)) return false;
        } else if (arg == "--engine-lib") {
            if (!needs_value(i, argc)) return false;
            cfg.engine_lib = argv[++i];
        } else if (arg == "--data-path") {
            if (!needs_value(i, argc)) return false;
            cfg.data_path = argv[++i];
        } else if (arg == "--resource") {
            if (!needs_value(i, argc)) return false;
            cfg.resources.push_back(argv[++i]);
        } else if (arg == "--encoders-json") {
            if (!needs_value(i, argc)) return false;
            cfg.encoders_json = argv[++i];
        } else if (arg == "--no-probe") {
            cfg.no_probe = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (cfg.show_help) {
        return true;
    }
    if (cfg.port < 1 || cfg.port > 65535) {
        std::fprintf(stderr, "--port must be in 1..65535\n");
        return false;
    }
    if (cfg.n_workers < 1) {
        std::fprintf(stderr, "--parallel must be >= 1\n");
        return false;
    }
    if (cfg.admission_timeout_ms < 0 || cfg.ready_timeout_ms < 1) {
        std::fprintf(stderr, "--admission-timeout-ms must be >= 0 and --ready-timeout-ms >= 1\n");
        return false;
    }
    if (cfg.default_chunk_size < 1) {
        std::fprintf(stderr, "--chunk-size must be >= 1\n");
        return false;
    }
    return true;
}

static bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

template<typename T>
static bool get_json_number(const json & j, const char * key, T & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    out = it->get<T>();
    return true;
}

static json make_error_json(const std::string & msg, int code = 400) {
    return json {
        {"ok", false},
        {"error", {
            {"message", msg},
            {"code", code},
        }},
    };
}

static int http_status_for(tts_say_status st) {
    switch (st) {
        case TTS_SAY_OK:                 return 200;
        case TTS_SAY_UNSUPPORTED_FORMAT: return 400;
        case TTS_SAY_INVALID_REQUEST:    return 400;
        case TTS_SAY_BUSY:               return 503;
        case TTS_SAY_FAILED:             return 500;
    }
    return 500;
}

static bool parse_say_query(const httplib::Request & req, tts_request & out, std::string & err) {
    out.text = req.get_param_value("text");
    if (req.has_param("voice")) {
        out.voice = req.get_param_value("voice");
    }
    if (req.has_param("format")) {
        out.format = req.get_param_value("format");
    }
    if (req.has_param("chunk_size")) {
        int32_t n = 0;
        if (!parse_i32(req.get_param_value("chunk_size").c_str(), n) || n < 1) {
            err = "chunk_size must be a positive integer";
            return false;
        }
        out.chunk_size = (size_t) n;
    }
    return true;
}

static bool parse_say_body(const std::string & body_raw, tts_request & out, std::string & err) {
    json body;
    try {
        body = json::parse(body_raw);
    } catch (const std::exception & e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!body.is_object()) {
        err = "request body must be a JSON object";
        return false;
    }
    try {
        if (!get_json_string(body, "text", out.text)) {
            get_json_string(body, "input", out.text);
        }
        get_json_string(body, "voice", out.voice);
        get_json_string(body, "format", out.format);
        int64_t chunk_size = 0;
        if (get_json_number(body, "chunk_size", chunk_size)) {
            if (chunk_size < 1) {
                err = "chunk_size must be a positive integer";
                return false;
            }
            out.chunk_size = (size_t) chunk_size;
        }
    } catch (const std::exception & e) {
        err = e.what();
        return false;
    }
    return true;
}

int main(int argc, char ** argv) {
    server_config cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    encoder_registry encoders = encoder_registry::defaults();
    if (!cfg.encoders_json.empty()) {
        std::string err;
        if (!encoders.merge_json_file(cfg.encoders_json, err)) {
            std::fprintf(stderr, "failed to load --encoders-json: %s\n", err.c_str());
            return 1;
        }
    }
    if (!cfg.no_probe) {
        encoders = encoder_registry::probe(encoders);
    }

    tts_pool_params pp;
    pp.n_workers = cfg.n_workers;
    pp.admission_timeout_ms = cfg.admission_timeout_ms;
    pp.worker.ready_timeout_ms = cfg.ready_timeout_ms;
    pp.engine.library = cfg.engine_lib;
    pp.engine.data_path = cfg.data_path;
    pp.engine.resources = cfg.resources;

    tts_worker_pool pool(std::move(encoders), std::move(pp));
    {
        std::string err;
        const auto t0 = std::chrono::steady_clock::now();
        if (!pool.start(err)) {
            std::fprintf(stderr, "failed to start workers: %s\n", err.c_str());
            return 1;
        }
        std::fprintf(stderr, "init time: %.3f sec\n",
                std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count());
    }

    httplib::Server server;
    server.set_default_headers({{"Server", "voxflow-server"}});

    server.set_pre_routing_handler([](const httplib::Request & req, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Origin", req.get_header_value("Origin"));
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Credentials", "true");
            res.set_header("Access-Control-Allow-Methods", "GET, POST");
            res.set_header("Access-Control-Allow-Headers", "*");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/health", [&](const httplib::Request &, httplib::Response & res) {
        json j = {
            {"status", "ok"},
            {"workers", pool.size()},
            {"busy", pool.busy_count()},
            {"formats", pool.encoders().formats()},
        };
        res.set_content(j.dump(), "application/json; charset=utf-8");
    });

    server.Get("/formats", [&](const httplib::Request &, httplib::Response & res) {
        json formats = json::array();
        for (const auto & f : pool.encoders().formats()) {
            formats.push_back({
                {"format", f},
                {"mime", pool.encoders().mime_type(f)},
                {"encoder", pool.encoders().find(f) != nullptr},
            });
        }
        res.set_content(json {{"formats", formats}}.dump(), "application/json; charset=utf-8");
    });

    auto say_handler = [&](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();

        tts_request tr;
        tr.chunk_size = (size_t) cfg.default_chunk_size;
        std::string err;
        const bool parsed = req.method == "POST" ? parse_say_body(req.body, tr, err) : parse_say_query(req, tr, err);
        if (!parsed) {
            res.status = 400;
            res.set_content(make_error_json(err, 400).dump(), "application/json; charset=utf-8");
            return;
        }

        auto stream = std::make_shared<tts_stream>();
        const tts_say_status st = pool.say(tr, *stream, err);
        if (st != TTS_SAY_OK) {
            const int code = http_status_for(st);
            std::fprintf(stderr, "say: path=%s ok=false status=%s format=%s voice=%s: %s\n",
                    req.path.c_str(), tts_say_status_to_cstr(st), tr.format.c_str(), tr.voice.c_str(), err.c_str());
            res.status = code;
            if (st == TTS_SAY_BUSY) {
                res.set_header("Retry-After", "1");
            }
            res.set_content(make_error_json(err, code).dump(), "application/json; charset=utf-8");
            return;
        }

        const double wait_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t_req_begin).count();
        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_header("X-Audio-Format", tr.format);

        res.set_chunked_content_provider(
                pool.encoders().mime_type(tr.format),
                [stream, n_bytes = size_t(0)](size_t, httplib::DataSink & sink) mutable -> bool {
                    std::string chunk;
                    if (!stream->next(chunk)) {
                        if (!stream->error().empty()) {
                            std::fprintf(stderr, "say: stream failed after %zu bytes: %s\n", n_bytes, stream->error().c_str());
                            return false;
                        }
                        sink.done();
                        return true;
                    }
                    n_bytes += chunk.size();
                    return sink.write(chunk.data(), chunk.size());
                },
                [stream, path = req.path, format = tr.format, wait_ms, t_req_begin](bool success) {
                    // an unfinished stream is drained by its worker on release
                    stream->release();
                    const double total_ms = std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - t_req_begin).count();
                    std::fprintf(stderr, "say: path=%s ok=%s format=%s wait_ms=%.2f total_ms=%.2f\n",
                            path.c_str(), success ? "true" : "false", format.c_str(), wait_ms, total_ms);
                });
    };

    server.Get("/say", say_handler);
    server.Post("/say", say_handler);

    std::fprintf(stderr, "voxflow-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    if (!server.listen(cfg.host, cfg.port)) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
