#include "voxflow-lib.h"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

struct cli_params {
    std::string prompt;
    std::string prompt_file;
    std::string output = "output.wav";
    std::string voice = "default";
    std::string format;   // empty: taken from the output extension, else wav

    int32_t n_threads = 1;
    int32_t chunk_size = 0;
    int32_t admission_timeout_ms = 30000;

    std::string engine_lib;
    std::string data_path;
    std::vector<std::string> resources;
    std::string encoders_json;
    bool no_probe = false;

    bool demo = false;
    bool list_formats = false;
    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -p TEXT [-o FILE] [options]\n"
        "  %s --demo [options]\n\n"
        "Synthesis:\n"
        "  -p, --prompt TEXT               input text\n"
        "  --prompt-file FNAME             input text file\n"
        "  -o, --output FNAME              output file (default: output.wav)\n"
        "  -v, --voice NAME                voice (default: default)\n"
        "  -f, --format NAME               wav | mp3 | opus | ... (default: from --output extension)\n"
        "  --chunk-size N                  encoder read size in bytes (default: 1024)\n\n"
        "Workers:\n"
        "  -t, --threads N                 1 = in-process worker, >1 = worker processes (default: 1)\n"
        "  --admission-timeout-ms N        wait for an idle worker (default: 30000)\n\n"
        "Engine:\n"
        "  --engine-lib FNAME              shared library exporting voxflow_engine_entry\n"
        "                                  (default: built-in tone engine)\n"
        "  --data-path DIR                 engine data directory\n"
        "  --resource PATH                 engine resource path (repeatable)\n\n"
        "Encoders:\n"
        "  --encoders-json FNAME           extra encoders, {\"fmt\": {\"argv\": [...], \"package\": \"...\", \"mime\": \"...\"}}\n"
        "  --no-probe                      keep encoders whose binary is not on PATH\n"
        "  --list-formats                  print supported formats and exit\n\n"
        "Other:\n"
        "  --demo                          write wav.wav, mp3.mp3, opus.ogg and wav.wav again\n"
        "  -h, --help                      show this help\n",
        argv0, argv0);
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

static std::string trim_copy(const std::string & in) {
    size_t b = 0;
    while (b < in.size() && std::isspace((unsigned char) in[b])) {
        ++b;
    }
    size_t e = in.size();
    while (e > b && std::isspace((unsigned char) in[e - 1])) {
        --e;
    }
    return in.substr(b, e - b);
}

static bool load_text_file(const std::string & path, std::string & out, std::string & err) {
    std::ifstream file(path);
    if (!file) {
        err = "failed to open prompt file: " + path;
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!file.good() && !file.eof()) {
        err = "failed to read prompt file: " + path;
        return false;
    }
    return true;
}

// "mp3.mp3" -> "mp3", "opus.ogg" -> "opus": the part before the first dot, as the
// demo file names are built.
static std::string format_from_name(const std::string & name) {
    const size_t slash = name.find_last_of('/');
    const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    const size_t dot = base.find('.');
    return dot == std::string::npos ? base : base.substr(0, dot);
}

static std::string format_from_extension(const std::string & path) {
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || path.find('/', dot) != std::string::npos) {
        return "wav";
    }
    const std::string ext = path.substr(dot + 1);
    return ext == "ogg" ? "opus" : ext;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            p.show_help = true;
        } else if (arg == "-p" || arg == "--prompt") {
            if (!needs_value(i, argc)) return false;
            p.prompt = argv[++i];
        } else if (arg == "--prompt-file") {
            if (!needs_value(i, argc)) return false;
            p.prompt_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "-v" || arg == "--voice") {
            if (!needs_value(i, argc)) return false;
            p.voice = argv[++i];
        } else if (arg == "-f" || arg == "--format") {
            if (!needs_value(i, argc)) return false;
            p.format = argv[++i];
        } else if (arg == "--chunk-size") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.chunk_size)) return false;
        } else if (arg == "-t" || arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.n_threads)) return false;
        } else if (arg == "--admission-timeout-ms") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.admission_timeout_ms)) return false;
        } else if (arg == "--engine-lib") {
            if (!needs_value(i, argc)) return false;
            p.engine_lib = argv[++i];
        } else if (arg == "--data-path") {
            if (!needs_value(i, argc)) return false;
            p.data_path = argv[++i];
        } else if (arg == "--resource") {
            if (!needs_value(i, argc)) return false;
            p.resources.push_back(argv[++i]);
        } else if (arg == "--encoders-json") {
            if (!needs_value(i, argc)) return false;
            p.encoders_json = argv[++i];
        } else if (arg == "--no-probe") {
            p.no_probe = true;
        } else if (arg == "--list-formats") {
            p.list_formats = true;
        } else if (arg == "--demo") {
            p.demo = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (p.show_help) {
        return true;
    }

    if (!p.prompt.empty() && !p.prompt_file.empty()) {
        std::fprintf(stderr, "--prompt and --prompt-file cannot be used together\n");
        return false;
    }

    if (!p.prompt_file.empty()) {
        std::string perr;
        if (!load_text_file(p.prompt_file, p.prompt, perr)) {
            std::fprintf(stderr, "%s\n", perr.c_str());
            return false;
        }
        p.prompt = trim_copy(p.prompt);
    }

    if (!p.demo && !p.list_formats && p.prompt.empty()) {
        std::fprintf(stderr, "either --prompt, --prompt-file, --demo or --list-formats is required\n");
        return false;
    }
    if (p.n_threads < 1) {
        p.n_threads = 1;
    }
    if (p.chunk_size < 0) {
        std::fprintf(stderr, "--chunk-size must be >= 0\n");
        return false;
    }
    if (p.admission_timeout_ms < 0) {
        std::fprintf(stderr, "--admission-timeout-ms must be >= 0\n");
        return false;
    }
    if (p.format.empty()) {
        p.format = format_from_extension(p.output);
    }
    return true;
}

static double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

static int run_demo(voxflow_context * ctx, const cli_params & p) {
    static const char * k_demo_names[] = {"wav.wav", "mp3.mp3", "opus.ogg", "wav.wav"};

    int failures = 0;
    for (const char * name : k_demo_names) {
        const std::string format = format_from_name(name);
        if (!voxflow_format_supported(ctx, format.c_str())) {
            std::printf("File %s skipped: format %s is not available\n", name, format.c_str());
            continue;
        }
        const std::string text = "I can save my voice in " + format;

        char err[1024] = {0};
        const auto t0 = std::chrono::steady_clock::now();
        const voxflow_status st = voxflow_to_file(ctx, name, text.c_str(), p.voice.c_str(), format.c_str(), err, sizeof(err));
        if (st != VOXFLOW_STATUS_OK) {
            std::fprintf(stderr, "voxflow_to_file(%s) failed (%s): %s\n", name, voxflow_status_to_cstr(st), err);
            failures++;
            continue;
        }
        std::printf("File %s created in %.3f sec.\n", name, seconds_since(t0));
    }
    return failures == 0 ? 0 : 1;
}

static int run_say(voxflow_context * ctx, const cli_params & p) {
    char err[1024] = {0};
    voxflow_stream * stream = nullptr;

    const auto t0 = std::chrono::steady_clock::now();
    const voxflow_status st = voxflow_say(
            ctx, p.prompt.c_str(), p.voice.c_str(), p.format.c_str(), (size_t) p.chunk_size, &stream, err, sizeof(err));
    if (st != VOXFLOW_STATUS_OK) {
        std::fprintf(stderr, "voxflow_say failed (%s): %s\n", voxflow_status_to_cstr(st), err);
        return 1;
    }
    const double t_first = seconds_since(t0);

    FILE * f = std::fopen(p.output.c_str(), "wb");
    if (f == nullptr) {
        std::fprintf(stderr, "failed to open file for write: %s\n", p.output.c_str());
        voxflow_stream_free(stream);
        return 1;
    }

    size_t total = 0;
    size_t n_chunks = 0;
    bool ok = true;
    const uint8_t * data = nullptr;
    size_t n = 0;
    while (voxflow_stream_next(stream, &data, &n, err, sizeof(err))) {
        if (std::fwrite(data, 1, n, f) != n) {
            std::fprintf(stderr, "failed to write file: %s\n", p.output.c_str());
            ok = false;
            break;
        }
        total += n;
        n_chunks++;
    }
    if (ok && err[0] != '\0') {
        std::fprintf(stderr, "stream failed: %s\n", err);
        ok = false;
    }
    voxflow_stream_free(stream);
    if (std::fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        return 1;
    }

    std::fprintf(stderr, "wrote %s: format=%s bytes=%zu chunks=%zu first_chunk=%.3fs total=%.3fs\n",
            p.output.c_str(), p.format.c_str(), total, n_chunks, t_first, seconds_since(t0));
    return 0;
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    std::vector<const char *> resource_ptrs;
    resource_ptrs.reserve(p.resources.size());
    for (const auto & r : p.resources) {
        resource_ptrs.push_back(r.c_str());
    }

    voxflow_params vp = voxflow_default_params();
    vp.n_workers = p.n_threads;
    vp.admission_timeout_ms = p.admission_timeout_ms;
    vp.engine_library = p.engine_lib.empty() ? nullptr : p.engine_lib.c_str();
    vp.data_path = p.data_path.empty() ? nullptr : p.data_path.c_str();
    vp.resource_paths = resource_ptrs.empty() ? nullptr : resource_ptrs.data();
    vp.n_resource_paths = resource_ptrs.size();
    vp.encoders_json = p.encoders_json.empty() ? nullptr : p.encoders_json.c_str();
    vp.probe_encoders = !p.no_probe;

    char err[1024] = {0};
    const auto t_init = std::chrono::steady_clock::now();
    voxflow_context * ctx = voxflow_init(&vp, err, sizeof(err));
    if (ctx == nullptr) {
        std::fprintf(stderr, "voxflow_init failed: %s\n", err);
        return 1;
    }

    int rc = 0;
    if (p.list_formats) {
        char formats[512] = {0};
        if (!voxflow_formats(ctx, formats, sizeof(formats))) {
            std::fprintf(stderr, "warning: format list truncated\n");
        }
        std::printf("%s\n", formats);
    } else if (p.demo) {
        std::printf("Init time: %.3f sec.\n\n", seconds_since(t_init));
        rc = run_demo(ctx, p);
    } else {
        rc = run_say(ctx, p);
    }

    voxflow_free(ctx);
    return rc;
}
