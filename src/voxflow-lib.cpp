#include "voxflow-lib.h"

#include "encoder-registry.h"
#include "tts-worker-pool.h"

#include <cstdio>
#include <memory>
#include <new>
#include <string>

struct voxflow_context {
    std::unique_ptr<tts_worker_pool> pool;
};

struct voxflow_stream {
    tts_stream stream;
    std::string chunk;
};

namespace {

static void set_err(char * err, size_t err_size, const std::string & msg) {
    if (err != nullptr && err_size > 0) {
        std::snprintf(err, err_size, "%s", msg.c_str());
    }
}

static voxflow_status to_status(tts_say_status s) {
    switch (s) {
        case TTS_SAY_OK:                 return VOXFLOW_STATUS_OK;
        case TTS_SAY_UNSUPPORTED_FORMAT: return VOXFLOW_STATUS_UNSUPPORTED_FORMAT;
        case TTS_SAY_INVALID_REQUEST:    return VOXFLOW_STATUS_INVALID_REQUEST;
        case TTS_SAY_BUSY:               return VOXFLOW_STATUS_BUSY;
        case TTS_SAY_FAILED:             return VOXFLOW_STATUS_FAILED;
    }
    return VOXFLOW_STATUS_FAILED;
}

static tts_request make_request(const char * text, const char * voice, const char * format, size_t chunk_size) {
    tts_request req;
    req.text = text != nullptr ? text : "";
    if (voice != nullptr && voice[0] != '\0') {
        req.voice = voice;
    }
    if (format != nullptr && format[0] != '\0') {
        req.format = format;
    }
    if (chunk_size > 0) {
        req.chunk_size = chunk_size;
    }
    return req;
}

} // namespace

voxflow_params voxflow_default_params(void) {
    const tts_worker_params wp;
    voxflow_params p {};
    p.n_workers = 1;
    p.admission_timeout_ms = tts_pool_params().admission_timeout_ms;
    p.ready_timeout_ms = wp.ready_timeout_ms;
    p.encoder_exit_timeout_ms = wp.encoder_exit_timeout_ms;
    p.engine_vtable = nullptr;
    p.engine_library = nullptr;
    p.data_path = nullptr;
    p.resource_paths = nullptr;
    p.n_resource_paths = 0;
    p.encoders_json = nullptr;
    p.probe_encoders = true;
    return p;
}

voxflow_context * voxflow_init(const voxflow_params * params, char * err, size_t err_size) {
    const voxflow_params p = params != nullptr ? *params : voxflow_default_params();

    encoder_registry encoders = encoder_registry::defaults();
    if (p.encoders_json != nullptr && p.encoders_json[0] != '\0') {
        std::string json_err;
        if (!encoders.merge_json_file(p.encoders_json, json_err)) {
            set_err(err, err_size, json_err);
            return nullptr;
        }
    }
    if (p.probe_encoders) {
        encoders = encoder_registry::probe(encoders);
    }

    tts_pool_params pool_params;
    pool_params.n_workers = p.n_workers;
    pool_params.admission_timeout_ms = p.admission_timeout_ms;
    pool_params.worker.ready_timeout_ms = p.ready_timeout_ms;
    pool_params.worker.encoder_exit_timeout_ms = p.encoder_exit_timeout_ms;
    pool_params.engine.vtable = p.engine_vtable;
    pool_params.engine.library = p.engine_library != nullptr ? p.engine_library : "";
    pool_params.engine.data_path = p.data_path != nullptr ? p.data_path : "";
    for (size_t i = 0; i < p.n_resource_paths; ++i) {
        if (p.resource_paths[i] != nullptr) {
            pool_params.engine.resources.emplace_back(p.resource_paths[i]);
        }
    }

    auto * ctx = new (std::nothrow) voxflow_context();
    if (ctx == nullptr) {
        set_err(err, err_size, "out of memory");
        return nullptr;
    }
    ctx->pool = std::make_unique<tts_worker_pool>(std::move(encoders), std::move(pool_params));

    std::string start_err;
    if (!ctx->pool->start(start_err)) {
        set_err(err, err_size, start_err);
        delete ctx;
        return nullptr;
    }
    return ctx;
}

void voxflow_free(voxflow_context * ctx) {
    if (ctx == nullptr) {
        return;
    }
    ctx->pool->shutdown();
    delete ctx;
}

bool voxflow_format_supported(const voxflow_context * ctx, const char * format) {
    return ctx != nullptr && format != nullptr && ctx->pool->encoders().supports(format);
}

bool voxflow_formats(const voxflow_context * ctx, char * out, size_t out_size) {
    if (ctx == nullptr || out == nullptr || out_size == 0) {
        return false;
    }
    std::string joined;
    for (const auto & f : ctx->pool->encoders().formats()) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += f;
    }
    std::snprintf(out, out_size, "%s", joined.c_str());
    return joined.size() < out_size;
}

const char * voxflow_status_to_cstr(voxflow_status status) {
    switch (status) {
        case VOXFLOW_STATUS_OK:                 return tts_say_status_to_cstr(TTS_SAY_OK);
        case VOXFLOW_STATUS_UNSUPPORTED_FORMAT: return tts_say_status_to_cstr(TTS_SAY_UNSUPPORTED_FORMAT);
        case VOXFLOW_STATUS_INVALID_REQUEST:    return tts_say_status_to_cstr(TTS_SAY_INVALID_REQUEST);
        case VOXFLOW_STATUS_BUSY:               return tts_say_status_to_cstr(TTS_SAY_BUSY);
        case VOXFLOW_STATUS_FAILED:             return tts_say_status_to_cstr(TTS_SAY_FAILED);
    }
    return "unknown";
}

voxflow_status voxflow_say(
        voxflow_context * ctx,
        const char * text,
        const char * voice,
        const char * format,
        size_t chunk_size,
        voxflow_stream ** stream_out,
        char * err,
        size_t err_size) {
    if (ctx == nullptr || stream_out == nullptr) {
        set_err(err, err_size, "context and stream_out are required");
        return VOXFLOW_STATUS_INVALID_REQUEST;
    }
    *stream_out = nullptr;

    auto * s = new (std::nothrow) voxflow_stream();
    if (s == nullptr) {
        set_err(err, err_size, "out of memory");
        return VOXFLOW_STATUS_FAILED;
    }

    std::string say_err;
    const tts_say_status st = ctx->pool->say(make_request(text, voice, format, chunk_size), s->stream, say_err);
    if (st != TTS_SAY_OK) {
        set_err(err, err_size, say_err);
        delete s;
        return to_status(st);
    }
    *stream_out = s;
    return VOXFLOW_STATUS_OK;
}

bool voxflow_stream_next(voxflow_stream * stream, const uint8_t ** data, size_t * n_bytes, char * err, size_t err_size) {
    if (stream == nullptr || data == nullptr || n_bytes == nullptr) {
        set_err(err, err_size, "stream, data and n_bytes are required");
        return false;
    }
    *data = nullptr;
    *n_bytes = 0;
    if (!stream->stream.next(stream->chunk)) {
        if (!stream->stream.error().empty()) {
            set_err(err, err_size, stream->stream.error());
        }
        return false;
    }
    *data = reinterpret_cast<const uint8_t *>(stream->chunk.data());
    *n_bytes = stream->chunk.size();
    return true;
}

void voxflow_stream_free(voxflow_stream * stream) {
    delete stream;
}

voxflow_status voxflow_to_file(
        voxflow_context * ctx,
        const char * path,
        const char * text,
        const char * voice,
        const char * format,
        char * err,
        size_t err_size) {
    if (ctx == nullptr || path == nullptr || path[0] == '\0') {
        set_err(err, err_size, "context and path are required");
        return VOXFLOW_STATUS_INVALID_REQUEST;
    }
    std::string file_err;
    const tts_say_status st = ctx->pool->to_file(path, make_request(text, voice, format, 0), file_err);
    if (st != TTS_SAY_OK) {
        set_err(err, err_size, file_err);
    }
    return to_status(st);
}
