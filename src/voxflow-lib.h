#pragma once

#include "voxflow-engine.h"

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#    define VOXFLOW_API __declspec(dllexport)
#else
#    define VOXFLOW_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

struct voxflow_context;
struct voxflow_stream;

enum voxflow_status {
    VOXFLOW_STATUS_OK                 = 0,
    VOXFLOW_STATUS_UNSUPPORTED_FORMAT = 1,
    VOXFLOW_STATUS_INVALID_REQUEST    = 2,
    VOXFLOW_STATUS_BUSY               = 3,
    VOXFLOW_STATUS_FAILED             = 4,
};

struct voxflow_params {
    int32_t n_workers;              // 1 = one thread worker, >1 = process workers
    int32_t admission_timeout_ms;   // how long voxflow_say waits for an idle worker
    int32_t ready_timeout_ms;       // how long a worker waits for the engine to start
    int32_t encoder_exit_timeout_ms;

    // Engine selection: engine_vtable, then engine_library, then the built-in tone engine.
    const struct voxflow_engine_vtable * engine_vtable;
    const char * engine_library;
    const char * data_path;
    const char * const * resource_paths;
    size_t n_resource_paths;

    // Optional JSON file with extra or replacement encoders.
    const char * encoders_json;
    // Drop encoders whose binary is not on PATH.
    bool probe_encoders;
};

VOXFLOW_API struct voxflow_params voxflow_default_params(void);

VOXFLOW_API struct voxflow_context * voxflow_init(
        const struct voxflow_params * params,
        char * err,
        size_t err_size);

// Waits for running requests to finish. Every stream must be freed first.
VOXFLOW_API void voxflow_free(struct voxflow_context * ctx);

VOXFLOW_API bool voxflow_format_supported(const struct voxflow_context * ctx, const char * format);

// Comma separated list of supported formats, native format first.
VOXFLOW_API bool voxflow_formats(
        const struct voxflow_context * ctx,
        char * out,
        size_t out_size);

VOXFLOW_API const char * voxflow_status_to_cstr(enum voxflow_status status);

// Starts synthesis of `text`. voice and format may be NULL for the defaults
// ("default", "wav"); chunk_size 0 uses the default read size.
VOXFLOW_API enum voxflow_status voxflow_say(
        struct voxflow_context * ctx,
        const char * text,
        const char * voice,
        const char * format,
        size_t chunk_size,
        struct voxflow_stream ** stream_out,
        char * err,
        size_t err_size);

// Next chunk of the stream. Returns false at the end or on error; err is set on
// error only. *data stays valid until the next call or voxflow_stream_free.
VOXFLOW_API bool voxflow_stream_next(
        struct voxflow_stream * stream,
        const uint8_t ** data,
        size_t * n_bytes,
        char * err,
        size_t err_size);

// Safe on an unfinished stream: the rest of the output is discarded.
VOXFLOW_API void voxflow_stream_free(struct voxflow_stream * stream);

VOXFLOW_API enum voxflow_status voxflow_to_file(
        struct voxflow_context * ctx,
        const char * path,
        const char * text,
        const char * voice,
        const char * format,
        char * err,
        size_t err_size);

#ifdef __cplusplus
}
#endif
