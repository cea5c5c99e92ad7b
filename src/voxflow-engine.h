#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// ABI between voxflow and a synthesis engine. An engine converts text + voice into
// 16-bit mono PCM and reports it through the two callbacks passed at create time.
// Both callbacks are invoked synchronously from inside generate().

#define VOXFLOW_ENGINE_API_VERSION "1.0.0"
#define VOXFLOW_ENGINE_ENTRY_SYMBOL "voxflow_engine_entry"

#ifdef __cplusplus
extern "C" {
#endif

// Called once per utterance before any samples. Return false to abort generation.
typedef bool (*voxflow_sample_rate_callback)(int32_t sample_rate, void * user_data);

// Called zero or more times with raw samples. Return false to abort generation.
typedef bool (*voxflow_samples_callback)(const int16_t * samples, size_t n_samples, void * user_data);

struct voxflow_engine_init_params {
    const char * data_path;
    const char * const * resource_paths;
    size_t n_resource_paths;
    voxflow_sample_rate_callback on_sample_rate;
    voxflow_samples_callback on_samples;
    void * user_data;
};

struct voxflow_engine_vtable {
    const char * (*version)(void);
    void * (*create)(const struct voxflow_engine_init_params * params, char * err, size_t err_size);
    void (*destroy)(void * engine);
    bool (*set_voice)(void * engine, const char * voice, char * err, size_t err_size);
    bool (*generate)(void * engine, const char * text, char * err, size_t err_size);
};

// Exported by engine shared libraries under VOXFLOW_ENGINE_ENTRY_SYMBOL.
typedef const struct voxflow_engine_vtable * (*voxflow_engine_entry_fn)(void);

#ifdef __cplusplus
}
#endif
