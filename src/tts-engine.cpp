#include "tts-engine.h"

#include <dlfcn.h>

#include <cstdio>
#include <cstring>

tts_engine::~tts_engine() {
    free();
}

bool tts_engine::init(
        const tts_engine_config & cfg,
        voxflow_sample_rate_callback on_sample_rate,
        voxflow_samples_callback on_samples,
        void * user_data,
        std::string & err) {
    free();

    const voxflow_engine_vtable * api = cfg.vtable;
    if (api == nullptr && !cfg.library.empty()) {
        library_ = dlopen(cfg.library.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (library_ == nullptr) {
            const char * dl_err = dlerror();
            err = "failed to load engine library " + cfg.library + ": " + (dl_err != nullptr ? dl_err : "unknown error");
            return false;
        }
        auto entry = reinterpret_cast<voxflow_engine_entry_fn>(dlsym(library_, VOXFLOW_ENGINE_ENTRY_SYMBOL));
        if (entry == nullptr) {
            err = cfg.library + " does not export " VOXFLOW_ENGINE_ENTRY_SYMBOL;
            free();
            return false;
        }
        api = entry();
    }
    if (api == nullptr) {
        api = voxflow_tone_engine();
    }
    if (api == nullptr || api->create == nullptr || api->destroy == nullptr ||
        api->set_voice == nullptr || api->generate == nullptr) {
        err = "engine vtable is incomplete";
        free();
        return false;
    }

    version_ = api->version != nullptr && api->version() != nullptr ? api->version() : "";
    if (version_ != VOXFLOW_ENGINE_API_VERSION) {
        std::fprintf(stderr, "warning: API version (%s) different of library version (%s)\n",
                VOXFLOW_ENGINE_API_VERSION, version_.empty() ? "unknown" : version_.c_str());
    }

    std::vector<const char *> resources;
    resources.reserve(cfg.resources.size());
    for (const auto & r : cfg.resources) {
        resources.push_back(r.c_str());
    }

    voxflow_engine_init_params params;
    params.data_path = cfg.data_path.empty() ? nullptr : cfg.data_path.c_str();
    params.resource_paths = resources.empty() ? nullptr : resources.data();
    params.n_resource_paths = resources.size();
    params.on_sample_rate = on_sample_rate;
    params.on_samples = on_samples;
    params.user_data = user_data;

    char c_err[1024] = {0};
    void * handle = api->create(&params, c_err, sizeof(c_err));
    if (handle == nullptr) {
        err = c_err[0] != '\0' ? std::string(c_err) : std::string("engine initialization failed");
        free();
        return false;
    }
    api_ = api;
    handle_ = handle;
    return true;
}

void tts_engine::free() {
    if (handle_ != nullptr && api_ != nullptr) {
        api_->destroy(handle_);
    }
    handle_ = nullptr;
    api_ = nullptr;
    if (library_ != nullptr) {
        dlclose(library_);
        library_ = nullptr;
    }
}

bool tts_engine::set_voice(const std::string & voice, std::string & err) {
    if (handle_ == nullptr) {
        err = "engine is not loaded";
        return false;
    }
    char c_err[1024] = {0};
    if (!api_->set_voice(handle_, voice.c_str(), c_err, sizeof(c_err))) {
        err = c_err[0] != '\0' ? std::string(c_err) : "unknown voice: " + voice;
        return false;
    }
    return true;
}

bool tts_engine::generate(const std::string & text, std::string & err) {
    if (handle_ == nullptr) {
        err = "engine is not loaded";
        return false;
    }
    char c_err[1024] = {0};
    if (!api_->generate(handle_, text.c_str(), c_err, sizeof(c_err))) {
        err = c_err[0] != '\0' ? std::string(c_err) : std::string("generation failed");
        return false;
    }
    return true;
}
