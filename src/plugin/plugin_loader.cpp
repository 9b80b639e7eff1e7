#include "plugin/plugin_loader.hpp"
#include "core/utils.hpp"

#include <dlfcn.h>
#include <format>
#include <stdexcept>

namespace piiguard {

// ============================================================================
// LoadedPlugin
// ============================================================================

LoadedPlugin::LoadedPlugin(std::string path, void* handle)
    : path_(std::move(path)), handle_(handle) {}

LoadedPlugin::~LoadedPlugin() {
    // Destroy plugin instance before dlclose
    if (recognizer) {
        if (recognizer->destroy) {
            recognizer->destroy(recognizer->instance);
        }
        delete recognizer;
    }
    if (handle_) {
        dlclose(handle_);
    }
}

LoadedPlugin::LoadedPlugin(LoadedPlugin&& other) noexcept
    : path_(std::move(other.path_)),
      handle_(other.handle_),
      recognizer(other.recognizer) {
    other.handle_ = nullptr;
    other.recognizer = nullptr;
}

LoadedPlugin& LoadedPlugin::operator=(LoadedPlugin&& other) noexcept {
    if (this != &other) {
        path_ = std::move(other.path_);
        handle_ = other.handle_;
        recognizer = other.recognizer;
        other.handle_ = nullptr;
        other.recognizer = nullptr;
    }
    return *this;
}

void* LoadedPlugin::resolve(const char* symbol) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, symbol);
}

// ============================================================================
// PluginRecognitionModel
// ============================================================================

PluginRecognitionModel::PluginRecognitionModel(std::unique_ptr<LoadedPlugin> plugin)
    : plugin_(std::move(plugin)) {
    if (!plugin_ || !plugin_->recognizer || !plugin_->recognizer->recognize) {
        throw std::invalid_argument("recognizer plugin has no recognize entry point");
    }
    if (plugin_->recognizer->get_info) {
        const auto info = plugin_->recognizer->get_info(plugin_->recognizer->instance);
        name_ = info.name ? info.name : plugin_->path();
    } else {
        name_ = plugin_->path();
    }
}

std::unique_ptr<PluginRecognitionModel> PluginRecognitionModel::load(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        utils::log::error(std::format("Recognizer load failed [{}]: {}", path, dlerror()));
        return nullptr;
    }

    auto plugin = std::make_unique<LoadedPlugin>(path, handle);

    // Resolve factory: RecognizerPlugin* create_recognizer_plugin()
    using FactoryFn = RecognizerPlugin* (*)();
    const auto factory = reinterpret_cast<FactoryFn>(plugin->resolve("create_recognizer_plugin"));
    if (!factory) {
        utils::log::error(std::format("Recognizer [{}]: missing create_recognizer_plugin symbol", path));
        return nullptr;
    }

    auto* rp = factory();
    if (!rp) {
        utils::log::error(std::format("Recognizer [{}]: factory returned null", path));
        return nullptr;
    }
    plugin->recognizer = rp;

    if (!rp->get_info || !rp->recognize) {
        utils::log::error(std::format("Recognizer [{}]: incomplete vtable", path));
        return nullptr;
    }

    // Validate API version
    const auto info = rp->get_info(rp->instance);
    if (info.api_version != PIIGUARD_PLUGIN_API_VERSION) {
        utils::log::error(std::format("Recognizer [{}]: API version mismatch (got {}, expected {})",
            path, info.api_version, PIIGUARD_PLUGIN_API_VERSION));
        return nullptr;
    }

    utils::log::info(std::format("Recognizer loaded: {} v{}",
        info.name ? info.name : path, info.version ? info.version : "?"));
    return std::make_unique<PluginRecognitionModel>(std::move(plugin));
}

std::vector<RecognizedSpan> PluginRecognitionModel::recognize(std::string_view text) const {
    RecognizerPlugin* rp = plugin_->recognizer;

    RecognizerPluginSpan* spans = nullptr;
    size_t count = 0;
    const int rc = rp->recognize(rp->instance, text.data(), text.size(), &spans, &count);

    // Release plugin-owned spans on every exit path, a failed call included
    struct SpanGuard {
        RecognizerPlugin* rp;
        RecognizerPluginSpan* spans;
        size_t count;
        ~SpanGuard() {
            if (spans && rp->free_spans) rp->free_spans(rp->instance, spans, count);
        }
    } guard{rp, spans, count};

    if (rc != 0) {
        throw std::runtime_error(std::format("recognizer '{}' failed with status {}", name_, rc));
    }

    std::vector<RecognizedSpan> result;
    if (!spans) return result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& s = spans[i];
        if (!s.label) continue;
        RecognizedSpan span;
        span.label = s.label;
        span.start = s.start;
        span.end = s.end;
        // Out-of-range offsets pass through with empty text; the detector drops them
        if (s.start < s.end && s.end <= text.size()) {
            span.text = std::string(text.substr(s.start, s.end - s.start));
        }
        result.push_back(std::move(span));
    }
    return result;
}

} // namespace piiguard
