#pragma once

#include <cstddef>
#include <cstdint>

// C ABI plugin interface for recognition-model backends loaded via dlopen/dlsym.
// Plugins implement the vtable and export a factory function.

extern "C" {

// Plugin metadata
struct PluginInfo {
    const char* name;
    const char* version;
    const char* type;       // "recognizer"
    uint32_t api_version;   // Must match PIIGUARD_PLUGIN_API_VERSION
};

constexpr uint32_t PIIGUARD_PLUGIN_API_VERSION = 1;

// One recognized span, byte offsets into the text passed to recognize()
struct RecognizerPluginSpan {
    const char* label;      // Model vocabulary, e.g. "PERSON", "GPE"
    size_t start;
    size_t end;
};

// Recognizer plugin vtable
struct RecognizerPlugin {
    void* instance;
    PluginInfo (*get_info)(void* instance);
    // 0 = success. The plugin owns *out_spans until free_spans is called.
    int (*recognize)(void* instance, const char* text, size_t text_len,
                     RecognizerPluginSpan** out_spans, size_t* out_count);
    void (*free_spans)(void* instance, RecognizerPluginSpan* spans, size_t count);
    void (*destroy)(void* instance);
};

// Factory function signature (plugins export this)
// "create_recognizer_plugin" -> RecognizerPlugin*

} // extern "C"
