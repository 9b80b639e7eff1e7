#pragma once

#include "detector/recognition_model.hpp"
#include "plugin/plugin_interface.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// RAII wrapper for a loaded shared library
class LoadedPlugin {
public:
    LoadedPlugin(std::string path, void* handle);
    ~LoadedPlugin();

    // Non-copyable, movable
    LoadedPlugin(const LoadedPlugin&) = delete;
    LoadedPlugin& operator=(const LoadedPlugin&) = delete;
    LoadedPlugin(LoadedPlugin&& other) noexcept;
    LoadedPlugin& operator=(LoadedPlugin&& other) noexcept;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] void* handle() const { return handle_; }

    // Resolve symbol from the shared library
    [[nodiscard]] void* resolve(const char* symbol) const;

private:
    std::string path_;
    void* handle_;

public:
    // Plugin instance (owned, destroyed before dlclose)
    RecognizerPlugin* recognizer = nullptr;
};

/**
 * @brief IRecognitionModel backed by a recognizer plugin
 *
 * Concurrency follows the plugin: the adapter adds no locking.
 */
class PluginRecognitionModel : public IRecognitionModel {
public:
    explicit PluginRecognitionModel(std::unique_ptr<LoadedPlugin> plugin);

    /**
     * @brief dlopen a recognizer plugin and validate its API version
     * @return nullptr on any failure (logged)
     */
    [[nodiscard]] static std::unique_ptr<PluginRecognitionModel> load(const std::string& path);

    /**
     * @throws std::runtime_error when the plugin reports a non-zero status
     */
    [[nodiscard]] std::vector<RecognizedSpan> recognize(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const override { return name_; }

private:
    std::unique_ptr<LoadedPlugin> plugin_;
    std::string name_;
};

} // namespace piiguard
