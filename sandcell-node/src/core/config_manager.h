// config_manager.h - YAML configuration loading/saving
#pragma once

#include "core/sandbox_config.h"
#include <string>

namespace sandcell::node::core {

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Missing file keeps defaults and succeeds; a parse error keeps defaults and fails
    bool LoadConfig(const std::string& path, SandboxConfig& config);

    bool SaveConfig(const SandboxConfig& config, const std::string& path);

    const SandboxConfig& GetConfig() const { return cached_config_; }
    const std::string& GetLoadedPath() const { return last_loaded_path_; }
    void SetConfig(const SandboxConfig& config) { cached_config_ = config; }

    static SandboxConfig GetDefaultConfig();

    // Clamp or reset values that cannot be honoured; logs every change
    static void Sanitize(SandboxConfig& config);

    // Get config file path (checks multiple locations)
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    SandboxConfig cached_config_;
};

} // namespace sandcell::node::core
