#pragma once

#include <string>

#include "pstrat/core/values.hpp"

namespace pstrat::core {

// Key-value persistence for the startup roster and warm-restart variables.
// Loads return false on unreadable content; a missing store loads empty.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual bool loadSettings(StrategySettingMap& out) = 0;
    virtual bool saveSettings(const StrategySettingMap& settings) = 0;

    virtual bool loadData(StrategyDataMap& out) = 0;
    virtual bool saveData(const StrategyDataMap& data) = 0;
};

// YAML files on disk, one for the roster and one for variables.
class YamlSettingsStore : public SettingsStore {
public:
    YamlSettingsStore(std::string settingsPath, std::string dataPath);

    bool loadSettings(StrategySettingMap& out) override;
    bool saveSettings(const StrategySettingMap& settings) override;

    bool loadData(StrategyDataMap& out) override;
    bool saveData(const StrategyDataMap& data) override;

    const std::string& settingsPath() const noexcept { return settingsPath_; }
    const std::string& dataPath() const noexcept { return dataPath_; }
    const std::string& lastError() const noexcept { return lastError_; }

private:
    std::string settingsPath_;
    std::string dataPath_;
    std::string lastError_;
};

} // namespace pstrat::core
