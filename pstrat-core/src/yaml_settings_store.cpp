#include "pstrat/core/settings_store.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pstrat::core {

namespace {

namespace fs = std::filesystem;

// Quoted scalars carry the non-specific "!" tag and always decode as strings.
Value decodeValue(const YAML::Node& node) {
    const std::string raw = node.Scalar();
    if (node.Tag() == "!") return raw;
    std::int64_t i{};
    if (YAML::convert<std::int64_t>::decode(node, i)) return i;
    double d{};
    if (YAML::convert<double>::decode(node, d)) return d;
    if (raw == "true") return true;
    if (raw == "false") return false;
    return raw;
}

void emitValue(YAML::Emitter& out, const Value& v) {
    std::visit([&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out << YAML::DoubleQuoted << x;
        } else {
            out << x;
        }
    }, v);
}

void emitPositions(YAML::Emitter& out, const PositionMap& m) {
    out << YAML::BeginMap;
    for (const auto& [instrument, lots] : m) {
        out << YAML::Key << instrument << YAML::Value << lots;
    }
    out << YAML::EndMap;
}

PositionMap decodePositions(const YAML::Node& node) {
    PositionMap m;
    if (!node.IsMap()) return m;
    for (const auto& kv : node) {
        m[kv.first.as<std::string>()] = kv.second.as<int>();
    }
    return m;
}

// Missing file -> empty null node, true
bool readFile(const std::string& path, YAML::Node& out, std::string& error) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        out = YAML::Node();
        return true;
    }
    try {
        out = YAML::LoadFile(path);
        return true;
    } catch (const YAML::Exception& e) {
        error = path + ": " + e.what();
        return false;
    }
}

// Write to a sibling temp file, then rename over the target
bool writeFile(const std::string& path, const YAML::Emitter& out, std::string& error) {
    if (!out.good()) {
        error = path + ": " + out.GetLastError();
        return false;
    }
    const std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f) {
            error = "cannot open " + tmp;
            return false;
        }
        f << out.c_str() << "\n";
        if (!f) {
            error = "write failed: " + tmp;
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        error = "rename " + tmp + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

YamlSettingsStore::YamlSettingsStore(std::string settingsPath, std::string dataPath)
    : settingsPath_(std::move(settingsPath)), dataPath_(std::move(dataPath)) {}

bool YamlSettingsStore::loadSettings(StrategySettingMap& out) {
    out.clear();
    YAML::Node root;
    if (!readFile(settingsPath_, root, lastError_)) return false;
    if (!root || root.IsNull()) return true;
    try {
        for (const auto& entry : root) {
            const auto name = entry.first.as<std::string>();
            const YAML::Node& node = entry.second;
            StrategySetting s{};
            s.className = node["class_name"].as<std::string>();
            for (const auto& instrument : node["instruments"]) {
                s.instruments.push_back(instrument.as<std::string>());
            }
            if (const auto setting = node["setting"]; setting && setting.IsMap()) {
                for (const auto& kv : setting) {
                    s.setting[kv.first.as<std::string>()] = decodeValue(kv.second);
                }
            }
            out.emplace(name, std::move(s));
        }
    } catch (const YAML::Exception& e) {
        lastError_ = settingsPath_ + ": " + e.what();
        out.clear();
        return false;
    }
    return true;
}

bool YamlSettingsStore::saveSettings(const StrategySettingMap& settings) {
    YAML::Emitter out;
    out.SetDoublePrecision(15);
    out << YAML::BeginMap;
    for (const auto& [name, s] : settings) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "class_name" << YAML::Value << s.className;
        out << YAML::Key << "instruments" << YAML::Value << YAML::Flow << s.instruments;
        out << YAML::Key << "setting" << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : s.setting) {
            out << YAML::Key << key << YAML::Value;
            emitValue(out, value);
        }
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return writeFile(settingsPath_, out, lastError_);
}

bool YamlSettingsStore::loadData(StrategyDataMap& out) {
    out.clear();
    YAML::Node root;
    if (!readFile(dataPath_, root, lastError_)) return false;
    if (!root || root.IsNull()) return true;
    try {
        for (const auto& entry : root) {
            StrategyData d{};
            for (const auto& kv : entry.second) {
                const auto key = kv.first.as<std::string>();
                if (key == "positions") {
                    d.positions = decodePositions(kv.second);
                } else if (key == "targets") {
                    d.targets = decodePositions(kv.second);
                } else if (kv.second.IsScalar()) {
                    d.fields[key] = decodeValue(kv.second);
                }
            }
            out.emplace(entry.first.as<std::string>(), std::move(d));
        }
    } catch (const YAML::Exception& e) {
        lastError_ = dataPath_ + ": " + e.what();
        out.clear();
        return false;
    }
    return true;
}

bool YamlSettingsStore::saveData(const StrategyDataMap& data) {
    YAML::Emitter out;
    out.SetDoublePrecision(15);
    out << YAML::BeginMap;
    for (const auto& [name, d] : data) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        for (const auto& [key, value] : d.fields) {
            out << YAML::Key << key << YAML::Value;
            emitValue(out, value);
        }
        out << YAML::Key << "positions" << YAML::Value;
        emitPositions(out, d.positions);
        out << YAML::Key << "targets" << YAML::Value;
        emitPositions(out, d.targets);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return writeFile(dataPath_, out, lastError_);
}

} // namespace pstrat::core
