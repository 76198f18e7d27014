// ==============================================================================
// config.cpp - YAML-конфигурация фасада
// ==============================================================================

#include <factforge/config.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace factforge {

namespace {

/// Значение ключа или fallback; неконвертируемое значение - ошибка
template <typename T>
T value_or(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node v = node[key];
    if (!v || v.IsNull()) {
        return fallback;
    }
    return v.as<T>();
}

Config parse_config_node(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("configuration root must be a mapping");
    }

    if (root["strategy"]) {
        config.strategy = parse_strategy(root["strategy"].as<std::string>());
    }
    config.fallback_to_proxy = value_or(root, "fallback_to_proxy", config.fallback_to_proxy);
    config.discriminator = value_or(root, "discriminator", config.discriminator);
    if (config.discriminator.empty()) {
        throw std::invalid_argument("discriminator cannot be empty");
    }
    config.ns = value_or<std::string>(root, "namespace", "");

    if (const YAML::Node log = root["log"]) {
        if (!log.IsMap()) {
            throw std::invalid_argument("'log' must be a mapping");
        }
        config.log.verbose = value_or(log, "verbose", 0);
        config.log.quiet = value_or(log, "quiet", false);
        if (log["file"]) {
            config.log.log_path = std::filesystem::path(log["file"].as<std::string>());
        }
    }

    config.definitions = value_or<std::string>(root, "definitions", "");
    return config;
}

}  // namespace

Strategy parse_strategy(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "compiled") {
        return Strategy::Compiled;
    }
    if (lower == "proxy") {
        return Strategy::Proxy;
    }
    throw std::invalid_argument("unknown strategy: '" + std::string(s) +
                                "' (expected compiled or proxy)");
}

ConfigResult parse_config(std::string_view yaml) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.config = parse_config_node(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = e.what();
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        result.config = parse_config_node(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = path.string() + ": " + e.what();
    } catch (const std::exception& e) {
        result.error = path.string() + ": " + e.what();
    }
    return result;
}

}  // namespace factforge
