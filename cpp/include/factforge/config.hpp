// ==============================================================================
// factforge/config.hpp - YAML-конфигурация фасада
// ==============================================================================
//
// Назначение:
// - Загрузка настроек материализации из YAML (yaml-cpp)
// - Стратегия, fallback, дискриминатор, namespace, журнал, определения
//
// Пример:
//
//   strategy: compiled
//   fallback_to_proxy: true
//   discriminator: _type
//   log:
//     verbose: 1
//   definitions: |
//     declare Person
//         name : String
//     end
//
// ==============================================================================

#ifndef FACTFORGE_CONFIG_HPP
#define FACTFORGE_CONFIG_HPP

#include <factforge/fact.hpp>
#include <factforge/output.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace factforge {

struct Config {
    Strategy strategy = Strategy::Compiled;
    bool fallback_to_proxy = true;
    std::string discriminator = "_type";
    std::string ns;  // package для to_declarative_text

    output::OutputConfig log;

    /// Документ определений (declare/import/...), загружаемый в реестр
    std::string definitions;
};

/// Результат загрузки конфигурации
struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// "compiled" | "proxy" (без учёта регистра)
/// @throw std::invalid_argument
Strategy parse_strategy(std::string_view s);

/// Разобрать YAML-текст
ConfigResult parse_config(std::string_view yaml);

/// Загрузить YAML-файл
ConfigResult load_config(const std::filesystem::path& path);

}  // namespace factforge

#endif  // FACTFORGE_CONFIG_HPP
