// ==============================================================================
// factforge/output.hpp - Диагностический журнал
// ==============================================================================
//
// Назначение:
// - Единственная точка записи диагностических сообщений библиотеки
// - Уровни: error / warn / info / debug / trace с префиксами [x] [!] [+] [*] [~]
// - Цветной вывод (ANSI escape codes) при TTY
// - Запись в файл журнала вместо stderr (log_path)
//
// ==============================================================================

#ifndef FACTFORGE_OUTPUT_HPP
#define FACTFORGE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace factforge::output {

// ----------------------------------------------------------------------------
// Уровни сообщений
// ----------------------------------------------------------------------------

enum class Level {
    Error,  // всегда
    Warn,   // если не quiet
    Info,   // если не quiet
    Debug,  // verbose >= 1
    Trace   // verbose >= 2
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // подавить info/warn
    int verbose = 0;     // уровень подробности (0..2+)

    // Файл журнала; без него сообщения идут в stderr
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg = {});
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Формат: "[+] <message>"
    void info(std::string_view message);

    /// Формат: "[!] <message>"
    void warn(std::string_view message);

    /// Формат: "[x] <message>" (печатается и при quiet)
    void error(std::string_view message);

    /// Формат: "[*] <message>"
    void debug(std::string_view message);

    /// Формат: "[~] <message>"
    void trace(std::string_view message);

    /// Будет ли напечатано сообщение уровня level
    bool enabled(Level level) const;

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл журнала (при log_path задан)
    bool open_log_file();

    void close_log_file();

    bool has_log_file() const { return log_file_ != nullptr; }

private:
    void emit(Level level, std::string_view message);

    OutputConfig config_;
    FILE* log_file_ = nullptr;
    bool color_ = false;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Префикс уровня: "[x] ", "[!] ", "[+] ", "[*] ", "[~] "
const char* level_prefix(Level level);

/// Форматирует сообщение: "<prefix><message>\n"
std::string format_message(Level level, std::string_view message);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, является ли stderr терминалом
bool stderr_is_tty();

/// Writer без вывода, кроме ошибок (quiet)
Writer& quiet_writer();

}  // namespace factforge::output

#endif  // FACTFORGE_OUTPUT_HPP
