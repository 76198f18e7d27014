// ==============================================================================
// output.cpp - Диагностический журнал
// ==============================================================================

#include <factforge/output.hpp>

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace factforge::output {

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

Color level_color(Level level) {
    switch (level) {
    case Level::Error:
        return Color::Red;
    case Level::Warn:
        return Color::Yellow;
    case Level::Info:
        return Color::Green;
    case Level::Debug:
        return Color::Cyan;
    case Level::Trace:
        return Color::Magenta;
    }
    return Color::Default;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.log_path.has_value()) {
        open_log_file();
    }
    color_ = log_file_ == nullptr && stderr_is_tty();
}

Writer::~Writer() {
    close_log_file();
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Error:
        return true;
    case Level::Warn:
    case Level::Info:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Trace:
        return config_.verbose > 1;
    }
    return false;
}

void Writer::info(std::string_view message) {
    emit(Level::Info, message);
}

void Writer::warn(std::string_view message) {
    emit(Level::Warn, message);
}

void Writer::error(std::string_view message) {
    emit(Level::Error, message);
}

void Writer::debug(std::string_view message) {
    emit(Level::Debug, message);
}

void Writer::trace(std::string_view message) {
    emit(Level::Trace, message);
}

void Writer::emit(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* f = log_file_ != nullptr ? log_file_ : stderr;
    const char* prefix = level_prefix(level);

    if (color_) {
        std::string code = ansi_color_code(level_color(level));
        std::fwrite(code.data(), 1, code.size(), f);
        std::fputs(prefix, f);
        std::fputs(ANSI_RESET, f);
    } else {
        std::fputs(prefix, f);
    }
    std::fwrite(message.data(), 1, message.size(), f);
    std::fputc('\n', f);
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(log_file_ != nullptr ? log_file_ : stderr);
}

bool Writer::open_log_file() {
    if (!config_.log_path.has_value()) {
        return false;
    }
    close_log_file();
    log_file_ = std::fopen(config_.log_path->string().c_str(), "ab");
    return log_file_ != nullptr;
}

void Writer::close_log_file() {
    if (log_file_ != nullptr) {
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

const char* level_prefix(Level level) {
    switch (level) {
    case Level::Error:
        return "[x] ";
    case Level::Warn:
        return "[!] ";
    case Level::Info:
        return "[+] ";
    case Level::Debug:
        return "[*] ";
    case Level::Trace:
        return "[~] ";
    }
    return "";
}

std::string format_message(Level level, std::string_view message) {
    std::string out = level_prefix(level);
    out.append(message.data(), message.size());
    out += '\n';
    return out;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        return "";
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool stderr_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

Writer& quiet_writer() {
    static Writer writer(OutputConfig{true, 0, std::nullopt});
    return writer;
}

}  // namespace factforge::output
