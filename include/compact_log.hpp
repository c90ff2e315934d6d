#pragma once

#include <unistd.h>
#include <string>
#include <string_view>
#include <filesystem>
#include <expected>
#include <mutex>

namespace compact {

enum class Color {
    None,
    Red,
    Green,
    Yellow,
    Blue
};

// Lightweight writer for user-facing output, bypasses iostream buffering
class Writer {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    static void line(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
        write_all(STDOUT_FILENO, "\n");
    }

    // Coloured status line; colour is dropped when stdout is not a terminal
    static void status(Color color, std::string_view s);

    static void nl() {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, "\n");
    }

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            auto n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace compact

namespace pushgate {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogFileError {
    std::string message;
};

// Levelled log. Warn/Error always reach stderr, Debug/Info only when verbose.
// Every level reaches the file sink once one is open.
class Log {
public:
    static void set_verbose(bool verbose);
    static bool verbose();

    // Opens <dir>/<prefix>-YYYYmmdd_HHMMSS.log for appending
    static std::expected<std::filesystem::path, LogFileError> open_file(
        const std::filesystem::path& dir, std::string_view prefix);
    static void close_file();

    static void write(LogLevel level, std::string_view component, std::string_view message);

    static void debug(std::string_view component, std::string_view message) { write(LogLevel::Debug, component, message); }
    static void info(std::string_view component, std::string_view message) { write(LogLevel::Info, component, message); }
    static void warn(std::string_view component, std::string_view message) { write(LogLevel::Warn, component, message); }
    static void error(std::string_view component, std::string_view message) { write(LogLevel::Error, component, message); }
};

std::string_view level_name(LogLevel level);

} // namespace pushgate
