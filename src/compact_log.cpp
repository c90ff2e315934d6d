#include "compact_log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace compact {

void Writer::status(Color color, std::string_view s) {
    static const bool tty = ::isatty(STDOUT_FILENO) == 1;
    if (!tty || color == Color::None) {
        line(s);
        return;
    }
    std::string_view code;
    switch (color) {
        case Color::Red: code = "\033[0;31m"; break;
        case Color::Green: code = "\033[0;32m"; break;
        case Color::Yellow: code = "\033[1;33m"; break;
        case Color::Blue: code = "\033[0;34m"; break;
        case Color::None: break;
    }
    std::string out;
    out.reserve(s.size() + 16);
    out += code;
    out += s;
    out += "\033[0m\n";
    print(out);
}

} // namespace compact

namespace pushgate {

namespace {

std::atomic<bool> g_verbose{false};

struct FileSink {
    std::mutex mutex;
    std::ofstream stream;
};

FileSink& sink() {
    static FileSink s;
    return s;
}

std::string timestamp(const char* fmt) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

} // namespace

std::string_view level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void Log::set_verbose(bool verbose) { g_verbose = verbose; }
bool Log::verbose() { return g_verbose; }

std::expected<std::filesystem::path, LogFileError> Log::open_file(
    const std::filesystem::path& dir, std::string_view prefix) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return std::unexpected(LogFileError{"cannot create log directory " + dir.string() + ": " + ec.message()});

    auto path = dir / (std::string(prefix) + "-" + timestamp("%Y%m%d_%H%M%S") + ".log");
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.stream.is_open()) s.stream.close();
    s.stream.open(path, std::ios::app);
    if (!s.stream) return std::unexpected(LogFileError{"cannot open log file " + path.string()});
    return path;
}

void Log::close_file() {
    auto& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.stream.is_open()) s.stream.close();
}

void Log::write(LogLevel level, std::string_view component, std::string_view message) {
    {
        auto& s = sink();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.stream.is_open()) {
            s.stream << '[' << timestamp("%Y-%m-%d %H:%M:%S") << "] [" << level_name(level) << "] ["
                     << component << "] " << message << '\n';
            s.stream.flush();
        }
    }

    bool to_console = level == LogLevel::Warn || level == LogLevel::Error || g_verbose;
    if (!to_console) return;

    std::string out;
    out.reserve(message.size() + component.size() + 24);
    out += '[';
    out += timestamp("%H:%M:%S");
    out += "] [";
    out += level_name(level);
    out += "] ";
    out += message;
    out += '\n';
    compact::Writer::error(out);
}

} // namespace pushgate
