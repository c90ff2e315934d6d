#pragma once

#include <string_view>

namespace pushgate {

// Process exit codes. 0/1/2 are verdicts, everything else is an operational error.
enum class ExitStatus : int {
    Clean = 0,
    Violations = 1,
    Remediated = 2,
    PermissionError = 3,
    NetworkError = 4,
    ToolMissing = 6,
    ValidationError = 7,
    ConfigError = 9,
    SecurityError = 10
};

inline int to_int(ExitStatus status) { return static_cast<int>(status); }

inline bool is_operational_error(ExitStatus status) {
    switch (status) {
        case ExitStatus::Clean:
        case ExitStatus::Violations:
        case ExitStatus::Remediated:
            return false;
        case ExitStatus::PermissionError:
        case ExitStatus::NetworkError:
        case ExitStatus::ToolMissing:
        case ExitStatus::ValidationError:
        case ExitStatus::ConfigError:
        case ExitStatus::SecurityError:
            return true;
    }
    return true;
}

inline std::string_view describe(ExitStatus status) {
    switch (status) {
        case ExitStatus::Clean: return "clean";
        case ExitStatus::Violations: return "violations found";
        case ExitStatus::Remediated: return "auto-remediated";
        case ExitStatus::PermissionError: return "permission error";
        case ExitStatus::NetworkError: return "network error";
        case ExitStatus::ToolMissing: return "required tool missing";
        case ExitStatus::ValidationError: return "validation error";
        case ExitStatus::ConfigError: return "configuration error";
        case ExitStatus::SecurityError: return "security error";
    }
    return "unknown";
}

} // namespace pushgate
