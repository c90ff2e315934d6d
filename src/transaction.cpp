#include "transaction.hpp"
#include "checksum.hpp"
#include "compact_log.hpp"
#include <fstream>
#include <ctime>
#include <cerrno>
#include <type_traits>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pushgate {

namespace {

volatile std::sig_atomic_t g_pending_signal = 0;

void on_signal(int sig) { g_pending_signal = sig; }

TxError classify(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return TxError::PermissionDenied;
    }
    return TxError::IoError;
}

std::unexpected<TxErrorInfo> fs_error(TxError fallback, const std::string& what, const std::error_code& ec) {
    auto kind = classify(ec);
    return std::unexpected(TxErrorInfo{kind == TxError::PermissionDenied ? kind : fallback,
                                       what + ": " + ec.message()});
}

} // namespace

std::string describe(const RollbackAction& action) {
    return std::visit([](const auto& a) -> std::string {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, rollback::RestoreBackup>) {
            return "restore " + a.target.string() + " from " + a.backup.filename().string();
        } else if constexpr (std::is_same_v<T, rollback::RemoveFile>) {
            return "remove " + a.path.string();
        } else if constexpr (std::is_same_v<T, rollback::RestorePermissions>) {
            return "restore permissions of " + a.path.string();
        } else if constexpr (std::is_same_v<T, rollback::RemoveDirectory>) {
            return "remove directory " + a.path.string();
        } else {
            return a.description;
        }
    }, action);
}

void Transaction::begin(std::string name) {
    name_ = std::move(name);
    log_.clear();
    backups_.clear();
    active_ = true;
    Log::info("tx", "begin " + name_);
}

void Transaction::add_rollback(RollbackAction action) {
    Log::debug("tx", "registered: " + describe(action));
    log_.push_back(std::move(action));
}

std::expected<void, TxErrorInfo> Transaction::commit() {
    if (auto ok = require_active(); !ok) return ok;
    if (auto ok = check_interrupted(); !ok) return ok;
    Log::info("tx", "commit " + name_ + " (" + std::to_string(log_.size()) + " actions)");
    log_.clear();
    active_ = false;
    return {};
}

size_t Transaction::rollback() {
    size_t failures = 0;
    if (!log_.empty()) Log::warn("tx", "rolling back " + name_ + " (" + std::to_string(log_.size()) + " actions)");
    for (auto it = log_.rbegin(); it != log_.rend(); ++it) {
        if (execute(*it)) {
            Log::info("tx", "rolled back: " + describe(*it));
        } else {
            ++failures;
            Log::error("tx", "rollback step failed: " + describe(*it));
        }
    }
    log_.clear();
    active_ = false;
    return failures;
}

bool Transaction::execute(const RollbackAction& action) {
    std::error_code ec;
    if (auto* a = std::get_if<rollback::RestoreBackup>(&action)) {
        auto digest = sha256_file(a->backup);
        if (!digest || *digest != a->sha256) {
            Log::error("tx", "backup " + a->backup.string() + " failed verification");
            return false;
        }
        fs::copy_file(a->backup, a->target, fs::copy_options::overwrite_existing, ec);
        if (ec) return false;
        fs::remove(a->backup, ec);
        return true;
    }
    if (auto* a = std::get_if<rollback::RemoveFile>(&action)) {
        fs::remove(a->path, ec);
        // Never created
        return !ec || ec == std::errc::not_a_directory;
    }
    if (auto* a = std::get_if<rollback::RestorePermissions>(&action)) {
        fs::permissions(a->path, a->perms, fs::perm_options::replace, ec);
        return !ec;
    }
    if (auto* a = std::get_if<rollback::RemoveDirectory>(&action)) {
        // Only an emptied directory is removed
        return fs::remove(a->path, ec) && !ec;
    }
    const auto& custom = std::get<rollback::Custom>(action);
    return custom.fn ? custom.fn() : false;
}

std::expected<void, TxErrorInfo> Transaction::require_active() const {
    if (!active_) return std::unexpected(TxErrorInfo{TxError::NotActive, "no transaction in progress"});
    return {};
}

std::expected<void, TxErrorInfo> Transaction::check_interrupted() const {
    if (int sig = SignalScope::pending_signal(); sig != 0) {
        return std::unexpected(TxErrorInfo{TxError::Interrupted,
            "interrupted by signal " + std::to_string(sig), sig});
    }
    return {};
}

fs::path Transaction::backup_path(const fs::path& path) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    fs::path base = path;
    base += ".backup.";
    base += stamp;
    fs::path candidate = base;
    for (int seq = 1; fs::exists(candidate); ++seq) {
        candidate = base;
        candidate += "." + std::to_string(seq);
    }
    return candidate;
}

std::expected<void, TxErrorInfo> Transaction::snapshot(const fs::path& path) {
    auto backup = backup_path(path);
    std::error_code ec;
    fs::copy_file(path, backup, fs::copy_options::none, ec);
    if (ec) return fs_error(TxError::BackupFailed, "backup of " + path.string(), ec);
    auto digest = sha256_file(backup);
    if (!digest) return std::unexpected(TxErrorInfo{TxError::BackupFailed, digest.error().message});
    backups_.push_back(backup);
    add_rollback(rollback::RestoreBackup{backup, path, *digest});
    return {};
}

std::expected<void, TxErrorInfo> Transaction::atomic_write(const fs::path& path, std::string_view content) {
    if (auto ok = require_active(); !ok) return ok;
    if (auto ok = check_interrupted(); !ok) return ok;

    if (fs::exists(path)) {
        if (auto ok = snapshot(path); !ok) return ok;
    } else {
        add_rollback(rollback::RemoveFile{path});
    }
    return write_file_atomically(path, content);
}

std::expected<void, TxErrorInfo> Transaction::atomic_move(const fs::path& src, const fs::path& dest) {
    if (auto ok = require_active(); !ok) return ok;
    if (auto ok = check_interrupted(); !ok) return ok;

    if (fs::exists(dest)) {
        if (auto ok = snapshot(dest); !ok) return ok;
    }
    add_rollback(rollback::Custom{"move " + dest.string() + " back to " + src.string(), [src, dest] {
        std::error_code ec;
        fs::rename(dest, src, ec);
        return !ec;
    }});

    std::error_code ec;
    fs::rename(src, dest, ec);
    if (ec) return fs_error(TxError::WriteFailed, "move " + src.string() + " -> " + dest.string(), ec);
    return {};
}

std::expected<void, TxErrorInfo> Transaction::set_executable(const fs::path& path) {
    if (auto ok = require_active(); !ok) return ok;
    if (auto ok = check_interrupted(); !ok) return ok;

    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) return fs_error(TxError::IoError, "stat " + path.string(), ec);
    add_rollback(rollback::RestorePermissions{path, perms});

    fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) return fs_error(TxError::IoError, "chmod +x " + path.string(), ec);
    return {};
}

std::expected<void, TxErrorInfo> Transaction::ensure_directory(const fs::path& path) {
    if (auto ok = require_active(); !ok) return ok;
    if (auto ok = check_interrupted(); !ok) return ok;

    // Register removal for each missing level, outermost first
    std::vector<fs::path> missing;
    for (fs::path p = path; !p.empty() && !fs::exists(p); p = p.parent_path()) {
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        add_rollback(rollback::RemoveDirectory{*it});
    }
    if (missing.empty()) return {};

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) return fs_error(TxError::WriteFailed, "mkdir " + path.string(), ec);
    return {};
}

TransactionGuard::~TransactionGuard() {
    if (dismissed_ || !tx_.active()) return;
    auto failures = tx_.rollback();
    if (failures > 0) {
        compact::Writer::error("rollback incomplete: " + std::to_string(failures) + " step(s) failed\n");
    }
}

SignalScope::SignalScope() {
    g_pending_signal = 0;
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
    sigaction(SIGHUP, &sa, &old_hup_);
}

SignalScope::~SignalScope() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
}

int SignalScope::pending_signal() { return g_pending_signal; }
void SignalScope::reset() { g_pending_signal = 0; }
void SignalScope::raise_for_test(int sig) { g_pending_signal = sig; }

std::expected<void, TxErrorInfo> write_file_atomically(const fs::path& path, std::string_view content) {
    fs::path tmp = path.parent_path() / ("." + path.filename().string() + ".tmp." + std::to_string(::getpid()));
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fs_error(TxError::WriteFailed, "cannot create " + tmp.string(),
                            std::error_code(errno, std::generic_category()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return std::unexpected(TxErrorInfo{TxError::WriteFailed, "short write to " + tmp.string()});
        }
    }

    std::error_code ec;
    if (auto st = fs::status(path, ec); !ec && fs::exists(st)) {
        fs::permissions(tmp, st.permissions(), fs::perm_options::replace, ec);
    }
    // A missing target is not an error here
    if (ec == std::errc::no_such_file_or_directory) ec.clear();
    if (!ec) fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fs_error(TxError::WriteFailed, "replace " + path.string(), ec);
    }
    return {};
}

} // namespace pushgate
