#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <functional>
#include <filesystem>
#include <expected>
#include <csignal>

namespace pushgate {

enum class TxError {
    NotActive,
    Interrupted,
    BackupFailed,
    WriteFailed,
    PermissionDenied,
    IoError
};

struct TxErrorInfo {
    TxError error;
    std::string message;
    int signal = 0;  // set for Interrupted
};

namespace rollback {

struct RestoreBackup {
    std::filesystem::path backup;
    std::filesystem::path target;
    std::string sha256;
};

struct RemoveFile {
    std::filesystem::path path;
};

struct RestorePermissions {
    std::filesystem::path path;
    std::filesystem::perms perms;
};

struct RemoveDirectory {
    std::filesystem::path path;
};

struct Custom {
    std::string description;
    std::function<bool()> fn;
};

} // namespace rollback

using RollbackAction = std::variant<rollback::RestoreBackup, rollback::RemoveFile,
                                    rollback::RestorePermissions, rollback::RemoveDirectory,
                                    rollback::Custom>;

std::string describe(const RollbackAction& action);

// Ordered log of inverse actions. Each mutation registers its inverse before
// touching the filesystem, so rollback() can undo a partially applied change.
class Transaction {
public:
    Transaction() = default;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void begin(std::string name);
    void add_rollback(RollbackAction action);

    // Fails with Interrupted when a signal arrived since begin()
    std::expected<void, TxErrorInfo> commit();

    // Replays the log in reverse; returns how many actions failed
    size_t rollback();

    bool active() const { return active_; }
    const std::string& name() const { return name_; }
    size_t pending() const { return log_.size(); }
    const std::vector<std::filesystem::path>& backups() const { return backups_; }

    std::expected<void, TxErrorInfo> atomic_write(const std::filesystem::path& path, std::string_view content);
    std::expected<void, TxErrorInfo> atomic_move(const std::filesystem::path& src, const std::filesystem::path& dest);
    std::expected<void, TxErrorInfo> set_executable(const std::filesystem::path& path);
    std::expected<void, TxErrorInfo> ensure_directory(const std::filesystem::path& path);

    std::expected<void, TxErrorInfo> check_interrupted() const;

    // <path>.backup.<YYYYmmdd_HHMMSS>[.n], never an existing path
    static std::filesystem::path backup_path(const std::filesystem::path& path);

private:
    std::expected<void, TxErrorInfo> require_active() const;
    std::expected<void, TxErrorInfo> snapshot(const std::filesystem::path& path);
    static bool execute(const RollbackAction& action);

    std::string name_;
    bool active_ = false;
    std::vector<RollbackAction> log_;
    std::vector<std::filesystem::path> backups_;
};

// Rolls the transaction back on scope exit unless it was committed
class TransactionGuard {
public:
    explicit TransactionGuard(Transaction& tx) : tx_(tx) {}
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void dismiss() { dismissed_ = true; }

private:
    Transaction& tx_;
    bool dismissed_ = false;
};

// Turns SIGINT/SIGTERM/SIGHUP into a flag polled by Transaction while alive
class SignalScope {
public:
    SignalScope();
    ~SignalScope();

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

    // 0 when no signal arrived
    static int pending_signal();
    static void reset();
    static void raise_for_test(int sig);

private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
    struct sigaction old_hup_{};
};

// Temp sibling + rename, keeping the target's permission bits
std::expected<void, TxErrorInfo> write_file_atomically(const std::filesystem::path& path, std::string_view content);

} // namespace pushgate
