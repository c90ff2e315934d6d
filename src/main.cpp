#include "config.hpp"
#include "compact_log.hpp"
#include "exit_status.hpp"
#include "gate.hpp"
#include "git_repo.hpp"
#include "installer.hpp"
#include "pin_validator.hpp"
#include "secret_scanner.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

using namespace pushgate;
namespace fs = std::filesystem;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd;
    std::vector<std::string> args;

    // Command options
    std::optional<std::string> mode, diff_file, allowlist, dir, config_path;
    bool redact = false, quiet = false, actions = false, images = false;
    bool hooks_path = false, force = false, dry_run = false;
    bool verbose = false, help = false;

    GateConfig config;
    fs::path root;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
};

void print_usage(const char* program_name) {
    std::cout << "pushgate: pre-push security gate (C++23)\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  scan                         Scan for secrets\n"
              << "      --mode <staged|full>     Staged additions (default) or every tracked file\n"
              << "      --redact                 Mask the secret in reported lines\n"
              << "      --diff-file <path>       Scan the added lines of a unified diff\n"
              << "      --allowlist <path>       Allowlist file (one regex per line)\n"
              << "  pincheck --dir <path>        Report workflow references not pinned to a SHA/digest\n"
              << "  autopin --dir <path>         Rewrite floating references to pinned ones\n"
              << "      --actions / --images     Limit to actions or container images\n"
              << "  hook                         Run every enabled check (pre-push entry point)\n"
              << "  install                      Install the pre-push hook\n"
              << "      --hooks-path             Chain through core.hooksPath (.githooks)\n"
              << "      --force                  Replace an existing .git/hooks/pre-push\n"
              << "      --dry-run                Print the plan only\n\n"
              << "Options:\n"
              << "  --config <path>              Config file (default .security-controls/config.env)\n"
              << "  --quiet                      Only the exit code (pincheck, autopin)\n"
              << "  --verbose                    Debug output\n"
              << "  --help                       This text\n\n"
              << "Exit codes: 0 clean, 1 violations, 2 remediated, 3 permission, 4 network,\n"
              << "            6 tool missing, 7 validation, 9 config, 10 security, 128+n signal\n";
}

int cmd_scan(FSMContext& ctx) {
    ScanOptions options;
    options.mode = ctx.config.secret_scan_mode;
    if (ctx.mode) {
        auto mode = parse_mode(*ctx.mode);
        if (!mode) { std::cerr << "Error: " << mode.error().message << "\n"; return to_int(ExitStatus::ConfigError); }
        options.mode = *mode;
    }
    options.redact = ctx.redact;
    if (ctx.diff_file) options.diff_file = fs::path(*ctx.diff_file);

    Gate gate(GitRepo(ctx.root), ctx.config);
    std::optional<fs::path> allowlist;
    if (ctx.allowlist) allowlist = fs::path(*ctx.allowlist);
    auto scanner = gate.make_scanner(allowlist);
    if (!scanner) { std::cerr << "Error: " << scanner.error().message << "\n"; return to_int(ExitStatus::ConfigError); }
    return to_int(scanner->scan(options, gate.repo()));
}

int cmd_pincheck(FSMContext& ctx) {
    PinValidator validator;
    return to_int(validator.check(*ctx.dir, ctx.quiet));
}

int cmd_autopin(FSMContext& ctx) {
    AutopinOptions options;
    // Neither flag means both
    if (ctx.actions || ctx.images) {
        options.actions = ctx.actions;
        options.images = ctx.images;
    }
    options.quiet = ctx.quiet;

    RemoteResolver remote(ctx.config.resolver, ctx.config.resolver_timeout_seconds);
    CachingResolver resolver(remote);
    PinValidator validator(&resolver);
    return to_int(validator.autopin(*ctx.dir, options));
}

int cmd_hook(FSMContext& ctx) {
    GitRepo repo(ctx.root);
    if (!repo.is_git_repo()) {
        std::cerr << "Error: " << ctx.root.string() << " is not a git repository\n";
        return to_int(ExitStatus::ValidationError);
    }
    Gate gate(std::move(repo), ctx.config);
    return to_int(gate.run_hook());
}

int cmd_install(FSMContext& ctx) {
    InstallOptions options;
    options.hooks_path = ctx.hooks_path;
    options.force = ctx.force;
    options.dry_run = ctx.dry_run;
    std::error_code ec;
    if (auto self = fs::read_symlink("/proc/self/exe", ec); !ec) options.executable = self.string();

    Installer installer(GitRepo(ctx.root), ctx.config, options);
    return to_int(installer.run());
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = to_int(ExitStatus::ValidationError);
                    ctx.help = true;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    bool has_value = i + 1 < ctx.argc;
                    if (a == "--mode" && has_value) ctx.mode = ctx.argv[++i];
                    else if (a == "--diff-file" && has_value) ctx.diff_file = ctx.argv[++i];
                    else if (a == "--allowlist" && has_value) ctx.allowlist = ctx.argv[++i];
                    else if (a == "--dir" && has_value) ctx.dir = ctx.argv[++i];
                    else if (a == "--config" && has_value) ctx.config_path = ctx.argv[++i];
                    else if (a == "--redact") ctx.redact = true;
                    else if (a == "--quiet") ctx.quiet = true;
                    else if (a == "--actions") ctx.actions = true;
                    else if (a == "--images") ctx.images = true;
                    else if (a == "--hooks-path") ctx.hooks_path = true;
                    else if (a == "--force") ctx.force = true;
                    else if (a == "--dry-run") ctx.dry_run = true;
                    else if (a == "--verbose") ctx.verbose = true;
                    else if (a == "--help" || a == "-h") ctx.help = true;
                    else ctx.args.push_back(a);
                }
                if (ctx.cmd == "--help" || ctx.cmd == "-h" || ctx.cmd == "help") ctx.help = true;
                state = ctx.help ? FSMState::Error : FSMState::PreCommand;
                break;
            }
            case FSMState::PreCommand: {
                Log::set_verbose(ctx.verbose);

                if (!ctx.args.empty()) {
                    ctx.exit_code = to_int(ExitStatus::ValidationError);
                    ctx.error_message = "Unexpected argument: " + ctx.args.front();
                    state = FSMState::Error;
                    break;
                }
                if (ctx.cmd == "pincheck" || ctx.cmd == "autopin") {
                    if (!ctx.dir) {
                        ctx.exit_code = to_int(ExitStatus::ValidationError);
                        ctx.error_message = ctx.cmd + " requires --dir <path>.";
                        state = FSMState::Error;
                        break;
                    }
                } else if (ctx.cmd != "scan" && ctx.cmd != "hook" && ctx.cmd != "install") {
                    ctx.exit_code = to_int(ExitStatus::ValidationError);
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }

                std::error_code ec;
                ctx.root = fs::current_path(ec);
                if (ec) {
                    ctx.exit_code = to_int(ExitStatus::PermissionError);
                    ctx.error_message = "cannot determine working directory: " + ec.message();
                    state = FSMState::Error;
                    break;
                }

                auto cfg_path = ctx.config_path ? fs::path(*ctx.config_path) : ctx.root / kConfigFile;
                auto cfg = load_config(cfg_path);
                if (!cfg) {
                    ctx.exit_code = to_int(ExitStatus::ConfigError);
                    ctx.error_message = cfg_path.string() + ": " + cfg.error().message;
                    std::cerr << "Error: " << ctx.error_message << "\n";
                    state = FSMState::Done;
                    break;
                }
                ctx.config = std::move(*cfg);
                Log::debug("main", "command " + ctx.cmd + ", config " + cfg_path.string());
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                try {
                    if (ctx.cmd == "scan") ctx.exit_code = cmd_scan(ctx);
                    else if (ctx.cmd == "pincheck") ctx.exit_code = cmd_pincheck(ctx);
                    else if (ctx.cmd == "autopin") ctx.exit_code = cmd_autopin(ctx);
                    else if (ctx.cmd == "hook") ctx.exit_code = cmd_hook(ctx);
                    else if (ctx.cmd == "install") ctx.exit_code = cmd_install(ctx);
                    state = FSMState::PostCommand;
                } catch (const std::exception& e) {
                    ctx.exit_code = to_int(ExitStatus::ValidationError);
                    std::cerr << "Error: " << e.what() << "\n";
                    state = FSMState::Done;
                }
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    Log::debug("main", ctx.cmd + " exited " + std::to_string(ctx.exit_code) +
                               " after " + std::to_string(ms) + " ms");
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                if (ctx.help) {
                    print_usage(ctx.argv[0]);
                } else {
                    std::cerr << "Run '" << ctx.argv[0] << " --help' for usage.\n";
                }
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
