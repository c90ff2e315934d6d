#include "config.hpp"
#include <iostream>
#include <fstream>
#include <cassert>
#include <filesystem>
#include <unistd.h>

using namespace pushgate;
namespace fs = std::filesystem;

int main() {
    std::cout << "Testing config.env parsing...\n\n";

    // Test 1: empty input keeps the defaults
    {
        auto cfg = parse_config("");
        assert(cfg.has_value());
        assert(cfg->enable_secret_scan);
        assert(cfg->secret_scan_mode == ScanMode::Staged);
        assert(cfg->excluded_prefixes == default_excluded_prefixes());
        assert(cfg->workflows_dir == ".github/workflows");
        assert(cfg->resolver == ResolverBackend::Api);
        assert(cfg->large_file_max_mb == 10);
        std::cout << "✓ Test 1 passed: Defaults\n";
    }

    // Test 2: every key, comments, quotes and export
    {
        auto cfg = parse_config(
            "# header comment\n"
            "\n"
            "ENABLE_SECRET_SCAN=false\n"
            "SECRET_SCAN_MODE=full  # staged | full\n"
            "export SECRET_SCAN_EXCLUDE=\"third_party/, generated/\"\n"
            "SECRET_ALLOWLIST_FILE='ci/allow.txt'\n"
            "ENABLE_PIN_CHECK=yes\n"
            "ENABLE_AUTOPIN=0\n"
            "WORKFLOWS_DIR=.gitea/workflows\n"
            "PIN_RESOLVER=git\n"
            "RESOLVER_TIMEOUT_SECONDS=5\n"
            "ENABLE_LARGE_FILE_CHECK=off\n"
            "LARGE_FILE_MAX_MB=25\n"
            "LOG_DIR=/tmp/pushgate-logs\n"
            "ENABLE_SAST=true\n");
        assert(cfg.has_value());
        assert(!cfg->enable_secret_scan);
        assert(cfg->secret_scan_mode == ScanMode::Full);
        assert(cfg->excluded_prefixes.size() == 2);
        assert(cfg->excluded_prefixes[0] == "third_party/");
        assert(cfg->excluded_prefixes[1] == "generated/");
        assert(cfg->allowlist_file == "ci/allow.txt");
        assert(cfg->enable_pin_check);
        assert(!cfg->enable_autopin);
        assert(cfg->workflows_dir == ".gitea/workflows");
        assert(cfg->resolver == ResolverBackend::Git);
        assert(cfg->resolver_timeout_seconds == 5);
        assert(!cfg->enable_large_file_check);
        assert(cfg->large_file_max_mb == 25);
        assert(cfg->log_dir == "/tmp/pushgate-logs");
        std::cout << "✓ Test 2 passed: All keys\n";
    }

    // Test 3: invalid values report their line
    {
        auto bad_bool = parse_config("ENABLE_PIN_CHECK=true\nENABLE_AUTOPIN=maybe\n");
        assert(!bad_bool.has_value());
        assert(bad_bool.error().error == ConfigError::InvalidValue);
        assert(bad_bool.error().line == 2);

        auto bad_mode = parse_config("SECRET_SCAN_MODE=partial\n");
        assert(!bad_mode.has_value());
        assert(bad_mode.error().line == 1);

        assert(!parse_config("LARGE_FILE_MAX_MB=-3\n").has_value());
        assert(!parse_config("RESOLVER_TIMEOUT_SECONDS=10s\n").has_value());
        assert(!parse_config("PIN_RESOLVER=ssh\n").has_value());
        assert(!parse_config("just some words\n").has_value());
        std::cout << "✓ Test 3 passed: Invalid values rejected\n";
    }

    // Test 4: scan mode parsing
    {
        assert(parse_mode("Staged").value() == ScanMode::Staged);
        assert(parse_mode(" full ").value() == ScanMode::Full);
        assert(!parse_mode("diff").has_value());
        assert(mode_name(ScanMode::Full) == "full");
        std::cout << "✓ Test 4 passed: Scan modes\n";
    }

    // Test 5: files
    {
        auto dir = fs::temp_directory_path() / ("pushgate_config_" + std::to_string(::getpid()));
        fs::create_directories(dir);

        auto missing = load_config(dir / "absent.env");
        assert(missing.has_value());
        assert(missing->enable_secret_scan);

        {
            std::ofstream out(dir / "config.env");
            out << "LARGE_FILE_MAX_MB=1\nENABLE_SECRET_SCAN=nah\n";
        }
        auto bad = load_config(dir / "config.env");
        assert(!bad.has_value());
        assert(bad.error().line == 2);
        assert(bad.error().message.find("config.env:2:") != std::string::npos);

        fs::remove_all(dir);
        std::cout << "✓ Test 5 passed: Missing file means defaults\n";
    }

    // Test 6: "#" inside quotes belongs to the value
    {
        auto cfg = parse_config(
            "LOG_DIR=\"/var/log/app #1\"  # per-host logs\n"
            "SECRET_ALLOWLIST_FILE='ci/allow #2.txt'\n"
            "WORKFLOWS_DIR=.github/workflows # default\n");
        assert(cfg.has_value());
        assert(cfg->log_dir == "/var/log/app #1");
        assert(cfg->allowlist_file == "ci/allow #2.txt");
        assert(cfg->workflows_dir == ".github/workflows");
        std::cout << "✓ Test 6 passed: Quoted values keep #\n";
    }

    std::cout << "\n✅ All config tests passed!\n";
    return 0;
}
