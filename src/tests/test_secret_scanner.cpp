#include "secret_scanner.hpp"
#include <iostream>
#include <fstream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

using namespace pushgate;
namespace fs = std::filesystem;

static const std::string kAwsSecret = "0123456789abcdef0123456789abcdef01234567";

static fs::path make_temp_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("pushgate_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static bool git(const fs::path& repo, const std::string& args) {
    std::string cmd = "git -C '" + repo.string() + "' " + args + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

void test_inspection() {
    std::cout << "Testing line inspection...\n\n";
    SecretScanner scanner(Allowlist{}, PathFilter{});

    // Test 1: one cloud credential finding
    {
        std::vector<ScanTarget> targets = {
            {"deploy.env", "AWS_SECRET_ACCESS_KEY=\"" + kAwsSecret + "\"", 3, ScanOrigin::Staged},
        };
        auto findings = scanner.find_secrets(targets);
        assert(findings.size() == 1);
        assert(findings[0].file == "deploy.env");
        assert(findings[0].line_number == 3);
        assert(findings[0].category == SecretCategory::CloudCredential);
        std::cout << "✓ Test 1 passed: AWS secret in staged line\n";
    }

    // Test 2: redaction removes the raw secret
    {
        auto f = scanner.inspect({"deploy.env", "AWS_SECRET_ACCESS_KEY=\"" + kAwsSecret + "\"", 1, ScanOrigin::Staged});
        assert(f.has_value());
        assert(f->redacted_line.find(kAwsSecret) == std::string::npos);
        assert(f->redacted_line == "AWS_SECRET_ACCESS_KEY=\"***REDACTED***\"");
        assert(f->line.find(kAwsSecret) != std::string::npos);
        std::cout << "✓ Test 2 passed: Redacted line hides the secret\n";
    }

    // Test 3: placeholder password
    {
        auto findings = scanner.find_secrets({{"settings.py", "password = \"YOUR_PASSWORD_HERE\"", 1, ScanOrigin::Staged}});
        assert(findings.empty());
        std::cout << "✓ Test 3 passed: Placeholder password is clean\n";
    }

    // Test 4: excluded paths never produce findings
    {
        auto findings = scanner.find_secrets({{"node_modules/x/.env", "AWS_SECRET_ACCESS_KEY=" + kAwsSecret, 1, ScanOrigin::Staged}});
        assert(findings.empty());
        std::cout << "✓ Test 4 passed: Excluded path skipped\n";
    }

    // Test 5: allowlisted line
    {
        auto allow = Allowlist::parse("^AWS_SECRET_ACCESS_KEY=" + kAwsSecret + "$\n");
        assert(allow.has_value());
        SecretScanner allowing(std::move(*allow), PathFilter{});
        auto findings = allowing.find_secrets({{"ci.env", "AWS_SECRET_ACCESS_KEY=" + kAwsSecret, 1, ScanOrigin::Staged}});
        assert(findings.empty());
        std::cout << "✓ Test 5 passed: Allowlist suppresses finding\n";
    }

    // Test 6: redact() keeps both ends of the line
    {
        assert(SecretScanner::redact("key=abc123;rest", 4, 6) == "key=***REDACTED***;rest");
        std::cout << "✓ Test 6 passed: Redaction splice\n";
    }
}

void test_diff_file_scan() {
    std::cout << "\nTesting --diff-file scans...\n\n";
    auto dir = make_temp_dir("scanner_diff");

    // Test 7: only added lines of the diff are reported
    {
        write_file(dir / "change.diff",
            "--- a/deploy.env\n"
            "+++ b/deploy.env\n"
            "@@ -1 +1 @@\n"
            "-AWS_SECRET_ACCESS_KEY=\"" + kAwsSecret + "\"\n"
            "+AWS_SECRET_ACCESS_KEY=\"${AWS_SECRET}\"\n");
        SecretScanner scanner(Allowlist{}, PathFilter{});
        ScanOptions options;
        options.diff_file = dir / "change.diff";
        auto findings = scanner.collect(options, GitRepo(dir));
        assert(findings.has_value());
        assert(findings->empty());
        assert(scanner.scan(options, GitRepo(dir)) == ExitStatus::Clean);
        std::cout << "✓ Test 7 passed: Removed secret is not a finding\n";
    }

    // Test 8: missing diff file is an operational error
    {
        SecretScanner scanner(Allowlist{}, PathFilter{});
        ScanOptions options;
        options.diff_file = dir / "missing.diff";
        assert(scanner.scan(options, GitRepo(dir)) == ExitStatus::ValidationError);
        std::cout << "✓ Test 8 passed: Missing diff file\n";
    }

    fs::remove_all(dir);
}

void test_staged_scan() {
    std::cout << "\nTesting staged scans against a real repository...\n\n";
    if (std::system("git --version >/dev/null 2>&1") != 0) {
        std::cout << "- skipped: git not available\n";
        return;
    }
    auto dir = make_temp_dir("scanner_git");
    assert(git(dir, "init -q"));
    GitRepo repo(dir);
    SecretScanner scanner(Allowlist{}, PathFilter{});
    ScanOptions options;
    options.mode = ScanMode::Staged;
    options.redact = true;

    // Test 9: unstaged secret is invisible to a staged scan
    {
        write_file(dir / "app.env", "APP_NAME=demo\n");
        assert(git(dir, "add app.env"));
        write_file(dir / "app.env", "APP_NAME=demo\nAWS_SECRET_ACCESS_KEY=\"" + kAwsSecret + "\"\n");
        auto findings = scanner.collect(options, repo);
        assert(findings.has_value());
        assert(findings->empty());
        std::cout << "✓ Test 9 passed: Unstaged secret ignored\n";
    }

    // Test 10: staging it turns it into exactly one finding
    {
        assert(git(dir, "add app.env"));
        auto findings = scanner.collect(options, repo);
        assert(findings.has_value());
        assert(findings->size() == 1);
        assert((*findings)[0].file == "app.env");
        assert((*findings)[0].line_number == 2);
        assert(scanner.scan(options, repo) == ExitStatus::Violations);
        std::cout << "✓ Test 10 passed: Staged secret reported\n";
    }

    // Test 11: full mode reads tracked files from the work tree
    {
        options.mode = ScanMode::Full;
        auto findings = scanner.collect(options, repo);
        assert(findings.has_value());
        assert(findings->size() == 1);
        std::cout << "✓ Test 11 passed: Full scan\n";
    }

    // Test 12: names git would quote are scanned under their real path
    {
        const std::string name = "caf\xc3\xa9 \"v2\".env";
        write_file(dir / name, "AWS_SECRET_ACCESS_KEY=\"" + kAwsSecret + "\"\n");
        assert(git(dir, "add -A"));

        auto in_file = [&](const std::vector<Finding>& findings) {
            size_t n = 0;
            for (const auto& f : findings) {
                if (f.file == name) ++n;
            }
            return n;
        };

        options.mode = ScanMode::Staged;
        auto staged = scanner.collect(options, repo);
        assert(staged.has_value());
        assert(in_file(*staged) == 1);

        options.mode = ScanMode::Full;
        auto full = scanner.collect(options, repo);
        assert(full.has_value());
        assert(in_file(*full) == 1);
        std::cout << "✓ Test 12 passed: Non-ASCII and quoted file names\n";
    }

    fs::remove_all(dir);
}

int main() {
    test_inspection();
    test_diff_file_scan();
    test_staged_scan();
    std::cout << "\n✅ All secret scanner tests passed!\n";
    return 0;
}
