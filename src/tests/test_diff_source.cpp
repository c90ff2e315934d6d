#include "diff_source.hpp"
#include <iostream>
#include <cassert>

using namespace pushgate;

void test_unified_diff() {
    std::cout << "Testing unified diff parsing...\n\n";

    // Test 1: only added lines, numbered in the post-image
    {
        std::string diff =
            "diff --git a/app.env b/app.env\n"
            "index 1111111..2222222 100644\n"
            "--- a/app.env\n"
            "+++ b/app.env\n"
            "@@ -3,0 +4,2 @@\n"
            "+API_URL=https://example.org\n"
            "+DEBUG=false\n";
        auto targets = parse_unified_diff(diff);
        assert(targets.size() == 2);
        assert(targets[0].file == "app.env");
        assert(targets[0].line == "API_URL=https://example.org");
        assert(targets[0].line_number == 4);
        assert(targets[1].line_number == 5);
        assert(targets[0].origin == ScanOrigin::Staged);
        std::cout << "✓ Test 1 passed: Added lines with post-image numbers\n";
    }

    // Test 2: removed lines are never targets
    {
        std::string diff =
            "--- a/config.py\n"
            "+++ b/config.py\n"
            "@@ -10,2 +10,1 @@\n"
            "-password = \"hunter2hunter2hunter2\"\n"
            "-token = \"abc\"\n"
            "+password = get_secret()\n";
        auto targets = parse_unified_diff(diff);
        assert(targets.size() == 1);
        assert(targets[0].line == "password = get_secret()");
        assert(targets[0].line_number == 10);
        std::cout << "✓ Test 2 passed: Removed lines skipped\n";
    }

    // Test 3: context lines advance the counter
    {
        std::string diff =
            "--- a/f.txt\n"
            "+++ b/f.txt\n"
            "@@ -1,2 +1,4 @@\n"
            " one\n"
            "+two\n"
            " three\n"
            "+four\n"
            "\\ No newline at end of file\n";
        auto targets = parse_unified_diff(diff);
        assert(targets.size() == 2);
        assert(targets[0].line_number == 2);
        assert(targets[1].line_number == 4);
        std::cout << "✓ Test 3 passed: Context lines counted\n";
    }

    // Test 4: several files; "+++"-looking content inside a hunk is content
    {
        std::string diff =
            "diff --git a/a.md b/a.md\n"
            "--- a/a.md\n"
            "+++ b/a.md\n"
            "@@ -0,0 +1,2 @@\n"
            "+++ not a header\n"
            "+second\n"
            "diff --git a/b.md b/b.md\n"
            "--- a/b.md\n"
            "+++ b/b.md\n"
            "@@ -5 +5 @@\n"
            "-old\n"
            "+new\n";
        auto targets = parse_unified_diff(diff);
        assert(targets.size() == 3);
        assert(targets[0].file == "a.md" && targets[0].line == "++ not a header");
        assert(targets[1].file == "a.md" && targets[1].line_number == 2);
        assert(targets[2].file == "b.md" && targets[2].line == "new" && targets[2].line_number == 5);
        std::cout << "✓ Test 4 passed: Multi-file diff\n";
    }

    // Test 5: deleted files produce nothing
    {
        std::string diff =
            "--- a/gone.txt\n"
            "+++ /dev/null\n"
            "@@ -1 +0,0 @@\n"
            "-secret\n";
        assert(parse_unified_diff(diff).empty());
        std::cout << "✓ Test 5 passed: Deleted file ignored\n";
    }
}

void test_path_filter() {
    std::cout << "\nTesting path filter...\n\n";

    // Test 6: default build-output prefixes
    {
        PathFilter filter;
        assert(filter.is_excluded("node_modules/pkg/index.js"));
        assert(filter.is_excluded("./dist/bundle.js"));
        assert(filter.is_excluded(".github/workflows/ci.yml"));
        assert(!filter.is_excluded("src/main.cpp"));
        assert(!filter.is_excluded("docs/build.md"));
        std::cout << "✓ Test 6 passed: Default exclusions\n";
    }

    // Test 7: custom prefixes replace the defaults
    {
        PathFilter filter({"generated/"});
        assert(filter.is_excluded("generated/api.ts"));
        assert(!filter.is_excluded("node_modules/x.js"));
        std::cout << "✓ Test 7 passed: Custom exclusions\n";
    }

    // Test 8: lock files and binary extensions
    {
        assert(PathFilter::is_lock_file("Cargo.lock"));
        assert(PathFilter::is_lock_file("web/package-lock.json"));
        assert(PathFilter::is_lock_file("go.sum"));
        assert(!PathFilter::is_lock_file("lockfile.txt"));
        assert(PathFilter::is_binary_extension("assets/logo.PNG"));
        assert(!PathFilter::is_binary_extension("src/app.ts"));
        std::cout << "✓ Test 8 passed: Lock file and binary detection\n";
    }
}

int main() {
    test_unified_diff();
    test_path_filter();
    std::cout << "\n✅ All diff source tests passed!\n";
    return 0;
}
