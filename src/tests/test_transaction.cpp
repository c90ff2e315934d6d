#include "transaction.hpp"
#include "checksum.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cassert>
#include <filesystem>
#include <unistd.h>

using namespace pushgate;
namespace fs = std::filesystem;

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

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static size_t count_backups(const fs::path& dir) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename().string().find(".backup.") != std::string::npos) ++n;
    }
    return n;
}

void test_commit_and_rollback() {
    std::cout << "Testing transaction commit and rollback...\n\n";
    auto dir = make_temp_dir("tx");

    // Test 1: N files restored to their exact prior content
    {
        const size_t n = 5;
        for (size_t i = 0; i < n; ++i) write_file(dir / ("f" + std::to_string(i)), "original " + std::to_string(i) + "\n");

        Transaction tx;
        tx.begin("rewrite");
        for (size_t i = 0; i < n; ++i) {
            assert(tx.atomic_write(dir / ("f" + std::to_string(i)), "changed\n").has_value());
        }
        assert(tx.atomic_write(dir / "new-file", "fresh\n").has_value());
        assert(read_file(dir / "f3") == "changed\n");
        assert(tx.pending() == n + 1);

        assert(tx.rollback() == 0);
        for (size_t i = 0; i < n; ++i) {
            assert(read_file(dir / ("f" + std::to_string(i))) == "original " + std::to_string(i) + "\n");
        }
        assert(!fs::exists(dir / "new-file"));
        assert(count_backups(dir) == 0);
        assert(!tx.active());
        std::cout << "✓ Test 1 passed: Rollback restores every file\n";
    }

    // Test 2: commit keeps the changes and the backups
    {
        Transaction tx;
        tx.begin("commit");
        assert(tx.atomic_write(dir / "f0", "committed\n").has_value());
        assert(tx.commit().has_value());
        assert(tx.pending() == 0);
        assert(tx.rollback() == 0);
        assert(read_file(dir / "f0") == "committed\n");
        assert(tx.backups().size() == 1);
        assert(read_file(tx.backups()[0]) == "original 0\n");
        fs::remove(tx.backups()[0]);
        std::cout << "✓ Test 2 passed: Commit clears the log\n";
    }

    // Test 3: failure after a successful write rolls the first write back
    {
        fs::create_directories(dir / "blocked");
        write_file(dir / "blocked" / "hooks", "not a directory\n");
        {
            Transaction tx;
            TransactionGuard guard(tx);
            tx.begin("install");
            assert(tx.atomic_write(dir / "config.env", "A\n").has_value());
            auto second = tx.atomic_write(dir / "blocked" / "hooks" / "pre-push", "B\n");
            assert(!second.has_value());
            assert(fs::exists(dir / "config.env"));
        }
        assert(!fs::exists(dir / "config.env"));
        std::cout << "✓ Test 3 passed: Guard rolls back on scope exit\n";
    }

    // Test 4: rollback runs in reverse order
    {
        std::string order;
        Transaction tx;
        tx.begin("order");
        tx.add_rollback(rollback::Custom{"first", [&] { order += "1"; return true; }});
        tx.add_rollback(rollback::Custom{"second", [&] { order += "2"; return true; }});
        tx.add_rollback(rollback::Custom{"failing", [&] { order += "3"; return false; }});
        assert(tx.rollback() == 1);
        assert(order == "321");
        std::cout << "✓ Test 4 passed: Reverse order, failures tolerated\n";
    }

    // Test 5: a tampered backup is not restored
    {
        write_file(dir / "guarded", "v1\n");
        Transaction tx;
        tx.begin("tamper");
        assert(tx.atomic_write(dir / "guarded", "v2\n").has_value());
        write_file(tx.backups()[0], "evil\n");
        assert(tx.rollback() == 1);
        assert(read_file(dir / "guarded") == "v2\n");
        std::cout << "✓ Test 5 passed: Backup digest verified\n";
    }

    fs::remove_all(dir);
}

void test_filesystem_operations() {
    std::cout << "\nTesting filesystem operations...\n\n";
    auto dir = make_temp_dir("tx_ops");

    // Test 6: created directories removed, existing ones kept
    {
        Transaction tx;
        tx.begin("dirs");
        assert(tx.ensure_directory(dir / "a" / "b" / "c").has_value());
        assert(fs::is_directory(dir / "a" / "b" / "c"));
        assert(tx.rollback() == 0);
        assert(!fs::exists(dir / "a"));
        assert(fs::exists(dir));
        std::cout << "✓ Test 6 passed: ensure_directory rollback\n";
    }

    // Test 7: permissions restored
    {
        write_file(dir / "hook", "#!/bin/sh\n");
        fs::permissions(dir / "hook", fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
        Transaction tx;
        tx.begin("chmod");
        assert(tx.set_executable(dir / "hook").has_value());
        assert((fs::status(dir / "hook").permissions() & fs::perms::owner_exec) != fs::perms::none);
        assert(tx.rollback() == 0);
        assert((fs::status(dir / "hook").permissions() & fs::perms::owner_exec) == fs::perms::none);
        std::cout << "✓ Test 7 passed: set_executable rollback\n";
    }

    // Test 8: move undone, overwritten destination restored
    {
        write_file(dir / "src", "S\n");
        write_file(dir / "dest", "D\n");
        Transaction tx;
        tx.begin("move");
        assert(tx.atomic_move(dir / "src", dir / "dest").has_value());
        assert(!fs::exists(dir / "src"));
        assert(read_file(dir / "dest") == "S\n");
        assert(tx.rollback() == 0);
        assert(read_file(dir / "src") == "S\n");
        assert(read_file(dir / "dest") == "D\n");
        std::cout << "✓ Test 8 passed: atomic_move rollback\n";
    }

    // Test 9: mutations need an open transaction
    {
        Transaction tx;
        auto r = tx.atomic_write(dir / "nope", "x");
        assert(!r.has_value());
        assert(r.error().error == TxError::NotActive);
        assert(!fs::exists(dir / "nope"));
        std::cout << "✓ Test 9 passed: Inactive transaction refuses writes\n";
    }

    // Test 10: pending signal stops the next mutation and the commit
    {
        SignalScope scope;
        Transaction tx;
        tx.begin("signal");
        assert(tx.atomic_write(dir / "before", "1").has_value());
        SignalScope::raise_for_test(SIGINT);
        auto r = tx.atomic_write(dir / "after", "2");
        assert(!r.has_value());
        assert(r.error().error == TxError::Interrupted);
        assert(r.error().signal == SIGINT);
        assert(!fs::exists(dir / "after"));
        assert(!tx.commit().has_value());
        assert(tx.rollback() == 0);
        assert(!fs::exists(dir / "before"));
        SignalScope::reset();
        std::cout << "✓ Test 10 passed: Interruption rolls back\n";
    }

    // Test 11: atomic write keeps the mode of the replaced file
    {
        write_file(dir / "script", "old\n");
        fs::permissions(dir / "script", fs::perms::owner_all, fs::perm_options::replace);
        assert(write_file_atomically(dir / "script", "new\n").has_value());
        assert(read_file(dir / "script") == "new\n");
        assert((fs::status(dir / "script").permissions() & fs::perms::owner_exec) != fs::perms::none);
        std::cout << "✓ Test 11 passed: Mode preserved across replace\n";
    }

    // Test 12: checksum of a known string
    {
        assert(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        std::cout << "✓ Test 12 passed: SHA-256\n";
    }

    fs::remove_all(dir);
}

int main() {
    test_commit_and_rollback();
    test_filesystem_operations();
    std::cout << "\n✅ All transaction tests passed!\n";
    return 0;
}
