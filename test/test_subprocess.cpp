#include "test_util.hpp"
#include "annotate/subprocess.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>

using namespace panannot;

static std::string g_test_dir;

static void test_exit_status_and_log() {
    std::fprintf(stderr, "-- test_exit_status_and_log\n");

    std::string log = g_test_dir + "/ok.log";
    Subprocess proc;
    std::string err;
    CHECK(proc.start({"/bin/sh", "-c", "echo to-stdout; echo to-stderr >&2; exit 0"},
                     log, g_test_dir, err));
    CHECK(proc.running());
    ProcessResult r = proc.wait(nullptr);
    CHECK(r.started);
    CHECK(r.success());
    CHECK(!proc.running());

    std::string text = read_text_file(log);
    CHECK(text.find("to-stdout") != std::string::npos);
    CHECK(text.find("to-stderr") != std::string::npos);
}

static void test_nonzero_exit() {
    std::fprintf(stderr, "-- test_nonzero_exit\n");

    Subprocess proc;
    std::string err;
    CHECK(proc.start({"/bin/sh", "-c", "exit 3"}, g_test_dir + "/fail.log", "", err));
    ProcessResult r = proc.wait(nullptr);
    CHECK(!r.success());
    CHECK(!r.cancelled);
    CHECK_EQ(r.exit_code, 3);
}

static void test_working_directory() {
    std::fprintf(stderr, "-- test_working_directory\n");

    std::string wd = g_test_dir + "/wd";
    std::filesystem::create_directories(wd);
    Subprocess proc;
    std::string err;
    CHECK(proc.start({"/bin/sh", "-c", "echo here > marker.txt"},
                     g_test_dir + "/wd.log", wd, err));
    CHECK(proc.wait(nullptr).success());
    CHECK(path_exists(wd + "/marker.txt"));
}

static void test_cannot_execute() {
    std::fprintf(stderr, "-- test_cannot_execute\n");

    Subprocess proc;
    std::string err;
    CHECK(!proc.start({g_test_dir + "/no-such-program"}, g_test_dir + "/x.log", "", err));
    CHECK(err.find("no-such-program") != std::string::npos);
    CHECK(!proc.running());

    CHECK(!proc.start({}, g_test_dir + "/x.log", "", err));
}

static void test_cancellation_terminates() {
    std::fprintf(stderr, "-- test_cancellation_terminates\n");

    CancellationToken token;
    Subprocess proc;
    std::string err;
    CHECK(proc.start({"/bin/sh", "-c", "sleep 30"}, g_test_dir + "/sleep.log", "", err));

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        token.request();
    });
    auto t0 = std::chrono::steady_clock::now();
    ProcessResult r = proc.wait(&token);
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - t0).count();
    canceller.join();

    CHECK(r.cancelled);
    CHECK(!r.success());
    CHECK(!proc.running());
    CHECK(elapsed < 10);
}

static void test_sigterm_ignored_then_killed() {
    std::fprintf(stderr, "-- test_sigterm_ignored_then_killed\n");

    Subprocess proc;
    std::string err;
    CHECK(proc.start({"/bin/sh", "-c", "trap '' TERM; while true; do sleep 1; done"},
                     g_test_dir + "/stubborn.log", "", err));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto t0 = std::chrono::steady_clock::now();
    proc.terminate();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - t0).count();
    CHECK(!proc.running());
    CHECK(elapsed < 10);
}

static void test_destructor_reaps() {
    std::fprintf(stderr, "-- test_destructor_reaps\n");

    std::string err;
    {
        Subprocess proc;
        CHECK(proc.start({"/bin/sh", "-c", "sleep 30"}, g_test_dir + "/d.log", "", err));
    }
    // Reaching this point without hanging is the check
    CHECK(true);
}

static void test_scoped_temp_dir() {
    std::fprintf(stderr, "-- test_scoped_temp_dir\n");

    std::string path = g_test_dir + "/scratch/ESCO.1-prokkaRes";
    {
        ScopedTempDir dir(path);
        CHECK(dir.created());
        write_text_file(path + "/partial.gff", "x\n");
        std::filesystem::create_directories(path + "/out");
    }
    CHECK(!path_exists(path));

    // Stale content from an earlier run is cleared on creation
    std::filesystem::create_directories(path);
    write_text_file(path + "/stale.txt", "old\n");
    {
        ScopedTempDir dir(path);
        CHECK(!path_exists(path + "/stale.txt"));
        ScopedTempDir moved(std::move(dir));
        CHECK(!dir.created());
        CHECK(moved.created());
    }
    CHECK(!path_exists(path));
}

static void test_find_executable() {
    std::fprintf(stderr, "-- test_find_executable\n");

    std::string resolved;
    CHECK(find_executable("sh", resolved));
    CHECK(!resolved.empty());
    CHECK(find_executable("/bin/sh", resolved));
    CHECK_STR(resolved, "/bin/sh");
    CHECK(!find_executable("panannot-no-such-tool", resolved));

    std::string script = g_test_dir + "/tool";
    write_text_file(script, "#!/bin/sh\n");
    CHECK(!find_executable(script, resolved));   // not executable yet
    write_script(script, "exit 0\n");
    CHECK(find_executable(script, resolved));
}

int main() {
    g_test_dir = make_test_dir("panannot_subprocess_test");

    test_exit_status_and_log();
    test_nonzero_exit();
    test_working_directory();
    test_cannot_execute();
    test_cancellation_terminates();
    test_sigterm_ignored_then_killed();
    test_destructor_reaps();
    test_scoped_temp_dir();
    test_find_executable();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
