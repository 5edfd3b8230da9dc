// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_seen;

static std::string on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines_seen.push_back(line);
    if (line.rfind("ACCEPT ", 0) == 0)
        return "ERR no completed transfer " + line.substr(7);
    return "OK";
}

static std::string temp_path(const std::string &suffix)
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/chunkrelay-cli-test-" + std::to_string(::getpid()) + suffix;
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/chunkrelayctl --sock " + sock + " " + args + " >/dev/null 2>&1";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionality)
{
    test_cli::g_lines_seen.clear();
    const auto sock = test_cli::temp_path(".sock");
    const auto file = test_cli::temp_path(".bin");
    {
        std::ofstream out(file, std::ios::binary);
        out << "payload";
    }

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "send " + file), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "pending"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "discard some-key"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "accept missing-key"), exitc::failure);
    EXPECT_EQ(test_cli::run_cli(sock, "sweep"), exitc::ok);

    // rejected locally, never reach the daemon
    EXPECT_EQ(test_cli::run_cli(sock, "frobnicate"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "accept"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "send /definitely/not/here.bin"), exitc::bad_args);

    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_seen.size(), 6u);
        EXPECT_EQ(test_cli::g_lines_seen[0],
                  "SEND " + std::filesystem::absolute(file).string());
        EXPECT_EQ(test_cli::g_lines_seen[1], "PENDING");
        EXPECT_EQ(test_cli::g_lines_seen[2], "DISCARD some-key");
        EXPECT_EQ(test_cli::g_lines_seen[3], "ACCEPT missing-key");
        EXPECT_EQ(test_cli::g_lines_seen[4], "SWEEP");
        EXPECT_EQ(test_cli::g_lines_seen.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
    std::filesystem::remove(file);
}

TEST(CLI, TestNoDaemon)
{
    const auto sock = test_cli::temp_path("-absent.sock");
    ::unlink(sock.c_str());
    EXPECT_EQ(test_cli::run_cli(sock, "pending"), exitc::no_server);
}
