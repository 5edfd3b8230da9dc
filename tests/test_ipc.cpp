#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    // temporary socket path
    std::string sock = "/tmp/chunkrelay-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    // no handler: the reply is empty
    std::string reply = "untouched";
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n", &reply));
    EXPECT_TRUE(reply.empty());
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestHandlerReplyReachesClient)
{
    std::string sock = "/tmp/chunkrelay-ipc-reply-" + std::to_string(getpid()) + ".sock";

    std::vector<std::string> seen;
    std::thread              th([&] {
        ipc::start_server(sock, [&](const std::string &line) -> std::string {
            seen.push_back(line);
            if (line == "PENDING")
                return "k1 2/3 idle=40ms\nk2 0/5 idle=1ms";
            return "OK";
        });
    });
    for (int i = 0; i < 100 && access(sock.c_str(), F_OK) != 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::string reply;
    ASSERT_TRUE(ipc::send_line(sock, "PENDING", &reply));
    EXPECT_EQ(reply, "k1 2/3 idle=40ms\nk2 0/5 idle=1ms\n");

    ASSERT_TRUE(ipc::send_line(sock, "QUIT", &reply));
    EXPECT_EQ(reply, "OK\n");
    th.join();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "PENDING");
    EXPECT_EQ(seen[1], "QUIT");
}

TEST(IPC, TestSendLineWithoutServerFails)
{
    std::string sock = "/tmp/chunkrelay-ipc-none-" + std::to_string(getpid()) + ".sock";
    ::unlink(sock.c_str());
    EXPECT_FALSE(ipc::send_line(sock, "PENDING"));
    EXPECT_FALSE(ipc::send_line(sock, ""));
}
