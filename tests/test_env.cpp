// tests/test_env.cpp
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("CHUNKRELAY_CTL_SOCK");
    const std::string want = "/tmp/chunkrelay-test.sock";
    g.set(want);

    // should NOT log the default path when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Control socket at") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("CHUNKRELAY_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "chunkrelay-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/chunkrelay/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket at " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace chunkrelay;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    LOG_SYSTEM("system_always_above");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[SYSTEM]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, ParseAliasesAndFallback)
{
    using namespace chunkrelay;
    EXPECT_TRUE(parse_level("warn") == Level::Warning);
    EXPECT_TRUE(parse_level("WARNING") == Level::Warning);
    EXPECT_TRUE(parse_level("Err") == Level::Error);
    EXPECT_FALSE(parse_level("loud").has_value());
    EXPECT_FALSE(parse_level("").has_value());

    set_log_level(Level::Error);
    set_log_level_by_name("loud");
    EXPECT_TRUE(global_level() == Level::Info);

    EnvGuard g("CHUNKRELAY_LOG_LEVEL");
    g.set("debug");
    init_log_from_env();
    EXPECT_TRUE(global_level() == Level::Debug);
    set_log_level(Level::Info);
}

TEST(Config, ParseU64IsStrict)
{
    EXPECT_EQ(config::parse_u64("0").value_or(1), 0u);
    EXPECT_EQ(config::parse_u64("26214400").value_or(0), 26214400u);
    EXPECT_FALSE(config::parse_u64("").has_value());
    EXPECT_FALSE(config::parse_u64(nullptr).has_value());
    EXPECT_FALSE(config::parse_u64("-1").has_value());
    EXPECT_FALSE(config::parse_u64("+5").has_value());
    EXPECT_FALSE(config::parse_u64(" 5").has_value());
    EXPECT_FALSE(config::parse_u64("5ms").has_value());
    EXPECT_FALSE(config::parse_u64("99999999999999999999999").has_value());
}

struct ConfigEnv
{
    EnvGuard limit{"CHUNKRELAY_ATTACHMENT_LIMIT"};
    EnvGuard chunk{"CHUNKRELAY_CHUNK_SIZE"};
    EnvGuard expiry{"CHUNKRELAY_EXPIRY_MS"};
    EnvGuard sweep{"CHUNKRELAY_SWEEP_MS"};
    EnvGuard max_size{"CHUNKRELAY_MAX_OBJECT_SIZE"};
    EnvGuard auto_merge{"CHUNKRELAY_AUTO_MERGE"};
    EnvGuard out_dir{"CHUNKRELAY_OUT_DIR"};

    ConfigEnv()
    {
        for (auto *g : {&limit, &chunk, &expiry, &sweep, &max_size, &auto_merge, &out_dir})
            g->unset();
    }
};

TEST(Config, DefaultsWithoutEnv)
{
    ConfigEnv env;
    auto      c = config::load_config_from_env();
    EXPECT_EQ(c.chunk_size, constants::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(c.attachment_limit, constants::ATTACHMENT_LIMIT);
    EXPECT_EQ(c.expiry_window, constants::DEFAULT_EXPIRY_WINDOW);
    EXPECT_EQ(c.sweep_interval, constants::DEFAULT_SWEEP_INTERVAL);
    EXPECT_EQ(c.max_object_size, constants::DEFAULT_MAX_OBJECT_SIZE);
    EXPECT_TRUE(c.auto_merge);
    EXPECT_TRUE(config::validate(c));
}

TEST(Config, ReadsOverrides)
{
    ConfigEnv env;
    env.limit.set("1000");
    env.chunk.set("900");
    env.expiry.set("2500");
    env.sweep.set("100");
    env.max_size.set("0");
    env.auto_merge.set("off");
    env.out_dir.set("/tmp/inbox");

    auto c = config::load_config_from_env();
    EXPECT_EQ(c.attachment_limit, 1000u);
    EXPECT_EQ(c.chunk_size, 900u);
    EXPECT_EQ(c.expiry_window, std::chrono::milliseconds(2500));
    EXPECT_EQ(c.sweep_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(c.max_object_size, 0u);
    EXPECT_FALSE(c.auto_merge);
    EXPECT_EQ(c.out_dir, "/tmp/inbox");
    EXPECT_TRUE(config::validate(c));
}

TEST(Config, InvalidValuesIgnoredWithWarning)
{
    ConfigEnv env;
    env.chunk.set("lots");
    env.expiry.set("0");
    env.auto_merge.set("maybe");

    testing::internal::CaptureStderr();
    auto        c   = config::load_config_from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c.chunk_size, constants::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(c.expiry_window, constants::DEFAULT_EXPIRY_WINDOW);
    EXPECT_TRUE(c.auto_merge);
    EXPECT_NE(err.find("CHUNKRELAY_CHUNK_SIZE"), std::string::npos);
    EXPECT_NE(err.find("CHUNKRELAY_EXPIRY_MS"), std::string::npos);
    EXPECT_NE(err.find("CHUNKRELAY_AUTO_MERGE"), std::string::npos);
}

TEST(Config, ChunkAboveLimitFallsBackUnderIt)
{
    ConfigEnv env;
    env.limit.set("1000");
    env.chunk.set("1000");
    auto c = config::load_config_from_env();
    EXPECT_LT(c.chunk_size, c.attachment_limit);
    EXPECT_GT(c.chunk_size, 0u);
    EXPECT_TRUE(config::validate(c));

    env.limit.set("10485760");  // 10 MiB keeps the usual half-MiB margin
    env.chunk.set("20000000");
    c = config::load_config_from_env();
    EXPECT_EQ(c.chunk_size, 10485760u - 512u * 1024);
}

TEST(Config, ValidateRejectsBadCombinations)
{
    config::Config c;
    EXPECT_TRUE(config::validate(c));

    c.chunk_size = 0;
    EXPECT_FALSE(config::validate(c));

    c            = config::Config{};
    c.chunk_size = c.attachment_limit;
    EXPECT_FALSE(config::validate(c));

    c                = config::Config{};
    c.expiry_window = std::chrono::milliseconds(0);
    EXPECT_FALSE(config::validate(c));
}
