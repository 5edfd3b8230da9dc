#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

#include "app/object_store.hpp"

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void spit(const fs::path &p, const std::string &s)
{
    std::ofstream out(p, std::ios::binary);
    out << s;
}

static chunk::Object make_obj(const std::string &name, const std::string &text)
{
    chunk::Object o;
    o.name       = name;
    o.object_key = name + "-key";
    o.bytes.assign(text.begin(), text.end());
    return o;
}

class ObjectStore : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / ("chunkrelay-store-" + std::to_string(::getpid()));
        fs::remove_all(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST(SafeFileName, KeepsOnlyTheLastComponent)
{
    EXPECT_EQ(app::safe_file_name("movie.mp4"), "movie.mp4");
    EXPECT_EQ(app::safe_file_name("../../etc/passwd"), "passwd");
    EXPECT_EQ(app::safe_file_name("/abs/dir/x.bin"), "x.bin");
    EXPECT_EQ(app::safe_file_name(""), "object.bin");
    EXPECT_EQ(app::safe_file_name("."), "object.bin");
    EXPECT_EQ(app::safe_file_name(".."), "object.bin");
    EXPECT_EQ(app::safe_file_name("dir/"), "object.bin");
}

TEST_F(ObjectStore, SavesIntoFreshDirectory)
{
    auto p = app::save_object(dir_ / "nested", make_obj("a.bin", "hello"));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, dir_ / "nested" / "a.bin");
    EXPECT_EQ(slurp(*p), "hello");
}

TEST_F(ObjectStore, SecondSaveTakesNumberedName)
{
    auto first  = app::save_object(dir_, make_obj("a.bin", "one"));
    auto second = app::save_object(dir_, make_obj("a.bin", "two"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->filename(), "a.bin.1");
    EXPECT_EQ(slurp(*first), "one");
    EXPECT_EQ(slurp(*second), "two");
}

TEST_F(ObjectStore, FailsWhenEveryNameIsTaken)
{
    fs::create_directories(dir_);
    spit(dir_ / "a.bin", "zero");
    spit(dir_ / "a.bin.1", "one");
    spit(dir_ / "a.bin.2", "two");

    EXPECT_FALSE(app::save_object(dir_, make_obj("a.bin", "new"), 3).has_value());

    // nothing overwritten, nothing added
    EXPECT_EQ(slurp(dir_ / "a.bin"), "zero");
    EXPECT_EQ(slurp(dir_ / "a.bin.1"), "one");
    EXPECT_EQ(slurp(dir_ / "a.bin.2"), "two");
    EXPECT_FALSE(fs::exists(dir_ / "a.bin.3"));
}

TEST_F(ObjectStore, EmptyObjectStillCreatesFile)
{
    auto p = app::save_object(dir_, make_obj("empty", ""));
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(fs::exists(*p));
    EXPECT_EQ(fs::file_size(*p), 0u);
}
