#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(ConfigParse, EmptyTextGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const StoreLayout& l = result.value.layout();
    EXPECT_EQ(l.store_dir, ".store");
    EXPECT_EQ(l.data_dir, "data");
    EXPECT_EQ(l.lock_file, "wc.lock");
    EXPECT_EQ(l.apiurl, "_apiurl");
    EXPECT_EQ(l.project, "_project");
    EXPECT_EQ(l.package, "_package");
    EXPECT_EQ(l.packages, "_packages");
    EXPECT_EQ(l.files, "_files");
}

TEST(ConfigParse, OverridesOnlyGivenKeys) {
    auto result = Config::parse(
        "store:\n"
        "  dir: .osc\n"
        "  entries:\n"
        "    apiurl: API\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const StoreLayout& l = result.value.layout();
    EXPECT_EQ(l.store_dir, ".osc");
    EXPECT_EQ(l.apiurl, "API");
    EXPECT_EQ(l.data_dir, "data");
    EXPECT_EQ(l.project, "_project");
}

TEST(ConfigParse, UnrelatedSectionsAreIgnored) {
    auto result = Config::parse("editor: vim\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.layout().store_dir, ".store");
}

TEST(ConfigParse, RejectsPathSeparators) {
    auto result = Config::parse("store:\n  lock_file: locks/wc.lock\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("lock_file"), std::string::npos);
}

TEST(ConfigParse, RejectsEmptyAndDotNames) {
    EXPECT_TRUE(Config::parse("store:\n  dir: \"\"\n").is_err());
    EXPECT_TRUE(Config::parse("store:\n  data_dir: ..\n").is_err());
    EXPECT_TRUE(Config::parse("store:\n  entries:\n    files: .\n").is_err());
}

TEST(ConfigParse, RejectsWrongShapes) {
    EXPECT_TRUE(Config::parse("store: [a, b]\n").is_err());
    EXPECT_TRUE(Config::parse("store:\n  entries: x\n").is_err());
    EXPECT_TRUE(Config::parse("store:\n  dir: [a]\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(ConfigParse, RejectsCollidingNames) {
    auto lock_on_entry = Config::parse("store:\n  lock_file: _apiurl\n");
    ASSERT_TRUE(lock_on_entry.is_err());
    EXPECT_NE(lock_on_entry.error.find("lock_file"), std::string::npos);
    EXPECT_NE(lock_on_entry.error.find("_apiurl"), std::string::npos);

    EXPECT_TRUE(Config::parse("store:\n  data_dir: _files\n").is_err());
    EXPECT_TRUE(Config::parse("store:\n  lock_file: data\n").is_err());
    EXPECT_TRUE(Config::parse(
        "store:\n"
        "  entries:\n"
        "    project: P\n"
        "    package: P\n").is_err());
}

TEST(ConfigParse, StoreDirMayShareNameWithChildren) {
    auto result = Config::parse("store:\n  dir: data\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.layout().store_dir, "data");
}

TEST(ConfigParse, MalformedYamlIsError) {
    auto result = Config::parse("store: {dir: .x\n");
    EXPECT_TRUE(result.is_err());
}

TEST(ConfigValidate, StoreNames) {
    EXPECT_EQ(validate_store_name("dir", ".store"), "");
    EXPECT_NE(validate_store_name("dir", "a\\b"), "");
}

TEST(ConfigValidate, DefaultLayoutHasDistinctNames) {
    EXPECT_EQ(validate_store_layout(StoreLayout{}), "");

    StoreLayout layout;
    layout.files = layout.packages;
    EXPECT_NE(validate_store_layout(layout), "");
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            fmt::format("wcstore_config_test_{}_{}", ::getpid(),
                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        if (const char* home = std::getenv("HOME")) {
            saved_home = home;
            had_home = true;
        }
        ::setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            ::setenv("HOME", saved_home.c_str(), 1);
        } else {
            ::unsetenv("HOME");
        }
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, MissingFileIsError) {
    auto result = Config::load_file(test_dir / "nope.yaml");
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigFileTest, LoadFileRemembersSource) {
    fs::path file = test_dir / "wcstore.yaml";
    std::ofstream(file) << "store:\n  dir: .meta\n";
    auto result = Config::load_file(file);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.layout().store_dir, ".meta");
    EXPECT_EQ(result.value.source(), file);
}

TEST_F(ConfigFileTest, InvalidFileNamesThePath) {
    fs::path file = test_dir / "bad.yaml";
    std::ofstream(file) << "store:\n  dir: a/b\n";
    auto result = Config::load_file(file);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find(file.string()), std::string::npos);
}

TEST_F(ConfigFileTest, GlobalConfigIsOptional) {
    EXPECT_FALSE(global_config_exists());
    auto result = Config::load_global();
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.layout().store_dir, ".store");
    EXPECT_TRUE(result.value.source().empty());
}

TEST_F(ConfigFileTest, GlobalConfigIsRead) {
    EXPECT_EQ(get_global_config_path(), test_dir / ".wcstore" / "config.yaml");
    fs::create_directories(get_global_config_dir());
    std::ofstream(get_global_config_path()) << "store:\n  entries:\n    project: PRJ\n";

    auto result = Config::load_global();
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.layout().project, "PRJ");
}
