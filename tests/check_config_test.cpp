#include "config/check_config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace elmtest::config;

TEST(CheckConfigTest, DefaultsWhenEmpty) {
    auto config = parse_check_config("");
    EXPECT_EQ(config.test_directories, std::vector<std::string>{"tests"});
    EXPECT_EQ(config.jobs, 0u);
    EXPECT_FALSE(config.strict);
    EXPECT_TRUE(config.color);
}

TEST(CheckConfigTest, ParsesCheckSection) {
    auto config = parse_check_config("[package]\n"
                                     "name = \"app\"\n"
                                     "\n"
                                     "[check]\n"
                                     "# where the suites live\n"
                                     "test-directories = [\"tests\", \"integration\"]\n"
                                     "jobs = 4\n"
                                     "strict = true   # fail on unexposed tests\n"
                                     "color = false\n");

    EXPECT_EQ(config.test_directories, (std::vector<std::string>{"tests", "integration"}));
    EXPECT_EQ(config.jobs, 4u);
    EXPECT_TRUE(config.strict);
    EXPECT_FALSE(config.color);
}

TEST(CheckConfigTest, KeysOutsideCheckSectionIgnored) {
    auto config = parse_check_config("strict = true\n"
                                     "[lint]\n"
                                     "jobs = 8\n");
    EXPECT_FALSE(config.strict);
    EXPECT_EQ(config.jobs, 0u);
}

TEST(CheckConfigTest, InvalidValuesKeepDefaults) {
    auto config = parse_check_config("[check]\n"
                                     "jobs = many\n"
                                     "strict = yes\n"
                                     "test-directories = tests\n"
                                     "colour = false\n"
                                     "no equals sign\n");
    EXPECT_EQ(config.jobs, 0u);
    EXPECT_FALSE(config.strict);
    EXPECT_EQ(config.test_directories, std::vector<std::string>{"tests"});
    EXPECT_TRUE(config.color);
}

TEST(CheckConfigTest, EmptyArrayClearsDirectories) {
    auto config = parse_check_config("[check]\ntest-directories = []\n");
    EXPECT_TRUE(config.test_directories.empty());
}

TEST(CheckConfigTest, HashInsideStringIsNotComment) {
    auto config = parse_check_config("[check]\ntest-directories = [\"tests#1\"]\n");
    EXPECT_EQ(config.test_directories, std::vector<std::string>{"tests#1"});
}

class CheckConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("elmtest_config_test_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }
};

TEST_F(CheckConfigFileTest, LoadsFromProjectRoot) {
    {
        std::ofstream out(test_dir / CONFIG_FILE_NAME);
        out << "[check]\njobs = 2\n";
    }

    auto config = load_check_config(test_dir);
    EXPECT_EQ(config.jobs, 2u);
}

TEST_F(CheckConfigFileTest, MissingFileGivesDefaults) {
    auto config = load_check_config(test_dir);
    EXPECT_EQ(config.jobs, 0u);
    EXPECT_EQ(config.test_directories, std::vector<std::string>{"tests"});

    auto explicit_config = load_check_config_file(test_dir / "absent.toml");
    EXPECT_TRUE(explicit_config.color);
}
