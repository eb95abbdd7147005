#include "discovery/test_discovery.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace elmtest;
using namespace elmtest::discovery;

class TestDiscoveryTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("elmtest_discovery_test_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(test_dir / "Parser");
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void create_file(const fs::path& path, const std::string& content = "") {
        fs::create_directories(path.parent_path());
        std::ofstream f(path);
        f << content;
        f.close();
    }
};

// ============================================================================
// File Discovery
// ============================================================================

TEST_F(TestDiscoveryTest, FindsElmFilesRecursively) {
    create_file(test_dir / "Main.elm");
    create_file(test_dir / "Parser" / "Json.elm");
    create_file(test_dir / "README.md");

    std::vector<fs::path> files;
    find_elm_files(test_dir, files);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "Main.elm");
    EXPECT_EQ(files[1].filename().string(), "Json.elm");
}

TEST_F(TestDiscoveryTest, SkipsElmStuff) {
    create_file(test_dir / "Main.elm");
    create_file(test_dir / "elm-stuff" / "generated" / "Cached.elm");

    std::vector<fs::path> files;
    find_elm_files(test_dir, files);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "Main.elm");
}

TEST_F(TestDiscoveryTest, NonExistentDirectory) {
    std::vector<fs::path> files;
    find_elm_files(test_dir / "nonexistent", files);
    EXPECT_TRUE(files.empty());
}

TEST_F(TestDiscoveryTest, AppendsToExistingList) {
    create_file(test_dir / "A.elm");

    std::vector<fs::path> files{"Existing.elm"};
    find_elm_files(test_dir, files);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].string(), "Existing.elm");
}

// ============================================================================
// Module Names
// ============================================================================

TEST(ModuleNameTest, NestedPathBecomesDottedName) {
    EXPECT_EQ(module_name_from_path("tests/Parser/Json.elm", "tests"), "Parser.Json");
}

TEST(ModuleNameTest, FileAtRoot) {
    EXPECT_EQ(module_name_from_path("tests/Example.elm", "tests"), "Example");
}

TEST(ModuleNameTest, OutsideRootFallsBackToStem) {
    EXPECT_EQ(module_name_from_path("other/Thing.elm", "tests"), "Thing");
}

// ============================================================================
// Candidate Tests
// ============================================================================

TEST(TestAnnotationTest, RecognizesTestAnnotations) {
    EXPECT_EQ(test_annotation_name("suite : Test"), "suite");
    EXPECT_EQ(test_annotation_name("parserTests:Test"), "parserTests");
    EXPECT_EQ(test_annotation_name("qualified : Test.Test"), "qualified");
    EXPECT_EQ(test_annotation_name("t\xC3\xABst : Test"), "t\xC3\xABst");
}

TEST(TestAnnotationTest, RejectsOtherDeclarations) {
    EXPECT_FALSE(test_annotation_name("helper : Int -> Test").has_value());
    EXPECT_FALSE(test_annotation_name("    nested : Test").has_value());
    EXPECT_FALSE(test_annotation_name("Suite : Test").has_value());
    EXPECT_FALSE(test_annotation_name("suite =").has_value());
    EXPECT_FALSE(test_annotation_name("").has_value());
}

TEST_F(TestDiscoveryTest, CandidateTestsInFile) {
    fs::path file = test_dir / "Suite.elm";
    create_file(file, "module Suite exposing (..)\n"
                      "\n"
                      "import Test exposing (Test, test)\n"
                      "\n"
                      "suite : Test\n"
                      "suite =\n"
                      "    test \"one\" (\\_ -> Expect.pass)\n"
                      "\n"
                      "-- old : Test\n"
                      "{-\n"
                      "disabled : Test\n"
                      "-}\n"
                      "helper : Int\n"
                      "helper = 1\n"
                      "\n"
                      "other : Test\n"
                      "other = suite\n");

    auto result = find_candidate_tests(file);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (NameSet{"other", "suite"}));
}

TEST_F(TestDiscoveryTest, DeclaredModuleName) {
    fs::path file = test_dir / "Parser" / "Json.elm";
    create_file(file, "-- decoders\n"
                      "module Parser.Json exposing\n"
                      "    ( suite )\n");
    EXPECT_EQ(declared_module_name(file), "Parser.Json");

    fs::path broken = test_dir / "Broken.elm";
    create_file(broken, "x = 1\n");
    EXPECT_FALSE(declared_module_name(broken).has_value());
    EXPECT_FALSE(declared_module_name(test_dir / "Missing.elm").has_value());
}

TEST_F(TestDiscoveryTest, CandidateTestsMissingFile) {
    auto result = find_candidate_tests(test_dir / "Missing.elm");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("Missing.elm"), std::string::npos);
}
