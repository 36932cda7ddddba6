#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "errors.hpp"
#include "file_index.hpp"
#include "test_helpers.hpp"

using namespace code_query;
namespace fs = std::filesystem;

class FileIndexTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / ("code_query_index_" + std::to_string(stamp));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string& rel, const std::string& content) {
        fs::path p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
    }
};

TEST_F(FileIndexTest, BuildsSortedRecordsWithMetadata) {
    write("src/b.py", "import os\nprint(os.name)\n");
    write("a.py", "x = 1");
    write("src/c.cpp", "int main() {}\n");

    DiskFileReader reader(root);
    FileIndex index = FileIndex::build(root.string(), reader, ProjectFilter{});

    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index.records()[0].path, "a.py");
    EXPECT_EQ(index.records()[1].path, "src/b.py");
    EXPECT_EQ(index.records()[2].path, "src/c.cpp");

    const FileRecord* b = index.lookup("src/b.py");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->line_count, 2u);
    EXPECT_EQ(b->extension, ".py");
    EXPECT_EQ(index.lookup("a.py")->line_count, 1u);
    EXPECT_EQ(index.lookup("missing.py"), nullptr);
}

TEST_F(FileIndexTest, PreviewIsBoundedPrefix) {
    write("long.txt", std::string(2000, 'q'));

    DiskFileReader reader(root);
    FileIndex index = FileIndex::build(root.string(), reader, ProjectFilter{}, 500);

    EXPECT_EQ(index.lookup("long.txt")->preview, std::string(500, 'q'));
}

TEST_F(FileIndexTest, FilterSkipsIgnoredPathsUnlessExcepted) {
    write("src/main.py", "main");
    write("build/out.py", "generated");
    write("build/keep/config.py", "kept");
    write("docs/readme.md", "docs");
    write(".git/HEAD", "ref");

    ProjectFilter filter;
    filter.allowed_extensions = {"py"};
    filter.ignored_paths = {"build"};
    filter.included_paths = {"build/keep"};

    DiskFileReader reader(root);
    FileIndex index = FileIndex::build(root.string(), reader, filter);

    EXPECT_TRUE(index.contains("src/main.py"));
    EXPECT_TRUE(index.contains("build/keep/config.py"));
    EXPECT_FALSE(index.contains("build/out.py"));
    EXPECT_FALSE(index.contains("docs/readme.md"));
    EXPECT_FALSE(index.contains(".git/HEAD"));
}

TEST_F(FileIndexTest, MissingRootFailsToBuild) {
    DiskFileReader reader(root / "nope");
    EXPECT_THROW(FileIndex::build((root / "nope").string(), reader, ProjectFilter{}), IndexBuildError);
}

TEST_F(FileIndexTest, RootWithoutEligibleFilesFailsToBuild) {
    write("notes.md", "nothing to see");
    ProjectFilter filter;
    filter.allowed_extensions = {"py"};

    DiskFileReader reader(root);
    EXPECT_THROW(FileIndex::build(root.string(), reader, filter), IndexBuildError);
}

TEST(FileIndexRecordsTest, DuplicatePathsAreDropped) {
    FileIndex index({{"a.py", 1, ".py", "one"}, {"a.py", 2, ".py", "two"}});

    EXPECT_EQ(index.size(), 1u);
}

TEST(FileIndexRecordsTest, ListDirectoryMatchesPrefix) {
    auto index = testing_support::make_index({"src/net/a.cpp", "src/net/b.cpp", "src/util.cpp", "tests/t.cpp"});

    auto net = index.list_directory("src/net/");
    ASSERT_EQ(net.size(), 2u);
    EXPECT_EQ(net[0].path, "src/net/a.cpp");
    EXPECT_EQ(net[1].path, "src/net/b.cpp");
    EXPECT_EQ(index.list_directory("src/").size(), 3u);
    EXPECT_EQ(index.list_directory("").size(), 4u);
    EXPECT_TRUE(index.list_directory("lib/").empty());
}

TEST(FileIndexRecordsTest, TreeShowsNestedDirectories) {
    auto index = testing_support::make_index({"src/a.cpp", "README.md"});

    std::string tree = index.render_tree("repo");

    EXPECT_NE(tree.find("repo/"), std::string::npos);
    EXPECT_NE(tree.find("src/"), std::string::npos);
    EXPECT_NE(tree.find("a.cpp"), std::string::npos);
    EXPECT_NE(tree.find("README.md"), std::string::npos);
}

TEST(DiskFileReaderTest, RejectsPathsOutsideRoot) {
    DiskFileReader reader(fs::temp_directory_path());
    EXPECT_THROW(reader.read_full("../etc/passwd"), FileReadError);
    EXPECT_THROW(reader.read_full("/etc/passwd"), FileReadError);
}
