#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/tryrun_errors.hpp"
#include "sandbox/sandbox.hpp"

namespace {

using tryrun::core::errors::ErrorCategory;
using tryrun::core::errors::get_error;
using tryrun::core::errors::get_value;
using tryrun::core::errors::is_error;
using tryrun::sandbox::Sandbox;
using tryrun::sandbox::should_skip_directory;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_sandbox_" + tryrun::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST(SandboxTest, SkipListCoversHeavyAndMetadataDirectories) {
    for (const char* name : {".git", ".hg", ".svn", ".tryrun", "node_modules", "dist",
                             "build", "coverage"}) {
        EXPECT_TRUE(should_skip_directory(name)) << name;
    }
    EXPECT_FALSE(should_skip_directory("src"));
    EXPECT_FALSE(should_skip_directory("Build"));
}

TEST(SandboxTest, CopiesRepositoryWithoutSkippedDirectories) {
    TempWorkspace workspace;
    write_file(workspace.root() / "package.json", "{}");
    write_file(workspace.root() / "src/index.js", "console.log('hi')");
    write_file(workspace.root() / ".git/HEAD", "ref: refs/heads/main");
    write_file(workspace.root() / "node_modules/left-pad/index.js", "module.exports = 1");
    write_file(workspace.root() / "packages/app/dist/bundle.js", "bundled");
    write_file(workspace.root() / "coverage/lcov.info", "TN:");

    std::filesystem::path sandbox_root;
    {
        auto created = Sandbox::create(workspace.root());
        ASSERT_FALSE(is_error(created));
        const auto& sandbox = get_value(created);
        sandbox_root = sandbox->root();
        const auto repo = sandbox->repo_path();

        EXPECT_EQ(repo, sandbox_root / "repo");
        EXPECT_NE(sandbox_root.filename().string().find("tryrun-run-"), std::string::npos);
        EXPECT_EQ(read_file(repo / "package.json"), "{}");
        EXPECT_EQ(read_file(repo / "src/index.js"), "console.log('hi')");
        EXPECT_FALSE(std::filesystem::exists(repo / ".git"));
        EXPECT_FALSE(std::filesystem::exists(repo / "node_modules"));
        EXPECT_FALSE(std::filesystem::exists(repo / "packages/app/dist"));
        EXPECT_TRUE(std::filesystem::exists(repo / "packages/app"));
        EXPECT_FALSE(std::filesystem::exists(repo / "coverage"));
    }
    EXPECT_FALSE(std::filesystem::exists(sandbox_root));
}

TEST(SandboxTest, RecreatesSymlinksWithoutFollowingThem) {
    TempWorkspace workspace;
    write_file(workspace.root() / "real.txt", "real");
    std::filesystem::create_symlink("real.txt", workspace.root() / "alias.txt");
    std::filesystem::create_directory_symlink("/", workspace.root() / "rootfs");

    auto created = Sandbox::create(workspace.root());
    ASSERT_FALSE(is_error(created));
    const auto repo = get_value(created)->repo_path();

    EXPECT_TRUE(std::filesystem::is_symlink(repo / "alias.txt"));
    EXPECT_EQ(std::filesystem::read_symlink(repo / "alias.txt").string(), "real.txt");
    EXPECT_TRUE(std::filesystem::is_symlink(repo / "rootfs"));
    EXPECT_EQ(read_file(repo / "alias.txt"), "real");
}

TEST(SandboxTest, MissingSourceIsSandboxError) {
    const auto missing =
        std::filesystem::current_path() /
        ("__missing_sandbox_source__" + tryrun::core::config::generate_run_id());
    auto created = Sandbox::create(missing);
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).category, ErrorCategory::Sandbox);
    EXPECT_EQ(get_error(created).code, "invalid_repository_path");
}

TEST(SandboxTest, EachSandboxIsDistinct) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.txt", "a");

    auto first = Sandbox::create(workspace.root());
    auto second = Sandbox::create(workspace.root());
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_NE(get_value(first)->root(), get_value(second)->root());
}

}  // namespace
