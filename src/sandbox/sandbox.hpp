#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/tryrun_errors.hpp"

namespace tryrun::sandbox {

// Directory names never copied into a sandbox: VCS metadata, our own state,
// dependency caches, build output and coverage reports.
bool should_skip_directory(const std::string& name);

// Recursively copies source into destination (created if missing), skipping
// should_skip_directory() names at any depth. Symlinks are recreated, not
// followed; sockets, FIFOs and devices are skipped. Returns files copied.
core::errors::Result<std::size_t> copy_repository(const std::filesystem::path& source,
                                                  const std::filesystem::path& destination);

// One ephemeral, exclusively owned copy of a repository. The whole temporary
// tree is removed when the object is destroyed; removal errors are logged and
// otherwise ignored.
class Sandbox {
public:
    static core::errors::Result<std::unique_ptr<Sandbox>> create(
        const std::filesystem::path& source_repo);

    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& repo_path() const { return repo_path_; }

private:
    explicit Sandbox(std::filesystem::path root);

    std::filesystem::path root_;
    std::filesystem::path repo_path_;
};

}  // namespace tryrun::sandbox
