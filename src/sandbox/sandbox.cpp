#include "sandbox/sandbox.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace tryrun::sandbox {

using core::errors::ErrorCategory;
using core::errors::TryRunError;

namespace {

TryRunError copy_error(const std::string& what, const std::filesystem::path& path,
                       const std::error_code& ec) {
    return TryRunError{ErrorCategory::Sandbox,
                       "Sandbox copy failed to " + what + " " + path.string() + ": " +
                           ec.message(),
                       "sandbox_copy_failed"};
}

core::errors::Result<std::size_t> copy_tree(const std::filesystem::path& source,
                                            const std::filesystem::path& destination) {
    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        return copy_error("create", destination, ec);
    }

    std::filesystem::directory_iterator it(source, ec);
    if (ec) {
        return copy_error("list", source, ec);
    }

    std::size_t copied = 0;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return copy_error("list", source, ec);
        }
        const auto& src_path = it->path();
        const auto dest_path = destination / src_path.filename();
        const auto status = std::filesystem::symlink_status(src_path, ec);
        if (ec) {
            return copy_error("stat", src_path, ec);
        }

        if (std::filesystem::is_symlink(status)) {
            const auto target = std::filesystem::read_symlink(src_path, ec);
            if (ec) {
                return copy_error("read link", src_path, ec);
            }
            std::filesystem::create_symlink(target, dest_path, ec);
            if (ec) {
                return copy_error("create link", dest_path, ec);
            }
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (should_skip_directory(src_path.filename().string())) {
                continue;
            }
            auto nested = copy_tree(src_path, dest_path);
            if (core::errors::is_error(nested)) {
                return core::errors::get_error(nested);
            }
            copied += core::errors::get_value(nested);
            continue;
        }

        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }
        std::filesystem::copy_file(src_path, dest_path,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return copy_error("copy", src_path, ec);
        }
        ++copied;
    }
    return copied;
}

}  // namespace

bool should_skip_directory(const std::string& name) {
    static const char* const kSkipped[] = {".git", ".hg", ".svn", ".tryrun",
                                           "node_modules", "dist", "build", "coverage"};
    for (const char* skipped : kSkipped) {
        if (name == skipped) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::size_t> copy_repository(const std::filesystem::path& source,
                                                  const std::filesystem::path& destination) {
    std::error_code ec;
    if (!std::filesystem::is_directory(source, ec) || ec) {
        return TryRunError{ErrorCategory::Sandbox,
                           "Repository path is not a directory: " + source.string(),
                           "invalid_repository_path"};
    }
    return copy_tree(source, destination);
}

Sandbox::Sandbox(std::filesystem::path root)
    : root_(std::move(root)), repo_path_(root_ / "repo") {}

Sandbox::~Sandbox() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        TRYRUN_LOG_WARN("Sandbox: cleanup of " + root_.string() +
                        " failed: " + ec.message());
        return;
    }
    TRYRUN_LOG_DEBUG("Sandbox: removed " + root_.string());
}

core::errors::Result<std::unique_ptr<Sandbox>> Sandbox::create(
    const std::filesystem::path& source_repo) {
    std::error_code ec;
    const auto temp_root = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return TryRunError{ErrorCategory::Sandbox,
                           "Unable to locate temporary directory: " + ec.message(),
                           "sandbox_create_failed"};
    }

    std::string pattern = (temp_root / "tryrun-run-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return TryRunError{ErrorCategory::Sandbox,
                           "Unable to create sandbox directory: " +
                               std::string(std::strerror(errno)),
                           "sandbox_create_failed"};
    }

    // Owned from here on: any early return below removes the directory.
    std::unique_ptr<Sandbox> sandbox(new Sandbox(std::filesystem::path(buffer.data())));
    auto copied = copy_repository(source_repo, sandbox->repo_path());
    if (core::errors::is_error(copied)) {
        return core::errors::get_error(copied);
    }

    TRYRUN_LOG_INFO("Sandbox: copied " + std::to_string(core::errors::get_value(copied)) +
                    " files into " + sandbox->repo_path().string());
    return std::move(sandbox);
}

}  // namespace tryrun::sandbox
