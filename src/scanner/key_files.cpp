#include "scanner/key_files.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "sandbox/sandbox.hpp"

namespace tryrun::scanner {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string strip_extension(const std::string& path) {
    const auto dot = path.find_last_of('.');
    const auto slash = path.find_last_of('/');
    if (dot == std::string::npos || dot == 0 ||
        (slash != std::string::npos && dot <= slash + 1)) {
        return path;
    }
    return path.substr(0, dot);
}

void assign_root_descriptor(protocol::KeyFiles& files, const std::string& name) {
    const std::string lower = lowercase(name);
    auto set_once = [&name](std::optional<std::string>& slot) {
        if (!slot.has_value()) {
            slot = name;
        }
    };

    if (lower == "package.json") {
        set_once(files.package_json);
    } else if (lower == "bun.lockb" || lower == "bun.lock") {
        set_once(files.bun_lock);
    } else if (lower == "pnpm-lock.yaml") {
        set_once(files.pnpm_lock);
    } else if (lower == "yarn.lock") {
        set_once(files.yarn_lock);
    } else if (lower == "dockerfile") {
        set_once(files.dockerfile);
    } else if (lower == "docker-compose.yml" || lower == "docker-compose.yaml" ||
               lower == "compose.yml" || lower == "compose.yaml") {
        set_once(files.docker_compose);
    } else if (lower == "requirements.txt") {
        set_once(files.requirements_txt);
    } else if (lower == "pyproject.toml") {
        set_once(files.pyproject_toml);
    } else if (lower == "makefile") {
        set_once(files.makefile);
    }
}

}  // namespace

bool is_entrypoint_candidate(const std::string& relative_path) {
    static const char* const kHints[] = {"src/cli", "src/index", "src/main", "src/app",
                                         "src/server", "src/bin", "bin", "cli",
                                         "index", "main", "app", "server"};
    const std::string stem = lowercase(strip_extension(relative_path));
    for (const char* hint : kHints) {
        const std::string suffix(hint);
        if (!ends_with(stem, suffix)) {
            continue;
        }
        if (stem.size() == suffix.size() || stem[stem.size() - suffix.size() - 1] == '/') {
            return true;
        }
    }
    return false;
}

bool is_test_or_fixture_path(const std::string& relative_path) {
    const std::string lower = lowercase(relative_path);
    static const char* const kMarkers[] = {"/test/", "/tests/", "/fixture/", "/fixtures/",
                                           "/example/", "/examples/"};
    for (const char* marker : kMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    static const char* const kRootPrefixes[] = {"test/", "tests/", "fixture/", "fixtures/",
                                                "example/", "examples/"};
    for (const char* prefix : kRootPrefixes) {
        if (starts_with(lower, prefix)) {
            return true;
        }
    }
    return false;
}

protocol::KeyFiles detect_key_files(const std::filesystem::path& root) {
    protocol::KeyFiles files;
    std::vector<std::string> entrypoints;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        TRYRUN_LOG_WARN("KeyFiles: cannot scan " + root.string() + ": " + ec.message());
        return files;
    }

    std::size_t scanned = 0;
    for (const std::filesystem::recursive_directory_iterator end; it != end;
         it.increment(ec)) {
        if (ec) {
            TRYRUN_LOG_WARN("KeyFiles: scan stopped early: " + ec.message());
            break;
        }
        if (++scanned > kMaxScannedEntries) {
            TRYRUN_LOG_WARN("KeyFiles: entry limit reached, scan truncated");
            break;
        }

        const auto name = it->path().filename().string();
        std::error_code status_ec;
        const auto status = it->symlink_status(status_ec);
        if (status_ec) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            if (sandbox::should_skip_directory(name)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }

        if (it.depth() == 0) {
            assign_root_descriptor(files, name);
        }
        const auto relative = it->path().lexically_relative(root).generic_string();
        if (is_entrypoint_candidate(relative) && !is_test_or_fixture_path(relative)) {
            entrypoints.push_back(relative);
        }
    }

    std::sort(entrypoints.begin(), entrypoints.end());
    if (entrypoints.size() > kMaxEntrypoints) {
        entrypoints.resize(kMaxEntrypoints);
    }
    files.entrypoints = std::move(entrypoints);

    TRYRUN_LOG_DEBUG("KeyFiles: scanned " + std::to_string(scanned) + " entries, " +
                     std::to_string(files.entrypoints.size()) + " entry points");
    return files;
}

}  // namespace tryrun::scanner
