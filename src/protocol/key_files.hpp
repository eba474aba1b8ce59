#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tryrun::protocol {

    // Repository-relative paths of the descriptors the planner cares about.
    // Produced by the file-scanning collaborator (scanner/key_files).
    struct KeyFiles {
        std::optional<std::string> package_json;
        std::optional<std::string> bun_lock;
        std::optional<std::string> pnpm_lock;
        std::optional<std::string> yarn_lock;
        std::optional<std::string> dockerfile;
        std::optional<std::string> docker_compose;
        std::optional<std::string> requirements_txt;
        std::optional<std::string> pyproject_toml;
        std::optional<std::string> makefile;
        std::vector<std::string> entrypoints;
    };

} // namespace tryrun::protocol
