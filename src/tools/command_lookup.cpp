#include "tools/command_lookup.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace tryrun::tools {

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

}  // namespace

bool command_exists(const std::string& command) {
    if (command.empty()) {
        return false;
    }
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command);
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        if (is_executable_file(std::filesystem::path(dir) / command)) {
            return true;
        }
    }
    return false;
}

}  // namespace tryrun::tools
