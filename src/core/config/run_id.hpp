#pragma once
#include <cctype>
#include <random>
#include <sstream>
#include <string>

namespace tryrun::core::config {

    // "<prefix>xxxxxxxx" with 8 random hex digits. Run IDs tag log lines and
    // name the per-attempt artifact files; tests reuse it for scratch dirs.
    inline std::string generate_run_id(const std::string& prefix = "run-") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Run IDs end up in file names, so only [A-Za-z0-9._-] is accepted and
    // path-like values ("..", leading dot) are refused.
    inline bool is_valid_run_id(const std::string& id) {
        if (id.empty() || id.size() > 64 || id.front() == '.') {
            return false;
        }
        for (const char c : id) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) == 0 && c != '-' && c != '_' && c != '.') {
                return false;
            }
        }
        return true;
    }

} // namespace tryrun::core::config
