#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "protocol/key_files.hpp"

namespace tryrun::scanner {

inline constexpr std::size_t kMaxScannedEntries = 20000;
inline constexpr std::size_t kMaxEntrypoints = 30;

// Walks root (without following symlinks or entering sandbox-skipped
// directories) and records the root-level descriptors and likely entry points.
protocol::KeyFiles detect_key_files(const std::filesystem::path& root);

// "src/cli.ts", "bin/server.js" and friends: the extension-less path ends
// with a known hint on a path-segment boundary.
bool is_entrypoint_candidate(const std::string& relative_path);

bool is_test_or_fixture_path(const std::string& relative_path);

}  // namespace tryrun::scanner
