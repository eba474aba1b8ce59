#include "cli_parser.hpp"
#include <algorithm>
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace tryrun::app::cli {

    using namespace tryrun::core::errors;
    using tryrun::protocol::CliCommand;
    using tryrun::protocol::TryRunRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> repo;
        std::optional<std::string> timeout;
        std::optional<std::string> max_output_chars;
        std::optional<std::string> policy;
        std::optional<std::string> artifacts_dir;
        bool allow_python = false;
        bool json = false;
        bool verbose = false;
    };

    const char* usage() {
        return "Usage: tryrun plan --repo <dir> [--allow-python] [--policy <file>] [--json] [--verbose]\n"
               "       tryrun run --repo <dir> [--timeout <sec>] [--max-output-chars <n>] [--allow-python]\n"
               "                  [--policy <file>] [--artifacts-dir <dir>] [--json] [--verbose]";
    }

    namespace {

        template <typename T>
        std::optional<T> parse_unsigned(const std::string& text) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        Result<std::filesystem::path> resolve_directory(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return TryRunError{ErrorCategory::Input, flag + " does not exist or is not a directory: " + raw, "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return TryRunError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + raw, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<TryRunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return TryRunError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        TryRunRequest req;
        std::string command = argv[1];
        if (command == "plan") {
            req.command = CliCommand::Plan;
        } else if (command == "run") {
            req.command = CliCommand::Run;
        } else {
            return TryRunError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            std::optional<std::string>* slot = nullptr;
            bool run_only = false;
            if (flag == "--repo") {
                slot = &raw.repo;
            } else if (flag == "--policy") {
                slot = &raw.policy;
            } else if (flag == "--timeout") {
                slot = &raw.timeout;
                run_only = true;
            } else if (flag == "--max-output-chars") {
                slot = &raw.max_output_chars;
                run_only = true;
            } else if (flag == "--artifacts-dir") {
                slot = &raw.artifacts_dir;
                run_only = true;
            } else if (flag == "--allow-python") {
                raw.allow_python = true;
                continue;
            } else if (flag == "--json") {
                raw.json = true;
                continue;
            } else if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            } else {
                return TryRunError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument", usage()};
            }

            if (run_only && req.command != CliCommand::Run) {
                return TryRunError{ErrorCategory::Input, flag + " is only valid for 'run'", "unknown_argument", usage()};
            }
            if (!take_value(i, *slot)) {
                return TryRunError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.allow_python = raw.allow_python;
        req.json_output = raw.json;
        req.verbose = raw.verbose;

        if (!raw.repo.has_value()) {
            return TryRunError{ErrorCategory::Input, "Must provide --repo", "missing_required_flag", usage()};
        }
        auto repo = resolve_directory(raw.repo.value(), "--repo");
        if (is_error(repo)) {
            return get_error(repo);
        }
        req.repo_path = get_value(repo);

        // Exception-free integer parsing; the timeout is clamped, not rejected.
        if (raw.timeout) {
            const auto seconds = parse_unsigned<std::uint32_t>(raw.timeout.value());
            if (!seconds) {
                return TryRunError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a positive integer."};
            }
            req.timeout_seconds = std::clamp(seconds.value(), kMinTimeoutSeconds, kMaxTimeoutSeconds);
        }

        if (raw.max_output_chars) {
            const auto chars = parse_unsigned<std::size_t>(raw.max_output_chars.value());
            if (!chars) {
                return TryRunError{ErrorCategory::Input, "Invalid number for --max-output-chars", "invalid_integer", "Provide a positive integer."};
            }
            if (chars.value() == 0 || chars.value() > kMaxOutputCharsLimit) {
                return TryRunError{ErrorCategory::Input, "--max-output-chars out of bounds", "bounds_error", "Must be between 1 and 10000000."};
            }
            req.max_output_chars = chars.value();
        }

        // The policy file may legitimately be missing; the loader reports that.
        if (raw.policy) {
            if (raw.policy->empty()) {
                return TryRunError{ErrorCategory::Input, "Empty value for --policy", "missing_value"};
            }
            req.policy_path = std::filesystem::path(raw.policy.value());
        }

        if (raw.artifacts_dir) {
            if (raw.artifacts_dir->empty()) {
                return TryRunError{ErrorCategory::Input, "Empty value for --artifacts-dir", "missing_value"};
            }
            std::error_code path_ec;
            auto absolute_dir = std::filesystem::absolute(raw.artifacts_dir.value(), path_ec);
            if (path_ec) {
                return TryRunError{ErrorCategory::Input, "Failed to resolve --artifacts-dir: " + raw.artifacts_dir.value(), "invalid_path"};
            }
            req.artifacts_dir = std::move(absolute_dir);
        }

        return req;
    }

} // namespace tryrun::app::cli
