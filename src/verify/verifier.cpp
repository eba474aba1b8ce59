#include "verify/verifier.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace tryrun::verify {

using protocol::CommandStep;
using protocol::VerificationStatus;

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool has_at(const std::string& text, const std::size_t pos, const char* literal) {
    return text.compare(pos, std::strlen(literal), literal) == 0;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> literals) {
    for (const char* literal : literals) {
        if (text.find(literal) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Whole-word occurrence, as \bword\b.
bool contains_word(const std::string& text, const char* word) {
    const std::size_t len = std::strlen(word);
    for (auto pos = text.find(word); pos != std::string::npos; pos = text.find(word, pos + 1)) {
        const bool left = pos == 0 || !is_word_char(text[pos - 1]);
        const bool right = pos + len >= text.size() || !is_word_char(text[pos + len]);
        if (left && right) {
            return true;
        }
    }
    return false;
}

std::size_t skip_spaces(const std::string& text, std::size_t pos) {
    while (pos < text.size() && is_space(text[pos])) {
        ++pos;
    }
    return pos;
}

// The first two to five digits at pos.
std::optional<std::string> port_at(const std::string& text, const std::size_t pos) {
    std::size_t end = pos;
    while (end < text.size() && end - pos < 5 && is_digit(text[end])) {
        ++end;
    }
    if (end - pos < 2) {
        return std::nullopt;
    }
    return text.substr(pos, end - pos);
}

// "ran 12 tests"
bool contains_ran_tests(const std::string& text) {
    for (auto pos = text.find("ran "); pos != std::string::npos;
         pos = text.find("ran ", pos + 1)) {
        std::size_t cursor = pos + 4;
        const std::size_t digits_start = cursor;
        while (cursor < text.size() && is_digit(text[cursor])) {
            ++cursor;
        }
        if (cursor > digits_start && has_at(text, cursor, " test")) {
            return true;
        }
    }
    return false;
}

// host:port for the loopback and wildcard hosts; earliest match wins.
std::optional<std::string> address_port(const std::string& text) {
    std::optional<std::string> best;
    std::size_t best_pos = std::string::npos;
    for (const char* host : {"localhost:", "127.0.0.1:", "0.0.0.0:"}) {
        const std::size_t len = std::strlen(host);
        for (auto pos = text.find(host); pos != std::string::npos && pos < best_pos;
             pos = text.find(host, pos + 1)) {
            if (auto port = port_at(text, pos + len)) {
                best = std::move(port);
                best_pos = pos;
                break;
            }
        }
    }
    return best;
}

// "listening [on] [port] N"
std::optional<std::string> listening_port(const std::string& text) {
    for (auto pos = text.find("listening"); pos != std::string::npos;
         pos = text.find("listening", pos + 1)) {
        std::size_t cursor = pos + 9;
        bool on_allowed = true;
        bool port_allowed = true;
        while (true) {
            const std::size_t next = skip_spaces(text, cursor);
            if (next == cursor) {
                break;
            }
            if (auto port = port_at(text, next)) {
                return port;
            }
            if (on_allowed && has_at(text, next, "on")) {
                on_allowed = false;
                cursor = next + 2;
                continue;
            }
            if (port_allowed && has_at(text, next, "port")) {
                on_allowed = false;
                port_allowed = false;
                cursor = next + 4;
                continue;
            }
            break;
        }
    }
    return std::nullopt;
}

// "port N"
std::optional<std::string> bare_port(const std::string& text) {
    for (auto pos = text.find("port"); pos != std::string::npos;
         pos = text.find("port", pos + 1)) {
        const std::size_t next = skip_spaces(text, pos + 4);
        if (next == pos + 4) {
            continue;
        }
        if (auto port = port_at(text, next)) {
            return port;
        }
    }
    return std::nullopt;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

VerificationResult failed_result(const VerificationInput& input) {
    if (input.timed_out) {
        return {VerificationStatus::Failed,
                "command timed out before verification could complete"};
    }
    if (input.cancelled) {
        return {VerificationStatus::Failed,
                "command was cancelled before verification could complete"};
    }
    const std::string code = input.exit_code.has_value()
                                 ? std::to_string(input.exit_code.value())
                                 : "null";
    return {VerificationStatus::Failed,
            "command failed with exit code " + code + " (" +
                protocol::to_string(input.classification) + ")"};
}

VerificationResult verify_install(const std::string& combined) {
    if (contains_any(combined, {"installed", "added", "dependencies", "up to date",
                                "lockfile"})) {
        return {VerificationStatus::Verified,
                "dependency installation signal detected in logs"};
    }
    return {VerificationStatus::Partial,
            "exit code 0; install logs did not include strong dependency signal"};
}

VerificationResult verify_test(const std::string& combined) {
    if (contains_word(combined, "pass") || contains_word(combined, "passed") ||
        contains_any(combined, {"test passed", "tests passed", "0 fail"}) ||
        contains_ran_tests(combined)) {
        return {VerificationStatus::Verified, "test pass signal detected in logs"};
    }
    return {VerificationStatus::Partial,
            "exit code 0; test pass markers were not confidently detected"};
}

VerificationResult verify_build(const VerificationInput& input,
                                const std::string& combined) {
    // Filesystem side effects outrank log text.
    if (const auto artifact =
            detect_build_artifact(input.sandbox_repo_path, input.command_started_at)) {
        return {VerificationStatus::Verified,
                "build artifact detected: " + artifact.value()};
    }
    if (contains_any(combined, {"built", "compiled", "bundle", "generated", "transpil"})) {
        return {VerificationStatus::Partial,
                "build-like log signal detected, but artifact verification was inconclusive"};
    }
    return {VerificationStatus::Partial,
            "exit code 0; no build artifact or strong build log signal detected"};
}

VerificationResult verify_start(const VerificationInput& input,
                                const std::string& combined) {
    auto port = detect_port(input.stdout_text);
    if (!port.has_value()) {
        port = detect_port(input.stderr_text);
    }
    if (port.has_value()) {
        return {VerificationStatus::Verified,
                "listening signal detected on port " + port.value()};
    }
    if (contains_any(combined, {"listening", "ready", "started", "running on"})) {
        return {VerificationStatus::Partial,
                "startup-like log signal detected without explicit port evidence"};
    }
    return {VerificationStatus::Partial,
            "exit code 0; no listening/ready signal was detected"};
}

VerificationResult verify_lint(const std::string& combined) {
    if (contains_any(combined, {"0 error", "no issue", "lint passed"})) {
        return {VerificationStatus::Verified, "lint success signal detected in logs"};
    }
    return {VerificationStatus::Partial,
            "exit code 0; lint success markers were not clearly detected"};
}

}  // namespace

std::optional<std::string> detect_port(const std::string& output) {
    // Linear scans; output may be hundreds of KB of whitespace or digits.
    const std::string text = lowercase(output);
    if (auto port = address_port(text)) {
        return port;
    }
    if (auto port = listening_port(text)) {
        return port;
    }
    return bare_port(text);
}

std::optional<std::string> detect_build_artifact(
    const std::filesystem::path& repo_path,
    const std::filesystem::file_time_type started_at) {
    static const char* const kCandidates[] = {"dist", "build", "out", ".next", "target"};
    const auto threshold = started_at - std::chrono::seconds(1);

    for (const char* candidate : kCandidates) {
        const auto path = repo_path / candidate;
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec) || ec) {
            continue;
        }
        const auto modified = std::filesystem::last_write_time(path, ec);
        if (ec) {
            continue;
        }
        if (modified >= threshold) {
            return std::string(candidate) + "/";
        }
    }
    return std::nullopt;
}

VerificationResult verify_execution(const VerificationInput& input) {
    if (!input.success) {
        return failed_result(input);
    }

    if (input.step == CommandStep::Start && input.help_mode) {
        return {VerificationStatus::Partial,
                "help output only; runtime startup was not verified"};
    }

    const std::string combined =
        lowercase(input.stderr_text + "\n" + input.stdout_text);

    switch (input.step) {
        case CommandStep::Install:
            return verify_install(combined);
        case CommandStep::Test:
            return verify_test(combined);
        case CommandStep::Build:
            return verify_build(input, combined);
        case CommandStep::Start:
            return verify_start(input, combined);
        case CommandStep::Lint:
            return verify_lint(combined);
        case CommandStep::Run:
        default:
            return {VerificationStatus::Partial,
                    "command exited successfully; no dedicated verifier for this step"};
    }
}

}  // namespace tryrun::verify
