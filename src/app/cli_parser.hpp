#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/tryrun_errors.hpp"

namespace tryrun::app::cli {

    inline constexpr std::uint32_t kMinTimeoutSeconds = 5;
    inline constexpr std::uint32_t kMaxTimeoutSeconds = 3600;
    inline constexpr std::size_t kMaxOutputCharsLimit = 10000000;

    tryrun::core::errors::Result<tryrun::protocol::TryRunRequest> parse_and_validate(int argc, char* argv[]);

    const char* usage();
}
