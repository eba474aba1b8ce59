#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include "protocol/run_execution_contract.hpp"

namespace tryrun::protocol {

    // Fields shared by every command lifecycle event. index is 1-based and
    // counts only authorized commands, as does total.
    struct CommandEventHeader {
        std::size_t index = 0;
        std::size_t total = 0;
        CommandStep step = CommandStep::Run;
        std::string command_text;
        std::string note;
    };

    struct CommandStartEvent {
        CommandEventHeader header;
    };

    struct CommandProgressEvent {
        CommandEventHeader header;
        std::int64_t elapsed_seconds = 1;
    };

    struct CommandEndEvent {
        CommandEventHeader header;
        std::int64_t elapsed_seconds = 0;
        std::optional<int> exit_code;
        bool timed_out = false;
        VerificationStatus verification_status = VerificationStatus::Skipped;
    };

    struct CommandFallbackEvent {
        CommandEventHeader header;
        bool timed_out = false;
    };

    // A try-run emits exactly one of these per notification. The UI layer
    // subscribes through a CommandEventSink; the executor never renders.
    using RunCommandEvent = std::variant<
        CommandStartEvent,
        CommandProgressEvent,
        CommandEndEvent,
        CommandFallbackEvent
    >;

    using CommandEventSink = std::function<void(const RunCommandEvent&)>;

    inline const CommandEventHeader& header_of(const RunCommandEvent& event) {
        return std::visit(
            [](const auto& e) -> const CommandEventHeader& { return e.header; },
            event);
    }

} // namespace tryrun::protocol
