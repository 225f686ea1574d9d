#pragma once
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace harbor::protocol {

    // Transport to a text-generation backend. `history` holds the turns that
    // precede `prompt`; implementations must not retain references to it.
    class Backend {
    public:
        virtual ~Backend() = default;

        virtual std::string name() const = 0;

        virtual core::errors::Result<std::string> send(
            const std::string& prompt, const ConversationHistory& history) = 0;
    };

} // namespace harbor::protocol
