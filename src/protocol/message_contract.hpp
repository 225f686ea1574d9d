#pragma once
#include <string>
#include <vector>

namespace harbor::protocol {

    enum class Role {
        User,
        Assistant,
        System
    };

    // One turn of the conversation as the backend sees it.
    struct Message {
        Role role;
        std::string content;
    };

    using ConversationHistory = std::vector<Message>;

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:      return "user";
            case Role::Assistant: return "assistant";
            case Role::System:    return "system";
            default: return "unknown";
        }
    }

} // namespace harbor::protocol
