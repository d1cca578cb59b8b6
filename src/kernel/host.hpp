#pragma once
#include <string>
#include <vector>

namespace pocket::kernel {

struct HostPart {
    std::string type;       // "text" or "tool"
    std::string text;       // Text, or the title of a tool part
    std::string tool;       // Tool name for tool parts
};

struct HostMessage {
    std::string id;
    std::string role;       // "user" or "assistant"
    std::vector<HostPart> parts;
};

struct HostStatus {
    bool success = false;
    std::string error;
};

struct CreateSessionResult {
    bool success = false;
    std::string error;
    std::string session_id;
};

struct ParentResult {
    bool success = false;
    std::string error;
    std::string parent_id;  // Empty for a top-level session
};

struct MessagesResult {
    bool success = false;
    std::string error;
    std::vector<HostMessage> messages;
};

// Session API of the host that runs the agents. Implementations must be
// callable from any thread; prompt() blocks until the session's turn ends.
class SessionHost {
public:
    virtual ~SessionHost() = default;

    virtual CreateSessionResult create_session(const std::string& parent_id, const std::string& title) = 0;
    virtual ParentResult get_parent(const std::string& session_id) = 0;
    virtual MessagesResult list_messages(const std::string& session_id) = 0;
    virtual HostStatus prompt(const std::string& session_id, const std::string& text) = 0;

    // Store a message without starting a turn. synthetic hides it from the user.
    virtual HostStatus persist(const std::string& session_id, const std::string& text, bool synthetic) = 0;

    // Store a line that is neither shown to the model nor to the user
    virtual HostStatus notify(const std::string& session_id, const std::string& text) = 0;
};

} // namespace pocket::kernel
