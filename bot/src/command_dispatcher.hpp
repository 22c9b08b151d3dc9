#ifndef COMMAND_DISPATCHER_HPP
#define COMMAND_DISPATCHER_HPP

#include "supervisor.hpp"
#include <string>
#include <vector>

struct CommandReply {
    bool ok = false;
    std::string text;
};

// Administrative commands from the operator channel
class CommandDispatcher {
public:
    explicit CommandDispatcher(Supervisor& supervisor);

    // `command` is matched case-insensitively, with an optional leading '!' or '/'
    CommandReply dispatch(const std::string& command, bool privileged);

    static bool requires_privilege(const std::string& command);
    static std::vector<std::string> commands();

private:
    static std::string normalize(const std::string& command);
    std::string help() const;

    Supervisor& supervisor_;
};

#endif // COMMAND_DISPATCHER_HPP
