#include "command_dispatcher.hpp"
#include "logger.hpp"
#include "util.hpp"

CommandDispatcher::CommandDispatcher(Supervisor& supervisor)
    : supervisor_(supervisor) {
}

std::string CommandDispatcher::normalize(const std::string& command) {
    std::string c = util::to_lower(util::trim(command));
    if (!c.empty() && (c[0] == '!' || c[0] == '/')) {
        c = c.substr(1);
    }
    return c;
}

std::vector<std::string> CommandDispatcher::commands() {
    return {"kill", "stop", "restart", "position", "status", "health", "performance", "ping", "command"};
}

bool CommandDispatcher::requires_privilege(const std::string& command) {
    std::string c = normalize(command);
    return c == "kill" || c == "stop" || c == "restart";
}

std::string CommandDispatcher::help() const {
    return "Commands:\n"
           "kill - close all positions (admin)\n"
           "stop - close all positions and stop the system (admin)\n"
           "restart - restart the system (admin)\n"
           "position - open positions\n"
           "status - system status\n"
           "health - run a health check\n"
           "performance - trading performance\n"
           "ping - liveness check\n"
           "command - this list";
}

CommandReply CommandDispatcher::dispatch(const std::string& command, bool privileged) {
    CommandReply reply;
    std::string c = normalize(command);

    if (requires_privilege(c) && !privileged) {
        LOG_WARNING("Refused privileged command '" + c + "' from unprivileged caller");
        reply.text = "Permission denied: '" + c + "' requires administrator rights";
        return reply;
    }

    LOG_INFO("Command: " + c);

    if (c == "kill") {
        CloseAllResult result = supervisor_.emergency_close("operator kill command");
        reply.ok = result.success;
        reply.text = result.success ? "All positions closed (" + std::to_string(result.outcomes.size()) + ")"
                                    : "Emergency close incomplete: " + result.error;
    } else if (c == "stop") {
        supervisor_.full_stop("operator stop command");
        reply.ok = true;
        reply.text = "System stopping";
    } else if (c == "restart") {
        reply.ok = supervisor_.auto_restart("operator restart command");
        reply.text = reply.ok ? "Restarting" : "Restart refused or failed";
    } else if (c == "position") {
        reply.ok = true;
        reply.text = supervisor_.positions_report();
    } else if (c == "status") {
        reply.ok = true;
        reply.text = supervisor_.status_report();
    } else if (c == "health") {
        reply.ok = true;
        reply.text = supervisor_.health_report();
    } else if (c == "performance") {
        reply.ok = true;
        reply.text = supervisor_.performance_report();
    } else if (c == "ping") {
        reply.ok = true;
        reply.text = "pong";
    } else if (c == "command") {
        reply.ok = true;
        reply.text = help();
    } else {
        reply.text = "Unknown command: '" + c + "'. Send 'command' for the list.";
    }
    return reply;
}
