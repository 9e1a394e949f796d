#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "OK";
        case ErrorKind::Transport:       return "Transport error";
        case ErrorKind::Auth:            return "Authentication error";
        case ErrorKind::ChannelSetup:    return "Channel setup error";
        case ErrorKind::RemoteOperation: return "Remote error";
        case ErrorKind::LocalIo:         return "Local I/O error";
        case ErrorKind::CommandFailed:   return "Command failed";
        case ErrorKind::ShellTerminated: return "Shell terminated";
        case ErrorKind::ShellBusy:       return "Shell busy";
        case ErrorKind::InvalidArgument: return "Invalid argument";
        case ErrorKind::Config:          return "Config error";
    }
    return "Error";
}

const char* setup_step_name(SetupStep step) {
    switch (step) {
        case SetupStep::None:      return "none";
        case SetupStep::Open:      return "channel open";
        case SetupStep::Pty:       return "pty request";
        case SetupStep::Subsystem: return "subsystem negotiation";
        case SetupStep::Exec:      return "exec request";
    }
    return "unknown";
}

std::string ConnectionParams::display_name() const {
    return fmt::format("{}@{}:{}", username, host, port);
}
