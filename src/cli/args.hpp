#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

class ConnectionStore;

// bssh [DESTINATION] [PATH] [-i FILE] [-p PORT] [--save NAME]
// bssh --forget NAME
// bssh --version | --help
struct CliArgs {
    std::string destination;        // saved name or [user@]host[:port]
    std::string path;               // initial remote directory
    std::string identity_file;
    std::optional<int> port;
    std::string save_name;
    std::string forget_name;        // delete this saved connection and exit
    bool show_version = false;
    bool show_help = false;
};

Result<CliArgs> parse_args(const std::vector<std::string>& argv);

// Destination -> params. A saved connection name wins over host parsing;
// -p and -i override whatever the destination says.
// --forget NAME: drop the entry from the store
Result<void> forget_saved_connection(const CliArgs& args, const ConnectionStore& store);

Result<ConnectionParams> resolve_destination(const CliArgs& args, const ConnectionStore& store,
                                             int default_port,
                                             const std::string& default_identity);
