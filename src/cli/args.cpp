#include "args.hpp"
#include <core/utils.hpp>
#include <managers/connection_store.hpp>

Result<CliArgs> parse_args(const std::vector<std::string>& argv) {
    CliArgs args;
    std::vector<std::string> positional;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& a = argv[i];

        auto next_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argv.size()) {
                return Result<std::string>::Err(ErrorKind::InvalidArgument, flag + " requires a value");
            }
            return Result<std::string>::Ok(argv[++i]);
        };

        if (a == "--version" || a == "-V") {
            args.show_version = true;
        } else if (a == "--help" || a == "-h") {
            args.show_help = true;
        } else if (a == "-i" || a == "--identity") {
            auto v = next_value(a);
            if (v.is_err()) return Result<CliArgs>::From(v);
            args.identity_file = v.value;
        } else if (a == "-p" || a == "--port") {
            auto v = next_value(a);
            if (v.is_err()) return Result<CliArgs>::From(v);
            int port = safe_stoi(v.value, -1);
            if (port <= 0 || port > 65535) {
                return Result<CliArgs>::Err(ErrorKind::InvalidArgument,
                                            "Invalid port number: " + v.value);
            }
            args.port = port;
        } else if (a == "--save") {
            auto v = next_value(a);
            if (v.is_err()) return Result<CliArgs>::From(v);
            args.save_name = v.value;
        } else if (a == "--forget") {
            auto v = next_value(a);
            if (v.is_err()) return Result<CliArgs>::From(v);
            args.forget_name = v.value;
        } else if (a.size() > 1 && a[0] == '-') {
            return Result<CliArgs>::Err(ErrorKind::InvalidArgument, "Unknown option: " + a);
        } else {
            positional.push_back(a);
        }
    }

    if (positional.size() > 2) {
        return Result<CliArgs>::Err(ErrorKind::InvalidArgument,
                                    "Unexpected argument: " + positional[2]);
    }
    if (!positional.empty()) args.destination = positional[0];
    if (positional.size() == 2) args.path = positional[1];

    if (!args.save_name.empty() && args.destination.empty()) {
        return Result<CliArgs>::Err(ErrorKind::InvalidArgument, "--save needs a destination");
    }
    if (!args.forget_name.empty() && (!args.destination.empty() || !args.save_name.empty())) {
        return Result<CliArgs>::Err(ErrorKind::InvalidArgument,
                                    "--forget cannot be combined with a destination");
    }
    return Result<CliArgs>::Ok(args);
}

Result<ConnectionParams> resolve_destination(const CliArgs& args, const ConnectionStore& store,
                                             int default_port,
                                             const std::string& default_identity) {
    ConnectionParams params;

    auto saved = store.find(args.destination);
    if (saved) {
        params = saved->to_params();
    } else {
        auto parsed = parse_destination(args.destination, default_port);
        if (parsed.is_err()) return parsed;
        params = parsed.value;
    }

    if (args.port) params.port = *args.port;
    if (!args.identity_file.empty()) {
        params.identity_key_path = args.identity_file;
    } else if (!params.identity_key_path && !default_identity.empty()) {
        params.identity_key_path = default_identity;
    }
    return Result<ConnectionParams>::Ok(params);
}

Result<void> forget_saved_connection(const CliArgs& args, const ConnectionStore& store) {
    if (args.forget_name.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "No connection name given");
    }
    return store.remove(args.forget_name);
}
