#include "bssh_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/session_state_store.hpp>
#include <readline/readline.h>
#include <readline/history.h>

BsshCLI::BsshCLI(Config config) : BaseCLI(std::move(config)) {
    register_all_commands();
}

void BsshCLI::register_all_commands() {
    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_file_commands(*this);
    register_shell_commands(*this);
}

std::optional<ConnectionParams> BsshCLI::choose_saved_connection() {
    auto saved = store_.load();
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return std::nullopt;
    }
    if (saved.value.empty()) {
        std::cout << theme::fail("No destination given and no saved connections.");
        std::cout << theme::step("Usage: bssh [user@]host[:port] [path]");
        return std::nullopt;
    }

    std::cout << theme::section("Saved connections");
    for (size_t i = 0; i < saved.value.size(); i++) {
        const auto& c = saved.value[i];
        std::cout << "    " << theme::blue(std::to_string(i + 1) + ".") << " "
                  << c.name << theme::dim("  " + c.display_name()) << "\n";
    }
    std::cout << "\n";

    char* raw = readline("  Connect to: ");
    if (!raw) return std::nullopt;
    std::string choice = raw;
    free(raw);
    trim(choice);

    int n = safe_stoi(choice, 0);
    if (n >= 1 && static_cast<size_t>(n) <= saved.value.size()) {
        return saved.value[static_cast<size_t>(n) - 1].to_params();
    }
    for (const auto& c : saved.value) {
        if (c.name == choice) return c.to_params();
    }
    std::cout << theme::fail("No saved connection '" + choice + "'");
    return std::nullopt;
}

int BsshCLI::forget(const CliArgs& args) {
    auto removed = forget_saved_connection(args, store_);
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    std::cout << theme::ok("Forgot saved connection '" + args.forget_name + "'");
    return 0;
}

bool BsshCLI::connect(const ConnectionParams& params) {
    std::cout << theme::section("Connecting");
    service = std::make_unique<BsshService>(config);

    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    auto result = service->connect(params, callback);
    if (result.is_err()) {
        std::cout << theme::fail("Connection failed: " + describe_error(result));
        service.reset();
        return false;
    }
    std::cout << theme::ok("Connected to " + params.display_name());
    return true;
}

void BsshCLI::restore_position(const std::string& path_arg) {
    SessionStateStore states(service->params());
    BrowserState state = states.load();

    std::string start = normalize_remote_path(path_arg.empty() ? state.current_path : path_arg);

    // Saved directory may be gone since last time
    auto listing = service->list(start);
    if (listing.is_err()) {
        std::cout << theme::info("Cannot open " + start + ", starting at /");
        bssh_log_error("restore " + start, listing);
        start = "/";
        state.selected_index = 0;
    }
    cwd = start;
    selected_index = path_arg.empty() ? state.selected_index : 0;
    if (listing.is_ok() && selected_index >= static_cast<int>(listing.value.size())) {
        selected_index = 0;
    }
}

void BsshCLI::save_position() {
    if (!service) return;
    SessionStateStore states(service->params());
    BrowserState state;
    state.host = service->params().host;
    state.port = service->params().port;
    state.username = service->params().username;
    state.current_path = cwd;
    state.selected_index = selected_index;

    auto saved = states.save(state);
    if (saved.is_err()) bssh_log_error("save browser state", saved);
}

int BsshCLI::run(const CliArgs& args) {
    if (!args.forget_name.empty()) return forget(args);

    std::cout << theme::banner(BSSH_VERSION);

    std::optional<ConnectionParams> params;
    if (args.destination.empty()) {
        params = choose_saved_connection();
        if (!params) return 1;
    } else {
        auto resolved = resolve_destination(args, store_, config.connection().port,
                                            config.connection().identity_file);
        if (resolved.is_err()) {
            std::cout << theme::fail(resolved.error);
            return 1;
        }
        params = resolved.value;
    }

    if (!args.save_name.empty()) {
        SavedConnection entry;
        entry.name = args.save_name;
        entry.host = params->host;
        entry.port = params->port;
        entry.username = params->username;
        if (params->identity_key_path) entry.identity_file = *params->identity_key_path;
        auto added = store_.add(entry);
        if (added.is_err()) {
            std::cout << theme::fail("Could not save connection: " + added.error);
        } else {
            std::cout << theme::ok("Saved as '" + args.save_name + "'");
        }
    }

    if (!connect(*params)) return 1;
    restore_position(args.path);

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";
    repl();

    save_position();
    if (service) {
        service->disconnect();
        service.reset();
    }
    return 0;
}

void BsshCLI::repl() {
    std::string line;
    while (!quit_requested) {
        if (!service || !service->is_connected()) {
            std::cout << "\n" << theme::divider();
            std::cout << theme::fail("Connection lost.");
            if (service) std::cout << theme::dim("    " + service->status_line()) << "\n";
            std::cout << theme::step("Run 'bssh' again to reconnect.");
            std::cout << "\n";
            break;
        }

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);
        trim(line);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string rest;
        std::getline(iss, rest);
        trim(rest);

        execute_command(command, rest);
    }
}
