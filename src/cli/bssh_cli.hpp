#pragma once

#include "base_cli.hpp"
#include "args.hpp"
#include <optional>
#include <string>
#include <managers/connection_store.hpp>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);

class BsshCLI : public BaseCLI {
public:
    explicit BsshCLI(Config config = Config());

    // Connect, restore the browser position, and run the REPL until quit,
    // EOF, or the session is lost. Returns the process exit code.
    int run(const CliArgs& args);

private:
    void register_all_commands();

    // No destination on the command line: pick a saved connection
    std::optional<ConnectionParams> choose_saved_connection();

    // Delete a saved connection; exit code
    int forget(const CliArgs& args);

    bool connect(const ConnectionParams& params);
    void restore_position(const std::string& path_arg);
    void save_position();
    void repl();

    ConnectionStore store_;
};
