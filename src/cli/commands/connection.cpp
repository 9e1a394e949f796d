#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <iostream>

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults");
    }

    if (cli.service) {
        std::cout << theme::kv("Session", cli.service->status_line());
    } else {
        std::cout << theme::kv("Session", "not connected");
    }
    std::cout << theme::kv("Directory", cli.cwd);
    std::cout << theme::kv("Log", bssh_log_path());
    std::cout << "\n";
}

static void do_quit(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::dim("Disconnecting...") << "\n";
    cli.quit_requested = true;
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show connection and session status");
    cli.add_command("quit", do_quit, "Save position and exit");
    cli.add_command("exit", do_quit, "Save position and exit");
    cli.add_command("help", [](BaseCLI& c, const std::string&) { c.print_help(); },
                    "Show this help message");
}
