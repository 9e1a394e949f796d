#include <iostream>
#include <vector>
#include <string>
#include "cli/bssh_cli.hpp"
#include "cli/theme.hpp"
#include <core/log.hpp>

void print_usage() {
    std::cout << theme::banner(BSSH_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    bssh "
              << theme::color::RESET << "[user@]host[:port] [path]"
              << theme::color::DIM << "   Connect and browse" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    bssh "
              << theme::color::RESET << "<saved-name> [path]"
              << theme::color::DIM << "         Connect to a saved entry" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    bssh"
              << theme::color::DIM << "                             Pick from saved connections"
              << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    -i, --identity FILE   Private key (default ~/.ssh/id_rsa)\n"
              << "    -p, --port PORT       SSH port\n"
              << "    --save NAME           Save the destination under NAME\n"
              << "    --forget NAME         Delete the saved connection NAME\n"
              << "    -V, --version         Show version\n"
              << "    -h, --help            Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> argv_list(argv + 1, argv + argc);
        auto parsed = parse_args(argv_list);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            std::cout << theme::step("Run 'bssh --help' for usage.");
            return 2;
        }
        const CliArgs& args = parsed.value;

        if (args.show_version) {
            std::cout << theme::color::BLUE << theme::color::BOLD << "bssh"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << BSSH_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (args.show_help) {
            print_usage();
            return 0;
        }

        if (!global_config_exists()) {
            auto created = create_default_global_config();
            if (created.is_err()) bssh_log_error("create default config", created);
        }

        Config config;
        auto loaded = Config::load_global();
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            std::cout << theme::step("Continuing with default settings.");
        } else {
            config = loaded.value;
        }
        bssh_log_configure(config.log().enabled, config.log().path);

        BsshCLI cli(config);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
