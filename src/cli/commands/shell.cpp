#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    if (arg.empty()) {
        std::cout << theme::step("Usage: exec <command>");
        return;
    }
    auto result = cli.service->exec(arg);
    if (result.is_err() && result.kind != ErrorKind::CommandFailed) {
        cli.report(result);
        return;
    }
    std::cout << result.value.stdout_data;
    if (!result.value.stderr_data.empty()) {
        std::cerr << result.value.stderr_data;
    }
    if (result.is_err()) {
        std::cout << theme::fail("Exit code " + std::to_string(result.value.exit_code));
    }
}

static void do_shell(BaseCLI& cli, const std::string& arg) {
    if (!cli.service) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    bool resuming = cli.service->has_shell();
    std::cout << theme::dim(resuming ? "    Resuming shell (Ctrl-S returns to the browser)..."
                                     : "    Starting shell (Ctrl-S returns to the browser)...")
              << "\n" << std::flush;

    auto result = cli.service->shell(cli.cwd);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    if (result.value == ForwardOutcome::Detached) {
        std::cout << theme::info("Back in the browser. 'shell' resumes the same session.");
    } else {
        std::cout << theme::info("Shell exited.");
    }
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command on the remote host");
    cli.add_command("shell", do_shell, "Open or resume the interactive shell");
}
