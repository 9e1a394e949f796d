#include "base_cli.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

void print_failure(const std::string& line) {
    std::cout << theme::fail(line);
}

std::vector<std::string> split_args(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_word = false;
    char quote = 0;

    for (char c : line) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur += c;
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                out.push_back(cur);
                cur.clear();
                in_word = false;
            }
        } else {
            cur += c;
            in_word = true;
        }
    }
    if (in_word) out.push_back(cur);
    return out;
}

BaseCLI::BaseCLI(Config config) : config(std::move(config)) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_connection() {
    if (!service || !service->is_connected()) {
        std::cout << theme::fail("Not connected.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Browse",   {"ls", "cd", "cat"}},
        {"Transfer", {"get", "put"}},
        {"Modify",   {"rm", "rmdir", "mkdir", "mv"}},
        {"Shell",    {"shell", "exec"}},
        {"General",  {"status", "help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::resolve_remote(const std::string& arg) const {
    if (arg.empty()) return cwd;
    if (arg[0] == '/') return normalize_remote_path(arg);
    return normalize_remote_path(join_remote_path(cwd, arg));
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::TEAL) + "bssh" + rl_esc(theme::color::RESET);
    if (service && service->is_connected()) {
        const auto& p = service->params();
        prompt += ":" + rl_esc(theme::color::BLUE) + p.username + "@" + p.host
                + rl_esc(theme::color::RESET) + ":" + cwd;
    }
    return prompt + "> ";
}
