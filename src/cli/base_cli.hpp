#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <managers/bssh_service.hpp>

class BaseCLI {
public:
    explicit BaseCLI(Config config = Config());
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_connection();

    // Print one status line for a failed result
    template <typename T>
    void report(const Result<T>& r) const;

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Absolute, normalized remote path; relative args resolve against cwd
    // ("" -> cwd)
    std::string resolve_remote(const std::string& arg) const;

    // Public state
    Config config;
    std::unique_ptr<BsshService> service;
    std::string cwd = "/";
    int selected_index = 0;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

void print_failure(const std::string& line);

// Whitespace-separated words; single or double quotes group a word.
std::vector<std::string> split_args(const std::string& line);

template <typename T>
void BaseCLI::report(const Result<T>& r) const {
    if (r.is_err()) print_failure(describe_error(r));
}
