#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <ctime>
#include <fmt/format.h>

static std::string format_mtime(const std::optional<int64_t>& mtime) {
    if (!mtime) return "-";
    std::time_t t = static_cast<std::time_t>(*mtime);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

static void print_listing(const std::vector<FileEntry>& entries, int selected) {
    int index = 0;
    for (const auto& e : entries) {
        std::string marker = index == selected ? theme::teal(">") : " ";
        std::string name = e.is_dir ? theme::blue(e.name + "/") : e.name;
        std::string size = e.is_dir ? "-" : format_size(e.size);
        std::cout << fmt::format("  {} {:>4}  {:>10}  {:<16}  ", marker, index, size,
                                 format_mtime(e.modified))
                  << name << "\n";
        index++;
    }
    if (entries.empty()) std::cout << theme::dim("    (empty)") << "\n";
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    std::string path = cli.resolve_remote(args.empty() ? "" : args[0]);

    auto result = cli.service->list(path);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    print_listing(result.value, path == cli.cwd ? cli.selected_index : -1);
}

static void do_cd(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    std::string target = cli.resolve_remote(args.empty() ? "/" : args[0]);

    // Listing doubles as the existence check
    auto result = cli.service->list(target);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    cli.cwd = target;
    cli.selected_index = 0;
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.empty() || args.size() > 2) {
        std::cout << theme::step("Usage: get <remote> [local]");
        return;
    }
    std::string remote = cli.resolve_remote(args[0]);
    std::string local = args.size() == 2 ? args[1] : base_name(remote);

    auto result = cli.service->download(remote, local);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    std::cout << theme::ok(fmt::format("{} -> {} ({})", remote, local, format_size(result.value)));
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.empty() || args.size() > 2) {
        std::cout << theme::step("Usage: put <local> [remote]");
        return;
    }
    std::string local = args[0];
    std::string remote = cli.resolve_remote(args.size() == 2 ? args[1] : base_name(local));

    auto result = cli.service->upload(local, remote);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    std::cout << theme::ok(fmt::format("{} -> {} ({})", local, remote, format_size(result.value)));
}

// rm / rmdir / mkdir share one shape: one path, one remote call
template <typename Op>
static void single_path_op(BaseCLI& cli, const std::string& arg, const char* usage,
                           const char* verb, Op op) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cout << theme::step(usage);
        return;
    }
    std::string path = cli.resolve_remote(args[0]);
    auto result = op(path);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    std::cout << theme::ok(fmt::format("{} {}", verb, path));
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    single_path_op(cli, arg, "Usage: rm <file>", "Deleted",
                   [&](const std::string& p) { return cli.service->remove_file(p); });
}

static void do_rmdir(BaseCLI& cli, const std::string& arg) {
    single_path_op(cli, arg, "Usage: rmdir <directory>", "Removed",
                   [&](const std::string& p) { return cli.service->remove_directory(p); });
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    single_path_op(cli, arg, "Usage: mkdir <directory>", "Created",
                   [&](const std::string& p) { return cli.service->make_directory(p); });
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 2) {
        std::cout << theme::step("Usage: mv <old> <new>");
        return;
    }
    std::string from = cli.resolve_remote(args[0]);
    std::string to = cli.resolve_remote(args[1]);
    auto result = cli.service->rename(from, to);
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    std::cout << theme::ok(fmt::format("Renamed {} -> {}", from, to));
}

static void do_cat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cout << theme::step("Usage: cat <file>");
        return;
    }
    auto result = cli.service->read_text(cli.resolve_remote(args[0]));
    if (result.is_err()) {
        cli.report(result);
        return;
    }
    std::cout << result.value;
    if (!result.value.empty() && result.value.back() != '\n') std::cout << "\n";
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a directory (default: current)");
    cli.add_command("cd", do_cd, "Change directory (.. for parent)");
    cli.add_command("cat", do_cat, "Print a remote file");
    cli.add_command("get", do_get, "Download <remote> [local]");
    cli.add_command("put", do_put, "Upload <local> [remote]");
    cli.add_command("rm", do_rm, "Delete a file");
    cli.add_command("rmdir", do_rmdir, "Delete an empty directory");
    cli.add_command("mkdir", do_mkdir, "Create a directory");
    cli.add_command("mv", do_mv, "Rename <old> <new>");
}
