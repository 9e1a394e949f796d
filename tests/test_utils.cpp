#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>
#include <ssh/channel.hpp>
#include <cstdlib>

TEST(Utils, JoinRemotePath) {
    EXPECT_EQ(join_remote_path("/", "etc"), "/etc");
    EXPECT_EQ(join_remote_path("/home/u", "a.txt"), "/home/u/a.txt");
    EXPECT_EQ(join_remote_path("/home/u/", "a.txt"), "/home/u/a.txt");
    EXPECT_EQ(join_remote_path("", "a.txt"), "a.txt");
}

TEST(Utils, RemoteParentPath) {
    EXPECT_EQ(remote_parent_path("/"), "/");
    EXPECT_EQ(remote_parent_path(""), "/");
    EXPECT_EQ(remote_parent_path("/etc"), "/");
    EXPECT_EQ(remote_parent_path("/home/u/docs"), "/home/u");
    EXPECT_EQ(remote_parent_path("/home/u/docs/"), "/home/u");
}

TEST(Utils, NormalizeRemotePath) {
    EXPECT_EQ(normalize_remote_path("/a/b/../x"), "/a/x");
    EXPECT_EQ(normalize_remote_path("/a/./b/"), "/a/b");
    EXPECT_EQ(normalize_remote_path("//srv//www"), "/srv/www");
    EXPECT_EQ(normalize_remote_path("/.."), "/");
    EXPECT_EQ(normalize_remote_path("/a/../../b"), "/b");
    EXPECT_EQ(normalize_remote_path("relative/dir"), "/relative/dir");
    EXPECT_EQ(normalize_remote_path(""), "/");
    EXPECT_EQ(normalize_remote_path("/"), "/");
}

TEST(Utils, BaseName) {
    EXPECT_EQ(base_name("/var/log/syslog"), "syslog");
    EXPECT_EQ(base_name("/var/log/"), "log");
    EXPECT_EQ(base_name("notes.txt"), "notes.txt");
}

TEST(Utils, ShellEscape) {
    EXPECT_EQ(shell_escape("/home/u"), "'/home/u'");
    EXPECT_EQ(shell_escape("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_escape(""), "''");
}

TEST(Utils, LoginShellCommandQuotesDirectory) {
    EXPECT_EQ(login_shell_command("/srv/my dir"), "cd '/srv/my dir' && exec $SHELL -l");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("42x", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

TEST(Utils, FormatSize) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.5 KiB");
    EXPECT_EQ(format_size(5ULL * 1024 * 1024), "5.0 MiB");
}

TEST(Utils, ParseDestinationFull) {
    auto r = parse_destination("alice@example.org:2222");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.username, "alice");
    EXPECT_EQ(r.value.host, "example.org");
    EXPECT_EQ(r.value.port, 2222);
}

TEST(Utils, ParseDestinationDefaults) {
    setenv("USER", "bob", 1);
    auto r = parse_destination("example.org", 2200);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.username, "bob");
    EXPECT_EQ(r.value.port, 2200);
}

TEST(Utils, ParseDestinationRejectsBadInput) {
    EXPECT_EQ(parse_destination("").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(parse_destination("host:0").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(parse_destination("host:99999").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(parse_destination("alice@").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(parse_destination("@host").kind, ErrorKind::InvalidArgument);
}

TEST(Types, DescribeErrorNamesSetupStep) {
    auto r = Result<int>::SetupErr(SetupStep::Pty, "Failed to request PTY");
    EXPECT_EQ(r.kind, ErrorKind::ChannelSetup);
    EXPECT_EQ(describe_error(r), "Channel setup error (pty request): Failed to request PTY");
}

TEST(Types, FromKeepsKindAndStep) {
    auto inner = Result<int>::SetupErr(SetupStep::Subsystem, "no sftp");
    auto outer = Result<std::string>::From(inner);
    EXPECT_TRUE(outer.is_err());
    EXPECT_EQ(outer.kind, ErrorKind::ChannelSetup);
    EXPECT_EQ(outer.step, SetupStep::Subsystem);
    EXPECT_EQ(outer.error, "no sftp");
}

TEST(Types, FailedCommandKeepsOutput) {
    SSHResult partial{2, "out", "err"};
    auto r = Result<SSHResult>::Err(ErrorKind::CommandFailed, "Command exited with code 2", partial);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.value.exit_code, 2);
    EXPECT_EQ(r.value.stdout_data, "out");
}

TEST(ChannelRequest, KindFollowsRequest) {
    EXPECT_EQ(request_kind(FileTransferRequest{}), ChannelKind::FileTransferSubsystem);

    ExecRequest exec;
    exec.command = "uptime";
    EXPECT_EQ(request_kind(exec), ChannelKind::OneShotExec);

    ShellRequest shell;
    shell.initial_directory = "/tmp";
    EXPECT_EQ(request_kind(shell), ChannelKind::InteractiveShell);
}
