#include <gtest/gtest.h>
#include <managers/bssh_service.hpp>
#include <ssh/session.hpp>
#include <core/utils.hpp>
#include <cstdlib>
#include <optional>
#include <unistd.h>

// End-to-end checks against a real SSH server. Set BSSH_TEST_HOST and
// optionally BSSH_TEST_USER (default $USER), BSSH_TEST_PORT, BSSH_TEST_KEY.
static std::optional<ConnectionParams> live_params() {
    const char* host = std::getenv("BSSH_TEST_HOST");
    const char* user = std::getenv("BSSH_TEST_USER");
    if (!user) user = std::getenv("USER");
    if (!host || !user) return std::nullopt;

    ConnectionParams p;
    p.host = host;
    p.username = user;
    if (const char* port = std::getenv("BSSH_TEST_PORT")) p.port = safe_stoi(port, 22);
    if (const char* key = std::getenv("BSSH_TEST_KEY")) p.identity_key_path = std::string(key);
    return p;
}

class LiveSession : public ::testing::Test {
protected:
    void SetUp() override {
        auto params = live_params();
        if (!params) GTEST_SKIP() << "BSSH_TEST_HOST not set";

        auto r = service.connect(*params);
        ASSERT_TRUE(r.is_ok()) << describe_error(r);
        scratch = "/tmp/bssh_live_" + std::to_string(::getpid());
    }

    void TearDown() override {
        if (service.is_connected()) {
            auto cleanup = service.exec("rm -rf " + shell_escape(scratch));
            (void)cleanup;
            service.disconnect();
        }
    }

    BsshService service;
    std::string scratch;
};

TEST_F(LiveSession, ListRootHasNoParent) {
    auto r = service.list("/");
    ASSERT_TRUE(r.is_ok()) << describe_error(r);
    for (const auto& e : r.value) EXPECT_NE(e.name, "..");
}

TEST_F(LiveSession, ExecReportsExitCode) {
    auto ok = service.exec("echo hello");
    ASSERT_TRUE(ok.is_ok()) << describe_error(ok);
    EXPECT_NE(ok.value.stdout_data.find("hello"), std::string::npos);

    auto failed = service.exec("exit 3");
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.kind, ErrorKind::CommandFailed);
    EXPECT_EQ(failed.value.exit_code, 3);
}

TEST_F(LiveSession, DirectoryLifecycle) {
    ASSERT_TRUE(service.make_directory(scratch).is_ok());
    ASSERT_TRUE(service.write_text(scratch + "/a.txt", "live\n").is_ok());
    ASSERT_TRUE(service.rename(scratch + "/a.txt", scratch + "/b.txt").is_ok());

    auto listing = service.list(scratch);
    ASSERT_TRUE(listing.is_ok());
    bool found = false;
    for (const auto& e : listing.value) {
        if (e.name == "b.txt") {
            found = true;
            EXPECT_EQ(e.size, 5u);
        }
        EXPECT_NE(e.name, "a.txt");
    }
    EXPECT_TRUE(found);

    auto text = service.read_text(scratch + "/b.txt");
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value, "live\n");

    EXPECT_TRUE(service.remove_directory(scratch).is_err());
    ASSERT_TRUE(service.remove_file(scratch + "/b.txt").is_ok());
    ASSERT_TRUE(service.remove_directory(scratch).is_ok());
}

TEST_F(LiveSession, StatusLineNamesEndpoint) {
    EXPECT_NE(service.status_line().find(service.params().host), std::string::npos);
}

TEST_F(LiveSession, InvalidatedSessionFailsChannelIo) {
    auto session = Session::connect(*live_params());
    ASSERT_TRUE(session.is_ok()) << describe_error(session);
    auto channel = session.value->open_channel(ExecRequest{"sleep 2; echo late", PtyOptions()});
    ASSERT_TRUE(channel.is_ok()) << describe_error(channel);

    session.value->invalidate("no activity for 300s");

    char buf[64];
    int n = channel.value->try_read(buf, sizeof(buf));
    EXPECT_TRUE(Session::is_transport_error(n)) << "rc=" << n;
    n = channel.value->try_read_stderr(buf, sizeof(buf));
    EXPECT_TRUE(Session::is_transport_error(n)) << "rc=" << n;
    EXPECT_TRUE(channel.value->eof());

    auto w = channel.value->write_all("x", 1);
    ASSERT_TRUE(w.is_err());
    EXPECT_EQ(w.kind, ErrorKind::Transport);

    auto again = session.value->open_channel(FileTransferRequest{});
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::Transport);
}

TEST_F(LiveSession, ListingUsesSeveralChannels) {
    ASSERT_TRUE(service.make_directory(scratch).is_ok());
    for (int i = 0; i < 20; i++) {
        ASSERT_TRUE(service.write_text(scratch + "/f" + std::to_string(i), "x").is_ok());
    }
    auto r = service.list(scratch);
    ASSERT_TRUE(r.is_ok()) << describe_error(r);
    EXPECT_EQ(r.value.size(), 21u);
    for (const auto& e : r.value) {
        if (e.name != "..") EXPECT_EQ(e.size, 1u) << e.name;
    }
}
