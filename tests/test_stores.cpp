#include <gtest/gtest.h>
#include <managers/connection_store.hpp>
#include <managers/session_state_store.hpp>
#include "fake_sftp_channel.hpp"

static SavedConnection make_saved(const std::string& name, const std::string& host) {
    SavedConnection c;
    c.name = name;
    c.host = host;
    c.port = 22;
    c.username = "ops";
    return c;
}

// ── ConnectionStore ────────────────────────────────────────────

TEST(ConnectionStore, MissingFileIsEmpty) {
    TempDir tmp;
    ConnectionStore store(tmp.path / "connections.yaml");
    auto r = store.load();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(ConnectionStore, AddFindRemove) {
    TempDir tmp;
    ConnectionStore store(tmp.path / "nested" / "connections.yaml");

    ASSERT_TRUE(store.add(make_saved("web", "web.example.org")).is_ok());
    ASSERT_TRUE(store.add(make_saved("db", "db.example.org")).is_ok());

    auto web = store.find("web");
    ASSERT_TRUE(web.has_value());
    EXPECT_EQ(web->host, "web.example.org");
    EXPECT_EQ(web->display_name(), "ops@web.example.org:22");
    EXPECT_FALSE(web->to_params().identity_key_path.has_value());

    ASSERT_TRUE(store.remove("web").is_ok());
    EXPECT_FALSE(store.find("web").has_value());
    EXPECT_TRUE(store.find("db").has_value());

    auto missing = store.remove("web");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::InvalidArgument);
}

TEST(ConnectionStore, AddReplacesSameName) {
    TempDir tmp;
    ConnectionStore store(tmp.path / "connections.yaml");

    ASSERT_TRUE(store.add(make_saved("box", "old.example.org")).is_ok());
    auto updated = make_saved("box", "new.example.org");
    updated.identity_file = "/keys/box";
    ASSERT_TRUE(store.add(updated).is_ok());

    auto all = store.load();
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value.size(), 1u);
    EXPECT_EQ(all.value[0].host, "new.example.org");
    EXPECT_EQ(*all.value[0].to_params().identity_key_path, "/keys/box");
}

TEST(ConnectionStore, EmptyNameRejected) {
    TempDir tmp;
    ConnectionStore store(tmp.path / "connections.yaml");
    EXPECT_EQ(store.add(make_saved("", "h")).kind, ErrorKind::InvalidArgument);
}

TEST(ConnectionStore, CorruptFileIsConfigError) {
    TempDir tmp;
    tmp.write("connections.yaml", "connections: [ {name: x");
    ConnectionStore store(tmp.path / "connections.yaml");
    auto r = store.load();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

// ── SessionStateStore ──────────────────────────────────────────

static ConnectionParams endpoint() {
    ConnectionParams p;
    p.host = "files.example.org";
    p.port = 2222;
    p.username = "alice";
    return p;
}

TEST(SessionStateStore, FileNamePerEndpoint) {
    EXPECT_EQ(SessionStateStore::file_name(endpoint()), "session_alice@files.example.org_2222.yaml");
}

TEST(SessionStateStore, NothingSavedGivesRoot) {
    TempDir tmp;
    SessionStateStore store(endpoint(), tmp.path);
    BrowserState s = store.load();
    EXPECT_EQ(s.current_path, "/");
    EXPECT_EQ(s.selected_index, 0);
    EXPECT_EQ(s.host, "files.example.org");
}

TEST(SessionStateStore, SaveThenLoad) {
    TempDir tmp;
    SessionStateStore store(endpoint(), tmp.path / "state");

    BrowserState s;
    s.host = "files.example.org";
    s.port = 2222;
    s.username = "alice";
    s.current_path = "/srv/data";
    s.selected_index = 5;
    ASSERT_TRUE(store.save(s).is_ok());

    BrowserState back = store.load();
    EXPECT_EQ(back.current_path, "/srv/data");
    EXPECT_EQ(back.selected_index, 5);
    EXPECT_FALSE(back.saved_at.empty());
}

TEST(SessionStateStore, EndpointsDoNotShareState) {
    TempDir tmp;
    SessionStateStore first(endpoint(), tmp.path);
    BrowserState s;
    s.current_path = "/only/here";
    ASSERT_TRUE(first.save(s).is_ok());

    ConnectionParams other = endpoint();
    other.port = 22;
    SessionStateStore second(other, tmp.path);
    EXPECT_EQ(second.load().current_path, "/");
}

TEST(SessionStateStore, CorruptFileFallsBackToDefaults) {
    TempDir tmp;
    tmp.write(SessionStateStore::file_name(endpoint()), "current_path: [oops");
    SessionStateStore store(endpoint(), tmp.path);
    BrowserState s = store.load();
    EXPECT_EQ(s.current_path, "/");
    EXPECT_EQ(s.selected_index, 0);
}
