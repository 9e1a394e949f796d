#include <gtest/gtest.h>
#include <sftp/file_ops.hpp>
#include "fake_sftp_channel.hpp"

static std::vector<std::string> names_of(const std::vector<FileEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.name);
    return out;
}

static const FileEntry* find_entry(const std::vector<FileEntry>& entries, const std::string& name) {
    for (const auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

// ── Listing ────────────────────────────────────────────────────

TEST(ListDirectory, DirectoriesFirstThenByName) {
    TempDir tmp;
    tmp.write("home/zeta.txt", "zz");
    tmp.write("home/alpha.txt", "a");
    tmp.write("home/docs/readme", "");
    tmp.write("home/bin/tool", "");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/home");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(names_of(r.value),
              (std::vector<std::string>{"..", "bin", "docs", "alpha.txt", "zeta.txt"}));
}

TEST(ListDirectory, CarriesStatAttributes) {
    TempDir tmp;
    tmp.write("data/file.bin", std::string(1234, 'x'));
    tmp.write("data/sub/inner", "");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/data");
    ASSERT_TRUE(r.is_ok());

    const FileEntry* file = find_entry(r.value, "file.bin");
    ASSERT_NE(file, nullptr);
    EXPECT_FALSE(file->is_dir);
    EXPECT_EQ(file->size, 1234u);
    EXPECT_EQ(file->path, "/data/file.bin");
    EXPECT_TRUE(file->modified.has_value());

    const FileEntry* sub = find_entry(r.value, "sub");
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_dir);
    EXPECT_EQ(sub->path, "/data/sub");
}

TEST(ListDirectory, NoParentEntryAtRoot) {
    TempDir tmp;
    tmp.write("etc/hosts", "");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(find_entry(r.value, ".."), nullptr);
    EXPECT_EQ(find_entry(r.value, "."), nullptr);
    EXPECT_NE(find_entry(r.value, "etc"), nullptr);
}

TEST(ListDirectory, ParentEntryPointsAtParent) {
    TempDir tmp;
    tmp.write("a/b/c/file", "");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/a/b");
    ASSERT_TRUE(r.is_ok());
    const FileEntry* parent = find_entry(r.value, "..");
    ASSERT_NE(parent, nullptr);
    EXPECT_TRUE(parent->is_dir);
    EXPECT_EQ(parent->path, "/a");

    auto top = list_directory(sftp, "/a");
    ASSERT_TRUE(top.is_ok());
    parent = find_entry(top.value, "..");
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(parent->path, "/");
}

TEST(ListDirectory, EmptyDirectoryHasOnlyParent) {
    TempDir tmp;
    fs::create_directories(tmp.path / "empty");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/empty");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(names_of(r.value), (std::vector<std::string>{".."}));
}

TEST(ListDirectory, FailedStatBecomesEmptyFile) {
    TempDir tmp;
    tmp.write("srv/locked/secret", "");
    tmp.write("srv/big.log", std::string(500, 'l'));
    tmp.write("srv/ok.txt", "fine");
    FakeSftpChannel sftp(tmp.path);
    sftp.failing_stats = {"/srv/locked", "/srv/big.log"};

    auto r = list_directory(sftp, "/srv");
    ASSERT_TRUE(r.is_ok());

    const FileEntry* locked = find_entry(r.value, "locked");
    ASSERT_NE(locked, nullptr);
    EXPECT_FALSE(locked->is_dir);
    EXPECT_EQ(locked->size, 0u);
    EXPECT_FALSE(locked->modified.has_value());

    const FileEntry* big = find_entry(r.value, "big.log");
    ASSERT_NE(big, nullptr);
    EXPECT_EQ(big->size, 0u);

    const FileEntry* ok = find_entry(r.value, "ok.txt");
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(ok->size, 4u);

    // Only ".." is a directory now
    EXPECT_EQ(names_of(r.value),
              (std::vector<std::string>{"..", "big.log", "locked", "ok.txt"}));
}

TEST(ListDirectory, StatsEveryEntryOnce) {
    TempDir tmp;
    for (int i = 0; i < 40; i++) tmp.write("many/f" + std::to_string(i), "");
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/many", 8);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(sftp.stat_calls.load(), 40);
    EXPECT_EQ(r.value.size(), 41u);
}

TEST(ListDirectory, StatsRunConcurrently) {
    TempDir tmp;
    for (int i = 0; i < 8; i++) tmp.write("slow/f" + std::to_string(i), "");
    FakeSftpChannel sftp(tmp.path);
    sftp.stat_delay = std::chrono::milliseconds(100);

    auto start = std::chrono::steady_clock::now();
    auto r = list_directory(sftp, "/slow", 4);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_ok());
    EXPECT_GT(sftp.peak_in_flight(), 1);
    EXPECT_LE(sftp.peak_in_flight(), 4);
    EXPECT_LT(elapsed, std::chrono::milliseconds(800));
}

TEST(ListDirectory, ParallelismOfOneIsSequential) {
    TempDir tmp;
    for (int i = 0; i < 5; i++) tmp.write("seq/f" + std::to_string(i), "");
    FakeSftpChannel sftp(tmp.path);
    sftp.stat_delay = std::chrono::milliseconds(5);

    auto r = list_directory(sftp, "/seq", 1);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(sftp.peak_in_flight(), 1);
}

TEST(ListDirectory, MissingDirectoryFails) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "/nope");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteOperation);
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(ListDirectory, EmptyPathRejected) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);

    auto r = list_directory(sftp, "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST(SortEntries, DirectoriesBeforeFiles) {
    std::vector<FileEntry> entries(4);
    entries[0].name = "b.txt";
    entries[1].name = "z";
    entries[1].is_dir = true;
    entries[2].name = "a.txt";
    entries[3].name = "..";
    entries[3].is_dir = true;

    sort_entries(entries);
    EXPECT_EQ(names_of(entries), (std::vector<std::string>{"..", "z", "a.txt", "b.txt"}));
}

// ── Transfers ──────────────────────────────────────────────────

TEST(Transfer, RoundTripAroundChunkBoundaries) {
    TempDir tmp;
    fs::create_directories(tmp.path / "remote");
    fs::create_directories(tmp.path / "local");
    FakeSftpChannel sftp(tmp.path / "remote");

    for (size_t size : {size_t(0), size_t(1), size_t(32767), size_t(32768), size_t(32769),
                        size_t(65536)}) {
        std::string content(size, '\0');
        for (size_t i = 0; i < size; i++) content[i] = static_cast<char>(i * 31 + 7);

        std::string name = "f" + std::to_string(size);
        tmp.write("local/" + name, content);

        auto up = upload_file(sftp, (tmp.path / "local" / name).string(), "/" + name);
        ASSERT_TRUE(up.is_ok()) << up.error;
        EXPECT_EQ(up.value, size);

        std::string back = (tmp.path / "local" / (name + ".back")).string();
        auto down = download_file(sftp, "/" + name, back);
        ASSERT_TRUE(down.is_ok()) << down.error;
        EXPECT_EQ(down.value, size);
        EXPECT_EQ(tmp.read("local/" + name + ".back"), content) << "size " << size;
    }
    EXPECT_LE(sftp.largest_write, TRANSFER_CHUNK_SIZE);
}

TEST(Transfer, ProgressReportsRunningTotal) {
    TempDir tmp;
    tmp.write("remote/data", std::string(70000, 'd'));
    FakeSftpChannel sftp(tmp.path / "remote");

    std::vector<uint64_t> seen;
    auto r = download_file(sftp, "/data", (tmp.path / "out").string(), TRANSFER_CHUNK_SIZE,
                           [&](uint64_t done) { seen.push_back(done); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(seen, (std::vector<uint64_t>{32768, 65536, 70000}));
}

TEST(Transfer, DirectionSelectsOperation) {
    TempDir tmp;
    tmp.write("remote/r.txt", "from remote");
    tmp.write("l.txt", "from local");
    FakeSftpChannel sftp(tmp.path / "remote");

    auto down = transfer(sftp, (tmp.path / "got.txt").string(), "/r.txt",
                         TransferDirection::Download);
    ASSERT_TRUE(down.is_ok());
    EXPECT_EQ(tmp.read("got.txt"), "from remote");

    auto up = transfer(sftp, (tmp.path / "l.txt").string(), "/sent.txt",
                       TransferDirection::Upload);
    ASSERT_TRUE(up.is_ok());
    EXPECT_EQ(tmp.read("remote/sent.txt"), "from local");
}

TEST(Transfer, MissingRemoteFileFails) {
    TempDir tmp;
    fs::create_directories(tmp.path / "remote");
    FakeSftpChannel sftp(tmp.path / "remote");

    auto r = download_file(sftp, "/missing", (tmp.path / "out").string());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteOperation);
}

TEST(Transfer, MissingLocalFileFails) {
    TempDir tmp;
    fs::create_directories(tmp.path / "remote");
    FakeSftpChannel sftp(tmp.path / "remote");

    auto r = upload_file(sftp, (tmp.path / "missing").string(), "/x");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LocalIo);
    EXPECT_FALSE(fs::exists(tmp.path / "remote" / "x"));
}

TEST(Transfer, UnwritableLocalTargetFails) {
    TempDir tmp;
    tmp.write("remote/r", "x");
    FakeSftpChannel sftp(tmp.path / "remote");

    auto r = download_file(sftp, "/r", (tmp.path / "no" / "such" / "dir" / "r").string());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LocalIo);
}

TEST(Transfer, ZeroChunkSizeRejected) {
    TempDir tmp;
    tmp.write("remote/r", "x");
    FakeSftpChannel sftp(tmp.path / "remote");

    auto r = download_file(sftp, "/r", (tmp.path / "out").string(), 0);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

// ── Mutations ──────────────────────────────────────────────────

TEST(Mutations, RenameMovesFile) {
    TempDir tmp;
    tmp.write("tmp/a.txt", "payload");
    FakeSftpChannel sftp(tmp.path);

    ASSERT_TRUE(rename_path(sftp, "/tmp/a.txt", "/tmp/b.txt").is_ok());

    auto r = list_directory(sftp, "/tmp");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(find_entry(r.value, "a.txt"), nullptr);
    const FileEntry* b = find_entry(r.value, "b.txt");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->size, 7u);
}

TEST(Mutations, RenameMissingFails) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);
    auto r = rename_path(sftp, "/ghost", "/other");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteOperation);
}

TEST(Mutations, CreateAndRemoveDirectory) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);

    ASSERT_TRUE(create_directory(sftp, "/newdir").is_ok());
    EXPECT_TRUE(fs::is_directory(tmp.path / "newdir"));

    auto again = create_directory(sftp, "/newdir");
    ASSERT_TRUE(again.is_err());
    EXPECT_NE(again.error.find("already exists"), std::string::npos);

    ASSERT_TRUE(delete_directory(sftp, "/newdir").is_ok());
    EXPECT_FALSE(fs::exists(tmp.path / "newdir"));
}

TEST(Mutations, RemoveNonEmptyDirectoryFails) {
    TempDir tmp;
    tmp.write("full/file", "x");
    FakeSftpChannel sftp(tmp.path);

    auto r = delete_directory(sftp, "/full");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not empty"), std::string::npos);
    EXPECT_TRUE(fs::exists(tmp.path / "full" / "file"));
}

TEST(Mutations, DeleteFile) {
    TempDir tmp;
    tmp.write("gone.txt", "bye");
    FakeSftpChannel sftp(tmp.path);

    ASSERT_TRUE(delete_file(sftp, "/gone.txt").is_ok());
    EXPECT_FALSE(fs::exists(tmp.path / "gone.txt"));
    EXPECT_TRUE(delete_file(sftp, "/gone.txt").is_err());
}

// ── Text files ─────────────────────────────────────────────────

TEST(TextFiles, WriteThenRead) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);

    std::string text = "line one\nline two\n" + std::string(40000, 'q');
    ASSERT_TRUE(write_text_file(sftp, "/notes.txt", text).is_ok());
    EXPECT_EQ(tmp.read("notes.txt"), text);

    auto r = read_text_file(sftp, "/notes.txt");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, text);
}

TEST(TextFiles, ReadMissingFails) {
    TempDir tmp;
    FakeSftpChannel sftp(tmp.path);
    EXPECT_TRUE(read_text_file(sftp, "/none").is_err());
}
