#include <gtest/gtest.h>
#include <sftp/file_ops.hpp>
#include <sftp/sftp_channel_pool.hpp>
#include <algorithm>
#include <stdexcept>
#include "fake_sftp_channel.hpp"

// Builds a pool of serialized fakes over one root, sharing one in-flight
// counter. The raw pointers stay valid as long as the pool does.
struct PoolFixture {
    std::shared_ptr<InFlightCounter> in_flight = std::make_shared<InFlightCounter>();
    std::vector<FakeSftpChannel*> fakes;
    std::unique_ptr<SftpChannelPool> pool;

    PoolFixture(const fs::path& root, int channels, std::chrono::milliseconds delay) {
        std::vector<std::unique_ptr<SftpChannel>> slots;
        for (int i = 0; i < channels; i++) {
            auto fake = std::make_unique<FakeSftpChannel>(root);
            fake->serialize_ops = true;
            fake->stat_delay = delay;
            fake->in_flight = in_flight;
            fakes.push_back(fake.get());
            slots.push_back(std::move(fake));
        }
        pool = std::make_unique<SftpChannelPool>(std::move(slots));
    }

    int total_stats() const {
        int n = 0;
        for (auto* f : fakes) n += f->stat_calls.load();
        return n;
    }
};

static void make_entries(const TempDir& tmp, const std::string& dir, int count) {
    for (int i = 0; i < count; i++) tmp.write(dir + "/f" + std::to_string(i), "x");
}

TEST(SftpChannelPool, OneChannelQueuesStats) {
    TempDir tmp;
    make_entries(tmp, "d", 8);
    PoolFixture f(tmp.path, 1, std::chrono::milliseconds(10));

    auto r = list_directory(*f.pool, "/d", 8);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 9u);
    EXPECT_EQ(f.in_flight->peak.load(), 1);
}

TEST(SftpChannelPool, StatsRunOnSeparateChannels) {
    TempDir tmp;
    make_entries(tmp, "d", 16);
    PoolFixture f(tmp.path, 4, std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    auto r = list_directory(*f.pool, "/d", 16);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 17u);
    EXPECT_EQ(f.total_stats(), 16);
    EXPECT_GT(f.in_flight->peak.load(), 1);
    EXPECT_LE(f.in_flight->peak.load(), 4);
    // Sixteen 50 ms round trips on one channel would take 800 ms
    EXPECT_LT(elapsed, std::chrono::milliseconds(600));
}

TEST(SftpChannelPool, EveryChannelCarriesStats) {
    TempDir tmp;
    make_entries(tmp, "d", 12);
    PoolFixture f(tmp.path, 3, std::chrono::milliseconds(30));

    auto r = list_directory(*f.pool, "/d", 12);
    ASSERT_TRUE(r.is_ok());
    for (auto* fake : f.fakes) EXPECT_GT(fake->stat_calls.load(), 0);
}

TEST(SftpChannelPool, FailedStatStillBecomesEmptyFile) {
    TempDir tmp;
    tmp.write("d/sub/inner", "");
    tmp.write("d/data.bin", std::string(64, 'b'));
    PoolFixture f(tmp.path, 2, std::chrono::milliseconds(0));
    for (auto* fake : f.fakes) fake->failing_stats = {"/d/sub"};

    auto r = list_directory(*f.pool, "/d");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].name, "..");
    EXPECT_EQ(r.value[1].name, "data.bin");
    EXPECT_EQ(r.value[1].size, 64u);
    EXPECT_EQ(r.value[2].name, "sub");
    EXPECT_FALSE(r.value[2].is_dir);
    EXPECT_EQ(r.value[2].size, 0u);
}

TEST(SftpChannelPool, NonStatCallsUseFirstChannel) {
    TempDir first;
    TempDir second;
    first.write("only_in_first.txt", "1");
    second.write("only_in_second.txt", "2");

    std::vector<std::unique_ptr<SftpChannel>> slots;
    slots.push_back(std::make_unique<FakeSftpChannel>(first.path));
    slots.push_back(std::make_unique<FakeSftpChannel>(second.path));
    SftpChannelPool pool(std::move(slots));
    EXPECT_EQ(pool.size(), 2u);

    auto names = pool.read_dir("/");
    ASSERT_TRUE(names.is_ok());
    EXPECT_NE(std::find(names.value.begin(), names.value.end(), "only_in_first.txt"),
              names.value.end());

    ASSERT_TRUE(pool.mkdir("/made").is_ok());
    EXPECT_TRUE(fs::is_directory(first.path / "made"));
    EXPECT_FALSE(fs::exists(second.path / "made"));

    ASSERT_TRUE(write_text_file(pool, "/note.txt", "hello").is_ok());
    EXPECT_EQ(first.read("note.txt"), "hello");
}

TEST(SftpChannelPool, EmptyPoolIsRejected) {
    std::vector<std::unique_ptr<SftpChannel>> none;
    EXPECT_THROW(SftpChannelPool pool(std::move(none)), std::logic_error);
}
