#include <gtest/gtest.h>
#include "download_manager.h"
#include "fake_collaborators.h"
#include "hash.h"
#include "fs.h"
#include <filesystem>
#include <string>

using namespace peerq;

class DownloadPathsTest : public ::testing::Test {
protected:
    DownloadPathsTest()
        : scheduler(clock.function()),
          downloads(config, events, scheduler, network, shares, users) {}

    void SetUp() override {
        std::filesystem::remove_all(test_dir);
        config.data_folder = test_dir + "/data";
        config.download_folder = test_dir + "/downloads";
        config.incomplete_folder = test_dir + "/incomplete";
        config.upload_folder = test_dir + "/received";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_download(const std::string& basename, const std::string& content) {
        ASSERT_TRUE(create_directories(config.download_folder));
        ASSERT_TRUE(create_file(combine_paths(config.download_folder, basename), content));
    }

    const std::string test_dir = "test_download_paths";

    TransferConfig config;
    EventBus events;
    peerq_test::FakeClock clock;
    Scheduler scheduler;
    peerq_test::FakeTransferNetwork network;
    peerq_test::FakeSharesIndex shares;
    peerq_test::FakeUserDirectory users;
    DownloadManager downloads;
};

TEST_F(DownloadPathsTest, DefaultDownloadFolder) {
    EXPECT_EQ(downloads.get_default_download_folder(), "test_download_paths/downloads");
    EXPECT_EQ(downloads.get_default_download_folder("alice"), "test_download_paths/downloads");

    config.username_subfolders = true;
    EXPECT_EQ(downloads.get_default_download_folder("al:ice"), "test_download_paths/downloads/al_ice");
    EXPECT_EQ(downloads.get_default_download_folder(), "test_download_paths/downloads");
}

TEST_F(DownloadPathsTest, FolderDestinationDropsRemoteParents) {
    EXPECT_EQ(downloads.get_folder_destination("alice", "Music\\Albums\\Best"),
              "test_download_paths/downloads/Best");

    // Subfolder of a requested folder keeps its relative structure
    EXPECT_EQ(downloads.get_folder_destination("alice", "Music\\Albums\\Best\\CD1", "Music\\Albums\\Best"),
              "test_download_paths/downloads/Best/CD1");

    EXPECT_EQ(downloads.get_folder_destination("alice", "Music\\Albums\\Best", "", "custom"), "custom/Best");

    // A folder at the share root
    EXPECT_EQ(downloads.get_folder_destination("alice", "Best"), "test_download_paths/downloads/Best");
}

TEST_F(DownloadPathsTest, FolderDestinationUsesRequestedTarget) {
    downloads.enqueue_folder("alice", "Music\\Albums\\Best", "target");

    EXPECT_EQ(downloads.get_folder_destination("alice", "Music\\Albums\\Best"), "target/Best");
    EXPECT_EQ(downloads.get_folder_destination("bob", "Music\\Albums\\Best"),
              "test_download_paths/downloads/Best");

    std::vector<FolderContentsRequest> requests = network.sent<FolderContentsRequest>("alice");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].directory, "Music\\Albums\\Best");
    EXPECT_EQ(requests[0].token, 1u);
}

TEST_F(DownloadPathsTest, DownloadBasenameIsCleaned) {
    EXPECT_EQ(downloads.get_download_basename("Music\\what?.mp3", config.download_folder), "what_.mp3");
    EXPECT_EQ(downloads.get_download_basename("a/b/c.txt", config.download_folder), "c.txt");
}

TEST_F(DownloadPathsTest, DownloadBasenameRespectsByteLimit) {
    const std::string folder = test_dir + "/missing";

    std::string basename = downloads.get_download_basename("share\\" + std::string(300, 'x') + ".mp3", folder);
    EXPECT_EQ(basename.size(), 255u);
    EXPECT_EQ(basename.substr(basename.size() - 4), ".mp3");

    // Two-byte characters are never split
    std::string wide;
    for (int i = 0; i < 200; ++i) {
        wide += "\xC3\xA9";
    }
    basename = downloads.get_download_basename("share\\" + wide + ".flac", folder);
    EXPECT_EQ(basename.size(), 255u);
    EXPECT_EQ(static_cast<unsigned char>(basename[249]), 0xA9);
    EXPECT_EQ(basename.substr(250), ".flac");
}

TEST_F(DownloadPathsTest, DownloadBasenameAvoidsConflicts) {
    write_download("song.mp3", "1");

    EXPECT_EQ(downloads.get_download_basename("x\\song.mp3", config.download_folder), "song.mp3");
    EXPECT_EQ(downloads.get_download_basename("x\\song.mp3", config.download_folder, true), "song (1).mp3");

    write_download("song (1).mp3", "2");
    EXPECT_EQ(downloads.get_download_basename("x\\song.mp3", config.download_folder, true), "song (2).mp3");
}

TEST_F(DownloadPathsTest, CompleteDownloadMatchesSize) {
    EXPECT_FALSE(downloads.get_complete_download_file_path("alice", "x\\song.mp3", 3).has_value());

    write_download("song.mp3", "abc");
    write_download("song (1).mp3", "abcde");

    std::optional<std::string> path = downloads.get_complete_download_file_path("alice", "x\\song.mp3", 3);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "test_download_paths/downloads/song.mp3");

    path = downloads.get_complete_download_file_path("alice", "x\\song.mp3", 5);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "test_download_paths/downloads/song (1).mp3");

    EXPECT_FALSE(downloads.get_complete_download_file_path("alice", "x\\song.mp3", 4).has_value());
}

TEST_F(DownloadPathsTest, IncompletePathIsStablePerUserAndFile) {
    std::string path = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");
    EXPECT_EQ(path, "test_download_paths/incomplete/INCOMPLETE" + sha1_hex("Music\\song.mp3alice") + "song.mp3");

    EXPECT_EQ(downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3"), path);
    EXPECT_NE(downloads.get_incomplete_download_file_path("bob", "Music\\song.mp3"), path);
}

TEST_F(DownloadPathsTest, IncompletePathRespectsByteLimit) {
    std::string path = downloads.get_incomplete_download_file_path("alice", "share\\" + std::string(300, 'y') + ".ogg");
    std::string basename = get_filename_from_path(path);

    EXPECT_EQ(basename.size(), 255u);
    EXPECT_EQ(basename.substr(0, 10), "INCOMPLETE");
    EXPECT_EQ(basename.substr(basename.size() - 4), ".ogg");
}

TEST_F(DownloadPathsTest, CurrentPathPrefersCompleteFile) {
    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "x\\song.mp3");
    EXPECT_EQ(downloads.get_current_download_file_path("alice", "x\\song.mp3", "", 3), incomplete);

    write_download("song.mp3", "abc");
    EXPECT_EQ(downloads.get_current_download_file_path("alice", "x\\song.mp3", "", 3),
              "test_download_paths/downloads/song.mp3");
}
