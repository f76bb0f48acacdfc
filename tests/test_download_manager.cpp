#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "download_manager.h"
#include "fake_collaborators.h"
#include "fs.h"
#include <filesystem>
#include <string>
#include <vector>

using namespace peerq;

class DownloadManagerTest : public ::testing::Test {
protected:
    DownloadManagerTest()
        : scheduler(clock.function()),
          downloads(config, events, scheduler, network, shares, users) {}

    void SetUp() override {
        std::filesystem::remove_all(test_dir);
        config.data_folder = test_dir + "/data";
        config.download_folder = test_dir + "/downloads";
        config.incomplete_folder = test_dir + "/incomplete";
        config.upload_folder = test_dir + "/received";

        events.on<FileDownloadedEvent>([this](const FileDownloadedEvent& e) { downloaded_files.push_back(e.file_path); });
        events.on<FolderDownloadedEvent>([this](const FolderDownloadedEvent& e) {
            downloaded_folders.push_back(e.folder_path);
        });
        events.on<TransferFinishedEvent>([this](const TransferFinishedEvent&) { finished_events++; });
        events.on<TransferStartedEvent>([this](const TransferStartedEvent& e) { started_files.push_back(e.file_path); });
        events.on<DownloadFolderErrorEvent>([this](const DownloadFolderErrorEvent& e) {
            folder_errors.push_back(e.error);
        });
        events.on<LargeFolderRequestedEvent>([this](const LargeFolderRequestedEvent& e) {
            large_folders.push_back(e);
        });
    }

    void TearDown() override {
        downloads.quit();
        std::filesystem::remove_all(test_dir);
    }

    Transfer* enqueue(const std::string& username, const std::string& virtual_path, uint64_t size = 100) {
        downloads.enqueue_download(username, virtual_path, "", size);
        return downloads.registry().find(username, virtual_path);
    }

    // Peer is ready to send us a file
    void request_upload(const std::string& username, const std::string& virtual_path, uint64_t size,
                        uint32_t token) {
        TransferRequestEvent event;
        event.username = username;
        event.ip_address = "10.0.0.1";
        event.request.direction = WireDirection::UPLOAD;
        event.request.token = token;
        event.request.file = virtual_path;
        event.request.filesize = size;
        events.emit(event);
    }

    void init_file_connection(const std::string& username, uint32_t token, socket_t sock) {
        FileTransferInitEvent event;
        event.username = username;
        event.token = token;
        event.sock = sock;
        events.emit(event);
    }

    void progress(const std::string& username, uint32_t token, uint64_t bytes_left) {
        FileDownloadProgressEvent event;
        event.username = username;
        event.token = token;
        event.bytes_left = bytes_left;
        events.emit(event);
    }

    void close_file_connection(const std::string& username, uint32_t token, socket_t sock) {
        FileConnectionClosedEvent event;
        event.username = username;
        event.token = token;
        event.sock = sock;
        events.emit(event);
    }

    void deny(const std::string& username, const std::string& virtual_path, const std::string& reason) {
        UploadDeniedEvent event;
        event.username = username;
        event.message.file = virtual_path;
        event.message.reason = reason;
        events.emit(event);
    }

    void complete_download(const std::string& username, const std::string& virtual_path, uint64_t size,
                           uint32_t token) {
        request_upload(username, virtual_path, size, token);
        init_file_connection(username, token, static_cast<socket_t>(token + 100));
        progress(username, token, 0);
        close_file_connection(username, token, static_cast<socket_t>(token + 100));
    }

    std::vector<TransferResponse> responses() const {
        return network.sent<TransferResponse>();
    }

    const std::string test_dir = "test_download_manager";

    TransferConfig config;
    EventBus events;
    peerq_test::FakeClock clock;
    Scheduler scheduler;
    peerq_test::FakeTransferNetwork network;
    peerq_test::FakeSharesIndex shares;
    peerq_test::FakeUserDirectory users;
    DownloadManager downloads;

    std::vector<std::string> downloaded_files;
    std::vector<std::string> downloaded_folders;
    std::vector<std::string> started_files;
    std::vector<std::string> folder_errors;
    std::vector<LargeFolderRequestedEvent> large_folders;
    int finished_events = 0;
};

//=============================================================================
// Enqueueing
//=============================================================================

TEST_F(DownloadManagerTest, EnqueueSendsQueueUpload) {
    Transfer* download = enqueue("alice", "Music\\song.mp3");

    ASSERT_NE(download, nullptr);
    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_EQ(download->folder_path, "test_download_manager/downloads");
    EXPECT_TRUE(downloads.registry().is_queued(*download));

    std::vector<QueueUpload> messages = network.sent<QueueUpload>("alice");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].file, "Music\\song.mp3");
    EXPECT_FALSE(messages[0].legacy_client);
}

TEST_F(DownloadManagerTest, EnqueueExistingDownloadIsIgnored) {
    enqueue("alice", "Music\\song.mp3");
    enqueue("alice", "Music\\song.mp3");

    EXPECT_EQ(downloads.registry().size(), 1u);
    EXPECT_EQ(network.sent<QueueUpload>().size(), 1u);
}

TEST_F(DownloadManagerTest, EnqueueForOfflineUser) {
    users.statuses["alice"] = UserStatus::OFFLINE;
    Transfer* download = enqueue("alice", "Music\\song.mp3");

    EXPECT_EQ(download->status, TransferStatus::USER_LOGGED_OFF);
    EXPECT_TRUE(downloads.registry().is_failed(*download));
    EXPECT_TRUE(network.sent<QueueUpload>().empty());

    users.statuses.clear();
    users.status = UserStatus::OFFLINE;
    download = enqueue("bob", "x.mp3");
    EXPECT_EQ(download->status, TransferStatus::USER_LOGGED_OFF);
}

TEST_F(DownloadManagerTest, AlreadyDownloadedFileIsFinished) {
    ASSERT_TRUE(create_directories(config.download_folder));
    ASSERT_TRUE(create_file(config.download_folder + "/song.mp3", "abc"));

    Transfer* download = enqueue("alice", "Music\\song.mp3", 3);

    EXPECT_EQ(download->status, TransferStatus::FINISHED);
    EXPECT_EQ(download->current_byte_offset.value_or(0), 3u);
    EXPECT_FALSE(downloads.registry().is_queued(*download));
    EXPECT_TRUE(network.sent<QueueUpload>().empty());
}

TEST_F(DownloadManagerTest, QueueMessagesWaitForShares) {
    shares.is_initialized = false;
    Transfer* download = enqueue("alice", "Music\\song.mp3");

    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_TRUE(network.sent<QueueUpload>().empty());

    shares.is_initialized = true;
    events.emit(SharesReadyEvent());

    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 1u);

    // Sent once only
    events.emit(SharesReadyEvent());
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 1u);
}

TEST_F(DownloadManagerTest, HeldQueueMessageDroppedWhenAborted) {
    shares.is_initialized = false;
    Transfer* download = enqueue("alice", "Music\\song.mp3");

    downloads.abort_downloads({download});
    events.emit(SharesReadyEvent());

    EXPECT_EQ(download->status, TransferStatus::PAUSED);
    EXPECT_TRUE(network.sent<QueueUpload>().empty());
}

//=============================================================================
// Filters
//=============================================================================

TEST_F(DownloadManagerTest, EscapedFilterMatchesWildcard) {
    config.download_filters = {DownloadFilter("*.exe", true)};
    downloads.update_download_filters();

    EXPECT_EQ(downloads.download_regexp(), "(\\\\(.*\\.exe)$)");
    EXPECT_TRUE(downloads.is_filtered("share\\virus.exe"));
    EXPECT_TRUE(downloads.is_filtered("share\\VIRUS.EXE"));
    EXPECT_FALSE(downloads.is_filtered("share\\song.mp3"));
    EXPECT_FALSE(downloads.is_filtered("share\\virus.exe.txt"));
}

TEST_F(DownloadManagerTest, InvalidFilterIsLeftOut) {
    config.download_filters = {DownloadFilter("[broken", false), DownloadFilter("*.tmp", true),
                               DownloadFilter("*.tmp", true)};
    downloads.update_download_filters();

    EXPECT_EQ(downloads.download_regexp(), "(\\\\(.*\\.tmp)$)");
    EXPECT_TRUE(downloads.is_filtered("a\\b.tmp"));

    config.download_filters.clear();
    downloads.update_download_filters();
    EXPECT_EQ(downloads.download_regexp(), "");
    EXPECT_FALSE(downloads.is_filtered("a\\b.tmp"));
}

TEST_F(DownloadManagerTest, FilteredDownloadIsNotRequested) {
    config.enable_filters = true;
    config.download_filters = {DownloadFilter("*.exe", true)};
    downloads.update_download_filters();

    Transfer* download = enqueue("alice", "share\\setup.exe");

    EXPECT_EQ(download->status, TransferStatus::FILTERED);
    EXPECT_FALSE(downloads.registry().is_failed(*download));
    EXPECT_TRUE(network.sent<QueueUpload>().empty());

    // Retrying a single filtered download bypasses the filters
    downloads.retry_downloads({download});
    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_EQ(network.sent<QueueUpload>().size(), 1u);
}

TEST_F(DownloadManagerTest, FilteredDownloadIsAutoCleared) {
    config.enable_filters = true;
    config.autoclear_downloads = true;
    config.download_filters = {DownloadFilter("*.exe", true)};
    downloads.update_download_filters();

    EXPECT_EQ(enqueue("alice", "share\\setup.exe"), nullptr);
    EXPECT_EQ(downloads.registry().size(), 0u);
}

TEST_F(DownloadManagerTest, FiltersDisabledByConfig) {
    config.download_filters = {DownloadFilter("*.exe", true)};
    downloads.update_download_filters();

    Transfer* download = enqueue("alice", "share\\setup.exe");
    EXPECT_EQ(download->status, TransferStatus::QUEUED);
}

//=============================================================================
// Transfer negotiation
//=============================================================================

TEST_F(DownloadManagerTest, PeerRequestActivatesQueuedDownload) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);

    request_upload("alice", "Music\\song.mp3", 100, 55);

    ASSERT_EQ(responses().size(), 1u);
    EXPECT_TRUE(responses()[0].allowed);
    EXPECT_EQ(responses()[0].token, 55u);
    EXPECT_EQ(download->status, TransferStatus::GETTING_STATUS);
    EXPECT_EQ(downloads.registry().find_active("alice", 55), download);
    EXPECT_FALSE(download->size_changed);
}

TEST_F(DownloadManagerTest, PeerRequestWithNewSizeMarksChange) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);

    request_upload("alice", "Music\\song.mp3", 120, 55);
    EXPECT_TRUE(download->size_changed);
    EXPECT_EQ(download->size, 120u);
}

TEST_F(DownloadManagerTest, PeerRequestWithZeroSizeKeepsKnownSize) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);

    request_upload("alice", "Music\\song.mp3", 0, 55);
    EXPECT_FALSE(download->size_changed);
    EXPECT_EQ(download->size, 100u);
}

TEST_F(DownloadManagerTest, UnknownPeerRequestIsDenied) {
    config.remote_downloads = RemoteDownloadPermission::NOBODY;
    request_upload("alice", "share\\gift.mp3", 10, 7);

    ASSERT_EQ(responses().size(), 1u);
    EXPECT_FALSE(responses()[0].allowed);
    EXPECT_EQ(responses()[0].reason, "Cancelled");
    EXPECT_EQ(downloads.registry().size(), 0u);
}

TEST_F(DownloadManagerTest, PeerRequestForFinishedDownloadIsComplete) {
    ASSERT_TRUE(create_directories(config.download_folder));
    ASSERT_TRUE(create_file(config.download_folder + "/song.mp3", "abc"));
    enqueue("alice", "Music\\song.mp3", 3);

    request_upload("alice", "Music\\song.mp3", 3, 7);

    ASSERT_EQ(responses().size(), 1u);
    EXPECT_FALSE(responses()[0].allowed);
    EXPECT_EQ(responses()[0].reason, "Complete");
}

TEST_F(DownloadManagerTest, BuddyMayPushFiles) {
    users.buddies["alice"] = BuddyInfo();
    request_upload("alice", "share\\Gifts\\gift.mp3", 10, 7);

    ASSERT_EQ(responses().size(), 1u);
    EXPECT_TRUE(responses()[0].allowed);

    Transfer* download = downloads.registry().find("alice", "share\\Gifts\\gift.mp3");
    ASSERT_NE(download, nullptr);
    EXPECT_EQ(download->folder_path, "test_download_manager/received/alice/Gifts");
    EXPECT_TRUE(downloads.registry().is_active(*download));

    // Strangers may not
    request_upload("bob", "share\\other.mp3", 10, 8);
    EXPECT_FALSE(responses()[1].allowed);
}

TEST_F(DownloadManagerTest, RemoteDownloadPermissions) {
    users.buddies["buddy"] = BuddyInfo();
    BuddyInfo trusted;
    trusted.is_trusted = true;
    users.buddies["trusted"] = trusted;

    config.remote_downloads = RemoteDownloadPermission::EVERYONE;
    EXPECT_TRUE(downloads.can_upload("stranger"));

    config.remote_downloads = RemoteDownloadPermission::BUDDIES;
    EXPECT_TRUE(downloads.can_upload("buddy"));
    EXPECT_FALSE(downloads.can_upload("stranger"));

    config.remote_downloads = RemoteDownloadPermission::TRUSTED;
    EXPECT_FALSE(downloads.can_upload("buddy"));
    EXPECT_TRUE(downloads.can_upload("trusted"));

    config.remote_downloads = RemoteDownloadPermission::NOBODY;
    EXPECT_FALSE(downloads.can_upload("trusted"));
}

//=============================================================================
// File connection
//=============================================================================

TEST_F(DownloadManagerTest, FileConnectionStartsDownload) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);

    init_file_connection("alice", 55, 9);

    EXPECT_EQ(download->status, TransferStatus::TRANSFERRING);
    EXPECT_EQ(download->sock, 9);
    ASSERT_NE(download->file_handle, nullptr);

    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");
    EXPECT_TRUE(file_exists(incomplete));
    EXPECT_EQ(started_files, (std::vector<std::string>{incomplete}));

    std::vector<DownloadFile> commands = network.commands<DownloadFile>();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].sock, 9);
    EXPECT_EQ(commands[0].token, 55u);
    EXPECT_EQ(commands[0].leftbytes, 100u);

    std::vector<FileOffset> offsets = network.sent<FileOffset>("alice");
    ASSERT_EQ(offsets.size(), 1u);
    EXPECT_EQ(offsets[0].offset, 0u);
}

TEST_F(DownloadManagerTest, FileConnectionResumesPartialFile) {
    enqueue("alice", "Music\\song.mp3", 100);
    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");
    ASSERT_TRUE(create_directories(config.incomplete_folder));
    ASSERT_TRUE(create_file(incomplete, std::string(40, 'x')));

    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);

    std::vector<FileOffset> offsets = network.sent<FileOffset>("alice");
    ASSERT_EQ(offsets.size(), 1u);
    EXPECT_EQ(offsets[0].offset, 40u);
    EXPECT_EQ(network.commands<DownloadFile>()[0].leftbytes, 60u);
}

TEST_F(DownloadManagerTest, ChangedRemoteFileRestartsFromZero) {
    enqueue("alice", "Music\\song.mp3", 100);
    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");
    ASSERT_TRUE(create_directories(config.incomplete_folder));
    ASSERT_TRUE(create_file(incomplete, std::string(40, 'x')));

    request_upload("alice", "Music\\song.mp3", 120, 55);
    init_file_connection("alice", 55, 9);

    EXPECT_EQ(network.sent<FileOffset>("alice")[0].offset, 0u);
    EXPECT_EQ(get_file_size(incomplete), 0);
}

TEST_F(DownloadManagerTest, OutgoingFileConnectionIsIgnored) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);

    FileTransferInitEvent event;
    event.username = "alice";
    event.token = 55;
    event.sock = 9;
    event.is_outgoing = true;
    events.emit(event);

    EXPECT_EQ(download->sock, INVALID_SOCKET_VALUE);
    EXPECT_EQ(download->status, TransferStatus::GETTING_STATUS);
}

TEST_F(DownloadManagerTest, ProgressUpdatesSpeedAndTimeLeft) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);

    clock.advance(2);
    progress("alice", 55, 60);

    EXPECT_EQ(download->current_byte_offset.value_or(0), 40u);
    EXPECT_EQ(download->speed.value_or(0), 20u);
    EXPECT_EQ(download->time_left, 3u);
    EXPECT_DOUBLE_EQ(download->time_elapsed, 2.0);
    EXPECT_EQ(download->request_timer_id, 0u);
    EXPECT_EQ(downloads.registry().statistics().transferred_bytes, 40u);
}

TEST_F(DownloadManagerTest, CompletedDownloadIsMoved) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");

    complete_download("alice", "Music\\song.mp3", 100, 55);

    EXPECT_EQ(download->status, TransferStatus::FINISHED);
    EXPECT_EQ(download->current_byte_offset.value_or(0), 100u);
    EXPECT_EQ(download->file_handle, nullptr);
    EXPECT_FALSE(downloads.registry().is_active(*download));

    EXPECT_FALSE(file_exists(incomplete));
    EXPECT_TRUE(file_exists("test_download_manager/downloads/song.mp3"));
    EXPECT_EQ(downloaded_files, (std::vector<std::string>{"test_download_manager/downloads/song.mp3"}));
    EXPECT_EQ(finished_events, 1);
    EXPECT_EQ(downloads.registry().statistics().completed_transfers, 1u);
}

TEST_F(DownloadManagerTest, CompletedDownloadAvoidsOverwriting) {
    ASSERT_TRUE(create_directories(config.download_folder));
    ASSERT_TRUE(create_file(config.download_folder + "/song.mp3", "other"));

    enqueue("alice", "Music\\song.mp3", 100);
    complete_download("alice", "Music\\song.mp3", 100, 55);

    EXPECT_EQ(read_file_text(config.download_folder + "/song.mp3"), "other");
    EXPECT_TRUE(file_exists(config.download_folder + "/song (1).mp3"));
}

TEST_F(DownloadManagerTest, CompletedDownloadIsAutoCleared) {
    config.autoclear_downloads = true;
    enqueue("alice", "Music\\song.mp3", 100);

    complete_download("alice", "Music\\song.mp3", 100, 55);

    EXPECT_EQ(downloads.registry().size(), 0u);
    EXPECT_EQ(finished_events, 1);
    EXPECT_TRUE(file_exists("test_download_manager/downloads/song.mp3"));
}

TEST_F(DownloadManagerTest, FailedMoveKeepsIncompleteFile) {
    ASSERT_TRUE(create_directories(test_dir));
    ASSERT_TRUE(create_file(test_dir + "/blocker", "x"));
    config.download_folder = test_dir + "/blocker/downloads";

    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    std::string incomplete = downloads.get_incomplete_download_file_path("alice", "Music\\song.mp3");

    complete_download("alice", "Music\\song.mp3", 100, 55);

    EXPECT_EQ(download->status, TransferStatus::DOWNLOAD_FOLDER_ERROR);
    EXPECT_TRUE(downloads.registry().is_failed(*download));
    EXPECT_TRUE(file_exists(incomplete));
    ASSERT_EQ(folder_errors.size(), 1u);
    EXPECT_FALSE(folder_errors[0].empty());
    EXPECT_TRUE(downloaded_files.empty());
    EXPECT_EQ(finished_events, 0);
}

TEST_F(DownloadManagerTest, IncompleteFolderErrorAbortsDownload) {
    ASSERT_TRUE(create_directories(test_dir));
    ASSERT_TRUE(create_file(test_dir + "/blocker", "x"));
    config.incomplete_folder = test_dir + "/blocker/incomplete";

    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);

    EXPECT_EQ(download->status, TransferStatus::DOWNLOAD_FOLDER_ERROR);
    EXPECT_EQ(folder_errors.size(), 1u);
    EXPECT_TRUE(network.commands<DownloadFile>().empty());
    // The file connection is closed
    ASSERT_EQ(network.commands<CloseConnection>().size(), 1u);
    EXPECT_EQ(network.commands<CloseConnection>()[0].sock, 9);
}

TEST_F(DownloadManagerTest, ClosedConnectionBeforeEnd) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);
    progress("alice", 55, 50);

    // A different socket is not ours
    close_file_connection("alice", 55, 10);
    EXPECT_EQ(download->status, TransferStatus::TRANSFERRING);

    close_file_connection("alice", 55, 9);
    EXPECT_EQ(download->status, TransferStatus::CANCELLED);
    EXPECT_TRUE(downloads.registry().is_failed(*download));
}

TEST_F(DownloadManagerTest, ClosedConnectionWithOfflineUser) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);

    users.statuses["alice"] = UserStatus::OFFLINE;
    close_file_connection("alice", 55, 9);

    EXPECT_EQ(download->status, TransferStatus::USER_LOGGED_OFF);
}

TEST_F(DownloadManagerTest, DownloadFileError) {
    Transfer* download = enqueue("alice", "Music\\song.mp3", 100);
    request_upload("alice", "Music\\song.mp3", 100, 55);
    init_file_connection("alice", 55, 9);

    DownloadFileErrorEvent event;
    event.username = "alice";
    event.token = 55;
    event.error = "No space left on device";
    events.emit(event);

    EXPECT_EQ(download->status, TransferStatus::LOCAL_FILE_ERROR);
    EXPECT_EQ(download->file_handle, nullptr);
}

//=============================================================================
// Denials and failures
//=============================================================================

TEST_F(DownloadManagerTest, FileNotSharedRetriesOnceAsLegacy) {
    Transfer* download = enqueue("alice", "Music\\söng.mp3");

    deny("alice", "Music\\söng.mp3", "File not shared.");

    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_TRUE(download->legacy_attempt);
    std::vector<QueueUpload> messages = network.sent<QueueUpload>("alice");
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_TRUE(messages[1].legacy_client);

    deny("alice", "Music\\söng.mp3", "File not shared.");

    EXPECT_EQ(download->status, TransferStatus::FILE_NOT_SHARED);
    EXPECT_TRUE(downloads.registry().is_failed(*download));
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 2u);
}

TEST_F(DownloadManagerTest, InternalStatusFromPeerBecomesCancelled) {
    Transfer* download = enqueue("alice", "a.mp3");
    deny("alice", "a.mp3", "Transferring");

    EXPECT_EQ(download->status, TransferStatus::CANCELLED);
    EXPECT_TRUE(download->status_message.empty());
}

TEST_F(DownloadManagerTest, UnknownReasonIsKept) {
    Transfer* download = enqueue("alice", "a.mp3");
    deny("alice", "a.mp3", "Shares are private");

    EXPECT_EQ(download->status, TransferStatus::CANCELLED);
    EXPECT_EQ(download->status_text(), "Shares are private");
}

TEST_F(DownloadManagerTest, DenialForUnqueuedFileIsIgnored) {
    Transfer* download = enqueue("alice", "a.mp3");
    downloads.abort_downloads({download});

    deny("alice", "a.mp3", "Banned");
    EXPECT_EQ(download->status, TransferStatus::PAUSED);
}

TEST_F(DownloadManagerTest, RemoteQueueLimitResumesWhenQueueDrains) {
    Transfer* a = enqueue("alice", "a.mp3");
    Transfer* b = enqueue("alice", "b.mp3");
    Transfer* c = enqueue("alice", "c.mp3");

    deny("alice", "a.mp3", "Too many files");

    EXPECT_EQ(a->status, TransferStatus::REMOTE_QUEUED);
    EXPECT_TRUE(downloads.registry().is_failed(*a));
    EXPECT_EQ(downloads.registry().user_queue_limit("alice").value_or(0), 5u);

    downloads.abort_downloads({b, c});

    // Our queue with alice ran dry, so the limited download goes back
    EXPECT_EQ(a->status, TransferStatus::QUEUED);
    EXPECT_TRUE(downloads.registry().is_queued(*a));
    EXPECT_FALSE(downloads.registry().user_queue_limit("alice").has_value());
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 4u);
}

TEST_F(DownloadManagerTest, RemoteQueueLimitResumesInBatches) {
    std::vector<Transfer*> limited;
    for (int i = 0; i < 8; ++i) {
        limited.push_back(enqueue("alice", std::to_string(i) + ".mp3"));
    }
    for (int i = 0; i < 8; ++i) {
        deny("alice", std::to_string(i) + ".mp3", "Too many files");
    }

    // Only one batch is asked for again while the limit is in place
    EXPECT_EQ(downloads.registry().queued_count("alice"), 5u);
    EXPECT_EQ(downloads.registry().user_queue_limit("alice").value_or(0), 5u);

    uint32_t token = 1;
    for (int round = 0; round < 5 && downloads.registry().queued_count("alice") > 0; ++round) {
        for (Transfer* download : downloads.registry().queued_for("alice")) {
            complete_download("alice", download->virtual_path, 100, token++);
        }
    }

    for (Transfer* download : limited) {
        EXPECT_EQ(download->status, TransferStatus::FINISHED) << download->virtual_path;
    }
    EXPECT_FALSE(downloads.registry().user_queue_limit("alice").has_value());
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 16u);
}

TEST_F(DownloadManagerTest, UserLimitReasonIsRemoteQueued) {
    Transfer* download = enqueue("alice", "a.mp3");
    deny("alice", "a.mp3", "User limit of 10 files reached");

    EXPECT_EQ(download->status, TransferStatus::REMOTE_QUEUED);
}

TEST_F(DownloadManagerTest, UploadFailedRetriesOnceAsLegacy) {
    Transfer* download = enqueue("alice", "a.mp3");
    request_upload("alice", "a.mp3", 100, 55);

    UploadFailedEvent failed;
    failed.username = "alice";
    failed.message.file = "a.mp3";
    events.emit(failed);

    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_TRUE(download->legacy_attempt);

    request_upload("alice", "a.mp3", 100, 56);
    events.emit(failed);

    EXPECT_EQ(download->status, TransferStatus::CONNECTION_CLOSED);
    EXPECT_TRUE(downloads.registry().is_failed(*download));
}

TEST_F(DownloadManagerTest, PeerConnectionProblems) {
    Transfer* timeout = enqueue("alice", "1.mp3");
    Transfer* offline = enqueue("bob", "2.mp3");
    Transfer* closed = enqueue("carol", "3.mp3");

    PeerConnectionErrorEvent error;
    error.username = "alice";
    error.msgs.push_back(QueueUpload{"1.mp3", false});
    events.emit(error);

    error.username = "bob";
    error.msgs = {QueueUpload{"2.mp3", false}};
    error.is_offline = true;
    events.emit(error);

    PeerConnectionClosedEvent closed_event;
    closed_event.username = "carol";
    closed_event.msgs.push_back(QueueUpload{"3.mp3", false});
    events.emit(closed_event);

    EXPECT_EQ(timeout->status, TransferStatus::CONNECTION_TIMEOUT);
    EXPECT_EQ(offline->status, TransferStatus::USER_LOGGED_OFF);
    EXPECT_EQ(closed->status, TransferStatus::CONNECTION_CLOSED);
}

//=============================================================================
// Server and user state
//=============================================================================

TEST_F(DownloadManagerTest, UserGoingOfflineAndOnline) {
    Transfer* queued = enqueue("alice", "1.mp3");
    Transfer* paused = enqueue("alice", "2.mp3");
    Transfer* closed = enqueue("alice", "3.mp3");
    downloads.abort_downloads({paused});
    downloads.registry().abort(*closed, TransferStatus::CONNECTION_CLOSED);
    ASSERT_TRUE(downloads.registry().is_failed(*closed));

    users.statuses["alice"] = UserStatus::OFFLINE;
    UserStatusEvent status_event;
    status_event.username = "alice";
    status_event.status = UserStatus::OFFLINE;
    events.emit(status_event);

    EXPECT_EQ(queued->status, TransferStatus::USER_LOGGED_OFF);
    EXPECT_EQ(paused->status, TransferStatus::PAUSED);

    users.statuses["alice"] = UserStatus::ONLINE;
    status_event.status = UserStatus::ONLINE;
    events.emit(status_event);

    EXPECT_EQ(queued->status, TransferStatus::QUEUED);
    EXPECT_TRUE(downloads.registry().is_queued(*queued));
    EXPECT_EQ(closed->status, TransferStatus::QUEUED);
    EXPECT_TRUE(downloads.registry().is_queued(*closed));
    EXPECT_EQ(paused->status, TransferStatus::PAUSED);
}

TEST_F(DownloadManagerTest, LoginStartsTimers) {
    ServerLoginEvent login;
    login.success = true;
    events.emit(login);

    ASSERT_EQ(network.commands<SetDownloadLimit>().size(), 1u);
    EXPECT_EQ(network.commands<SetDownloadLimit>()[0].limit, 0u);

    Transfer* queued = enqueue("alice", "1.mp3");
    Transfer* timed_out = enqueue("bob", "2.mp3");

    PeerConnectionErrorEvent error;
    error.username = "bob";
    error.msgs.push_back(QueueUpload{"2.mp3", false});
    events.emit(error);
    ASSERT_EQ(timed_out->status, TransferStatus::CONNECTION_TIMEOUT);

    clock.advance(180);
    scheduler.run_due();

    std::vector<PlaceInQueueRequest> requests = network.sent<PlaceInQueueRequest>("alice");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].file, "1.mp3");
    EXPECT_EQ(queued->status, TransferStatus::QUEUED);

    // Connection failures are retried
    EXPECT_EQ(timed_out->status, TransferStatus::QUEUED);
    EXPECT_EQ(network.sent<QueueUpload>("bob").size(), 2u);
}

TEST_F(DownloadManagerTest, DisconnectLogsOffQueue) {
    ServerLoginEvent login;
    login.success = true;
    events.emit(login);

    Transfer* queued = enqueue("alice", "1.mp3");
    Transfer* active = enqueue("bob", "2.mp3");
    request_upload("bob", "2.mp3", 100, 5);

    events.emit(ServerDisconnectEvent());

    EXPECT_EQ(queued->status, TransferStatus::USER_LOGGED_OFF);
    EXPECT_EQ(active->status, TransferStatus::USER_LOGGED_OFF);
    EXPECT_FALSE(downloads.registry().has_any_active());
    EXPECT_EQ(scheduler.pending_count(), 0u);
    EXPECT_TRUE(file_exists(downloads.transfers_file_path()));
}

TEST_F(DownloadManagerTest, PlaceInQueueResponse) {
    Transfer* download = enqueue("alice", "1.mp3");

    PlaceInQueueResponseEvent event;
    event.username = "alice";
    event.response.filename = "1.mp3";
    event.response.place = 12;
    events.emit(event);

    EXPECT_EQ(download->queue_position, 12u);
}

TEST_F(DownloadManagerTest, SpeedLimits) {
    config.download_speed_limit = SpeedLimitMode::PRIMARY;
    config.download_limit = 300;
    config.download_limit_alt = 100;
    downloads.update_transfer_limits();

    config.download_speed_limit = SpeedLimitMode::ALTERNATIVE;
    downloads.update_transfer_limits();

    std::vector<SetDownloadLimit> limits = network.commands<SetDownloadLimit>();
    ASSERT_EQ(limits.size(), 2u);
    EXPECT_EQ(limits[0].limit, 300u);
    EXPECT_EQ(limits[1].limit, 100u);

    users.status = UserStatus::OFFLINE;
    downloads.update_transfer_limits();
    EXPECT_EQ(network.commands<SetDownloadLimit>().size(), 2u);
}

//=============================================================================
// Folders
//=============================================================================

TEST_F(DownloadManagerTest, FolderContentsAreEnqueuedSorted) {
    downloads.enqueue_folder("alice", "Music\\Album");

    FolderContentsResponseEvent event;
    event.username = "alice";
    event.token = 1;
    FolderFileEntry b;
    b.basename = "b.mp3";
    b.size = 3;
    FolderFileEntry a;
    a.basename = "a.mp3";
    a.size = 5;
    event.listing["Music\\Album"] = {b, a};
    event.listing["Music\\Other"] = {a};
    events.emit(event);

    EXPECT_EQ(downloads.registry().size(), 2u);

    std::vector<std::string> files;
    for (const QueueUpload& message : network.sent<QueueUpload>("alice")) {
        files.push_back(message.file);
    }
    EXPECT_THAT(files, testing::ElementsAre("Music\\Album\\a.mp3", "Music\\Album\\b.mp3"));

    Transfer* download = downloads.registry().find("alice", "Music\\Album\\a.mp3");
    ASSERT_NE(download, nullptr);
    EXPECT_EQ(download->folder_path, "test_download_manager/downloads/Album");
    EXPECT_EQ(download->size, 5u);

    // Answered once
    events.emit(event);
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 2u);
}

TEST_F(DownloadManagerTest, UnrequestedFolderContentsAreIgnored) {
    FolderContentsResponseEvent event;
    event.username = "alice";
    FolderFileEntry a;
    a.basename = "a.mp3";
    event.listing["Music\\Album"] = {a};
    events.emit(event);

    EXPECT_EQ(downloads.registry().size(), 0u);
}

TEST_F(DownloadManagerTest, FolderDownloadedAfterLastFile) {
    downloads.enqueue_folder("alice", "Music\\Album");

    FolderContentsResponseEvent event;
    event.username = "alice";
    FolderFileEntry a;
    a.basename = "a.mp3";
    a.size = 5;
    FolderFileEntry b;
    b.basename = "b.mp3";
    b.size = 3;
    event.listing["Music\\Album"] = {a, b};
    events.emit(event);

    complete_download("alice", "Music\\Album\\a.mp3", 5, 1);
    EXPECT_TRUE(downloaded_folders.empty());

    complete_download("alice", "Music\\Album\\b.mp3", 3, 2);
    EXPECT_EQ(downloaded_folders, (std::vector<std::string>{"test_download_manager/downloads/Album"}));
    EXPECT_TRUE(file_exists("test_download_manager/downloads/Album/a.mp3"));
    EXPECT_TRUE(file_exists("test_download_manager/downloads/Album/b.mp3"));
}

TEST_F(DownloadManagerTest, LargeFolderNeedsConfirmation) {
    downloads.enqueue_folder("alice", "Music\\Huge");

    FolderContentsResponseEvent event;
    event.username = "alice";
    for (int i = 0; i < 101; ++i) {
        FolderFileEntry entry;
        entry.basename = "track" + std::to_string(1000 + i) + ".mp3";
        entry.size = 1;
        event.listing["Music\\Huge"].push_back(entry);
    }
    events.emit(event);

    EXPECT_EQ(downloads.registry().size(), 0u);
    ASSERT_EQ(large_folders.size(), 1u);
    EXPECT_EQ(large_folders[0].folder_path, "Music\\Huge");
    EXPECT_EQ(large_folders[0].num_files, 101u);

    downloads.download_large_folder("alice", "Music\\Huge", large_folders[0].listing);
    EXPECT_EQ(downloads.registry().size(), 101u);
    EXPECT_EQ(large_folders.size(), 1u);
}

TEST_F(DownloadManagerTest, HundredFilesNeedNoConfirmation) {
    downloads.enqueue_folder("alice", "Music\\Big");

    FolderContentsResponseEvent event;
    event.username = "alice";
    for (int i = 0; i < 100; ++i) {
        FolderFileEntry entry;
        entry.basename = "track" + std::to_string(1000 + i) + ".mp3";
        event.listing["Music\\Big"].push_back(entry);
    }
    events.emit(event);

    EXPECT_TRUE(large_folders.empty());
    EXPECT_EQ(downloads.registry().size(), 100u);
}

//=============================================================================
// User actions and persistence
//=============================================================================

TEST_F(DownloadManagerTest, ClearDownloadsByStatus) {
    Transfer* queued = enqueue("alice", "1.mp3");
    Transfer* paused = enqueue("alice", "2.mp3");
    downloads.abort_downloads({paused});

    downloads.clear_downloads({}, {TransferStatus::PAUSED});
    EXPECT_EQ(downloads.registry().size(), 1u);
    EXPECT_EQ(downloads.registry().find("alice", "1.mp3"), queued);

    downloads.clear_downloads();
    EXPECT_EQ(downloads.registry().size(), 0u);
}

TEST_F(DownloadManagerTest, ClearDeletedFinishedDownloads) {
    ASSERT_TRUE(create_directories(config.download_folder));
    ASSERT_TRUE(create_file(config.download_folder + "/kept.mp3", "abc"));
    ASSERT_TRUE(create_file(config.download_folder + "/gone.mp3", "abc"));

    enqueue("alice", "kept.mp3", 3);
    enqueue("alice", "gone.mp3", 3);
    enqueue("alice", "queued.mp3", 3);
    ASSERT_TRUE(delete_file(config.download_folder + "/gone.mp3"));

    downloads.clear_downloads({}, {}, true);

    EXPECT_NE(downloads.registry().find("alice", "kept.mp3"), nullptr);
    EXPECT_EQ(downloads.registry().find("alice", "gone.mp3"), nullptr);
    EXPECT_NE(downloads.registry().find("alice", "queued.mp3"), nullptr);
}

TEST_F(DownloadManagerTest, RetryDownloadRequeues) {
    Transfer* download = enqueue("alice", "1.mp3");
    deny("alice", "1.mp3", "Cancelled");
    ASSERT_EQ(download->status, TransferStatus::CANCELLED);

    downloads.retry_downloads({download});

    EXPECT_EQ(download->status, TransferStatus::QUEUED);
    EXPECT_FALSE(downloads.registry().is_failed(*download));
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 2u);
}

TEST_F(DownloadManagerTest, StartLoadsSavedList) {
    ASSERT_TRUE(create_directories(config.data_folder));
    ASSERT_TRUE(create_file(downloads.transfers_file_path(), R"([
        ["alice", "q.mp3", "dl", "Queued", 10, null, {}],
        ["bob", "off.mp3", "dl", "User logged off", 10, null, {}]
    ])"));

    downloads.start();

    ASSERT_EQ(downloads.registry().size(), 2u);
    Transfer* queued = downloads.registry().find("alice", "q.mp3");
    Transfer* offline = downloads.registry().find("bob", "off.mp3");
    EXPECT_FALSE(downloads.registry().is_queued(*queued));
    EXPECT_TRUE(downloads.registry().is_failed(*offline));

    ServerLoginEvent login;
    login.success = true;
    events.emit(login);

    EXPECT_TRUE(downloads.registry().is_queued(*queued));
    EXPECT_EQ(network.sent<QueueUpload>("alice").size(), 1u);
    EXPECT_TRUE(network.sent<QueueUpload>("bob").empty());

    UserStatusEvent online;
    online.username = "bob";
    online.status = UserStatus::ONLINE;
    events.emit(online);

    EXPECT_TRUE(downloads.registry().is_queued(*offline));
}

TEST_F(DownloadManagerTest, QuitSavesList) {
    enqueue("alice", "1.mp3");
    downloads.quit();

    EXPECT_EQ(downloads.registry().size(), 0u);
    auto loaded = TransferRegistry::load_transfers(downloads.transfers_file_path());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0]->virtual_path, "1.mp3");
}
