#include <gtest/gtest.h>
#include "../src/transfer_storage.h"
#include "../src/fs.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

using namespace meshshare;

class TransferStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        history_file_ = "/tmp/meshshare_history_test_" + std::to_string(getpid()) + ".json";
        clean_test_files();
    }

    void TearDown() override {
        clean_test_files();
    }

    void clean_test_files() {
        if (file_exists(history_file_)) delete_file(history_file_);
    }

    Transfer finished_transfer(const std::string& id) {
        FileNode dir("photos", 0);
        dir.children.emplace_back("one.jpg", 10);
        dir.children.emplace_back("two.jpg", 20);
        dir.children[0].status = TransferStatus::Success;
        dir.children[0].transferred = 10;
        dir.children[1].status = TransferStatus::Io;

        std::vector<FileNode> files;
        files.push_back(dir);

        Transfer transfer = make_incoming_transfer(id, "172.20.0.5", files);
        transfer.status = TransferStatus::FinishedWithErrors;
        transfer.path = "/home/user/Downloads";
        transfer.total_size = 30;
        transfer.total_transferred = 10;
        transfer.finalized = true;
        return transfer;
    }

    std::string history_file_;
};

TEST_F(TransferStorageTest, MissingFileMeansEmptyHistory) {
    JsonFileTransferStorage storage(history_file_);
    EXPECT_TRUE(storage.load().empty());
    EXPECT_FALSE(file_exists(history_file_));
    EXPECT_EQ(storage.get_file_path(), history_file_);
}

TEST_F(TransferStorageTest, StoredTransfersSurviveRestart) {
    Transfer original = finished_transfer("t1");
    {
        JsonFileTransferStorage storage(history_file_);
        ASSERT_TRUE(storage.store(original));
    }
    ASSERT_TRUE(file_exists(history_file_));

    JsonFileTransferStorage reopened(history_file_);
    auto history = reopened.load();
    ASSERT_EQ(history.size(), 1u);

    const Transfer& restored = history[0];
    EXPECT_EQ(restored.id, "t1");
    EXPECT_EQ(restored.direction, TransferDirection::Incoming);
    EXPECT_EQ(restored.peer, "172.20.0.5");
    EXPECT_EQ(restored.status, TransferStatus::FinishedWithErrors);
    EXPECT_EQ(restored.path, "/home/user/Downloads");
    EXPECT_EQ(restored.total_size, 30u);
    EXPECT_EQ(restored.total_transferred, 10u);
    EXPECT_TRUE(restored.finalized);

    auto created_ms = [](const Transfer& transfer) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(transfer.created.time_since_epoch()).count();
    };
    EXPECT_EQ(created_ms(restored), created_ms(original));

    const FileNode* two = find_file(restored.files, "photos/two.jpg");
    ASSERT_NE(two, nullptr);
    EXPECT_EQ(two->status, TransferStatus::Io);
    EXPECT_EQ(two->size, 20u);
    EXPECT_EQ(find_file(restored.files, "photos/one.jpg")->transferred, 10u);
}

TEST_F(TransferStorageTest, StoreReplacesSameId) {
    JsonFileTransferStorage storage(history_file_);
    Transfer transfer = finished_transfer("t1");
    ASSERT_TRUE(storage.store(transfer));
    ASSERT_TRUE(storage.store(finished_transfer("t2")));

    transfer.status = TransferStatus::Canceled;
    ASSERT_TRUE(storage.store(transfer));

    auto history = storage.load();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].id, "t1");
    EXPECT_EQ(history[0].status, TransferStatus::Canceled);
    EXPECT_EQ(history[1].id, "t2");

    nlohmann::json json = nlohmann::json::parse(read_file_text_cpp(history_file_));
    ASSERT_TRUE(json.is_array());
    EXPECT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0]["status"], static_cast<int>(TransferStatus::Canceled));
}

TEST_F(TransferStorageTest, OutgoingDirectionIsKept) {
    JsonFileTransferStorage storage(history_file_);
    Transfer outgoing = make_outgoing_transfer("o1", "172.20.0.6", "/home/user/a.txt");
    outgoing.status = TransferStatus::Success;
    ASSERT_TRUE(storage.store(outgoing));

    JsonFileTransferStorage reopened(history_file_);
    auto history = reopened.load();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].direction, TransferDirection::Outgoing);
    EXPECT_EQ(history[0].path, "/home/user/a.txt");
}

TEST_F(TransferStorageTest, CorruptHistoryIsNotOverwritten) {
    ASSERT_TRUE(create_file(history_file_, "{ definitely not a history"));

    JsonFileTransferStorage storage(history_file_);
    EXPECT_TRUE(storage.load().empty());
    EXPECT_FALSE(storage.store(finished_transfer("t1")));
    EXPECT_EQ(read_file_text_cpp(history_file_), "{ definitely not a history");
}

TEST_F(TransferStorageTest, InvalidEntriesAreSkipped) {
    ASSERT_TRUE(create_file(history_file_,
        R"([{"id":"good","status":0,"files":[]},{"status":1},{"id":"","status":0}])"));

    JsonFileTransferStorage storage(history_file_);
    auto history = storage.load();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, "good");
    EXPECT_EQ(history[0].status, TransferStatus::Success);
}
