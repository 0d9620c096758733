#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/event_manager.h"
#include "mock_collaborators.h"
#include <atomic>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

using namespace meshshare;
using namespace meshshare::testing_support;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Return;

// Transfer "t1" from an allowed peer:
//   a      (1)
//   b      (2)
//   dir/c  (3)
class AcceptTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        peers_.set_peer(PeerInfo("172.20.0.5", "peer-host", true));
        ON_CALL(engine_, finalize(_)).WillByDefault(Return(true));
        ON_CALL(engine_, accept(_, _, _)).WillByDefault(Return(true));

        events_ = std::make_unique<EventManager>(peers_, storage_, engine_);
        events_->handle_event(request_received_event("t1", "172.20.0.5",
            R"([{"id":"a","size":1},{"id":"b","size":2},{"id":"dir","size":0,"children":[{"id":"c","size":3}]}])"));
        ASSERT_TRUE(events_->get_transfer("t1").has_value());
    }

    StaticPeerDirectory peers_;
    MemoryTransferStorage storage_;
    NiceMock<MockTransferEngine> engine_;
    std::unique_ptr<EventManager> events_;
    const uint64_t no_limit_ = std::numeric_limits<uint64_t>::max();
};

TEST_F(AcceptTransferTest, AcceptWholeTransfer) {
    EXPECT_CALL(engine_, accept("t1", "/tmp/downloads", IsEmpty())).Times(1).WillOnce(Return(true));

    Transfer accepted;
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp/downloads", {}, no_limit_, &accepted), FileshareError::None);
    EXPECT_EQ(accepted.id, "t1");
    EXPECT_EQ(accepted.path, "/tmp/downloads");
    EXPECT_EQ(accepted.status, TransferStatus::Ongoing);

    auto stored = events_->get_transfer("t1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->path, "/tmp/downloads");
    EXPECT_EQ(stored->status, TransferStatus::Ongoing);
}

TEST_F(AcceptTransferTest, UnknownTransfer) {
    EXPECT_CALL(engine_, accept(_, _, _)).Times(0);
    EXPECT_EQ(events_->accept_transfer("missing", "/tmp", {}, no_limit_), FileshareError::TransferNotFound);
}

TEST_F(AcceptTransferTest, OutgoingTransferCannotBeAccepted) {
    ASSERT_EQ(events_->new_outgoing_transfer("o1", "172.20.0.5", "/home/user/file"), FileshareError::None);
    EXPECT_CALL(engine_, accept(_, _, _)).Times(0);
    EXPECT_EQ(events_->accept_transfer("o1", "/tmp", {}, no_limit_), FileshareError::TransferAcceptOutgoing);
}

TEST_F(AcceptTransferTest, SecondAcceptIsRejected) {
    EXPECT_CALL(engine_, accept("t1", _, _)).Times(1).WillOnce(Return(true));

    EXPECT_EQ(events_->accept_transfer("t1", "/tmp/first", {}, no_limit_), FileshareError::None);
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp/second", {}, no_limit_), FileshareError::TransferAlreadyAccepted);
    EXPECT_EQ(events_->get_transfer("t1")->path, "/tmp/first");
}

TEST_F(AcceptTransferTest, UnknownFileIsRejected) {
    EXPECT_CALL(engine_, accept(_, _, _)).Times(0);
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"a", "nope"}, no_limit_), FileshareError::FileNotFound);
    EXPECT_EQ(events_->get_transfer("t1")->status, TransferStatus::Requested);
}

TEST_F(AcceptTransferTest, SizeLimitCoversSelectedFilesOnly) {
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {}, 5), FileshareError::SizeLimitExceeded);
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"dir", "a"}, 3), FileshareError::SizeLimitExceeded);
    EXPECT_EQ(events_->get_transfer("t1")->status, TransferStatus::Requested);

    EXPECT_CALL(engine_, accept("t1", "/tmp", ElementsAre("a", "b"))).Times(1).WillOnce(Return(true));
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"a", "b"}, 3), FileshareError::None);
}

TEST_F(AcceptTransferTest, LimitEqualToSizeIsAccepted) {
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {}, 6), FileshareError::None);
}

TEST_F(AcceptTransferTest, PartialAcceptLeavesOtherFilesRequested) {
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"dir/c"}, no_limit_), FileshareError::None);

    events_->handle_event(transfer_started_event("t1", "dir/c"));

    auto transfer = events_->get_transfer("t1");
    ASSERT_TRUE(transfer.has_value());
    EXPECT_EQ(transfer->status, TransferStatus::Ongoing);
    EXPECT_EQ(transfer->total_size, 3u);
    EXPECT_EQ(find_file(transfer->files, "dir/c")->status, TransferStatus::Ongoing);
    EXPECT_EQ(find_file(transfer->files, "a")->status, TransferStatus::Requested);
    EXPECT_EQ(find_file(transfer->files, "b")->status, TransferStatus::Requested);
}

TEST_F(AcceptTransferTest, EngineFailureDoesNotRollBack) {
    EXPECT_CALL(engine_, accept("t1", _, _)).Times(1).WillOnce(Return(false));

    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {}, no_limit_), FileshareError::None);
    EXPECT_EQ(events_->get_transfer("t1")->status, TransferStatus::Ongoing);
}

TEST_F(AcceptTransferTest, ConcurrentAcceptsSucceedOnce) {
    EXPECT_CALL(engine_, accept("t1", _, _)).Times(1).WillOnce(Return(true));

    const int thread_count = 16;
    std::atomic<int> succeeded(0);
    std::atomic<int> already_accepted(0);
    std::atomic<bool> go(false);

    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; i++) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            FileshareError result = events_->accept_transfer("t1", "/tmp/dest" + std::to_string(i), {}, no_limit_);
            if (result == FileshareError::None) {
                succeeded++;
            } else if (result == FileshareError::TransferAlreadyAccepted) {
                already_accepted++;
            }
        });
    }

    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(already_accepted.load(), thread_count - 1);
    EXPECT_EQ(events_->get_transfer("t1")->status, TransferStatus::Ongoing);
}

TEST_F(AcceptTransferTest, SingleFileOverLimit) {
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"dir/c"}, 2), FileshareError::SizeLimitExceeded);
    EXPECT_EQ(events_->accept_transfer("t1", "/tmp", {"a"}, 2), FileshareError::None);
}
