#include <gtest/gtest.h>
#include "../src/engine_events.h"
#include <string>

using namespace meshshare;

class EngineEventsTest : public ::testing::Test {
};

TEST_F(EngineEventsTest, DecodeRequestReceivedWithNestedTree) {
    auto event = decode_engine_event(R"({
        "type": "RequestReceived",
        "data": {
            "peer": "172.20.0.5",
            "transfer": "c13c619c-c70b-49b8-9396-72de88155c43",
            "files": [
                {
                    "id": "testfile-big",
                    "size": 10485760
                },
                {
                    "id": "dir",
                    "size": 0,
                    "children": {
                        "zeta.txt": { "size": 5 },
                        "alpha.txt": { "id": "alpha.txt", "size": 7 }
                    }
                }
            ]
        }
    })");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, EngineEventType::RequestReceived);
    EXPECT_EQ(event->transfer_id, "c13c619c-c70b-49b8-9396-72de88155c43");
    ASSERT_TRUE(event->request.has_value());
    EXPECT_FALSE(event->progress.has_value());
    EXPECT_FALSE(event->finish.has_value());

    const auto& request = *event->request;
    EXPECT_EQ(request.peer, "172.20.0.5");
    ASSERT_EQ(request.files.size(), 2u);
    EXPECT_EQ(request.files[0].id, "testfile-big");
    EXPECT_EQ(request.files[0].size, 10485760u);
    EXPECT_EQ(request.files[0].status, TransferStatus::Requested);

    // Children keep the order the engine wrote, ids fall back to the key
    ASSERT_EQ(request.files[1].children.size(), 2u);
    EXPECT_EQ(request.files[1].children[0].id, "zeta.txt");
    EXPECT_EQ(request.files[1].children[0].size, 5u);
    EXPECT_EQ(request.files[1].children[1].id, "alpha.txt");
    EXPECT_NE(find_file(request.files, "dir/alpha.txt"), nullptr);
}

TEST_F(EngineEventsTest, DecodeRequestQueuedWithoutPeer) {
    auto event = decode_engine_event(
        R"({"type":"RequestQueued","data":{"transfer":"t1","files":[{"id":"a","size":1,"children":[{"id":"b","size":2}]}]}})");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, EngineEventType::RequestQueued);
    ASSERT_TRUE(event->request.has_value());
    EXPECT_TRUE(event->request->peer.empty());
    EXPECT_NE(find_file(event->request->files, "a/b"), nullptr);
}

TEST_F(EngineEventsTest, DecodeStartedAndProgress) {
    auto started = decode_engine_event(R"({"type":"TransferStarted","data":{"transfer":"t1","file":"a/b"}})");
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->type, EngineEventType::TransferStarted);
    ASSERT_TRUE(started->progress.has_value());
    EXPECT_EQ(started->progress->file_id, "a/b");
    EXPECT_EQ(started->progress->transferred, 0u);

    auto progress = decode_engine_event(
        R"({"type":"TransferProgress","data":{"transfer":"t1","file":"a/b","transfered":4096}})");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->type, EngineEventType::TransferProgress);
    ASSERT_TRUE(progress->progress.has_value());
    EXPECT_EQ(progress->progress->transferred, 4096u);
}

TEST_F(EngineEventsTest, DecodeFileFinished) {
    auto event = decode_engine_event(R"({
        "type": "TransferFinished",
        "data": {
            "transfer": "t1",
            "reason": "FileFailed",
            "data": { "file": "a/b", "status": 15, "by_peer": true }
        }
    })");

    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->finish.has_value());
    EXPECT_EQ(event->finish->reason, FinishReason::FileFailed);
    EXPECT_EQ(event->finish->file_id, "a/b");
    ASSERT_TRUE(event->finish->status_code.has_value());
    EXPECT_EQ(*event->finish->status_code, 15);
    EXPECT_TRUE(event->finish->by_peer);

    auto downloaded = decode_engine_event(
        R"json({"type":"TransferFinished","data":{"transfer":"t1","reason":"FileDownloaded","data":{"file":"x","final_path":"/home/u/Downloads/x(1)"}}})json");
    ASSERT_TRUE(downloaded.has_value());
    EXPECT_EQ(downloaded->finish->reason, FinishReason::FileDownloaded);
    EXPECT_EQ(downloaded->finish->final_path, "/home/u/Downloads/x(1)");
    EXPECT_FALSE(downloaded->finish->status_code.has_value());
}

TEST_F(EngineEventsTest, DecodeTransferLevelFinishWithoutDetails) {
    auto event = decode_engine_event(
        R"({"type":"TransferFinished","data":{"transfer":"t1","reason":"TransferCanceled"}})");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->finish->reason, FinishReason::TransferCanceled);
    EXPECT_TRUE(event->finish->file_id.empty());
    EXPECT_FALSE(event->finish->by_peer);
}

TEST_F(EngineEventsTest, RejectsMalformedEvents) {
    EXPECT_FALSE(decode_engine_event("").has_value());
    EXPECT_FALSE(decode_engine_event("{not json").has_value());
    EXPECT_FALSE(decode_engine_event("[1,2,3]").has_value());
    EXPECT_FALSE(decode_engine_event(R"({"data":{"transfer":"t1"}})").has_value());
    EXPECT_FALSE(decode_engine_event(R"({"type":"Bogus","data":{"transfer":"t1"}})").has_value());
    EXPECT_FALSE(decode_engine_event(R"({"type":"TransferStarted"})").has_value());
    EXPECT_FALSE(decode_engine_event(R"({"type":"TransferStarted","data":{"file":"a"}})").has_value());
    EXPECT_FALSE(decode_engine_event(R"({"type":"TransferStarted","data":{"transfer":"t1"}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"TransferProgress","data":{"transfer":"t1","file":"a"}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"RequestReceived","data":{"transfer":"t1","files":[]}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"RequestReceived","data":{"transfer":"t1","peer":"p","files":[{"id":"a","size":-1}]}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"TransferFinished","data":{"transfer":"t1","reason":"Exploded"}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"TransferFinished","data":{"transfer":"t1","reason":"FileDownloaded"}})").has_value());
}

TEST_F(EngineEventsTest, IntegralFloatSizesAreAccepted) {
    auto event = decode_engine_event(
        R"({"type":"RequestReceived","data":{"transfer":"t1","peer":"p","files":[{"id":"a","size":1048576.0}]}})");
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->request.has_value());
    ASSERT_EQ(event->request->files.size(), 1u);
    EXPECT_EQ(event->request->files[0].size, 1048576u);

    auto progress = decode_engine_event(
        R"({"type":"TransferProgress","data":{"transfer":"t1","file":"a","transfered":512.0}})");
    ASSERT_TRUE(progress.has_value());
    ASSERT_TRUE(progress->progress.has_value());
    EXPECT_EQ(progress->progress->transferred, 512u);

    EXPECT_FALSE(decode_engine_event(
        R"({"type":"RequestReceived","data":{"transfer":"t1","peer":"p","files":[{"id":"a","size":1.5}]}})").has_value());
    EXPECT_FALSE(decode_engine_event(
        R"({"type":"RequestReceived","data":{"transfer":"t1","peer":"p","files":[{"id":"a","size":-2.0}]}})").has_value());
}

TEST_F(EngineEventsTest, NameConversions) {
    EXPECT_STREQ(event_type_to_string(EngineEventType::TransferProgress), "TransferProgress");
    EXPECT_EQ(event_type_from_string("RequestQueued"), EngineEventType::RequestQueued);
    EXPECT_FALSE(event_type_from_string("requestqueued").has_value());

    EXPECT_STREQ(finish_reason_to_string(FinishReason::FileUploaded), "FileUploaded");
    EXPECT_EQ(finish_reason_from_string("TransferFailed"), FinishReason::TransferFailed);

    EXPECT_TRUE(is_file_reason(FinishReason::FileCanceled));
    EXPECT_FALSE(is_file_reason(FinishReason::TransferFailed));
}
