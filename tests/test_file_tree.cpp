#include <gtest/gtest.h>
#include "../src/file_tree.h"
#include <vector>
#include <string>

using namespace meshshare;

class FileTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        // docs/
        //   a.txt   (10)
        //   img/
        //     b.png (20)
        // c.bin     (30)
        FileNode docs("docs", 0);
        FileNode img("img", 0);
        img.children.emplace_back("b.png", 20);
        docs.children.emplace_back("a.txt", 10);
        docs.children.push_back(img);

        files_.push_back(docs);
        files_.emplace_back("c.bin", 30);
    }

    std::vector<FileNode> files_;
};

TEST_F(FileTreeTest, FlattenListsDirectoriesBeforeEntries) {
    auto entries = flatten_files(files_);
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[0].path, "docs");
    EXPECT_EQ(entries[1].path, "docs/a.txt");
    EXPECT_EQ(entries[2].path, "docs/img");
    EXPECT_EQ(entries[3].path, "docs/img/b.png");
    EXPECT_EQ(entries[4].path, "c.bin");

    EXPECT_FALSE(entries[0].node->is_leaf());
    EXPECT_TRUE(entries[3].node->is_leaf());
}

TEST_F(FileTreeTest, CountLeaves) {
    EXPECT_EQ(count_leaves(files_), 3u);
    EXPECT_EQ(count_leaves({}), 0u);
}

TEST_F(FileTreeTest, FindFileByFullPath) {
    const FileNode* node = find_file(files_, "docs/img/b.png");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->size, 20u);

    EXPECT_NE(find_file(files_, "docs/img"), nullptr);
    EXPECT_EQ(find_file(files_, "b.png"), nullptr);
    EXPECT_EQ(find_file(files_, "docs/missing"), nullptr);
    EXPECT_EQ(find_file(files_, ""), nullptr);
}

TEST_F(FileTreeTest, SetFileStatusOnLeafAndDirectory) {
    set_file_status(files_, "c.bin", TransferStatus::Success);
    EXPECT_EQ(find_file(files_, "c.bin")->status, TransferStatus::Success);
    EXPECT_EQ(find_file(files_, "docs/a.txt")->status, TransferStatus::Requested);

    set_file_status(files_, "docs", TransferStatus::Canceled);
    EXPECT_EQ(find_file(files_, "docs/a.txt")->status, TransferStatus::Canceled);
    EXPECT_EQ(find_file(files_, "docs/img/b.png")->status, TransferStatus::Canceled);

    // Unknown paths are ignored
    set_file_status(files_, "nope", TransferStatus::Io);
    EXPECT_EQ(find_file(files_, "c.bin")->status, TransferStatus::Success);
}

TEST_F(FileTreeTest, ResolvePendingLeavesOnly) {
    set_file_status(files_, "docs/a.txt", TransferStatus::Success);
    find_file(files_, "c.bin")->status = TransferStatus::Ongoing;

    EXPECT_EQ(resolve_pending_files(files_, TransferStatus::Canceled), 2u);
    EXPECT_EQ(find_file(files_, "docs/a.txt")->status, TransferStatus::Success);
    EXPECT_EQ(find_file(files_, "docs/img/b.png")->status, TransferStatus::Canceled);
    EXPECT_EQ(find_file(files_, "c.bin")->status, TransferStatus::Canceled);

    EXPECT_EQ(resolve_pending_files(files_, TransferStatus::Canceled), 0u);
}

TEST_F(FileTreeTest, LeafSizes) {
    EXPECT_EQ(total_leaf_size(files_), 60u);
    EXPECT_EQ(leaf_size(*find_file(files_, "docs")), 30u);
    EXPECT_EQ(leaf_size(*find_file(files_, "c.bin")), 30u);
}

TEST_F(FileTreeTest, AggregateStatusKeepsCurrentWhilePending) {
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Ongoing);

    set_file_status(files_, "docs", TransferStatus::Success);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Ongoing);

    EXPECT_EQ(aggregate_status({}, TransferStatus::Requested), TransferStatus::Requested);
}

TEST_F(FileTreeTest, AggregateStatusTerminalOutcomes) {
    set_all_file_status(files_, TransferStatus::Success);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Success);

    set_all_file_status(files_, TransferStatus::Canceled);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Canceled);

    set_file_status(files_, "c.bin", TransferStatus::Io);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::FinishedWithErrors);

    // Success mixed with Canceled and no failures counts as success
    set_all_file_status(files_, TransferStatus::Success);
    set_file_status(files_, "c.bin", TransferStatus::Canceled);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Success);

    set_file_status(files_, "c.bin", TransferStatus::Ongoing);
    EXPECT_EQ(aggregate_status(files_, TransferStatus::Ongoing), TransferStatus::Ongoing);
}

TEST_F(FileTreeTest, StatusCodes) {
    EXPECT_EQ(status_from_code(4), TransferStatus::Transport);
    EXPECT_EQ(status_from_code(27), TransferStatus::FileModified);
    EXPECT_EQ(status_from_code(101), TransferStatus::Ongoing);
    EXPECT_FALSE(status_from_code(28).has_value());
    EXPECT_FALSE(status_from_code(-1).has_value());
    EXPECT_FALSE(status_from_code(99).has_value());

    EXPECT_EQ(failure_status_from_code(15), TransferStatus::Io);
    EXPECT_EQ(failure_status_from_code(std::nullopt), TransferStatus::BadStatus);
    EXPECT_EQ(failure_status_from_code(0), TransferStatus::BadStatus);
    EXPECT_EQ(failure_status_from_code(1), TransferStatus::BadStatus);
    EXPECT_EQ(failure_status_from_code(500), TransferStatus::BadStatus);
}

TEST_F(FileTreeTest, StatusClassification) {
    EXPECT_TRUE(is_terminal_status(TransferStatus::Success));
    EXPECT_TRUE(is_terminal_status(TransferStatus::FinishedWithErrors));
    EXPECT_FALSE(is_terminal_status(TransferStatus::Io));
    EXPECT_FALSE(is_terminal_status(TransferStatus::Ongoing));

    EXPECT_FALSE(is_resolved_status(TransferStatus::Requested));
    EXPECT_TRUE(is_resolved_status(TransferStatus::Canceled));

    EXPECT_TRUE(is_failure_status(TransferStatus::BadFile));
    EXPECT_FALSE(is_failure_status(TransferStatus::Success));
    EXPECT_FALSE(is_failure_status(TransferStatus::Requested));

    EXPECT_STREQ(status_to_string(TransferStatus::BadFile), "BadFile");
    EXPECT_STREQ(status_description(TransferStatus::Transport), "transport problem");
}
