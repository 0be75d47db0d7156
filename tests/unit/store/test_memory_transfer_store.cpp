/**
 * @file test_memory_transfer_store.cpp
 * @brief Unit tests for the in-memory store and record filters
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/store/transfer_store.h>

#include "store_test_records.h"

namespace kcenon::blob_transfer::test {

class MemoryTransferStoreTest : public ::testing::Test {
protected:
    memory_transfer_store store_;
};

TEST_F(MemoryTransferStoreTest, FetchByKindInSaveOrder) {
    auto first = make_blob("photos");
    auto second = make_blob("photos");
    auto block = make_block(first, 0);
    ASSERT_TRUE(store_.save({first, block, second}).has_value());

    auto blobs = store_.fetch(transfer_kind::blob);
    ASSERT_TRUE(blobs.has_value());
    ASSERT_EQ(blobs.value().size(), 2u);
    EXPECT_EQ(base_of(blobs.value()[0]).id, first.id);
    EXPECT_EQ(base_of(blobs.value()[1]).id, second.id);

    auto blocks = store_.fetch(transfer_kind::block);
    ASSERT_TRUE(blocks.has_value());
    EXPECT_EQ(blocks.value().size(), 1u);
}

TEST_F(MemoryTransferStoreTest, UpsertKeepsOrder) {
    auto first = make_blob("photos");
    auto second = make_blob("photos");
    ASSERT_TRUE(store_.save({first, second}).has_value());

    first.state = transfer_state::paused;
    ASSERT_TRUE(store_.save({first}).has_value());

    auto blobs = store_.fetch(transfer_kind::blob);
    ASSERT_TRUE(blobs.has_value());
    ASSERT_EQ(blobs.value().size(), 2u);
    EXPECT_EQ(base_of(blobs.value()[0]).id, first.id);
    EXPECT_EQ(base_of(blobs.value()[0]).state, transfer_state::paused);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(MemoryTransferStoreTest, Filters) {
    auto multi = make_multi("photos");
    auto child = make_blob("photos", multi.id);
    auto root = make_blob("docs");
    root.state = transfer_state::failed;
    ASSERT_TRUE(store_.save({multi, child, root}).has_value());

    auto roots = store_.fetch(transfer_kind::blob, filters::has_no_parent());
    ASSERT_TRUE(roots.has_value());
    ASSERT_EQ(roots.value().size(), 1u);
    EXPECT_EQ(base_of(roots.value().front()).id, root.id);

    auto children = store_.fetch(transfer_kind::blob, filters::has_parent(multi.id));
    ASSERT_TRUE(children.has_value());
    ASSERT_EQ(children.value().size(), 1u);
    EXPECT_EQ(base_of(children.value().front()).id, child.id);

    auto docs = store_.fetch(transfer_kind::blob, filters::with_restoration_id("docs"));
    ASSERT_TRUE(docs.has_value());
    EXPECT_EQ(docs.value().size(), 1u);

    auto failed = store_.fetch(transfer_kind::blob,
                               filters::with_state(transfer_state::failed));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed.value().size(), 1u);
}

TEST_F(MemoryTransferStoreTest, RemoveCascades) {
    auto multi = make_multi("photos");
    auto blob = make_blob("photos", multi.id);
    auto block_a = make_block(blob, 0);
    auto block_b = make_block(blob, 1);
    auto other = make_blob("photos");
    ASSERT_TRUE(store_.save({multi, blob, block_a, block_b, other}).has_value());

    ASSERT_TRUE(store_.remove(multi.id).has_value());
    EXPECT_EQ(store_.size(), 1u);

    auto left = store_.fetch(transfer_kind::blob);
    ASSERT_TRUE(left.has_value());
    ASSERT_EQ(left.value().size(), 1u);
    EXPECT_EQ(base_of(left.value().front()).id, other.id);
}

TEST_F(MemoryTransferStoreTest, RemoveUnknownIsNoop) {
    ASSERT_TRUE(store_.save({make_blob("photos")}).has_value());
    EXPECT_TRUE(store_.remove(transfer_id::generate()).has_value());
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(MemoryTransferStoreTest, Clear) {
    ASSERT_TRUE(store_.save({make_blob("photos"), make_multi("photos")}).has_value());
    ASSERT_TRUE(store_.clear().has_value());
    EXPECT_EQ(store_.size(), 0u);
}

}  // namespace kcenon::blob_transfer::test
