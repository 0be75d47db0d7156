/**
 * @file test_client_registry.cpp
 * @brief Unit tests for restoration id to client lookup
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/client/client_registry.h>

#include "../test_fakes.h"

#include <memory>

namespace kcenon::blob_transfer::test {

class ClientRegistryTest : public ::testing::Test {
protected:
    client_registry registry_;
};

TEST_F(ClientRegistryTest, RegisterAndFind) {
    auto client = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(client).has_value());

    EXPECT_EQ(registry_.find("photos"), client);
    EXPECT_TRUE(registry_.is_registered("photos"));
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ClientRegistryTest, UnknownIdReturnsNull) {
    EXPECT_EQ(registry_.find("missing"), nullptr);
    EXPECT_FALSE(registry_.is_registered("missing"));
}

TEST_F(ClientRegistryTest, RejectsNullAndEmptyId) {
    auto null_result = registry_.register_client(nullptr);
    ASSERT_FALSE(null_result.has_value());
    EXPECT_EQ(null_result.error().code, error_code::invalid_restoration_id);

    auto empty = registry_.register_client(std::make_shared<fake_storage_client>(""));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::invalid_restoration_id);
}

TEST_F(ClientRegistryTest, DuplicateLiveClientRejected) {
    log_capture capture;
    auto first = std::make_shared<fake_storage_client>("photos");
    auto second = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(first).has_value());

    auto again = registry_.register_client(second);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::duplicate_restoration_id);
    EXPECT_EQ(registry_.find("photos"), first);
    EXPECT_EQ(capture.count(log_level::warn), 1u);
}

TEST_F(ClientRegistryTest, ExpiredClientCanBeReplaced) {
    auto first = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(first).has_value());
    first.reset();

    auto second = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(second).has_value());
    EXPECT_EQ(registry_.find("photos"), second);
}

TEST_F(ClientRegistryTest, DoesNotKeepClientsAlive) {
    auto client = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(client).has_value());
    std::weak_ptr<fake_storage_client> watch = client;
    client.reset();

    EXPECT_TRUE(watch.expired());
    EXPECT_EQ(registry_.find("photos"), nullptr);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ClientRegistryTest, Unregister) {
    auto client = std::make_shared<fake_storage_client>("photos");
    ASSERT_TRUE(registry_.register_client(client).has_value());

    EXPECT_TRUE(registry_.unregister_client("photos"));
    EXPECT_FALSE(registry_.unregister_client("photos"));
    EXPECT_EQ(registry_.find("photos"), nullptr);
}

TEST_F(ClientRegistryTest, SeveralRestorationIds) {
    auto photos = std::make_shared<fake_storage_client>("photos");
    auto docs = std::make_shared<fake_storage_client>("docs");
    ASSERT_TRUE(registry_.register_client(photos).has_value());
    ASSERT_TRUE(registry_.register_client(docs).has_value());

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.find("docs")->endpoint(), "fake://docs");
}

}  // namespace kcenon::blob_transfer::test
