/**
 * @file test_basic_scenarios.cpp
 * @brief Basic integration tests against a local container and a JSON store
 */

#include "test_fixtures.h"

namespace kcenon::blob_transfer::test {

// Round trip tests
class RoundTripTest : public ManagerFixture {};

TEST_F(RoundTripTest, UploadThenDownload) {
    auto source = create_test_file("report.bin", 5 * min_block_size + 123);

    auto upload_id = manager().upload(upload_request_for(source, "docs/report.bin"));
    ASSERT_TRUE(upload_id.has_value()) << upload_id.error().message;
    ASSERT_TRUE(wait_for_state(upload_id.value(), transfer_state::completed));

    EXPECT_TRUE(client_->blob_exists("docs/report.bin"));
    EXPECT_TRUE(files_equal(source, client_->blob_path("docs/report.bin")));
    EXPECT_EQ(manager().children(upload_id.value()).size(), 6u);

    auto target = download_dir_ / "report.bin";
    auto download_id = manager().download(download_request_for("docs/report.bin", target));
    ASSERT_TRUE(download_id.has_value()) << download_id.error().message;
    ASSERT_TRUE(wait_for_state(download_id.value(), transfer_state::completed));

    EXPECT_TRUE(files_equal(source, target));
    auto progress = manager().progress(download_id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->total_bytes, 5 * min_block_size + 123);
    EXPECT_TRUE(progress->is_complete());
}

TEST_F(RoundTripTest, EmptyFile) {
    auto source = create_test_file("empty.bin", 0);

    auto upload_id = manager().upload(upload_request_for(source, "empty.bin"));
    ASSERT_TRUE(upload_id.has_value());
    ASSERT_TRUE(wait_for_state(upload_id.value(), transfer_state::completed));
    EXPECT_TRUE(client_->blob_exists("empty.bin"));
    EXPECT_EQ(std::filesystem::file_size(client_->blob_path("empty.bin")), 0u);
}

TEST_F(RoundTripTest, UploadMultipleFiles) {
    std::vector<upload_request> requests;
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 3; ++i) {
        auto name = "photo_" + std::to_string(i) + ".jpg";
        sources.push_back(create_test_file(name, (i + 1) * min_block_size + 7,
                                           static_cast<unsigned int>(i)));
        requests.push_back(upload_request_for(sources.back(), "album/" + name));
    }

    auto multi = manager().upload_multiple(requests);
    ASSERT_TRUE(multi.has_value()) << multi.error().message;
    ASSERT_TRUE(wait_for_state(multi.value(), transfer_state::completed));

    for (int i = 0; i < 3; ++i) {
        auto name = "album/photo_" + std::to_string(i) + ".jpg";
        EXPECT_TRUE(files_equal(sources[i], client_->blob_path(name))) << name;
    }
    EXPECT_EQ(manager().find(multi.value())->destination, "album/photo_");
}

TEST_F(RoundTripTest, DownloadMissingBlobFails) {
    auto id = manager().download(download_request_for("nowhere.bin", download_dir_ / "x"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for_state(id.value(), transfer_state::failed));
    EXPECT_FALSE(manager().find(id.value())->error_message.empty());
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "x"));
}

TEST_F(RoundTripTest, UploadExistingBlobWithoutOverwriteFails) {
    auto source = create_test_file("dup.bin", min_block_size);
    auto first = manager().upload(upload_request_for(source, "dup.bin"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(wait_for_state(first.value(), transfer_state::completed));

    auto second = manager().upload(upload_request_for(source, "dup.bin"));
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(wait_for_state(second.value(), transfer_state::failed));

    auto request = upload_request_for(source, "dup.bin");
    request.options.overwrite = true;
    auto third = manager().upload(request);
    ASSERT_TRUE(third.has_value());
    EXPECT_TRUE(wait_for_state(third.value(), transfer_state::completed));
}

// Persistence tests
class PersistenceTest : public ManagerFixture {};

TEST_F(PersistenceTest, CompletedTransfersSurviveRestart) {
    auto source = create_test_file("a.bin", 2 * min_block_size);
    auto id = manager().upload(upload_request_for(source, "a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for_state(id.value(), transfer_state::completed));
    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(count_files(store_dir_, ".json"), 3u);

    ASSERT_NO_FATAL_FAILURE(start_manager());

    auto transfers = manager().transfers();
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0].id, id.value());
    EXPECT_EQ(transfers[0].state, transfer_state::completed);
    EXPECT_EQ(transfers[0].bytes_transferred, 2 * min_block_size);
    EXPECT_EQ(manager().children(id.value()).size(), 2u);
}

TEST_F(PersistenceTest, PausedUploadResumesInNewManager) {
    auto source = create_test_file("large.bin", 48 * min_block_size + 5);
    ASSERT_NO_FATAL_FAILURE(start_manager(1));

    auto id = manager().upload(upload_request_for(source, "large.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(manager().pause(id.value()).has_value());
    auto paused_state = state_of(id.value());
    ASSERT_TRUE(paused_state == transfer_state::paused ||
                paused_state == transfer_state::completed);

    ASSERT_NO_FATAL_FAILURE(start_manager());

    auto transfers = manager().transfers();
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0].state, paused_state);
    if (paused_state == transfer_state::paused) {
        ASSERT_TRUE(manager().resume(id.value()).has_value());
    }

    ASSERT_TRUE(wait_for_state(id.value(), transfer_state::completed));
    EXPECT_TRUE(files_equal(source, client_->blob_path("large.bin")));
}

TEST_F(PersistenceTest, ResumeAllAfterRestart) {
    auto first = create_test_file("one.bin", 20 * min_block_size, 1);
    auto second = create_test_file("two.bin", 20 * min_block_size, 2);
    ASSERT_NO_FATAL_FAILURE(start_manager(1));

    auto a = manager().upload(upload_request_for(first, "one.bin"));
    auto b = manager().upload(upload_request_for(second, "two.bin"));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_TRUE(manager().pause_all().has_value());

    ASSERT_NO_FATAL_FAILURE(start_manager());
    ASSERT_TRUE(manager().resume_all("backup").has_value());

    ASSERT_TRUE(wait_for_state(a.value(), transfer_state::completed));
    ASSERT_TRUE(wait_for_state(b.value(), transfer_state::completed));
    EXPECT_TRUE(files_equal(first, client_->blob_path("one.bin")));
    EXPECT_TRUE(files_equal(second, client_->blob_path("two.bin")));
}

TEST_F(PersistenceTest, RemoveDeletesRecords) {
    auto source = create_test_file("gone.bin", 3 * min_block_size);
    auto id = manager().upload(upload_request_for(source, "gone.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for_state(id.value(), transfer_state::completed));

    ASSERT_TRUE(manager().remove(id.value()).has_value());
    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(count_files(store_dir_, ".json"), 0u);

    ASSERT_NO_FATAL_FAILURE(start_manager());
    EXPECT_EQ(manager().count(), 0u);
}

// Reachability tests
class ReachabilityTest : public ManagerFixture {};

TEST_F(ReachabilityTest, NetworkLossPausesAndReturnResumes) {
    auto source = create_test_file("net.bin", 40 * min_block_size);
    ASSERT_NO_FATAL_FAILURE(start_manager(1));

    auto id = manager().upload(upload_request_for(source, "net.bin"));
    ASSERT_TRUE(id.has_value());

    monitor_->set_status(reachability_status::unreachable);
    auto state = state_of(id.value());
    EXPECT_TRUE(state == transfer_state::paused || state == transfer_state::completed);

    monitor_->set_status(reachability_status::reachable_lan);
    ASSERT_TRUE(wait_for_state(id.value(), transfer_state::completed));
    EXPECT_TRUE(files_equal(source, client_->blob_path("net.bin")));
}

}  // namespace kcenon::blob_transfer::test
