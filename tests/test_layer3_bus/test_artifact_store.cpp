/**
 * @file test_artifact_store.cpp
 * @brief Canonical layout, write-once moves and commit markers.
 */
#include "abus_bus.hpp"
#include "bus_test_harness.h"

#include <gtest/gtest.h>

using namespace artbus;
using namespace artbus::bus;
using namespace artbus::tests::helper;
using nlohmann::json;

namespace
{

std::string hash_of(std::string_view payload)
{
    return crypto::content_hash_of(payload);
}

CommitMarker marker_for(const ArtifactStore &store, const std::string &job_id,
                        std::string_view payload)
{
    CommitMarker marker;
    marker.manifest.job_id = job_id;
    marker.manifest.identity = make_identity("r1", "simulation", "fills", "fills-0001");
    marker.manifest.data_file = data_file_name(job_id);
    marker.manifest.bytes = payload.size();
    marker.manifest.content_hash = hash_of(payload);
    marker.canonical_path = store.canonical_path(marker.manifest.identity).string();
    marker.inbox_data = "/bus/inbox/" + data_file_name(job_id);
    marker.inbox_manifest = "/bus/inbox/" + manifest_file_name(job_id);
    marker.started_at = "2026-10-17T12:00:00.000Z";
    return marker;
}

} // namespace

TEST(ArtifactStoreTest, CanonicalPathIsDeterministic)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    const auto id = make_identity("r1", "simulation", "fills", "fills-0001");
    EXPECT_EQ(store.canonical_path(id), fs::path("/bus/store/simulation/fills/r1/fills-0001.parquet"));
    EXPECT_EQ(store.canonical_path(id), store.canonical_path(id));
    EXPECT_EQ(store.marker_path("job-1"), fs::path("/bus/store/.pending/job-1.json"));
}

TEST(ArtifactStoreTest, CommitMovesInboxFile)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    backend.put("/bus/inbox/job-1.parquet", "data");
    const auto id = make_identity("r1", "simulation", "fills", "fills-0001");

    auto outcome = store.commit("/bus/inbox/job-1.parquet", id, hash_of("data"));
    ASSERT_TRUE(outcome.is_ok()) << outcome.error_message();
    EXPECT_EQ(outcome.content(), CommitOutcome::Moved);
    EXPECT_FALSE(backend.exists("/bus/inbox/job-1.parquet"));
    EXPECT_EQ(backend.read_file(store.canonical_path(id)).content(), "data");
}

/**
 * Re-committing identical bytes discards the inbox copy; different bytes are
 * refused and both files stay where they are.
 */
TEST(ArtifactStoreTest, CommitIsWriteOnce)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    const auto id = make_identity("r1", "simulation", "fills", "fills-0001");
    backend.put("/bus/inbox/job-1.parquet", "data");
    ASSERT_TRUE(store.commit("/bus/inbox/job-1.parquet", id, hash_of("data")).is_ok());

    backend.put("/bus/inbox/job-2.parquet", "data");
    auto dup = store.commit("/bus/inbox/job-2.parquet", id, hash_of("data"));
    ASSERT_TRUE(dup.is_ok());
    EXPECT_EQ(dup.content(), CommitOutcome::AlreadyPresent);
    EXPECT_FALSE(backend.exists("/bus/inbox/job-2.parquet"));

    backend.put("/bus/inbox/job-3.parquet", "other");
    auto conflict = store.commit("/bus/inbox/job-3.parquet", id, hash_of("other"));
    ASSERT_TRUE(conflict.is_error());
    EXPECT_EQ(conflict.error(), BusError::ValidationError);
    EXPECT_TRUE(backend.exists("/bus/inbox/job-3.parquet"));
    EXPECT_EQ(backend.read_file(store.canonical_path(id)).content(), "data");
}

TEST(ArtifactStoreTest, FailedMoveIsCommitIOError)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    backend.put("/bus/inbox/job-1.parquet", "data");
    backend.fail_next(MemoryBackend::FaultOp::Rename);

    auto outcome = store.commit("/bus/inbox/job-1.parquet",
                                make_identity("r1", "simulation", "fills", "a"), hash_of("data"));
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error(), BusError::CommitIOError);
    EXPECT_TRUE(backend.exists("/bus/inbox/job-1.parquet"));
}

TEST(ArtifactStoreTest, MarkersRoundTripAndClear)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    ASSERT_TRUE(store.write_marker(marker_for(store, "job-b", "bbb")).is_ok());
    ASSERT_TRUE(store.write_marker(marker_for(store, "job-a", "aaa")).is_ok());
    EXPECT_TRUE(store.has_marker("job-a"));

    auto markers = store.list_markers();
    ASSERT_TRUE(markers.is_ok());
    ASSERT_EQ(markers.content().size(), 2u);
    EXPECT_EQ(markers.content()[0].manifest.job_id, "job-a");
    EXPECT_EQ(markers.content()[0].manifest.content_hash, hash_of("aaa"));
    EXPECT_EQ(markers.content()[1].inbox_manifest, "/bus/inbox/job-b.manifest.json");

    ASSERT_TRUE(store.clear_marker("job-a").is_ok());
    EXPECT_FALSE(store.has_marker("job-a"));
    EXPECT_EQ(store.list_markers().content().size(), 1u);
}

TEST(ArtifactStoreTest, MarkerWriteFailureIsCommitIOError)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    backend.fail_next(MemoryBackend::FaultOp::Write);
    auto st = store.write_marker(marker_for(store, "job-1", "x"));
    ASSERT_TRUE(st.is_error());
    EXPECT_EQ(st.error(), BusError::CommitIOError);
}

/**
 * Unreadable markers are skipped (and left in place) instead of failing the listing.
 */
TEST(ArtifactStoreTest, CorruptMarkersAreSkipped)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    backend.put(store.marker_path("job-bad"), "{ not json");
    backend.put(store.marker_path("job-empty"), json{{"job_id", "job-empty"}}.dump());
    ASSERT_TRUE(store.write_marker(marker_for(store, "job-ok", "ok")).is_ok());

    auto markers = store.list_markers();
    ASSERT_TRUE(markers.is_ok());
    ASSERT_EQ(markers.content().size(), 1u);
    EXPECT_EQ(markers.content()[0].manifest.job_id, "job-ok");
    EXPECT_TRUE(backend.exists(store.marker_path("job-bad")));
}

TEST(ArtifactStoreTest, MarkerFromJsonRequiresPaths)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    json j = marker_for(store, "job-1", "x").to_json();
    j.erase("canonical_path");
    auto parsed = CommitMarker::from_json(j);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error(), BusError::Corruption);
}

TEST(ArtifactStoreTest, StoredFilesExcludeMarkers)
{
    MemoryBackend backend;
    ArtifactStore store(backend, "/bus/store");
    backend.put("/bus/inbox/job-1.parquet", "data");
    ASSERT_TRUE(store.write_marker(marker_for(store, "job-1", "data")).is_ok());
    ASSERT_TRUE(store.commit("/bus/inbox/job-1.parquet",
                             make_identity("r1", "simulation", "fills", "fills-0001"),
                             hash_of("data"))
                    .is_ok());

    auto files = store.stored_files();
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.content().size(), 1u);
    EXPECT_EQ(files.content()[0], fs::path("/bus/store/simulation/fills/r1/fills-0001.parquet"));
}
