// DownloadRecord JSON encoding and stream source expiry.

#include <gtest/gtest.h>

#include "support/TestDoubles.hpp"

namespace reelq::test {
namespace {

TEST(DownloadRecordTest, UnknownFieldsAreIgnored) {
    auto j = nlohmann::json::parse(R"({
        "id": "abc",
        "content": {"contentId": "tt9", "title": "Movie", "rating": 8.1},
        "state": "downloading",
        "progress": 0.5,
        "quality": "720p",
        "addedByVersion": "9.9",
        "source": {"url": "https://cdn/x.mpd", "type": "dash", "ttl": 30}
    })");

    auto record = DownloadRecord::fromJson(j);

    EXPECT_EQ(record.id, "abc");
    EXPECT_EQ(record.content.contentId, "tt9");
    EXPECT_EQ(record.content.title, "Movie");
    EXPECT_EQ(record.state, DownloadState::Downloading);
    EXPECT_DOUBLE_EQ(record.progress, 0.5);
    ASSERT_TRUE(record.source.has_value());
    EXPECT_EQ(record.source->type, StreamType::Dash);
}

TEST(DownloadRecordTest, MissingFieldsFallBackToDefaults) {
    auto record = DownloadRecord::fromJson(nlohmann::json{{"id", "only-id"}});

    EXPECT_EQ(record.id, "only-id");
    EXPECT_EQ(record.state, DownloadState::Pending);
    EXPECT_EQ(record.pauseReason, PauseReason::None);
    EXPECT_DOUBLE_EQ(record.progress, 0.0);
    EXPECT_FALSE(record.localArtifactPath.has_value());
    EXPECT_FALSE(record.source.has_value());
    EXPECT_FALSE(record.completedAt.has_value());
    EXPECT_FALSE(record.content.season.has_value());
}

TEST(DownloadRecordTest, UnknownEnumValuesFallBack) {
    auto record = DownloadRecord::fromJson(nlohmann::json{
        {"id", "x"}, {"state", "archived"}, {"pauseReason", "battery"}});

    EXPECT_EQ(record.state, DownloadState::Pending);
    EXPECT_EQ(record.pauseReason, PauseReason::None);
    EXPECT_EQ(streamTypeFromString("rtmp"), StreamType::Direct);
}

TEST(DownloadRecordTest, TimestampsKeepMillisecondPrecision) {
    auto record = makeRecord("t");
    record.createdAt = TimePoint(std::chrono::milliseconds(1700000000123));
    record.updatedAt = TimePoint(std::chrono::milliseconds(1700000000456));
    record.completedAt = TimePoint(std::chrono::milliseconds(1700000000789));

    auto j = record.toJson();
    EXPECT_EQ(j["createdAt"].get<int64_t>(), 1700000000123);

    auto decoded = DownloadRecord::fromJson(j);
    EXPECT_EQ(decoded.createdAt, record.createdAt);
    EXPECT_EQ(decoded.updatedAt, record.updatedAt);
    EXPECT_EQ(decoded.completedAt, record.completedAt);
}

TEST(DownloadRecordTest, StateNamesAreStable) {
    EXPECT_STREQ(toString(DownloadState::Pending), "pending");
    EXPECT_STREQ(toString(DownloadState::Downloading), "downloading");
    EXPECT_STREQ(toString(DownloadState::Paused), "paused");
    EXPECT_STREQ(toString(DownloadState::Completed), "completed");
    EXPECT_STREQ(toString(DownloadState::Failed), "failed");
    EXPECT_STREQ(toString(PauseReason::CellularPolicy), "cellular");
    EXPECT_STREQ(toString(PauseReason::Interrupted), "interrupted");
}

TEST(StreamSourceTest, ExpiryIsOptional) {
    auto source = makeSource("https://cdn/a.mp4");
    auto now = Clock::now();

    EXPECT_FALSE(source.isExpired(now));

    source.expiresAt = now + std::chrono::minutes(1);
    EXPECT_FALSE(source.isExpired(now));

    source.expiresAt = now;
    EXPECT_TRUE(source.isExpired(now));
}

} // namespace
} // namespace reelq::test
