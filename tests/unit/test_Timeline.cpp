#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "timeline/Manager.hpp"
#include "timeline/Timeline.hpp"

#include <fstream>

namespace fs = std::filesystem;
using namespace fa;
using namespace fa::timeline;

class TimelineTest : public ::testing::Test {
protected:
    test::TempDir dir;
    runtime::Context ctx = test::makeContext();
    std::unique_ptr<Manager> manager;

    void SetUp() override { manager = std::make_unique<Manager>(ctx, dir.path()); }

    static nlohmann::json text(const std::string& title) { return {{"title", title}, {"text", "body"}}; }
};

TEST_F(TimelineTest, PendingEventCommitsOnScopeExit) {
    const auto t = manager->newTimeline("alerts");
    std::string id;
    {
        auto ev = t->createEvent("TEXT", 1000, text("boot"));
        id = ev.id();
        EXPECT_EQ(t->size(), 0u);
    }
    ASSERT_EQ(t->size(), 1u);

    const auto events = t->listEvents();
    EXPECT_EQ(events.front().id, id);
    EXPECT_EQ(events.front().event_type, "TEXT");
    EXPECT_EQ(events.front().record["title"], "boot");
    EXPECT_EQ(events.front().record["_id"], id);
    EXPECT_EQ(events.front().record["timestamp"], 1000);
}

TEST_F(TimelineTest, PendingEventWritesNothingWhenScopeThrows) {
    const auto t = manager->newTimeline("alerts");
    EXPECT_THROW({
        auto ev = t->createEvent("TEXT", std::nullopt, text("doomed"));
        throw std::runtime_error("work failed");
    }, std::runtime_error);
    EXPECT_EQ(t->size(), 0u);
}

TEST_F(TimelineTest, AbandonedEventIsNotWritten) {
    const auto t = manager->newTimeline("alerts");
    {
        auto ev = t->createEvent("TEXT");
        ev.abandon();
    }
    EXPECT_TRUE(t->empty());
}

TEST_F(TimelineTest, UnknownEventTypeIsRejected) {
    const auto t = manager->newTimeline("alerts");
    EXPECT_THROW((void)t->createEvent("VIDEO"), UnknownEventKind);
    EXPECT_TRUE(t->empty());
}

TEST_F(TimelineTest, FullTimelineRejectsNewEventsWithoutChangingCount) {
    const auto t = manager->newTimeline("t", 2);
    t->addEvent("TEXT", 1, text("one"));
    t->addEvent("TEXT", 2, text("two"));

    EXPECT_THROW((void)t->createEvent("TEXT", 3, text("three")), TimelineFull);
    EXPECT_EQ(t->size(), 2u);

    t->clear({t->listEvents().front().id});
    EXPECT_NO_THROW(t->addEvent("TEXT", 4, text("four")));
    EXPECT_EQ(t->size(), 2u);
    EXPECT_THROW((void)t->createEvent("TEXT", 5), TimelineFull);
}

TEST_F(TimelineTest, SortedListingOrdersByTimestampAndIsStable) {
    const auto t = manager->newTimeline("alerts");
    for (const int64_t ts : {50, 10, 30, 10, 40, 30}) t->addEvent("TEXT", ts, text(std::to_string(ts)));

    const auto first = t->listEvents(true);
    ASSERT_EQ(first.size(), 6u);
    for (size_t i = 1; i < first.size(); ++i) EXPECT_LE(first[i - 1].timestamp, first[i].timestamp);

    for (int round = 0; round < 5; ++round) {
        const auto again = t->listEvents(true);
        ASSERT_EQ(again.size(), first.size());
        for (size_t i = 0; i < again.size(); ++i) EXPECT_EQ(again[i].id, first[i].id);
    }
}

TEST_F(TimelineTest, ClearRemovesOnlyNamedIdsAndIgnoresUnknownOnes) {
    const auto t = manager->newTimeline("alerts");
    t->addEvent("TEXT", 1, text("a")).addEvent("TEXT", 2, text("b")).addEvent("TEXT", 3, text("c"));
    const auto events = t->listEvents();

    t->clear({events[1].id, "TEXT_999_12345", "../escape"});

    const auto left = t->listEvents();
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0].id, events[0].id);
    EXPECT_EQ(left[1].id, events[2].id);
}

TEST_F(TimelineTest, UnreadableRecordsAndTempFilesAreSkipped) {
    const auto t = manager->newTimeline("alerts");
    t->addEvent("TEXT", 1, text("ok"));
    std::ofstream(t->path() / "garbage.json") << "{not json";
    std::ofstream(t->path() / ".TEXT_2_1.json.tmp") << "{}";

    const auto events = t->listEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().record["title"], "ok");
}

TEST_F(TimelineTest, RecordsWithMistypedFieldsAreSkipped) {
    const auto t = manager->newTimeline("alerts");
    t->addEvent("TEXT", 1, text("ok"));
    std::ofstream(t->path() / "bad_stamp.json") << R"({"_id": "bad_stamp", "timestamp": "yesterday"})";
    std::ofstream(t->path() / "bad_id.json") << R"({"_id": 42, "timestamp": 3})";

    const auto events = t->listEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events.front().record["title"], "ok");
}

TEST_F(TimelineTest, AttachmentsAreEmbeddedAsBase64) {
    const auto t = manager->newTimeline("photos");
    const auto file = dir / "snap.jpg";
    std::ofstream(file, std::ios::binary) << "abc";

    t->createEvent("IMAGE", 7, {{"title", "door"}}).attach(file, "front");

    const auto record = t->listEvents().front().record;
    EXPECT_EQ(record["event_type"], "IMAGE");
    EXPECT_EQ(record["image_format"], "jpg");
    ASSERT_EQ(record["attachments"].size(), 1u);
    EXPECT_EQ(record["attachments"][0]["name"], "front");
    EXPECT_EQ(record["attachments"][0]["filename"], "snap.jpg");
    EXPECT_EQ(record["attachments"][0]["data"], "YWJj");
}

TEST_F(TimelineTest, ClearAllEmptiesTheTimeline) {
    const auto t = manager->newTimeline("alerts");
    t->addEvent("TEXT", 1).addEvent("TEXT", 2);
    t->clearAll();
    EXPECT_TRUE(t->empty());
}

TEST_F(TimelineTest, ManagerLooksUpTimelinesByName) {
    manager->newTimeline("alerts");
    EXPECT_EQ(manager->get("alerts")->name(), "alerts");
    EXPECT_THROW((void)manager->get("missing"), UnknownTimeline);
    EXPECT_THROW(manager->newTimeline("../up"), std::invalid_argument);
}

TEST_F(TimelineTest, FromConfigCreatesConfiguredTimelinesUnderDeviceClass) {
    config::Config cfg;
    cfg.device.device_class = "pump";
    cfg.timelines.path = dir.path();
    cfg.timelines.entries = {{"alerts", 3}, {"log", std::nullopt}};
    const auto configured = Manager::fromConfig(test::makeContext(cfg));

    EXPECT_EQ(configured->root(), dir.path() / "pump");
    EXPECT_EQ(configured->get("alerts")->maxEvents(), 3u);
    EXPECT_FALSE(configured->get("log")->maxEvents().has_value());
    EXPECT_TRUE(fs::is_directory(dir.path() / "pump" / "log"));
}
