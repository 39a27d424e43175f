#include <gtest/gtest.h>
#include "errors.hpp"
#include "session_data_store.hpp"
#include "session_tracker.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>

using namespace continuity;

class SessionDataStoreTest : public ::testing::Test {
protected:
    static constexpr int64_t kTimeout = 1000;

    void SetUp() override {
        SessionTrackerConfig cfg;
        cfg.sessions_dir = dir.Sub("sessions");
        cfg.timeout_ms = kTimeout;
        tracker = std::make_unique<SessionTracker>(cfg, &clock);
        ASSERT_TRUE(tracker->Initialize().success);
        store = std::make_unique<SessionDataStore>(tracker.get(), &clock, dir.Sub("results"));
        ASSERT_TRUE(store->Initialize().success);
    }

    continuity_test::ScopedTempDir dir;
    ManualClock clock;
    std::unique_ptr<SessionTracker> tracker;
    std::unique_ptr<SessionDataStore> store;
};

TEST_F(SessionDataStoreTest, StoreThenGet) {
    ASSERT_TRUE(store->Store("decision", "DR-001", {{"choice", "sqlite"}, {"votes", 3}}));
    auto v = store->Get("decision", "DR-001");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ((*v)["choice"], "sqlite");
    EXPECT_EQ((*v)["votes"], 3);
    EXPECT_TRUE(store->Has("decision:DR-001"));
    EXPECT_FALSE(store->Get("decision", "DR-002").has_value());
}

TEST_F(SessionDataStoreTest, ValuesArePersistedAsNamespacedKeys) {
    ASSERT_TRUE(store->Store("notes", "today", "remember the index"));
    auto path = std::filesystem::path(tracker->SessionsDir()) / (store->CurrentSessionId() + ".json");
    auto j = nlohmann::json::parse(continuity_test::ReadAll(path.string()));
    EXPECT_EQ(j["notes:today"], "remember the index");

    SessionDataStore reopened(tracker.get(), &clock, dir.Sub("results"));
    auto v = reopened.GetKey("notes:today");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "remember the index");
}

TEST_F(SessionDataStoreTest, DecisionSurvivesSessionRollover) {
    auto first = store->CurrentSessionId();
    ASSERT_TRUE(store->Store("decision", "DR-014", "Java"));

    clock.Advance(kTimeout + 1);
    auto second = tracker->GetCurrentSessionId();
    EXPECT_NE(first, second);
    EXPECT_EQ(store->CurrentSessionId(), second);

    EXPECT_FALSE(store->Get("decision", "DR-014").has_value());
    auto v = store->RetrieveAcrossSessions("decision", "DR-014");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "Java");

    auto previous = store->GetPreviousSessionData(first, "decision:DR-014");
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, "Java");
}

TEST_F(SessionDataStoreTest, RetrieveAcrossSessionsPrefersActiveSession) {
    ASSERT_TRUE(store->Store("config", "mode", "old"));
    clock.Advance(kTimeout + 1);
    ASSERT_TRUE(store->Store("config", "mode", "new"));

    auto v = store->RetrieveAcrossSessions("config", "mode");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "new");
    EXPECT_FALSE(store->RetrieveAcrossSessions("config", "missing").has_value());
}

TEST_F(SessionDataStoreTest, DeleteAndClear) {
    EXPECT_FALSE(store->Delete("nothing:here"));

    ASSERT_TRUE(store->StoreKey("a", 1));
    ASSERT_TRUE(store->StoreKey("b", 2));
    EXPECT_TRUE(store->Delete("a"));
    EXPECT_FALSE(store->Has("a"));
    EXPECT_TRUE(store->Has("b"));

    ASSERT_TRUE(store->Clear());
    EXPECT_FALSE(store->Has("b"));
    EXPECT_TRUE(store->GetSessionState().data_keys.empty());
}

TEST_F(SessionDataStoreTest, ListSessionsSkipsIndex) {
    auto first = store->CurrentSessionId();
    ASSERT_TRUE(store->StoreKey("k", 1));
    clock.Advance(kTimeout + 1);
    ASSERT_TRUE(store->StoreKey("k", 2));
    auto second = store->CurrentSessionId();

    auto sessions = store->ListSessions();
    EXPECT_EQ(sessions.size(), 2u);
    EXPECT_NE(std::find(sessions.begin(), sessions.end(), first), sessions.end());
    EXPECT_NE(std::find(sessions.begin(), sessions.end(), second), sessions.end());
    EXPECT_EQ(std::find(sessions.begin(), sessions.end(), "index"), sessions.end());
}

TEST_F(SessionDataStoreTest, AssertAndCompleteTest) {
    ASSERT_TRUE(store->StoreKey("testId", "t-42"));
    ASSERT_TRUE(store->StoreKey("testName", "boundary survival"));

    auto passed = store->Assert("index written", true);
    EXPECT_TRUE(passed.passed);
    EXPECT_EQ(passed.message, "Assertion passed: index written");

    auto failed = store->Assert("score above 0.9", false, "score was 0.6");
    EXPECT_FALSE(failed.passed);
    EXPECT_EQ(failed.message, "score was 0.6");

    auto assertions = store->GetKey(SessionDataStore::kAssertionsKey);
    ASSERT_TRUE(assertions.has_value());
    EXPECT_EQ(assertions->size(), 2u);

    clock.Advance(250);
    auto summary = store->CompleteTest();
    EXPECT_EQ(summary["testId"], "t-42");
    EXPECT_EQ(summary["testName"], "boundary survival");
    EXPECT_EQ(summary["totalAssertions"], 2);
    EXPECT_EQ(summary["passedAssertions"], 1);
    EXPECT_DOUBLE_EQ(summary["successRate"].get<double>(), 50.0);
    EXPECT_TRUE(store->Has(SessionDataStore::kTestSummaryKey));
    EXPECT_TRUE(std::filesystem::exists(dir.Sub("results/t-42-report.json")));
}

TEST_F(SessionDataStoreTest, CompleteTestKeepsReportInsideResultsDir) {
    ASSERT_TRUE(store->StoreKey("testId", "../../escaped"));
    EXPECT_TRUE(store->Assert("ran", true).passed);

    auto summary = store->CompleteTest();
    EXPECT_EQ(summary["testId"], "../../escaped");
    EXPECT_EQ(summary["totalAssertions"], 1);
    EXPECT_TRUE(std::filesystem::exists(dir.Sub("results/unknown-report.json")));
    EXPECT_FALSE(std::filesystem::exists(dir.Sub("escaped-report.json")));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(dir.path()).parent_path() / "escaped-report.json"));
}

TEST_F(SessionDataStoreTest, CompleteTestWithoutAssertions) {
    auto summary = store->CompleteTest();
    EXPECT_EQ(summary["testId"], "unknown");
    EXPECT_EQ(summary["totalAssertions"], 0);
    EXPECT_DOUBLE_EQ(summary["successRate"].get<double>(), 0.0);
}

TEST_F(SessionDataStoreTest, CreateSessionBoundaryRecordsTrackerBoundary) {
    auto before = tracker->GetTokenBoundaries().size();
    auto marker = store->CreateSessionBoundary("handoff", {{"reason", "context full"}});
    ASSERT_TRUE(marker.success);
    EXPECT_EQ(marker.id.rfind("boundary-", 0), 0u);
    EXPECT_EQ(marker.session_id, store->CurrentSessionId());

    auto stored = store->GetKey("boundary-" + marker.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((*stored)["type"], "handoff");
    EXPECT_EQ((*stored)["data"]["reason"], "context full");

    auto boundaries = tracker->GetTokenBoundaries();
    ASSERT_EQ(boundaries.size(), before + 1);
    EXPECT_EQ(boundaries.back().id, marker.id);
    EXPECT_EQ(boundaries.back().type, "session_boundary");
    EXPECT_EQ(boundaries.back().metadata["boundaryType"], "handoff");
}

TEST_F(SessionDataStoreTest, SessionStateReportsKeysAndScore) {
    ASSERT_TRUE(store->Store("a", "b", true));
    auto state = store->GetSessionState();
    ASSERT_TRUE(state.success);
    EXPECT_EQ(state.session_id, tracker->GetCurrentSessionId());
    ASSERT_EQ(state.data_keys.size(), 1u);
    EXPECT_EQ(state.data_keys[0], "a:b");
    ASSERT_TRUE(state.proximity.has_value());
    EXPECT_EQ(*state.proximity, BoundaryProximity::kFar);
    EXPECT_GE(state.continuity_score, 0.0);
    EXPECT_LE(state.continuity_score, 1.0);

    auto j = ToJson(state);
    EXPECT_EQ(j["dataSize"], 1);
    EXPECT_EQ(j["boundaryProximity"], "far");
}

TEST_F(SessionDataStoreTest, FailedWriteLeavesCacheUnchanged) {
    ASSERT_TRUE(store->StoreKey("kept", 1));
    auto path = std::filesystem::path(tracker->SessionsDir()) / (store->CurrentSessionId() + ".json");
    std::filesystem::remove(path);
    std::filesystem::create_directory(path);

    EXPECT_FALSE(store->StoreKey("lost", 2));
    EXPECT_FALSE(store->Has("lost"));
    EXPECT_TRUE(store->Has("kept"));
}

TEST(SessionDataStoreConstructionTest, NullTrackerThrows) {
    EXPECT_THROW(SessionDataStore store(nullptr), ConfigurationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
