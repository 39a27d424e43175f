#include <gtest/gtest.h>
#include "context_assembler.hpp"
#include "errors.hpp"
#include "providers/session_provider.hpp"
#include "session_data_store.hpp"
#include "session_tracker.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace continuity;

namespace {

ContextItem MakeItem(const std::string& id, double priority, const std::string& type = "note") {
    ContextItem item;
    item.type = type;
    item.id = id;
    item.title = "Title " + id;
    item.content = "Content of " + id;
    item.priority = priority;
    return item;
}

// Returns a fixed item list and records how it was called.
class FakeProvider : public IContextProvider {
public:
    FakeProvider(std::string name, std::vector<ContextItem> items, int* calls = nullptr,
                 ProviderOptions* last_options = nullptr)
        : name_(std::move(name)), items_(std::move(items)), calls_(calls), last_options_(last_options) {}

    std::string Name() const override { return name_; }

    std::vector<ContextItem> Provide(const std::string&, const ProviderOptions& options) override {
        if (calls_) (*calls_)++;
        if (last_options_) *last_options_ = options;
        return items_;
    }

private:
    std::string name_;
    std::vector<ContextItem> items_;
    int* calls_;
    ProviderOptions* last_options_;
};

template <typename E>
class ThrowingProvider : public IContextProvider {
public:
    explicit ThrowingProvider(std::string name) : name_(std::move(name)) {}
    std::string Name() const override { return name_; }
    std::vector<ContextItem> Provide(const std::string&, const ProviderOptions&) override {
        throw E("provider exploded");
    }

private:
    std::string name_;
};

class NonStandardThrowingProvider : public IContextProvider {
public:
    std::string Name() const override { return "vision"; }
    std::vector<ContextItem> Provide(const std::string&, const ProviderOptions&) override { throw 42; }
};

class FakeEmbeddingBackend : public IEmbeddingBackend {
public:
    std::string Name() const override { return "fake"; }
    std::optional<std::vector<double>> Embed(const std::string&, std::string*) override {
        return std::vector<double>{0.1, 0.2, 0.3, 0.4};
    }
};

}  // namespace

class ContextAssemblerTest : public ::testing::Test {
protected:
    static constexpr int64_t kTtl = 1000;

    void SetUp() override {
        SessionTrackerConfig tcfg;
        tcfg.sessions_dir = dir.Sub("sessions");
        tcfg.timeout_ms = 60 * 60 * 1000;
        tracker = std::make_unique<SessionTracker>(tcfg, &clock);
        store = std::make_unique<SessionDataStore>(tracker.get(), &clock, dir.Sub("results"));

        cfg.context_dir = dir.Sub("context");
        cfg.cache_ttl_ms = kTtl;
    }

    ContextAssembler& Build(IEmbeddingBackend* backend = nullptr) {
        assembler = std::make_unique<ContextAssembler>(cfg, store.get(), backend, &clock);
        EXPECT_TRUE(assembler->Initialize().success);
        return *assembler;
    }

    continuity_test::ScopedTempDir dir;
    ManualClock clock;
    AssemblerConfig cfg;
    std::unique_ptr<SessionTracker> tracker;
    std::unique_ptr<SessionDataStore> store;
    std::unique_ptr<ContextAssembler> assembler;
};

TEST_F(ContextAssemblerTest, ItemsSortedByPriority) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("B", 0.5)}));
    a.RegisterProvider(std::make_unique<FakeProvider>("adaptive", std::vector<ContextItem>{MakeItem("A", 0.9)}));

    auto out = a.GenerateContext("what did we decide");
    ASSERT_TRUE(out.success);
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.items[0].id, "A");
    EXPECT_EQ(out.items[1].id, "B");
    EXPECT_EQ(out.strategy, Strategy::kStandard);
}

TEST_F(ContextAssemblerTest, CacheHitWithinTtlAndMissAfterExpiry) {
    auto& a = Build();
    int calls = 0;
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}, &calls));

    auto first = a.GenerateContext("q");
    EXPECT_FALSE(first.from_cache);
    auto second = a.GenerateContext("q");
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(second.items.size(), 1u);
    EXPECT_EQ(second.items[0].id, "v");

    a.GenerateContext("another query");
    EXPECT_EQ(calls, 2);

    clock.Advance(kTtl + 1);
    auto third = a.GenerateContext("q");
    EXPECT_FALSE(third.from_cache);
    EXPECT_EQ(calls, 3);
}

TEST_F(ContextAssemblerTest, CacheDisabledAlwaysRunsProviders) {
    cfg.cache_enabled = false;
    auto& a = Build();
    int calls = 0;
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}, &calls));
    a.GenerateContext("q");
    a.GenerateContext("q");
    EXPECT_EQ(calls, 2);
}

TEST_F(ContextAssemblerTest, EmptyResultIsNotCachedAndFails) {
    auto& a = Build();
    int calls = 0;
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{}, &calls));

    auto out = a.GenerateContext("q");
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error, "no context available");
    EXPECT_TRUE(out.items.empty());
    a.GenerateContext("q");
    EXPECT_EQ(calls, 2);
}

TEST_F(ContextAssemblerTest, ThrowingProviderContributesNothing) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<ThrowingProvider<std::runtime_error>>("vision"));
    a.RegisterProvider(std::make_unique<FakeProvider>("session", std::vector<ContextItem>{MakeItem("s", 0.7)}));

    auto out = a.GenerateContext("q");
    ASSERT_TRUE(out.success);
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].id, "s");
}

TEST_F(ContextAssemblerTest, NonStandardExceptionFromProviderIsContained) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<NonStandardThrowingProvider>());
    a.RegisterProvider(std::make_unique<FakeProvider>("session", std::vector<ContextItem>{MakeItem("s", 0.7)}));

    GeneratedContext out;
    EXPECT_NO_THROW(out = a.GenerateContext("q"));
    ASSERT_TRUE(out.success);
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].id, "s");
}

TEST_F(ContextAssemblerTest, InvariantViolationPropagates) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<ThrowingProvider<InvariantViolation>>("vision"));
    EXPECT_THROW(a.GenerateContext("q"), InvariantViolation);
}

TEST_F(ContextAssemblerTest, SemanticFallbackWhenProvidersAreEmpty) {
    FakeEmbeddingBackend backend;
    auto& a = Build(&backend);

    auto out = a.GenerateContext("how do sessions roll over");
    ASSERT_TRUE(out.success);
    EXPECT_TRUE(out.fallback);
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].type, "semantic");
    EXPECT_EQ(out.items[0].title, "Semantic Context");
    EXPECT_DOUBLE_EQ(out.items[0].priority.value_or(0), 0.85);
    EXPECT_NE(out.items[0].content.find("4 dimensions"), std::string::npos);

    auto empty_query = a.GenerateContext("");
    EXPECT_FALSE(empty_query.success);
}

TEST_F(ContextAssemblerTest, NoBackendMeansNoFallback) {
    auto& a = Build();
    auto out = a.GenerateContext("anything");
    EXPECT_FALSE(out.success);
    EXPECT_FALSE(out.fallback);
}

TEST_F(ContextAssemblerTest, VisionFocusedBoostIsClamped) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>(
        "vision", std::vector<ContextItem>{MakeItem("high", 0.9), MakeItem("low", 0.5)}));

    ContextRequest req;
    req.strategy = "vision-focused";
    auto out = a.GenerateContext("q", req);
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.strategy, Strategy::kVisionFocused);
    EXPECT_DOUBLE_EQ(*out.items[0].priority, 1.0);
    EXPECT_DOUBLE_EQ(*out.items[1].priority, 0.7);
}

TEST_F(ContextAssemblerTest, MinimalTakesFirstVisionItemAndNarrowsRecall) {
    auto& a = Build();
    ProviderOptions seen;
    a.RegisterProvider(std::make_unique<FakeProvider>(
        "vision", std::vector<ContextItem>{MakeItem("v1", 0.9), MakeItem("v2", 0.8)}));
    a.RegisterProvider(std::make_unique<FakeProvider>("adaptive", std::vector<ContextItem>{}, nullptr, &seen));

    ContextRequest req;
    req.strategy = "minimal";
    req.limit = 10;
    req.min_relevance = 0.1;
    auto out = a.GenerateContext("q", req);
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].id, "v1");
    ASSERT_TRUE(seen.limit.has_value());
    EXPECT_EQ(*seen.limit, 2);
    ASSERT_TRUE(seen.min_relevance.has_value());
    EXPECT_DOUBLE_EQ(*seen.min_relevance, 0.8);
}

TEST_F(ContextAssemblerTest, BoundaryStrategyLeadsWithBoundaryItem) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));

    ContextRequest req;
    req.strategy = "boundary";
    req.boundary_info = nlohmann::json{{"id", "b1"}, {"tokens", 8000}};
    auto out = a.GenerateContext("q", req);
    ASSERT_EQ(out.items.size(), 2u);
    EXPECT_EQ(out.items[0].id, "boundary-b1");
    EXPECT_EQ(out.items[0].title, "Token Boundary");
    EXPECT_DOUBLE_EQ(*out.items[0].priority, 0.95);
}

TEST_F(ContextAssemblerTest, ComprehensiveUsesEveryProvider) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("custom", std::vector<ContextItem>{MakeItem("c", 0.4)}));
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));

    ContextRequest standard;
    standard.strategy = "standard";
    EXPECT_EQ(a.GenerateContext("q", standard).items.size(), 1u);

    ContextRequest comprehensive;
    comprehensive.strategy = "comprehensive";
    EXPECT_EQ(a.GenerateContext("q", comprehensive).items.size(), 2u);
}

TEST_F(ContextAssemblerTest, DevelopmentFlowAddsGuidanceAndCodeInsights) {
    auto& a = Build();
    ProviderOptions meta_seen;
    a.RegisterProvider(std::make_unique<FakeProvider>("recent_changes", std::vector<ContextItem>{MakeItem("rc", 0.5)}));
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v1", 0.6)}));
    a.RegisterProvider(std::make_unique<FakeProvider>(
        "metacognitive", std::vector<ContextItem>{MakeItem("m1", 0.4), MakeItem("m2", 0.3), MakeItem("m3", 0.2)},
        nullptr, &meta_seen));

    ContextRequest req;
    req.strategy = "development-flow";
    auto out = a.GenerateContext("q", req);
    ASSERT_EQ(out.items.size(), 3u);

    EXPECT_EQ(out.items[0].id, "drift_prevention_guidance");
    EXPECT_EQ(out.items[0].type, "vision_guidance");
    EXPECT_EQ(out.items[0].title, "Title v1");
    EXPECT_DOUBLE_EQ(*out.items[0].priority, 0.9);

    EXPECT_EQ(out.items[1].id, "code_pattern_insights");
    EXPECT_EQ(out.items[1].type, "code_insights");
    EXPECT_EQ(out.items[1].content, "Content of m1\n\nContent of m2");
    EXPECT_DOUBLE_EQ(*out.items[1].priority, 0.85);

    EXPECT_EQ(out.items[2].id, "rc");
    EXPECT_DOUBLE_EQ(*out.items[2].priority, 0.6);
    ASSERT_TRUE(meta_seen.limit.has_value());
    EXPECT_EQ(*meta_seen.limit, 2);
}

TEST_F(ContextAssemblerTest, UnknownStrategyFallsBackToDefault) {
    cfg.default_strategy = "development-flow";
    auto& a = Build();
    EXPECT_EQ(a.default_strategy(), Strategy::kDevelopmentFlow);

    ContextRequest req;
    req.strategy = "telepathy";
    EXPECT_EQ(a.GenerateContext("q", req).strategy, Strategy::kDevelopmentFlow);
}

TEST_F(ContextAssemblerTest, SessionProviderDescribesActiveSession) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<SessionContextProvider>(store.get()));

    auto out = a.GenerateContext("q");
    ASSERT_EQ(out.items.size(), 1u);
    EXPECT_EQ(out.items[0].id, "session_state");
    EXPECT_NE(out.items[0].content.find("Session ID: " + tracker->GetCurrentSessionId()), std::string::npos);
    EXPECT_NE(out.items[0].content.find("Previous Session: None"), std::string::npos);
}

TEST_F(ContextAssemblerTest, InjectContextWritesCurrentContext) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));

    ContextRequest req;
    req.format = "plain";
    auto r = a.InjectContext("status check", req);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.context_count, 1u);
    EXPECT_EQ(r.format, RenderFormat::kPlain);
    EXPECT_EQ(r.session_id, store->CurrentSessionId());
    EXPECT_EQ(r.formatted_context.rfind("CONTINUITY CONTEXT AWARENESS", 0), 0u);

    auto current = nlohmann::json::parse(continuity_test::ReadAll(a.CurrentContextPath()));
    EXPECT_EQ(current["query"], "status check");
    EXPECT_EQ(current["contextCount"], 1);

    auto last = store->GetKey(ContextAssembler::kLastInjectionKey);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ((*last)["format"], "plain");

    auto history = nlohmann::json::parse(continuity_test::ReadAll(a.ContextHistoryPath()));
    ASSERT_EQ(history.size(), 1u);
    ASSERT_TRUE(history[0].contains("filePath"));
    const auto md_path = history[0]["filePath"].get<std::string>();
    EXPECT_EQ(std::filesystem::path(md_path).parent_path(), std::filesystem::path(a.LlmAccessDir()));
    EXPECT_EQ(std::filesystem::path(md_path).extension(), ".md");

    const auto md = continuity_test::ReadAll(md_path);
    EXPECT_NE(md.find("- Query: status check"), std::string::npos);
    EXPECT_NE(md.find("- Session ID: " + r.session_id), std::string::npos);
    EXPECT_NE(md.find(r.formatted_context), std::string::npos);

    auto json_path = std::filesystem::path(md_path).replace_extension(".json");
    auto doc = nlohmann::json::parse(continuity_test::ReadAll(json_path.string()));
    EXPECT_EQ(doc["metadata"]["query"], "status check");
    EXPECT_EQ(doc["metadata"]["contextCount"], 1);
    EXPECT_EQ(doc["context"], r.formatted_context);
    ASSERT_EQ(doc["rawContext"].size(), 1u);
    EXPECT_EQ(doc["rawContext"][0]["id"], "v");

    EXPECT_EQ(continuity_test::ReadAll(a.LatestContextPath()), md);
}

TEST_F(ContextAssemblerTest, GenerateAndInjectEachRecordTheirOwnCall) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));

    a.GenerateContext("generated only");
    auto generated = store->GetKey(ContextAssembler::kLastInjectionKey);
    ASSERT_TRUE(generated.has_value());
    EXPECT_EQ((*generated)["query"], "generated only");
    EXPECT_FALSE(generated->contains("format"));

    clock.Advance(10);
    ContextRequest req;
    req.format = "json";
    a.InjectContext("injected", req);
    auto injected = store->GetKey(ContextAssembler::kLastInjectionKey);
    ASSERT_TRUE(injected.has_value());
    EXPECT_EQ((*injected)["query"], "injected");
    EXPECT_EQ((*injected)["format"], "json");
    EXPECT_EQ((*injected)["timestamp"], clock.WallMs());
}

TEST_F(ContextAssemblerTest, ContextHistoryIsNewestFirstAndCapped) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));
    for (int i = 0; i < 25; i++) a.InjectContext("q" + std::to_string(i));

    auto history = nlohmann::json::parse(continuity_test::ReadAll(a.ContextHistoryPath()));
    ASSERT_TRUE(history.is_array());
    ASSERT_EQ(history.size(), 20u);
    EXPECT_EQ(history[0]["query"], "q24");
    EXPECT_EQ(history[19]["query"], "q5");
}

TEST_F(ContextAssemblerTest, InjectAtBoundaryRecordsBoundary) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));
    auto before = tracker->GetTokenBoundaries().size();

    auto r = a.InjectContextAtBoundary({{"id", "b-7"}, {"reason", "window full"}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.strategy, Strategy::kBoundary);
    EXPECT_EQ(r.query, ContextAssembler::kBoundaryQuery);
    EXPECT_NE(r.formatted_context.find("### Token Boundary"), std::string::npos);

    auto boundaries = tracker->GetTokenBoundaries();
    ASSERT_EQ(boundaries.size(), before + 1);
    EXPECT_EQ(boundaries.back().metadata["boundaryType"], "token_boundary");
    EXPECT_EQ(boundaries.back().metadata["data"]["boundaryId"], "b-7");
}

TEST_F(ContextAssemblerTest, StatusReportsConfiguration) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{}));
    auto status = a.GetStatus();
    EXPECT_EQ(status["initialized"], true);
    EXPECT_EQ(status["providerCount"], 1);
    EXPECT_EQ(status["strategyCount"], 7);
    EXPECT_EQ(status["defaultStrategy"], "standard");
}

TEST_F(ContextAssemblerTest, StatusReportsLastCacheCleanupAsWallTime) {
    auto& a = Build();
    a.RegisterProvider(std::make_unique<FakeProvider>("vision", std::vector<ContextItem>{MakeItem("v", 0.9)}));
    EXPECT_TRUE(a.GetStatus()["lastCacheCleanup"].is_null());

    clock.Advance(5000);
    a.GenerateContext("q");
    EXPECT_EQ(a.GetStatus()["lastCacheCleanup"], clock.WallMs());
}

TEST(ContextAssemblerConstructionTest, NullStoreThrows) {
    EXPECT_THROW(ContextAssembler assembler(AssemblerConfig{}, nullptr, nullptr), ConfigurationError);
}

TEST(StrategyTest, NamesRoundTrip) {
    EXPECT_EQ(AllStrategies().size(), 7u);
    for (auto s : AllStrategies()) {
        auto parsed = StrategyFromString(ToString(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(StrategyFromString("Standard").has_value());
}

TEST(CacheKeyTest, DependsOnOptions) {
    ProviderOptions plain;
    ProviderOptions limited;
    limited.limit = 3;
    EXPECT_NE(ContextAssembler::CacheKey(Strategy::kStandard, "q", plain),
              ContextAssembler::CacheKey(Strategy::kStandard, "q", limited));
    EXPECT_NE(ContextAssembler::CacheKey(Strategy::kStandard, "q", plain),
              ContextAssembler::CacheKey(Strategy::kMinimal, "q", plain));
    EXPECT_EQ(ContextAssembler::CacheKey(Strategy::kStandard, "q", plain), "standard:q:{}");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
