#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "inference/inference_router.hpp"
#include "inference/model_strategies.hpp"
#include "inference/prompt_builder.hpp"
#include "LogManager.hpp"

using namespace code_intelligence;

namespace {

enum class Behaviour { Succeed, Throw, ReturnError, Hang };

// Scripted strategy for routing tests.
class ScriptedStrategy : public InferenceStrategy {
public:
    ScriptedStrategy(std::string name, StrategyKind kind, bool available, Behaviour behaviour)
        : name_(std::move(name)), kind_(kind), available_(available), behaviour_(behaviour) {}

    StrategyKind kind() const override { return kind_; }
    std::string name() const override { return name_; }
    bool is_available() override { return available_; }
    bool initialize() override {
        ++init_calls;
        initialized_ = available_;
        return available_;
    }
    bool is_initialized() const override { return initialized_; }

    CompletionResult generate_code_completion(const CompletionContext& ctx, Intent) override {
        ++calls;
        switch (behaviour_) {
            case Behaviour::Throw:
                throw std::runtime_error(name_ + " exploded");
            case Behaviour::ReturnError:
                return CompletionResult::failure(name_ + " refused");
            case Behaviour::Hang:
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                break;
            case Behaviour::Succeed:
                break;
        }
        CompletionResult r;
        r.status = "success";
        r.response = name_ + " answer for " + ctx.query;
        r.confidence = 1.7;
        r.strategy_used = name_;
        return r;
    }

    void set_behaviour(Behaviour b) { behaviour_ = b; }

    std::atomic<int> calls{0};
    std::atomic<int> init_calls{0};

private:
    std::string name_;
    StrategyKind kind_;
    bool available_;
    Behaviour behaviour_;
    std::atomic<bool> initialized_{false};
};

InferenceConfig fast_config() {
    InferenceConfig cfg;
    cfg.preference = {"primary", "secondary", "fallback"};
    cfg.timeout_ms = 100;
    return cfg;
}

CompletionContext sample_context() {
    CompletionContext ctx;
    ctx.file_path = "src/app.py";
    ctx.language = "python";
    ctx.query = "add retries";
    ctx.cursor_line = 12;
    ctx.surrounding_code = "def fetch(url):\n    return http.get(url)\n";
    ctx.extensions["project_id"] = "demo";
    return ctx;
}

} // namespace

TEST(InferenceRouter, UninitializedRouterReturnsError) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Succeed);
    InferenceRouter router({primary}, fast_config());

    EXPECT_EQ(router.state(), StrategyState::Uninitialized);
    CompletionResult r = router.generate_completion(sample_context(), Intent::Suggest);
    EXPECT_EQ(r.status, "error");
    EXPECT_FALSE(r.error.empty());
    EXPECT_EQ(primary->calls.load(), 0);
}

TEST(InferenceRouter, OrdersByPreferenceAndAppendsFallback) {
    auto secondary = std::make_shared<ScriptedStrategy>("secondary", StrategyKind::Reduced, true, Behaviour::Succeed);
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Succeed);
    InferenceRouter router({secondary, nullptr, primary}, fast_config());

    EXPECT_EQ(router.strategy_names(), (std::vector<std::string>{"primary", "secondary", "fallback"}));
}

TEST(InferenceRouter, SkipsUnavailablePreferredStrategy) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, false, Behaviour::Succeed);
    auto secondary = std::make_shared<ScriptedStrategy>("secondary", StrategyKind::Reduced, true, Behaviour::Succeed);
    InferenceRouter router({primary, secondary}, fast_config());

    ASSERT_TRUE(router.initialize());
    EXPECT_EQ(router.current_strategy(), "secondary");
    EXPECT_EQ(router.state(), StrategyState::Ready);

    CompletionResult r = router.generate_completion(sample_context(), Intent::Explain);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.strategy_used, "secondary");
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);
}

TEST(InferenceRouter, InitializeIsIdempotent) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Succeed);
    InferenceRouter router({primary}, fast_config());
    ASSERT_TRUE(router.initialize());
    ASSERT_TRUE(router.initialize());
    EXPECT_EQ(primary->init_calls.load(), 1);
}

TEST(InferenceRouter, FallbackIsAlwaysListedAsAvailable) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, false, Behaviour::Succeed);
    InferenceRouter router({primary}, fast_config());

    auto available = router.get_available_strategies();
    EXPECT_EQ(available, std::vector<std::string>{"fallback"});

    ASSERT_TRUE(router.initialize());
    EXPECT_EQ(router.current_strategy(), "fallback");
}

class RouterFailoverTest : public ::testing::TestWithParam<Behaviour> {};

TEST_P(RouterFailoverTest, FailingStrategyHopsOnceToTheNext) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, GetParam());
    auto secondary = std::make_shared<ScriptedStrategy>("secondary", StrategyKind::Reduced, true, Behaviour::Succeed);
    InferenceRouter router({primary, secondary}, fast_config());
    ASSERT_TRUE(router.initialize());
    ASSERT_EQ(router.current_strategy(), "primary");

    CompletionResult r = router.generate_completion(sample_context(), Intent::Suggest);
    EXPECT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.strategy_used, "secondary");
    EXPECT_EQ(router.current_strategy(), "secondary");
    EXPECT_EQ(router.state(), StrategyState::Ready);
    EXPECT_EQ(secondary->calls.load(), 1);

    // The degraded strategy is not retried on later calls.
    router.generate_completion(sample_context(), Intent::Suggest);
    EXPECT_EQ(primary->calls.load(), 1);
}

INSTANTIATE_TEST_SUITE_P(FailureModes, RouterFailoverTest,
                         ::testing::Values(Behaviour::Throw, Behaviour::ReturnError, Behaviour::Hang));

TEST(InferenceRouter, ExhaustedAfterOneHop) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Throw);
    auto secondary = std::make_shared<ScriptedStrategy>("secondary", StrategyKind::Reduced, true, Behaviour::ReturnError);
    auto fallback = std::make_shared<ScriptedStrategy>("fallback", StrategyKind::Fallback, true, Behaviour::Succeed);
    InferenceRouter router({primary, secondary, fallback}, fast_config());
    ASSERT_TRUE(router.initialize());

    CompletionResult r = router.generate_completion(sample_context(), Intent::Debug);
    EXPECT_EQ(r.status, "error");
    ASSERT_TRUE(r.error_kind.has_value());
    EXPECT_EQ(*r.error_kind, ErrorKind::StrategyExhausted);
    EXPECT_EQ(r.strategy_used, "primary");
    EXPECT_EQ(fallback->calls.load(), 0);
    EXPECT_EQ(router.state(), StrategyState::Degraded);

    auto health = router.health();
    EXPECT_EQ(health["status"], "degraded");
    EXPECT_EQ(health["strategies"][0]["state"], "degraded");
    EXPECT_EQ(health["strategies"][1]["state"], "degraded");
}

TEST(InferenceRouter, UnknownIntentIsAnError) {
    InferenceRouter router({}, fast_config());
    ASSERT_TRUE(router.initialize());
    CompletionResult r = router.generate_completion(sample_context(), "summon");
    EXPECT_EQ(r.status, "error");

    CompletionResult ok = router.generate_completion(sample_context(), "Explain");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.strategy_used, "fallback");
}

TEST(InferenceRouter, SwitchStrategyReinitializes) {
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Succeed);
    auto secondary = std::make_shared<ScriptedStrategy>("secondary", StrategyKind::Reduced, true, Behaviour::Succeed);
    InferenceRouter router({primary, secondary}, fast_config());
    ASSERT_TRUE(router.initialize());

    EXPECT_TRUE(router.switch_strategy("secondary"));
    EXPECT_EQ(router.current_strategy(), "secondary");
    EXPECT_EQ(secondary->init_calls.load(), 1);
    EXPECT_TRUE(router.switch_strategy("secondary"));
    EXPECT_EQ(secondary->init_calls.load(), 2);

    EXPECT_FALSE(router.switch_strategy("nonexistent"));
    EXPECT_EQ(router.current_strategy(), "secondary");
}

TEST(InferenceRouter, RecordsInteractions) {
    LogManager::instance().clear();
    auto primary = std::make_shared<ScriptedStrategy>("primary", StrategyKind::Full, true, Behaviour::Succeed);
    InferenceRouter router({primary}, fast_config());
    ASSERT_TRUE(router.initialize());
    router.generate_completion(sample_context(), Intent::Refactor);

    auto logs = LogManager::instance().get_logs_json();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0]["project_id"], "demo");
    EXPECT_EQ(logs[0]["intent"], "refactor");
    EXPECT_EQ(logs[0]["strategy"], "primary");
    EXPECT_EQ(logs[0]["status"], "success");
    EXPECT_NE(logs[0]["full_prompt"].get<std::string>().find("add retries"), std::string::npos);
}

TEST(PromptBuilder, KeepsRequestAndDropsLowRankedSections) {
    CompletionContext ctx = sample_context();
    ctx.vector_excerpts = {std::string(500, 'v')};
    PromptBuilder builder(160);

    std::string prompt = builder.build(ctx, Intent::Suggest);
    EXPECT_LE(prompt.size(), 160u);
    EXPECT_NE(prompt.find("### REQUEST\nadd retries"), std::string::npos);
    EXPECT_NE(prompt.find("### FOCAL POINT"), std::string::npos);
    EXPECT_EQ(prompt.find(std::string(200, 'v')), std::string::npos);

    PromptBuilder roomy(6000);
    std::string full = roomy.build(ctx, Intent::Suggest);
    EXPECT_NE(full.find("### RELATED CODE"), std::string::npos);
    EXPECT_LT(full.find("### FOCAL POINT"), full.find("### RELATED CODE"));
}

TEST(MockStrategy, ConfidenceGrowsWithContext) {
    CompletionContext bare;
    EXPECT_DOUBLE_EQ(MockStrategy::estimate_confidence(bare, Intent::Suggest), 0.3);

    CompletionContext rich = sample_context();
    rich.symbol_excerpts = {"def fetch(url)"};
    rich.graph_excerpts = {"depends on: http.py"};
    // 0.3 + 0.15 + 0.15 + 0.1 + 0.2, scaled by 1.1 and capped
    EXPECT_DOUBLE_EQ(MockStrategy::estimate_confidence(rich, Intent::Explain), 0.95);
    EXPECT_NEAR(MockStrategy::estimate_confidence(rich, Intent::Debug), 0.72, 1e-9);
}

TEST(MockStrategy, ProducesContextAwareResult) {
    MockStrategy mock;
    ASSERT_TRUE(mock.is_available());
    ASSERT_TRUE(mock.initialize());

    CompletionContext ctx = sample_context();
    ctx.graph_excerpts = {"depends on: http.py"};
    CompletionResult r = mock.generate_code_completion(ctx, Intent::Suggest);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.strategy_used, "mock");
    EXPECT_TRUE(r.context_used);
    EXPECT_NE(r.response.find("app.py"), std::string::npos);
    EXPECT_EQ(r.suggestions, follow_up_suggestions(Intent::Suggest));

    MockStrategy disabled(false);
    EXPECT_FALSE(disabled.is_available());
    EXPECT_FALSE(disabled.initialize());
}

TEST(FallbackStrategy, AnswersWithReviewFlag) {
    FallbackStrategy fallback;
    ASSERT_TRUE(fallback.initialize());
    CompletionResult r = fallback.generate_code_completion(sample_context(), Intent::Optimize);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.requires_human_review);
    EXPECT_FALSE(r.context_used);
    EXPECT_DOUBLE_EQ(r.confidence, 0.5);
    EXPECT_FALSE(r.response.empty());
}
