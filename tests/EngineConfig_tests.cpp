#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <entt/entity/registry.hpp>

#include "Engine.hpp"
#include "EventQueue.h"
#include "LogManager.hpp"
#include "assets/AssetStorage.hpp"
#include "ecs/AssetComponent.hpp"
#include "player/LottiePlayer.hpp"
#include "serializers/EngineConfigSerialize.hpp"

using namespace lplay;
using json = nlohmann::json;

TEST(EngineConfig, Defaults) {
    EventQueue queue;
    EngineConfig config(queue);
    EXPECT_TRUE(config.get_flag(EngineFlag::LogTransitions));
    EXPECT_FALSE(config.get_flag(EngineFlag::EchoLogToStdout));
    EXPECT_FLOAT_EQ(config.get_value(EngineValue::TimeScale), 1.0f);
}

TEST(EngineConfig, ChangesDispatchEvents) {
    EventQueue queue;
    EngineConfig config(queue);
    std::vector<float> scales;
    std::vector<bool> echoes;
    queue.register_callback([&](const SetTimeScaleEvent& e) { scales.push_back(e.time_scale); });
    queue.register_callback([&](const SetLogEchoEvent& e) { echoes.push_back(e.enabled); });

    config.set_value(EngineValue::TimeScale, 2.0f);
    config.set_value(EngineValue::TimeScale, 2.0f);
    config.set_flag(EngineFlag::EchoLogToStdout, true);
    config.set_flag(EngineFlag::LogTransitions, false);

    // Unchanged values dispatch nothing
    EXPECT_EQ(scales, std::vector<float>{ 2.0f });
    EXPECT_EQ(echoes, std::vector<bool>{ true });
    EXPECT_FALSE(config.get_flag(EngineFlag::LogTransitions));
}

TEST(EngineConfigSerialize, ApplyAndWrite) {
    EventQueue queue;
    EngineConfig config(queue);

    serializers::apply_engine_config(json::parse(R"({ "log_transitions": false, "time_scale": 0.5, "unknown": 1 })"), config);
    EXPECT_FALSE(config.get_flag(EngineFlag::LogTransitions));
    EXPECT_FLOAT_EQ(config.get_value(EngineValue::TimeScale), 0.5f);

    auto j = serializers::serialize_engine_config(config);
    EXPECT_EQ(j["log_transitions"], false);
    EXPECT_EQ(j["echo_log"], false);
    EXPECT_FLOAT_EQ(j["time_scale"].get<float>(), 0.5f);
}

TEST(EngineConfigSerialize, RejectsBadValues) {
    EventQueue queue;
    EngineConfig config(queue);
    EXPECT_THROW(serializers::apply_engine_config(json::parse(R"({ "time_scale": -1 })"), config), serializers::ConfigError);
    EXPECT_THROW(serializers::apply_engine_config(json::parse(R"({ "echo_log": "yes" })"), config), serializers::ConfigError);
    EXPECT_THROW(serializers::apply_engine_config(json::array(), config), serializers::ConfigError);
    EXPECT_FLOAT_EQ(config.get_value(EngineValue::TimeScale), 1.0f);
}

class EngineTest : public ::testing::Test {
protected:
    EnginePtr engine = make_default_engine();
    std::shared_ptr<EngineContext> ctx = engine->context();
    assets::VectorAssetHandle asset;
    entt::entity entity{};

    void SetUp() override {
        engine->init();
        asset = ctx->asset_storage->add(assets::VectorAsset::make_lottie(
            "anim", playback::Composition{ 0.0f, 100.0f, 30.0f }, 10.0f, 10.0f));
        player::LottiePlayer p{ "a" };
        p.with_state(player::AnimationState{ "a" }.with_transition(player::OnAfter{ "b", 1.0f }))
         .with_state(player::AnimationState{ "b" });
        entity = ctx->registry->create();
        ctx->registry->emplace<ecs::AssetComponent>(entity, asset);
        ctx->registry->emplace<player::LottiePlayer>(entity, std::move(p));
    }

    float rendered() { return ctx->asset_storage->get(asset).rendered_frames; }
    const player::StateId& current() { return ctx->registry->get<player::LottiePlayer>(entity).current_state(); }
};

TEST_F(EngineTest, TickAdvancesClockAndPlayers) {
    engine->tick(0.0f);
    engine->tick(0.5f);

    EXPECT_DOUBLE_EQ(ctx->clock.now(), 0.5);
    EXPECT_EQ(ctx->clock.frame_count(), 2u);
    EXPECT_NEAR(rendered(), 15.0f, 1e-3f);
}

TEST_F(EngineTest, NegativeDeltaCountsAsZero) {
    engine->tick(0.0f);
    engine->tick(-1.0f);
    EXPECT_DOUBLE_EQ(ctx->clock.now(), 0.0);
    EXPECT_FLOAT_EQ(rendered(), 0.0f);
}

TEST_F(EngineTest, TimeScaleScalesDelta) {
    ctx->engine_config->set_value(EngineValue::TimeScale, 2.0f);
    EXPECT_FLOAT_EQ(engine->time_scale(), 2.0f);

    engine->tick(0.0f);
    engine->tick(0.5f);
    EXPECT_DOUBLE_EQ(ctx->clock.now(), 1.0);
    EXPECT_NEAR(rendered(), 30.0f, 1e-3f);

    // First frame at t = 1, so one more scaled second fires OnAfter
    engine->tick(0.5f);
    EXPECT_EQ(current(), player::StateId{ "b" });
}

TEST_F(EngineTest, ZeroTimeScaleFreezes) {
    ctx->engine_config->set_value(EngineValue::TimeScale, 0.0f);
    engine->tick(0.0f);
    engine->tick(0.5f);
    EXPECT_FLOAT_EQ(rendered(), 0.0f);
    EXPECT_EQ(current(), player::StateId{ "a" });
}

TEST_F(EngineTest, TransitionLoggingFollowsFlag) {
    auto log = std::dynamic_pointer_cast<LogManager>(ctx->log_manager);
    ASSERT_NE(log, nullptr);

    auto count = [&] {
        size_t n = 0;
        for (const auto& line : log->lines())
            if (line.find("->") != std::string::npos) n++;
        return n;
    };

    engine->tick(0.0f);
    EXPECT_EQ(count(), 1u);

    ctx->engine_config->set_flag(EngineFlag::LogTransitions, false);
    engine->tick(1.0f);
    engine->tick(1.0f);
    EXPECT_EQ(current(), player::StateId{ "b" });
    EXPECT_EQ(count(), 1u);
}
