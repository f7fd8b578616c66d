/**
 * @file test_escalation.cpp
 * @brief EscalationPolicy / EscalationController 단계 전환
 */

#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "config/GuardConfig.hpp"
#include "escalation/EscalationController.hpp"
#include "escalation/EscalationPolicy.hpp"
#include "state/VerificationState.hpp"
#include "test_support.hpp"

using States::Intent;

namespace {

struct Rig {
    GuardConfig cfg;
    VerificationState state;
    std::shared_ptr<FakeGenerator> gen = std::make_shared<FakeGenerator>();
    std::unique_ptr<EscalationController> ctl;

    Rig() { ctl = std::make_unique<EscalationController>(cfg, state, gen); }
};

} // namespace

TEST(EscalationPolicyTest, LevelZeroIsConcierge)
{
    GuardConfig cfg;
    EscalationPolicy policy(cfg.verified, cfg.tiers);

    const auto d = policy.describe(0, "hello there");
    EXPECT_EQ(d.level, 0);
    EXPECT_EQ(d.intent, Intent::Concierge);
    EXPECT_TRUE(d.prompt.contains("concierge"));
    EXPECT_TRUE(d.prompt.contains("\"hello there\""));
}

TEST(EscalationPolicyTest, TiersMapToIntents)
{
    GuardConfig cfg;
    EscalationPolicy policy(cfg.verified, cfg.tiers);

    EXPECT_EQ(policy.describe(1, "x").intent, Intent::InquireIdentity);
    EXPECT_EQ(policy.describe(2, "x").intent, Intent::OrderToLeave);
    EXPECT_EQ(policy.describe(3, "x").intent, Intent::FinalWarning);
    EXPECT_EQ(policy.describe(1, "x").tone, "neutral");
    EXPECT_EQ(policy.describe(2, "x").tone, "firm");
    EXPECT_EQ(policy.describe(3, "x").tone, "severe");
    EXPECT_TRUE(policy.describe(3, "x").prompt.contains("trespassing"));
}

TEST(EscalationPolicyTest, LevelsAboveTopTierReuseTopWording)
{
    GuardConfig cfg;
    EscalationPolicy policy(cfg.verified, cfg.tiers);

    const auto top = policy.describe(3, "go away");
    const auto beyond = policy.describe(7, "go away");
    EXPECT_EQ(beyond.intent, top.intent);
    EXPECT_EQ(beyond.prompt, top.prompt);
    EXPECT_EQ(beyond.level, 7);
}

TEST(EscalationPolicyTest, DescribeIsPure)
{
    GuardConfig cfg;
    EscalationPolicy policy(cfg.verified, cfg.tiers);
    const auto a = policy.describe(2, "who are you");
    const auto b = policy.describe(2, "who are you");
    EXPECT_EQ(a.prompt, b.prompt);
    EXPECT_EQ(a.intent, b.intent);
}

TEST(EscalationControllerTest, UnverifiedTurnsEscalateAndSaturate)
{
    Rig r;
    std::vector<int> levels;
    for (int i = 0; i < 6; ++i) {
        levels.push_back(r.ctl->handleTurn(QString("turn %1").arg(i)).level);
    }
    EXPECT_EQ(levels, (std::vector<int>{1, 2, 3, 3, 3, 3}));
    EXPECT_EQ(r.ctl->level(), 3);
    EXPECT_EQ(r.gen->lastPolicy.intent, Intent::FinalWarning);
}

TEST(EscalationControllerTest, LevelNeverExceedsConfiguredTierCount)
{
    GuardConfig cfg;
    cfg.tiers.resize(2);
    VerificationState state;
    auto gen = std::make_shared<FakeGenerator>();
    EscalationController ctl(cfg, state, gen);

    int prev = 0;
    for (int i = 0; i < 10; ++i) {
        const int lv = ctl.handleTurn("stay").level;
        EXPECT_GE(lv, prev);
        EXPECT_LE(lv, 2);
        if (prev < 2) EXPECT_EQ(lv, prev + 1);
        prev = lv;
    }
}

TEST(EscalationControllerTest, VerifiedTurnUsesConciergeAndStaysAtZero)
{
    Rig r;
    r.state.set(true);
    const auto t = r.ctl->handleTurn("good morning");
    EXPECT_EQ(t.level, 0);
    EXPECT_EQ(t.intent, Intent::Concierge);
    EXPECT_EQ(r.gen->lastPolicy.intent, Intent::Concierge);
    EXPECT_EQ(t.reply, "L0:good morning");
    EXPECT_TRUE(t.generated);
}

TEST(EscalationControllerTest, ReverificationResetsFromAnyLevel)
{
    for (int prior = 1; prior <= 5; ++prior) {
        Rig r;
        for (int i = 0; i < prior; ++i) r.ctl->handleTurn("hey");
        ASSERT_EQ(r.ctl->level(), std::min(prior, 3));

        r.state.set(true);
        const auto t = r.ctl->handleTurn("it's me");
        EXPECT_EQ(t.level, 0) << "prior=" << prior;
        EXPECT_EQ(t.intent, Intent::Concierge);
    }
}

TEST(EscalationControllerTest, BriefVerificationBetweenTurnsRestartsEscalation)
{
    Rig r;
    r.ctl->handleTurn("a");
    r.ctl->handleTurn("b");
    ASSERT_EQ(r.ctl->level(), 2);

    // 두 턴 사이에 잠깐 인증되었다가 다시 해제
    r.state.set(true);
    r.state.set(false);

    EXPECT_EQ(r.ctl->handleTurn("c").level, 1);
}

TEST(EscalationControllerTest, BlankUtteranceDoesNotTouchLevel)
{
    Rig r;
    r.ctl->handleTurn("first");
    const auto t = r.ctl->handleTurn("   ");
    EXPECT_EQ(t.reply, r.cfg.invalidInputReply);
    EXPECT_EQ(t.level, 1);
    EXPECT_EQ(r.gen->calls, 1);
}

TEST(EscalationControllerTest, VerifiedUserNeverReportsPendingLevel)
{
    Rig r;
    std::vector<int> seen;
    QObject::connect(r.ctl.get(), &EscalationController::escalationChanged, [&](int lv) { seen.push_back(lv); });

    for (int i = 0; i < 3; ++i) r.ctl->handleTurn("who cares");
    ASSERT_EQ(r.ctl->level(), 3);

    // 턴 없이 인증만 바뀐 상태
    r.state.set(true);
    EXPECT_EQ(r.ctl->level(), 0);

    const auto t = r.ctl->handleTurn("  ");
    EXPECT_EQ(t.reply, r.cfg.invalidInputReply);
    EXPECT_EQ(t.level, 0);
    EXPECT_EQ(t.intent, Intent::Concierge);
    EXPECT_EQ(r.gen->calls, 3);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 0}));
}

TEST(EscalationControllerTest, ReverificationSinceLastTurnReportsZeroBeforeNextTurn)
{
    Rig r;
    r.ctl->handleTurn("a");
    r.ctl->handleTurn("b");

    r.state.set(true);
    r.state.set(false);
    EXPECT_EQ(r.ctl->level(), 0);

    EXPECT_EQ(r.ctl->handleTurn("c").level, 1);
    EXPECT_EQ(r.ctl->level(), 1);
}

TEST(EscalationControllerTest, GenerationFailureKeepsLevelAndReturnsFallback)
{
    Rig r;
    r.gen->mode = FakeGenerator::Mode::Throw;
    int failures = 0;
    QObject::connect(r.ctl.get(), &EscalationController::generationFailed, [&](const QString&) { ++failures; });

    const auto t1 = r.ctl->handleTurn("hello");
    EXPECT_EQ(t1.reply, r.cfg.fallbackReply);
    EXPECT_FALSE(t1.generated);
    EXPECT_EQ(t1.level, 1);

    r.gen->mode = FakeGenerator::Mode::Empty;
    const auto t2 = r.ctl->handleTurn("hello?");
    EXPECT_EQ(t2.reply, r.cfg.fallbackReply);
    EXPECT_EQ(t2.level, 2);

    r.gen->mode = FakeGenerator::Mode::Echo;
    const auto t3 = r.ctl->handleTurn("fine");
    EXPECT_EQ(t3.level, 3);
    EXPECT_EQ(t3.reply, "L3:fine");
    EXPECT_EQ(failures, 2);
}

TEST(EscalationControllerTest, EmitsEscalationChangedOnlyOnChange)
{
    Rig r;
    std::vector<int> seen;
    QObject::connect(r.ctl.get(), &EscalationController::escalationChanged, [&](int lv) { seen.push_back(lv); });

    for (int i = 0; i < 5; ++i) r.ctl->handleTurn("x");
    r.state.set(true);
    r.ctl->handleTurn("x");
    r.ctl->handleTurn("x");

    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 0}));
}

TEST(EscalationControllerTest, CannedGeneratorUsedWhenNoneGiven)
{
    GuardConfig cfg;
    VerificationState state;
    EscalationController ctl(cfg, state, nullptr);

    EXPECT_EQ(ctl.handleTurn("hi").reply, cfg.tiers[0].cannedReply);
    EXPECT_EQ(ctl.handleTurn("no").reply, cfg.tiers[1].cannedReply);
}
