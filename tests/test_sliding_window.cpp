/**
 * @file test_sliding_window.cpp
 * @brief SlidingWindowAggregator 다수결/만료 검증
 */

#include <gtest/gtest.h>
#include <random>
#include <vector>

#include "window/SlidingWindowAggregator.hpp"
#include "test_support.hpp"

using namespace std::chrono;
using namespace std::chrono_literals;

namespace {

SlidingWindowAggregator makeAgg(milliseconds w = 3000ms, double thr = 0.5, bool failOpen = false)
{
    SlidingWindowAggregator::Params p;
    p.window = w;
    p.threshold = thr;
    p.emptyVerdict = failOpen;
    return SlidingWindowAggregator(p);
}

const TimePoint T0 = TimePoint(hours(1));

} // namespace

TEST(SlidingWindowTest, EmptyWindowIsFailClosed)
{
    auto agg = makeAgg();
    EXPECT_FALSE(agg.currentVerdict());
    EXPECT_FALSE(agg.expire(T0));
    EXPECT_TRUE(agg.empty());
}

TEST(SlidingWindowTest, EmptyWindowHonoursFailOpen)
{
    auto agg = makeAgg(3000ms, 0.5, true);
    EXPECT_TRUE(agg.currentVerdict());
    EXPECT_TRUE(agg.expire(T0));
}

TEST(SlidingWindowTest, FirstObservationDecidesVerdict)
{
    auto trusted = makeAgg();
    EXPECT_TRUE(trusted.ingest({T0, TrustLabel::Trusted}));

    auto untrusted = makeAgg();
    EXPECT_FALSE(untrusted.ingest({T0, TrustLabel::Untrusted}));

    auto none = makeAgg();
    EXPECT_FALSE(none.ingest({T0, TrustLabel::NoSignal}));
}

TEST(SlidingWindowTest, TieRoundsToVerified)
{
    auto agg = makeAgg();
    agg.ingest({T0, TrustLabel::Trusted});
    EXPECT_TRUE(agg.ingest({T0 + 100ms, TrustLabel::Untrusted}));
    EXPECT_DOUBLE_EQ(agg.trustedFraction(), 0.5);
}

TEST(SlidingWindowTest, NoSignalCountsAsNonTrusted)
{
    auto agg = makeAgg();
    agg.ingest({T0, TrustLabel::Trusted});
    agg.ingest({T0 + 100ms, TrustLabel::NoSignal});
    EXPECT_FALSE(agg.ingest({T0 + 200ms, TrustLabel::NoSignal}));
    EXPECT_EQ(agg.size(), 3u);
}

TEST(SlidingWindowTest, OneTrustedOfThreeIsUnverified)
{
    auto agg = makeAgg(3000ms);
    agg.ingest({T0, TrustLabel::Trusted});
    agg.ingest({T0 + 1s, TrustLabel::Untrusted});
    const bool v = agg.ingest({T0 + 2s, TrustLabel::Untrusted});

    EXPECT_EQ(agg.size(), 3u);
    EXPECT_NEAR(agg.trustedFraction(), 1.0 / 3.0, 1e-9);
    EXPECT_FALSE(v);
}

TEST(SlidingWindowTest, FourTrustedThenSilenceExpires)
{
    auto agg = makeAgg(3000ms);
    for (int i = 0; i < 4; ++i) {
        agg.ingest({T0 + milliseconds(i * 250), TrustLabel::Trusted});
    }
    EXPECT_TRUE(agg.currentVerdict());

    // 마지막 관측 후 4초
    EXPECT_FALSE(agg.expire(T0 + 750ms + 4s));
    EXPECT_TRUE(agg.empty());
}

TEST(SlidingWindowTest, BoundaryAgeIsKept)
{
    auto agg = makeAgg(3000ms);
    agg.ingest({T0, TrustLabel::Trusted});

    // now - ts == W 는 유지
    EXPECT_TRUE(agg.expire(T0 + 3000ms));
    EXPECT_EQ(agg.size(), 1u);

    EXPECT_FALSE(agg.expire(T0 + 3001ms));
    EXPECT_EQ(agg.size(), 0u);
}

TEST(SlidingWindowTest, IngestEvictsStaleFront)
{
    auto agg = makeAgg(3000ms);
    agg.ingest({T0, TrustLabel::Trusted});
    agg.ingest({T0 + 1s, TrustLabel::Trusted});
    // 첫 관측(나이 3.5s) 제거, 두 번째(2.5s) 유지
    EXPECT_TRUE(agg.ingest({T0 + 3500ms, TrustLabel::Untrusted}));
    EXPECT_EQ(agg.size(), 2u);
}

TEST(SlidingWindowTest, AllStaleAfterLongSuspendYieldsSingleEntry)
{
    auto agg = makeAgg(3000ms);
    for (int i = 0; i < 10; ++i) {
        agg.ingest({T0 + milliseconds(i * 100), TrustLabel::Trusted});
    }
    // 긴 정지 후 첫 관측: 이전 항목 전부 만료
    EXPECT_FALSE(agg.ingest({T0 + hours(5), TrustLabel::Untrusted}));
    EXPECT_EQ(agg.size(), 1u);
}

TEST(SlidingWindowTest, CustomThreshold)
{
    auto agg = makeAgg(10000ms, 0.75);
    agg.ingest({T0, TrustLabel::Trusted});
    agg.ingest({T0 + 1s, TrustLabel::Trusted});
    EXPECT_FALSE(agg.ingest({T0 + 2s, TrustLabel::Untrusted}));    // 0.667
    EXPECT_TRUE(agg.ingest({T0 + 3s, TrustLabel::Trusted}));       // 0.75
}

TEST(SlidingWindowTest, ClearResetsToEmptyVerdict)
{
    auto agg = makeAgg();
    agg.ingest({T0, TrustLabel::Trusted});
    agg.clear();
    EXPECT_TRUE(agg.empty());
    EXPECT_FALSE(agg.currentVerdict());
}

// W 안의 임의 시퀀스: 판정 == trusted/total >= 0.5
TEST(SlidingWindowTest, RandomSequencesWithinWindowMatchMajority)
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> labelDist(0, 2);
    std::uniform_int_distribution<int> lenDist(1, 40);

    for (int run = 0; run < 200; ++run) {
        auto agg = makeAgg(3000ms);
        const int n = lenDist(rng);
        int trusted = 0;
        bool v = false;
        for (int i = 0; i < n; ++i) {
            const auto l = static_cast<TrustLabel>(labelDist(rng));
            if (l == TrustLabel::Trusted) ++trusted;
            // 전체 구간 < W
            v = agg.ingest({T0 + milliseconds(i * 50), l});
        }
        ASSERT_EQ(agg.size(), static_cast<size_t>(n));
        EXPECT_EQ(v, (static_cast<double>(trusted) / n) >= 0.5) << "run=" << run;
    }
}
