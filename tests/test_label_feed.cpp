/**
 * @file test_label_feed.cpp
 * @brief LabelFeedAdapter 최신값 우편함
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "sensing/LabelFeedAdapter.hpp"

TEST(LabelFeedAdapterTest, ClassifyBeforeOpenFails)
{
    LabelFeedAdapter feed;
    TrustLabel l;
    EXPECT_FALSE(feed.classify(l));
}

TEST(LabelFeedAdapterTest, NothingPostedYieldsNoSignal)
{
    LabelFeedAdapter feed;
    ASSERT_TRUE(feed.open());
    TrustLabel l = TrustLabel::Trusted;
    EXPECT_TRUE(feed.classify(l));
    EXPECT_EQ(l, TrustLabel::NoSignal);
}

TEST(LabelFeedAdapterTest, LatestPostWinsAndIsConsumedOnce)
{
    LabelFeedAdapter feed;
    ASSERT_TRUE(feed.open());
    feed.post(TrustLabel::Untrusted);
    feed.post(TrustLabel::Trusted);

    TrustLabel l;
    ASSERT_TRUE(feed.classify(l));
    EXPECT_EQ(l, TrustLabel::Trusted);

    ASSERT_TRUE(feed.classify(l));
    EXPECT_EQ(l, TrustLabel::NoSignal);     // 새 게시 없음
}

TEST(LabelFeedAdapterTest, PostsBeforeOpenAreIgnored)
{
    LabelFeedAdapter feed;
    feed.post(TrustLabel::Trusted);
    ASSERT_TRUE(feed.open());

    TrustLabel l;
    ASSERT_TRUE(feed.classify(l));
    EXPECT_EQ(l, TrustLabel::NoSignal);
}

TEST(LabelFeedAdapterTest, CloseIsIdempotent)
{
    LabelFeedAdapter feed;
    ASSERT_TRUE(feed.open());
    feed.close();
    feed.close();
    EXPECT_FALSE(feed.isOpen());
}

TEST(LabelFeedAdapterTest, ConcurrentPostsNeverProduceInvalidLabel)
{
    LabelFeedAdapter feed;
    ASSERT_TRUE(feed.open());

    std::atomic<bool> done{false};
    std::thread producer([&] {
        for (int i = 0; i < 5000; ++i) {
            feed.post(i % 2 ? TrustLabel::Trusted : TrustLabel::Untrusted);
        }
        done = true;
    });

    while (!done.load()) {
        TrustLabel l;
        ASSERT_TRUE(feed.classify(l));
        EXPECT_TRUE(l == TrustLabel::Trusted || l == TrustLabel::Untrusted || l == TrustLabel::NoSignal);
    }
    producer.join();
    EXPECT_EQ(feed.posted(), 5000u);
}
