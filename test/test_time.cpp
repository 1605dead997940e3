//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "gtest/gtest.h"

#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptTime.h"

TEST(TimeTest, GetAndCurrentTime) {
    pt::time::spec_t t1, t2;
    pt::time::get(t1);
    usleep(1000);
    t2 = pt::time::current_time();
    EXPECT_TRUE(pt::time::isLTE(t1, t2));
    EXPECT_FALSE(pt::time::isEqual(t1, t2));
}

TEST(TimeTest, Elapsed) {
    pt::time::spec_t t0 = {1, 0};
    pt::time::spec_t t1 = {2, 500000000};
    EXPECT_EQ(pt::time::elapsedMicros(t0, t1), 1500000ull);
    EXPECT_EQ(pt::time::elapsedMs(t0, t1), 1500u);
    EXPECT_DOUBLE_EQ(pt::time::elapsedSecs(t0, t1), 1.5);
}

TEST(TimeTest, ElapsedWithinOneSecond) {
    pt::time::spec_t t0 = {5, 100000000};
    pt::time::spec_t t1 = {5, 350000000};
    EXPECT_EQ(pt::time::elapsedMicros(t0, t1), 250000ull);
}

TEST(TimeTest, ElapsedNow) {
    pt::time::spec_t t0;
    pt::time::get(t0);
    usleep(2000);
    EXPECT_GE(pt::time::elapsedMicros(t0), 2000ull);
    EXPECT_GT(pt::time::elapsedSecs(t0), 0.0);
}

TEST(TimeTest, Comparisons) {
    pt::time::spec_t t1 = {1, 100};
    pt::time::spec_t t2 = {1, 200};
    pt::time::spec_t t3 = {2, 0};

    EXPECT_TRUE(pt::time::isLTE(t1, t2));
    EXPECT_TRUE(pt::time::isLTE(t2, t3));
    EXPECT_TRUE(pt::time::isLTE(t1, t1));
    EXPECT_FALSE(pt::time::isLTE(t3, t1));

    EXPECT_TRUE(pt::time::isGTE(t3, t2));
    EXPECT_TRUE(pt::time::isGTE(t2, t2));
    EXPECT_FALSE(pt::time::isGTE(t1, t2));

    EXPECT_TRUE(pt::time::isEqual(t1, t1));
    EXPECT_FALSE(pt::time::isEqual(t1, t2));
}

TEST(TimeTest, Zero) {
    pt::time::spec_t t = {1, 1};
    EXPECT_FALSE(pt::time::isZero(t));
    pt::time::setZero(t);
    EXPECT_TRUE(pt::time::isZero(t));
}

TEST(TimeTest, Now) {
    pt::time::spec_t t;
    EXPECT_EQ(pt::time::now(t), pt::kOkRC);
    EXPECT_FALSE(pt::time::isZero(t));
}

TEST(TimeTest, Advance) {
    pt::time::spec_t t = {1, 0};
    pt::time::advanceMicros(t, 500000);
    EXPECT_EQ(t.tv_sec, 1);
    EXPECT_EQ(t.tv_nsec, 500000000);
    pt::time::advanceMs(t, 500);
    EXPECT_EQ(t.tv_sec, 2);
    EXPECT_EQ(t.tv_nsec, 0);
    pt::time::advanceMicros(t, 3250000);
    EXPECT_EQ(t.tv_sec, 5);
    EXPECT_EQ(t.tv_nsec, 250000000);
}

TEST(TimeTest, AdvanceSecs) {
    pt::time::spec_t t = {1, 900000000};
    pt::time::advanceSecs(t, 0.25);
    EXPECT_EQ(t.tv_sec, 2);
    EXPECT_EQ(t.tv_nsec, 150000000);

    // beyond the range of an unsigned microsecond count
    t = {10, 0};
    pt::time::advanceSecs(t, 5000.5);
    EXPECT_EQ(t.tv_sec, 5010);
    EXPECT_EQ(t.tv_nsec, 500000000);
}

TEST(TimeTest, FutureMs) {
    pt::time::spec_t t_future;
    ASSERT_EQ(pt::time::futureMs(t_future, 100), pt::kOkRC);
    pt::time::spec_t t_now;
    pt::time::get(t_now);
    EXPECT_TRUE(pt::time::isGTE(t_future, t_now));
    EXPECT_GE(pt::time::elapsedMicros(t_now, t_future), 100000ull - 1000 /* allow for 1ms jitter */);
}

TEST(TimeTest, Conversions) {
    pt::time::spec_t ts;
    pt::time::fracSecondsToSpec(ts, 1.5);
    EXPECT_EQ(ts.tv_sec, 1);
    EXPECT_EQ(ts.tv_nsec, 500000000);
    EXPECT_DOUBLE_EQ(pt::time::specToSeconds(ts), 1.5);
}

TEST(TimeTest, FormatDateTime) {
    char buf[128];
    unsigned len = pt::time::formatDateTime(buf, sizeof(buf), false);
    EXPECT_GT(len, 0u);
    EXPECT_LT(len, sizeof(buf));
    // Example format: 12:34:56.789
    EXPECT_EQ(buf[2], ':');
    EXPECT_EQ(buf[5], ':');
    EXPECT_EQ(buf[8], '.');

    len = pt::time::formatDateTime(buf, sizeof(buf), true);
    EXPECT_GT(len, 0u);
    EXPECT_LT(len, sizeof(buf));
    // Example format: 2024:01:26 12:34:56.789
    EXPECT_EQ(buf[4], ':');
    EXPECT_EQ(buf[7], ':');
    EXPECT_EQ(buf[10], ' ');
}
