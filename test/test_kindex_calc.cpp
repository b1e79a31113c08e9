/**
* This file is part of kindex.
*
* Copyright (C) 2021 Aerial Robotics Group, Hong Kong University of Science and Technology
* Author: CAO Shaozu (shaozu.cao@gmail.com)
*
* kindex is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* kindex is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with kindex. If not, see <http://www.gnu.org/licenses/>.
*/

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "kindex/kindex_calc.hpp"
#include "test_common.hpp"

using namespace kindex;
using namespace kindex_test;

static const int HIDX[NHCOMP] = {0, 1};

TEST(KindexCalc, LevelAtReferenceK9)
{
    EXPECT_DOUBLE_EQ(kindex_level(120.0, 500.0), 6.0);
    EXPECT_DOUBLE_EQ(kindex_level(4.0, 500.0), KINDEX_QUIET);
    EXPECT_DOUBLE_EQ(kindex_level(501.0, 500.0), 9.0);
    EXPECT_DOUBLE_EQ(kindex_level(0.0, 500.0), KINDEX_QUIET);
    EXPECT_DOUBLE_EQ(kindex_level(5.0, 500.0), 1.0);
    EXPECT_DOUBLE_EQ(kindex_level(40.0, 500.0), 4.0);
    EXPECT_DOUBLE_EQ(kindex_level(329.9, 500.0), 7.0);
    EXPECT_DOUBLE_EQ(kindex_level(500.0, 500.0), 9.0);
    EXPECT_DOUBLE_EQ(kindex_level(1E6, 500.0), 9.0);
}

TEST(KindexCalc, LevelIsScaleInvariant)
{
    const double vars[] = {0.0, 3.0, 7.5, 15.0, 33.0, 60.0, 100.0, 150.0, 250.0, 400.0, 800.0};
    for (double v : vars) {
        EXPECT_DOUBLE_EQ(kindex_level(2.0 * v, 1000.0), kindex_level(v, 500.0)) << "var=" << v;
    }
}

TEST(KindexCalc, ScaledThresholds)
{
    double thres[KINDEX_NLEVEL];
    kindex_thres(300.0, thres);
    EXPECT_DOUBLE_EQ(thres[0], 0.0);
    EXPECT_DOUBLE_EQ(thres[1], 3.0);
    EXPECT_DOUBLE_EQ(thres[6], 72.0);
    EXPECT_DOUBLE_EQ(thres[9], 300.0);
    for (int i = 1; i < KINDEX_NLEVEL; ++i) EXPECT_LT(thres[i - 1], thres[i]);
}

TEST(KindexCalc, PeakToPeak)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(ptp({}), 0.0);
    EXPECT_DOUBLE_EQ(ptp({5.0}), 0.0);
    EXPECT_DOUBLE_EQ(ptp({5.0, 2.0, 9.0}), 7.0);
    EXPECT_DOUBLE_EQ(ptp({nan, 2.0, nan, 6.5}), 4.5);
    EXPECT_DOUBLE_EQ(ptp({nan, 2.0}), 0.0);
}

TEST(KindexCalc, ThreeHourWindowOfMinuteSamples)
{
    std::vector<MagSamplePtr> samples;
    for (int i = 0; i < 180; ++i) {
        samples.push_back(make_sample(utc(2021, 3, 1, 0, i), 100.0 + i % 41, 100.0 + i % 11));
    }

    std::vector<KWindow> windows;
    ASSERT_EQ(calc_windows(samples, HIDX, windows), 1);
    EXPECT_EQ(windows[0].block, 0);
    EXPECT_EQ(windows[0].n, 180);
    EXPECT_DOUBLE_EQ(windows[0].range[0], 40.0);
    EXPECT_DOUBLE_EQ(windows[0].range[1], 10.0);
    EXPECT_DOUBLE_EQ(windows[0].var, 40.0);
    EXPECT_EQ(time2str(windows[0].center), "2021-03-01 01:30:00");

    std::vector<KIndex> kindex;
    ASSERT_EQ(calc_kindex(windows, 500.0, kindex), 1);
    EXPECT_DOUBLE_EQ(kindex[0].value, 4.0);
    EXPECT_DOUBLE_EQ(kindex[0].var, 40.0);
    EXPECT_EQ(kindex[0].n, 180);
}

TEST(KindexCalc, SingleSampleWindowIsQuiet)
{
    std::vector<MagSamplePtr> samples;
    samples.push_back(make_sample(utc(2021, 3, 1, 4, 0), 35000.0, 500.0));

    std::vector<KWindow> windows;
    ASSERT_EQ(calc_windows(samples, HIDX, windows), 1);
    EXPECT_EQ(windows[0].block, 1);
    EXPECT_DOUBLE_EQ(windows[0].var, 0.0);
    EXPECT_EQ(time2str(windows[0].center), "2021-03-01 04:30:00");

    std::vector<KIndex> kindex;
    calc_kindex(windows, 500.0, kindex);
    ASSERT_EQ(kindex.size(), 1u);
    EXPECT_DOUBLE_EQ(kindex[0].value, KINDEX_QUIET);
}

TEST(KindexCalc, EmptySamplesGiveNoWindows)
{
    std::vector<MagSamplePtr> samples;
    std::vector<KWindow> windows(3);
    EXPECT_EQ(calc_windows(samples, HIDX, windows), 0);
    EXPECT_TRUE(windows.empty());

    std::vector<KIndex> kindex(2);
    EXPECT_EQ(calc_kindex(windows, 500.0, kindex), 0);
    EXPECT_TRUE(kindex.empty());
}

TEST(KindexCalc, BlockIndexNonDecreasing)
{
    const gtime_t day_start = utc(2021, 3, 1);
    int prev = -1;
    for (int m = 0; m < 2 * 1440; m += 7) {
        int b = block_index(time_add(day_start, m * 60.0), day_start);
        EXPECT_GE(b, prev);
        EXPECT_EQ(b, m / 180);
        prev = b;
    }
    EXPECT_EQ(block_index(utc(2021, 3, 1, 2, 59, 59.9), day_start), 0);
    EXPECT_EQ(block_index(utc(2021, 3, 1, 3, 0, 0.0), day_start), 1);
    EXPECT_EQ(block_index(utc(2021, 3, 2, 0, 0, 0.0), day_start), 8);
}

TEST(KindexCalc, WindowsCountedFromFirstDay)
{
    // unsorted input starting late in the day
    std::vector<MagSamplePtr> samples;
    samples.push_back(make_sample(utc(2021, 3, 2, 1, 0), 10.0, 0.0));
    samples.push_back(make_sample(utc(2021, 3, 1, 22, 0), 0.0, 0.0));
    samples.push_back(make_sample(utc(2021, 3, 1, 23, 0), 0.0, 30.0));
    samples.push_back(make_sample(utc(2021, 3, 2, 2, 0), 80.0, 0.0));

    EXPECT_EQ(time2str(first_daystart(samples)), "2021-03-01 00:00:00");

    std::vector<KWindow> windows;
    ASSERT_EQ(calc_windows(samples, HIDX, windows), 2);
    EXPECT_EQ(windows[0].block, 7);
    EXPECT_EQ(windows[1].block, 8);
    EXPECT_EQ(time2str(windows[0].center), "2021-03-01 22:30:00");
    EXPECT_EQ(time2str(windows[1].center), "2021-03-02 01:30:00");
    EXPECT_DOUBLE_EQ(windows[0].var, 30.0);
    EXPECT_DOUBLE_EQ(windows[1].var, 70.0);

    std::vector<KIndex> kindex;
    calc_kindex(windows, 500.0, kindex);
    ASSERT_EQ(kindex.size(), 2u);
    EXPECT_DOUBLE_EQ(kindex[0].value, 3.0);
    EXPECT_DOUBLE_EQ(kindex[1].value, 5.0);
}

TEST(KindexCalc, HorizontalComponentPositions)
{
    // H in position 0, D unused, second component taken from position 2
    const int hidx[NHCOMP] = {0, 2};
    std::vector<MagSamplePtr> samples;
    samples.push_back(make_sample(utc(2021, 3, 1, 0, 0), 100.0, 0.0, 50.0));
    samples.push_back(make_sample(utc(2021, 3, 1, 0, 1), 110.0, 900.0, 75.0));

    std::vector<KWindow> windows;
    ASSERT_EQ(calc_windows(samples, hidx, windows), 1);
    EXPECT_DOUBLE_EQ(windows[0].var, 25.0);
}
