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
#include "kindex/kindex_cycle.hpp"
#include "test_common.hpp"

using namespace kindex;
using namespace kindex_test;

static const char *ENT_COLS = "ENTX      ENTY      ENTZ      ENTF";

/* day of minute data, horizontal ranges of 40 nT and 10 nT in every window */
static std::string ent_day(const std::string& date, int nmin = 1440)
{
    return iaga_day(iaga_header("Entoto", "ENT", "XYZF", ENT_COLS), date, nmin,
                    [](int i) { return 35000.0 + i % 41; },
                    [](int i) { return 500.0 + i % 11; });
}

TEST(KindexCycle, DefaultOptions)
{
    EXPECT_EQ(staopt_default.code, "ent");
    EXPECT_DOUBLE_EQ(staopt_default.k9, 500.0);
    EXPECT_EQ(staopt_default.len_days, 3);
    EXPECT_DOUBLE_EQ(staopt_default.interval, 600.0);
    EXPECT_DOUBLE_EQ(staopt_default.zmax, ZSCORE_MAX);
    EXPECT_EQ(staopt_default.suffix, "pmin.min");
    EXPECT_TRUE(check_staopt(staopt_default));
}

TEST(KindexCycle, InvalidOptions)
{
    StaOpt opt = staopt_default;
    opt.k9 = 0.0;
    EXPECT_FALSE(check_staopt(opt));

    KIndexSet set;
    EXPECT_EQ(kindex_cycle(opt, {ent_day("2021-03-01")}, set), KINDEX_ERR_OPT);
    EXPECT_TRUE(set.kindex.empty());

    opt = staopt_default;
    opt.len_days = 0;
    EXPECT_FALSE(check_staopt(opt));
    opt = staopt_default;
    opt.interval = -1.0;
    EXPECT_FALSE(check_staopt(opt));
    opt = staopt_default;
    opt.zmax = 0.0;
    EXPECT_FALSE(check_staopt(opt));
}

TEST(KindexCycle, EmptySupplyGivesEmptySequence)
{
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, {}, set), KINDEX_OK);
    EXPECT_TRUE(set.kindex.empty());
    EXPECT_TRUE(set.samples.empty());
    EXPECT_EQ(set.nfile, 0);
    EXPECT_EQ(set.nfail, 0);
    EXPECT_EQ(set.station, "ENT");

    KIndex k;
    EXPECT_FALSE(latest_kindex(set, k));
}

TEST(KindexCycle, ThreeHourWindowOfOneFile)
{
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, {ent_day("2021-03-01", 180)}, set), KINDEX_OK);
    ASSERT_EQ(set.kindex.size(), 1u);
    EXPECT_DOUBLE_EQ(set.kindex[0].var, 40.0);
    EXPECT_DOUBLE_EQ(set.kindex[0].value, 4.0);
    EXPECT_EQ(set.kindex[0].n, 180);
    EXPECT_EQ(time2str(set.kindex[0].time), "2021-03-01 01:30:00");
    EXPECT_EQ(set.station, "Entoto");
    EXPECT_EQ(set.comp, COMP_XYZ);
    EXPECT_EQ(set.labels, "XYZ");
}

TEST(KindexCycle, MergesFilesInTimeOrder)
{
    // files supplied newest first, as selected from the data directory
    std::vector<std::string> contents = {
        ent_day("2021-03-03"), ent_day("2021-03-02"), ent_day("2021-03-01")
    };
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, contents, set), KINDEX_OK);
    EXPECT_EQ(set.nfile, 3);
    EXPECT_EQ(set.nfail, 0);
    EXPECT_EQ(set.samples.size(), 3u * 1440u);
    ASSERT_EQ(set.kindex.size(), 24u);

    for (size_t i = 0; i < set.kindex.size(); ++i) {
        EXPECT_EQ(set.kindex[i].block, (int)i);
        EXPECT_DOUBLE_EQ(set.kindex[i].value, 4.0);
        EXPECT_EQ(set.kindex[i].n, 180);
    }
    for (size_t i = 1; i < set.samples.size(); ++i) {
        EXPECT_GE(time_diff(set.samples[i]->time, set.samples[i - 1]->time), 0.0);
    }

    KIndex k;
    ASSERT_TRUE(latest_kindex(set, k));
    EXPECT_EQ(time2str(k.time), "2021-03-03 22:30:00");
}

TEST(KindexCycle, FormatErrorSkipsFile)
{
    std::vector<std::string> contents = {"not an observatory file\n", ent_day("2021-03-01")};
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, contents, set), KINDEX_OK);
    EXPECT_EQ(set.nfile, 1);
    EXPECT_EQ(set.nfail, 1);
    EXPECT_EQ(set.kindex.size(), 8u);
}

TEST(KindexCycle, AllFilesFailGivesEmptySequence)
{
    std::vector<std::string> contents = {
        "garbage\n", iaga_header("Entoto", "ENT", "XYZF", ENT_COLS)
    };
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, contents, set), KINDEX_OK);
    EXPECT_EQ(set.nfile, 0);
    EXPECT_EQ(set.nfail, 2);
    EXPECT_TRUE(set.kindex.empty());
}

TEST(KindexCycle, ConflictingTripletIsRejected)
{
    std::string hdz = iaga_day(iaga_header("Entoto", "ENT", "HDZF", "ENTH      ENTD      ENTZ      ENTF"),
                               "2021-03-02", 1440,
                               [](int) { return 35000.0; }, [](int) { return 60.0; });
    std::vector<std::string> contents = {ent_day("2021-03-01"), hdz};

    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, contents, set), KINDEX_OK);
    EXPECT_EQ(set.comp, COMP_XYZ);
    EXPECT_EQ(set.nfile, 1);
    EXPECT_EQ(set.nfail, 1);
    EXPECT_EQ(set.samples.size(), 1440u);
    EXPECT_EQ(set.kindex.size(), 8u);
}

TEST(KindexCycle, OutlierRemovedBeforeWindowing)
{
    std::string content = iaga_day(iaga_header("Entoto", "ENT", "XYZF", ENT_COLS), "2021-03-01", 360,
                                   [](int i) { return i == 200 ? 36000.0 : 35000.0 + i % 3; },
                                   [](int) { return 500.0; });
    KIndexSet set;
    ASSERT_EQ(kindex_cycle(staopt_default, {content}, set), KINDEX_OK);
    EXPECT_EQ(set.samples.size(), 359u);
    ASSERT_EQ(set.kindex.size(), 2u);
    EXPECT_DOUBLE_EQ(set.kindex[1].var, 2.0);
    EXPECT_DOUBLE_EQ(set.kindex[1].value, KINDEX_QUIET);
    EXPECT_EQ(set.kindex[1].n, 179);
}

TEST(KindexCycle, StationNameOverrideAndK9)
{
    StaOpt opt = staopt_default;
    opt.name = "Addis Ababa";
    opt.k9 = 300.0;

    KIndexSet set;
    ASSERT_EQ(kindex_cycle(opt, {ent_day("2021-03-01", 180)}, set), KINDEX_OK);
    EXPECT_EQ(set.station, "Addis Ababa");
    ASSERT_EQ(set.kindex.size(), 1u);
    // level 4 spans 24 to 42 nT for K9=300
    EXPECT_DOUBLE_EQ(set.kindex[0].value, 4.0);

    opt.k9 = 200.0;
    ASSERT_EQ(kindex_cycle(opt, {ent_day("2021-03-01", 180)}, set), KINDEX_OK);
    // level 5 starts at 28 nT for K9=200
    EXPECT_DOUBLE_EQ(set.kindex[0].value, 5.0);
}

TEST(KindexCycle, ReadFilesFromDisk)
{
    TempDir dir;
    ASSERT_TRUE(write_file(dir.file("ent20210301pmin.min"), ent_day("2021-03-01")));
    ASSERT_TRUE(write_file(dir.file("ent20210302pmin.min"), ent_day("2021-03-02")));

    std::vector<std::string> paths = {
        dir.file("ent20210302pmin.min"), dir.file("ent20210301pmin.min"), dir.file("missing.min")
    };
    KIndexSet set;
    ASSERT_EQ(kindex_cycle_files(staopt_default, paths, set), KINDEX_OK);
    EXPECT_EQ(set.nfile, 2);
    EXPECT_EQ(set.nfail, 1);
    EXPECT_EQ(set.kindex.size(), 16u);
}
