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

#include "kindex/kindex_calc.hpp"
#include "kindex/kindex_utility.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <eigen3/Eigen/Dense>
#include <glog/logging.h>

namespace kindex
{
    /* Niemegk reference thresholds (nT) for K=0..9 */
    static const double kindex_thres_base[KINDEX_NLEVEL] = {
        0.0, 5.0, 10.0, 20.0, 40.0, 70.0, 120.0, 200.0, 330.0, 500.0
    };

    struct BlockAcc                     /* samples of one block */
    {
        int n = 0;
        std::vector<double> val[NHCOMP];
    };

    int block_index(gtime_t t, gtime_t day_start)
    {
        return static_cast<int>(floor(time_diff(t, day_start) / KINDEX_BLOCK_SEC));
    }

    gtime_t first_daystart(const std::vector<MagSamplePtr>& samples)
    {
        auto first = std::min_element(samples.begin(), samples.end(),
                                      [](const MagSamplePtr& a, const MagSamplePtr& b) {
                                          return time_diff(a->time, b->time) < 0.0;
                                      });
        return time_daystart((*first)->time);
    }

    double ptp(const std::vector<double>& v)
    {
        std::vector<double> valid;
        valid.reserve(v.size());
        for (double x : v) {
            if (!std::isnan(x)) valid.push_back(x);
        }
        if (valid.size() < 2) return 0.0;

        Eigen::Map<const Eigen::VectorXd> vec(valid.data(), valid.size());
        return vec.maxCoeff() - vec.minCoeff();
    }

    int calc_windows(const std::vector<MagSamplePtr>& samples, const int *hidx,
                     std::vector<KWindow>& windows)
    {
        windows.clear();
        if (samples.empty()) {
            return 0;
        }

        const gtime_t day_start = first_daystart(samples);

        std::map<int, BlockAcc> blocks;
        for (const auto& s : samples) {
            BlockAcc& acc = blocks[block_index(s->time, day_start)];
            acc.n++;
            for (int k = 0; k < NHCOMP; ++k) {
                acc.val[k].push_back(s->val[hidx[k]]);
            }
        }

        for (const auto& entry : blocks) {
            KWindow w;
            w.block = entry.first;
            w.center = time_add(day_start, entry.first * KINDEX_BLOCK_SEC + KINDEX_HALF_BLOCK);
            w.n = entry.second.n;
            for (int k = 0; k < NHCOMP; ++k) {
                w.range[k] = w.n > 1 ? ptp(entry.second.val[k]) : 0.0;
            }
            w.var = w.n > 1 ? std::max(w.range[0], w.range[1]) : 0.0;
            windows.push_back(w);
        }

        LOG(INFO) << "calc_windows: " << samples.size() << " samples in " << windows.size()
                  << " windows from " << time2str(day_start);
        return static_cast<int>(windows.size());
    }

    void kindex_thres(double k9, double *thres)
    {
        for (int i = 0; i < KINDEX_NLEVEL; ++i) {
            thres[i] = kindex_thres_base[i] * k9 / KINDEX_K9_REF;
        }
    }

    double kindex_level(double var, double k9)
    {
        double thres[KINDEX_NLEVEL];
        kindex_thres(k9, thres);

        // number of thresholds <= var, minus one
        int level = static_cast<int>(std::upper_bound(thres, thres + KINDEX_NLEVEL, var) - thres) - 1;
        level = std::max(0, std::min(KINDEX_MAXLEVEL, level));

        return level == 0 ? KINDEX_QUIET : static_cast<double>(level);
    }

    int calc_kindex(const std::vector<KWindow>& windows, double k9, std::vector<KIndex>& kindex)
    {
        kindex.clear();
        for (const auto& w : windows) {
            KIndex k;
            k.time = w.center;
            k.value = kindex_level(w.var, k9);
            k.var = w.var;
            k.block = w.block;
            k.n = w.n;
            kindex.push_back(k);
        }
        return static_cast<int>(kindex.size());
    }

}   // namespace kindex
