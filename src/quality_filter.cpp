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

#include "kindex/quality_filter.hpp"
#include <cmath>
#include <limits>
#include <glog/logging.h>

namespace kindex
{
    Eigen::ArrayXd zscore(const Eigen::ArrayXd& v)
    {
        const Eigen::Index n = v.size();
        Eigen::ArrayXd z = Eigen::ArrayXd::Zero(n);
        if (n == 0) return z;

        // NaN != NaN
        const Eigen::Array<bool, Eigen::Dynamic, 1> valid = (v == v);
        const Eigen::Index nv = valid.count();
        if (nv == 0) return z;

        const Eigen::ArrayXd w = valid.select(v, 0.0);
        const double mean = w.sum() / nv;
        const double var = valid.select((v - mean).square(), 0.0).sum() / nv;
        const double sd = std::sqrt(var);
        if (!(sd > ZSCORE_MIN_STD)) return z;

        return valid.select((v - mean) / sd, std::numeric_limits<double>::quiet_NaN());
    }

    Eigen::ArrayXd comp_column(const std::vector<MagSamplePtr>& samples, int idx)
    {
        Eigen::ArrayXd col(samples.size());
        for (size_t i = 0; i < samples.size(); ++i) {
            col(i) = samples[i]->val[idx];
        }
        return col;
    }

    std::vector<MagSamplePtr> zscore_filter(const std::vector<MagSamplePtr>& samples,
                                            const int *hidx, double zmax)
    {
        if (samples.empty()) {
            return samples;
        }

        const Eigen::Index n = static_cast<Eigen::Index>(samples.size());
        Eigen::Array<bool, Eigen::Dynamic, 1> keep = Eigen::Array<bool, Eigen::Dynamic, 1>::Constant(n, true);

        for (int k = 0; k < NHCOMP; ++k) {
            const Eigen::ArrayXd z = zscore(comp_column(samples, hidx[k]));
            // NaN compares false and fails the gate
            keep = keep && (z.abs() <= zmax);
        }

        std::vector<MagSamplePtr> kept;
        kept.reserve(keep.count());
        for (Eigen::Index i = 0; i < n; ++i) {
            if (keep(i)) kept.push_back(samples[i]);
        }

        LOG(INFO) << "zscore_filter: kept " << kept.size() << "/" << samples.size()
                  << " samples (|z|<=" << zmax << ")";
        return kept;
    }

}   // namespace kindex
