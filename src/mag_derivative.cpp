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

#include "kindex/mag_derivative.hpp"
#include "kindex/kindex_utility.hpp"
#include <algorithm>
#include <cmath>
#include <glog/logging.h>

namespace kindex
{
    Eigen::ArrayXd abs_diff(const Eigen::ArrayXd& v)
    {
        const Eigen::Index n = v.size();
        Eigen::ArrayXd d = Eigen::ArrayXd::Zero(n);
        if (n < 2) return d;

        d.tail(n - 1) = (v.tail(n - 1) - v.head(n - 1)).abs();
        return d.isNaN().select(0.0, d);
    }

    Eigen::ArrayXd medfilt(const Eigen::ArrayXd& v, int kernel)
    {
        if (kernel < 1 || kernel % 2 == 0) {
            LOG(ERROR) << "medfilt: kernel size must be odd and positive, got " << kernel;
            return v;
        }
        const Eigen::Index n = v.size();
        const int half = kernel / 2;
        Eigen::ArrayXd out(n);
        std::vector<double> win(kernel);

        for (Eigen::Index i = 0; i < n; ++i) {
            for (int j = -half; j <= half; ++j) {
                const Eigen::Index k = i + j;
                win[j + half] = (k < 0 || k >= n) ? 0.0 : v(k);
            }
            std::nth_element(win.begin(), win.begin() + half, win.end());
            out(i) = win[half];
        }
        return out;
    }

    int calc_derivative(const std::vector<MagSamplePtr>& samples, int comp,
                        std::vector<MagDeriv>& deriv)
    {
        deriv.clear();
        if (samples.empty() || (comp != COMP_XYZ && comp != COMP_HDZ)) {
            return 0;
        }

        std::vector<MagSamplePtr> sorted(samples);
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const MagSamplePtr& a, const MagSamplePtr& b) {
                             return time_diff(a->time, b->time) < 0.0;
                         });

        const Eigen::Index n = static_cast<Eigen::Index>(sorted.size());
        Eigen::ArrayXd c0(n), c1(n), f(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            c0(i) = sorted[i]->val[0];
            c1(i) = sorted[i]->val[1];
            f(i) = sorted[i]->f;
        }

        Eigen::ArrayXd x, h;
        if (comp == COMP_XYZ) {
            x = c0;
            h = (c0.square() + c1.square()).sqrt();
        }
        else {
            // D in arcmin
            h = c0;
            x = h * (c1 / 60.0 * M_PI / 180.0).cos();
        }

        const Eigen::ArrayXd dx = abs_diff(x), dh = abs_diff(h), df = abs_diff(f);
        const Eigen::ArrayXd dxs = medfilt(dx), dhs = medfilt(dh), dfs = medfilt(df);

        deriv.resize(sorted.size());
        for (Eigen::Index i = 0; i < n; ++i) {
            MagDeriv& d = deriv[i];
            d.time = sorted[i]->time;
            d.x = x(i);
            d.h = h(i);
            d.f = f(i);
            d.dx = dx(i); d.dx_smooth = dxs(i);
            d.dh = dh(i); d.dh_smooth = dhs(i);
            d.df = df(i); d.df_smooth = dfs(i);
        }
        return static_cast<int>(deriv.size());
    }

}   // namespace kindex
