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

#ifndef KINDEX_QUALITY_FILTER_HPP_
#define KINDEX_QUALITY_FILTER_HPP_

#include <eigen3/Eigen/Dense>
#include <vector>
#include "kindex_constant.hpp"

namespace kindex
{
    /* standard scores of one component ------------------------------------------------------
    * args   : const Eigen::ArrayXd& v    I   component values (NaN: no value)
    * return : Eigen::ArrayXd - (v-mean)/std with mean and population std over non-NaN
    *          values. NaN where v is NaN. All zero if std is zero, near zero or undefined.
    *---------------------------------------------------------------------------------------*/
    Eigen::ArrayXd zscore(const Eigen::ArrayXd& v);

    /* component column of samples -----------------------------------------------------------
    * args   : const std::vector<MagSamplePtr>& samples I samples
    *          int idx                    I   triplet position of component
    * return : Eigen::ArrayXd - values in sample order
    *---------------------------------------------------------------------------------------*/
    Eigen::ArrayXd comp_column(const std::vector<MagSamplePtr>& samples, int idx);

    /* reject outliers by joint z-score gate -------------------------------------------------
    * args   : const std::vector<MagSamplePtr>& samples I samples
    *          const int *hidx            I   triplet positions of the selected components (NHCOMP)
    *          double zmax                I   gate on |z| (ZSCORE_MAX)
    * return : std::vector<MagSamplePtr> - retained samples in input order
    * notes  : a sample is kept only if every selected component scores |z|<=zmax.
    *          A NaN value fails the gate unless its component has zero variance.
    *---------------------------------------------------------------------------------------*/
    std::vector<MagSamplePtr> zscore_filter(const std::vector<MagSamplePtr>& samples,
                                            const int *hidx, double zmax = ZSCORE_MAX);

}   // namespace kindex

#endif
