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
*
* Field rate-of-change series derived from the filtered sample table, for
* plotting alongside the K-index.
*/

#ifndef KINDEX_MAG_DERIVATIVE_HPP_
#define KINDEX_MAG_DERIVATIVE_HPP_

#include <eigen3/Eigen/Dense>
#include <vector>
#include "kindex_constant.hpp"

namespace kindex
{
    #define MEDFILT_KERNEL  5                       /* median filter kernel size */

    /* absolute first difference -------------------------------------------------------------
    * args   : const Eigen::ArrayXd& v    I   series
    * return : Eigen::ArrayXd - |v[i]-v[i-1]|, 0 for the first element and where undefined
    *---------------------------------------------------------------------------------------*/
    Eigen::ArrayXd abs_diff(const Eigen::ArrayXd& v);

    /* median filter -------------------------------------------------------------------------
    * args   : const Eigen::ArrayXd& v    I   series
    *          int kernel                 I   odd kernel size
    * return : Eigen::ArrayXd - median of each kernel window, zero padded at both ends.
    *          The input unchanged if kernel is not odd and positive.
    *---------------------------------------------------------------------------------------*/
    Eigen::ArrayXd medfilt(const Eigen::ArrayXd& v, int kernel = MEDFILT_KERNEL);

    /* derived series ------------------------------------------------------------------------
    * args   : const std::vector<MagSamplePtr>& samples I samples (any order)
    *          int comp                   I   component triplet (COMP_???)
    *          std::vector<MagDeriv>& deriv O  derived series in ascending time
    * return : int - number of epochs
    * notes  : XYZ data: H=sqrt(X^2+Y^2). HDZ data: X=H*cos(D), D in arcmin.
    *          Rates are per sample interval (nT/min for minute data).
    *---------------------------------------------------------------------------------------*/
    int calc_derivative(const std::vector<MagSamplePtr>& samples, int comp,
                        std::vector<MagDeriv>& deriv);

}   // namespace kindex

#endif
