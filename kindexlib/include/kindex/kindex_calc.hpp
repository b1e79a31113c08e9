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
* 3-hour window aggregation and K-index quantization.
*/

#ifndef KINDEX_CALC_HPP_
#define KINDEX_CALC_HPP_

#include <vector>
#include "kindex_constant.hpp"

namespace kindex
{
    /* window block index --------------------------------------------------------------------
    * args   : gtime_t t                  I   sample time
    *          gtime_t day_start          I   start of first day
    * return : int - floor((t-day_start)/KINDEX_BLOCK_SEC)
    *---------------------------------------------------------------------------------------*/
    int block_index(gtime_t t, gtime_t day_start);

    /* start of first day of samples ---------------------------------------------------------
    * args   : const std::vector<MagSamplePtr>& samples I samples (any order, not empty)
    * return : gtime_t - 00:00 UTC of the day containing the earliest sample
    *---------------------------------------------------------------------------------------*/
    gtime_t first_daystart(const std::vector<MagSamplePtr>& samples);

    /* peak-to-peak range --------------------------------------------------------------------
    * args   : const std::vector<double>& v I   values (NaN: no value)
    * return : double - max-min over non-NaN values, 0 if fewer than two
    *---------------------------------------------------------------------------------------*/
    double ptp(const std::vector<double>& v);

    /* aggregate samples into 3-hour windows -------------------------------------------------
    * args   : const std::vector<MagSamplePtr>& samples I filtered samples
    *          const int *hidx            I   triplet positions of horizontal components (NHCOMP)
    *          std::vector<KWindow>& windows O windows in ascending block order
    * return : int - number of windows
    * notes  : blocks are counted from 00:00 UTC of the earliest sample. The statistic
    *          of a window is the larger peak-to-peak range of the two components, or 0
    *          for a window holding a single sample.
    *---------------------------------------------------------------------------------------*/
    int calc_windows(const std::vector<MagSamplePtr>& samples, const int *hidx,
                     std::vector<KWindow>& windows);

    /* scaled K-index thresholds -------------------------------------------------------------
    * args   : double k9                  I   K9 limit of station (nT)
    *          double *thres              O   thresholds (KINDEX_NLEVEL)
    * return : none
    * notes  : base table {0,5,10,20,40,70,120,200,330,500} scaled by k9/500
    *---------------------------------------------------------------------------------------*/
    void kindex_thres(double k9, double *thres);

    /* K-index of disturbance statistic ------------------------------------------------------
    * args   : double var                 I   disturbance statistic (nT)
    *          double k9                  I   K9 limit of station (nT)
    * return : double - K-index (KINDEX_QUIET for level 0, 1-9 otherwise)
    *---------------------------------------------------------------------------------------*/
    double kindex_level(double var, double k9);

    /* K-index of windows --------------------------------------------------------------------
    * args   : const std::vector<KWindow>& windows I windows
    *          double k9                  I   K9 limit of station (nT)
    *          std::vector<KIndex>& kindex O   K-index per window
    * return : int - number of K-index values
    *---------------------------------------------------------------------------------------*/
    int calc_kindex(const std::vector<KWindow>& windows, double k9, std::vector<KIndex>& kindex);

}   // namespace kindex

#endif
