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
* One K-index processing cycle of a station: read the files of the lookback
* period, merge, reject outliers, aggregate into windows and quantize.
*/

#ifndef KINDEX_CYCLE_HPP_
#define KINDEX_CYCLE_HPP_

#include <vector>
#include <string>
#include "kindex_constant.hpp"

namespace kindex
{
    /* Check station options -----------------------------------------------------------------
    * args   : const StaOpt& opt            I   station options
    * return : bool - true if options are valid (k9>0, len_days>=1, interval>0, zmax>0)
    *---------------------------------------------------------------------------------------*/
    bool check_staopt(const StaOpt& opt);

    /* Process one cycle from file contents --------------------------------------------------
    * args   : const StaOpt& opt            I   station options
    *          const std::vector<std::string>& contents I raw IAGA-2002 file contents
    *          KIndexSet& set               O   K-index sequence and filtered samples
    * return : int - status (KINDEX_OK: ok, KINDEX_ERR_OPT: invalid options)
    * notes  : Files with format errors, without data rows, or whose component triplet
    *          differs from the first accepted file are skipped and counted in set.nfail.
    *          An empty supply or no usable file gives an empty sequence with KINDEX_OK.
    *---------------------------------------------------------------------------------------*/
    int kindex_cycle(const StaOpt& opt, const std::vector<std::string>& contents, KIndexSet& set);

    /* Process one cycle from files ----------------------------------------------------------
    * args   : const StaOpt& opt            I   station options
    *          const std::vector<std::string>& paths I  IAGA-2002 file paths
    *          KIndexSet& set               O   K-index sequence and filtered samples
    * return : int - status (KINDEX_OK: ok, KINDEX_ERR_OPT: invalid options)
    *---------------------------------------------------------------------------------------*/
    int kindex_cycle_files(const StaOpt& opt, const std::vector<std::string>& paths, KIndexSet& set);

    /* Latest K-index of cycle ---------------------------------------------------------------
    * args   : const KIndexSet& set         I   cycle result
    *          KIndex& k                    O   K-index of the last window
    * return : bool - false if the sequence is empty
    *---------------------------------------------------------------------------------------*/
    bool latest_kindex(const KIndexSet& set, KIndex& k);

}   // namespace kindex

#endif
