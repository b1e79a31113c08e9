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
* Exposition of K-index results: Prometheus text gauge, line protocol points,
* derived series csv and a log table.
*/

#ifndef KINDEX_OUTPUT_HPP_
#define KINDEX_OUTPUT_HPP_

#include <ostream>
#include <vector>
#include <string>
#include "kindex_constant.hpp"

namespace kindex
{
    #define KINDEX_METRIC       "geomagnetic_k_index"   /* prometheus gauge name */
    #define KINDEX_MEASUREMENT  "k_index"               /* line protocol measurement */

    /* write prometheus gauge ----------------------------------------------------------------
    * args   : std::ostream& os             O   output stream
    *          const std::string& station   I   station label
    *          const KIndex& k              I   latest K-index
    * return : none
    * notes  : prometheus text exposition format (HELP, TYPE and one sample line)
    *---------------------------------------------------------------------------------------*/
    void write_prom_gauge(std::ostream& os, const std::string& station, const KIndex& k);

    /* write line protocol points ------------------------------------------------------------
    * args   : std::ostream& os             O   output stream
    *          const std::string& station   I   station tag
    *          const std::vector<KIndex>& kindex I K-index sequence
    * return : int - number of points written
    * notes  : k_index,station=<station> value=<K> <unix time in ns>
    *---------------------------------------------------------------------------------------*/
    int write_line_protocol(std::ostream& os, const std::string& station,
                            const std::vector<KIndex>& kindex);

    int write_deriv_csv(std::ostream& os, const std::vector<MagDeriv>& deriv);

    void print_kindex(std::ostream& os, const KIndexSet& set);

    /* replace text file ---------------------------------------------------------------------
    * args   : const std::string& path      I   output path
    *          const std::string& text      I   file content
    * return : bool - true if written and renamed into place
    *---------------------------------------------------------------------------------------*/
    bool write_text_file(const std::string& path, const std::string& text);

}   // namespace kindex

#endif
