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
* Time and string utilities. The calendar conversions follow RTKLIB:
*
* The RTKLIB software package is distributed under the following BSD 2-clause
* license (http://opensource.org/licenses/BSD-2-Clause) and additional two
* exclusive clauses. Users are permitted to develop, produce or sell their own
* non-commercial or commercial products utilizing, linking or including RTKLIB as
* long as they comply with the license.
*
*         Copyright (c) 2007-2020, T. Takasu, All rights reserved.
*/

#ifndef KINDEX_UTILITY_HPP_
#define KINDEX_UTILITY_HPP_

#include <string>
#include <vector>
#include "kindex_constant.hpp"

namespace kindex
{
    /* convert calendar day/time to time ---------------------------------------------------
    * args   : const double *ep        I   day/time {year,month,day,hour,min,sec}
    * return : gtime_t struct ({0,0} if year/month out of range)
    * notes  : proper in 1970-2099
    *---------------------------------------------------------------------------------------*/
    gtime_t epoch2time(const double *ep);

    /* time to calendar day/time -----------------------------------------------------------
    * args   : gtime_t t               I   gtime_t struct
    *          double *ep              O   day/time {year,month,day,hour,min,sec}
    * return : none
    *---------------------------------------------------------------------------------------*/
    void time2epoch(gtime_t t, double *ep);

    /* add time ------------------------------------------------------------------------------
    * args   : gtime_t t               I   gtime_t struct
    *          double sec              I   time to add (s)
    * return : gtime_t struct (t+sec)
    *---------------------------------------------------------------------------------------*/
    gtime_t time_add(gtime_t t, double sec);

    /* time difference -----------------------------------------------------------------------
    * args   : gtime_t t1,t2           I   gtime_t structs
    * return : time difference (t1-t2) (s)
    *---------------------------------------------------------------------------------------*/
    double time_diff(gtime_t t1, gtime_t t2);

    /* start of UTC day ----------------------------------------------------------------------
    * args   : gtime_t t               I   gtime_t struct
    * return : 00:00:00 UTC of the calendar day containing t
    *---------------------------------------------------------------------------------------*/
    gtime_t time_daystart(gtime_t t);

    /* time to string ------------------------------------------------------------------------
    * args   : gtime_t t               I   gtime_t struct
    *          int n                   I   number of decimals of seconds
    * return : string "yyyy-mm-dd hh:mm:ss(.s...)"
    *---------------------------------------------------------------------------------------*/
    std::string time2str(gtime_t t, int n = 0);

    /* parse date and time-of-day fields -----------------------------------------------------
    * args   : const std::string& date  I   "yyyy-mm-dd" or "yyyy/mm/dd"
    *          const std::string& tod   I   "hh:mm", "hh:mm:ss" or "hh:mm:ss.sss"
    *          gtime_t *t               O   time (UTC)
    * return : bool - true if both fields parse and are in range
    *---------------------------------------------------------------------------------------*/
    bool str2time(const std::string& date, const std::string& tod, gtime_t *t);

    /* current system time in UTC ------------------------------------------------------------*/
    gtime_t time_now();

    /* trim leading and trailing whitespace --------------------------------------------------*/
    std::string trim(const std::string& s);

    /* upper/lower case copy of string -------------------------------------------------------*/
    std::string to_upper(const std::string& s);
    std::string to_lower(const std::string& s);

    /* split string at whitespace ------------------------------------------------------------*/
    std::vector<std::string> split_ws(const std::string& s);

}   // namespace kindex

#endif
