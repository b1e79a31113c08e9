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
* As the calendar conversions are adapted from RTKLIB,
* the license for those part of code is claimed as follows:
*
* The RTKLIB software package is distributed under the following BSD 2-clause
* license (http://opensource.org/licenses/BSD-2-Clause) and additional two
* exclusive clauses. Users are permitted to develop, produce or sell their own
* non-commercial or commercial products utilizing, linking or including RTKLIB as
* long as they comply with the license.
*
*         Copyright (c) 2007-2020, T. Takasu, All rights reserved.
*/

#include "kindex/kindex_utility.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <sys/time.h>

namespace kindex
{
    gtime_t epoch2time(const double *ep)
    {
        const int doy[] = {1, 32, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335};
        gtime_t time = {0, 0};
        int days, sec, year = (int)ep[0], mon = (int)ep[1], day = (int)ep[2];

        if (year < 1970 || 2099 < year || mon < 1 || 12 < mon) return time;

        /* leap year if year%4==0 in 1901-2099 */
        days = (year-1970)*365 + (year-1969)/4 + doy[mon-1] + day - 2 + (year%4==0&&mon>=3?1:0);
        sec = (int)floor(ep[5]);
        time.time = (time_t)days*86400 + (int)ep[3]*3600 + (int)ep[4]*60 + sec;
        time.sec = ep[5] - sec;
        return time;
    }

    void time2epoch(gtime_t t, double *ep)
    {
        const int mday[] = { /* # of days in a month */
            31,28,31,30,31,30,31,31,30,31,30,31,31,28,31,30,31,30,31,31,30,31,30,31,
            31,29,31,30,31,30,31,31,30,31,30,31,31,28,31,30,31,30,31,31,30,31,30,31
        };
        int days, sec, mon, day;

        /* leap year if year%4==0 in 1901-2099 */
        days = (int)(t.time/86400);
        sec = (int)(t.time - (time_t)days*86400);
        for (day = days%1461, mon = 0; mon < 48; mon++) {
            if (day >= mday[mon]) day -= mday[mon]; else break;
        }
        ep[0] = 1970 + days/1461*4 + mon/12; ep[1] = mon%12 + 1; ep[2] = day + 1;
        ep[3] = sec/3600; ep[4] = sec%3600/60; ep[5] = sec%60 + t.sec;
    }

    gtime_t time_add(gtime_t t, double sec)
    {
        double tt;

        t.sec += sec;
        tt = floor(t.sec);
        t.time += (time_t)tt;
        t.sec -= tt;
        return t;
    }

    double time_diff(gtime_t t1, gtime_t t2)
    {
        return difftime(t1.time, t2.time) + t1.sec - t2.sec;
    }

    gtime_t time_daystart(gtime_t t)
    {
        double ep[6];
        time2epoch(t, ep);
        ep[3] = ep[4] = ep[5] = 0.0;
        return epoch2time(ep);
    }

    std::string time2str(gtime_t t, int n)
    {
        double ep[6];
        char buff[64];

        if (n < 0) n = 0; else if (n > 12) n = 12;
        if (1.0 - t.sec < 0.5/pow(10.0, n)) {
            t.time++;
            t.sec = 0.0;
        }
        time2epoch(t, ep);
        snprintf(buff, sizeof(buff), "%04.0f-%02.0f-%02.0f %02.0f:%02.0f:%0*.*f",
                 ep[0], ep[1], ep[2], ep[3], ep[4], n <= 0 ? 2 : n + 3, n <= 0 ? 0 : n, ep[5]);
        return std::string(buff);
    }

    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    bool str2time(const std::string& date, const std::string& tod, gtime_t *t)
    {
        double ep[6] = {0};
        int year, mon, day, hour, min, nc = 0;
        char sep1, sep2;

        if (sscanf(date.c_str(), "%4d%c%2d%c%2d%n", &year, &sep1, &mon, &sep2, &day, &nc) != 5 ||
            nc != (int)date.size() || sep1 != sep2 || (sep1 != '-' && sep1 != '/')) {
            return false;
        }
        if (year < 1970 || year > 2099 || mon < 1 || mon > 12 || day < 1) return false;
        int mdays = days_in_month[mon-1] + (mon == 2 && year % 4 == 0 ? 1 : 0);
        if (day > mdays) return false;

        // hh:mm[:ss[.sss]]
        std::string::size_type p1 = tod.find(':');
        if (p1 == std::string::npos) return false;
        std::string::size_type p2 = tod.find(':', p1 + 1);
        const std::string hh = tod.substr(0, p1);
        const std::string mm = tod.substr(p1 + 1, p2 == std::string::npos ? std::string::npos : p2 - p1 - 1);
        const std::string ss = p2 == std::string::npos ? std::string("0") : tod.substr(p2 + 1);

        auto all_digits = [](const std::string& s) {
            return !s.empty() && s.size() <= 2 &&
                   std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        };
        if (!all_digits(hh) || !all_digits(mm)) return false;
        hour = std::stoi(hh);
        min = std::stoi(mm);

        // seconds: digits with optional fraction
        if (ss.empty() || !std::isdigit((unsigned char)ss[0])) return false;
        char *end = nullptr;
        double sec = strtod(ss.c_str(), &end);
        if (end == ss.c_str() || *end != '\0') return false;

        if (hour > 23 || min > 59 || sec < 0.0 || sec >= 61.0) return false;

        ep[0] = year; ep[1] = mon; ep[2] = day;
        ep[3] = hour; ep[4] = min; ep[5] = sec;
        *t = epoch2time(ep);
        return true;
    }

    gtime_t time_now()
    {
        gtime_t time;
        struct timeval tv;

        if (!gettimeofday(&tv, NULL)) {
            time.time = tv.tv_sec;
            time.sec = tv.tv_usec * 1E-6;
        }
        else {
            time.time = ::time(NULL);
            time.sec = 0.0;
        }
        return time;
    }

    std::string trim(const std::string& s)
    {
        auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
        auto b = std::find_if_not(s.begin(), s.end(), is_ws);
        auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
        if (b >= e) return std::string();
        return std::string(b, e);
    }

    std::string to_upper(const std::string& s)
    {
        std::string u;
        u.reserve(s.size());
        for (char c : s) u.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        return u;
    }

    std::string to_lower(const std::string& s)
    {
        std::string u;
        u.reserve(s.size());
        for (char c : s) u.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return u;
    }

    std::vector<std::string> split_ws(const std::string& s)
    {
        std::vector<std::string> tokens;
        std::istringstream iss(s);
        std::string tok;
        while (iss >> tok) tokens.push_back(tok);
        return tokens;
    }

}   // namespace kindex
