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

#include "kindex/kindex_output.hpp"
#include "kindex/kindex_utility.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <glog/logging.h>

namespace kindex
{
    static std::string fmt_value(double v)
    {
        std::ostringstream ss;
        ss << v;
        return ss.str();
    }

    /* escape label value of prometheus text format */
    static std::string prom_escape(const std::string& s)
    {
        std::string out;
        for (char c : s) {
            if      (c == '\\') out += "\\\\";
            else if (c == '"')  out += "\\\"";
            else if (c == '\n') out += "\\n";
            else                out += c;
        }
        return out;
    }

    /* escape tag value of line protocol */
    static std::string tag_escape(const std::string& s)
    {
        std::string out;
        for (char c : s) {
            if (c == ' ' || c == ',' || c == '=') out += '\\';
            out += c;
        }
        return out;
    }

    void write_prom_gauge(std::ostream& os, const std::string& station, const KIndex& k)
    {
        os << "# HELP " << KINDEX_METRIC << " K-index value\n";
        os << "# TYPE " << KINDEX_METRIC << " gauge\n";
        os << KINDEX_METRIC << "{station=\"" << prom_escape(station) << "\"} "
           << fmt_value(k.value) << "\n";
    }

    int write_line_protocol(std::ostream& os, const std::string& station,
                            const std::vector<KIndex>& kindex)
    {
        const std::string tag = tag_escape(station);
        for (const auto& k : kindex) {
            const long long ns = static_cast<long long>(k.time.time) * 1000000000LL +
                                 static_cast<long long>(std::llround(k.time.sec * 1E9));
            os << KINDEX_MEASUREMENT << ",station=" << tag << " value=" << fmt_value(k.value)
               << " " << ns << "\n";
        }
        return static_cast<int>(kindex.size());
    }

    int write_deriv_csv(std::ostream& os, const std::vector<MagDeriv>& deriv)
    {
        os << "time,X,H,F,dX/dt,dX/dt_smooth,dH/dt,dH/dt_smooth,dF/dt,dF/dt_smooth\n";
        for (const auto& d : deriv) {
            const double val[9] = {d.x, d.h, d.f, d.dx, d.dx_smooth, d.dh, d.dh_smooth,
                                   d.df, d.df_smooth};
            std::stringstream ss;
            ss << time2str(d.time);
            for (int i = 0; i < 9; ++i) {
                ss << ",";
                // empty field for no value
                if (!std::isnan(val[i])) ss << std::fixed << std::setprecision(3) << val[i];
            }
            os << ss.str() << "\n";
        }
        return static_cast<int>(deriv.size());
    }

    void print_kindex(std::ostream& os, const KIndexSet& set)
    {
        os << "station: " << set.station << " (" << (set.labels.empty() ? "-" : set.labels)
           << ")  files: " << set.nfile << "  rejected: " << set.nfail
           << "  samples: " << set.samples.size() << std::endl;
        os << "  blk | window center       |    n |   var(nT) |    K" << std::endl;
        os << "-------------------------------------------------------" << std::endl;
        for (const auto& k : set.kindex) {
            std::stringstream ss;
            ss << std::setw(5) << k.block << " | "
               << time2str(k.time) << " | "
               << std::setw(4) << k.n << " | "
               << std::fixed << std::setprecision(2) << std::setw(9) << k.var << " | "
               << std::setw(4) << fmt_value(k.value);
            os << ss.str() << std::endl;
        }
    }

    bool write_text_file(const std::string& path, const std::string& text)
    {
        const std::string tmp = path + ".tmp";
        std::ofstream ofs(tmp, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            LOG(ERROR) << "Cannot open output file: " << tmp;
            return false;
        }
        ofs << text;
        ofs.close();
        if (ofs.fail()) {
            LOG(ERROR) << "Error writing output file: " << tmp;
            std::remove(tmp.c_str());
            return false;
        }
        if (std::rename(tmp.c_str(), path.c_str()) != 0) {
            LOG(ERROR) << "Cannot rename " << tmp << " to " << path;
            std::remove(tmp.c_str());
            return false;
        }
        return true;
    }

}   // namespace kindex
