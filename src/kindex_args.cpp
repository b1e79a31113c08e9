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

#include "kindex/kindex_args.hpp"
#include "kindex/iaga_reader.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <glog/logging.h>

namespace kindex
{
    /* string to number, whole string must be consumed */
    static bool str2num(const char *s, double& v)
    {
        char *end = nullptr;
        errno = 0;
        double d = strtod(s, &end);
        if (end == s || *end != '\0' || errno != 0 || !std::isfinite(d)) return false;
        v = d;
        return true;
    }

    static bool str2num(const char *s, int& v)
    {
        char *end = nullptr;
        errno = 0;
        long l = strtol(s, &end, 10);
        if (end == s || *end != '\0' || errno != 0 || l < INT_MIN || l > INT_MAX) return false;
        v = static_cast<int>(l);
        return true;
    }

    void print_usage(std::ostream& os, const char *exe)
    {
        os  << "Usage: " << exe << " [options] [file ...]\n\n"
            << "Options:\n"
            << "  --code <code>            Station code, file name and column prefix (default: ent)\n"
            << "  --name <name>            Station name for outputs (default: from file header)\n"
            << "  --k9 <nT>                K9 limit of the station (default: 500)\n"
            << "  --days <N>               Number of daily files to process (default: 3)\n"
            << "  --interval <sec>         Polling interval (default: 600)\n"
            << "  --zmax <z>               Outlier gate on |z-score| (default: 2.5)\n"
            << "  --data_dir <path>        Directory of daily IAGA-2002 files (default: .)\n"
            << "  --suffix <sfx>           File name suffix (default: pmin.min)\n"
            << "  --prom_file <file>       Prometheus text file of the latest K-index\n"
            << "  --series_file <file>     Line protocol file of the K-index sequence\n"
            << "  --deriv_file <file>      CSV file of the derived field rate series\n"
            << "  --once                   Run a single cycle and exit\n"
            << "  -h, --help               Show this help\n\n"
            << "Files (or wildcard patterns) given on the command line replace the\n"
            << "data directory scan.\n";
    }

    int parse_monitor_args(int argc, const char *const *argv, MonitorArgs& a)
    {
        for (int i = 1; i < argc; ++i) {
            const std::string key = argv[i];
            auto need_value = [&](const std::string& k) -> const char* {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for " << k << "\n";
                    return nullptr;
                }
                return argv[++i];
            };

            if (key == "-h" || key == "--help") {
                return ARGS_HELP;
            } else if (key == "--once") {
                a.once = true;
            } else if (key == "--code" || key == "--name" || key == "--data_dir" ||
                       key == "--suffix" || key == "--prom_file" || key == "--series_file" ||
                       key == "--deriv_file") {
                const char* v = need_value(key);
                if (!v) return ARGS_ERR;
                if      (key == "--code")        a.opt.code = v;
                else if (key == "--name")        a.opt.name = v;
                else if (key == "--data_dir")    a.opt.data_dir = v;
                else if (key == "--suffix")      a.opt.suffix = v;
                else if (key == "--prom_file")   a.opt.prom_file = v;
                else if (key == "--series_file") a.opt.series_file = v;
                else                             a.opt.deriv_file = v;
            } else if (key == "--days") {
                const char* v = need_value(key);
                if (!v) return ARGS_ERR;
                if (!str2num(v, a.opt.len_days)) {
                    std::cerr << "Invalid value for " << key << ": " << v << "\n";
                    return ARGS_ERR;
                }
            } else if (key == "--k9" || key == "--interval" || key == "--zmax") {
                const char* v = need_value(key);
                if (!v) return ARGS_ERR;
                double& dst = key == "--k9" ? a.opt.k9 :
                              key == "--interval" ? a.opt.interval : a.opt.zmax;
                if (!str2num(v, dst)) {
                    std::cerr << "Invalid value for " << key << ": " << v << "\n";
                    return ARGS_ERR;
                }
            } else if (key.size() > 1 && key[0] == '-') {
                std::cerr << "Unknown option: " << key << "\n";
                return ARGS_ERR;
            } else {
                a.files.push_back(key);
            }
        }
        return ARGS_OK;
    }

    int expand_input_files(const std::vector<std::string>& files, std::vector<std::string>& paths)
    {
        paths.clear();
        for (const auto& f : files) {
            std::vector<std::string> expanded;
            if (expath(f, expanded) <= 0) {
                LOG(WARNING) << "No files match " << f;
                continue;
            }
            paths.insert(paths.end(), expanded.begin(), expanded.end());
        }
        return static_cast<int>(paths.size());
    }

}   // namespace kindex
