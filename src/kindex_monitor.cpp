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

/**
 * kindex_monitor: K-index monitor of one observatory station
 *
 * Every polling interval the latest station files are read, the K-index
 * sequence is computed and the results are written to the configured outputs.
 */

#include "kindex/kindex_constant.hpp"
#include "kindex/kindex_utility.hpp"
#include "kindex/iaga_reader.hpp"
#include "kindex/kindex_cycle.hpp"
#include "kindex/mag_derivative.hpp"
#include "kindex/kindex_output.hpp"
#include "kindex/kindex_args.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <glog/logging.h>

using namespace kindex;

/* write outputs of one cycle */
static void expose_cycle(const StaOpt& opt, const KIndexSet& set)
{
    KIndex k;
    if (latest_kindex(set, k)) {
        LOG(INFO) << "Exposing latest K-index for " << set.station << ": " << k.value
                  << " (" << time2str(k.time) << ")";
        if (!opt.prom_file.empty()) {
            std::stringstream ss;
            write_prom_gauge(ss, set.station, k);
            write_text_file(opt.prom_file, ss.str());
        }
    }
    else {
        LOG(WARNING) << "No K-index for station " << set.station;
    }

    if (!opt.series_file.empty()) {
        std::stringstream ss;
        int n = write_line_protocol(ss, set.station, set.kindex);
        if (write_text_file(opt.series_file, ss.str())) {
            LOG(INFO) << "Wrote " << n << " points to " << opt.series_file;
        }
    }
    if (!opt.deriv_file.empty()) {
        std::vector<MagDeriv> deriv;
        calc_derivative(set.samples, set.comp, deriv);
        std::stringstream ss;
        write_deriv_csv(ss, deriv);
        if (write_text_file(opt.deriv_file, ss.str())) {
            LOG(INFO) << "Wrote " << deriv.size() << " epochs to " << opt.deriv_file;
        }
    }
}

int main(int argc, char* argv[])
{
    google::InitGoogleLogging(argv[0]);

    MonitorArgs args;
    const int stat = parse_monitor_args(argc, argv, args);
    if (stat == ARGS_HELP) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    if (stat != ARGS_OK) {
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (!check_staopt(args.opt)) {
        return 1;
    }

    LOG(INFO) << "Starting K-index monitor: code=" << args.opt.code << " k9=" << args.opt.k9
              << " days=" << args.opt.len_days << " interval=" << args.opt.interval << "s";

    while (true) {
        std::vector<std::string> paths;
        if (args.files.empty()) {
            list_station_files(args.opt, paths);
        }
        else {
            expand_input_files(args.files, paths);
        }

        const gtime_t t0 = time_now();
        KIndexSet set;
        if (kindex_cycle_files(args.opt, paths, set) != KINDEX_OK) {
            return 1;
        }
        print_kindex(std::cout, set);
        expose_cycle(args.opt, set);
        LOG(INFO) << "Cycle finished in " << time_diff(time_now(), t0) << " s";

        if (args.once) break;

        LOG(INFO) << "Sleeping for " << args.opt.interval << " s";
        std::this_thread::sleep_for(std::chrono::duration<double>(args.opt.interval));
    }
    return 0;
}
