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

#include "kindex/kindex_cycle.hpp"
#include "kindex/iaga_reader.hpp"
#include "kindex/quality_filter.hpp"
#include "kindex/kindex_calc.hpp"
#include "kindex/kindex_utility.hpp"
#include <algorithm>
#include <glog/logging.h>

namespace kindex
{
    const StaOpt staopt_default = {
        "ent",              /* code */
        "",                 /* name */
        500.0,              /* k9 */
        3,                  /* len_days */
        600.0,              /* interval */
        ZSCORE_MAX,         /* zmax */
        ".",                /* data_dir */
        "pmin.min",         /* suffix */
        "",                 /* prom_file */
        "",                 /* series_file */
        ""                  /* deriv_file */
    };

    bool check_staopt(const StaOpt& opt)
    {
        if (!(opt.k9 > 0.0)) {
            LOG(ERROR) << "invalid station option: k9=" << opt.k9;
            return false;
        }
        if (opt.len_days < 1) {
            LOG(ERROR) << "invalid station option: len_days=" << opt.len_days;
            return false;
        }
        if (!(opt.interval > 0.0)) {
            LOG(ERROR) << "invalid station option: interval=" << opt.interval;
            return false;
        }
        if (!(opt.zmax > 0.0)) {
            LOG(ERROR) << "invalid station option: zmax=" << opt.zmax;
            return false;
        }
        return true;
    }

    static void init_kindexset(const StaOpt& opt, KIndexSet& set)
    {
        set.station = opt.name.empty() ? to_upper(opt.code) : opt.name;
        set.comp = COMP_NONE;
        set.labels.clear();
        set.kindex.clear();
        set.samples.clear();
        set.nfile = 0;
        set.nfail = 0;
    }

    /* Process cycle with file labels for log messages ---------------------------------------*/
    static int process_cycle(const StaOpt& opt, const std::vector<std::string>& labels,
                             const std::vector<std::string>& contents, KIndexSet& set)
    {
        if (!check_staopt(opt)) {
            return KINDEX_ERR_OPT;
        }
        if (contents.empty()) {
            LOG(WARNING) << "No files for station " << set.station;
            return KINDEX_OK;
        }

        std::vector<MagSamplePtr> merged;
        int hidx[NHCOMP] = {0, 1};

        for (size_t i = 0; i < contents.size(); ++i) {
            MagFile file;
            int stat = read_iaga2002(contents[i], opt.code, file);
            if (stat != IAGA_OK) {
                LOG(ERROR) << "Error reading file " << labels[i] << ": " << iaga_errmsg(stat);
                set.nfail++;
                continue;
            }
            if (file.samples.empty()) {
                LOG(WARNING) << "No data rows in file " << labels[i];
                set.nfail++;
                continue;
            }
            if (set.comp == COMP_NONE) {
                set.comp = file.comp;
                set.labels = file.labels;
                hidx[0] = file.hidx[0];
                hidx[1] = file.hidx[1];
                if (opt.name.empty()) set.station = file.station;
            }
            else if (file.comp != set.comp) {
                LOG(WARNING) << "Component triplet " << file.labels << " of file " << labels[i]
                             << " conflicts with " << set.labels << ", file skipped";
                set.nfail++;
                continue;
            }
            merged.insert(merged.end(), file.samples.begin(), file.samples.end());
            set.nfile++;
        }

        if (merged.empty()) {
            LOG(WARNING) << "No valid data processed for station " << set.station;
            return KINDEX_OK;
        }

        set.samples = zscore_filter(merged, hidx, opt.zmax);
        std::stable_sort(set.samples.begin(), set.samples.end(),
                         [](const MagSamplePtr& a, const MagSamplePtr& b) {
                             return time_diff(a->time, b->time) < 0.0;
                         });

        std::vector<KWindow> windows;
        calc_windows(set.samples, hidx, windows);
        calc_kindex(windows, opt.k9, set.kindex);

        LOG(INFO) << "kindex_cycle: station=" << set.station << " files=" << set.nfile
                  << " rejected=" << set.nfail << " samples=" << set.samples.size()
                  << " windows=" << set.kindex.size();
        return KINDEX_OK;
    }

    int kindex_cycle(const StaOpt& opt, const std::vector<std::string>& contents, KIndexSet& set)
    {
        init_kindexset(opt, set);

        std::vector<std::string> labels;
        for (size_t i = 0; i < contents.size(); ++i) {
            labels.push_back("#" + std::to_string(i));
        }
        return process_cycle(opt, labels, contents, set);
    }

    int kindex_cycle_files(const StaOpt& opt, const std::vector<std::string>& paths, KIndexSet& set)
    {
        init_kindexset(opt, set);

        std::vector<std::string> labels, contents;
        int nopen = 0;
        for (const auto& path : paths) {
            std::string content;
            if (!read_text_file(path, content)) {
                LOG(ERROR) << "Cannot open file: " << path;
                nopen++;
                continue;
            }
            LOG(INFO) << "Reading file: " << path;
            labels.push_back(path);
            contents.push_back(content);
        }

        int stat = process_cycle(opt, labels, contents, set);
        set.nfail += nopen;
        return stat;
    }

    bool latest_kindex(const KIndexSet& set, KIndex& k)
    {
        if (set.kindex.empty()) {
            return false;
        }
        k = set.kindex.back();
        return true;
    }

}   // namespace kindex
