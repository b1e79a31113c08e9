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
* Implementation of IAGA-2002 observatory file reading and station file
* selection.
*/

#include "kindex/iaga_reader.hpp"
#include "kindex/kindex_utility.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <glob.h>
#include <glog/logging.h>

namespace kindex
{
    static const double NaN = std::numeric_limits<double>::quiet_NaN();

    static const char *comp_labels[] = {"XYZ", "HDZ"};

    const char *iaga_errmsg(int stat)
    {
        switch (stat) {
            case IAGA_OK:         return "ok";
            case IAGA_ERR_OPEN:   return "cannot read file";
            case IAGA_ERR_HEADER: return "header not found";
            case IAGA_ERR_COMP:   return "no valid components";
            case IAGA_ERR_COLUMN: return "missing expected column";
            default:              return "unknown error";
        }
    }

    /* Missing data marker -------------------------------------------------------------------
    * args   : double v                   I   decoded value
    * return : bool - true if v is one of the IAGA-2002 missing/not recorded markers
    *---------------------------------------------------------------------------------------*/
    static bool is_missing(double v)
    {
        return fabs(v - IAGA_MISSING) < 1E-6 || fabs(v - IAGA_MISSING_ALT) < 1E-6 ||
               fabs(v - IAGA_NOTRECORDED) < 1E-6;
    }

    /* String to component value (NaN: non-numeric or missing) -------------------------------*/
    static double str2val(const std::string& tok)
    {
        if (tok.empty()) return NaN;
        char *end = nullptr;
        double v = strtod(tok.c_str(), &end);
        if (end == tok.c_str() || *end != '\0' || !std::isfinite(v)) return NaN;
        return is_missing(v) ? NaN : v;
    }

    /* Metadata value of labelled header line ------------------------------------------------
    * args   : const std::string& line    I   trimmed header line
    *          const char *label          I   label (case insensitive)
    *          std::string& value         O   value without ':' and '|' decoration
    * return : bool - true if the line carries the label
    *---------------------------------------------------------------------------------------*/
    static bool meta_value(const std::string& line, const char *label, std::string& value)
    {
        const size_t n = strlen(label);
        if (line.size() < n || to_upper(line.substr(0, n)) != to_upper(label)) {
            return false;
        }
        std::string rest = trim(line.substr(n));
        if (!rest.empty() && rest[0] == ':') rest = rest.substr(1);
        std::string::size_type bar = rest.find('|');
        if (bar != std::string::npos) rest = rest.substr(0, bar);
        value = trim(rest);
        return true;
    }

    /* Decode reported components code (XYZF/XYZ/HDZF/HDZ) ----------------------------------*/
    static int decode_reported(const std::string& value)
    {
        std::string code;
        for (char c : value) {
            if (std::isalpha(static_cast<unsigned char>(c))) code.push_back(c);
        }
        code = to_upper(code);
        if (code == "XYZF" || code == "XYZ") return COMP_XYZ;
        if (code == "HDZF" || code == "HDZ") return COMP_HDZ;
        return COMP_NONE;
    }

    static int find_field(const std::vector<std::string>& fields, const std::string& name)
    {
        auto it = std::find(fields.begin(), fields.end(), name);
        return it == fields.end() ? -1 : static_cast<int>(it - fields.begin());
    }

    /* Locate triplet columns with given prefix ----------------------------------------------
    * args   : const std::vector<std::string>& fields I header fields
    *          const std::string& prefix  I   column prefix ("" for generic labels)
    *          int comp                   I   component triplet (COMP_???)
    *          int *col                   O   column index of each component and F
    * return : bool - true if all three components are present
    *---------------------------------------------------------------------------------------*/
    static bool find_triplet(const std::vector<std::string>& fields, const std::string& prefix,
                             int comp, int *col)
    {
        const char *labels = comp_labels[comp];
        for (int i = 0; i < MAXCOMP; ++i) {
            col[i] = find_field(fields, prefix + labels[i]);
            if (col[i] < 0) return false;
        }
        col[MAXCOMP] = find_field(fields, prefix + "F");
        return true;
    }

    static void init_magfile(MagFile& file)
    {
        file.samples.clear();
        file.comp = COMP_NONE;
        file.labels.clear();
        file.hidx[0] = 0;
        file.hidx[1] = 1;
        file.station.clear();
        file.code.clear();
        file.source.clear();
        file.reported.clear();
        file.orient.clear();
        file.interval.clear();
        file.type.clear();
        file.pos[0] = file.pos[1] = file.pos[2] = NaN;
    }

    /* Decode metadata lines above the header ------------------------------------------------*/
    static void decode_meta(const std::vector<std::string>& lines, size_t header, MagFile& file,
                            std::string& name)
    {
        std::string value;
        for (size_t i = 0; i < header; ++i) {
            const std::string& line = lines[i];
            if (line[0] == '#') continue;   // comment block

            if      (meta_value(line, "Station Name", value))       name = value;
            else if (meta_value(line, "IAGA CODE", value))          file.code = to_upper(value);
            else if (meta_value(line, "Source of Data", value))     file.source = value;
            else if (meta_value(line, "Geodetic Latitude", value))  file.pos[0] = str2val(value);
            else if (meta_value(line, "Geodetic Longitude", value)) file.pos[1] = str2val(value);
            else if (meta_value(line, "Elevation", value))          file.pos[2] = str2val(value);
            else if (meta_value(line, "Reported", value))           file.reported = value;
            else if (meta_value(line, "Sensor Orientation", value)) file.orient = value;
            else if (meta_value(line, "Data Interval Type", value)) file.interval = value;
            else if (meta_value(line, "Data Type", value))          file.type = value;
        }
    }

    int read_iaga2002(const std::string& content, const std::string& code, MagFile& file)
    {
        init_magfile(file);

        std::vector<std::string> lines;
        {
            std::istringstream iss(content);
            std::string line;
            while (std::getline(iss, line)) {
                line = trim(line);
                if (!line.empty()) lines.push_back(line);
            }
        }

        // Find the header line
        size_t header = lines.size();
        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string& line = lines[i];
            if (line.compare(0, 4, "DATE") == 0 && line.find("TIME") != std::string::npos &&
                line.find("DOY") != std::string::npos) {
                header = i;
                break;
            }
        }
        if (header == lines.size()) {
            return IAGA_ERR_HEADER;
        }

        std::string name;
        decode_meta(lines, header, file, name);

        std::vector<std::string> fields;
        for (const auto& tok : split_ws(lines[header])) {
            std::string field;
            for (char c : tok) {
                if (c != '|') field.push_back(c);
            }
            if (!field.empty()) fields.push_back(field);
        }

        // Resolve component triplet: generic, station-prefixed, then reported
        const std::string prefix = to_upper(trim(code));
        std::vector<std::string> prefixes;
        if (!prefix.empty()) prefixes.push_back(prefix);
        if (!file.code.empty() && file.code != prefix) prefixes.push_back(file.code);

        int col[MAXCOMP + 1] = {-1, -1, -1, -1};
        if (find_triplet(fields, "", COMP_XYZ, col)) {
            file.comp = COMP_XYZ;
        }
        else if (find_triplet(fields, "", COMP_HDZ, col)) {
            file.comp = COMP_HDZ;
        }
        else {
            for (const auto& p : prefixes) {
                if (find_triplet(fields, p, COMP_XYZ, col)) {
                    file.comp = COMP_XYZ;
                    break;
                }
                if (find_triplet(fields, p, COMP_HDZ, col)) {
                    file.comp = COMP_HDZ;
                    break;
                }
            }
        }
        if (file.comp == COMP_NONE) {
            int comp = decode_reported(file.reported);
            if (comp == COMP_NONE) {
                return IAGA_ERR_COMP;
            }
            // reported order: the component columns follow DOY, then F
            const int idoy = find_field(fields, "DOY");
            if (idoy < 0 || idoy + MAXCOMP >= (int)fields.size()) {
                LOG(WARNING) << "read_iaga2002: reported components " << comp_labels[comp]
                             << " not found in header columns";
                return IAGA_ERR_COLUMN;
            }
            for (int i = 0; i < MAXCOMP; ++i) col[i] = idoy + 1 + i;
            col[MAXCOMP] = idoy + 1 + MAXCOMP < (int)fields.size() ? idoy + 1 + MAXCOMP : -1;
            file.comp = comp;
        }
        file.labels = comp_labels[file.comp];

        const int idate = find_field(fields, "DATE");
        const int itime = find_field(fields, "TIME");
        if (idate < 0 || itime < 0) {
            return IAGA_ERR_COLUMN;
        }

        if (!name.empty())        file.station = name;
        else if (!prefix.empty()) file.station = prefix;
        else                      file.station = file.code;
        if (file.code.empty()) file.code = prefix;

        // Read data rows
        int ndrop = 0;
        for (size_t i = header + 1; i < lines.size(); ++i) {
            const std::vector<std::string> tokens = split_ws(lines[i]);
            gtime_t time;
            if ((int)tokens.size() <= std::max(idate, itime) ||
                !str2time(tokens[idate], tokens[itime], &time)) {
                ndrop++;
                continue;
            }
            MagSamplePtr sample = std::make_shared<MagSample>();
            sample->time = time;
            for (int j = 0; j < MAXCOMP; ++j) {
                sample->val[j] = col[j] < (int)tokens.size() ? str2val(tokens[col[j]]) : NaN;
            }
            sample->f = col[MAXCOMP] >= 0 && col[MAXCOMP] < (int)tokens.size() ?
                        str2val(tokens[col[MAXCOMP]]) : NaN;
            file.samples.push_back(sample);
        }

        LOG(INFO) << "read_iaga2002: station=" << file.station << " comp=" << file.labels
                  << " samples=" << file.samples.size() << " dropped=" << ndrop;
        return IAGA_OK;
    }

    bool read_text_file(const std::string& path, std::string& content)
    {
        std::ifstream ifs(path, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            return false;
        }
        std::ostringstream oss;
        oss << ifs.rdbuf();
        if (ifs.bad()) {
            return false;
        }
        content = oss.str();
        return true;
    }

    int read_iaga2002_file(const std::string& path, const std::string& code, MagFile& file)
    {
        std::string content;
        if (!read_text_file(path, content)) {
            init_magfile(file);
            LOG(ERROR) << "Cannot open file: " << path;
            return IAGA_ERR_OPEN;
        }
        int stat = read_iaga2002(content, code, file);
        if (stat != IAGA_OK) {
            LOG(ERROR) << "Error reading file " << path << ": " << iaga_errmsg(stat);
        }
        return stat;
    }

    /* File name date (yyyymmdd after station code) ------------------------------------------*/
    static bool name2date(const std::string& name, size_t pos, gtime_t *t)
    {
        if (name.size() < pos + 8) return false;
        const std::string ymd = name.substr(pos, 8);
        for (char c : ymd) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return str2time(ymd.substr(0, 4) + "-" + ymd.substr(4, 2) + "-" + ymd.substr(6, 2), "00:00", t);
    }

    int select_station_files(const std::vector<std::string>& names,
                             const std::string& code, const std::string& suffix,
                             int len_days, std::vector<std::string>& files)
    {
        files.clear();

        const std::string lcode = to_lower(code);
        const std::string lsuffix = to_lower(suffix);

        std::vector<std::pair<gtime_t, std::string>> dated;
        for (const auto& name : names) {
            const std::string lname = to_lower(name);
            if (lname.compare(0, lcode.size(), lcode) != 0) continue;
            if (lname.size() < lsuffix.size() ||
                lname.compare(lname.size() - lsuffix.size(), lsuffix.size(), lsuffix) != 0) {
                continue;
            }
            gtime_t date;
            if (!name2date(name, lcode.size(), &date)) continue;
            dated.push_back(std::make_pair(date, name));
        }

        // newest first
        std::stable_sort(dated.begin(), dated.end(),
                         [](const std::pair<gtime_t, std::string>& a, const std::pair<gtime_t, std::string>& b) {
                             return time_diff(a.first, b.first) > 0.0;
                         });

        for (size_t i = 0; i < dated.size() && (int)i < len_days; ++i) {
            files.push_back(dated[i].second);
        }
        return static_cast<int>(files.size());
    }

    int expath(const std::string& path, std::vector<std::string>& files)
    {
        files.clear();

        // Check if path contains wildcards
        if (path.find('*') == std::string::npos && path.find('?') == std::string::npos) {
            // No wildcards, just add the path
            files.push_back(path);
            return 1;
        }

        // Use glob to expand wildcards
        glob_t glob_result;
        memset(&glob_result, 0, sizeof(glob_result));

        int ret = glob(path.c_str(), GLOB_TILDE | GLOB_BRACE, NULL, &glob_result);
        if (ret != 0) {
            globfree(&glob_result);
            return 0;
        }

        for (size_t i = 0; i < glob_result.gl_pathc; ++i) {
            files.push_back(glob_result.gl_pathv[i]);
        }

        globfree(&glob_result);
        return static_cast<int>(files.size());
    }

    int list_station_files(const StaOpt& opt, std::vector<std::string>& files)
    {
        files.clear();

        std::string dir = opt.data_dir.empty() ? std::string(".") : opt.data_dir;
        if (dir.size() > 1 && dir[dir.size() - 1] == '/') dir.erase(dir.size() - 1);

        std::vector<std::string> paths;
        if (expath(dir + "/*", paths) <= 0) {
            LOG(ERROR) << "No files found in " << dir;
            return 0;
        }

        std::vector<std::string> names;
        for (const auto& p : paths) {
            std::string::size_type slash = p.find_last_of('/');
            names.push_back(slash == std::string::npos ? p : p.substr(slash + 1));
        }

        std::vector<std::string> selected;
        if (select_station_files(names, opt.code, opt.suffix, opt.len_days, selected) <= 0) {
            LOG(ERROR) << "No matching files found in " << dir;
            return 0;
        }
        for (const auto& name : selected) {
            files.push_back(dir + "/" + name);
        }
        return static_cast<int>(files.size());
    }

}   // namespace kindex
