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
* This file provides IAGA-2002 observatory file reading utilities and the
* selection of the latest station files from a directory.
*/

#ifndef KINDEX_IAGA_READER_HPP_
#define KINDEX_IAGA_READER_HPP_

#include <vector>
#include <string>
#include "kindex_constant.hpp"

namespace kindex
{
    /* IAGA-2002 reader status -------------------------------------------------------------*/
    enum IagaStatus {
        IAGA_OK = 0,                /* file parsed */
        IAGA_ERR_OPEN = -1,         /* file cannot be read */
        IAGA_ERR_HEADER = -2,       /* no DATE/TIME/DOY header line */
        IAGA_ERR_COMP = -3,         /* no resolvable component triplet */
        IAGA_ERR_COLUMN = -4        /* expected column absent from header */
    };

    /* Status message --------------------------------------------------------------------------
    * args   : int stat                     I   status (IAGA_???)
    * return : const char* - message ("header not found", "no valid components", ...)
    *---------------------------------------------------------------------------------------*/
    const char *iaga_errmsg(int stat);

    /* Read IAGA-2002 file content -----------------------------------------------------------
    * args   : const std::string& content   I   raw file text
    *          const std::string& code      I   station code used as column prefix
    *                                           ("": use IAGA CODE of the header)
    *          MagFile& file                O   parsed file
    * return : int - status (IAGA_OK: ok, <0: format error)
    * notes  : The header line is the first line starting with DATE and containing
    *          TIME and DOY. The component triplet is resolved from generic labels
    *          (X,Y,Z / H,D,Z), then station-prefixed labels (ENTX, ...), then the
    *          "Reported" metadata line, which maps the three columns after DOY
    *          (and F as the fourth). Rows whose timestamp does not parse are
    *          dropped. Missing-data markers decode to NaN.
    *---------------------------------------------------------------------------------------*/
    int read_iaga2002(const std::string& content, const std::string& code, MagFile& file);

    /* Read IAGA-2002 file -------------------------------------------------------------------
    * args   : const std::string& path      I   file path
    *          const std::string& code      I   station code used as column prefix
    *          MagFile& file                O   parsed file
    * return : int - status (IAGA_OK: ok, <0: error)
    *---------------------------------------------------------------------------------------*/
    int read_iaga2002_file(const std::string& path, const std::string& code, MagFile& file);

    /* Read whole file into string -----------------------------------------------------------
    * args   : const std::string& path      I   file path
    *          std::string& content         O   file content
    * return : bool - true if success, false otherwise
    *---------------------------------------------------------------------------------------*/
    bool read_text_file(const std::string& path, std::string& content);

    /* Select latest station files -----------------------------------------------------------
    * args   : const std::vector<std::string>& names I   file names (no directory)
    *          const std::string& code      I   station code (case insensitive prefix)
    *          const std::string& suffix    I   file name suffix (case insensitive)
    *          int len_days                 I   number of files to keep
    *          std::vector<std::string>& files O selected names, newest first
    * return : int - number of selected files
    * notes  : the 8 characters after the code must form a yyyymmdd date
    *---------------------------------------------------------------------------------------*/
    int select_station_files(const std::vector<std::string>& names,
                             const std::string& code, const std::string& suffix,
                             int len_days, std::vector<std::string>& files);

    /* Expand file path with wildcards -------------------------------------------------------
    * similar to RTKLIB's expath() function
    * args   : const std::string& path      I   path with wildcards
    *          std::vector<std::string>& files O expanded file list
    * return : int - number of expanded files
    *---------------------------------------------------------------------------------------*/
    int expath(const std::string& path, std::vector<std::string>& files);

    /* List latest station files in data directory -------------------------------------------
    * args   : const StaOpt& opt            I   station options (data_dir, code, suffix, len_days)
    *          std::vector<std::string>& files O selected paths, newest first
    * return : int - number of selected files
    *---------------------------------------------------------------------------------------*/
    int list_station_files(const StaOpt& opt, std::vector<std::string>& files);

}   // namespace kindex

#endif
