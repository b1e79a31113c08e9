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
* Command line options of the K-index monitor.
*/

#ifndef KINDEX_ARGS_HPP_
#define KINDEX_ARGS_HPP_

#include <ostream>
#include <string>
#include <vector>
#include "kindex_constant.hpp"

namespace kindex
{
    // status of command line parsing
    #define ARGS_OK             0
    #define ARGS_HELP           1                   /* help requested */
    #define ARGS_ERR            -1                  /* invalid command line */

    struct MonitorArgs
    {
        StaOpt opt = staopt_default;                /* station options */
        std::vector<std::string> files;             /* input files or patterns (empty: scan data_dir) */
        bool once = false;                          /* single cycle */
    };

    void print_usage(std::ostream& os, const char *exe);

    /* Parse monitor command line ------------------------------------------------------------
    * args   : int argc                     I   number of arguments
    *          const char *const *argv      I   arguments (argv[0]: program name)
    *          MonitorArgs& args            O   parsed options
    * return : int - status (ARGS_OK, ARGS_HELP, ARGS_ERR)
    * notes  : numeric values must parse completely ("3abc" is rejected). Arguments
    *          not starting with '-' are input files.
    *---------------------------------------------------------------------------------------*/
    int parse_monitor_args(int argc, const char *const *argv, MonitorArgs& args);

    /* Expand input files --------------------------------------------------------------------
    * args   : const std::vector<std::string>& files I files or wildcard patterns
    *          std::vector<std::string>& paths O   expanded paths in argument order
    * return : int - number of paths
    *---------------------------------------------------------------------------------------*/
    int expand_input_files(const std::vector<std::string>& files, std::vector<std::string>& paths);

}   // namespace kindex

#endif
