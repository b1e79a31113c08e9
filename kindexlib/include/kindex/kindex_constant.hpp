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
* Constants and data records shared by the observatory reader and the
* K-index processing chain.
*/

#ifndef KINDEX_CONSTANT_HPP_
#define KINDEX_CONSTANT_HPP_

#include <vector>
#include <string>
#include <memory>
#include <ctime>

namespace kindex
{
    #define KINDEX_BLOCK_SEC    10800.0             /* K-index window length (s) */
    #define KINDEX_HALF_BLOCK   5400.0              /* offset of window center from start (s) */
    #define KINDEX_NLEVEL       10                  /* number of K levels (0-9) */
    #define KINDEX_MAXLEVEL     9                   /* max K level */
    #define KINDEX_K9_REF       500.0               /* K9 limit of the base threshold table (nT) */
    #define KINDEX_QUIET        0.25                /* reported value of K level 0 */

    #define ZSCORE_MAX          2.5                 /* default outlier gate (|z|) */
    #define ZSCORE_MIN_STD      1E-9                /* std below which a component scores 0 */

    #define IAGA_MISSING        99999.0             /* IAGA-2002 missing value */
    #define IAGA_MISSING_ALT    99999.9             /* missing value written by some observatories */
    #define IAGA_NOTRECORDED    88888.0             /* IAGA-2002 "not recorded" value */

    #define MAXCOMP             3                   /* number of field components in a triplet */
    #define NHCOMP              2                   /* number of horizontal components used for K */

    #define SECPERDAY           86400.0             /* seconds per day */

    // component triplet
    #define COMP_NONE           -1                  /* unresolved */
    #define COMP_XYZ            0                   /* cartesian (X,Y,Z) */
    #define COMP_HDZ            1                   /* horizontal intensity/declination/vertical (H,D,Z) */

    // status of K-index processing cycle
    #define KINDEX_OK           0
    #define KINDEX_ERR_OPT      -1                  /* invalid station options */

    // UTC time (same layout as RTKLIB's gtime_t)
    struct gtime_t
    {
        time_t time;            /* time (s) expressed by standard time_t */
        double sec;             /* fraction of second under 1 s */
    };

    struct MagSample                                /* one minute of observatory data */
    {
        gtime_t time;                               /* sample time (UTC) */
        double val[MAXCOMP];                        /* field components in triplet order (nT, D in arcmin), NaN: no value */
        double f;                                   /* total field F (nT), NaN: no value */
    };
    typedef std::shared_ptr<MagSample> MagSamplePtr;

    struct MagFile                                  /* one parsed observatory file */
    {
        std::vector<MagSamplePtr> samples;          /* samples in file order */
        int comp;                                   /* component triplet (COMP_???) */
        std::string labels;                         /* generic component labels ("XYZ" or "HDZ") */
        int hidx[NHCOMP];                           /* triplet positions of horizontal components */
        std::string station;                        /* station name */
        std::string code;                           /* IAGA code */
        std::string source;                         /* source of data */
        std::string reported;                       /* reported components as declared in header */
        std::string orient;                         /* sensor orientation */
        std::string interval;                       /* data interval type */
        std::string type;                           /* data type */
        double pos[3];                              /* geodetic latitude/longitude (deg), elevation (m) */
    };
    typedef std::shared_ptr<MagFile> MagFilePtr;

    struct KWindow                                  /* 3-hour window statistic */
    {
        int block;                                  /* block index from start of first day */
        gtime_t center;                             /* window center time */
        int n;                                      /* number of samples */
        double range[NHCOMP];                       /* peak-to-peak range of horizontal components */
        double var;                                 /* disturbance statistic (max range) */
    };

    struct KIndex                                   /* K-index of one window */
    {
        gtime_t time;                               /* window center time */
        double value;                               /* K-index (0.25,1,...,9) */
        double var;                                 /* disturbance statistic */
        int block;                                  /* block index */
        int n;                                      /* number of samples */
    };

    // Station processing options
    struct StaOpt
    {
        std::string code;           /* station code (file name prefix, e.g. "ent") */
        std::string name;           /* station name override (empty: from file) */
        double k9;                  /* K9 limit (nT) */
        int len_days;               /* number of lookback days */
        double interval;            /* polling interval (s) */
        double zmax;                /* outlier gate (|z|) */
        std::string data_dir;       /* directory of observatory files */
        std::string suffix;         /* observatory file name suffix */
        std::string prom_file;      /* prometheus text file (empty: none) */
        std::string series_file;    /* line protocol output file (empty: none) */
        std::string deriv_file;     /* derived series csv (empty: none) */
    };

    extern const StaOpt staopt_default;             /* default options (reference station) */

    struct KIndexSet                                /* result of one processing cycle */
    {
        std::string station;                        /* station name */
        int comp;                                   /* component triplet of merged data */
        std::string labels;                         /* component labels */
        std::vector<KIndex> kindex;                 /* K-index sequence, ascending time */
        std::vector<MagSamplePtr> samples;          /* filtered samples, ascending time */
        int nfile;                                  /* number of files accepted */
        int nfail;                                  /* number of files rejected */
    };
    typedef std::shared_ptr<KIndexSet> KIndexSetPtr;

    struct MagDeriv                                 /* derived series epoch */
    {
        gtime_t time;
        double x;                                   /* X (nT), reconstructed from H,D for HDZ data */
        double h;                                   /* horizontal intensity H (nT) */
        double f;                                   /* total field F (nT) */
        double dx, dx_smooth;                       /* |dX/dt| (nT/min) raw and median filtered */
        double dh, dh_smooth;                       /* |dH/dt| (nT/min) raw and median filtered */
        double df, df_smooth;                       /* |dF/dt| (nT/min) raw and median filtered */
    };

}   // namespace kindex

#endif
