#ifndef RESULTIO_H
#define RESULTIO_H

#include <string>
#include <vector>

#include "Matrix.h"
#include "PTVCommons.h"
#include "TargetInfo.h"

// Text result files of OpenPTV. Every writer goes to <path>.tmp first
// and renames it, so a reader never sees a partial file.
//
//  <base>.%04d_targets : "%d\n", then "%4d %9.4f %9.4f %5d %5d %5d %5d %5d\n"
//                        (pnr, x, y, n, nx, ny, sumg, tnr)
//  rt_is.<frame>       : "%d\n", then "%4d %9.3f %9.3f %9.3f %4d %4d %4d %4d\n"
//                        (id, x, y, z, pnr of camera 1..4)
//  ptv_is.<frame>      : "%d\n", then "%4d %4d %10.3f %10.3f %10.3f\n"
//                        (prev, next, x, y, z)

// one record of a ptv_is file, prev/next are record indices in the adjacent frames
struct PtvisRecord
{
    int prev = PREV_NONE;
    int next = NEXT_NONE;
    Pt3D pt;
};

// an image extension of base is dropped, "%d" in base is replaced by the
// %04d frame, otherwise ".%04d" is appended, then "_targets"
std::string getTargetPath (std::string const& target_base, int frame);

// write content to path through path.tmp and a rename
void writeFileAtomic (std::string const& path, std::string const& content);

void writeTargets (std::string const& path, std::vector<Target> const& target_list);
// Throws FatalError(IOfailure) for a missing or malformed file
std::vector<Target> readTargets (std::string const& path);

void writeRtis (std::string const& path, std::vector<Point3D> const& pt3d_list);
// Throws FatalError(IOfailure) for a missing or malformed file
std::vector<Point3D> readRtis (std::string const& path);

void writePtvis (std::string const& path, std::vector<PtvisRecord> const& record_list);
std::vector<PtvisRecord> readPtvis (std::string const& path);

#endif
