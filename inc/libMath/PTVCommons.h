#ifndef PTVCOMMONS_H
#define PTVCOMMONS_H

#include <iostream>
#include <string>
#include "../error.hpp"

#define SMALLNUMBER 1e-8
#define SQRTSMALLNUMBER 1e-6
#define MAGSMALLNUMBER 1e-8
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// log small
#define LOGSMALLNUMBER 1e-4

// undistort
#define UNDISTORT_MAX_ITER 50
#define UNDISTORT_EPS 1e-5

// multimedia: bisection on the refraction angle
#define MULTIMED_MAX_ITER 100
#define MULTIMED_EPS 1e-10

// triangulation: largest accepted eigenvalue ratio of the normal matrix
#define TRIANG_MAX_COND 1e6

// correspondence file layout has exactly this many camera slots
#define MAX_CAM_RTIS 4

// sentinels
#define CORRES_NONE -1 // camera did not contribute / target not used
#define PREV_NONE -1
#define NEXT_NONE -2
#define UNLINKED -1


struct PixelRange 
{
    // left is closed, right is open 
    // [min, max)
    int row_min = 0;
    int row_max = 0;
    int col_min = 0;
    int col_max = 0;

    PixelRange () {};
    PixelRange (int row, int col) 
        : row_min(row), row_max(row + 1), col_min(col), col_max(col + 1) {};

    void setRange (int row, int col)
    {
        if (row + 1 > row_max) row_max = row + 1;
        if (row < row_min) row_min = row;
        if (col + 1 > col_max) col_max = col + 1;
        if (col < col_min) col_min = col;
    };
    int getNumOfRow () const
    {
        return row_max - row_min;
    };
    int getNumOfCol() const
    {
        return col_max - col_min;
    };
};

// Minimal CSV helper: read a comma-delimited field (no quotes handling).
// Strips trailing '\r' if present (Windows line endings).
static inline bool read_csv_field(std::istream& in, std::string& out, char delim = ',') {
    if (!std::getline(in, out, delim)) return false;
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return true;
};

enum class FrameErrorPolicy
{
    FailFast,  // abort the run on the first failed frame
    SkipFrame  // record the failure and continue
};

enum class TrackDirection
{
    Forward,
    Backward,
    Both
};

// stage of the per-frame pipeline, reported with errors
enum class PipelineStage
{
    Load,
    Detect,
    Correspond,
    Triangulate,
    Persist
};

inline const char* stageName (PipelineStage s)
{
    switch (s)
    {
        case PipelineStage::Load:        return "load";
        case PipelineStage::Detect:      return "detect";
        case PipelineStage::Correspond:  return "correspond";
        case PipelineStage::Triangulate: return "triangulate";
        case PipelineStage::Persist:     return "persist";
    }
    return "unknown";
}

#endif // !PTVCOMMONS_H
