#ifndef TRIANGULATION_H
#define TRIANGULATION_H

#include <vector>

#include "Matrix.h"
#include "PTVCommons.h"
#include "myMATH.h"

struct TriangulationResult
{
    Pt3D pt3d;           // least-squares intersection [mm]
    double residual = 0; // RMS perpendicular distance to the rays [mm]
    double cond = 1;     // eigenvalue ratio of the normal matrix
};

// Least-squares intersection of lines of sight:
//   sum_i (I - n_i n_i^T) x = sum_i (I - n_i n_i^T) p_i
// Fails with ReconstructionFailure for fewer than 2 rays or when the
// normal matrix is ill-conditioned (near parallel rays).
StatusOr<TriangulationResult> triangulate (std::vector<Line3D> const& line_of_sight_list);

#endif
