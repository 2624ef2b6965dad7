#ifndef MYMATH_H
#define MYMATH_H

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

#include "Matrix.h"
#include "PTVCommons.h"

namespace myMATH
{

// Linespace
// n >= 2, including min and max
std::vector<double> linspace (double min, double max, int n);

// All size-K combinations of {0,...,N-1} in lexicographic order
void generateCombinations(size_t N, size_t K, std::vector<std::vector<int>>& out);

// unit_vec = (pt2 - pt1) / norm(pt2 - pt1)
Pt3D createUnitVector (Pt3D const& pt1, Pt3D const& pt2);

double dot (Pt3D const& pt1, Pt3D const& pt2);
double dot (Pt2D const& pt1, Pt2D const& pt2);

double dist2 (Pt3D const& pt1, Pt3D const& pt2);
double dist2 (Pt2D const& pt1, Pt2D const& pt2);
double dist2 (Pt3D const& pt, Line3D const& line);
double dist (Pt3D const& pt1, Pt3D const& pt2);
double dist (Pt2D const& pt1, Pt2D const& pt2);
double dist (Pt3D const& pt, Line3D const& line);

// distance between a point and the segment [pt_a, pt_b]
double distToSegment (Pt2D const& pt, Pt2D const& pt_a, Pt2D const& pt_b);

// distance between a point and a polyline (at least 1 vertex)
double distToPolyline (Pt2D const& pt, std::vector<Pt2D> const& polyline);

// angle between two vectors [deg], 0 if any of them is (close to) zero
double angleDeg (Pt3D const& v1, Pt3D const& v2);

// Inverse of a 3x3 matrix, throws if singular
Matrix<double> inverse3 (Matrix<double> const& mtx);

// Eigenvalues of a symmetric 3x3 matrix, ascending order
std::vector<double> eigenSym3 (Matrix<double> const& mtx);

// Find the cross point of a 3d line and a 3d plane
// return true if they are parallel (pt3d is then left unchanged)
bool crossPoint (Pt3D& pt3d, Line3D const& line, Plane3D const& plane);

// Rotation matrix from omega, phi, kappa [rad] (rotation order used by .ori files)
Matrix<double> rotationMatrix (double omega, double phi, double kappa);

}

#endif
