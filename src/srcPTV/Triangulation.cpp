#include "Triangulation.h"

StatusOr<TriangulationResult> triangulate (std::vector<Line3D> const& line_of_sight_list)
{
    const int n = int(line_of_sight_list.size());
    if (n < 2)
    {
        return STATUS_OR_ERR_CTX(TriangulationResult, ErrorCode::ReconstructionFailure,
                                 "triangulate: cannot triangulate with less than 2 lines of sight",
                                 "n_ray = " + std::to_string(n));
    }

    Matrix<double> mtx(3, 3, 0);
    Matrix<double> temp(3, 3, 0);
    Pt3D pt_3d(0, 0, 0);

    for (int i = 0; i < n; i ++)
    {
        Pt3D const& pt_ref = line_of_sight_list[i].pt;
        Pt3D const& unit_vector = line_of_sight_list[i].unit_vector;

        double nx = unit_vector[0];
        double ny = unit_vector[1];
        double nz = unit_vector[2];

        temp(0,0) = 1-nx*nx; temp(0,1) = -nx*ny;  temp(0,2) = -nx*nz;
        temp(1,0) = -nx*ny;  temp(1,1) = 1-ny*ny; temp(1,2) = -ny*nz;
        temp(2,0) = -nx*nz;  temp(2,1) = -ny*nz;  temp(2,2) = 1-nz*nz;

        pt_3d += temp * pt_ref;
        mtx += temp;
    }

    // condition number from the eigenvalues (mtx is symmetric positive semi-definite)
    std::vector<double> eig = myMATH::eigenSym3(mtx);
    const double eig_min = eig[0];
    const double eig_max = eig[2];
    if (eig_min < eig_max / TRIANG_MAX_COND || eig_min < SMALLNUMBER)
    {
        return STATUS_OR_ERR_CTX(TriangulationResult, ErrorCode::ReconstructionFailure,
                                 "triangulate: lines of sight are nearly parallel",
                                 "eig_min = " + std::to_string(eig_min) + ", eig_max = " + std::to_string(eig_max));
    }

    TriangulationResult res;
    res.cond = eig_max / eig_min;
    res.pt3d = myMATH::inverse3(mtx) * pt_3d;

    // RMS of the perpendicular distances
    double sum_d2 = 0;
    for (int i = 0; i < n; i ++)
    {
        sum_d2 += myMATH::dist2(res.pt3d, line_of_sight_list[i]);
    }
    res.residual = std::sqrt(sum_d2 / n);

    return res;
}
