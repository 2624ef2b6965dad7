#include "myMATH.h"
#include <functional>
#include <limits>

namespace myMATH
{

// Linespace
// n >= 2, including min and max, n_gap = n-1
std::vector<double> linspace (double min, double max, int n)
{
    REQUIRE_CTX(n >= 2, ErrorCode::InvalidArgument,
                "myMATH::linspace: need at least 2 points", "n = " + std::to_string(n));

    double delta = (max - min) / (n - 1);

    std::vector<double> res(n);
    for (int i = 0; i < n; i ++)
    {
        res[i] = (min + delta * i);
    }

    return res;
}

//
// Generate all size-K combinations from the set {0, 1, ..., N-1}.
// - Output is in lexicographic order (e.g. N=4, K=3 -> [0,1,2], [0,1,3], [0,2,3], [1,2,3]).
// - At depth `d` the next index i >= `start`, and i can go up to N - (K - d)
//   so that enough elements are left to fill the remaining slots.
void generateCombinations(size_t N, size_t K, std::vector<std::vector<int>>& out)
{
    out.clear();
    if (K > N) return;
    if (K == 0) { out.push_back({}); return; }

    std::vector<int> comb;
    comb.reserve(K);

    std::function<void(size_t, size_t)> DFS = [&](size_t start, size_t depth)
    {
        if (depth == K) {
            out.push_back(comb);
            return;
        }

        for (size_t i = start; i <= N - (K - depth); ++i) {
            comb.push_back(static_cast<int>(i));
            DFS(i + 1, depth + 1);
            comb.pop_back();
        }
    };

    DFS(0, 0);
}

// Create unit vector
// unit_vec = (pt2 - pt1) / norm(pt2 - pt1)
Pt3D createUnitVector (Pt3D const& pt1, Pt3D const& pt2)
{
    Pt3D res = pt2 - pt1;
    double len = res.norm();
    REQUIRE(len > MAGSMALLNUMBER, ErrorCode::InvalidArgument,
            "myMATH::createUnitVector: the two points coincide");
    res /= len;
    return res;
}

// Calculate dot product
double dot (Pt3D const& pt1, Pt3D const& pt2)
{
    return pt1[0] * pt2[0] + pt1[1] * pt2[1] + pt1[2] * pt2[2];
}

double dot (Pt2D const& pt1, Pt2D const& pt2)
{
    return pt1[0] * pt2[0] + pt1[1] * pt2[1];
}

// Calculate the distance between two points
double dist2 (Pt3D const& pt1, Pt3D const& pt2)
{
    double res = 0;
    for (int i = 0; i < 3; i ++)
    {
        res += (pt2[i] - pt1[i]) * (pt2[i] - pt1[i]);
    }
    return res;
}

double dist2 (Pt2D const& pt1, Pt2D const& pt2)
{
    double res = 0;
    for (int i = 0; i < 2; i ++)
    {
        res += (pt2[i] - pt1[i]) * (pt2[i] - pt1[i]);
    }
    return res;
}

// Calculate the distance between point and line
double dist2 (Pt3D const& pt, Line3D const& line)
{
    Pt3D diff = pt - line.pt;

    double x = diff[1]*line.unit_vector[2] - diff[2]*line.unit_vector[1];
    double y = diff[2]*line.unit_vector[0] - diff[0]*line.unit_vector[2];
    double z = diff[0]*line.unit_vector[1] - diff[1]*line.unit_vector[0];
    
    return x*x + y*y + z*z;
}

double dist (Pt3D const& pt1, Pt3D const& pt2)
{
    return std::sqrt(dist2(pt1, pt2));
}

double dist (Pt2D const& pt1, Pt2D const& pt2)
{
    return std::sqrt(dist2(pt1, pt2));
}

double dist (Pt3D const& pt, Line3D const& line)
{
    return std::sqrt(dist2(pt, line));
}

double distToSegment (Pt2D const& pt, Pt2D const& pt_a, Pt2D const& pt_b)
{
    const double dx = pt_b[0] - pt_a[0];
    const double dy = pt_b[1] - pt_a[1];
    const double len2 = dx*dx + dy*dy;
    if (len2 < SMALLNUMBER)
    {
        return dist(pt, pt_a);
    }

    double s = ((pt[0] - pt_a[0]) * dx + (pt[1] - pt_a[1]) * dy) / len2;
    s = std::clamp(s, 0.0, 1.0);

    const double ex = pt_a[0] + s * dx - pt[0];
    const double ey = pt_a[1] + s * dy - pt[1];
    return std::sqrt(ex*ex + ey*ey);
}

double distToPolyline (Pt2D const& pt, std::vector<Pt2D> const& polyline)
{
    REQUIRE(!polyline.empty(), ErrorCode::InvalidArgument,
            "myMATH::distToPolyline: empty polyline");

    if (polyline.size() == 1)
    {
        return dist(pt, polyline[0]);
    }

    double d_min = std::numeric_limits<double>::max();
    for (size_t i = 0; i + 1 < polyline.size(); i ++)
    {
        d_min = std::min(d_min, distToSegment(pt, polyline[i], polyline[i+1]));
    }
    return d_min;
}

double angleDeg (Pt3D const& v1, Pt3D const& v2)
{
    const double n1 = v1.norm();
    const double n2 = v2.norm();
    if (n1 < MAGSMALLNUMBER || n2 < MAGSMALLNUMBER)
    {
        return 0;
    }

    double c = dot(v1, v2) / (n1 * n2);
    c = std::clamp(c, -1.0, 1.0);
    return std::acos(c) * 180.0 / M_PI;
}

// Inverse by adjugate, mtx must be 3x3
Matrix<double> inverse3 (Matrix<double> const& m)
{
    REQUIRE(m.getDimRow() == 3 && m.getDimCol() == 3, ErrorCode::InvalidArgument,
            "myMATH::inverse3: matrix must be 3x3");

    const double det = m(0,0) * (m(1,1)*m(2,2) - m(1,2)*m(2,1))
                     - m(0,1) * (m(1,0)*m(2,2) - m(1,2)*m(2,0))
                     + m(0,2) * (m(1,0)*m(2,1) - m(1,1)*m(2,0));

    REQUIRE_CTX(std::fabs(det) > SMALLNUMBER * SMALLNUMBER, ErrorCode::InvalidArgument,
                "myMATH::inverse3: matrix is singular", "det = " + std::to_string(det));

    Matrix<double> inv(3, 3, 0);
    inv(0,0) =  (m(1,1)*m(2,2) - m(1,2)*m(2,1)) / det;
    inv(0,1) = -(m(0,1)*m(2,2) - m(0,2)*m(2,1)) / det;
    inv(0,2) =  (m(0,1)*m(1,2) - m(0,2)*m(1,1)) / det;
    inv(1,0) = -(m(1,0)*m(2,2) - m(1,2)*m(2,0)) / det;
    inv(1,1) =  (m(0,0)*m(2,2) - m(0,2)*m(2,0)) / det;
    inv(1,2) = -(m(0,0)*m(1,2) - m(0,2)*m(1,0)) / det;
    inv(2,0) =  (m(1,0)*m(2,1) - m(1,1)*m(2,0)) / det;
    inv(2,1) = -(m(0,0)*m(2,1) - m(0,1)*m(2,0)) / det;
    inv(2,2) =  (m(0,0)*m(1,1) - m(0,1)*m(1,0)) / det;

    return inv;
}

// Closed form for symmetric 3x3 (trigonometric solution of the characteristic cubic)
std::vector<double> eigenSym3 (Matrix<double> const& m)
{
    REQUIRE(m.getDimRow() == 3 && m.getDimCol() == 3, ErrorCode::InvalidArgument,
            "myMATH::eigenSym3: matrix must be 3x3");

    std::vector<double> eig(3, 0);

    const double p1 = m(0,1)*m(0,1) + m(0,2)*m(0,2) + m(1,2)*m(1,2);
    if (p1 < SMALLNUMBER * SMALLNUMBER)
    {
        // diagonal
        eig[0] = m(0,0);
        eig[1] = m(1,1);
        eig[2] = m(2,2);
        std::sort(eig.begin(), eig.end());
        return eig;
    }

    const double q = (m(0,0) + m(1,1) + m(2,2)) / 3.0;
    const double p2 = (m(0,0) - q)*(m(0,0) - q) + (m(1,1) - q)*(m(1,1) - q)
                    + (m(2,2) - q)*(m(2,2) - q) + 2.0 * p1;
    const double p = std::sqrt(p2 / 6.0);

    // B = (A - qI) / p
    Matrix<double> B(3, 3, 0);
    for (int i = 0; i < 3; i ++)
    {
        for (int j = 0; j < 3; j ++)
        {
            B(i,j) = (m(i,j) - (i == j ? q : 0.0)) / p;
        }
    }
    double r = ( B(0,0) * (B(1,1)*B(2,2) - B(1,2)*B(2,1))
               - B(0,1) * (B(1,0)*B(2,2) - B(1,2)*B(2,0))
               + B(0,2) * (B(1,0)*B(2,1) - B(1,1)*B(2,0)) ) / 2.0;
    r = std::clamp(r, -1.0, 1.0);

    const double phi = std::acos(r) / 3.0;
    const double e_max = q + 2.0 * p * std::cos(phi);
    const double e_min = q + 2.0 * p * std::cos(phi + 2.0 * M_PI / 3.0);
    eig[0] = e_min;
    eig[2] = e_max;
    eig[1] = 3.0 * q - e_min - e_max;
    std::sort(eig.begin(), eig.end());

    return eig;
}

// Find the cross points of 3d line and 3d plane
bool crossPoint (Pt3D& pt3d, Line3D const& line, Plane3D const& plane)
{
    double den = dot(line.unit_vector, plane.norm_vector);
    
    if (std::fabs(den) < 1e-10)
    {
        return true;
    }

    Pt3D diff = plane.pt - line.pt;
    double factor = dot(diff, plane.norm_vector) / den;

    pt3d = line.pt + line.unit_vector * factor;

    return false;
}

Matrix<double> rotationMatrix (double omega, double phi, double kappa)
{
    const double cp = std::cos(phi),   sp = std::sin(phi);
    const double co = std::cos(omega), so = std::sin(omega);
    const double ck = std::cos(kappa), sk = std::sin(kappa);

    Matrix<double> dm(3, 3, 0);
    dm(0,0) = cp * ck;
    dm(0,1) = -cp * sk;
    dm(0,2) = sp;
    dm(1,0) = co * sk + so * sp * ck;
    dm(1,1) = co * ck - so * sp * sk;
    dm(1,2) = -so * cp;
    dm(2,0) = so * sk - co * sp * ck;
    dm(2,1) = so * ck + co * sp * sk;
    dm(2,2) = co * cp;

    return dm;
}

}
