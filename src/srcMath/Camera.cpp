#include "Camera.h"

#include <iomanip>

namespace
{

// Snell refraction of unit vector u through a surface with unit normal n
// (n points against u), eta = n_in / n_out
Pt3D refract (Pt3D const& u, Pt3D const& n, double eta)
{
    const double cos_i = -myMATH::dot(n, u);
    const double k = 1.0 - eta * eta * (1.0 - cos_i * cos_i);
    if (k < 0)
    {
        THROW_FATAL_CTX(ErrorCode::ReconstructionFailure,
                        "Camera: total internal reflection at the window",
                        "eta = " + std::to_string(eta));
    }
    Pt3D t = u * eta + n * (eta * cos_i - std::sqrt(k));
    t /= t.norm();
    return t;
}

// tan(asin(s))
double tanFromSin (double s)
{
    return s / std::sqrt(1.0 - s * s);
}

}


Camera::Camera ()
{
    setOrientation(Pt3D(0, 0, 0), 0, 0, 0);
}

Camera::Camera (std::string const& ori_file, std::string const& addpar_file)
{
    loadParameters(ori_file, addpar_file);
}

void Camera::loadParameters (std::string const& ori_file, std::string const& addpar_file)
{
    std::ifstream fin(ori_file, std::ios::in);
    REQUIRE_CTX(fin.is_open(), ErrorCode::ConfigurationError,
                "Camera::loadParameters: cannot open orientation file", ori_file);

    // x0 y0 z0 / omega phi kappa / 3x3 rotation / xh yh / cc / glass vector
    double x0, y0, z0;
    double dm[9];
    bool is_ok = static_cast<bool>(fin >> x0 >> y0 >> z0 >> _omega >> _phi >> _kappa);
    for (int i = 0; i < 9 && is_ok; i ++)
    {
        is_ok = static_cast<bool>(fin >> dm[i]);
    }
    is_ok = is_ok && (fin >> _xh >> _yh >> _cc);
    REQUIRE_CTX(is_ok, ErrorCode::ConfigurationError,
                "Camera::loadParameters: malformed orientation file", ori_file);

    _x0 = Pt3D(x0, y0, z0);
    _r_mtx = Matrix<double>(3, 3, 0);
    for (int i = 0; i < 9; i ++)
    {
        _r_mtx[i] = dm[i];
    }

    double gx, gy, gz;
    if (fin >> gx >> gy >> gz)
    {
        _glass_vec = Pt3D(gx, gy, gz);
        REQUIRE_CTX(_glass_vec.norm() > SMALLNUMBER, ErrorCode::ConfigurationError,
                    "Camera::loadParameters: glass vector has zero length", ori_file);
    }
    fin.close();

    _added_param = AddedParam();
    if (addpar_file.empty())
    {
        return;
    }

    std::ifstream fin_add(addpar_file, std::ios::in);
    if (!fin_add.is_open())
    {
        logWarning(STATUS_ERR_CTX(ErrorCode::ConfigurationError,
                                  "no .addpar file, using zero distortion", addpar_file));
        return;
    }

    AddedParam& ap = _added_param;
    is_ok = static_cast<bool>(fin_add >> ap.k1 >> ap.k2 >> ap.k3 >> ap.p1 >> ap.p2 >> ap.scx >> ap.she);
    REQUIRE_CTX(is_ok, ErrorCode::ConfigurationError,
                "Camera::loadParameters: malformed .addpar file", addpar_file);
    REQUIRE_CTX(std::fabs(ap.scx) > SMALLNUMBER, ErrorCode::ConfigurationError,
                "Camera::loadParameters: scx must not be zero", addpar_file);
}

void Camera::saveParameters (std::string const& ori_file, std::string const& addpar_file) const
{
    std::ofstream fout(ori_file, std::ios::out);
    REQUIRE_CTX(fout.is_open(), ErrorCode::IOfailure,
                "Camera::saveParameters: cannot open file", ori_file);

    fout << std::fixed << std::setprecision(8);
    fout << _x0[0] << " " << _x0[1] << " " << _x0[2] << "\n";
    fout << "    " << _omega << "  " << _phi << "  " << _kappa << "\n\n";
    for (int i = 0; i < 3; i ++)
    {
        fout << "    " << _r_mtx(i,0) << "  " << _r_mtx(i,1) << "  " << _r_mtx(i,2) << "\n";
    }
    fout << "\n    " << _xh << "  " << _yh << "\n";
    fout << "    " << _cc << "\n";
    fout << "    " << _glass_vec[0] << "  " << _glass_vec[1] << "  " << _glass_vec[2] << "\n";
    fout.close();

    if (addpar_file.empty())
    {
        return;
    }

    std::ofstream fout_add(addpar_file, std::ios::out);
    REQUIRE_CTX(fout_add.is_open(), ErrorCode::IOfailure,
                "Camera::saveParameters: cannot open file", addpar_file);
    AddedParam const& ap = _added_param;
    fout_add << std::fixed << std::setprecision(8)
             << ap.k1 << " " << ap.k2 << " " << ap.k3 << " "
             << ap.p1 << " " << ap.p2 << " " << ap.scx << " " << ap.she << "\n";
}

void Camera::setOrientation (Pt3D const& x0, double omega, double phi, double kappa)
{
    _x0 = x0;
    _omega = omega;
    _phi = phi;
    _kappa = kappa;
    _r_mtx = myMATH::rotationMatrix(omega, phi, kappa);
}

void Camera::setSensor (int n_row, int n_col, double pix_x, double pix_y)
{
    REQUIRE_CTX(n_row > 0 && n_col > 0 && pix_x > 0 && pix_y > 0, ErrorCode::ConfigurationError,
                "Camera::setSensor: sensor size and pixel pitch must be positive",
                std::to_string(n_col) + "x" + std::to_string(n_row));
    _n_row = n_row;
    _n_col = n_col;
    _pix_x = pix_x;
    _pix_y = pix_y;
}

int Camera::getNRow () const
{
    return _n_row;
}

int Camera::getNCol () const
{
    return _n_col;
}

Pt2D Camera::metricToPixel (Pt2D const& pt_metric) const
{
    return Pt2D(pt_metric[0] / _pix_x + _n_col / 2.0,
                -pt_metric[1] / _pix_y + _n_row / 2.0);
}

Pt2D Camera::pixelToMetric (Pt2D const& pt_pixel) const
{
    return Pt2D((pt_pixel[0] - _n_col / 2.0) * _pix_x,
                -(pt_pixel[1] - _n_row / 2.0) * _pix_y);
}

Pt2D Camera::distort (Pt2D const& pt_flat) const
{
    AddedParam const& ap = _added_param;
    const double x = pt_flat[0];
    const double y = pt_flat[1];
    const double r2 = x * x + y * y;
    if (r2 < SMALLNUMBER * SMALLNUMBER)
    {
        return Pt2D(ap.scx * x - std::sin(ap.she) * y, std::cos(ap.she) * y);
    }

    const double rad = ap.k1 * r2 + ap.k2 * r2 * r2 + ap.k3 * r2 * r2 * r2;
    const double xd = x + x * rad + ap.p1 * (r2 + 2 * x * x) + 2 * ap.p2 * x * y;
    const double yd = y + y * rad + ap.p2 * (r2 + 2 * y * y) + 2 * ap.p1 * x * y;

    return Pt2D(ap.scx * xd - std::sin(ap.she) * yd, std::cos(ap.she) * yd);
}

// fixed point iteration on the Brown model after removing the affine part
Pt2D Camera::undistort (Pt2D const& pt_dist) const
{
    AddedParam const& ap = _added_param;
    const double y0 = pt_dist[1] / std::cos(ap.she);
    const double x0 = (pt_dist[0] + std::sin(ap.she) * y0) / ap.scx;

    double x = x0, y = y0;
    for (int iter = 0; iter < UNDISTORT_MAX_ITER; iter ++)
    {
        const double r2 = x * x + y * y;
        const double rad = ap.k1 * r2 + ap.k2 * r2 * r2 + ap.k3 * r2 * r2 * r2;
        const double x_new = x0 - (x * rad + ap.p1 * (r2 + 2 * x * x) + 2 * ap.p2 * x * y);
        const double y_new = y0 - (y * rad + ap.p2 * (r2 + 2 * y * y) + 2 * ap.p1 * x * y);

        const double change = std::fabs(x_new - x) + std::fabs(y_new - y);
        x = x_new;
        y = y_new;
        if (change < UNDISTORT_EPS)
        {
            break;
        }
    }

    return Pt2D(x, y);
}

double Camera::windowHeight (Pt3D const& pt) const
{
    const double gv_len = _glass_vec.norm();
    return myMATH::dot(pt, _glass_vec) / gv_len - gv_len;
}

// Finds the incidence angle in air whose refracted path reaches pt_world.
// In the plane of the window normal and pt_world, the radial offset is
//   r(t1) = h_c tan(t1) + d tan(t2) + h_w tan(t3),  n1 sin(t1) = n2 sin(t2) = n3 sin(t3)
// which is monotonic in t1, so bisection on sin(t1) converges.
Pt3D Camera::virtualPoint (Pt3D const& pt_world) const
{
    if (_mm.isHomogeneous())
    {
        return pt_world;
    }

    const double h_c = windowHeight(_x0) - _mm.d;
    const double h_w = -windowHeight(pt_world);
    if (h_c <= 0 || h_w <= 0)
    {
        return pt_world;
    }

    Pt3D n = _glass_vec / _glass_vec.norm();
    Pt3D diff = pt_world - _x0;
    Pt3D radial = diff - n * myMATH::dot(diff, n);
    const double r_target = radial.norm();
    if (r_target < SMALLNUMBER)
    {
        return pt_world;
    }
    Pt3D e_r = radial / r_target;

    auto radius = [&](double s1)
    {
        const double s2 = _mm.n1 * s1 / _mm.n2;
        const double s3 = _mm.n1 * s1 / _mm.n3;
        return h_c * tanFromSin(s1) + _mm.d * tanFromSin(s2) + h_w * tanFromSin(s3);
    };

    double s_max = 1.0;
    s_max = std::min(s_max, _mm.n2 / _mm.n1);
    s_max = std::min(s_max, _mm.n3 / _mm.n1);

    double lo = 0.0;
    double hi = s_max * (1.0 - 1e-12);
    double s1 = 0.5 * (lo + hi);
    for (int iter = 0; iter < MULTIMED_MAX_ITER; iter ++)
    {
        s1 = 0.5 * (lo + hi);
        const double r = radius(s1);
        if (std::fabs(r - r_target) < MULTIMED_EPS)
        {
            break;
        }
        if (r < r_target)
        {
            lo = s1;
        }
        else
        {
            hi = s1;
        }
    }

    Pt3D dir = n * (-std::sqrt(1.0 - s1 * s1)) + e_r * s1;
    return _x0 + dir * diff.norm();
}

Pt3D Camera::pinholeDirection (Pt2D const& pt_img) const
{
    Pt2D flat = undistort(pixelToMetric(pt_img));
    Pt3D v(flat[0] - _xh, flat[1] - _yh, -_cc);
    Pt3D dir = _r_mtx * v;
    dir /= dir.norm();
    return dir;
}

Pt2D Camera::project (Pt3D const& pt_world) const
{
    Pt3D diff = virtualPoint(pt_world) - _x0;
    Matrix<double> pt_cam = _r_mtx.transpose() * diff;

    if (std::fabs(pt_cam[2]) < SMALLNUMBER)
    {
        THROW_FATAL_CTX(ErrorCode::ReconstructionFailure,
                        "Camera::project: point lies on the camera plane",
                        "(" + std::to_string(pt_world[0]) + "," + std::to_string(pt_world[1]) +
                        "," + std::to_string(pt_world[2]) + ")");
    }

    Pt2D flat(-_cc * pt_cam[0] / pt_cam[2] + _xh,
              -_cc * pt_cam[1] / pt_cam[2] + _yh);

    return metricToPixel(distort(flat));
}

Line3D Camera::lineOfSight (Pt2D const& pt_img) const
{
    Line3D line{_x0, pinholeDirection(pt_img)};
    if (_mm.isHomogeneous())
    {
        return line;
    }

    const double gv_len = _glass_vec.norm();
    Pt3D n = _glass_vec / gv_len;

    // ray must start above the window and head into it
    if (windowHeight(_x0) - _mm.d <= 0 || myMATH::dot(line.unit_vector, n) > -SMALLNUMBER)
    {
        return line;
    }

    Plane3D plane_air{n * (gv_len + _mm.d), n};
    Pt3D pt_air;
    if (myMATH::crossPoint(pt_air, line, plane_air))
    {
        return line;
    }
    Pt3D dir_glass = refract(line.unit_vector, n, _mm.n1 / _mm.n2);

    Pt3D pt_water = pt_air;
    if (_mm.d > 0)
    {
        Plane3D plane_water{n * gv_len, n};
        Line3D line_glass{pt_air, dir_glass};
        myMATH::crossPoint(pt_water, line_glass, plane_water);
    }
    Pt3D dir_water = refract(dir_glass, n, _mm.n2 / _mm.n3);

    return Line3D{pt_water, dir_water};
}

std::vector<Pt2D> Camera::epipolarCurve (Pt2D const& pt_img, Camera const& cam_other, 
                                         double z_min, double z_max, int n_points) const
{
    REQUIRE_CTX(n_points >= 2, ErrorCode::InvalidArgument,
                "Camera::epipolarCurve: need at least 2 samples", std::to_string(n_points));

    std::vector<Pt2D> curve;
    Line3D los = lineOfSight(pt_img);
    if (std::fabs(los.unit_vector[2]) < SMALLNUMBER)
    {
        return curve;
    }

    std::vector<double> z_list = myMATH::linspace(z_min, z_max, n_points);
    curve.reserve(n_points);
    for (double z : z_list)
    {
        const double t = (z - los.pt[2]) / los.unit_vector[2];
        Pt3D pt = los.pt + los.unit_vector * t;
        curve.push_back(cam_other.project(pt));
    }

    return curve;
}
