#ifndef CAMERA_H
#define CAMERA_H

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "Matrix.h"
#include "PTVCommons.h"
#include "myMATH.h"

// Refractive layers between the camera and the observed fluid.
// Camera sits in medium n1 (air), looks through a flat window of
// index n2 and thickness d into the fluid of index n3.
struct MultimediaParam
{
    double n1 = 1.0; // air
    double n2 = 1.0; // glass
    double d = 0.0;  // glass thickness [mm]
    double n3 = 1.0; // water

    bool isHomogeneous () const
    {
        return std::fabs(n1 - n2) < SMALLNUMBER && std::fabs(n1 - n3) < SMALLNUMBER;
    };
};

// Brown + affine distortion coefficients (.addpar)
struct AddedParam
{
    double k1 = 0, k2 = 0, k3 = 0; // radial
    double p1 = 0, p2 = 0;         // decentering
    double scx = 1;                // x scale
    double she = 0;                // shear [rad]
};

// Pinhole camera with OpenPTV orientation files.
//  World -> image:  X_cam = R^T (X - X0); x = -cc X_cam[0]/X_cam[2] + xh, ...
//  then distortion, then metric -> pixel with the sensor size and pixel pitch.
//  Pixel frame: x to the right, y downward, origin at the image corner.
class Camera
{
public:
    // exterior orientation
    Pt3D _x0;                   // projection center
    double _omega = 0, _phi = 0, _kappa = 0; // [rad]
    Matrix<double> _r_mtx = Matrix<double>(3, 3, 0);

    // interior orientation
    double _xh = 0, _yh = 0;    // principal point [mm]
    double _cc = 1;             // principal distance [mm]
    AddedParam _added_param;

    // glass vector: from the world origin to the water side of the window,
    // normal to it, pointing toward the camera
    Pt3D _glass_vec = Pt3D(0, 0, 1);
    MultimediaParam _mm;

    // sensor
    int _n_row = 0;             // imy
    int _n_col = 0;             // imx
    double _pix_x = 1, _pix_y = 1; // [mm]

    bool _is_active = true;

    Camera ();
    Camera (const Camera& c) = default;
    Camera (std::string const& ori_file, std::string const& addpar_file);
    Camera& operator= (const Camera& c) = default;
    ~Camera () {};

    // Load the .ori file (and .addpar, when addpar_file is not empty).
    // Throws FatalError(ConfigurationError) for missing or malformed files.
    void loadParameters (std::string const& ori_file, std::string const& addpar_file = "");
    void saveParameters (std::string const& ori_file, std::string const& addpar_file = "") const;

    // exterior orientation from angles, updates _r_mtx
    void setOrientation (Pt3D const& x0, double omega, double phi, double kappa);
    void setSensor (int n_row, int n_col, double pix_x, double pix_y);
    void setMultimedia (MultimediaParam const& mm) { _mm = mm; };

    int getNRow () const;
    int getNCol () const;

    // world point [mm] -> distorted image point [px]
    Pt2D project (Pt3D const& pt_world) const;

    // distorted image point [px] -> ray in the observed medium
    // (refracted through the window when the media differ)
    Line3D lineOfSight (Pt2D const& pt_img) const;

    // Image of the line of sight of pt_img in cam_other, as a polyline of n_points
    // samples between depth z_min and z_max (world z). Empty when the ray is
    // parallel to the z planes.
    std::vector<Pt2D> epipolarCurve (Pt2D const& pt_img, Camera const& cam_other, 
                                     double z_min, double z_max, int n_points) const;

    // metric image plane [mm] <-> pixel
    Pt2D metricToPixel (Pt2D const& pt_metric) const;
    Pt2D pixelToMetric (Pt2D const& pt_pixel) const;

    // Brown + affine distortion, metric coordinates relative to the sensor center
    Pt2D distort (Pt2D const& pt_flat) const;
    Pt2D undistort (Pt2D const& pt_dist) const;

private:
    // world point in the fluid -> the point along the air ray that images to the same pixel
    Pt3D virtualPoint (Pt3D const& pt_world) const;
    Pt3D pinholeDirection (Pt2D const& pt_img) const;
    double windowHeight (Pt3D const& pt) const; // signed distance above the water side plane
};

#endif
