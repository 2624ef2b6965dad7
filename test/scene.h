#ifndef SCENE_H
#define SCENE_H

// Synthetic cameras and images shared by the tests.
// Cameras look at the origin from z = 600 mm, 256x256 px sensor,
// 0.01 mm pixels and 10 mm principal distance (about 1.6 px/mm).

#include <cmath>
#include <vector>

#include "Camera.h"
#include "Matrix.h"
#include "TargetInfo.h"

#define SCENE_N_PIX 256
#define SCENE_PIX_SIZE 0.01
#define SCENE_CC 10.0

// camera at (x0, y0, z0) looking at the origin (x0 or y0 must be 0)
inline Camera makeCamera (double x0, double y0, double z0)
{
    Camera cam;
    const double omega = std::atan2(-y0, z0);
    const double phi = std::atan2(x0, std::sqrt(y0 * y0 + z0 * z0));
    cam.setOrientation(Pt3D(x0, y0, z0), omega, phi, 0);
    cam._cc = SCENE_CC;
    cam.setSensor(SCENE_N_PIX, SCENE_N_PIX, SCENE_PIX_SIZE, SCENE_PIX_SIZE);
    return cam;
}

inline std::vector<Camera> makeCameraPair ()
{
    return {makeCamera(-150, 0, 600), makeCamera(150, 0, 600)};
}

inline std::vector<Camera> makeCameraTriple ()
{
    return {makeCamera(-150, 0, 600), makeCamera(150, 0, 600), makeCamera(0, 150, 600)};
}

// gaussian spot, grey values rounded like an 8-bit camera
inline void drawBlob (Image& img, Pt2D const& pt, double peak = 200, double sigma = 1.2)
{
    const int r0 = int(std::floor(pt[1]));
    const int c0 = int(std::floor(pt[0]));
    for (int r = r0 - 5; r <= r0 + 5; r ++)
    {
        for (int c = c0 - 5; c <= c0 + 5; c ++)
        {
            if (r < 0 || r >= img.getDimRow() || c < 0 || c >= img.getDimCol()) continue;
            const double d2 = (c - pt[0]) * (c - pt[0]) + (r - pt[1]) * (r - pt[1]);
            const double g = std::round(peak * std::exp(-d2 / (2 * sigma * sigma)));
            img(r, c) = std::min(255.0, img(r, c) + g);
        }
    }
}

inline Image renderImage (Camera const& cam, std::vector<Pt3D> const& pt_list)
{
    Image img(cam.getNRow(), cam.getNCol(), 0);
    for (auto const& pt : pt_list)
    {
        drawBlob(img, cam.project(pt));
    }
    return img;
}

// ideal detections of pt_list in cam, pnr in list order
inline std::vector<Target> projectTargets (Camera const& cam, std::vector<Pt3D> const& pt_list)
{
    std::vector<Target> target_list;
    for (size_t i = 0; i < pt_list.size(); i ++)
    {
        Pt2D pt = cam.project(pt_list[i]);
        target_list.emplace_back(int(i), pt[0], pt[1], 13, 4, 4, 1500);
    }
    return target_list;
}

// well separated in y, inside x in [-50,50], z in [-30,30]
inline std::vector<Pt3D> makeScenePoints ()
{
    return {Pt3D(-20, -30, 0), Pt3D(10, -10, 5), Pt3D(-5, 10, -10), Pt3D(20, 30, 10)};
}

#endif
