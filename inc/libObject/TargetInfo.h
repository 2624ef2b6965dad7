#ifndef TARGETINFO_H
#define TARGETINFO_H

#include <array>
#include <vector>

#include "Matrix.h"
#include "PTVCommons.h"

// ============================== 2D target (one detected blob) ==============================
// Only _tnr changes after detection (set by the correspondence step).
class Target
{
public:
    int _pnr = -1;         // 0-based index within camera and frame
    Pt2D _pt_center;       // [px], x to the right, y downward
    int _n = 0;            // number of pixels
    int _nx = 0;           // bounding box width
    int _ny = 0;           // bounding box height
    int _sumg = 0;         // sum of grey values
    int _tnr = CORRES_NONE; // index of the 3D point using this target

    Target () = default;
    Target (const Target& target) = default;
    Target (int pnr, double x, double y, int n, int nx, int ny, int sumg, int tnr = CORRES_NONE)
        : _pnr(pnr), _pt_center(x, y), _n(n), _nx(nx), _ny(ny), _sumg(sumg), _tnr(tnr) {};
    Target& operator= (const Target& target) = default;
    ~Target () = default;

    double x () const { return _pt_center[0]; };
    double y () const { return _pt_center[1]; };
};

// ============================== 3D point of one frame ==============================
class Point3D
{
public:
    int _id = 0;         // 1-based within the frame
    Pt3D _pt_center;     // [mm]
    std::array<int, MAX_CAM_RTIS> _pnr_list; // target index per camera, CORRES_NONE if unused

    Point3D () { _pnr_list.fill(CORRES_NONE); };
    Point3D (const Point3D& pt) = default;
    Point3D (int id, Pt3D const& pt_center) 
        : _id(id), _pt_center(pt_center) { _pnr_list.fill(CORRES_NONE); };
    Point3D& operator= (const Point3D& pt) = default;
    ~Point3D () = default;

    int getNumCamUsed () const
    {
        int n = 0;
        for (int pnr : _pnr_list)
        {
            if (pnr != CORRES_NONE) n ++;
        }
        return n;
    };
};

// ============================== Pt3dCloud for KD-tree ==============================
// View on the points of one frame, the points must outlive this adapter.
struct Pt3dCloud
{
    const std::vector<Point3D>& _pt3d_list; // view only (no ownership)

    explicit Pt3dCloud (const std::vector<Point3D>& pt3d_list) 
        : _pt3d_list(pt3d_list) {}

    // Must define the interface required by nanoflann
    inline size_t kdtree_get_point_count () const { return _pt3d_list.size(); }

    inline double kdtree_get_pt (const size_t idx, int dim) const
    {
        return _pt3d_list[idx]._pt_center[dim];
    }

    // Bounding box (not needed for standard KD-tree queries)
    template <class BBOX> bool kdtree_get_bbox (BBOX&) const { return false; }
};

#endif
