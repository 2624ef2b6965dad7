#ifndef LIBPTV_CONFIG_H
#define LIBPTV_CONFIG_H

#include <iostream>
#include <fstream>
#include <vector>
#include <string>

#include "Camera.h"
#include "Matrix.h"
#include "PTVCommons.h"

// Observed volume: x range, and z limits linear in x between the two layers
struct VolumeParam
{
    double x_lay[2] = {-100, 100};
    double z_min_lay[2] = {-100, -100};
    double z_max_lay[2] = {100, 100};

    double getZMin (double x) const;
    double getZMax (double x) const;
    // z range over the whole volume, used to clip epipolar lines
    double getZMinAll () const { return std::min(z_min_lay[0], z_min_lay[1]); };
    double getZMaxAll () const { return std::max(z_max_lay[0], z_max_lay[1]); };

    bool isInside (Pt3D const& pt) const;
};

// Correspondence tolerances
struct CorrespParam
{
    double eps0 = 0.2;      // [px], band around the epipolar curve
    double cn = 0;          // min ratio of pixel counts
    double cnx = 0;         // min ratio of x extents
    double cny = 0;         // min ratio of y extents
    double csumg = 0;       // min ratio of grey sums
    double corrmin = 0;     // min mean pair score of a tuple
    double tol_3d = 1.0;    // [mm], max triangulation residual
    bool all_cam_flag = false; // only tuples using every camera
    int n_epi_points = 20;  // samples of an epipolar curve
};

// Target detection
struct DetectParam
{
    std::string finder = "threshold"; // name in TargetFinderRegistry
    double threshold = 20;  // grey value
    int n_min = 1, n_max = 1000;
    int nx_min = 1, nx_max = 100;
    int ny_min = 1, ny_max = 100;
    double sumg_min = 0;
    double discont = 100;   // max grey step between neighbours in one blob
};

// Tracking gates, velocities in [mm/frame]
struct TrackParam
{
    double dvx_min = -1, dvx_max = 1;
    double dvy_min = -1, dvy_max = 1;
    double dvz_min = -1, dvz_max = 1;
    double angle = 180;     // [deg], max change of direction
    double dacc = 1;        // [mm/frame], max change of velocity
    bool add_new_particles = true;
    int max_gap = 1;        // missing frames a link may bridge
    std::string strategy = "gated"; // name in TrackingStrategyRegistry

    double getRadiusMax () const; // largest displacement allowed in one frame
};

// Run configuration, read once and passed by const reference.
//
// Config file: one item per line, comma separated, '#' starts a comment.
//   first,last[,step]
//   n_thread
//   n_cam
//   imx,imy,pix_x,pix_y
//   n1,n2,d,n3
//   ori,addpar,img_base,target_base            (one line per camera)
//   x_lay0,x_lay1,zmin0,zmin1,zmax0,zmax1
//   eps0,cn,cnx,cny,csumg,corrmin,tol_3d,all_cam_flag
//   finder,threshold,n_min,n_max,nx_min,nx_max,ny_min,ny_max,sumg_min,discont
//   dvx_min,dvx_max,dvy_min,dvy_max,dvz_min,dvz_max,angle,dacc,add,max_gap,strategy
//   output_folder[,error_policy[,use_existing_target]]
class PTVSetting 
{
public:
    // Throws FatalError(ConfigurationError) for missing or invalid entries
    void readConfig (const std::string& config_file);
    // Throws FatalError(ConfigurationError) for inconsistent values
    void check () const;

    // cameras from the .ori/.addpar files, with sensor and media applied
    std::vector<Camera> loadCameras () const;

    std::vector<int> getFrameList () const;

    std::string getRtisPath (int frame) const;
    std::string getPtvisPath (int frame) const;

    int _frame_start = 0;
    int _frame_end = 0;
    int _frame_step = 1;
    int _n_thread = 0;
    int _n_cam = 0;

    // sensor
    int _img_n_col = 0; // imx
    int _img_n_row = 0; // imy
    double _pix_x = 0.01;
    double _pix_y = 0.01;

    MultimediaParam _mm_param;

    std::vector<std::string> _ori_paths;
    std::vector<std::string> _addpar_paths;
    std::vector<std::string> _img_base_list;
    std::vector<std::string> _target_base_list;

    VolumeParam _volume;
    CorrespParam _corresp_param;
    DetectParam _detect_param;
    TrackParam _track_param;

    std::string _output_path;
    FrameErrorPolicy _error_policy = FrameErrorPolicy::FailFast;
    bool _use_existing_target = false;
};

#endif // LIBPTV_CONFIG_H
