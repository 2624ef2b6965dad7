#include "test.h"

#include <fstream>
#include <string>
#include <vector>

#include "Camera.h"
#include "Config.h"
#include "myMATH.h"
#include "scene.h"

// two calibrated cameras and a config file using them, returns the config path
std::string writeConfig (std::string const& dir, std::string const& tracking_line, std::string const& output_line)
{
    std::vector<Camera> cams = makeCameraPair();
    for (int i = 0; i < 2; i ++)
    {
        std::string name = dir + "cam" + std::to_string(i + 1);
        cams[i].saveParameters(name + ".ori", name + ".addpar");
    }

    std::string path = dir + "config.txt";
    std::ofstream fout(path);
    fout << "# frames\n"
         << "1001, 1010\n"
         << "2   # threads\n"
         << "2\n"
         << "256,256,0.01,0.01\n"
         << "1,1,0,1\n"
         << dir << "cam1.ori," << dir << "cam1.addpar," << dir << "img/cam1.%d," << dir << "res/cam1\n"
         << dir << "cam2.ori," << dir << "cam2.addpar," << dir << "img/cam2.%d," << dir << "res/cam2\n"
         << "-50,50,-30,-30,30,30\n"
         << "1.0, 0.1, 0.2, 0.3, 0.4, 0, 0.5, 1\n"
         << "threshold,25,4,200,2,20,2,20,100,255\n"
         << tracking_line << "\n"
         << output_line << "\n";
    return path;
}

bool test_read_config ()
{
    std::string dir = makeResultDir("test_read_config");
    std::string path = writeConfig(dir, "-2,2,-1.5,1.5,-1,1,60,0.5,0,2,nearest", dir + "out, SkipFrame, 0");

    PTVSetting setting;
    setting.readConfig(path);

    CHECK(setting._frame_start == 1001 && setting._frame_end == 1010 && setting._frame_step == 1);
    CHECK(setting.getFrameList().size() == 10);
    CHECK(setting._n_thread == 2);
    CHECK(setting._n_cam == 2);
    CHECK(setting._img_n_col == 256 && setting._img_n_row == 256);
    CHECK(setting._mm_param.isHomogeneous());
    CHECK(setting._img_base_list[1] == dir + "img/cam2.%d");
    CHECK(setting._target_base_list[0] == dir + "res/cam1");

    CHECK_NEAR(setting._volume.x_lay[1], 50, 0);
    CHECK_NEAR(setting._volume.getZMin(0), -30, 1e-12);
    CHECK(setting._volume.isInside(Pt3D(0, 1000, 0)));
    CHECK(!setting._volume.isInside(Pt3D(60, 0, 0)));

    CHECK_NEAR(setting._corresp_param.eps0, 1.0, 0);
    CHECK_NEAR(setting._corresp_param.csumg, 0.4, 0);
    CHECK(setting._corresp_param.all_cam_flag);

    CHECK(setting._detect_param.finder == "threshold");
    CHECK(setting._detect_param.n_min == 4 && setting._detect_param.ny_max == 20);
    CHECK_NEAR(setting._detect_param.discont, 255, 0);

    CHECK_NEAR(setting._track_param.dvy_min, -1.5, 0);
    CHECK_NEAR(setting._track_param.angle, 60, 0);
    CHECK(!setting._track_param.add_new_particles);
    CHECK(setting._track_param.max_gap == 2);
    CHECK(setting._track_param.strategy == "nearest");
    CHECK_NEAR(setting._track_param.getRadiusMax(), std::sqrt(4 + 2.25 + 1), 1e-12);

    CHECK(setting._output_path == dir + "out/");
    CHECK(setting._error_policy == FrameErrorPolicy::SkipFrame);
    CHECK(!setting._use_existing_target);
    CHECK(setting.getRtisPath(1005) == dir + "out/rt_is.1005");
    CHECK(setting.getPtvisPath(1005) == dir + "out/ptv_is.1005");

    // the calibration survives the .ori round trip
    std::vector<Camera> cams = setting.loadCameras();
    std::vector<Camera> cams_ref = makeCameraPair();
    CHECK(cams.size() == 2);
    Pt3D pt(12, -7, 20);
    for (int i = 0; i < 2; i ++)
    {
        CHECK_NEAR(myMATH::dist(cams[i].project(pt), cams_ref[i].project(pt)), 0, 1e-4);
    }
    return true;
}

bool test_defaults ()
{
    std::string dir = makeResultDir("test_defaults");
    std::string path = writeConfig(dir, "-1,1,-1,1,-1,1,180,1,1,1", dir + "out/");

    PTVSetting setting;
    setting.readConfig(path);
    CHECK(setting._track_param.strategy == "gated");
    CHECK(setting._error_policy == FrameErrorPolicy::FailFast);
    CHECK(setting._output_path == dir + "out/");
    return true;
}

bool test_config_errors ()
{
    std::string dir = makeResultDir("test_config_errors");
    PTVSetting setting;

    CHECK_THROW_CODE(setting.readConfig(dir + "no_such_config.txt"), ErrorCode::ConfigurationError);

    // not a number
    std::string path = writeConfig(dir, "-1,1,-1,1,-1,1,abc,1,1,1", dir + "out");
    CHECK_THROW_CODE(setting.readConfig(path), ErrorCode::ConfigurationError);

    // too few tracking fields
    path = writeConfig(dir, "-1,1,-1,1,-1,1", dir + "out");
    CHECK_THROW_CODE(setting.readConfig(path), ErrorCode::ConfigurationError);

    // min > max
    path = writeConfig(dir, "1,-1,-1,1,-1,1,180,1,1,1", dir + "out");
    CHECK_THROW_CODE(setting.readConfig(path), ErrorCode::ConfigurationError);

    // unknown policy
    path = writeConfig(dir, "-1,1,-1,1,-1,1,180,1,1,1", dir + "out, retry");
    CHECK_THROW_CODE(setting.readConfig(path), ErrorCode::ConfigurationError);

    // missing output line
    path = writeConfig(dir, "-1,1,-1,1,-1,1,180,1,1,1", "");
    CHECK_THROW_CODE(setting.readConfig(path), ErrorCode::ConfigurationError);

    // camera count out of range
    {
        std::ofstream fout(dir + "bad_cam.txt");
        fout << "1,10\n1\n5\n";
    }
    CHECK_THROW_CODE(setting.readConfig(dir + "bad_cam.txt"), ErrorCode::ConfigurationError);

    // missing calibration file
    path = writeConfig(dir, "-1,1,-1,1,-1,1,180,1,1,1", dir + "out");
    setting.readConfig(path);
    fs::remove(dir + "cam2.ori");
    CHECK_THROW_CODE(setting.loadCameras(), ErrorCode::ConfigurationError);

    CHECK(std::string(errorCodeName(ErrorCode::ConfigurationError)) == "ConfigurationError");
    CHECK(std::string(errorCodeName(ErrorCode::LinkAmbiguity)) == "LinkAmbiguityWarning");
    CHECK(std::string(errorCodeName(static_cast<ErrorCode>(10))) == "Unknown");
    return true;
}

int main()
{
    int n_fail = 0;
    n_fail += runTest("test_read_config", test_read_config);
    n_fail += runTest("test_defaults", test_defaults);
    n_fail += runTest("test_config_errors", test_config_errors);
    return n_fail == 0 ? 0 : 1;
}
