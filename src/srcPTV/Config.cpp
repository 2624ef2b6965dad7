#include "Config.h"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace
{

std::vector<std::string> splitFields (std::string const& line)
{
    std::vector<std::string> fields;
    std::stringstream parser(line);
    std::string field;
    while (read_csv_field(parser, field, ','))
    {
        field.erase(0, field.find_first_not_of(" \t"));
        field.erase(field.find_last_not_of(" \t") + 1);
        fields.push_back(field);
    }
    return fields;
}

double toDouble (std::string const& field, std::string const& what)
{
    try {
        size_t pos = 0;
        double v = std::stod(field, &pos);
        if (pos != field.size()) throw std::invalid_argument(field);
        return v;
    } catch (std::exception const&) {
        THROW_FATAL_CTX(ErrorCode::ConfigurationError, "Config Error: not a number", what + " = '" + field + "'");
    }
}

int toInt (std::string const& field, std::string const& what)
{
    try {
        size_t pos = 0;
        int v = std::stoi(field, &pos);
        if (pos != field.size()) throw std::invalid_argument(field);
        return v;
    } catch (std::exception const&) {
        THROW_FATAL_CTX(ErrorCode::ConfigurationError, "Config Error: not an integer", what + " = '" + field + "'");
    }
}

std::string toLower (std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

}


// --------------------------- VolumeParam ---------------------------
double VolumeParam::getZMin (double x) const
{
    const double dx = x_lay[1] - x_lay[0];
    if (std::fabs(dx) < SMALLNUMBER) return std::min(z_min_lay[0], z_min_lay[1]);
    return z_min_lay[0] + (x - x_lay[0]) * (z_min_lay[1] - z_min_lay[0]) / dx;
}

double VolumeParam::getZMax (double x) const
{
    const double dx = x_lay[1] - x_lay[0];
    if (std::fabs(dx) < SMALLNUMBER) return std::max(z_max_lay[0], z_max_lay[1]);
    return z_max_lay[0] + (x - x_lay[0]) * (z_max_lay[1] - z_max_lay[0]) / dx;
}

// y is not limited
bool VolumeParam::isInside (Pt3D const& pt) const
{
    const double x = pt[0];
    const double z = pt[2];
    if (x < std::min(x_lay[0], x_lay[1]) || x > std::max(x_lay[0], x_lay[1]))
    {
        return false;
    }
    return z >= getZMin(x) && z <= getZMax(x);
}


// --------------------------- TrackParam ---------------------------
double TrackParam::getRadiusMax () const
{
    const double dx = std::max(std::fabs(dvx_min), std::fabs(dvx_max));
    const double dy = std::max(std::fabs(dvy_min), std::fabs(dvy_max));
    const double dz = std::max(std::fabs(dvz_min), std::fabs(dvz_max));
    return std::sqrt(dx*dx + dy*dy + dz*dz);
}


// --------------------------- PTVSetting ---------------------------
void PTVSetting::readConfig (const std::string& config_path) 
{
    std::ifstream file(config_path);
    REQUIRE_CTX(file.is_open(), ErrorCode::ConfigurationError, "Config Error: cannot open file", config_path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        // trim spaces
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty()) continue;

        // remove comments
        size_t comment_pos = line.find('#');
        if (comment_pos == 0) continue;
        if (comment_pos != std::string::npos) line.erase(comment_pos);

        // trim again
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty()) continue;

        lines.push_back(line);
    }
    file.close();

    size_t line_id = 0;
    auto nextLine = [&](const char* what) -> std::vector<std::string> {
        REQUIRE_CTX(line_id < lines.size(), ErrorCode::ConfigurationError,
                    "Config Error: too few lines", std::string("missing ") + what);
        return splitFields(lines[line_id++]);
    };
    auto requireFields = [](std::vector<std::string> const& f, size_t n, const char* what) {
        REQUIRE_CTX(f.size() >= n, ErrorCode::ConfigurationError,
                    "Config Error: too few fields", std::string(what) + ", expected " + std::to_string(n));
    };

    // frame range
    std::vector<std::string> f = nextLine("frame range");
    requireFields(f, 2, "frame range");
    _frame_start = toInt(f[0], "first");
    _frame_end   = toInt(f[1], "last");
    _frame_step  = f.size() > 2 ? toInt(f[2], "step") : 1;

    // threads
    f = nextLine("n_thread");
    _n_thread = toInt(f[0], "n_thread");
    if (_n_thread < 0) _n_thread = 0;

    // number of cameras
    f = nextLine("n_cam");
    _n_cam = toInt(f[0], "n_cam");
    REQUIRE_CTX(_n_cam > 0 && _n_cam <= MAX_CAM_RTIS, ErrorCode::ConfigurationError,
                "Config Error: number of cameras must be in [1,4]", std::to_string(_n_cam));

    // sensor
    f = nextLine("sensor");
    requireFields(f, 4, "imx,imy,pix_x,pix_y");
    _img_n_col = toInt(f[0], "imx");
    _img_n_row = toInt(f[1], "imy");
    _pix_x = toDouble(f[2], "pix_x");
    _pix_y = toDouble(f[3], "pix_y");

    // multimedia
    f = nextLine("multimedia");
    requireFields(f, 4, "n1,n2,d,n3");
    _mm_param.n1 = toDouble(f[0], "n1");
    _mm_param.n2 = toDouble(f[1], "n2");
    _mm_param.d  = toDouble(f[2], "d");
    _mm_param.n3 = toDouble(f[3], "n3");

    // cameras
    _ori_paths.clear();
    _addpar_paths.clear();
    _img_base_list.clear();
    _target_base_list.clear();
    for (int i = 0; i < _n_cam; ++i) {
        f = nextLine("camera");
        requireFields(f, 4, "ori,addpar,img_base,target_base");
        _ori_paths.push_back(f[0]);
        _addpar_paths.push_back(f[1]);
        _img_base_list.push_back(f[2]);
        _target_base_list.push_back(f[3]);
    }

    // volume
    f = nextLine("volume");
    requireFields(f, 6, "volume");
    for (int i = 0; i < 2; ++i) {
        _volume.x_lay[i]     = toDouble(f[i],     "x_lay");
        _volume.z_min_lay[i] = toDouble(f[2 + i], "zmin_lay");
        _volume.z_max_lay[i] = toDouble(f[4 + i], "zmax_lay");
    }

    // correspondence
    f = nextLine("correspondence");
    requireFields(f, 8, "correspondence");
    _corresp_param.eps0    = toDouble(f[0], "eps0");
    _corresp_param.cn      = toDouble(f[1], "cn");
    _corresp_param.cnx     = toDouble(f[2], "cnx");
    _corresp_param.cny     = toDouble(f[3], "cny");
    _corresp_param.csumg   = toDouble(f[4], "csumg");
    _corresp_param.corrmin = toDouble(f[5], "corrmin");
    _corresp_param.tol_3d  = toDouble(f[6], "tol_3d");
    _corresp_param.all_cam_flag = toInt(f[7], "all_cam_flag") != 0;

    // detection
    f = nextLine("detection");
    requireFields(f, 10, "detection");
    _detect_param.finder    = f[0];
    _detect_param.threshold = toDouble(f[1], "threshold");
    _detect_param.n_min     = toInt(f[2], "n_min");
    _detect_param.n_max     = toInt(f[3], "n_max");
    _detect_param.nx_min    = toInt(f[4], "nx_min");
    _detect_param.nx_max    = toInt(f[5], "nx_max");
    _detect_param.ny_min    = toInt(f[6], "ny_min");
    _detect_param.ny_max    = toInt(f[7], "ny_max");
    _detect_param.sumg_min  = toDouble(f[8], "sumg_min");
    _detect_param.discont   = toDouble(f[9], "discont");

    // tracking
    f = nextLine("tracking");
    requireFields(f, 10, "tracking");
    _track_param.dvx_min = toDouble(f[0], "dvxmin");
    _track_param.dvx_max = toDouble(f[1], "dvxmax");
    _track_param.dvy_min = toDouble(f[2], "dvymin");
    _track_param.dvy_max = toDouble(f[3], "dvymax");
    _track_param.dvz_min = toDouble(f[4], "dvzmin");
    _track_param.dvz_max = toDouble(f[5], "dvzmax");
    _track_param.angle   = toDouble(f[6], "angle");
    _track_param.dacc    = toDouble(f[7], "dacc");
    _track_param.add_new_particles = toInt(f[8], "add") != 0;
    _track_param.max_gap = toInt(f[9], "max_gap");
    if (f.size() > 10 && !f[10].empty()) _track_param.strategy = f[10];

    // output
    f = nextLine("output folder");
    _output_path = f[0];
    if (!_output_path.empty()) {
        char back = _output_path.back();
        if (back != '/' && back != '\\') _output_path.push_back('/');
    }
    if (f.size() > 1 && !f[1].empty()) {
        const std::string policy = toLower(f[1]);
        if (policy == "failfast" || policy == "fail_fast") {
            _error_policy = FrameErrorPolicy::FailFast;
        } else if (policy == "skipframe" || policy == "skip_frame" || policy == "skip") {
            _error_policy = FrameErrorPolicy::SkipFrame;
        } else {
            THROW_FATAL_CTX(ErrorCode::ConfigurationError, "Config Error: unknown frame error policy", f[1]);
        }
    }
    if (f.size() > 2 && !f[2].empty()) {
        _use_existing_target = toInt(f[2], "use_existing_target") != 0;
    }

    check();
}

void PTVSetting::check () const
{
    REQUIRE_CTX(_frame_end >= _frame_start, ErrorCode::ConfigurationError, "Config Error: invalid frame range",
                std::to_string(_frame_start) + "," + std::to_string(_frame_end));
    REQUIRE_CTX(_frame_step > 0, ErrorCode::ConfigurationError, "Config Error: frame step must be positive",
                std::to_string(_frame_step));
    REQUIRE_CTX(_n_cam > 0 && _n_cam <= MAX_CAM_RTIS, ErrorCode::ConfigurationError,
                "Config Error: number of cameras must be in [1,4]", std::to_string(_n_cam));
    REQUIRE_CTX(int(_ori_paths.size()) == _n_cam && int(_img_base_list.size()) == _n_cam 
                && int(_target_base_list.size()) == _n_cam && int(_addpar_paths.size()) == _n_cam,
                ErrorCode::ConfigurationError, "Config Error: camera path count != n_cam", std::to_string(_n_cam));
    REQUIRE_CTX(_img_n_col > 0 && _img_n_row > 0 && _pix_x > 0 && _pix_y > 0, ErrorCode::ConfigurationError,
                "Config Error: invalid sensor size", std::to_string(_img_n_col) + "x" + std::to_string(_img_n_row));
    REQUIRE_CTX(_mm_param.n1 > 0 && _mm_param.n2 > 0 && _mm_param.n3 > 0 && _mm_param.d >= 0,
                ErrorCode::ConfigurationError, "Config Error: invalid multimedia parameters", "");
    REQUIRE_CTX(_corresp_param.eps0 > 0 && _corresp_param.tol_3d > 0 && _corresp_param.n_epi_points >= 2,
                ErrorCode::ConfigurationError, "Config Error: invalid correspondence tolerances", "");
    REQUIRE_CTX(_detect_param.n_min <= _detect_param.n_max && _detect_param.nx_min <= _detect_param.nx_max
                && _detect_param.ny_min <= _detect_param.ny_max,
                ErrorCode::ConfigurationError, "Config Error: invalid detection size bounds", "");
    REQUIRE_CTX(_track_param.dvx_min <= _track_param.dvx_max && _track_param.dvy_min <= _track_param.dvy_max
                && _track_param.dvz_min <= _track_param.dvz_max,
                ErrorCode::ConfigurationError, "Config Error: invalid velocity bounds", "");
    REQUIRE_CTX(_track_param.max_gap >= 0 && _track_param.angle >= 0 && _track_param.dacc >= 0,
                ErrorCode::ConfigurationError, "Config Error: invalid tracking gates", "");
}

std::vector<Camera> PTVSetting::loadCameras () const
{
    std::vector<Camera> cam_list;
    cam_list.reserve(static_cast<size_t>(_n_cam));
    for (int i = 0; i < _n_cam; ++i) {
        Camera cam(_ori_paths[i], _addpar_paths[i]);
        cam.setSensor(_img_n_row, _img_n_col, _pix_x, _pix_y);
        cam.setMultimedia(_mm_param);
        cam._is_active = true;
        cam_list.emplace_back(cam);
    }
    return cam_list;
}

std::vector<int> PTVSetting::getFrameList () const
{
    std::vector<int> frame_list;
    for (int frame = _frame_start; frame <= _frame_end; frame += _frame_step) {
        frame_list.push_back(frame);
    }
    return frame_list;
}

std::string PTVSetting::getRtisPath (int frame) const
{
    return _output_path + "rt_is." + std::to_string(frame);
}

std::string PTVSetting::getPtvisPath (int frame) const
{
    return _output_path + "ptv_is." + std::to_string(frame);
}
