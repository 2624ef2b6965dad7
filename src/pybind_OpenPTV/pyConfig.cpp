#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "Config.h"

namespace py = pybind11;

void bind_Config(py::module_& m) {
    py::enum_<FrameErrorPolicy>(m, "FrameErrorPolicy")
        .value("FailFast",  FrameErrorPolicy::FailFast)
        .value("SkipFrame", FrameErrorPolicy::SkipFrame)
        .export_values();

    py::enum_<TrackDirection>(m, "TrackDirection")
        .value("Forward",  TrackDirection::Forward)
        .value("Backward", TrackDirection::Backward)
        .value("Both",     TrackDirection::Both)
        .export_values();

    py::enum_<PipelineStage>(m, "PipelineStage")
        .value("Load",        PipelineStage::Load)
        .value("Detect",      PipelineStage::Detect)
        .value("Correspond",  PipelineStage::Correspond)
        .value("Triangulate", PipelineStage::Triangulate)
        .value("Persist",     PipelineStage::Persist)
        .export_values();

    py::class_<VolumeParam>(m, "VolumeParam")
        .def(py::init<>())
        .def_property("x_lay",
            [](const VolumeParam& v){ return std::vector<double>{v.x_lay[0], v.x_lay[1]}; },
            [](VolumeParam& v, std::pair<double,double> x){ v.x_lay[0] = x.first; v.x_lay[1] = x.second; })
        .def_property("z_min_lay",
            [](const VolumeParam& v){ return std::vector<double>{v.z_min_lay[0], v.z_min_lay[1]}; },
            [](VolumeParam& v, std::pair<double,double> z){ v.z_min_lay[0] = z.first; v.z_min_lay[1] = z.second; })
        .def_property("z_max_lay",
            [](const VolumeParam& v){ return std::vector<double>{v.z_max_lay[0], v.z_max_lay[1]}; },
            [](VolumeParam& v, std::pair<double,double> z){ v.z_max_lay[0] = z.first; v.z_max_lay[1] = z.second; })
        .def("getZMin", &VolumeParam::getZMin, py::arg("x"))
        .def("getZMax", &VolumeParam::getZMax, py::arg("x"))
        .def("isInside", &VolumeParam::isInside, py::arg("pt"));

    py::class_<CorrespParam>(m, "CorrespParam")
        .def(py::init<>())
        .def_readwrite("eps0", &CorrespParam::eps0)
        .def_readwrite("cn", &CorrespParam::cn)
        .def_readwrite("cnx", &CorrespParam::cnx)
        .def_readwrite("cny", &CorrespParam::cny)
        .def_readwrite("csumg", &CorrespParam::csumg)
        .def_readwrite("corrmin", &CorrespParam::corrmin)
        .def_readwrite("tol_3d", &CorrespParam::tol_3d)
        .def_readwrite("all_cam_flag", &CorrespParam::all_cam_flag)
        .def_readwrite("n_epi_points", &CorrespParam::n_epi_points);

    py::class_<DetectParam>(m, "DetectParam")
        .def(py::init<>())
        .def_readwrite("finder", &DetectParam::finder)
        .def_readwrite("threshold", &DetectParam::threshold)
        .def_readwrite("n_min", &DetectParam::n_min)
        .def_readwrite("n_max", &DetectParam::n_max)
        .def_readwrite("nx_min", &DetectParam::nx_min)
        .def_readwrite("nx_max", &DetectParam::nx_max)
        .def_readwrite("ny_min", &DetectParam::ny_min)
        .def_readwrite("ny_max", &DetectParam::ny_max)
        .def_readwrite("sumg_min", &DetectParam::sumg_min)
        .def_readwrite("discont", &DetectParam::discont);

    py::class_<TrackParam>(m, "TrackParam")
        .def(py::init<>())
        .def_readwrite("dvx_min", &TrackParam::dvx_min)
        .def_readwrite("dvx_max", &TrackParam::dvx_max)
        .def_readwrite("dvy_min", &TrackParam::dvy_min)
        .def_readwrite("dvy_max", &TrackParam::dvy_max)
        .def_readwrite("dvz_min", &TrackParam::dvz_min)
        .def_readwrite("dvz_max", &TrackParam::dvz_max)
        .def_readwrite("angle", &TrackParam::angle)
        .def_readwrite("dacc", &TrackParam::dacc)
        .def_readwrite("add_new_particles", &TrackParam::add_new_particles)
        .def_readwrite("max_gap", &TrackParam::max_gap)
        .def_readwrite("strategy", &TrackParam::strategy)
        .def("getRadiusMax", &TrackParam::getRadiusMax);

    py::class_<PTVSetting>(m, "PTVSetting")
        .def(py::init<>())
        .def("readConfig", &PTVSetting::readConfig, py::arg("config_file"))
        .def("check", &PTVSetting::check)
        .def("loadCameras", &PTVSetting::loadCameras)
        .def("getFrameList", &PTVSetting::getFrameList)
        .def("getRtisPath", &PTVSetting::getRtisPath, py::arg("frame"))
        .def("getPtvisPath", &PTVSetting::getPtvisPath, py::arg("frame"))
        .def_readwrite("_frame_start", &PTVSetting::_frame_start)
        .def_readwrite("_frame_end", &PTVSetting::_frame_end)
        .def_readwrite("_frame_step", &PTVSetting::_frame_step)
        .def_readwrite("_n_thread", &PTVSetting::_n_thread)
        .def_readwrite("_n_cam", &PTVSetting::_n_cam)
        .def_readwrite("_img_n_col", &PTVSetting::_img_n_col)
        .def_readwrite("_img_n_row", &PTVSetting::_img_n_row)
        .def_readwrite("_pix_x", &PTVSetting::_pix_x)
        .def_readwrite("_pix_y", &PTVSetting::_pix_y)
        .def_readwrite("_mm_param", &PTVSetting::_mm_param)
        .def_readwrite("_ori_paths", &PTVSetting::_ori_paths)
        .def_readwrite("_addpar_paths", &PTVSetting::_addpar_paths)
        .def_readwrite("_img_base_list", &PTVSetting::_img_base_list)
        .def_readwrite("_target_base_list", &PTVSetting::_target_base_list)
        .def_readwrite("_volume", &PTVSetting::_volume)
        .def_readwrite("_corresp_param", &PTVSetting::_corresp_param)
        .def_readwrite("_detect_param", &PTVSetting::_detect_param)
        .def_readwrite("_track_param", &PTVSetting::_track_param)
        .def_readwrite("_output_path", &PTVSetting::_output_path)
        .def_readwrite("_error_policy", &PTVSetting::_error_policy)
        .def_readwrite("_use_existing_target", &PTVSetting::_use_existing_target);
}
