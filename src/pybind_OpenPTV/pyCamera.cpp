#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "Camera.h"

namespace py = pybind11;

void bind_Camera(py::module_& m) {
    py::class_<MultimediaParam>(m, "MultimediaParam")
        .def(py::init<>())
        .def_readwrite("n1", &MultimediaParam::n1)
        .def_readwrite("n2", &MultimediaParam::n2)
        .def_readwrite("d",  &MultimediaParam::d)
        .def_readwrite("n3", &MultimediaParam::n3)
        .def("isHomogeneous", &MultimediaParam::isHomogeneous);

    py::class_<AddedParam>(m, "AddedParam")
        .def(py::init<>())
        .def_readwrite("k1",  &AddedParam::k1)
        .def_readwrite("k2",  &AddedParam::k2)
        .def_readwrite("k3",  &AddedParam::k3)
        .def_readwrite("p1",  &AddedParam::p1)
        .def_readwrite("p2",  &AddedParam::p2)
        .def_readwrite("scx", &AddedParam::scx)
        .def_readwrite("she", &AddedParam::she);

    py::class_<Camera>(m, "Camera")
        .def(py::init<>())
        .def(py::init<std::string const&, std::string const&>(),
             py::arg("ori_file"), py::arg("addpar_file"))
        .def(py::init<const Camera&>())
        .def_readwrite("_x0",          &Camera::_x0)
        .def_readwrite("_omega",       &Camera::_omega)
        .def_readwrite("_phi",         &Camera::_phi)
        .def_readwrite("_kappa",       &Camera::_kappa)
        .def_readwrite("_r_mtx",       &Camera::_r_mtx)
        .def_readwrite("_xh",          &Camera::_xh)
        .def_readwrite("_yh",          &Camera::_yh)
        .def_readwrite("_cc",          &Camera::_cc)
        .def_readwrite("_added_param", &Camera::_added_param)
        .def_readwrite("_glass_vec",   &Camera::_glass_vec)
        .def_readwrite("_mm",          &Camera::_mm)
        .def_readwrite("_pix_x",       &Camera::_pix_x)
        .def_readwrite("_pix_y",       &Camera::_pix_y)
        .def_readwrite("_is_active",   &Camera::_is_active)
        .def("loadParameters", &Camera::loadParameters,
             py::arg("ori_file"), py::arg("addpar_file") = "")
        .def("saveParameters", &Camera::saveParameters,
             py::arg("ori_file"), py::arg("addpar_file") = "")
        .def("setOrientation", &Camera::setOrientation,
             py::arg("x0"), py::arg("omega"), py::arg("phi"), py::arg("kappa"))
        .def("setSensor", &Camera::setSensor,
             py::arg("n_row"), py::arg("n_col"), py::arg("pix_x"), py::arg("pix_y"))
        .def("setMultimedia", &Camera::setMultimedia, py::arg("mm"))
        .def("getNRow", &Camera::getNRow)
        .def("getNCol", &Camera::getNCol)
        .def("project", &Camera::project, py::arg("pt_world"))
        .def("lineOfSight", &Camera::lineOfSight, py::arg("pt_img"))
        .def("epipolarCurve", &Camera::epipolarCurve,
             py::arg("pt_img"), py::arg("cam_other"), py::arg("z_min"), py::arg("z_max"),
             py::arg("n_points"))
        .def("metricToPixel", &Camera::metricToPixel, py::arg("pt_metric"))
        .def("pixelToMetric", &Camera::pixelToMetric, py::arg("pt_pixel"))
        .def("__repr__", [](const Camera& c){
            return "<Camera " + std::to_string(c._n_col) + "x" + std::to_string(c._n_row) +
                   (c._mm.isHomogeneous() ? "" : " multimedia") + ">";
        });
}
