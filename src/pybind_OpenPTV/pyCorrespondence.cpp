#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>

#include "Correspondence.h"
#include "Triangulation.h"

namespace py = pybind11;

void bind_Correspondence(py::module_& m) {
    py::class_<TriangulationResult>(m, "TriangulationResult")
        .def(py::init<>())
        .def_readwrite("pt3d", &TriangulationResult::pt3d)
        .def_readwrite("residual", &TriangulationResult::residual)
        .def_readwrite("cond", &TriangulationResult::cond);

    // failure is raised as RuntimeError with the error text
    m.def("triangulate",
          [](std::vector<Line3D> const& line_of_sight_list) {
              StatusOr<TriangulationResult> res = triangulate(line_of_sight_list);
              if (!res) {
                  throw std::runtime_error(res.status().err.toString());
              }
              return res.value();
          },
          py::arg("line_of_sight_list"));

    py::class_<Correspondence>(m, "Correspondence")
        .def(py::init<>())
        .def_readwrite("_pnr_list", &Correspondence::_pnr_list)
        .def_readwrite("_n_cam_used", &Correspondence::_n_cam_used)
        .def_readwrite("_residual", &Correspondence::_residual)
        .def_readwrite("_corr", &Correspondence::_corr)
        .def_readwrite("_pt3d", &Correspondence::_pt3d);

    py::class_<CorrespondenceResult>(m, "CorrespondenceResult")
        .def(py::init<>())
        .def_readwrite("_corresp_list", &CorrespondenceResult::_corresp_list)
        .def_readwrite("_tnr_list", &CorrespondenceResult::_tnr_list);

    // target lists come back with _tnr filled in
    m.def("findCorrespondences",
          [](std::vector<Camera> const& cams, std::vector<std::vector<Target>> target_list,
             VolumeParam const& volume, CorrespParam const& param) {
              CorrespondenceResult res;
              {
                  py::gil_scoped_release nogil;
                  res = findCorrespondences(cams, target_list, volume, param);
              }
              return py::make_tuple(res, target_list);
          },
          py::arg("cams"), py::arg("target_list"), py::arg("volume"), py::arg("param"));

    m.def("makePoint3DList", &makePoint3DList, py::arg("result"));
}
