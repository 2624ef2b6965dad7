#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ResultIO.h"
#include "TargetFinder.h"
#include "TargetInfo.h"

namespace py = pybind11;

void bind_TargetInfo(py::module_& m) {
    py::class_<Target>(m, "Target")
        .def(py::init<>())
        .def(py::init<int,double,double,int,int,int,int,int>(),
             py::arg("pnr"), py::arg("x"), py::arg("y"), py::arg("n"), py::arg("nx"),
             py::arg("ny"), py::arg("sumg"), py::arg("tnr") = CORRES_NONE)
        .def_readwrite("_pnr", &Target::_pnr)
        .def_readwrite("_pt_center", &Target::_pt_center)
        .def_readwrite("_n", &Target::_n)
        .def_readwrite("_nx", &Target::_nx)
        .def_readwrite("_ny", &Target::_ny)
        .def_readwrite("_sumg", &Target::_sumg)
        .def_readwrite("_tnr", &Target::_tnr)
        .def("__repr__", [](const Target& t){
            return "<Target pnr=" + std::to_string(t._pnr) + " (" + std::to_string(t.x()) +
                   "," + std::to_string(t.y()) + ") n=" + std::to_string(t._n) + ">";
        });

    py::class_<Point3D>(m, "Point3D")
        .def(py::init<>())
        .def(py::init<int, Pt3D const&>(), py::arg("id"), py::arg("pt_center"))
        .def_readwrite("_id", &Point3D::_id)
        .def_readwrite("_pt_center", &Point3D::_pt_center)
        .def_readwrite("_pnr_list", &Point3D::_pnr_list)
        .def("getNumCamUsed", &Point3D::getNumCamUsed);

    py::class_<TargetFinderRegistry, std::unique_ptr<TargetFinderRegistry, py::nodelete>>(m, "TargetFinderRegistry")
        .def_static("instance", &TargetFinderRegistry::instance, py::return_value_policy::reference)
        .def("contains", &TargetFinderRegistry::contains, py::arg("name"))
        .def("getNames", &TargetFinderRegistry::getNames);

    m.def("detectTargets", &detectTargets, py::arg("img"), py::arg("param"),
          py::call_guard<py::gil_scoped_release>());

    // result files
    py::class_<PtvisRecord>(m, "PtvisRecord")
        .def(py::init<>())
        .def_readwrite("prev", &PtvisRecord::prev)
        .def_readwrite("next", &PtvisRecord::next)
        .def_readwrite("pt", &PtvisRecord::pt);

    m.def("getTargetPath", &getTargetPath, py::arg("target_base"), py::arg("frame"));
    m.def("readTargets", &readTargets, py::arg("path"));
    m.def("writeTargets", &writeTargets, py::arg("path"), py::arg("target_list"));
    m.def("readRtis", &readRtis, py::arg("path"));
    m.def("writeRtis", &writeRtis, py::arg("path"), py::arg("pt3d_list"));
    m.def("readPtvis", &readPtvis, py::arg("path"));
}
