#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "FrameBuffer.h"
#include "Tracker.h"

namespace py = pybind11;

void bind_Tracker(py::module_& m) {
    py::class_<PathInfo>(m, "PathInfo")
        .def(py::init<>())
        .def_readonly("prev_fid", &PathInfo::prev_fid)
        .def_readonly("prev_id", &PathInfo::prev_id)
        .def_readonly("next_fid", &PathInfo::next_fid)
        .def_readonly("next_id", &PathInfo::next_id)
        .def("hasPrev", &PathInfo::hasPrev)
        .def("hasNext", &PathInfo::hasNext);

    py::class_<FrameBuffer>(m, "FrameBuffer")
        .def(py::init<PTVSetting const&>(), py::arg("setting"))
        .def(py::init<std::vector<int> const&, std::vector<std::vector<Point3D>> const&>(),
             py::arg("frame_list"), py::arg("pt3d_lists"))
        .def("getNumFrame", &FrameBuffer::getNumFrame)
        .def("getFrame", &FrameBuffer::getFrame, py::arg("fid"))
        .def("getPath", &FrameBuffer::getPath, py::arg("fid"), py::arg("id"))
        .def("countLinks", &FrameBuffer::countLinks)
        .def("makePtvisRecords", &FrameBuffer::makePtvisRecords)
        .def("writePtvis", &FrameBuffer::writePtvis, py::arg("setting"));

    py::class_<TrackingSummary>(m, "TrackingSummary")
        .def(py::init<>())
        .def_readonly("n_tracks_started", &TrackingSummary::n_tracks_started)
        .def_readonly("n_tracks_ended", &TrackingSummary::n_tracks_ended)
        .def_readonly("n_links_made", &TrackingSummary::n_links_made)
        .def_readonly("n_ambiguities", &TrackingSummary::n_ambiguities)
        .def("print", &TrackingSummary::print);

    py::class_<TrackingStrategyRegistry, std::unique_ptr<TrackingStrategyRegistry, py::nodelete>>(m, "TrackingStrategyRegistry")
        .def_static("instance", &TrackingStrategyRegistry::instance, py::return_value_policy::reference)
        .def("contains", &TrackingStrategyRegistry::contains, py::arg("name"))
        .def("getNames", &TrackingStrategyRegistry::getNames);

    py::class_<Tracker>(m, "Tracker")
        .def(py::init<TrackParam const&>(), py::arg("param"))
        .def("trackForward", &Tracker::trackForward, py::arg("fb"))
        .def("trackBackward", &Tracker::trackBackward, py::arg("fb"))
        .def("track", &Tracker::track, py::arg("fb"), py::arg("direction"))
        .def_static("mergeLinks", &Tracker::mergeLinks, py::arg("fb_dst"), py::arg("fb_src"))
        .def("getNumAmbiguity", &Tracker::getNumAmbiguity);

    m.def("runTracking", &runTracking, py::arg("setting"), py::arg("direction"),
          py::call_guard<py::gil_scoped_release>());
}
