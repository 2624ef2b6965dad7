#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "Sequence.h"

namespace py = pybind11;

void bind_Sequence(py::module_& m) {
    // cancel() may be called from another Python thread while run is going
    py::class_<CancelToken>(m, "CancelToken")
        .def(py::init<>())
        .def("cancel", &CancelToken::cancel)
        .def("reset", &CancelToken::reset)
        .def("isCancelled", &CancelToken::isCancelled);

    py::class_<FrameSummary>(m, "FrameSummary")
        .def(py::init<>())
        .def_readwrite("frame", &FrameSummary::frame)
        .def_readwrite("n_points", &FrameSummary::n_points)
        .def_readwrite("n_detections_per_camera", &FrameSummary::n_detections_per_camera);

    py::class_<FrameFailure>(m, "FrameFailure")
        .def_readonly("frame", &FrameFailure::frame)
        .def_readonly("stage", &FrameFailure::stage)
        .def_property_readonly("message", [](const FrameFailure& f){ return f.error.toString(); });

    py::class_<SequenceSummary>(m, "SequenceSummary")
        .def(py::init<>())
        .def_readonly("frame_list", &SequenceSummary::frame_list)
        .def_readonly("failed_list", &SequenceSummary::failed_list)
        .def_readonly("cancelled_list", &SequenceSummary::cancelled_list)
        .def_readonly("is_cancelled", &SequenceSummary::is_cancelled)
        .def("print", [](const SequenceSummary& s){ s.print(std::cout); });

    m.def("runSequence",
          [](PTVSetting const& setting, ImageSource const& img_src,
             std::vector<Camera> const& cams, CancelToken* cancel) {
              py::gil_scoped_release nogil;
              return runSequence(setting, img_src, cams, cancel);
          },
          py::arg("setting"), py::arg("img_src"), py::arg("cams"), py::arg("cancel") = nullptr);

    py::class_<FrameRange>(m, "FrameRange")
        .def(py::init<>())
        .def_readwrite("first", &FrameRange::first)
        .def_readwrite("last", &FrameRange::last)
        .def("__repr__", [](const FrameRange& r){
            return "<FrameRange " + std::to_string(r.first) + ".." + std::to_string(r.last) + ">";
        });

    m.def("chunkFrameRange", &chunkFrameRange, py::arg("first"), py::arg("last"), py::arg("n_chunk"));
}
