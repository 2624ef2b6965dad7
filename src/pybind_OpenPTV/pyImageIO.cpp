#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "ImageIO.h"

namespace py = pybind11;

void bind_ImageIO(py::module_& m) {
    py::class_<ImageParam>(m, "ImageParam")
        .def(py::init<>())
        .def_readwrite("n_row", &ImageParam::n_row)
        .def_readwrite("n_col", &ImageParam::n_col)
        .def_readwrite("bits_per_sample", &ImageParam::bits_per_sample)
        .def_readwrite("n_channel", &ImageParam::n_channel)
        .def("__repr__", [](const ImageParam& p){
            return "<ImageParam n_row=" + std::to_string(p.n_row) +
                   " n_col=" + std::to_string(p.n_col) +
                   " bits_per_sample=" + std::to_string(p.bits_per_sample) +
                   " n_channel=" + std::to_string(p.n_channel) + ">";
        });

    py::class_<ImageIO>(m, "ImageIO")
        .def(py::init<>())
        .def("loadImg", &ImageIO::loadImg, py::arg("file"),
             py::call_guard<py::gil_scoped_release>())
        .def("saveImg", &ImageIO::saveImg, py::arg("save_path"), py::arg("image"),
             py::call_guard<py::gil_scoped_release>())
        .def("setImgParam", &ImageIO::setImgParam, py::arg("img_param"))
        .def("getImgParam", &ImageIO::getImgParam);

    m.def("formatFrame", &formatFrame, py::arg("pattern"), py::arg("frame"));

    py::class_<ImageSource>(m, "ImageSource")
        .def("getNumCam", &ImageSource::getNumCam)
        .def("getImage", &ImageSource::getImage, py::arg("cam_id"), py::arg("frame"));

    py::class_<TiffImageSource, ImageSource>(m, "TiffImageSource")
        .def(py::init<std::vector<std::string> const&>(), py::arg("img_base_list"))
        .def("getImagePath", &TiffImageSource::getImagePath, py::arg("cam_id"), py::arg("frame"));

    // images handed over from the GUI
    py::class_<MemoryImageSource, ImageSource>(m, "MemoryImageSource")
        .def(py::init<int>(), py::arg("n_cam"))
        .def("addImage", &MemoryImageSource::addImage,
             py::arg("cam_id"), py::arg("frame"), py::arg("img"));
}
