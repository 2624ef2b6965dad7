// pyOpenPTV.cpp
#include <pybind11/pybind11.h>
#include <pybind11/iostream.h>
#include <string>
#include <memory>
#include <iostream>

#include "error.hpp"

namespace py = pybind11;

void bind_Matrix(py::module_&);
void bind_ImageIO(py::module_&);
void bind_Camera(py::module_&);
void bind_Config(py::module_&);
void bind_TargetInfo(py::module_&);
void bind_Correspondence(py::module_&);
void bind_Sequence(py::module_&);
void bind_Tracker(py::module_&);

int run_openptv(const std::string& config_path, const std::string& mode);

struct PythonStreamRedirector {
    std::unique_ptr<py::scoped_ostream_redirect> out;
    std::unique_ptr<py::scoped_estream_redirect> err;

    PythonStreamRedirector() {
        py::object sys = py::module_::import("sys");
        out = std::make_unique<py::scoped_ostream_redirect>(std::cout, sys.attr("stdout"));
        err = std::make_unique<py::scoped_estream_redirect>(std::cerr, sys.attr("stderr"));
    }
    PythonStreamRedirector(py::object py_stdout, py::object py_stderr) {
        out = std::make_unique<py::scoped_ostream_redirect>(std::cout, py_stdout);
        err = std::make_unique<py::scoped_estream_redirect>(std::cerr, py_stderr);
    }
    void close() { err.reset(); out.reset(); }
};

void bind_PythonStreamRedirector(py::module_& m) {
    py::class_<PythonStreamRedirector>(m, "PythonStreamRedirector")
        .def(py::init<>())
        .def(py::init<py::object, py::object>(), py::arg("stdout"), py::arg("stderr"))
        .def("close", &PythonStreamRedirector::close)
        .def("__enter__", [](PythonStreamRedirector &self) { return &self; },
             py::return_value_policy::reference)
        .def("__exit__", [](PythonStreamRedirector &self, py::object, py::object, py::object) {
            self.close(); return false;
        });
}

PYBIND11_MODULE(pyopenptv, m) {
    m.doc() = "OpenPTV Python bindings";

    // FatalError -> pyopenptv.FatalError, message is Error::toString()
    py::register_exception<FatalError>(m, "FatalError");

    bind_PythonStreamRedirector(m);

    bind_Config(m);
    bind_Matrix(m);
    bind_ImageIO(m);
    bind_Camera(m);
    bind_TargetInfo(m);
    bind_Correspondence(m);
    bind_Sequence(m);
    bind_Tracker(m);

    m.def("run",
          [](const std::string& config_file_path, const std::string& mode) {
              py::object sys = py::module_::import("sys");
              py::scoped_ostream_redirect  out(std::cout, sys.attr("stdout"));
              py::scoped_estream_redirect  err(std::cerr, sys.attr("stderr"));
              py::gil_scoped_release nogil;
              int rc = run_openptv(config_file_path, mode);
              if (rc != 0)
                  throw py::value_error("OpenPTV failed with return code = " + std::to_string(rc));
          },
          py::arg("config_file_path"), py::arg("mode") = "all");
}
