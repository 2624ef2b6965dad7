#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "Matrix.h"

namespace py = pybind11;

template <typename T>
void bind_MatrixT(py::module_ &m, const char* py_name) {
    using Mat = Matrix<T>;
    py::class_<Mat> cls(m, py_name);

    cls.def(py::init<>())
       .def(py::init<int,int,T>(), py::arg("rows"), py::arg("cols"), py::arg("val"))
       .def(py::init<const Mat&>(), py::arg("other"));

    cls.def("getDimRow", &Mat::getDimRow)
       .def("getDimCol", &Mat::getDimCol)
       .def("print",     &Mat::print, py::arg("precision")=3)
       .def("norm",      &Mat::norm)
       .def("transpose", &Mat::transpose);

    // A[i,j] / A[i], checked
    cls.def("__getitem__", [](const Mat& self, std::pair<int,int> ij){ return self.at(ij.first, ij.second); })
       .def("__setitem__", [](Mat& self, std::pair<int,int> ij, const T& v){ self.at(ij.first, ij.second) = v; })
       .def("__getitem__", [](const Mat& self, int k){
            if (k < 0 || k >= self.getDimRow() * self.getDimCol()) throw py::index_error();
            return self[k];
        })
       .def("__setitem__", [](Mat& self, int k, const T& v){
            if (k < 0 || k >= self.getDimRow() * self.getDimCol()) throw py::index_error();
            self[k] = v;
        });

    cls.def("__eq__", &Mat::operator==, py::is_operator())
       .def("__ne__", &Mat::operator!=, py::is_operator());

    cls.def("__add__", [](const Mat& a, const Mat& b){ return a + b; }, py::is_operator())
       .def("__sub__", [](const Mat& a, const Mat& b){ return a - b; }, py::is_operator())
       .def("__matmul__", [](const Mat& a, const Mat& b){ return a * b; }, py::is_operator())
       .def("__mul__", [](const Mat& a, const T& s){ return a * s; }, py::is_operator())
       .def("__truediv__", [](const Mat& a, const T& s){ return a / s; }, py::is_operator());

    cls.def("__repr__", [py_name](const Mat& mtx){
        return std::string("<") + py_name + " " +
               std::to_string(mtx.getDimRow()) + "x" +
               std::to_string(mtx.getDimCol()) + ">";
    });

    cls.def("to_list", [](const Mat& self){
        std::vector<std::vector<T>> out(self.getDimRow(), std::vector<T>(self.getDimCol()));
        for (int i = 0; i < self.getDimRow(); ++i)
            for (int j = 0; j < self.getDimCol(); ++j)
                out[i][j] = self(i,j);
        return out;
    });
}

void bind_Matrix(py::module_& m) {
    bind_MatrixT<double>(m, "MatrixDouble");

    py::class_<Pt2D, Matrix<double>>(m, "Pt2D")
        .def(py::init<>())
        .def(py::init<double,double>())
        .def(py::init<const Pt2D&>())
        .def(py::init<const Matrix<double>&>())
        .def("__repr__", [](const Pt2D& p){
            return "<Pt2D ("+std::to_string(p[0])+","+std::to_string(p[1])+")>";
        });

    py::class_<Pt3D, Matrix<double>>(m, "Pt3D")
        .def(py::init<>())
        .def(py::init<double,double,double>())
        .def(py::init<const Pt3D&>())
        .def(py::init<const Matrix<double>&>())
        .def("__repr__", [](const Pt3D& p){
            return "<Pt3D ("+std::to_string(p[0])+","+std::to_string(p[1])+","+std::to_string(p[2])+")>";
        });

    py::class_<Line3D>(m, "Line3D")
        .def(py::init<>())
        .def_readwrite("pt",          &Line3D::pt)
        .def_readwrite("unit_vector", &Line3D::unit_vector);

    py::class_<Image, Matrix<double>>(m, "Image")
        .def(py::init<>())
        .def(py::init<int,int,double>(), py::arg("rows"), py::arg("cols"), py::arg("val")=0.0)
        .def(py::init<const Image&>())
        .def(py::init<const Matrix<double>&>())
        .def("__repr__", [](const Image& img){
            return "<Image " + std::to_string(img.getDimRow()) + "x" + std::to_string(img.getDimCol()) + ">";
        });
}
