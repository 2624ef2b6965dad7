//
//  Matrix.h
//
//  header file of class Matrix, points, lines and images
//

#ifndef MATRIX_H
#define MATRIX_H

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "PTVCommons.h"

template <class T> class Matrix {
  int _dim_row = 0;
  int _dim_col = 0;
  int _n = 0;        // tot number of elem
  int _is_space = 0; // 0 for nothing installed; 1 for already claim space
  int mapID(int id_x, int id_y) const; // id_x*_dim_col + id_y
  T *_mtx = nullptr;

  // Create/Clear space
  void clear();
  void create(int dim_row, int dim_col);

public:
  // Constructor
  Matrix() {};
  Matrix(Matrix<T> const &mtx); // deep copy
  Matrix(Matrix<T> &&mtx) noexcept;
  Matrix(int dim_row, int dim_col, T val);

  // dim_row, dim_col must be compatible with mtx
  Matrix(std::initializer_list<std::initializer_list<T>> mtx);

  // Destructor
  ~Matrix();

  // Get/Assign value
  T at(int r, int c) const;         // check index
  T &at(int r, int c);              // check index
  T operator()(int i, int j) const; // no check, fast
  T &operator()(int i, int j);      // no check, fast
  // Return _mtx[i], i = id_x*_dim_col + id_y
  T operator[](int vec_i) const;
  T &operator[](int vec_i);

  // Get matrix info
  int getDimRow() const;
  int getDimCol() const;
  void print(int precision = 3) const;
  const T *data() const;
  T *data();

  // Scalar operations
  double norm() const; // sqrt(sum( xi^2 )) for all i

  // Matrix calculation
  Matrix<T> &operator=(Matrix<T> const &mtx);
  Matrix<T> &operator=(Matrix<T> &&mtx) noexcept;
  bool operator==(Matrix<T> const &mtx) const;
  bool operator!=(Matrix<T> const &mtx) const;
  Matrix<T> operator+(Matrix<T> const &mtx) const;
  Matrix<T> &operator+=(Matrix<T> const &mtx);
  Matrix<T> operator-(Matrix<T> const &mtx) const;
  Matrix<T> &operator-=(Matrix<T> const &mtx);
  Matrix<T> operator*(Matrix<T> const &mtx) const;
  Matrix<T> operator*(T ratio) const;
  Matrix<T> &operator*=(T ratio);
  Matrix<T> operator/(T ratio) const;
  Matrix<T> &operator/=(T ratio);

  // Matrix manipulation
  Matrix<T> transpose() const;
};

class Pt3D : public Matrix<double> {
public:
  Pt3D() : Matrix<double>(3, 1, 0) {};
  Pt3D(double x, double y, double z) : Matrix<double>({{x}, {y}, {z}}) {};
  Pt3D(const Pt3D &pt) : Matrix<double>(pt) {};
  Pt3D(const Matrix<double> &mtx)
      : Matrix<double>({{mtx[0]}, {mtx[1]}, {mtx[2]}}) {};
  Pt3D &operator=(const Pt3D &pt) = default;
};

class Pt2D : public Matrix<double> {
public:
  Pt2D() : Matrix<double>(2, 1, 0) {};
  Pt2D(double x, double y) : Matrix<double>({{x}, {y}}) {};
  Pt2D(const Pt2D &pt) : Matrix<double>(pt) {};
  Pt2D(const Matrix<double> &mtx) : Matrix<double>({{mtx[0]}, {mtx[1]}}) {};
  Pt2D &operator=(const Pt2D &pt) = default;
};

// Structure to store line
struct Line3D {
  Pt3D pt;
  Pt3D unit_vector;
};

// Structure to store 3D plane
struct Plane3D {
  Pt3D pt;
  Pt3D norm_vector;
};

// Image: matrix with double type, grey values of an 8-bit camera image
// Image(row_id, col_id) = intensity
// row_id = img_y, col_id = img_x
class Image : public Matrix<double> {
public:
  Image() : Matrix<double>(1, 1, 0) {};
  Image(int dim_row, int dim_col, double val)
      : Matrix<double>(dim_row, dim_col, val) {};
  Image(std::initializer_list<std::initializer_list<double>> mtx)
      : Matrix<double>(mtx) {};
  Image(const Image &mtx) : Matrix<double>(mtx) {};
  Image(const Matrix<double> &mtx) : Matrix<double>(mtx) {};
  Image &operator=(const Image &mtx) = default;
};

#include "Matrix.hpp"

#endif
