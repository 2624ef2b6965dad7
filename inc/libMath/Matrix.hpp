//
//  Matrix.hpp
//
//  template implementation of class Matrix
//

#ifndef MATRIX_HPP
#define MATRIX_HPP

// Create/Clear space
template <class T> void Matrix<T>::clear() {
  if (_is_space) {
    delete[] _mtx;
    _mtx = nullptr;
    _is_space = 0;
  }
  _dim_row = 0;
  _dim_col = 0;
  _n = 0;
}

template <class T> void Matrix<T>::create(int dim_row, int dim_col) {
  clear();
  _dim_row = dim_row;
  _dim_col = dim_col;
  _n = dim_row * dim_col;
  if (_n > 0) {
    _mtx = new T[_n];
    _is_space = 1;
  }
}

template <class T> int Matrix<T>::mapID(int id_x, int id_y) const {
  return id_x * _dim_col + id_y;
}

// Constructor
template <class T> Matrix<T>::Matrix(Matrix<T> const &mtx) {
  create(mtx._dim_row, mtx._dim_col);
  std::copy(mtx._mtx, mtx._mtx + _n, _mtx);
}

template <class T> Matrix<T>::Matrix(Matrix<T> &&mtx) noexcept
    : _dim_row(mtx._dim_row), _dim_col(mtx._dim_col), _n(mtx._n),
      _is_space(mtx._is_space), _mtx(mtx._mtx) {
  mtx._mtx = nullptr;
  mtx._is_space = 0;
  mtx._dim_row = 0;
  mtx._dim_col = 0;
  mtx._n = 0;
}

template <class T> Matrix<T>::Matrix(int dim_row, int dim_col, T val) {
  if (dim_row < 0 || dim_col < 0) {
    THROW_FATAL_CTX(ErrorCode::InvalidArgument, "Matrix: negative dimension",
                    std::to_string(dim_row) + "x" + std::to_string(dim_col));
  }
  create(dim_row, dim_col);
  std::fill(_mtx, _mtx + _n, val);
}

template <class T>
Matrix<T>::Matrix(std::initializer_list<std::initializer_list<T>> mtx) {
  int dim_row = static_cast<int>(mtx.size());
  int dim_col = dim_row > 0 ? static_cast<int>(mtx.begin()->size()) : 0;
  create(dim_row, dim_col);

  int i = 0;
  for (auto const &row : mtx) {
    if (static_cast<int>(row.size()) != dim_col) {
      THROW_FATAL(ErrorCode::InvalidArgument,
                  "Matrix: rows of initializer list have different sizes");
    }
    int j = 0;
    for (auto const &val : row) {
      _mtx[mapID(i, j)] = val;
      j++;
    }
    i++;
  }
}

template <class T> Matrix<T>::~Matrix() { clear(); }

// Get/Assign value
template <class T> T Matrix<T>::at(int r, int c) const {
  if (r < 0 || r >= _dim_row || c < 0 || c >= _dim_col) {
    THROW_FATAL_CTX(ErrorCode::OutOfRange, "Matrix::at: index out of range",
                    "(" + std::to_string(r) + "," + std::to_string(c) + ")");
  }
  return _mtx[mapID(r, c)];
}

template <class T> T &Matrix<T>::at(int r, int c) {
  if (r < 0 || r >= _dim_row || c < 0 || c >= _dim_col) {
    THROW_FATAL_CTX(ErrorCode::OutOfRange, "Matrix::at: index out of range",
                    "(" + std::to_string(r) + "," + std::to_string(c) + ")");
  }
  return _mtx[mapID(r, c)];
}

template <class T> T Matrix<T>::operator()(int i, int j) const {
  return _mtx[mapID(i, j)];
}

template <class T> T &Matrix<T>::operator()(int i, int j) {
  return _mtx[mapID(i, j)];
}

template <class T> T Matrix<T>::operator[](int vec_i) const {
  return _mtx[vec_i];
}

template <class T> T &Matrix<T>::operator[](int vec_i) { return _mtx[vec_i]; }

// Get matrix info
template <class T> int Matrix<T>::getDimRow() const { return _dim_row; }

template <class T> int Matrix<T>::getDimCol() const { return _dim_col; }

template <class T> void Matrix<T>::print(int precision) const {
  std::cout << std::setprecision(precision) << std::fixed;
  for (int i = 0; i < _dim_row; i++) {
    for (int j = 0; j < _dim_col; j++) {
      std::cout << _mtx[mapID(i, j)] << (j + 1 < _dim_col ? "," : "");
    }
    std::cout << "\n";
  }
  std::cout << std::defaultfloat;
}

template <class T> const T *Matrix<T>::data() const { return _mtx; }

template <class T> T *Matrix<T>::data() { return _mtx; }

// Scalar operations
template <class T> double Matrix<T>::norm() const {
  double res = 0;
  for (int i = 0; i < _n; i++) {
    res += static_cast<double>(_mtx[i]) * static_cast<double>(_mtx[i]);
  }
  return std::sqrt(res);
}

// Matrix calculation
template <class T> Matrix<T> &Matrix<T>::operator=(Matrix<T> const &mtx) {
  if (this != &mtx) {
    if (_n != mtx._n) {
      create(mtx._dim_row, mtx._dim_col);
    } else {
      _dim_row = mtx._dim_row;
      _dim_col = mtx._dim_col;
    }
    std::copy(mtx._mtx, mtx._mtx + _n, _mtx);
  }
  return *this;
}

template <class T> Matrix<T> &Matrix<T>::operator=(Matrix<T> &&mtx) noexcept {
  if (this != &mtx) {
    clear();
    _dim_row = mtx._dim_row;
    _dim_col = mtx._dim_col;
    _n = mtx._n;
    _is_space = mtx._is_space;
    _mtx = mtx._mtx;
    mtx._mtx = nullptr;
    mtx._is_space = 0;
    mtx._dim_row = 0;
    mtx._dim_col = 0;
    mtx._n = 0;
  }
  return *this;
}

template <class T> bool Matrix<T>::operator==(Matrix<T> const &mtx) const {
  if (_dim_row != mtx._dim_row || _dim_col != mtx._dim_col) {
    return false;
  }
  for (int i = 0; i < _n; i++) {
    if (std::fabs(double(_mtx[i] - mtx._mtx[i])) > SMALLNUMBER) {
      return false;
    }
  }
  return true;
}

template <class T> bool Matrix<T>::operator!=(Matrix<T> const &mtx) const {
  return !(*this == mtx);
}

template <class T>
Matrix<T> Matrix<T>::operator+(Matrix<T> const &mtx) const {
  Matrix<T> res(*this);
  res += mtx;
  return res;
}

template <class T> Matrix<T> &Matrix<T>::operator+=(Matrix<T> const &mtx) {
  REQUIRE(_dim_row == mtx._dim_row && _dim_col == mtx._dim_col,
          ErrorCode::InvalidArgument, "Matrix::operator+=: size mismatch");
  for (int i = 0; i < _n; i++) {
    _mtx[i] += mtx._mtx[i];
  }
  return *this;
}

template <class T>
Matrix<T> Matrix<T>::operator-(Matrix<T> const &mtx) const {
  Matrix<T> res(*this);
  res -= mtx;
  return res;
}

template <class T> Matrix<T> &Matrix<T>::operator-=(Matrix<T> const &mtx) {
  REQUIRE(_dim_row == mtx._dim_row && _dim_col == mtx._dim_col,
          ErrorCode::InvalidArgument, "Matrix::operator-=: size mismatch");
  for (int i = 0; i < _n; i++) {
    _mtx[i] -= mtx._mtx[i];
  }
  return *this;
}

template <class T>
Matrix<T> Matrix<T>::operator*(Matrix<T> const &mtx) const {
  REQUIRE(_dim_col == mtx._dim_row, ErrorCode::InvalidArgument,
          "Matrix::operator*: size mismatch");
  Matrix<T> res(_dim_row, mtx._dim_col, T(0));
  for (int i = 0; i < _dim_row; i++) {
    for (int j = 0; j < mtx._dim_col; j++) {
      T sum = 0;
      for (int k = 0; k < _dim_col; k++) {
        sum += _mtx[mapID(i, k)] * mtx._mtx[mtx.mapID(k, j)];
      }
      res(i, j) = sum;
    }
  }
  return res;
}

template <class T> Matrix<T> Matrix<T>::operator*(T ratio) const {
  Matrix<T> res(*this);
  res *= ratio;
  return res;
}

template <class T> Matrix<T> &Matrix<T>::operator*=(T ratio) {
  for (int i = 0; i < _n; i++) {
    _mtx[i] *= ratio;
  }
  return *this;
}

template <class T> Matrix<T> Matrix<T>::operator/(T ratio) const {
  Matrix<T> res(*this);
  res /= ratio;
  return res;
}

template <class T> Matrix<T> &Matrix<T>::operator/=(T ratio) {
  REQUIRE(ratio != T(0), ErrorCode::InvalidArgument,
          "Matrix::operator/=: divided by zero");
  for (int i = 0; i < _n; i++) {
    _mtx[i] /= ratio;
  }
  return *this;
}

// Matrix manipulation
template <class T> Matrix<T> Matrix<T>::transpose() const {
  Matrix<T> res(_dim_col, _dim_row, T(0));
  for (int i = 0; i < _dim_row; i++) {
    for (int j = 0; j < _dim_col; j++) {
      res(j, i) = _mtx[mapID(i, j)];
    }
  }
  return res;
}

#endif
