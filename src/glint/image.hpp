#pragma once

#include <cstdint>
#include <cmath>
#include <vector>
#include <ostream>
#include <type_traits>

#include "format.hpp"
#include "geometry.hpp"


namespace glint {

using std::vector;

//
// 2 dim contiguous buffer (row major, row 0 is the top of the image)
//
template<typename T>
struct vector2 {
  static_assert(!std::is_same_v<T, bool>, "`bool` is not supported. Use `char` instead.");

  vector<T> v;
  size_t num_rows = 0, num_cols = 0;

  void resize(size_t in_num_rows, size_t in_num_cols) {
    num_rows = in_num_rows;
    num_cols = in_num_cols;
    v.resize(num_rows * num_cols);
  }

  void assign(size_t in_num_rows, size_t in_num_cols, const T& value) {
    num_rows = in_num_rows;
    num_cols = in_num_cols;
    v.assign(num_rows * num_cols, value);
  }

  T& operator()(size_t row, size_t col) {
    return v.data()[num_cols * row + col];
  }

  const T& operator()(size_t row, size_t col) const {
    return v.data()[num_cols * row + col];
  }

  bool empty() const { return v.empty(); }
};

using Image = vector2<fvec3>;


//
// Linear radiance -> display bytes (gamma 2, clamped to [0, 0.999])
//
inline u8vec3 toRgb8(fvec3 linear) {
  u8vec3 result;
  for (int i = 0; i < 3; i++) {
    float c = std::isfinite(linear[i]) ? fmaxf(linear[i], 0.0f) : 0.0f;
    c = fminf(std::sqrt(c), 0.999f);
    result[i] = static_cast<uint8_t>(256.0f * c);
  }
  return result;
}

inline vector<u8vec3> toRgb8(const vector<fvec3>& pixels) {
  vector<u8vec3> result;
  result.reserve(pixels.size());
  for (auto& p : pixels) {
    result.push_back(toRgb8(p));
  }
  return result;
}

// [0, 255] bytes -> [0, 1] color
inline fvec3 fromRgb8(u8vec3 rgb) {
  return fvec3{rgb} / 255.0f;
}


//
// .ppm writer
//
struct PPMWriter {
  int w, h;
  const u8vec3* p_data;

  friend std::ostream& operator<<(std::ostream& os, const PPMWriter& self) {
    auto p_data = self.p_data;
    os << format("P3\n%d %d\n255\n", self.w, self.h);
    for (auto y = 0; y < self.h; y++) {
      for (auto x = 0; x < self.w; x++) {
        os << format("%d %d %d\n", (int)(*p_data)[0], (int)(*p_data)[1], (int)(*p_data)[2]);
        p_data++;
      }
    }
    return os;
  }
};


} // namespace glint
