#pragma once

#include <cmath>
#include <cstdint>
#include <array>
#include <limits>
#include <ostream>
#include <utility>

#include <glm/glm.hpp>

#include "common.hpp"
#include "format.hpp"


namespace glint {

//
// Geometry utilities (vec, Ray, bbox, frames)
//

using glm::fvec2, glm::fvec3, glm::fvec4, glm::dvec3,
      glm::uvec3, glm::u8vec3,
      glm::fmat3, glm::fmat4;

constexpr float kPi = 3.14159265358979323846f;
constexpr float kInfinity = std::numeric_limits<float>::infinity();

// Offset for spawning secondary rays
constexpr float kRayTmin = 1e-4f;


inline uint8_t opArgMax(const fvec3& v) {
  uint8_t ret = 0;
  for (uint8_t i = 1; i < 3; i++) {
    ret = v[i] < v[ret] ? ret : i;
  }
  return ret;
}

inline float opMinReduce(const fvec3& v) {
  return fminf(fminf(v[0], v[1]), v[2]);
}

inline float opMaxReduce(const fvec3& v) {
  return fmaxf(fmaxf(v[0], v[1]), v[2]);
}

inline bool isFinite(const fvec3& v) {
  return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

inline bool nearZero(const fvec3& v, float eps = 1e-8f) {
  return std::abs(v[0]) < eps && std::abs(v[1]) < eps && std::abs(v[2]) < eps;
}


struct Ray {
  fvec3 o = fvec3{0};
  fvec3 d = fvec3{0, 0, -1};
  uint32_t depth = 0;
  uint32_t seed = 0;  // drawn by the integrator, decides stochastic (medium) hits

  fvec3 at(float t) const {
    return o + t * d;
  }
};


struct bbox3 {
  fvec3 bmin, bmax;

  // Sentinel containing nothing. Union with it is the identity.
  static bbox3 empty() {
    return bbox3{fvec3{kInfinity}, fvec3{-kInfinity}};
  }

  static bbox3 fromPoints(const fvec3& a, const fvec3& b) {
    return bbox3{glm::min(a, b), glm::max(a, b)};
  }

  static bbox3 opUnion(const bbox3& b1, const bbox3& b2) {
    return bbox3{
        glm::min(b1.bmin, b2.bmin),
        glm::max(b1.bmax, b2.bmax),};
  }

  static bbox3 opUnion(const bbox3& b, const fvec3& p) {
    return bbox3{glm::min(b.bmin, p), glm::max(b.bmax, p)};
  }

  bool isEmpty() const {
    return bmin[0] > bmax[0] || bmin[1] > bmax[1] || bmin[2] > bmax[2];
  }

  bool isFinite() const {
    return glint::isFinite(bmin) && glint::isFinite(bmax);
  }

  fvec3 center() const {
    return (bmin + bmax) / 2.0f;
  }

  fvec3 extent() const {
    return bmax - bmin;
  }

  float surfaceArea() const {
    if (isEmpty()) return 0;
    fvec3 e = extent();
    return 2.0f * (e[0] * e[1] + e[1] * e[2] + e[2] * e[0]);
  }

  bool contains(const bbox3& other) const {
    if (other.isEmpty()) return true;
    return
      opMinReduce(other.bmin - this->bmin) >= 0 &&
      opMinReduce(this->bmax - other.bmax) >= 0;
  }

  bool contains(const fvec3& p) const {
    return contains(bbox3{p, p});
  }

  // Widen every axis so flat primitives keep some volume and grazing rays survive rounding
  bbox3 padded(float delta = 1e-4f) const {
    bbox3 result = *this;
    for (int i = 0; i < 3; i++) {
      result.bmin[i] -= delta / 2;
      result.bmax[i] += delta / 2;
    }
    return result;
  }

  friend bool operator==(const bbox3& a, const bbox3& b) {
    return a.bmin == b.bmin && a.bmax == b.bmax;
  }

  friend std::ostream& operator<<(std::ostream& os, const bbox3& bbox) {
    os << glint::format("[%s, %s]", bbox.bmin, bbox.bmax);
    return os;
  }

  // Slab test restricted to [ray_tmin, ray_tmax]. `hit_t` receives the entry distance.
  // Zero direction components are resolved per axis without forming 1/0, so a ray running
  // exactly along a slab plane is neither rejected nor polluted by 0 * inf = NaN.
  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ float& hit_t) const {
    float exit_t;
    return rayInterval(ray, ray_tmin, ray_tmax, /*out*/ hit_t, exit_t);
  }

  // Same slab test, also reporting where the ray leaves the box
  bool rayInterval(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ float& enter_t, float& exit_t) const {
    // Inverted infinite bounds would otherwise pass as an unbounded slab
    if (isEmpty())
      return false;

    float t_in  = ray_tmin;
    float t_out = ray_tmax;
    for (int i = 0; i < 3; i++) {
      float o = ray.o[i];
      float d = ray.d[i];
      if (d == 0) {
        // Parallel to both planes: either always inside the slab or never
        if (o < bmin[i] || o > bmax[i])
          return false;
        continue;
      }
      float t0 = (bmin[i] - o) / d;  // "negative" plane
      float t1 = (bmax[i] - o) / d;  // "positive" plane
      if (t0 > t1) std::swap(t0, t1);
      t_in  = t0 > t_in  ? t0 : t_in;
      t_out = t1 < t_out ? t1 : t_out;
      if (t_in > t_out)
        return false;
    }
    enter_t = t_in;
    exit_t = t_out;
    return true;
  }
};


// [0, W] x [0, H]  -->  [-X/2, X/2] x [-tan(yfov/2), tan(yfov/2)]
//   where X defined so that aspect ratio is preserved
inline fmat3 xformInvView(float yfov, float w, float h) {
  float half_y = std::tan(yfov / 2.0f);
  float half_x = (w / h) * half_y;
  float a = -half_x;
  float b = -half_y;
  float s = 2 * half_y / h;
  return glm::fmat3{
      s, 0, 0,
      0, s, 0,
      a, b, 1,};
}

inline fmat4 xformLookAt(fvec3 eye_loc, fvec3 lookat_loc, fvec3 up_vec) {
  // assert |up| = 1
  using glm::normalize, glm::cross;
  fvec3 z = normalize(eye_loc - lookat_loc);
  fvec3 x = normalize(- cross(z, up_vec));
  fvec3 y = cross(z, x);
  fvec3 t = eye_loc;
  return glm::fmat4{
      x[0], x[1], x[2], 0.0,
      y[0], y[1], y[2], 0.0,
      z[0], z[1], z[2], 0.0,
      t[0], t[1], t[2], 1.0,};
}

// Orthonormal frame whose third column is `z`
inline fmat3 xformZframe(fvec3 z) {
  // assert |z| = 1
  using glm::normalize, glm::cross, glm::abs;
  fvec3 x = cross(z, (abs(z.x) < 0.9f) ? fvec3(1.0, 0.0, 0.0) : fvec3(0.0, 1.0, 0.0));
  x = normalize(x);
  fvec3 y = cross(z, x);
  return fmat3(x, y, z);
}

inline fvec3 reflect(const fvec3& v, const fvec3& n) {
  return v - 2.0f * glm::dot(v, n) * n;
}

// `v` unit and against `n`; `eta` is the relative index (incident / transmitted)
inline fvec3 refract(const fvec3& v, const fvec3& n, float eta) {
  float cos_theta = fminf(glm::dot(-v, n), 1.0f);
  fvec3 r_perp = eta * (v + cos_theta * n);
  fvec3 r_parallel = -std::sqrt(std::abs(1.0f - glm::dot(r_perp, r_perp))) * n;
  return r_perp + r_parallel;
}

// Spawn point for a ray leaving a surface toward `dir`, offset along the geometric normal
inline fvec3 offsetOrigin(const fvec3& p, const fvec3& n_geo, const fvec3& dir) {
  constexpr float kOffset = 1e-4f;
  return glm::dot(dir, n_geo) > 0 ? p + kOffset * n_geo : p - kOffset * n_geo;
}


} // namespace glint


// Define "operator<<(..., fvec3)" within glm namespace so that "glint::toScalarOrString" in format.hpp can find it.
// (cf. http://clang.llvm.org/compatibility.html#dep_lookup)
namespace glm {

inline std::ostream& operator<<(std::ostream& os, const glm::fvec2& v) {
  os << glint::format("[%.3f, %.3f]", v[0], v[1]);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, const glm::fvec3& v) {
  os << glint::format("[%.3f, %.3f, %.3f]", v[0], v[1], v[2]);
  return os;
}

} // namespace glm
