#pragma once

#include <cstdint>
#include <cstring>

#include "geometry.hpp"


namespace glint {

//
// PCG pseudo random generator (https://github.com/imneme/pcg-c-basic)
//
// Never shared between threads: every worker (or every pixel sample) owns its instance.
//
struct Rng {
  uint64_t state, inc;
  Rng() : Rng(0x1234, 0x5678) {}
  Rng(uint64_t init_state, uint64_t init_seq) { seed(init_state, init_seq); }

  void seed(uint64_t init_state, uint64_t init_seq) {
    state = 0u;
    inc = (init_seq << 1u) | 1u;
    next();
    state += init_state;
    next();
  }

  uint32_t next() {
    uint64_t oldstate = state;
    state = oldstate * 6364136223846793005ULL + inc;
    uint32_t xorshifted = ((oldstate >> 18u) ^ oldstate) >> 27u;
    uint32_t rot = oldstate >> 59u;
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
  }

  float uniform() {
    uint32_t x = next();

    // Use lower 23 bits to make [0, 1) by
    //   2^{127 - 127} * 1.x[22..0] - 1.0
    uint32_t y = (127u << 23u) | (0x7fffffu & x);
    float f;
    std::memcpy(&f, &y, sizeof(f));
    return f - 1.0f;
  }

  fvec2 uniform2() {
    return fvec2{uniform(), uniform()};
  }

  // Uniform integer in [0, n)
  uint32_t uniformIndex(uint32_t n) {
    uint32_t i = static_cast<uint32_t>(uniform() * n);
    return i < n ? i : n - 1;
  }
};

// splitmix64 finalizer, used to decorrelate (seed, pixel, sample) tuples
inline uint64_t hashSeed(uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

inline uint64_t hashSeed(uint64_t a, uint64_t b) {
  return hashSeed(a ^ hashSeed(b));
}


//
// Various transformation
//

inline fvec3 map_Spherical_Cartesian(fvec3 rtp) {
  using std::cos, std::sin;
  return fvec3{
    rtp[0] * sin(rtp[1]) * cos(rtp[2]),
    rtp[0] * sin(rtp[1]) * sin(rtp[2]),
    rtp[0] * cos(rtp[1]),
  };
}

inline fvec2 map_Polar_Cartesian(fvec2 rp) {
  using std::cos, std::sin;
  return fvec2{
    rp[0] * cos(rp[1]),
    rp[0] * sin(rp[1]),
  };
}

// (Almost everywhere) constant Jacobian 2d-isotopy between square and disk by Shirly and Chiu
inline fvec2 map_Square_Disk_radius_phi(fvec2 u) {
  using glm::sign, glm::abs;

  // [0, 1]^2 -> [-1, 1]^2
  u = 2.0f * u - 1.0f;
  if (u[0] == 0 && u[1] == 0)
    return fvec2{0, 0};

  // Flip around to the 1/8 part of square { (x, y) | x in [0, 1], y in [0, x] }
  fvec2 sign_u = sign(u);
  fvec2 abs_u = abs(u);
  bool swap_xy = abs_u[0] < abs_u[1];
  fvec2 eighth_u = !swap_xy ? abs_u : fvec2{abs_u[1], abs_u[0]};

  float radius = eighth_u[0];
  float phi = kPi / 4.0f * eighth_u[1] / eighth_u[0]; // in [0, pi/4]

  // Flip back to the original part
  phi = !swap_xy ? phi : (kPi / 2.0f - phi);           // in [0, pi/2]
  phi = 0 <= sign_u[0] ? phi : (kPi - phi);            // in [0, pi]
  phi = 0 <= sign_u[1] ? phi : (2.0f * kPi - phi);     // in [0, 2pi]

  return fvec2{radius, phi};
}

inline fvec2 map_Square_Disk(fvec2 u) {
  return map_Polar_Cartesian(map_Square_Disk_radius_phi(u));
}


//
// Sampling routines
//

// Cosine weighted direction around +z
inline void sample_HemisphereCosine(fvec2 u, /*out*/ fvec3& p, float& pdf) {
  // Uniform on disk, then lift to hemisphere (Malley)
  fvec2 d = map_Square_Disk(u);
  float z = std::sqrt(fmaxf(0.0f, 1.0f - d[0] * d[0] - d[1] * d[1]));
  p = fvec3{d[0], d[1], z};
  pdf = z / kPi;
}

inline float pdf_HemisphereCosine(float cos_theta) {
  return cos_theta > 0 ? cos_theta / kPi : 0;
}

// Uniform direction on the unit sphere (pdf 1 / 4pi)
inline fvec3 sample_Sphere(fvec2 u) {
  float z = 1.0f - 2.0f * u[0];
  float r = std::sqrt(fmaxf(0.0f, 1.0f - z * z));
  float phi = 2.0f * kPi * u[1];
  return fvec3{r * std::cos(phi), r * std::sin(phi), z};
}

// Uniform point inside the unit ball
inline fvec3 sample_Ball(Rng& rng) {
  fvec3 dir = sample_Sphere(rng.uniform2());
  float radius = std::cbrt(rng.uniform());
  return radius * dir;
}

// Uniform direction within the cone around +z with half angle acos(cos_theta_max)
inline fvec3 sample_Cone(fvec2 u, float cos_theta_max) {
  float cos_theta = 1.0f + u[0] * (cos_theta_max - 1.0f);
  float sin_theta = std::sqrt(fmaxf(0.0f, 1.0f - cos_theta * cos_theta));
  float phi = 2.0f * kPi * u[1];
  return fvec3{sin_theta * std::cos(phi), sin_theta * std::sin(phi), cos_theta};
}

// Uniform barycentric coordinate (b1, b2) on a triangle
inline fvec2 sample_Triangle(fvec2 u) {
  float su = std::sqrt(u[0]);
  return fvec2{1.0f - su, u[1] * su};
}


} // namespace glint
