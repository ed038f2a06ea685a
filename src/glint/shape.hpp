#pragma once

#include <cmath>
#include <cstring>
#include <type_traits>
#include <variant>
#include <vector>

#include "geometry.hpp"
#include "sampling.hpp"


namespace glint {

//
// Surface interaction
//
struct HitRecord {
  fvec3 p{0};
  fvec3 n_geo{0, 0, 1};  // geometric normal, facing against the incoming ray
  fvec3 n{0, 0, 1};      // shading normal (possibly bump perturbed), same hemisphere convention
  fvec2 uv{0};
  float t = kInfinity;
  bool front_face = true;
  uint32_t material = 0;
  uint32_t primitive = 0;

  void setFaceNormal(const Ray& ray, const fvec3& outward) {
    front_face = glm::dot(ray.d, outward) < 0;
    n_geo = front_face ? outward : -outward;
    n = n_geo;
  }
};

// Point sampled on an emitting surface as seen from a reference point
struct SurfaceSample {
  fvec3 p{0};
  fvec3 n{0, 0, 1};  // outward normal at `p`
  fvec2 uv{0};
  float pdf = 0;     // solid angle measure w.r.t. the reference point
};


//
// Shapes
//

struct Sphere {
  fvec3 center{0};
  float radius = 1;
  uint32_t material = 0;

  bbox3 bbox() const {
    return bbox3{center - fvec3{radius}, center + fvec3{radius}};
  }

  fvec3 centroid() const { return center; }

  float area() const { return 4.0f * kPi * radius * radius; }

  // Longitude/latitude in [0, 1]^2 for a point on the unit sphere
  static fvec2 uvOf(const fvec3& q) {
    float theta = std::acos(glm::clamp(-q[1], -1.0f, 1.0f));
    float phi = std::atan2(-q[2], q[0]) + kPi;
    return fvec2{phi / (2.0f * kPi), theta / kPi};
  }

  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    fvec3 oc = ray.o - center;
    float a = glm::dot(ray.d, ray.d);
    float half_b = glm::dot(oc, ray.d);
    float c = glm::dot(oc, oc) - radius * radius;
    float discriminant = half_b * half_b - a * c;
    if (discriminant < 0 || a == 0)
      return false;

    float sqrt_d = std::sqrt(discriminant);
    float t = (-half_b - sqrt_d) / a;
    if (!(ray_tmin <= t && t <= ray_tmax)) {
      t = (-half_b + sqrt_d) / a;
      if (!(ray_tmin <= t && t <= ray_tmax))
        return false;
    }

    hit.t = t;
    hit.p = ray.at(t);
    fvec3 outward = (hit.p - center) / radius;
    hit.setFaceNormal(ray, outward);
    hit.uv = uvOf(outward);
    hit.material = material;
    return true;
  }

  bool sampleToward(const fvec3& ref, fvec2 u, /*out*/ SurfaceSample& s) const {
    fvec3 to_center = center - ref;
    float dist2 = glm::dot(to_center, to_center);
    if (dist2 <= radius * radius) {
      // Reference inside: uniform on the surface, converted to solid angle
      fvec3 dir = sample_Sphere(u);
      s.p = center + radius * dir;
      s.n = dir;
      s.uv = uvOf(dir);
      fvec3 wi = s.p - ref;
      float d2 = glm::dot(wi, wi);
      float cos_l = std::abs(glm::dot(glm::normalize(wi), s.n));
      if (d2 == 0 || cos_l == 0)
        return false;
      s.pdf = d2 / (cos_l * area());
      return true;
    }

    // Reference outside: uniform within the subtended cone
    float dist = std::sqrt(dist2);
    float sin2_max = radius * radius / dist2;
    float cos_max = std::sqrt(fmaxf(0.0f, 1.0f - sin2_max));
    fmat3 frame = xformZframe(to_center / dist);
    fvec3 wi = frame * sample_Cone(u, cos_max);

    // Closest intersection along wi, tangent point when grazing
    float b = glm::dot(wi, to_center);
    float disc = fmaxf(0.0f, b * b - (dist2 - radius * radius));
    float t = b - std::sqrt(disc);
    s.p = ref + t * wi;
    s.n = glm::normalize(s.p - center);
    s.uv = uvOf(s.n);
    float solid_angle = 2.0f * kPi * (1.0f - cos_max);
    if (!(solid_angle > 0))
      return false;
    s.pdf = 1.0f / solid_angle;
    return true;
  }
};


struct Triangle {
  fvec3 vs[3];
  uint32_t material = 0;

  bbox3 bbox() const {
    bbox3 result = bbox3::fromPoints(vs[0], vs[1]);
    return bbox3::opUnion(result, vs[2]);
  }

  fvec3 centroid() const {
    return (vs[0] + vs[1] + vs[2]) / 3.0f;
  }

  fvec3 cross() const {
    return glm::cross(vs[1] - vs[0], vs[2] - vs[0]);
  }

  float area() const { return glm::length(cross()) / 2.0f; }

  bool isDegenerate() const {
    return !(area() > 1e-12f);
  }

  // Moller-Trumbore. `uv` receives the barycentric (b1, b2).
  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    constexpr float kEpsilon = 1e-9f;
    fvec3 e1 = vs[1] - vs[0];
    fvec3 e2 = vs[2] - vs[0];
    fvec3 pvec = glm::cross(ray.d, e2);
    float det = glm::dot(e1, pvec);
    if (std::abs(det) < kEpsilon)
      return false;

    float inv_det = 1.0f / det;
    fvec3 tvec = ray.o - vs[0];
    float b1 = glm::dot(tvec, pvec) * inv_det;
    if (b1 < 0 || b1 > 1)
      return false;

    fvec3 qvec = glm::cross(tvec, e1);
    float b2 = glm::dot(ray.d, qvec) * inv_det;
    if (b2 < 0 || b1 + b2 > 1)
      return false;

    float t = glm::dot(e2, qvec) * inv_det;
    if (!(ray_tmin <= t && t <= ray_tmax))
      return false;

    hit.t = t;
    hit.p = ray.at(t);
    hit.setFaceNormal(ray, glm::normalize(glm::cross(e1, e2)));
    hit.uv = fvec2{b1, b2};
    hit.material = material;
    return true;
  }

  bool sampleToward(const fvec3& ref, fvec2 u, /*out*/ SurfaceSample& s) const {
    fvec2 b = sample_Triangle(u);
    s.p = (1.0f - b[0] - b[1]) * vs[0] + b[0] * vs[1] + b[1] * vs[2];
    s.n = glm::normalize(cross());
    s.uv = b;
    fvec3 wi = s.p - ref;
    float d2 = glm::dot(wi, wi);
    float cos_l = std::abs(glm::dot(wi, s.n)) / std::sqrt(d2);
    if (!(d2 > 0) || !(cos_l > 0))
      return false;
    s.pdf = d2 / (cos_l * area());
    return true;
  }
};


// Parallelogram spanned by `u` and `v` from corner `q`
struct Quad {
  fvec3 q{0};
  fvec3 u{1, 0, 0};
  fvec3 v{0, 1, 0};
  uint32_t material = 0;

  bbox3 bbox() const {
    bbox3 result = bbox3::fromPoints(q, q + u + v);
    result = bbox3::opUnion(result, q + u);
    return bbox3::opUnion(result, q + v);
  }

  fvec3 centroid() const { return q + (u + v) / 2.0f; }

  float area() const { return glm::length(glm::cross(u, v)); }

  bool isDegenerate() const {
    return !(area() > 1e-12f);
  }

  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    fvec3 n = glm::cross(u, v);
    float denom = glm::dot(n, ray.d);
    if (std::abs(denom) < 1e-9f)
      return false;

    float t = glm::dot(n, q - ray.o) / denom;
    if (!(ray_tmin <= t && t <= ray_tmax))
      return false;

    // Planar coordinates of the hit point
    fvec3 w = n / glm::dot(n, n);
    fvec3 planar = ray.at(t) - q;
    float alpha = glm::dot(w, glm::cross(planar, v));
    float beta = glm::dot(w, glm::cross(u, planar));
    if (alpha < 0 || alpha > 1 || beta < 0 || beta > 1)
      return false;

    hit.t = t;
    hit.p = ray.at(t);
    hit.setFaceNormal(ray, glm::normalize(n));
    hit.uv = fvec2{alpha, beta};
    hit.material = material;
    return true;
  }

  bool sampleToward(const fvec3& ref, fvec2 uv, /*out*/ SurfaceSample& s) const {
    s.p = q + uv[0] * u + uv[1] * v;
    s.n = glm::normalize(glm::cross(u, v));
    s.uv = uv;
    fvec3 wi = s.p - ref;
    float d2 = glm::dot(wi, wi);
    float cos_l = std::abs(glm::dot(wi, s.n)) / std::sqrt(d2);
    if (!(d2 > 0) || !(cos_l > 0))
      return false;
    s.pdf = d2 / (cos_l * area());
    return true;
  }
};


// Shapes which can be instanced
using Primitive = std::variant<Sphere, Triangle, Quad>;

inline bbox3 primitiveBbox(const Primitive& p) {
  return std::visit([](const auto& s) { return s.bbox(); }, p);
}

inline fvec3 primitiveCentroid(const Primitive& p) {
  return std::visit([](const auto& s) { return s.centroid(); }, p);
}

inline uint32_t primitiveMaterial(const Primitive& p) {
  return std::visit([](const auto& s) { return s.material; }, p);
}


//
// `object` rotated about +y, then moved by `offset`
//
struct Instance {
  Primitive object;
  fvec3 offset{0};
  float sin_theta = 0;
  float cos_theta = 1;

  static Instance create(const Primitive& object, const fvec3& offset, float angle_y_degrees) {
    float theta = angle_y_degrees * kPi / 180.0f;
    return Instance{object, offset, std::sin(theta), std::cos(theta)};
  }

  fvec3 toLocal(const fvec3& v) const {
    return fvec3{cos_theta * v[0] - sin_theta * v[2], v[1], sin_theta * v[0] + cos_theta * v[2]};
  }

  fvec3 toWorld(const fvec3& v) const {
    return fvec3{cos_theta * v[0] + sin_theta * v[2], v[1], -sin_theta * v[0] + cos_theta * v[2]};
  }

  bbox3 bbox() const {
    bbox3 local = primitiveBbox(object);
    bbox3 result = bbox3::empty();
    for (int i = 0; i < 8; i++) {
      fvec3 corner{
          (i & 1) ? local.bmax[0] : local.bmin[0],
          (i & 2) ? local.bmax[1] : local.bmin[1],
          (i & 4) ? local.bmax[2] : local.bmin[2]};
      result = bbox3::opUnion(result, toWorld(corner) + offset);
    }
    return result;
  }

  fvec3 centroid() const { return toWorld(primitiveCentroid(object)) + offset; }

  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    Ray local{toLocal(ray.o - offset), toLocal(ray.d), ray.depth, ray.seed};
    bool found = std::visit([&](const auto& s) { return s.rayIntersect(local, ray_tmin, ray_tmax, hit); }, object);
    if (!found)
      return false;

    // Rigid motion keeps t, orientation and front_face
    hit.p = toWorld(hit.p) + offset;
    hit.n_geo = toWorld(hit.n_geo);
    hit.n = toWorld(hit.n);
    return true;
  }

  bool sampleToward(const fvec3& ref, fvec2 u, /*out*/ SurfaceSample& s) const {
    fvec3 local_ref = toLocal(ref - offset);
    bool found = std::visit([&](const auto& shape) { return shape.sampleToward(local_ref, u, s); }, object);
    if (!found)
      return false;
    s.p = toWorld(s.p) + offset;
    s.n = toWorld(s.n);
    return true;
  }
};


// Uniform [0, 1) derived from the ray and its seed. Keeps medium intersection a pure function of the ray.
inline float hashUniform(const Ray& ray) {
  uint64_t h = hashSeed(ray.seed);
  for (int i = 0; i < 3; i++) {
    uint32_t o, d;
    std::memcpy(&o, &ray.o[i], sizeof(o));
    std::memcpy(&d, &ray.d[i], sizeof(d));
    h = hashSeed(h, (uint64_t(o) << 32) | d);
  }
  return (h >> 40) * (1.0f / 16777216.0f);
}

//
// Homogeneous participating medium filling a sphere or an axis aligned box.
// A ray crossing `d` units inside scatters with probability 1 - exp(-density * d).
// The boundary sphere's own material is ignored.
//
struct ConstantMedium {
  std::variant<Sphere, bbox3> boundary;
  float density = 1;
  uint32_t material = 0;

  bbox3 bbox() const {
    if (auto sphere = std::get_if<Sphere>(&boundary))
      return sphere->bbox();
    return std::get<bbox3>(boundary);
  }

  fvec3 centroid() const { return bbox().center(); }

  // Part of [ray_tmin, ray_tmax] inside the boundary
  bool insideInterval(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ float& t0, float& t1) const {
    if (auto box = std::get_if<bbox3>(&boundary))
      return box->rayInterval(ray, ray_tmin, ray_tmax, t0, t1);

    auto& sphere = std::get<Sphere>(boundary);
    fvec3 oc = ray.o - sphere.center;
    float a = glm::dot(ray.d, ray.d);
    float half_b = glm::dot(oc, ray.d);
    float c = glm::dot(oc, oc) - sphere.radius * sphere.radius;
    float discriminant = half_b * half_b - a * c;
    if (discriminant < 0 || a == 0)
      return false;
    float sqrt_d = std::sqrt(discriminant);
    t0 = fmaxf((-half_b - sqrt_d) / a, ray_tmin);
    t1 = fminf((-half_b + sqrt_d) / a, ray_tmax);
    return t0 < t1;
  }

  bool rayIntersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    float t0, t1;
    if (!insideInterval(ray, ray_tmin, ray_tmax, /*out*/ t0, t1))
      return false;

    float speed = glm::length(ray.d);
    float inside = (t1 - t0) * speed;
    float free_path = -std::log(1.0f - hashUniform(ray)) / density;
    if (!(free_path <= inside))
      return false;

    hit.t = t0 + free_path / speed;
    hit.p = ray.at(hit.t);
    // No surface: any normal works for the phase function, face it against the ray
    hit.n_geo = hit.n = -ray.d / speed;
    hit.front_face = true;
    hit.uv = fvec2{0};
    hit.material = material;
    return true;
  }

  // Media are never sampled as emitters
  bool sampleToward(const fvec3&, fvec2, /*out*/ SurfaceSample&) const {
    return false;
  }
};


using Shape = std::variant<Sphere, Triangle, Quad, Instance, ConstantMedium>;

inline bbox3 shapeBbox(const Shape& shape) {
  return std::visit([](const auto& s) { return s.bbox(); }, shape);
}

inline fvec3 shapeCentroid(const Shape& shape) {
  return std::visit([](const auto& s) { return s.centroid(); }, shape);
}

inline uint32_t shapeMaterial(const Shape& shape) {
  return std::visit([](const auto& s) -> uint32_t {
    using T = std::decay_t<decltype(s)>;
    if constexpr (std::is_same_v<T, Instance>) {
      return primitiveMaterial(s.object);
    } else {
      return s.material;
    }
  }, shape);
}

inline bool shapeIntersect(
    const Shape& shape, const Ray& ray, float ray_tmin, float ray_tmax,
    /*out*/ HitRecord& hit) {
  return std::visit([&](const auto& s) { return s.rayIntersect(ray, ray_tmin, ray_tmax, hit); }, shape);
}

inline bool shapeSampleToward(
    const Shape& shape, const fvec3& ref, fvec2 u,
    /*out*/ SurfaceSample& s) {
  return std::visit([&](const auto& shape_) { return shape_.sampleToward(ref, u, s); }, shape);
}

// Box between corners `a` and `b` as six outward facing quads
inline std::vector<Quad> makeBox(const fvec3& a, const fvec3& b, uint32_t material) {
  fvec3 lo = glm::min(a, b);
  fvec3 hi = glm::max(a, b);
  fvec3 dx{hi[0] - lo[0], 0, 0};
  fvec3 dy{0, hi[1] - lo[1], 0};
  fvec3 dz{0, 0, hi[2] - lo[2]};
  return {
    Quad{fvec3{lo[0], lo[1], hi[2]},  dx,  dy, material},  // front
    Quad{fvec3{hi[0], lo[1], hi[2]}, -dz,  dy, material},  // right
    Quad{fvec3{hi[0], lo[1], lo[2]}, -dx,  dy, material},  // back
    Quad{fvec3{lo[0], lo[1], lo[2]},  dz,  dy, material},  // left
    Quad{fvec3{lo[0], hi[1], hi[2]},  dx, -dz, material},  // top
    Quad{fvec3{lo[0], lo[1], lo[2]},  dx,  dz, material},  // bottom
  };
}


} // namespace glint
