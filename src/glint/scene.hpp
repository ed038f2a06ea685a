#pragma once

#include <set>
#include <vector>

#include "bvh.hpp"
#include "camera.hpp"
#include "common.hpp"
#include "format.hpp"
#include "geometry.hpp"
#include "light.hpp"
#include "material.hpp"
#include "shape.hpp"


namespace glint {

using std::vector;


// Radiance of rays leaving the scene (vertical gradient from `bottom` to `top`)
struct Background {
  fvec3 bottom{0};
  fvec3 top{0};

  static Background constant(const fvec3& color) {
    return Background{color, color};
  }

  fvec3 eval(const fvec3& dir) const {
    if (bottom == top)
      return bottom;
    float t = glm::clamp(0.5f * (glm::normalize(dir)[1] + 1.0f), 0.0f, 1.0f);
    return (1.0f - t) * bottom + t * top;
  }
};


//
// Immutable scene. Every query is const and safe for concurrent callers.
//
struct Scene {
  vector<Material> materials;
  vector<Shape> shapes;
  vector<Light> lights;
  Camera camera;
  Background background;
  Bvh bvh;

  bool intersect(
      const Ray& ray, float ray_tmin, float ray_tmax,
      /*out*/ HitRecord& hit) const {
    return bvh.rayIntersect(ray, ray_tmin, ray_tmax,
        [&](uint32_t prim, float tmin, float tmax, float& t) {
          HitRecord tmp;
          if (!shapeIntersect(shapes[prim], ray, tmin, tmax, /*out*/ tmp))
            return false;
          tmp.primitive = prim;
          hit = tmp;
          t = tmp.t;
          return true;
        });
  }

  bool occluded(const Ray& ray, float ray_tmin, float ray_tmax) const {
    return bvh.rayIntersect(ray, ray_tmin, ray_tmax,
        [&](uint32_t prim, float tmin, float tmax, float& t) {
          HitRecord tmp;
          if (!shapeIntersect(shapes[prim], ray, tmin, tmax, /*out*/ tmp))
            return false;
          t = tmp.t;
          return true;
        }, /*any_hit*/ true);
  }

  // Incident radiance from `light` at `p`, `path_length` travelled so far (for attenuated emitters)
  LightSample sampleLight(const Light& light, const fvec3& p, fvec2 u, float path_length) const {
    if (auto point = std::get_if<PointLight>(&light))
      return samplePointLight(*point, p);
    if (auto directional = std::get_if<DirectionalLight>(&light))
      return sampleDirectionalLight(*directional, p);

    const auto& area = std::get<AreaLight>(light);
    const Shape& shape = shapes[area.primitive];
    LightSample result;
    SurfaceSample s;
    if (!shapeSampleToward(shape, p, u, /*out*/ s) || !(s.pdf > 0) || !std::isfinite(s.pdf))
      return result;

    fvec3 to_light = s.p - p;
    float len = glm::length(to_light);
    if (!(len > 0))
      return result;

    HitRecord at_light;
    at_light.p = s.p;
    at_light.uv = s.uv;
    at_light.front_face = glm::dot(to_light, s.n) < 0;
    fvec3 le = emitted(materials[shapeMaterial(shape)], at_light, path_length + len);

    result.wi = to_light / len;
    result.dist = len * (1.0f - 1e-4f) - kRayTmin;
    result.radiance = le / s.pdf;
    result.valid = result.dist > 0;
    return result;
  }
};


//
// Collects scene data, validates it and builds the hierarchy
//
struct SceneBuilder {
  vector<Material> materials;
  vector<Shape> shapes;
  vector<Light> lights;
  Camera camera;
  Background background;
  BvhOptions bvh_options;

  uint32_t addMaterial(const Material& material) {
    materials.push_back(material);
    return static_cast<uint32_t>(materials.size() - 1);
  }

  uint32_t addShape(const Shape& shape) {
    shapes.push_back(shape);
    return static_cast<uint32_t>(shapes.size() - 1);
  }

  // Indexed triangle mesh
  void addMesh(const vector<fvec3>& vertices, const vector<uvec3>& indices, uint32_t material) {
    for (auto& index : indices) {
      for (int k = 0; k < 3; k++) {
        if (index[k] >= vertices.size()) {
          throw ConstructionError{format("mesh index %u out of range (%u vertices)",
              index[k], (uint32_t)vertices.size())};
        }
      }
      shapes.push_back(Triangle{{vertices[index[0]], vertices[index[1]], vertices[index[2]]}, material});
    }
  }

  void addLight(const Light& light) {
    lights.push_back(light);
  }

  Scene build() const;
};


namespace detail {

inline void validateShape(const Sphere& s, uint32_t i) {
  if (!isFinite(s.center) || !std::isfinite(s.radius) || !(s.radius > 0))
    throw ConstructionError{format("sphere %u has invalid center %s or radius %f", i, s.center, s.radius)};
}

inline void validateShape(const Triangle& s, uint32_t i) {
  if (!isFinite(s.vs[0]) || !isFinite(s.vs[1]) || !isFinite(s.vs[2]))
    throw ConstructionError{format("triangle %u has non-finite vertices", i)};
  if (s.isDegenerate())
    throw ConstructionError{format("triangle %u is degenerate", i)};
}

inline void validateShape(const Quad& s, uint32_t i) {
  if (!isFinite(s.q) || !isFinite(s.u) || !isFinite(s.v))
    throw ConstructionError{format("quad %u has non-finite corner or edges", i)};
  if (s.isDegenerate())
    throw ConstructionError{format("quad %u is degenerate", i)};
}

inline void validateShape(const Instance& s, uint32_t i) {
  if (!isFinite(s.offset) || !std::isfinite(s.sin_theta) || !std::isfinite(s.cos_theta))
    throw ConstructionError{format("instance %u has non-finite transform", i)};
  std::visit([&](const auto& object) { validateShape(object, i); }, s.object);
}

inline void validateShape(const ConstantMedium& s, uint32_t i) {
  if (!std::isfinite(s.density) || !(s.density > 0))
    throw ConstructionError{format("medium %u has invalid density %f", i, s.density)};
  if (auto sphere = std::get_if<Sphere>(&s.boundary)) {
    validateShape(*sphere, i);
    return;
  }
  const bbox3& box = std::get<bbox3>(s.boundary);
  if (!box.isFinite() || !(box.bmin[0] < box.bmax[0] && box.bmin[1] < box.bmax[1] && box.bmin[2] < box.bmax[2]))
    throw ConstructionError{format("medium %u needs a finite box with positive extent", i)};
}

inline void validateMaterial(const Material& material, uint32_t i) {
  if (auto dielectric = std::get_if<Dielectric>(&material)) {
    if (!std::isfinite(dielectric->ior) || !(dielectric->ior > 0))
      throw ConstructionError{format("material %u has invalid ior %f", i, dielectric->ior)};
  }
  if (auto metal = std::get_if<Metal>(&material)) {
    if (!std::isfinite(metal->fuzz) || metal->fuzz < 0)
      throw ConstructionError{format("material %u has negative fuzz %f", i, metal->fuzz)};
  }
}

} // namespace detail


inline Scene SceneBuilder::build() const {
  Scene scene;
  scene.materials = materials;
  scene.shapes = shapes;
  scene.camera = camera;
  scene.background = background;

  for (uint32_t i = 0; i < materials.size(); i++) {
    detail::validateMaterial(materials[i], i);
  }

  uint32_t num_shapes = static_cast<uint32_t>(shapes.size());
  vector<bbox3> bboxes;
  bboxes.reserve(num_shapes);
  std::set<uint32_t> area_lights;
  for (uint32_t i = 0; i < num_shapes; i++) {
    const Shape& shape = shapes[i];
    std::visit([&](const auto& s) { detail::validateShape(s, i); }, shape);
    uint32_t material = shapeMaterial(shape);
    if (material >= materials.size()) {
      throw ConstructionError{format("primitive %u refers to material %u (%u materials)",
          i, material, (uint32_t)materials.size())};
    }
    // Flat shapes get a little thickness so the slab test always sees a volume
    bboxes.push_back(shapeBbox(shape).padded());
    if (isEmissive(materials[material])) {
      if (std::holds_alternative<ConstantMedium>(shape))
        throw ConstructionError{format("medium %u cannot use an emissive material", i)};
      area_lights.insert(i);
    }
  }

  for (auto& light : lights) {
    if (auto area = std::get_if<AreaLight>(&light)) {
      if (area->primitive >= num_shapes || !isEmissive(materials[shapeMaterial(shapes[area->primitive])]))
        throw ConstructionError{format("area light refers to non-emissive primitive %u", area->primitive)};
      area_lights.insert(area->primitive);
      continue;
    }
    if (auto point = std::get_if<PointLight>(&light)) {
      if (!isFinite(point->position) || !isFinite(point->intensity))
        throw ConstructionError{"point light must be finite"};
    }
    if (auto directional = std::get_if<DirectionalLight>(&light)) {
      if (!isFinite(directional->direction) || !isFinite(directional->irradiance) ||
          nearZero(directional->direction))
        throw ConstructionError{"directional light needs a finite, non-zero direction"};
    }
    scene.lights.push_back(light);
  }
  for (auto i : area_lights) {
    scene.lights.push_back(AreaLight{i});
  }

  if (!isFinite(camera.camera_loc) || !isFinite(camera.lookat_loc) || camera.camera_loc == camera.lookat_loc) {
    throw ConstructionError{"camera needs distinct finite location and lookat"};
  }
  fvec3 view = camera.lookat_loc - camera.camera_loc;
  if (!isFinite(camera.up_vec) || nearZero(glm::cross(glm::normalize(view), camera.up_vec), 1e-6f)) {
    throw ConstructionError{"camera up_vec must not be parallel to the view direction"};
  }

  scene.bvh = Bvh::create(bboxes, bvh_options);
  log::debug("scene", "%u primitives, %u materials, %u lights",
      num_shapes, (uint32_t)materials.size(), (uint32_t)scene.lights.size());
  return scene;
}


} // namespace glint
