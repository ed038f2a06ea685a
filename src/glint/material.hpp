#pragma once

#include <cmath>
#include <optional>
#include <type_traits>
#include <variant>

#include "geometry.hpp"
#include "sampling.hpp"
#include "shape.hpp"
#include "texture.hpp"


namespace glint {

//
// Materials
//

struct Lambertian {
  Texture albedo = SolidColor{fvec3{0.5}};
  std::optional<Texture> normal_map;
};

struct Metal {
  Texture albedo = SolidColor{fvec3{0.9}};
  float fuzz = 0;
  std::optional<Texture> normal_map;
};

struct Dielectric {
  float ior = 1.5f;
  Texture albedo = SolidColor{fvec3{1}};
  std::optional<Texture> normal_map;
};

// Emission is attenuated by 1 / (1 + length / half_length) when `half_length > 0`
struct DiffuseLight {
  Texture emit = SolidColor{fvec3{1}};
  float half_length = 0;
  bool two_sided = false;
};

// Phase function of a ConstantMedium: scatters uniformly over the sphere
struct Isotropic {
  Texture albedo = SolidColor{fvec3{0.5}};
};

using Material = std::variant<Lambertian, Metal, Dielectric, DiffuseLight, Isotropic>;


struct ScatterRecord {
  fvec3 attenuation{0};
  Ray ray;
  float pdf = 0;        // solid angle pdf of `ray.d` (unused when specular)
  bool specular = false;
};


inline bool isEmissive(const Material& material) {
  return std::holds_alternative<DiffuseLight>(material);
}

// Delta (or near delta) lobes are not handled by light sampling
inline bool isSpecular(const Material& material) {
  return std::holds_alternative<Metal>(material) || std::holds_alternative<Dielectric>(material);
}

// Tangent space map normal, stored in [0, 1]^3, expressed around `n`
inline fvec3 perturbNormal(const Texture& normal_map, const fvec3& n, fvec2 uv) {
  fvec3 local = (sampleTexture(normal_map, uv) - 0.5f) * 2.0f;
  fvec3 result = xformZframe(n) * local;
  float len = glm::length(result);
  if (!(len > 0) || !std::isfinite(len))
    return n;
  return result / len;
}

// Apply the material's bump map (if any) to `hit.n`
inline void applyNormalMap(const Material& material, /*inout*/ HitRecord& hit) {
  const std::optional<Texture>* normal_map = std::visit([](const auto& m) -> const std::optional<Texture>* {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, DiffuseLight> || std::is_same_v<T, Isotropic>) {
      return nullptr;
    } else {
      return &m.normal_map;
    }
  }, material);
  if (normal_map && *normal_map) {
    hit.n = perturbNormal(**normal_map, hit.n_geo, hit.uv);
  }
}

// Schlick's approximation
inline float reflectance(float cos_theta, float ratio) {
  float r0 = (1.0f - ratio) / (1.0f + ratio);
  r0 = r0 * r0;
  return r0 + (1.0f - r0) * std::pow(1.0f - cos_theta, 5.0f);
}


inline std::optional<ScatterRecord> scatter(
    const Lambertian& m, const Ray& ray, const HitRecord& hit, Rng& rng) {
  fvec3 local; float pdf;
  sample_HemisphereCosine(rng.uniform2(), /*out*/ local, pdf);
  fvec3 wo = xformZframe(hit.n) * local;
  if (!(pdf > 0) || glm::dot(wo, hit.n_geo) <= 0)
    return std::nullopt;

  ScatterRecord rec;
  rec.attenuation = sampleTexture(m.albedo, hit.uv);
  rec.ray = Ray{offsetOrigin(hit.p, hit.n_geo, wo), wo, ray.depth + 1};
  rec.pdf = pdf;
  return rec;
}

inline std::optional<ScatterRecord> scatter(
    const Metal& m, const Ray& ray, const HitRecord& hit, Rng& rng) {
  fvec3 reflected = reflect(glm::normalize(ray.d), hit.n);
  fvec3 wo = reflected + m.fuzz * sample_Ball(rng);
  if (glm::dot(wo, hit.n_geo) <= 0 || nearZero(wo))
    return std::nullopt;

  wo = glm::normalize(wo);
  ScatterRecord rec;
  rec.attenuation = sampleTexture(m.albedo, hit.uv);
  rec.ray = Ray{offsetOrigin(hit.p, hit.n_geo, wo), wo, ray.depth + 1};
  rec.specular = true;
  return rec;
}

inline std::optional<ScatterRecord> scatter(
    const Dielectric& m, const Ray& ray, const HitRecord& hit, Rng& rng) {
  float ratio = hit.front_face ? (1.0f / m.ior) : m.ior;
  fvec3 unit_d = glm::normalize(ray.d);
  float cos_theta = fminf(glm::dot(-unit_d, hit.n), 1.0f);
  float sin_theta = std::sqrt(fmaxf(0.0f, 1.0f - cos_theta * cos_theta));

  // At or beyond the critical angle nothing refracts
  bool cannot_refract = ratio * sin_theta >= 1.0f;
  fvec3 wo;
  if (cannot_refract || reflectance(cos_theta, ratio) > rng.uniform()) {
    wo = reflect(unit_d, hit.n);
  } else {
    wo = refract(unit_d, hit.n, ratio);
  }

  ScatterRecord rec;
  rec.attenuation = sampleTexture(m.albedo, hit.uv);
  rec.ray = Ray{offsetOrigin(hit.p, hit.n_geo, wo), wo, ray.depth + 1};
  rec.specular = true;
  return rec;
}

inline std::optional<ScatterRecord> scatter(
    const DiffuseLight&, const Ray&, const HitRecord&, Rng&) {
  return std::nullopt;
}

inline std::optional<ScatterRecord> scatter(
    const Isotropic& m, const Ray& ray, const HitRecord& hit, Rng& rng) {
  ScatterRecord rec;
  rec.attenuation = sampleTexture(m.albedo, hit.uv);
  rec.ray = Ray{hit.p, sample_Sphere(rng.uniform2()), ray.depth + 1};
  rec.pdf = 1.0f / (4.0f * kPi);
  return rec;
}

inline std::optional<ScatterRecord> scatter(
    const Material& material, const Ray& ray, const HitRecord& hit, Rng& rng) {
  return std::visit([&](const auto& m) { return scatter(m, ray, hit, rng); }, material);
}


// Radiance leaving an emitter toward the viewer after `path_length` of travel
inline fvec3 emitted(const Material& material, const HitRecord& hit, float path_length) {
  auto light = std::get_if<DiffuseLight>(&material);
  if (!light)
    return fvec3{0};
  if (!hit.front_face && !light->two_sided)
    return fvec3{0};

  fvec3 color = sampleTexture(light->emit, hit.uv);
  if (light->half_length > 0) {
    color /= 1.0f + path_length / light->half_length;
  }
  return color;
}

// BSDF times |cos| toward `wi` (unit), for light sampling. Zero for specular lobes.
// The phase function has no cosine term.
inline fvec3 evalBsdf(const Material& material, const HitRecord& hit, const fvec3& wi) {
  if (auto isotropic = std::get_if<Isotropic>(&material))
    return sampleTexture(isotropic->albedo, hit.uv) / (4.0f * kPi);
  auto lambertian = std::get_if<Lambertian>(&material);
  if (!lambertian)
    return fvec3{0};
  float cos_theta = glm::dot(wi, hit.n);
  if (cos_theta <= 0 || glm::dot(wi, hit.n_geo) <= 0)
    return fvec3{0};
  return sampleTexture(lambertian->albedo, hit.uv) * (cos_theta / kPi);
}

// Surface color used by the auxiliary buffers
inline fvec3 albedoOf(const Material& material, const HitRecord& hit) {
  return std::visit([&](const auto& m) {
    using T = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<T, DiffuseLight>) {
      return sampleTexture(m.emit, hit.uv);
    } else {
      return sampleTexture(m.albedo, hit.uv);
    }
  }, material);
}


} // namespace glint
