#pragma once

#include <algorithm>
#include <cmath>

#include "config.hpp"
#include "geometry.hpp"
#include "material.hpp"
#include "sampling.hpp"
#include "scene.hpp"


namespace glint {

// Radiance estimate of one camera ray, with first hit data for the auxiliary buffers
struct Sample {
  fvec3 radiance{0};
  fvec3 albedo{0};
  fvec3 normal{0};
};

// Non-finite -> 0, negative -> 0, then optionally clamp each component to `max_value`
inline fvec3 sanitize(const fvec3& v, float max_value = 0) {
  fvec3 result{0};
  for (int i = 0; i < 3; i++) {
    float c = std::isfinite(v[i]) ? std::max(v[i], 0.0f) : 0.0f;
    result[i] = max_value > 0 ? std::min(c, max_value) : c;
  }
  return result;
}


//
// pbrt-like integrator interface. Implementations are stateless, `Li` may run on any worker.
//
struct Integrator {
  virtual ~Integrator() = default;
  virtual Sample Li(const Ray& ray, const Scene& scene, Rng& rng) const = 0;
};


//
// Unidirectional path tracer with next event estimation and russian roulette
//
struct PathIntegrator : Integrator {
  uint32_t max_depth = 8;
  uint32_t rr_depth = 3;
  bool next_event = true;
  float radiance_clamp = 0;

  PathIntegrator() {}
  PathIntegrator(const RenderConfig& config)
    : max_depth(config.max_depth), rr_depth(config.rr_depth),
      next_event(config.next_event), radiance_clamp(config.radiance_clamp) {}

  // Direct light from one uniformly chosen light (already divided by its selection probability)
  fvec3 sampleDirect(const Scene& scene, const Material& material, const HitRecord& hit,
                     float path_length, Rng& rng) const {
    uint32_t num_lights = scene.lights.size();
    const Light& light = scene.lights[rng.uniformIndex(num_lights)];
    LightSample ls = scene.sampleLight(light, hit.p, rng.uniform2(), path_length);
    if (!ls.valid)
      return fvec3{0};

    fvec3 f = evalBsdf(material, hit, ls.wi);
    if (f == fvec3{0})
      return fvec3{0};

    Ray shadow{offsetOrigin(hit.p, hit.n_geo, ls.wi), ls.wi, 0, rng.next()};
    if (scene.occluded(shadow, kRayTmin, ls.dist))
      return fvec3{0};
    return f * ls.radiance * (float)num_lights;
  }

  Sample Li(const Ray& camera_ray, const Scene& scene, Rng& rng) const override {
    Sample result;
    fvec3 L{0};
    fvec3 throughput{1};
    Ray ray = camera_ray;
    float path_length = 0;

    // Whether the previous vertex already accounted for emission found by this ray
    bool direct_sampled = false;

    for (uint32_t depth = 0; depth < max_depth; depth++) {
      HitRecord hit;
      ray.seed = rng.next();
      if (!scene.intersect(ray, kRayTmin, kInfinity, /*out*/ hit)) {
        fvec3 bg = scene.background.eval(ray.d);
        L += throughput * bg;
        if (depth == 0) {
          result.albedo = bg;
        }
        break;
      }

      const Material& material = scene.materials[hit.material];
      applyNormalMap(material, /*inout*/ hit);
      path_length += hit.t * glm::length(ray.d);

      if (depth == 0) {
        result.albedo = albedoOf(material, hit);
        result.normal = hit.n;
      }

      if (!direct_sampled && isEmissive(material)) {
        L += throughput * emitted(material, hit, path_length);
      }

      bool do_direct =
          next_event && !isSpecular(material) && !isEmissive(material) &&
          !scene.lights.empty() && depth + 1 < max_depth;
      if (do_direct) {
        L += throughput * sampleDirect(scene, material, hit, path_length, rng);
      }

      auto scattered = scatter(material, ray, hit, rng);
      if (!scattered)
        break;
      if (!scattered->specular && !(scattered->pdf > 0))
        break;

      // Lambertian cosine sampling and the isotropic phase function both reduce
      // BSDF * cos / pdf to the albedo
      throughput *= scattered->attenuation;

      if (depth >= rr_depth) {
        float p = glm::clamp(opMaxReduce(throughput), 0.05f, 0.95f);
        if (rng.uniform() >= p)
          break;
        throughput /= p;
      }

      direct_sampled = do_direct;
      ray = scattered->ray;
    }

    result.radiance = sanitize(L, radiance_clamp);
    result.albedo = sanitize(result.albedo);
    if (!isFinite(result.normal))
      result.normal = fvec3{0};
    return result;
  }
};
GLINT_REGISTER_INTEGRATOR(PathIntegrator)


// Shading normal mapped to [0, 1]
struct NormalIntegrator : Integrator {
  NormalIntegrator() {}
  NormalIntegrator(const RenderConfig&) {}

  Sample Li(const Ray& ray, const Scene& scene, Rng&) const override {
    Sample result;
    HitRecord hit;
    if (!scene.intersect(ray, kRayTmin, kInfinity, /*out*/ hit)) {
      result.radiance = fvec3{0.5};
      return result;
    }
    applyNormalMap(scene.materials[hit.material], /*inout*/ hit);
    result.radiance = sanitize(hit.n * 0.5f + 0.5f);
    result.normal = hit.n;
    return result;
  }
};
GLINT_REGISTER_INTEGRATOR(NormalIntegrator)


// First hit surface color (emission for lights), background on miss
struct AlbedoIntegrator : Integrator {
  AlbedoIntegrator() {}
  AlbedoIntegrator(const RenderConfig&) {}

  Sample Li(const Ray& ray, const Scene& scene, Rng&) const override {
    Sample result;
    HitRecord hit;
    if (!scene.intersect(ray, kRayTmin, kInfinity, /*out*/ hit)) {
      result.radiance = result.albedo = sanitize(scene.background.eval(ray.d));
      return result;
    }
    const Material& material = scene.materials[hit.material];
    applyNormalMap(material, /*inout*/ hit);
    result.radiance = result.albedo = sanitize(albedoOf(material, hit));
    result.normal = hit.n;
    return result;
  }
};
GLINT_REGISTER_INTEGRATOR(AlbedoIntegrator)


// Flat shading by a fixed light direction, factor in [0.25, 1.25]
struct SimpleIntegrator : Integrator {
  fvec3 light_dir = glm::normalize(fvec3{1, 1, -1});

  SimpleIntegrator() {}
  SimpleIntegrator(const RenderConfig&) {}

  Sample Li(const Ray& ray, const Scene& scene, Rng&) const override {
    Sample result;
    HitRecord hit;
    if (!scene.intersect(ray, kRayTmin, kInfinity, /*out*/ hit)) {
      result.radiance = result.albedo = sanitize(scene.background.eval(ray.d));
      return result;
    }
    const Material& material = scene.materials[hit.material];
    applyNormalMap(material, /*inout*/ hit);
    fvec3 color = albedoOf(material, hit);
    if (!isEmissive(material)) {
      color *= glm::dot(hit.n, light_dir) * 0.5f + 0.75f;
    }
    result.radiance = sanitize(color);
    result.albedo = sanitize(albedoOf(material, hit));
    result.normal = hit.n;
    return result;
  }
};
GLINT_REGISTER_INTEGRATOR(SimpleIntegrator)


} // namespace glint
