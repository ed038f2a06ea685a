#pragma once

#include <variant>

#include "geometry.hpp"


namespace glint {

//
// Lights for next event estimation
//

// Emitting primitive (its material is a DiffuseLight)
struct AreaLight {
  uint32_t primitive = 0;
};

// Radiant intensity `intensity` at `position`, falls off by inverse square distance
struct PointLight {
  fvec3 position{0};
  fvec3 intensity{1};
};

// Constant irradiance `irradiance` arriving along `direction` (pointing away from the light)
struct DirectionalLight {
  fvec3 direction{0, -1, 0};
  fvec3 irradiance{1};
};

using Light = std::variant<AreaLight, PointLight, DirectionalLight>;


// Incident light toward a shading point
struct LightSample {
  fvec3 wi{0};               // unit, toward the light
  float dist = kInfinity;    // shadow ray extent
  fvec3 radiance{0};         // already divided by the sampling pdf (without light selection)
  bool valid = false;
};


inline LightSample samplePointLight(const PointLight& light, const fvec3& p) {
  LightSample s;
  fvec3 to_light = light.position - p;
  float d2 = glm::dot(to_light, to_light);
  if (!(d2 > 0))
    return s;
  s.dist = std::sqrt(d2);
  s.wi = to_light / s.dist;
  s.radiance = light.intensity / d2;
  s.valid = true;
  return s;
}

inline LightSample sampleDirectionalLight(const DirectionalLight& light, const fvec3&) {
  LightSample s;
  float len = glm::length(light.direction);
  if (!(len > 0))
    return s;
  s.wi = -light.direction / len;
  s.dist = kInfinity;
  s.radiance = light.irradiance;
  s.valid = true;
  return s;
}


} // namespace glint
