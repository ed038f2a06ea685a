#pragma once

#include <cmath>
#include <cstdint>
#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "common.hpp"
#include "format.hpp"
#include "misc.hpp"


namespace glint {

struct Integrator;
struct RenderConfig;

//
// Integrator registry (integrators construct themselves from a RenderConfig)
//
struct ClassRegistry {
  using new_func_t = std::function<std::shared_ptr<const Integrator>(const RenderConfig&)>;

  static std::map<std::string, new_func_t>& data() {
    static std::map<std::string, new_func_t> instance;
    return instance;
  }

  static bool contains(const std::string& name) {
    return data().count(name) > 0;
  }

  static std::shared_ptr<const Integrator> create(const std::string& name, const RenderConfig& config);
};

#define GLINT_REGISTER_INTEGRATOR(CLASS)                                                \
  struct CLASS ## __Registerer {                                                        \
    CLASS ## __Registerer () {                                                          \
      ::glint::ClassRegistry::data()[#CLASS] = [](const ::glint::RenderConfig& config)  \
          -> std::shared_ptr<const ::glint::Integrator> {                               \
        return std::make_shared<CLASS>(config);                                         \
      };                                                                                \
    }                                                                                   \
  };                                                                                    \
  inline CLASS ## __Registerer CLASS ## __Registerer__instance;                         \


enum class SeedPolicy {
  kDeterministic,  // generator per (pixel, sample), independent of scheduling
  kPerWorker,      // generator per (worker, pass)
};

inline const char* seedPolicyName(SeedPolicy policy) {
  return policy == SeedPolicy::kDeterministic ? "deterministic" : "per_worker";
}


struct RenderConfig {
  int w = 300;
  int h = 300;
  int samples_per_pixel = 16;
  int samples_per_pass = 4;
  int max_depth = 8;
  int worker_count = 0;          // 0: hardware concurrency
  int rr_depth = 3;              // russian roulette starts at this depth
  int tile_size = 32;
  SeedPolicy seed_policy = SeedPolicy::kDeterministic;
  uint64_t seed = 0x853c49e6748fea9bULL;
  bool next_event = true;
  float radiance_clamp = 0;      // 0: off
  bool aux_buffers = false;      // first hit albedo and normal
  std::string integrator = "PathIntegrator";

  int numPasses() const {
    return (samples_per_pixel + samples_per_pass - 1) / samples_per_pass;
  }

  // Samples traced in `pass` (the last pass takes the remainder)
  int samplesInPass(int pass) const {
    int done = pass * samples_per_pass;
    return std::min(samples_per_pass, samples_per_pixel - done);
  }

  void validate() const {
    auto check = [](bool ok, const char* what, int value) {
      if (!ok)
        throw ConfigError{format("%s must be positive (got %d)", what, value)};
    };
    check(w > 0, "width", w);
    check(h > 0, "height", h);
    check(samples_per_pixel > 0, "samples_per_pixel", samples_per_pixel);
    check(samples_per_pass > 0, "samples_per_pass", samples_per_pass);
    check(max_depth > 0, "max_depth", max_depth);
    check(tile_size > 0, "tile_size", tile_size);
    if (worker_count < 0)
      throw ConfigError{format("worker_count must not be negative (got %d)", worker_count)};
    if (rr_depth < 0)
      throw ConfigError{format("rr_depth must not be negative (got %d)", rr_depth)};
    if (!(radiance_clamp >= 0) || !std::isfinite(radiance_clamp))
      throw ConfigError{format("radiance_clamp must be finite and non-negative (got %f)", radiance_clamp)};
    if (!ClassRegistry::contains(integrator))
      throw ConfigError{format("unknown integrator \"%s\"", integrator)};
  }

  //
  // From a Yeml dict, e.g.
  //
  //   w: 320
  //   h: 240
  //   samples_per_pixel: 64
  //   seed_policy: per_worker
  //   integrator: PathIntegrator
  //
  // Missing keys keep their defaults. Malformed values raise ConfigError.
  //
  static RenderConfig fromYeml(const Yeml& y, const RenderConfig& base = {}) {
    RenderConfig c = base;
    if (y.isNull())
      return c;
    if (!y.isDict())
      throw ConfigError{"render config must be a dict"};
    try {
      c.w = y.get<int>("w", c.w);
      c.h = y.get<int>("h", c.h);
      c.samples_per_pixel = y.get<int>("samples_per_pixel", c.samples_per_pixel);
      c.samples_per_pass = y.get<int>("samples_per_pass", c.samples_per_pass);
      c.max_depth = y.get<int>("max_depth", c.max_depth);
      c.worker_count = y.get<int>("worker_count", c.worker_count);
      c.rr_depth = y.get<int>("rr_depth", c.rr_depth);
      c.tile_size = y.get<int>("tile_size", c.tile_size);
      c.seed = y.get<uint64_t>("seed", c.seed);
      c.next_event = y.get<bool>("next_event", c.next_event);
      c.radiance_clamp = y.get<float>("radiance_clamp", c.radiance_clamp);
      c.aux_buffers = y.get<bool>("aux_buffers", c.aux_buffers);
      c.integrator = y.get<std::string>("integrator", c.integrator);
    } catch (const std::runtime_error& e) {
      throw ConfigError{e.what()};
    }
    if (auto policy = y.ds("seed_policy")) {
      if (*policy == seedPolicyName(SeedPolicy::kDeterministic)) {
        c.seed_policy = SeedPolicy::kDeterministic;
      } else if (*policy == seedPolicyName(SeedPolicy::kPerWorker)) {
        c.seed_policy = SeedPolicy::kPerWorker;
      } else {
        throw ConfigError{format("unknown seed_policy \"%s\"", *policy)};
      }
    }
    return c;
  }
};


inline std::shared_ptr<const Integrator> ClassRegistry::create(
    const std::string& name, const RenderConfig& config) {
  auto it = data().find(name);
  if (it == data().end())
    throw ConfigError{format("unknown integrator \"%s\"", name)};
  return it->second(config);
}


} // namespace glint
