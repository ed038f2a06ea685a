#pragma once

#include <exception>
#include <vector>

#include "format.hpp"
#include "geometry.hpp"
#include "renderer.hpp"


namespace glint {

//
// External post-processing (denoiser, bloom, ...)
//
struct PostProcessor {
  virtual ~PostProcessor() = default;

  // Returns a linear color buffer shaped like `snapshot.pixels`
  virtual std::vector<fvec3> process(const Snapshot& snapshot) = 0;

  virtual const char* name() const { return "post"; }
};

// Post-processed pixels, or the raw snapshot pixels when `processor` is absent, throws
// or returns a buffer of the wrong shape
inline std::vector<fvec3> applyPostProcessor(PostProcessor* processor, const Snapshot& snapshot) {
  if (!processor)
    return snapshot.pixels;

  std::vector<fvec3> result;
  try {
    result = processor->process(snapshot);
  } catch (const std::exception& e) {
    log::warn("post", "%s failed (%s), using raw framebuffer", processor->name(), e.what());
    return snapshot.pixels;
  }

  if (result.size() != snapshot.pixels.size()) {
    log::warn("post", "%s returned %d pixels for %dx%d, using raw framebuffer",
        processor->name(), (int)result.size(), snapshot.w, snapshot.h);
    return snapshot.pixels;
  }
  return result;
}


} // namespace glint
