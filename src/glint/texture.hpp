#pragma once

#include <algorithm>
#include <cmath>
#include <memory>
#include <variant>

#include "geometry.hpp"
#include "image.hpp"


namespace glint {

//
// Textures: color as a function of surface UV
//

struct SolidColor {
  fvec3 color;
};

// Alternating cells of `scale` cells per unit UV
struct CheckerTexture {
  fvec3 even;
  fvec3 odd;
  float scale = 10;
};

// Host supplied, already decoded image. UV outside [0, 1] wraps.
struct ImageTexture {
  std::shared_ptr<const Image> image;
};

using Texture = std::variant<SolidColor, CheckerTexture, ImageTexture>;


inline fvec3 sampleTexture(const SolidColor& tex, fvec2) {
  return tex.color;
}

inline fvec3 sampleTexture(const CheckerTexture& tex, fvec2 uv) {
  int iu = static_cast<int>(std::floor(uv[0] * tex.scale));
  int iv = static_cast<int>(std::floor(uv[1] * tex.scale));
  return ((iu + iv) & 1) == 0 ? tex.even : tex.odd;
}

inline fvec3 sampleTexture(const ImageTexture& tex, fvec2 uv) {
  if (!tex.image || tex.image->empty())
    return fvec3{0};
  const Image& image = *tex.image;
  // Repeat: -0.25 samples like 0.75
  fvec2 wrapped = uv - glm::floor(uv);
  float u = wrapped[0];
  float v = 1.0f - wrapped[1];
  // Nearest texel, row 0 at the top (v = 1)
  size_t x = std::min(static_cast<size_t>(u * image.num_cols), image.num_cols - 1);
  size_t y = std::min(static_cast<size_t>(v * image.num_rows), image.num_rows - 1);
  return image(y, x);
}

inline fvec3 sampleTexture(const Texture& tex, fvec2 uv) {
  return std::visit([&](const auto& t) { return sampleTexture(t, uv); }, tex);
}


} // namespace glint
