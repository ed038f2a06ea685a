#pragma once

#include <map>
#include <string>

#include "bvh.hpp"
#include "common.hpp"
#include "format.hpp"
#include "misc.hpp"
#include "ply.hpp"
#include "scene.hpp"


namespace glint {

//
// Scene description in Yeml
//
//   camera:
//     camera_loc: 0 1 4
//     lookat_loc: 0 0 0
//     yfov: 40              # degrees
//   background: 0.7 0.8 1   # or a dict with "bottom" and "top"
//   bvh:
//     split: sah
//   materials:
//     - name: white
//       type: lambertian    # lambertian | metal | dielectric | diffuse_light | isotropic
//       albedo: 0.8 0.8 0.8
//   shapes:
//     - type: sphere        # sphere | triangle | quad | box | ply | medium
//       center: 0 0 0
//       radius: 1
//       material: white
//       rotate_y: 15        # optional, degrees, applied before "translate"
//       translate: 0 0 1    # optional
//     - type: medium        # fog inside a sphere ("center", "radius") or a box ("min", "max")
//       min: -1 0 -1
//       max: 1 2 1
//       density: 0.5
//       material: fog       # usually isotropic
//   lights:
//     - type: directional   # point | directional
//       direction: 0 -1 0
//       irradiance: 1 1 1
//
// Relative "ply" paths are resolved against `base_dir`.
//

namespace detail {

inline Texture textureFromYeml(const Yeml& y, const string& key, const fvec3& fallback) {
  fvec3 color = y.get<fvec3>(key, fallback);
  if (auto odd = y.ds(key + "_checker")) {
    float scale = y.get<float>(key + "_checker_scale", 10.0f);
    return CheckerTexture{color, sto<fvec3>(*odd), scale};
  }
  return SolidColor{color};
}

inline Material materialFromYeml(const Yeml& y) {
  const string& type = y("type");
  if (type == "lambertian") {
    Lambertian m;
    m.albedo = textureFromYeml(y, "albedo", fvec3{0.5});
    return m;
  }
  if (type == "metal") {
    Metal m;
    m.albedo = textureFromYeml(y, "albedo", fvec3{0.9});
    m.fuzz = y.get<float>("fuzz", 0.0f);
    return m;
  }
  if (type == "dielectric") {
    Dielectric m;
    m.ior = y.get<float>("ior", 1.5f);
    m.albedo = textureFromYeml(y, "albedo", fvec3{1});
    return m;
  }
  if (type == "isotropic") {
    Isotropic m;
    m.albedo = textureFromYeml(y, "albedo", fvec3{0.5});
    return m;
  }
  if (type == "diffuse_light") {
    DiffuseLight m;
    m.emit = textureFromYeml(y, "emit", fvec3{1});
    m.half_length = y.get<float>("half_length", 0.0f);
    m.two_sided = y.get<bool>("two_sided", false);
    return m;
  }
  throw ConstructionError{format("unknown material type \"%s\"", type)};
}

inline const Yeml::List& listOf(const Yeml& y, const string& key) {
  if (!y.isList())
    throw ConstructionError{format("\"%s\" must be a list", key)};
  return y.asList();
}

inline uint32_t materialRef(const Yeml& y, const std::map<string, uint32_t>& names) {
  const string& name = y("material");
  auto it = names.find(name);
  if (it == names.end())
    throw ConstructionError{format("unknown material \"%s\"", name)};
  return it->second;
}

// Wraps `object` in an Instance when "rotate_y" or "translate" is given
inline Shape placed(const Yeml& y, const Primitive& object) {
  if (!y.d("rotate_y") && !y.d("translate"))
    return std::visit([](const auto& s) -> Shape { return s; }, object);
  return Instance::create(object, y.get<fvec3>("translate", fvec3{0}), y.get<float>("rotate_y", 0.0f));
}

inline ConstantMedium mediumFromYeml(const Yeml& y, uint32_t material) {
  ConstantMedium medium;
  medium.density = sto<float>(y("density"));
  medium.material = material;
  if (y.d("radius")) {
    medium.boundary = Sphere{sto<fvec3>(y("center")), sto<float>(y("radius")), material};
  } else {
    medium.boundary = bbox3::fromPoints(sto<fvec3>(y("min")), sto<fvec3>(y("max")));
  }
  return medium;
}

} // namespace detail


inline Camera cameraFromYeml(const Yeml& y, const Camera& base = {}) {
  Camera c = base;
  if (!y)
    return c;
  c.camera_loc = y.get<fvec3>("camera_loc", c.camera_loc);
  c.lookat_loc = y.get<fvec3>("lookat_loc", c.lookat_loc);
  c.up_vec = y.get<fvec3>("up_vec", c.up_vec);
  c.yfov = y.get<float>("yfov", c.yfov * 180.0f / kPi) * kPi / 180.0f;
  c.aperture = y.get<float>("aperture", c.aperture);
  c.focus_dist = y.get<float>("focus_dist", glm::length(c.lookat_loc - c.camera_loc));
  return c;
}


inline SceneBuilder loadSceneYeml(const Yeml& y, const string& base_dir = "") {
  SceneBuilder builder;
  try {
    if (auto camera = y.d("camera")) {
      builder.camera = cameraFromYeml(**camera);
    }

    if (auto background = y.d("background")) {
      const Yeml& yb = **background;
      builder.background = yb.isStr()
          ? Background::constant(sto<fvec3>(yb.s()))
          : Background{yb.get<fvec3>("bottom", fvec3{0}), yb.get<fvec3>("top", fvec3{0})};
    }

    if (auto bvh = y.d("bvh")) {
      const Yeml& yb = **bvh;
      BvhOptions& opts = builder.bvh_options;
      int max_primitive = yb.get<int>("max_primitive", opts.max_primitive);
      if (max_primitive < 1 || max_primitive > 255)
        throw ConstructionError{format("bvh max_primitive must be in [1, 255] (got %d)", max_primitive)};
      opts.max_primitive = static_cast<uint8_t>(max_primitive);
      opts.parallel_threshold = yb.get<uint32_t>("parallel_threshold", opts.parallel_threshold);
      string split = yb.get<string>("split", "middle");
      if (split == "middle") {
        opts.split = SplitPolicy::kMiddle;
      } else if (split == "sah") {
        opts.split = SplitPolicy::kSah;
      } else {
        throw ConstructionError{format("unknown bvh split \"%s\"", split)};
      }
    }

    std::map<string, uint32_t> names;
    if (auto materials = y.d("materials")) {
      for (auto& ym : detail::listOf(**materials, "materials")) {
        uint32_t index = builder.addMaterial(detail::materialFromYeml(*ym));
        names[(*ym)("name")] = index;
      }
    }

    if (auto shapes = y.d("shapes")) {
      for (auto& ys_ptr : detail::listOf(**shapes, "shapes")) {
        const Yeml& ys = *ys_ptr;
        const string& type = ys("type");
        uint32_t material = detail::materialRef(ys, names);
        if (type == "sphere") {
          builder.addShape(detail::placed(ys, Sphere{sto<fvec3>(ys("center")), sto<float>(ys("radius")), material}));
        } else if (type == "triangle") {
          builder.addShape(detail::placed(ys,
              Triangle{{sto<fvec3>(ys("v0")), sto<fvec3>(ys("v1")), sto<fvec3>(ys("v2"))}, material}));
        } else if (type == "quad") {
          builder.addShape(detail::placed(ys, Quad{sto<fvec3>(ys("q")), sto<fvec3>(ys("u")), sto<fvec3>(ys("v")), material}));
        } else if (type == "box") {
          for (auto& side : makeBox(sto<fvec3>(ys("min")), sto<fvec3>(ys("max")), material)) {
            builder.addShape(detail::placed(ys, side));
          }
        } else if (type == "medium") {
          builder.addShape(detail::mediumFromYeml(ys, material));
        } else if (type == "ply") {
          string file = ys("file");
          if (!file.empty() && file[0] != '/' && !base_dir.empty())
            file = base_dir + "/" + file;
          vector<fvec3> vertices;
          vector<uvec3> indices;
          loadPly(file, vertices, indices);
          fvec3 scale = ys.get<fvec3>("scale", fvec3{1});
          fvec3 offset = ys.get<fvec3>("offset", fvec3{0});
          // Meshes get the placement baked into their vertices
          Instance place = Instance::create(Primitive{}, ys.get<fvec3>("translate", fvec3{0}), ys.get<float>("rotate_y", 0.0f));
          for (auto& v : vertices) {
            v = place.toWorld(v * scale + offset) + place.offset;
          }
          builder.addMesh(vertices, indices, material);
        } else {
          throw ConstructionError{format("unknown shape type \"%s\"", type)};
        }
      }
    }

    if (auto lights = y.d("lights")) {
      for (auto& yl_ptr : detail::listOf(**lights, "lights")) {
        const Yeml& yl = *yl_ptr;
        const string& type = yl("type");
        if (type == "point") {
          builder.addLight(PointLight{sto<fvec3>(yl("position")), sto<fvec3>(yl("intensity"))});
        } else if (type == "directional") {
          builder.addLight(DirectionalLight{sto<fvec3>(yl("direction")), sto<fvec3>(yl("irradiance"))});
        } else {
          throw ConstructionError{format("unknown light type \"%s\"", type)};
        }
      }
    }
  } catch (const ConstructionError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw ConstructionError{format("scene: %s", e.what())};
  }
  return builder;
}


} // namespace glint
