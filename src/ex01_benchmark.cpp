#include <catch2/catch.hpp>

#include "glint/bvh.hpp"
#include "glint/misc.hpp"
#include "glint/ply.hpp"
#include "glint/renderer.hpp"
#include "glint/scene.hpp"
#include "glint/scene_yeml.hpp"


using std::string, std::vector;
using namespace glint;


namespace {

vector<bbox3> randomBboxes(int n) {
  Rng rng{0x1234, 1};
  vector<bbox3> result;
  for (int i = 0; i < n; i++) {
    fvec3 c = 2.0f * fvec3{rng.uniform(), rng.uniform(), rng.uniform()} - 1.0f;
    fvec3 r = 0.02f * fvec3{rng.uniform(), rng.uniform(), rng.uniform()} + 0.001f;
    result.push_back(bbox3{c - r, c + r});
  }
  return result;
}

} // namespace


TEST_CASE("Bvh-create-benchmark") {
  vector<bbox3> bboxes = randomBboxes(1 << 16);

  BvhOptions serial;
  serial.parallel_threshold = 1u << 31;

  BvhOptions parallel;

  BvhOptions sah;
  sah.split = SplitPolicy::kSah;

  BENCHMARK("65536 boxes - middle, serial") {
    return Bvh::create(bboxes, serial);
  };

  BENCHMARK("65536 boxes - middle, parallel") {
    return Bvh::create(bboxes, parallel);
  };

  BENCHMARK("65536 boxes - sah, parallel") {
    return Bvh::create(bboxes, sah);
  };

  sah.max_primitive = 8;
  BENCHMARK("65536 boxes - sah, parallel, max_primitive = 8") {
    return Bvh::create(bboxes, sah);
  };
}


TEST_CASE("Bvh-octahedron-benchmark") {
  string filename = string(CMAKE_SOURCE_DIR) + "/data/octahedron.ply";
  vector<fvec3> vertices;
  vector<uvec3> indices;
  loadPly(filename, vertices, indices);

  vector<bbox3> bboxes;
  for (auto& index : indices) {
    Triangle t{{vertices[index[0]], vertices[index[1]], vertices[index[2]]}, 0};
    bboxes.push_back(t.bbox().padded());
  }

  BENCHMARK("octahedron.ply - max_primitive = 1") {
    BvhOptions options;
    options.max_primitive = 1;
    return Bvh::create(bboxes, options);
  };
}


TEST_CASE("Renderer-benchmark") {
  Yeml y = Yeml::parseFile(CMAKE_SOURCE_DIR "/data/scene.yaml");
  auto scene_ptr = std::make_shared<const Scene>(loadSceneYeml(y, CMAKE_SOURCE_DIR "/data").build());

  RenderConfig config;
  config.w = 64;
  config.h = 48;
  config.samples_per_pixel = 4;
  config.samples_per_pass = 4;
  config.max_depth = 6;
  config.worker_count = 1;

  BENCHMARK("scene.yaml 64x48 4 spp - 1 worker") {
    return render(scene_ptr, config).passes_completed;
  };

  config.worker_count = 0;
  BENCHMARK("scene.yaml 64x48 4 spp - all workers") {
    return render(scene_ptr, config).passes_completed;
  };
}
