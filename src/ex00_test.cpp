#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <sstream>

#include "glint/bvh.hpp"
#include "glint/format.hpp"
#include "glint/ply.hpp"
#include "glint/sampling.hpp"
#include "glint/shape.hpp"


using std::vector;
using namespace glint;


TEST_CASE("format") {
  fvec3 v = {1, 2, 3};
  CHECK(format("%s", v) == "[1.000, 2.000, 3.000]");
  CHECK(format("%d %s", 7, std::string{"x"}) == "7 x");
  CHECK(format("%s", bbox3{fvec3{0}, fvec3{1}}) ==
      "[[0.000, 0.000, 0.000], [1.000, 1.000, 1.000]]");
  CHECK(format("%s", vector<int>{1, 2, 3}) == "{1, 2, 3}");
}

TEST_CASE("loadPly") {
  vector<fvec3> vertices;
  vector<uvec3> indices;

  SECTION("octahedron") {
    loadPly(CMAKE_SOURCE_DIR "/data/octahedron.ply", vertices, indices);
    REQUIRE(vertices.size() == 6);
    REQUIRE(indices.size() == 8);
    CHECK(vertices[0] == fvec3{3, 0, 0});
    CHECK(vertices[5] == fvec3{-3, 0, 0});
    CHECK(indices[0] == uvec3{0, 1, 2});
    CHECK(indices[7] == uvec3{5, 1, 4});
  }

  SECTION("quad faces") {
    std::istringstream istr{
        "ply\n"
        "format ascii 1.0\n"
        "element vertex 4\n"
        "property float x\n"
        "property float y\n"
        "property float z\n"
        "element face 1\n"
        "property list uchar int vertex_indices\n"
        "end_header\n"
        "0 0 0\n"
        "1 0 0\n"
        "1 1 0\n"
        "0 1 0\n"
        "4 0 1 2 3\n"};
    loadPly(istr, vertices, indices);
    REQUIRE(indices.size() == 2);
    CHECK(indices[0] == uvec3{0, 1, 2});
    CHECK(indices[1] == uvec3{0, 2, 3});
  }

  SECTION("errors") {
    std::istringstream bad_magic{"plx\n"};
    CHECK_THROWS_WITH(loadPly(bad_magic, vertices, indices), "ply:1: missing magic \"ply\"");

    std::istringstream binary{"ply\nformat binary_little_endian 1.0\n"};
    CHECK_THROWS_AS(loadPly(binary, vertices, indices), ConstructionError);

    std::istringstream out_of_range{
        "ply\nformat ascii 1.0\nelement vertex 1\nelement face 1\nend_header\n"
        "0 0 0\n"
        "3 0 0 1\n"};
    CHECK_THROWS_WITH(loadPly(out_of_range, vertices, indices), "ply:7: face index 1 out of range");

    CHECK_THROWS_AS(loadPly("no-such-file.ply", vertices, indices), ConstructionError);
  }
}

TEST_CASE("bbox3::rayIntersect") {
  bbox3 box{fvec3{0}, fvec3{1}};
  float t;

  SECTION("basic") {
    CHECK(box.rayIntersect(Ray{{-1, 0.5, 0.5}, {1, 0, 0}}, 0, kInfinity, t));
    CHECK(t == Approx(1));
    CHECK_FALSE(box.rayIntersect(Ray{{-1, 2, 0.5}, {1, 0, 0}}, 0, kInfinity, t));

    // Box behind the ray
    CHECK_FALSE(box.rayIntersect(Ray{{2, 0.5, 0.5}, {1, 0, 0}}, 0, kInfinity, t));

    // Box beyond tmax
    CHECK_FALSE(box.rayIntersect(Ray{{-3, 0.5, 0.5}, {1, 0, 0}}, 0, 1, t));

    // Starting inside
    CHECK(box.rayIntersect(Ray{{0.5, 0.5, 0.5}, {0, 0, 1}}, 0, kInfinity, t));
    CHECK(t == 0);
  }

  SECTION("zero direction components") {
    // Running exactly on the y = 0 face
    CHECK(box.rayIntersect(Ray{{-1, 0, 0.5}, {1, 0, 0}}, 0, kInfinity, t));
    CHECK(t == Approx(1));

    // Parallel outside of the slab
    CHECK_FALSE(box.rayIntersect(Ray{{-1, -0.5, 0.5}, {1, 0, 0}}, 0, kInfinity, t));

    // Degenerate direction is only "inside" or "outside"
    CHECK(box.rayIntersect(Ray{{0.5, 0.5, 0.5}, {0, 0, 0}}, 0, kInfinity, t));
    CHECK_FALSE(box.rayIntersect(Ray{{1.5, 0.5, 0.5}, {0, 0, 0}}, 0, kInfinity, t));
  }

  SECTION("empty") {
    CHECK_FALSE(bbox3::empty().rayIntersect(Ray{{0, 0, 0}, {1, 1, 1}}, 0, kInfinity, t));
    CHECK_FALSE(bbox3::empty().rayIntersect(Ray{{0, 0, 0}, {0, 0, 0}}, 0, kInfinity, t));
  }
}

TEST_CASE("Shape-intersect") {
  HitRecord hit;

  SECTION("sphere") {
    Sphere s{fvec3{0}, 1, 3};
    REQUIRE(s.rayIntersect(Ray{{0, 0, 5}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(4));
    CHECK(hit.front_face);
    CHECK(hit.n_geo == fvec3{0, 0, 1});
    CHECK(hit.material == 3);

    // From inside the normal faces the ray
    REQUIRE(s.rayIntersect(Ray{{0, 0, 0}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(1));
    CHECK_FALSE(hit.front_face);
    CHECK(hit.n_geo == fvec3{0, 0, 1});

    CHECK_FALSE(s.rayIntersect(Ray{{0, 2, 5}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK_FALSE(s.rayIntersect(Ray{{0, 0, 5}, {0, 0, -1}}, kRayTmin, 3.5f, hit));
  }

  SECTION("triangle") {
    Triangle tri{{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}, 0};
    REQUIRE(tri.rayIntersect(Ray{{0.25, 0.25, 1}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(1));
    CHECK(hit.uv[0] == Approx(0.25));
    CHECK(hit.uv[1] == Approx(0.25));
    CHECK(hit.front_face);

    CHECK_FALSE(tri.rayIntersect(Ray{{0.75, 0.75, 1}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK_FALSE(tri.rayIntersect(Ray{{0.25, 0.25, 1}, {1, 0, 0}}, kRayTmin, kInfinity, hit));

    CHECK(Triangle{{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}}, 0}.isDegenerate());
    CHECK_FALSE(tri.isDegenerate());
  }

  SECTION("quad") {
    Quad quad{fvec3{0}, fvec3{2, 0, 0}, fvec3{0, 1, 0}, 0};
    REQUIRE(quad.rayIntersect(Ray{{1, 0.5, 1}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(1));
    CHECK(hit.uv[0] == Approx(0.5));
    CHECK(hit.uv[1] == Approx(0.5));

    CHECK_FALSE(quad.rayIntersect(Ray{{3, 0.5, 1}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(quad.area() == Approx(2));
  }

  SECTION("sampleToward") {
    // Cone sampling from outside, every sample lands on the sphere
    Sphere s{fvec3{0, 0, -3}, 1, 0};
    Rng rng;
    for (int i = 0; i < 100; i++) {
      SurfaceSample ss;
      REQUIRE(s.sampleToward(fvec3{0}, rng.uniform2(), ss));
      CHECK(glm::length(ss.p - s.center) == Approx(1).margin(1e-4));
      CHECK(ss.pdf > 0);
    }

    // Area pdf converted to solid angle, looking straight at the quad
    Quad quad{fvec3{-1, -1, -2}, fvec3{2, 0, 0}, fvec3{0, 2, 0}, 0};
    SurfaceSample ss;
    REQUIRE(quad.sampleToward(fvec3{0}, fvec2{0.5, 0.5}, ss));
    CHECK(ss.p == fvec3{0, 0, -2});
    CHECK(ss.pdf == Approx(4.0f / 4.0f));
  }
}


TEST_CASE("bbox3::rayInterval") {
  bbox3 box{fvec3{-1}, fvec3{1}};
  float t0, t1;
  REQUIRE(box.rayInterval(Ray{{0, 0, -5}, {0, 0, 1}}, 0, kInfinity, t0, t1));
  CHECK(t0 == Approx(4));
  CHECK(t1 == Approx(6));

  // Starting inside clamps the entry to ray_tmin
  REQUIRE(box.rayInterval(Ray{{0, 0, 0}, {0, 0, 1}}, 0.5f, kInfinity, t0, t1));
  CHECK(t0 == Approx(0.5));
  CHECK(t1 == Approx(1));

  CHECK_FALSE(box.rayInterval(Ray{{0, 0, -5}, {0, 0, 1}}, 0, 3.0f, t0, t1));
}

TEST_CASE("Shape-instance") {
  HitRecord hit;
  Quad quad{fvec3{0}, fvec3{1, 0, 0}, fvec3{0, 1, 0}, 2};

  SECTION("translate") {
    Instance inst = Instance::create(quad, fvec3{0, 0, -3}, 0);
    REQUIRE(inst.rayIntersect(Ray{{0.5, 0.5, 0}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(3));
    CHECK(hit.p[2] == Approx(-3));
    CHECK(hit.material == 2);
    CHECK(hit.front_face);
    CHECK(inst.centroid()[2] == Approx(-3));
    CHECK_FALSE(inst.rayIntersect(Ray{{1.5, 0.5, 0}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
  }

  SECTION("rotate_y") {
    // +90 degrees maps local (x, y, z) to (z, y, -x): the quad now lies in the x = 0 plane
    Instance inst = Instance::create(quad, fvec3{0}, 90);
    REQUIRE(inst.rayIntersect(Ray{{2, 0.5, -0.5}, {-1, 0, 0}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(2));
    CHECK(hit.p[0] == Approx(0).margin(1e-5));
    CHECK(hit.p[2] == Approx(-0.5));
    CHECK(hit.n_geo[0] == Approx(1));
    CHECK(hit.uv[0] == Approx(0.5));
    CHECK(hit.front_face);

    bbox3 b = inst.bbox();
    CHECK(b.bmin[2] == Approx(-1));
    CHECK(b.bmax[2] == Approx(0).margin(1e-5));
    CHECK(b.bmax[1] == Approx(1));
    CHECK(b.extent()[0] == Approx(0).margin(1e-5));
  }

  SECTION("sampleToward") {
    // Same light as the plain quad test, placed by an offset
    Instance inst = Instance::create(Quad{fvec3{-1, -1, 0}, fvec3{2, 0, 0}, fvec3{0, 2, 0}, 0}, fvec3{0, 0, -2}, 0);
    SurfaceSample ss;
    REQUIRE(inst.sampleToward(fvec3{0}, fvec2{0.5, 0.5}, ss));
    CHECK(ss.p == fvec3{0, 0, -2});
    CHECK(ss.pdf == Approx(1));
  }

  SECTION("shape helpers") {
    Shape shape = Instance::create(Sphere{fvec3{0}, 1, 4}, fvec3{3, 0, 0}, 30);
    CHECK(shapeMaterial(shape) == 4);
    CHECK(shapeCentroid(shape)[0] == Approx(3));
    CHECK(shapeIntersect(shape, Ray{{3, 0, 5}, {0, 0, -1}}, kRayTmin, kInfinity, hit));
    CHECK(hit.t == Approx(4));
  }
}

TEST_CASE("Shape-medium") {
  HitRecord hit;
  Rng rng{0x5eed, 3};

  // Fraction of parallel rays scattering inside [-1, 1]^3 along z, within [ray_tmin, ray_tmax]
  auto scatteredFraction = [&](const ConstantMedium& medium, float ray_tmax) {
    int n = 20000, count = 0;
    for (int i = 0; i < n; i++) {
      fvec3 o{rng.uniform() - 0.5f, rng.uniform() - 0.5f, -5};
      Ray ray{o, fvec3{0, 0, 1}, 0, rng.next()};
      if (medium.rayIntersect(ray, kRayTmin, ray_tmax, hit)) {
        REQUIRE(hit.t >= 4.0f - 1e-4f);
        REQUIRE(hit.t <= fminf(6.0f, ray_tmax) + 1e-4f);
        REQUIRE(hit.material == 1);
        count++;
      }
    }
    return (double)count / n;
  };

  SECTION("box transmittance") {
    ConstantMedium medium{bbox3{fvec3{-1}, fvec3{1}}, 0.5f, 1};
    CHECK(scatteredFraction(medium, kInfinity) == Approx(1 - std::exp(-1.0)).margin(0.02));
    CHECK(scatteredFraction(medium, 4.5f) == Approx(1 - std::exp(-0.25)).margin(0.02));
  }

  SECTION("sphere boundary from inside") {
    ConstantMedium medium{Sphere{fvec3{0}, 1, 0}, 1.0f, 1};
    int n = 20000, count = 0;
    for (int i = 0; i < n; i++) {
      if (medium.rayIntersect(Ray{fvec3{0}, fvec3{1, 0, 0}, 0, rng.next()}, kRayTmin, kInfinity, hit)) {
        REQUIRE(hit.t <= 1.0f + 1e-4f);
        count++;
      }
    }
    CHECK((double)count / n == Approx(1 - std::exp(-1.0)).margin(0.02));
  }

  SECTION("pure function of the ray") {
    ConstantMedium medium{bbox3{fvec3{-1}, fvec3{1}}, 2.0f, 1};
    for (int i = 0; i < 100; i++) {
      Ray ray{fvec3{0, 0, -5}, fvec3{0, 0, 1}, 0, rng.next()};
      HitRecord a, b;
      bool hit_a = medium.rayIntersect(ray, kRayTmin, kInfinity, a);
      bool hit_b = medium.rayIntersect(ray, kRayTmin, kInfinity, b);
      REQUIRE(hit_a == hit_b);
      if (hit_a) REQUIRE(a.t == b.t);
    }
  }

  SECTION("misses and sampling") {
    ConstantMedium medium{bbox3{fvec3{-1}, fvec3{1}}, 100.0f, 1};
    CHECK_FALSE(medium.rayIntersect(Ray{{0, 3, -5}, {0, 0, 1}}, kRayTmin, kInfinity, hit));
    SurfaceSample ss;
    CHECK_FALSE(medium.sampleToward(fvec3{0, 0, -5}, fvec2{0.5}, ss));
    CHECK(medium.bbox().bmax == fvec3{1});
  }
}

TEST_CASE("makeBox") {
  vector<Quad> sides = makeBox(fvec3{1, 2, 3}, fvec3{0}, 5);
  REQUIRE(sides.size() == 6);
  fvec3 center{0.5, 1, 1.5};
  float area = 0;
  for (auto& q : sides) {
    // Every face points away from the center
    CHECK(glm::dot(glm::cross(q.u, q.v), q.centroid() - center) > 0);
    CHECK(q.material == 5);
    area += q.area();
  }
  CHECK(area == Approx(2 * (1 * 2 + 2 * 3 + 1 * 3)));
}

namespace {

//
// Structural checks against the input boxes
//
void checkBvh(const Bvh& bvh, const vector<bbox3>& bboxes) {
  size_t num_prims = bboxes.size();

  // "primitives" is a permutation
  vector<uint32_t> sorted = bvh.primitives;
  std::sort(sorted.begin(), sorted.end());
  REQUIRE(sorted.size() == num_prims);
  for (uint32_t i = 0; i < num_prims; i++) {
    REQUIRE(sorted[i] == i);
  }

  // full binary tree
  REQUIRE(bvh.nodes.size() == 2 * bvh.num_leaves - 1);
  REQUIRE(bvh.num_leaves <= num_prims);

  // every primitive is in exactly one leaf, node boxes are tight unions
  vector<int> seen(num_prims, 0);
  uint32_t max_depth = 0;
  std::function<bbox3(uint32_t, uint32_t)> visit = [&](uint32_t i, uint32_t depth) -> bbox3 {
    max_depth = std::max(max_depth, depth);
    const BvhNode& node = bvh.nodes[i];
    bbox3 expected = bbox3::empty();
    if (node.isLeaf()) {
      REQUIRE(node.num_primitives >= 1);
      REQUIRE(node.num_primitives <= bvh.options.max_primitive);
      for (auto k = 0; k < node.num_primitives; k++) {
        uint32_t prim = bvh.primitives[node.begin + k];
        seen[prim]++;
        REQUIRE(node.bbox.contains(bboxes[prim]));
        expected = bbox3::opUnion(expected, bboxes[prim]);
      }
    } else {
      REQUIRE(node.begin + 1 < bvh.nodes.size());
      expected = bbox3::opUnion(visit(node.begin, depth + 1), visit(node.begin + 1, depth + 1));
      REQUIRE(node.bbox.contains(bvh.nodes[node.begin].bbox));
      REQUIRE(node.bbox.contains(bvh.nodes[node.begin + 1].bbox));
    }
    REQUIRE(node.bbox == expected);
    return node.bbox;
  };
  visit(0, 1);
  REQUIRE(max_depth == bvh.depth);
  for (auto count : seen) {
    REQUIRE(count == 1);
  }
}

fvec3 randomPoint(Rng& rng, float lo, float hi) {
  return fvec3{rng.uniform(), rng.uniform(), rng.uniform()} * (hi - lo) + lo;
}

vector<Shape> randomShapes(Rng& rng, int n) {
  vector<Shape> shapes;
  for (int i = 0; i < n; i++) {
    fvec3 c = randomPoint(rng, -1, 1);
    if (i % 2 == 0) {
      shapes.push_back(Sphere{c, 0.01f + 0.08f * rng.uniform(), 0});
    } else {
      shapes.push_back(Triangle{{c, c + randomPoint(rng, -0.15f, 0.15f), c + randomPoint(rng, -0.15f, 0.15f)}, 0});
    }
  }
  return shapes;
}

vector<bbox3> shapeBboxes(const vector<Shape>& shapes) {
  vector<bbox3> result;
  for (auto& shape : shapes) {
    result.push_back(shapeBbox(shape).padded());
  }
  return result;
}

bool bvhIntersect(
    const Bvh& bvh, const vector<Shape>& shapes, const Ray& ray,
    /*out*/ float& hit_t, bool any_hit = false) {
  return bvh.rayIntersect(ray, kRayTmin, kInfinity,
      [&](uint32_t prim, float tmin, float tmax, float& t) {
        HitRecord hit;
        if (!shapeIntersect(shapes[prim], ray, tmin, tmax, hit))
          return false;
        t = hit_t = hit.t;
        return true;
      }, any_hit);
}

bool bruteIntersect(const vector<Shape>& shapes, const Ray& ray, /*out*/ float& hit_t) {
  bool result = false;
  float tmax = kInfinity;
  for (auto& shape : shapes) {
    HitRecord hit;
    if (shapeIntersect(shape, ray, kRayTmin, tmax, hit)) {
      result = true;
      tmax = hit_t = hit.t;
    }
  }
  return result;
}

} // namespace


TEST_CASE("Bvh-simple") {
  // 8 small triangles at corners of [-1, 1]^3
  vector<Shape> shapes;
  for (auto x : {-1.0f, 1.0f}) {
    for (auto y : {-1.0f, 1.0f}) {
      for (auto z : {-1.0f, 1.0f}) {
        fvec3 p{x, y, z};
        shapes.push_back(Triangle{{
            p + fvec3{0.1f * x, 0, 0},
            p + fvec3{0, 0.1f * y, 0},
            p + fvec3{0, 0, 0.1f * z}}, 0});
      }
    }
  }
  vector<bbox3> bboxes = shapeBboxes(shapes);

  SECTION("node counts") {
    BvhOptions options;
    options.max_primitive = 8;
    CHECK(Bvh::create(bboxes, options).nodes.size() == 1);
    options.max_primitive = 4;
    CHECK(Bvh::create(bboxes, options).nodes.size() == 3);
    options.max_primitive = 2;
    CHECK(Bvh::create(bboxes, options).nodes.size() == 7);
    options.max_primitive = 1;
    CHECK(Bvh::create(bboxes, options).nodes.size() == 15);
  }

  SECTION("ray") {
    Bvh bvh = Bvh::create(bboxes);
    checkBvh(bvh, bboxes);

    // Toward the (+1, +1, +1) corner triangle, through its centroid
    Ray ray{fvec3{2}, fvec3{-1}};
    float t = 0;
    uint32_t hit_prim = 0;
    bool hit = bvh.rayIntersect(ray, kRayTmin, kInfinity,
        [&](uint32_t prim, float tmin, float tmax, float& t_out) {
          HitRecord h;
          if (!shapeIntersect(shapes[prim], ray, tmin, tmax, h))
            return false;
          t = t_out = h.t;
          hit_prim = prim;
          return true;
        });
    REQUIRE(hit);
    CHECK(hit_prim == 7);
    CHECK(ray.at(t)[0] == Approx(3.1f / 3.0f));

    // Through the gap in the middle
    CHECK_FALSE(bvhIntersect(bvh, shapes, Ray{fvec3{2, 0, 0}, fvec3{-1, 0, 0}}, t));
  }
}

TEST_CASE("Bvh-octahedron") {
  vector<fvec3> vertices;
  vector<uvec3> indices;
  loadPly(CMAKE_SOURCE_DIR "/data/octahedron.ply", vertices, indices);
  vector<Shape> shapes;
  for (auto& index : indices) {
    shapes.push_back(Triangle{{vertices[index[0]], vertices[index[1]], vertices[index[2]]}, 0});
  }
  vector<bbox3> bboxes = shapeBboxes(shapes);

  for (auto split : {SplitPolicy::kMiddle, SplitPolicy::kSah}) {
    BvhOptions options;
    options.split = split;
    options.max_primitive = 1;
    Bvh bvh = Bvh::create(bboxes, options);
    checkBvh(bvh, bboxes);
    CHECK(bvh.num_leaves == 8);
    CHECK(bvh.bbox().contains(bbox3{fvec3{-3, -2, -1}, fvec3{3, 2, 1}}));

    // Every axis direction hits a vertex tip from outside
    float t;
    CHECK(bvhIntersect(bvh, shapes, Ray{fvec3{5, 0.01f, 0.01f}, fvec3{-1, 0, 0}}, t));
    CHECK(t == Approx(2).margin(0.1));
    CHECK(bvhIntersect(bvh, shapes, Ray{fvec3{0.01f, 0.01f, 5}, fvec3{0, 0, -1}}, t));
    CHECK(t == Approx(4).margin(0.1));
  }
}

TEST_CASE("Bvh-random") {
  Rng rng{0xcafe, 1};
  vector<Shape> shapes = randomShapes(rng, 600);
  vector<bbox3> bboxes = shapeBboxes(shapes);

  auto policy = GENERATE(SplitPolicy::kMiddle, SplitPolicy::kSah);
  auto max_primitive = GENERATE(1, 2, 5);
  BvhOptions options;
  options.split = policy;
  options.max_primitive = max_primitive;
  Bvh bvh = Bvh::create(bboxes, options);
  checkBvh(bvh, bboxes);

  SECTION("parallel build gives the same hierarchy") {
    BvhOptions parallel = options;
    parallel.parallel_threshold = 16;
    parallel.max_spawn_depth = 6;
    Bvh other = Bvh::create(bboxes, parallel);
    REQUIRE(other.primitives == bvh.primitives);
    REQUIRE(other.nodes.size() == bvh.nodes.size());
    for (size_t i = 0; i < bvh.nodes.size(); i++) {
      REQUIRE(other.nodes[i].bbox == bvh.nodes[i].bbox);
      REQUIRE(other.nodes[i].begin == bvh.nodes[i].begin);
      REQUIRE(other.nodes[i].isLeaf() == bvh.nodes[i].isLeaf());
    }
    CHECK(other.depth == bvh.depth);
  }

  SECTION("same answers as brute force") {
    int num_hits = 0;
    for (int i = 0; i < 2000; i++) {
      Ray ray{randomPoint(rng, -1.5f, 1.5f), glm::normalize(randomPoint(rng, -1, 1))};
      float t_bvh = 0, t_brute = 0, t_any = 0;
      bool hit_bvh = bvhIntersect(bvh, shapes, ray, t_bvh);
      bool hit_brute = bruteIntersect(shapes, ray, t_brute);
      REQUIRE(hit_bvh == hit_brute);
      REQUIRE(bvhIntersect(bvh, shapes, ray, t_any, /*any_hit*/ true) == hit_brute);
      if (hit_brute) {
        REQUIRE(t_bvh == t_brute);
        num_hits++;
      }
    }
    // Sanity: the scene is not empty space
    CHECK(num_hits > 100);
  }
}

TEST_CASE("Bvh-sah") {
  // Heavily overlapping boxes make a single leaf cheaper than any split,
  // the range is split anyway until leaves respect max_primitive
  vector<bbox3> bboxes;
  for (int i = 0; i < 4; i++) {
    bboxes.push_back(bbox3{fvec3{-10 + 0.1f * i}, fvec3{10 + 0.1f * i}});
  }
  BvhOptions options;
  options.split = SplitPolicy::kSah;
  options.max_primitive = 1;
  Bvh bvh = Bvh::create(bboxes, options);
  checkBvh(bvh, bboxes);
  CHECK(bvh.num_leaves == 4);
  CHECK_FALSE(bvh.nodes[0].isLeaf());
}

TEST_CASE("Bvh-degenerate") {
  SECTION("empty") {
    Bvh bvh = Bvh::create({});
    REQUIRE(bvh.nodes.size() == 1);
    CHECK(bvh.nodes[0].isLeaf());
    CHECK(bvh.bbox().isEmpty());
    float t;
    CHECK_FALSE(bvhIntersect(bvh, {}, Ray{fvec3{0}, fvec3{1, 0, 0}}, t));

    // Never built
    CHECK_FALSE(bvhIntersect(Bvh{}, {}, Ray{fvec3{0}, fvec3{1, 0, 0}}, t));
  }

  SECTION("coincident centroids") {
    vector<bbox3> bboxes(9, bbox3{fvec3{-1}, fvec3{1}});
    Bvh bvh = Bvh::create(bboxes);
    checkBvh(bvh, bboxes);
  }

  SECTION("invalid bounds") {
    CHECK_THROWS_AS(Bvh::create({bbox3{fvec3{0}, fvec3{kInfinity}}}), ConstructionError);
    CHECK_THROWS_AS(Bvh::create({bbox3{fvec3{0}, fvec3{1}}, bbox3::empty()}), ConstructionError);
    BvhOptions options;
    options.max_primitive = 0;
    CHECK_THROWS_AS(Bvh::create({bbox3{fvec3{0}, fvec3{1}}}, options), ConstructionError);
  }
}
