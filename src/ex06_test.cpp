#include <catch2/catch.hpp>

#include <chrono>
#include <cmath>
#include <map>
#include <memory>
#include <thread>

#include "glint/integrator.hpp"
#include "glint/post.hpp"
#include "glint/renderer.hpp"
#include "glint/scene.hpp"


using std::vector;
using namespace glint;


namespace {

// Diffuse sphere on a floor, one panel light and a weak sun
std::shared_ptr<const Scene> makeScene() {
  SceneBuilder builder;
  uint32_t white = builder.addMaterial(Lambertian{SolidColor{fvec3{0.7}}});
  uint32_t red = builder.addMaterial(Lambertian{SolidColor{fvec3{0.7, 0.2, 0.1}}});
  uint32_t lamp = builder.addMaterial(DiffuseLight{SolidColor{fvec3{4}}});
  builder.addShape(Quad{fvec3{-5, 0, -5}, fvec3{10, 0, 0}, fvec3{0, 0, 10}, white});
  builder.addShape(Sphere{fvec3{0, 0.5, 0}, 0.5f, red});
  builder.addShape(Quad{fvec3{-0.5, 2, -0.5}, fvec3{1, 0, 0}, fvec3{0, 0, 1}, lamp});
  builder.addLight(DirectionalLight{fvec3{-1, -1, -1}, fvec3{0.2}});
  builder.background = Background{fvec3{0.1}, fvec3{0.3, 0.4, 0.5}};
  builder.camera.camera_loc = fvec3{0, 1, 4};
  builder.camera.lookat_loc = fvec3{0, 0.5, 0};
  return std::make_shared<const Scene>(builder.build());
}

RenderConfig smallConfig() {
  RenderConfig config;
  config.w = 24;
  config.h = 16;
  config.samples_per_pixel = 6;
  config.samples_per_pass = 4;
  config.max_depth = 4;
  config.tile_size = 8;
  config.worker_count = 1;
  return config;
}

struct RecordingSink : ProgressSink {
  vector<Snapshot> snapshots;
  int num_finished = 0;
  RenderStatus status = RenderStatus::kFailed;
  CancelToken cancel;
  bool cancel_on_snapshot = false;

  void onSnapshot(const Snapshot& snapshot) override {
    snapshots.push_back(snapshot);
    if (cancel_on_snapshot)
      cancel.cancel();
  }

  void onFinish(const RenderOutcome& outcome) override {
    num_finished++;
    status = outcome.status;
  }
};

// Fails for every ray heading right of x = 0.1
struct FaultyIntegrator : Integrator {
  NormalIntegrator inner;
  bool throw_int = false;  // throw something that is not a std::exception

  Sample Li(const Ray& ray, const Scene& scene, Rng& rng) const override {
    if (ray.d[0] > 0.1f) {
      if (throw_int)
        throw 42;
      throw RenderError{"boom"};
    }
    return inner.Li(ray, scene, rng);
  }
};

struct ScalePost : PostProcessor {
  float factor = 2;
  vector<fvec3> process(const Snapshot& snapshot) override {
    vector<fvec3> result = snapshot.pixels;
    for (auto& p : result) p *= factor;
    return result;
  }
};

struct ThrowingPost : PostProcessor {
  vector<fvec3> process(const Snapshot&) override {
    throw std::runtime_error{"denoiser unavailable"};
  }
};

struct TruncatingPost : PostProcessor {
  vector<fvec3> process(const Snapshot& snapshot) override {
    return vector<fvec3>(snapshot.pixels.size() / 2);
  }
};

} // namespace


TEST_CASE("Renderer-config") {
  auto scene = makeScene();

  RenderConfig config = smallConfig();
  config.w = 0;
  CHECK_THROWS_AS(Renderer(scene, config), ConfigError);

  config = smallConfig();
  config.max_depth = 0;
  CHECK_THROWS_AS(render(scene, config), ConfigError);

  config = smallConfig();
  config.integrator = "Nope";
  CHECK_THROWS_AS(render(scene, config), ConfigError);

  CHECK_THROWS_AS(Renderer(nullptr, smallConfig()), ConfigError);
}


TEST_CASE("makeTiles") {
  vector<Tile> tiles = makeTiles(70, 33, 32);
  REQUIRE(tiles.size() == 6);
  CHECK(tiles[2].w() == 6);
  CHECK(tiles[5].h() == 1);

  // Every pixel belongs to exactly one tile
  vector2<int> covered;
  covered.assign(33, 70, 0);
  for (size_t i = 0; i < tiles.size(); i++) {
    REQUIRE(tiles[i].index == (int)i);
    for (int y = tiles[i].y0; y < tiles[i].y1; y++) {
      for (int x = tiles[i].x0; x < tiles[i].x1; x++) {
        covered(y, x)++;
      }
    }
  }
  for (auto c : covered.v) {
    REQUIRE(c == 1);
  }

  CHECK(format("%s", tiles[4]) == "tile 4 [32, 64) x [32, 33)");
}


TEST_CASE("Accumulator") {
  Accumulator acc;
  Sample bad;
  bad.radiance = fvec3{std::nanf(""), kInfinity, -1};
  acc.add(bad);
  Sample good;
  good.radiance = fvec3{0.3f};
  acc.add(good);
  CHECK(acc.count == 2);
  CHECK(acc.mean() == fvec3{0.15f});
  CHECK(Accumulator{}.mean() == fvec3{0});
}


TEST_CASE("Renderer-progressive") {
  auto scene = makeScene();
  RenderConfig config = smallConfig();
  RecordingSink sink;
  RenderOutcome outcome = Renderer{scene, config}.render(&sink);

  REQUIRE(outcome.status == RenderStatus::kCompleted);
  REQUIRE(outcome.passes_completed == 2);
  CHECK(outcome.failures.empty());
  CHECK(sink.num_finished == 1);
  CHECK(sink.status == RenderStatus::kCompleted);

  // One snapshot per pass, the last one equals the outcome
  REQUIRE(sink.snapshots.size() == 2);
  CHECK(sink.snapshots[0].pass == 0);
  CHECK(sink.snapshots[0].samples_completed == 4);
  CHECK(sink.snapshots[1].pass == 1);
  CHECK(sink.snapshots[1].samples_completed == 6);
  CHECK(sink.snapshots[1].progress() == 1);
  CHECK(sink.snapshots[1].estimated_seconds_left == 0);
  CHECK(sink.snapshots[1].pixels == outcome.snapshot.pixels);

  for (size_t i = 0; i < outcome.snapshot.pixels.size(); i++) {
    REQUIRE(sink.snapshots[0].sample_counts[i] == 4);
    REQUIRE(outcome.snapshot.sample_counts[i] == 6);
    for (int k = 0; k < 3; k++) {
      REQUIRE(std::isfinite(outcome.snapshot.pixels[i][k]));
      REQUIRE(outcome.snapshot.pixels[i][k] >= 0);
    }
  }
  CHECK(outcome.snapshot.w == 24);
  CHECK(outcome.snapshot.h == 16);
  CHECK(outcome.snapshot.albedo.empty());
}


TEST_CASE("Renderer-workers") {
  auto scene = makeScene();
  RenderConfig config = smallConfig();

  SECTION("deterministic seeding does not depend on scheduling") {
    RenderOutcome serial = render(scene, config);
    config.worker_count = 4;
    RenderOutcome parallel = render(scene, config);
    config.tile_size = 5;
    RenderOutcome retiled = render(scene, config);

    REQUIRE(serial.status == RenderStatus::kCompleted);
    REQUIRE(parallel.status == RenderStatus::kCompleted);
    CHECK(parallel.snapshot.pixels == serial.snapshot.pixels);
    CHECK(retiled.snapshot.pixels == serial.snapshot.pixels);
    CHECK(parallel.snapshot.sample_counts == serial.snapshot.sample_counts);
  }

  SECTION("per worker seeding") {
    config.seed_policy = SeedPolicy::kPerWorker;
    config.worker_count = 3;
    config.samples_per_pixel = 64;
    config.samples_per_pass = 16;
    RenderOutcome a = render(scene, config);
    config.worker_count = 1;
    RenderOutcome b = render(scene, config);
    REQUIRE(a.status == RenderStatus::kCompleted);

    // No lost or duplicated sample, and the same image up to noise
    double sum_a = 0, sum_b = 0;
    for (size_t i = 0; i < a.snapshot.pixels.size(); i++) {
      REQUIRE(a.snapshot.sample_counts[i] == 64);
      sum_a += a.snapshot.pixels[i][0];
      sum_b += b.snapshot.pixels[i][0];
    }
    CHECK(sum_a == Approx(sum_b).epsilon(0.05));
  }

  SECTION("aux buffers") {
    config.aux_buffers = true;
    config.worker_count = 2;
    RenderOutcome outcome = render(scene, config);
    REQUIRE(outcome.snapshot.albedo.size() == 24 * 16);
    REQUIRE(outcome.snapshot.normal.size() == 24 * 16);
    for (auto& n : outcome.snapshot.normal) {
      float len = glm::length(n);
      REQUIRE((len == Approx(1).margin(1e-4) || len == 0));
    }
  }
}


TEST_CASE("Renderer-cancel") {
  auto scene = makeScene();
  RenderConfig config = smallConfig();
  config.worker_count = 2;

  SECTION("before start") {
    CancelToken cancel;
    cancel.cancel();
    RecordingSink sink;
    RenderOutcome outcome = Renderer{scene, config}.render(&sink, cancel);
    CHECK(outcome.status == RenderStatus::kCancelled);
    CHECK(outcome.passes_completed == 0);
    CHECK(sink.snapshots.empty());
    CHECK(sink.num_finished == 1);
    CHECK(outcome.snapshot.pass == -1);
    REQUIRE(outcome.snapshot.pixels.size() == 24 * 16);
    for (size_t i = 0; i < outcome.snapshot.pixels.size(); i++) {
      REQUIRE(outcome.snapshot.pixels[i] == fvec3{0});
      REQUIRE(outcome.snapshot.sample_counts[i] == 0);
    }
  }

  SECTION("after the first pass") {
    RecordingSink sink;
    sink.cancel_on_snapshot = true;
    config.samples_per_pixel = 12;
    RenderOutcome outcome = Renderer{scene, config}.render(&sink, sink.cancel);
    CHECK(outcome.status == RenderStatus::kCancelled);
    CHECK(outcome.passes_completed == 1);
    CHECK(outcome.snapshot.pass == 0);
    REQUIRE(sink.snapshots.size() == 1);
    CHECK(outcome.snapshot.pixels == sink.snapshots[0].pixels);
    for (auto count : outcome.snapshot.sample_counts) {
      REQUIRE(count == 4);
    }
  }

  SECTION("timeout") {
    config.w = 32;
    config.h = 32;
    config.samples_per_pixel = 1000000;
    config.samples_per_pass = 1;
    CancelToken cancel;
    auto begin = std::chrono::steady_clock::now();
    RenderOutcome outcome;
    {
      CancelTimer timer{cancel, std::chrono::milliseconds{200}};
      outcome = Renderer{scene, config}.render(nullptr, cancel);
      CHECK(timer.fired.load());
    }
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
    CHECK(seconds < 10);
    CHECK(outcome.status == RenderStatus::kCancelled);

    // The snapshot is a whole number of passes
    CHECK(outcome.snapshot.samples_completed == outcome.passes_completed);
    for (auto count : outcome.snapshot.sample_counts) {
      REQUIRE((int)count == outcome.snapshot.samples_completed);
    }
  }
}


TEST_CASE("CancelTimer") {
  CancelToken fires;
  {
    CancelTimer timer{fires, std::chrono::milliseconds{10}};
    for (int i = 0; i < 200 && !fires.isCancelled(); i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    CHECK(timer.fired.load());
  }
  CHECK(fires.isCancelled());

  // Destroyed before the deadline
  CancelToken quiet;
  auto begin = std::chrono::steady_clock::now();
  {
    CancelTimer timer{quiet, std::chrono::seconds{30}};
  }
  double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
  CHECK(seconds < 5);
  CHECK_FALSE(quiet.isCancelled());

  // Copies share the flag
  CancelToken a;
  CancelToken b = a;
  b.cancel();
  CHECK(a.isCancelled());
}


TEST_CASE("Renderer-failure") {
  auto scene = makeScene();
  RenderConfig config = smallConfig();
  config.w = 32;
  config.worker_count = 3;
  config.samples_per_pixel = 8;
  Renderer renderer{scene, config, std::make_shared<FaultyIntegrator>()};
  RecordingSink sink;
  RenderOutcome outcome = renderer.render(&sink);

  REQUIRE(outcome.status == RenderStatus::kFailed);
  CHECK(sink.status == RenderStatus::kFailed);
  CHECK(outcome.passes_completed == 2);
  REQUIRE(!outcome.failures.empty());

  vector<Tile> tiles = makeTiles(config.w, config.h, config.tile_size);
  REQUIRE(outcome.failures.size() < tiles.size() * 2);

  std::map<int, int> missing;  // tile index -> samples lost
  for (auto& failure : outcome.failures) {
    CHECK(failure.message == "boom");
    missing[failure.tile.index] += config.samplesInPass(failure.pass);
  }

  // Failed tiles lose exactly their failed passes, every other tile is complete
  for (auto& tile : tiles) {
    int expected = config.samples_per_pixel - missing[tile.index];
    for (int y = tile.y0; y < tile.y1; y++) {
      for (int x = tile.x0; x < tile.x1; x++) {
        REQUIRE((int)outcome.snapshot.sample_counts[y * config.w + x] == expected);
      }
    }
  }
  // The left edge looks away from the faulty direction
  CHECK(missing[0] == 0);
}


TEST_CASE("Renderer-failure-non-std-exception") {
  auto scene = makeScene();
  RenderConfig config = smallConfig();
  config.worker_count = 2;
  auto integrator = std::make_shared<FaultyIntegrator>();
  integrator->throw_int = true;
  Renderer renderer{scene, config, integrator};
  RecordingSink sink;

  RenderOutcome outcome;
  REQUIRE_NOTHROW(outcome = renderer.render(&sink));
  CHECK(outcome.status == RenderStatus::kFailed);
  CHECK(sink.num_finished == 1);
  CHECK(sink.status == RenderStatus::kFailed);
  CHECK(outcome.passes_completed == config.numPasses());
  REQUIRE(!outcome.failures.empty());
  for (auto& failure : outcome.failures) {
    CHECK(failure.message == "unknown exception");
  }
}


TEST_CASE("Renderer-example") {
  // One sphere, one directional light, Lambertian, 4x4, 16 spp, max depth 4
  fvec3 background{0.2, 0.3, 0.4};
  SceneBuilder builder;
  builder.addMaterial(Lambertian{SolidColor{fvec3{0.8, 0.5, 0.3}}});
  builder.addShape(Sphere{fvec3{0}, 0.8f, 0});
  builder.addLight(DirectionalLight{fvec3{0, -1, -1}, fvec3{1}});
  builder.background = Background::constant(background);
  builder.camera.camera_loc = fvec3{0, 0, 5};
  builder.camera.lookat_loc = fvec3{0};
  builder.camera.yfov = 40.0f * kPi / 180.0f;
  auto scene = std::make_shared<const Scene>(builder.build());

  RenderConfig config;
  config.w = 4;
  config.h = 4;
  config.samples_per_pixel = 16;
  config.max_depth = 4;
  config.worker_count = 2;
  RenderOutcome outcome = render(scene, config);

  REQUIRE(outcome.status == RenderStatus::kCompleted);
  REQUIRE(outcome.snapshot.pixels.size() == 16);
  for (auto& p : outcome.snapshot.pixels) {
    for (int k = 0; k < 3; k++) {
      REQUIRE(p[k] >= 0);
      REQUIRE(p[k] <= 1);
    }
  }

  // Corner pixels never see the sphere
  for (auto i : {0, 3, 12, 15}) {
    REQUIRE(outcome.snapshot.pixels[i] == background);
  }
  // The center ones always do
  for (auto i : {5, 6, 9, 10}) {
    REQUIRE(outcome.snapshot.pixels[i] != background);
  }
}


TEST_CASE("estimateSecondsLeft") {
  CHECK(estimateSecondsLeft(1, 1, 100) == Approx(99));
  CHECK(estimateSecondsLeft(50, 50, 100) == Approx(50));
  CHECK(estimateSecondsLeft(1, 100, 100) == 0);
  CHECK(estimateSecondsLeft(1, 0, 100) == 0);
}


TEST_CASE("PostProcessor") {
  Snapshot snapshot = Snapshot::zero(4, 2, 1, 1);
  snapshot.pixels[3] = fvec3{0.25};

  CHECK(applyPostProcessor(nullptr, snapshot) == snapshot.pixels);

  ScalePost scale;
  vector<fvec3> scaled = applyPostProcessor(&scale, snapshot);
  CHECK(scaled[3] == fvec3{0.5});

  ThrowingPost throwing;
  CHECK(applyPostProcessor(&throwing, snapshot) == snapshot.pixels);

  TruncatingPost truncating;
  CHECK(applyPostProcessor(&truncating, snapshot) == snapshot.pixels);
}
