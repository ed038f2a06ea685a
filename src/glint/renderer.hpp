#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "camera.hpp"
#include "common.hpp"
#include "config.hpp"
#include "format.hpp"
#include "geometry.hpp"
#include "image.hpp"
#include "integrator.hpp"
#include "sampling.hpp"
#include "scene.hpp"


namespace glint {

using std::vector;


//
// Tiles: [x0, x1) x [y0, y1), row major over the image
//
struct Tile {
  int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
  int index = 0;

  int w() const { return x1 - x0; }
  int h() const { return y1 - y0; }

  friend std::ostream& operator<<(std::ostream& os, const Tile& t) {
    os << format("tile %d [%d, %d) x [%d, %d)", t.index, t.x0, t.x1, t.y0, t.y1);
    return os;
  }
};

inline vector<Tile> makeTiles(int w, int h, int tile_size) {
  vector<Tile> tiles;
  for (int y = 0; y < h; y += tile_size) {
    for (int x = 0; x < w; x += tile_size) {
      Tile t;
      t.x0 = x;
      t.y0 = y;
      t.x1 = std::min(x + tile_size, w);
      t.y1 = std::min(y + tile_size, h);
      t.index = static_cast<int>(tiles.size());
      tiles.push_back(t);
    }
  }
  return tiles;
}


//
// Per pixel running sums (double so that repeated identical samples average back exactly)
//
struct Accumulator {
  dvec3 sum{0};
  dvec3 albedo{0};
  dvec3 normal{0};
  uint32_t count = 0;

  void add(const Sample& sample) {
    sum += dvec3{sanitize(sample.radiance)};
    albedo += dvec3{sanitize(sample.albedo)};
    normal += dvec3{isFinite(sample.normal) ? sample.normal : fvec3{0}};
    count++;
  }

  void merge(const Accumulator& other) {
    sum += other.sum;
    albedo += other.albedo;
    normal += other.normal;
    count += other.count;
  }

  fvec3 mean() const {
    return count > 0 ? fvec3{sum / (double)count} : fvec3{0};
  }
};


struct Framebuffer {
  vector2<Accumulator> pixels;

  int w() const { return static_cast<int>(pixels.num_cols); }
  int h() const { return static_cast<int>(pixels.num_rows); }

  void reset(int w, int h) {
    pixels.assign(h, w, Accumulator{});
  }

  // Only the worker that completed `tile` calls this, tiles never overlap
  void merge(const Tile& tile, const vector<Accumulator>& local) {
    for (int y = tile.y0; y < tile.y1; y++) {
      for (int x = tile.x0; x < tile.x1; x++) {
        pixels(y, x).merge(local[(y - tile.y0) * tile.w() + (x - tile.x0)]);
      }
    }
  }
};


//
// Immutable copy of the framebuffer means, published after each pass
//
struct Snapshot {
  int w = 0, h = 0;
  vector<fvec3> pixels;             // mean linear radiance, row major, row 0 at the top
  vector<uint32_t> sample_counts;
  vector<fvec3> albedo;             // empty unless aux buffers are requested
  vector<fvec3> normal;
  int pass = -1;                    // last completed pass (-1: none)
  int num_passes = 0;
  int samples_completed = 0;        // per pixel, over completed passes
  int samples_per_pixel = 0;
  double elapsed_seconds = 0;
  double estimated_seconds_left = 0;

  float progress() const {
    return samples_per_pixel > 0 ? (float)samples_completed / samples_per_pixel : 0;
  }

  static Snapshot zero(int w, int h, int num_passes, int samples_per_pixel) {
    Snapshot s;
    s.w = w;
    s.h = h;
    s.pixels.assign(w * h, fvec3{0});
    s.sample_counts.assign(w * h, 0);
    s.num_passes = num_passes;
    s.samples_per_pixel = samples_per_pixel;
    return s;
  }
};

inline Snapshot takeSnapshot(const Framebuffer& fb, bool aux_buffers) {
  Snapshot s;
  s.w = fb.w();
  s.h = fb.h();
  size_t n = fb.pixels.v.size();
  s.pixels.resize(n);
  s.sample_counts.resize(n);
  if (aux_buffers) {
    s.albedo.resize(n);
    s.normal.resize(n);
  }
  for (size_t i = 0; i < n; i++) {
    const Accumulator& acc = fb.pixels.v[i];
    s.pixels[i] = acc.mean();
    s.sample_counts[i] = acc.count;
    if (aux_buffers && acc.count > 0) {
      s.albedo[i] = fvec3{acc.albedo / (double)acc.count};
      dvec3 nsum = acc.normal;
      double len = glm::length(nsum);
      s.normal[i] = len > 0 ? fvec3{nsum / len} : fvec3{0};
    }
  }
  return s;
}

// Same rate as so far: elapsed / done * left
inline double estimateSecondsLeft(double elapsed_seconds, int samples_done, int samples_total) {
  if (samples_done <= 0)
    return 0;
  return elapsed_seconds / samples_done * (samples_total - samples_done);
}


enum class RenderStatus { kCompleted, kCancelled, kFailed };

inline const char* renderStatusName(RenderStatus status) {
  switch (status) {
    case RenderStatus::kCompleted: return "completed";
    case RenderStatus::kCancelled: return "cancelled";
    case RenderStatus::kFailed:    return "failed";
  }
  return "?";
}

struct TileFailure {
  Tile tile;
  int pass = 0;
  std::string message;
};

struct RenderOutcome {
  RenderStatus status = RenderStatus::kCompleted;
  Snapshot snapshot;
  vector<TileFailure> failures;
  int passes_completed = 0;
};


struct ProgressSink {
  virtual ~ProgressSink() = default;
  virtual void onSnapshot(const Snapshot&) {}
  virtual void onFinish(const RenderOutcome&) {}
};


//
// Broadcast cancellation flag. Copies share the same flag.
//
struct CancelToken {
  std::shared_ptr<std::atomic<bool>> flag = std::make_shared<std::atomic<bool>>(false);

  void cancel() const { flag->store(true, std::memory_order_relaxed); }
  bool isCancelled() const { return flag->load(std::memory_order_relaxed); }
};

//
// Raises `token` once `timeout` elapses, unless destroyed (or disarmed) before
//
struct CancelTimer {
  CancelToken token;
  std::mutex mutex;
  std::condition_variable cv;
  bool disarmed = false;
  std::atomic<bool> fired{false};
  std::thread thread;

  CancelTimer(const CancelToken& in_token, std::chrono::duration<double> timeout) : token{in_token} {
    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);
    thread = std::thread{[this, deadline]() {
      std::unique_lock<std::mutex> lock{mutex};
      if (!cv.wait_until(lock, deadline, [this]() { return disarmed; })) {
        fired = true;
        token.cancel();
      }
    }};
  }

  CancelTimer(const CancelTimer&) = delete;
  CancelTimer& operator=(const CancelTimer&) = delete;

  ~CancelTimer() {
    disarm();
  }

  void disarm() {
    {
      std::lock_guard<std::mutex> lock{mutex};
      disarmed = true;
    }
    cv.notify_all();
    if (thread.joinable())
      thread.join();
  }
};


//
// Fixed set of threads running one job at a time (each worker calls `job(worker_index)` once)
//
struct WorkerPool {
  vector<std::thread> workers;
  std::mutex mutex;
  std::condition_variable task_cv;
  std::condition_variable done_cv;
  std::function<void(int)> job;
  uint64_t generation = 0;
  int active = 0;
  bool running = true;
  std::exception_ptr error;

  explicit WorkerPool(int num_workers) {
    for (int i = 0; i < num_workers; i++) {
      workers.emplace_back([this, i]() { workerLoop(i); });
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  ~WorkerPool() {
    {
      std::lock_guard<std::mutex> lock{mutex};
      running = false;
    }
    task_cv.notify_all();
    for (auto& t : workers) {
      if (t.joinable()) t.join();
    }
  }

  int size() const { return static_cast<int>(workers.size()); }

  // Blocks until every worker returned from `in_job`. Rethrows the first escaped exception.
  void run(std::function<void(int)> in_job) {
    std::unique_lock<std::mutex> lock{mutex};
    job = std::move(in_job);
    error = nullptr;
    active = size();
    generation++;
    task_cv.notify_all();
    done_cv.wait(lock, [this]() { return active == 0; });
    job = nullptr;
    if (error) {
      std::rethrow_exception(error);
    }
  }

  void workerLoop(int worker_index) {
    uint64_t seen = 0;
    while (true) {
      std::function<void(int)> task;
      {
        std::unique_lock<std::mutex> lock{mutex};
        task_cv.wait(lock, [&]() { return !running || generation != seen; });
        if (!running) return;
        seen = generation;
        task = job;
      }

      std::exception_ptr task_error;
      try {
        task(worker_index);
      } catch (...) {
        task_error = std::current_exception();
      }

      {
        std::lock_guard<std::mutex> lock{mutex};
        if (task_error && !error)
          error = task_error;
        active--;
      }
      done_cv.notify_all();
    }
  }
};


inline int resolveWorkerCount(int worker_count) {
  if (worker_count > 0)
    return worker_count;
  return std::max(1, (int)std::thread::hardware_concurrency());
}


//
// Progressive tile renderer
//
struct Renderer {
  std::shared_ptr<const Scene> scene;
  std::shared_ptr<const Integrator> integrator;
  RenderConfig config;

  // `integrator` defaults to the one registered under `config.integrator`
  Renderer(std::shared_ptr<const Scene> in_scene, const RenderConfig& in_config,
           std::shared_ptr<const Integrator> in_integrator = nullptr)
    : scene{std::move(in_scene)}, integrator{std::move(in_integrator)}, config{in_config} {
    config.validate();
    if (!scene)
      throw ConfigError{"renderer needs a scene"};
    if (!integrator)
      integrator = ClassRegistry::create(config.integrator, config);
  }

  RenderOutcome render(ProgressSink* sink = nullptr, const CancelToken& cancel = {}) const;

  // Trace `num_samples` samples for every pixel of `tile` into `local`.
  // Returns false when cancellation was observed (the partial result must be discarded).
  bool renderTile(
      const Camera& camera, const Tile& tile, int pass, int num_samples,
      Rng& worker_rng, const CancelToken& cancel,
      /*out*/ vector<Accumulator>& local) const {
    local.assign(tile.w() * tile.h(), Accumulator{});
    for (int y = tile.y0; y < tile.y1; y++) {
      for (int x = tile.x0; x < tile.x1; x++) {
        if (cancel.isCancelled())
          return false;

        Accumulator& acc = local[(y - tile.y0) * tile.w() + (x - tile.x0)];
        uint64_t pixel_index = (uint64_t)y * config.w + x;
        for (int s = 0; s < num_samples; s++) {
          uint64_t sample_index = (uint64_t)pass * config.samples_per_pass + s;
          Rng pixel_rng{0, 0};
          Rng* rng = &worker_rng;
          if (config.seed_policy == SeedPolicy::kDeterministic) {
            pixel_rng.seed(hashSeed(hashSeed(config.seed, pixel_index), sample_index), pixel_index);
            rng = &pixel_rng;
          }
          fvec2 u_pixel = rng->uniform2();
          fvec2 u_lens = rng->uniform2();
          Ray ray = camera.generateRay(x, y, u_pixel, u_lens);
          acc.add(integrator->Li(ray, *scene, *rng));
        }
      }
    }
    return true;
  }
};


inline RenderOutcome Renderer::render(ProgressSink* sink, const CancelToken& cancel) const {
  using clock = std::chrono::steady_clock;
  auto time_begin = clock::now();

  Camera camera = scene->camera;
  camera.initialize(config.w, config.h);

  vector<Tile> tiles = makeTiles(config.w, config.h, config.tile_size);
  int num_passes = config.numPasses();
  int num_workers = resolveWorkerCount(config.worker_count);

  Framebuffer fb;
  fb.reset(config.w, config.h);

  RenderOutcome outcome;
  outcome.snapshot = Snapshot::zero(config.w, config.h, num_passes, config.samples_per_pixel);

  log::info("render", "%dx%d, %d spp in %d passes, %d tiles, %d workers, integrator %s",
      config.w, config.h, config.samples_per_pixel, num_passes, (int)tiles.size(), num_workers,
      config.integrator);

  std::mutex failure_mutex;
  int samples_done = 0;
  {
    WorkerPool pool{num_workers};
    for (int pass = 0; pass < num_passes; pass++) {
      if (cancel.isCancelled())
        break;

      int num_samples = config.samplesInPass(pass);
      std::atomic<uint32_t> next_tile{0};
      pool.run([&](int worker_index) {
        Rng worker_rng{hashSeed(config.seed, (uint64_t)worker_index), (uint64_t)pass};
        vector<Accumulator> local;
        while (!cancel.isCancelled()) {
          uint32_t i = next_tile.fetch_add(1);
          if (i >= tiles.size())
            return;
          const Tile& tile = tiles[i];
          try {
            if (renderTile(camera, tile, pass, num_samples, worker_rng, cancel, /*out*/ local)) {
              fb.merge(tile, local);
            }
          } catch (const std::exception& e) {
            log::error("render", "%s failed in pass %d: %s", tile, pass, e.what());
            std::lock_guard<std::mutex> lock{failure_mutex};
            outcome.failures.push_back(TileFailure{tile, pass, e.what()});
          } catch (...) {
            // Not a std::exception: still confined to this tile
            log::error("render", "%s failed in pass %d: unknown exception", tile, pass);
            std::lock_guard<std::mutex> lock{failure_mutex};
            outcome.failures.push_back(TileFailure{tile, pass, "unknown exception"});
          }
        }
      });

      // A pass interrupted by cancellation is not published
      if (cancel.isCancelled())
        break;

      samples_done += num_samples;
      outcome.passes_completed = pass + 1;

      Snapshot snapshot = takeSnapshot(fb, config.aux_buffers);
      snapshot.pass = pass;
      snapshot.num_passes = num_passes;
      snapshot.samples_completed = samples_done;
      snapshot.samples_per_pixel = config.samples_per_pixel;
      snapshot.elapsed_seconds = std::chrono::duration<double>(clock::now() - time_begin).count();
      snapshot.estimated_seconds_left =
          estimateSecondsLeft(snapshot.elapsed_seconds, samples_done, config.samples_per_pixel);
      outcome.snapshot = std::move(snapshot);

      log::info("render", "pass %d/%d (%d spp, %.2fs elapsed, ~%.2fs left)",
          pass + 1, num_passes, samples_done,
          outcome.snapshot.elapsed_seconds, outcome.snapshot.estimated_seconds_left);
      if (sink)
        sink->onSnapshot(outcome.snapshot);
    }
  }

  if (outcome.passes_completed < num_passes) {
    outcome.status = RenderStatus::kCancelled;
    log::info("render", "cancelled after %d/%d passes", outcome.passes_completed, num_passes);
  } else if (!outcome.failures.empty()) {
    outcome.status = RenderStatus::kFailed;
    log::warn("render", "%d tile failures", (int)outcome.failures.size());
  } else {
    outcome.status = RenderStatus::kCompleted;
  }

  if (sink)
    sink->onFinish(outcome);
  return outcome;
}


// Render `scene` with the integrator registered under `config.integrator`
inline RenderOutcome render(
    std::shared_ptr<const Scene> scene, const RenderConfig& config,
    ProgressSink* sink = nullptr, const CancelToken& cancel = {}) {
  Renderer renderer{std::move(scene), config};
  return renderer.render(sink, cancel);
}


} // namespace glint
