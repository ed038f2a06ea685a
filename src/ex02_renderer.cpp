#include <fstream>
#include <memory>

#include "glint/config.hpp"
#include "glint/image.hpp"
#include "glint/misc.hpp"
#include "glint/post.hpp"
#include "glint/renderer.hpp"
#include "glint/scene_yeml.hpp"


using std::string, std::vector, std::make_shared;
using namespace glint;


// Writes every published snapshot so a long render can be watched
struct PreviewSink : ProgressSink {
  string outfile;

  PreviewSink(const string& in_outfile) : outfile{in_outfile} {}

  void onSnapshot(const Snapshot& snapshot) override {
    writePpm(outfile, snapshot.w, snapshot.h, snapshot.pixels);
  }

  void onFinish(const RenderOutcome& outcome) override {
    log::info("render", "%s: %d passes, %d tile failures",
        renderStatusName(outcome.status), outcome.passes_completed, (int)outcome.failures.size());
    for (auto& failure : outcome.failures) {
      log::warn("render", "%s (pass %d): %s", failure.tile, failure.pass, failure.message);
    }
  }

  static void writePpm(const string& file, int w, int h, const vector<fvec3>& pixels) {
    vector<u8vec3> bytes = toRgb8(pixels);
    std::ofstream ostr(file);
    if (!ostr.is_open())
      throw std::runtime_error{format("cannot write \"%s\"", file)};
    ostr << PPMWriter{w, h, bytes.data()};
  }
};


struct MyRenderer {
  Yeml y;
  string yaml_file;
  string outfile;
  RenderConfig config;
  std::shared_ptr<const Scene> scene;
  std::unique_ptr<CancelTimer> timer;
  CancelToken cancel;

  MyRenderer(const string& in_yaml_file, const string& in_outfile)
    : y{Yeml::parseFile(in_yaml_file)}, yaml_file{in_yaml_file}, outfile{in_outfile} {
    config = RenderConfig::fromYeml(y.d("render") ? *y.d("render").value() : Yeml{});
  }

  void loadScene() {
    log::info("render", "Loading %s", yaml_file);
    SceneBuilder builder = loadSceneYeml(y, dirname(yaml_file));
    scene = make_shared<const Scene>(builder.build());
  }

  void setTimeout(double seconds) {
    timer = std::make_unique<CancelTimer>(cancel, std::chrono::duration<double>{seconds});
  }

  RenderStatus run() {
    Renderer renderer{scene, config};
    PreviewSink sink{outfile};
    RenderOutcome outcome = renderer.render(&sink, cancel);
    if (timer && timer->fired) {
      log::warn("render", "timed out, writing the last completed pass");
    }

    // No external post-processor is wired into the command line
    vector<fvec3> pixels = applyPostProcessor(nullptr, outcome.snapshot);
    log::info("render", "Writing result to %s", outfile);
    PreviewSink::writePpm(outfile, outcome.snapshot.w, outcome.snapshot.h, pixels);
    return outcome.status;
  }
};


int main(int argc, const char** argv) {
  Cli cli{argc, argv};
  auto yaml = cli.getArg<string>("--yaml");
  auto outfile = cli.getArg<string>("--outfile").value_or("out.ppm");
  auto w = cli.getArg<int>("-w");
  auto h = cli.getArg<int>("-h");
  auto spp = cli.getArg<int>("--spp");
  auto workers = cli.getArg<int>("--workers");
  auto integrator = cli.getArg<string>("--integrator");
  auto timeout = cli.getArg<double>("--timeout");
  auto log_level = cli.getArg<string>("--log-level");
  bool help = cli.checkArg("--help");

  if (help || !yaml) {
    print(cli.help());
    return help ? 0 : 1;
  }

  if (log_level) {
    log::Level level;
    if (!log::parseLevel(*log_level, level)) {
      log::error("render", "unknown log level \"%s\"", *log_level);
      return 1;
    }
    log::setLevel(level);
  }

  try {
    MyRenderer renderer{*yaml, outfile};
    if (w) renderer.config.w = *w;
    if (h) renderer.config.h = *h;
    if (spp) renderer.config.samples_per_pixel = *spp;
    if (workers) renderer.config.worker_count = *workers;
    if (integrator) renderer.config.integrator = *integrator;
    renderer.config.validate();

    renderer.loadScene();
    if (timeout) renderer.setTimeout(*timeout);

    RenderStatus status = renderer.run();
    return status == RenderStatus::kFailed ? 2 : 0;

  } catch (const ConfigError& e) {
    log::error("render", "invalid configuration: %s", e.what());
  } catch (const ConstructionError& e) {
    log::error("render", "invalid scene: %s", e.what());
  } catch (const std::runtime_error& e) {
    log::error("render", "%s", e.what());
  }
  return 1;
}
