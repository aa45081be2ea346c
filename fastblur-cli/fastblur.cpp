// fastblur.cpp
// Command-line front end for the box-approximated Gaussian blur:
// - Loads a PNG or JPEG, blurs every channel in place, writes PNG or JPEG.
// - Settings come from defaults, FASTBLUR_THREADS, an optional JSON config
//   file and the command line, in that order of precedence.
// - --repeat times several runs over the same input; --report prints JSON.

#include <popt.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "blur_config.h"
#include "box_planner.h"
#include "gaussian_blur_fast.h"
#include "image.h"
#include "image_io.h"
#include "radius.h"

using json = nlohmann::json;
using namespace fastblur;

namespace {

// popt return codes for options whose presence matters
enum OptVal {
  OPT_SIGMA = 1,
  OPT_THREADS,
  OPT_QUALITY,
  OPT_REFERENCE,
  OPT_NO_PARALLEL_LINES,
};

struct CliArgs {
  std::string input;
  std::string output;
  std::string config_path;
  int repeat = 1;
  bool report = false;
  bool verbose = false;
  BlurConfig cfg;
};

bool g_verbose = false;

std::string take_string(char* s) {
  std::string out = s ? s : "";
  std::free(s);
  return out;
}

// Exits with EXIT_USAGE on bad options.
CliArgs parse_cli_or_die(int argc, const char** argv) {
  CliArgs args;
  char* opt_input = nullptr;
  char* opt_output = nullptr;
  char* opt_config = nullptr;
  double opt_sigma = 0.0;
  int opt_threads = 0;
  int opt_quality = 0;
  int opt_repeat = 1;
  int opt_report = 0;
  int opt_verbose = 0;

  struct poptOption optionsTable[] = {
    { "input",   'i', POPT_ARG_STRING, &opt_input,   0, "Input image (.png, .jpg, .jpeg)", "FILE" },
    { "output",  'o', POPT_ARG_STRING, &opt_output,  0, "Output image (.png, .jpg, .jpeg)", "FILE" },
    { "sigma",   's', POPT_ARG_DOUBLE, &opt_sigma,   OPT_SIGMA, "Gaussian standard deviation in pixels (default 3)", "SIGMA" },
    { "threads", 't', POPT_ARG_INT,    &opt_threads, OPT_THREADS, "Channel worker threads (0=auto, default 1)", "N" },
    { "jpeg-quality", 'q', POPT_ARG_INT, &opt_quality, OPT_QUALITY, "JPEG quality (1-100, default 90)", "Q" },
    { "reference", 0, POPT_ARG_NONE, nullptr, OPT_REFERENCE, "Use the checked reference box pass", nullptr },
    { "no-parallel-lines", 0, POPT_ARG_NONE, nullptr, OPT_NO_PARALLEL_LINES, "Disable OpenMP over lines", nullptr },
    { "repeat",  'r', POPT_ARG_INT,    &opt_repeat,  0, "Blur N times from the original pixels and time it", "N" },
    { "config",  'c', POPT_ARG_STRING, &opt_config,  0, "JSON config file", "FILE" },
    { "report",  0,   POPT_ARG_NONE,   &opt_report,  0, "Print a JSON report on stdout", nullptr },
    { "verbose", 'v', POPT_ARG_NONE,   &opt_verbose, 0, "Verbose logging", nullptr },
    POPT_AUTOHELP
    POPT_TABLEEND
  };

  CliOverrides cli;

  poptContext pc = poptGetContext(argv[0], argc, argv, optionsTable, 0);
  int rc;
  while ((rc = poptGetNextOpt(pc)) >= 0) {
    switch (rc) {
      case OPT_SIGMA: cli.sigma = opt_sigma; break;
      case OPT_THREADS: cli.threads = opt_threads; break;
      case OPT_QUALITY: cli.jpeg_quality = opt_quality; break;
      case OPT_REFERENCE: cli.reference = true; break;
      case OPT_NO_PARALLEL_LINES: cli.no_parallel_lines = true; break;
      default: break;
    }
  }
  if (rc < -1) {
    fprintf(stderr, "[main] Options error: %s: %s\n", poptBadOption(pc, POPT_BADOPTION_NOALIAS), poptStrerror(rc));
    poptPrintUsage(pc, stderr, 0);
    poptFreeContext(pc);
    exit(EXIT_USAGE);
  }
  if (poptPeekArg(pc)) {
    fprintf(stderr, "[main] Unexpected argument: %s\n", poptPeekArg(pc));
    poptPrintUsage(pc, stderr, 0);
    poptFreeContext(pc);
    exit(EXIT_USAGE);
  }
  poptFreeContext(pc);

  args.input = take_string(opt_input);
  args.output = take_string(opt_output);
  args.config_path = take_string(opt_config);
  args.repeat = opt_repeat;
  args.report = opt_report != 0;
  args.verbose = opt_verbose != 0;

  if (args.input.empty() || args.output.empty()) {
    fprintf(stderr, "[main] --input FILE and --output FILE are required\n");
    exit(EXIT_USAGE);
  }
  if (args.repeat < 1) {
    fprintf(stderr, "[main] --repeat must be >= 1\n");
    exit(EXIT_USAGE);
  }

  try {
    args.cfg = resolve_config(args.config_path, cli);
  } catch (const ConfigError& e) {
    fprintf(stderr, "[config] %s\n", e.what());
    exit(EXIT_USAGE);
  }

  return args;
}

int run(const CliArgs& args) {
  Image img;
  load_image(args.input, img);
  fprintf(stderr, "[io] Loaded %s: %dx%d, %d channel(s)\n", args.input.c_str(), img.width, img.height, img.channels);

  const Radius radius(args.cfg.sigma);
  const BoxSpecSequence specs = plan_box_blur(radius);
  SeparableBlurEngine engine(args.cfg.blurOptions());

  if (g_verbose) {
    fprintf(stderr, "[blur] sigma=%.3f half-widths=%d,%d,%d path=%s threads=%zu parallel_lines=%d\n",
            radius.sigma(), specs[0].half_width, specs[1].half_width, specs[2].half_width,
            path_name(args.cfg.path), engine.threads(), args.cfg.parallel_lines ? 1 : 0);
  }

  const std::vector<uint8_t> original = img.pixels;
  std::vector<double> times_ms;
  times_ms.reserve((size_t)args.repeat);

  for (int i = 0; i < args.repeat; ++i) {
    if (i > 0) img.pixels = original;
    using clock = std::chrono::steady_clock;
    auto t0 = clock::now();
    engine.blur(img.view(), radius);
    auto t1 = clock::now();
    times_ms.push_back(std::chrono::duration<double, std::milli>(t1 - t0).count());
    if (g_verbose) fprintf(stderr, "[blur] run %d: %.3f ms\n", i + 1, times_ms.back());
  }

  save_image(args.output, img, args.cfg.jpeg_quality);
  fprintf(stderr, "[io] Wrote %s\n", args.output.c_str());

  const json report = make_report(args.input, args.output, img, args.cfg, specs, engine.threads(), times_ms);
  if (args.repeat > 1) {
    fprintf(stderr, "[blur] %d runs: min %.3f ms, avg %.3f ms\n", args.repeat,
            report["min_ms"].get<double>(), report["avg_ms"].get<double>());
  }
  if (args.report) {
    std::printf("%s\n", report.dump().c_str());
  }
  return EXIT_OK;
}

} // namespace

// ----------------- main -----------------
int main(int argc, char** argv) {
  CliArgs args = parse_cli_or_die(argc, (const char**)argv);
  g_verbose = args.verbose;

  try {
    return run(args);
  } catch (const std::exception& e) {
    fprintf(stderr, "[main] %s\n", e.what());
    return exit_code_for(e);
  }
}
