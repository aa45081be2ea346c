#include "blur_config.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include "radius.h"

namespace fastblur {

using json = nlohmann::json;

BlurOptions BlurConfig::blurOptions() const {
  BlurOptions opts;
  opts.threads = threads;
  opts.path = path;
  opts.parallel_lines = parallel_lines;
  return opts;
}

int getenv_or_int(const char* key, int def) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def;
  char* end = nullptr;
  long val = std::strtol(v, &end, 10);
  if (!end || *end) return def;
  return (int)val;
}

void apply_env_config(BlurConfig& cfg) {
  const int threads = getenv_or_int("FASTBLUR_THREADS", -1);
  if (threads >= 0) cfg.threads = static_cast<std::size_t>(threads);
}

const char* path_name(BoxBlurPath path) {
  return path == BoxBlurPath::Reference ? "reference" : "fast";
}

BoxBlurPath parse_path_name(const std::string& name) {
  if (name == "fast") return BoxBlurPath::Fast;
  if (name == "reference") return BoxBlurPath::Reference;
  throw ConfigError("path must be \"fast\" or \"reference\", got \"" + name + "\"");
}

void apply_json_config(const json& j, BlurConfig& cfg) {
  if (!j.is_object()) throw ConfigError("config must be a JSON object");

  if (j.contains("sigma")) {
    const json& v = j["sigma"];
    if (!v.is_number()) throw ConfigError("sigma must be a number");
    const double sigma = v.get<double>();
    if (!Radius::isValid(sigma)) throw ConfigError("sigma must be finite and >= 0");
    cfg.sigma = sigma;
  }
  if (j.contains("threads")) {
    const json& v = j["threads"];
    if (!v.is_number_integer() || v.get<long long>() < 0) throw ConfigError("threads must be an integer >= 0");
    cfg.threads = v.get<std::size_t>();
  }
  if (j.contains("jpeg_quality")) {
    const json& v = j["jpeg_quality"];
    if (!v.is_number_integer()) throw ConfigError("jpeg_quality must be an integer");
    const long long q = v.get<long long>();
    if (q < 1 || q > 100) throw ConfigError("jpeg_quality must be in 1..100");
    cfg.jpeg_quality = static_cast<int>(q);
  }
  if (j.contains("path")) {
    const json& v = j["path"];
    if (!v.is_string()) throw ConfigError("path must be a string");
    cfg.path = parse_path_name(v.get<std::string>());
  }
  if (j.contains("parallel_lines")) {
    const json& v = j["parallel_lines"];
    if (!v.is_boolean()) throw ConfigError("parallel_lines must be a boolean");
    cfg.parallel_lines = v.get<bool>();
  }
}

void apply_config_file(const std::string& path, BlurConfig& cfg) {
  std::ifstream in(path);
  if (!in) throw ConfigError(path + ": cannot open config file");

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  try {
    apply_json_config(j, cfg);
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

void apply_cli_overrides(const CliOverrides& cli, BlurConfig& cfg) {
  if (cli.sigma && !Radius::isValid(*cli.sigma)) throw ConfigError("--sigma must be finite and >= 0");
  if (cli.threads && *cli.threads < 0) throw ConfigError("--threads must be >= 0");
  if (cli.jpeg_quality && (*cli.jpeg_quality < 1 || *cli.jpeg_quality > 100)) {
    throw ConfigError("--jpeg-quality must be in 1..100");
  }

  if (cli.sigma) cfg.sigma = *cli.sigma;
  if (cli.threads) cfg.threads = static_cast<std::size_t>(*cli.threads);
  if (cli.jpeg_quality) cfg.jpeg_quality = *cli.jpeg_quality;
  if (cli.reference) cfg.path = BoxBlurPath::Reference;
  if (cli.no_parallel_lines) cfg.parallel_lines = false;
}

BlurConfig resolve_config(const std::string& config_path, const CliOverrides& cli) {
  BlurConfig cfg;
  apply_env_config(cfg);
  if (!config_path.empty()) apply_config_file(config_path, cfg);
  apply_cli_overrides(cli, cfg);
  return cfg;
}

int exit_code_for(const std::exception& e) {
  // InvalidRadius derives from std::invalid_argument
  if (dynamic_cast<const ConfigError*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return EXIT_USAGE;
  }
  return EXIT_RUNTIME;
}

json make_report(const std::string& input, const std::string& output, const Image& img,
                 const BlurConfig& cfg, const BoxSpecSequence& specs, std::size_t threads,
                 const std::vector<double>& times_ms) {
  json halfWidths = json::array();
  for (const BoxFilterSpec& s : specs) halfWidths.push_back(s.half_width);

  double total = 0.0;
  for (double t : times_ms) total += t;
  const double best = times_ms.empty() ? 0.0 : *std::min_element(times_ms.begin(), times_ms.end());

  return json{
    {"input", input},
    {"output", output},
    {"width", img.width},
    {"height", img.height},
    {"channels", img.channels},
    {"sigma", cfg.sigma},
    {"half_widths", halfWidths},
    {"path", path_name(cfg.path)},
    {"threads", threads},
    {"runs", times_ms.size()},
    {"min_ms", best},
    {"avg_ms", times_ms.empty() ? 0.0 : total / (double)times_ms.size()},
  };
}

} // namespace fastblur
