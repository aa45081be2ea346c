#pragma once
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "box_planner.h"
#include "gaussian_blur_fast.h"
#include "image.h"

namespace fastblur {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Settings for one fastblur run. Precedence, lowest first: defaults,
// environment, config file, command line.
struct BlurConfig {
  double sigma = 3.0;
  std::size_t threads = 1;   // 0 = hardware concurrency
  int jpeg_quality = 90;     // 1..100
  BoxBlurPath path = BoxBlurPath::Fast;
  bool parallel_lines = true;

  BlurOptions blurOptions() const;
};

// Integer environment variable, or def if unset or not an integer.
int getenv_or_int(const char* key, int def);

// FASTBLUR_THREADS
void apply_env_config(BlurConfig& cfg);

// Keys: sigma, threads, jpeg_quality, path ("fast" | "reference"), parallel_lines.
// Unknown keys are ignored. Throws ConfigError on a bad type or value.
void apply_json_config(const nlohmann::json& j, BlurConfig& cfg);

// Throws ConfigError if the file cannot be read or parsed.
void apply_config_file(const std::string& path, BlurConfig& cfg);

// Values given on the command line; unset fields leave the config alone.
struct CliOverrides {
  std::optional<double> sigma;
  std::optional<int> threads;
  std::optional<int> jpeg_quality;
  bool reference = false;
  bool no_parallel_lines = false;
};

// Same ranges as the JSON keys. Throws ConfigError, leaving cfg untouched.
void apply_cli_overrides(const CliOverrides& cli, BlurConfig& cfg);

// defaults < environment < config file (if config_path is non-empty) < cli
BlurConfig resolve_config(const std::string& config_path, const CliOverrides& cli);

enum ExitCode { EXIT_OK = 0, EXIT_RUNTIME = 1, EXIT_USAGE = 2 };

// InvalidRadius, ConfigError and std::invalid_argument are usage errors;
// anything else is a runtime failure.
int exit_code_for(const std::exception& e);

// One JSON object per run: input, output, width, height, channels, sigma,
// half_widths, path, threads, runs, min_ms, avg_ms.
nlohmann::json make_report(const std::string& input, const std::string& output, const Image& img,
                           const BlurConfig& cfg, const BoxSpecSequence& specs, std::size_t threads,
                           const std::vector<double>& times_ms);

const char* path_name(BoxBlurPath path);
// Throws ConfigError.
BoxBlurPath parse_path_name(const std::string& name);

} // namespace fastblur
