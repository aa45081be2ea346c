#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "blur_config.h"

using namespace fastblur;
using nlohmann::json;

TEST(BlurConfig, Defaults)
{
  const BlurConfig cfg;
  EXPECT_DOUBLE_EQ(cfg.sigma, 3.0);
  EXPECT_EQ(cfg.threads, 1u);
  EXPECT_EQ(cfg.jpeg_quality, 90);
  EXPECT_EQ(cfg.path, BoxBlurPath::Fast);
  EXPECT_TRUE(cfg.parallel_lines);
}

TEST(BlurConfig, JsonKeysApply)
{
  BlurConfig cfg;
  apply_json_config(json::parse(R"({
    "sigma": 7.5,
    "threads": 0,
    "jpeg_quality": 42,
    "path": "reference",
    "parallel_lines": false,
    "comment": "unknown keys are ignored"
  })"),
                    cfg);
  EXPECT_DOUBLE_EQ(cfg.sigma, 7.5);
  EXPECT_EQ(cfg.threads, 0u);
  EXPECT_EQ(cfg.jpeg_quality, 42);
  EXPECT_EQ(cfg.path, BoxBlurPath::Reference);
  EXPECT_FALSE(cfg.parallel_lines);

  const BlurOptions opts = cfg.blurOptions();
  EXPECT_EQ(opts.threads, 0u);
  EXPECT_EQ(opts.path, BoxBlurPath::Reference);
  EXPECT_FALSE(opts.parallel_lines);
}

TEST(BlurConfig, MissingKeysKeepCurrentValues)
{
  BlurConfig cfg;
  cfg.sigma = 11.0;
  apply_json_config(json::parse(R"({"threads": 6})"), cfg);
  EXPECT_DOUBLE_EQ(cfg.sigma, 11.0);
  EXPECT_EQ(cfg.threads, 6u);
}

TEST(BlurConfig, IntegerSigmaIsAccepted)
{
  BlurConfig cfg;
  apply_json_config(json::parse(R"({"sigma": 4})"), cfg);
  EXPECT_DOUBLE_EQ(cfg.sigma, 4.0);
}

TEST(BlurConfig, RejectsBadValues)
{
  const char* bad[] = {
      R"([1, 2])",
      R"({"sigma": -1})",
      R"({"sigma": "3"})",
      R"({"threads": -2})",
      R"({"threads": 1.5})",
      R"({"jpeg_quality": 0})",
      R"({"jpeg_quality": 101})",
      R"({"jpeg_quality": 80.5})",
      R"({"path": "simd"})",
      R"({"path": 1})",
      R"({"parallel_lines": 1})",
  };
  for (const char* text : bad) {
    BlurConfig cfg;
    EXPECT_THROW(apply_json_config(json::parse(text), cfg), ConfigError) << text;
  }
}

TEST(BlurConfig, PathNames)
{
  EXPECT_STREQ(path_name(BoxBlurPath::Fast), "fast");
  EXPECT_STREQ(path_name(BoxBlurPath::Reference), "reference");
  EXPECT_EQ(parse_path_name("fast"), BoxBlurPath::Fast);
  EXPECT_EQ(parse_path_name("reference"), BoxBlurPath::Reference);
  EXPECT_THROW(parse_path_name("Fast"), ConfigError);
}

TEST(BlurConfig, EnvironmentInteger)
{
  ::setenv("FASTBLUR_TEST_INT", "12", 1);
  EXPECT_EQ(getenv_or_int("FASTBLUR_TEST_INT", 3), 12);
  ::setenv("FASTBLUR_TEST_INT", "12abc", 1);
  EXPECT_EQ(getenv_or_int("FASTBLUR_TEST_INT", 3), 3);
  ::setenv("FASTBLUR_TEST_INT", "", 1);
  EXPECT_EQ(getenv_or_int("FASTBLUR_TEST_INT", 3), 3);
  ::unsetenv("FASTBLUR_TEST_INT");
  EXPECT_EQ(getenv_or_int("FASTBLUR_TEST_INT", 3), 3);
}

TEST(BlurConfig, EnvironmentThreads)
{
  BlurConfig cfg;
  ::setenv("FASTBLUR_THREADS", "8", 1);
  apply_env_config(cfg);
  EXPECT_EQ(cfg.threads, 8u);

  ::setenv("FASTBLUR_THREADS", "-1", 1);
  apply_env_config(cfg);
  EXPECT_EQ(cfg.threads, 8u);

  ::setenv("FASTBLUR_THREADS", "lots", 1);
  apply_env_config(cfg);
  EXPECT_EQ(cfg.threads, 8u);
  ::unsetenv("FASTBLUR_THREADS");
}

TEST(BlurConfig, ConfigFile)
{
  const std::string path = ::testing::TempDir() + "fastblur_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"sigma": 2.25, "jpeg_quality": 70})";
  }
  BlurConfig cfg;
  apply_config_file(path, cfg);
  EXPECT_DOUBLE_EQ(cfg.sigma, 2.25);
  EXPECT_EQ(cfg.jpeg_quality, 70);

  {
    std::ofstream out(path);
    out << R"({"sigma": 2.25,)";
  }
  EXPECT_THROW(apply_config_file(path, cfg), ConfigError);

  {
    std::ofstream out(path);
    out << R"({"threads": "many"})";
  }
  try {
    apply_config_file(path, cfg);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
  }
  std::remove(path.c_str());

  EXPECT_THROW(apply_config_file(path, cfg), ConfigError);
}

TEST(BlurConfig, CliOverridesApply)
{
  BlurConfig cfg;
  CliOverrides cli;
  cli.sigma = 0.0;
  cli.threads = 5;
  cli.jpeg_quality = 100;
  cli.reference = true;
  cli.no_parallel_lines = true;
  apply_cli_overrides(cli, cfg);
  EXPECT_DOUBLE_EQ(cfg.sigma, 0.0);
  EXPECT_EQ(cfg.threads, 5u);
  EXPECT_EQ(cfg.jpeg_quality, 100);
  EXPECT_EQ(cfg.path, BoxBlurPath::Reference);
  EXPECT_FALSE(cfg.parallel_lines);

  // nothing set on the command line
  BlurConfig untouched;
  untouched.sigma = 9.0;
  apply_cli_overrides(CliOverrides(), untouched);
  EXPECT_DOUBLE_EQ(untouched.sigma, 9.0);
  EXPECT_EQ(untouched.path, BoxBlurPath::Fast);
  EXPECT_TRUE(untouched.parallel_lines);
}

TEST(BlurConfig, CliOverridesRejectOutOfRangeValues)
{
  auto rejects = [](const CliOverrides& cli) {
    BlurConfig cfg;
    cfg.sigma = 4.0;
    try {
      apply_cli_overrides(cli, cfg);
    } catch (const ConfigError& e) {
      EXPECT_EQ(exit_code_for(e), EXIT_USAGE);
      EXPECT_DOUBLE_EQ(cfg.sigma, 4.0);
      return true;
    }
    return false;
  };

  CliOverrides negativeSigma;
  negativeSigma.sigma = -1.0;
  EXPECT_TRUE(rejects(negativeSigma));

  CliOverrides nanSigma;
  nanSigma.sigma = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(rejects(nanSigma));

  CliOverrides negativeThreads;
  negativeThreads.threads = -1;
  EXPECT_TRUE(rejects(negativeThreads));

  CliOverrides qualityZero;
  qualityZero.jpeg_quality = 0;
  EXPECT_TRUE(rejects(qualityZero));

  CliOverrides qualityHigh;
  qualityHigh.jpeg_quality = 500;
  qualityHigh.sigma = 1.0;
  EXPECT_TRUE(rejects(qualityHigh));
}

TEST(BlurConfig, ResolvePrecedence)
{
  const std::string path = ::testing::TempDir() + "fastblur_precedence_test.json";
  {
    std::ofstream out(path);
    out << R"({"sigma": 6.0, "threads": 3, "jpeg_quality": 55})";
  }

  ::setenv("FASTBLUR_THREADS", "7", 1);

  // environment over defaults
  BlurConfig envOnly = resolve_config("", CliOverrides());
  EXPECT_EQ(envOnly.threads, 7u);
  EXPECT_DOUBLE_EQ(envOnly.sigma, 3.0);

  // config file over environment
  BlurConfig withFile = resolve_config(path, CliOverrides());
  EXPECT_EQ(withFile.threads, 3u);
  EXPECT_DOUBLE_EQ(withFile.sigma, 6.0);
  EXPECT_EQ(withFile.jpeg_quality, 55);

  // command line over config file
  CliOverrides cli;
  cli.threads = 2;
  cli.sigma = 1.5;
  BlurConfig withCli = resolve_config(path, cli);
  EXPECT_EQ(withCli.threads, 2u);
  EXPECT_DOUBLE_EQ(withCli.sigma, 1.5);
  EXPECT_EQ(withCli.jpeg_quality, 55);

  ::unsetenv("FASTBLUR_THREADS");

  CliOverrides badSigma;
  badSigma.sigma = -1.0;
  EXPECT_THROW(resolve_config(path, badSigma), ConfigError);
  EXPECT_THROW(resolve_config(path + ".missing", CliOverrides()), ConfigError);
  std::remove(path.c_str());
}

TEST(BlurConfig, ExitCodes)
{
  EXPECT_EQ(exit_code_for(ConfigError("bad key")), EXIT_USAGE);
  EXPECT_EQ(exit_code_for(InvalidRadius(-1.0)), EXIT_USAGE);
  EXPECT_EQ(exit_code_for(std::invalid_argument("bad image")), EXIT_USAGE);
  EXPECT_EQ(exit_code_for(std::runtime_error("in.png: Not a PNG")), EXIT_RUNTIME);
  EXPECT_EQ(EXIT_OK, 0);
  EXPECT_EQ(EXIT_RUNTIME, 1);
  EXPECT_EQ(EXIT_USAGE, 2);
}

TEST(BlurConfig, ReportFields)
{
  BlurConfig cfg;
  cfg.sigma = 15.0;
  cfg.path = BoxBlurPath::Reference;
  const Image img(40, 30, 3);
  const json report = make_report("in.png", "out.jpg", img, cfg, plan_box_blur(Radius(15.0)), 4, {2.0, 4.0, 3.0});

  for (const char* key : {"input", "output", "width", "height", "channels", "sigma", "half_widths", "path",
                          "threads", "runs", "min_ms", "avg_ms"}) {
    EXPECT_TRUE(report.contains(key)) << key;
  }
  EXPECT_EQ(report["input"], "in.png");
  EXPECT_EQ(report["output"], "out.jpg");
  EXPECT_EQ(report["width"], 40);
  EXPECT_EQ(report["height"], 30);
  EXPECT_EQ(report["channels"], 3);
  EXPECT_DOUBLE_EQ(report["sigma"].get<double>(), 15.0);
  EXPECT_EQ(report["half_widths"], json({14, 14, 15}));
  EXPECT_EQ(report["path"], "reference");
  EXPECT_EQ(report["threads"], 4);
  EXPECT_EQ(report["runs"], 3);
  EXPECT_DOUBLE_EQ(report["min_ms"].get<double>(), 2.0);
  EXPECT_DOUBLE_EQ(report["avg_ms"].get<double>(), 3.0);

  const json empty = make_report("a.png", "b.png", img, cfg, plan_box_blur(Radius(0.0)), 1, {});
  EXPECT_EQ(empty["runs"], 0);
  EXPECT_DOUBLE_EQ(empty["min_ms"].get<double>(), 0.0);
}
