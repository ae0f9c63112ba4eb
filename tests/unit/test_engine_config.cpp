#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/config/engine_config.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace hiyo;
using Catch::Approx;
namespace fs = std::filesystem;

namespace {

struct TempDir {
  fs::path path;

  TempDir() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / ("hiyo_config_" + std::to_string(stamp));
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
  std::string name;
  EnvGuard(const std::string &n, const std::string &value) : name(n) {
    ::setenv(name.c_str(), value.c_str(), 1);
  }
  ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("ParseEngineConfig of an empty document yields defaults",
          "[config]") {
  bool ok = false;
  auto cfg = ParseEngineConfig("", &ok);
  REQUIRE(ok);
  REQUIRE(cfg.limits.context_ceiling == 16384);
  REQUIRE(cfg.limits.max_tokens_ceiling == 4096);
  REQUIRE(cfg.channel_capacity == 64);
  REQUIRE(cfg.governor.max_requests_per_second == 10);
  REQUIRE(cfg.governor.max_requests_per_minute == 60);
  REQUIRE(cfg.governor.memory_fraction == Approx(0.8));
  REQUIRE(cfg.governor.max_tokens_per_call == 8192);
  REQUIRE(cfg.governor.max_active_tokens == 10000);
  REQUIRE(cfg.generation.temperature == Approx(0.7f));
  REQUIRE(cfg.generation.top_p == Approx(0.9f));
  REQUIRE(cfg.generation.max_tokens == 1024);
  REQUIRE(cfg.logging.format == "text");
  REQUIRE(cfg.models.dir.filename() == "models");
}

TEST_CASE("ParseEngineConfig reads every section", "[config]") {
  const std::string yaml = R"(
engine:
  context_ceiling: 2048
  max_tokens_ceiling: 256
  channel_capacity: 8
governor:
  max_requests_per_second: 2
  max_requests_per_minute: 30
  memory_fraction: 0.5
  max_tokens_per_call: 1000
  max_active_tokens: 3000
models:
  dir: /srv/models
  catalog: /srv/catalog.yaml
  restrict_to_catalog: true
  default: acme/tiny
  gpu_layers: 99
  ctx_size: 1024
  batch_size: 64
logging:
  format: json
  level: debug
generation:
  temperature: 0.2
  top_p: 0.5
  max_tokens: 128
  seed: 42
)";
  bool ok = false;
  auto cfg = ParseEngineConfig(yaml, &ok);
  REQUIRE(ok);
  REQUIRE(cfg.limits.context_ceiling == 2048);
  REQUIRE(cfg.limits.max_tokens_ceiling == 256);
  REQUIRE(cfg.channel_capacity == 8);
  REQUIRE(cfg.governor.max_requests_per_second == 2);
  REQUIRE(cfg.governor.max_requests_per_minute == 30);
  REQUIRE(cfg.governor.memory_fraction == Approx(0.5));
  REQUIRE(cfg.governor.max_tokens_per_call == 1000);
  REQUIRE(cfg.governor.max_active_tokens == 3000);
  REQUIRE(cfg.models.dir == fs::path("/srv/models"));
  REQUIRE(cfg.models.catalog == fs::path("/srv/catalog.yaml"));
  REQUIRE(cfg.models.restrict_to_catalog);
  REQUIRE(cfg.models.default_model == "acme/tiny");
  REQUIRE(cfg.models.backend.gpu_layers == 99);
  REQUIRE(cfg.models.backend.ctx_size == 1024);
  REQUIRE(cfg.models.backend.batch_size == 64);
  REQUIRE(cfg.logging.format == "json");
  REQUIRE(cfg.logging.level == "debug");
  REQUIRE(cfg.generation.temperature == Approx(0.2f));
  REQUIRE(cfg.generation.top_p == Approx(0.5f));
  REQUIRE(cfg.generation.max_tokens == 128);
  REQUIRE(cfg.generation.seed == 42u);
}

TEST_CASE("ParseEngineConfig keeps values parsed before an error",
          "[config]") {
  const std::string yaml = R"(
governor:
  max_requests_per_second: 3
generation:
  temperature: hot
)";
  bool ok = true;
  auto cfg = ParseEngineConfig(yaml, &ok);
  REQUIRE_FALSE(ok);
  REQUIRE(cfg.governor.max_requests_per_second == 3);
  REQUIRE(cfg.generation.temperature == Approx(0.7f));

  ParseEngineConfig("engine: [unclosed", &ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("LoadEngineConfig resolves relative paths against the file",
          "[config]") {
  TempDir tmp;
  auto path = tmp.path / "config.yaml";
  {
    std::ofstream out(path);
    out << "models:\n  dir: weights\n  catalog: catalog.yaml\n";
  }
  bool ok = false;
  auto cfg = LoadEngineConfig(path, &ok);
  REQUIRE(ok);
  REQUIRE(cfg.models.dir == tmp.path / "weights");
  REQUIRE(cfg.models.catalog == tmp.path / "catalog.yaml");
}

TEST_CASE("LoadEngineConfig without a file falls back to defaults",
          "[config]") {
  TempDir tmp;
  EnvGuard home("HIYO_HOME", tmp.path.string());
  bool ok = false;
  auto cfg = LoadEngineConfig(tmp.path / "absent.yaml", &ok);
  REQUIRE(ok);
  REQUIRE(cfg.models.dir == tmp.path / "models");
  REQUIRE(HiyoHome() == tmp.path);
  REQUIRE(DefaultConfigPath() == tmp.path / "config.yaml");
}

TEST_CASE("LoadEngineConfig reports a malformed file", "[config]") {
  TempDir tmp;
  auto path = tmp.path / "config.yaml";
  {
    std::ofstream out(path);
    out << "engine:\n  context_ceiling: [1, 2\n";
  }
  bool ok = true;
  LoadEngineConfig(path, &ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("ApplyEnvOverrides takes precedence over the file", "[config]") {
  auto cfg = ParseEngineConfig("models:\n  dir: /from/file\n");
  EnvGuard dir("HIYO_MODELS_DIR", "/from/env");
  EnvGuard model("HIYO_DEFAULT_MODEL", "acme/env-model");
  EnvGuard format("HIYO_LOG_FORMAT", "json");
  EnvGuard level("HIYO_LOG_LEVEL", "warning");
  ApplyEnvOverrides(&cfg);
  REQUIRE(cfg.models.dir == fs::path("/from/env"));
  REQUIRE(cfg.models.default_model == "acme/env-model");
  REQUIRE(cfg.logging.format == "json");
  REQUIRE(cfg.logging.level == "warning");
}
