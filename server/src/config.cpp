#include <fnrun/server/config.hpp>

#include <fnrun/common/exceptions.hpp>
#include <fnrun/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cxxopts.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fnrun::server::config {

  void HTTPServer::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional
    common::util::cereal_load_value(archive, "threads", threads);
    common::util::cereal_load_value(archive, "port", port);
    common::util::cereal_load_value(archive, "max_payload_size", max_payload_size);
  }

  void HTTPServer::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
    port = DEFAULT_PORT;
    max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE;
  }

  void Workers::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "threads", threads);
    if (threads <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Number of worker threads must be positive, found {}", threads)
      );
    }
  }

  void Workers::set_defaults()
  {
    threads = DEFAULT_THREADS_NUMBER;
  }

  sandbox::Limits Sandbox::limits() const
  {
    sandbox::Limits limits;
    limits.wall_time = std::chrono::milliseconds{wall_time_ms};
    limits.cpu_time_s = cpu_time_s;
    limits.memory_mb = memory_mb;
    limits.max_result_bytes = max_result_bytes;
    limits.max_output_bytes = max_output_bytes;
    limits.max_open_files = max_open_files;
    return limits;
  }

  void Sandbox::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "executable", executable);
    common::util::cereal_load_value(archive, "wall_time_ms", wall_time_ms);
    common::util::cereal_load_value(archive, "cpu_time_s", cpu_time_s);
    common::util::cereal_load_value(archive, "memory_mb", memory_mb);
    common::util::cereal_load_value(archive, "max_result_bytes", max_result_bytes);
    common::util::cereal_load_value(archive, "max_output_bytes", max_output_bytes);
    common::util::cereal_load_value(archive, "max_open_files", max_open_files);
    common::util::cereal_load_value(archive, "environment", environment);
    common::util::cereal_load_value(archive, "allowed_modules", allowed_modules);

    if (wall_time_ms <= 0 || cpu_time_s <= 0 || max_open_files <= 0) {
      throw common::InvalidConfigurationError(
          "Sandbox time limits and open file limit must be positive"
      );
    }
  }

  void Sandbox::set_defaults()
  {
    executable = "";
    wall_time_ms = sandbox::Limits::DEFAULT_WALL_TIME_MS;
    cpu_time_s = sandbox::Limits::DEFAULT_CPU_TIME_S;
    memory_mb = sandbox::Limits::DEFAULT_MEMORY_MB;
    max_result_bytes = sandbox::Limits::DEFAULT_MAX_RESULT_BYTES;
    max_output_bytes = sandbox::Limits::DEFAULT_MAX_OUTPUT_BYTES;
    max_open_files = sandbox::Limits::DEFAULT_MAX_OPEN_FILES;
    environment = default_environment();
    allowed_modules = default_allowed_modules();
  }

  std::vector<std::string> Sandbox::default_environment()
  {
    return {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "PYTHONIOENCODING=utf-8"};
  }

  std::vector<std::string> Sandbox::default_allowed_modules()
  {
    // Modules that hand out sys, os or builtins (collections, typing, dataclasses,
    // enum and others) are left out.
    return {"math",     "cmath",     "json",    "re",       "time",   "string",
            "itertools", "functools", "operator", "decimal", "hashlib", "base64",
            "textwrap", "copy",      "heapq",   "bisect",   "unicodedata", "os"};
  }

  void RateLimitRule::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "max", max);
    common::util::cereal_load_value(archive, "window", window);
    if (max < 0 || window <= 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Invalid rate limit rule: max {}, window {}", max, window)
      );
    }
  }

  void RateLimit::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "enabled", enabled);
    common::util::cereal_load_value(archive, "cleanup_interval", cleanup_interval);
    common::util::cereal_load_value(archive, "deploy", deploy);
    common::util::cereal_load_value(archive, "execute", execute);
    common::util::cereal_load_value(archive, "read", read);
  }

  void RateLimit::set_defaults()
  {
    enabled = false;
    cleanup_interval = DEFAULT_CLEANUP_INTERVAL;

    // 10 deployments per 15 minutes.
    deploy = RateLimitRule{10, 15 * 60};
    execute = RateLimitRule{0, 60};
    read = RateLimitRule{60, 60};
  }

  Config Config::deserialize(std::istream& in_stream)
  {
    Config cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  Config Config::deserialize(int argc, char** argv)
  {
    cxxopts::Options options("fnrun-server", "Deploys and executes Python functions.");
    options.add_options()("c,config", "JSON config.", cxxopts::value<std::string>()->default_value(""))(
        "v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false")
    );
    auto parsed_options = options.parse(argc, argv);

    std::string config_file{parsed_options["config"].as<std::string>()};

    Config cfg;
    if (config_file.length() > 0) {
      std::ifstream in_stream{config_file};
      if (!in_stream.is_open()) {
        spdlog::error("Could not open config file {}", config_file);
        exit(1);
      }

      cereal::JSONInputArchive archive_in(in_stream);
      cfg.load(archive_in);
    } else {

      cfg.set_defaults();
    }

    if (parsed_options["verbose"].as<bool>()) {
      cfg.verbose = true;
    }

    return cfg;
  }

  void Config::set_defaults()
  {
    public_url = DEFAULT_PUBLIC_URL;
    verbose = false;

    http.set_defaults();
    workers.set_defaults();
    sandbox.set_defaults();
    rate_limit.set_defaults();
  }

  void Config::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_value(archive, "verbose", verbose);
    common::util::cereal_load_value(archive, "public-url", public_url);

    // Trailing slashes would double up in the endpoints.
    while (!public_url.empty() && public_url.back() == '/') {
      public_url.pop_back();
    }

    common::util::cereal_load_optional(archive, "http", this->http);
    common::util::cereal_load_optional(archive, "workers", this->workers);
    common::util::cereal_load_optional(archive, "sandbox", this->sandbox);
    common::util::cereal_load_optional(archive, "rate-limit", this->rate_limit);
  }

} // namespace fnrun::server::config
