#ifndef FNRUN_SERVER_CONFIG_HPP
#define FNRUN_SERVER_CONFIG_HPP

#include <fnrun/sandbox/limits.hpp>

#include <istream>
#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace fnrun::server::config {

  struct HTTPServer {

    static constexpr int DEFAULT_THREADS_NUMBER = 1;
    static constexpr int DEFAULT_PORT = 8080;
    static constexpr int DEFAULT_MAX_PAYLOAD_SIZE = 1024 * 1024;

    HTTPServer()
    {
      set_defaults();
    }

    int port;
    int threads;
    int max_payload_size;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Workers {

    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    Workers()
    {
      set_defaults();
    }

    // Upper bound on concurrently running sandboxes.
    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Sandbox {

    Sandbox()
    {
      set_defaults();
    }

    // Empty selects fnrun-sandbox next to the server executable.
    std::string executable;

    int wall_time_ms;
    int cpu_time_s;
    size_t memory_mb;
    size_t max_result_bytes;
    size_t max_output_bytes;
    int max_open_files;

    // Base environment as NAME=value entries.
    std::vector<std::string> environment;

    std::vector<std::string> allowed_modules;

    sandbox::Limits limits() const;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static std::vector<std::string> default_environment();
    static std::vector<std::string> default_allowed_modules();
  };

  struct RateLimitRule {

    // Zero disables the rule.
    int max = 0;
    int window = 60;

    void load(cereal::JSONInputArchive& archive);
  };

  struct RateLimit {

    static constexpr int DEFAULT_CLEANUP_INTERVAL = 300;

    RateLimit()
    {
      set_defaults();
    }

    bool enabled;
    int cleanup_interval;

    RateLimitRule deploy;
    RateLimitRule execute;
    RateLimitRule read;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Config {

    static constexpr char DEFAULT_PUBLIC_URL[] = "http://127.0.0.1:8080";

    Config()
    {
      set_defaults();
    }

    HTTPServer http;
    Workers workers;
    Sandbox sandbox;
    RateLimit rate_limit;

    // Prefix of the endpoints returned by deploy.
    std::string public_url;

    bool verbose;

    void set_defaults();

    void load(cereal::JSONInputArchive& archive);

    static Config deserialize(int argc, char** argv);
    static Config deserialize(std::istream& in);
  };

} // namespace fnrun::server::config

#endif
