#ifndef FNRUN_SERVER_SERVER_HPP
#define FNRUN_SERVER_SERVER_HPP

#include <fnrun/sandbox/runner.hpp>
#include <fnrun/server/config.hpp>
#include <fnrun/server/dispatcher.hpp>
#include <fnrun/server/http.hpp>
#include <fnrun/server/rate_limiter.hpp>
#include <fnrun/server/registry.hpp>

#include <memory>

#include <spdlog/spdlog.h>

namespace fnrun::server {

  struct Server {

    void run();

    void shutdown();

    void wait();

    int http_port() const
    {
      return _http_server->port();
    }

    Registry& registry()
    {
      return _registry;
    }

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Creates the process-wide server.
    ///
    /// @param[in] cfg server configuration
    /// @param[in] runner sandbox runner; a ProcessRunner built from the
    /// configuration when empty
    ////////////////////////////////////////////////////////////////////////////////
    static void configure(const config::Config& cfg, std::unique_ptr<sandbox::Runner> runner = nullptr)
    {
      _instance.reset(new Server{cfg, std::move(runner)});
    }

    static Server* instance()
    {
      return _instance.get();
    }

  private:
    static std::shared_ptr<Server> _instance;

    Server(const config::Config& cfg, std::unique_ptr<sandbox::Runner> runner);

    static std::unique_ptr<sandbox::Runner> create_runner(const config::Config& cfg);

    std::shared_ptr<spdlog::logger> _logger;

    Registry _registry;

    std::unique_ptr<sandbox::Runner> _runner;

    Dispatcher _dispatcher;

    rate_limiter::RateLimiter _rate_limiter;

    // Shared pointer is required by drogon
    std::shared_ptr<HttpServer> _http_server;
  };

} // namespace fnrun::server

#endif
