#include <fnrun/server/server.hpp>

#include <fnrun/common/util.hpp>

#include <spdlog/spdlog.h>

namespace fnrun::server {

  std::shared_ptr<Server> Server::_instance = nullptr;

  Server::Server(const config::Config& cfg, std::unique_ptr<sandbox::Runner> runner)
      : _logger(common::util::create_logger("Server")),
        _runner(runner ? std::move(runner) : create_runner(cfg)),
        _dispatcher(cfg, _registry, *_runner), _rate_limiter(cfg.rate_limit),
        _http_server(std::make_shared<HttpServer>(cfg.http, _dispatcher, _rate_limiter))
  {
    _logger->info(
        "Sandbox limits: wall time {} ms, CPU time {} s, memory {} MiB, {} workers",
        cfg.sandbox.wall_time_ms, cfg.sandbox.cpu_time_s, cfg.sandbox.memory_mb,
        cfg.workers.threads
    );
    if (_rate_limiter.enabled()) {
      _logger->info("Rate limiting enabled");
    }
  }

  std::unique_ptr<sandbox::Runner> Server::create_runner(const config::Config& cfg)
  {
    sandbox::ProcessRunnerOptions options;
    options.executable = cfg.sandbox.executable;
    options.environment = cfg.sandbox.environment;
    options.allowed_modules = cfg.sandbox.allowed_modules;
    options.verbose = cfg.verbose;
    return std::make_unique<sandbox::ProcessRunner>(std::move(options));
  }

  void Server::run()
  {
    _rate_limiter.run();
    _http_server->run();
  }

  void Server::wait()
  {
    _http_server->wait();
    _rate_limiter.wait();
    _dispatcher.wait();
  }

  void Server::shutdown()
  {
    _rate_limiter.shutdown();
    _http_server->shutdown();
  }

} // namespace fnrun::server
