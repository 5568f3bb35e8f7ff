#ifndef FNRUN_SERVER_DISPATCHER_HPP
#define FNRUN_SERVER_DISPATCHER_HPP

#include <fnrun/common/util.hpp>
#include <fnrun/sandbox/limits.hpp>
#include <fnrun/sandbox/result.hpp>
#include <fnrun/sandbox/runner.hpp>
#include <fnrun/server/config.hpp>
#include <fnrun/server/registry.hpp>

#include <BS_thread_pool.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <json/value.h>

namespace fnrun::server {

  struct Response {
    int status;
    Json::Value body;
  };

  class Dispatcher {
  public:
    Dispatcher(const config::Config& cfg, Registry& registry, sandbox::Runner& runner);

    template <typename F>
    void add_task(F&& func)
    {
      _pool.detach_task(std::forward<F>(func));
    }

    // Blocks until all queued tasks are finished.
    void wait();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Validates and stores a deployment.
    ///
    /// @param[in] body JSON body of the deploy request
    /// @return {success, endpoint, deployment_id}, or a failure with HTTP 400
    /// for a rejected request
    ////////////////////////////////////////////////////////////////////////////////
    Response deploy(const Json::Value& body);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Runs a deployed function in a sandbox.
    ///
    /// Blocks the calling thread for the duration of the invocation, use
    /// add_task to run it on the worker pool. A key that was never deployed
    /// fails with NotFound and never reaches the runner.
    ///
    /// @param[in] key deployment key
    /// @param[in] arguments JSON object of keyword arguments
    ////////////////////////////////////////////////////////////////////////////////
    Response execute(const std::string& key, const Json::Value& arguments);

    // Never fails, also with no deployments.
    Json::Value health() const;

    Json::Value deployments() const;

    const sandbox::Limits& limits() const
    {
      return _limits;
    }

    static int http_status(sandbox::ErrorKind kind);

    static Json::Value error_body(std::string_view error, const std::string& detail);

    static Json::Value failure_body(const sandbox::Failure& failure);

  private:
    Registry& _registry;

    sandbox::Runner& _runner;

    sandbox::Limits _limits;

    std::string _public_url;

    std::shared_ptr<spdlog::logger> _logger;

    // Last, so running tasks finish before the members they use are destroyed.
    BS::thread_pool _pool;
  };

} // namespace fnrun::server

#endif
