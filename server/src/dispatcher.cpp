#include <fnrun/server/dispatcher.hpp>

#include <fnrun/common/exceptions.hpp>
#include <fnrun/server/validation.hpp>

#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fnrun::server {

  Dispatcher::Dispatcher(const config::Config& cfg, Registry& registry, sandbox::Runner& runner)
      : _registry(registry), _runner(runner), _limits(cfg.sandbox.limits()),
        _public_url(cfg.public_url), _logger(common::util::create_logger("Dispatcher")),
        _pool(cfg.workers.threads)
  {
  }

  void Dispatcher::wait()
  {
    _pool.wait();
  }

  int Dispatcher::http_status(sandbox::ErrorKind kind)
  {
    switch (kind) {
    case sandbox::ErrorKind::NOT_FOUND:
      return 404;
    case sandbox::ErrorKind::INVALID_ARGUMENTS:
      return 400;
    default:
      return 500;
    }
  }

  Json::Value Dispatcher::error_body(std::string_view error, const std::string& detail)
  {
    Json::Value body{Json::objectValue};
    body["success"] = false;
    body["error"] = std::string{error};
    body["detail"] = detail;
    return body;
  }

  Json::Value Dispatcher::failure_body(const sandbox::Failure& failure)
  {
    Json::Value body = error_body(sandbox::kind_to_string(failure.kind), failure.message);
    if (failure.kind == sandbox::ErrorKind::NOT_FOUND) {
      Json::Value available{Json::arrayValue};
      for (const std::string& name : failure.available) {
        available.append(name);
      }
      body["available"] = available;
    }
    return body;
  }

  Response Dispatcher::deploy(const Json::Value& body)
  {
    validation::DeployRequest request;
    if (auto err = validation::parse_deploy(body, request); err.has_value()) {
      _logger->info("Rejected deployment: {}", err.value());
      return Response{
          http_status(sandbox::ErrorKind::INVALID_ARGUMENTS),
          error_body(sandbox::kind_to_string(sandbox::ErrorKind::INVALID_ARGUMENTS), err.value())};
    }

    DeploymentPtr record;
    try {
      record = _registry.put(request.key, std::move(request.code), std::move(request.env));
    } catch (common::FnRunException& exc) {
      _logger->error("Could not store deployment {}: {}", request.key.str(), exc.what());
      return Response{
          http_status(sandbox::ErrorKind::INTERNAL_ERROR),
          error_body(sandbox::kind_to_string(sandbox::ErrorKind::INTERNAL_ERROR), exc.what())};
    }

    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                         record->created_at.time_since_epoch()
    )
                         .count();
    std::string key = record->key.str();
    _logger->info("Deployed {}, revision {}", key, record->revision);

    Json::Value response{Json::objectValue};
    response["success"] = true;
    response["endpoint"] = fmt::format("{}/execute/{}", _public_url, key);
    response["deployment_id"] = fmt::format("deploy_{}", timestamp);
    return Response{200, response};
  }

  Response Dispatcher::execute(const std::string& key, const Json::Value& arguments)
  {
    DeploymentPtr record;
    try {
      record = _registry.get(key);
    } catch (common::FnRunException& exc) {
      _logger->error("Could not read deployment {}: {}", key, exc.what());
      return Response{
          http_status(sandbox::ErrorKind::INTERNAL_ERROR),
          error_body(sandbox::kind_to_string(sandbox::ErrorKind::INTERNAL_ERROR), exc.what())};
    }

    if (!record) {
      return Response{
          http_status(sandbox::ErrorKind::NOT_FOUND),
          error_body(
              sandbox::kind_to_string(sandbox::ErrorKind::NOT_FOUND),
              fmt::format("function '{}' not found, deploy it first", key)
          )};
    }

    sandbox::Invocation invocation{
        key, record->source, record->entry_point, arguments, record->env};

    sandbox::InvocationResult result;
    try {
      result = _runner.invoke(invocation, _limits);
    } catch (std::exception& exc) {
      _logger->error("Sandbox failure while executing {}: {}", key, exc.what());
      result = sandbox::Failure::internal_error(exc.what());
    }

    if (const auto* success = std::get_if<sandbox::Success>(&result)) {
      Json::Value response{Json::objectValue};
      response["success"] = true;
      response["result"] = success->value;
      return Response{200, response};
    }

    const auto& failure = std::get<sandbox::Failure>(result);
    _logger->info(
        "Execution of {} failed: {} {}", key, sandbox::kind_to_string(failure.kind),
        failure.message
    );
    return Response{http_status(failure.kind), failure_body(failure)};
  }

  Json::Value Dispatcher::health() const
  {
    Json::Value functions{Json::arrayValue};
    for (const std::string& key : _registry.list()) {
      functions.append(key);
    }

    Json::Value response{Json::objectValue};
    response["status"] = "healthy";
    response["deployed_functions"] = functions;
    return response;
  }

  Json::Value Dispatcher::deployments() const
  {
    Json::Value list{Json::arrayValue};
    for (const DeploymentPtr& record : _registry.deployments()) {

      Json::Value item{Json::objectValue};
      item["key"] = record->key.str();
      item["entry_point"] = record->entry_point;
      item["revision"] = record->revision;
      item["created_at"] = record->created_at_iso();

      Json::Value names{Json::arrayValue};
      for (const auto& [name, _] : record->env) {
        names.append(name);
      }
      item["env_vars"] = names;

      list.append(item);
    }

    Json::Value response{Json::objectValue};
    response["deployments"] = list;
    return response;
  }

} // namespace fnrun::server
