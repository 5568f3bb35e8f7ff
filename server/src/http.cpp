#include <fnrun/server/http.hpp>

#include <fnrun/common/util.hpp>
#include <fnrun/server/config.hpp>
#include <fnrun/server/dispatcher.hpp>

#include <chrono>
#include <memory>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <json/reader.h>

namespace fnrun::server {

  namespace {

    // Empty optional when the body is not valid JSON.
    std::optional<Json::Value> parse_body(const HttpServer::request_t& request, bool allow_empty)
    {
      std::string_view body = request->body();
      if (body.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        if (allow_empty) {
          return Json::Value{Json::objectValue};
        }
        return std::nullopt;
      }

      Json::CharReaderBuilder builder;
      std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
      Json::Value value;
      std::string errors;
      if (!reader->parse(body.data(), body.data() + body.size(), &value, &errors)) {
        return std::nullopt;
      }
      return value;
    }

  } // namespace

  HttpServer::HttpServer(
      const config::HTTPServer& cfg, Dispatcher& dispatcher,
      rate_limiter::RateLimiter& rate_limiter
  )
      : _port(cfg.port), _threads(cfg.threads), _dispatcher(dispatcher),
        _rate_limiter(rate_limiter)
  {
    _logger = common::util::create_logger("HttpServer");
    drogon::app().setClientMaxBodySize(cfg.max_payload_size);
    drogon::app().setIdleConnectionTimeout(120);
  }

  void HttpServer::run()
  {
    drogon::app().disableSigtermHandling();
    drogon::app().registerController(shared_from_this());
    drogon::app().setThreadNum(_threads);
    _logger->info("Listening on port {}", _port);
    _server_thread = std::thread{[this]() { drogon::app().addListener("0.0.0.0", _port).run(); }};
  }

  void HttpServer::shutdown()
  {
    _logger->info("Stopping HTTP server");
    if (drogon::app().isRunning()) {
      drogon::app().getLoop()->queueInLoop([]() { drogon::app().quit(); });
    }
  }

  void HttpServer::wait()
  {
    if (_server_thread.joinable()) {
      _server_thread.join();
    }
    _logger->info("Stopped HTTP server");
  }

  drogon::HttpResponsePtr HttpServer::failed_response(
      const std::string& error, const std::string& detail, drogon::HttpStatusCode status_code
  )
  {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(Dispatcher::error_body(error, detail));
    resp->setStatusCode(status_code);
    return resp;
  }

  drogon::HttpResponsePtr HttpServer::json_response(const Response& response)
  {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(response.body);
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    return resp;
  }

  std::string HttpServer::client_id(const request_t& request)
  {
    const std::string& forwarded = request->getHeader("x-forwarded-for");
    if (!forwarded.empty()) {
      std::string first = forwarded.substr(0, forwarded.find(','));
      auto begin = first.find_first_not_of(' ');
      auto end = first.find_last_not_of(' ');
      if (begin != std::string::npos) {
        return first.substr(begin, end - begin + 1);
      }
    }

    const std::string& real_ip = request->getHeader("x-real-ip");
    if (!real_ip.empty()) {
      return real_ip;
    }

    return request->peerAddr().toIp();
  }

  HttpServer::callback_t HttpServer::_logged(
      const request_t& request, callback_t&& callback,
      std::optional<rate_limiter::Decision> decision
  )
  {
    auto start = std::chrono::high_resolution_clock::now();
    return [this, start, decision, method = std::string{request->methodString()},
            path = request->path(), ip = client_id(request),
            callback = std::move(callback)](const drogon::HttpResponsePtr& resp) {
      if (decision.has_value() && decision->limit > 0) {
        resp->addHeader("X-RateLimit-Limit", std::to_string(decision->limit));
        resp->addHeader("X-RateLimit-Remaining", std::to_string(decision->remaining));
        resp->addHeader("X-RateLimit-Reset", std::to_string(decision->reset_epoch()));
      }

      auto end = std::chrono::high_resolution_clock::now();
      _logger->info(
          "{} {} - {} ({} ms) - IP: {}", method, path, static_cast<int>(resp->statusCode()),
          std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count(), ip
      );
      callback(resp);
    };
  }

  bool HttpServer::_admit(
      const request_t& request, callback_t& callback, rate_limiter::Rule rule,
      std::optional<rate_limiter::Decision>& decision
  )
  {
    if (!_rate_limiter.enabled()) {
      return true;
    }

    auto now = rate_limiter::RateLimiter::clock_t::now();
    decision = _rate_limiter.check(rule, client_id(request), now);
    if (decision->allowed) {
      return true;
    }

    Json::Value json = Dispatcher::error_body("RateLimited", decision->message);
    int64_t retry_after = decision->retry_after(now);
    json["retry_after"] = static_cast<Json::Int64>(retry_after);

    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(drogon::k429TooManyRequests);
    resp->addHeader("Retry-After", std::to_string(retry_after));
    _logged(request, std::move(callback), decision)(resp);
    return false;
  }

  void HttpServer::deploy(const request_t& request, callback_t&& callback)
  {
    std::optional<rate_limiter::Decision> decision;
    if (!_admit(request, callback, rate_limiter::Rule::DEPLOY, decision)) {
      return;
    }
    auto respond = _logged(request, std::move(callback), decision);

    auto body = parse_body(request, false);
    if (!body.has_value()) {
      respond(failed_response(
          "InvalidArguments", "request body must be valid JSON", drogon::k400BadRequest
      ));
      return;
    }

    respond(json_response(_dispatcher.deploy(body.value())));
  }

  void HttpServer::execute_namespaced(
      const request_t& request, callback_t&& callback, const std::string& owner,
      const std::string& repo, const std::string& function_name
  )
  {
    _execute(request, std::move(callback), fmt::format("{}/{}/{}", owner, repo, function_name));
  }

  void HttpServer::execute(
      const request_t& request, callback_t&& callback, const std::string& function_name
  )
  {
    _execute(request, std::move(callback), function_name);
  }

  void HttpServer::_execute(const request_t& request, callback_t&& callback, std::string key)
  {
    std::optional<rate_limiter::Decision> decision;
    if (!_admit(request, callback, rate_limiter::Rule::EXECUTE, decision)) {
      return;
    }
    auto respond = _logged(request, std::move(callback), decision);

    auto body = parse_body(request, true);
    if (!body.has_value() || !body->isObject()) {
      respond(failed_response(
          "InvalidArguments", "request body must be a JSON object of arguments",
          drogon::k400BadRequest
      ));
      return;
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Execute {}", key);
    _dispatcher.add_task([this, key = std::move(key), arguments = std::move(body.value()),
                          respond = std::move(respond)]() {
      respond(json_response(_dispatcher.execute(key, arguments)));
    });
  }

  void HttpServer::health(const request_t& request, callback_t&& callback)
  {
    std::optional<rate_limiter::Decision> decision;
    if (!_admit(request, callback, rate_limiter::Rule::READ, decision)) {
      return;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(_dispatcher.health());
    resp->setStatusCode(drogon::k200OK);
    _logged(request, std::move(callback), decision)(resp);
  }

  void HttpServer::list_deployments(const request_t& request, callback_t&& callback)
  {
    std::optional<rate_limiter::Decision> decision;
    if (!_admit(request, callback, rate_limiter::Rule::READ, decision)) {
      return;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(_dispatcher.deployments());
    resp->setStatusCode(drogon::k200OK);
    _logged(request, std::move(callback), decision)(resp);
  }

} // namespace fnrun::server
