#ifndef FNRUN_SERVER_HTTP_HPP
#define FNRUN_SERVER_HTTP_HPP

#include <fnrun/server/rate_limiter.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <drogon/HttpTypes.h>
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>

namespace fnrun::server {

  class Dispatcher;
  struct Response;

  namespace config {
    struct HTTPServer;
  } // namespace config

  struct HttpServer : public drogon::HttpController<HttpServer, false>,
                      std::enable_shared_from_this<HttpServer> {
    using request_t = drogon::HttpRequestPtr;
    using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HttpServer::deploy, "/deploy", drogon::Post);
    ADD_METHOD_TO(HttpServer::execute_namespaced, "/execute/{1}/{2}/{3}", drogon::Post);
    ADD_METHOD_TO(HttpServer::execute, "/execute/{1}", drogon::Post);
    ADD_METHOD_TO(HttpServer::health, "/health", drogon::Get);
    ADD_METHOD_TO(HttpServer::list_deployments, "/deployments", drogon::Get);
    METHOD_LIST_END

    HttpServer(
        const config::HTTPServer& cfg, Dispatcher& dispatcher,
        rate_limiter::RateLimiter& rate_limiter
    );

    void run();
    void shutdown();
    void wait();

    void deploy(const request_t& request, callback_t&& callback);

    void execute_namespaced(
        const request_t& request, callback_t&& callback, const std::string& owner,
        const std::string& repo, const std::string& function_name
    );

    void execute(const request_t& request, callback_t&& callback, const std::string& function_name);

    void health(const request_t& request, callback_t&& callback);

    void list_deployments(const request_t& request, callback_t&& callback);

    static drogon::HttpResponsePtr failed_response(
        const std::string& error, const std::string& detail,
        drogon::HttpStatusCode code = drogon::k500InternalServerError
    );

    static drogon::HttpResponsePtr json_response(const Response& response);

    // First X-Forwarded-For entry, then X-Real-IP, then the peer address.
    static std::string client_id(const request_t& request);

    int port() const
    {
      return _port;
    }

  private:
    // Wraps the callback to log the request and attach rate limit headers.
    callback_t _logged(
        const request_t& request, callback_t&& callback,
        std::optional<rate_limiter::Decision> decision
    );

    // Counts the request; a rejected one is answered with 429 and false is returned.
    bool _admit(
        const request_t& request, callback_t& callback, rate_limiter::Rule rule,
        std::optional<rate_limiter::Decision>& decision
    );

    void _execute(const request_t& request, callback_t&& callback, std::string key);

    int _port;

    int _threads;

    Dispatcher& _dispatcher;

    rate_limiter::RateLimiter& _rate_limiter;

    std::shared_ptr<spdlog::logger> _logger;
    std::thread _server_thread;
  };

} // namespace fnrun::server

#endif
