#ifndef FNRUN_COMMON_HTTP_HPP
#define FNRUN_COMMON_HTTP_HPP

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

namespace drogon {
  class HttpRequest;
  class HttpResponse;
  enum class ReqResult;
  class HttpClient;
} // namespace drogon

namespace trantor {
  class EventLoop;
  class EventLoopThreadPool;
} // namespace trantor

namespace Json {
  class Value;
} // namespace Json

namespace fnrun::common::http {

  struct HTTPClient {

    using request_ptr_t = std::shared_ptr<drogon::HttpRequest>;
    using response_ptr_t = std::shared_ptr<drogon::HttpResponse>;
    using headers_t = std::initializer_list<std::pair<std::string, std::string>>;
    using callback_t =
        std::function<void(drogon::ReqResult, const std::shared_ptr<drogon::HttpResponse>&)>;

    HTTPClient();

    HTTPClient(const std::string& address, trantor::EventLoop* loop);

    request_ptr_t get(const std::string& path, headers_t&& headers, callback_t&& callback);

    request_ptr_t
    post(const std::string& path, headers_t&& headers, Json::Value&& body, callback_t&& callback);

    // Sends the body as-is, without any JSON validation.
    request_ptr_t post(
        const std::string& path, headers_t&& headers, const std::string& body,
        callback_t&& callback
    );

  private:
    void request(request_ptr_t& req, headers_t&& headers, callback_t&& callback);

    std::shared_ptr<drogon::HttpClient> _http_client;
  };

  struct HTTPClientFactory {

    static void initialize(int thread_num);
    static void shutdown();

    static HTTPClient create_client(std::string address, int port = -1);

  private:
    static std::unique_ptr<trantor::EventLoopThreadPool> _pool;
  };

} // namespace fnrun::common::http

#endif
