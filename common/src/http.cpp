#include <fnrun/common/http.hpp>

#include <fnrun/common/exceptions.hpp>

#include <drogon/HttpClient.h>
#include <drogon/HttpRequest.h>
#include <fmt/format.h>
#include <json/value.h>
#include <trantor/net/EventLoop.h>
#include <trantor/net/EventLoopThreadPool.h>

namespace fnrun::common::http {

  std::unique_ptr<trantor::EventLoopThreadPool> HTTPClientFactory::_pool = nullptr;

  HTTPClient::HTTPClient() : _http_client(nullptr) {}

  HTTPClient::HTTPClient(const std::string& address, trantor::EventLoop* loop)
  {
    this->_http_client = drogon::HttpClient::newHttpClient(address, loop, false, false);
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post(
      const std::string& path, headers_t&& headers, Json::Value&& body, callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpJsonRequest(body);
    req->setMethod(drogon::Post);
    req->setPath(path);
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest> HTTPClient::post(
      const std::string& path, headers_t&& headers, const std::string& body,
      callback_t&& callback
  )
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath(path);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    req->setBody(body);
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  std::shared_ptr<drogon::HttpRequest>
  HTTPClient::get(const std::string& path, headers_t&& headers, callback_t&& callback)
  {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath(path);
    request(req, std::forward<headers_t>(headers), std::forward<callback_t>(callback));

    return req;
  }

  void HTTPClient::request(
      std::shared_ptr<drogon::HttpRequest>& req, headers_t&& headers, callback_t&& callback
  )
  {
    if (!_http_client) {
      throw common::FnRunException("HTTP client is not connected!");
    }

    for (const auto& header : headers) {
      req->addHeader(header.first, header.second);
    }
    _http_client->sendRequest(req, std::move(callback));
  }

  void HTTPClientFactory::initialize(int thread_num)
  {
    HTTPClientFactory::_pool = std::make_unique<trantor::EventLoopThreadPool>(thread_num);
    HTTPClientFactory::_pool->start();
  }

  void HTTPClientFactory::shutdown()
  {
    HTTPClientFactory::_pool.reset();
  }

  HTTPClient HTTPClientFactory::create_client(std::string address, int port)
  {
    if (!_pool) {
      throw common::FnRunException("Uninitialized HTTPClientFactory!");
    }

    if (port != -1) {
      return HTTPClient{fmt::format("{}:{}", address, port), _pool->getNextLoop()};
    } else {
      return HTTPClient{address, _pool->getNextLoop()};
    }
  }

} // namespace fnrun::common::http
