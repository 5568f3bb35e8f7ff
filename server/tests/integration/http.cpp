#include <fnrun/common/http.hpp>
#include <fnrun/sandbox/result.hpp>
#include <fnrun/sandbox/runner.hpp>
#include <fnrun/server/config.hpp>
#include <fnrun/server/server.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <json/value.h>
#include <spdlog/spdlog.h>

using namespace fnrun;

// Stands in for the sandbox; behavior depends on the entry point.
class FakeRunner : public sandbox::Runner {
public:
  sandbox::InvocationResult
  invoke(const sandbox::Invocation& invocation, const sandbox::Limits&) override
  {
    if (invocation.entry_point == "calculator") {
      int a = invocation.arguments.get("a", 0).asInt();
      int b = invocation.arguments.get("b", 0).asInt();
      Json::Value result;
      result["operation"] = invocation.arguments.get("operation", "add").asString();
      result["result"] = a + b;
      return sandbox::Success{result};
    }

    if (invocation.entry_point == "broken") {
      return sandbox::Failure::execution_error("ValueError: boom");
    }

    if (invocation.entry_point == "echo_env") {
      Json::Value result{Json::objectValue};
      for (const auto& [name, value] : invocation.env) {
        result[name] = value;
      }
      return sandbox::Success{result};
    }

    sandbox::Failure failure = sandbox::Failure::not_found(
        fmt::format("entry point '{}' not found; available: [helper]", invocation.entry_point)
    );
    failure.available = {"helper"};
    return failure;
  }
};

class HttpIntegration : public ::testing::Test {
protected:
  static constexpr int PORT = 18421;

  static void SetUpTestSuite()
  {
    spdlog::set_level(spdlog::level::debug);

    server::config::Config cfg;
    cfg.http.port = PORT;
    cfg.workers.threads = 2;
    cfg.public_url = fmt::format("http://127.0.0.1:{}", PORT);
    cfg.rate_limit.enabled = true;
    cfg.rate_limit.deploy = server::config::RateLimitRule{100, 900};
    cfg.rate_limit.execute = server::config::RateLimitRule{0, 60};
    cfg.rate_limit.read = server::config::RateLimitRule{3, 60};

    server::Server::configure(cfg, std::make_unique<FakeRunner>());
    server::Server::instance()->run();

    for (int i = 0; i < 100 && !drogon::app().isRunning(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    common::http::HTTPClientFactory::initialize(1);
  }

  static void TearDownTestSuite()
  {
    common::http::HTTPClientFactory::shutdown();
    server::Server::instance()->shutdown();
    server::Server::instance()->wait();
  }

  using response_t = drogon::HttpResponsePtr;

  template <typename Send>
  static response_t wait_for(Send&& send)
  {
    auto promise = std::make_shared<std::promise<response_t>>();
    auto future = promise->get_future();
    send([promise](drogon::ReqResult result, const response_t& response) {
      promise->set_value(result == drogon::ReqResult::Ok ? response : nullptr);
    });
    if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
      return nullptr;
    }
    return future.get();
  }

  static response_t get(const std::string& path, const std::string& client)
  {
    auto http = common::http::HTTPClientFactory::create_client("http://127.0.0.1", PORT);
    return wait_for([&](auto&& callback) {
      http.get(path, {{"X-Forwarded-For", client}}, std::move(callback));
    });
  }

  static response_t post(const std::string& path, const std::string& client, Json::Value body)
  {
    auto http = common::http::HTTPClientFactory::create_client("http://127.0.0.1", PORT);
    return wait_for([&](auto&& callback) {
      http.post(path, {{"X-Forwarded-For", client}}, std::move(body), std::move(callback));
    });
  }

  static response_t
  post_raw(const std::string& path, const std::string& client, const std::string& body)
  {
    auto http = common::http::HTTPClientFactory::create_client("http://127.0.0.1", PORT);
    return wait_for([&](auto&& callback) {
      http.post(path, {{"X-Forwarded-For", client}}, body, std::move(callback));
    });
  }

  static Json::Value json(const response_t& response)
  {
    auto body = response->getJsonObject();
    return body ? *body : Json::Value{};
  }

  static Json::Value deploy_body(const std::string& name)
  {
    Json::Value body;
    body["function_name"] = name;
    body["code"] = fmt::format("def {}(**kwargs):\n    return kwargs\n", name);
    return body;
  }
};

TEST_F(HttpIntegration, Health)
{
  auto response = get("/health", "10.0.0.1");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(json(response)["status"].asString(), "healthy");
  EXPECT_TRUE(json(response)["deployed_functions"].isArray());
  EXPECT_EQ(response->getHeader("X-RateLimit-Limit"), "3");
  EXPECT_EQ(response->getHeader("X-RateLimit-Remaining"), "2");
}

TEST_F(HttpIntegration, DeployAndExecute)
{
  auto response = post("/deploy", "10.0.0.2", deploy_body("calculator"));
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_TRUE(json(response)["success"].asBool());
  EXPECT_EQ(
      json(response)["endpoint"].asString(),
      fmt::format("http://127.0.0.1:{}/execute/calculator", PORT)
  );
  EXPECT_EQ(json(response)["deployment_id"].asString().rfind("deploy_", 0), 0u);

  Json::Value arguments;
  arguments["operation"] = "add";
  arguments["a"] = 2;
  arguments["b"] = 3;
  response = post("/execute/calculator", "10.0.0.2", arguments);
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_TRUE(json(response)["success"].asBool());
  EXPECT_EQ(json(response)["result"]["operation"].asString(), "add");
  EXPECT_EQ(json(response)["result"]["result"].asInt(), 5);

  // An empty body means no arguments.
  response = post_raw("/execute/calculator", "10.0.0.2", "");
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(json(response)["result"]["result"].asInt(), 0);

  response = get("/health", "10.0.0.2");
  ASSERT_NE(response, nullptr);
  bool listed = false;
  for (const Json::Value& name : json(response)["deployed_functions"]) {
    listed |= name.asString() == "calculator";
  }
  EXPECT_TRUE(listed);
}

TEST_F(HttpIntegration, Namespaced)
{
  Json::Value body = deploy_body("calculator");
  body["owner"] = "alice";
  body["repo"] = "tools";
  auto response = post("/deploy", "10.0.0.3", body);
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(
      json(response)["endpoint"].asString(),
      fmt::format("http://127.0.0.1:{}/execute/alice/tools/calculator", PORT)
  );

  Json::Value arguments;
  arguments["a"] = 40;
  arguments["b"] = 2;
  response = post("/execute/alice/tools/calculator", "10.0.0.3", arguments);
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(json(response)["result"]["result"].asInt(), 42);

  response = post("/execute/bob/tools/calculator", "10.0.0.3", arguments);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
}

TEST_F(HttpIntegration, NotDeployed)
{
  auto response = post("/execute/never_deployed", "10.0.0.4", Json::Value{Json::objectValue});
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
  EXPECT_FALSE(json(response)["success"].asBool());
  EXPECT_EQ(json(response)["error"].asString(), "NotFound");
  EXPECT_EQ(
      json(response)["detail"].asString(), "function 'never_deployed' not found, deploy it first"
  );
}

TEST_F(HttpIntegration, EntryPointNotFound)
{
  auto response = post("/deploy", "10.0.0.5", deploy_body("misnamed"));
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

  response = post("/execute/misnamed", "10.0.0.5", Json::Value{Json::objectValue});
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k404NotFound);
  ASSERT_EQ(json(response)["available"].size(), 1u);
  EXPECT_EQ(json(response)["available"][0].asString(), "helper");
}

TEST_F(HttpIntegration, ExecutionFailure)
{
  auto response = post("/deploy", "10.0.0.6", deploy_body("broken"));
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

  response = post("/execute/broken", "10.0.0.6", Json::Value{Json::objectValue});
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k500InternalServerError);
  EXPECT_EQ(json(response)["error"].asString(), "ExecutionError");
  EXPECT_EQ(json(response)["detail"].asString(), "ValueError: boom");
}

TEST_F(HttpIntegration, BadRequests)
{
  auto response = post_raw("/deploy", "10.0.0.7", "{not json");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k400BadRequest);
  EXPECT_EQ(json(response)["error"].asString(), "InvalidArguments");

  Json::Value body = deploy_body("f");
  body["function_name"] = "import";
  response = post("/deploy", "10.0.0.7", body);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k400BadRequest);

  response = post_raw("/execute/calculator", "10.0.0.7", "[1, 2]");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k400BadRequest);
}

TEST_F(HttpIntegration, Deployments)
{
  Json::Value body = deploy_body("echo_env");
  body["env_vars"]["API_KEY"] = "secret-value";
  auto response = post("/deploy", "10.0.0.8", body);
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);

  response = post("/execute/echo_env", "10.0.0.8", Json::Value{Json::objectValue});
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(json(response)["result"]["API_KEY"].asString(), "secret-value");

  response = get("/deployments", "10.0.0.8");
  ASSERT_NE(response, nullptr);
  ASSERT_EQ(response->getStatusCode(), drogon::k200OK);
  EXPECT_EQ(std::string{response->body()}.find("secret-value"), std::string::npos);

  bool found = false;
  for (const Json::Value& item : json(response)["deployments"]) {
    if (item["key"].asString() == "echo_env") {
      found = true;
      ASSERT_EQ(item["env_vars"].size(), 1u);
      EXPECT_EQ(item["env_vars"][0].asString(), "API_KEY");
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(HttpIntegration, RateLimited)
{
  for (int i = 0; i < 3; ++i) {
    auto response = get("/health", "10.0.0.9");
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
  }

  auto response = get("/health", "10.0.0.9");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k429TooManyRequests);
  EXPECT_FALSE(json(response)["success"].asBool());
  EXPECT_EQ(json(response)["error"].asString(), "RateLimited");
  EXPECT_GE(json(response)["retry_after"].asInt(), 1);
  EXPECT_FALSE(response->getHeader("Retry-After").empty());
  EXPECT_EQ(response->getHeader("X-RateLimit-Remaining"), "0");

  // Other clients are not affected.
  response = get("/health", "10.0.0.10");
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
}
