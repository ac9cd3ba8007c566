#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "wallet/http_error.hpp"
#include "wallet/request_pipeline.hpp"

namespace {
namespace http = boost::beast::http;

class RequestPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logger_ = std::make_shared<wallet::Logger>("wallet-service");
    logger_->SetSink([](const wallet::LogRecord&, const nlohmann::json&) {});
    config_.service_version = "2.0.1";
    config_.cors_origins = wallet::CorsOriginsFor("development");

    auto routes = std::make_shared<wallet::Router>();
    routes->Post("/echo", [](wallet::RequestContext& ctx, wallet::HttpResponse& res) {
      res.result(http::status::ok);
      res.body() = ctx.json_body.dump();
    });
    routes->Get("/fail", [](wallet::RequestContext&, wallet::HttpResponse&) {
      throw std::runtime_error("downstream exploded");
    });
    routes->Get("/missing/:id", [](wallet::RequestContext& ctx, wallet::HttpResponse&) {
      throw wallet::NotFound("Wallet " + ctx.path_params["id"] + " not found", "WALLET_NOT_FOUND");
    });
    pipeline_ = std::make_unique<wallet::RequestPipeline>(config_, logger_, routes);
  }

  wallet::HttpResponse Send(http::verb method, const std::string& target, const std::string& body = "",
                            const std::string& content_type = "") {
    wallet::HttpRequest req{method, target, 11};
    if (!content_type.empty()) {
      req.set(http::field::content_type, content_type);
    }
    req.body() = body;
    req.prepare_payload();
    return pipeline_->Handle(req, "trace");
  }

  wallet::AppConfig config_;
  std::shared_ptr<wallet::Logger> logger_;
  std::unique_ptr<wallet::RequestPipeline> pipeline_;
};

}  // namespace

TEST_F(RequestPipelineTest, HealthReportsServiceIdentity) {
  auto res = Send(http::verb::get, "/health");
  ASSERT_EQ(res.result(), http::status::ok);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["status"], "healthy");
  EXPECT_EQ(body["service"], "wallet-service");
  EXPECT_EQ(body["version"], "2.0.1");
  EXPECT_EQ(std::string(res["X-Content-Type-Options"]), "nosniff");
}

TEST_F(RequestPipelineTest, HeadHealthSendsHeadersWithoutBody) {
  auto get = Send(http::verb::get, "/health");
  auto res = Send(http::verb::head, "/health");
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_TRUE(res.body().empty());
  EXPECT_EQ(std::string(res[http::field::content_type]), "application/json; charset=utf-8");
  EXPECT_EQ(std::string(res[http::field::content_length]), std::to_string(get.body().size()));
  EXPECT_EQ(std::string(res["X-Content-Type-Options"]), "nosniff");
}

TEST_F(RequestPipelineTest, UnknownRouteIsNotFoundWithOriginalUrl) {
  auto res = Send(http::verb::get, "/unknown/path?page=2");
  ASSERT_EQ(res.result(), http::status::not_found);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["error"], "Not Found");
  EXPECT_EQ(body["code"], "ROUTE_NOT_FOUND");
  EXPECT_EQ(body["message"], "Route /unknown/path?page=2 not found");
}

TEST_F(RequestPipelineTest, UnmatchedApiPathFallsThroughToNotFound) {
  auto res = Send(http::verb::get, "/api/v1/nothing-here");
  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(nlohmann::json::parse(res.body())["code"], "ROUTE_NOT_FOUND");
}

TEST_F(RequestPipelineTest, MountedRouteReceivesDecodedJson) {
  auto res = Send(http::verb::post, "/api/v1/echo", R"({"amount":5})", "application/json");
  ASSERT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(res.body())["amount"], 5);
}

TEST_F(RequestPipelineTest, MalformedJsonIsBadRequest) {
  auto res = Send(http::verb::post, "/api/v1/echo", "{oops", "application/json");
  ASSERT_EQ(res.result(), http::status::bad_request);
  EXPECT_EQ(nlohmann::json::parse(res.body())["code"], "INVALID_JSON");
}

TEST_F(RequestPipelineTest, HandlerExceptionBecomesJsonError) {
  auto res = Send(http::verb::get, "/api/v1/fail");
  ASSERT_EQ(res.result(), http::status::internal_server_error);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["error"], "downstream exploded");
  EXPECT_EQ(body["code"], "INTERNAL_ERROR");
  EXPECT_EQ(body["path"], "/api/v1/fail");
}

TEST_F(RequestPipelineTest, HttpErrorFromHandlerKeepsStatus) {
  auto res = Send(http::verb::get, "/api/v1/missing/w-7");
  ASSERT_EQ(res.result(), http::status::not_found);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["code"], "WALLET_NOT_FOUND");
  EXPECT_EQ(body["error"], "Wallet w-7 not found");
}

TEST_F(RequestPipelineTest, PreflightShortCircuitsRouting) {
  wallet::HttpRequest req{http::verb::options, "/api/v1/echo", 11};
  req.set(http::field::origin, "http://localhost:8000");
  req.set(http::field::access_control_request_method, "POST");
  auto res = pipeline_->Handle(req, "trace");
  EXPECT_EQ(res.result(), http::status::no_content);
  EXPECT_EQ(std::string(res[http::field::access_control_allow_origin]), "http://localhost:8000");
  EXPECT_EQ(std::string(res["X-Frame-Options"]), "SAMEORIGIN");
}
