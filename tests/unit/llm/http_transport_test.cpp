#include <gtest/gtest.h>

#include <memory>

#include "common/local_server_test.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/llm/http_transport.hpp"
#include "lore_core/llm/openai_client.hpp"

namespace lore_core {

using lore_tests::LocalServer;

class CurlTransportTest : public ::testing::Test {
 protected:
  HttpRequest request_to(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.headers.push_back("Content-Type: application/json");
    request.body = R"({"input":"hello"})";
    request.timeout = std::chrono::milliseconds(100);
    return request;
  }

  CurlTransport transport_;
};

TEST_F(CurlTransportTest, SilentServerTimesOutAsUnavailable) {
  LocalServer server;

  try {
    transport_.post(request_to(server.url("/v1/embeddings")));
    FAIL() << "Expected ProviderUnavailable";
  } catch (const RateLimited&) {
    FAIL() << "A timeout must not be reported as rate limiting";
  } catch (const ProviderUnavailable& e) {
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
  }
}

TEST_F(CurlTransportTest, RefusedConnectionIsUnavailable) {
  const std::string url =
      "http://127.0.0.1:" + std::to_string(LocalServer::unused_port()) + "/v1/embeddings";
  EXPECT_THROW(transport_.post(request_to(url)), ProviderUnavailable);
}

TEST_F(CurlTransportTest, ReturnsStatusBodyAndLowerCasedHeaders) {
  LocalServer server;
  server.respond_once(LocalServer::http_response(429, "Too Many Requests", "Retry-After: 2\r\n",
                                                 R"({"error":"slow down"})"));

  HttpRequest request = request_to(server.url("/v1/embeddings"));
  request.timeout = std::chrono::milliseconds(5000);
  HttpResponse response = transport_.post(request);

  EXPECT_EQ(response.status_code, 429);
  EXPECT_EQ(response.body, R"({"error":"slow down"})");
  EXPECT_EQ(response.headers["retry-after"], "2");

  std::string received = server.received_request();
  EXPECT_EQ(received.rfind("POST /v1/embeddings HTTP/1.1", 0), 0u);
  EXPECT_NE(received.find(R"({"input":"hello"})"), std::string::npos);
}

TEST_F(CurlTransportTest, OpenAIClientSurfacesRetryAfterFromTheWire) {
  LocalServer server;
  server.respond_once(LocalServer::http_response(429, "Too Many Requests", "Retry-After: 2\r\n",
                                                 R"({"error":"slow down"})"));

  ProviderSettings settings;
  settings.provider = "openai";
  settings.endpoint = server.url("/v1");
  settings.model = "text-embedding-3-small";
  settings.api_key = "sk-test";
  settings.timeout = std::chrono::milliseconds(5000);
  OpenAIClient client(settings, std::make_shared<CurlTransport>());

  try {
    client.embed("hello");
    FAIL() << "Expected RateLimited";
  } catch (const RateLimited& e) {
    ASSERT_TRUE(e.retry_after().has_value());
    EXPECT_EQ(*e.retry_after(), std::chrono::milliseconds(2000));
  }
  EXPECT_NE(server.received_request().find("Authorization: Bearer sk-test"), std::string::npos);
}

}  // namespace lore_core
