#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "net/http_client.hpp"
#include "net/sse_parser.hpp"
#include "test_server.hpp"

using namespace stepagent::net;
using test_support::Responder;
using test_support::SilentHttpServer;
using test_support::TestHttpServer;
using test_support::TestRequest;

// ============================================================
// ParsedUrl 解析测试
// ============================================================

TEST(ParsedUrlTest, ParseHttpUrl) {
  auto result = ParsedUrl::parse("http://example.com/path");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->scheme, "http");
  EXPECT_EQ(result->host, "example.com");
  EXPECT_EQ(result->path, "/path");
  EXPECT_TRUE(result->port.empty());
  EXPECT_EQ(result->port_or_default(), "80");
  EXPECT_FALSE(result->is_https());
}

TEST(ParsedUrlTest, ParseHttpsWithPortAndQuery) {
  auto result = ParsedUrl::parse("HTTPS://api.example.com:8443/v1/mcp?session=abc");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->scheme, "https");
  EXPECT_EQ(result->host, "api.example.com");
  EXPECT_EQ(result->port, "8443");
  EXPECT_EQ(result->path, "/v1/mcp");
  EXPECT_EQ(result->query, "?session=abc");
  EXPECT_EQ(result->target(), "/v1/mcp?session=abc");
  EXPECT_TRUE(result->is_https());
}

TEST(ParsedUrlTest, ParseUrlNoPath) {
  auto result = ParsedUrl::parse("https://example.com");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->path, "/");
  EXPECT_EQ(result->port_or_default(), "443");

  auto query_only = ParsedUrl::parse("http://example.com?x=1");
  ASSERT_TRUE(query_only.has_value());
  EXPECT_EQ(query_only->path, "/");
  EXPECT_EQ(query_only->query, "?x=1");
}

TEST(ParsedUrlTest, ParseIpv6Literal) {
  auto result = ParsedUrl::parse("http://[::1]:9000/sse");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->host, "::1");
  EXPECT_EQ(result->port, "9000");
  EXPECT_EQ(result->origin(), "http://[::1]:9000");
}

TEST(ParsedUrlTest, InvalidUrl) {
  EXPECT_FALSE(ParsedUrl::parse("").has_value());
  EXPECT_FALSE(ParsedUrl::parse("not-a-url").has_value());
  EXPECT_FALSE(ParsedUrl::parse("ftp://example.com/file").has_value());
  EXPECT_FALSE(ParsedUrl::parse("http:///path").has_value());
  EXPECT_FALSE(ParsedUrl::parse("http://host:port/").has_value());
  EXPECT_FALSE(ParsedUrl::parse("http://[::1/x").has_value());
}

// ============================================================
// 相对地址解析（SSE endpoint 事件）
// ============================================================

TEST(ParsedUrlTest, ResolveReferences) {
  auto base = ParsedUrl::parse("http://localhost:8000/mcp/sse");
  ASSERT_TRUE(base.has_value());

  // 绝对路径
  EXPECT_EQ(base->resolve("/messages?sessionId=1"), "http://localhost:8000/messages?sessionId=1");
  // 相对路径基于当前目录
  EXPECT_EQ(base->resolve("messages?sessionId=2"), "http://localhost:8000/mcp/messages?sessionId=2");
  // 完整 URL 原样返回
  EXPECT_EQ(base->resolve("https://other.example.com/post"), "https://other.example.com/post");
  // 空引用指向自身
  EXPECT_EQ(base->resolve(""), "http://localhost:8000/mcp/sse");
}

// ============================================================
// HttpResponse
// ============================================================

TEST(HttpResponseTest, HeaderLookupIsCaseInsensitive) {
  HttpResponse response;
  response.status_code = 202;
  response.headers["mcp-session-id"] = "abc";

  EXPECT_TRUE(response.ok());
  EXPECT_EQ(response.header("Mcp-Session-Id"), "abc");
  EXPECT_EQ(response.header("missing"), "");

  response.status_code = 404;
  EXPECT_FALSE(response.ok());
}

// ============================================================
// ChunkedDecoder
// ============================================================

TEST(ChunkedDecoderTest, DecodesWholeBody) {
  ChunkedDecoder decoder;
  std::string out;

  EXPECT_TRUE(decoder.feed("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n", out));
  EXPECT_EQ(out, "Wikipedia");
  EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, DecodesByteByByte) {
  const std::string body = "a;ext=1\r\n0123456789\r\n3\r\nabc\r\n0\r\nX-Trailer: y\r\n\r\n";
  ChunkedDecoder decoder;
  std::string out;

  for (char c : body) {
    ASSERT_TRUE(decoder.feed(std::string_view(&c, 1), out));
  }
  EXPECT_EQ(out, "0123456789abc");
  EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, IncompleteBodyIsNotDone) {
  ChunkedDecoder decoder;
  std::string out;

  EXPECT_TRUE(decoder.feed("5\r\nhel", out));
  EXPECT_EQ(out, "hel");
  EXPECT_FALSE(decoder.done());
}

TEST(ChunkedDecoderTest, RejectsMalformedFraming) {
  std::string out;

  ChunkedDecoder bad_size;
  EXPECT_FALSE(bad_size.feed("zz\r\n", out));

  ChunkedDecoder missing_crlf;
  EXPECT_FALSE(missing_crlf.feed("2\r\nabX", out));
}

// ============================================================
// SseParser
// ============================================================

class SseParserTest : public ::testing::Test {
 protected:
  SseParser make_parser() {
    return SseParser([this](const SseEvent &event) {
      events.push_back(event);
      return true;
    });
  }

  std::vector<SseEvent> events;
};

TEST_F(SseParserTest, DefaultEventIsMessage) {
  auto parser = make_parser();
  parser.feed("data: {\"jsonrpc\":\"2.0\"}\n\n");

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event, "message");
  EXPECT_EQ(events[0].data, "{\"jsonrpc\":\"2.0\"}");
}

TEST_F(SseParserTest, EndpointEvent) {
  auto parser = make_parser();
  parser.feed("event: endpoint\ndata: /messages?sessionId=42\n\n");

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event, "endpoint");
  EXPECT_EQ(events[0].data, "/messages?sessionId=42");
}

TEST_F(SseParserTest, MultiLineDataAndCrlf) {
  auto parser = make_parser();
  parser.feed("id: 7\r\ndata: line one\r\ndata: line two\r\n\r\n");

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].data, "line one\nline two");
  EXPECT_EQ(events[0].id, "7");
}

TEST_F(SseParserTest, CommentsAndEmptyEventsAreSkipped) {
  auto parser = make_parser();
  parser.feed(": keep-alive\n\n");
  parser.feed("event: ping\n\n");

  EXPECT_TRUE(events.empty());

  // 无数据的事件名不会泄漏到下一个事件
  parser.feed("data: x\n\n");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event, "message");
}

TEST_F(SseParserTest, EventsSplitAcrossFeeds) {
  auto parser = make_parser();
  parser.feed("event: mess");
  parser.feed("age\nda");
  EXPECT_TRUE(events.empty());
  parser.feed("ta: {\"id\":1}\n");
  EXPECT_TRUE(events.empty());
  parser.feed("\n");

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].data, "{\"id\":1}");
}

TEST(SseParserStopTest, HandlerCanStopParsing) {
  int seen = 0;
  SseParser parser([&](const SseEvent &) {
    ++seen;
    return false;
  });

  EXPECT_FALSE(parser.feed("data: a\n\ndata: b\n\n"));
  EXPECT_EQ(seen, 1);
}

// ============================================================
// HttpClient（本地回环服务器）
// ============================================================

TEST(HttpClientTest, GetWithContentLength) {
  TestHttpServer server([](const TestRequest &req, Responder &res) {
    res.send(200, "text/plain", req.method + " " + req.target, {{"X-Test", "yes"}});
  });

  HttpClient client;
  HttpOptions options;
  options.timeout = std::chrono::milliseconds(5000);
  auto response = client.request(server.url("/hello?x=1"), options);

  EXPECT_TRUE(response.error.empty()) << response.error;
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "GET /hello?x=1");
  EXPECT_EQ(response.header("x-test"), "yes");
}

TEST(HttpClientTest, PostSendsBodyAndHeaders) {
  TestHttpServer server([](const TestRequest &req, Responder &res) {
    res.send(200, "application/json", req.header("content-type") + "|" + req.body);
  });

  HttpClient client;
  HttpOptions options;
  options.method = "POST";
  options.headers["Content-Type"] = "application/json";
  options.body = R"({"a":1})";
  auto response = client.request(server.url("/post"), options);

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, R"(application/json|{"a":1})");
}

TEST(HttpClientTest, ChunkedResponse) {
  TestHttpServer server([](const TestRequest &, Responder &res) {
    res.write_raw(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
        "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
  });

  HttpClient client;
  auto response = client.request(server.url("/"), HttpOptions{});

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "hello world");
}

TEST(HttpClientTest, ErrorStatusKeepsBody) {
  TestHttpServer server([](const TestRequest &, Responder &res) {
    res.send(404, "text/plain", "no such thing");
  });

  HttpClient client;
  std::string streamed;
  auto response = client.stream(server.url("/missing"), HttpOptions{}, [&](const HttpResponse &, std::string_view data) {
    streamed.append(data);
    return true;
  });

  // 非 2xx 响应不会交给流处理器
  EXPECT_EQ(response.status_code, 404);
  EXPECT_EQ(response.body, "no such thing");
  EXPECT_TRUE(streamed.empty());
}

TEST(HttpClientTest, StreamDeliversEventStream) {
  TestHttpServer server([](const TestRequest &, Responder &res) {
    res.begin_stream("text/event-stream");
    res.write_raw("event: endpoint\ndata: /messages\n\n");
    res.write_raw("data: {\"id\":1}\n\n");
  });

  HttpClient client;
  std::vector<SseEvent> events;
  SseParser parser([&](const SseEvent &event) {
    events.push_back(event);
    return true;
  });

  auto response = client.stream(server.url("/sse"), HttpOptions{}, [&](const HttpResponse &head, std::string_view data) {
    EXPECT_EQ(head.header("content-type"), "text/event-stream");
    return parser.feed(data);
  });

  EXPECT_TRUE(response.error.empty()) << response.error;
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].event, "endpoint");
  EXPECT_EQ(events[1].data, "{\"id\":1}");
}

TEST(HttpClientTest, ConnectionRefusedReportsError) {
  // 先占用端口再关闭，得到一个无人监听的端口
  std::string url;
  {
    TestHttpServer server([](const TestRequest &, Responder &res) {
      res.send(200, "text/plain", "");
    });
    url = server.url("/");
    server.stop();
  }

  HttpClient client;
  HttpOptions options;
  options.connect_timeout = std::chrono::milliseconds(2000);
  auto response = client.request(url, options);

  EXPECT_EQ(response.status_code, 0);
  EXPECT_FALSE(response.error.empty());
}

TEST(HttpClientTest, InvalidUrl) {
  HttpClient client;
  auto response = client.request("ftp://example.com/", HttpOptions{});

  EXPECT_EQ(response.status_code, 0);
  EXPECT_NE(response.error.find("Invalid URL"), std::string::npos);
}

TEST(HttpClientTest, CancelWhileWaitingForResponse) {
  SilentHttpServer server;

  HttpClient client;
  HttpOptions options;
  options.timeout = std::chrono::milliseconds(30000);
  auto pending = std::async(std::launch::async, [&]() {
    return client.request(server.url("/slow"), options);
  });

  // 请求已到达服务器后再取消
  for (int i = 0; i < 200 && server.request_count() == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ASSERT_EQ(server.request_count(), 1);

  auto start = std::chrono::steady_clock::now();
  client.cancel();
  ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

  auto response = pending.get();
  EXPECT_EQ(response.status_code, 0);
  EXPECT_EQ(response.error, "Request cancelled");
}

TEST(HttpClientTest, CancelledClientRefusesRequests) {
  HttpClient client;
  client.cancel();
  EXPECT_TRUE(client.is_cancelled());

  auto response = client.request("http://127.0.0.1:1/", HttpOptions{});
  EXPECT_EQ(response.error, "Request cancelled");
}
