//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_api_client.cpp
// Purpose: HTTPApiClient tests against an in-process Boost.Beast fake upstream
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "pmtrelay/ChunkSink.h"
#include "pmtrelay/HTTPApiClient.hpp"
#include "pmtrelay/JSONRPCTypes.h"
#include "pmtrelay/errors/Errors.h"

using namespace pmtrelay;
using namespace std::chrono_literals;

namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using Request = http::request<http::string_body>;

//==========================================================================================================
// FakeUpstream
// Purpose: Accepts connections on 127.0.0.1:<ephemeral>, records each request, and lets the test script
//          the reply through a handler.
//==========================================================================================================
class FakeUpstream {
public:
    using Handler = std::function<void(boost::beast::tcp_stream&, const Request&)>;

    explicit FakeUpstream(Handler h) : handler(std::move(h)) {
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    ~FakeUpstream() { stop(); }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port); }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lk(mutex);
        return seen;
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        boost::system::error_code ec;
        // Poke acceptor
        tcp::socket poke{io};
        poke.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    unsigned short port{0};

private:
    void runOnce() {
        boost::system::error_code ec;
        tcp::socket socket{io};
        acceptor.accept(socket, ec);
        if (ec || !running.load()) {
            return;
        }
        boost::beast::tcp_stream stream{std::move(socket)};
        boost::beast::flat_buffer buffer;
        Request req;
        http::read(stream, buffer, req, ec);
        if (ec) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            seen.push_back(req);
        }
        try {
            handler(stream, req);
        } catch (const boost::system::system_error& e) {
            // Client went away mid-reply; expected in cancellation tests.
            (void)e;
        }
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    boost::asio::io_context io;
    tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    Handler handler;
    mutable std::mutex mutex;
    std::vector<Request> seen;
};

void writeJson(boost::beast::tcp_stream& stream, const Request& req, http::status status, const std::string& body,
               const std::string& contentType = "application/json") {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "fake-upstream");
    res.set(http::field::content_type, contentType);
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();
    http::write(stream, res);
}

// Writes raw bytes; used for EOF-delimited event streams.
void writeRaw(boost::beast::tcp_stream& stream, const std::string& bytes) {
    boost::asio::write(stream.socket(), boost::asio::buffer(bytes));
}

const std::string kSseHeader =
    "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream; charset=utf-8\r\nCache-Control: no-cache\r\n"
    "Connection: close\r\n\r\n";

// Blocks until the client closes its end.
void waitForClientClose(boost::beast::tcp_stream& stream) {
    char b[64];
    boost::system::error_code ec;
    while (!ec) {
        stream.socket().read_some(boost::asio::buffer(b), ec);
    }
}

HTTPApiClient::Options optionsFor(const FakeUpstream& srv) {
    HTTPApiClient::Options o;
    o.baseUrl = srv.baseUrl();
    o.apiKey = "api-key-1234567";
    o.budgetKey = "budget-key-7654321";
    o.connectTimeoutMs = 2000;
    o.requestTimeoutMs = 5000;
    o.streamIdleTimeoutMs = 5000;
    return o;
}

ExecutionRequest execRequest(const std::string& id) {
    ExecutionRequest r;
    r.productId = id;
    r.parameters = ParseJSON(R"({"x":2,"stream":true})");
    return r;
}

std::string catalogPage(const std::string& toolsJson, bool hasNext) {
    return std::string(R"({"success":true,"tools":)") + toolsJson + R"(,"details":{"has_next_page":)" +
           (hasNext ? "true" : "false") + "}}";
}

} // namespace

TEST(HTTPApiClient, FetchToolsFollowsPagination) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        const std::string target(req.target());
        if (target.find("page=1&") != std::string::npos) {
            writeJson(s, req, http::status::ok, catalogPage(
                R"([{"type":"function","function":{"name":"prod-a","description":"Alpha - first","parameters":{"type":"object"}}},)"
                R"({"type":"function","function":{"name":"prod-b","description":"Beta - second"}}])", true));
        } else {
            writeJson(s, req, http::status::ok, catalogPage(
                R"([{"type":"function","function":{"name":"prod-c","description":"Gamma - third"}}])", false));
        }
    });
    HTTPApiClient client(optionsFor(srv));

    auto tools = client.FetchTools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].id, "prod-a");
    EXPECT_EQ(tools[0].description, "Alpha - first");
    EXPECT_EQ(SerializeJSON(tools[0].parameters), R"({"type":"object"})");
    EXPECT_TRUE(tools[1].parameters.IsNull());
    EXPECT_EQ(tools[2].id, "prod-c");

    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(std::string(reqs[0].target()), "/products/fetch?page=1&page_size=50");
    EXPECT_EQ(std::string(reqs[1].target()), "/products/fetch?page=2&page_size=50");
    EXPECT_EQ(reqs[0].method(), http::verb::get);
    EXPECT_EQ(std::string(reqs[0]["X-API-Key"]), "api-key-1234567");
    EXPECT_EQ(std::string(reqs[0]["X-Budget-Key"]), "budget-key-7654321");
    EXPECT_EQ(std::string(reqs[0][http::field::user_agent]), "AgentPMT-MCP/1.0");
    EXPECT_EQ(std::string(reqs[0][http::field::content_type]), "application/json");
    EXPECT_EQ(std::string(reqs[0][http::field::host]), "127.0.0.1:" + std::to_string(srv.port));
}

TEST(HTTPApiClient, BaseUrlPathPrefixIsKept) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, catalogPage("[]", false));
    });
    auto opts = optionsFor(srv);
    opts.baseUrl = srv.baseUrl() + "/api/v1/";
    opts.pageSize = 10;
    HTTPApiClient client(opts);
    EXPECT_TRUE(client.FetchTools().empty());
    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(std::string(reqs[0].target()), "/api/v1/products/fetch?page=1&page_size=10");
}

TEST(HTTPApiClient, FetchToolsNonSuccessStatusFails) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::internal_server_error, "down", "text/plain");
    });
    HTTPApiClient client(optionsFor(srv));
    try {
        client.FetchTools();
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail(), "API returned status 500: down");
        EXPECT_EQ(e.status(), std::optional<int>(500));
        EXPECT_EQ(std::string(e.what()), "fetch tools GET /products/fetch: API returned status 500: down");
    }
}

TEST(HTTPApiClient, FetchToolsApiErrorAndBadBodyFail) {
    std::atomic<int> call{0};
    FakeUpstream srv([&call](boost::beast::tcp_stream& s, const Request& req) {
        if (call.fetch_add(1) == 0) {
            writeJson(s, req, http::status::ok, R"({"success":false,"error":"bad key"})");
        } else {
            writeJson(s, req, http::status::ok, "not json");
        }
    });
    HTTPApiClient client(optionsFor(srv));
    try {
        client.FetchTools();
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail(), "API error: bad key");
    }
    try {
        client.FetchTools();
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail().rfind("failed to parse response", 0), 0u) << e.detail();
    }
}

TEST(HTTPApiClient, FetchToolsFailsOnLaterPageWithoutPartialCatalog) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        const std::string target(req.target());
        if (target.find("page=1&") != std::string::npos) {
            writeJson(s, req, http::status::ok,
                      catalogPage(R"([{"function":{"name":"prod-a","description":"A"}}])", true));
        } else {
            writeJson(s, req, http::status::bad_gateway, "gateway");
        }
    });
    HTTPApiClient client(optionsFor(srv));
    EXPECT_THROW(client.FetchTools(), errors::ApiError);
}

TEST(HTTPApiClient, FetchToolsStopsAtPageLimit) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, catalogPage("[]", true));
    });
    auto opts = optionsFor(srv);
    opts.maxPages = 2;
    HTTPApiClient client(opts);
    try {
        client.FetchTools();
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail(), "catalog exceeds 2 pages");
    }
    EXPECT_EQ(srv.requests().size(), 2u);
}

TEST(HTTPApiClient, PurchaseSendsProductAndParameters) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, R"({"success":true,"output":"42"})");
    });
    HTTPApiClient client(optionsFor(srv));
    ExecutionResult r = client.Purchase(execRequest("prod-math"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "42");

    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method(), http::verb::post);
    EXPECT_EQ(std::string(reqs[0].target()), "/products/purchase");
    JSONValue body = ParseJSON(reqs[0].body());
    EXPECT_EQ(*FindString(body, "product_id"), "prod-math");
    EXPECT_EQ(SerializeJSON(*FindMember(body, "parameters")), R"({"stream":true,"x":2})");
}

TEST(HTTPApiClient, PurchaseFailureCarriesUpstreamError) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, R"({"success":false,"error":"boom"})");
    });
    HTTPApiClient client(optionsFor(srv));
    try {
        client.Purchase(execRequest("p"));
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(std::string(e.what()), "purchase POST /products/purchase: purchase failed: boom");
        EXPECT_EQ(e.detail(), "purchase failed: boom");
    }
}

TEST(HTTPApiClient, StreamDeliversDataEventsUntilDone) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        writeRaw(s, kSseHeader);
        writeRaw(s, "data: A\n\n: comment\n\n");
        writeRaw(s, "event: data\ndata: B\n\n");
        writeRaw(s, "event: done\ndata: \n\n");
        writeRaw(s, "data: after-done\n\n");
    });
    HTTPApiClient client(optionsFor(srv));
    StringChunkSink sink;
    client.StreamPurchase(execRequest("p"), sink);
    EXPECT_EQ(sink.Chunks(), (std::vector<std::string>{"A", "B"}));

    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(std::string(reqs[0].target()), "/products/purchase?stream=true");
    EXPECT_EQ(std::string(reqs[0][http::field::accept]), "text/event-stream");
}

TEST(HTTPApiClient, StreamEndsSuccessfullyAtEofWithoutDone) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        writeRaw(s, kSseHeader);
        writeRaw(s, "data: one\n\nevent: progress\ndata: 50%\n\ndata: two");
    });
    HTTPApiClient client(optionsFor(srv));
    StringChunkSink sink;
    client.StreamPurchase(execRequest("p"), sink);
    EXPECT_EQ(sink.Chunks(), (std::vector<std::string>{"one", "two"}));
}

TEST(HTTPApiClient, StreamErrorEventFails) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        writeRaw(s, kSseHeader);
        writeRaw(s, "event: error\ndata: boom\n\n");
    });
    HTTPApiClient client(optionsFor(srv));
    StringChunkSink sink;
    try {
        client.StreamPurchase(execRequest("p"), sink);
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
        EXPECT_EQ(e.detail(), "stream error: boom");
    }
    EXPECT_TRUE(sink.Chunks().empty());
}

TEST(HTTPApiClient, NonEventStreamReplyIsOneChunk) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, R"({"success":true,"output":"whole result"})");
    });
    HTTPApiClient client(optionsFor(srv));
    StringChunkSink sink;
    client.StreamPurchase(execRequest("p"), sink);
    EXPECT_EQ(sink.Chunks(), (std::vector<std::string>{"whole result"}));
}

TEST(HTTPApiClient, StreamNonSuccessStatusFailsBeforeAnyChunk) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::unauthorized, "data: A\n\n", "text/event-stream");
    });
    HTTPApiClient client(optionsFor(srv));
    StringChunkSink sink;
    try {
        client.StreamPurchase(execRequest("p"), sink);
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.status(), std::optional<int>(401));
    }
    EXPECT_TRUE(sink.Chunks().empty());
}

TEST(HTTPApiClient, CancellationMidStreamKeepsDeliveredChunks) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        writeRaw(s, kSseHeader);
        writeRaw(s, "data: A\n\n");
        waitForClientClose(s);
    });
    HTTPApiClient client(optionsFor(srv));
    std::stop_source stopper;
    std::vector<std::string> chunks;
    FunctionChunkSink sink([&](const std::string& c) {
        chunks.push_back(c);
        stopper.request_stop();
    });
    try {
        client.StreamPurchase(execRequest("p"), sink, stopper.get_token());
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_TRUE(e.cancelled());
        EXPECT_EQ(e.detail(), "cancelled");
    }
    EXPECT_EQ(chunks, (std::vector<std::string>{"A"}));
}

TEST(HTTPApiClient, StopRequestedBeforeCallFailsWithoutRequest) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, R"({"success":true,"output":"x"})");
    });
    HTTPApiClient client(optionsFor(srv));
    std::stop_source stopper;
    stopper.request_stop();
    try {
        client.Purchase(execRequest("p"), stopper.get_token());
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_TRUE(e.cancelled());
    }
    EXPECT_TRUE(srv.requests().empty());
}

TEST(HTTPApiClient, StopWhileAwaitingHeadersCancelsPurchase) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        waitForClientClose(s);
    });
    HTTPApiClient client(optionsFor(srv));
    std::stop_source stopper;
    std::thread canceller([&stopper]() {
        std::this_thread::sleep_for(100ms);
        stopper.request_stop();
    });
    auto started = std::chrono::steady_clock::now();
    try {
        client.Purchase(execRequest("p"), stopper.get_token());
        ADD_FAILURE() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_TRUE(e.cancelled());
        EXPECT_EQ(e.detail(), "cancelled");
    }
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(srv.requests().size(), 1u);
}

TEST(HTTPApiClient, StopWhileAwaitingHeadersCancelsFetchTools) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        waitForClientClose(s);
    });
    HTTPApiClient client(optionsFor(srv));
    std::stop_source stopper;
    std::thread canceller([&stopper]() {
        std::this_thread::sleep_for(100ms);
        stopper.request_stop();
    });
    auto started = std::chrono::steady_clock::now();
    try {
        client.FetchTools(stopper.get_token());
        ADD_FAILURE() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_TRUE(e.cancelled());
        EXPECT_EQ(e.operation(), "fetch tools");
    }
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(HTTPApiClient, OversizedBufferedBodyFails) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request& req) {
        writeJson(s, req, http::status::ok, R"({"success":true,"output":")" + std::string(256, 'x') + "\"}");
    });
    auto opts = optionsFor(srv);
    opts.maxBodyBytes = 64;
    HTTPApiClient client(opts);
    try {
        client.Purchase(execRequest("p"));
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail(), "response body exceeds 64 bytes");
    }
}

TEST(HTTPApiClient, IdleStreamTimesOut) {
    FakeUpstream srv([](boost::beast::tcp_stream& s, const Request&) {
        writeRaw(s, kSseHeader);
        writeRaw(s, "data: A\n\n");
        waitForClientClose(s);
    });
    auto opts = optionsFor(srv);
    opts.streamIdleTimeoutMs = 200;
    HTTPApiClient client(opts);
    StringChunkSink sink;
    auto started = std::chrono::steady_clock::now();
    try {
        client.StreamPurchase(execRequest("p"), sink);
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail(), "request timed out");
        EXPECT_FALSE(e.cancelled());
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
    EXPECT_EQ(sink.Chunks(), (std::vector<std::string>{"A"}));
}

TEST(HTTPApiClient, ConnectionRefusedIsRequestFailure) {
    unsigned short closedPort = 0;
    {
        boost::asio::io_context io;
        tcp::acceptor a{io, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        closedPort = a.local_endpoint().port();
    }
    HTTPApiClient::Options opts;
    opts.baseUrl = "http://127.0.0.1:" + std::to_string(closedPort);
    opts.apiKey = "k";
    opts.budgetKey = "b";
    HTTPApiClient client(opts);
    try {
        client.FetchTools();
        FAIL() << "expected ApiError";
    } catch (const errors::ApiError& e) {
        EXPECT_EQ(e.detail().rfind("request failed: ", 0), 0u) << e.detail();
        EXPECT_EQ(e.operation(), "fetch tools");
    }
}

TEST(HTTPApiClient, RejectsUnusableBaseUrls) {
    for (const char* url : {"ftp://example.com", "example.com", "http://", "http://host:abc", "https://h/x?y=1"}) {
        HTTPApiClient::Options opts;
        opts.baseUrl = url;
        EXPECT_THROW(HTTPApiClient client(opts), errors::ConfigError) << url;
    }
}
