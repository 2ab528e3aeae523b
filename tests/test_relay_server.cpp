//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_relay_server.cpp
// Purpose: End-to-end relay tests: newline-delimited JSON in, responses out, fake upstream behind
//==========================================================================================================

#include <gtest/gtest.h>
#include <unistd.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "pmtrelay/RelayServer.h"
#include "pmtrelay/StdioTransport.hpp"
#include "pmtrelay/errors/Errors.h"

using namespace pmtrelay;

namespace {

class CatalogApiClient : public IApiClient {
public:
    std::vector<std::string> purchasedIds;
    bool sawStop{false};

    std::vector<ToolDescriptor> FetchTools(std::stop_token) override {
        return {ToolDescriptor{"prod-math", "Smart Math \xE2\x80\x94 does math", JSONValue()}};
    }
    ExecutionResult Purchase(const ExecutionRequest& request, std::stop_token stop) override {
        if (stop.stop_requested()) {
            sawStop = true;
            throw errors::ApiError("purchase", "POST /products/purchase", "cancelled", std::nullopt, true);
        }
        purchasedIds.push_back(request.productId);
        ExecutionResult r;
        r.success = true;
        r.output = "4";
        return r;
    }
    void StreamPurchase(const ExecutionRequest&, IChunkSink& sink, std::stop_token) override {
        sink.OnChunk("A");
        sink.OnChunk("B");
    }
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

TEST(RelayServer, HandleLineSkipsUndecodableInput) {
    auto api = std::make_shared<CatalogApiClient>();
    RelayServer server(api, Implementation("pmtrelay", "9.9.9"));
    EXPECT_FALSE(server.HandleLine("{bad json").has_value());
    EXPECT_FALSE(server.HandleLine("[]").has_value());
    EXPECT_FALSE(server.HandleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());

    auto reply = server.HandleLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_NE(reply->find("\"version\":\"9.9.9\""), std::string::npos);
    EXPECT_EQ(reply->rfind("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":", 0), 0u) << *reply;
}

TEST(RelayServer, ServesSessionOverPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const std::string input =
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "{bad json\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\",\"params\":{\"name\":\"Smart-Math\",\"arguments\":{\"x\":2}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"tools/call\",\"params\":{\"name\":\"Smart-Math\",\"arguments\":{\"stream\":true}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"foo/bar\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":\"tools/call\",\"params\":{}}";
    ASSERT_EQ(::write(fds[1], input.data(), input.size()), static_cast<ssize_t>(input.size()));
    ::close(fds[1]);

    auto api = std::make_shared<CatalogApiClient>();
    RelayServer server(api, Implementation("pmtrelay", "1.0.0"));
    std::ostringstream out;
    StdioTransport::Options opts;
    opts.inputFd = fds[0];
    StdioTransport transport(opts, out);
    server.Run(transport);
    ::close(fds[0]);

    auto lines = splitLines(out.str());
    ASSERT_EQ(lines.size(), 6u) << out.str();
    EXPECT_NE(lines[0].find("\"protocolVersion\":\"2025-03-26\""), std::string::npos);
    EXPECT_NE(lines[1].find("\"name\":\"Smart-Math\""), std::string::npos);
    EXPECT_EQ(lines[2], R"({"jsonrpc":"2.0","id":3,"result":{"content":[{"text":"4","type":"text"}],"isError":false}})");
    EXPECT_EQ(lines[3], R"({"jsonrpc":"2.0","id":4,"result":{"content":[{"text":"AB","type":"text"}],"isError":false}})");
    EXPECT_NE(lines[4].find("-32601"), std::string::npos);
    EXPECT_NE(lines[4].find("foo/bar"), std::string::npos);
    EXPECT_NE(lines[5].find("-32602"), std::string::npos);
    EXPECT_EQ(api->purchasedIds, (std::vector<std::string>{"prod-math"}));
    EXPECT_EQ(server.GetNameMapper().Resolve("Smart-Math"), std::optional<std::string>("prod-math"));
}

TEST(RelayServer, ExtraHandlersCanBeRegistered) {
    auto api = std::make_shared<CatalogApiClient>();
    RelayServer server(api);
    server.GetDispatcher().Register("ping", [](const JSONRPCRequest& req, std::stop_token) {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = req.id;
        resp->result = JSONValue(JSONValue::Object{});
        return resp;
    });
    auto reply = server.HandleLine(R"({"jsonrpc":"2.0","id":"p1","method":"ping"})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, R"({"jsonrpc":"2.0","id":"p1","result":{}})");
}

TEST(RelayServer, RequestStopCancelsLaterCalls) {
    auto api = std::make_shared<CatalogApiClient>();
    RelayServer server(api);
    EXPECT_FALSE(server.StopRequested());
    server.RequestStop();
    EXPECT_TRUE(server.StopRequested());

    auto reply = server.HandleLine(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"x"}})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_NE(reply->find("\"isError\":true"), std::string::npos);
    EXPECT_NE(reply->find("Error: cancelled"), std::string::npos);
    EXPECT_TRUE(api->sawStop);
}
