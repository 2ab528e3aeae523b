//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/pmtrelay/HTTPApiClient.cpp
// Purpose: HTTP/HTTPS client for the upstream tool API using Boost.Beast coroutines
//==========================================================================================================

//==========================================================================================================
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <future>
#include <string_view>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "pmtrelay/HTTPApiClient.hpp"
#include "pmtrelay/JSONRPCTypes.h"
#include "pmtrelay/SseParser.h"
#include "pmtrelay/errors/Errors.h"

namespace pmtrelay {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kFetchEndpoint = "/products/fetch";
constexpr const char* kPurchaseEndpoint = "/products/purchase";

constexpr const char* kOpFetch = "fetch tools";
constexpr const char* kOpPurchase = "purchase";
constexpr const char* kOpStream = "stream purchase";

// ------------------------------------------------------------------------------------------------------
// URL parsing (adequate for http[s]://host[:port][/prefix])
// ------------------------------------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string prefix;      // path prefix without trailing '/'
    std::string hostHeader;  // host[:port] with the port omitted when it is the scheme default
};

UrlParts parseBaseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::ConfigError("API URL must start with http:// or https://: " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    for (auto& c : parts.scheme) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw errors::ConfigError("unsupported API URL scheme: " + parts.scheme);
    }
    if (url.find_first_of("?#", schemeEnd) != std::string::npos) {
        throw errors::ConfigError("API URL must not contain a query or fragment: " + url);
    }

    std::size_t pos = schemeEnd + 3;
    std::size_t slash = url.find('/', pos);
    std::string hostPort = (slash == std::string::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
    parts.prefix = (slash == std::string::npos) ? std::string() : url.substr(slash);
    while (!parts.prefix.empty() && parts.prefix.back() == '/') parts.prefix.pop_back();

    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw errors::ConfigError("malformed IPv6 host in API URL: " + url);
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':') throw errors::ConfigError("malformed API URL: " + url);
            colon = close + 1;
        }
    } else {
        colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
    }
    const std::string defaultPort = parts.scheme == "https" ? "443" : "80";
    parts.port = (colon == std::string::npos) ? defaultPort : hostPort.substr(colon + 1);

    if (parts.host.empty()) {
        throw errors::ConfigError("API URL has no host: " + url);
    }
    if (parts.port.empty() || parts.port.find_first_not_of("0123456789") != std::string::npos) {
        throw errors::ConfigError("API URL has an invalid port: " + url);
    }

    const std::string hostForHeader = hostPort.front() == '[' ? "[" + parts.host + "]" : parts.host;
    parts.hostHeader = parts.port == defaultPort ? hostForHeader : hostForHeader + ":" + parts.port;
    return parts;
}

// Media type of a Content-Type value: lower-cased, parameters and surrounding blanks removed.
std::string mediaType(std::string_view contentType) {
    auto semi = contentType.find(';');
    std::string_view mt = contentType.substr(0, semi);
    while (!mt.empty() && (mt.front() == ' ' || mt.front() == '\t')) mt.remove_prefix(1);
    while (!mt.empty() && (mt.back() == ' ' || mt.back() == '\t')) mt.remove_suffix(1);
    std::string out(mt);
    for (auto& c : out) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool isIpLiteral(const std::string& host) {
    boost::system::error_code ec;
    (void)net::ip::make_address(host, ec);
    return !ec;
}

// ------------------------------------------------------------------------------------------------------
// Per-call plumbing
// ------------------------------------------------------------------------------------------------------
struct Exchange {
    http::verb method{http::verb::get};
    std::string target;
    std::string body;
    bool acceptEventStream{false};
};

struct Reply {
    unsigned int status{0};
    std::string contentType;
    bool eventStream{false};
    std::string body;  // empty when the body was consumed as an event stream
};

// Returns false to stop reading the event stream.
using EventHandler = std::function<bool(const SseEvent&)>;

// Shared between the calling thread's stop_callback and the coroutine; only touched on the io thread.
struct CallState {
    std::atomic<bool> cancelled{false};
    std::function<void()> cancelHook;
};

class HookGuard {
public:
    HookGuard(CallState& st, std::function<void()> fn) : state(st) { state.cancelHook = std::move(fn); }
    ~HookGuard() { state.cancelHook = nullptr; }
    HookGuard(const HookGuard&) = delete;
    HookGuard& operator=(const HookGuard&) = delete;

private:
    CallState& state;
};

void throwIfCancelled(const CallState& st) {
    if (st.cancelled.load()) {
        throw boost::system::system_error(net::error::operation_aborted);
    }
}

std::string purchaseBody(const ExecutionRequest& request) {
    JSONValue::Object obj;
    obj["product_id"] = std::make_shared<JSONValue>(request.productId);
    obj["parameters"] = std::make_shared<JSONValue>(request.parameters);
    return SerializeJSON(JSONValue(std::move(obj)));
}
} // namespace

class HTTPApiClient::Impl {
public:
    HTTPApiClient::Options opts;
    UrlParts base;

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https

    explicit Impl(const HTTPApiClient::Options& o) : opts(o), base(parseBaseUrl(o.baseUrl)) {
        if (base.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            if (userProvidedCA) {
                try {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } catch (const boost::system::system_error& e) {
                    throw errors::ConfigError(std::string("failed to load CA file/path: ") + e.what());
                }
            } else {
                boost::system::error_code ec;
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_WARN("HTTPS: set_default_verify_paths failed: {}", ec.message());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPApiClient: io loop terminated: {}", e.what());
            }
        });
        LOG_DEBUG("HTTPApiClient: upstream {}://{}:{}{}", base.scheme, base.host, base.port, base.prefix);
    }

    ~Impl() {
        if (workGuard) {
            workGuard->reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    http::request<http::string_body> buildRequest(const Exchange& ex) const {
        http::request<http::string_body> req{ex.method, ex.target, 11};
        req.set(http::field::host, base.hostHeader);
        req.set(http::field::user_agent, opts.userAgent);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, ex.acceptEventStream ? "text/event-stream" : "application/json");
        req.set("X-API-Key", opts.apiKey);
        req.set("X-Budget-Key", opts.budgetKey);
        req.set(http::field::connection, "close");
        req.body() = ex.body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: write the request, read the headers, then either buffer the body or feed it to onEvent.
    template <class Stream>
    net::awaitable<Reply> coTalk(Stream& stream, http::request<http::string_body>& req, CallState& st,
                                 const EventHandler& onEvent) {
        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(std::chrono::milliseconds(opts.requestTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        throwIfCancelled(st);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        // Beast 1.74 rejects every sized body under body_limit(boost::none); buffered bodies are bounded
        // by maxBodyBytes below instead.
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        throwIfCancelled(st);

        Reply reply;
        reply.status = parser.get().result_int();
        reply.contentType = std::string(parser.get()[http::field::content_type]);
        reply.eventStream = onEvent && reply.status / 100 == 2 && mediaType(reply.contentType) == "text/event-stream";
        LOG_DEBUG("HTTP {} {} -> {} ({})", std::string(http::to_string(req.method())), std::string(req.target()),
                  reply.status, reply.contentType);
        if (!reply.eventStream) {
            if (auto announced = parser.content_length(); announced && *announced > opts.maxBodyBytes) {
                throw std::runtime_error(fmt::format("response body exceeds {} bytes", opts.maxBodyBytes));
            }
        }

        SseParser sse;
        bool stopped = false;
        std::array<char, 8192> chunk{};
        while (!parser.is_done() && !stopped) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            if (reply.eventStream) {
                lowest.expires_after(std::chrono::milliseconds(opts.streamIdleTimeoutMs));
            }
            boost::system::error_code ec;
            co_await http::async_read_some(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            throwIfCancelled(st);
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            // Peers that close TLS without close_notify end an EOF-delimited body this way.
            const bool truncated = (ec == ssl::error::stream_truncated);
            if (ec && !truncated) {
                throw boost::system::system_error(ec);
            }
            const std::size_t n = chunk.size() - parser.get().body().size;
            if (n > 0) {
                if (reply.eventStream) {
                    for (const auto& ev : sse.Feed(std::string_view(chunk.data(), n))) {
                        if (!onEvent(ev)) {
                            stopped = true;
                            break;
                        }
                    }
                } else {
                    if (reply.body.size() + n > opts.maxBodyBytes) {
                        throw std::runtime_error(fmt::format("response body exceeds {} bytes", opts.maxBodyBytes));
                    }
                    reply.body.append(chunk.data(), n);
                }
            }
            if (truncated) {
                break;
            }
        }
        if (reply.eventStream && !stopped) {
            if (auto ev = sse.Finish()) {
                onEvent(*ev);
            }
        }
        co_return reply;
    }

    // Coroutine: resolve, connect (and handshake), then exchange one request/response.
    net::awaitable<Reply> coExchange(Exchange ex, std::shared_ptr<CallState> st, EventHandler onEvent) {
        auto executor = co_await net::this_coro::executor;
        throwIfCancelled(*st);

        tcp::resolver resolver(executor);
        tcp::resolver::results_type endpoints;
        {
            HookGuard hook(*st, [&resolver]() { resolver.cancel(); });
            endpoints = co_await resolver.async_resolve(base.host, base.port, net::use_awaitable);
        }
        throwIfCancelled(*st);

        auto req = buildRequest(ex);
        if (sslCtx) {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            if (!isIpLiteral(base.host)) {
                if (!::SSL_set_tlsext_host_name(stream.native_handle(), base.host.c_str())) {
                    throw std::runtime_error("HTTPS: failed to set SNI hostname");
                }
            }
            if (::SSL_set1_host(stream.native_handle(), base.host.c_str()) != 1) {
                throw std::runtime_error("HTTPS: failed to set verification hostname");
            }
            HookGuard hook(*st, [&stream]() { beast::get_lowest_layer(stream).cancel(); });
            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
            throwIfCancelled(*st);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            throwIfCancelled(*st);

            Reply reply = co_await coTalk(stream, req, *st, onEvent);
            boost::system::error_code ec;
            beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return reply;
        } else {
            beast::tcp_stream stream(executor);
            HookGuard hook(*st, [&stream]() { stream.cancel(); });
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(endpoints, net::use_awaitable);
            throwIfCancelled(*st);

            Reply reply = co_await coTalk(stream, req, *st, onEvent);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return reply;
        }
    }

    //==========================================================================================================
    // perform
    // Purpose: Runs one exchange on the io thread and blocks until it completes. A stop request posts a
    //          cancellation to the io thread, which aborts whichever socket operation is in flight.
    // Throws:
    //   errors::ApiError for every failure, with cancelled() set when the stop token fired.
    //==========================================================================================================
    Reply perform(const char* op, const std::string& endpoint, Exchange ex, std::stop_token stop,
                  EventHandler onEvent = nullptr) {
        if (stop.stop_requested()) {
            throw errors::ApiError(op, endpoint, "cancelled", std::nullopt, true);
        }
        auto st = std::make_shared<CallState>();
        auto done = std::make_shared<std::promise<Reply>>();
        auto fut = done->get_future();

        net::co_spawn(ioc, coExchange(std::move(ex), st, std::move(onEvent)),
            [done](std::exception_ptr eptr, Reply reply) {
                if (eptr) {
                    done->set_exception(eptr);
                } else {
                    done->set_value(std::move(reply));
                }
            });

        std::stop_callback onStop(stop, [this, st]() {
            net::post(ioc, [st]() {
                st->cancelled.store(true);
                if (st->cancelHook) {
                    st->cancelHook();
                }
            });
        });

        try {
            return fut.get();
        } catch (const errors::ApiError&) {
            throw;
        } catch (const boost::system::system_error& e) {
            if (st->cancelled.load()) {
                throw errors::ApiError(op, endpoint, "cancelled", std::nullopt, true);
            }
            if (e.code() == beast::error::timeout) {
                throw errors::ApiError(op, endpoint, "request timed out");
            }
            throw errors::ApiError(op, endpoint, "request failed: " + e.code().message());
        } catch (const std::future_error& e) {
            throw errors::ApiError(op, endpoint, std::string("request abandoned: ") + e.what());
        } catch (const std::exception& e) {
            if (st->cancelled.load()) {
                throw errors::ApiError(op, endpoint, "cancelled", std::nullopt, true);
            }
            throw errors::ApiError(op, endpoint, e.what());
        }
    }

    static void checkStatus(const char* op, const std::string& endpoint, const Reply& reply) {
        if (reply.status / 100 != 2) {
            throw errors::ApiError(op, endpoint,
                                   fmt::format("API returned status {}: {}", reply.status, reply.body),
                                   static_cast<int>(reply.status));
        }
    }

    static JSONValue parseBody(const char* op, const std::string& endpoint, const Reply& reply) {
        JSONValue doc;
        try {
            doc = ParseJSON(reply.body);
        } catch (const JSONParseError& e) {
            throw errors::ApiError(op, endpoint, std::string("failed to parse response: ") + e.what(),
                                   static_cast<int>(reply.status));
        }
        if (!doc.IsObject()) {
            throw errors::ApiError(op, endpoint, "failed to parse response: not a JSON object",
                                   static_cast<int>(reply.status));
        }
        return doc;
    }

    static std::string errorText(const JSONValue& doc) {
        const std::string* e = FindString(doc, "error");
        return e ? *e : std::string();
    }

    static ExecutionResult purchaseResult(const char* op, const std::string& endpoint, const Reply& reply) {
        JSONValue doc = parseBody(op, endpoint, reply);
        ExecutionResult result;
        result.success = FindBool(doc, "success").value_or(false);
        if (const std::string* out = FindString(doc, "output")) result.output = *out;
        result.error = errorText(doc);
        if (!result.success) {
            throw errors::ApiError(op, endpoint, "purchase failed: " + result.error,
                                   static_cast<int>(reply.status));
        }
        return result;
    }

    // Unwraps tools[].function.{name, description, parameters} into out.
    static void appendTools(const JSONValue& doc, const std::string& endpoint, std::vector<ToolDescriptor>& out) {
        const JSONValue* tools = FindMember(doc, "tools");
        if (!tools || tools->IsNull()) {
            return;
        }
        const auto* arr = std::get_if<JSONValue::Array>(&tools->value);
        if (!arr) {
            throw errors::ApiError(kOpFetch, endpoint, "failed to parse response: tools is not an array");
        }
        for (const auto& entry : *arr) {
            const JSONValue* fn = entry ? FindMember(*entry, "function") : nullptr;
            const std::string* name = fn ? FindString(*fn, "name") : nullptr;
            if (!name) {
                throw errors::ApiError(kOpFetch, endpoint, "failed to parse response: tool entry without function.name");
            }
            ToolDescriptor td;
            td.id = *name;
            if (const std::string* d = FindString(*fn, "description")) td.description = *d;
            if (const JSONValue* p = FindMember(*fn, "parameters")) td.parameters = *p;
            out.push_back(std::move(td));
        }
    }
};

HTTPApiClient::HTTPApiClient(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPApiClient::~HTTPApiClient() = default;

std::vector<ToolDescriptor> HTTPApiClient::FetchTools(std::stop_token stop) {
    FUNC_SCOPE();
    const std::string endpoint = std::string("GET ") + kFetchEndpoint;
    std::vector<ToolDescriptor> all;
    for (unsigned int page = 1;; ++page) {
        if (page > pImpl->opts.maxPages) {
            throw errors::ApiError(kOpFetch, endpoint, fmt::format("catalog exceeds {} pages", pImpl->opts.maxPages));
        }
        Exchange ex;
        ex.method = http::verb::get;
        ex.target = pImpl->base.prefix + kFetchEndpoint +
                    fmt::format("?page={}&page_size={}", page, pImpl->opts.pageSize);
        Reply reply = pImpl->perform(kOpFetch, endpoint, std::move(ex), stop);
        Impl::checkStatus(kOpFetch, endpoint, reply);

        JSONValue doc = Impl::parseBody(kOpFetch, endpoint, reply);
        if (!FindBool(doc, "success").value_or(false)) {
            throw errors::ApiError(kOpFetch, endpoint, "API error: " + Impl::errorText(doc),
                                   static_cast<int>(reply.status));
        }
        Impl::appendTools(doc, endpoint, all);

        const JSONValue* details = FindMember(doc, "details");
        const bool hasNext = details && FindBool(*details, "has_next_page").value_or(false);
        LOG_DEBUG("Catalog page {} fetched; {} tools so far; has_next_page={}", page, all.size(), hasNext);
        if (!hasNext) {
            break;
        }
    }
    return all;
}

ExecutionResult HTTPApiClient::Purchase(const ExecutionRequest& request, std::stop_token stop) {
    FUNC_SCOPE();
    const std::string endpoint = std::string("POST ") + kPurchaseEndpoint;
    Exchange ex;
    ex.method = http::verb::post;
    ex.target = pImpl->base.prefix + kPurchaseEndpoint;
    ex.body = purchaseBody(request);
    Reply reply = pImpl->perform(kOpPurchase, endpoint, std::move(ex), stop);
    Impl::checkStatus(kOpPurchase, endpoint, reply);
    return Impl::purchaseResult(kOpPurchase, endpoint, reply);
}

void HTTPApiClient::StreamPurchase(const ExecutionRequest& request, IChunkSink& sink, std::stop_token stop) {
    FUNC_SCOPE();
    const std::string endpoint = std::string("POST ") + kPurchaseEndpoint + "?stream=true";
    Exchange ex;
    ex.method = http::verb::post;
    ex.target = pImpl->base.prefix + kPurchaseEndpoint + "?stream=true";
    ex.body = purchaseBody(request);
    ex.acceptEventStream = true;

    std::size_t delivered = 0;
    EventHandler onEvent = [&sink, &delivered, &endpoint](const SseEvent& ev) -> bool {
        if (ev.type.empty() || ev.type == "data") {
            if (!ev.data.empty()) {
                sink.OnChunk(ev.data);
                ++delivered;
            }
            return true;
        }
        if (ev.type == "error") {
            throw errors::ApiError(kOpStream, endpoint, "stream error: " + ev.data);
        }
        if (ev.type == "done") {
            return false;
        }
        LOG_DEBUG("Ignoring event stream event of type '{}'", ev.type);
        return true;
    };

    Reply reply = pImpl->perform(kOpStream, endpoint, std::move(ex), stop, std::move(onEvent));
    if (reply.eventStream) {
        LOG_DEBUG("Event stream finished after {} chunks", delivered);
        return;
    }

    // Upstream answered without an event stream: treat the body as a synchronous purchase reply.
    Impl::checkStatus(kOpStream, endpoint, reply);
    ExecutionResult result = Impl::purchaseResult(kOpStream, endpoint, reply);
    sink.OnChunk(result.output);
}

} // namespace pmtrelay
