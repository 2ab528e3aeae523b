//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: JSON-RPC method table for the relay (initialize, tools, resources, notifications)
//==========================================================================================================

#include "logging/Logger.h"
#include "pmtrelay/ChunkSink.h"
#include "pmtrelay/Dispatcher.h"
#include "pmtrelay/errors/Errors.h"

namespace pmtrelay {

namespace {
// The request id is echoed as received; an absent id stays absent.
const std::optional<JSONRPCId>& responseId(const JSONRPCRequest& request) {
    return request.id;
}

std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCRequest& request, JSONValue result) {
    auto resp = std::make_unique<JSONRPCResponse>();
    resp->id = responseId(request);
    resp->result = std::move(result);
    return resp;
}

std::unique_ptr<JSONRPCResponse> makeError(const JSONRPCRequest& request, int code, const std::string& message,
                                           std::optional<JSONValue> data = std::nullopt) {
    return errors::makeErrorResponse(responseId(request), errors::makeRpcError(code, message, std::move(data)));
}

// Tool result shape: { content: [ { type: "text", text } ], isError }
JSONValue toolResult(const std::string& text, bool isError) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>("text");
    item["text"] = std::make_shared<JSONValue>(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(isError);
    return JSONValue(std::move(obj));
}

JSONValue defaultInputSchema() {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    return JSONValue(std::move(schema));
}
} // namespace

Dispatcher::Dispatcher(std::shared_ptr<IApiClient> apiClient, NameMapper& nameMapper, Implementation info)
    : api(std::move(apiClient)), names(nameMapper), serverInfo(std::move(info)) {
    Register(Methods::Initialize, [this](const JSONRPCRequest& req, std::stop_token) {
        return handleInitialize(req);
    });
    Register(Methods::ListTools, [this](const JSONRPCRequest& req, std::stop_token stop) {
        return handleToolsList(req, stop);
    });
    Register(Methods::CallTool, [this](const JSONRPCRequest& req, std::stop_token stop) {
        return handleToolsCall(req, stop);
    });
    Register(Methods::ListResources, [this](const JSONRPCRequest& req, std::stop_token) {
        return handleResourcesList(req);
    });
    Register(Methods::Initialized, [](const JSONRPCRequest&, std::stop_token) -> std::unique_ptr<JSONRPCResponse> {
        LOG_INFO("Client initialized");
        return nullptr;
    });
}

void Dispatcher::Register(const std::string& method, Handler handler) {
    handlers[method] = std::move(handler);
}

bool Dispatcher::HasMethod(const std::string& method) const {
    return handlers.find(method) != handlers.end();
}

std::unique_ptr<JSONRPCResponse> Dispatcher::Dispatch(const JSONRPCRequest& request, std::stop_token stop) {
    FUNC_SCOPE();
    if (!request.hasMethod) {
        LOG_WARN("Request without method (id {})",
                 request.id.has_value() ? JSONRPCIdToString(*request.id) : std::string("none"));
        return makeError(request, JSONRPCErrorCodes::InvalidRequest, "invalid request: missing method");
    }

    auto it = handlers.find(request.method);
    if (it == handlers.end()) {
        if (request.IsNotification() && request.method.rfind(Methods::NotificationPrefix, 0) == 0) {
            LOG_DEBUG("Ignoring notification {}", request.method);
            return nullptr;
        }
        LOG_WARN("Unknown method: {}", request.method);
        JSONValue::Object data;
        data["method"] = std::make_shared<JSONValue>(request.method);
        return makeError(request, JSONRPCErrorCodes::MethodNotFound, "method not found: " + request.method,
                         JSONValue(std::move(data)));
    }

    try {
        return it->second(request, stop);
    } catch (const std::exception& e) {
        LOG_ERROR("Handler for {} failed: {}", request.method, e.what());
        return makeError(request, JSONRPCErrorCodes::InternalError, e.what());
    }
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleInitialize(const JSONRPCRequest& request) {
    LOG_INFO("Initialize request from client");

    JSONValue::Object tools;
    tools["listChanged"] = std::make_shared<JSONValue>(true);
    JSONValue::Object capabilities;
    capabilities["tools"] = std::make_shared<JSONValue>(std::move(tools));

    JSONValue::Object serverInfoObj;
    serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo.name);
    serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo.version);

    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    resultObj["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));
    resultObj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfoObj));
    return makeResult(request, JSONValue(std::move(resultObj)));
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleToolsList(const JSONRPCRequest& request, std::stop_token stop) {
    LOG_DEBUG("Handling tools/list request");
    std::vector<ToolDescriptor> tools;
    try {
        tools = api->FetchTools(stop);
    } catch (const errors::ApiError& e) {
        LOG_ERROR("Failed to fetch tools: {}", e.what());
        return makeError(request, JSONRPCErrorCodes::InternalError, "failed to fetch tools: " + e.detail());
    }
    LOG_INFO("Fetched {} tools from API", tools.size());

    const std::vector<std::string> publicNames = names.Refresh(tools);

    JSONValue::Array arr;
    arr.reserve(tools.size());
    for (std::size_t i = 0; i < tools.size(); ++i) {
        const auto& t = tools[i];
        JSONValue::Object obj;
        obj["name"] = std::make_shared<JSONValue>(publicNames[i]);
        obj["description"] = std::make_shared<JSONValue>(t.description);
        // Upstream schemas pass through untouched, except a null or absent one: MCP clients require an
        // object schema, so it is sent as {"type":"object"}.
        obj["inputSchema"] = std::make_shared<JSONValue>(t.parameters.IsNull() ? defaultInputSchema() : t.parameters);
        arr.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    LOG_DEBUG("Mapped {} tools with readable names", names.Size());

    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return makeResult(request, JSONValue(std::move(resultObj)));
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleToolsCall(const JSONRPCRequest& request, std::stop_token stop) {
    LOG_DEBUG("Handling tools/call request");
    const std::string* publicName = request.params ? FindString(*request.params, "name") : nullptr;
    if (!publicName) {
        return makeError(request, JSONRPCErrorCodes::InvalidParams, "missing or invalid 'name' parameter");
    }

    std::string productId;
    if (auto resolved = names.Resolve(*publicName)) {
        productId = *resolved;
    } else {
        LOG_WARN("Tool '{}' not found in name map, using it as the upstream id", *publicName);
        productId = *publicName;
    }

    ExecutionRequest exec;
    exec.productId = productId;
    const JSONValue* args = FindMember(*request.params, "arguments");
    exec.parameters = (args && args->IsObject()) ? *args : JSONValue(JSONValue::Object{});
    const bool streaming = FindBool(exec.parameters, "stream").value_or(false);

    LOG_INFO("Tool call: {} (product ID: {}, streaming: {})", *publicName, productId, streaming);

    try {
        if (streaming) {
            StringChunkSink sink;
            api->StreamPurchase(exec, sink, stop);
            std::string output = sink.Joined();
            LOG_INFO("Streaming purchase completed: {} chars", output.size());
            return makeResult(request, toolResult(output, false));
        }
        ExecutionResult result = api->Purchase(exec, stop);
        LOG_INFO("Purchase completed successfully");
        return makeResult(request, toolResult(result.output, false));
    } catch (const errors::ApiError& e) {
        LOG_WARN("Tool call {} failed: {}", *publicName, e.what());
        return makeResult(request, toolResult("Error: " + e.detail(), true));
    } catch (const std::exception& e) {
        LOG_WARN("Tool call {} failed: {}", *publicName, e.what());
        return makeResult(request, toolResult(std::string("Error: ") + e.what(), true));
    }
}

std::unique_ptr<JSONRPCResponse> Dispatcher::handleResourcesList(const JSONRPCRequest& request) {
    LOG_DEBUG("Handling resources/list request");
    JSONValue::Object resultObj;
    resultObj["resources"] = std::make_shared<JSONValue>(JSONValue::Array{});
    return makeResult(request, JSONValue(std::move(resultObj)));
}

} // namespace pmtrelay
