#include <kmcp/mcp/mcp_dispatcher.hpp>

#include <kmcp/core/log.hpp>
#include <kmcp/mcp/tool_invoker.hpp>

#include <exception>

namespace kmcp {

namespace {

// Params may be omitted (or null); when present they must be an object.
bool ParamsAreObjectOrAbsent(const nlohmann::json& params) {
    return params.is_null() || params.is_object();
}

JsonRpcResponse InvalidParams(const nlohmann::json& id, const std::string& detail) {
    return JsonRpcResponse::Failure(id, RpcError::Standard(kInvalidParams, detail));
}

} // anonymous namespace

nlohmann::json ToolsListResult(const ToolRegistry& registry) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return {{"tools", std::move(tools)}};
}

McpDispatcher::McpDispatcher(ServerContext& context) : context_(context) {}

std::string McpDispatcher::HandleMessage(std::string_view raw) {
    auto& metrics = context_.Metrics();
    metrics.CountRequest();

    JsonRpcResponse response;
    auto decoded = DecodeRequest(raw);
    if (decoded.IsErr()) {
        LogDebug("dispatch", "Rejected message: " + decoded.Error().detail);
        response = decoded.Error().ToResponse();
    } else {
        response = Dispatch(decoded.Value());
    }

    if (response.IsError()) {
        metrics.CountError();
    }
    return Encode(response);
}

JsonRpcResponse McpDispatcher::Dispatch(const JsonRpcRequest& request) {
    LogDebug("dispatch", "-> " + request.method);
    try {
        if (request.method == "initialize") {
            return HandleInitialize(request);
        }
        if (request.method == "tools/list") {
            return HandleToolsList(request);
        }
        if (request.method == "tools/call") {
            return HandleToolsCall(request);
        }
        if (request.method == "notifications/initialized") {
            return JsonRpcResponse::Success(request.id, nlohmann::json::object());
        }
        return JsonRpcResponse::Failure(request.id, RpcError::Standard(kMethodNotFound));
    } catch (const std::exception& e) {
        LogError("dispatch", "Unexpected failure in '" + request.method + "': " + e.what());
        return JsonRpcResponse::Failure(request.id,
                                        RpcError::Standard(kInternalError, e.what()));
    }
}

JsonRpcResponse McpDispatcher::HandleInitialize(const JsonRpcRequest& request) {
    if (!ParamsAreObjectOrAbsent(request.params)) {
        return InvalidParams(request.id, "'params' must be an object");
    }

    const auto& info = context_.Info();
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", info.name},
        {"version", info.version}
    };
    return JsonRpcResponse::Success(request.id, std::move(result));
}

JsonRpcResponse McpDispatcher::HandleToolsList(const JsonRpcRequest& request) {
    if (!ParamsAreObjectOrAbsent(request.params)) {
        return InvalidParams(request.id, "'params' must be an object");
    }
    return JsonRpcResponse::Success(request.id, ToolsListResult(context_.Registry()));
}

JsonRpcResponse McpDispatcher::HandleToolsCall(const JsonRpcRequest& request) {
    const auto& params = request.params;
    if (!params.is_object()) {
        return InvalidParams(request.id, "'params' must be an object");
    }

    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return InvalidParams(request.id, "Missing 'name' parameter");
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto args = params.find("arguments"); args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return InvalidParams(request.id, "'arguments' must be an object");
        }
        arguments = *args;
    }

    auto outcome = InvokeTool(context_.Registry(), context_.Metrics(),
                              name->get<std::string>(), arguments);
    if (outcome.IsErr()) {
        return JsonRpcResponse::Failure(request.id, std::move(outcome).Error());
    }
    return JsonRpcResponse::Success(request.id, std::move(outcome).Value());
}

} // namespace kmcp
