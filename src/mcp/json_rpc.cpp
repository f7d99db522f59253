#include <kmcp/mcp/json_rpc.hpp>

namespace kmcp {

namespace {

bool IsValidId(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

Result<JsonRpcRequest, DecodeError> Invalid(std::string detail,
                                            nlohmann::json id = nullptr) {
    return Result<JsonRpcRequest, DecodeError>::Err(
        DecodeError{DecodeErrorKind::InvalidRequest, std::move(detail), std::move(id)});
}

void AppendError(std::string& out, const RpcError& error) {
    out += "{\"code\":";
    out += std::to_string(error.code);
    out += ",\"message\":";
    out += DumpJson(error.message);
    if (error.data.has_value()) {
        out += ",\"data\":";
        out += DumpJson(*error.data);
    }
    out += '}';
}

} // anonymous namespace

const char* StandardErrorMessage(int code) noexcept {
    switch (code) {
        case kParseError:     return "Parse error";
        case kInvalidRequest: return "Invalid Request";
        case kMethodNotFound: return "Method not found";
        case kInvalidParams:  return "Invalid params";
        case kInternalError:  return "Internal error";
    }
    return "Server error";
}

// ---------------------------------------------------------------------------
// RpcError
// ---------------------------------------------------------------------------
RpcError RpcError::Standard(int code) {
    return RpcError{code, StandardErrorMessage(code), std::nullopt};
}

RpcError RpcError::Standard(int code, nlohmann::json data) {
    return RpcError{code, StandardErrorMessage(code), std::move(data)};
}

nlohmann::json RpcError::ToJson() const {
    nlohmann::json j = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        j["data"] = *data;
    }
    return j;
}

// ---------------------------------------------------------------------------
// JsonRpcResponse
// ---------------------------------------------------------------------------
JsonRpcResponse JsonRpcResponse::Success(nlohmann::json id, nlohmann::json result) {
    JsonRpcResponse response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

JsonRpcResponse JsonRpcResponse::Failure(nlohmann::json id, RpcError error) {
    JsonRpcResponse response;
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

JsonRpcResponse DecodeError::ToResponse() const {
    auto error = RpcError::Standard(Code());
    if (!detail.empty()) {
        error.data = detail;
    }
    return JsonRpcResponse::Failure(id, std::move(error));
}

// ---------------------------------------------------------------------------
// DecodeRequest
// ---------------------------------------------------------------------------
Result<JsonRpcRequest, DecodeError> DecodeRequest(std::string_view bytes) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<JsonRpcRequest, DecodeError>::Err(
            DecodeError{DecodeErrorKind::ParseError, e.what(), nullptr});
    }

    if (message.is_array()) {
        return Invalid("Batch requests are not supported");
    }
    if (!message.is_object()) {
        return Invalid("Request must be a JSON object");
    }

    nlohmann::json id = nullptr;
    if (auto it = message.find("id"); it != message.end()) {
        if (!IsValidId(*it)) {
            return Invalid("'id' must be a number, a string or null");
        }
        id = *it;
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || *version != "2.0") {
        return Invalid("'jsonrpc' must be \"2.0\"", id);
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Invalid("'method' must be a string", id);
    }

    JsonRpcRequest request;
    request.id = std::move(id);
    request.method = method->get<std::string>();
    if (auto params = message.find("params"); params != message.end()) {
        request.params = *params;
    }
    return Result<JsonRpcRequest, DecodeError>::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
std::string DumpJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Encode(const JsonRpcResponse& response) {
    // Built by hand to keep the member order jsonrpc, id, result|error.
    std::string out = "{\"jsonrpc\":\"2.0\",\"id\":";
    out += DumpJson(response.id);
    if (response.error.has_value()) {
        out += ",\"error\":";
        AppendError(out, *response.error);
    } else {
        out += ",\"result\":";
        out += response.result.has_value() ? DumpJson(*response.result) : "null";
    }
    out += '}';
    return out;
}

std::string EncodeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return Encode(JsonRpcResponse::Success(id, result));
}

std::string EncodeError(const nlohmann::json& id, int code,
                        std::string_view message,
                        const std::optional<nlohmann::json>& data) {
    return Encode(JsonRpcResponse::Failure(
        id, RpcError{code, std::string(message), data}));
}

nlohmann::json ToJson(const JsonRpcResponse& response) {
    nlohmann::json j = {{"jsonrpc", "2.0"}, {"id", response.id}};
    if (response.error.has_value()) {
        j["error"] = response.error->ToJson();
    } else {
        j["result"] = response.result.value_or(nullptr);
    }
    return j;
}

} // namespace kmcp
