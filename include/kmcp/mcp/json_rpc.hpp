#pragma once

#include <kmcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kmcp {

// JSON-RPC 2.0 standard error codes.
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;

/// Standard message for the codes above ("Parse error", ...).
const char* StandardErrorMessage(int code) noexcept;

// ---------------------------------------------------------------------------
// RpcError: the error member of a JSON-RPC response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;

    /// Error with the standard message for `code`.
    static RpcError Standard(int code);
    static RpcError Standard(int code, nlohmann::json data);

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct JsonRpcRequest {
    nlohmann::json id;      // number, string or null (absent -> null)
    std::string method;
    nlohmann::json params;  // null when absent
};

// Exactly one of result / error is set.
struct JsonRpcResponse {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    static JsonRpcResponse Success(nlohmann::json id, nlohmann::json result);
    static JsonRpcResponse Failure(nlohmann::json id, RpcError error);

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }
};

enum class DecodeErrorKind {
    ParseError,
    InvalidRequest,
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::ParseError;
    std::string detail;
    nlohmann::json id;  // echoed back when it could be recovered, else null

    [[nodiscard]] int Code() const noexcept {
        return kind == DecodeErrorKind::ParseError ? kParseError : kInvalidRequest;
    }

    [[nodiscard]] JsonRpcResponse ToResponse() const;
};

// ---------------------------------------------------------------------------
// Envelope codec. Batches are not supported: a top-level array is an
// Invalid Request.
// ---------------------------------------------------------------------------
Result<JsonRpcRequest, DecodeError> DecodeRequest(std::string_view bytes);

/// Serialize as {"jsonrpc":"2.0","id":...,"result"|"error":...}. Never throws;
/// invalid UTF-8 in strings is replaced.
std::string Encode(const JsonRpcResponse& response);

std::string EncodeResult(const nlohmann::json& id, const nlohmann::json& result);

std::string EncodeError(const nlohmann::json& id, int code,
                        std::string_view message,
                        const std::optional<nlohmann::json>& data = std::nullopt);

/// Same envelope as Encode(), as a JSON value.
nlohmann::json ToJson(const JsonRpcResponse& response);

/// dump() that cannot throw on invalid UTF-8.
std::string DumpJson(const nlohmann::json& value);

} // namespace kmcp
