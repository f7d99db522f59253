#pragma once

#include <kmcp/core/result.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace kmcp {

// ---------------------------------------------------------------------------
// ToolDescriptor: metadata advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    // {"name", "description", "inputSchema"} as sent on the wire.
    [[nodiscard]] nlohmann::json ToJson() const;
};

// Ok: the tool's output value. Err: a tool-domain failure message that is
// reported back to the client as data (isError: true), not as a protocol
// error.
using ToolOutcome = Result<nlohmann::json, std::string>;

// ---------------------------------------------------------------------------
// IToolHandler: the callable side of a tool.
//
// Call() runs on whichever worker thread serves the request and may be
// invoked concurrently; implementations synchronize their own state.
// Throwing is treated as an internal fault of the tool.
// ---------------------------------------------------------------------------
class IToolHandler {
public:
    virtual ~IToolHandler() = default;
    [[nodiscard]] virtual ToolOutcome Call(const nlohmann::json& arguments) const = 0;
};

using ToolFunction = std::function<ToolOutcome(const nlohmann::json& arguments)>;

// Adapts a plain callable to IToolHandler.
class FunctionToolHandler : public IToolHandler {
public:
    explicit FunctionToolHandler(ToolFunction fn) : fn_(std::move(fn)) {}

    [[nodiscard]] ToolOutcome Call(const nlohmann::json& arguments) const override {
        return fn_(arguments);
    }

private:
    ToolFunction fn_;
};

struct ToolEntry {
    ToolDescriptor descriptor;
    std::shared_ptr<const IToolHandler> handler;
};

// ---------------------------------------------------------------------------
// ToolRegistry: tool name -> (descriptor, handler).
//
// Filled single-threaded during bootstrap, then frozen behind a
// shared_ptr<const ToolRegistry>; the const interface is safe for concurrent
// readers. Registering an existing name replaces the entry in place
// (last write wins) and keeps its listing position.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    Result<void, Error> Register(ToolDescriptor descriptor,
                                 std::shared_ptr<const IToolHandler> handler);

    Result<void, Error> Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolFunction fn);

    // nullptr when no tool of that name exists.
    [[nodiscard]] const ToolEntry* Find(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Descriptors in registration order.
    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

private:
    std::vector<ToolEntry> entries_;
    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace kmcp
