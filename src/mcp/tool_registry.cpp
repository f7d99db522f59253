#include <kmcp/mcp/tool_registry.hpp>

#include <kmcp/core/log.hpp>
#include <kmcp/core/types.hpp>

namespace kmcp {

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema},
    };
}

Result<void, Error> ToolRegistry::Register(
    ToolDescriptor descriptor, std::shared_ptr<const IToolHandler> handler) {
    auto name = ToolName::Create(descriptor.name);
    if (name.IsErr()) {
        return Result<void, Error>::Err(
            Error{"ToolRegistry::Register", name.Error(), ErrorCategory::Registry});
    }
    if (!handler) {
        return Result<void, Error>::Err(
            Error{"ToolRegistry::Register",
                  "Tool '" + descriptor.name + "' has no handler",
                  ErrorCategory::Registry});
    }

    auto it = index_.find(descriptor.name);
    if (it != index_.end()) {
        LogWarn("registry", "Tool '" + descriptor.name +
                                "' registered twice; replacing the earlier entry");
        descriptors_[it->second] = descriptor;
        entries_[it->second] = ToolEntry{std::move(descriptor), std::move(handler)};
        return Result<void, Error>::Ok();
    }

    index_.emplace(descriptor.name, entries_.size());
    descriptors_.push_back(descriptor);
    entries_.push_back(ToolEntry{std::move(descriptor), std::move(handler)});
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolFunction fn) {
    if (!fn) {
        return Register(ToolDescriptor{name, description, input_schema}, nullptr);
    }
    return Register(ToolDescriptor{name, description, input_schema},
                    std::make_shared<FunctionToolHandler>(std::move(fn)));
}

const ToolEntry* ToolRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return index_.count(name) > 0;
}

} // namespace kmcp
