#include <kmcp/core/types.hpp>

#include <algorithm>

namespace kmcp {

namespace {

bool IsToolNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
}

} // anonymous namespace

Result<ToolName, std::string> ToolName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ToolName, std::string>::Err("Tool name must not be empty");
    }
    if (name.size() > kMaxLength) {
        return Result<ToolName, std::string>::Err(
            "Tool name must be at most " + std::to_string(kMaxLength) +
            " characters, got " + std::to_string(name.size()));
    }
    auto bad = std::find_if_not(name.begin(), name.end(), IsToolNameChar);
    if (bad != name.end()) {
        return Result<ToolName, std::string>::Err(
            "Tool name '" + std::string(name) +
            "' contains invalid character '" + std::string(1, *bad) +
            "' (allowed: letters, digits, '_', '-', '.')");
    }
    return Result<ToolName, std::string>::Ok(ToolName(std::string(name)));
}

} // namespace kmcp
