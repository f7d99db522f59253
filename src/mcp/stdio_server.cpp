#include <kmcp/mcp/stdio_server.hpp>

#include <kmcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace kmcp {

namespace {

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

StdioServer::StdioServer(McpDispatcher& dispatcher,
                         std::istream& in,
                         std::ostream& out,
                         std::function<bool()> stop_requested)
    : dispatcher_(dispatcher),
      in_(in),
      out_(out),
      stop_requested_(std::move(stop_requested)) {}

void StdioServer::Run() {
    LogInfo("stdio", "Serving MCP on stdin/stdout");
    while (state_ == State::ReadingLine) {
        Step();
    }
    LogInfo("stdio", "Stopped after " + std::to_string(handled_) + " request(s)");
}

void StdioServer::Step() {
    if (stop_requested_ && stop_requested_()) {
        state_ = State::Done;
        return;
    }

    std::string line;
    if (!std::getline(in_, line)) {
        // EOF, or a read interrupted by a shutdown signal.
        state_ = State::Done;
        return;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (IsBlank(line)) {
        return;
    }

    auto response = dispatcher_.HandleMessage(line);
    ++handled_;
    if (!WriteLine(response)) {
        LogError("stdio", "Failed to write response to stdout; stopping");
        state_ = State::Done;
    }
}

bool StdioServer::WriteLine(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    return static_cast<bool>(out_);
}

} // namespace kmcp
