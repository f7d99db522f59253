#pragma once

#include <kmcp/mcp/mcp_dispatcher.hpp>

#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace kmcp {

// ---------------------------------------------------------------------------
// StdioServer: JSON-RPC over newline-delimited stdin/stdout.
//
// One response line per non-blank request line, flushed before the next
// line is read. Requests are handled strictly in order.
// ---------------------------------------------------------------------------
class StdioServer {
public:
    enum class State {
        ReadingLine,
        Done,
    };

    // stop_requested is polled between requests; a request already read is
    // always answered before the loop ends.
    explicit StdioServer(McpDispatcher& dispatcher,
                         std::istream& in = std::cin,
                         std::ostream& out = std::cout,
                         std::function<bool()> stop_requested = {});

    // Run the loop until EOF, an output failure, or a stop request.
    void Run();

    [[nodiscard]] State CurrentState() const noexcept { return state_; }

    // Requests answered so far.
    [[nodiscard]] std::size_t Handled() const noexcept { return handled_; }

private:
    void Step();
    bool WriteLine(const std::string& line);

    McpDispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::function<bool()> stop_requested_;
    State state_ = State::ReadingLine;
    std::size_t handled_ = 0;
};

} // namespace kmcp
