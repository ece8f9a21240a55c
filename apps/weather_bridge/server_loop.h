#pragma once

#include "method_handlers.h"
#include "server_context.h"
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace wxmcp::mcp {

// process_line handles one input frame end to end.
// Returns the response line to write (without newline), or nullopt when
// nothing must be written: blank line, unparseable frame, or notification.
[[nodiscard]] std::optional<std::string> process_line(const std::string& line,
                                                      const MethodRegistry& registry,
                                                      ServerContext& ctx);

// run_server_loop reads frames from in until end of stream and writes one
// flushed line to out per response. Returns normally at end of input.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace wxmcp::mcp
