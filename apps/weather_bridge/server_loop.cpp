#include "server_loop.h"

#include <algorithm>
#include <cctype>

namespace wxmcp::mcp {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::optional<std::string> process_line(const std::string& line, const MethodRegistry& registry,
                                        ServerContext& ctx) {
  if (is_blank(line)) {
    return std::nullopt;
  }

  // Without a parsed id there is nothing to correlate an error to.
  auto request = parse_request(line);
  if (!request.has_value()) {
    ctx.log << "ERROR: " << request.error().message << "\n";
    return std::nullopt;
  }

  ctx.log << "Received request: " << request.value().method << "\n";
  return dispatch_request(request.value(), registry, ctx);
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  const auto registry = build_method_registry();

  // Main loop: read JSON-RPC requests from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    auto response = process_line(line, registry, ctx);
    if (response.has_value()) {
      out << response.value() << "\n" << std::flush;
    }
  }

  ctx.log << "MCP bridge shutting down\n";
}

}  // namespace wxmcp::mcp
