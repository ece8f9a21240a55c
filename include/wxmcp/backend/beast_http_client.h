#pragma once

#include "wxmcp/backend/backend_config.h"
#include "wxmcp/backend/http_client.h"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace wxmcp::backend {

// BeastHttpClient talks plain HTTP/1.1 to the configured backend over Boost.Beast.
// Each call opens a fresh connection (Connection: close) on a private io_context,
// so instances carry no connection state between calls.
class BeastHttpClient final : public IHttpClient {
 public:
  explicit BeastHttpClient(BackendConfig config) : config_(std::move(config)) {}
  ~BeastHttpClient() override = default;

  BeastHttpClient(const BeastHttpClient&) = default;
  BeastHttpClient& operator=(const BeastHttpClient&) = default;
  BeastHttpClient(BeastHttpClient&&) = default;
  BeastHttpClient& operator=(BeastHttpClient&&) = default;

  [[nodiscard]] HttpResult get(const std::string& target, std::chrono::seconds timeout) override;
  [[nodiscard]] HttpResult post_json(const std::string& target, const std::string& body,
                                     std::chrono::seconds timeout) override;

 private:
  HttpResult perform(bool is_post, const std::string& target,
                     const std::optional<std::string>& body, std::chrono::seconds timeout);

  BackendConfig config_;
};

}  // namespace wxmcp::backend
