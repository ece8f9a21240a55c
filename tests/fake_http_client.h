#pragma once

#include "wxmcp/backend/http_client.h"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace wxmcp::testing {

// FakeHttpClient replays one canned outcome for every call and records what was sent.
class FakeHttpClient final : public backend::IHttpClient {
 public:
  struct Call {
    std::string method;            // NOLINT(readability-identifier-naming)
    std::string target;            // NOLINT(readability-identifier-naming)
    std::string body;              // NOLINT(readability-identifier-naming)
    std::chrono::seconds timeout;  // NOLINT(readability-identifier-naming)
  };

  explicit FakeHttpClient(backend::HttpResult outcome) : outcome_(std::move(outcome)) {}

  static FakeHttpClient responding(int status, std::string body) {
    return FakeHttpClient(
        backend::HttpResult::ok(backend::HttpResponse{status, std::move(body)}));
  }

  static FakeHttpClient failing(backend::HttpErrorKind kind, std::string message) {
    return FakeHttpClient(backend::HttpResult::err(backend::HttpError{kind, std::move(message)}));
  }

  backend::HttpResult get(const std::string& target, std::chrono::seconds timeout) override {
    calls_.push_back(Call{"GET", target, "", timeout});
    return outcome_;
  }

  backend::HttpResult post_json(const std::string& target, const std::string& body,
                                std::chrono::seconds timeout) override {
    calls_.push_back(Call{"POST", target, body, timeout});
    return outcome_;
  }

  [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }

 private:
  backend::HttpResult outcome_;
  std::vector<Call> calls_;
};

}  // namespace wxmcp::testing
