#pragma once

#include "core/logging/logger.hpp"
#include "oracle/oracle_client.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace skillbench::oracle {

struct RetryPolicy {
  // Extra attempts after the first call.
  int retry_count = 2;
  std::chrono::milliseconds rate_limit_backoff{30000};
};

// Decorator that retries failed oracle calls.
//
// RateLimited failures wait `rate_limit_backoff` before the next attempt;
// other failures retry immediately. NotAvailable never retries because no
// later attempt can succeed.
class RetryingOracleClient final : public IOracleClient {
public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  RetryingOracleClient(std::shared_ptr<IOracleClient> inner, RetryPolicy policy,
                       core::logging::Logger logger, SleepFn sleep = {});

  bool Generate(const std::string& prompt, const GenerateOptions& options, GenerateResult& result,
                OracleError& error) override;

private:
  std::shared_ptr<IOracleClient> inner_;
  RetryPolicy policy_;
  core::logging::Logger logger_;
  SleepFn sleep_;
};

} // namespace skillbench::oracle
