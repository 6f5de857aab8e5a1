#include "oracle/retrying_oracle_client.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <utility>

namespace skillbench::oracle {

RetryingOracleClient::RetryingOracleClient(std::shared_ptr<IOracleClient> inner,
                                           RetryPolicy policy, core::logging::Logger logger,
                                           SleepFn sleep)
    : inner_(std::move(inner)), policy_(policy), logger_(logger.WithComponent("oracle")),
      sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

bool RetryingOracleClient::Generate(const std::string& prompt, const GenerateOptions& options,
                                    GenerateResult& result, OracleError& error) {
  const int attempts = 1 + std::max(0, policy_.retry_count);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (inner_->Generate(prompt, options, result, error)) {
      return true;
    }
    if (error.kind == OracleErrorKind::kNotAvailable || attempt == attempts) {
      break;
    }

    logger_.Warn("retrying oracle call", {{"attempt", std::to_string(attempt + 1)},
                                          {"max_attempts", std::to_string(attempts)},
                                          {"error_code", ToString(error.kind)}});
    if (error.kind == OracleErrorKind::kRateLimited) {
      sleep_(policy_.rate_limit_backoff);
    }
  }
  return false;
}

} // namespace skillbench::oracle
