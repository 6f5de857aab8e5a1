#include "oracle/testing/scripted_oracle_client.hpp"

#include <utility>

namespace skillbench::oracle::testing {

ScriptedOracleClient::ScriptedOracleClient(Handler handler) : handler_(std::move(handler)) {}

bool ScriptedOracleClient::Generate(const std::string& prompt, const GenerateOptions& options,
                                    GenerateResult& result, OracleError& error) {
  OracleCall call;
  call.prompt = prompt;
  call.system_instructions = options.system_instructions;
  call.working_dir = options.working_dir;
  call.timeout = options.timeout;
  call.model = options.model;
  {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(call);
  }

  result = GenerateResult{};
  if (!handler_) {
    error.kind = OracleErrorKind::kNotAvailable;
    error.message = "scripted oracle has no handler";
    return false;
  }
  // The handler runs outside the lock so slow scripted answers from one
  // stream never serialize the others.
  return handler_(call, result, error);
}

std::vector<OracleCall> ScriptedOracleClient::calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_;
}

std::size_t ScriptedOracleClient::call_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_.size();
}

} // namespace skillbench::oracle::testing
