#pragma once

#include "oracle/oracle_client.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace skillbench::oracle::testing {

// Snapshot of one Generate() invocation.
struct OracleCall {
  std::string prompt;
  std::optional<std::string> system_instructions;
  std::filesystem::path working_dir;
  std::chrono::milliseconds timeout{0};
  std::string model;
};

// Scripted oracle used by scheduler and iteration tests so no model CLI is
// needed. The handler decides each answer; every call is recorded in order.
// Safe to call from several skill streams at once.
class ScriptedOracleClient final : public IOracleClient {
public:
  using Handler = std::function<bool(const OracleCall& call, GenerateResult& result,
                                     OracleError& error)>;

  explicit ScriptedOracleClient(Handler handler);

  bool Generate(const std::string& prompt, const GenerateOptions& options, GenerateResult& result,
                OracleError& error) override;

  std::vector<OracleCall> calls() const;
  std::size_t call_count() const;

private:
  Handler handler_;
  mutable std::mutex mu_;
  std::vector<OracleCall> calls_;
};

} // namespace skillbench::oracle::testing
