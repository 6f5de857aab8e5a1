#include "oracle/structured_output.hpp"

#include <cctype>
#include <optional>

namespace skillbench::oracle {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::optional<std::string_view> FindFencedJsonBlock(std::string_view raw) {
  constexpr std::string_view kOpenFence = "```json";
  const std::size_t open = raw.find(kOpenFence);
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  const std::size_t body_start = open + kOpenFence.size();
  const std::size_t close = raw.find("```", body_start);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  return Trim(raw.substr(body_start, close - body_start));
}

std::optional<std::string_view> FindBraceSpan(std::string_view raw) {
  const std::size_t first = raw.find('{');
  const std::size_t last = raw.rfind('}');
  if (first == std::string_view::npos || last == std::string_view::npos || last <= first) {
    return std::nullopt;
  }
  return raw.substr(first, last - first + 1);
}

} // namespace

bool ParseStructuredOutput(std::string_view raw, core::json::Value& value, std::string& error) {
  error.clear();
  const std::string_view trimmed = Trim(raw);
  if (trimmed.empty()) {
    error = "model output is empty";
    return false;
  }

  std::string direct_error;
  if (core::json::Parse(trimmed, value, direct_error)) {
    return true;
  }

  if (const auto fenced = FindFencedJsonBlock(trimmed); fenced.has_value()) {
    std::string fenced_error;
    if (core::json::Parse(fenced.value(), value, fenced_error)) {
      return true;
    }
  }

  if (const auto span = FindBraceSpan(trimmed); span.has_value()) {
    std::string span_error;
    if (core::json::Parse(span.value(), value, span_error)) {
      return true;
    }
  }

  error = "unable to extract structured JSON from model output (" + direct_error + ")";
  return false;
}

} // namespace skillbench::oracle
