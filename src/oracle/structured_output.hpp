#pragma once

#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace skillbench::oracle {

// Extracts one JSON value from free-form model output.
//
// Strategies, first success wins:
// 1) the whole text parses as JSON
// 2) the body of the first ```json fenced block
// 3) the span from the first '{' to the last '}'
//
// Returns false with a parse diagnostic when none of them yields JSON.
bool ParseStructuredOutput(std::string_view raw, core::json::Value& value, std::string& error);

} // namespace skillbench::oracle
