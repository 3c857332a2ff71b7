#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_adapter {

// Convert the "result" of a tools/call reply into the value handed back to
// the caller:
//   1. non-empty structuredContent, returned as-is (an object whose only key
//      is "result" is unwrapped). A result with neither "content" nor
//      "structuredContent" counts as structured.
//   2. text blocks: one gives a string, several give an array of strings.
//   3. otherwise {"raw": <result>}.
// Never throws.
nlohmann::json NormalizeCallResult(const nlohmann::json& result);

// The text carried by each content block of `result`, in order.
std::vector<std::string> ExtractContentText(const nlohmann::json& result);

} // namespace mcp_adapter
