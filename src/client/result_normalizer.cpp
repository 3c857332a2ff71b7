#include <mcp_adapter/client/result_normalizer.hpp>

#include <optional>

namespace mcp_adapter {

namespace {

bool IsEmptyValue(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_object() || value.is_array() || value.is_string()) return value.empty();
    return false;
}

nlohmann::json UnwrapResultKey(const nlohmann::json& value) {
    if (value.is_object() && value.size() == 1) {
        auto it = value.find("result");
        if (it != value.end() && !it->is_null()) {
            return *it;
        }
    }
    return value;
}

std::optional<std::string> BlockText(const nlohmann::json& block) {
    if (block.is_string()) {
        return block.get<std::string>();
    }
    if (!block.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"text", "value", "markdown", "string"}) {
        auto it = block.find(key);
        if (it != block.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::vector<std::string> ExtractContentText(const nlohmann::json& result) {
    std::vector<std::string> texts;
    if (!result.is_object()) return texts;
    auto content = result.find("content");
    if (content == result.end() || !content->is_array()) return texts;
    for (const auto& block : *content) {
        if (auto text = BlockText(block)) {
            texts.push_back(std::move(*text));
        }
    }
    return texts;
}

nlohmann::json NormalizeCallResult(const nlohmann::json& result) {
    if (result.is_object()) {
        auto structured = result.find("structuredContent");
        if (structured != result.end() && !IsEmptyValue(*structured)) {
            return UnwrapResultKey(*structured);
        }
        // Servers predating content blocks return their payload directly.
        if (structured == result.end() && !result.contains("content") &&
            !result.contains("isError") && !result.empty()) {
            return UnwrapResultKey(result);
        }
    }

    auto texts = ExtractContentText(result);
    if (texts.size() == 1) {
        return texts.front();
    }
    if (texts.size() > 1) {
        return texts;
    }
    return {{"raw", result}};
}

} // namespace mcp_adapter
