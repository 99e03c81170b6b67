#pragma once

#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace talkback::server::utils {

// RFC 3986 百分号编码，非保留字符之外的字节一律编码
std::string encodeUrlComponent(const std::string& value);

// 按键排序输出 key=value&...
std::string serializeQuery(const std::map<std::string, std::string>& params);

std::optional<nlohmann::json> parseJsonSafe(const std::string& text, std::string* error = nullptr);

// 截取至多 maxBytes 字节，不切断 UTF-8 多字节字符
std::string truncateUtf8(const std::string& text, size_t maxBytes);

} // namespace talkback::server::utils
