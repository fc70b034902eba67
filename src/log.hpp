#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace genui {

bool LogEnabled();
void SetLogEnabled(bool enabled);

std::string TruncateForLog(std::string s, size_t max_chars);
std::string JsonForLog(const nlohmann::json& j, size_t max_chars = 2000);

}  // namespace genui
