#include "log.hpp"

#include <atomic>
#include <cstring>

namespace genui {
namespace {

std::atomic<bool> g_log_enabled{true};

}  // namespace

bool LogEnabled() {
  return g_log_enabled.load(std::memory_order_relaxed);
}

void SetLogEnabled(bool enabled) {
  g_log_enabled.store(enabled, std::memory_order_relaxed);
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string JsonForLog(const nlohmann::json& j, size_t max_chars) {
  return TruncateForLog(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), max_chars);
}

}  // namespace genui
