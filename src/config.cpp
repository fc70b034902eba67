#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace genui {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static void ReadBoolEnv(const char* name, bool* out) {
  auto v = GetEnvStr(name);
  if (v.empty()) return;
  bool b = false;
  if (TryParseBool(v, &b)) *out = b;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;

  if (auto host = GetEnvStr("GENUI_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("GENUI_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  cfg.model_endpoint = ParseHttpEndpoint("http://127.0.0.1:11434", 11434);
  if (auto ep = GetEnvStr("GENUI_MODEL_HOST"); !ep.empty()) cfg.model_endpoint = ParseHttpEndpoint(ep, 80);
  if (auto model = GetEnvStr("GENUI_MODEL"); !model.empty()) cfg.model = model;
  if (auto key = GetEnvStr("GENUI_API_KEY"); !key.empty()) cfg.api_key = key;
  if (auto prompt = GetEnvStr("GENUI_SYSTEM_PROMPT"); !prompt.empty()) cfg.system_prompt = prompt;
  if (auto iters = GetEnvStr("GENUI_MAX_ITERATIONS"); !iters.empty()) {
    cfg.max_iterations = std::atoi(iters.c_str());
    if (cfg.max_iterations < 0) cfg.max_iterations = 0;
  }

  ReadBoolEnv("GENUI_ALLOW_CREATE", &cfg.actions.allow_create);
  ReadBoolEnv("GENUI_ALLOW_UPDATE", &cfg.actions.allow_update);
  ReadBoolEnv("GENUI_ALLOW_DELETE", &cfg.actions.allow_delete);

  if (auto ids = GetEnvStr("GENUI_CATALOG_IDS"); !ids.empty()) cfg.catalog_ids = SplitCsv(ids);
  ReadBoolEnv("GENUI_LOG", &cfg.log_enabled);

  return cfg;
}

}  // namespace genui
