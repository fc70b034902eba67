#pragma once

#include <string>
#include <vector>

namespace genui {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8090;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

// Which structural tools the model may call.
struct ActionsConfig {
  bool allow_create = true;
  bool allow_update = true;
  bool allow_delete = true;
};

struct RuntimeConfig {
  HttpListenConfig listen;
  HttpEndpoint model_endpoint;
  std::string model = "default";
  std::string api_key;
  std::string system_prompt;
  int max_iterations = 0;
  ActionsConfig actions;
  std::vector<std::string> catalog_ids;
  bool log_enabled = true;
};

RuntimeConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::vector<std::string> SplitCsv(const std::string& s);

}  // namespace genui
