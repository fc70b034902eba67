#include "basic_functions.hpp"
#include "client_capabilities.hpp"
#include "client_function.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "local_agent.hpp"
#include "log.hpp"
#include "openai_compatible_adapter.hpp"
#include "surface_registry.hpp"
#include "surface_router.hpp"
#include "tooling.hpp"
#include "ui_tools.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

static std::string BuildSystemPrompt(const genui::RuntimeConfig& cfg, const genui::ToolRegistry& tools,
                                     const genui::FunctionRegistry& functions) {
  std::string prompt = cfg.system_prompt;
  if (!prompt.empty()) prompt += "\n\n";
  prompt += genui::BuildUiTechPrompt(genui::ExtractToolNames(tools.ListSchemas()));
  prompt += "\n\nClient functions available in bindings ({\"function\": name, \"args\": {...}}):\n";
  prompt += functions.Describe().dump(2);
  return prompt;
}

static nlohmann::json BuildCapabilities(const genui::RuntimeConfig& cfg, const genui::FunctionRegistry& functions) {
  std::vector<genui::CatalogDescriptor> catalogs;
  for (const auto& id : cfg.catalog_ids) {
    genui::CatalogDescriptor c;
    c.catalog_id = id;
    catalogs.push_back(std::move(c));
  }
  // The function catalog has no id and is always sent inline.
  genui::CatalogDescriptor fn_catalog;
  fn_catalog.functions = functions.Describe();
  catalogs.push_back(std::move(fn_catalog));

  std::string err;
  auto caps = genui::BuildClientCapabilities(catalogs, genui::InlineCatalogHandling::kMissingIds, &err);
  if (!caps) {
    std::cout << "[http] capabilities error=" << err << "\n";
    return nlohmann::json::object();
  }
  return caps->ToJson();
}

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = genui::LoadConfigFromEnv();
  genui::SetLogEnabled(cfg.log_enabled);

  std::mutex surface_mu;
  genui::SurfaceRegistry surfaces;

  genui::FunctionRegistry functions;
  genui::RegisterBasicFunctions(&functions);

  genui::ToolRegistry tools;
  genui::RegisterSurfaceTools(&tools, &surfaces, cfg.actions, &surface_mu);

  genui::OpenAiCompatibleAdapter adapter(cfg.model_endpoint, cfg.model, cfg.api_key);
  genui::AgentOptions options;
  options.max_iterations = cfg.max_iterations;
  options.system_prompt = BuildSystemPrompt(cfg, tools, functions);
  genui::LocalAgent agent(&adapter, &tools, options);

  genui::Conversation conversation(&surfaces, &agent);
  auto text_sub = conversation.TextResponses().Subscribe([](const std::string& text) {
    if (genui::LogEnabled()) std::cout << "[surface] assistant text=" << genui::TruncateForLog(text, 2000) << "\n";
  });

  genui::SurfaceRouter router(&surfaces, &conversation, &surface_mu, BuildCapabilities(cfg, functions));

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", "server_error"}, {"param", nullptr}, {"code", nullptr}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "upstream error";
      type = "api_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["surfaces"] = surfaces.SurfaceIds().size();
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::cout << "[http] model endpoint=" << cfg.model_endpoint.scheme << "://" << cfg.model_endpoint.host << ":"
            << cfg.model_endpoint.port << cfg.model_endpoint.base_path << " model=" << cfg.model << "\n";
  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  surfaces.Dispose();
  return ok ? 0 : 1;
}
