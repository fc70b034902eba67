#include "surface_router.hpp"

#include "a2ui_message.hpp"
#include "log.hpp"
#include "ui_models.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace genui {
namespace {

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_header("Content-Type", "application/json");
  res->set_content(body.dump(), "application/json");
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static void LogRequest(const httplib::Request& req) {
  if (!LogEnabled()) return;
  std::cout << "[http] " << req.method << " " << req.path;
  if (!req.body.empty()) std::cout << " body=" << TruncateForLog(req.body, 2000);
  std::cout << "\n";
}

static nlohmann::json HistoryToJson(const std::vector<ChatMessage>& history) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& m : history) out.push_back(m.ToJson());
  return out;
}

}  // namespace

SurfaceRouter::SurfaceRouter(SurfaceRegistry* surfaces, Conversation* conversation, std::mutex* surface_mu,
                             nlohmann::json capabilities)
    : surfaces_(surfaces),
      conversation_(conversation),
      surface_mu_(surface_mu),
      capabilities_(std::move(capabilities)) {}

void SurfaceRouter::Register(httplib::Server* server) {
  auto messages_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));

    std::vector<nlohmann::json> items;
    if (j.is_array()) {
      items.assign(j.begin(), j.end());
    } else {
      items.push_back(j);
    }

    // Decode everything first so a bad batch changes nothing.
    std::vector<A2uiMessage> messages;
    messages.reserve(items.size());
    for (size_t i = 0; i < items.size(); i++) {
      std::string err;
      auto m = ParseMessage(items[i], &err);
      if (!m) {
        auto body = MakeError(err, "invalid_request_error");
        body["error"]["param"] = "messages[" + std::to_string(i) + "]";
        return SendJson(&res, 400, body);
      }
      messages.push_back(std::move(*m));
    }

    nlohmann::json results = nlohmann::json::array();
    std::lock_guard<std::mutex> lock(*surface_mu_);
    for (const auto& m : messages) {
      std::string err;
      const bool ok = surfaces_->Dispatch(m, &err);
      nlohmann::json r = {{"kind", MessageKind(m)}, {"surfaceId", MessageSurfaceId(m)}, {"ok", ok}};
      if (!ok) r["error"] = err;
      results.push_back(std::move(r));
    }
    SendJson(&res, 200, {{"results", results}});
  };

  auto list_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& id : surfaces_->SurfaceIds()) ids.push_back(id);
    SendJson(&res, 200, {{"object", "list"}, {"data", ids}});
  };

  auto get_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const std::string surface_id = req.matches[1];
    std::lock_guard<std::mutex> lock(*surface_mu_);
    auto surface = surfaces_->Find(surface_id);
    if (!surface) return SendJson(&res, 404, MakeError("surface not found: " + surface_id, "not_found_error"));

    nlohmann::json out;
    out["surfaceId"] = surface_id;
    auto definition = surface->Definition();
    out["definition"] = definition ? definition->ToJson() : nlohmann::json(nullptr);
    std::string err;
    auto data = surface->Model().Get(DataPath::Root(), &err);
    out["data"] = data ? *data : nlohmann::json(nullptr);
    SendJson(&res, 200, out);
  };

  // Runs the agent synchronously; the registry lock must not be held here
  // because the UI tools take it.
  auto events_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    std::string err;
    auto event = UiEvent::FromJson(j, &err);
    if (!event) return SendJson(&res, 400, MakeError(err, "invalid_request_error"));
    if (!surfaces_->Contains(event->surface_id)) {
      return SendJson(&res, 404, MakeError("surface not found: " + event->surface_id, "not_found_error"));
    }
    const bool published = surfaces_->HandleInteraction(*event, &err);
    if (!err.empty()) return SendJson(&res, 409, MakeError(err, "invalid_request_error"));
    SendJson(&res, 200, {{"published", published}});
  };

  auto conversation_post_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
      return SendJson(&res, 400, MakeError("missing field: text", "invalid_request_error"));
    }
    auto result = conversation_->SendRequest(ChatMessage::User(j["text"].get<std::string>()));
    if (!result.ok) return SendJson(&res, 502, MakeError(result.error, "api_error"));
    nlohmann::json out;
    out["text"] = result.text ? nlohmann::json(*result.text) : nlohmann::json(nullptr);
    out["iterations"] = result.iterations;
    nlohmann::json shown = nlohmann::json::array();
    for (const auto& id : conversation_->ShownSurfaceIds()) shown.push_back(id);
    out["surfaces"] = shown;
    SendJson(&res, 200, out);
  };

  auto conversation_get_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::json shown = nlohmann::json::array();
    for (const auto& id : conversation_->ShownSurfaceIds()) shown.push_back(id);
    SendJson(&res, 200,
             {{"messages", HistoryToJson(conversation_->History())},
              {"surfaces", shown},
              {"processing", conversation_->IsProcessing()}});
  };

  auto capabilities_handler = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, capabilities_);
  };

  server->Post("/v1/surfaces/messages", messages_handler);
  server->Post("/v1/surfaces/events", events_handler);
  server->Get("/v1/surfaces", list_handler);
  server->Get(R"(/v1/surfaces/([^/]+))", get_handler);
  server->Post("/v1/conversation", conversation_post_handler);
  server->Get("/v1/conversation", conversation_get_handler);
  server->Get("/v1/capabilities", capabilities_handler);
}

}  // namespace genui
