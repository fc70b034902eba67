#pragma once

#include "config.hpp"
#include "providers/model_adapter.hpp"

#include <string>

namespace genui {

// Chat completions over HTTP against any OpenAI-compatible server
// (llama.cpp server, Ollama, vLLM, ...).
class OpenAiCompatibleAdapter : public IModelAdapter {
 public:
  OpenAiCompatibleAdapter(HttpEndpoint endpoint, std::string model, std::string api_key = {});

  std::string Name() const override;
  nlohmann::json AdaptTools(const std::vector<ToolSchema>& tools) const override;
  nlohmann::json ConvertMessages(const std::vector<ChatMessage>& messages) const override;
  std::optional<nlohmann::json> GenerateContent(const nlohmann::json& content,
                                                const nlohmann::json& tools,
                                                std::string* err) override;
  ModelTurnResult ProcessResponse(const nlohmann::json& response) const override;

 private:
  HttpEndpoint endpoint_;
  std::string model_;
  std::string api_key_;
};

}  // namespace genui
