#pragma once

#include "conversation.hpp"
#include "surface_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <mutex>

namespace genui {

class SurfaceRouter {
 public:
  // `surface_mu` is the lock the UI tools take around registry mutations.
  SurfaceRouter(SurfaceRegistry* surfaces, Conversation* conversation, std::mutex* surface_mu,
                nlohmann::json capabilities);
  void Register(httplib::Server* server);

 private:
  SurfaceRegistry* surfaces_;
  Conversation* conversation_;
  std::mutex* surface_mu_;
  nlohmann::json capabilities_;
};

}  // namespace genui
