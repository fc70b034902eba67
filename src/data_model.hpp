#pragma once

#include "data_path.hpp"
#include "reactive.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace genui {

// Observable JSON document owned by one surface. Paths are read from the
// document root; a field step into a sequence (or an index step into a map)
// is a structural conflict.
class DataModel {
 public:
  DataModel();
  ~DataModel();

  DataModel(const DataModel&) = delete;
  DataModel& operator=(const DataModel&) = delete;

  // Creates missing maps and sequences. On failure the document is untouched.
  bool Update(const DataPath& path, nlohmann::json contents, std::string* err = nullptr);

  // Missing nodes read as null.
  std::optional<nlohmann::json> Get(const DataPath& path, std::string* err = nullptr) const;

  // Emits the current value, then every change made through `path`, an
  // ancestor or a descendant.
  ValueStream Watch(const DataPath& path) const;

  void Dispose();
  bool Disposed() const;
  size_t ObserverCount() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

}  // namespace genui
