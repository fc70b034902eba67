#include "data_model.hpp"

#include "log.hpp"

#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

namespace genui {

struct DataModel::State {
  struct Observer {
    uint64_t id = 0;
    DataPath path;
    bool has_last = false;
    nlohmann::json last;
    StreamObserver observer;
  };

  nlohmann::json root = nlohmann::json::object();
  std::vector<Observer> observers;
  uint64_t next_id = 1;
  bool disposed = false;

  Observer* FindObserver(uint64_t id) {
    for (auto& o : observers) {
      if (o.id == id) return &o;
    }
    return nullptr;
  }
};

namespace {

static std::string ConflictError(const DataPath& path, size_t depth, const char* expected, const nlohmann::json& found) {
  std::vector<PathSegment> prefix(path.Segments().begin(), path.Segments().begin() + depth);
  return std::string("structural conflict: expected ") + expected + " at '" + DataPath(prefix, true).ToString() +
         "' but found " + found.type_name();
}

// Writes may extend a sequence past its end by at most this many null slots.
constexpr size_t kMaxIndexGap = 1024;

static bool CheckIndexGap(const DataPath& path, size_t depth, size_t size, std::string* err) {
  const size_t index = path.Segments()[depth].index;
  if (index <= size || index - size <= kMaxIndexGap) return true;
  if (err) {
    std::vector<PathSegment> prefix(path.Segments().begin(), path.Segments().begin() + depth);
    *err = "structural conflict: index " + std::to_string(index) + " at '" + DataPath(prefix, true).ToString() +
           "' is more than " + std::to_string(kMaxIndexGap) + " past the end of a sequence of size " +
           std::to_string(size);
  }
  return false;
}

static bool ReadAt(const nlohmann::json& root, const DataPath& path, nlohmann::json* out, std::string* err) {
  const nlohmann::json* cur = &root;
  const auto& segs = path.Segments();
  for (size_t i = 0; i < segs.size(); i++) {
    if (cur->is_null()) {
      *out = nullptr;
      return true;
    }
    const auto& seg = segs[i];
    if (seg.IsField()) {
      if (!cur->is_object()) {
        if (err) *err = ConflictError(path, i, "map", *cur);
        return false;
      }
      auto it = cur->find(seg.field);
      if (it == cur->end()) {
        *out = nullptr;
        return true;
      }
      cur = &*it;
    } else {
      if (!cur->is_array()) {
        if (err) *err = ConflictError(path, i, "sequence", *cur);
        return false;
      }
      if (seg.index >= cur->size()) {
        *out = nullptr;
        return true;
      }
      cur = &(*cur)[seg.index];
    }
  }
  *out = *cur;
  return true;
}

// Checks the whole write path before anything is mutated so that a
// conflicting write leaves the document untouched. `cur` becomes null once
// the walk leaves the existing document; the rest of the path is created
// from empty containers.
static bool ValidateWrite(const nlohmann::json& root, const DataPath& path, std::string* err) {
  const nlohmann::json* cur = &root;
  const auto& segs = path.Segments();
  for (size_t i = 0; i < segs.size(); i++) {
    const auto& seg = segs[i];
    if (cur && cur->is_null()) cur = nullptr;
    if (!cur) {
      if (seg.IsIndex() && !CheckIndexGap(path, i, 0, err)) return false;
      continue;
    }
    if (seg.IsField()) {
      if (!cur->is_object()) {
        if (err) *err = ConflictError(path, i, "map", *cur);
        return false;
      }
      auto it = cur->find(seg.field);
      cur = it == cur->end() ? nullptr : &*it;
    } else {
      if (!cur->is_array()) {
        if (err) *err = ConflictError(path, i, "sequence", *cur);
        return false;
      }
      if (!CheckIndexGap(path, i, cur->size(), err)) return false;
      cur = seg.index < cur->size() ? &(*cur)[seg.index] : nullptr;
    }
  }
  return true;
}

static void ApplyWrite(nlohmann::json* root, const DataPath& path, nlohmann::json contents) {
  nlohmann::json* cur = root;
  const auto& segs = path.Segments();
  for (size_t i = 0; i < segs.size(); i++) {
    const auto& seg = segs[i];
    const bool last = i + 1 == segs.size();
    if (cur->is_null()) *cur = seg.IsField() ? nlohmann::json::object() : nlohmann::json::array();
    nlohmann::json* child = nullptr;
    if (seg.IsField()) {
      child = &(*cur)[seg.field];
    } else {
      while (cur->size() <= seg.index) cur->push_back(nullptr);
      child = &(*cur)[seg.index];
    }
    if (last) {
      *child = std::move(contents);
      return;
    }
    cur = child;
  }
}

static bool Related(const DataPath& a, const DataPath& b) {
  return a.IsPrefixOf(b) || b.IsPrefixOf(a);
}

}  // namespace

DataModel::DataModel() : state_(std::make_shared<State>()) {}

DataModel::~DataModel() {
  Dispose();
}

bool DataModel::Update(const DataPath& path, nlohmann::json contents, std::string* err) {
  if (state_->disposed) {
    if (err) *err = "data model disposed";
    return false;
  }
  if (LogEnabled()) {
    std::cout << "[data-model] update path=" << path.ToString() << " contents=" << JsonForLog(contents) << "\n";
  }
  if (path.IsRoot()) {
    state_->root = std::move(contents);
  } else {
    if (!ValidateWrite(state_->root, path, err)) return false;
    ApplyWrite(&state_->root, path, std::move(contents));
  }

  std::vector<uint64_t> ids;
  for (const auto& o : state_->observers) {
    if (Related(o.path, path)) ids.push_back(o.id);
  }
  // Keep the state alive even if a listener drops the last model reference.
  auto state = state_;
  for (auto id : ids) {
    if (state->disposed) break;
    auto* o = state->FindObserver(id);
    if (!o) continue;
    nlohmann::json value;
    std::string read_err;
    if (!ReadAt(state->root, o->path, &value, &read_err)) {
      o->has_last = false;
      auto on_error = o->observer.on_error;
      if (on_error) on_error(read_err);
      continue;
    }
    if (o->has_last && o->last == value) continue;
    o->has_last = true;
    o->last = value;
    auto on_value = o->observer.on_value;
    if (on_value) on_value(value);
  }
  return true;
}

std::optional<nlohmann::json> DataModel::Get(const DataPath& path, std::string* err) const {
  if (state_->disposed) {
    if (err) *err = "data model disposed";
    return std::nullopt;
  }
  nlohmann::json value;
  if (!ReadAt(state_->root, path, &value, err)) return std::nullopt;
  return value;
}

ValueStream DataModel::Watch(const DataPath& path) const {
  std::weak_ptr<State> weak = state_;
  return ValueStream([weak, path](const StreamObserver& observer) {
    auto state = weak.lock();
    if (!state || state->disposed) {
      if (observer.on_error) observer.on_error("data model disposed");
      return Subscription();
    }
    const uint64_t id = state->next_id++;
    State::Observer o;
    o.id = id;
    o.path = path;
    o.observer = observer;
    state->observers.push_back(std::move(o));

    Subscription sub([weak, id]() {
      auto s = weak.lock();
      if (!s) return;
      auto& obs = s->observers;
      for (auto it = obs.begin(); it != obs.end(); ++it) {
        if (it->id == id) {
          obs.erase(it);
          break;
        }
      }
    });

    nlohmann::json value;
    std::string err;
    if (!ReadAt(state->root, path, &value, &err)) {
      if (observer.on_error) observer.on_error(err);
      return sub;
    }
    if (auto* registered = state->FindObserver(id)) {
      registered->has_last = true;
      registered->last = value;
    }
    if (observer.on_value) observer.on_value(value);
    return sub;
  });
}

void DataModel::Dispose() {
  if (state_->disposed) return;
  state_->disposed = true;
  state_->observers.clear();
}

bool DataModel::Disposed() const {
  return state_->disposed;
}

size_t DataModel::ObserverCount() const {
  return state_->observers.size();
}

}  // namespace genui
