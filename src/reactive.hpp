#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace genui {

// Move-only cancel handle. Cancels on destruction.
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> cancel);
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  void Cancel();
  bool Active() const { return static_cast<bool>(cancel_); }

 private:
  std::function<void()> cancel_;
};

struct StreamObserver {
  std::function<void(const nlohmann::json& value)> on_value;
  std::function<void(const std::string& error)> on_error;
};

// Cold: every Listen() starts its own run of the producer.
class ValueStream {
 public:
  using Producer = std::function<Subscription(const StreamObserver& observer)>;

  ValueStream() = default;
  explicit ValueStream(Producer producer);

  static ValueStream Of(nlohmann::json value);
  static ValueStream Error(std::string error);

  // Emits a JSON array of the latest value of every input once each
  // input has produced at least one value, and again on every later emission.
  static ValueStream CombineLatest(std::vector<ValueStream> streams);

  Subscription Listen(StreamObserver observer) const;
  Subscription Listen(std::function<void(const nlohmann::json&)> on_value,
                      std::function<void(const std::string&)> on_error = nullptr) const;

  ValueStream Map(std::function<nlohmann::json(const nlohmann::json&)> fn) const;

  // For every source value, cancels the stream produced for the
  // previous value and listens to fn(value) instead.
  ValueStream SwitchMap(std::function<ValueStream(const nlohmann::json&)> fn) const;

  bool Valid() const { return static_cast<bool>(producer_); }

 private:
  Producer producer_;
};

// Multicast, unbuffered, closable event channel. Listeners only see events
// emitted after they subscribed.
template <typename T>
class Broadcast {
 public:
  using Listener = std::function<void(const T&)>;
  using DoneListener = std::function<void()>;

  Broadcast() : state_(std::make_shared<State>()) {}
  ~Broadcast() { Close(); }

  Broadcast(const Broadcast&) = delete;
  Broadcast& operator=(const Broadcast&) = delete;

  Subscription Subscribe(Listener on_event, DoneListener on_done = nullptr) {
    uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (!state_->closed) {
        id = state_->next_id++;
        state_->listeners.push_back({id, std::move(on_event), std::move(on_done)});
      }
    }
    if (id == 0) {
      if (on_done) on_done();
      return Subscription();
    }
    std::weak_ptr<State> weak = state_;
    return Subscription([weak, id]() {
      auto state = weak.lock();
      if (!state) return;
      std::lock_guard<std::mutex> lock(state->mu);
      auto& ls = state->listeners;
      ls.erase(std::remove_if(ls.begin(), ls.end(), [id](const Entry& e) { return e.id == id; }), ls.end());
    });
  }

  bool Emit(const T& event) {
    std::vector<Entry> snapshot;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (state_->closed) return false;
      snapshot = state_->listeners;
    }
    for (const auto& entry : snapshot) {
      if (!IsListening(entry.id)) continue;
      if (entry.on_event) entry.on_event(event);
    }
    return true;
  }

  void Close() {
    std::vector<Entry> snapshot;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      if (state_->closed) return;
      state_->closed = true;
      snapshot.swap(state_->listeners);
    }
    for (const auto& entry : snapshot) {
      if (entry.on_done) entry.on_done();
    }
  }

  bool Closed() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->closed;
  }

  size_t ListenerCount() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->listeners.size();
  }

 private:
  struct Entry {
    uint64_t id = 0;
    Listener on_event;
    DoneListener on_done;
  };

  struct State {
    mutable std::mutex mu;
    std::vector<Entry> listeners;
    uint64_t next_id = 1;
    bool closed = false;
  };

  bool IsListening(uint64_t id) const {
    std::lock_guard<std::mutex> lock(state_->mu);
    for (const auto& e : state_->listeners) {
      if (e.id == id) return true;
    }
    return false;
  }

  std::shared_ptr<State> state_;
};

}  // namespace genui
