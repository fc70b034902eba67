#include "reactive.hpp"

#include <exception>
#include <utility>

namespace genui {

Subscription::Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

Subscription::~Subscription() {
  Cancel();
}

Subscription::Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
  other.cancel_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this == &other) return *this;
  Cancel();
  cancel_ = std::move(other.cancel_);
  other.cancel_ = nullptr;
  return *this;
}

void Subscription::Cancel() {
  if (!cancel_) return;
  auto cancel = std::move(cancel_);
  cancel_ = nullptr;
  cancel();
}

ValueStream::ValueStream(Producer producer) : producer_(std::move(producer)) {}

ValueStream ValueStream::Of(nlohmann::json value) {
  return ValueStream([value = std::move(value)](const StreamObserver& observer) {
    if (observer.on_value) observer.on_value(value);
    return Subscription();
  });
}

ValueStream ValueStream::Error(std::string error) {
  return ValueStream([error = std::move(error)](const StreamObserver& observer) {
    if (observer.on_error) observer.on_error(error);
    return Subscription();
  });
}

Subscription ValueStream::Listen(StreamObserver observer) const {
  if (!producer_) {
    if (observer.on_error) observer.on_error("stream has no producer");
    return Subscription();
  }
  return producer_(observer);
}

Subscription ValueStream::Listen(std::function<void(const nlohmann::json&)> on_value,
                                 std::function<void(const std::string&)> on_error) const {
  StreamObserver observer;
  observer.on_value = std::move(on_value);
  observer.on_error = std::move(on_error);
  return Listen(std::move(observer));
}

namespace {

struct CombineState {
  std::vector<nlohmann::json> latest;
  std::vector<bool> has_value;
  size_t ready = 0;
  std::vector<Subscription> subs;
  bool cancelled = false;
  StreamObserver observer;
};

struct SwitchState {
  Subscription outer;
  Subscription inner;
  uint64_t generation = 0;
  bool cancelled = false;
  StreamObserver observer;
};

}  // namespace

ValueStream ValueStream::CombineLatest(std::vector<ValueStream> streams) {
  return ValueStream([streams = std::move(streams)](const StreamObserver& observer) {
    if (streams.empty()) {
      if (observer.on_value) observer.on_value(nlohmann::json::array());
      return Subscription();
    }
    auto state = std::make_shared<CombineState>();
    state->latest.resize(streams.size());
    state->has_value.assign(streams.size(), false);
    state->observer = observer;
    std::weak_ptr<CombineState> weak = state;

    for (size_t i = 0; i < streams.size(); i++) {
      auto sub = streams[i].Listen(
          [weak, i](const nlohmann::json& v) {
            auto s = weak.lock();
            if (!s || s->cancelled) return;
            s->latest[i] = v;
            if (!s->has_value[i]) {
              s->has_value[i] = true;
              s->ready++;
            }
            if (s->ready < s->latest.size()) return;
            nlohmann::json combined = nlohmann::json::array();
            for (const auto& item : s->latest) combined.push_back(item);
            if (s->observer.on_value) s->observer.on_value(combined);
          },
          [weak](const std::string& err) {
            auto s = weak.lock();
            if (!s || s->cancelled) return;
            if (s->observer.on_error) s->observer.on_error(err);
          });
      state->subs.push_back(std::move(sub));
    }

    return Subscription([state]() {
      state->cancelled = true;
      auto subs = std::move(state->subs);
      state->subs.clear();
      for (auto& s : subs) s.Cancel();
    });
  });
}

ValueStream ValueStream::Map(std::function<nlohmann::json(const nlohmann::json&)> fn) const {
  ValueStream source = *this;
  return ValueStream([source, fn](const StreamObserver& observer) {
    return source.Listen(
        [observer, fn](const nlohmann::json& v) {
          nlohmann::json mapped;
          try {
            mapped = fn(v);
          } catch (const std::exception& e) {
            if (observer.on_error) observer.on_error(e.what());
            return;
          }
          if (observer.on_value) observer.on_value(mapped);
        },
        observer.on_error);
  });
}

ValueStream ValueStream::SwitchMap(std::function<ValueStream(const nlohmann::json&)> fn) const {
  ValueStream source = *this;
  return ValueStream([source, fn](const StreamObserver& observer) {
    auto state = std::make_shared<SwitchState>();
    state->observer = observer;
    std::weak_ptr<SwitchState> weak = state;

    auto outer = source.Listen(
        [weak, fn](const nlohmann::json& v) {
          auto s = weak.lock();
          if (!s || s->cancelled) return;
          s->inner.Cancel();
          const uint64_t gen = ++s->generation;
          ValueStream next = fn(v);
          auto sub = next.Listen(
              [weak, gen](const nlohmann::json& x) {
                auto st = weak.lock();
                if (!st || st->cancelled || st->generation != gen) return;
                if (st->observer.on_value) st->observer.on_value(x);
              },
              [weak, gen](const std::string& err) {
                auto st = weak.lock();
                if (!st || st->cancelled || st->generation != gen) return;
                if (st->observer.on_error) st->observer.on_error(err);
              });
          // A newer value may have arrived while `next` emitted synchronously.
          if (s->cancelled || s->generation != gen) {
            sub.Cancel();
            return;
          }
          s->inner = std::move(sub);
        },
        [weak](const std::string& err) {
          auto s = weak.lock();
          if (!s || s->cancelled) return;
          if (s->observer.on_error) s->observer.on_error(err);
        });
    state->outer = std::move(outer);

    return Subscription([state]() {
      state->cancelled = true;
      auto inner = std::move(state->inner);
      auto outer_sub = std::move(state->outer);
      inner.Cancel();
      outer_sub.Cancel();
    });
  });
}

}  // namespace genui
