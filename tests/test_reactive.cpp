#include <gtest/gtest.h>
#include "reactive.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace genui;

namespace {

// A hot source driven by the test: Push() forwards to every live listener.
class TestSource {
 public:
  ValueStream Stream() {
    return ValueStream([this](const StreamObserver& observer) {
      const int id = next_id_++;
      observers_.push_back({id, observer});
      return Subscription([this, id]() {
        for (auto it = observers_.begin(); it != observers_.end(); ++it) {
          if (it->first == id) {
            observers_.erase(it);
            break;
          }
        }
      });
    });
  }

  void Push(const nlohmann::json& v) {
    auto snapshot = observers_;
    for (auto& o : snapshot) {
      if (o.second.on_value) o.second.on_value(v);
    }
  }

  size_t Listeners() const { return observers_.size(); }

 private:
  int next_id_ = 0;
  std::vector<std::pair<int, StreamObserver>> observers_;
};

}  // namespace

TEST(SubscriptionTest, CancelRunsOnceAndOnDestruction) {
  int cancels = 0;
  {
    Subscription s([&]() { cancels++; });
    EXPECT_TRUE(s.Active());
    s.Cancel();
    s.Cancel();
    EXPECT_FALSE(s.Active());
  }
  EXPECT_EQ(cancels, 1);
  {
    Subscription s([&]() { cancels++; });
    Subscription moved = std::move(s);
  }
  EXPECT_EQ(cancels, 2);
}

TEST(ValueStreamTest, OfAndErrorDeliverImmediately) {
  nlohmann::json got;
  std::string err;
  auto s1 = ValueStream::Of(42).Listen([&](const nlohmann::json& v) { got = v; });
  auto s2 = ValueStream::Error("boom").Listen([](const nlohmann::json&) {}, [&](const std::string& e) { err = e; });
  EXPECT_EQ(got, 42);
  EXPECT_EQ(err, "boom");
}

TEST(ValueStreamTest, CombineLatestWaitsForEveryInput) {
  TestSource a;
  TestSource b;
  std::vector<nlohmann::json> seen;
  auto sub = ValueStream::CombineLatest({a.Stream(), b.Stream()}).Listen([&](const nlohmann::json& v) {
    seen.push_back(v);
  });
  a.Push(1);
  EXPECT_TRUE(seen.empty());
  b.Push("x");
  a.Push(2);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], nlohmann::json::parse(R"([1, "x"])"));
  EXPECT_EQ(seen[1], nlohmann::json::parse(R"([2, "x"])"));

  sub.Cancel();
  EXPECT_EQ(a.Listeners(), 0u);
  EXPECT_EQ(b.Listeners(), 0u);
}

TEST(ValueStreamTest, CombineLatestOfNothingEmitsEmptyArray) {
  nlohmann::json got;
  auto sub = ValueStream::CombineLatest({}).Listen([&](const nlohmann::json& v) { got = v; });
  EXPECT_EQ(got, nlohmann::json::array());
}

TEST(ValueStreamTest, MapErrorsBecomeStreamErrors) {
  std::string err;
  auto sub = ValueStream::Of(1)
                 .Map([](const nlohmann::json&) -> nlohmann::json { throw std::runtime_error("bad map"); })
                 .Listen([](const nlohmann::json&) {}, [&](const std::string& e) { err = e; });
  EXPECT_EQ(err, "bad map");
}

TEST(ValueStreamTest, SwitchMapCancelsPreviousInnerStream) {
  TestSource outer;
  TestSource inner_a;
  TestSource inner_b;
  std::vector<nlohmann::json> seen;
  auto sub = outer.Stream()
                 .SwitchMap([&](const nlohmann::json& v) { return v == "a" ? inner_a.Stream() : inner_b.Stream(); })
                 .Listen([&](const nlohmann::json& v) { seen.push_back(v); });

  outer.Push("a");
  inner_a.Push(1);
  outer.Push("b");
  EXPECT_EQ(inner_a.Listeners(), 0u);
  inner_a.Push(2);
  inner_b.Push(3);
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], 1);
  EXPECT_EQ(seen[1], 3);

  sub.Cancel();
  EXPECT_EQ(outer.Listeners(), 0u);
  EXPECT_EQ(inner_b.Listeners(), 0u);
}

TEST(BroadcastTest, LateSubscribersOnlySeeLaterEvents) {
  Broadcast<int> channel;
  std::vector<int> first;
  std::vector<int> second;
  auto s1 = channel.Subscribe([&](const int& v) { first.push_back(v); });
  EXPECT_TRUE(channel.Emit(1));
  auto s2 = channel.Subscribe([&](const int& v) { second.push_back(v); });
  EXPECT_TRUE(channel.Emit(2));
  EXPECT_EQ(first, (std::vector<int>{1, 2}));
  EXPECT_EQ(second, (std::vector<int>{2}));
}

TEST(BroadcastTest, CloseNotifiesAndRejectsFurtherUse) {
  Broadcast<int> channel;
  int done = 0;
  auto s1 = channel.Subscribe([](const int&) {}, [&]() { done++; });
  channel.Close();
  channel.Close();
  EXPECT_EQ(done, 1);
  EXPECT_TRUE(channel.Closed());
  EXPECT_FALSE(channel.Emit(3));

  auto s2 = channel.Subscribe([](const int&) {}, [&]() { done++; });
  EXPECT_EQ(done, 2);
  EXPECT_FALSE(s2.Active());
}

TEST(BroadcastTest, ListenerCancelledDuringEmitIsSkipped) {
  Broadcast<int> channel;
  int second_calls = 0;
  Subscription s2;
  auto s1 = channel.Subscribe([&](const int&) { s2.Cancel(); });
  s2 = channel.Subscribe([&](const int&) { second_calls++; });
  channel.Emit(1);
  EXPECT_EQ(second_calls, 0);
  EXPECT_EQ(channel.ListenerCount(), 1u);
}
