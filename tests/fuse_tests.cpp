#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "helpers.hpp"

#include <wselect/fuse.hpp>

#include <memory>
#include <vector>

using namespace wselect;

namespace {

// Сценарий ответов + счётчик вызовов и флаг разрушения
class Scripted final : public Source<int, Err> {
public:
  Scripted(std::vector<Poll<int, Err>> script, int &calls, bool &destroyed)
      : script_(std::move(script)), calls_(calls), destroyed_(destroyed) {}
  ~Scripted() override { destroyed_ = true; }

  Poll<int, Err> poll() override {
    size_t i = static_cast<size_t>(calls_++);
    if (i < script_.size())
      return script_[i];
    return Item<int>{-1}; // опрос после конца сценария
  }

private:
  std::vector<Poll<int, Err>> script_;
  int &calls_;
  bool &destroyed_;
};

} // namespace

TEST_CASE("fuse forwards until completion and never polls again") {
  int calls = 0;
  bool destroyed = false;
  Fuse<int, Err> f(std::make_unique<Scripted>(
      std::vector<Poll<int, Err>>{Item<int>{1}, NotReady{}, Item<int>{2},
                                  Completed{}},
      calls, destroyed));

  REQUIRE(f.poll() == Poll<int, Err>{Item<int>{1}});
  REQUIRE(is_not_ready(f.poll()));
  REQUIRE(f.poll() == Poll<int, Err>{Item<int>{2}});
  REQUIRE_FALSE(f.is_done());
  REQUIRE(is_completed(f.poll()));
  REQUIRE(f.is_done());
  REQUIRE(destroyed);

  for (int i = 0; i < 3; ++i)
    REQUIRE(is_completed(f.poll()));
  REQUIRE(calls == 4);
}

TEST_CASE("fuse also closes after a failure") {
  int calls = 0;
  bool destroyed = false;
  Fuse<int, Err> f(std::make_unique<Scripted>(
      std::vector<Poll<int, Err>>{Failure<Err>{"boom"}}, calls, destroyed));

  auto r = f.poll();
  REQUIRE(is_failure(r));
  REQUIRE(std::get<Failure<Err>>(r).error == "boom");
  REQUIRE(f.is_done());
  REQUIRE(destroyed);

  REQUIRE(is_completed(f.poll()));
  REQUIRE(calls == 1);
}

TEST_CASE("fuse keeps the source alive while it is pending") {
  int calls = 0;
  bool destroyed = false;
  {
    Fuse<int, Err> f(std::make_unique<Scripted>(
        std::vector<Poll<int, Err>>{NotReady{}}, calls, destroyed));
    REQUIRE(is_not_ready(f.poll()));
    REQUIRE_FALSE(destroyed);
  }
  // разрушение адаптера разрушает источник
  REQUIRE(destroyed);
}
