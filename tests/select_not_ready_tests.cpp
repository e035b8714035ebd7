#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "helpers.hpp"

#include <wselect/drain.hpp>
#include <wselect/select.hpp>

#include <map>
#include <vector>

using namespace wselect;

static SourcePtr<int, Err> items(std::vector<int> v) {
  return from_vector<Err>(std::move(v));
}

TEST_CASE("all sources with breaks") {
  auto sel = make_builder<int, Err>()
                 .append(with_breaks(items({1, 1})), 1)
                 .append(with_breaks(items({2, 2, 2})), 3)
                 .append(with_breaks(items({3, 3, 3, 3})), 1)
                 .finalize();

  auto d = drain(sel);
  REQUIRE_FALSE(d.failure.has_value());
  REQUIRE(d.items == std::vector<int>{1, 2, 3, 2, 1, 2, 3, 3, 3});
  REQUIRE(d.not_ready > 0);
}

TEST_CASE("only the middle source has breaks") {
  auto sel = make_builder<int, Err>()
                 .append(items({1, 1}), 1)
                 .append(with_breaks(items({2, 2, 2})), 3)
                 .append(items({3, 3, 3, 3}), 1)
                 .finalize();

  auto d = drain(sel);
  REQUIRE(d.items == std::vector<int>{1, 2, 3, 1, 2, 3, 2, 3, 3});
}

TEST_CASE("stalled leader does not stall the combined source") {
  // первый источник никогда не готов, второй выдаёт всё подряд
  int stalled_polls = 0;
  auto sel = make_builder<int, Err>()
                 .append(from_fn<int, Err>([&]() -> Poll<int, Err> {
                           ++stalled_polls;
                           return NotReady{};
                         }),
                         5)
                 .append(items({7, 8, 9}), 1)
                 .finalize();

  std::vector<int> got;
  for (int i = 0; i < 3; ++i) {
    auto r = sel.poll();
    REQUIRE(is_item(r));
    got.push_back(std::get<Item<int>>(r).value);
  }
  REQUIRE(got == std::vector<int>{7, 8, 9});
  REQUIRE(stalled_polls >= 3);

  // второй исчерпан, первый всё ещё ждёт: NotReady, не Completed
  REQUIRE(is_not_ready(sel.poll()));
  REQUIRE(is_not_ready(sel.poll()));
}

TEST_CASE("breaks keep per-source order and lose nothing") {
  std::vector<int> a{100, 101, 102, 103};
  std::vector<int> b{200, 201};
  std::vector<int> c{300, 301, 302, 303, 304};

  auto sel = make_builder<int, Err>()
                 .append(with_breaks(items(a)), 2)
                 .append(items(b), 1)
                 .append(with_breaks(with_breaks(items(c))), 3)
                 .finalize();

  auto d = drain(sel);
  REQUIRE_FALSE(d.failure.has_value());
  REQUIRE(d.items.size() == a.size() + b.size() + c.size());

  std::map<int, std::vector<int>> by_source;
  for (int v : d.items)
    by_source[v / 100].push_back(v);
  REQUIRE(by_source[1] == a);
  REQUIRE(by_source[2] == b);
  REQUIRE(by_source[3] == c);
}
