#pragma once
#include "source.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace wselect {

template <class T, class E> struct Drained {
  std::vector<T> items;
  std::optional<E> failure;
  size_t not_ready = 0; // сколько раз источник ответил NotReady
};

// Опрашивает источник до Completed, первой Failure или limit элементов.
// wait() вызывается после каждого NotReady и играет роль точки
// приостановки хост-рантайма.
template <class T, class E, class Wait>
Drained<T, E> drain(Source<T, E> &src, Wait &&wait,
                    size_t limit = std::numeric_limits<size_t>::max()) {
  Drained<T, E> out;
  while (out.items.size() < limit) {
    auto r = src.poll();
    if (auto *it = std::get_if<Item<T>>(&r)) {
      out.items.push_back(std::move(it->value));
    } else if (auto *f = std::get_if<Failure<E>>(&r)) {
      out.failure = std::move(f->error);
      break;
    } else if (is_completed(r)) {
      break;
    } else {
      ++out.not_ready;
      wait();
    }
  }
  return out;
}

// Источники, которые сами перевзводят пробуждение, можно опрашивать сразу.
template <class T, class E> Drained<T, E> drain(Source<T, E> &src) {
  return drain(src, [] {});
}

} // namespace wselect
