#pragma once
#include "poll.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace wselect {

// Асинхронный источник элементов. poll() никогда не блокирует:
// NotReady означает, что источник сам позаботился о будущем пробуждении.
template <class T, class E> class Source {
public:
  using item_type = T;
  using error_type = E;

  virtual ~Source() = default;
  virtual Poll<T, E> poll() = 0;
};

template <class T, class E> using SourcePtr = std::unique_ptr<Source<T, E>>;

// Всегда готовый источник поверх вектора.
template <class T, class E> class VectorSource final : public Source<T, E> {
public:
  explicit VectorSource(std::vector<T> items) : items_(std::move(items)) {}

  Poll<T, E> poll() override {
    if (pos_ >= items_.size())
      return Completed{};
    return Item<T>{std::move(items_[pos_++])};
  }

  size_t remaining() const { return items_.size() - pos_; }

private:
  std::vector<T> items_;
  size_t pos_ = 0;
};

template <class T, class E> class FnSource final : public Source<T, E> {
public:
  explicit FnSource(std::function<Poll<T, E>()> fn) : fn_(std::move(fn)) {}

  Poll<T, E> poll() override { return fn_(); }

private:
  std::function<Poll<T, E>()> fn_;
};

template <class E, class T> SourcePtr<T, E> from_vector(std::vector<T> items) {
  return std::make_unique<VectorSource<T, E>>(std::move(items));
}

template <class T, class E, class Fn> SourcePtr<T, E> from_fn(Fn &&fn) {
  return std::make_unique<FnSource<T, E>>(
      std::function<Poll<T, E>()>(std::forward<Fn>(fn)));
}

} // namespace wselect
