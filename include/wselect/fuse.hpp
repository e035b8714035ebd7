#pragma once
#include "source.hpp"

#include <memory>
#include <utility>

namespace wselect {

// Адаптер "fuse": после Completed или Failure внутренний источник
// уничтожается и больше никогда не опрашивается, все последующие
// вызовы poll() сразу возвращают Completed.
template <class T, class E> class Fuse final : public Source<T, E> {
public:
  explicit Fuse(SourcePtr<T, E> inner) : inner_(std::move(inner)) {}

  Fuse(Fuse &&) noexcept = default;
  Fuse &operator=(Fuse &&) noexcept = default;
  Fuse(const Fuse &) = delete;
  Fuse &operator=(const Fuse &) = delete;

  Poll<T, E> poll() override {
    if (!inner_)
      return Completed{};
    auto r = inner_->poll();
    if (is_completed(r) || is_failure(r))
      inner_.reset();
    return r;
  }

  bool is_done() const { return !inner_; }

private:
  SourcePtr<T, E> inner_;
};

} // namespace wselect
