#pragma once
#include <wselect/source.hpp>

#include <string>
#include <utility>

// Через раз отвечает NotReady и сразу "будит" себя: повторный опрос
// без ожидания корректен.
template <class T, class E>
class WithBreaks final : public wselect::Source<T, E> {
public:
  explicit WithBreaks(wselect::SourcePtr<T, E> inner)
      : inner_(std::move(inner)) {}

  wselect::Poll<T, E> poll() override {
    flag_ = !flag_;
    if (flag_)
      return inner_->poll();
    return wselect::NotReady{};
  }

private:
  wselect::SourcePtr<T, E> inner_;
  bool flag_ = false;
};

template <class T, class E>
wselect::SourcePtr<T, E> with_breaks(wselect::SourcePtr<T, E> inner) {
  return std::make_unique<WithBreaks<T, E>>(std::move(inner));
}

using Err = std::string;
