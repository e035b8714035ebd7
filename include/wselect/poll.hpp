#pragma once
#include <cstdint>
#include <ostream>
#include <variant>

namespace wselect {

// Результат одного неблокирующего опроса источника.
template <class T> struct Item {
  T value;
  bool operator==(const Item &) const = default;
};

struct NotReady {
  bool operator==(const NotReady &) const = default;
};

struct Completed {
  bool operator==(const Completed &) const = default;
};

template <class E> struct Failure {
  E error;
  bool operator==(const Failure &) const = default;
};

// Порядок альтернатив совпадает с PollKind
template <class T, class E>
using Poll = std::variant<Item<T>, NotReady, Completed, Failure<E>>;

enum class PollKind : uint8_t { Item, NotReady, Completed, Failure };

const char *to_string(PollKind k);
std::ostream &operator<<(std::ostream &os, PollKind k);

template <class T, class E> PollKind kind_of(const Poll<T, E> &p) {
  return static_cast<PollKind>(p.index());
}

template <class T, class E> bool is_item(const Poll<T, E> &p) {
  return std::holds_alternative<Item<T>>(p);
}
template <class T, class E> bool is_not_ready(const Poll<T, E> &p) {
  return std::holds_alternative<NotReady>(p);
}
template <class T, class E> bool is_completed(const Poll<T, E> &p) {
  return std::holds_alternative<Completed>(p);
}
template <class T, class E> bool is_failure(const Poll<T, E> &p) {
  return std::holds_alternative<Failure<E>>(p);
}

} // namespace wselect
