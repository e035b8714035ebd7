#pragma once
#include "fuse.hpp"
#include "source.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wselect {

template <class T, class E> class Builder;

// Один зарегистрированный источник и его окно [start_at, prev_start_at)
// внутри круга длиной cycle_length.
template <class T, class E> struct Segment {
  Fuse<T, E> source;
  uint32_t weight;
  uint64_t start_at;
  uint64_t prev_start_at;
};

struct SegmentInfo {
  uint32_t weight = 0;
  uint64_t start_at = 0;
  uint64_t prev_start_at = 0;
  bool done = false;
};

// Объединённый источник. Сегменты хранятся в порядке добавления:
// индекс 0 - наивысший приоритет внутри круга.
template <class T, class E> class Select final : public Source<T, E> {
public:
  Select(Select &&) noexcept = default;
  Select &operator=(Select &&) noexcept = default;
  Select(const Select &) = delete;
  Select &operator=(const Select &) = delete;

  Poll<T, E> poll() override {
    auto step = walk(cursor_);
    // начать круг заново с наивысшего приоритета, если середина круга пуста
    if (cursor_ > 0 && (is_not_ready(step.second) || is_completed(step.second)))
      step = walk(0);

    cursor_ = step.first % cycle_;

    if (is_completed(step.second) && !finished_) {
      finished_ = true;
      spdlog::debug("select: all {} source(s) exhausted", segments_.size());
    }
    return std::move(step.second);
  }

  uint64_t cursor() const { return cursor_; }
  uint64_t cycle_length() const { return cycle_; }
  size_t size() const { return segments_.size(); }

  std::vector<SegmentInfo> layout() const {
    std::vector<SegmentInfo> out;
    out.reserve(segments_.size());
    for (const auto &s : segments_)
      out.push_back({s.weight, s.start_at, s.prev_start_at, s.source.is_done()});
    return out;
  }

  std::string describe() const {
    std::string out = fmt::format("Select{{cursor={}, cycle={}, segments=[",
                                  cursor_, cycle_);
    for (size_t i = 0; i < segments_.size(); ++i) {
      const auto &s = segments_[i];
      out += fmt::format("{}#{} w={} [{}, {}){}", i ? ", " : "", i, s.weight,
                         s.start_at, s.prev_start_at,
                         s.source.is_done() ? " done" : "");
    }
    out += "]}";
    return out;
  }

private:
  friend class Builder<T, E>;

  Select(std::vector<Segment<T, E>> segments, uint64_t cycle)
      : segments_(std::move(segments)), cycle_(cycle) {}

  // Один проход по цепочке. Спускаемся к сегменту с наименьшим приоритетом,
  // чьё окно уже началось, и идём обратно к последнему добавленному,
  // протаскивая (cursor, lower_done). Возвращает (новый счётчик, результат).
  std::pair<uint64_t, Poll<T, E>> walk(uint64_t cursor) {
    if (segments_.empty())
      return {0, Completed{}};

    size_t i = segments_.size() - 1;
    while (cursor < segments_[i].start_at)
      --i; // start_at первого сегмента всегда 0

    // cursor == 0 на границе означает, что круг пройден целиком
    bool lower_done = cursor == 0;

    for (; i < segments_.size(); ++i) {
      auto &s = segments_[i];
      auto r = s.source.poll();
      if (is_item(r) || is_failure(r))
        return {cursor + 1, std::move(r)};

      lower_done = lower_done && is_completed(r);
      cursor = s.prev_start_at;
    }

    if (lower_done)
      return {cursor, Completed{}};
    return {cursor, NotReady{}};
  }

  std::vector<Segment<T, E>> segments_;
  uint64_t cursor_ = 0;
  uint64_t cycle_ = 1;
  bool finished_ = false;
};

// Построитель цепочки. append/finalize потребляют построитель:
//   auto sel = make_builder<int, Err>()
//                  .append(from_vector<Err>(a), 1)
//                  .append(from_vector<Err>(b), 3)
//                  .finalize();
template <class T, class E> class Builder {
public:
  Builder() = default;
  Builder(Builder &&) noexcept = default;
  Builder &operator=(Builder &&) noexcept = default;
  Builder(const Builder &) = delete;
  Builder &operator=(const Builder &) = delete;

  [[nodiscard]] Builder append(SourcePtr<T, E> source, uint32_t weight) && {
    if (weight == 0) {
      spdlog::critical("select: append with zero weight (segment #{})",
                       segments_.size());
      throw std::invalid_argument("wselect: segment weight must be >= 1");
    }
    if (!source) {
      spdlog::critical("select: append of null source (segment #{})",
                       segments_.size());
      throw std::invalid_argument("wselect: source must not be null");
    }

    const uint64_t start_at = total_;
    total_ = start_at + weight;
    segments_.push_back(
        Segment<T, E>{Fuse<T, E>(std::move(source)), weight, start_at, total_});
    return std::move(*this);
  }

  [[nodiscard]] Select<T, E> finalize() && {
    // пустая цепочка: длина круга 1, чтобы не делить по модулю 0
    const uint64_t cycle = segments_.empty() ? 1 : total_;
    spdlog::debug("select: finalized {} segment(s), cycle length {}",
                  segments_.size(), cycle);
    return Select<T, E>(std::move(segments_), cycle);
  }

  size_t size() const { return segments_.size(); }
  uint64_t total_weight() const { return total_; }

private:
  std::vector<Segment<T, E>> segments_;
  uint64_t total_ = 0;
};

template <class T, class E> Builder<T, E> make_builder() { return {}; }

} // namespace wselect
