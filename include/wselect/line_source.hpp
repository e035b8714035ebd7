#pragma once
#include "reactor.hpp"
#include "source.hpp"

#include <memory>
#include <string>

namespace wselect {

struct IoError {
  int code = 0;
  std::string path;

  std::string message() const;
  bool operator==(const IoError &) const = default;
};

// Построчное чтение дескриптора в неблокирующем режиме.
class LineSource final : public Source<std::string, IoError> {
public:
  LineSource(int fd, std::string name, Reactor *reactor, bool owns_fd);
  ~LineSource() override;

  LineSource(const LineSource &) = delete;
  LineSource &operator=(const LineSource &) = delete;

  // "-" - стандартный ввод. Бросает std::runtime_error, если файл не открыть.
  static std::unique_ptr<LineSource> open(const std::string &path,
                                          Reactor *reactor);

  Poll<std::string, IoError> poll() override;

  int fd() const { return fd_; }
  const std::string &name() const { return name_; }

private:
  int fd_;
  std::string name_;
  Reactor *reactor_;
  bool owns_fd_;
  int saved_flags_ = -1;
  std::string buf_;
  bool eof_ = false;
};

} // namespace wselect
