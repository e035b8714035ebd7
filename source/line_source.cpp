#include <wselect/line_source.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace wselect {

std::string IoError::message() const {
  return fmt::format("{}: {}", path, std::strerror(code));
}

LineSource::LineSource(int fd, std::string name, Reactor *reactor,
                       bool owns_fd)
    : fd_(fd), name_(std::move(name)), reactor_(reactor), owns_fd_(owns_fd) {
  int fl = ::fcntl(fd_, F_GETFL);
  if (fl >= 0 && !(fl & O_NONBLOCK)) {
    if (::fcntl(fd_, F_SETFL, fl | O_NONBLOCK) == 0)
      saved_flags_ = fl;
  }
}

LineSource::~LineSource() {
  if (owns_fd_) {
    ::close(fd_);
  } else if (saved_flags_ >= 0) {
    // чужой дескриптор (stdin): вернуть исходный режим
    (void)::fcntl(fd_, F_SETFL, saved_flags_);
  }
}

std::unique_ptr<LineSource> LineSource::open(const std::string &path,
                                             Reactor *reactor) {
  if (path == "-")
    return std::make_unique<LineSource>(STDIN_FILENO, "-", reactor, false);

  int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0)
    throw std::runtime_error(
        fmt::format("open: {}: {}", path, std::strerror(errno)));
  spdlog::debug("opened {} (fd {})", path, fd);
  return std::make_unique<LineSource>(fd, path, reactor, true);
}

Poll<std::string, IoError> LineSource::poll() {
  char chunk[4096];
  for (;;) {
    auto nl = buf_.find('\n');
    if (nl != std::string::npos) {
      std::string line = buf_.substr(0, nl);
      buf_.erase(0, nl + 1);
      return Item<std::string>{std::move(line)};
    }
    if (eof_) {
      if (buf_.empty())
        return Completed{};
      // хвост без завершающего \n
      std::string line;
      line.swap(buf_);
      return Item<std::string>{std::move(line)};
    }

    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buf_.append(chunk, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      eof_ = true;
      continue;
    }
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      if (reactor_)
        reactor_->want_read(fd_);
      return NotReady{};
    }
    return Failure<IoError>{IoError{errno, name_}};
  }
}

} // namespace wselect
