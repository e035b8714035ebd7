#include <wselect/poll.hpp>

namespace wselect {

const char *to_string(PollKind k) {
  switch (k) {
  case PollKind::Item:
    return "item";
  case PollKind::NotReady:
    return "not-ready";
  case PollKind::Completed:
    return "completed";
  case PollKind::Failure:
    return "failure";
  }
  return "?";
}

std::ostream &operator<<(std::ostream &os, PollKind k) {
  return os << to_string(k);
}

} // namespace wselect
