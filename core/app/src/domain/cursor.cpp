#include "pulse/domain/cursor.hpp"

namespace pulse {
namespace domain {

namespace {

std::string stripLeadingZeros(const std::string& digits) {
  const auto first = digits.find_first_not_of('0');
  if (first == std::string::npos) {
    return "0";
  }
  return digits.substr(first);
}

}  // namespace

bool Cursor::isInitial() const {
  return compareTimetokens(timetoken, "0") == 0;
}

// -----------------------------------------------------------------------------
// compareTimetokens()
// -----------------------------------------------------------------------------
// Both inputs are unsigned decimal strings, so after dropping leading zeros a
// longer string is always the larger number and equal lengths compare
// lexicographically.
// -----------------------------------------------------------------------------
int compareTimetokens(const std::string& lhs, const std::string& rhs) {
  const std::string a = stripLeadingZeros(lhs);
  const std::string b = stripLeadingZeros(rhs);

  if (a.size() != b.size()) {
    return a.size() < b.size() ? -1 : 1;
  }
  return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

bool isBehind(const Cursor& candidate, const Cursor& current) {
  return compareTimetokens(candidate.timetoken, current.timetoken) < 0;
}

bool operator==(const Cursor& lhs, const Cursor& rhs) {
  return compareTimetokens(lhs.timetoken, rhs.timetoken) == 0 &&
         lhs.region == rhs.region;
}

bool operator!=(const Cursor& lhs, const Cursor& rhs) { return !(lhs == rhs); }

std::string toString(const Cursor& cursor) {
  return "{" + cursor.timetoken + ", " + std::to_string(cursor.region) + "}";
}

}  // namespace domain
}  // namespace pulse
