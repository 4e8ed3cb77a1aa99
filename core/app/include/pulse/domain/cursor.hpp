#pragma once

#include <string>

namespace pulse {
namespace domain {

// -----------------------------------------------------------------------------
// Cursor: position in the server's update stream
// -----------------------------------------------------------------------------
//
// @brief  Timetoken plus region, as returned by every subscribe response.
//
// @details
// The timetoken is a 17-digit decimal string (100ns ticks since the Unix
// epoch). It is kept as a string because it does not fit a double and the
// server echoes it back verbatim; comparisons are numeric on the digits.
//
// Timetoken "0" means "no position yet": a handshake sent with tt=0 asks the
// server for the current head of the stream.
//
// Thread model:
//   Value type. Copied into engine contexts and statuses.
// -----------------------------------------------------------------------------
struct Cursor {
  std::string timetoken{"0"};
  int region{0};

  bool isInitial() const;
};

// Numeric comparison of two decimal timetoken strings.
// Returns <0, 0 or >0. Leading zeros are ignored.
int compareTimetokens(const std::string& lhs, const std::string& rhs);

// True when `candidate` is strictly behind `current` in the stream.
bool isBehind(const Cursor& candidate, const Cursor& current);

bool operator==(const Cursor& lhs, const Cursor& rhs);
bool operator!=(const Cursor& lhs, const Cursor& rhs);

std::string toString(const Cursor& cursor);

}  // namespace domain
}  // namespace pulse
