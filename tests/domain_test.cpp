// =============================================================================
// domain_test.cpp
// =============================================================================
// Unit tests for the value types in pulse::domain: Cursor and ChannelSet.
//
// Validates:
//   - Timetoken comparison is numeric, not lexicographic
//   - Cursor equality and the "behind" check used by the receive loop
//   - ChannelSet keeps insertion order and rejects duplicates
//   - Set algebra (union, difference, intersection) used by the client
//   - Presence channel filtering before heartbeat and leave requests
// =============================================================================

#include "pulse/domain/channel_set.hpp"
#include "pulse/domain/cursor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using pulse::domain::ChannelSet;
using pulse::domain::Cursor;

// -----------------------------------------------------------------------------
// 1. Timetokens compare as 17-digit numbers.
// Why: A plain string compare would put "9" after "15000000000000000".
// -----------------------------------------------------------------------------
TEST(CursorTest, CompareTimetokensIsNumeric) {
  using pulse::domain::compareTimetokens;

  EXPECT_LT(compareTimetokens("9", "15000000000000000"), 0);
  EXPECT_GT(compareTimetokens("15000000000000001", "15000000000000000"), 0);
  EXPECT_EQ(compareTimetokens("0015", "15"), 0);
  EXPECT_EQ(compareTimetokens("0", "000"), 0);
}

// -----------------------------------------------------------------------------
// 2. The initial cursor is timetoken "0" at region 0.
// -----------------------------------------------------------------------------
TEST(CursorTest, InitialCursor) {
  const Cursor initial;
  EXPECT_TRUE(initial.isInitial());
  EXPECT_EQ(initial.region, 0);

  const Cursor later{"15000000000000000", 4};
  EXPECT_FALSE(later.isInitial());
  EXPECT_EQ(pulse::domain::toString(later), "{15000000000000000, 4}");
}

// -----------------------------------------------------------------------------
// 3. Equality looks at both timetoken and region.
// -----------------------------------------------------------------------------
TEST(CursorTest, EqualityIncludesRegion) {
  EXPECT_EQ((Cursor{"100", 1}), (Cursor{"100", 1}));
  EXPECT_NE((Cursor{"100", 1}), (Cursor{"100", 2}));
  EXPECT_NE((Cursor{"100", 1}), (Cursor{"101", 1}));
}

// -----------------------------------------------------------------------------
// 4. isBehind() is a strict timetoken comparison.
// Why: The receive loop keeps its current cursor when the server hands back
//      an older one; an equal cursor is not "behind".
// -----------------------------------------------------------------------------
TEST(CursorTest, IsBehind) {
  EXPECT_TRUE(pulse::domain::isBehind(Cursor{"99", 1}, Cursor{"100", 1}));
  EXPECT_FALSE(pulse::domain::isBehind(Cursor{"100", 3}, Cursor{"100", 1}));
  EXPECT_FALSE(pulse::domain::isBehind(Cursor{"101", 1}, Cursor{"100", 1}));
}

// -----------------------------------------------------------------------------
// 5. Insertion order is kept and duplicates are rejected.
// Why: Request URLs list names in insertion order; tests and servers alike
//      expect "a,b" for subscribe(a) then subscribe(b).
// -----------------------------------------------------------------------------
TEST(ChannelSetTest, KeepsInsertionOrderWithoutDuplicates) {
  ChannelSet set;
  EXPECT_TRUE(set.insert("b"));
  EXPECT_TRUE(set.insert("a"));
  EXPECT_FALSE(set.insert("b"));

  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(set.join(), "b,a");
  EXPECT_TRUE(set.contains("a"));
  EXPECT_FALSE(set.contains("c"));

  const ChannelSet from_list{"x", "y", "x"};
  EXPECT_EQ(from_list.size(), 2u);
}

// -----------------------------------------------------------------------------
// 6. erase() reports whether the name was present.
// -----------------------------------------------------------------------------
TEST(ChannelSetTest, Erase) {
  ChannelSet set{"a", "b", "c"};
  EXPECT_TRUE(set.erase("b"));
  EXPECT_FALSE(set.erase("b"));
  EXPECT_EQ(set.join(), "a,c");
  EXPECT_FALSE(set.contains("b"));
}

// -----------------------------------------------------------------------------
// 7. Set algebra keeps the left operand's order.
// -----------------------------------------------------------------------------
TEST(ChannelSetTest, SetAlgebra) {
  const ChannelSet left{"a", "b", "c"};
  const ChannelSet right{"c", "d", "a"};

  EXPECT_EQ(left.unionWith(right).join(), "a,b,c,d");
  EXPECT_EQ(left.difference(right).join(), "b");
  EXPECT_EQ(left.intersection(right).join(), "a,c");
  EXPECT_TRUE(left.difference(left).empty());
}

// -----------------------------------------------------------------------------
// 8. Presence channels are recognised by suffix and can be stripped.
// Why: Heartbeats and leaves must never name "-pnpres" channels.
// -----------------------------------------------------------------------------
TEST(ChannelSetTest, PresenceChannelFiltering) {
  EXPECT_TRUE(pulse::domain::isPresenceChannel("room-pnpres"));
  EXPECT_FALSE(pulse::domain::isPresenceChannel("room"));
  EXPECT_FALSE(pulse::domain::isPresenceChannel("-pnpresroom"));

  const ChannelSet set{"room", "room-pnpres", "lobby"};
  EXPECT_EQ(set.withoutPresenceChannels().join(), "room,lobby");
}

// -----------------------------------------------------------------------------
// 9. Equality depends on order as well as content.
// -----------------------------------------------------------------------------
TEST(ChannelSetTest, Equality) {
  EXPECT_EQ((ChannelSet{"a", "b"}), (ChannelSet{"a", "b"}));
  EXPECT_NE((ChannelSet{"a", "b"}), (ChannelSet{"b", "a"}));
  EXPECT_EQ(ChannelSet(std::vector<std::string>{"a"}), (ChannelSet{"a"}));
}
