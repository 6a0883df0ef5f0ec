// =============================================================================
// action_type_test.cpp
// =============================================================================
// Unit tests for vclock::domain::ActionType name mapping.
// =============================================================================

#include "vclock/domain/action_type.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using vclock::domain::ActionType;

// -----------------------------------------------------------------------------
// 1. Wire names of the common actions.
// -----------------------------------------------------------------------------
TEST(ActionTypeTest, KnownNames) {
  EXPECT_STREQ(vclock::domain::actionTypeToString(ActionType::CreatePost),
               "create_post");
  EXPECT_STREQ(vclock::domain::actionTypeToString(ActionType::CreateComment),
               "create_comment");
  EXPECT_STREQ(vclock::domain::actionTypeToString(ActionType::DoNothing),
               "do_nothing");
  EXPECT_STREQ(vclock::domain::actionTypeToString(ActionType::ShareToGroup),
               "share_to_group");
}

// -----------------------------------------------------------------------------
// 2. Every enumerator has a distinct name that maps back to itself.
// -----------------------------------------------------------------------------
TEST(ActionTypeTest, NamesAreDistinctAndInvertible) {
  std::set<std::string> names;
  const int last = static_cast<int>(ActionType::ShareToGroup);
  for (int i = 0; i <= last; ++i) {
    const auto type = static_cast<ActionType>(i);
    const std::string name = vclock::domain::actionTypeToString(type);
    names.insert(name);

    const auto back = vclock::domain::actionTypeFromString(name);
    ASSERT_TRUE(back.has_value()) << name;
    EXPECT_EQ(*back, type) << name;
  }
  EXPECT_EQ(names.size(), static_cast<std::size_t>(last + 1));
}

// -----------------------------------------------------------------------------
// 3. Unknown names are rejected, case-sensitively.
// -----------------------------------------------------------------------------
TEST(ActionTypeTest, UnknownNamesRejected) {
  EXPECT_FALSE(vclock::domain::actionTypeFromString("").has_value());
  EXPECT_FALSE(vclock::domain::actionTypeFromString("teleport").has_value());
  EXPECT_FALSE(vclock::domain::actionTypeFromString("CREATE_POST").has_value());
}
