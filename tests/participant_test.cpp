#include <coedit-cpp/participant.hpp>

#include <gtest/gtest.h>

using namespace coedit_cpp;

namespace {

auto alice() -> Participant {
    return Participant::join(UserId{"u1"}, UserName{"Alice"}, UserColor{"#FF6B6B"});
}

}  // namespace

TEST(Participant, join_is_active) {
    const auto p = alice();
    EXPECT_TRUE(p.is_active());
    EXPECT_EQ(p.user_id(), UserId{"u1"});
    EXPECT_EQ(p.user_name(), UserName{"Alice"});
    EXPECT_EQ(p.user_color(), UserColor{"#FF6B6B"});
}

TEST(Participant, deactivate_returns_inactive_copy) {
    const auto p = alice();
    const auto off = p.deactivate();
    EXPECT_FALSE(off.is_active());
    EXPECT_TRUE(p.is_active());
    EXPECT_EQ(off.user_id(), p.user_id());
}

TEST(Participant, deactivate_is_idempotent) {
    const auto once = alice().deactivate();
    EXPECT_EQ(once.deactivate(), once);
}

TEST(Participant, equality_covers_all_fields) {
    EXPECT_EQ(alice(), alice());
    EXPECT_NE(alice(), alice().deactivate());
    EXPECT_NE(alice(), Participant::join(UserId{"u1"}, UserName{"Al"}, UserColor{"#FF6B6B"}));
}
