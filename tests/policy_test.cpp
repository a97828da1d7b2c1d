#include <coedit-cpp/policy.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace coedit_cpp;

namespace {

auto member(const std::string& id) -> Participant {
    return Participant::join(UserId{id}, UserName{"User " + id}, UserColor{"#95E1D3"});
}

auto full_map(std::size_t n) -> ParticipantMap {
    auto map = ParticipantMap{};
    for (std::size_t i = 0; i < n; ++i) {
        auto p = member("u" + std::to_string(i));
        map.insert_or_assign(p.user_id(), p);
    }
    return map;
}

}  // namespace

TEST(Policy, active_participant_can_edit) {
    EXPECT_TRUE(can_user_edit(member("u1")));
}

TEST(Policy, inactive_participant_cannot_edit) {
    EXPECT_FALSE(can_user_edit(member("u1").deactivate()));
}

TEST(Policy, session_full_at_capacity) {
    EXPECT_FALSE(is_session_full(full_map(2), 3));
    EXPECT_TRUE(is_session_full(full_map(3), 3));
    EXPECT_TRUE(is_session_full(full_map(4), 3));
}

TEST(Policy, inactive_members_count_toward_capacity) {
    auto map = full_map(3);
    map.insert_or_assign(UserId{"u0"}, map.at(UserId{"u0"}).deactivate());
    EXPECT_TRUE(is_session_full(map, 3));
    EXPECT_FALSE(can_participant_join(map, member("new"), 3));
}

TEST(Policy, new_user_joins_when_room) {
    EXPECT_TRUE(can_participant_join(full_map(2), member("new"), 3));
}

TEST(Policy, rejoin_allowed_at_capacity_for_every_member) {
    for (std::size_t cap = 1; cap <= 6; ++cap) {
        const auto map = full_map(cap);
        for (const auto& [id, p] : map) {
            EXPECT_TRUE(can_participant_join(map, p, cap)) << id.value();
            EXPECT_TRUE(can_participant_join(map, p.deactivate(), cap)) << id.value();
        }
        EXPECT_FALSE(can_participant_join(map, member("stranger"), cap));
    }
}

TEST(Policy, rejoin_allowed_even_over_capacity) {
    const auto map = full_map(5);
    EXPECT_TRUE(can_participant_join(map, member("u4"), 3));
}

TEST(Policy, session_overloads_match_map_versions) {
    const auto session = CollaborationSession::create("s1", DocumentId{"d1"})
                             .add_participant(member("a"))
                             .add_participant(member("b"));
    EXPECT_TRUE(is_session_full(session, 2));
    EXPECT_FALSE(can_participant_join(session, member("c"), 2));
    EXPECT_TRUE(can_participant_join(session, member("a"), 2));
}

// Three members in a capacity-3 session, a fourth is refused, then one
// member disconnects without leaving.
TEST(Scenario, capacity_three_with_disconnect) {
    auto session = CollaborationSession::create("s1", DocumentId{"d1"});
    for (const auto* id : {"alice", "bob", "carol"}) {
        const auto p = member(id);
        ASSERT_TRUE(can_participant_join(session, p, 3));
        session = session.add_participant(p);
    }
    EXPECT_FALSE(can_participant_join(session, member("dave"), 3));

    session = session.deactivate_participant(UserId{"bob"});
    EXPECT_EQ(session.participant_count(), 3u);
    EXPECT_EQ(session.active_participants().size(), 2u);
    EXPECT_TRUE(session.has_participant(UserId{"bob"}));
    EXPECT_FALSE(can_participant_join(session, member("dave"), 3));
    EXPECT_TRUE(can_participant_join(session, member("bob"), 3));
}
