/**
 * @file test_formation.cpp
 * @brief Tests for formation geometry, FormationController, FormationRegistry,
 *        and FormationMember.
 *
 * Tests cover:
 *  1.  V, Line, Circle, and Sphere slot shapes
 *  2.  Slot offsets follow the scale
 *  3.  Local-to-world mapping, including a vertical heading
 *  4.  First member leads; join order is slot order
 *  5.  One formation per agent
 *  6.  Leader succession by score, skipping badly damaged ships
 *  7.  Registry signals, removeEmpty, destroy, largest
 *  8.  Combat spreads the formation, heavy losses switch to Sphere
 *  9.  Spread relaxes out of combat
 * 10.  setDestination routes the leader and turns the formation
 * 11.  Slot priority by role, shape, and ship type
 * 12.  canBreakFormation
 * 13.  snap and isInPosition
 * 14.  Followers steer toward their slot; the leader is left alone
 */

#include <fatp_fleet/FatpFleet.h>

#include <cmath>
#include <cstdio>
#include <vector>

using namespace fatp_fleet;

// =============================================================================
// Test harness
// =============================================================================

static int sTestsPassed = 0;
static int sTestsFailed = 0;

#define TEST_ASSERT(cond, msg)                                              \
    do                                                                      \
    {                                                                       \
        if (!(cond))                                                        \
        {                                                                   \
            std::printf("  FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__);  \
            ++sTestsFailed;                                                 \
            return;                                                         \
        }                                                                   \
    } while (0)

#define RUN_TEST(fn)                                    \
    do                                                  \
    {                                                   \
        std::printf("  Running: %s\n", #fn);            \
        fn();                                           \
        ++sTestsPassed;                                 \
    } while (0)

static bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

static bool nearVec(const Vec3& a, const Vec3& b, float eps = 1e-3f)
{
    return distance(a, b) <= eps;
}

// =============================================================================
// Geometry
// =============================================================================

static void test_slot_shapes()
{
    const SlotList v = localSlots(FormationType::VFormation, 3, 1.0f);
    TEST_ASSERT(v.size() == 3, "one slot per ship");
    TEST_ASSERT(nearVec(v[0], Vec3::zero()), "V leader at the apex");
    TEST_ASSERT(nearVec(v[1], {-12.5f, 0.0f, -21.6506f}), "first wingman back and left");
    TEST_ASSERT(nearVec(v[2], {12.5f, 0.0f, -21.6506f}), "second wingman back and right");

    const SlotList line = localSlots(FormationType::Line, 4, 1.0f);
    TEST_ASSERT(near(line[0].x, -40.0f) && near(line[1].x, -20.0f), "line left half");
    TEST_ASSERT(near(line[2].x, 0.0f) && near(line[3].x, 20.0f), "line right half");

    const SlotList circle = localSlots(FormationType::Circle, 5, 1.0f);
    TEST_ASSERT(nearVec(circle[0], Vec3::zero()), "circle leader centered");
    for (std::size_t i = 1; i < circle.size(); ++i)
    {
        TEST_ASSERT(near(circle[i].length(), 30.0f), "circle radius");
        TEST_ASSERT(near(circle[i].y, 0.0f), "circle is flat");
    }

    const SlotList sphere = localSlots(FormationType::Sphere, 6, 1.0f);
    TEST_ASSERT(nearVec(sphere[0], Vec3::zero()), "sphere leader centered");
    for (std::size_t i = 1; i < sphere.size(); ++i)
    {
        TEST_ASSERT(near(sphere[i].length(), 40.0f), "sphere radius");
    }

    TEST_ASSERT(localSlots(FormationType::Helix, 0, 1.0f).empty(), "no ships, no slots");
}

static void test_slots_follow_scale()
{
    const SlotList base = localSlots(FormationType::VFormation, 3, 1.0f);
    const SlotList wide = localSlots(FormationType::VFormation, 3, 2.0f);
    TEST_ASSERT(near(wide[1].x, base[1].x * 2.0f), "x doubles");
    TEST_ASSERT(near(wide[1].z, base[1].z * 2.0f), "z doubles");

    const SlotList box = localSlots(FormationType::Box, 4, 0.5f);
    TEST_ASSERT(near(distance(box[0], box[1]), 12.5f), "box spacing scaled");
}

static void test_to_world()
{
    // Heading +Z: right = cross(+Z, +Y) = -X.
    TEST_ASSERT(nearVec(toWorld({1.0f, 0.0f, 0.0f}, Vec3::zero(), Vec3::unitZ()), {-1.0f, 0.0f, 0.0f}),
                "local x maps to the right vector");
    TEST_ASSERT(nearVec(toWorld({0.0f, 2.0f, 0.0f}, Vec3::zero(), Vec3::unitZ()), {0.0f, 2.0f, 0.0f}),
                "local y maps to up");
    TEST_ASSERT(nearVec(toWorld({0.0f, 0.0f, 10.0f}, {5.0f, 0.0f, 0.0f}, Vec3::unitX()), {15.0f, 0.0f, 0.0f}),
                "local z follows the heading from the center");
    TEST_ASSERT(nearVec(toWorld({0.0f, 0.0f, 10.0f}, Vec3::zero(), {0.0f, 0.0f, 4.0f}), {0.0f, 0.0f, 10.0f}),
                "heading is normalized");

    // Straight up: +X stands in for right.
    TEST_ASSERT(nearVec(toWorld({3.0f, 0.0f, 0.0f}, Vec3::zero(), Vec3::unitY()), {3.0f, 0.0f, 0.0f}),
                "vertical heading falls back to +X");
    TEST_ASSERT(nearVec(toWorld({0.0f, 0.0f, 2.0f}, Vec3::zero(), Vec3::unitY()), {0.0f, 2.0f, 0.0f}),
                "vertical heading keeps forward");
}

// =============================================================================
// Membership
// =============================================================================

static void test_first_member_leads()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context(), {10.0f, 0.0f, 10.0f});
    ScoutShip b(AgentId(2), svc.context());
    BomberShip c(AgentId(3), svc.context());

    std::vector<AgentId> leaders;
    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    auto conn = f.onLeaderChanged.connect([&](FormationId, AgentId leader) { leaders.push_back(leader); });

    TEST_ASSERT(svc.formations().join(f.id(), a), "a joined");
    TEST_ASSERT(svc.formations().join(f.id(), b), "b joined");
    TEST_ASSERT(svc.formations().join(f.id(), c), "c joined");

    TEST_ASSERT(f.leader() == a.id(), "first member leads");
    TEST_ASSERT(f.indexOf(b.id()) == 1 && f.indexOf(c.id()) == 2, "join order is slot order");
    TEST_ASSERT(leaders.size() == 1 && leaders[0] == a.id(), "leader announced once");
    TEST_ASSERT(nearVec(f.center(), a.position()), "center starts at the first member");
    TEST_ASSERT(nearVec(f.slotPosition(0), a.position()), "leader slot at the center");
    TEST_ASSERT(nearVec(f.slotPosition(-1), f.center()), "invalid index gives the center");
    TEST_ASSERT(a.formation() == &f && a.formationIndex() == 0, "ship sees its formation");
    TEST_ASSERT(!a.isFollowingFormation(), "leader flies its own route");
    TEST_ASSERT(b.isFollowingFormation(), "patrolling wingman follows its slot");

    f.setLeader(c.id());
    TEST_ASSERT(f.leader() == c.id() && f.indexOf(a.id()) == 1, "explicit leader moves to slot 0");
    TEST_ASSERT(leaders.size() == 2, "leader change announced");
}

static void test_one_formation_per_agent()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());

    FormationController& f1 = svc.formations().create(FormationType::Line, Vec3::zero());
    FormationController& f2 = svc.formations().create(FormationType::Box, Vec3::zero());

    TEST_ASSERT(svc.formations().join(f1.id(), a), "first join");
    TEST_ASSERT(!svc.formations().join(f1.id(), a), "rejoining refused");
    TEST_ASSERT(!svc.formations().join(f2.id(), a), "second formation refused");
    TEST_ASSERT(!svc.formations().join(FormationId(99), a), "unknown formation refused");
    TEST_ASSERT(f2.empty(), "refused join leaves no trace");
    TEST_ASSERT(svc.formations().formationOf(a.id()) == &f1, "still in the first");

    TEST_ASSERT(svc.formations().leave(a.id()), "left");
    TEST_ASSERT(!svc.formations().leave(a.id()), "leave twice reports nothing");
    TEST_ASSERT(svc.formations().join(f2.id(), a), "free to join another");
}

static void test_leader_succession()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    ScoutShip scout(AgentId(2), svc.context());
    BomberShip bomber(AgentId(3), svc.context());
    svc.hub().registerAgent(lead);
    svc.hub().registerAgent(scout);
    svc.hub().registerAgent(bomber);

    TEST_ASSERT(near(FormationController::leadershipScore(bomber), 54.0f), "bomber score");
    TEST_ASSERT(near(FormationController::leadershipScore(scout), 49.0f), "scout score");

    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), scout);
    (void)svc.formations().join(f.id(), bomber);

    int announcements = 0;
    auto conn = f.onLeaderChanged.connect([&](FormationId, AgentId) { ++announcements; });

    TEST_ASSERT(svc.formations().leave(lead.id()), "leader left");
    TEST_ASSERT(f.leader() == bomber.id(), "highest score promoted");
    TEST_ASSERT(f.indexOf(scout.id()) == 1, "others keep their order");
    TEST_ASSERT(announcements == 1, "succession announced");
}

static void test_succession_skips_damaged()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    BomberShip bomber(AgentId(2), svc.context());
    ScoutShip scout(AgentId(3), svc.context());
    svc.hub().registerAgent(lead);
    svc.hub().registerAgent(bomber);
    svc.hub().registerAgent(scout);

    FormationController& f = svc.formations().create(FormationType::Line, Vec3::zero());
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), bomber);
    (void)svc.formations().join(f.id(), scout);

    bomber.setHealth(bomber.maxHealth() * 0.25f);
    lead.destroy();

    TEST_ASSERT(!f.contains(lead.id()), "destroyed leader removed");
    TEST_ASSERT(f.leader() == scout.id(), "badly damaged bomber passed over");
    TEST_ASSERT(f.memberCount() == 2, "two remain");
    TEST_ASSERT(f.peakMemberCount() == 3, "peak remembered");
}

static void test_registry_lifecycle()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    FighterShip b(AgentId(2), svc.context());
    FighterShip c(AgentId(3), svc.context());

    int created = 0;
    int destroyed = 0;
    auto c1 = svc.formations().onFormationCreated.connect([&](FormationController&) { ++created; });
    auto c2 = svc.formations().onFormationDestroyed.connect([&](FormationController&) { ++destroyed; });

    FormationController& pair = svc.formations().create(FormationType::Line, Vec3::zero());
    FormationController& solo = svc.formations().create(FormationType::Box, Vec3::zero());
    const FormationId emptyId = svc.formations().create(FormationType::Circle, Vec3::zero()).id();
    (void)svc.formations().join(pair.id(), a);
    (void)svc.formations().join(pair.id(), b);
    (void)svc.formations().join(solo.id(), c);

    TEST_ASSERT(created == 3, "creation announced");
    TEST_ASSERT(svc.formations().largest() == &pair, "largest by member count");

    TEST_ASSERT(svc.formations().removeEmpty() == 1, "empty formation removed");
    TEST_ASSERT(svc.formations().find(emptyId) == nullptr, "gone");
    TEST_ASSERT(destroyed == 1, "destruction announced");

    const FormationId pairId = pair.id();
    TEST_ASSERT(svc.formations().destroy(pairId), "destroyed with members");
    TEST_ASSERT(!svc.formations().isMember(a.id()) && !svc.formations().isMember(b.id()), "members released");
    TEST_ASSERT(a.formation() == nullptr, "ship no longer sees it");
    TEST_ASSERT(!svc.formations().destroy(pairId), "second destroy reports nothing");

    svc.formations().clear();
    TEST_ASSERT(svc.formations().size() == 0, "cleared");
    TEST_ASSERT(!svc.formations().isMember(c.id()), "clear releases everyone");
}

// =============================================================================
// Dynamic adjustment
// =============================================================================

static void test_combat_spread_and_sphere_switch()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    FighterShip b(AgentId(2), svc.context(), {20.0f, 0.0f, 0.0f});
    FighterShip c(AgentId(3), svc.context(), {-20.0f, 0.0f, 0.0f});
    FighterShip d(AgentId(4), svc.context(), {0.0f, 0.0f, -20.0f});
    for (AIEnemyShip* s : std::vector<AIEnemyShip*>{&a, &b, &c, &d})
    {
        svc.hub().registerAgent(*s);
    }

    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    for (AIEnemyShip* s : std::vector<AIEnemyShip*>{&a, &b, &c, &d})
    {
        (void)svc.formations().join(f.id(), *s);
    }

    f.update(0.1f);
    TEST_ASSERT(!f.inCombat(), "quiet without targets");
    TEST_ASSERT(near(f.tacticalSpread(), 1.0f), "no change at rest spread");

    Contact player;
    player.position = {0.0f, 0.0f, 200.0f};
    a.setTarget(player);
    f.update(0.1f);
    TEST_ASSERT(f.inCombat(), "in combat once a member has a target");
    TEST_ASSERT(near(f.tacticalSpread(), FormationController::kCombatSpread), "spread out in combat");
    TEST_ASSERT(f.type() == FormationType::VFormation, "shape kept while losses are light");

    (void)svc.formations().leave(b.id());
    (void)svc.formations().leave(c.id());
    f.update(0.1f);
    TEST_ASSERT(f.type() == FormationType::VFormation, "half lost is not enough");

    (void)svc.formations().leave(d.id());
    f.update(0.1f);
    TEST_ASSERT(f.type() == FormationType::Sphere, "heavy losses close into a sphere");
}

static void test_spread_relaxes_out_of_combat()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    svc.hub().registerAgent(a);

    FormationController& f = svc.formations().create(FormationType::Line, Vec3::zero());
    (void)svc.formations().join(f.id(), a);
    f.setTacticalSpread(1.5f);

    f.update(1.0f);
    TEST_ASSERT(near(f.tacticalSpread(), 1.4f), "relaxes at 0.1 per second");

    for (int i = 0; i < 20; ++i)
    {
        f.update(1.0f);
    }
    TEST_ASSERT(near(f.tacticalSpread(), FormationController::kMinSpread), "floors at 0.8");

    f.setDynamic(false);
    f.setTacticalSpread(2.0f);
    f.update(1.0f);
    TEST_ASSERT(near(f.tacticalSpread(), 2.0f), "static formations keep their spread");

    f.setDifficultyScale(0.5f);
    TEST_ASSERT(near(f.scale(), 1.0f), "scale combines both factors");
}

static void test_destination_routes_leader()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    FighterShip wing(AgentId(2), svc.context(), {0.0f, 0.0f, -30.0f});
    svc.hub().registerAgent(lead);
    svc.hub().registerAgent(wing);

    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), wing);

    const Vec3 goal(300.0f, 0.0f, 0.0f);
    f.setDestination(goal);

    TEST_ASSERT(f.hasDestination() && f.destination() == goal, "destination stored");
    TEST_ASSERT(nearVec(f.direction(), Vec3::unitX()), "formation turns toward it");
    TEST_ASSERT(lead.navigator().hasPath(), "leader routed");
    TEST_ASSERT(lead.navigator().destination() == goal, "leader heads for the goal");
    TEST_ASSERT(!(wing.navigator().destination() == goal), "followers are not routed");
}

// =============================================================================
// FormationMember
// =============================================================================

static void test_slot_priority()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    FighterShip wing(AgentId(2), svc.context());
    ScoutShip tail(AgentId(3), svc.context());
    InterceptorShip last(AgentId(4), svc.context());

    FormationController& v = svc.formations().create(FormationType::VFormation, Vec3::zero());
    (void)svc.formations().join(v.id(), lead);
    (void)svc.formations().join(v.id(), wing);
    (void)svc.formations().join(v.id(), tail);
    (void)svc.formations().join(v.id(), last);

    TEST_ASSERT(near(lead.formationMember().formationPriority(), 1.0f), "V leader");
    TEST_ASSERT(near(wing.formationMember().formationPriority(), 0.7f), "V wingman");
    TEST_ASSERT(near(tail.formationMember().formationPriority(), 0.6f), "scout in a front slot");
    TEST_ASSERT(near(last.formationMember().formationPriority(), 0.3f), "trailing interceptor");

    BomberShip bomber(AgentId(5), svc.context());
    FighterShip core(AgentId(6), svc.context());
    FormationController& s = svc.formations().create(FormationType::Sphere, Vec3::zero());
    (void)svc.formations().join(s.id(), core);
    (void)svc.formations().join(s.id(), bomber);
    TEST_ASSERT(near(bomber.formationMember().formationPriority(), 0.8f), "bomber in a sphere");

    InterceptorShip loner(AgentId(7), svc.context());
    TEST_ASSERT(loner.formationMember().formationPriority() == 0.0f, "no formation, no priority");
}

static void test_can_break_formation()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    FighterShip b(AgentId(2), svc.context());
    FighterShip c(AgentId(3), svc.context());
    FighterShip d(AgentId(4), svc.context());

    FormationController& f = svc.formations().create(FormationType::Box, Vec3::zero());
    for (AIEnemyShip* s : std::vector<AIEnemyShip*>{&a, &b, &c, &d})
    {
        (void)svc.formations().join(f.id(), *s);
    }

    TEST_ASSERT(!a.formationMember().canBreakFormation(), "leader never breaks");
    TEST_ASSERT(b.formationMember().canBreakFormation(), "follower in a group of four");

    (void)svc.formations().leave(d.id());
    TEST_ASSERT(!b.formationMember().canBreakFormation(), "three ships hold together");
    TEST_ASSERT(!d.formationMember().canBreakFormation(), "loner has nothing to break");
}

static void test_snap_and_in_position()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    FighterShip wing(AgentId(2), svc.context(), {200.0f, 0.0f, 0.0f});

    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), wing);

    TEST_ASSERT(!wing.formationMember().isInPosition(), "far from the slot");
    TEST_ASSERT(wing.formationMember().distanceFromPosition() > 100.0f, "distance reported");

    wing.formationMember().snap();
    TEST_ASSERT(nearVec(wing.position(), f.slotPosition(1)), "snapped onto the slot");
    TEST_ASSERT(wing.formationMember().isInPosition(), "in position");
    TEST_ASSERT(near(wing.formationMember().distanceFromPosition(), 0.0f), "zero distance");
    TEST_ASSERT(wing.velocity() == Vec3::zero(), "snap stops the ship");
}

static void test_followers_steer_to_slot()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context());
    FighterShip wing(AgentId(2), svc.context(), {100.0f, 0.0f, 100.0f});
    svc.hub().registerAgent(lead);
    svc.hub().registerAgent(wing);

    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), wing);

    const float before = wing.formationMember().distanceFromPosition();
    for (int i = 0; i < 5; ++i)
    {
        f.update(0.1f);
        wing.formationMember().update(0.1f);
        wing.setPosition(wing.position() + wing.velocity() * 0.1f);
    }

    const Vec3 toSlot = f.slotPosition(1) - wing.position();
    TEST_ASSERT(dot(wing.velocity(), toSlot) > 0.0f, "heading for the slot");
    TEST_ASSERT(wing.formationMember().distanceFromPosition() < before, "gap closing");
    TEST_ASSERT(nearVec(wing.formationMember().targetPosition(), f.slotPosition(1)), "target is the slot");

    lead.formationMember().update(0.1f);
    TEST_ASSERT(lead.velocity() == Vec3::zero(), "leader is not steered");
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::printf("=== test_formation ===\n");
    defaultLogger().setStderrEnabled(false);

    RUN_TEST(test_slot_shapes);
    RUN_TEST(test_slots_follow_scale);
    RUN_TEST(test_to_world);
    RUN_TEST(test_first_member_leads);
    RUN_TEST(test_one_formation_per_agent);
    RUN_TEST(test_leader_succession);
    RUN_TEST(test_succession_skips_damaged);
    RUN_TEST(test_registry_lifecycle);
    RUN_TEST(test_combat_spread_and_sphere_switch);
    RUN_TEST(test_spread_relaxes_out_of_combat);
    RUN_TEST(test_destination_routes_leader);
    RUN_TEST(test_slot_priority);
    RUN_TEST(test_can_break_formation);
    RUN_TEST(test_snap_and_in_position);
    RUN_TEST(test_followers_steer_to_slot);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}
