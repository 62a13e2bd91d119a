/**
 * @file test_tactical.cpp
 * @brief Tests for TacticalAI, TacticalMemory, and SwarmBehavior.
 *
 * Tests cover:
 *  1.  Scores and requirements for an all-fighter group
 *  2.  Hull-class requirements gate flanking, hit-and-run, and bombardment
 *  3.  Flank and pincer waypoints
 *  4.  Encirclement, spacing, and integrity measures
 *  5.  Memory bounds, default rate, and resolved outcomes
 *  6.  Remembered failures change the selected tactic
 *  7.  A flanking order spreads the formation once and splits the wings
 *  8.  Orders go out only on a tactic change and reach unassigned groups
 *  9.  Groups without a target are skipped
 * 10.  Separation, alignment, and cohesion forces
 * 11.  World-edge avoidance and steering clamps
 * 12.  Leadership emergence
 * 13.  Threat mood bias does not ratchet
 */

#include <fatp_fleet/FatpFleet.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
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

#define TEST_ASSERT_THROWS(expr, exception_type, msg)                      \
    do                                                                      \
    {                                                                       \
        bool caught = false;                                                \
        try                                                                 \
        {                                                                   \
            expr;                                                           \
        }                                                                   \
        catch (const exception_type&)                                       \
        {                                                                   \
            caught = true;                                                  \
        }                                                                   \
        if (!caught)                                                        \
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

static Contact contactAt(const Vec3& p)
{
    Contact c;
    c.position = p;
    return c;
}

// Forces one drain pass on the ship's endpoint.
static void pump(AIEnemyShip& ship)
{
    (void)ship.communication().update(CommunicationSystem::kDefaultProcessingInterval, ship.position());
}

static const TacticalOption* findOption(const TacticalAI::OptionList& options, TacticalOrder type)
{
    for (const TacticalOption& option : options)
    {
        if (option.type == type)
        {
            return &option;
        }
    }
    return nullptr;
}

// =============================================================================
// Scoring
// =============================================================================

static void test_fighter_group_options()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context(), {0.0f, 0.0f, 0.0f});
    FighterShip b(AgentId(2), svc.context(), {40.0f, 0.0f, 0.0f});
    FighterShip c(AgentId(3), svc.context(), {20.0f, 0.0f, 34.641f});
    const TacticalAI::Group group{&a, &b, &c};
    const Contact target = contactAt({0.0f, 0.0f, 200.0f});

    const TacticalAI::OptionList options = TacticalAI::generateOptions(group, target, svc.formations());
    TEST_ASSERT(options.size() == 2, "assault and defense only");

    const TacticalOption* assault = findOption(options, TacticalOrder::DirectAssault);
    TEST_ASSERT(assault != nullptr, "assault available");
    TEST_ASSERT(near(assault->effectiveness, 75.0f * 1.2f * 0.1f), "damage * health * numbers");
    TEST_ASSERT(findOption(options, TacticalOrder::DefensiveFormation) != nullptr, "defense always open");
    TEST_ASSERT(findOption(options, TacticalOrder::FlankingManeuver) == nullptr, "flanking needs an interceptor");
    TEST_ASSERT(findOption(options, TacticalOrder::PincerMovement) == nullptr, "pincer needs four ships");

    a.setHealth(a.maxHealth() * 0.5f);
    b.setHealth(b.maxHealth() * 0.5f);
    c.setHealth(c.maxHealth() * 0.5f);
    const TacticalAI::OptionList battered = TacticalAI::generateOptions(group, target, svc.formations());
    TEST_ASSERT(findOption(battered, TacticalOrder::DirectAssault) == nullptr, "assault needs 60% health");

    a.setHealth(a.maxHealth() * 0.2f);
    b.setHealth(b.maxHealth() * 0.2f);
    c.setHealth(c.maxHealth() * 0.2f);
    TEST_ASSERT(TacticalAI::generateOptions(group, target, svc.formations()).empty(), "nothing left below 30%");

    const TacticalSituation s = TacticalAI::assessSituation(group, target);
    TEST_ASSERT(s.allyCount == 3, "count");
    TEST_ASSERT(near(s.allyHealthAverage, 0.2f), "health");
    TEST_ASSERT(near(s.terrainAdvantage, 0.5f), "terrain neutral");
    TEST_ASSERT(s.threatLevel > 0.4f && s.threatLevel < 1.0f, "threat mixes damage and proximity");
}

static void test_type_requirements()
{
    FleetServices svc;
    InterceptorShip interceptor(AgentId(1), svc.context());
    FighterShip fighter(AgentId(2), svc.context(), {40.0f, 0.0f, 0.0f});
    ScoutShip scout(AgentId(3), svc.context(), {20.0f, 0.0f, 34.641f});
    BomberShip bomber(AgentId(4), svc.context(), {20.0f, 0.0f, -34.641f});
    const Contact target = contactAt({0.0f, 0.0f, 200.0f});

    const TacticalAI::Group trio{&interceptor, &fighter, &scout};
    const TacticalAI::OptionList options = TacticalAI::generateOptions(trio, target, svc.formations());
    TEST_ASSERT(findOption(options, TacticalOrder::FlankingManeuver) != nullptr, "flanking with interceptor and fighter");
    TEST_ASSERT(findOption(options, TacticalOrder::HitAndRun) != nullptr, "hit and run with scout and interceptor");
    TEST_ASSERT(findOption(options, TacticalOrder::SuppressionBombardment) == nullptr, "no bomber, no bombardment");

    const TacticalAI::Group withBomber{&bomber, &fighter};
    const TacticalAI::OptionList heavy = TacticalAI::generateOptions(withBomber, target, svc.formations());
    const TacticalOption* bombard = findOption(heavy, TacticalOrder::SuppressionBombardment);
    TEST_ASSERT(bombard != nullptr, "bomber enables bombardment");
    TEST_ASSERT(near(bombard->effectiveness, 0.5f + 0.2f + 0.3f), "beyond 80 units the range term is full");

    TacticalRequirements needsScout;
    needsScout.requiredTypes = shipTypeBit(ShipType::Scout);
    TEST_ASSERT(!TacticalAI::meetsRequirements(needsScout, withBomber), "missing hull");
    TEST_ASSERT(!TacticalAI::meetsRequirements(TacticalRequirements{}, TacticalAI::Group{}), "empty group");
}

static void test_waypoints()
{
    const TacticalOrderData flank = TacticalAI::flankPositions({10.0f, 0.0f, 10.0f});
    TEST_ASSERT(flank.hasWings, "two wings");
    TEST_ASSERT(near(distance(flank.wingA, {10.0f, 0.0f, 10.0f}), TacticalAI::kFlankRadius), "wing A on the ring");
    TEST_ASSERT(near(flank.wingA.z, 90.0f) && near(flank.wingB.z, -70.0f), "either side on z");

    const TacticalOrderData pincer = TacticalAI::pincerPositions(Vec3::zero(), {0.0f, 0.0f, 10.0f});
    TEST_ASSERT(near(pincer.wingA.x, -100.0f) && near(pincer.wingA.z, 30.0f), "ahead of the target, to one side");
    TEST_ASSERT(near(pincer.wingB.x, 100.0f) && near(pincer.wingB.z, 30.0f), "and to the other");

    const TacticalOrderData still = TacticalAI::pincerPositions(Vec3::zero(), Vec3::zero());
    TEST_ASSERT(near(still.wingA.x, 100.0f) && near(still.wingB.x, -100.0f), "stationary target uses the x axis");

    const TacticalOrderData climbing = TacticalAI::pincerPositions(Vec3::zero(), {0.0f, 10.0f, 0.0f});
    TEST_ASSERT(near(climbing.wingA.x, 100.0f), "vertical motion uses the x axis");
}

static void test_group_measures()
{
    FleetServices svc;
    FighterShip e(AgentId(1), svc.context(), {50.0f, 0.0f, 0.0f});
    FighterShip n(AgentId(2), svc.context(), {0.0f, 0.0f, 50.0f});
    FighterShip w(AgentId(3), svc.context(), {-50.0f, 0.0f, 0.0f});
    FighterShip s(AgentId(4), svc.context(), {0.0f, 0.0f, -50.0f});

    const TacticalAI::Group ring{&e, &n, &w, &s};
    TEST_ASSERT(near(TacticalAI::encirclementPotential(ring, Vec3::zero()), 0.75f), "quarter gaps");

    const TacticalAI::Group half{&e, &n, &w};
    TEST_ASSERT(near(TacticalAI::encirclementPotential(half, Vec3::zero()), 0.5f), "open half");
    TEST_ASSERT(TacticalAI::encirclementPotential(TacticalAI::Group{&e, &n}, Vec3::zero()) == 0.0f,
                "two ships cannot encircle");

    TEST_ASSERT(near(TacticalAI::formationIntegrity(ring), 0.5f), "50 from the centroid");
    TEST_ASSERT(TacticalAI::formationIntegrity(TacticalAI::Group{&e}) == 1.0f, "a single ship is intact");

    FighterShip close(AgentId(5), svc.context(), {90.0f, 0.0f, 0.0f});
    TEST_ASSERT(near(TacticalAI::formationSpacing(TacticalAI::Group{&e, &close}), 1.0f), "ideal spacing");
    TEST_ASSERT(TacticalAI::formationSpacing(TacticalAI::Group{&e, &w}) == 0.0f, "far apart clamps at zero");

    TEST_ASSERT(near(TacticalAI::coordinationLevel(ring, svc.formations()), e.teamwork()), "mean teamwork");
    FormationController& f = svc.formations().create(FormationType::Box, Vec3::zero());
    svc.hub().registerAgent(e);
    (void)svc.formations().join(f.id(), e);
    TEST_ASSERT(near(TacticalAI::coordinationLevel(ring, svc.formations()), std::min(1.0f, e.teamwork() + 0.2f)),
                "formation bonus");
}

// =============================================================================
// Memory
// =============================================================================

static void test_memory()
{
    TacticalMemory memory;
    TEST_ASSERT(near(memory.successRate(TacticalOrder::HitAndRun), 0.5f), "default rate");

    const uint64_t first = memory.record(TacticalOrder::HitAndRun, TacticalSituation{});
    const uint64_t second = memory.record(TacticalOrder::HitAndRun, TacticalSituation{});
    (void)memory.record(TacticalOrder::DirectAssault, TacticalSituation{});
    TEST_ASSERT(near(memory.successRate(TacticalOrder::HitAndRun), 0.5f), "unresolved entries do not count");

    TEST_ASSERT(memory.resolve(first, true), "resolved");
    TEST_ASSERT(near(memory.successRate(TacticalOrder::HitAndRun), 1.0f), "one success");
    TEST_ASSERT(memory.resolve(second, false), "resolved");
    TEST_ASSERT(near(memory.successRate(TacticalOrder::HitAndRun), 0.5f), "one of two");

    for (std::size_t i = 0; i < TacticalMemory::kMaxEntries; ++i)
    {
        (void)memory.record(TacticalOrder::PincerMovement, TacticalSituation{});
    }
    TEST_ASSERT(memory.size() == TacticalMemory::kMaxEntries, "bounded");
    TEST_ASSERT(!memory.resolve(first, true), "oldest evicted");
    TEST_ASSERT(near(memory.successRate(TacticalOrder::HitAndRun), 0.5f), "evicted history back to default");
}

static void test_memory_changes_selection()
{
    TacticalAI ai;
    TacticalAI::OptionList options;
    options.push_back(TacticalOption{TacticalOrder::DirectAssault, 1.0f, TacticalRequirements{}});
    options.push_back(TacticalOption{TacticalOrder::DefensiveFormation, 0.9f, TacticalRequirements{}});

    const TacticalOption* fresh = ai.selectBest(options);
    TEST_ASSERT(fresh != nullptr && fresh->type == TacticalOrder::DirectAssault, "raw score wins without history");

    for (int i = 0; i < 3; ++i)
    {
        const uint64_t serial = ai.memory().record(TacticalOrder::DirectAssault, TacticalSituation{});
        (void)ai.memory().resolve(serial, false);
    }
    const TacticalOption* learned = ai.selectBest(options);
    TEST_ASSERT(learned != nullptr && learned->type == TacticalOrder::DefensiveFormation, "failures demote a tactic");
    TEST_ASSERT(near(ai.weightedScore(options[0]), 0.75f), "failure weight");

    TEST_ASSERT(ai.selectBest(TacticalAI::OptionList{}) == nullptr, "nothing to choose");
}

// =============================================================================
// Command
// =============================================================================

static void test_flanking_spreads_and_splits()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context(), {0.0f, 0.0f, 0.0f});
    InterceptorShip left(AgentId(2), svc.context(), {40.0f, 0.0f, 0.0f});
    InterceptorShip right(AgentId(3), svc.context(), {20.0f, 0.0f, 34.641f});
    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    const Contact target = contactAt({0.0f, 0.0f, 120.0f});
    for (AIEnemyShip* ship : {static_cast<AIEnemyShip*>(&lead), static_cast<AIEnemyShip*>(&left),
                              static_cast<AIEnemyShip*>(&right)})
    {
        svc.hub().registerAgent(*ship);
        (void)svc.formations().join(f.id(), *ship);
        ship->setHealth(ship->maxHealth() * 0.55f);
        ship->setTarget(target);
    }

    TacticalAI ai;
    std::vector<TacticalDecision> seen;
    auto conn = ai.onDecision.connect([&](const TacticalDecision& d) { seen.push_back(d); });

    const std::vector<AIEnemyShip*> agents{&lead, &left, &right};
    const std::vector<TacticalDecision> decisions = ai.update(agents, svc.formations());
    TEST_ASSERT(decisions.size() == 1 && seen.size() == 1, "one decision, signalled");
    TEST_ASSERT(decisions.front().tactic == TacticalOrder::FlankingManeuver, "fast wingmen flank");
    TEST_ASSERT(decisions.front().commander == lead.id(), "leader commands");
    TEST_ASSERT(decisions.front().members.size() == 3, "members listed");
    TEST_ASSERT(ai.lastTactic(f.id()) == TacticalOrder::FlankingManeuver, "tactic tracked");

    TEST_ASSERT(near(f.tacticalSpread(), TacticalAI::kFlankSpread), "commander spread its own formation");
    TEST_ASSERT(lead.navigator().destination() == target.position, "fighter goes straight in");

    pump(lead);
    pump(left);
    pump(right);

    TEST_ASSERT(near(f.tacticalSpread(), TacticalAI::kFlankSpread), "wingmen do not spread it again");

    const TacticalOrderData wings = TacticalAI::flankPositions(target.position);
    TEST_ASSERT(left.navigator().destination() == wings.wingB, "slot 1 takes wing B");
    TEST_ASSERT(right.navigator().destination() == wings.wingA, "slot 2 takes wing A");
    TEST_ASSERT(left.communication().messageHistory(MessageType::FormationOrder).size() == 1, "formation order heard");
}

static void test_orders_on_change_and_unassigned()
{
    FleetServices svc;
    FighterShip lead(AgentId(1), svc.context(), {0.0f, 0.0f, 0.0f});
    InterceptorShip left(AgentId(2), svc.context(), {40.0f, 0.0f, 0.0f});
    InterceptorShip right(AgentId(3), svc.context(), {20.0f, 0.0f, 34.641f});
    ScoutShip scout(AgentId(4), svc.context(), {-60.0f, 0.0f, 0.0f});
    InterceptorShip chaser(AgentId(5), svc.context(), {-60.0f, 0.0f, 30.0f});
    FormationController& f = svc.formations().create(FormationType::VFormation, Vec3::zero());
    const Contact target = contactAt({0.0f, 0.0f, 120.0f});
    for (AIEnemyShip* ship : {static_cast<AIEnemyShip*>(&lead), static_cast<AIEnemyShip*>(&left),
                              static_cast<AIEnemyShip*>(&right), static_cast<AIEnemyShip*>(&scout),
                              static_cast<AIEnemyShip*>(&chaser)})
    {
        svc.hub().registerAgent(*ship);
        ship->setHealth(ship->maxHealth() * 0.55f);
        ship->setTarget(target);
    }
    (void)svc.formations().join(f.id(), lead);
    (void)svc.formations().join(f.id(), left);
    (void)svc.formations().join(f.id(), right);

    TacticalAI ai;
    const std::vector<AIEnemyShip*> agents{&lead, &left, &right, &scout, &chaser};
    const std::vector<TacticalDecision> first = ai.update(agents, svc.formations());
    TEST_ASSERT(first.size() == 2, "formation and unassigned pair");
    TEST_ASSERT(first[1].formation == NullFormation, "unassigned group keyed by NullFormation");
    TEST_ASSERT(first[1].tactic == TacticalOrder::HitAndRun, "scout and interceptor hit and run");
    TEST_ASSERT(first[1].commander == scout.id(), "first unassigned ship commands");

    const uint64_t sentBefore = lead.communication().lastSequence();
    const std::vector<TacticalDecision> second = ai.update(agents, svc.formations());
    TEST_ASSERT(second.size() == 2, "both groups again");
    TEST_ASSERT(lead.communication().lastSequence() == sentBefore + 1, "same tactic sends no formation order");
    TEST_ASSERT(near(f.tacticalSpread(), TacticalAI::kFlankSpread), "spread applied once over two passes");

    pump(scout);
    pump(chaser);
    pump(lead);
    TEST_ASSERT(chaser.communication().messageHistory(MessageType::TacticalOrder).size() == 2,
                "unassigned wingman hears its commander");
    TEST_ASSERT(lead.communication().messageHistory(MessageType::TacticalOrder).size() == 2,
                "formation leader hears the orders but ignores them");
    TEST_ASSERT(lead.navigator().destination() == target.position, "leader still on its own order");

    TEST_ASSERT(ai.memory().size() == 4, "four executions remembered");
    TEST_ASSERT(ai.memory().entries().front().success == true, "unchanged group counts as success");

    ai.forgetFormation(f.id());
    TEST_ASSERT(!ai.lastTactic(f.id()).has_value(), "forgotten");
}

static void test_groups_without_target_skipped()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    FighterShip b(AgentId(2), svc.context(), {30.0f, 0.0f, 0.0f});
    svc.hub().registerAgent(a);
    svc.hub().registerAgent(b);

    TacticalAI ai;
    const std::vector<AIEnemyShip*> agents{&a, &b};
    TEST_ASSERT(ai.update(agents, svc.formations()).empty(), "no target, no tactic");
    TEST_ASSERT(ai.memory().size() == 0, "nothing remembered");

    Contact stale = contactAt({0.0f, 0.0f, 500.0f});
    Contact fresh = contactAt({0.0f, 0.0f, 90.0f});
    a.setTarget(stale);
    a.setLastPlayerSightingTime(4.0f);
    b.setTarget(fresh);
    const std::optional<Contact> chosen = TacticalAI::groupTarget(TacticalAI::Group{&a, &b});
    TEST_ASSERT(chosen.has_value() && chosen->position == fresh.position, "freshest sighting wins");

    b.destroy();
    const auto groups = TacticalAI::buildGroups(agents, svc.formations());
    TEST_ASSERT(groups.size() == 1 && groups.front().second.size() == 1, "destroyed ships excluded");
}

// =============================================================================
// Swarm
// =============================================================================

static void test_flocking_forces()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context(), {0.0f, 0.0f, 0.0f});
    FighterShip near10(AgentId(2), svc.context(), {10.0f, 0.0f, 0.0f});
    FighterShip far50(AgentId(3), svc.context(), {0.0f, 0.0f, 50.0f});
    near10.setVelocity({0.0f, 0.0f, 30.0f});

    SwarmBehavior swarm;
    const SwarmBehavior::Swarm ships{&a, &near10, &far50};
    const SteeringForces f = swarm.forcesFor(a, ships);

    TEST_ASSERT(near(f.separation.x, -1.0f) && near(f.separation.z, 0.0f), "pushed away from the close ship");
    TEST_ASSERT(near(f.alignment.z, 1.0f), "matches the close ship's heading");
    TEST_ASSERT(f.cohesion.x > 0.0f && f.cohesion.z > 0.0f, "drawn toward both neighbors");
    TEST_ASSERT(near(f.cohesion.length(), 1.0f), "cohesion is a direction");
    TEST_ASSERT(f.avoidance == Vec3::zero(), "no edge near the origin");

    const SteeringForces lone = swarm.forcesFor(far50, SwarmBehavior::Swarm{&far50});
    TEST_ASSERT(lone.separation == Vec3::zero() && lone.cohesion == Vec3::zero(), "no neighbors, no flocking");

    TEST_ASSERT_THROWS(swarm.setBehaviorRadii(0.0f, 40.0f, 60.0f), std::invalid_argument, "zero radius rejected");
    TEST_ASSERT_THROWS(swarm.setBehaviorWeights(1.0f, -1.0f, 1.0f, 1.0f), std::invalid_argument,
                       "negative weight rejected");
}

static void test_edge_avoidance_and_clamps()
{
    FleetServices svc;
    svc.world().radius = 300.0f;
    FighterShip edge(AgentId(1), svc.context(), {280.0f, 0.0f, 0.0f});
    edge.setForward(Vec3::unitX());

    SwarmBehavior swarm;
    const SteeringForces f = swarm.forcesFor(edge, SwarmBehavior::Swarm{&edge});
    TEST_ASSERT(f.avoidance.x < 0.0f, "edge ahead steers back inward");

    edge.setVelocity({edge.speed(), 0.0f, 0.0f});
    SwarmBehavior::applySteering(edge, {-1000.0f, 0.0f, 0.0f}, 0.1f);
    TEST_ASSERT(near(edge.velocity().x, edge.speed() - edge.speed() * SwarmBehavior::kMaxForceFactor * 0.1f),
                "force clamped to twice the speed");

    SwarmBehavior::applySteering(edge, {0.0f, 0.0f, 10000.0f}, 10.0f);
    TEST_ASSERT(edge.velocity().length() <= edge.speed() + 1e-3f, "velocity clamped to speed");

    const Vec3 before = edge.velocity();
    SwarmBehavior::applySteering(edge, {0.01f, 0.0f, 0.0f}, 0.1f);
    TEST_ASSERT(edge.velocity() == before, "negligible force ignored");
}

static void test_leadership_emergence()
{
    FleetServices svc;
    InterceptorShip first(AgentId(1), svc.context());
    FighterShip second(AgentId(2), svc.context(), {20.0f, 0.0f, 0.0f});
    svc.hub().registerAgent(first);
    svc.hub().registerAgent(second);
    FormationController& f = svc.formations().create(FormationType::Line, Vec3::zero());
    (void)svc.formations().join(f.id(), first);
    (void)svc.formations().join(f.id(), second);
    TEST_ASSERT(f.leader() == first.id(), "first joiner leads");

    TEST_ASSERT(SwarmBehavior::isMoreSuitableLeader(second, first), "fighter outranks interceptor");
    TEST_ASSERT(!SwarmBehavior::isMoreSuitableLeader(first, second), "and not the other way round");

    SwarmBehavior::handleLeadershipEmergence(SwarmBehavior::Swarm{&first, &second}, svc.formations());
    TEST_ASSERT(f.leader() == second.id(), "fitter ship took over");

    SwarmBehavior::handleLeadershipEmergence(SwarmBehavior::Swarm{&first, &second}, svc.formations());
    TEST_ASSERT(f.leader() == second.id(), "stable once settled");
}

static void test_mood_bias()
{
    FleetServices svc;
    FighterShip a(AgentId(1), svc.context());
    FighterShip b(AgentId(2), svc.context(), {30.0f, 0.0f, 0.0f});
    const SwarmBehavior::Swarm ships{&a, &b};
    const float caution = a.caution();
    const float teamwork = a.teamwork();
    const float aggression = a.aggressiveness();

    SwarmBehavior::adaptToThreatLevel(ships);
    SwarmBehavior::adaptToThreatLevel(ships);
    TEST_ASSERT(near(a.aggressiveness(), aggression + 0.1f), "calm fleet grows bolder once");

    a.setHealth(a.maxHealth() * 0.2f);
    b.setHealth(b.maxHealth() * 0.2f);
    TEST_ASSERT(near(SwarmBehavior::swarmThreatLevel(ships), 0.8f), "threat from damage");
    for (int i = 0; i < 5; ++i)
    {
        SwarmBehavior::adaptToThreatLevel(ships);
    }
    TEST_ASSERT(near(a.caution(), caution + 0.2f), "caution raised once");
    TEST_ASSERT(near(a.teamwork(), std::min(1.0f, teamwork + 0.3f)), "teamwork raised once");
    TEST_ASSERT(near(a.aggressiveness(), aggression), "bold bias replaced");

    a.setHealth(a.maxHealth() * 0.5f);
    b.setHealth(b.maxHealth() * 0.5f);
    SwarmBehavior::adaptToThreatLevel(ships);
    TEST_ASSERT(near(a.caution(), caution) && near(a.teamwork(), teamwork), "middling threat clears the bias");
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::printf("=== test_tactical ===\n");
    defaultLogger().setStderrEnabled(false);

    RUN_TEST(test_fighter_group_options);
    RUN_TEST(test_type_requirements);
    RUN_TEST(test_waypoints);
    RUN_TEST(test_group_measures);
    RUN_TEST(test_memory);
    RUN_TEST(test_memory_changes_selection);
    RUN_TEST(test_flanking_spreads_and_splits);
    RUN_TEST(test_orders_on_change_and_unassigned);
    RUN_TEST(test_groups_without_target_skipped);
    RUN_TEST(test_flocking_forces);
    RUN_TEST(test_edge_avoidance_and_clamps);
    RUN_TEST(test_leadership_emergence);
    RUN_TEST(test_mood_bias);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}
