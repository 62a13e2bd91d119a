/**
 * @file test_config.cpp
 * @brief Tests for FleetConfig defaults, JSON loading, and validation.
 *
 * Tests cover:
 *  1.  An empty object yields the defaults
 *  2.  Every recognized key is applied
 *  3.  Unknown keys are ignored
 *  4.  Wrong value types are rejected
 *  5.  Malformed and non-object documents are rejected
 *  6.  Out-of-range values fail validation
 *  7.  Unknown enum names are rejected
 *  8.  rngSeed must be a non-negative integer
 *  9.  validate() on a hand-built config
 */

#include <fatp_fleet/FatpFleet.h>

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string_view>

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

static bool near(float a, float b, float eps = 1e-4f)
{
    return std::fabs(a - b) <= eps;
}

template <typename E>
static bool throwsOn(std::string_view json)
{
    try
    {
        (void)loadFleetConfig(json);
    }
    catch (const E&)
    {
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
    return false;
}

// =============================================================================
// Loading
// =============================================================================

static void test_empty_object_is_defaults()
{
    const FleetConfig loaded = loadFleetConfig("{}");
    const FleetConfig defaults;

    TEST_ASSERT(loaded.communicationRange == defaults.communicationRange, "range");
    TEST_ASSERT(loaded.messageProcessingInterval == defaults.messageProcessingInterval, "processing interval");
    TEST_ASSERT(loaded.evaluationInterval == defaults.evaluationInterval, "evaluation interval");
    TEST_ASSERT(loaded.adaptationRate == defaults.adaptationRate, "adaptation rate");
    TEST_ASSERT(loaded.initialDifficulty == DifficultyLevel::Medium, "difficulty");
    TEST_ASSERT(loaded.worldRadius == defaults.worldRadius, "world radius");
    TEST_ASSERT(loaded.spawnInterval == defaults.spawnInterval, "spawn interval");
    TEST_ASSERT(loaded.neighborRadius == defaults.neighborRadius, "neighbor radius");
    TEST_ASSERT(loaded.formationUpdateInterval == defaults.formationUpdateInterval, "formation interval");
    TEST_ASSERT(loaded.swarmUpdateInterval == defaults.swarmUpdateInterval, "swarm interval");
    TEST_ASSERT(loaded.tacticalUpdateInterval == defaults.tacticalUpdateInterval, "tactical interval");
    TEST_ASSERT(loaded.targetLossTimeout == defaults.targetLossTimeout, "target loss timeout");
    TEST_ASSERT(loaded.rngSeed == defaults.rngSeed, "seed");
    TEST_ASSERT(loaded.logLevel == LogLevel::Info, "log level");
}

static void test_all_keys_applied()
{
    const FleetConfig c = loadFleetConfig(R"({
        "communicationRange": 220.5,
        "messageProcessingInterval": 0.1,
        "evaluationInterval": 5,
        "adaptationRate": 0.25,
        "initialDifficulty": "Hard",
        "worldRadius": 800,
        "spawnInterval": 4.5,
        "neighborRadius": 60,
        "formationUpdateInterval": 0.5,
        "swarmUpdateInterval": 0.25,
        "tacticalUpdateInterval": 2,
        "targetLossTimeout": 12,
        "rngSeed": 42,
        "logLevel": "WARN"
    })");

    TEST_ASSERT(near(c.communicationRange, 220.5f), "range");
    TEST_ASSERT(near(c.messageProcessingInterval, 0.1f), "processing interval");
    TEST_ASSERT(near(c.evaluationInterval, 5.0f), "integer accepted as number");
    TEST_ASSERT(near(c.adaptationRate, 0.25f), "adaptation rate");
    TEST_ASSERT(c.initialDifficulty == DifficultyLevel::Hard, "difficulty");
    TEST_ASSERT(near(c.worldRadius, 800.0f), "world radius");
    TEST_ASSERT(near(c.spawnInterval, 4.5f), "spawn interval");
    TEST_ASSERT(near(c.neighborRadius, 60.0f), "neighbor radius");
    TEST_ASSERT(near(c.formationUpdateInterval, 0.5f), "formation interval");
    TEST_ASSERT(near(c.swarmUpdateInterval, 0.25f), "swarm interval");
    TEST_ASSERT(near(c.tacticalUpdateInterval, 2.0f), "tactical interval");
    TEST_ASSERT(near(c.targetLossTimeout, 12.0f), "target loss timeout");
    TEST_ASSERT(c.rngSeed == 42u, "seed");
    TEST_ASSERT(c.logLevel == LogLevel::Warn, "log level");
}

static void test_unknown_keys_ignored()
{
    const FleetConfig c = loadFleetConfig(R"({"shieldColor": "blue", "worldRadius": 300, "extra": [1, 2]})");
    TEST_ASSERT(near(c.worldRadius, 300.0f), "known key still applied");
    TEST_ASSERT(near(c.communicationRange, 150.0f), "others default");
}

static void test_wrong_types_rejected()
{
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"worldRadius": "big"})"), "string for number");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"logLevel": 3})"), "number for log level");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"initialDifficulty": true})"), "bool for difficulty");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"spawnInterval": null})"), "null for number");
}

static void test_malformed_documents_rejected()
{
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"worldRadius": )"), "truncated");
    TEST_ASSERT(throwsOn<std::runtime_error>("not json"), "garbage");
    TEST_ASSERT(throwsOn<std::runtime_error>("[1, 2]"), "array document");
    TEST_ASSERT(throwsOn<std::runtime_error>("7"), "scalar document");
}

static void test_validation_failures()
{
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"adaptationRate": 0})"), "zero rate");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"adaptationRate": 1.5})"), "rate above one");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"worldRadius": 0})"), "zero world");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"spawnInterval": -1})"), "negative spawn interval");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"communicationRange": -5})"), "negative range");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"messageProcessingInterval": 0})"), "zero processing interval");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"swarmUpdateInterval": 0})"), "zero swarm interval");
    TEST_ASSERT(throwsOn<std::invalid_argument>(R"({"tacticalUpdateInterval": -3})"), "negative tactical interval");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"tacticalUpdateInterval": "often"})"), "string for tactical interval");

    const FleetConfig edge = loadFleetConfig(R"({"adaptationRate": 1, "communicationRange": 0})");
    TEST_ASSERT(near(edge.adaptationRate, 1.0f), "rate of one allowed");
    TEST_ASSERT(edge.communicationRange == 0.0f, "zero range allowed");
}

static void test_unknown_enum_names_rejected()
{
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"initialDifficulty": "Nightmare"})"), "difficulty");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"logLevel": "VERBOSE"})"), "log level");

    const FleetConfig c = loadFleetConfig(R"({"initialDifficulty": "VeryEasy", "logLevel": "OFF"})");
    TEST_ASSERT(c.initialDifficulty == DifficultyLevel::VeryEasy, "VeryEasy");
    TEST_ASSERT(c.logLevel == LogLevel::Off, "OFF");
}

static void test_seed_must_be_non_negative_integer()
{
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"rngSeed": -1})"), "negative");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"rngSeed": 3.5})"), "fractional");
    TEST_ASSERT(throwsOn<std::runtime_error>(R"({"rngSeed": "7"})"), "string");
    TEST_ASSERT(loadFleetConfig(R"({"rngSeed": 0})").rngSeed == 0u, "zero allowed");
}

static void test_validate_direct()
{
    FleetConfig c;
    bool threw = false;
    try
    {
        c.validate();
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    TEST_ASSERT(!threw, "defaults are valid");

    c.targetLossTimeout = 0.0f;
    TEST_ASSERT_THROWS(c.validate(), std::invalid_argument, "zero timeout rejected");

    c.targetLossTimeout = 10.0f;
    c.neighborRadius = -1.0f;
    TEST_ASSERT_THROWS(c.validate(), std::invalid_argument, "negative neighbor radius rejected");
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::printf("=== test_config ===\n");
    defaultLogger().setStderrEnabled(false);

    RUN_TEST(test_empty_object_is_defaults);
    RUN_TEST(test_all_keys_applied);
    RUN_TEST(test_unknown_keys_ignored);
    RUN_TEST(test_wrong_types_rejected);
    RUN_TEST(test_malformed_documents_rejected);
    RUN_TEST(test_validation_failures);
    RUN_TEST(test_unknown_enum_names_rejected);
    RUN_TEST(test_seed_must_be_non_negative_integer);
    RUN_TEST(test_validate_direct);

    std::printf("\n%d/%d tests passed\n", sTestsPassed, sTestsPassed + sTestsFailed);
    return sTestsFailed == 0 ? 0 : 1;
}
