#pragma once

/**
 * @file FleetConfig.h
 * @brief Tunables for a fleet run and their JSON loader.
 */

// FAT-P components used:
// - JsonLite: Parse the configuration object
//
// Every field has a working default, so an empty object "{}" is a valid
// configuration. Unknown keys are ignored; a known key with the wrong JSON
// type is an error. Enumerations (initialDifficulty, logLevel) are given by
// name, e.g. "Hard" or "WARN".

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <fat_p/JsonLite.h>

#include "Log.h"
#include "Types.h"

namespace fatp_fleet
{

struct FleetConfig
{
    float communicationRange = 150.0f;
    float messageProcessingInterval = 0.2f;
    float evaluationInterval = 10.0f;
    float adaptationRate = 0.1f;
    DifficultyLevel initialDifficulty = DifficultyLevel::Medium;
    float worldRadius = 500.0f;
    float spawnInterval = 10.0f;
    float neighborRadius = 100.0f;
    float formationUpdateInterval = 1.0f;
    float swarmUpdateInterval = 0.1f;
    float tacticalUpdateInterval = 3.0f;
    float targetLossTimeout = 10.0f;
    uint32_t rngSeed = 0x5EEDu;
    LogLevel logLevel = LogLevel::Info;

    /// @throws std::invalid_argument naming the first bad field.
    void validate() const
    {
        if (communicationRange < 0.0f)
        {
            throw std::invalid_argument("FleetConfig: communicationRange must be >= 0");
        }
        if (!(messageProcessingInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: messageProcessingInterval must be > 0");
        }
        if (!(evaluationInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: evaluationInterval must be > 0");
        }
        if (!(adaptationRate > 0.0f) || adaptationRate > 1.0f)
        {
            throw std::invalid_argument("FleetConfig: adaptationRate must be in (0, 1]");
        }
        if (!(worldRadius > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: worldRadius must be > 0");
        }
        if (!(spawnInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: spawnInterval must be > 0");
        }
        if (neighborRadius < 0.0f)
        {
            throw std::invalid_argument("FleetConfig: neighborRadius must be >= 0");
        }
        if (!(formationUpdateInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: formationUpdateInterval must be > 0");
        }
        if (!(swarmUpdateInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: swarmUpdateInterval must be > 0");
        }
        if (!(tacticalUpdateInterval > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: tacticalUpdateInterval must be > 0");
        }
        if (!(targetLossTimeout > 0.0f))
        {
            throw std::invalid_argument("FleetConfig: targetLossTimeout must be > 0");
        }
    }
};

namespace detail
{

[[nodiscard]] inline float jsonNumber(const fat_p::JsonValue& value, std::string_view key)
{
    if (const auto* d = std::get_if<double>(&value))
    {
        return static_cast<float>(*d);
    }
    if (const auto* i = std::get_if<int64_t>(&value))
    {
        return static_cast<float>(*i);
    }
    throw std::runtime_error("FleetConfig: '" + std::string(key) + "' must be a number");
}

[[nodiscard]] inline const std::string& jsonString(const fat_p::JsonValue& value, std::string_view key)
{
    if (const auto* s = std::get_if<std::string>(&value))
    {
        return *s;
    }
    throw std::runtime_error("FleetConfig: '" + std::string(key) + "' must be a string");
}

[[nodiscard]] inline DifficultyLevel parseDifficulty(const std::string& name)
{
    for (auto level : {DifficultyLevel::VeryEasy,
                       DifficultyLevel::Easy,
                       DifficultyLevel::Medium,
                       DifficultyLevel::Hard,
                       DifficultyLevel::VeryHard})
    {
        if (toString(level) == name)
        {
            return level;
        }
    }
    throw std::runtime_error("FleetConfig: unknown difficulty '" + name + "'");
}

[[nodiscard]] inline LogLevel parseLogLevel(const std::string& name)
{
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off})
    {
        if (toString(level) == name)
        {
            return level;
        }
    }
    throw std::runtime_error("FleetConfig: unknown log level '" + name + "'");
}

} // namespace detail

/**
 * @brief Parses and validates a configuration object.
 *
 * @throws std::runtime_error on malformed JSON, a non-object document, or a
 *         field of the wrong type.
 * @throws std::invalid_argument if the parsed values fail validate().
 */
[[nodiscard]] inline FleetConfig loadFleetConfig(std::string_view json)
{
    const fat_p::JsonValue parsed = [json]()
    {
        try
        {
            return fat_p::parse_json(json);
        }
        catch (const std::exception& e)
        {
            throw std::runtime_error(std::string("FleetConfig: malformed JSON: ") + e.what());
        }
    }();

    const auto* object = std::get_if<fat_p::JsonObject>(&parsed);
    if (object == nullptr)
    {
        throw std::runtime_error("FleetConfig: document must be a JSON object");
    }

    FleetConfig config;
    for (const auto& [key, value] : *object)
    {
        if (key == "communicationRange")
        {
            config.communicationRange = detail::jsonNumber(value, key);
        }
        else if (key == "messageProcessingInterval")
        {
            config.messageProcessingInterval = detail::jsonNumber(value, key);
        }
        else if (key == "evaluationInterval")
        {
            config.evaluationInterval = detail::jsonNumber(value, key);
        }
        else if (key == "adaptationRate")
        {
            config.adaptationRate = detail::jsonNumber(value, key);
        }
        else if (key == "initialDifficulty")
        {
            config.initialDifficulty = detail::parseDifficulty(detail::jsonString(value, key));
        }
        else if (key == "worldRadius")
        {
            config.worldRadius = detail::jsonNumber(value, key);
        }
        else if (key == "spawnInterval")
        {
            config.spawnInterval = detail::jsonNumber(value, key);
        }
        else if (key == "neighborRadius")
        {
            config.neighborRadius = detail::jsonNumber(value, key);
        }
        else if (key == "formationUpdateInterval")
        {
            config.formationUpdateInterval = detail::jsonNumber(value, key);
        }
        else if (key == "swarmUpdateInterval")
        {
            config.swarmUpdateInterval = detail::jsonNumber(value, key);
        }
        else if (key == "tacticalUpdateInterval")
        {
            config.tacticalUpdateInterval = detail::jsonNumber(value, key);
        }
        else if (key == "targetLossTimeout")
        {
            config.targetLossTimeout = detail::jsonNumber(value, key);
        }
        else if (key == "rngSeed")
        {
            const auto* seed = std::get_if<int64_t>(&value);
            if (seed == nullptr || *seed < 0)
            {
                throw std::runtime_error("FleetConfig: 'rngSeed' must be a non-negative integer");
            }
            config.rngSeed = static_cast<uint32_t>(*seed);
        }
        else if (key == "logLevel")
        {
            config.logLevel = detail::parseLogLevel(detail::jsonString(value, key));
        }
    }

    config.validate();
    return config;
}

} // namespace fatp_fleet
