#pragma once

/**
 * @file Message.h
 * @brief AIMessage value type and its closed set of payloads.
 */

// Each MessageType has exactly one payload alternative it expects. Handlers
// reach it with std::get_if; a message whose payload does not match its type
// is ignored rather than reported, so a malformed message degrades AI quality
// instead of halting the receiving agent.

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

enum class MessageType : uint8_t
{
    TargetSighted,
    RequestSupport,
    SupportConfirmed,
    EngagingTarget,
    AllyDestroyed,
    FormationOrder,
    TacticalOrder,
    StatusUpdate,
    CoordinatedAttack,
    RequestEscort,
    EscortConfirmed,
    IntelReport
};

inline constexpr std::size_t kMessageTypeCount = 12;

[[nodiscard]] constexpr std::string_view toString(MessageType type) noexcept
{
    switch (type)
    {
    case MessageType::TargetSighted:     return "TargetSighted";
    case MessageType::RequestSupport:    return "RequestSupport";
    case MessageType::SupportConfirmed:  return "SupportConfirmed";
    case MessageType::EngagingTarget:    return "EngagingTarget";
    case MessageType::AllyDestroyed:     return "AllyDestroyed";
    case MessageType::FormationOrder:    return "FormationOrder";
    case MessageType::TacticalOrder:     return "TacticalOrder";
    case MessageType::StatusUpdate:      return "StatusUpdate";
    case MessageType::CoordinatedAttack: return "CoordinatedAttack";
    case MessageType::RequestEscort:     return "RequestEscort";
    case MessageType::EscortConfirmed:   return "EscortConfirmed";
    case MessageType::IntelReport:       return "IntelReport";
    }
    return "Unknown";
}

// =============================================================================
// Payloads
// =============================================================================

/// @brief TargetSighted / EngagingTarget: what the sender saw at the position.
struct ContactReport
{
    Vec3 velocity;
    float health = 0.0f;
    float confidence = 1.0f;
};

/// @brief RequestSupport.
struct SupportRequest
{
    float healthRatio = 1.0f;
    ShipType shipType = ShipType::Fighter;
};

enum class FormationOrderType : uint8_t
{
    ChangeFormation,
    SpreadOut,
    CloseRanks,
    BreakFormation
};

/// @brief FormationOrder.
struct FormationOrderData
{
    FormationOrderType order = FormationOrderType::ChangeFormation;
    FormationType formationType = FormationType::VFormation;
    float spacingMultiplier = 1.0f;
};

/// @brief Group tactic, chosen by the TacticalAI and carried by TacticalOrder.
enum class TacticalOrder : uint8_t
{
    DirectAssault,
    FlankingManeuver,
    PincerMovement,
    DefensiveFormation,
    HitAndRun,
    SuppressionBombardment
};

inline constexpr std::size_t kTacticalOrderCount = 6;

[[nodiscard]] constexpr std::string_view toString(TacticalOrder order) noexcept
{
    switch (order)
    {
    case TacticalOrder::DirectAssault:          return "DirectAssault";
    case TacticalOrder::FlankingManeuver:       return "FlankingManeuver";
    case TacticalOrder::PincerMovement:         return "PincerMovement";
    case TacticalOrder::DefensiveFormation:     return "DefensiveFormation";
    case TacticalOrder::HitAndRun:              return "HitAndRun";
    case TacticalOrder::SuppressionBombardment: return "SuppressionBombardment";
    }
    return "Unknown";
}

/**
 * @brief TacticalOrder payload. The message position is the objective
 *        (normally the target); flanking and pincer orders add the two wing
 *        points, and each receiver picks one.
 */
struct TacticalOrderData
{
    TacticalOrder order = TacticalOrder::DirectAssault;
    Vec3 wingA;
    Vec3 wingB;
    bool hasWings = false;
};

/// @brief StatusUpdate. Stored verbatim by the AllyTracker.
struct StatusData
{
    float healthRatio = 1.0f;
    Vec3 position;
    Vec3 velocity;
    bool inCombat = false;
    float ammoLevel = 1.0f;
};

/// @brief CoordinatedAttack.
enum class CoordinatedAttack : uint8_t
{
    BombardmentReady,
    InterceptorStrike,
    FlankingComplete
};

/// @brief RequestEscort.
struct EscortRequest
{
    float healthRatio = 1.0f;
};

/// @brief IntelReport. Appended to the IntelligenceDatabase.
struct IntelData
{
    Vec3 position;

    /// @brief Hull class of the observed contact, when identified.
    std::optional<ShipType> shipType;
    float threatLevel = 0.0f;
    Vec3 velocity;
    float confidence = 1.0f;
};

/// @brief AllyDestroyed.
struct AllyLoss
{
    ShipType shipType = ShipType::Fighter;
};

/// @brief SupportConfirmed / EscortConfirmed.
enum class Acknowledgement : uint8_t
{
    EnRoute,
    ProvidingEscort
};

using MessagePayload = std::variant<std::monostate,
                                    ContactReport,
                                    SupportRequest,
                                    FormationOrderData,
                                    TacticalOrderData,
                                    StatusData,
                                    CoordinatedAttack,
                                    EscortRequest,
                                    IntelData,
                                    AllyLoss,
                                    Acknowledgement>;

// =============================================================================
// AIMessage
// =============================================================================

/**
 * @brief One unit of agent-to-agent communication.
 *
 * Value type: copied into each recipient's inbound queue, so a message is
 * effectively immutable once sent. timestamp is simulation seconds, set by
 * CommunicationSystem::sendMessage along with sequence.
 */
struct AIMessage
{
    MessageType type = MessageType::StatusUpdate;
    AgentId sender = NullAgent;
    std::optional<AgentId> target;
    Vec3 position;
    MessagePayload payload;
    double timestamp = 0.0;

    /// @brief Per-sender serial set by sendMessage, starting at 1. Every copy
    ///        of one broadcast carries the same value; 0 means unsequenced.
    uint64_t sequence = 0;

    bool isBroadcast = false;
    float priority = 0.5f;
};

/// @brief Convenience constructor used by states and ship maneuvers.
[[nodiscard]] inline AIMessage makeMessage(MessageType type,
                                           AgentId sender,
                                           const Vec3& position,
                                           MessagePayload payload = {})
{
    AIMessage msg;
    msg.type = type;
    msg.sender = sender;
    msg.position = position;
    msg.payload = std::move(payload);
    return msg;
}

} // namespace fatp_fleet
