#pragma once

/**
 * @file FatpFleet.h
 * @brief Umbrella header for the fleet AI.
 */

// Core types
#include "Vec3.h"
#include "Types.h"
#include "Log.h"
#include "Message.h"

// Shared knowledge
#include "ThreatDatabase.h"
#include "AllyTracker.h"
#include "IntelligenceDatabase.h"

// Formations
#include "FormationGeometry.h"
#include "FormationController.h"
#include "FormationMember.h"
#include "FormationRegistry.h"

// Messaging
#include "CommunicationHub.h"
#include "CommunicationSystem.h"

// Agents (must follow the services above)
#include "FleetServices.h"
#include "Navigator.h"
#include "AIState.h"
#include "AIEnemyShip.h"
#include "AIStates.h"
#include "Ships.h"
#include "SwarmBehavior.h"
#include "TacticalAI.h"

// Difficulty and coordination
#include "PlayerPerformanceTracker.h"
#include "DifficultyScaling.h"
#include "GameEvents.h"
#include "FleetConfig.h"
#include "FleetManager.h"

// Out-of-line implementations (must follow AIEnemyShip.h)
#include "AIEnemyShip_Impl.h"
#include "CommunicationHub_Impl.h"
#include "CommunicationSystem_Impl.h"
#include "FormationController_Impl.h"
#include "FormationRegistry_Impl.h"
#include "Navigator_Impl.h"
#include "FormationMember_Impl.h"
