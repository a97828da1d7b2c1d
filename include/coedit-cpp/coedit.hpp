/// @file coedit.hpp
/// @brief Umbrella header for the coedit-cpp library.
///
/// Include this single header for access to the domain types (Document,
/// CollaborationSession, Participant, AgentQuery), the edit-permission
/// policy, mention detection, configuration and SessionRegistry.
/// JSON interop and snapshots live in json.hpp and snapshot.hpp.

#pragma once

#include <coedit-cpp/agent_query.hpp>
#include <coedit-cpp/change.hpp>
#include <coedit-cpp/config.hpp>
#include <coedit-cpp/document.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/mention.hpp>
#include <coedit-cpp/participant.hpp>
#include <coedit-cpp/policy.hpp>
#include <coedit-cpp/registry.hpp>
#include <coedit-cpp/session.hpp>
#include <coedit-cpp/types.hpp>
