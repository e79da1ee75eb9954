#pragma once

/**
 * Sagabus C++ Library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"
#include "config.hpp"
#include "id_generator.hpp"

// Messages and the bus seen from a dispatch
#include "message.hpp"
#include "bus_context.hpp"

// Persistence
#include "persister.hpp"
#include "finder.hpp"

// Sagas and their registration
#include "saga.hpp"
#include "saga_registry.hpp"

// Dispatch
#include "timeout_dispatcher.hpp"
#include "saga_not_found.hpp"
#include "saga_orchestrator.hpp"
