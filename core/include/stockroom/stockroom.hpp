#pragma once

/**
 * Stockroom event-sourcing core.
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"

// Validation helpers
#include "validation.hpp"

// Structured logging
#include "logging.hpp"

// Functional state reconstruction
#include "router.hpp"

// Event log and read-side seams
#include "event_store.hpp"
#include "projector.hpp"
