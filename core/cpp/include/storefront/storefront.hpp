#pragma once

/**
 * Storefront order core
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Domain types and lifecycle
#include "types.hpp"
#include "order_status.hpp"

// Helper utilities
#include "helpers.hpp"
#include "validation.hpp"
#include "wire.hpp"

// Store
#include "db.hpp"
#include "schema.hpp"

// Order intake and queries
#include "order_number.hpp"
#include "stock_validator.hpp"
#include "order_engine.hpp"
#include "order_lifecycle.hpp"
#include "order_queries.hpp"

// Post-commit side effects
#include "router.hpp"
#include "outbox.hpp"
#include "collaborators.hpp"

// Configuration
#include "config.hpp"

// gRPC client
#include "client.hpp"
