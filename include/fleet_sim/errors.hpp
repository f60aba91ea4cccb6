// === Error Types =============================================================
//
// Exception hierarchy surfaced by the simulation core and the fleet service.
// The service maps each type onto an HTTP-style status code.

#pragma once

#include <stdexcept>

namespace fleet_sim {

/** @brief Base class for every failure raised by the fleet simulator. */
class FleetError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Caller-supplied input was rejected before any state changed. */
class ValidationError final : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief A vessel (or its route) does not exist in the store. */
class NotFoundError final : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief A store write could not be committed; the previous row remains. */
class PersistenceError : public FleetError {
  public:
    using FleetError::FleetError;
};

/** @brief The store could not be acquired within the configured timeout. */
class StoreTimeoutError final : public PersistenceError {
  public:
    using PersistenceError::PersistenceError;
};

}  // namespace fleet_sim
