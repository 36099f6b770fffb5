#pragma once

#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file spot_registry.hpp
 * @brief Public API for the in-memory parking spot registry.
 *
 * This header defines:
 * - Domain types: SpotStatus, SpotError, SpotSnapshot
 * - Result types returned by registry operations
 * - SpotRegistry: the allocation API (park, release, reserve, cancel, list)
 *
 * Model:
 * - A fixed number of spots with ids [0..capacity-1], set at construction.
 * - Each spot is Free, Occupied or Reserved (never two at once).
 * - Reservation details exist for a spot if and only if it is Reserved.
 */

namespace parking {

/**
 * @brief Spot identifier type.
 *
 * Kept as an alias for readability in public APIs.
 */
using SpotId = int;

/**
 * @brief Status of a single spot.
 */
enum class SpotStatus {
    Free,     /**< Available for parking or reservation. */
    Occupied, /**< A car is parked here. */
    Reserved  /**< Held for future use, not occupied. */
};

/**
 * @brief Error kinds reported by registry operations.
 *
 * @details
 * Cancellation reports one combined kind for "out of range" and "not reserved",
 * while parking and reservation distinguish the two.
 */
enum class SpotError {
    None,                 /**< Operation succeeded. */
    InvalidSpotId,        /**< Spot id is outside [0..capacity-1]. */
    SpotUnavailable,      /**< Spot exists but is not Free. */
    SpotNotFound,         /**< Release target is out of range or not Occupied. */
    InvalidOrNotReserved, /**< Cancel target is out of range or not Reserved. */
    NoAvailableSpot       /**< No Free spot for an automatic allocation. */
};

/**
 * @brief One entry of a registry snapshot.
 */
struct SpotSnapshot {
    SpotId id;         /**< Spot identifier. */
    SpotStatus status; /**< Status at the time of the snapshot. */
};

/**
 * @brief Result of an allocation that picks or confirms a spot.
 */
struct AllocationResult {
    bool success;        /**< True if a spot was allocated. */
    SpotId spot_id;      /**< Allocated spot on success; -1 otherwise. */
    SpotError error;     /**< SpotError::None on success. */
    std::string message; /**< Human-readable result description (useful for CLI & tests). */
};

/**
 * @brief Result of an operation on an explicitly named spot.
 */
struct SpotResult {
    bool success;        /**< True if the state transition happened. */
    SpotError error;     /**< SpotError::None on success. */
    std::string message; /**< Human-readable result description. */
};

/**
 * @brief In-memory registry of parking spots and reservations.
 *
 * @details
 * All operations are synchronous. Every mutating operation either applies
 * the full transition (status change and reservation map update) or leaves
 * the registry untouched.
 *
 * ### Thread-safety
 * None. The registry is owned by a single caller.
 *
 * ### Allocation
 * Automatic allocation uses linear scans in ascending id order, so results
 * are deterministic: the lowest id wins every tie.
 */
class SpotRegistry {
public:
    /**
     * @brief Largest capacity a registry accepts.
     */
    static constexpr int kMaxCapacity = 100000;

    /**
     * @brief Creates a registry with @p capacity Free spots and no reservations.
     *
     * @param capacity Number of spots in [0, kMaxCapacity]; zero is allowed.
     * @throws std::invalid_argument if @p capacity is negative or above kMaxCapacity.
     */
    explicit SpotRegistry(int capacity);

    /** @brief Number of spots (fixed for the registry's lifetime). */
    int capacity() const;

    /**
     * @brief Parks in the lowest-numbered Free spot.
     * @return The allocated spot, or SpotError::NoAvailableSpot.
     */
    AllocationResult allocate_first_free();

    /**
     * @brief Parks in the Free spot closest to @p position.
     *
     * @param position Any integer; it need not name an existing spot.
     * @return The allocated spot, or SpotError::NoAvailableSpot.
     *
     * @details
     * Distance is |id - position|. Among equidistant spots the lowest id wins.
     */
    AllocationResult allocate_nearest(int position);

    /**
     * @brief Parks in spot @p id.
     * @return SpotError::InvalidSpotId if out of range,
     *         SpotError::SpotUnavailable if the spot is Occupied or Reserved.
     */
    SpotResult allocate_specific(SpotId id);

    /**
     * @brief Frees an Occupied spot.
     * @return SpotError::SpotNotFound if @p id is out of range or not Occupied.
     *
     * @note Releasing a Reserved spot is an error; use cancel_reservation().
     */
    SpotResult release(SpotId id);

    /**
     * @brief Reserves a Free spot and stores @p details verbatim.
     * @return SpotError::InvalidSpotId or SpotError::SpotUnavailable on failure.
     */
    SpotResult reserve(SpotId id, const std::string& details);

    /**
     * @brief Cancels a reservation, returning the spot to Free.
     * @return SpotError::InvalidOrNotReserved if @p id is out of range or not Reserved.
     */
    SpotResult cancel_reservation(SpotId id);

    /**
     * @brief Lists every spot with its status, ascending by id.
     */
    std::vector<SpotSnapshot> snapshot() const;

    /**
     * @brief Returns the lowest Free id without allocating it, or -1.
     */
    SpotId find_first_free() const;

    /**
     * @brief Returns the Free spot closest to @p position without allocating it, or -1.
     *
     * Uses the same tie-break as allocate_nearest().
     */
    SpotId find_nearest_free(int position) const;

    /**
     * @brief Reads the status of spot @p id.
     * @return False if @p id is out of range.
     */
    bool status(SpotId id, SpotStatus& out_status) const;

    /**
     * @brief Reads the reservation details stored for spot @p id.
     * @return False if the spot does not exist or is not Reserved.
     */
    bool reservation_details(SpotId id, std::string& out_details) const;

    /** @brief Number of Free spots. */
    int free_count() const;

    /** @brief Number of active reservations. */
    int reservation_count() const;

    /**
     * @brief Fixed human-readable text for an error kind.
     */
    static std::string error_message(SpotError error);

    /**
     * @brief Display label for a status ("Available", "Occupied", "Reserved").
     */
    static std::string status_label(SpotStatus status);

private:
    std::vector<SpotStatus> spots_; /**< Status per spot; index == spot id. */

    /**
     * @brief Reservation details keyed by spot id.
     *
     * @details
     * Holds an entry for exactly the spots whose status is Reserved.
     */
    std::unordered_map<SpotId, std::string> reservations_;

    bool in_range(SpotId id) const;

    static AllocationResult allocation_failed(SpotError error);
    static SpotResult spot_failed(SpotError error);
};

} // namespace parking
