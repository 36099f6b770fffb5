#include "spot_registry.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>

namespace parking {

SpotRegistry::SpotRegistry(int capacity) {
    if (capacity < 0 || capacity > kMaxCapacity) {
        throw std::invalid_argument(
            fmt::format("capacity must be in [0, {}], got {}", kMaxCapacity, capacity));
    }
    // All spots start Free; the vector is never resized afterwards
    spots_.assign(static_cast<std::size_t>(capacity), SpotStatus::Free);
}

int SpotRegistry::capacity() const {
    return static_cast<int>(spots_.size());
}

AllocationResult SpotRegistry::allocate_first_free() {
    const SpotId id = find_first_free();
    if (id < 0) {
        return allocation_failed(SpotError::NoAvailableSpot);
    }
    // Message first: nothing below may throw once the spot changes state
    AllocationResult result{true, id, SpotError::None, fmt::format("Parked in spot {}", id)};
    spots_[id] = SpotStatus::Occupied;
    return result;
}

AllocationResult SpotRegistry::allocate_nearest(int position) {
    const SpotId id = find_nearest_free(position);
    if (id < 0) {
        return allocation_failed(SpotError::NoAvailableSpot);
    }
    // Message first: nothing below may throw once the spot changes state
    AllocationResult result{true, id, SpotError::None, fmt::format("Parked in spot {}", id)};
    spots_[id] = SpotStatus::Occupied;
    return result;
}

SpotResult SpotRegistry::allocate_specific(SpotId id) {
    if (!in_range(id)) {
        return spot_failed(SpotError::InvalidSpotId);
    }
    if (spots_[id] != SpotStatus::Free) {
        return spot_failed(SpotError::SpotUnavailable);
    }
    SpotResult result{true, SpotError::None, fmt::format("Parked in spot {}", id)};
    spots_[id] = SpotStatus::Occupied;
    return result;
}

SpotResult SpotRegistry::release(SpotId id) {
    // Out of range and "not occupied" are reported the same way
    if (!in_range(id) || spots_[id] != SpotStatus::Occupied) {
        return spot_failed(SpotError::SpotNotFound);
    }
    SpotResult result{true, SpotError::None, fmt::format("Released spot {}", id)};
    spots_[id] = SpotStatus::Free;
    return result;
}

SpotResult SpotRegistry::reserve(SpotId id, const std::string& details) {
    if (!in_range(id)) {
        return spot_failed(SpotError::InvalidSpotId);
    }
    if (spots_[id] != SpotStatus::Free) {
        return spot_failed(SpotError::SpotUnavailable);
    }
    SpotResult result{true, SpotError::None, fmt::format("Reserved spot {}", id)};
    // A Free spot has no entry, so emplace always inserts. The entry is built
    // completely before it is linked in; if that throws, the map is unchanged.
    reservations_.emplace(id, details);
    spots_[id] = SpotStatus::Reserved;
    return result;
}

SpotResult SpotRegistry::cancel_reservation(SpotId id) {
    if (!in_range(id) || spots_[id] != SpotStatus::Reserved) {
        return spot_failed(SpotError::InvalidOrNotReserved);
    }
    SpotResult result{true, SpotError::None, fmt::format("Canceled reservation for spot {}", id)};
    reservations_.erase(id);
    spots_[id] = SpotStatus::Free;
    return result;
}

std::vector<SpotSnapshot> SpotRegistry::snapshot() const {
    std::vector<SpotSnapshot> out;
    out.reserve(spots_.size());
    for (std::size_t i = 0; i < spots_.size(); ++i) {
        out.push_back(SpotSnapshot{static_cast<SpotId>(i), spots_[i]});
    }
    return out;
}

SpotId SpotRegistry::find_first_free() const {
    for (std::size_t i = 0; i < spots_.size(); ++i) {
        if (spots_[i] == SpotStatus::Free) {
            return static_cast<SpotId>(i);
        }
    }
    return -1;
}

SpotId SpotRegistry::find_nearest_free(int position) const {
    SpotId nearest = -1;
    long long min_distance = 0;

    for (std::size_t i = 0; i < spots_.size(); ++i) {
        if (spots_[i] != SpotStatus::Free) continue;

        // long long so that |id - position| cannot overflow for extreme positions
        const long long distance = std::llabs(static_cast<long long>(i) - static_cast<long long>(position));

        // strict '<' keeps the lowest id among equidistant spots
        if (nearest < 0 || distance < min_distance) {
            min_distance = distance;
            nearest = static_cast<SpotId>(i);
        }
    }
    return nearest;
}

bool SpotRegistry::status(SpotId id, SpotStatus& out_status) const {
    if (!in_range(id)) return false;
    out_status = spots_[id];
    return true;
}

bool SpotRegistry::reservation_details(SpotId id, std::string& out_details) const {
    auto it = reservations_.find(id);
    if (it == reservations_.end()) return false;
    out_details = it->second;
    return true;
}

int SpotRegistry::free_count() const {
    int count = 0;
    for (const auto status : spots_) {
        if (status == SpotStatus::Free) ++count;
    }
    return count;
}

int SpotRegistry::reservation_count() const {
    return static_cast<int>(reservations_.size());
}

std::string SpotRegistry::error_message(SpotError error) {
    switch (error) {
    case SpotError::None:
        return "OK";
    case SpotError::InvalidSpotId:
        return "Invalid spot ID";
    case SpotError::SpotUnavailable:
        return "Spot already occupied or reserved";
    case SpotError::SpotNotFound:
        return "Spot not found or already empty";
    case SpotError::InvalidOrNotReserved:
        return "Invalid spot ID or spot not reserved";
    case SpotError::NoAvailableSpot:
        return "No available spots";
    }
    return "Unknown error";
}

std::string SpotRegistry::status_label(SpotStatus status) {
    switch (status) {
    case SpotStatus::Free:
        return "Available";
    case SpotStatus::Occupied:
        return "Occupied";
    case SpotStatus::Reserved:
        return "Reserved";
    }
    return "Unknown";
}

bool SpotRegistry::in_range(SpotId id) const {
    return id >= 0 && static_cast<std::size_t>(id) < spots_.size();
}

AllocationResult SpotRegistry::allocation_failed(SpotError error) {
    return AllocationResult{false, -1, error, error_message(error)};
}

SpotResult SpotRegistry::spot_failed(SpotError error) {
    return SpotResult{false, error, error_message(error)};
}

} // namespace parking
