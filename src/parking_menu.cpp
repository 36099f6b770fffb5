#include "parking_menu.hpp"

#include <fmt/format.h>

#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace parking {

const char* const kInvalidSpotInput = "Invalid input. Please enter a valid spot number.";
const char* const kInvalidPositionInput = "Invalid input. Please enter a valid position.";

// Prints the prompt and reads one line. False means the input has ended.
static bool prompt_line(std::istream& in, std::ostream& out, const std::string& prompt, std::string& line) {
    out << prompt << std::flush;
    return static_cast<bool>(std::getline(in, line));
}

enum class NumberRead { Ok, Invalid, EndOfInput };

static NumberRead prompt_number(std::istream& in, std::ostream& out, const std::string& prompt, int& value) {
    std::string line;
    if (!prompt_line(in, out, prompt, line)) return NumberRead::EndOfInput;
    return try_parse_non_negative(line, value) ? NumberRead::Ok : NumberRead::Invalid;
}

static void print_error(std::ostream& out, const std::string& message) {
    out << fmt::format("Error: {}\n", message);
}

std::string trim_copy(const std::string& text) {
    const char* const ws = " \t\r\n\f\v";
    const auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return std::string();
    const auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

bool try_parse_non_negative(const std::string& line, int& out_value) {
    const std::string digits = trim_copy(line);
    if (digits.empty()) return false;

    // std::stoi would also accept signs and leading spaces; only plain digits are valid here
    for (const char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }

    try {
        std::size_t pos = 0;
        const int value = std::stoi(digits, &pos);
        if (pos != digits.size()) return false;
        out_value = value;
        return true;
    } catch (const std::out_of_range&) {
        return false; // too large for an int
    }
}

bool try_parse_capacity(const std::string& text, int& out_capacity) {
    int value = 0;
    if (!try_parse_non_negative(text, value) || value > SpotRegistry::kMaxCapacity) return false;
    out_capacity = value;
    return true;
}

void print_menu(std::ostream& out) {
    out << "\nParking Lot Menu:\n"
        << "1. Park car in next available spot\n"
        << "2. Park car in specific spot\n"
        << "3. Remove car from spot\n"
        << "4. List all spots\n"
        << "5. Park car in nearest available spot\n"
        << "6. Reserve a spot in advance\n"
        << "7. Cancel a reservation\n"
        << "8. Exit\n"
        << "9. Help\n";
}

void print_help(std::ostream& out) {
    out << "Parking Lot Help:\n"
        << "1. Park car in next available spot: Parks your car in the lowest-numbered available spot.\n"
        << "2. Park car in specific spot: Parks your car in the spot you choose, if it is available.\n"
        << "3. Remove car from spot: Removes the car from the specified spot.\n"
        << "4. List all spots: Shows every spot as Occupied, Reserved or Available.\n"
        << "5. Park car in nearest available spot: Parks your car in the available spot closest to your position.\n"
        << "6. Reserve a spot in advance: Holds an available spot for later, with a note.\n"
        << "7. Cancel a reservation: Releases a reserved spot.\n"
        << "8. Exit: Exits the parking lot system.\n"
        << "9. Help: Displays this help information.\n";
}

void print_spots(const SpotRegistry& registry, std::ostream& out) {
    const std::vector<SpotSnapshot> spots = registry.snapshot();
    if (spots.empty()) {
        out << "The parking lot has no spots.\n";
        return;
    }
    for (const auto& spot : spots) {
        std::string line = fmt::format("Spot {}: {}", spot.id, SpotRegistry::status_label(spot.status));
        std::string details;
        if (spot.status == SpotStatus::Reserved && registry.reservation_details(spot.id, details)
            && !details.empty()) {
            line += fmt::format(" ({})", details);
        }
        out << line << "\n";
    }
}

int run_menu(SpotRegistry& registry, std::istream& in, std::ostream& out) {
    std::string line;
    while (true) {
        print_menu(out);
        if (!prompt_line(in, out, "Choose an option: ", line)) break;

        int choice = 0;
        if (!try_parse_non_negative(line, choice) || choice < 1 || choice > 9) {
            out << "Invalid choice. Please choose a valid option.\n";
            continue;
        }

        if (choice == 8) {
            out << "Exiting...\n";
            break;
        }

        int id = -1;
        NumberRead read = NumberRead::Ok;
        const char* invalid_message = kInvalidSpotInput;

        switch (choice) {
        case 1: {
            const AllocationResult r = registry.allocate_first_free();
            if (r.success) {
                out << fmt::format("Car parked in spot {}\n", r.spot_id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 2: {
            read = prompt_number(in, out, "Enter the spot number where you want to park the car: ", id);
            if (read != NumberRead::Ok) break;
            const SpotResult r = registry.allocate_specific(id);
            if (r.success) {
                out << fmt::format("Car parked in spot {}\n", id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 3: {
            read = prompt_number(in, out, "Enter the spot number to remove the car from: ", id);
            if (read != NumberRead::Ok) break;
            const SpotResult r = registry.release(id);
            if (r.success) {
                out << fmt::format("Car removed from spot {}\n", id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 4:
            out << "Parking lot status:\n";
            print_spots(registry, out);
            break;
        case 5: {
            int position = 0;
            invalid_message = kInvalidPositionInput;
            read = prompt_number(in, out, "Enter your current position: ", position);
            if (read != NumberRead::Ok) break;
            const AllocationResult r = registry.allocate_nearest(position);
            if (r.success) {
                out << fmt::format("Car parked in nearest available spot {}\n", r.spot_id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 6: {
            read = prompt_number(in, out, "Enter the spot number to reserve: ", id);
            if (read != NumberRead::Ok) break;
            std::string details;
            if (!prompt_line(in, out, "Enter reservation details: ", details)) {
                read = NumberRead::EndOfInput;
                break;
            }
            const SpotResult r = registry.reserve(id, trim_copy(details));
            if (r.success) {
                out << fmt::format("Spot {} reserved\n", id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 7: {
            read = prompt_number(in, out, "Enter the spot number to cancel the reservation: ", id);
            if (read != NumberRead::Ok) break;
            const SpotResult r = registry.cancel_reservation(id);
            if (r.success) {
                out << fmt::format("Reservation for spot {} canceled\n", id);
            } else {
                print_error(out, r.message);
            }
            break;
        }
        case 9:
            print_help(out);
            break;
        }

        if (read == NumberRead::Invalid) {
            out << invalid_message << "\n";
        } else if (read == NumberRead::EndOfInput) {
            break;
        }
    }

    // End of input is handled like Exit
    return 0;
}

} // namespace parking
