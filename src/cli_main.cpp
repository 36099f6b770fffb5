#include "parking_menu.hpp"
#include "spot_registry.hpp"

#include <fmt/format.h>

#include <iostream>

static constexpr int kDefaultCapacity = 10;

static void print_usage(const char* program) {
    std::cerr << fmt::format("Usage: {} [capacity]\n", program)
              << fmt::format("  capacity  number of parking spots, 0..{} (default {})\n",
                             parking::SpotRegistry::kMaxCapacity, kDefaultCapacity);
}

int main(int argc, char** argv) {
    int capacity = kDefaultCapacity;
    if (argc > 2) {
        print_usage(argv[0]);
        return 2;
    }
    if (argc == 2 && !parking::try_parse_capacity(argv[1], capacity)) {
        std::cerr << fmt::format("Invalid capacity: '{}'\n", argv[1]);
        print_usage(argv[0]);
        return 2;
    }

    parking::SpotRegistry registry(capacity);

    std::cout << fmt::format("Parking Lot CLI ({} spots)\n", registry.capacity());
    return parking::run_menu(registry, std::cin, std::cout);
}
