#include <gtest/gtest.h>

#include "parking_menu.hpp"
#include "spot_registry.hpp"

#include <sstream>
#include <string>

using parking::SpotRegistry;
using parking::SpotStatus;

// ---------- Helpers ----------
static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Runs the menu over a scripted input and returns everything it printed.
static std::string run_script(SpotRegistry& reg, const std::string& script, int* exit_code = nullptr) {
    std::istringstream in(script);
    std::ostringstream out;
    const int rc = parking::run_menu(reg, in, out);
    if (exit_code) *exit_code = rc;
    return out.str();
}

static SpotStatus status_of(const SpotRegistry& reg, int id) {
    SpotStatus s = SpotStatus::Free;
    EXPECT_TRUE(reg.status(id, s));
    return s;
}

// ---------- Tests: input parsing ----------
TEST(InputParsing, ValidNumbers) {
    int v = -1;
    EXPECT_TRUE(parking::try_parse_non_negative("0", v));
    EXPECT_EQ(v, 0);

    EXPECT_TRUE(parking::try_parse_non_negative("42", v));
    EXPECT_EQ(v, 42);

    EXPECT_TRUE(parking::try_parse_non_negative("  7\r\n", v)); // surrounding whitespace ignored
    EXPECT_EQ(v, 7);

    EXPECT_TRUE(parking::try_parse_non_negative("007", v));
    EXPECT_EQ(v, 7);
}

TEST(InputParsing, InvalidNumbers) {
    int v = 123;
    EXPECT_FALSE(parking::try_parse_non_negative("", v));
    EXPECT_FALSE(parking::try_parse_non_negative("   ", v));
    EXPECT_FALSE(parking::try_parse_non_negative("-1", v));
    EXPECT_FALSE(parking::try_parse_non_negative("+1", v));
    EXPECT_FALSE(parking::try_parse_non_negative("1 2", v));
    EXPECT_FALSE(parking::try_parse_non_negative("12x", v));
    EXPECT_FALSE(parking::try_parse_non_negative("abc", v));
    EXPECT_FALSE(parking::try_parse_non_negative("3.5", v));
    EXPECT_FALSE(parking::try_parse_non_negative("99999999999999999999", v));
    EXPECT_EQ(v, 123); // never written on failure
}

TEST(InputParsing, CapacityWithinLimit) {
    int capacity = -1;
    EXPECT_TRUE(parking::try_parse_capacity("0", capacity));
    EXPECT_EQ(capacity, 0);

    EXPECT_TRUE(parking::try_parse_capacity("25", capacity));
    EXPECT_EQ(capacity, 25);

    EXPECT_TRUE(parking::try_parse_capacity(std::to_string(SpotRegistry::kMaxCapacity), capacity));
    EXPECT_EQ(capacity, SpotRegistry::kMaxCapacity);
}

TEST(InputParsing, CapacityRejectsOversizedOrMalformed) {
    int capacity = 10;
    EXPECT_FALSE(parking::try_parse_capacity(std::to_string(SpotRegistry::kMaxCapacity + 1), capacity));
    EXPECT_FALSE(parking::try_parse_capacity("2000000000", capacity));
    EXPECT_FALSE(parking::try_parse_capacity("99999999999999999999", capacity));
    EXPECT_FALSE(parking::try_parse_capacity("-5", capacity));
    EXPECT_FALSE(parking::try_parse_capacity("ten", capacity));
    EXPECT_FALSE(parking::try_parse_capacity("", capacity));
    EXPECT_EQ(capacity, 10); // default kept
}

TEST(InputParsing, TrimCopy) {
    EXPECT_EQ(parking::trim_copy("  Alice  "), "Alice");
    EXPECT_EQ(parking::trim_copy("\tBob Smith\r\n"), "Bob Smith");
    EXPECT_EQ(parking::trim_copy("   "), "");
    EXPECT_EQ(parking::trim_copy(""), "");
}

// ---------- Tests: menu actions ----------
TEST(Menu, ParkInNextAvailableSpotAndList) {
    SpotRegistry reg(2);
    int rc = -1;
    const std::string out = run_script(reg, "1\n4\n8\n", &rc);

    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(contains(out, "Car parked in spot 0"));
    EXPECT_TRUE(contains(out, "Spot 0: Occupied"));
    EXPECT_TRUE(contains(out, "Spot 1: Available"));
    EXPECT_TRUE(contains(out, "Exiting..."));
}

TEST(Menu, ParkSpecificAndRemove) {
    SpotRegistry reg(3);
    const std::string out = run_script(reg, "2\n2\n2\n2\n3\n2\n3\n2\n8\n");

    EXPECT_TRUE(contains(out, "Car parked in spot 2"));
    EXPECT_TRUE(contains(out, "Error: Spot already occupied or reserved"));
    EXPECT_TRUE(contains(out, "Car removed from spot 2"));
    EXPECT_TRUE(contains(out, "Error: Spot not found or already empty"));
    EXPECT_EQ(status_of(reg, 2), SpotStatus::Free);
}

TEST(Menu, ParkInNearestSpot) {
    SpotRegistry reg(5);
    ASSERT_TRUE(reg.allocate_specific(3).success);

    const std::string out = run_script(reg, "5\n3\n8\n");
    EXPECT_TRUE(contains(out, "Car parked in nearest available spot 2"));
    EXPECT_EQ(status_of(reg, 2), SpotStatus::Occupied);
}

TEST(Menu, ReserveWithTrimmedDetailsThenCancel) {
    SpotRegistry reg(2);
    std::string out = run_script(reg, "6\n1\n   Alice 9am  \n4\n8\n");

    EXPECT_TRUE(contains(out, "Spot 1 reserved"));
    EXPECT_TRUE(contains(out, "Spot 1: Reserved (Alice 9am)"));

    std::string details;
    ASSERT_TRUE(reg.reservation_details(1, details));
    EXPECT_EQ(details, "Alice 9am");

    out = run_script(reg, "7\n1\n7\n1\n8\n");
    EXPECT_TRUE(contains(out, "Reservation for spot 1 canceled"));
    EXPECT_TRUE(contains(out, "Error: Invalid spot ID or spot not reserved"));
    EXPECT_EQ(status_of(reg, 1), SpotStatus::Free);
    EXPECT_EQ(reg.reservation_count(), 0);
}

TEST(Menu, ReportsOutOfRangeSpot) {
    SpotRegistry reg(1);
    const std::string out = run_script(reg, "2\n5\n6\n5\nnote\n8\n");

    EXPECT_TRUE(contains(out, "Error: Invalid spot ID"));
    EXPECT_EQ(reg.free_count(), 1);
}

TEST(Menu, FullLotReportsNoAvailableSpot) {
    SpotRegistry reg(1);
    const std::string out = run_script(reg, "1\n1\n5\n0\n8\n");

    EXPECT_TRUE(contains(out, "Car parked in spot 0"));
    EXPECT_TRUE(contains(out, "Error: No available spots"));
}

// ---------- Tests: bad input ----------
TEST(Menu, InvalidNumbersDoNotMutateState) {
    SpotRegistry reg(3);
    const std::string out = run_script(reg, "2\nabc\n3\n-1\n6\nx\n7\n\n5\nfar\n8\n");

    EXPECT_TRUE(contains(out, "Invalid input. Please enter a valid spot number."));
    EXPECT_TRUE(contains(out, "Invalid input. Please enter a valid position."));
    EXPECT_EQ(reg.free_count(), 3);
    EXPECT_EQ(reg.reservation_count(), 0);
    EXPECT_TRUE(contains(out, "Exiting..."));
}

TEST(Menu, InvalidChoiceShowsMenuAgain) {
    SpotRegistry reg(1);
    const std::string out = run_script(reg, "0\n10\nhello\n8\n");

    std::size_t count = 0;
    for (std::size_t pos = out.find("Invalid choice"); pos != std::string::npos;
         pos = out.find("Invalid choice", pos + 1)) {
        ++count;
    }
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(reg.free_count(), 1);
}

TEST(Menu, HelpListsEveryChoice) {
    SpotRegistry reg(1);
    const std::string out = run_script(reg, "9\n8\n");

    EXPECT_TRUE(contains(out, "Parking Lot Help:"));
    EXPECT_TRUE(contains(out, "1. Park car in next available spot:"));
    EXPECT_TRUE(contains(out, "9. Help:"));
}

TEST(Menu, EmptyLotListing) {
    SpotRegistry reg(0);
    const std::string out = run_script(reg, "4\n8\n");
    EXPECT_TRUE(contains(out, "The parking lot has no spots."));
}

TEST(Menu, EndOfInputExitsCleanly) {
    SpotRegistry reg(2);
    int rc = -1;

    // Input ends at the menu prompt
    std::string out = run_script(reg, "1\n", &rc);
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(contains(out, "Car parked in spot 0"));

    // Input ends while waiting for a spot number
    out = run_script(reg, "3\n", &rc);
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(status_of(reg, 0), SpotStatus::Occupied);

    // Input ends before the reservation details
    out = run_script(reg, "6\n1\n", &rc);
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(status_of(reg, 1), SpotStatus::Free);
}
