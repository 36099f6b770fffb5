#pragma once

#include "spot_registry.hpp"

#include <iosfwd>
#include <string>

/**
 * @file parking_menu.hpp
 * @brief Line-oriented numbered menu over a SpotRegistry.
 *
 * The menu reads from any std::istream and writes to any std::ostream, so the
 * executable runs it on stdin/stdout and the tests run it on string streams.
 */

namespace parking {

/**
 * @brief Returns @p text without leading and trailing whitespace.
 */
std::string trim_copy(const std::string& text);

/**
 * @brief Parses a non-negative decimal integer from a line of input.
 *
 * @param line Raw input line; surrounding whitespace is ignored.
 * @param out_value Parsed value on success; untouched on failure.
 * @return True if the trimmed line is only digits and fits in an int.
 *
 * @details
 * Signs, embedded spaces, trailing garbage ("12x") and empty input are rejected.
 */
bool try_parse_non_negative(const std::string& line, int& out_value);

/**
 * @brief Parses a registry capacity from a command-line argument.
 *
 * @return True if @p text is a non-negative integer no larger than
 *         SpotRegistry::kMaxCapacity; @p out_capacity is untouched otherwise.
 */
bool try_parse_capacity(const std::string& text, int& out_capacity);

/** @brief Writes the numbered menu. */
void print_menu(std::ostream& out);

/** @brief Writes one line of help per menu choice. */
void print_help(std::ostream& out);

/** @brief Writes one "Spot <id>: <status>" line per spot. */
void print_spots(const SpotRegistry& registry, std::ostream& out);

/**
 * @brief Runs the interactive menu until Exit is chosen or input ends.
 *
 * @param registry Registry mutated by the menu actions (owned by the caller).
 * @param in Source of menu choices and arguments, one per line.
 * @param out Destination for prompts and results.
 * @return Process exit status (always 0).
 *
 * @details
 * Bad input never mutates the registry; the loop reports it and shows the
 * menu again.
 */
int run_menu(SpotRegistry& registry, std::istream& in, std::ostream& out);

} // namespace parking
