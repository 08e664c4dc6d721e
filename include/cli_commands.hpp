#pragma once

#include <iostream>
#include <optional>

#include "options.hpp"

namespace cli {

/**
 * @brief Handle `--help` and `--version`.
 *
 * Returns `0` after printing, or `std::nullopt` when neither was requested.
 */
std::optional<int> handle_info(const Options& opts, std::ostream& os = std::cout);

/**
 * @brief Print the planned commands for `--dry-run`.
 *
 * Returns the exit code when a dry run was requested, `std::nullopt`
 * otherwise.
 */
std::optional<int> handle_dry_run(const Options& opts, std::ostream& os = std::cout);

/** @brief Configure the logger from @a opts.logging. */
void setup_logging(const Options& opts);

/**
 * @brief Execute one sync run and translate failures into an exit code.
 *
 * Errors are printed to stderr and logged.
 */
int handle_sync_run(const Options& opts);

/**
 * @brief Full command line flow: parse, answer info requests, dry run or
 *        sync.
 */
int run(int argc, char* argv[]);

} // namespace cli
