#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>

// Parse an unsigned integer from a string.
// Format: decimal digits only, no sign, no trailing characters.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only, no sign, no trailing characters.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, K/KB, M/MB, G/GB or T/TB
// (case-insensitive, powers of 1024).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, overflow or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse milliseconds with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s, or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Interpret a flag value taken from a config file.
// Empty, "1", "true", "yes" and "on" are true; "0", "false", "no" and "off" are false.
// Anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
