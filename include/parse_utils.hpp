#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include "arg_parser.hpp"

// Parse an unsigned integer from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse an unsigned integer option from the parser.
// Invalid input: missing option, non-numeric, or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const ArgParser& parser, const std::string& flag, unsigned int min,
                        unsigned int max, bool& ok);

// Parse a byte size from a string with an optional unit suffix.
// Format: unsigned integer followed by B, K/KB/KiB, M/MB/MiB, G/GB/GiB, T/TB/TiB
// (case-insensitive). All multiples are binary, so "10M" is 10485760 bytes.
// Bounds: [0, SIZE_MAX].
// Invalid input: bad unit, parse failure, or overflow sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Parse a byte size option from the parser using the rules above.
size_t parse_bytes(const ArgParser& parser, const std::string& flag, bool& ok);

#endif // PARSE_UTILS_HPP
