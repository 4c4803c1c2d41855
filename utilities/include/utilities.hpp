#ifndef UTILITIES_HPP
#define UTILITIES_HPP

#include <string>
#include <vector>
#include <random>

// Case-insensitive (ASCII) equality
bool iequals(const std::string& a, const std::string& b);

std::string join(const std::vector<std::string>& items, const std::string& separator);

// Lowercase hex characters drawn from rng, e.g. "3fa9c01e"
std::string random_hex_suffix(std::mt19937& rng, std::size_t length);

#endif // UTILITIES_HPP
