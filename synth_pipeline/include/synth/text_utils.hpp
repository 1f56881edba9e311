#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace synth {

// SHA-1 digest words (h0..h4) of the input bytes.
std::array<std::uint32_t, 5> sha1(std::string_view input);

// One-way deterministic masking used for pseudonymization:
// the lowercase hex SHA-1 digest of the input (40 chars).
std::string mask_string(std::string_view input);

// Random string of [A-Za-z0-9] with exactly `length` characters.
std::string random_string(std::size_t length, std::mt19937_64& rng);

// Number of digits after the decimal point in the shortest text form of v
// ("4.0" -> 1, "3.125" -> 3, "1e-05" -> 5).
int decimals_of(double v);

}  // namespace synth
