// text_utils.cpp
//
// String primitives shared by the synthesizers: SHA-1 masking, random
// alphanumeric strings and decimal-place counting.

#include "synth/text_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

#include "synth/value.hpp"

namespace synth {

std::array<std::uint32_t, 5> sha1(std::string_view input) {
  const std::uint64_t bit_len = static_cast<std::uint64_t>(input.size()) * 8ULL;
  std::vector<std::uint8_t> msg(input.begin(), input.end());
  msg.push_back(0x80);
  while ((msg.size() % 64) != 56) msg.push_back(0);
  for (int i = 7; i >= 0; --i) {
    msg.push_back(static_cast<std::uint8_t>((bit_len >> (i * 8)) & 0xFF));
  }

  std::uint32_t h0 = 0x67452301;
  std::uint32_t h1 = 0xEFCDAB89;
  std::uint32_t h2 = 0x98BADCFE;
  std::uint32_t h3 = 0x10325476;
  std::uint32_t h4 = 0xC3D2E1F0;

  auto rol = [](std::uint32_t v, int s) { return (v << s) | (v >> (32 - s)); };

  for (std::size_t chunk = 0; chunk < msg.size(); chunk += 64) {
    std::uint32_t w[80]{};
    for (int i = 0; i < 16; ++i) {
      const std::size_t b = chunk + static_cast<std::size_t>(i) * 4;
      w[i] = (static_cast<std::uint32_t>(msg[b]) << 24) |
             (static_cast<std::uint32_t>(msg[b + 1]) << 16) |
             (static_cast<std::uint32_t>(msg[b + 2]) << 8) |
             (static_cast<std::uint32_t>(msg[b + 3]));
    }
    for (int i = 16; i < 80; ++i) {
      w[i] = rol(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    std::uint32_t a = h0, b = h1, c = h2, d = h3, e = h4;
    for (int i = 0; i < 80; ++i) {
      std::uint32_t f = 0;
      std::uint32_t k = 0;
      if (i < 20) {
        f = (b & c) | ((~b) & d);
        k = 0x5A827999;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDC;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6;
      }
      const std::uint32_t temp = rol(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = rol(b, 30);
      b = a;
      a = temp;
    }

    h0 += a;
    h1 += b;
    h2 += c;
    h3 += d;
    h4 += e;
  }

  return {h0, h1, h2, h3, h4};
}

std::string mask_string(std::string_view input) {
  const auto digest = sha1(input);
  char buf[41];
  std::snprintf(buf, sizeof(buf), "%08x%08x%08x%08x%08x", digest[0],
                digest[1], digest[2], digest[3], digest[4]);
  return std::string(buf, 40);
}

std::string random_string(std::size_t length, std::mt19937_64& rng) {
  static constexpr char alphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphabet) - 2);
  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(alphabet[pick(rng)]);
  }
  return out;
}

int decimals_of(double v) {
  const std::string s = format_double(v);

  // Split off an exponent, if any: digits = mantissa decimals - exponent.
  const std::size_t e_pos = s.find_first_of("eE");
  const std::string mantissa = s.substr(0, e_pos);
  int exponent = 0;
  if (e_pos != std::string::npos) {
    exponent = std::atoi(s.c_str() + e_pos + 1);
  }

  int digits = 0;
  const std::size_t dot = mantissa.rfind('.');
  if (dot != std::string::npos) {
    digits = static_cast<int>(mantissa.size() - dot - 1);
  }
  digits -= exponent;
  return digits < 0 ? 0 : digits;
}

}  // namespace synth
