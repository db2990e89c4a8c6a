#include "base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace repostore {

static const char _alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t n = (uint8_t(data[i]) << 16) | (uint8_t(data[i + 1]) << 8) | uint8_t(data[i + 2]);
    out += _alphabet[(n >> 18) & 63];
    out += _alphabet[(n >> 12) & 63];
    out += _alphabet[(n >> 6) & 63];
    out += _alphabet[n & 63];
  }

  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t n = uint8_t(data[i]) << 16;
    out += _alphabet[(n >> 18) & 63];
    out += _alphabet[(n >> 12) & 63];
    out += "==";
  }
  else if (rest == 2) {
    uint32_t n = (uint8_t(data[i]) << 16) | (uint8_t(data[i + 1]) << 8);
    out += _alphabet[(n >> 18) & 63];
    out += _alphabet[(n >> 12) & 63];
    out += _alphabet[(n >> 6) & 63];
    out += '=';
  }

  return out;
}

std::string base64_decode(const std::string& encoded) {
  std::array<int, 256> table;
  table.fill(-1);
  for (int i = 0; i < 64; i++) {
    table[(unsigned char)_alphabet[i]] = i;
  }

  std::string out;
  out.reserve(encoded.size() / 4 * 3);

  uint32_t bits = 0;
  int nbits = 0;
  size_t symbols = 0;
  size_t padding = 0;

  for (unsigned char c : encoded) {
    if (std::isspace(c)) {
      continue;
    }
    if (c == '=') {
      padding++;
      symbols++;
      continue;
    }
    if (padding > 0 || table[c] < 0) {
      throw std::invalid_argument("invalid character in base64 input");
    }

    bits = (bits << 6) | table[c];
    nbits += 6;
    symbols++;

    if (nbits >= 8) {
      nbits -= 8;
      out += char((bits >> nbits) & 0xFF);
    }
  }

  if (symbols % 4 != 0 || padding > 2) {
    throw std::invalid_argument("truncated base64 input");
  }

  return out;
}

}  // namespace repostore
