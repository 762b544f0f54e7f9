#include "chaumauth/tools.hpp"

#include <format>  // for format

#include <openssl/rand.h>  // for RAND_bytes

#include <array>        // for array
#include <cstdint>      // for uint8_t
#include <string_view>  // for string_view

#include "chaumauth/macro_tools.hpp"  // for OSSL_CHECK_OR_UNEXPECTED

namespace chaumauth {

namespace {

auto append_escaped(std::string &out, std::string_view const text) -> void {
  for (auto const ch : text) {
    auto const byte = static_cast<unsigned char>(ch);
    if (ch == '"' or ch == '\\') {
      out.push_back('\\');
      out.push_back(ch);
    } else if (byte < 0x20 or byte == 0x7f) {
      out += std::format("\\x{:02x}", byte);
    } else {
      out.push_back(ch);
    }
  }
}

}  // namespace

[[nodiscard("Must use generate_random_string return value")]]
auto generate_random_string(std::size_t const length) noexcept
    -> std::expected<std::string, std::string> {
  std::string_view constexpr char_pool =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";

  auto constexpr pool_size = char_pool.length();
  // Largest multiple of pool_size representable in one byte; bytes at or
  // above it are rejected so every character stays uniform.
  auto constexpr limit = 256UL - (256UL % pool_size);

  std::string random_string;
  random_string.reserve(length);

  std::array<uint8_t, 64> random_bytes{};
  while (random_string.size() < length) {
    OSSL_CHECK_OR_UNEXPECTED(
        RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())),
        "RAND_bytes failed")

    for (auto const byte : random_bytes) {
      if (random_string.size() == length) {
        break;
      }
      if (byte < limit) {
        random_string.push_back(char_pool[byte % pool_size]);
      }
    }
  }
  return random_string;
}

[[nodiscard]]
auto abbreviate(std::string const &token, std::size_t const keep) noexcept
    -> std::string {
  std::string shown;
  append_escaped(shown, std::string_view{token}.substr(0, keep));
  if (token.size() > keep) {
    shown += "...";
  }
  return shown;
}

[[nodiscard]]
auto printable(std::string_view const text) -> std::string {
  std::string quoted;
  quoted.reserve(text.size() + 2);
  quoted.push_back('"');
  append_escaped(quoted, text);
  quoted.push_back('"');
  return quoted;
}

}  // namespace chaumauth
