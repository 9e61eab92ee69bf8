#ifndef RKHASH_HPP
#define RKHASH_HPP

#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <types.hpp>

// rabin-karp rolling hash over several moduli at once
template <u64 G, u64... M>
class hash_t {
private:
  std::array<u64, sizeof...(M)> keys, coeff, inv;

  constexpr inline u64 fast_pow(u64 b, u64 e) const {
    u64 r = 1;
    b %= G;
    while (e) {
      if (e & 1) r = (r * b) % G;
      b = (b * b) % G;
      e >>= 1;
    }
    return r;
  }
  constexpr inline u64 fast_inv(u64 b) const { return fast_pow(b, G - 2ul); }
  constexpr inline void init() {
    u32 i = 0;
    for (auto m : { M... }) {
      keys[i]  = 0;
      coeff[i] = 1;
      inv[i]   = fast_inv(m);
      i++;
    }
    length = 0;
  }

public:
  u64 length;
  constexpr hash_t() { init(); }
  constexpr hash_t(const std::string_view &s) {
    init();
    for (auto &&c : s) add_right(static_cast<u8>(c));
  }
  constexpr friend bool operator==(const hash_t &a, const hash_t &b) {
    return a.length == b.length && a.keys == b.keys;
  }
  constexpr void add_right(u64 x) {
    u32 i = 0;
    for (auto m : { M... }) {
      keys[i]  = (keys[i] * m + x) % G;
      coeff[i] = (coeff[i] * m) % G;
      i++;
    }
    length++;
  }
  constexpr void remove_left(u64 x) {
    for (u32 i = 0; i < sizeof...(M); i++) {
      coeff[i] = (coeff[i] * inv[i]) % G;
      auto tmp = (x * coeff[i]) % G;
      keys[i]  = (keys[i] + G - tmp) % G;
    }
    length--;
  }
};

using rkhash = hash_t<0x3dad792b, 0x37f5bdcb, 0x3ce6a7af, 0x318d14ef>;

// first offset at or after `from` where `needle` occurs in `text`; `hash` is
// the hash of `needle` and every hash match is confirmed against the text
template <typename H>
std::optional<u64> rkfind(std::string_view text, std::string_view needle, const H &hash, u64 from = 0) {
  const u64 n = needle.size();
  if (n == 0 || from > text.size() || text.size() - from < n) return std::nullopt;
  H span;
  u64 i;
  for (i = from; i < from + n; i++) span.add_right(static_cast<u8>(text[i]));
  if (span == hash && text.substr(from, n) == needle) return from;
  for (; i < text.size(); i++) {
    span.remove_left(static_cast<u8>(text[i - n]));
    span.add_right(static_cast<u8>(text[i]));
    if (span == hash && text.substr(i + 1 - n, n) == needle) return i + 1 - n;
  }
  return std::nullopt;
}

#endif
