// Copyright 2026 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GLFIELD_LIB_ALGEBRA_FP64_GENERIC_H_
#define GLFIELD_LIB_ALGEBRA_FP64_GENERIC_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "algebra/field_error.h"
#include "algebra/sysdep.h"
#include "util/panic.h"

namespace glfield {

// Number of bits needed to represent X, i.e. floor(log2(x)) + 1 for x > 0.
constexpr size_t bit_width64(uint64_t x) {
  size_t bits = 0;
  for (; x != 0; x >>= 1) {
    ++bits;
  }
  return bits;
}

/*
Prime field F_p for a prime p < 2^64, one machine word per element.

The REDUCE policy supplies the field parameters and the reduction:

  struct Reduce {
    static constexpr uint64_t kModulus;     // p
    static constexpr uint64_t kGenerator;   // fixed generator of F_p^*
    // any x in [0, 2^64) -> x mod p
    static uint64_t canonical(uint64_t x);
    // (h * 2^64 + l) mod p, for any h, l
    static uint64_t reduce128(uint64_t l, uint64_t h);
  };

Elements are plain values.  An Elt may carry a raw integer >= p (for example
one decoded from bytes); every operation treats it as its residue, and
results of arithmetic are always in [0, p).  All operations are const and
return new values.  The trailing "f" marks the functional form of each
operator, as in F.mulf(a, b).
*/
template <class Reduce>
class Fp64Generic {
 public:
  static constexpr uint64_t kModulus = Reduce::kModulus;
  static constexpr size_t kBytes = sizeof(uint64_t);
  static constexpr size_t kBits = bit_width64(kModulus - 1);

  static_assert(kModulus > 2 && (kModulus & 1) == 1,
                "modulus must be an odd prime");

  struct Elt {
    uint64_t n = 0;

    // Equality of canonical representatives, so raw values >= p compare
    // equal to their residues.
    bool operator==(const Elt& y) const {
      return Reduce::canonical(n) == Reduce::canonical(y.n);
    }
    bool operator!=(const Elt& y) const { return !operator==(y); }
  };

  Fp64Generic() {}

  // The field object holds no state, but we disallow copies so that code
  // keeps passing `const Field&` around.
  Fp64Generic(const Fp64Generic&) = delete;
  Fp64Generic& operator=(const Fp64Generic&) = delete;

  Elt zero() const { return Elt{0}; }
  Elt one() const { return Elt{1}; }
  Elt generator() const { return of_scalar(Reduce::kGenerator); }

  static constexpr size_t field_bit_size() { return kBits; }

  // ------------------------------------------------------------------
  // Canonicalization

  Elt of_scalar(uint64_t x) const { return Elt{Reduce::canonical(x)}; }
  Elt from_raw_integer(uint64_t x) const { return of_scalar(x); }
  Elt from_base_type(uint64_t x) const { return of_scalar(x); }

  // The stored integer, not necessarily < p.
  uint64_t representative(const Elt& a) const { return a.n; }

  // The unique representative in [0, p).
  uint64_t canonical(const Elt& a) const { return Reduce::canonical(a.n); }

  bool equal(const Elt& a, const Elt& b) const { return a == b; }

  // ------------------------------------------------------------------
  // Arithmetic

  Elt addf(const Elt& a, const Elt& b) const {
    uint64_t s;
    uint64_t c = addcq(&s, a.n, b.n);
    return Elt{Reduce::reduce128(s, c)};
  }

  Elt subf(const Elt& a, const Elt& b) const {
    uint64_t x = Reduce::canonical(a.n);
    uint64_t y = Reduce::canonical(b.n);
    if (x >= y) {
      return Elt{x - y};
    }
    // x < y < p, so the sum stays below p
    return Elt{x + (kModulus - y)};
  }

  Elt negf(const Elt& a) const {
    uint64_t x = Reduce::canonical(a.n);
    return Elt{x == 0 ? 0 : kModulus - x};
  }

  Elt mulf(const Elt& a, const Elt& b) const {
    uint64_t l, h;
    mulq(&l, &h, a.n, b.n);
    return Elt{Reduce::reduce128(l, h)};
  }

  // a^e by square-and-multiply, least significant bit first.
  Elt powf(const Elt& a, uint64_t e) const {
    Elt r = one();
    Elt x = of_scalar(a.n);
    while (e != 0) {
      if (e & 1) {
        r = mulf(r, x);
      }
      e >>= 1;
      if (e != 0) {
        x = mulf(x, x);
      }
    }
    return r;
  }

  // a^(p-2) = 1/a, by Fermat.  Empty on a == 0.
  std::optional<Elt> invertf(const Elt& a, FieldError* err = nullptr) const {
    if (Reduce::canonical(a.n) == 0) {
      return fail(err, FieldError::kZeroInversion);
    }
    return powf(a, kModulus - 2);
  }

  std::optional<Elt> divf(const Elt& a, const Elt& b,
                          FieldError* err = nullptr) const {
    std::optional<Elt> binv = invertf(b, err);
    if (!binv.has_value()) {
      return std::nullopt;
    }
    return mulf(a, *binv);
  }

  // ------------------------------------------------------------------
  // Byte codec.  Encoders write the stored integer as-is; decoders keep the
  // decoded integer as-is.

  void to_bytes_be(uint8_t buf[/* kBytes */], const Elt& a) const {
    for (size_t i = 0; i < kBytes; ++i) {
      buf[i] = static_cast<uint8_t>(a.n >> (8 * (kBytes - 1 - i)));
    }
  }

  void to_bytes_le(uint8_t buf[/* kBytes */], const Elt& a) const {
    for (size_t i = 0; i < kBytes; ++i) {
      buf[i] = static_cast<uint8_t>(a.n >> (8 * i));
    }
  }

  // Decodes the first kBytes of BYTES[0..N).  Trailing bytes are ignored.
  std::optional<Elt> from_bytes_be(const uint8_t bytes[], size_t n,
                                   FieldError* err = nullptr) const {
    if (n < kBytes) {
      return fail(err, FieldError::kByteLength);
    }
    uint64_t v = 0;
    for (size_t i = 0; i < kBytes; ++i) {
      v = (v << 8) | bytes[i];
    }
    return Elt{v};
  }

  std::optional<Elt> from_bytes_le(const uint8_t bytes[], size_t n,
                                   FieldError* err = nullptr) const {
    if (n < kBytes) {
      return fail(err, FieldError::kByteLength);
    }
    uint64_t v = 0;
    for (size_t i = kBytes; i-- > 0;) {
      v = (v << 8) | bytes[i];
    }
    return Elt{v};
  }

  // Wire form: big-endian, appended to OUT.
  void serialize(std::vector<uint8_t>& out, const Elt& a) const {
    uint8_t buf[kBytes];
    to_bytes_be(buf, a);
    out.insert(out.end(), buf, buf + kBytes);
  }

  std::optional<Elt> deserialize(const uint8_t bytes[], size_t n,
                                 FieldError* err = nullptr) const {
    return from_bytes_be(bytes, n, err);
  }

  std::optional<Elt> deserialize(const std::vector<uint8_t>& bytes,
                                 FieldError* err = nullptr) const {
    return from_bytes_be(bytes.data(), bytes.size(), err);
  }

  // ------------------------------------------------------------------
  // Strings

  // Parses an untrusted hex string with optional "0x" prefix.  The prefix
  // is only recognized when the string is longer than two characters.
  // The parsed integer is kept as-is.
  std::optional<Elt> from_hex(const std::string& s,
                              FieldError* err = nullptr) const {
    size_t i = 0;
    if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
      i = 2;
    }
    if (i == s.size()) {
      return fail(err, FieldError::kInvalidHexString);
    }
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
      int d = hex_digit(s[i]);
      if (d < 0 || (v >> 60) != 0) {
        return fail(err, FieldError::kInvalidHexString);
      }
      v = (v << 4) | static_cast<uint64_t>(d);
    }
    return Elt{v};
  }

  // Parses a trusted constant, "0x"-prefixed hex or decimal, of any length,
  // reduced mod p.  Panics on malformed input; use from_hex() for anything
  // that did not come from the source code.
  Elt of_string(const char* s) const {
    check(s != nullptr, "of_string: null string");
    uint64_t base = 10;
    if (s[0] == '0' && s[1] == 'x') {
      base = 16;
      s += 2;
    }
    check(*s != '\0', "of_string: empty number");

    const Elt eb = of_scalar(base);
    Elt r = zero();
    for (; *s; ++s) {
      int d = hex_digit(*s);
      check(d >= 0 && static_cast<uint64_t>(d) < base,
            "of_string: invalid digit");
      r = addf(mulf(r, eb), of_scalar(static_cast<uint64_t>(d)));
    }
    return r;
  }

 private:
  static std::optional<Elt> fail(FieldError* err, FieldError why) {
    if (err != nullptr) {
      *err = why;
    }
    return std::nullopt;
  }

  static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }
};

// Reduction by 128-bit remainder.  Works for any odd prime below 2^64 and
// serves as the reference for the specialized reductions.
template <uint64_t kPrime, uint64_t kGen>
struct Fp64DivisionReduce {
  static constexpr uint64_t kModulus = kPrime;
  static constexpr uint64_t kGenerator = kGen;

  static inline uint64_t canonical(uint64_t x) { return x % kModulus; }

  static inline uint64_t reduce128(uint64_t l, uint64_t h) {
    return modq(l, h, kModulus);
  }
};

}  // namespace glfield

#endif  // GLFIELD_LIB_ALGEBRA_FP64_GENERIC_H_
