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

#ifndef GLFIELD_LIB_ALGEBRA_SYSDEP_H_
#define GLFIELD_LIB_ALGEBRA_SYSDEP_H_

#include <cstdint>

namespace glfield {

// Double-width primitives on 64-bit words.  Compilers that provide a
// 128-bit integer type get it; everything else falls back to 32-bit limbs.

// (*h, *l) = a * b
static inline void mulq(uint64_t* l, uint64_t* h, uint64_t a, uint64_t b) {
#if defined(__SIZEOF_INT128__)
  unsigned __int128 p = static_cast<unsigned __int128>(a) * b;
  *l = static_cast<uint64_t>(p);
  *h = static_cast<uint64_t>(p >> 64);
#else
  uint64_t a0 = a & 0xFFFFFFFFu, a1 = a >> 32;
  uint64_t b0 = b & 0xFFFFFFFFu, b1 = b >> 32;
  uint64_t p00 = a0 * b0;
  uint64_t p01 = a0 * b1;
  uint64_t p10 = a1 * b0;
  uint64_t p11 = a1 * b1;
  // middle column cannot overflow: (2^32-1) + 2 * (2^32-1) < 2^64
  uint64_t mid = (p00 >> 32) + (p01 & 0xFFFFFFFFu) + (p10 & 0xFFFFFFFFu);
  *l = (mid << 32) | (p00 & 0xFFFFFFFFu);
  *h = p11 + (p01 >> 32) + (p10 >> 32) + (mid >> 32);
#endif
}

// *s = a + b mod 2^64, returns the carry out.
static inline uint64_t addcq(uint64_t* s, uint64_t a, uint64_t b) {
  uint64_t t = a + b;
  *s = t;
  return t < a ? 1 : 0;
}

// *d = a - b mod 2^64, returns the borrow out.
static inline uint64_t subbq(uint64_t* d, uint64_t a, uint64_t b) {
  *d = a - b;
  return a < b ? 1 : 0;
}

// Returns (h * 2^64 + l) mod m for m > 0.
static inline uint64_t modq(uint64_t l, uint64_t h, uint64_t m) {
#if defined(__SIZEOF_INT128__)
  unsigned __int128 x = (static_cast<unsigned __int128>(h) << 64) | l;
  return static_cast<uint64_t>(x % m);
#else
  // Shift-subtract over the 128 bits, most significant first.  The running
  // remainder r < m, so 2r + 1 may need one extra bit; track it in `top`.
  uint64_t r = 0;
  for (int i = 127; i >= 0; --i) {
    uint64_t bit = (i >= 64) ? ((h >> (i - 64)) & 1) : ((l >> i) & 1);
    uint64_t top = r >> 63;
    r = (r << 1) | bit;
    if (top || r >= m) {
      r -= m;
    }
  }
  return r;
#endif
}

}  // namespace glfield

#endif  // GLFIELD_LIB_ALGEBRA_SYSDEP_H_
