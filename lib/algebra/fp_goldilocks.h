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

#ifndef GLFIELD_LIB_ALGEBRA_FP_GOLDILOCKS_H_
#define GLFIELD_LIB_ALGEBRA_FP_GOLDILOCKS_H_

#include <cstdint>

#include "algebra/field_traits.h"
#include "algebra/fp64_generic.h"

namespace glfield {
// Optimized implementation of Fp(2^64 - 2^32 + 1), the "Goldilocks" prime.
//
// With EPS = 2^32 - 1 we have
//   2^64 = EPS      (mod p)
//   2^96 = -1       (mod p)
// so a 128-bit value x = l + 2^64 * (hl + 2^32 * hh) reduces to
//   l - hh + hl * EPS  (mod p)
// with no division.

/*
This struct contains the reduction policy for the Goldilocks field.
*/
struct GoldilocksReduce {
  static constexpr uint64_t kModulus = 0xFFFFFFFF00000001u;
  static constexpr uint64_t kGenerator = 7;
  static constexpr uint64_t kEpsilon = 0xFFFFFFFFu;  // 2^64 mod p

  // 2p > 2^64, so one conditional subtraction suffices.
  static inline uint64_t canonical(uint64_t x) {
    return x >= kModulus ? x - kModulus : x;
  }

  static inline uint64_t reduce128(uint64_t l, uint64_t h) {
    uint64_t hh = h >> 32;
    uint64_t hl = h & kEpsilon;

    // t0 = l - hh.  On borrow the word holds l - hh + 2^64; adding p
    // instead of 2^64 means subtracting EPS, which cannot underflow since
    // hh < 2^32.
    uint64_t t0;
    if (subbq(&t0, l, hh)) {
      t0 -= kEpsilon;
    }

    // hl * EPS <= (2^32 - 1)^2 fits in one word.
    uint64_t t1 = hl * kEpsilon;

    // On carry the word lost 2^64 = EPS (mod p).  The wrapped sum is at
    // most 2^64 - 2^33, so adding EPS back cannot carry again.
    uint64_t t2;
    if (addcq(&t2, t0, t1)) {
      t2 += kEpsilon;
    }
    return canonical(t2);
  }
};

using FpGoldilocks = Fp64Generic<GoldilocksReduce>;

static_assert(is_prime_field64<FpGoldilocks>::value,
              "FpGoldilocks must provide the field operations");
static_assert(FpGoldilocks::kBits == 64, "p - 1 needs 64 bits");

// The one shared instance.  The field object is stateless; any number of
// threads may use it concurrently.
extern const FpGoldilocks goldilocks_field;

}  // namespace glfield

#endif  // GLFIELD_LIB_ALGEBRA_FP_GOLDILOCKS_H_
