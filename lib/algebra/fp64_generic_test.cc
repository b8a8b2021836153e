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

#include "algebra/fp64_generic.h"

#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "algebra/field_error.h"
#include "algebra/field_traits.h"
#include "algebra/fp_goldilocks.h"
#include "gtest/gtest.h"

namespace glfield {
namespace {

// Goldilocks through the generic 128-bit remainder, and a second prime to
// make sure nothing in the template depends on the Goldilocks shape.
using FpGoldilocksByDivision =
    Fp64Generic<Fp64DivisionReduce<0xFFFFFFFF00000001u, 7>>;
using FpMersenne61 = Fp64Generic<Fp64DivisionReduce<0x1FFFFFFFFFFFFFFFu, 37>>;

static_assert(is_prime_field64<FpGoldilocksByDivision>::value, "");
static_assert(is_prime_field64<FpMersenne61>::value, "");
static_assert(!is_prime_field64<int>::value, "");
static_assert(!is_prime_field64<std::vector<uint64_t>>::value, "");
static_assert(FpMersenne61::kBits == 61, "");

template <class Field>
class Fp64GenericTest : public ::testing::Test {
 public:
  using Elt = typename Field::Elt;
  static constexpr uint64_t p = Field::kModulus;

  const Field F;

  // Raw words worth trying, including values >= p.
  std::vector<uint64_t> boundary_words() const {
    return {0,          1,          2,         3,
            p - 2,      p - 1,      p,         p + 1,
            p / 2,      0xFFFFFFFFu, 1ull << 32, 1ull << 63,
            ~uint64_t{0}, ~uint64_t{0} - 1};
  }

  // Boundary words plus pseudo-random ones, fixed seed.
  std::vector<Elt> sample(bool canonical_only) const {
    std::vector<Elt> v;
    for (uint64_t w : boundary_words()) {
      if (!canonical_only || w < p) {
        v.push_back(Elt{w});
      }
    }
    std::mt19937_64 rng(0x5eed);
    for (size_t i = 0; i < 32; ++i) {
      uint64_t w = rng();
      v.push_back(canonical_only ? F.of_scalar(w) : Elt{w});
    }
    return v;
  }
};

TYPED_TEST_SUITE_P(Fp64GenericTest);

TYPED_TEST_P(Fp64GenericTest, Identities) {
  const auto& F = this->F;
  for (const auto& a : this->sample(false)) {
    EXPECT_EQ(F.addf(a, F.zero()), a);
    EXPECT_EQ(F.mulf(a, F.one()), a);
    EXPECT_EQ(F.addf(a, F.negf(a)), F.zero());
    EXPECT_EQ(F.subf(a, a), F.zero());
    EXPECT_EQ(F.mulf(a, F.zero()), F.zero());
  }
}

TYPED_TEST_P(Fp64GenericTest, ResultsAreCanonical) {
  const auto& F = this->F;
  const uint64_t p = TestFixture::p;
  auto xs = this->sample(false);
  for (const auto& a : xs) {
    EXPECT_LT(F.representative(F.negf(a)), p);
    for (const auto& b : xs) {
      EXPECT_LT(F.representative(F.addf(a, b)), p);
      EXPECT_LT(F.representative(F.subf(a, b)), p);
      EXPECT_LT(F.representative(F.mulf(a, b)), p);
    }
  }
}

TYPED_TEST_P(Fp64GenericTest, CommutativeAndAssociative) {
  const auto& F = this->F;
  auto xs = this->sample(false);
  for (size_t i = 0; i < xs.size(); ++i) {
    const auto& a = xs[i];
    const auto& b = xs[(i + 7) % xs.size()];
    const auto& c = xs[(i + 13) % xs.size()];
    EXPECT_EQ(F.addf(a, b), F.addf(b, a));
    EXPECT_EQ(F.mulf(a, b), F.mulf(b, a));
    EXPECT_EQ(F.addf(F.addf(a, b), c), F.addf(a, F.addf(b, c)));
    EXPECT_EQ(F.mulf(F.mulf(a, b), c), F.mulf(a, F.mulf(b, c)));
  }
}

TYPED_TEST_P(Fp64GenericTest, Distributive) {
  const auto& F = this->F;
  auto xs = this->sample(false);
  for (size_t i = 0; i < xs.size(); ++i) {
    const auto& a = xs[i];
    const auto& b = xs[(i + 3) % xs.size()];
    const auto& c = xs[(i + 5) % xs.size()];
    EXPECT_EQ(F.mulf(a, F.addf(b, c)), F.addf(F.mulf(a, b), F.mulf(a, c)));
    EXPECT_EQ(F.mulf(a, F.subf(b, c)), F.subf(F.mulf(a, b), F.mulf(a, c)));
  }
}

TYPED_TEST_P(Fp64GenericTest, SubIsAddNeg) {
  const auto& F = this->F;
  auto xs = this->sample(false);
  for (const auto& a : xs) {
    for (const auto& b : xs) {
      EXPECT_EQ(F.subf(a, b), F.addf(a, F.negf(b)));
    }
  }
}

TYPED_TEST_P(Fp64GenericTest, Inverse) {
  const auto& F = this->F;
  for (const auto& a : this->sample(false)) {
    FieldError err = FieldError::kByteLength;
    auto ainv = F.invertf(a, &err);
    if (a == F.zero()) {
      EXPECT_FALSE(ainv.has_value());
      EXPECT_EQ(err, FieldError::kZeroInversion);
      continue;
    }
    ASSERT_TRUE(ainv.has_value());
    EXPECT_EQ(F.mulf(a, *ainv), F.one());

    auto q = F.divf(F.one(), a);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(*q, *ainv);
  }
}

TYPED_TEST_P(Fp64GenericTest, Fermat) {
  const auto& F = this->F;
  const uint64_t p = TestFixture::p;
  for (const auto& a : this->sample(false)) {
    if (a == F.zero()) {
      EXPECT_EQ(F.powf(a, p - 1), F.zero());
    } else {
      EXPECT_EQ(F.powf(a, p - 1), F.one());
    }
    EXPECT_EQ(F.powf(a, 0), F.one());
    EXPECT_EQ(F.powf(a, 1), a);
    EXPECT_EQ(F.powf(a, p), a);
  }
}

TYPED_TEST_P(Fp64GenericTest, PowMatchesRepeatedMul) {
  const auto& F = this->F;
  for (const auto& a : this->sample(true)) {
    auto r = F.one();
    for (uint64_t e = 0; e < 20; ++e) {
      EXPECT_EQ(F.powf(a, e), r);
      r = F.mulf(r, a);
    }
  }
}

TYPED_TEST_P(Fp64GenericTest, RawWordsActAsResidues) {
  const auto& F = this->F;
  const uint64_t p = TestFixture::p;
  using Elt = typename TestFixture::Elt;

  const Elt raw{p + 5};
  const Elt five = F.of_scalar(5);
  EXPECT_EQ(raw, five);
  EXPECT_TRUE(F.equal(raw, five));
  EXPECT_EQ(F.representative(raw), p + 5);
  EXPECT_EQ(F.canonical(raw), 5u);
  EXPECT_EQ(F.representative(F.from_raw_integer(p + 5)), 5u);
  EXPECT_EQ(F.from_base_type(p), F.zero());
  EXPECT_NE(Elt{p + 1}, Elt{p + 2});

  const Elt seven = F.of_scalar(7);
  EXPECT_EQ(F.addf(raw, seven), F.of_scalar(12));
  EXPECT_EQ(F.subf(seven, raw), F.of_scalar(2));
  EXPECT_EQ(F.subf(raw, seven), F.negf(F.of_scalar(2)));
  EXPECT_EQ(F.mulf(raw, seven), F.of_scalar(35));
  EXPECT_EQ(F.powf(raw, 2), F.of_scalar(25));
  EXPECT_EQ(F.negf(Elt{p}), F.zero());
  EXPECT_FALSE(F.invertf(Elt{p}).has_value());
}

TYPED_TEST_P(Fp64GenericTest, ByteRoundTrip) {
  const auto& F = this->F;
  using Elt = typename TestFixture::Elt;
  for (uint64_t w : this->boundary_words()) {
    uint8_t be[TypeParam::kBytes], le[TypeParam::kBytes];
    F.to_bytes_be(be, Elt{w});
    F.to_bytes_le(le, Elt{w});
    for (size_t i = 0; i < TypeParam::kBytes; ++i) {
      EXPECT_EQ(be[i], le[TypeParam::kBytes - 1 - i]);
    }

    auto xbe = F.from_bytes_be(be, sizeof(be));
    auto xle = F.from_bytes_le(le, sizeof(le));
    ASSERT_TRUE(xbe.has_value());
    ASSERT_TRUE(xle.has_value());
    // raw words survive the codec unreduced
    EXPECT_EQ(F.representative(*xbe), w);
    EXPECT_EQ(F.representative(*xle), w);

    std::vector<uint8_t> wire;
    F.serialize(wire, Elt{w});
    ASSERT_EQ(wire.size(), TypeParam::kBytes);
    auto xs = F.deserialize(wire);
    ASSERT_TRUE(xs.has_value());
    EXPECT_EQ(F.representative(*xs), w);
  }
}

TYPED_TEST_P(Fp64GenericTest, HexRoundTrip) {
  const auto& F = this->F;
  for (uint64_t w : this->boundary_words()) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%" PRIx64, w);
    std::string bare(buf);
    std::string prefixed = "0x" + bare;

    auto a = F.from_hex(bare);
    auto b = F.from_hex(prefixed);
    ASSERT_TRUE(a.has_value()) << bare;
    ASSERT_TRUE(b.has_value()) << prefixed;
    EXPECT_EQ(F.representative(*a), w);
    EXPECT_EQ(F.representative(*b), w);
    EXPECT_EQ(*a, *b);
  }
}

REGISTER_TYPED_TEST_SUITE_P(Fp64GenericTest, Identities, ResultsAreCanonical,
                            CommutativeAndAssociative, Distributive,
                            SubIsAddNeg, Inverse, Fermat,
                            PowMatchesRepeatedMul, RawWordsActAsResidues,
                            ByteRoundTrip, HexRoundTrip);

using FieldTypes =
    ::testing::Types<FpGoldilocks, FpGoldilocksByDivision, FpMersenne61>;
INSTANTIATE_TYPED_TEST_SUITE_P(Fp64, Fp64GenericTest, FieldTypes);

TEST(Fp64Generic, BitWidth) {
  EXPECT_EQ(bit_width64(0), 0u);
  EXPECT_EQ(bit_width64(1), 1u);
  EXPECT_EQ(bit_width64(2), 2u);
  EXPECT_EQ(bit_width64(0xFF), 8u);
  EXPECT_EQ(bit_width64(0x100), 9u);
  EXPECT_EQ(bit_width64(~uint64_t{0}), 64u);
  EXPECT_EQ(FpGoldilocksByDivision::field_bit_size(), 64u);
  EXPECT_EQ(FpMersenne61::field_bit_size(), 61u);
}

TEST(Fp64Generic, FoldAgreesWithDivision) {
  const FpGoldilocks F;
  const FpGoldilocksByDivision G;
  std::mt19937_64 rng(1234);
  for (size_t i = 0; i < 10000; ++i) {
    uint64_t a = rng(), b = rng();
    if (i % 4 == 1) a |= 0xFFFFFFFF00000000u;
    if (i % 4 == 2) b = ~uint64_t{0} - (b & 0xFF);
    EXPECT_EQ(F.representative(F.mulf(FpGoldilocks::Elt{a},
                                      FpGoldilocks::Elt{b})),
              G.representative(G.mulf(FpGoldilocksByDivision::Elt{a},
                                      FpGoldilocksByDivision::Elt{b})));
    EXPECT_EQ(F.representative(F.addf(FpGoldilocks::Elt{a},
                                      FpGoldilocks::Elt{b})),
              G.representative(G.addf(FpGoldilocksByDivision::Elt{a},
                                      FpGoldilocksByDivision::Elt{b})));
  }
}

}  // namespace
}  // namespace glfield
