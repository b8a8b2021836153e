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

#ifndef GLFIELD_LIB_ALGEBRA_FIELD_TRAITS_H_
#define GLFIELD_LIB_ALGEBRA_FIELD_TRAITS_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace glfield {

/*
Compile-time description of "a prime field with one-word elements".

Higher-level code is written as templates over a Field type and receives a
`const Field& F`.  Any type providing the members below qualifies; there is
no common base class.  Use

  static_assert(is_prime_field64<Field>::value, "...");

at the top of such templates to get a readable error instead of a page of
substitution failures.
*/
namespace field_traits_internal {

template <class Field>
using Elt = typename Field::Elt;

template <class Field>
const Field& field();

template <class Field>
const Elt<Field>& elt();

template <class T, class U>
using Same = std::is_same<T, U>;

// Identities, arithmetic, and conversions must return Elt.
template <class Field>
using ArithmeticResults = std::conjunction<
    Same<decltype(field<Field>().zero()), Elt<Field>>,
    Same<decltype(field<Field>().one()), Elt<Field>>,
    Same<decltype(field<Field>().generator()), Elt<Field>>,
    Same<decltype(field<Field>().addf(elt<Field>(), elt<Field>())),
         Elt<Field>>,
    Same<decltype(field<Field>().subf(elt<Field>(), elt<Field>())),
         Elt<Field>>,
    Same<decltype(field<Field>().negf(elt<Field>())), Elt<Field>>,
    Same<decltype(field<Field>().mulf(elt<Field>(), elt<Field>())),
         Elt<Field>>,
    Same<decltype(field<Field>().powf(elt<Field>(), uint64_t{})), Elt<Field>>,
    Same<decltype(field<Field>().of_scalar(uint64_t{})), Elt<Field>>,
    Same<decltype(field<Field>().from_raw_integer(uint64_t{})), Elt<Field>>,
    Same<decltype(field<Field>().from_base_type(uint64_t{})), Elt<Field>>>;

// Fallible operations report failure through an empty optional.
template <class Field>
using FallibleResults = std::conjunction<
    Same<decltype(field<Field>().invertf(elt<Field>())),
         std::optional<Elt<Field>>>,
    Same<decltype(field<Field>().divf(elt<Field>(), elt<Field>())),
         std::optional<Elt<Field>>>,
    Same<decltype(field<Field>().from_bytes_be(
             std::declval<const uint8_t*>(), size_t{})),
         std::optional<Elt<Field>>>,
    Same<decltype(field<Field>().from_bytes_le(
             std::declval<const uint8_t*>(), size_t{})),
         std::optional<Elt<Field>>>,
    Same<decltype(field<Field>().deserialize(std::declval<const uint8_t*>(),
                                             size_t{})),
         std::optional<Elt<Field>>>,
    Same<decltype(field<Field>().from_hex(std::declval<std::string>())),
         std::optional<Elt<Field>>>>;

template <class Field>
using Members = std::void_t<
    decltype(Field::kModulus), decltype(Field::kBits), decltype(Field::kBytes),
    decltype(Field::field_bit_size()),
    decltype(field<Field>().equal(elt<Field>(), elt<Field>())),
    decltype(elt<Field>() == elt<Field>()),
    decltype(field<Field>().representative(elt<Field>())),
    decltype(field<Field>().to_bytes_be(std::declval<uint8_t*>(),
                                        elt<Field>())),
    decltype(field<Field>().to_bytes_le(std::declval<uint8_t*>(),
                                        elt<Field>())),
    decltype(field<Field>().serialize(std::declval<std::vector<uint8_t>&>(),
                                      elt<Field>())),
    ArithmeticResults<Field>, FallibleResults<Field>>;

}  // namespace field_traits_internal

template <class Field, class = void>
struct is_prime_field64 : std::false_type {};

template <class Field>
struct is_prime_field64<Field, field_traits_internal::Members<Field>>
    : std::conjunction<field_traits_internal::ArithmeticResults<Field>,
                       field_traits_internal::FallibleResults<Field>> {};

}  // namespace glfield

#endif  // GLFIELD_LIB_ALGEBRA_FIELD_TRAITS_H_
