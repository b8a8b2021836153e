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

#ifndef GLFIELD_LIB_ALGEBRA_FIELD_ERROR_H_
#define GLFIELD_LIB_ALGEBRA_FIELD_ERROR_H_

namespace glfield {

// Recoverable failures of field operations.  Fallible operations return an
// empty std::optional and, when the caller passes a non-null FieldError*,
// store the kind there.
enum class FieldError {
  kZeroInversion,     // inverse of, or division by, zero
  kInvalidHexString,  // malformed or out-of-range hex input
  kByteLength,        // fewer than kBytes bytes to decode
};

inline const char* field_error_name(FieldError e) {
  switch (e) {
    case FieldError::kZeroInversion:
      return "zero has no multiplicative inverse";
    case FieldError::kInvalidHexString:
      return "invalid hex string";
    case FieldError::kByteLength:
      return "not enough bytes for a field element";
  }
  return "unknown field error";
}

}  // namespace glfield

#endif  // GLFIELD_LIB_ALGEBRA_FIELD_ERROR_H_
