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

#ifndef GLFIELD_LIB_UTIL_PANIC_H_
#define GLFIELD_LIB_UTIL_PANIC_H_

namespace glfield {

// Aborts the program with message WHY unless TRUTH holds.  Reserved for
// broken invariants and malformed trusted input; recoverable failures are
// returned to the caller instead.
void check(bool truth, const char* why);

}  // namespace glfield

#endif  // GLFIELD_LIB_UTIL_PANIC_H_
