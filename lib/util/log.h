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

#ifndef GLFIELD_LIB_UTIL_LOG_H_
#define GLFIELD_LIB_UTIL_LOG_H_

namespace glfield {

enum LogLevel { ERROR = 0, WARNING = 1, INFO = 2 };

// Messages above the current level are dropped.  The default is WARNING.
void set_log_level(enum LogLevel l);
enum LogLevel log_level();

// printf-style logging to stdout, prefixed with the elapsed wall time.
void log(enum LogLevel l, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace glfield

#endif  // GLFIELD_LIB_UTIL_LOG_H_
