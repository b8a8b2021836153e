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

#include "util/log.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace glfield {
namespace {
enum LogLevel current_level = WARNING;

const char* level_tag(enum LogLevel l) {
  switch (l) {
    case ERROR:
      return "E";
    case WARNING:
      return "W";
    case INFO:
      return "I";
  }
  return "?";
}

double elapsed_seconds() {
  using clock = std::chrono::steady_clock;
  static const clock::time_point start = clock::now();
  return std::chrono::duration<double>(clock::now() - start).count();
}
}  // namespace

void set_log_level(enum LogLevel l) { current_level = l; }

enum LogLevel log_level() { return current_level; }

void log(enum LogLevel l, const char* format, ...) {
  if (l > current_level) {
    return;
  }
  fprintf(stdout, "%s %10.6f ", level_tag(l), elapsed_seconds());

  va_list ap;
  va_start(ap, format);
  vfprintf(stdout, format, ap);
  va_end(ap);

  fputc('\n', stdout);
  fflush(stdout);
}

}  // namespace glfield
