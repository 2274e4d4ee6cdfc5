// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "softbuffer/Config.hpp"

#include <cassert>
#include <cstdlib>

void test_parse_bool_flag() {
  assert(sb::parse_bool_flag("1") == true);
  assert(sb::parse_bool_flag("TRUE") == true);
  assert(sb::parse_bool_flag("yes") == true);
  assert(sb::parse_bool_flag("On") == true);
  assert(sb::parse_bool_flag("0") == false);
  assert(sb::parse_bool_flag("false") == false);
  assert(sb::parse_bool_flag("off") == false);
  assert(!sb::parse_bool_flag("maybe"));
  assert(!sb::parse_bool_flag(""));
}

void test_from_environment() {
  ::unsetenv("SOFTBUFFER_NO_SHM");
  assert(sb::Config::from_environment().allow_shared_memory);

  ::setenv("SOFTBUFFER_NO_SHM", "1", 1);
  assert(!sb::Config::from_environment().allow_shared_memory);

  ::setenv("SOFTBUFFER_NO_SHM", "no", 1);
  assert(sb::Config::from_environment().allow_shared_memory);

  ::setenv("SOFTBUFFER_NO_SHM", "garbage", 1);
  assert(sb::Config::from_environment().allow_shared_memory);

  ::unsetenv("SOFTBUFFER_NO_SHM");
}

int main() {
  test_parse_bool_flag();
  test_from_environment();
}
