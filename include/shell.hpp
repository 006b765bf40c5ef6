// shell.hpp
// Interactive command loop over a MemorySpace, implemented in src/shell.cpp.

#pragma once

#include "memory_space.hpp"

#include <iosfwd>

namespace memspace
{

constexpr int DEFAULT_SHELL_CAPACITY = 64 * 1024; // words

// Reads commands from in until end of input or exit/quit, writing all
// responses to out. Bad arguments print a usage line and the loop goes on.
// Returns the exit status (always 0).
int run_shell(MemorySpace &space, std::istream &in, std::ostream &out);

// Entry point behind memspace_shell: argv may carry one capacity argument.
// Returns 1 on a malformed or non-positive capacity, otherwise the status
// of run_shell.
int shell_main(int argc, const char *const *argv, std::istream &in, std::ostream &out,
               std::ostream &err);

} // namespace memspace
