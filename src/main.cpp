// Interactive shell over a single simulated memory space.
// Usage: memspace_shell [capacity]

#include "shell.hpp"

#include <iostream>

int main(int argc, char **argv)
{
	return memspace::shell_main(argc, argv, std::cin, std::cout, std::cerr);
}
