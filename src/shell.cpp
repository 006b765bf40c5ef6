// shell.cpp
// Commands:
//   malloc <length>
//   free <address>
//   defrag
//   dump
//   lists
//   stats
//   help
//   exit / quit

#include "shell.hpp"
#include "errors.hpp"

#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace memspace
{

static void print_help(std::ostream &out)
{
	out << "Available commands:\n"
	    << "  malloc <length>   - allocate <length> words (first fit)\n"
	    << "  free <address>    - free the block based at <address>\n"
	    << "  defrag            - merge adjacent free blocks\n"
	    << "  dump              - show all blocks in address order\n"
	    << "  lists             - show the raw free and allocated lists\n"
	    << "  stats             - show memory statistics (e.g., fragmentation)\n"
	    << "  help              - show this help message\n"
	    << "  exit | quit       - exit the program\n";
}

// Whole-token integer parse: "5abc" and "" are rejected.
static bool parse_int(const std::string &text, int &value)
{
	std::istringstream iss(text);
	int parsed = 0;
	if (!(iss >> parsed) || !iss.eof())
		return false;
	value = parsed;
	return true;
}

// Reads exactly one integer argument from the rest of a command line.
static bool read_single_int(std::istringstream &iss, int &value)
{
	std::string arg;
	std::string extra;
	if (!(iss >> arg) || (iss >> extra))
		return false;
	return parse_int(arg, value);
}

int run_shell(MemorySpace &space, std::istream &in, std::ostream &out)
{
	out << "Memory space of " << space.capacity() << " words\n";
	print_help(out);

	std::string line;
	while (true)
	{
		out << "\n";
		out << "memspace> " << std::flush;
		if (!std::getline(in, line))
			break;

		std::istringstream iss(line);
		std::string cmd;
		if (!(iss >> cmd))
			continue; // empty line

		if (cmd == "malloc")
		{
			int length = 0;
			if (!read_single_int(iss, length))
			{
				out << "Usage: malloc <length>\n";
				continue;
			}
			int address = space.malloc(length);
			if (address < 0)
				out << "Allocation of " << length << " word(s) failed\n";
			else
				out << "Allocated address=" << address << " for length=" << length << "\n";
		}
		else if (cmd == "free")
		{
			int address = -1;
			if (!read_single_int(iss, address))
			{
				out << "Usage: free <address>\n";
				continue;
			}
			try
			{
				space.free(address);
				out << "Freed address=" << address << "\n";
			}
			catch (const InvalidFree &e)
			{
				out << "Free failed: " << e.what() << "\n";
			}
		}
		else if (cmd == "defrag")
		{
			int merges = space.defrag();
			out << "Defrag merged " << merges << " block pair(s)\n";
		}
		else if (cmd == "dump")
		{
			space.dump(out);
		}
		else if (cmd == "lists")
		{
			out << space.to_string() << "\n";
		}
		else if (cmd == "stats")
		{
			space.print_stats(out);
		}
		else if (cmd == "help")
		{
			print_help(out);
		}
		else if (cmd == "exit" || cmd == "quit")
		{
			break;
		}
		else
		{
			out << "Unknown command: " << cmd << " (type 'help' for usage)\n";
		}
	}

	return 0;
}

int shell_main(int argc, const char *const *argv, std::istream &in, std::ostream &out,
               std::ostream &err)
{
	int capacity = DEFAULT_SHELL_CAPACITY;
	if (argc > 2 || (argc == 2 && !parse_int(argv[1], capacity)))
	{
		err << "Usage: " << (argc > 0 ? argv[0] : "memspace_shell") << " [capacity]\n";
		return 1;
	}

	try
	{
		MemorySpace space(capacity);
		return run_shell(space, in, out);
	}
	catch (const InvalidCapacity &e)
	{
		err << "Error: " << e.what() << "\n";
		return 1;
	}
}

} // namespace memspace
