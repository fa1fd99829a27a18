#ifndef RENDERER_HPP
#define RENDERER_HPP

#include <string>

#include "configuration.hpp"
#include "sys.hpp"

namespace Ansi {
	extern const char* const RED;
	extern const char* const RESET;

	// bracket colour of the clique with the given enumeration index
	const char* cliqueColor(std::size_t idx);
}

/*
 * Bracket picture of a finished configuration, e.g. "[1 (2) 3 4)".
 *
 * "(" opens a clique whose first number is shared with another clique, ")" closes a
 * clique that shares any number. Everything else uses square brackets.
 */
std::string renderConfiguration(const Configuration& config, const membership_t& membership, bool color);
std::string renderConfiguration(const Configuration& config, bool color);

#endif
