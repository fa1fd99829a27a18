#include <sstream>
#include <vector>

#include "renderer.hpp"

using namespace std;

const char* const Ansi::RED = "\x1b[31m";
const char* const Ansi::RESET = "\x1b[0m";

const char* Ansi::cliqueColor(size_t idx) {
	// green, blue, cyan, magenta, yellow, red, white, bright black
	static const char* const colors[] = {
		"\x1b[32m", "\x1b[34m", "\x1b[36m", "\x1b[35m",
		"\x1b[33m", "\x1b[31m", "\x1b[37m", "\x1b[90m"
	};
	return colors[idx % (sizeof(colors) / sizeof(colors[0]))];
}

string renderConfiguration(const Configuration& config, const membership_t& membership, bool color) {
	const auto& cliques = config.getCliques();
	number_t maxNumber = config.getMaxNumber();
	if (maxNumber == 0) {
		return "";
	}

	auto shared = [&membership](number_t x) {
		auto iter = membership.find(x);
		return (iter != membership.end()) && (iter->second == 2);
	};

	// precalc overlap flag per clique
	vector<bool> overlapping(cliques.size(), false);
	for (size_t c = 0; c < cliques.size(); ++c) {
		for (auto x : cliques[c]) {
			if (shared(x)) {
				overlapping[c] = true;
				break;
			}
		}
	}

	stringstream ss;
	auto bracket = [&ss, color](size_t c, char b) {
		if (color) {
			ss << Ansi::cliqueColor(c);
		}
		ss << b;
	};

	for (number_t pos = 1; pos <= maxNumber; ++pos) {
		if (pos > 1) {
			ss << " ";
		}

		for (size_t c = 0; c < cliques.size(); ++c) {
			if (!cliques[c].empty() && (cliques[c].front() == pos)) {
				bracket(c, shared(pos) ? '(' : '[');
			}
		}

		ss << pos;

		for (size_t c = 0; c < cliques.size(); ++c) {
			if (!cliques[c].empty() && (cliques[c].back() == pos)) {
				bracket(c, overlapping[c] ? ')' : ']');
			}
		}
	}

	if (color) {
		ss << Ansi::RESET;
	}

	return ss.str();
}

string renderConfiguration(const Configuration& config, bool color) {
	return renderConfiguration(config, config.getNumberMembership(), color);
}
