#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <cstddef>
#include <functional>
#include <vector>

#include "sys.hpp"

/*
 * Immutable collection of cliques over the numbers 1..n.
 *
 * Cliques are kept in the order they were supplied (enumeration order), every
 * clique itself sorted and free of duplicates. Equality and hashing only look at
 * the canonical key: the lexicographically sorted list of distinct cliques.
 */
class Configuration {
	public:
		explicit Configuration(const cliques_t& cliques);

		const cliques_t& getCliques() const;
		const cliques_t& getCanonicalCliques() const;
		std::size_t getSize() const;
		number_t getMaxNumber() const;

		membership_t getNumberMembership() const;
		bool isValid() const;
		Configuration removeSubsets() const;

		std::size_t hash() const;

		bool operator==(const Configuration& other) const;
		bool operator!=(const Configuration& other) const;

	private:
		cliques_t cliques;
		cliques_t canonical;
		std::size_t hashValue;
};

typedef std::vector<Configuration> configurations_t;

// true if a is a strict subset of b, both sorted
bool isStrictSubset(const clique_t& a, const clique_t& b);

namespace std {
	template<>
	struct hash<Configuration> {
		std::size_t operator()(const Configuration& obj) const;
	};
}

#endif
