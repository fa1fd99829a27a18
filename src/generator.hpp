#ifndef GENERATOR_HPP
#define GENERATOR_HPP

#include <vector>

#include "configuration.hpp"
#include "sys.hpp"

typedef std::vector<configurations_t> levels_t;

// all valid configurations over 1..n, throws std::domain_error for n < 1
configurations_t generateConfigurations(number_t n);

// results for 1..maxN, index i holds n = i + 1
levels_t generateLevels(number_t maxN);

// one recursion step: build level n from the complete level n - 1 (n >= 3)
configurations_t extendLevel(const configurations_t& previous, number_t n);

// every number 1..n occurs in 1 or 2 cliques and no clique is a strict subset of another
bool satisfiesInvariant(const Configuration& config, number_t n);

#endif
