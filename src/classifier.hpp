#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "configuration.hpp"
#include "sys.hpp"

/*
 * Size of the clique containing n, 0 if there is none.
 *
 * If n is part of two cliques, the first one in canonical order (smaller minimum
 * element) is reported, independent of the order the cliques were built in.
 */
number_t endingCliqueSize(const Configuration& config, number_t n);

breakdown_t breakdownByEndingSize(const configurations_t& configs, number_t n);

#endif
