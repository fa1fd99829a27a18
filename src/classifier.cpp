#include <algorithm>

#include "classifier.hpp"

using namespace std;

number_t endingCliqueSize(const Configuration& config, number_t n) {
	for (const auto& clique : config.getCanonicalCliques()) {
		if (binary_search(clique.begin(), clique.end(), n)) {
			return static_cast<number_t>(clique.size());
		}
	}
	return 0;
}

breakdown_t breakdownByEndingSize(const configurations_t& configs, number_t n) {
	breakdown_t result;
	for (const auto& config : configs) {
		++result[endingCliqueSize(config, n)];
	}
	return result;
}
