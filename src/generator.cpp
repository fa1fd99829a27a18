#include <cassert>
#include <list>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include <tbb/blocked_range.h>
#include <tbb/parallel_reduce.h>

#include "generator.hpp"

using namespace std;

void checkDomain(number_t n, number_t minimum = 1) {
	if (n < minimum) {
		stringstream ss;
		ss << "n must be at least " << minimum << " (got " << n << ")";
		throw domain_error(ss.str());
	}
}

configurations_t baseLevel(number_t n) {
	assert((n == 1) || (n == 2));

	if (n == 1) {
		return {Configuration(cliques_t{{1}})};
	} else {
		return {
			Configuration(cliques_t{{1}, {2}}),
			Configuration(cliques_t{{1, 2}})
		};
	}
}

Configuration extendBy(const Configuration& parent, clique_t clique) {
	cliques_t cliques(parent.getCliques());
	cliques.push_back(move(clique));
	return Configuration(cliques).removeSubsets();
}

class TBBHelperExtend {
	public:
		list<Configuration> candidates;

		TBBHelperExtend(const configurations_t& _parents, number_t _n) :
			parents(_parents),
			n(_n) {}

		TBBHelperExtend(TBBHelperExtend& obj, tbb::split) :
			parents(obj.parents),
			n(obj.n) {}

		void operator()(const tbb::blocked_range<size_t>& range) {
			for (auto p = range.begin(); p != range.end(); ++p) {
				const auto& parent = parents[p];

				// close n on its own
				candidates.push_back(extendBy(parent, {n}));

				// ranges [i, n], longest last
				for (number_t i = n - 1; i >= 1; --i) {
					clique_t clique;
					for (number_t x = i; x <= n; ++x) {
						clique.push_back(x);
					}
					candidates.push_back(extendBy(parent, move(clique)));
				}
			}
		}

		void join(TBBHelperExtend& obj) {
			this->candidates.splice(this->candidates.end(), obj.candidates);
		}

	private:
		const configurations_t& parents;
		number_t n;
};

configurations_t extendLevel(const configurations_t& previous, number_t n) {
	checkDomain(n, 3);

	TBBHelperExtend helper(previous, n);
	tbb::parallel_reduce(tbb::blocked_range<size_t>(0, previous.size()), helper);

	// dedup (first occurrence wins) + validity filter
	unordered_set<Configuration> seen;
	configurations_t result;
	for (const auto& candidate : helper.candidates) {
		if (seen.insert(candidate).second && candidate.isValid()) {
			assert(satisfiesInvariant(candidate, n));
			result.push_back(candidate);
		}
	}

	return result;
}

levels_t generateLevels(number_t maxN) {
	checkDomain(maxN);

	levels_t levels;
	for (number_t n = 1; n <= maxN; ++n) {
		if (n <= 2) {
			levels.push_back(baseLevel(n));
		} else {
			levels.push_back(extendLevel(levels.back(), n));
		}
	}

	return levels;
}

configurations_t generateConfigurations(number_t n) {
	checkDomain(n);

	if (n <= 2) {
		return baseLevel(n);
	}

	auto levels = generateLevels(n);
	return move(levels.back());
}

bool satisfiesInvariant(const Configuration& config, number_t n) {
	auto membership = config.getNumberMembership();
	if (membership.size() != static_cast<size_t>(n)) {
		return false;
	}

	number_t expected = 1;
	for (const auto& kv : membership) {
		if ((kv.first != expected) || (kv.second < 1) || (kv.second > 2)) {
			return false;
		}
		++expected;
	}

	const auto& cliques = config.getCliques();
	for (size_t i = 0; i < cliques.size(); ++i) {
		for (size_t j = 0; j < cliques.size(); ++j) {
			if ((i != j) && isStrictSubset(cliques[i], cliques[j])) {
				return false;
			}
		}
	}

	return true;
}
