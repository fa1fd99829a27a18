#include <algorithm>

#include <boost/functional/hash.hpp>

#include "configuration.hpp"

using namespace std;

clique_t normalizeClique(const clique_t& input) {
	clique_t result(input);
	sort(result.begin(), result.end());
	result.erase(unique(result.begin(), result.end()), result.end());
	result.shrink_to_fit();
	return result;
}

Configuration::Configuration(const cliques_t& cliques_) {
	cliques.reserve(cliques_.size());
	for (const auto& c : cliques_) {
		cliques.push_back(normalizeClique(c));
	}

	// canonical key = set of sets
	canonical = cliques;
	sort(canonical.begin(), canonical.end());
	canonical.erase(unique(canonical.begin(), canonical.end()), canonical.end());

	hashValue = boost::hash_range(canonical.begin(), canonical.end());
}

const cliques_t& Configuration::getCliques() const {
	return cliques;
}

const cliques_t& Configuration::getCanonicalCliques() const {
	return canonical;
}

size_t Configuration::getSize() const {
	return cliques.size();
}

number_t Configuration::getMaxNumber() const {
	number_t result = 0;
	for (const auto& c : cliques) {
		if (!c.empty()) {
			result = max(result, c.back());
		}
	}
	return result;
}

membership_t Configuration::getNumberMembership() const {
	membership_t result;
	for (const auto& c : cliques) {
		for (auto x : c) {
			++result[x];
		}
	}
	return result;
}

bool Configuration::isValid() const {
	for (const auto& kv : getNumberMembership()) {
		if ((kv.second < 1) || (kv.second > 2)) {
			return false;
		}
	}
	return true;
}

Configuration Configuration::removeSubsets() const {
	cliques_t filtered;

	for (size_t i = 0; i < cliques.size(); ++i) {
		bool isSubset = false;
		for (size_t j = 0; j < cliques.size(); ++j) {
			if ((i != j) && isStrictSubset(cliques[i], cliques[j])) {
				isSubset = true;
				break;
			}
		}

		if (!isSubset) {
			filtered.push_back(cliques[i]);
		}
	}

	return Configuration(filtered);
}

size_t Configuration::hash() const {
	return hashValue;
}

bool Configuration::operator==(const Configuration& other) const {
	return (hashValue == other.hashValue) && (canonical == other.canonical);
}

bool Configuration::operator!=(const Configuration& other) const {
	return !(*this == other);
}

bool isStrictSubset(const clique_t& a, const clique_t& b) {
	return (a.size() < b.size()) && includes(b.begin(), b.end(), a.begin(), a.end());
}

size_t std::hash<Configuration>::operator()(const Configuration& obj) const {
	return obj.hash();
}
