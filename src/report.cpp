#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

#include "classifier.hpp"
#include "renderer.hpp"
#include "report.hpp"

using namespace std;

typedef vector<breakdown_t> breakdowns_t;

breakdowns_t calcBreakdowns(const levels_t& levels) {
	breakdowns_t result;
	for (size_t i = 0; i < levels.size(); ++i) {
		result.push_back(breakdownByEndingSize(levels[i], static_cast<number_t>(i + 1)));
	}
	return result;
}

int calcCountWidth(const breakdowns_t& breakdowns) {
	size_t maxCount = 0;
	for (const auto& b : breakdowns) {
		for (const auto& kv : b) {
			maxCount = max(maxCount, kv.second);
		}
	}
	return static_cast<int>(to_string(maxCount).size());
}

size_t lookup(const breakdown_t& breakdown, number_t size) {
	auto iter = breakdown.find(size);
	return (iter == breakdown.end()) ? 0 : iter->second;
}

void writeLevels(ostream& out, const levels_t& levels, const ReportOptions& options) {
	auto breakdowns = calcBreakdowns(levels);
	int width = calcCountWidth(breakdowns);

	for (size_t i = 0; i < levels.size(); ++i) {
		number_t n = static_cast<number_t>(i + 1);
		const auto& configs = levels[i];

		stringstream breakdown;
		bool first = true;
		for (number_t size = 1; size <= n; ++size) {
			size_t count = lookup(breakdowns[i], size);
			if (count == 0) {
				continue;
			}

			if (first) {
				first = false;
			} else {
				breakdown << ", ";
			}

			if (options.showSizeLabels) {
				if (options.color) {
					breakdown << Ansi::RED << size << Ansi::RESET;
				} else {
					breakdown << size;
				}
				breakdown << ": ";
			}
			breakdown << setw(width) << count;
		}

		if (options.showSizeLabels) {
			out << "n = " << n << ": " << configs.size() << " configurations" << endl;
			out << "  Ending clique breakdown: " << breakdown.str() << endl;
		} else {
			out << "n = " << n << ": " << configs.size() << " configurations = " << breakdown.str() << endl;
		}

		if (options.showFullList) {
			out << string(50, '-') << endl;
			size_t idx = 1;
			for (const auto& config : configs) {
				out << setw(2) << idx++ << ". "
					<< renderConfiguration(config, options.color)
					<< "  (ending size: " << endingCliqueSize(config, n) << ")" << endl;
			}
		}

		out << endl;
	}
}

void writeRecurrence(ostream& out, const levels_t& levels) {
	auto breakdowns = calcBreakdowns(levels);
	int width = calcCountWidth(breakdowns);

	out << "Verifying recurrence relation: a_{n+1} = 3*a_n - 1" << endl;
	out << string(50, '=') << endl;

	for (size_t i = 0; i < levels.size(); ++i) {
		number_t n = static_cast<number_t>(i + 1);
		size_t count = levels[i].size();

		stringstream breakdown;
		for (number_t size = 1; size <= n; ++size) {
			if (size > 1) {
				breakdown << " + ";
			}
			breakdown << setw(width) << lookup(breakdowns[i], size);
		}

		out << "a_" << n << " = " << count << " = [" << breakdown.str() << "]";
		if (i > 0) {
			size_t prev = levels[i - 1].size();
			size_t expected = 3 * prev - 1;
			out << ", expected 3*" << prev << " - 1 = " << expected << " "
				<< ((count == expected) ? "✓" : "✗");
		}
		out << endl;
	}
}

vector<number_t> verifyRecurrence(const levels_t& levels) {
	vector<number_t> result;
	for (size_t i = 1; i < levels.size(); ++i) {
		if (levels[i].size() != 3 * levels[i - 1].size() - 1) {
			result.push_back(static_cast<number_t>(i + 1));
		}
	}
	return result;
}
