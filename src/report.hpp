#ifndef REPORT_HPP
#define REPORT_HPP

#include <ostream>
#include <vector>

#include "generator.hpp"
#include "sys.hpp"

struct ReportOptions {
	bool showFullList = false;
	bool showSizeLabels = true;
	bool color = false;
};

// per level: count, breakdown by ending clique size, optionally every configuration
void writeLevels(std::ostream& out, const levels_t& levels, const ReportOptions& options);

// a_{n+1} = 3*a_n - 1 table
void writeRecurrence(std::ostream& out, const levels_t& levels);

// levels n (>= 2) where the recurrence does not hold
std::vector<number_t> verifyRecurrence(const levels_t& levels);

#endif
