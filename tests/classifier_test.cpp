#include <gtest/gtest.h>

#include "classifier.hpp"
#include "generator.hpp"

TEST(Classifier, EndingCliqueSize) {
	EXPECT_EQ(1, endingCliqueSize(Configuration(cliques_t{{1}, {2}, {3}}), 3));
	EXPECT_EQ(2, endingCliqueSize(Configuration(cliques_t{{1}, {2, 3}}), 3));
	EXPECT_EQ(3, endingCliqueSize(Configuration(cliques_t{{1, 2, 3}}), 3));
}

TEST(Classifier, MissingNumberIsZero) {
	EXPECT_EQ(0, endingCliqueSize(Configuration(cliques_t{{1, 2}}), 3));
	EXPECT_EQ(0, endingCliqueSize(Configuration(cliques_t{}), 1));
}

TEST(Classifier, SharedNumberReportsCliqueWithSmallerMinimum) {
	Configuration a(cliques_t{{2, 3, 4}, {1, 2}});
	Configuration b(cliques_t{{1, 2}, {2, 3, 4}});

	EXPECT_EQ(2, endingCliqueSize(a, 2));
	EXPECT_EQ(2, endingCliqueSize(b, 2));
}

TEST(Classifier, BreakdownThree) {
	auto breakdown = breakdownByEndingSize(generateConfigurations(3), 3);

	breakdown_t expected = {{1, 2}, {2, 2}, {3, 1}};
	EXPECT_EQ(expected, breakdown);
}

TEST(Classifier, BreakdownFour) {
	auto breakdown = breakdownByEndingSize(generateConfigurations(4), 4);

	breakdown_t expected = {{1, 5}, {2, 5}, {3, 3}, {4, 1}};
	EXPECT_EQ(expected, breakdown);
}

TEST(Classifier, SizeWithinRange) {
	auto levels = generateLevels(7);

	for (std::size_t i = 0; i < levels.size(); ++i) {
		number_t n = static_cast<number_t>(i + 1);
		for (const auto& config : levels[i]) {
			number_t size = endingCliqueSize(config, n);
			EXPECT_GE(size, 1);
			EXPECT_LE(size, n);

			bool found = false;
			for (const auto& clique : config.getCliques()) {
				if ((clique.back() == n) && (static_cast<number_t>(clique.size()) == size)) {
					found = true;
				}
			}
			EXPECT_TRUE(found);
		}
	}
}
