#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "tracer.hpp"

namespace {
	bool endsWith(const std::string& s, const std::string& suffix) {
		return (s.size() >= suffix.size()) && (s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
	}
}

TEST(Tracer, Path) {
	std::stringstream profile;
	auto root = std::make_shared<Tracer>("main", &profile);
	auto child = std::make_shared<Tracer>("generate", root);
	Tracer leaf("n 7!", child);

	EXPECT_EQ("main", root->getPath());
	EXPECT_EQ("main/generate/n7", leaf.getPath());
}

TEST(Tracer, WritesOnDestruction) {
	std::stringstream profile;
	{
		auto root = std::make_shared<Tracer>("main", &profile);
		{
			Tracer child("report", root);
		}
		std::string first = profile.str();
		EXPECT_EQ(0u, first.find("main/report: "));
		EXPECT_TRUE(endsWith(first, " seconds\n"));
	}

	std::string all = profile.str();
	EXPECT_NE(std::string::npos, all.find("\nmain: "));
}

TEST(Tracer, Note) {
	std::stringstream profile;
	{
		auto root = std::make_shared<Tracer>("generate", &profile);
		Tracer level("n4", root);
		level.setNote("14 configurations");
	}

	std::string out = profile.str();
	EXPECT_EQ(0u, out.find("generate/n4: "));
	EXPECT_NE(std::string::npos, out.find(" seconds (14 configurations)\n"));
	EXPECT_NE(std::string::npos, out.find("\ngenerate: "));
	EXPECT_TRUE(endsWith(out, " seconds\n"));
}
