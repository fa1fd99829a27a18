#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <boost/program_options.hpp>

#include <tbb/task_arena.h>

#include "generator.hpp"
#include "report.hpp"
#include "tracer.hpp"

namespace po = boost::program_options;

int main(int argc, char **argv) {
	// global config vars
	number_t cfgMax;
	std::size_t cfgThreads;
	ReportOptions cfgReport;
	bool cfgProfile;

	// parse program options
	po::options_description poDesc("Options");
	poDesc.add_options()
		(
			"max",
			po::value(&cfgMax)->default_value(11),
			"Generate configurations for n = 1..max"
		)
		(
			"full-list",
			"Print every configuration, not just the breakdown"
		)
		(
			"no-labels",
			"Print the breakdown without clique size labels"
		)
		(
			"color",
			"Use ANSI colors"
		)
		(
			"threads",
			po::value(&cfgThreads)->default_value(0),
			"Number of threads (0 = auto)"
		)
		(
			"profile",
			"Print time profile"
		)
		(
			"help",
			"Print this help message"
		)
	;
	po::variables_map poVm;
	try {
		po::store(po::parse_command_line(argc, argv, poDesc), poVm);
		po::notify(poVm);
	} catch (const std::exception& e) {
		std::cout << "Error:" << std::endl
			<< e.what() << std::endl
			<< std::endl
			<< "Use --help to get help ;)" << std::endl;
		return EXIT_FAILURE;
	}
	if (poVm.count("help")) {
		std::cout << "cliqueconf" << std::endl << std::endl << poDesc << std::endl;
		return EXIT_SUCCESS;
	}
	cfgReport.showFullList = poVm.count("full-list") > 0;
	cfgReport.showSizeLabels = poVm.count("no-labels") == 0;
	cfgReport.color = poVm.count("color") > 0;
	cfgProfile = poVm.count("profile") > 0;

	if (cfgMax < 1) {
		std::cout << "Error:" << std::endl
			<< "--max must be at least 1 (got " << cfgMax << ")" << std::endl;
		return EXIT_FAILURE;
	}

	// setup tbb
	int threads = static_cast<int>(cfgThreads);
	if (threads == 0) {
		threads = tbb::task_arena::automatic;
	}
	tbb::task_arena arena(threads);

	// start time tracing
	std::stringstream timerProfile;
	bool recurrenceOk = true;

	{
		auto tMain = std::make_shared<Tracer>("main", &timerProfile);
		std::shared_ptr<Tracer> tPhase;

		// generate levels, each one from its predecessor
		tPhase.reset(new Tracer("generate", tMain));
		levels_t levels;
		for (number_t n = 1; n <= cfgMax; ++n) {
			std::stringstream name;
			name << "n" << n;
			Tracer tLevel(name.str(), tPhase);

			std::cerr << "Generate: n=" << n << " " << std::flush;
			if (n <= 2) {
				levels.push_back(generateConfigurations(n));
			} else {
				arena.execute([&levels, n]() {
					levels.push_back(extendLevel(levels.back(), n));
				});
			}
			std::stringstream note;
			note << levels.back().size() << " configurations";
			tLevel.setNote(note.str());
			std::cerr << "done (" << note.str() << ")" << std::endl;
		}

		tPhase.reset(new Tracer("report", tMain));
		std::cout << "Clique Configuration Generator" << std::endl;
		std::cout << std::string(50, '=') << std::endl;
		std::cout << std::endl;

		writeLevels(std::cout, levels, cfgReport);
		writeRecurrence(std::cout, levels);

		auto failed = verifyRecurrence(levels);
		recurrenceOk = failed.empty();
		if (!recurrenceOk) {
			std::cerr << "Recurrence violated at " << failed.size() << " level(s)" << std::endl;
		}
	}

	if (cfgProfile) {
		std::cout << std::endl << "Time profile:" << std::endl << timerProfile.str() << std::endl;
	}

	return recurrenceOk ? EXIT_SUCCESS : EXIT_FAILURE;
}
