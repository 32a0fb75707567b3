#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <sstream>

#include "profiler.hpp"
#include "colony_factory.hpp"
#include "cli.hpp"

#include "variants/sequential.hpp"
#ifdef GRIDANT_WITH_OPENCL
#include "variants/gridcl.hpp"
#endif

CliParameters cli;

std::string print_now() {
	auto current_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	char now_str[std::size("2000-01-01T16:00:00")];
	std::strftime(now_str, std::size(now_str), "%FT%T", std::gmtime(&current_time));
	return std::string(now_str);
}

std::string route_to_string(const std::vector<size_t>& route) {
	std::ostringstream out;
	for (auto it = route.begin(); it != route.end(); it++) {
		out << (it == route.begin() ? "" : " ") << *it;
	}
	return out.str();
}

void output_profiler(
std::filesystem::path path,
bool append,
std::string variant,
std::string problem,
unsigned int rounds,
double length,
bool reached_goal) {
	bool existed = std::filesystem::exists(path);
	std::ofstream file(path, append ? std::ofstream::app : std::ofstream::trunc);
	if (!file) {
		throw std::runtime_error("cannot write profiler output \"" + path.string() + "\"");
	}

	const char sep = ';';
	if (!existed || !append) {
		file 
			<< "variant" << sep
			<< "problem" << sep
			<< "timestamp" << sep
			<< "rounds" << sep
			<< "prep" << sep
			<< "optr" << sep
			<< "opts" << sep
			<< "adva" << sep
			<< "eval" << sep
			<< "upda" << sep
			<< "length" << sep
			<< "reached_goal" << "\n";
	}

	file 
		<< variant << sep
		<< problem << sep
		<< print_now() << sep
		<< rounds << sep
		<< Profiler::first("prep").value<double, std::milli>() << sep
		<< Profiler::first("optr").value<double, std::milli>() << sep
		<< Profiler::average_ms("opts") << sep
		<< Profiler::average_ms("adva") << sep
		<< Profiler::average_ms("eval") << sep
		<< Profiler::average_ms("upda") << sep
		<< length << sep
		<< (reached_goal ? 1 : 0) << "\n";
}

AntParams read_params(const Problem& problem) {
	AntParams params;
	params.initial_trail = cli.real("trail");
	params.alpha = cli.real("alpha");
	params.beta = cli.real("beta");
	params.evaporation = cli.real("evaporation");
	params.q = cli.real("q");
	params.ant_factor = cli.real("ants");
	params.random_jump = cli.real("random-jump");

	params.grid_width = cli.count("width");
	params.grid_height = cli.given("height") ? cli.count("height") : 0;

	params.rounds = cli.count("rounds");

	params.start_node = cli.count("start");
	params.goal_node = cli.count("goal");

	params.random_seed = static_cast<uint32_t>(std::hash<std::string>{}(cli.param("seed")));
	params.verbose = cli.flag("verbose");

	params.validate(problem.size());
	return params;
}

int run(int argc, char* argv[]) {
	ColonyFactory::add<SequentialOptimizer>();
#ifdef GRIDANT_WITH_OPENCL
	ColonyFactory::add<GridCLOptimizer>();
#endif

	cli.addFlag("help", "Prints this help message", {"h"});
	cli.addFlag("list", "List all colony variants available", {"l"});
	cli.addParameter("colony", "Selects the colony to run. Colony arguments are separated by a colon (:)", {"c"}, "sequential");
	cli.addParameter("rounds", "How many iterations the colony runs", {"r"}, "80000");
	cli.addParameter("seed", "Controls the random-number-generator seed", {}, "thomas");
	cli.addParameter("start", "Node the ants start from", {"s"}, "0");
	cli.addParameter("goal", "Node the ants are looking for", {"g"}, "1");
	cli.addParameter("width", "Width of the node grid", {"w"}, "10");
	cli.addParameter("height", "Height of the node grid (default: enough rows for all nodes)", {});
	cli.addParameter("trail", "Initial trail on every edge", {}, "1");
	cli.addParameter("alpha", "Trail preference", {}, "1");
	cli.addParameter("beta", "Short edge preference", {}, "5");
	cli.addParameter("evaporation", "Fraction of the trail kept every iteration", {}, "0.5");
	cli.addParameter("q", "Trail deposit scale", {}, "500");
	cli.addParameter("ants", "Number of ants per node", {}, "0.8");
	cli.addParameter("random-jump", "Probability of a random move", {}, "0.3");
#ifdef GRIDANT_WITH_OPENCL
	cli.addParameter("kernels", "Directory holding the OpenCL kernels", {}, "./src/variants");
#endif
	cli.addParameter("output", "Specify an output file to write the profiler results to", {"o"});
	cli.addFlag("append", "Append to the file specified by --output instead of overwriting it. Used only when --output is specified", {"a"});
	cli.addFlag("verbose", "Report every improvement of the best route and every dead ant", {"v"});

	cli.parse(argc, argv);

	if (cli.flag("help")) {
		std::cout 
			<< "Grid Ant Colony path search\n"
			<< "Usage:\n"
			<< "  gridant <weights.txt> [flags]\n\n"
			<< "Flags:"
			<< cli.help()
			<< std::endl;
		return EXIT_SUCCESS;
	}

	if (cli.flag("list")) {
		for (const auto& signature : ColonyFactory::signatures()) {
			std::cout << signature << "\n";
		}
		return EXIT_SUCCESS;
	}

	if (cli.entries().size() != 1) {
		std::cerr
			<< (cli.entries().size() == 0 ? "Not enough" : "Too many")
			<< " files provided\n"
			<< "See --help for more information" << std::endl;
		return EXIT_FAILURE;
	}

	ColonyFactory::Selection colony = ColonyFactory::select(cli.param("colony"));

#ifdef GRIDANT_WITH_OPENCL
	CLColonyOptimizer::kernel_directory = cli.param("kernels");
#endif

	Problem problem{std::filesystem::path(cli.entries().front())};

	AntParams params = read_params(problem);
	std::unique_ptr<AntOptimizer> optimizer = colony.make(problem, params);

	Profiler::start("prep");
	optimizer->prepare();
	Profiler::stop("prep");

	Profiler::start("optr");
	optimizer->optimize(static_cast<unsigned int>(params.rounds));
	Profiler::stop("optr");

	std::string variant = colony.signature();

	if (cli.param("output").empty()) {
		std::cout
			<< "Finished!\n"
			<< "Variant: " << variant << "\n"
			<< "Problem: " << problem.name << " (" << problem.size() << " nodes)\n"
			<< "Best route: " << route_to_string(optimizer->best_route()) << "\n"
			<< "Best route length: " << optimizer->corrected_length() << "\n"
			<< "Reached goal: " << (optimizer->reached_goal() ? "yes" : "no") << "\n"
			<< "Prepare Time: " << Profiler::first("prep").value<double, std::milli>() << "ms\n"
			<< "Execution Time: " << Profiler::first("optr").value<double, std::milli>() << "ms\n";
		Profiler::report(std::cout);
		std::cout << std::endl;
	}
	else {
		output_profiler(
			cli.param("output"),
			cli.flag("append"),
			variant,
			problem.name,
			static_cast<unsigned int>(params.rounds),
			optimizer->corrected_length(),
			optimizer->reached_goal());
	}

	return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
	try {
		return run(argc, argv);
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
