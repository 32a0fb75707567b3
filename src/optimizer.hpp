#pragma once

#include <iostream>
#include <limits>
#include <vector>

#include "ant.hpp"
#include "params.hpp"
#include "problem.hpp"
#include "trail.hpp"

class AntOptimizer {
protected:
	Problem problem;
	AntParams params;

	std::vector<size_t> best_route_nodes;
	// Raw length of the best route, including the load-time edge bias
	double best_length = std::numeric_limits<double>::infinity();
	unsigned int iteration = 0;

	// Evaporates every edge, then lets every ant (dead or not) deposit along its route
	void update_trails(const std::vector<Ant>& ants) {
		trail.evaporate(params.evaporation);
		for (const Ant& ant : ants) {
			double contribution = params.q / ant.route_length(problem.weights);
			trail.deposit(ant.route.begin(), ant.route.end(), contribution);
		}
	}

	void update_best(const std::vector<Ant>& ants) {
		for (const Ant& ant : ants) {
			double length = ant.route_length(problem.weights);
			if (best_route_nodes.empty() || length < best_length) {
				best_length = length;
				best_route_nodes = ant.route;
				if (params.verbose) {
					std::cout
						<< "[Colony] iteration " << iteration
						<< ": best length " << corrected_length()
						<< (reached_goal() ? "" : " (partial)") << "\n";
				}
			}
		}
	}

public:
	TrailMatrix trail;

	AntOptimizer(const Problem& problem, AntParams params)
	: problem(problem), params(params), trail(problem.size(), params.initial_trail) {
		this->params.validate(problem.size());
	}

	virtual ~AntOptimizer() = default;

	virtual void prepare() = 0;
	virtual void optimize(unsigned int rounds) = 0;

	const std::vector<size_t>& best_route() const {
		return best_route_nodes;
	}

	double best_route_length() const {
		return best_length;
	}

	bool has_route() const {
		return !best_route_nodes.empty();
	}

	bool reached_goal() const {
		return has_route() && best_route_nodes.back() == params.goal_node;
	}

	// Best length with the bias removed: the sum of the weights as given in the input
	double corrected_length() const {
		if (!has_route()) { return best_length; }
		size_t edges = best_route_nodes.size() - 1;
		return best_length - 1.0 - Problem::edge_bias * edges;
	}

	unsigned int iterations_done() const {
		return iteration;
	}

	const AntParams& parameters() const {
		return params;
	}

	static constexpr const char* static_name = "abstract";
	static constexpr const char* static_params = "";
};
