#pragma once

#include <algorithm>
#include <memory>

#include "clcolony.hpp"
#include "../grid.hpp"
#include "../profiler.hpp"

/*
Runs the step phase on an OpenCL device, one work item per ant and one kernel
launch per step. The trail buffer is read-only on the device; dead ant resets,
evaporation, deposit and best tracking happen on the host once all ants have
stopped, after which the trail is written back.
*/
class GridCLOptimizer: public CLColonyOptimizer {
protected:
	cl::Program program;
	cl::KernelFunctor<
		cl::Buffer, // ant_routes
		cl::Buffer, // ant_route_sizes
		cl::Buffer, // ant_visited
		cl::Buffer, // ant_status
		cl_int,     // node_count
		cl_int,     // start_node
		cl_int      // goal_node
	> resetAntsCL;

	cl::KernelFunctor<
		cl::Buffer, // trail
		cl::Buffer, // visibility
		cl::Buffer, // ant_routes
		cl::Buffer, // ant_route_sizes
		cl::Buffer, // ant_visited
		cl::Buffer, // ant_status
		cl::Buffer, // rng_states
		cl_int,     // node_count
		cl_int,     // grid_width
		cl_int,     // cell_count
		cl_int,     // goal_node
		cl_double,  // alpha
		cl_double,  // random_jump
		cl_int      // exact_power
	> advanceAntsCL;

	cl::Buffer trail_d;
	cl::Buffer visibility_d;
	cl::Buffer routes_d;
	cl::Buffer route_sizes_d;
	cl::Buffer visited_d;
	cl::Buffer status_d;
	cl::Buffer rng_states_d;

	enum AntStatus : cl_int { active = 0, at_goal = 1, dead = 2 };

	void resetAnts() {
		cl::NDRange global_size(ants.size());
		resetAntsCL(
			cl::EnqueueArgs(queue, global_size),
			routes_d,
			route_sizes_d,
			visited_d,
			status_d,
			static_cast<cl_int>(problem.size()),
			static_cast<cl_int>(params.start_node),
			static_cast<cl_int>(params.goal_node)
		).wait();
	}

	void advanceAnts() {
		cl::NDRange global_size(ants.size());
		advanceAntsCL(
			cl::EnqueueArgs(queue, global_size),
			trail_d,
			visibility_d,
			routes_d,
			route_sizes_d,
			visited_d,
			status_d,
			rng_states_d,
			static_cast<cl_int>(problem.size()),
			static_cast<cl_int>(grid.width),
			static_cast<cl_int>(grid.cell_count()),
			static_cast<cl_int>(params.goal_node),
			params.alpha,
			params.random_jump,
			exact_power ? 1 : 0
		).wait();
	}

	// Copies the device routes into the host ants
	void readAnts() {
		queue.enqueueReadBuffer(route_sizes_d, CL_TRUE, 0, sizeof(cl_int) * ant_route_sizes.size(), ant_route_sizes.data());
		queue.enqueueReadBuffer(status_d, CL_TRUE, 0, sizeof(cl_int) * ant_status.size(), ant_status.data());
		queue.enqueueReadBuffer(routes_d, CL_TRUE, 0, sizeof(cl_int) * ant_routes.size(), ant_routes.data());

		for (size_t k = 0; k < ants.size(); k++) {
			Ant& ant = ants[k];
			auto begin = ant_routes.begin() + k * problem.size();
			ant.route.assign(begin, begin + ant_route_sizes[k]);
			ant.dead = ant_status[k] == dead;
			ant.complete = ant_status[k] != active;
		}
	}

public:
	static constexpr const char* static_name = "gridcl";
	static constexpr const char* static_params = "[fast|exact]";

	Grid grid;
	std::vector<Ant> ants;
	bool exact_power;

	std::vector<cl_int> ant_routes;
	std::vector<cl_int> ant_route_sizes;
	std::vector<cl_int> ant_status;

	GridCLOptimizer(const Problem& problem, AntParams params)
	:	CLColonyOptimizer::CLColonyOptimizer(problem, params),
		resetAntsCL(cl::Kernel()),
		advanceAntsCL(cl::Kernel()),
		grid(problem.size(), params.grid_width, params.grid_height),
		exact_power(make_power_function(params.variant_args)->name() == std::string("exact")) {}

	void prepare() override {
		setupCL(params.verbose);
		program = loadProgramVariant(static_name);

		size_t ant_count = params.ant_count(problem.size());
		ants.assign(ant_count, Ant());
		ant_routes.assign(ant_count * problem.size(), 0);
		ant_route_sizes.assign(ant_count, 0);
		ant_status.assign(ant_count, active);

		trail.reset();
		best_route_nodes.clear();
		best_length = std::numeric_limits<double>::infinity();
		iteration = 0;

		std::unique_ptr<PowerFunction> power = make_power_function(params.variant_args);
		Graph<double> visibility = getVisibility(*power);

		trail_d = createAndFillBuffer(problem.sizeSqr(), true, trail.trails);
		visibility_d = createAndFillBuffer(problem.sizeSqr(), true, visibility);
		routes_d = createAndFillBuffer<cl_int>(ant_count * problem.size(), false, 0);
		route_sizes_d = createAndFillBuffer<cl_int>(ant_count, false, 0);
		visited_d = createAndFillBuffer<cl_uchar>(ant_count * problem.size(), false, 0);
		status_d = createAndFillBuffer<cl_int>(ant_count, false, active);

		std::vector<cl_uint> rngs = getRngs(ant_count);
		rng_states_d = createAndFillBuffer(ant_count, false, rngs);

		queue.finish();

		resetAntsCL = decltype(resetAntsCL)(cl::Kernel(program, "reset_ants"));
		advanceAntsCL = decltype(advanceAntsCL)(cl::Kernel(program, "advance_ants"));
	}

	void optimize(unsigned int rounds) override {
		while (rounds-- > 0) {
			Profiler::start("opts");

			Profiler::start("adva");
			resetAnts();
			for (size_t i = 0; i + 1 < problem.size(); i++) {
				advanceAnts();
			}
			Profiler::stop("adva");

			Profiler::start("eval");
			readAnts();
			update_best(ants);
			Profiler::stop("eval");

			Profiler::start("upda");
			for (size_t k = 0; k < ants.size(); k++) {
				if (ants[k].dead) {
					trail.reset_route(ants[k].route.begin(), ants[k].route.end());
					if (params.verbose) {
						std::cout << "[Colony] ant " << k << " died at node " << ants[k].current_node() << "\n";
					}
				}
			}
			update_trails(ants);
			queue.enqueueWriteBuffer(
				trail_d, CL_TRUE, 0,
				sizeof(double) * trail.trails.adjacency_matrix.data.size(),
				trail.trails.adjacency_matrix.data.data());
			Profiler::stop("upda");

			iteration++;
			Profiler::stop("opts");
		}
	}
};
