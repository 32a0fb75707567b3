#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

/*
Wall-clock timing of the colony phases. Phases are identified by short keys:
  prep  optimizer preparation
  optr  whole optimization run
  opts  one iteration
  adva  ants moving
  upda  trail update
  eval  best route tracking
*/
struct Profiler {
	using Clock = std::chrono::steady_clock;
	using Duration = Clock::duration;
	using Timepoint = Clock::time_point;
	using Identifier = std::string;

	struct Measurement {
		Duration duration;

		explicit Measurement(Duration d = Duration::zero())
		: duration(d) {}

		template<typename T, typename Resolution = std::ratio<1>>
		T value() const {
			return std::chrono::duration_cast<std::chrono::duration<T, Resolution>>(duration).count();
		}
	};
	using MeasurementList = std::vector<Measurement>;

	struct Analysis {
		Measurement min;
		Measurement max;
		Measurement avg;
		Measurement total;
		size_t count = 0;
	};

	struct Phase {
		Timepoint started;
		bool running = false;
		MeasurementList measurements;
	};

	// Ordered so reports list phases alphabetically
	std::map<Identifier, Phase> phases;

	void start_timer(const Identifier& id) {
		Phase& phase = phases[id];
		if (phase.running) { return; }
		phase.running = true;
		phase.started = Clock::now();
	}

	void stop_timer(const Identifier& id) {
		Timepoint stopped = Clock::now();
		auto it = phases.find(id);
		if (it == phases.end() || !it->second.running) { return; }
		it->second.running = false;
		it->second.measurements.emplace_back(stopped - it->second.started);
	}

	Analysis get_analysis(const Identifier& id) const {
		auto it = phases.find(id);
		if (it == phases.end() || it->second.measurements.empty()) {
			throw std::out_of_range("No measurements recorded for \"" + id + "\"");
		}
		const MeasurementList& list = it->second.measurements;

		Analysis result;
		result.count = list.size();
		result.min = result.max = list.front();
		for (const Measurement& m : list) {
			result.min.duration = std::min(result.min.duration, m.duration);
			result.max.duration = std::max(result.max.duration, m.duration);
			result.total.duration += m.duration;
		}
		result.avg.duration = result.total.duration / static_cast<Duration::rep>(list.size());
		return result;
	}

	static Profiler default_profiler;

	static void start(const Identifier& id) {
		default_profiler.start_timer(id);
	}

	static void stop(const Identifier& id) {
		default_profiler.stop_timer(id);
	}

	static void clear() {
		default_profiler.phases.clear();
	}

	static bool has(const Identifier& id) {
		auto it = default_profiler.phases.find(id);
		return it != default_profiler.phases.end() && !it->second.measurements.empty();
	}

	static MeasurementList& at(const Identifier& id) {
		return default_profiler.phases.at(id).measurements;
	}

	static Measurement& first(const Identifier& id) {
		return at(id).front();
	}

	static Analysis analyze(const Identifier& id) {
		return default_profiler.get_analysis(id);
	}

	// Mean of a phase in milliseconds, 0 if it never ran
	static double average_ms(const Identifier& id) {
		return has(id) ? analyze(id).avg.value<double, std::milli>() : 0.0;
	}

	static std::vector<Identifier> measurement_keys() {
		std::vector<Identifier> ids;
		for (const auto& p : default_profiler.phases) {
			if (!p.second.measurements.empty()) {
				ids.push_back(p.first);
			}
		}
		return ids;
	}

	static void report(std::ostream& out) {
		for (const auto& id : measurement_keys()) {
			Analysis analysis = analyze(id);
			out
				<< "Measurement '" << id << "' (" << analysis.count << "x):\n"
				<< "  min: " << analysis.min.value<double, std::milli>() << "ms\n"
				<< "  max: " << analysis.max.value<double, std::milli>() << "ms\n"
				<< "  avg: " << analysis.avg.value<double, std::milli>() << "ms\n";
		}
	}
};

inline Profiler Profiler::default_profiler;
