#pragma once

#include <CL/opencl.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

#include "../optimizer.hpp"
#include "../power.hpp"

// Shared OpenCL plumbing for the colonies whose step phase runs on a device
class CLColonyOptimizer: public AntOptimizer {
protected:
	std::string loadFileString(std::filesystem::path path) {
		std::ifstream file(path);
		if (!file) {
			throw std::runtime_error("[OpenCL] Cannot read kernel source " + path.string());
		}
		return std::string(
			std::istreambuf_iterator<char>(file),
			std::istreambuf_iterator<char>());
	}

	std::vector<char> loadFileBinary(std::filesystem::path path) {
		std::ifstream file(path, std::ios::binary);
		if (!file) {
			throw std::runtime_error("[OpenCL] Cannot read kernel binary " + path.string());
		}
		return std::vector<char>(
			std::istreambuf_iterator<char>(file),
			std::istreambuf_iterator<char>());
	}

	void setupCL(bool verbose) {
		std::vector<cl::Platform> all_platforms;
		cl::Platform::get(&all_platforms);
		if (all_platforms.empty()) {
			throw std::runtime_error("[OpenCL] No platforms found");
		}
		cl::Platform default_platform = all_platforms.at(0);
		if (verbose) {
			std::cout
				<< "[OpenCL] Using platform: "
				<< default_platform.getInfo<CL_PLATFORM_NAME>() << "\n";
		}

		std::vector<cl::Device> devices;
		default_platform.getDevices(CL_DEVICE_TYPE_ALL, &devices);
		if (devices.empty()) {
			throw std::runtime_error("[OpenCL] No devices found");
		}

		device = devices.at(0);
		if (verbose) {
			std::cout
				<< "[OpenCL] Using device: "
				<< device.getInfo<CL_DEVICE_NAME>() << "\n";
		}

		context = cl::Context(device);
		queue = cl::CommandQueue(context, device);
	}

	cl::Program loadBinaryProgram(std::filesystem::path path, std::string compiler_args) {
		std::vector<char> program_binary = loadFileBinary(path);
		cl::Program program(context, program_binary);

		cl_int succ = program.build(compiler_args.c_str());
		if (succ != CL_SUCCESS) {
			throw std::runtime_error(
				"[OpenCL] Error building program " + path.filename().string()
				+ ": (" + std::to_string(succ) + ") "
				+ program.getBuildInfo<CL_PROGRAM_BUILD_LOG>(device));
		}
		return program;
	}

	cl::Program loadTextProgram(std::filesystem::path path, std::string compiler_args) {
		std::string program_source = loadFileString(path);
		cl::Program program(context, program_source);
		std::filesystem::path location = path;
		location.remove_filename();

		std::string options = "-I \"" + location.string() + "\" " + compiler_args;
		cl_int succ = program.build(options.c_str());
		if (succ != CL_SUCCESS) {
			throw std::runtime_error(
				"[OpenCL] Error building program " + path.filename().string()
				+ ": (" + std::to_string(succ) + ") "
				+ program.getBuildInfo<CL_PROGRAM_BUILD_LOG>(device));
		}

		return program;
	}

	bool is_spirv_file(std::filesystem::path path) {
		std::ifstream file(path, std::ios::binary);
		uint32_t magic_number = 0;
		file.read(reinterpret_cast<char*>(&magic_number), sizeof(magic_number));
		return magic_number == 0x07230203 || magic_number == 0x03022307;
	}

	cl::Program loadProgram(std::filesystem::path path, std::string compiler_args = "") {
		if (is_spirv_file(path)) {
			return loadBinaryProgram(path, compiler_args);
		}
		else {
			return loadTextProgram(path, compiler_args);
		}
	}

	cl::Program loadProgramVariant(const char* variant_name, std::string compiler_args = "") {
		return loadProgram(
			kernel_directory /
			std::filesystem::path(variant_name).replace_extension(".cl"),
			compiler_args
		);
	}

	template<typename T>
	cl::Buffer createBuffer(size_t size, bool read_only) {
		return cl::Buffer(context, read_only ? CL_MEM_READ_ONLY : CL_MEM_READ_WRITE, sizeof(T) * size);
	}

	template<typename T>
	cl::Buffer createAndFillBuffer(size_t size, bool read_only, T content) {
		cl::Buffer result = createBuffer<T>(size, read_only);
		queue.enqueueFillBuffer(result, content, 0, sizeof(T) * size);
		return result;
	}

	template<typename T>
	cl::Buffer createAndFillBuffer(size_t size, bool read_only, const std::vector<T>& data) {
		if (size != data.size()) {
			throw std::invalid_argument("[OpenCL] Buffer size does not match its data");
		}
		cl::Buffer result = createBuffer<T>(size, read_only);
		queue.enqueueWriteBuffer(
			result,
			CL_FALSE,
			0,
			sizeof(T) * size,
			data.data());
		return result;
	}

	template<typename T>
	cl::Buffer createAndFillBuffer(size_t size, bool read_only, const Graph<T>& data) {
		return createAndFillBuffer(size, read_only, data.adjacency_matrix.data);
	}

	// (1 / weight)^(beta), fixed for the whole run
	Graph<double> getVisibility(const PowerFunction& power) {
		Graph<double> result(problem.size());
		std::transform(problem.weights.adjacency_matrix.data.cbegin(), problem.weights.adjacency_matrix.data.cend(),
			result.adjacency_matrix.data.begin(), [this, &power](const double& w) {
				return power(1.0 / w, params.beta);
			} );
		return result;
	}

	// One generator state per ant, seeded like the sequential colony seeds its ants
	std::vector<cl_uint> getRngs(size_t ant_count) {
		std::vector<cl_uint> rngs(ant_count, 0);
		std::minstd_rand0 rng(params.random_seed);
		for (cl_uint& state : rngs) {
			Ant::minstd0_engine engine;
			engine.seed(rng());
			state = engine.state;
		}
		return rngs;
	}

	cl::Device device;
	cl::Context context;
	cl::CommandQueue queue;
public:
	static constexpr const char* static_name = "opencl";
	static constexpr const char* static_params = "";

	// Where the .cl sources of the variants are looked up
	inline static std::filesystem::path kernel_directory = "./src/variants";

	using AntOptimizer::AntOptimizer;
};
