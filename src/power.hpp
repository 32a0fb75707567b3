#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

// Strategy used for the trail^alpha and visibility^beta terms of the decision rule
struct PowerFunction {
	virtual ~PowerFunction() = default;
	virtual double operator()(double base, double exponent) const = 0;
	virtual const char* name() const = 0;
};

struct ExactPower: PowerFunction {
	double operator()(double base, double exponent) const override {
		return std::pow(base, exponent);
	}

	const char* name() const override { return "exact"; }
};

/*
Approximates base^exponent by interpolating the high 32 bits of the IEEE-754
representation of base. Relative error can reach ~25% at the extremes, which
is fine for a proportional random selection: ordering is kept, since the
result is monotonic in base for a positive exponent.
Non-positive bases and results that would underflow the bit trick yield 0.
*/
struct FastPower: PowerFunction {
	static constexpr double one_high_word = 1072632447.0;

	double operator()(double base, double exponent) const override {
		if (!(base > 0.0)) { return 0.0; }

		std::uint64_t bits;
		std::memcpy(&bits, &base, sizeof(bits));
		double high = static_cast<double>(static_cast<std::int32_t>(bits >> 32));
		double y = exponent * (high - one_high_word) + one_high_word;
		if (y <= 0.0) { return 0.0; }
		if (y > 2146435071.0) { return HUGE_VAL; }

		std::uint64_t result_bits = static_cast<std::uint64_t>(static_cast<std::int64_t>(y)) << 32;
		double result;
		std::memcpy(&result, &result_bits, sizeof(result));
		return result;
	}

	const char* name() const override { return "fast"; }
};

inline std::unique_ptr<PowerFunction> make_power_function(const std::string& name) {
	if (name.empty() || name == "fast") {
		return std::make_unique<FastPower>();
	}
	if (name == "exact") {
		return std::make_unique<ExactPower>();
	}
	throw std::invalid_argument("Unknown power function: \"" + name + "\"");
}
