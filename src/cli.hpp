#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/*
Minimal GNU-style command line: "--name value", "--name=value", "-n value",
boolean flags, and everything not starting with a dash collected as entries.
*/
struct CliParameters {
private:
	enum class ArgumentType { parameter, flag };
	struct Argument {
		std::string name;
		std::vector<std::string> aliases;
		std::string description;

		ArgumentType type;
		std::string value;
		std::string default_value;
		bool given = false;
	};

	std::vector<Argument> arguments;
	std::unordered_map<std::string, size_t> lookup;
	std::vector<std::string> items;

	void add(Argument argument) {
		if (lookup.count(argument.name) != 0) {
			throw std::invalid_argument("Argument registered twice: " + argument.name);
		}
		std::sort(argument.aliases.begin(), argument.aliases.end());
		arguments.push_back(std::move(argument));
		size_t index = arguments.size() - 1;
		lookup[arguments.back().name] = index;
		for (const auto& alias : arguments.back().aliases) {
			lookup[alias] = index;
		}
	}

	Argument& find(const std::string& name, ArgumentType type) {
		auto it = lookup.find(name);
		if (it == lookup.end()) {
			throw std::invalid_argument("Argument was never registered: " + name);
		}
		Argument& arg = arguments.at(it->second);
		if (arg.type != type) {
			throw std::invalid_argument(
				"Argument was not registered as " + std::string(type == ArgumentType::flag ? "flag" : "parameter")
				+ ": " + name);
		}
		return arg;
	}

	static std::string switch_name(const std::string& name) {
		return (name.size() == 1 ? "-" : "--") + name;
	}

public:
	void addParameter(std::string name, std::string description, std::unordered_set<std::string> alias = {}, std::string _default = "") {
		add(Argument{name, {alias.begin(), alias.end()}, description, ArgumentType::parameter, _default, _default});
	}

	void addFlag(std::string name, std::string description, std::unordered_set<std::string> alias = {}) {
		add(Argument{name, {alias.begin(), alias.end()}, description, ArgumentType::flag, "", ""});
	}

	std::string param(std::string name) {
		return find(name, ArgumentType::parameter).value;
	}

	bool flag(std::string name) {
		return find(name, ArgumentType::flag).given;
	}

	// Whether a parameter was given explicitly rather than left at its default
	bool given(std::string name) {
		return find(name, ArgumentType::parameter).given;
	}

	// Value of a parameter, parsed as a real number
	double real(std::string name) {
		std::string value = param(name);
		try {
			size_t used = 0;
			double result = std::stod(value, &used);
			if (used == value.size()) { return result; }
		}
		catch (const std::logic_error&) {}
		throw std::invalid_argument("Expected a number for --" + name + ", got \"" + value + "\"");
	}

	// Value of a parameter, parsed as a non-negative integer
	size_t count(std::string name) {
		std::string value = param(name);
		if (!value.empty() && value.find_first_not_of("0123456789") == std::string::npos) {
			try {
				return static_cast<size_t>(std::stoull(value));
			}
			catch (const std::out_of_range&) {}
		}
		throw std::invalid_argument("Expected a non-negative integer for --" + name + ", got \"" + value + "\"");
	}

	void parse(int argc, char* argv[]) {
		for (int i = 1; i < argc; i++) {
			std::string arg(argv[i]);
			if (arg.size() < 2 || arg.front() != '-') {
				items.push_back(arg);
				continue;
			}

			size_t dashes = arg.find_first_not_of('-');
			if (dashes == std::string::npos || dashes > 2) {
				throw std::invalid_argument("Malformed argument: " + arg);
			}
			size_t eqPos = arg.find_first_of('=');
			std::string argName = arg.substr(dashes, eqPos == std::string::npos ? eqPos : eqPos - dashes);

			auto it = lookup.find(argName);
			if (it == lookup.end()) {
				throw std::invalid_argument("Unknown Argument: " + arg);
			}
			Argument& argument = arguments.at(it->second);
			argument.given = true;
			if (argument.type == ArgumentType::flag) {
				if (eqPos != std::string::npos) {
					throw std::invalid_argument("Flag does not take a value: " + arg);
				}
				continue;
			}

			if (eqPos != std::string::npos) {
				argument.value = arg.substr(eqPos + 1);
			}
			else if (++i < argc) {
				argument.value = argv[i];
			}
			else {
				throw std::invalid_argument("No value provided for parameter: " + arg);
			}
		}
	}

	std::vector<std::string>& entries() {
		return items;
	}

	// One line per argument: switches, description and default value
	std::string help(size_t column_width = 28) const {
		std::string result = "\n";
		for (const auto& argument : arguments) {
			std::string switches = "  ";
			for (const auto& alias : argument.aliases) {
				switches += switch_name(alias) + ", ";
			}
			switches += switch_name(argument.name);
			if (argument.type == ArgumentType::parameter) {
				switches += " <value>";
			}

			if (switches.size() + 1 > column_width) {
				result += switches + "\n" + std::string(column_width, ' ');
			}
			else {
				result += switches + std::string(column_width - switches.size(), ' ');
			}

			result += argument.description;
			if (!argument.default_value.empty()) {
				result += " (default: " + argument.default_value + ")";
			}
			result += "\n";
		}
		return result;
	}
};
