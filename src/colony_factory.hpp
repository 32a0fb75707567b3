#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "problem.hpp"
#include "params.hpp"
#include "optimizer.hpp"

/*
Registry of colony variants. A variant is chosen on the command line by its
signature "name[:args]"; the part after the colon reaches the optimizer as
AntParams::variant_args.
*/
class ColonyFactory {
public:
	// A registered variant together with the arguments it was selected with
	struct Selection {
		const ColonyFactory* factory;
		std::string arguments;

		std::string signature() const {
			return arguments.empty() ? factory->name : factory->name + ":" + arguments;
		}

		std::unique_ptr<AntOptimizer> make(const Problem& problem, AntParams params) const {
			params.variant_args = arguments;
			return factory->make(problem, params);
		}
	};

	const std::string name;
	// Accepted arguments, for --list
	const std::string usage;

	ColonyFactory(std::string name, std::string usage)
	: name(std::move(name)), usage(std::move(usage)) {}

	virtual ~ColonyFactory() = default;

	virtual std::unique_ptr<AntOptimizer> make(const Problem& problem, AntParams params) const = 0;

	std::string signature() const {
		return usage.empty() ? name : name + ":" + usage;
	}

	template<typename Ty>
	static void add();

	static const ColonyFactory* get(const std::string& name) {
		auto it = registry.find(name);
		return it == registry.end() ? nullptr : it->second.get();
	}

	// Resolves "name[:args]", throws if no variant of that name is registered
	static Selection select(const std::string& signature) {
		size_t colon = signature.find(':');
		std::string name = signature.substr(0, colon);
		const ColonyFactory* factory = get(name);
		if (factory == nullptr) {
			throw std::invalid_argument("Unknown colony identifier: \"" + name + "\"");
		}
		return Selection{factory, colon == std::string::npos ? std::string() : signature.substr(colon + 1)};
	}

	// Sorted by name
	static std::vector<std::string> signatures() {
		std::vector<std::string> result;
		for (const auto& entry : registry) {
			result.push_back(entry.second->signature());
		}
		return result;
	}

private:
	static std::map<std::string, std::unique_ptr<ColonyFactory>> registry;
};

inline std::map<std::string, std::unique_ptr<ColonyFactory>> ColonyFactory::registry;

template<typename Ty>
struct ConcreteColonyFactory: ColonyFactory {
	ConcreteColonyFactory()
	: ColonyFactory(Ty::static_name, Ty::static_params) {}

	std::unique_ptr<AntOptimizer> make(const Problem& problem, AntParams params) const override {
		return std::make_unique<Ty>(problem, params);
	}
};

template<typename Ty>
void ColonyFactory::add() {
	auto factory = std::make_unique<ConcreteColonyFactory<Ty>>();
	std::string key = factory->name;
	registry[key] = std::move(factory);
}
