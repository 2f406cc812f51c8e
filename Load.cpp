#include "Load.hpp"

#include <list>
#include <map>

namespace {
	//function-local static so that Load<> objects in other translation units can register safely:
	std::map< LoadTag, std::list< std::function< void() > > > &get_load_functions() {
		static std::map< LoadTag, std::list< std::function< void() > > > load_functions;
		return load_functions;
	}
}

void add_load_function(LoadTag tag, std::function< void() > const &fn) {
	get_load_functions()[tag].emplace_back(fn);
}

void call_load_functions() {
	auto &load_functions = get_load_functions();
	for (auto &tag_fns : load_functions) {
		for (auto const &fn : tag_fns.second) {
			fn();
		}
		tag_fns.second.clear();
	}
}
