#pragma once

#include <functional>
#include <cstdint>

//"Load" wraps a global resource whose construction must wait until after
// the OpenGL context exists. Declare at file scope:
//   Load< Thing > thing(LoadTagDefault, [](){ return new Thing(...); });
// and main() calls call_load_functions() once the context is current.

enum LoadTag : uint32_t {
	LoadTagInit, //programs and other things that later loads depend on
	LoadTagDefault, //everything else
};

void add_load_function(LoadTag tag, std::function< void() > const &fn);

//run all registered load functions, LoadTagInit ones first:
void call_load_functions();

template< typename T >
struct Load {
	Load(LoadTag tag, std::function< T const *() > const &load_fn) {
		add_load_function(tag, [this,load_fn](){
			value = load_fn();
		});
	}

	T const &operator*() const { return *value; }
	T const *operator->() const { return value; }

	T const *value = nullptr;
};
