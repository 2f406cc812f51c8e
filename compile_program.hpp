#pragma once

#include "GL.hpp"

#include <string>

//compile + link a vertex/fragment shader pair.
// note: will throw (with the info log) if either stage fails to compile or the program fails to link.
GLuint compile_program(std::string const &vertex_shader_source, std::string const &fragment_shader_source);
