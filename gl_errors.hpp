#pragma once

#include "GL.hpp"

#include <iostream>
#include <string>

//print any pending OpenGL errors along with where the check happened:
#define GL_ERRORS() gl_errors(__FILE__, __LINE__)

inline void gl_errors(char const *file, int line) {
	GLenum error = glGetError();
	while (error != GL_NO_ERROR) {
		std::string name;
		if (error == GL_INVALID_ENUM) name = "GL_INVALID_ENUM";
		else if (error == GL_INVALID_VALUE) name = "GL_INVALID_VALUE";
		else if (error == GL_INVALID_OPERATION) name = "GL_INVALID_OPERATION";
		else if (error == GL_INVALID_FRAMEBUFFER_OPERATION) name = "GL_INVALID_FRAMEBUFFER_OPERATION";
		else if (error == GL_OUT_OF_MEMORY) name = "GL_OUT_OF_MEMORY";
		else name = "0x" + std::to_string(error);
		std::cerr << "GL error " << name << " at " << file << ":" << line << std::endl;
		error = glGetError();
	}
}
