#include "compile_program.hpp"

#include "gl_errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {
	GLuint compile_shader(GLenum type, std::string const &source) {
		GLuint shader = glCreateShader(type);
		GLchar const *str = source.c_str();
		GLint length = GLint(source.size());
		glShaderSource(shader, 1, &str, &length);
		glCompileShader(shader);

		GLint compile_status = GL_FALSE;
		glGetShaderiv(shader, GL_COMPILE_STATUS, &compile_status);
		if (compile_status != GL_TRUE) {
			GLint info_log_length = 0;
			glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &info_log_length);
			std::vector< GLchar > info_log(std::max(info_log_length, 1), '\0');
			glGetShaderInfoLog(shader, GLsizei(info_log.size()), NULL, info_log.data());
			glDeleteShader(shader);
			throw std::runtime_error("Failed to compile " + std::string(type == GL_VERTEX_SHADER ? "vertex" : "fragment") + " shader:\n" + std::string(info_log.data()));
		}
		return shader;
	}
}

GLuint compile_program(std::string const &vertex_shader_source, std::string const &fragment_shader_source) {
	GLuint vertex_shader = compile_shader(GL_VERTEX_SHADER, vertex_shader_source);
	GLuint fragment_shader = compile_shader(GL_FRAGMENT_SHADER, fragment_shader_source);

	GLuint program = glCreateProgram();
	glAttachShader(program, vertex_shader);
	glAttachShader(program, fragment_shader);

	//shaders are reference-counted by the program:
	glDeleteShader(vertex_shader);
	glDeleteShader(fragment_shader);

	glLinkProgram(program);
	GLint link_status = GL_FALSE;
	glGetProgramiv(program, GL_LINK_STATUS, &link_status);
	if (link_status != GL_TRUE) {
		GLint info_log_length = 0;
		glGetProgramiv(program, GL_INFO_LOG_LENGTH, &info_log_length);
		std::vector< GLchar > info_log(std::max(info_log_length, 1), '\0');
		glGetProgramInfoLog(program, GLsizei(info_log.size()), NULL, info_log.data());
		glDeleteProgram(program);
		throw std::runtime_error("Failed to link program:\n" + std::string(info_log.data()));
	}

	GL_ERRORS();
	return program;
}
