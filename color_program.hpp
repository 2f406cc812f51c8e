#pragma once

#include "GL.hpp"
#include "Load.hpp"

//ColorProgram fills quads with a flat color; with 'rounded' set, it cuts the quad down to its inscribed ellipse:
struct ColorProgram {
	//opengl program object:
	GLuint program = 0;

	//attribute locations:
	GLuint Position_vec2 = -1U;

	//uniform locations:
	GLuint object_to_clip_mat4 = -1U;
	GLuint color_vec4 = -1U;
	GLuint rounded_bool = -1U;

	ColorProgram();
};

extern Load< ColorProgram > color_program;
