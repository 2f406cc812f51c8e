#include "color_program.hpp"

#include "compile_program.hpp"
#include "gl_errors.hpp"

ColorProgram::ColorProgram() {
	program = compile_program(
		"#version 330\n"
		"uniform mat4 object_to_clip;\n"
		"layout(location=0) in vec2 Position;\n" //quads are built on the unit square [0,1]x[0,1]
		"out vec2 local;\n"
		"void main() {\n"
		"	gl_Position = object_to_clip * vec4(Position, 0.0, 1.0);\n"
		"	local = Position;\n"
		"}\n"
		,
		"#version 330\n"
		"uniform vec4 color;\n"
		"uniform bool rounded;\n"
		"in vec2 local;\n"
		"out vec4 fragColor;\n"
		"void main() {\n"
		"	if (rounded && length(local - vec2(0.5)) > 0.5) discard;\n"
		"	fragColor = color;\n"
		"}\n"
	);

	Position_vec2 = glGetAttribLocation(program, "Position");

	object_to_clip_mat4 = glGetUniformLocation(program, "object_to_clip");
	color_vec4 = glGetUniformLocation(program, "color");
	rounded_bool = glGetUniformLocation(program, "rounded");

	GL_ERRORS();
}

Load< ColorProgram > color_program(LoadTagInit, [](){
	return new ColorProgram();
});
