#pragma once

//OpenGL 3.3 core profile entry points, resolved at link time against libGL:
#define GL_GLEXT_PROTOTYPES
#include <GL/glcorearb.h>
