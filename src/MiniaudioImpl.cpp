// Single translation unit that compiles the miniaudio implementation.
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"
