#pragma once

// Single SDL include for the frontend. main() stays ours: no SDLmain.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
