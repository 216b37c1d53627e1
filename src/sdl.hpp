#pragma once

// Centralized SDL include.
// Only the surface and BMP helpers are used (no window, no renderer), so SDL is
// never initialised and main() stays our own: SDL_MAIN_HANDLED keeps SDL from
// renaming it to SDL_main.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
