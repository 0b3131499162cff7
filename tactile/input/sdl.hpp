#ifndef D5A38E61_2F07_4B9C_83D6_A1E49C7052BF
#define D5A38E61_2F07_4B9C_83D6_A1E49C7052BF

#include <SDL3/SDL_keycode.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_events.h>
#include <SDL3/SDL_mouse.h>
#include <SDL3/SDL.h>

#endif /* D5A38E61_2F07_4B9C_83D6_A1E49C7052BF */
