/**
 * @file globals.h
 * @brief Global variables for replay2player
 */

#ifndef REPLAY2PLAYER_GLOBALS_H
#define REPLAY2PLAYER_GLOBALS_H

#include "LogLevel.h"

#endif // REPLAY2PLAYER_GLOBALS_H
