/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/


/** @file This is the frame2ttl host driver example console application.
 */


#ifndef FRAME2TTL_APP_H
#define FRAME2TTL_APP_H

// ---------------------------------------------- includes ----------------------------------------

#include "frame2ttl.h"

// ---------------------------------------------- defines -----------------------------------------

#define APP_DISPLAY_SAMPLES         2000    /**< size of the live display buffer (2 s at 1 kHz) */
#define APP_STREAM_CHUNK            256     /**< maximum samples drained per loop */
#define APP_BURST_SAMPLES           100     /**< samples read with key 'v' */
#define APP_LOOP_DELAY_US           25000   /**< main loop period, the display refresh rate */

// ---------------------------------------------- functions ---------------------------------------

/** @brief Function checks the command line values before they are handed to setupFn.
 * @param logLevelIdx ... index into the log level table, 0..5
 * @param generationId ... protocol generation, 2, 3 or 4
 * @return 1 if both are valid, 0 otherwise
 */
int8_t checkArguments( int logLevelIdx, int generationId );

/** @brief Setup function is only called once at startup. Opens the console and the device session.
 * @param logLevelIdx ...  the log level index to be used (0..5 -> see logLevels array in frame2ttl_app.cpp)
 * @param portName ... serial port of the device
 * @param generationId ... protocol generation 2, 3 or 4
 */
void setupFn( uint8_t logLevelIdx, const char * portName, uint8_t generationId );

/** @brief Main loop function, is executed cyclic
 * @return 1 if wants to be called again
 * @return 0 if program should terminate
 */
int8_t loopFn( );

/** @brief Terminate function is only called once when exit key 'q' is pressed. Closes the session
 * (streaming is switched off first) and restores the console.
 */
void terminateFn( );

#endif // FRAME2TTL_APP_H
