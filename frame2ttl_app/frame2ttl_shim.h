/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/


#ifndef FRAME2TTL_SHIM_H
#define FRAME2TTL_SHIM_H

/** @file This is the shim for a POSIX host (linux).
 * Any define, macro and/or function herein must be adapted to match your
 * target platform
 */

// ---------------------------------------------- includes ----------------------------------------

#include <stdint.h>
#include <string.h>
#include <stdlib.h>
#include <unistd.h>

#if defined( __cplusplus)
extern "C"
{
#endif


// ---------------------------------------------- defines -----------------------------------------

#define SERIAL_MAX_TRANSFER                       4096  /**< largest single read()/write() chunk handed to the OS */
#define SERIAL_POLL_INTERVAL_MS                   1     /**< granularity of the timed read loop */


// ---------------------------------------------- macros ------------------------------------------

/** @brief macros to replace the platform specific printing
 */
#define PRINT_CHAR(c)                         printChar( c )
#define PRINT_INT(i)                          printInt( i )
#define PRINT_UINT(i)                         printUint( i )
#define PRINT_UINT_HEX(i)                     printUintHex( i )
#define PRINT_STR(str)                        printStr( str )
#define PRINT_CONST_STR(str)                  printConstStr( (const char *)str )
#define PRINT_LN()                            printLn( )

/** Which character to use to seperate the entries in printing */
#define SEPARATOR                             ','


// ---------------------------------------------- functions ---------------------------------------

/** @brief Function to allow to wait for some time in microseconds
 *  @param[in] wait number of microseconds to wait before this function returns
 */
void delayInMicroseconds( uint32_t wait );

/** @brief Function returns the current sys-tick.
 * \return current system tick in microseconds
 */
uint32_t getSysTick( );


// ---------------------------------- serial functions ------------------------------------------

/**  Return codes for serial functions:
 */
#define SERIAL_SUCCESS          0       /**< successfull execution no error */
#define SERIAL_ERR_OPEN         -1      /**< port could not be opened or configured */
#define SERIAL_ERR_WRITE        -2      /**< not all bytes could be written */
#define SERIAL_ERR_READ         -3      /**< the OS reported a read error or the port is closed */
#define SERIAL_ERR_TIMEOUT      -4      /**< timeout in waiting for the device to respond */

/** @brief Function will open the serial port and configure it for raw 8N1 transfers at the given
 * speed. Speeds the platform cannot set are replaced by the fastest supported one.
 * Any stale data in the receive buffer is discarded.
 * @param[in] dptr ... a pointer to the driver structure, the port handle is stored in it
 * @param[in] portName ... zero terminated device path, e.g. /dev/ttyACM0
 * @param[in] baudrate ... desired line speed in baud
 * \return SERIAL_SUCCESS when the port is open, else an error code
 */
int8_t serialOpen( void * dptr, const char * portName, uint32_t baudrate );

/** @brief Function closes the serial port. Can be called on a closed port.
 * @param[in] dptr ... a pointer to the driver structure
 */
void serialClose( void * dptr );

/** @brief Serial transmit function.
 * @param[in] dptr a pointer to the driver structure
 * @param[in] toTx number of bytes in the buffer to transmit
 * @param[in] txData pointer to the buffer to transmit
 * \return SERIAL_SUCCESS when all bytes were transmitted, else an error code
 */
int8_t serialWrite( void * dptr, uint16_t toTx, const uint8_t * txData );

/** @brief Serial receive function. Returns only after all requested bytes arrived, the
 * timeout elapsed or an error occured.
 * @param[in] dptr a pointer to the driver structure
 * @param[in] toRx number of bytes to receive
 * @param[out] rxData pointer to the buffer to be filled with received bytes
 * @param[in] timeoutInMs maximum time to wait for all bytes, 0 == wait forever
 * \return SERIAL_SUCCESS when all bytes were received, else an error code
 */
int8_t serialRead( void * dptr, uint32_t toRx, uint8_t * rxData, uint32_t timeoutInMs );

/** @brief Function returns the number of received bytes that can be read without blocking.
 * @param[in] dptr a pointer to the driver structure
 * \return number of bytes waiting in the receive buffer (0 on a closed port)
 */
uint32_t serialBytesAvailable( void * dptr );

/** @brief Function discards all received bytes that have not been read yet.
 * @param[in] dptr a pointer to the driver structure
 */
void serialFlushInput( void * dptr );


// ---------------------------------- console functions -----------------------------------------

/** @brief Function will prepare the console for single key input (no line buffering)
 */
void inputOpen( );

/** @brief Function restores the console settings saved by inputOpen
 */
void inputClose( );

/** @brief Function checks without blocking if a key was pressed
 * @param[out] c the received character
 * \return 1 if a character was received, 0 if not
 */
int8_t inputGetKey( char * c );

/** @brief Function outputs a single character. E.g. on a UART.
 *  @param[in] c the character to be printed
 */
void printChar( char c );

/** @brief Function outputs a signed integer. E.g. on a UART.
 *  @param[in] i the integer to be printed
 */
void printInt( int32_t i );

/** @brief Function outputs an unsigned integer. E.g. on a UART.
 *  @param[in] i the integer to be printed
 */
void printUint( uint32_t i );

/** @brief Function outputs an unsigned integer in HEX format. E.g. on a UART.
 *  @param[in] i the integer to be printed
 */
void printUintHex( uint32_t i );

/** @brief Function outputs a zero terminated string. E.g. on a UART.
 *  @param[in] str pointer to string to be printed
 */
void printStr( char * str );

/** @brief Function outputs a new-line. E.g. on a UART.
 */
void printLn( void );

/** @brief Function outputs a zero terminated constant string. E.g. on a UART.
 *  @param[in] str pointer to constant string to be printed.
 */
void printConstStr( const char * str );


#if defined( __cplusplus)
}
#endif

#endif  // FRAME2TTL_SHIM_H
