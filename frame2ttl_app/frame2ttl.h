/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/


#ifndef FRAME2TTL_H
#define FRAME2TTL_H

/** @file This is the frame2ttl host driver.
 * One driver structure represents one session with a device. The protocol
 * differences of the device generations are described by a constant
 * generation descriptor that is selected when the session is opened.
 */

// ---------------------------------------------- includes ----------------------------------------

#include "frame2ttl_shim.h"
#include "frame2ttl_cmds.h"

#if defined( __cplusplus)
extern "C"
{
#endif


// ---------------------------------------------- defines -----------------------------------------

#define FRAME2TTL_DRIVER_MAJOR_VERSION            1
#define FRAME2TTL_DRIVER_MINOR_VERSION            0

// log levels, can be or-ed together
#define FRAME2TTL_LOG_LEVEL_NONE                  0x00
#define FRAME2TTL_LOG_LEVEL_ERROR                 0x01  /**< error and warning messages */
#define FRAME2TTL_LOG_LEVEL_INFO                  0x02  /**< session open/close, versions */
#define FRAME2TTL_LOG_LEVEL_VERBOSE               0x04  /**< every command issued */
#define FRAME2TTL_LOG_LEVEL_SERIAL                0x08  /**< every serial transfer (byte counts) */
#define FRAME2TTL_LOG_LEVEL_DEBUG                 0x10  /**< serial transfers incl. data bytes */

// return codes of the driver functions
#define FRAME2TTL_SUCCESS_OK                      0
#define FRAME2TTL_ERR_HANDSHAKE                   -1    /**< wrong or missing identification byte */
#define FRAME2TTL_ERR_VERSION                     -2    /**< firmware/hardware not supported by this generation */
#define FRAME2TTL_ERR_VALIDATION                  -3    /**< argument out of range, nothing was transmitted */
#define FRAME2TTL_ERR_MODE                        -4    /**< not supported in the current detect mode/firmware */
#define FRAME2TTL_ERR_SERIAL                      -5    /**< port could not be opened, written or read */
#define FRAME2TTL_ERR_TIMEOUT                     -6    /**< a timed reply did not arrive */
#define FRAME2TTL_ERR_NOT_OPEN                    -7    /**< no session open */

// detect modes
#define FRAME2TTL_DETECT_MODE_AMPLITUDE           0     /**< raw luminance is compared against the thresholds */
#define FRAME2TTL_DETECT_MODE_DERIVATIVE          1     /**< sliding window luminance change is compared against the thresholds */

// sensor range
#define FRAME2TTL_SENSOR_MAX                      65535

// default thresholds
#define FRAME2TTL_HW2_LIGHT_THRESHOLD             100
#define FRAME2TTL_HW2_DARK_THRESHOLD              -150
#define FRAME2TTL_HW3_LIGHT_THRESHOLD             75
#define FRAME2TTL_HW3_DARK_THRESHOLD              -75
#define FRAME2TTL_AMPLITUDE_LIGHT_THRESHOLD       20000
#define FRAME2TTL_AMPLITUDE_DARK_THRESHOLD        30000
#define FRAME2TTL_DEFAULT_ACTIVATION_MARGIN       1000

// timing
#define FIRMWARE_REPLY_WAIT_MS                    250   /**< firmware v1 does not answer, so check after this time */
#define REPLY_TIMEOUT_MS                          1000  /**< handshake and version replies */
#define REOPEN_WAIT_MS                            250   /**< pause between closing and reopening at the fast link speed */
#define STREAM_STOP_WAIT_MS                       100   /**< let the last streamed samples arrive before discarding them */
#define AUTO_THRESHOLD_WAIT_MS                    3000  /**< the device measures ~2.5 seconds before it replies */

#define FRAME2TTL_MAX_PORT_NAME                   128

// link speeds
#define FRAME2TTL_BAUD_V2                         115200
#define FRAME2TTL_BAUD_V3                         12000000
#define FRAME2TTL_BAUD_FAST                       480000000


// ---------------------------------------------- macros ------------------------------------------

#define frame2ttlGetUint16( ptr )                 ( (uint16_t)( (ptr)[0] | ( (uint16_t)( (ptr)[1] ) << 8 ) ) )
#define frame2ttlGetInt16( ptr )                  ( (int16_t)frame2ttlGetUint16( ptr ) )
#define frame2ttlGetUint32( ptr )                 ( (uint32_t)(ptr)[0] | ( (uint32_t)(ptr)[1] << 8 ) | ( (uint32_t)(ptr)[2] << 16 ) | ( (uint32_t)(ptr)[3] << 24 ) )
#define frame2ttlGetInt32( ptr )                  ( (int32_t)frame2ttlGetUint32( ptr ) )


// ---------------------------------------------- types -------------------------------------------

/** @brief Describes one generation of the device protocol
 */
typedef struct _frame2ttlGeneration
{
  uint8_t id;                       /**< 2, 3 or 4 */
  uint32_t baudrate;                /**< link speed for the handshake */
  uint32_t fastBaudrate;            /**< link speed after the hardware check, 0 == never switch */
  uint8_t fastHardwareVersion;      /**< hardware versions >= this need the fast link */
  uint8_t exactHardwareVersion;     /**< 0 == any hardware version is accepted */
  uint8_t queryFirmware;            /**< 1 == firmware version is requested and checked */
  uint8_t minFirmwareVersion;
  uint8_t maxFirmwareVersion;       /**< 0 == no upper limit */
  uint8_t currentFirmwareVersion;   /**< older (but supported) firmware produces a warning */
  uint8_t int32FirmwareVersion;     /**< firmware >= this uses int32 thresholds + detect mode, 0 == never */
  int32_t fallbackLightThreshold;   /**< derivative default for hardware without own defaults */
  int32_t fallbackDarkThreshold;
  uint16_t autoThresholdWaitMs;
} frame2ttlGeneration;

typedef struct _frame2ttlDriverInfo
{
  uint8_t version[ 2 ];             /**< driver major, minor */
} frame2ttlDriverInfo;

typedef struct _frame2ttlDeviceInfo
{
  uint8_t firmwareVersion;          /**< 0 if the generation does not query it */
  uint8_t hardwareVersion;
} frame2ttlDeviceInfo;

/** @brief The driver structure, one per device session
 */
typedef struct _frame2ttlDriver
{
  frame2ttlDriverInfo info;
  frame2ttlDeviceInfo device;
  const frame2ttlGeneration * generation;   /**< 0 when no session is open */
  int serialHandle;                         /**< platform handle of the port, -1 when closed */
  uint32_t baudrate;                        /**< current link speed */
  char portName[ FRAME2TTL_MAX_PORT_NAME ];
  int32_t lightThreshold;
  int32_t darkThreshold;
  uint32_t activationMargin;
  uint8_t detectMode;
  uint8_t streaming;
  uint8_t logLevel;
} frame2ttlDriver;

extern const frame2ttlGeneration frame2ttlGenerationV2;
extern const frame2ttlGeneration frame2ttlGenerationV3;
extern const frame2ttlGeneration frame2ttlGenerationV4;


// ---------------------------------------------- functions ---------------------------------------

/** @brief Function returns the generation descriptor for the given id
 * @param id ... 2, 3 or 4
 * \return pointer to the descriptor, 0 if the id is unknown
 */
const frame2ttlGeneration * frame2ttlGetGeneration( uint8_t id );

/** @brief Function resets the driver structure. Must be called once before any other function.
 * @param driver ... pointer to the driver structure
 * @param logLevel ... bitmask of FRAME2TTL_LOG_LEVEL_*
 */
void frame2ttlInitialise( frame2ttlDriver * driver, uint8_t logLevel );

/** @brief Function changes the log level
 */
void frame2ttlSetLogLevel( frame2ttlDriver * driver, uint8_t logLevel );

/** @brief Function opens the port and negotiates a session: handshake, firmware and hardware
 * version check, link speed switch if the hardware needs it and default thresholds.
 * An already open session is closed first.
 * @param driver ... pointer to the driver structure
 * @param portName ... device path of the serial port
 * @param generation ... protocol generation to use
 * \return FRAME2TTL_SUCCESS_OK when the session is open, else an error code (the port is closed then)
 */
int8_t frame2ttlOpen( frame2ttlDriver * driver, const char * portName, const frame2ttlGeneration * generation );

/** @brief Function stops streaming (if on) and closes the port. No acknowledge is checked.
 */
void frame2ttlClose( frame2ttlDriver * driver );

/** @brief Function returns 1 if a session is open, 0 if not
 */
int8_t frame2ttlIsOpen( const frame2ttlDriver * driver );

/** @brief Function returns 1 if the session transmits both thresholds as a pair of int16 with a
 * single command, 0 if the thresholds are sent independently as int32.
 */
int8_t frame2ttlUsesPairedThresholds( const frame2ttlDriver * driver );

/** @brief Function returns 1 if the session supports detect mode and activation margin
 */
int8_t frame2ttlHasDetectMode( const frame2ttlDriver * driver );

/** @brief Function validates and transmits a new light threshold. The local value is only
 * changed after the transmission succeeded.
 * @param driver ... pointer to the driver structure
 * @param threshold ... derivative mode: > 0, amplitude mode: [margin, 65535-margin] and below dark threshold
 * \return FRAME2TTL_SUCCESS_OK or an error code, FRAME2TTL_ERR_VALIDATION is returned before anything is sent
 */
int8_t frame2ttlSetLightThreshold( frame2ttlDriver * driver, int32_t threshold );

/** @brief Function validates and transmits a new dark threshold. The local value is only
 * changed after the transmission succeeded.
 * @param driver ... pointer to the driver structure
 * @param threshold ... derivative mode: < 0, amplitude mode: [margin, 65535-margin] and above light threshold
 * \return FRAME2TTL_SUCCESS_OK or an error code, FRAME2TTL_ERR_VALIDATION is returned before anything is sent
 */
int8_t frame2ttlSetDarkThreshold( frame2ttlDriver * driver, int32_t threshold );

/** @brief Function switches the detect mode. If the mode changes both thresholds are reset to
 * the defaults of the new mode.
 * @param mode ... FRAME2TTL_DETECT_MODE_AMPLITUDE or FRAME2TTL_DETECT_MODE_DERIVATIVE
 */
int8_t frame2ttlSetDetectMode( frame2ttlDriver * driver, uint8_t mode );

/** @brief Function sets the minimum distance of the amplitude mode thresholds to the sensor range limits
 */
int8_t frame2ttlSetActivationMargin( frame2ttlDriver * driver, uint32_t margin );

/** @brief Function lets the device measure the light threshold. Run with the sync patch BLACK.
 * Blocks for the settling time and then until the device replies.
 */
int8_t frame2ttlCalibrateLightThresholdAuto( frame2ttlDriver * driver );

/** @brief Function lets the device measure the dark threshold. Run with the sync patch WHITE.
 * Blocks for the settling time and then until the device replies.
 */
int8_t frame2ttlCalibrateDarkThresholdAuto( frame2ttlDriver * driver );

/** @brief Function reads a number of contiguous raw sensor values. Blocks until all arrived.
 * @param driver ... pointer to the driver structure
 * @param nSamples ... number of samples, must be > 0
 * @param samples ... buffer of at least nSamples entries
 */
int8_t frame2ttlReadSamples( frame2ttlDriver * driver, int32_t nSamples, uint16_t * samples );

/** @brief Function reads the current raw sensor value
 */
int8_t frame2ttlReadSensor( frame2ttlDriver * driver, uint16_t * sample );

/** @brief Function switches streaming of raw sensor values on (1) or off (0)
 */
int8_t frame2ttlSetStreaming( frame2ttlDriver * driver, uint8_t enabled );

/** @brief Function reads the streamed samples that are already received, never blocks.
 * Only whole samples are read, a trailing single byte stays in the receive buffer.
 * @param driver ... pointer to the driver structure
 * @param samples ... buffer to fill
 * @param maxSamples ... size of the buffer in samples
 * @param received ... number of samples written to the buffer
 */
int8_t frame2ttlReadStream( frame2ttlDriver * driver, uint16_t * samples, uint32_t maxSamples, uint32_t * received );


#if defined( __cplusplus)
}
#endif

#endif // FRAME2TTL_H
