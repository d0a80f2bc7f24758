/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/

//
// frame2ttl host driver
//

// ---------------------------------------------- includes ----------------------------------------

#include "frame2ttl.h"
#include "frame2ttl_shim.h"
#include "frame2ttl_cmds.h"


// ---------------------------------------------- defines -----------------------------------------

#define INT16_LOWEST          ( -32768 )
#define INT16_HIGHEST         32767


// ---------------------------------------------- constants -----------------------------------------

// hardware v2 legacy driver: 115200 baud, no firmware query, hardware must be 2
const frame2ttlGeneration frame2ttlGenerationV2 =
{ .id = 2
, .baudrate = FRAME2TTL_BAUD_V2
, .fastBaudrate = 0
, .fastHardwareVersion = 0
, .exactHardwareVersion = 2
, .queryFirmware = 0
, .minFirmwareVersion = 0
, .maxFirmwareVersion = 0
, .currentFirmwareVersion = 0
, .int32FirmwareVersion = 0                         // always paired int16
, .fallbackLightThreshold = FRAME2TTL_HW2_LIGHT_THRESHOLD
, .fallbackDarkThreshold = FRAME2TTL_HW2_DARK_THRESHOLD
, .autoThresholdWaitMs = AUTO_THRESHOLD_WAIT_MS
};

// baud-switch driver: hardware 3 is reopened at the fast link speed
const frame2ttlGeneration frame2ttlGenerationV3 =
{ .id = 3
, .baudrate = FRAME2TTL_BAUD_V3
, .fastBaudrate = FRAME2TTL_BAUD_FAST
, .fastHardwareVersion = 3
, .exactHardwareVersion = 0
, .queryFirmware = 1
, .minFirmwareVersion = 2
, .maxFirmwareVersion = 0
, .currentFirmwareVersion = 2
, .int32FirmwareVersion = 0
, .fallbackLightThreshold = FRAME2TTL_HW3_LIGHT_THRESHOLD
, .fallbackDarkThreshold = FRAME2TTL_HW3_DARK_THRESHOLD
, .autoThresholdWaitMs = AUTO_THRESHOLD_WAIT_MS
};

// detect mode driver: firmware 3 .. 4, firmware 4 adds detect mode + int32 thresholds
const frame2ttlGeneration frame2ttlGenerationV4 =
{ .id = 4
, .baudrate = FRAME2TTL_BAUD_V3
, .fastBaudrate = FRAME2TTL_BAUD_FAST
, .fastHardwareVersion = 3
, .exactHardwareVersion = 0
, .queryFirmware = 1
, .minFirmwareVersion = 3
, .maxFirmwareVersion = 4
, .currentFirmwareVersion = 4
, .int32FirmwareVersion = 4
, .fallbackLightThreshold = FRAME2TTL_HW3_LIGHT_THRESHOLD
, .fallbackDarkThreshold = FRAME2TTL_HW3_DARK_THRESHOLD
, .autoThresholdWaitMs = AUTO_THRESHOLD_WAIT_MS
};


// ---------------------------------------------- logging -------------------------------------------

static void printError ( const frame2ttlDriver * driver, const char * what, int32_t value )
{
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_ERROR )
  {
    PRINT_CONST_STR( "#Err" );
    PRINT_CHAR( SEPARATOR );
    PRINT_CONST_STR( what );
    PRINT_CHAR( SEPARATOR );
    PRINT_INT( value );
    PRINT_LN( );
  }
}

static void printCommand ( const frame2ttlDriver * driver, char opcode, int32_t value )
{
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_VERBOSE )
  {
    PRINT_CONST_STR( "#Cmd" );
    PRINT_CHAR( SEPARATOR );
    PRINT_CHAR( opcode );
    PRINT_CHAR( SEPARATOR );
    PRINT_INT( value );
    PRINT_LN( );
  }
}


// ---------------------------------------------- helpers -------------------------------------------

static void setInt16 ( uint8_t * buf, int16_t value )
{
  uint16_t v = (uint16_t)value;
  buf[0] = (uint8_t)v;
  buf[1] = (uint8_t)( v >> 8 );
}

static void setUint32 ( uint8_t * buf, uint32_t value )
{
  buf[0] = (uint8_t)value;
  buf[1] = (uint8_t)( value >> 8 );
  buf[2] = (uint8_t)( value >> 16 );
  buf[3] = (uint8_t)( value >> 24 );
}

// maps shim error codes to driver error codes
static int8_t serialResult ( int8_t res )
{
  if ( res == SERIAL_SUCCESS )
  {
    return FRAME2TTL_SUCCESS_OK;
  }
  if ( res == SERIAL_ERR_TIMEOUT )
  {
    return FRAME2TTL_ERR_TIMEOUT;
  }
  return FRAME2TTL_ERR_SERIAL;
}

// transmit an opcode with an optional payload as a single write
static int8_t sendCommand ( frame2ttlDriver * driver, uint8_t opcode, uint8_t payloadSize, const uint8_t * payload )
{
  uint8_t buf[ FRAME2TTL_MAX_CMD_SIZE ];
  buf[0] = opcode;
  if ( payloadSize )
  {
    memcpy( buf + 1, payload, payloadSize );
  }
  int8_t res = serialWrite( driver, 1 + payloadSize, buf );
  if ( res != SERIAL_SUCCESS )
  {
    printError( driver, "tx", opcode );
  }
  return serialResult( res );
}

static int8_t sendUint8 ( frame2ttlDriver * driver, uint8_t opcode, uint8_t value )
{
  printCommand( driver, opcode, value );
  return sendCommand( driver, opcode, 1, &value );
}

static int8_t sendUint32 ( frame2ttlDriver * driver, uint8_t opcode, uint32_t value )
{
  uint8_t payload[4];
  setUint32( payload, value );
  printCommand( driver, opcode, (int32_t)value );
  return sendCommand( driver, opcode, 4, payload );
}

// sends both thresholds in one command as 2 x int16
static int8_t sendPairedThresholds ( frame2ttlDriver * driver, int32_t light, int32_t dark )
{
  uint8_t payload[ FRAME2TTL_PAIRED_THRESHOLD_SIZE ];
  setInt16( payload, (int16_t)light );
  setInt16( payload + 2, (int16_t)dark );
  printCommand( driver, FRAME2TTL_CMD_SET_THRESHOLDS, light );
  return sendCommand( driver, FRAME2TTL_CMD_SET_THRESHOLDS, FRAME2TTL_PAIRED_THRESHOLD_SIZE, payload );
}

// reads a single byte reply with the reply timeout
static int8_t readReplyByte ( frame2ttlDriver * driver, uint8_t * value )
{
  return serialResult( serialRead( driver, 1, value, REPLY_TIMEOUT_MS ) );
}

static void defaultThresholds ( const frame2ttlDriver * driver, int32_t * light, int32_t * dark )
{
  if ( driver->detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE )
  {
    *light = FRAME2TTL_AMPLITUDE_LIGHT_THRESHOLD;
    *dark = FRAME2TTL_AMPLITUDE_DARK_THRESHOLD;
  }
  else if ( driver->device.hardwareVersion == 2 )
  {
    *light = FRAME2TTL_HW2_LIGHT_THRESHOLD;
    *dark = FRAME2TTL_HW2_DARK_THRESHOLD;
  }
  else if ( driver->device.hardwareVersion == 3 )
  {
    *light = FRAME2TTL_HW3_LIGHT_THRESHOLD;
    *dark = FRAME2TTL_HW3_DARK_THRESHOLD;
  }
  else
  {
    *light = driver->generation->fallbackLightThreshold;
    *dark = driver->generation->fallbackDarkThreshold;
  }
}

// transmits the defaults of the current mode without validation and stores them
static int8_t applyDefaultThresholds ( frame2ttlDriver * driver )
{
  int32_t light;
  int32_t dark;
  int8_t res;
  defaultThresholds( driver, &light, &dark );
  if ( frame2ttlUsesPairedThresholds( driver ) )
  {
    res = sendPairedThresholds( driver, light, dark );
  }
  else if ( driver->detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE )
  { // dark first, the device keeps light below dark at all times
    res = sendUint32( driver, FRAME2TTL_CMD_SET_DARK_THRESHOLD, (uint32_t)dark );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      res = sendUint32( driver, FRAME2TTL_CMD_SET_THRESHOLDS, (uint32_t)light );
    }
  }
  else
  {
    res = sendUint32( driver, FRAME2TTL_CMD_SET_THRESHOLDS, (uint32_t)light );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      res = sendUint32( driver, FRAME2TTL_CMD_SET_DARK_THRESHOLD, (uint32_t)dark );
    }
  }
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    driver->lightThreshold = light;
    driver->darkThreshold = dark;
  }
  return res;
}

// checks a (light, dark) pair against the rules of the current detect mode
static int8_t checkThresholds ( const frame2ttlDriver * driver, int32_t light, int32_t dark )
{
  if ( driver->detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE )
  {
    int32_t lowest = (int32_t)driver->activationMargin;
    int32_t highest = FRAME2TTL_SENSOR_MAX - (int32_t)driver->activationMargin;
    if ( light < lowest || light > highest || dark < lowest || dark > highest )
    {
      return FRAME2TTL_ERR_VALIDATION;
    }
    if ( light >= dark )
    {
      return FRAME2TTL_ERR_VALIDATION;
    }
  }
  else
  {
    if ( light <= 0 || dark >= 0 )
    {
      return FRAME2TTL_ERR_VALIDATION;
    }
    if ( frame2ttlUsesPairedThresholds( driver ) && ( light > INT16_HIGHEST || dark < INT16_LOWEST ) )
    {
      return FRAME2TTL_ERR_VALIDATION;
    }
  }
  return FRAME2TTL_SUCCESS_OK;
}

// the amplitude thresholds (current ones, or the defaults a later mode switch applies) must stay inside
// [margin, sensor max - margin], margin must be <= ( FRAME2TTL_SENSOR_MAX - 1 ) / 2
static int8_t amplitudeFitsMargin ( const frame2ttlDriver * driver, uint32_t margin )
{
  int32_t light = FRAME2TTL_AMPLITUDE_LIGHT_THRESHOLD;
  int32_t dark = FRAME2TTL_AMPLITUDE_DARK_THRESHOLD;
  if ( driver->detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE )
  {
    light = driver->lightThreshold;
    dark = driver->darkThreshold;
  }
  return light >= (int32_t)margin && dark <= FRAME2TTL_SENSOR_MAX - (int32_t)margin;
}

static int8_t openPort ( frame2ttlDriver * driver, uint32_t baudrate )
{
  int8_t res = serialOpen( driver, driver->portName, baudrate );
  if ( res != SERIAL_SUCCESS )
  {
    printError( driver, "open", (int32_t)baudrate );
    return FRAME2TTL_ERR_SERIAL;
  }
  driver->baudrate = baudrate;
  return FRAME2TTL_SUCCESS_OK;
}

static int8_t handshake ( frame2ttlDriver * driver )
{
  uint8_t reply = 0;
  int8_t res = sendCommand( driver, FRAME2TTL_CMD_HANDSHAKE, 0, 0 );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    res = readReplyByte( driver, &reply );
  }
  if ( res == FRAME2TTL_ERR_SERIAL )
  {
    return res;
  }
  if ( res != FRAME2TTL_SUCCESS_OK || reply != FRAME2TTL_HANDSHAKE_REPLY )
  {
    printError( driver, "handshake", reply );
    return FRAME2TTL_ERR_HANDSHAKE;
  }
  return FRAME2TTL_SUCCESS_OK;
}

static int8_t checkFirmware ( frame2ttlDriver * driver )
{
  const frame2ttlGeneration * gen = driver->generation;
  int8_t res = sendCommand( driver, FRAME2TTL_CMD_FIRMWARE_VERSION, 0, 0 );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  delayInMicroseconds( FIRMWARE_REPLY_WAIT_MS * 1000 );
  if ( serialBytesAvailable( driver ) == 0 )
  { // firmware v1 does not know the command
    printError( driver, "legacy firmware", gen->minFirmwareVersion );
    return FRAME2TTL_ERR_VERSION;
  }
  res = readReplyByte( driver, &driver->device.firmwareVersion );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( driver->device.firmwareVersion < gen->minFirmwareVersion )
  {
    printError( driver, "old firmware", driver->device.firmwareVersion );
    return FRAME2TTL_ERR_VERSION;
  }
  if ( gen->maxFirmwareVersion && driver->device.firmwareVersion > gen->maxFirmwareVersion )
  {
    printError( driver, "future firmware", driver->device.firmwareVersion );
    return FRAME2TTL_ERR_VERSION;
  }
  if ( driver->device.firmwareVersion < gen->currentFirmwareVersion )
  {
    printError( driver, "update firmware to", gen->currentFirmwareVersion );    // supported, so only a warning
  }
  return FRAME2TTL_SUCCESS_OK;
}

static int8_t checkHardware ( frame2ttlDriver * driver )
{
  const frame2ttlGeneration * gen = driver->generation;
  int8_t res = sendCommand( driver, FRAME2TTL_CMD_HARDWARE_VERSION, 0, 0 );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    res = readReplyByte( driver, &driver->device.hardwareVersion );
  }
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    printError( driver, "hardware version", res );
    return res;
  }
  if ( gen->exactHardwareVersion && driver->device.hardwareVersion != gen->exactHardwareVersion )
  {
    printError( driver, "hardware", driver->device.hardwareVersion );
    return FRAME2TTL_ERR_VERSION;
  }
  if ( gen->fastBaudrate && driver->device.hardwareVersion >= gen->fastHardwareVersion )
  { // the link speed cannot be changed on an open port, reopen it
    serialClose( driver );
    delayInMicroseconds( REOPEN_WAIT_MS * 1000 );
    res = openPort( driver, gen->fastBaudrate );
  }
  return res;
}

static void printSession ( const frame2ttlDriver * driver )
{
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_INFO )
  {
    PRINT_CONST_STR( "#Info,open," );
    PRINT_STR( (char *)driver->portName );
    PRINT_CHAR( SEPARATOR );
    PRINT_UINT( driver->generation->id );
    PRINT_CHAR( SEPARATOR );
    PRINT_UINT( driver->device.firmwareVersion );
    PRINT_CHAR( SEPARATOR );
    PRINT_UINT( driver->device.hardwareVersion );
    PRINT_CHAR( SEPARATOR );
    PRINT_UINT( driver->baudrate );
    PRINT_LN( );
  }
}

static int8_t checkSession ( const frame2ttlDriver * driver )
{
  if ( !frame2ttlIsOpen( driver ) )
  {
    printError( driver, "not open", 0 );
    return FRAME2TTL_ERR_NOT_OPEN;
  }
  return FRAME2TTL_SUCCESS_OK;
}

static int8_t calibrateAuto ( frame2ttlDriver * driver, uint8_t opcode, int32_t * threshold )
{
  uint8_t reply[ FRAME2TTL_SINGLE_THRESHOLD_SIZE ];
  uint8_t replySize;
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( driver->detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE )
  {
    printError( driver, "auto threshold needs derivative mode", opcode );
    return FRAME2TTL_ERR_MODE;
  }
  printCommand( driver, opcode, 0 );
  res = sendCommand( driver, opcode, 0, 0 );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  delayInMicroseconds( (uint32_t)driver->generation->autoThresholdWaitMs * 1000 );
  replySize = frame2ttlUsesPairedThresholds( driver ) ? 2 : 4;
  res = serialResult( serialRead( driver, replySize, reply, 0 ) );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    *threshold = ( replySize == 2 ) ? frame2ttlGetInt16( reply ) : frame2ttlGetInt32( reply );
  }
  return res;
}


// ---------------------------------------------- functions -----------------------------------------

const frame2ttlGeneration * frame2ttlGetGeneration ( uint8_t id )
{
  switch ( id )
  {
    case 2: return &frame2ttlGenerationV2;
    case 3: return &frame2ttlGenerationV3;
    case 4: return &frame2ttlGenerationV4;
    default: return 0;
  }
}

void frame2ttlInitialise ( frame2ttlDriver * driver, uint8_t logLevel )
{
  memset( driver, 0, sizeof( frame2ttlDriver ) );
  driver->info.version[0] = FRAME2TTL_DRIVER_MAJOR_VERSION;
  driver->info.version[1] = FRAME2TTL_DRIVER_MINOR_VERSION;
  driver->serialHandle = -1;
  driver->detectMode = FRAME2TTL_DETECT_MODE_DERIVATIVE;
  driver->activationMargin = FRAME2TTL_DEFAULT_ACTIVATION_MARGIN;
  driver->logLevel = logLevel;
}

void frame2ttlSetLogLevel ( frame2ttlDriver * driver, uint8_t logLevel )
{
  driver->logLevel = logLevel;
}

int8_t frame2ttlIsOpen ( const frame2ttlDriver * driver )
{
  return driver->generation != 0 && driver->serialHandle >= 0;
}

int8_t frame2ttlUsesPairedThresholds ( const frame2ttlDriver * driver )
{
  const frame2ttlGeneration * gen = driver->generation;
  return gen == 0 || gen->int32FirmwareVersion == 0 || driver->device.firmwareVersion < gen->int32FirmwareVersion;
}

int8_t frame2ttlHasDetectMode ( const frame2ttlDriver * driver )
{
  return !frame2ttlUsesPairedThresholds( driver );
}

int8_t frame2ttlOpen ( frame2ttlDriver * driver, const char * portName, const frame2ttlGeneration * generation )
{
  int8_t res;
  if ( frame2ttlIsOpen( driver ) )
  {
    frame2ttlClose( driver );
  }
  if ( generation == 0 || portName == 0 || strlen( portName ) >= FRAME2TTL_MAX_PORT_NAME )
  {
    printError( driver, "open arguments", 0 );
    return FRAME2TTL_ERR_VALIDATION;
  }
  strcpy( driver->portName, portName );
  driver->generation = generation;
  driver->device.firmwareVersion = 0;
  driver->device.hardwareVersion = 0;
  driver->detectMode = FRAME2TTL_DETECT_MODE_DERIVATIVE;
  driver->activationMargin = FRAME2TTL_DEFAULT_ACTIVATION_MARGIN;
  driver->streaming = 0;

  res = openPort( driver, generation->baudrate );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    res = handshake( driver );
  }
  if ( res == FRAME2TTL_SUCCESS_OK && generation->queryFirmware )
  {
    res = checkFirmware( driver );
  }
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    res = checkHardware( driver );
  }
  if ( res == FRAME2TTL_SUCCESS_OK && frame2ttlHasDetectMode( driver ) )
  {
    res = sendUint8( driver, FRAME2TTL_CMD_DETECT_MODE, driver->detectMode );
  }
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    res = applyDefaultThresholds( driver );
  }
  if ( res == FRAME2TTL_SUCCESS_OK && frame2ttlHasDetectMode( driver ) )
  {
    res = sendUint32( driver, FRAME2TTL_CMD_ACTIVATION_MARGIN, driver->activationMargin );
  }

  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    serialClose( driver );
    driver->serialHandle = -1;
    driver->generation = 0;
    return res;
  }
  printSession( driver );
  return FRAME2TTL_SUCCESS_OK;
}

void frame2ttlClose ( frame2ttlDriver * driver )
{
  if ( !frame2ttlIsOpen( driver ) )
  {
    return;
  }
  if ( driver->streaming )
  { // best effort, there is no acknowledge for the stop
    if ( sendUint8( driver, FRAME2TTL_CMD_STREAM, 0 ) == FRAME2TTL_SUCCESS_OK )
    {
      delayInMicroseconds( STREAM_STOP_WAIT_MS * 1000 );
      serialFlushInput( driver );
    }
    driver->streaming = 0;
  }
  serialClose( driver );
  driver->serialHandle = -1;
  driver->generation = 0;
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_INFO )
  {
    PRINT_CONST_STR( "#Info,closed" );
    PRINT_LN( );
  }
}

int8_t frame2ttlSetLightThreshold ( frame2ttlDriver * driver, int32_t threshold )
{
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( checkThresholds( driver, threshold, driver->darkThreshold ) != FRAME2TTL_SUCCESS_OK )
  {
    printError( driver, "light threshold", threshold );
    return FRAME2TTL_ERR_VALIDATION;
  }
  if ( frame2ttlUsesPairedThresholds( driver ) )
  {
    res = sendPairedThresholds( driver, threshold, driver->darkThreshold );
  }
  else
  {
    res = sendUint32( driver, FRAME2TTL_CMD_SET_THRESHOLDS, (uint32_t)threshold );
  }
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    driver->lightThreshold = threshold;
  }
  return res;
}

int8_t frame2ttlSetDarkThreshold ( frame2ttlDriver * driver, int32_t threshold )
{
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( checkThresholds( driver, driver->lightThreshold, threshold ) != FRAME2TTL_SUCCESS_OK )
  {
    printError( driver, "dark threshold", threshold );
    return FRAME2TTL_ERR_VALIDATION;
  }
  if ( frame2ttlUsesPairedThresholds( driver ) )
  {
    res = sendPairedThresholds( driver, driver->lightThreshold, threshold );
  }
  else
  {
    res = sendUint32( driver, FRAME2TTL_CMD_SET_DARK_THRESHOLD, (uint32_t)threshold );
  }
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    driver->darkThreshold = threshold;
  }
  return res;
}

int8_t frame2ttlSetDetectMode ( frame2ttlDriver * driver, uint8_t mode )
{
  uint8_t originalMode = driver->detectMode;
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( !frame2ttlHasDetectMode( driver ) )
  {
    printError( driver, "detect mode unsupported", mode );
    return FRAME2TTL_ERR_MODE;
  }
  if ( mode != FRAME2TTL_DETECT_MODE_AMPLITUDE && mode != FRAME2TTL_DETECT_MODE_DERIVATIVE )
  {
    printError( driver, "detect mode", mode );
    return FRAME2TTL_ERR_VALIDATION;
  }
  res = sendUint8( driver, FRAME2TTL_CMD_DETECT_MODE, mode );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  driver->detectMode = mode;
  if ( mode != originalMode )
  {
    res = applyDefaultThresholds( driver );
    if ( res != FRAME2TTL_SUCCESS_OK )
    { // the thresholds still belong to the old mode
      driver->detectMode = originalMode;
    }
  }
  return res;
}

int8_t frame2ttlSetActivationMargin ( frame2ttlDriver * driver, uint32_t margin )
{
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( !frame2ttlHasDetectMode( driver ) )
  {
    printError( driver, "activation margin unsupported", (int32_t)margin );
    return FRAME2TTL_ERR_MODE;
  }
  if ( margin > ( FRAME2TTL_SENSOR_MAX - 1 ) / 2 )      // before any arithmetic, 2 * margin would wrap
  {
    printError( driver, "activation margin", (int32_t)( margin > INT32_MAX ? INT32_MAX : margin ) );
    return FRAME2TTL_ERR_VALIDATION;
  }
  if ( !amplitudeFitsMargin( driver, margin ) )
  {
    printError( driver, "activation margin", (int32_t)margin );
    return FRAME2TTL_ERR_VALIDATION;
  }
  res = sendUint32( driver, FRAME2TTL_CMD_ACTIVATION_MARGIN, margin );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    driver->activationMargin = margin;
  }
  return res;
}

int8_t frame2ttlCalibrateLightThresholdAuto ( frame2ttlDriver * driver )
{
  return calibrateAuto( driver, FRAME2TTL_CMD_AUTO_LIGHT_THRESHOLD, &driver->lightThreshold );
}

int8_t frame2ttlCalibrateDarkThresholdAuto ( frame2ttlDriver * driver )
{
  return calibrateAuto( driver, FRAME2TTL_CMD_AUTO_DARK_THRESHOLD, &driver->darkThreshold );
}

int8_t frame2ttlReadSamples ( frame2ttlDriver * driver, int32_t nSamples, uint16_t * samples )
{
  uint8_t * raw = (uint8_t *)samples;
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  if ( nSamples <= 0 || samples == 0 )
  {
    printError( driver, "samples", nSamples );
    return FRAME2TTL_ERR_VALIDATION;
  }
  res = sendUint32( driver, FRAME2TTL_CMD_READ_SENSOR, (uint32_t)nSamples );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  res = serialResult( serialRead( driver, (uint32_t)nSamples * FRAME2TTL_SAMPLE_SIZE, raw, 0 ) );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    printError( driver, "rx samples", res );
    return res;
  }
  for ( int32_t i = 0; i < nSamples; i++ )
  { // little endian on the wire, in place: sample i only overwrites its own 2 bytes
    samples[i] = frame2ttlGetUint16( raw + i * FRAME2TTL_SAMPLE_SIZE );
  }
  return FRAME2TTL_SUCCESS_OK;
}

int8_t frame2ttlReadSensor ( frame2ttlDriver * driver, uint16_t * sample )
{
  return frame2ttlReadSamples( driver, 1, sample );
}

int8_t frame2ttlSetStreaming ( frame2ttlDriver * driver, uint8_t enabled )
{
  int8_t res = checkSession( driver );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  enabled = enabled ? 1 : 0;
  res = sendUint8( driver, FRAME2TTL_CMD_STREAM, enabled );
  if ( res == FRAME2TTL_SUCCESS_OK )
  {
    driver->streaming = enabled;
  }
  return res;
}

int8_t frame2ttlReadStream ( frame2ttlDriver * driver, uint16_t * samples, uint32_t maxSamples, uint32_t * received )
{
  uint8_t * raw = (uint8_t *)samples;
  uint32_t n;
  int8_t res = checkSession( driver );
  *received = 0;
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    return res;
  }
  n = serialBytesAvailable( driver ) / FRAME2TTL_SAMPLE_SIZE;     // two bytes == one sample
  if ( n > maxSamples )
  {
    n = maxSamples;
  }
  if ( n == 0 )
  {
    return FRAME2TTL_SUCCESS_OK;
  }
  res = serialResult( serialRead( driver, n * FRAME2TTL_SAMPLE_SIZE, raw, REPLY_TIMEOUT_MS ) );
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    printError( driver, "rx stream", res );
    return res;
  }
  for ( uint32_t i = 0; i < n; i++ )
  {
    samples[i] = frame2ttlGetUint16( raw + i * FRAME2TTL_SAMPLE_SIZE );
  }
  *received = n;
  return FRAME2TTL_SUCCESS_OK;
}
