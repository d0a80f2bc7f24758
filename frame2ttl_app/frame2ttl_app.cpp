/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/

//
// frame2ttl host driver example console application
//

// ---------------------------------------------- includes ----------------------------------------

#include "frame2ttl_shim.h"
#include "frame2ttl.h"
#include "frame2ttl_app.h"
#include <errno.h>

// ---------------------------------------------- defines -----------------------------------------

// app states
#define APP_STATE_CLOSED            0
#define APP_STATE_OPEN              1
#define APP_STATE_STREAMING         2
#define APP_STATE_ERROR             3

// number of threshold presets per detect mode
#define APP_NUMBER_PRESETS          3

#define APP_NUMBER_CMD_NONE         0     // not a valid command, indicates that the application is in character input mode
#define APP_NUMBER_BUF_SIZE         12    // sign + 10 digits + terminator


// ---------------------------------------------- constants -----------------------------------------

// log levels to change with keys +/-
const uint8_t logLevels[] =
{ FRAME2TTL_LOG_LEVEL_NONE
, FRAME2TTL_LOG_LEVEL_ERROR
, FRAME2TTL_LOG_LEVEL_ERROR | FRAME2TTL_LOG_LEVEL_INFO
, FRAME2TTL_LOG_LEVEL_ERROR | FRAME2TTL_LOG_LEVEL_INFO | FRAME2TTL_LOG_LEVEL_VERBOSE
, FRAME2TTL_LOG_LEVEL_ERROR | FRAME2TTL_LOG_LEVEL_INFO | FRAME2TTL_LOG_LEVEL_VERBOSE | FRAME2TTL_LOG_LEVEL_SERIAL
, FRAME2TTL_LOG_LEVEL_ERROR | FRAME2TTL_LOG_LEVEL_INFO | FRAME2TTL_LOG_LEVEL_VERBOSE | FRAME2TTL_LOG_LEVEL_SERIAL | FRAME2TTL_LOG_LEVEL_DEBUG
};

// threshold presets, index [mode][preset]
const int32_t appLightThreshold[ 2 ][ APP_NUMBER_PRESETS ] =
{ { 10000, 20000, 30000 }       // amplitude
, { 50,    75,    100 }         // derivative
};
const int32_t appDarkThreshold[ 2 ][ APP_NUMBER_PRESETS ] =
{ { 20000, 30000, 40000 }
, { -50,   -75,   -150 }
};

// ---------------------------------------------- variables -----------------------------------------

frame2ttlDriver frame2ttl;        // instance of frame2ttl
const frame2ttlGeneration * generation;
char portName[ FRAME2TTL_MAX_PORT_NAME ];
int8_t stateFrame2ttl;            // current state of the session
uint8_t presetNr;                 // which threshold preset to choose
uint8_t llIdx;                    // index for log verbosity
char numberCmd;                   // key waiting for a number (if any)
uint8_t numberBufFill;            // fill level of the number buffer
char numberBuf[ APP_NUMBER_BUF_SIZE ];
uint16_t streamBuf[ APP_STREAM_CHUNK ];
uint16_t displayBuf[ APP_DISPLAY_SAMPLES ];   // live display, restarted when full
uint16_t displayPos;
uint16_t burstBuf[ APP_BURST_SAMPLES ];


// ---------------------------------------------- functions -----------------------------------------

// Print the current state (stateFrame2ttl) in a readable format
void printState ( )
{
  PRINT_CONST_STR( "state=" );
  switch ( stateFrame2ttl )
  {
    case APP_STATE_CLOSED: PRINT_CONST_STR( "closed" ); break;
    case APP_STATE_OPEN: PRINT_CONST_STR( "open" ); break;
    case APP_STATE_STREAMING: PRINT_CONST_STR( "streaming" ); break;
    case APP_STATE_ERROR: PRINT_CONST_STR( "error" ); break;
    default: PRINT_CONST_STR( "???" ); break;
  }
  PRINT_LN( );
}

// Function prints a help screen
void printHelp ( )
{
  PRINT_CONST_STR( "Frame2TTL Host Driver Version " );
  PRINT_INT( frame2ttl.info.version[0] );
  PRINT_CHAR( '.' );
  PRINT_INT( frame2ttl.info.version[1] );
  PRINT_LN( ); PRINT_CONST_STR( "c .. close session" );
  PRINT_LN( ); PRINT_CONST_STR( "D .. auto dark threshold (patch white)" );
  PRINT_LN( ); PRINT_CONST_STR( "g<n> .. set activation margin" );
  PRINT_LN( ); PRINT_CONST_STR( "h .. help" );
  PRINT_LN( ); PRINT_CONST_STR( "i .. device info" );
  PRINT_LN( ); PRINT_CONST_STR( "k<n> .. set dark threshold" );
  PRINT_LN( ); PRINT_CONST_STR( "l<n> .. set light threshold" );
  PRINT_LN( ); PRINT_CONST_STR( "L .. auto light threshold (patch black)" );
  PRINT_LN( ); PRINT_CONST_STR( "m .. toggle detect mode" );
  PRINT_LN( ); PRINT_CONST_STR( "o .. open session" );
  PRINT_LN( ); PRINT_CONST_STR( "q .. quit" );
  PRINT_LN( ); PRINT_CONST_STR( "r .. read sensor" );
  PRINT_LN( ); PRINT_CONST_STR( "s .. stream on/off" );
  PRINT_LN( ); PRINT_CONST_STR( "t .. threshold presets" );
  PRINT_LN( ); PRINT_CONST_STR( "v .. read sample burst" );
  PRINT_LN( ); PRINT_CONST_STR( "+ .. log+" );
  PRINT_LN( ); PRINT_CONST_STR( "- .. log-" );
  PRINT_LN( ); PRINT_CONST_STR( "<n> is a decimal number terminated with enter" );
  PRINT_LN( );
}

// #Dev,<port>,<generation>,<firmware>,<hardware>,<detect_mode>,<light>,<dark>,<margin>
void printDeviceInfo ( )
{
  PRINT_CONST_STR( "#Dev" );
  PRINT_CHAR( SEPARATOR );
  PRINT_STR( frame2ttl.portName );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( generation ? generation->id : 0 );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( frame2ttl.device.firmwareVersion );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( frame2ttl.device.hardwareVersion );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( frame2ttl.detectMode );
  PRINT_CHAR( SEPARATOR );
  PRINT_INT( frame2ttl.lightThreshold );
  PRINT_CHAR( SEPARATOR );
  PRINT_INT( frame2ttl.darkThreshold );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( frame2ttl.activationMargin );
  PRINT_LN( );
}

// #<tag>,<position>,<sample>,<sample>,...
void printSamples ( const char * tag, uint32_t position, const uint16_t * samples, uint32_t count )
{
  PRINT_CONST_STR( tag );
  PRINT_CHAR( SEPARATOR );
  PRINT_UINT( position );
  for ( uint32_t i = 0; i < count; i++ )
  {
    PRINT_CHAR( SEPARATOR );
    PRINT_UINT( samples[i] );
  }
  PRINT_LN( );
}

void printResult ( const char * what, int8_t res )
{
  if ( res != FRAME2TTL_SUCCESS_OK )
  {
    PRINT_CONST_STR( "#Err" );
    PRINT_CHAR( SEPARATOR );
    PRINT_CONST_STR( what );
    PRINT_CHAR( SEPARATOR );
    PRINT_INT( res );
    PRINT_LN( );
  }
}

void resetAppState ( )
{
  stateFrame2ttl = APP_STATE_CLOSED;
  presetNr = 0;
  numberCmd = APP_NUMBER_CMD_NONE;
  numberBufFill = 0;
  displayPos = 0;
}

// ---------------------------- keyboard handler ------------------------------------------------------------------

void openSession ( )
{
  if ( stateFrame2ttl == APP_STATE_CLOSED || stateFrame2ttl == APP_STATE_ERROR )
  {
    int8_t res = frame2ttlOpen( &frame2ttl, portName, generation );
    printResult( "open", res );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      stateFrame2ttl = APP_STATE_OPEN;
      printDeviceInfo( );
    }
    else
    {
      stateFrame2ttl = APP_STATE_ERROR;
    }
  }
}

void closeSession ( )
{
  frame2ttlClose( &frame2ttl );
  stateFrame2ttl = APP_STATE_CLOSED;
}

void readSensor ( )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    uint16_t sample;
    int8_t res = frame2ttlReadSensor( &frame2ttl, &sample );
    printResult( "read", res );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      printSamples( "#Smp", 0, &sample, 1 );
    }
  }
}

void readBurst ( )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    int8_t res = frame2ttlReadSamples( &frame2ttl, APP_BURST_SAMPLES, burstBuf );
    printResult( "read", res );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      printSamples( "#Smp", 0, burstBuf, APP_BURST_SAMPLES );
    }
  }
}

void stream ( )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    int8_t res = frame2ttlSetStreaming( &frame2ttl, 1 );
    printResult( "stream", res );
    if ( res == FRAME2TTL_SUCCESS_OK )
    {
      displayPos = 0;
      memset( displayBuf, 0, sizeof( displayBuf ) );
      stateFrame2ttl = APP_STATE_STREAMING;
    }
  }
  else if ( stateFrame2ttl == APP_STATE_STREAMING )
  {
    int8_t res = frame2ttlSetStreaming( &frame2ttl, 0 );
    printResult( "stream", res );
    if ( res == FRAME2TTL_SUCCESS_OK )    // else the device keeps streaming and has to be drained
    {
      stateFrame2ttl = APP_STATE_OPEN;
    }
  }
}

void detectMode ( )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    uint8_t mode = frame2ttl.detectMode == FRAME2TTL_DETECT_MODE_AMPLITUDE ? FRAME2TTL_DETECT_MODE_DERIVATIVE : FRAME2TTL_DETECT_MODE_AMPLITUDE;
    int8_t res = frame2ttlSetDetectMode( &frame2ttl, mode );
    printResult( "mode", res );
    presetNr = 0;
    printDeviceInfo( );
  }
}

void autoThreshold ( char key )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    int8_t res;
    PRINT_CONST_STR( "Measuring..." );
    PRINT_LN( );
    if ( key == 'L' )
    {
      res = frame2ttlCalibrateLightThresholdAuto( &frame2ttl );
    }
    else
    {
      res = frame2ttlCalibrateDarkThresholdAuto( &frame2ttl );
    }
    printResult( "auto", res );
    printDeviceInfo( );
  }
}

void thresholds ( )
{
  if ( stateFrame2ttl == APP_STATE_OPEN )
  {
    uint8_t mode = frame2ttl.detectMode;
    int32_t light;
    int32_t dark;
    int8_t res;
    presetNr++;
    if ( presetNr >= APP_NUMBER_PRESETS )
    {
      presetNr = 0;
    }
    light = appLightThreshold[ mode ][ presetNr ];
    dark = appDarkThreshold[ mode ][ presetNr ];
    if ( light < frame2ttl.darkThreshold )    // keep light below dark at every step in amplitude mode
    {
      res = frame2ttlSetLightThreshold( &frame2ttl, light );
      if ( res == FRAME2TTL_SUCCESS_OK )
      {
        res = frame2ttlSetDarkThreshold( &frame2ttl, dark );
      }
    }
    else
    {
      res = frame2ttlSetDarkThreshold( &frame2ttl, dark );
      if ( res == FRAME2TTL_SUCCESS_OK )
      {
        res = frame2ttlSetLightThreshold( &frame2ttl, light );
      }
    }
    printResult( "thresholds", res );
    PRINT_CONST_STR( "LightTh=" );
    PRINT_INT( frame2ttl.lightThreshold );
    PRINT_CONST_STR( " DarkTh=" );
    PRINT_INT( frame2ttl.darkThreshold );
    PRINT_LN( );
  }
}

void logUp ( )
{
  llIdx++;
  if ( llIdx > sizeof( logLevels ) - 1 )
  {
    llIdx = sizeof( logLevels ) - 1;
  }
  frame2ttlSetLogLevel( &frame2ttl, logLevels[llIdx] );
  PRINT_CONST_STR( "Log=" );
  PRINT_INT( logLevels[llIdx] );
  PRINT_LN( );
}

void logDown ( )
{
  if ( llIdx > 0 )
  {
    llIdx--;
  }
  frame2ttlSetLogLevel( &frame2ttl, logLevels[llIdx] );
  PRINT_CONST_STR( "Log=" );
  PRINT_INT( logLevels[llIdx] );
  PRINT_LN( );
}

// enters number input mode for the given key
void enterNumberInputMode ( char key )
{
  numberCmd = key;
  numberBufFill = 0;
}

// leaves number input mode
void exitNumberInputMode ( )
{
  numberCmd = APP_NUMBER_CMD_NONE;
  numberBufFill = 0;
  printState( );
}

// returns 1 if in number input mode, 0 if in character input mode
int8_t isInNumberInputMode ( )
{
  if ( numberCmd == APP_NUMBER_CMD_NONE ) {
    return 0;
  } else {
    return 1;
  }
}

// handles a completely received number
void handleCompleteNumber ( )
{
  char * end;
  long value;
  int8_t res;
  numberBuf[ numberBufFill ] = 0;
  errno = 0;
  value = strtol( numberBuf, &end, 10 );
  if ( numberBufFill == 0 || *end != 0 || errno == ERANGE || value < INT32_MIN
    || ( numberCmd == 'g' ? (unsigned long long)value > UINT32_MAX : value > INT32_MAX ) )
  {
    PRINT_CONST_STR( "#Err,Number," );
    PRINT_STR( numberBuf );
    PRINT_LN( );
    return;
  }
  if ( stateFrame2ttl != APP_STATE_OPEN )
  {
    return;
  }
  if ( numberCmd == 'l' )
  {
    res = frame2ttlSetLightThreshold( &frame2ttl, (int32_t)value );
  }
  else if ( numberCmd == 'k' )
  {
    res = frame2ttlSetDarkThreshold( &frame2ttl, (int32_t)value );
  }
  else
  {
    res = frame2ttlSetActivationMargin( &frame2ttl, (uint32_t)value );
  }
  printResult( "set", res );
  printDeviceInfo( );
}

// handles a single incoming character in number input mode
void handleNumberInput ( char key )
{
  if ( key == '\n' || key == '\r' )
  {
    handleCompleteNumber( );
    exitNumberInputMode( );
  }
  else if ( ( key >= '0' && key <= '9' ) || ( key == '-' && numberBufFill == 0 ) )
  {
    if ( numberBufFill >= APP_NUMBER_BUF_SIZE - 1 )
    {
      PRINT_CONST_STR( "#Err,NumberBuf" );
      PRINT_LN( );
      exitNumberInputMode( );
    }
    else
    {
      numberBuf[ numberBufFill++ ] = key;
    }
  }
  else
  {
    PRINT_CONST_STR( "#Err,Number" );
    PRINT_LN( );
    exitNumberInputMode( );
  }
}

// handles a single incoming character in character input mode, returns 1 if program termination is requested
int8_t handleCharInput ( char key )
{
  if ( key < 33 || key >= 126 ) // skip all control characters and DEL
  {
    return 0; // nothing to do here
  }
  else
  {
    if ( key == 'c' )            // close
    {
      closeSession( );
    }
    else if ( key == 'h' )       // print help
    {
      printHelp( );
    }
    else if ( key == 'i' )       // device info
    {
      printDeviceInfo( );
    }
    else if ( key == 'l' || key == 'k' || key == 'g' )    // light, dark threshold, activation margin
    {
      enterNumberInputMode( key );
      return 0;
    }
    else if ( key == 'L' || key == 'D' )                  // auto thresholds
    {
      autoThreshold( key );
    }
    else if ( key == 'm' )       // detect mode
    {
      detectMode( );
    }
    else if ( key == 'o' )       // open
    {
      openSession( );
    }
    else if ( key == 'q' )       // quit program
    {
      return 1;
    }
    else if ( key == 'r' )       // single sample
    {
      readSensor( );
    }
    else if ( key == 's' )       // stream on/off
    {
      stream( );
    }
    else if ( key == 't' )       // threshold presets
    {
      thresholds( );
    }
    else if ( key == 'v' )       // sample burst
    {
      readBurst( );
    }
    else if ( key == '+' )       // increase printing
    {
      logUp( );
    }
    else if ( key == '-' )       // decrease printing
    {
      logDown( );
    }
    else
    {
      PRINT_CONST_STR( "#Err" );
      PRINT_CHAR( SEPARATOR );
      PRINT_CONST_STR( "Cmd" );
      PRINT_CHAR( SEPARATOR );
      PRINT_CHAR( key );
      PRINT_LN( );
    }
    printState( );
    return 0;
  }
}

// Function checks the console for received characters and interprets them, returns 1 if program termination is requested
int8_t keyInput ( )
{
  char rx;
  int8_t read = inputGetKey( &rx );
  while ( read ) {
    if ( isInNumberInputMode( ) )
    {
      handleNumberInput( rx );
    }
    else if ( handleCharInput( rx ) != 0 )
    {
      return 1;
    }
    read = inputGetKey( &rx );
  }
  return 0;
}

// drains the streamed samples into the display buffer, never blocks
int8_t streamInput ( )
{
  uint32_t received = 0;
  int8_t res = frame2ttlReadStream( &frame2ttl, streamBuf, APP_STREAM_CHUNK, &received );
  if ( res != FRAME2TTL_SUCCESS_OK || received == 0 )
  {
    return res;
  }
  if ( displayPos + received >= APP_DISPLAY_SAMPLES )
  { // display is full, start a new sweep
    memset( displayBuf, 0, sizeof( displayBuf ) );
    displayPos = 0;
  }
  memcpy( displayBuf + displayPos, streamBuf, received * sizeof( uint16_t ) );
  printSamples( "#Str", displayPos, displayBuf + displayPos, received );
  displayPos += received;
  return FRAME2TTL_SUCCESS_OK;
}

// -------------------------------------------------------------------------------------------------------------


int8_t checkArguments ( int logLevelIdx, int generationId )
{
  if ( logLevelIdx < 0 || logLevelIdx >= (int)sizeof( logLevels ) )
  {
    return 0;
  }
  if ( generationId < 0 || generationId > UINT8_MAX || frame2ttlGetGeneration( (uint8_t)generationId ) == 0 )
  {
    return 0;
  }
  return 1;
}

// Setup function is only called once at startup. Do all the initialisation stuff here.
void setupFn ( uint8_t logLevelIdx, const char * port, uint8_t generationId )
{
  if ( logLevelIdx >= sizeof( logLevels ) )
  {
    logLevelIdx = sizeof( logLevels ) - 1;
  }
  llIdx = logLevelIdx;

  generation = frame2ttlGetGeneration( generationId );
  if ( generation == 0 )
  {
    generation = &frame2ttlGenerationV4;
  }
  strncpy( portName, port, FRAME2TTL_MAX_PORT_NAME - 1 );
  portName[ FRAME2TTL_MAX_PORT_NAME - 1 ] = 0;

  inputOpen( );
  resetAppState( );                                     // reset application local variables
  frame2ttlInitialise( &frame2ttl, logLevels[ llIdx ] );  // reset driver
  printHelp( );
  openSession( );
  printState( );
}

// Main loop function, is executed cyclic
int8_t loopFn ( )
{
  int8_t quit = keyInput( );                                        // handle any keystrokes from the console

  if ( stateFrame2ttl == APP_STATE_STREAMING )
  {
    int8_t res = streamInput( );
    if ( res != FRAME2TTL_SUCCESS_OK )                               // port gone, nothing left to stream from
    {
      printResult( "stream", res );
      closeSession( );
      stateFrame2ttl = APP_STATE_ERROR;
      printState( );
    }
  }

  return !quit;    // 1 == loop again, 0 == exit
}

// Closes the session, streaming is switched off by the driver first.
void terminateFn ( )
{
  frame2ttlClose( &frame2ttl );
  inputClose( );
}
