/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/

// Shim for a POSIX host. The serial port is a tty (usually the USB CDC ACM
// device of the frame2ttl, e.g. /dev/ttyACM0) driven in raw mode through
// termios. Console input and all printing go to stdin/stdout.
// To port the driver to another host only this file has to be replaced.


#include "frame2ttl_shim.h"
#include "frame2ttl.h"
#include <stdio.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <time.h>
#include <sys/ioctl.h>


// time functions -------------------------------------------------------------------------------------------------------

void delayInMicroseconds ( uint32_t wait )
{
  struct timespec ts;
  ts.tv_sec = wait / 1000000;
  ts.tv_nsec = (long)( wait % 1000000 ) * 1000;
  while ( nanosleep( &ts, &ts ) == -1 && errno == EINTR )
  {
    // sleep the remaining time after a signal
  }
}

uint32_t getSysTick ( )
{
  struct timespec ts;
  clock_gettime( CLOCK_MONOTONIC, &ts );
  return (uint32_t)( ts.tv_sec * 1000000ULL + ts.tv_nsec / 1000 );
}


// serial functions -----------------------------------------------------------------------------------------------------

typedef struct _baudEntry
{
  uint32_t baud;
  speed_t speed;
} baudEntry;

// ascending, the fastest entry is used for anything above it. A USB CDC link
// ignores the line speed, the nominal rates of the device (12M, 480M) end up here.
static const baudEntry baudTable[] =
{ { 9600, B9600 }
, { 19200, B19200 }
, { 38400, B38400 }
, { 57600, B57600 }
, { 115200, B115200 }
, { 230400, B230400 }
, { 460800, B460800 }
, { 921600, B921600 }
#ifdef B4000000
, { 4000000, B4000000 }
#endif
};

static speed_t baudToSpeed ( uint32_t baudrate )
{
  speed_t speed = baudTable[0].speed;
  for ( uint8_t i = 0; i < sizeof( baudTable ) / sizeof( baudTable[0] ); i++ )
  {
    if ( baudTable[i].baud <= baudrate )
    {
      speed = baudTable[i].speed;
    }
  }
  return speed;
}

static void dumpBytes ( uint8_t logLevel, uint32_t count, const uint8_t * data )
{
  if ( logLevel & FRAME2TTL_LOG_LEVEL_DEBUG )
  {
    while ( count-- )
    {
      PRINT_CONST_STR( " 0x" );
      PRINT_UINT_HEX( *data );
      data++;
    }
  }
}

int8_t serialOpen ( void * dptr, const char * portName, uint32_t baudrate )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  struct termios tio;
  speed_t speed = baudToSpeed( baudrate );
  int fd = open( portName, O_RDWR | O_NOCTTY | O_NONBLOCK );
  if ( fd < 0 )
  {
    return SERIAL_ERR_OPEN;
  }
  if ( tcgetattr( fd, &tio ) != 0 )
  {
    close( fd );
    return SERIAL_ERR_OPEN;
  }
  cfmakeraw( &tio );                                // 8N1, no echo, no line processing
  tio.c_cflag |= ( CLOCAL | CREAD );
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed( &tio, speed );
  cfsetospeed( &tio, speed );
  if ( tcsetattr( fd, TCSANOW, &tio ) != 0 )
  {
    close( fd );
    return SERIAL_ERR_OPEN;
  }
  tcflush( fd, TCIOFLUSH );                         // this clears any old pending data
  driver->serialHandle = fd;
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_SERIAL )
  {
    PRINT_CONST_STR( "SER-OPEN " );
    PRINT_STR( (char *)portName );
    PRINT_CONST_STR( " baud=" );
    PRINT_UINT( baudrate );
    PRINT_LN( );
  }
  return SERIAL_SUCCESS;
}

void serialClose ( void * dptr )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  if ( driver->serialHandle >= 0 )
  {
    close( driver->serialHandle );
    driver->serialHandle = -1;
    if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_SERIAL )
    {
      PRINT_CONST_STR( "SER-CLOSE" );
      PRINT_LN( );
    }
  }
}

int8_t serialWrite ( void * dptr, uint16_t toTx, const uint8_t * txData )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  const uint8_t * dump = txData;
  uint16_t tx = toTx;
  if ( driver->serialHandle < 0 )
  {
    return SERIAL_ERR_WRITE;
  }
  while ( tx )
  {
    ssize_t written = write( driver->serialHandle, txData, tx );
    if ( written < 0 )
    {
      if ( errno == EAGAIN || errno == EINTR )
      { // output buffer full, wait until it drains
        struct pollfd pfd = { driver->serialHandle, POLLOUT, 0 };
        poll( &pfd, 1, SERIAL_POLL_INTERVAL_MS );
        continue;
      }
      return SERIAL_ERR_WRITE;
    }
    tx -= (uint16_t)written;
    txData += written;
  }
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_SERIAL )
  {
    PRINT_CONST_STR( "SER-TX tx=" );
    PRINT_INT( toTx );
    dumpBytes( driver->logLevel, toTx, dump );
    PRINT_LN( );
  }
  return SERIAL_SUCCESS;
}

int8_t serialRead ( void * dptr, uint32_t toRx, uint8_t * rxData, uint32_t timeoutInMs )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  uint8_t * dump = rxData;
  uint32_t rx = 0;
  uint32_t start = getSysTick( );
  if ( driver->serialHandle < 0 )
  {
    return SERIAL_ERR_READ;
  }
  while ( rx < toRx )
  {
    struct pollfd pfd = { driver->serialHandle, POLLIN, 0 };
    int waitMs = -1;                                  // timeoutInMs == 0: block in poll
    if ( timeoutInMs )
    {
      uint32_t elapsedMs = ( getSysTick( ) - start ) / 1000;
      if ( elapsedMs >= timeoutInMs )
      {
        break;
      }
      waitMs = (int)( timeoutInMs - elapsedMs );
    }
    int ready = poll( &pfd, 1, waitMs );
    if ( ready < 0 )
    {
      if ( errno == EINTR )
      {
        continue;
      }
      return SERIAL_ERR_READ;
    }
    if ( ready == 0 )
    {
      continue;                                       // timeout is checked at the top
    }
    if ( pfd.revents & ( POLLERR | POLLHUP | POLLNVAL ) )
    {
      return SERIAL_ERR_READ;
    }
    uint32_t chunk = toRx - rx;
    if ( chunk > SERIAL_MAX_TRANSFER )
    {
      chunk = SERIAL_MAX_TRANSFER;
    }
    ssize_t got = read( driver->serialHandle, rxData + rx, chunk );
    if ( got < 0 )
    {
      if ( errno == EAGAIN || errno == EINTR )
      {
        continue;
      }
      return SERIAL_ERR_READ;
    }
    rx += (uint32_t)got;
  }
  if ( driver->logLevel & FRAME2TTL_LOG_LEVEL_SERIAL )
  {
    PRINT_CONST_STR( "SER-RX toRx=" );
    PRINT_UINT( toRx );
    PRINT_CONST_STR( " rx=" );
    PRINT_UINT( rx );
    dumpBytes( driver->logLevel, rx, dump );
    PRINT_LN( );
  }
  if ( rx < toRx )
  {
    return SERIAL_ERR_TIMEOUT;
  }
  return SERIAL_SUCCESS;
}

uint32_t serialBytesAvailable ( void * dptr )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  int available = 0;
  if ( driver->serialHandle < 0 || ioctl( driver->serialHandle, FIONREAD, &available ) != 0 || available < 0 )
  {
    return 0;
  }
  return (uint32_t)available;
}

void serialFlushInput ( void * dptr )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  if ( driver->serialHandle >= 0 )
  {
    tcflush( driver->serialHandle, TCIFLUSH );
  }
}


// console functions ----------------------------------------------------------------------------------------------------

static struct termios savedConsole;
static int8_t consoleSaved = 0;

void inputOpen ( )
{
  struct termios tio;
  if ( tcgetattr( STDIN_FILENO, &savedConsole ) == 0 )
  {
    consoleSaved = 1;
    tio = savedConsole;
    tio.c_lflag &= ~ICANON;                   // single keys, echo stays on so typed numbers are visible
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    tcsetattr( STDIN_FILENO, TCSANOW, &tio );
  }
}

void inputClose ( )
{
  if ( consoleSaved )
  {
    tcsetattr( STDIN_FILENO, TCSANOW, &savedConsole );
    consoleSaved = 0;
  }
}

int8_t inputGetKey ( char * c )
{
  struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
  if ( poll( &pfd, 1, 0 ) > 0 && ( pfd.revents & POLLIN ) )
  {
    if ( read( STDIN_FILENO, c, 1 ) == 1 )
    {
      return 1;
    }
  }
  return 0;
}


// printing functions ------------------------------------------------------------------------------------------------

void printConstStr ( const char * str )
{
  fputs( str, stdout );
}

void printChar ( char c )
{
  fputc( c, stdout );
}

void printInt ( int32_t i )
{
  printf( "%ld", (long)i );
}

void printUint ( uint32_t i )
{
  printf( "%lu", (unsigned long)i );
}

void printUintHex ( uint32_t i )
{
  printf( "%lX", (unsigned long)i );
}

void printStr ( char * str )
{
  fputs( str, stdout );    // use only for printing zero-terminated strings
}

void printLn ( void )
{
  fputc( '\n', stdout );
  fflush( stdout );
}
