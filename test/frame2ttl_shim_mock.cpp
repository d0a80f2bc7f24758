/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/

// Shim used by the unit tests instead of the POSIX shim. Reads never block:
// a read that cannot be served from the scripted bytes reports a timeout.

#include "frame2ttl_shim_mock.h"
#include "frame2ttl_shim.h"
#include "frame2ttl.h"
#include <stdio.h>

#define MOCK_SERIAL_HANDLE    3

MockSerial mockSerial;

void mockSerialReset ( )
{
  mockSerial.replies.clear( );
  mockSerial.tx.clear( );
  mockSerial.rx.clear( );
  mockSerial.openBaudrates.clear( );
  mockSerial.output.clear( );
  mockSerial.keys.clear( );
  mockSerial.writesBeforeFailure = -1;
  mockSerial.delayedUs = 0;
  mockSerial.closeCount = 0;
  mockSerial.flushCount = 0;
  mockSerial.isOpen = false;
  mockSerial.failOpen = false;
}


// time functions -------------------------------------------------------------------------------------------------------

void delayInMicroseconds ( uint32_t wait )
{
  mockSerial.delayedUs += wait;
}

uint32_t getSysTick ( )
{
  return (uint32_t)mockSerial.delayedUs;
}


// serial functions -----------------------------------------------------------------------------------------------------

int8_t serialOpen ( void * dptr, const char * portName, uint32_t baudrate )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  (void)portName;
  mockSerial.openBaudrates.push_back( baudrate );
  if ( mockSerial.failOpen )
  {
    return SERIAL_ERR_OPEN;
  }
  mockSerial.rx.clear( );                             // a fresh port has nothing pending
  mockSerial.isOpen = true;
  driver->serialHandle = MOCK_SERIAL_HANDLE;
  return SERIAL_SUCCESS;
}

void serialClose ( void * dptr )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  if ( driver->serialHandle >= 0 )
  {
    mockSerial.closeCount++;
    mockSerial.isOpen = false;
    driver->serialHandle = -1;
  }
}

int8_t serialWrite ( void * dptr, uint16_t toTx, const uint8_t * txData )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  if ( driver->serialHandle < 0 || toTx == 0 || mockSerial.writesBeforeFailure == 0 )
  {
    return SERIAL_ERR_WRITE;
  }
  if ( mockSerial.writesBeforeFailure > 0 )
  {
    mockSerial.writesBeforeFailure--;
  }
  mockSerial.tx.insert( mockSerial.tx.end( ), txData, txData + toTx );
  std::map< uint8_t, std::vector< uint8_t > >::const_iterator reply = mockSerial.replies.find( txData[0] );
  if ( reply != mockSerial.replies.end( ) )
  {
    mockSerial.rx.insert( mockSerial.rx.end( ), reply->second.begin( ), reply->second.end( ) );
  }
  return SERIAL_SUCCESS;
}

int8_t serialRead ( void * dptr, uint32_t toRx, uint8_t * rxData, uint32_t timeoutInMs )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  (void)timeoutInMs;
  if ( driver->serialHandle < 0 )
  {
    return SERIAL_ERR_READ;
  }
  if ( mockSerial.rx.size( ) < toRx )
  {
    return SERIAL_ERR_TIMEOUT;
  }
  for ( uint32_t i = 0; i < toRx; i++ )
  {
    rxData[i] = mockSerial.rx.front( );
    mockSerial.rx.pop_front( );
  }
  return SERIAL_SUCCESS;
}

uint32_t serialBytesAvailable ( void * dptr )
{
  frame2ttlDriver * driver = (frame2ttlDriver *)dptr;
  if ( driver->serialHandle < 0 )
  {
    return 0;
  }
  return (uint32_t)mockSerial.rx.size( );
}

void serialFlushInput ( void * dptr )
{
  (void)dptr;
  mockSerial.flushCount++;
  mockSerial.rx.clear( );
}


// console functions ----------------------------------------------------------------------------------------------------

void inputOpen ( )
{
}

void inputClose ( )
{
}

int8_t inputGetKey ( char * c )
{
  if ( mockSerial.keys.empty( ) )
  {
    return 0;
  }
  *c = mockSerial.keys.front( );
  mockSerial.keys.pop_front( );
  return 1;
}


// printing functions ------------------------------------------------------------------------------------------------

void printConstStr ( const char * str )
{
  mockSerial.output += str;
}

void printChar ( char c )
{
  mockSerial.output += c;
}

void printInt ( int32_t i )
{
  char buf[16];
  snprintf( buf, sizeof( buf ), "%ld", (long)i );
  mockSerial.output += buf;
}

void printUint ( uint32_t i )
{
  char buf[16];
  snprintf( buf, sizeof( buf ), "%lu", (unsigned long)i );
  mockSerial.output += buf;
}

void printUintHex ( uint32_t i )
{
  char buf[16];
  snprintf( buf, sizeof( buf ), "%lX", (unsigned long)i );
  mockSerial.output += buf;
}

void printStr ( char * str )
{
  mockSerial.output += str;
}

void printLn ( void )
{
  mockSerial.output += '\n';
}
