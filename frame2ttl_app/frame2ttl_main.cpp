/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/

//
// frame2ttl host driver example program
//

// ---------------------------------------------- includes ----------------------------------------

#include "frame2ttl.h"
#include "frame2ttl_app.h"
#include <stdio.h>
#include <getopt.h>


// ---------------------------------------------- defines -----------------------------------------

#define DEFAULT_GENERATION          4

// index into the log level table of the app: errors only
#define DEFAULT_LOG_LEVEL_IDX       1

// -------------------------------------------------------------------------------------------------------------

static void usage ( const char * program )
{
  fprintf( stderr, "usage: %s <port> [-g 2|3|4] [-l 0..5]\n", program );
  fprintf( stderr, "  -g  protocol generation (default %d)\n", DEFAULT_GENERATION );
  fprintf( stderr, "  -l  log level index (default %d)\n", DEFAULT_LOG_LEVEL_IDX );
}

int main ( int argc, char * argv[] )
{
  int generationId = DEFAULT_GENERATION;
  int logLevelIdx = DEFAULT_LOG_LEVEL_IDX;
  int opt;
  while ( ( opt = getopt( argc, argv, "g:l:h" ) ) != -1 )
  {
    switch ( opt )
    {
      case 'g': generationId = atoi( optarg ); break;
      case 'l': logLevelIdx = atoi( optarg ); break;
      default: usage( argv[0] ); return 1;
    }
  }
  if ( optind != argc - 1 || !checkArguments( logLevelIdx, generationId ) )
  {
    usage( argv[0] );
    return 1;
  }

  setupFn( (uint8_t)logLevelIdx, argv[optind], (uint8_t)generationId );
  while ( loopFn( ) )
  {
    delayInMicroseconds( APP_LOOP_DELAY_US );
  }
  terminateFn( );
  return 0;
}
