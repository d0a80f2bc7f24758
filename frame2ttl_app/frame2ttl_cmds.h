/*****************************************************************************
* Copyright (c) [2024] ams-OSRAM AG                                          *
* All rights are reserved.                                                   *
*                                                                            *
* FOR FULL LICENSE TEXT SEE LICENSE.TXT                                      *
******************************************************************************/


#ifndef FRAME2TTL_CMDS_H
#define FRAME2TTL_CMDS_H

/** @file Command opcodes and fixed protocol constants of the frame2ttl serial link.
 * Every command is a single opcode byte optionally followed by a fixed width
 * little endian payload. Replies are fixed width as well.
 */

// ---------------------------------------------- opcodes -----------------------------------------

#define FRAME2TTL_CMD_HANDSHAKE                   'C'   /**< no payload, reply uint8 == FRAME2TTL_HANDSHAKE_REPLY */
#define FRAME2TTL_CMD_FIRMWARE_VERSION            'F'   /**< no payload, reply uint8 (firmware v1 does not reply) */
#define FRAME2TTL_CMD_HARDWARE_VERSION            '#'   /**< no payload, reply uint8 */
#define FRAME2TTL_CMD_SET_THRESHOLDS              'T'   /**< payload int16 light + int16 dark, or int32 light (firmware >= 4) */
#define FRAME2TTL_CMD_SET_DARK_THRESHOLD          'K'   /**< payload int32 dark (firmware >= 4) */
#define FRAME2TTL_CMD_DETECT_MODE                 'M'   /**< payload uint8 mode (firmware >= 4) */
#define FRAME2TTL_CMD_ACTIVATION_MARGIN           'G'   /**< payload uint32 margin (firmware >= 4) */
#define FRAME2TTL_CMD_AUTO_LIGHT_THRESHOLD        'L'   /**< no payload, reply int16/int32 after the settling time */
#define FRAME2TTL_CMD_AUTO_DARK_THRESHOLD         'D'   /**< no payload, reply int16/int32 after the settling time */
#define FRAME2TTL_CMD_READ_SENSOR                 'V'   /**< payload uint32 n, reply n x uint16 */
#define FRAME2TTL_CMD_STREAM                      'S'   /**< payload uint8 on/off, device pushes uint16 samples while on */

// ---------------------------------------------- replies -----------------------------------------

#define FRAME2TTL_HANDSHAKE_REPLY                 218

// ---------------------------------------------- payload sizes -----------------------------------

#define FRAME2TTL_PAIRED_THRESHOLD_SIZE           4     /**< 2 x int16 */
#define FRAME2TTL_SINGLE_THRESHOLD_SIZE           4     /**< 1 x int32 */
#define FRAME2TTL_SAMPLE_SIZE                     2     /**< 1 x uint16 */
#define FRAME2TTL_MAX_CMD_SIZE                    5     /**< opcode + largest payload */

#endif // FRAME2TTL_CMDS_H
