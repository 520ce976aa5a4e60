/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief compile time settings and default values
 *
 * every setting can be overriden on the command line
 * (see the VOX_* cache variables in CMakeLists.txt)
 */

#pragma once

/*------------------ compile time settings -------------------*/

#ifndef VOX_LOG_LEVEL
# define VOX_LOG_LEVEL 2 /* kVoxLogLevelWarning */
#endif

#ifndef VOX_CUSTOM_ALLOCATOR
# define VOX_CUSTOM_ALLOCATOR 0
#endif

#ifndef VOX_DEBUG_MEMORY
# define VOX_DEBUG_MEMORY 0
#endif

/* log every received and consumed event */
#ifndef VOX_DEBUG_EVENTS
# define VOX_DEBUG_EVENTS 0
#endif

/* log FEC accumulation and recovery */
#ifndef VOX_DEBUG_FEC
# define VOX_DEBUG_FEC 0
#endif

/*---------------------- default values ----------------------*/

/* default event buffer (ring) size */
#ifndef VOX_EVENT_BUFFER_SIZE
# define VOX_EVENT_BUFFER_SIZE 256
#endif

/* max. event buffer size; 2 bytes are needed
 * for event numbers above 256 */
#ifndef VOX_MAX_EVENT_BUFFER_SIZE
# define VOX_MAX_EVENT_BUFFER_SIZE 2048
#endif

/* max. number of pending config frames */
#ifndef VOX_CONFIG_QUEUE_SIZE
# define VOX_CONFIG_QUEUE_SIZE 10
#endif

/* distance between the read position and the
 * ring slots that are cleared after reading */
#ifndef VOX_QUEUE_CLEAR_LAG
# define VOX_QUEUE_CLEAR_LAG 64
#endif

/* number of reusable fragment/part assembly buffers */
#ifndef VOX_ASSEMBLY_POOL_SIZE
# define VOX_ASSEMBLY_POOL_SIZE 10
#endif

/* max. number of decoder loop iterations without frame progress */
#ifndef VOX_STALL_LIMIT
# define VOX_STALL_LIMIT 100
#endif

/* max. configurable delay in frames */
#ifndef VOX_MAX_DELAY_FRAMES
# define VOX_MAX_DELAY_FRAMES 127
#endif

/* default part size (0: no parts) */
#ifndef VOX_PART_SIZE
# define VOX_PART_SIZE 0
#endif

/* number of stored intervals in the spacing profile */
#ifndef VOX_SPACING_PROFILE_SIZE
# define VOX_SPACING_PROFILE_SIZE 1000
#endif

/* sender counts as 'transmitting' if the last
 * non-empty frame was sent within this time (ms) */
#ifndef VOX_TRANSMIT_TIMEOUT
# define VOX_TRANSMIT_TIMEOUT 100
#endif
