/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief types and constants
 *
 * contains API macros, constants and enumerations
 */

#pragma once

#include "vox_config.h"

#if defined(__cplusplus)
# define VOX_INLINE inline
#else
# if (__STDC_VERSION__ >= 199901L)
#  define VOX_INLINE static inline
# else
#  define VOX_INLINE static
# endif
#endif

#ifndef VOX_CALL
# ifdef _WIN32
#  define VOX_CALL __cdecl
# else
#  define VOX_CALL
# endif
#endif

#ifndef VOX_EXPORT
# ifndef VOX_STATIC
#  if defined(_WIN32) // Windows
#   if defined(VOX_BUILD)
#      if defined(DLL_EXPORT)
#        define VOX_EXPORT __declspec(dllexport)
#      else
#        define VOX_EXPORT
#      endif
#   else
#    define VOX_EXPORT __declspec(dllimport)
#   endif
#  elif defined(__GNUC__) && defined(VOX_BUILD) // GNU C
#   define VOX_EXPORT __attribute__ ((visibility ("default")))
#  else /* Other */
#   define VOX_EXPORT
#  endif
# else /* VOX_STATIC */
#  define VOX_EXPORT
# endif
#endif

#ifdef __cplusplus
# define VOX_API extern "C" VOX_EXPORT
#else
# define VOX_API VOX_EXPORT
#endif

/*---------- struct packing -----------------*/

#if defined(__GNUC__)
# define VOX_PACK_BEGIN _Pragma("pack(push,8)")
# define VOX_PACK_END _Pragma("pack(pop)")
# elif defined(_MSC_VER)
# define VOX_PACK_BEGIN __pragma(pack(push,8))
# define VOX_PACK_END __pragma(pack(pop))
#else
# define VOX_PACK_BEGIN
# define VOX_PACK_END
#endif

/*-------------------- versioning --------------------*/

/** \brief the major version */
#define kVoxVersionMajor 1
/** \brief the minor version */
#define kVoxVersionMinor 0
/** \brief the bugfix version */
#define kVoxVersionPatch 0
/** \brief the test version (0: stable release) */
#define kVoxVersionTest 0

/*-------------------- constants --------------------*/

/** \brief list of available error codes (`VoxError`) */
enum
{
    /** unknown/unspecified error */
    kVoxErrorUnknown = -1,
    /** no error (= success) */
    kVoxErrorNone = 0,
    /** operation/control not implemented */
    kVoxErrorNotImplemented,
    /** bad argument for function/method call */
    kVoxErrorBadArgument,
    /** sender/receiver is idle or disposed */
    kVoxErrorIdle,
    /** operation would overflow */
    kVoxErrorOverflow,
    /** out of memory */
    kVoxErrorOutOfMemory,
    /** resource not found */
    kVoxErrorNotFound,
    /** insufficient buffer size */
    kVoxErrorInsufficientBuffer
};

/** \brief alias for success result */
#define kVoxOk kVoxErrorNone

/** \brief log levels */
enum
{
    /** no logging */
    kVoxLogLevelNone = 0,
    /** only errors */
    kVoxLogLevelError = 1,
    /** only errors and warnings */
    kVoxLogLevelWarning = 2,
    /** errors, warnings and notifications */
    kVoxLogLevelVerbose = 3,
    /** errors, warnings, notifications and debug messages */
    kVoxLogLevelDebug = 4
};

/** \brief frame flags (`VoxFlag`)
 *
 * \note only the lowest 8 bits are transmitted
 */
enum
{
    /** codec configuration; never fragmented */
    kVoxFrameConfig = 0x01,
    /** key frame (passed through to the decoder) */
    kVoxFrameKeyFrame = 0x02,
    /** part is not the first part of a frame */
    kVoxFramePartNotBeg = 0x04,
    /** part is not the last part of a frame */
    kVoxFramePartNotEnd = 0x08,
    /** last frame of a stream; flushes the receiver */
    kVoxFrameEndOfStream = 0x10,
    /** forward error correction event */
    kVoxFrameFEC = 0x20,
    /** fragment is not the first fragment of a frame */
    kVoxFrameFragNotBeg = 0x40,
    /** fragment is not the last fragment of a frame */
    kVoxFrameFragNotEnd = 0x80
};

/** \brief part flags mask */
#define kVoxFrameMaskPart (kVoxFramePartNotBeg | kVoxFramePartNotEnd)
/** \brief fragment flags mask */
#define kVoxFrameMaskFrag (kVoxFrameFragNotBeg | kVoxFrameFragNotEnd)

/** \brief receiver flags */
enum
{
    /** decode on a dedicated thread instead of
     * synchronously in VoxReceiver_receiveEvent() */
    kVoxReceiverThreaded = 0x01
};
