/* Copyright (c) 2021 Christof Ressi
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

/** \file
 * \brief main library API
 *
 * Call vox_initialize() (or vox_initializeEx()) once before
 * creating any senders or receivers.
 */

#pragma once

#include "vox_types.h"

/** \brief initialize the library */
VOX_API void VOX_CALL vox_initialize(void);

/** \brief initialize with custom log function and allocator
 *
 * \param log (optional) custom log function
 * \param alloc (optional) custom allocator; only used
 *        if compiled with VOX_CUSTOM_ALLOCATOR
 */
VOX_API void VOX_CALL vox_initializeEx(
        VoxLogFunc log, const VoxAllocator *alloc);

/** \brief terminate the library */
VOX_API void VOX_CALL vox_terminate(void);

/** \brief get the library version */
VOX_API void VOX_CALL vox_getVersion(
        VoxInt32 *major, VoxInt32 *minor, VoxInt32 *patch, VoxInt32 *test);

/** \brief get the library version as a string */
VOX_API const VoxChar * VOX_CALL vox_getVersionString(void);

/** \brief get a textual description for an error code */
VOX_API const VoxChar * VOX_CALL vox_strerror(VoxError err);

/** \brief keep a decoder frame alive beyond the decoder call
 *
 * Every call must be balanced by vox_frameRelease().
 * Null frames are ignored.
 */
VOX_API void VOX_CALL vox_frameRetain(const VoxFrame *frame);

/** \brief release a retained decoder frame */
VOX_API void VOX_CALL vox_frameRelease(const VoxFrame *frame);
