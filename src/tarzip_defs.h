/******************************************************************************\
 * tarzip_defs.h - A header file for common compile time defines.
 *
 * NOTE: These defines are used throughout the internal code base and are all
 *       placed inside this file to make changes to naming conventions
 *       easier.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#ifndef _TARZIP_DEFS_H
#define _TARZIP_DEFS_H

#include "tarzip_shared.h"

#include <limits.h>
#include <stdint.h>
#include <sys/types.h>

/*******************************************************************************
** Generic defines
*******************************************************************************/
#define TARZIP_BUF_SIZE             4096
#define TARZIP_BLOCK_SIZE           65536                   // read block size for archive data copies
#define TARZIP_RELEASE_VERSION      "1.0.0"

/*******************************************************************************
** Naming of inputs, outputs and staging areas
*******************************************************************************/
#define TARZIP_INPUT_SUFFIX         ".tar.gz"               // primary recognized input suffix
#define TARZIP_INPUT_SHORT_SUFFIX   ".tgz"                  // short form of the input suffix
#define TARZIP_OUTPUT_SUFFIX        ".zip"                  // suffix of produced archives
#define TARZIP_STAGE_SUFFIX         "_tmp"                  // appended to the base name for the staging directory
// The following needs the 'X' for random char replacement.
#define TARZIP_PARTIAL_PREFIX       "."                     // hides an output archive while it is written
#define TARZIP_PARTIAL_SUFFIX       ".XXXXXX"               // partial output is .<base>.zip.XXXXXX

/*******************************************************************************
** Logging
*******************************************************************************/
#define TARZIP_LOG_NAME             "tarzip"                // log file is <dir>/tarzip.<pid>.log
#define TARZIP_DEFAULT_LOG_DIR      "/tmp"

#endif /* _TARZIP_DEFS_H */
