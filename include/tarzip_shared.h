/******************************************************************************\
 * tarzip_shared.h - Definitions shared between the tarzip library and its
 *                   command line driver.
 *
 * Copyright 2024 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _TARZIP_SHARED_H
#define _TARZIP_SHARED_H

/*
 * tarzip reads environment variables about its configuration dynamically at
 * run time. The environment variables that are read are defined here. Note
 * that the value of these environment variables are subject to change. Use
 * the defines to guarantee portability.
 *
 * TARZIP_DBG_ENV_VAR (optional)
 *
 *      Used to turn on debug logging. Equivalent to passing --debug on the
 *      command line.
 *
 * TARZIP_LOG_DIR_ENV_VAR (optional)
 *
 *      Used to define a path to write log files to. If TARZIP_DBG_ENV_VAR is
 *      set, and this env variable is omitted, then the log file will be
 *      written to /tmp. The directory must be readable, writable and
 *      searchable by the user, otherwise logging stays disabled.
 *
 * TARZIP_JOBS_ENV_VAR (optional)
 *
 *      Used to define the default number of archives converted in parallel.
 *      The --jobs command line option overrides this environment variable.
 *
 */
#define TARZIP_DBG_ENV_VAR       "TARZIP_DEBUG"
#define TARZIP_LOG_DIR_ENV_VAR   "TARZIP_LOG_DIR"
#define TARZIP_JOBS_ENV_VAR      "TARZIP_JOBS"

/*
 * Process exit codes of the tarzip command line driver.
 *
 * TARZIP_EXIT_SUCCESS  - every archive was converted, or there was nothing
 *                        to convert
 * TARZIP_EXIT_FAILURE  - at least one archive failed to convert
 * TARZIP_EXIT_USAGE    - bad arguments or an unusable input/output directory
 */
#define TARZIP_EXIT_SUCCESS      0
#define TARZIP_EXIT_FAILURE      1
#define TARZIP_EXIT_USAGE        2

#endif /* _TARZIP_SHARED_H */
