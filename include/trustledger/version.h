/**
 * @file version.h
 * @brief Unified Version Information for trustledger
 *
 * Single source of truth for version information. All other files include
 * this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef TRUSTLEDGER_VERSION_H
#define TRUSTLEDGER_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define TRUSTLEDGER_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define TRUSTLEDGER_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define TRUSTLEDGER_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define TRUSTLEDGER_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define TRUSTLEDGER_VERSION_NUMBER ((TRUSTLEDGER_VERSION_MAJOR * 10000) + \
                                    (TRUSTLEDGER_VERSION_MINOR * 100) + \
                                    TRUSTLEDGER_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define TRUSTLEDGER_RELEASE_DATE "2026-10-19"

/** Library name */
#define TRUSTLEDGER_LIBRARY_NAME "trustledger"

/** Full library description */
#define TRUSTLEDGER_DESCRIPTION "Confidential Trust Score Ledger"

/** Build type identifier */
#ifdef NDEBUG
#define TRUSTLEDGER_BUILD_TYPE "Release"
#else
#define TRUSTLEDGER_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define TRUSTLEDGER_VERSION_AT_LEAST(major, minor, patch) \
    (TRUSTLEDGER_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* TRUSTLEDGER_VERSION_H */
