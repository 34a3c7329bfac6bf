// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file kale_version.h
 * @brief kale version information
 *
 * The version is defined in CMakeLists.txt (project VERSION) and passed via
 * -DKALE_VERSION during compilation.
 */

#include <cstdio>

// Fallback if not defined (e.g., IDE parsing)
#ifndef KALE_VERSION
#define KALE_VERSION "dev"
#endif

// Git commit hash (short), optionally passed by the build
#ifndef KALE_GIT_HASH
#define KALE_GIT_HASH "unknown"
#endif

/**
 * @brief Get version string
 * @return Version string like "0.3.0"
 */
inline const char* kale_version() {
    return KALE_VERSION;
}

/**
 * @brief Get version with git hash
 * @return Version string like "0.3.0 (abc1234)"
 */
inline const char* kale_version_full() {
    static char buf[64];
    static bool initialized = false;
    if (!initialized) {
        snprintf(buf, sizeof(buf), "%s (%s)", KALE_VERSION, KALE_GIT_HASH);
        initialized = true;
    }
    return buf;
}
