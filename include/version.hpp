#ifndef ANNEXSYNC_VERSION_HPP
#define ANNEXSYNC_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define ANNEXSYNC_VERSION_MAJOR 0
#define ANNEXSYNC_VERSION_MINOR 3
#define ANNEXSYNC_VERSION_PATCH 0

/*
 * Release tag injected by the CI workflow.
 * Example format: "0.3.0".
 */
#define ANNEXSYNC_VERSION_STR "0.3.0"
#define ANNEXSYNC_VERSION_RC                                                                       \
    ANNEXSYNC_VERSION_MAJOR, ANNEXSYNC_VERSION_MINOR, ANNEXSYNC_VERSION_PATCH, 0

/* Oldest git-annex release known to produce the JSON shapes we parse. */
#define ANNEXSYNC_MIN_ANNEX_VERSION "6.20171108"
/* ------------------------------------------------------------------ */

/* Everything below is **C++-only**.  Keep it out of windres runs.   */
#ifndef RC_INVOKED
/* Human-friendly version string for the C++ codebase */
constexpr const char* ANNEXSYNC_VERSION = ANNEXSYNC_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* ANNEXSYNC_VERSION_HPP */
