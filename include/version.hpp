#ifndef REMOTESYNC_VERSION_HPP
#define REMOTESYNC_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define REMOTESYNC_VERSION_MAJOR 1
#define REMOTESYNC_VERSION_MINOR 2
#define REMOTESYNC_VERSION_PATCH 0

#define REMOTESYNC_STRINGIFY_(x) #x
#define REMOTESYNC_STRINGIFY(x) REMOTESYNC_STRINGIFY_(x)
#define REMOTESYNC_VERSION_STR                                                                     \
    REMOTESYNC_STRINGIFY(REMOTESYNC_VERSION_MAJOR)                                                 \
    "." REMOTESYNC_STRINGIFY(REMOTESYNC_VERSION_MINOR) "." REMOTESYNC_STRINGIFY(                   \
        REMOTESYNC_VERSION_PATCH)
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* REMOTESYNC_VERSION = REMOTESYNC_VERSION_STR;

#endif /* REMOTESYNC_VERSION_HPP */
