#pragma once

#define LISTEN_ALONG_VERSION_MAJOR 0
#define LISTEN_ALONG_VERSION_MINOR 1
#define LISTEN_ALONG_VERSION_PATCH 0

#define LISTEN_ALONG_STRINGIFY(x) #x
#define LISTEN_ALONG_TOSTRING(x) LISTEN_ALONG_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define LISTEN_ALONG_VERSION_STRING                     \
    LISTEN_ALONG_TOSTRING(LISTEN_ALONG_VERSION_MAJOR) "." \
    LISTEN_ALONG_TOSTRING(LISTEN_ALONG_VERSION_MINOR) "." \
    LISTEN_ALONG_TOSTRING(LISTEN_ALONG_VERSION_PATCH)

// 10000*MAJOR + 100*MINOR + PATCH
#define LISTEN_ALONG_VERSION_NUM \
    ((LISTEN_ALONG_VERSION_MAJOR * 10000) + (LISTEN_ALONG_VERSION_MINOR * 100) + LISTEN_ALONG_VERSION_PATCH)
