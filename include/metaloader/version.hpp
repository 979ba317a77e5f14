#ifndef METALOADER_VERSION_HPP
#define METALOADER_VERSION_HPP

// Project version
#define METALOADER_VERSION_MAJOR 0
#define METALOADER_VERSION_MINOR 3
#define METALOADER_VERSION_PATCH 0

#define METALOADER_STRINGIFY_IMPL(x) #x
#define METALOADER_STRINGIFY(x) METALOADER_STRINGIFY_IMPL(x)

#define METALOADER_VERSION_STRING                                                               \
    METALOADER_STRINGIFY(METALOADER_VERSION_MAJOR)                                              \
    "." METALOADER_STRINGIFY(METALOADER_VERSION_MINOR) "." METALOADER_STRINGIFY(                \
        METALOADER_VERSION_PATCH)

#endif
