#pragma once

// ISOLA_BUILD_SHARED is defined for every user of a shared isola build,
// ISOLA_EXPORT_SHARED only while compiling the library itself.

#if !defined(ISOLA_BUILD_SHARED)
    #define ISOLA_API
#elif defined(_MSC_VER)
    #ifdef ISOLA_EXPORT_SHARED
        #define ISOLA_API __declspec(dllexport)
    #else
        #define ISOLA_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__)
    #define ISOLA_API __attribute__((visibility("default")))
#else
    #define ISOLA_API
#endif

// Exported classes holding standard library or clu members trip C4251 and C4275
#if defined(_MSC_VER) && defined(ISOLA_BUILD_SHARED)
    #define ISOLA_SUPPRESS_EXPORT_WARNING __pragma(warning(push)) __pragma(warning(disable: 4251 4275))
    #define ISOLA_RESTORE_EXPORT_WARNING __pragma(warning(pop))
#else
    #define ISOLA_SUPPRESS_EXPORT_WARNING
    #define ISOLA_RESTORE_EXPORT_WARNING
#endif
