#pragma once

#if defined(_WIN32)
    #if defined(DAGSTORE_EXPORT)
        #define DAGSTORE_API __declspec(dllexport)
    #else
        #define DAGSTORE_API __declspec(dllimport)
    #endif
#else
    #define DAGSTORE_API __attribute__((visibility("default")))
#endif
