#pragma once

#if defined(_WIN32)
    #if defined(TWINSCAN_EXPORT)
        #define TWINSCAN_API __declspec(dllexport)
    #else
        #define TWINSCAN_API __declspec(dllimport)
    #endif
#else
    #define TWINSCAN_API __attribute__((visibility("default")))
#endif
