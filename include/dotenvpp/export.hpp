#pragma once

#if defined(DOTENVPP_SHARED)
    #if defined(_MSC_VER)
        #if defined(DOTENVPP_BUILDING)
            #define DOTENVPP_API __declspec(dllexport)
        #else
            #define DOTENVPP_API __declspec(dllimport)
        #endif
    #elif defined(__GNUC__) || defined(__clang__)
        #if defined(DOTENVPP_BUILDING)
            #define DOTENVPP_API __attribute__((visibility("default")))
        #else
            #define DOTENVPP_API
        #endif
    #else
        #define DOTENVPP_API
    #endif
#else
    #define DOTENVPP_API
#endif
