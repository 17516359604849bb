#pragma once

#if defined(LEXIGRAPH_STATIC)
    #define LEXIGRAPH_API
#elif defined(_WIN32)
    #if defined(LEXIGRAPH_EXPORT)
        #define LEXIGRAPH_API __declspec(dllexport)
    #else
        #define LEXIGRAPH_API __declspec(dllimport)
    #endif
#else
    #define LEXIGRAPH_API __attribute__((visibility("default")))
#endif
