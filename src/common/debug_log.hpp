#pragma once

#include <iostream>

#ifndef NDEBUG
    #define MEETCAPTURE_LOG(x) std::cout << x
    #define MEETCAPTURE_LOG_ENDL std::endl
#else
    #define MEETCAPTURE_LOG(x) ((void)0)
    #define MEETCAPTURE_LOG_ENDL ((void)0)
#endif

// Errors are reported in release builds too.
#define MEETCAPTURE_ERROR_LOG(x) (std::cerr << "[meetcapture] " << x << std::endl)
