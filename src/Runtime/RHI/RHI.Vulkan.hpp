#pragma once

// Every translation unit touching Vulkan goes through volk; prototypes are
// never linked directly.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>
#include <cstdio>

// VMA declarations only. VMA_IMPLEMENTATION lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>

// Wraps Vulkan calls and logs errors without exceptions
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult result = x;                                                     \
            if (result != VK_SUCCESS) {                                              \
                fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, result, __FILE__, __LINE__);                              \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif

// Early-out for functions returning Core::Result / Core::Expected<T>.
#define VK_TRY(x, errorCode)                                                         \
    do {                                                                             \
        VkResult tryResult = x;                                                      \
        if (tryResult != VK_SUCCESS) {                                               \
            fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n",     \
                   #x, tryResult, __FILE__, __LINE__);                               \
            return std::unexpected(errorCode);                                       \
        }                                                                            \
    } while(0)
