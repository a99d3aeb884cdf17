// RHI.Vma.cpp – *no* `module;` here, this is just a normal TU.

#include <cstdlib>
#include <cstdio>

#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

// VMA config – must match everywhere you include vk_mem_alloc.h
#define VMA_IMPLEMENTATION
#ifndef VMA_STATIC_VULKAN_FUNCTIONS
    #define VMA_STATIC_VULKAN_FUNCTIONS 0
#endif
#ifndef VMA_DYNAMIC_VULKAN_FUNCTIONS
    #define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#endif
#define VMA_USE_NULLABILITY_ANNOTATIONS 0

#include <volk.h>
#include <vk_mem_alloc.h>
