// The one translation unit that compiles VMA. Plain TU, not a module unit.

#include <cstdlib>
#include <cstdio>

#define VK_NO_PROTOTYPES

// Function pointers come from volk at allocator creation (see VulkanDevice).
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#define VMA_USE_NULLABILITY_ANNOTATIONS 0

#define VMA_SYSTEM_ALIGNED_MALLOC(size, align) std::aligned_alloc(align, size)
#define VMA_SYSTEM_ALIGNED_FREE(ptr) std::free(ptr)

#include <volk.h>
#include <vk_mem_alloc.h>
