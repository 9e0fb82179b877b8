module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <string_view>

export module RHI:Types;

import Core;

export namespace RHI
{
    // "Any access" mask. Used where the previous or next user of a resource is unknown.
    inline constexpr VkAccessFlags2 AccessAll = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT;

    [[nodiscard]] constexpr Core::ErrorCode ToErrorCode(VkResult result)
    {
        switch (result)
        {
        case VK_SUCCESS:                        return Core::ErrorCode::Success;
        case VK_ERROR_OUT_OF_HOST_MEMORY:       return Core::ErrorCode::OutOfMemory;
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:     return Core::ErrorCode::OutOfDeviceMemory;
        case VK_ERROR_OUT_OF_POOL_MEMORY:
        case VK_ERROR_FRAGMENTED_POOL:
        case VK_ERROR_FRAGMENTATION:
        case VK_ERROR_MEMORY_MAP_FAILED:        return Core::ErrorCode::OutOfMemory;
        case VK_ERROR_DEVICE_LOST:              return Core::ErrorCode::DeviceLost;
        case VK_ERROR_FORMAT_NOT_SUPPORTED:     return Core::ErrorCode::InvalidFormat;
        case VK_ERROR_FEATURE_NOT_PRESENT:
        case VK_ERROR_EXTENSION_NOT_PRESENT:
        case VK_ERROR_INITIALIZATION_FAILED:    return Core::ErrorCode::InvalidState;
        default:                                return Core::ErrorCode::Unknown;
        }
    }

    [[nodiscard]] constexpr std::string_view VkResultToString(VkResult result)
    {
        switch (result)
        {
        case VK_SUCCESS:                    return "VK_SUCCESS";
        case VK_NOT_READY:                  return "VK_NOT_READY";
        case VK_TIMEOUT:                    return "VK_TIMEOUT";
        case VK_ERROR_OUT_OF_HOST_MEMORY:   return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_OUT_OF_POOL_MEMORY:   return "VK_ERROR_OUT_OF_POOL_MEMORY";
        case VK_ERROR_MEMORY_MAP_FAILED:    return "VK_ERROR_MEMORY_MAP_FAILED";
        case VK_ERROR_DEVICE_LOST:          return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
        default:                            return "VK_ERROR_<other>";
        }
    }
}
