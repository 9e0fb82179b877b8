module;
#include "RHI.Vulkan.hpp"

module RHI:Image.Impl;

import :Image;
import :Types;
import Core;

namespace RHI
{
    VulkanImage::VulkanImage(VulkanDevice& device, const ImageInfo& info, VkComponentMapping swizzle)
        : m_Device(device), m_Info(info)
    {
        const bool is3D = info.Extent.depth > 1;

        VkImageCreateInfo imageInfo{};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = is3D ? VK_IMAGE_TYPE_3D : VK_IMAGE_TYPE_2D;
        imageInfo.extent = info.Extent;
        imageInfo.mipLevels = info.MipLevels;
        imageInfo.arrayLayers = info.ArrayLayers;
        imageInfo.format = info.Format;
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        imageInfo.usage = info.Usage;
        imageInfo.samples = info.Samples;
        imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_GPU_ONLY;
        allocInfo.requiredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;

        VkResult result = vmaCreateImage(device.GetAllocator(), &imageInfo, &allocInfo, &m_Image, &m_Allocation, nullptr);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create {}x{}x{} image (format {}): {}",
                             info.Extent.width, info.Extent.height, info.Extent.depth,
                             static_cast<int>(info.Format), VkResultToString(result));
            m_Image = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = m_Image;
        viewInfo.viewType = is3D ? VK_IMAGE_VIEW_TYPE_3D
                                 : (info.ArrayLayers > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D);
        viewInfo.format = info.Format;
        viewInfo.components = swizzle;
        viewInfo.subresourceRange = GetFullRange();

        result = vkCreateImageView(device.GetLogicalDevice(), &viewInfo, nullptr, &m_ImageView);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create image view: {}", VkResultToString(result));
            m_ImageView = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    VulkanImage::~VulkanImage()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VmaAllocator allocator = m_Device.GetAllocator();

        if (m_ImageView)
        {
            VkImageView view = m_ImageView;
            m_Device.SafeDestroy([logicalDevice, view]()
            {
                vkDestroyImageView(logicalDevice, view, nullptr);
            });
        }

        if (m_Image)
        {
            VkImage image = m_Image;
            VmaAllocation allocation = m_Allocation;
            m_Device.SafeDestroy([allocator, image, allocation]()
            {
                vmaDestroyImage(allocator, image, allocation);
            });
        }
    }
}
