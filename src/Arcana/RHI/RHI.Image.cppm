module;
#include "RHI.Vulkan.hpp"

export module RHI:Image;

import :Device;

export namespace RHI
{
    struct ImageInfo
    {
        VkExtent3D Extent{1, 1, 1};
        VkFormat Format = VK_FORMAT_R8G8B8A8_UNORM;
        VkImageUsageFlags Usage = VK_IMAGE_USAGE_SAMPLED_BIT;
        uint32_t MipLevels = 1;
        uint32_t ArrayLayers = 1;
        VkSampleCountFlagBits Samples = VK_SAMPLE_COUNT_1_BIT;
        VkImageAspectFlags Aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    };

    inline constexpr VkComponentMapping IdentitySwizzle{
        VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
        VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY};

    // Device-local image plus one view over all of its mips and layers.
    // Depth > 1 makes a 3D image; otherwise 2D (or 2D array with layers > 1).
    class VulkanImage
    {
    public:
        VulkanImage(VulkanDevice& device, const ImageInfo& info, VkComponentMapping swizzle = IdentitySwizzle);
        ~VulkanImage();

        VulkanImage(const VulkanImage&) = delete;
        VulkanImage& operator=(const VulkanImage&) = delete;

        [[nodiscard]] VkImage GetHandle() const { return m_Image; }
        [[nodiscard]] VkImageView GetView() const { return m_ImageView; }
        [[nodiscard]] const ImageInfo& GetInfo() const { return m_Info; }
        [[nodiscard]] VkFormat GetFormat() const { return m_Info.Format; }
        [[nodiscard]] VkExtent3D GetExtent() const { return m_Info.Extent; }
        [[nodiscard]] uint32_t GetMipLevels() const { return m_Info.MipLevels; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Info.Extent.width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Info.Extent.height; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] VkImageSubresourceRange GetFullRange() const
        {
            return {m_Info.Aspect, 0, m_Info.MipLevels, 0, m_Info.ArrayLayers};
        }

    private:
        VulkanDevice& m_Device;
        ImageInfo m_Info;
        VkImage m_Image = VK_NULL_HANDLE;
        VkImageView m_ImageView = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        bool m_IsValid = true;
    };
}
