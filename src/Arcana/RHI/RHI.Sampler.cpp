module;
#include "RHI.Vulkan.hpp"

module RHI:Sampler.Impl;

import :Sampler;
import :Types;
import Core;

namespace RHI
{
    Sampler::Sampler(VulkanDevice& device, const SamplerInfo& info)
        : m_Device(device)
    {
        VkSamplerCreateInfo samplerInfo{};
        samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        samplerInfo.magFilter = info.MagFilter;
        samplerInfo.minFilter = info.MinFilter;
        samplerInfo.mipmapMode = info.MipmapMode;
        samplerInfo.addressModeU = info.AddressMode;
        samplerInfo.addressModeV = info.AddressMode;
        samplerInfo.addressModeW = info.AddressMode;

        // Requires the samplerAnisotropy feature, which the device enables whenever the GPU has it.
        samplerInfo.anisotropyEnable = info.Anisotropy ? VK_TRUE : VK_FALSE;
        samplerInfo.maxAnisotropy = info.Anisotropy ? device.GetLimits().maxSamplerAnisotropy : 1.0f;

        samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
        samplerInfo.unnormalizedCoordinates = VK_FALSE;
        samplerInfo.compareEnable = VK_FALSE;
        samplerInfo.compareOp = VK_COMPARE_OP_ALWAYS;
        samplerInfo.minLod = 0.0f;
        samplerInfo.maxLod = info.MaxLod;

        VkResult result = vkCreateSampler(device.GetLogicalDevice(), &samplerInfo, nullptr, &m_Sampler);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create sampler: {}", VkResultToString(result));
            m_Sampler = VK_NULL_HANDLE;
        }
    }

    Sampler::~Sampler()
    {
        if (!m_Sampler) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkSampler sampler = m_Sampler;
        m_Device.SafeDestroy([logicalDevice, sampler]()
        {
            vkDestroySampler(logicalDevice, sampler, nullptr);
        });
    }
}
