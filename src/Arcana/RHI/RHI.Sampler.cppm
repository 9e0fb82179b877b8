module;
#include "RHI.Vulkan.hpp"

export module RHI:Sampler;

import :Device;

export namespace RHI
{
    struct SamplerInfo
    {
        VkFilter MagFilter = VK_FILTER_LINEAR;
        VkFilter MinFilter = VK_FILTER_LINEAR;
        VkSamplerMipmapMode MipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR;
        VkSamplerAddressMode AddressMode = VK_SAMPLER_ADDRESS_MODE_REPEAT;
        float MaxLod = VK_LOD_CLAMP_NONE;
        bool Anisotropy = false;
    };

    class Sampler
    {
    public:
        Sampler(VulkanDevice& device, const SamplerInfo& info = {});
        ~Sampler();

        Sampler(const Sampler&) = delete;
        Sampler& operator=(const Sampler&) = delete;

        [[nodiscard]] VkSampler GetHandle() const { return m_Sampler; }
        [[nodiscard]] bool IsValid() const { return m_Sampler != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkSampler m_Sampler = VK_NULL_HANDLE;
    };
}
