module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <span>
#include <vector>

export module RHI:Descriptors;

import :Device;
import Core;

export namespace RHI
{
    class DescriptorLayout
    {
    public:
        DescriptorLayout(VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_Layout != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    // A set plus the pool it came from, which is where it must be returned.
    struct DescriptorAllocation
    {
        VkDescriptorSet Set = VK_NULL_HANDLE;
        VkDescriptorPool Pool = VK_NULL_HANDLE;
    };

    // Chain of pools whose sets can be handed back one at a time. When the
    // current pool runs dry a new one twice its size is appended, so the
    // number of sets alive at once is bounded only by memory.
    //
    // Free() defers the actual vkFreeDescriptorSets until the current frame
    // slot retires, so a set may be freed right after it was recorded into a
    // command buffer.
    class DescriptorPool
    {
    public:
        // `sizes` and `maxSets` describe the first pool; later pools scale both.
        DescriptorPool(VulkanDevice& device, std::span<const VkDescriptorPoolSize> sizes, uint32_t maxSets);
        ~DescriptorPool();

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        [[nodiscard]] Core::Expected<DescriptorAllocation> Allocate(VkDescriptorSetLayout layout);
        void Free(const DescriptorAllocation& allocation);

        [[nodiscard]] bool IsValid() const { return m_CurrentPool != VK_NULL_HANDLE; }
        [[nodiscard]] uint32_t GetPoolCount() const { return static_cast<uint32_t>(m_AllPools.size()); }
        [[nodiscard]] uint32_t GetCurrentMaxSets() const { return m_MaxSets; }

    private:
        [[nodiscard]] VkDescriptorPool CreatePool(uint32_t maxSets, uint32_t scale) const;
        bool Grow();

        VulkanDevice& m_Device;
        std::vector<VkDescriptorPoolSize> m_BaseSizes;
        uint32_t m_BaseMaxSets = 0;
        uint32_t m_MaxSets = 0;

        VkDescriptorPool m_CurrentPool = VK_NULL_HANDLE;
        std::vector<VkDescriptorPool> m_AllPools;
    };
}
