module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

module RHI:Descriptors.Impl;

import :Descriptors;
import :Types;
import Core;

namespace RHI
{
    // --- Descriptor Layout ---
    DescriptorLayout::DescriptorLayout(VulkanDevice& device, std::span<const VkDescriptorSetLayoutBinding> bindings)
        : m_Device(device)
    {
        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
        layoutInfo.pBindings = bindings.data();

        VkResult result = vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout: {}", VkResultToString(result));
            m_Layout = VK_NULL_HANDLE;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (!m_Layout) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorSetLayout layout = m_Layout;
        m_Device.SafeDestroy([logicalDevice, layout]()
        {
            vkDestroyDescriptorSetLayout(logicalDevice, layout, nullptr);
        });
    }

    // --- Descriptor Pool ---
    namespace
    {
        constexpr uint32_t kMaxSetsPerPool = 1u << 16;
    }

    DescriptorPool::DescriptorPool(VulkanDevice& device, std::span<const VkDescriptorPoolSize> sizes, uint32_t maxSets)
        : m_Device(device), m_BaseSizes(sizes.begin(), sizes.end()), m_BaseMaxSets(maxSets)
    {
        m_CurrentPool = CreatePool(maxSets, 1);
        if (m_CurrentPool)
        {
            m_AllPools.push_back(m_CurrentPool);
            m_MaxSets = maxSets;
        }
    }

    DescriptorPool::~DescriptorPool()
    {
        // Pending Free() calls must have run first: owners drop the pool only after
        // WaitIdle() and FlushAllDeletionQueues().
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        for (VkDescriptorPool pool : m_AllPools)
        {
            m_Device.SafeDestroy([logicalDevice, pool]()
            {
                vkDestroyDescriptorPool(logicalDevice, pool, nullptr);
            });
        }
        m_AllPools.clear();
        m_CurrentPool = VK_NULL_HANDLE;
    }

    VkDescriptorPool DescriptorPool::CreatePool(uint32_t maxSets, uint32_t scale) const
    {
        std::vector<VkDescriptorPoolSize> sizes = m_BaseSizes;
        for (VkDescriptorPoolSize& size : sizes)
            size.descriptorCount *= scale;

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        poolInfo.poolSizeCount = static_cast<uint32_t>(sizes.size());
        poolInfo.pPoolSizes = sizes.data();
        poolInfo.maxSets = maxSets;

        VkDescriptorPool pool = VK_NULL_HANDLE;
        VkResult result = vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &pool);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool ({} sets): {}", maxSets, VkResultToString(result));
            return VK_NULL_HANDLE;
        }
        return pool;
    }

    bool DescriptorPool::Grow()
    {
        // Geometric growth keeps the chain short under sustained pressure.
        const uint32_t nextMaxSets = std::min(std::max(m_MaxSets, 1u) * 2, kMaxSetsPerPool);
        const uint32_t nextScale = std::max(1u, (nextMaxSets + m_BaseMaxSets - 1) / std::max(m_BaseMaxSets, 1u));

        VkDescriptorPool pool = CreatePool(nextMaxSets, nextScale);
        if (!pool) return false;

        Core::Log::Warn("DescriptorPool: pool exhausted, growing {} -> {} sets (pool #{})",
                        m_MaxSets, nextMaxSets, m_AllPools.size() + 1);

        m_AllPools.push_back(pool);
        m_CurrentPool = pool;
        m_MaxSets = nextMaxSets;
        return true;
    }

    Core::Expected<DescriptorAllocation> DescriptorPool::Allocate(VkDescriptorSetLayout layout)
    {
        if (!m_CurrentPool)
            return Core::Err<DescriptorAllocation>(Core::ErrorCode::InvalidState);

        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_CurrentPool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        VkDescriptorSet set = VK_NULL_HANDLE;
        VkResult result = vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set);

        if (result == VK_ERROR_OUT_OF_POOL_MEMORY || result == VK_ERROR_FRAGMENTED_POOL)
        {
            if (!Grow())
                return Core::Err<DescriptorAllocation>(Core::ErrorCode::OutOfMemory);

            allocInfo.descriptorPool = m_CurrentPool;
            result = vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set);
        }

        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set: {}", VkResultToString(result));
            return Core::Err<DescriptorAllocation>(Core::ErrorCode::OutOfMemory);
        }
        return DescriptorAllocation{set, m_CurrentPool};
    }

    void DescriptorPool::Free(const DescriptorAllocation& allocation)
    {
        if (!allocation.Set || !allocation.Pool) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorPool pool = allocation.Pool;
        VkDescriptorSet set = allocation.Set;
        m_Device.SafeDestroy([logicalDevice, pool, set]()
        {
            vkFreeDescriptorSets(logicalDevice, pool, 1, &set);
        });
    }
}
