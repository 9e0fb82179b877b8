module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <span>

module RHI:Staging.Impl;

import :Staging;
import :Buffer;
import Core;

namespace RHI
{
    static_assert(IsPowerOfTwo(StagingAlignment));

    VulkanStagingAllocator::VulkanStagingAllocator(VulkanDevice& device)
        : m_Device(device)
    {
    }

    Core::Expected<std::unique_ptr<StagingBuffer>> VulkanStagingAllocator::AllocateAndFill(
        std::span<const std::byte> bytes, StagingUsage usage)
    {
        if (bytes.empty())
        {
            Core::Log::Error("VulkanStagingAllocator: empty payloads must be skipped by the caller.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const VkDeviceSize payload = bytes.size();
        const VkDeviceSize capacity = AlignUp(payload, StagingAlignment);

        VkBufferUsageFlags flags = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
        if (usage == StagingUsage::UniformTexel) flags |= VK_BUFFER_USAGE_UNIFORM_TEXEL_BUFFER_BIT;

        auto buffer = std::make_unique<VulkanBuffer>(m_Device, BufferInfo{
            .Size = capacity,
            .Usage = flags,
            .MemoryUsage = VMA_MEMORY_USAGE_AUTO_PREFER_HOST,
        });

        if (!buffer->IsValid() || !buffer->IsHostVisible())
        {
            Core::Log::Error("VulkanStagingAllocator: failed to allocate {} bytes of staging memory.", capacity);
            return std::unexpected(Core::ErrorCode::OutOfMemory);
        }

        if (auto written = buffer->Write(bytes); !written)
        {
            Core::Log::Error("VulkanStagingAllocator: host write of {} bytes failed ({}).",
                             payload, Core::ErrorCodeToString(written.error()));
            return std::unexpected(Core::ErrorCode::OutOfMemory);
        }

        ++m_AllocationCount;
        m_AllocatedBytes += capacity;

        VkBuffer handle = buffer->GetHandle();
        return std::make_unique<StagingBuffer>(handle, payload, capacity, usage, std::move(buffer));
    }
}
