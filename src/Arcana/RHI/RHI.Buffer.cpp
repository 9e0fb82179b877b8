module;
#include <cstddef>
#include <cstring>
#include <limits>
#include <span>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;

import :Buffer;
import :Types;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, const BufferInfo& info)
        : m_Device(device), m_SizeBytes(static_cast<size_t>(info.Size)), m_Usage(info.Usage)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = info.Size;
        bufferInfo.usage = info.Usage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = info.MemoryUsage;
        if (info.MemoryUsage == VMA_MEMORY_USAGE_AUTO_PREFER_HOST || info.MemoryUsage == VMA_MEMORY_USAGE_CPU_TO_GPU)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }
        else if (info.MemoryUsage == VMA_MEMORY_USAGE_GPU_TO_CPU)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        VmaAllocationInfo resultInfo{};
        VkResult result = vmaCreateBuffer(device.GetAllocator(), &bufferInfo, &allocInfo, &m_Buffer, &m_Allocation, &resultInfo);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer of {} bytes: {}", info.Size, VkResultToString(result));
            m_Buffer = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            return;
        }

        m_MappedData = resultInfo.pMappedData;
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device.GetAllocator();

        m_Device.SafeDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    Core::Result VulkanBuffer::Write(std::span<const std::byte> data, size_t offset)
    {
        if (data.empty()) return Core::Ok();

        if (offset + data.size() > m_SizeBytes)
        {
            Core::Log::Error("VulkanBuffer::Write(): {} bytes at offset {} overflow capacity {}", data.size(), offset, m_SizeBytes);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        if (!m_MappedData)
        {
            Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible. Upload through the Uploader instead.");
            return Core::Err(Core::ErrorCode::OutOfMemory);
        }

        std::memcpy(static_cast<std::byte*>(m_MappedData) + offset, data.data(), data.size());

        VkResult result = vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, data.size());
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("VulkanBuffer::Write(): flush failed: {}", VkResultToString(result));
            return Core::Err(Core::ErrorCode::OutOfMemory);
        }
        return Core::Ok();
    }

    void VulkanBuffer::Invalidate(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        VK_CHECK(vmaInvalidateAllocation(m_Device.GetAllocator(), m_Allocation, offset,
                                         size == std::numeric_limits<size_t>::max() ? VK_WHOLE_SIZE : size));
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        VK_CHECK(vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset,
                                    size == std::numeric_limits<size_t>::max() ? VK_WHOLE_SIZE : size));
    }
}
