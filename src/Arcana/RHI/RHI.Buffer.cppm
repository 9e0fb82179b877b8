module;
#include <cstddef>
#include <cstring>
#include <limits>
#include <span>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI
{
    struct BufferInfo
    {
        VkDeviceSize Size = 0;
        VkBufferUsageFlags Usage = 0;
        // GPU_ONLY for device-local targets, AUTO_PREFER_HOST for staging,
        // GPU_TO_CPU for readback. Host-visible kinds are persistently mapped.
        VmaMemoryUsage MemoryUsage = VMA_MEMORY_USAGE_GPU_ONLY;
    };

    class VulkanBuffer
    {
    public:
        VulkanBuffer(VulkanDevice& device, const BufferInfo& info);
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage)
            : VulkanBuffer(device, BufferInfo{size, usage, memoryUsage})
        {
        }
        ~VulkanBuffer();

        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }
        [[nodiscard]] VkBufferUsageFlags GetUsage() const { return m_Usage; }
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        // Copies host bytes into the persistent mapping and flushes them.
        [[nodiscard]] Core::Result Write(std::span<const std::byte> data, size_t offset = 0);

        // Needed for GPU->CPU readbacks when memory is not HOST_COHERENT.
        void Invalidate(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());
        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

        template <typename T>
        [[nodiscard]] Core::Result Read(T* outData, size_t count = 1, size_t byteOffset = 0)
        {
            const size_t byteSize = count * sizeof(T);
            if (!outData || byteOffset + byteSize > m_SizeBytes || !m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Read(): invalid read. size={} offset={} cap={} mapped={}",
                                 byteSize, byteOffset, m_SizeBytes, m_MappedData != nullptr);
                return Core::Err(Core::ErrorCode::OutOfRange);
            }

            Invalidate(byteOffset, byteSize);
            std::memcpy(outData, static_cast<const std::byte*>(m_MappedData) + byteOffset, byteSize);
            return Core::Ok();
        }

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        // Persistent pointer. nullptr for GPU-only memory.
        void* m_MappedData = nullptr;

        size_t m_SizeBytes = 0;
        VkBufferUsageFlags m_Usage = 0;
    };
}
