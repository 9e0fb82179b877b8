module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

export module RHI:Staging;

import :Device;
import :Buffer;
import Core;

export namespace RHI
{
    enum class StagingUsage : uint8_t
    {
        TransferSrc,  // source of a buffer or buffer-to-image copy
        UniformTexel  // read by the transcoder through a texel buffer view
    };

    inline constexpr VkDeviceSize StagingAlignment = 16;

    [[nodiscard]] constexpr bool IsPowerOfTwo(VkDeviceSize x) { return x && ((x & (x - 1)) == 0); }

    [[nodiscard]] constexpr VkDeviceSize AlignUp(VkDeviceSize value, VkDeviceSize alignment)
    {
        return (value + alignment - 1) & ~(alignment - 1);
    }

    // Host-filled buffer feeding exactly one upload. Move-only through unique_ptr;
    // never reused. `Owner` is empty for buffers that some other system owns.
    class StagingBuffer
    {
    public:
        StagingBuffer(VkBuffer handle, VkDeviceSize payloadSize, VkDeviceSize capacity, StagingUsage usage,
                      std::unique_ptr<VulkanBuffer> owner = nullptr)
            : m_Owner(std::move(owner)), m_Handle(handle), m_PayloadSize(payloadSize), m_Capacity(capacity), m_Usage(usage)
        {
        }

        StagingBuffer(const StagingBuffer&) = delete;
        StagingBuffer& operator=(const StagingBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Handle; }
        // Bytes the caller wrote. Copies read exactly this many.
        [[nodiscard]] VkDeviceSize GetPayloadSize() const { return m_PayloadSize; }
        // Allocated size, PayloadSize rounded up to StagingAlignment.
        [[nodiscard]] VkDeviceSize GetCapacity() const { return m_Capacity; }
        [[nodiscard]] StagingUsage GetUsage() const { return m_Usage; }

    private:
        std::unique_ptr<VulkanBuffer> m_Owner;
        VkBuffer m_Handle = VK_NULL_HANDLE;
        VkDeviceSize m_PayloadSize = 0;
        VkDeviceSize m_Capacity = 0;
        StagingUsage m_Usage = StagingUsage::TransferSrc;
    };

    class IStagingAllocator
    {
    public:
        virtual ~IStagingAllocator() = default;

        IStagingAllocator(const IStagingAllocator&) = delete;
        IStagingAllocator& operator=(const IStagingAllocator&) = delete;

        // `bytes` must be non-empty; callers treat empty payloads as no-ops.
        // OutOfMemory when either the allocation or the host write fails.
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<StagingBuffer>> AllocateAndFill(
            std::span<const std::byte> bytes, StagingUsage usage) = 0;

    protected:
        IStagingAllocator() = default;
    };

    // One VMA host-visible allocation per call. Released buffers go through the
    // device's deferred destruction, so they outlive the commands reading them.
    class VulkanStagingAllocator final : public IStagingAllocator
    {
    public:
        explicit VulkanStagingAllocator(VulkanDevice& device);

        [[nodiscard]] Core::Expected<std::unique_ptr<StagingBuffer>> AllocateAndFill(
            std::span<const std::byte> bytes, StagingUsage usage) override;

        [[nodiscard]] uint64_t GetAllocationCount() const { return m_AllocationCount; }
        [[nodiscard]] uint64_t GetAllocatedBytes() const { return m_AllocatedBytes; }

    private:
        VulkanDevice& m_Device;
        uint64_t m_AllocationCount = 0;
        uint64_t m_AllocatedBytes = 0;
    };
}
