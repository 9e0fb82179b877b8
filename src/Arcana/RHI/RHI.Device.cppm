module;
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;

namespace RHI
{
    export struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        [[nodiscard]] bool IsComplete() const { return GraphicsFamily.has_value(); }
    };

    // Owns the logical device, the VMA allocator and the deferred destruction
    // queues. Everything that holds a Vulkan object keeps a VulkanDevice& and
    // hands its handles back through SafeDestroy.
    export class VulkanDevice
    {
    public:
        explicit VulkanDevice(VulkanContext& context);
        ~VulkanDevice();

        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] const VkPhysicalDeviceLimits& GetLimits() const { return m_Properties.limits; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] constexpr uint32_t GetFramesInFlight() const { return MAX_FRAMES_IN_FLIGHT; }

        // Serialized against every other submission on the graphics queue.
        [[nodiscard]] VkResult SubmitToGraphicsQueue(const VkSubmitInfo2& submitInfo, VkFence fence);
        void WaitIdle();

        // Runs the deletions queued while `frameIndex` was the current slot and makes
        // it the current slot again. Call once the slot's fence has signalled.
        void FlushDeletionQueue(uint32_t frameIndex);
        // Only safe after WaitIdle().
        void FlushAllDeletionQueues();
        void SafeDestroy(std::function<void()>&& deleteFn);

        [[nodiscard]] size_t GetPendingDeletionCount() const;

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;
        VkPhysicalDeviceProperties m_Properties{};

        VmaAllocator m_Allocator = VK_NULL_HANDLE;

        std::mutex m_QueueMutex;

        bool m_IsValid = true;

        static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
        std::vector<std::function<void()>> m_DeletionQueue[MAX_FRAMES_IN_FLIGHT];
        uint32_t m_CurrentFrameIndex = 0;
        mutable std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);

        bool IsDeviceSuitable(VkPhysicalDevice device);
        QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
    };
}
