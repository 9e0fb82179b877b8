module;
#include "RHI.Vulkan.hpp"
#include <memory>
#include <span>
#include <vector>

export module RHI:CommandQueue;

import :Device;
import :CommandEncoder;
import Core;

export namespace RHI
{
    struct QueueSubmitSync
    {
        std::span<const VkSemaphore> WaitSemaphores{};
        // One stage mask per wait semaphore. Empty means ALL_COMMANDS for each.
        std::span<const VkPipelineStageFlags2> WaitStages{};
        std::span<const VkSemaphore> SignalSemaphores{};
        VkFence Fence = VK_NULL_HANDLE;
    };

    class ICommandQueue
    {
    public:
        virtual ~ICommandQueue() = default;

        ICommandQueue(const ICommandQueue&) = delete;
        ICommandQueue& operator=(const ICommandQueue&) = delete;
        ICommandQueue(ICommandQueue&&) = delete;
        ICommandQueue& operator=(ICommandQueue&&) = delete;

        // Returns an encoder in the recording state.
        [[nodiscard]] virtual Core::Expected<std::unique_ptr<ICommandEncoder>> CreateEncoder() = 0;

        // Ends every encoder and submits them as one batch, in order. The queue
        // consumes the encoders whether or not the submission succeeds.
        [[nodiscard]] virtual Core::Result Submit(std::vector<std::unique_ptr<ICommandEncoder>> encoders,
                                                  const QueueSubmitSync& sync) = 0;

        [[nodiscard]] Core::Result SubmitOne(std::unique_ptr<ICommandEncoder> encoder, const QueueSubmitSync& sync = {})
        {
            std::vector<std::unique_ptr<ICommandEncoder>> encoders;
            encoders.push_back(std::move(encoder));
            return Submit(std::move(encoders), sync);
        }

    protected:
        ICommandQueue() = default;
    };

    // The device's graphics queue plus a command pool for one recording thread.
    class VulkanCommandQueue final : public ICommandQueue
    {
    public:
        explicit VulkanCommandQueue(VulkanDevice& device);
        ~VulkanCommandQueue() override;

        [[nodiscard]] Core::Expected<std::unique_ptr<ICommandEncoder>> CreateEncoder() override;
        [[nodiscard]] Core::Result Submit(std::vector<std::unique_ptr<ICommandEncoder>> encoders,
                                          const QueueSubmitSync& sync) override;

        [[nodiscard]] bool IsValid() const { return m_Pool != VK_NULL_HANDLE; }
        [[nodiscard]] uint64_t GetSubmitCount() const { return m_SubmitCount; }

    private:
        VulkanDevice& m_Device;
        VkCommandPool m_Pool = VK_NULL_HANDLE;
        uint64_t m_SubmitCount = 0;
    };
}
