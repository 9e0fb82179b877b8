module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <memory>
#include <vector>

module RHI:CommandQueue.Impl;

import :CommandQueue;
import :CommandEncoder;
import :Types;
import Core;

namespace RHI
{
    VulkanCommandQueue::VulkanCommandQueue(VulkanDevice& device)
        : m_Device(device)
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT | VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = device.GetQueueIndices().GraphicsFamily.value();

        VkResult result = vkCreateCommandPool(device.GetLogicalDevice(), &poolInfo, nullptr, &m_Pool);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create command pool: {}", VkResultToString(result));
            m_Pool = VK_NULL_HANDLE;
        }
    }

    VulkanCommandQueue::~VulkanCommandQueue()
    {
        if (!m_Pool) return;

        // Queued after the frees of its command buffers, which ran or are pending in older slots.
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkCommandPool pool = m_Pool;
        m_Device.SafeDestroy([logicalDevice, pool]()
        {
            vkDestroyCommandPool(logicalDevice, pool, nullptr);
        });
    }

    Core::Expected<std::unique_ptr<ICommandEncoder>> VulkanCommandQueue::CreateEncoder()
    {
        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_Pool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 1;

        VkCommandBuffer cmd = VK_NULL_HANDLE;
        VkResult result = vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, &cmd);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate command buffer: {}", VkResultToString(result));
            return std::unexpected(ToErrorCode(result));
        }

        // The encoder owns the buffer from here on, including on the error path below.
        auto encoder = std::make_unique<VulkanCommandEncoder>(m_Device, m_Pool, cmd);

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        result = vkBeginCommandBuffer(cmd, &beginInfo);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("vkBeginCommandBuffer failed: {}", VkResultToString(result));
            return std::unexpected(ToErrorCode(result));
        }

        return std::unique_ptr<ICommandEncoder>(std::move(encoder));
    }

    Core::Result VulkanCommandQueue::Submit(std::vector<std::unique_ptr<ICommandEncoder>> encoders,
                                            const QueueSubmitSync& sync)
    {
        if (!sync.WaitStages.empty() && sync.WaitStages.size() != sync.WaitSemaphores.size())
        {
            Core::Log::Error("Submit: {} wait stages for {} wait semaphores", sync.WaitStages.size(), sync.WaitSemaphores.size());
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        std::vector<VkCommandBufferSubmitInfo> commandInfos;
        commandInfos.reserve(encoders.size());
        for (auto& encoder : encoders)
        {
            if (!encoder || encoder->GetHandle() == VK_NULL_HANDLE)
            {
                Core::Log::Error("Submit: encoder does not record into a Vulkan command buffer");
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }

            if (auto ended = encoder->End(); !ended) return ended;

            VkCommandBufferSubmitInfo info{};
            info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
            info.commandBuffer = encoder->GetHandle();
            commandInfos.push_back(info);
        }

        std::vector<VkSemaphoreSubmitInfo> waitInfos;
        waitInfos.reserve(sync.WaitSemaphores.size());
        for (size_t i = 0; i < sync.WaitSemaphores.size(); ++i)
        {
            VkSemaphoreSubmitInfo info{};
            info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
            info.semaphore = sync.WaitSemaphores[i];
            info.stageMask = sync.WaitStages.empty() ? VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT : sync.WaitStages[i];
            waitInfos.push_back(info);
        }

        std::vector<VkSemaphoreSubmitInfo> signalInfos;
        signalInfos.reserve(sync.SignalSemaphores.size());
        for (VkSemaphore semaphore : sync.SignalSemaphores)
        {
            VkSemaphoreSubmitInfo info{};
            info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
            info.semaphore = semaphore;
            info.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            signalInfos.push_back(info);
        }

        VkSubmitInfo2 submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
        submitInfo.waitSemaphoreInfoCount = static_cast<uint32_t>(waitInfos.size());
        submitInfo.pWaitSemaphoreInfos = waitInfos.data();
        submitInfo.commandBufferInfoCount = static_cast<uint32_t>(commandInfos.size());
        submitInfo.pCommandBufferInfos = commandInfos.data();
        submitInfo.signalSemaphoreInfoCount = static_cast<uint32_t>(signalInfos.size());
        submitInfo.pSignalSemaphoreInfos = signalInfos.data();

        VkResult result = m_Device.SubmitToGraphicsQueue(submitInfo, sync.Fence);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Queue submission failed: {}", VkResultToString(result));
            return Core::Err(result == VK_ERROR_DEVICE_LOST ? Core::ErrorCode::DeviceLost : Core::ErrorCode::SubmitFailed);
        }

        ++m_SubmitCount;
        // Encoders die here; their command buffers are freed through deferred destruction.
        return Core::Ok();
    }
}
