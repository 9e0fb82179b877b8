module;
#include "RHI.Vulkan.hpp"
#include <cassert>
#include <cstddef>
#include <span>
#include <vector>

module RHI:CommandEncoder.Impl;

import :CommandEncoder;
import :Types;
import Core;

namespace RHI
{
    VulkanCommandEncoder::VulkanCommandEncoder(VulkanDevice& device, VkCommandPool pool, VkCommandBuffer cmd)
        : m_Device(device), m_Pool(pool), m_Cmd(cmd)
    {
    }

    VulkanCommandEncoder::~VulkanCommandEncoder()
    {
        if (!m_Cmd) return;

        // The buffer may still be executing; free it once its frame slot retires.
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkCommandPool pool = m_Pool;
        VkCommandBuffer cmd = m_Cmd;
        m_Device.SafeDestroy([logicalDevice, pool, cmd]()
        {
            vkFreeCommandBuffers(logicalDevice, pool, 1, &cmd);
        });
    }

    void VulkanCommandEncoder::CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions)
    {
        if (regions.empty()) return;
        vkCmdCopyBuffer(m_Cmd, src, dst, static_cast<uint32_t>(regions.size()), regions.data());
    }

    void VulkanCommandEncoder::CopyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                                                 std::span<const VkBufferImageCopy> regions)
    {
        if (regions.empty()) return;
        vkCmdCopyBufferToImage(m_Cmd, src, dst, dstLayout, static_cast<uint32_t>(regions.size()), regions.data());
    }

    void VulkanCommandEncoder::CopyImage(VkImage src, VkImageLayout srcLayout, VkImage dst, VkImageLayout dstLayout,
                                         std::span<const VkImageCopy> regions)
    {
        if (regions.empty()) return;
        vkCmdCopyImage(m_Cmd, src, srcLayout, dst, dstLayout, static_cast<uint32_t>(regions.size()), regions.data());
    }

    void VulkanCommandEncoder::UpdateBuffer(VkBuffer dst, VkDeviceSize offset, std::span<const std::byte> data)
    {
        assert(data.size() % 4 == 0 && data.size() <= 65536);
        if (data.empty()) return;
        vkCmdUpdateBuffer(m_Cmd, dst, offset, data.size(), data.data());
    }

    void VulkanCommandEncoder::GlobalMemoryBarrier(VkPipelineStageFlags2 srcStages, VkAccessFlags2 srcAccess,
                                                   VkPipelineStageFlags2 dstStages, VkAccessFlags2 dstAccess)
    {
        VkMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        barrier.srcStageMask = srcStages;
        barrier.srcAccessMask = srcAccess;
        barrier.dstStageMask = dstStages;
        barrier.dstAccessMask = dstAccess;

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.memoryBarrierCount = 1;
        depInfo.pMemoryBarriers = &barrier;

        vkCmdPipelineBarrier2(m_Cmd, &depInfo);
    }

    void VulkanCommandEncoder::ImageBarriers(VkPipelineStageFlags2 srcStages, VkPipelineStageFlags2 dstStages,
                                             std::span<const ImageBarrier> barriers)
    {
        if (barriers.empty()) return;

        std::vector<VkImageMemoryBarrier2> vkBarriers;
        vkBarriers.reserve(barriers.size());

        for (const ImageBarrier& b : barriers)
        {
            VkImageMemoryBarrier2 barrier{};
            barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
            barrier.srcStageMask = srcStages;
            barrier.srcAccessMask = b.OldAccess;
            barrier.dstStageMask = dstStages;
            barrier.dstAccessMask = b.NewAccess;
            barrier.oldLayout = b.OldLayout.value_or(VK_IMAGE_LAYOUT_UNDEFINED);
            barrier.newLayout = b.NewLayout;
            barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.image = b.Image;
            barrier.subresourceRange = b.Range;
            vkBarriers.push_back(barrier);
        }

        VkDependencyInfo depInfo{};
        depInfo.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        depInfo.imageMemoryBarrierCount = static_cast<uint32_t>(vkBarriers.size());
        depInfo.pImageMemoryBarriers = vkBarriers.data();

        vkCmdPipelineBarrier2(m_Cmd, &depInfo);
    }

    void VulkanCommandEncoder::BindComputePipeline(VkPipeline pipeline)
    {
        vkCmdBindPipeline(m_Cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline);
    }

    void VulkanCommandEncoder::BindComputeDescriptorSets(VkPipelineLayout layout, uint32_t firstSet,
                                                         std::span<const VkDescriptorSet> sets)
    {
        vkCmdBindDescriptorSets(m_Cmd, VK_PIPELINE_BIND_POINT_COMPUTE, layout, firstSet,
                                static_cast<uint32_t>(sets.size()), sets.data(), 0, nullptr);
    }

    void VulkanCommandEncoder::PushConstants(VkPipelineLayout layout, VkShaderStageFlags stages, uint32_t offset,
                                             std::span<const std::byte> data)
    {
        vkCmdPushConstants(m_Cmd, layout, stages, offset, static_cast<uint32_t>(data.size()), data.data());
    }

    void VulkanCommandEncoder::Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ)
    {
        vkCmdDispatch(m_Cmd, groupsX, groupsY, groupsZ);
    }

    Core::Result VulkanCommandEncoder::End()
    {
        if (m_Ended) return Core::Ok();

        VkResult result = vkEndCommandBuffer(m_Cmd);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("vkEndCommandBuffer failed: {}", VkResultToString(result));
            return Core::Err(ToErrorCode(result));
        }
        m_Ended = true;
        return Core::Ok();
    }
}
