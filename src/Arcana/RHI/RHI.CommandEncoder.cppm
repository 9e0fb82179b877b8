module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <optional>
#include <span>

export module RHI:CommandEncoder;

import :Device;
import Core;

export namespace RHI
{
    struct ImageBarrier
    {
        VkImage Image = VK_NULL_HANDLE;
        VkImageSubresourceRange Range{VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
        // std::nullopt: prior contents are undefined and need not be preserved.
        std::optional<VkImageLayout> OldLayout;
        VkImageLayout NewLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkAccessFlags2 OldAccess = 0;
        VkAccessFlags2 NewAccess = 0;
    };

    // Recording surface for one primary command buffer. The upload engine only
    // talks to this interface, so recording can be observed without a GPU.
    class ICommandEncoder
    {
    public:
        virtual ~ICommandEncoder() = default;

        ICommandEncoder(const ICommandEncoder&) = delete;
        ICommandEncoder& operator=(const ICommandEncoder&) = delete;
        ICommandEncoder(ICommandEncoder&&) = delete;
        ICommandEncoder& operator=(ICommandEncoder&&) = delete;

        virtual void CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) = 0;
        virtual void CopyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                                       std::span<const VkBufferImageCopy> regions) = 0;
        virtual void CopyImage(VkImage src, VkImageLayout srcLayout, VkImage dst, VkImageLayout dstLayout,
                               std::span<const VkImageCopy> regions) = 0;

        // Inline update: data lives in the command stream. Size must be a multiple
        // of 4 and at most 65536 bytes.
        virtual void UpdateBuffer(VkBuffer dst, VkDeviceSize offset, std::span<const std::byte> data) = 0;

        virtual void GlobalMemoryBarrier(VkPipelineStageFlags2 srcStages, VkAccessFlags2 srcAccess,
                                         VkPipelineStageFlags2 dstStages, VkAccessFlags2 dstAccess) = 0;
        // All barriers share one stage pair and land in one vkCmdPipelineBarrier2.
        virtual void ImageBarriers(VkPipelineStageFlags2 srcStages, VkPipelineStageFlags2 dstStages,
                                   std::span<const ImageBarrier> barriers) = 0;

        virtual void BindComputePipeline(VkPipeline pipeline) = 0;
        virtual void BindComputeDescriptorSets(VkPipelineLayout layout, uint32_t firstSet,
                                               std::span<const VkDescriptorSet> sets) = 0;
        virtual void PushConstants(VkPipelineLayout layout, VkShaderStageFlags stages, uint32_t offset,
                                   std::span<const std::byte> data) = 0;
        virtual void Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) = 0;

        // Finishes recording. Idempotent.
        [[nodiscard]] virtual Core::Result End() = 0;

        // VK_NULL_HANDLE for encoders that do not record into Vulkan.
        [[nodiscard]] virtual VkCommandBuffer GetHandle() const = 0;

    protected:
        ICommandEncoder() = default;
    };

    class VulkanCommandEncoder final : public ICommandEncoder
    {
    public:
        // Takes ownership of `cmd`, which must already be in the recording state.
        VulkanCommandEncoder(VulkanDevice& device, VkCommandPool pool, VkCommandBuffer cmd);
        ~VulkanCommandEncoder() override;

        void CopyBuffer(VkBuffer src, VkBuffer dst, std::span<const VkBufferCopy> regions) override;
        void CopyBufferToImage(VkBuffer src, VkImage dst, VkImageLayout dstLayout,
                               std::span<const VkBufferImageCopy> regions) override;
        void CopyImage(VkImage src, VkImageLayout srcLayout, VkImage dst, VkImageLayout dstLayout,
                       std::span<const VkImageCopy> regions) override;
        void UpdateBuffer(VkBuffer dst, VkDeviceSize offset, std::span<const std::byte> data) override;
        void GlobalMemoryBarrier(VkPipelineStageFlags2 srcStages, VkAccessFlags2 srcAccess,
                                 VkPipelineStageFlags2 dstStages, VkAccessFlags2 dstAccess) override;
        void ImageBarriers(VkPipelineStageFlags2 srcStages, VkPipelineStageFlags2 dstStages,
                           std::span<const ImageBarrier> barriers) override;
        void BindComputePipeline(VkPipeline pipeline) override;
        void BindComputeDescriptorSets(VkPipelineLayout layout, uint32_t firstSet,
                                       std::span<const VkDescriptorSet> sets) override;
        void PushConstants(VkPipelineLayout layout, VkShaderStageFlags stages, uint32_t offset,
                           std::span<const std::byte> data) override;
        void Dispatch(uint32_t groupsX, uint32_t groupsY, uint32_t groupsZ) override;

        [[nodiscard]] Core::Result End() override;
        [[nodiscard]] VkCommandBuffer GetHandle() const override { return m_Cmd; }

    private:
        VulkanDevice& m_Device;
        VkCommandPool m_Pool = VK_NULL_HANDLE;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        bool m_Ended = false;
    };
}
