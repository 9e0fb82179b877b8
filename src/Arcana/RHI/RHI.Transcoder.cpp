module;
#include "RHI.Vulkan.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>

module RHI:Transcoder.Impl;

import :Transcoder;
import :CommandEncoder;
import :ComputePipeline;
import :Descriptors;
import :Device;
import :Formats;
import :Image;
import :Shader;
import :Staging;
import :Types;
import Core;

namespace RHI
{
    namespace
    {
        // Mirrors the OffsetStride block in rgb2rgba.comp.
        struct OffsetStride
        {
            int32_t OffsetX;
            int32_t OffsetY;
            uint32_t RowLength;
        };
        static_assert(sizeof(OffsetStride) == 12);

        // Texel buffer views are not owned by any RHI object; this hands the
        // view to deferred destruction on every exit path.
        class ScopedBufferView
        {
        public:
            ScopedBufferView(VulkanDevice& device, VkBufferView view) : m_Device(device), m_View(view) {}
            ~ScopedBufferView()
            {
                if (!m_View) return;
                VkDevice logicalDevice = m_Device.GetLogicalDevice();
                VkBufferView view = m_View;
                m_Device.SafeDestroy([logicalDevice, view]()
                {
                    vkDestroyBufferView(logicalDevice, view, nullptr);
                });
            }

            ScopedBufferView(const ScopedBufferView&) = delete;
            ScopedBufferView& operator=(const ScopedBufferView&) = delete;

            [[nodiscard]] VkBufferView Get() const { return m_View; }

        private:
            VulkanDevice& m_Device;
            VkBufferView m_View;
        };
    }

    Core::Result ValidateTranscodeRegion(const ImageRegion& region)
    {
        // 2D, one slice, one layer.
        if (region.Extent.depth != 1 || region.Offset.z != 0 || region.ImageExtent.depth > 1 ||
            region.Subresource.layerCount != 1)
        {
            Core::Log::Error("Transcode: only single-layer 2D regions are supported (depth {}, {} layers).",
                             region.Extent.depth, region.Subresource.layerCount);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        const bool fits = region.Offset.x >= 0 && region.Offset.y >= 0 &&
                          static_cast<uint64_t>(region.Offset.x) + region.Extent.width <= region.ImageExtent.width &&
                          static_cast<uint64_t>(region.Offset.y) + region.Extent.height <= region.ImageExtent.height;
        if (region.Extent.width == 0 || region.Extent.height == 0 || !fits)
        {
            Core::Log::Error("Transcode: region {}x{} at ({}, {}) does not fit a {}x{} image.",
                             region.Extent.width, region.Extent.height, region.Offset.x, region.Offset.y,
                             region.ImageExtent.width, region.ImageExtent.height);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        return Core::Ok();
    }

    Core::Expected<std::unique_ptr<Rgb2RgbaTranscoder>> Rgb2RgbaTranscoder::Create(
        VulkanDevice& device, const std::filesystem::path& shaderPath)
    {
        ShaderModule shader(device, shaderPath, ShaderStage::Compute);
        if (!shader.IsValid())
        {
            Core::Log::Error("Rgb2RgbaTranscoder: compute shader unavailable at '{}' ({})",
                             shaderPath.string(), Core::ErrorCodeToString(shader.GetLoadError()));
            return std::unexpected(shader.GetLoadError());
        }

        const std::array<VkDescriptorSetLayoutBinding, 2> bindings{{
            {0, VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER, 1, VK_SHADER_STAGE_COMPUTE_BIT, nullptr},
            {1, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, 1, VK_SHADER_STAGE_COMPUTE_BIT, nullptr},
        }};
        auto layout = std::make_unique<DescriptorLayout>(device, bindings);
        if (!layout->IsValid()) return std::unexpected(Core::ErrorCode::OutOfMemory);

        const std::array<VkDescriptorPoolSize, 2> poolSizes{{
            {VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER, InitialDescriptorSets},
            {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, InitialDescriptorSets},
        }};
        auto pool = std::make_unique<DescriptorPool>(device, poolSizes, InitialDescriptorSets);
        if (!pool->IsValid()) return std::unexpected(Core::ErrorCode::OutOfMemory);

        auto pipeline = ComputePipelineBuilder(device)
                            .SetShader(shader)
                            .AddDescriptorSetLayout(layout->GetHandle())
                            .AddPushConstantRange({VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(OffsetStride)})
                            .Build();
        if (!pipeline)
            return std::unexpected(pipeline.error());

        Core::Log::Info("RGB->RGBA transcoder initialized.");
        return std::make_unique<Rgb2RgbaTranscoder>(device, std::move(layout), std::move(pool), std::move(*pipeline));
    }

    Rgb2RgbaTranscoder::Rgb2RgbaTranscoder(VulkanDevice& device,
                                           std::unique_ptr<DescriptorLayout> layout,
                                           std::unique_ptr<DescriptorPool> pool,
                                           std::unique_ptr<ComputePipeline> pipeline)
        : m_Device(device), m_Layout(std::move(layout)), m_Pool(std::move(pool)), m_Pipeline(std::move(pipeline))
    {
    }

    Rgb2RgbaTranscoder::~Rgb2RgbaTranscoder() = default;

    Core::Result Rgb2RgbaTranscoder::Validate(const ImageRegion& region,
                                              VkFormat sourceFormat,
                                              VkFormat destinationFormat,
                                              uint32_t rowLength,
                                              uint32_t imageHeight,
                                              VkDeviceSize payloadSize) const
    {
        if (!IsSupportedConversion(sourceFormat, destinationFormat))
        {
            Core::Log::Error("Rgb2RgbaTranscoder: unsupported conversion {} -> {}",
                             static_cast<int>(sourceFormat), static_cast<int>(destinationFormat));
            return Core::Err(Core::ErrorCode::UnsupportedConversion);
        }

        if (auto fits = ValidateTranscodeRegion(region); !fits)
            return fits;

        const auto required = RequiredSourceBytes(sourceFormat, region.Extent, 1, rowLength, imageHeight);
        if (!required || *required > payloadSize)
        {
            Core::Log::Error("Rgb2RgbaTranscoder: source holds {} bytes, region needs {}.",
                             payloadSize, required.value_or(0));
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // The texel view covers the whole staging allocation.
        const VkDeviceSize capacity = AlignUp(payloadSize, StagingAlignment);
        if (capacity > m_Device.GetLimits().maxTexelBufferElements)
        {
            Core::Log::Error("Rgb2RgbaTranscoder: {} source bytes exceed maxTexelBufferElements ({}).",
                             capacity, m_Device.GetLimits().maxTexelBufferElements);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }
        return Core::Ok();
    }

    Core::Result Rgb2RgbaTranscoder::UploadSynchronized(const ImageRegion& region,
                                                        const StagingBuffer& source,
                                                        VkFormat sourceFormat,
                                                        VkFormat destinationFormat,
                                                        uint32_t rowLength,
                                                        uint32_t imageHeight,
                                                        ICommandEncoder& encoder)
    {
        if (auto valid = Validate(region, sourceFormat, destinationFormat, rowLength, imageHeight,
                                  source.GetPayloadSize()); !valid)
            return valid;

        if (source.GetUsage() != StagingUsage::UniformTexel)
        {
            Core::Log::Error("Rgb2RgbaTranscoder: staging buffer was not allocated for texel reads.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // Binding 0: the staging bytes, one R8 texel per byte.
        VkBufferViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_BUFFER_VIEW_CREATE_INFO;
        viewInfo.buffer = source.GetHandle();
        viewInfo.format = VK_FORMAT_R8_UNORM;
        viewInfo.offset = 0;
        viewInfo.range = VK_WHOLE_SIZE;

        VkBufferView rawView = VK_NULL_HANDLE;
        VkResult result = vkCreateBufferView(m_Device.GetLogicalDevice(), &viewInfo, nullptr, &rawView);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Rgb2RgbaTranscoder: texel buffer view creation failed: {}", VkResultToString(result));
            return Core::Err(ToErrorCode(result));
        }
        ScopedBufferView sourceView(m_Device, rawView);

        // Binding 1: intermediate storage image, same extent as the destination.
        auto intermediate = std::make_unique<VulkanImage>(m_Device, ImageInfo{
            .Extent = {region.ImageExtent.width, region.ImageExtent.height, 1},
            .Format = VK_FORMAT_R8G8B8A8_UNORM,
            .Usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT,
        });
        if (!intermediate->IsValid()) return Core::Err(Core::ErrorCode::OutOfDeviceMemory);

        auto set = m_Pool->Allocate(m_Layout->GetHandle());
        if (!set) return Core::Err(set.error());

        VkDescriptorImageInfo storageInfo{};
        storageInfo.imageView = intermediate->GetView();
        storageInfo.imageLayout = VK_IMAGE_LAYOUT_GENERAL;

        std::array<VkWriteDescriptorSet, 2> writes{};
        writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[0].dstSet = set->Set;
        writes[0].dstBinding = 0;
        writes[0].descriptorCount = 1;
        writes[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER;
        writes[0].pTexelBufferView = &rawView;

        writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[1].dstSet = set->Set;
        writes[1].dstBinding = 1;
        writes[1].descriptorCount = 1;
        writes[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
        writes[1].pImageInfo = &storageInfo;

        vkUpdateDescriptorSets(m_Device.GetLogicalDevice(), static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);

        const VkImageSubresourceRange intermediateRange = intermediate->GetFullRange();

        ImageBarrier toGeneral{};
        toGeneral.Image = intermediate->GetHandle();
        toGeneral.Range = intermediateRange;
        toGeneral.OldLayout = std::nullopt;
        toGeneral.NewLayout = VK_IMAGE_LAYOUT_GENERAL;
        toGeneral.OldAccess = 0;
        toGeneral.NewAccess = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
        encoder.ImageBarriers(VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                              std::span(&toGeneral, 1));

        const VkDescriptorSet sets[] = {set->Set};
        encoder.BindComputePipeline(m_Pipeline->GetHandle());
        encoder.BindComputeDescriptorSets(m_Pipeline->GetLayout(), 0, sets);

        const OffsetStride push{region.Offset.x, region.Offset.y, rowLength};
        encoder.PushConstants(m_Pipeline->GetLayout(), VK_SHADER_STAGE_COMPUTE_BIT, 0,
                              std::as_bytes(std::span(&push, 1)));
        encoder.Dispatch(region.Extent.width, region.Extent.height, region.Extent.depth);

        ImageBarrier toTransferSrc{};
        toTransferSrc.Image = intermediate->GetHandle();
        toTransferSrc.Range = intermediateRange;
        toTransferSrc.OldLayout = VK_IMAGE_LAYOUT_GENERAL;
        toTransferSrc.NewLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        toTransferSrc.OldAccess = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
        toTransferSrc.NewAccess = VK_ACCESS_2_TRANSFER_READ_BIT;
        encoder.ImageBarriers(VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                              std::span(&toTransferSrc, 1));

        VkImageCopy copy{};
        copy.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        copy.srcOffset = region.Offset;
        copy.dstSubresource = region.Subresource;
        copy.dstOffset = region.Offset;
        copy.extent = region.Extent;
        encoder.CopyImage(intermediate->GetHandle(), VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                          region.Image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, std::span(&copy, 1));

        // The set, the view and the intermediate image all retire with this frame slot.
        m_Pool->Free(*set);
        ++m_DispatchCount;
        return Core::Ok();
    }
}
