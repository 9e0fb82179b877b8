module;
#include "RHI.Vulkan.hpp"
#include <cassert>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <vector>

module RHI:Uploader.Impl;

import :Uploader;
import :CommandEncoder;
import :CommandQueue;
import :Formats;
import :Staging;
import :Transcoder;
import :Types;
import Core;

namespace RHI
{
    namespace
    {
        [[nodiscard]] VkImageSubresourceRange ToRange(const VkImageSubresourceLayers& layers)
        {
            return {layers.aspectMask, layers.mipLevel, 1, layers.baseArrayLayer, layers.layerCount};
        }

        [[nodiscard]] ImageBarrier EnterTransfer(const ImageUploadDesc& desc)
        {
            ImageBarrier barrier{};
            barrier.Image = desc.Region.Image;
            barrier.Range = ToRange(desc.Region.Subresource);
            barrier.OldLayout = desc.OldLayout;
            barrier.NewLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
            barrier.OldAccess = desc.OldAccess;
            barrier.NewAccess = VK_ACCESS_2_TRANSFER_WRITE_BIT;
            return barrier;
        }

        [[nodiscard]] ImageBarrier ExitTransfer(const ImageUploadDesc& desc)
        {
            ImageBarrier barrier{};
            barrier.Image = desc.Region.Image;
            barrier.Range = ToRange(desc.Region.Subresource);
            barrier.OldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
            barrier.NewLayout = desc.NewLayout;
            barrier.OldAccess = VK_ACCESS_2_TRANSFER_WRITE_BIT;
            barrier.NewAccess = desc.NewAccess;
            return barrier;
        }

        // TOP_OF_PIPE cannot carry access bits under sync2.
        [[nodiscard]] VkPipelineStageFlags2 EnterStage(VkAccessFlags2 oldAccess)
        {
            return oldAccess != 0 ? VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT : VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
        }
    }

    Uploader::Uploader(IStagingAllocator& staging, IPixelTranscoder& transcoder, UploaderConfig config)
        : m_Staging(staging), m_Transcoder(transcoder), m_Config(config)
    {
        // vkCmdUpdateBuffer limit.
        assert(m_Config.InlineUpdateLimit <= 65536);
    }

    Core::Result Uploader::UploadBuffer(const BufferTarget& destination, VkDeviceSize offset,
                                        std::span<const std::byte> data,
                                        VkAccessFlags2 oldAccess, VkAccessFlags2 newAccess)
    {
        if (data.empty()) return Core::Ok();

        if (!destination.Buffer || !destination.Owner)
        {
            Core::Log::Error("Uploader: queued buffer upload without an owned destination.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        auto staging = m_Staging.AllocateAndFill(data, StagingUsage::TransferSrc);
        if (!staging) return Core::Err(staging.error());

        return EnqueueBufferUpload(std::move(*staging), destination, offset, oldAccess, newAccess);
    }

    Core::Result Uploader::UploadImage(const ImageUploadDesc& desc, std::span<const std::byte> data)
    {
        if (data.empty()) return Core::Ok();

        if (!desc.Owner)
        {
            Core::Log::Error("Uploader: queued image upload without an owner for its image.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        auto staging = StageImageData(desc, data);
        if (!staging) return Core::Err(staging.error());

        return EnqueueImageUpload(std::move(*staging), desc);
    }

    Core::Result Uploader::EnqueueBufferUpload(std::unique_ptr<StagingBuffer> staging,
                                               const BufferTarget& destination, VkDeviceSize offset,
                                               VkAccessFlags2 oldAccess, VkAccessFlags2 newAccess)
    {
        if (!staging) return Core::Err(Core::ErrorCode::InvalidArgument);

        if (!destination.Buffer || !destination.Owner)
        {
            Core::Log::Error("Uploader: queued buffer upload without an owned destination.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_BufferUploads.push_back(BufferUpload{
            .Staging = std::move(staging),
            .Destination = destination,
            .Offset = offset,
            .OldAccess = oldAccess,
            .NewAccess = newAccess,
        });
        return Core::Ok();
    }

    Core::Result Uploader::EnqueueImageUpload(std::unique_ptr<StagingBuffer> staging, const ImageUploadDesc& desc)
    {
        if (!staging) return Core::Err(Core::ErrorCode::InvalidArgument);

        if (!desc.Owner)
        {
            Core::Log::Error("Uploader: queued image upload without an owner for its image.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        auto path = ValidateImageUpload(desc, staging->GetPayloadSize());
        if (!path) return Core::Err(path.error());

        if (*path == UploadPath::Transcode && staging->GetUsage() != StagingUsage::UniformTexel)
        {
            Core::Log::Error("Uploader: transcoded uploads need a UniformTexel staging buffer.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_ImageUploads.push_back(ImageUpload{.Staging = std::move(staging), .Desc = desc});
        return Core::Ok();
    }

    Core::Result Uploader::UploadBufferWith(VkBuffer destination, VkDeviceSize offset,
                                            std::span<const std::byte> data, ICommandEncoder& encoder)
    {
        assert((data.size() & 3) == 0 && "Buffer upload size must be a multiple of 4");

        if (data.empty()) return Core::Ok();

        if (data.size() <= m_Config.InlineUpdateLimit)
        {
            encoder.UpdateBuffer(destination, offset, data);
            return Core::Ok();
        }

        auto staging = m_Staging.AllocateAndFill(data, StagingUsage::TransferSrc);
        if (!staging) return Core::Err(staging.error());

        const VkBufferCopy copy{0, offset, (*staging)->GetPayloadSize()};
        encoder.CopyBuffer((*staging)->GetHandle(), destination, std::span(&copy, 1));
        // The staging buffer is released here; its memory lives on in the
        // deletion queue until this frame slot retires.
        return Core::Ok();
    }

    Core::Result Uploader::UploadImageWith(const ImageUploadDesc& desc, std::span<const std::byte> data,
                                           ICommandEncoder& encoder)
    {
        if (data.empty()) return Core::Ok();

        auto staging = StageImageData(desc, data);
        if (!staging) return Core::Err(staging.error());

        const ImageBarrier enter = EnterTransfer(desc);
        encoder.ImageBarriers(EnterStage(desc.OldAccess), VK_PIPELINE_STAGE_2_TRANSFER_BIT, std::span(&enter, 1));

        if (auto recorded = RecordImageTransfer(desc, **staging, encoder); !recorded)
            return recorded;

        const ImageBarrier exit = ExitTransfer(desc);
        encoder.ImageBarriers(VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                              std::span(&exit, 1));
        return Core::Ok();
    }

    Core::Result Uploader::Flush(ICommandQueue& queue)
    {
        if (!HasPendingUploads()) return Core::Ok();

        auto encoder = queue.CreateEncoder();
        if (!encoder)
        {
            Core::Log::Error("Uploader: no command encoder for flush ({}).", Core::ErrorCodeToString(encoder.error()));
            return Core::Err(encoder.error());
        }

        if (!m_BufferUploads.empty())
            RecordBufferPhase(**encoder);

        if (!m_ImageUploads.empty())
        {
            if (auto recorded = RecordImagePhase(**encoder); !recorded)
            {
                Core::Log::Error("Uploader: flush aborted ({}); {} buffer and {} image uploads remain queued.",
                                 Core::ErrorCodeToString(recorded.error()),
                                 m_BufferUploads.size(), m_ImageUploads.size());
                return recorded;
            }
        }

        if (auto submitted = queue.SubmitOne(std::move(*encoder)); !submitted)
        {
            Core::Log::Error("Uploader: flush submission failed ({}); {} buffer and {} image uploads remain queued.",
                             Core::ErrorCodeToString(submitted.error()),
                             m_BufferUploads.size(), m_ImageUploads.size());
            return submitted;
        }

        Core::Log::Debug("Uploader: flushed {} buffer and {} image uploads.",
                         m_BufferUploads.size(), m_ImageUploads.size());

        m_BufferUploads.clear();
        m_ImageUploads.clear();
        ++m_FlushCount;
        return Core::Ok();
    }

    Core::Expected<UploadPath> Uploader::ValidateImageUpload(const ImageUploadDesc& desc,
                                                             VkDeviceSize payloadSize) const
    {
        auto path = ClassifyUpload(desc.SourceFormat, desc.DestinationFormat);
        if (!path)
        {
            Core::Log::Error("Uploader: cannot upload format {} into format {} ({}).",
                             static_cast<int>(desc.SourceFormat), static_cast<int>(desc.DestinationFormat),
                             Core::ErrorCodeToString(path.error()));
            return path;
        }

        if (desc.Region.Image == VK_NULL_HANDLE)
        {
            Core::Log::Error("Uploader: image upload without a destination image.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        // Block-compressed formats have no known texel size; the copy is trusted as-is.
        const auto required = RequiredSourceBytes(desc.SourceFormat, desc.Region.Extent,
                                                  desc.Region.Subresource.layerCount,
                                                  desc.RowLength, desc.ImageHeight);
        if (required && *required > payloadSize)
        {
            Core::Log::Error("Uploader: image upload carries {} bytes, region needs {}.", payloadSize, *required);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        if (*path == UploadPath::Transcode)
        {
            if (auto valid = m_Transcoder.Validate(desc.Region, desc.SourceFormat, desc.DestinationFormat,
                                                   desc.RowLength, desc.ImageHeight, payloadSize); !valid)
                return std::unexpected(valid.error());
        }

        return path;
    }
}

    Core::Expected<std::unique_ptr<StagingBuffer>> Uploader::StageImageData(const ImageUploadDesc& desc,
                                                                            std::span<const std::byte> data)
    {
        auto path = ValidateImageUpload(desc, data.size());
        if (!path) return std::unexpected(path.error());

        const StagingUsage usage = *path == UploadPath::Copy ? StagingUsage::TransferSrc : StagingUsage::UniformTexel;
        return m_Staging.AllocateAndFill(data, usage);
    }

    void Uploader::RecordBufferPhase(ICommandEncoder& encoder) const
    {
        VkAccessFlags2 oldAccess = 0;
        VkAccessFlags2 newAccess = 0;
        for (const BufferUpload& upload : m_BufferUploads)
        {
            oldAccess |= upload.OldAccess;
            newAccess |= upload.NewAccess;
        }

        encoder.GlobalMemoryBarrier(VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, oldAccess,
                                    VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT);

        for (const BufferUpload& upload : m_BufferUploads)
        {
            const VkBufferCopy copy{0, upload.Offset, upload.Staging->GetPayloadSize()};
            encoder.CopyBuffer(upload.Staging->GetHandle(), upload.Destination.Buffer, std::span(&copy, 1));
        }

        encoder.GlobalMemoryBarrier(VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                                    VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, newAccess);
    }

    Core::Result Uploader::RecordImagePhase(ICommandEncoder& encoder)
    {
        std::vector<ImageBarrier> barriers;
        barriers.reserve(m_ImageUploads.size());

        VkAccessFlags2 oldAccess = 0;
        for (const ImageUpload& upload : m_ImageUploads)
        {
            barriers.push_back(EnterTransfer(upload.Desc));
            oldAccess |= upload.Desc.OldAccess;
        }
        encoder.ImageBarriers(EnterStage(oldAccess), VK_PIPELINE_STAGE_2_TRANSFER_BIT, barriers);

        for (const ImageUpload& upload : m_ImageUploads)
        {
            if (auto recorded = RecordImageTransfer(upload.Desc, *upload.Staging, encoder); !recorded)
                return recorded;
        }

        barriers.clear();
        for (const ImageUpload& upload : m_ImageUploads)
            barriers.push_back(ExitTransfer(upload.Desc));
        encoder.ImageBarriers(VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, barriers);

        return Core::Ok();
    }

    Core::Result Uploader::RecordImageTransfer(const ImageUploadDesc& desc, const StagingBuffer& staging,
                                               ICommandEncoder& encoder)
    {
        if (desc.SourceFormat != desc.DestinationFormat)
        {
            return m_Transcoder.UploadSynchronized(desc.Region, staging, desc.SourceFormat, desc.DestinationFormat,
                                                   desc.RowLength, desc.ImageHeight, encoder);
        }

        VkBufferImageCopy copy{};
        copy.bufferOffset = 0;
        copy.bufferRowLength = desc.RowLength;
        copy.bufferImageHeight = desc.ImageHeight;
        copy.imageSubresource = desc.Region.Subresource;
        copy.imageOffset = desc.Region.Offset;
        copy.imageExtent = desc.Region.Extent;
        encoder.CopyBufferToImage(staging.GetHandle(), desc.Region.Image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                  std::span(&copy, 1));
        return Core::Ok();
    }
}
