module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

export module RHI:Uploader;

import :CommandEncoder;
import :CommandQueue;
import :Formats;
import :Staging;
import :Transcoder;
import :Types;
import Core;

export namespace RHI
{
    struct UploaderConfig
    {
        // Direct buffer uploads up to this size go inline into the command stream.
        VkDeviceSize InlineUpdateLimit = 16384;
    };

    // Keeps a queued upload's destination alive until the flush that writes it
    // has been submitted. Any shared_ptr converts to it.
    using ResourceOwner = std::shared_ptr<const void>;

    // A buffer handle plus the object that owns it.
    struct BufferTarget
    {
        VkBuffer Buffer = VK_NULL_HANDLE;
        ResourceOwner Owner;
    };

    struct ImageUploadDesc
    {
        ImageRegion Region{};
        // Owner of Region.Image. Required for queued uploads, unused by UploadImageWith.
        ResourceOwner Owner;
        // std::nullopt: first use, prior contents are discarded.
        std::optional<VkImageLayout> OldLayout;
        VkImageLayout NewLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        VkAccessFlags2 OldAccess = 0;
        VkAccessFlags2 NewAccess = AccessAll;
        VkFormat SourceFormat = VK_FORMAT_UNDEFINED;
        VkFormat DestinationFormat = VK_FORMAT_UNDEFINED;
        // Source row stride / slice height in texels. 0 = tightly packed.
        uint32_t RowLength = 0;
        uint32_t ImageHeight = 0;
    };

    struct BufferUpload
    {
        std::unique_ptr<StagingBuffer> Staging;
        BufferTarget Destination;
        VkDeviceSize Offset = 0;
        VkAccessFlags2 OldAccess = AccessAll;
        VkAccessFlags2 NewAccess = AccessAll;
    };

    struct ImageUpload
    {
        std::unique_ptr<StagingBuffer> Staging;
        ImageUploadDesc Desc;
    };

    // Pending GPU writes plus the code that turns them into commands.
    //
    // Queued uploads accumulate until Flush(), which records them into one
    // command buffer behind two barriers per phase (buffers, then images) and
    // submits it. The *With variants record straight into a caller's encoder.
    //
    // Single recording thread. Nothing here waits on the GPU.
    class Uploader
    {
    public:
        Uploader(IStagingAllocator& staging, IPixelTranscoder& transcoder, UploaderConfig config = {});

        Uploader(const Uploader&) = delete;
        Uploader& operator=(const Uploader&) = delete;

        // Allocate a staging buffer for `data` and queue it. Empty data is a no-op.
        // Queued uploads hold their destination's owner and reject a null one.
        [[nodiscard]] Core::Result UploadBuffer(const BufferTarget& destination, VkDeviceSize offset,
                                                std::span<const std::byte> data,
                                                VkAccessFlags2 oldAccess = AccessAll,
                                                VkAccessFlags2 newAccess = AccessAll);
        [[nodiscard]] Core::Result UploadImage(const ImageUploadDesc& desc, std::span<const std::byte> data);

        [[nodiscard]] Core::Result EnqueueBufferUpload(std::unique_ptr<StagingBuffer> staging,
                                                       const BufferTarget& destination, VkDeviceSize offset,
                                                       VkAccessFlags2 oldAccess, VkAccessFlags2 newAccess);
        // Rejects anything the flush could not record, transcoder limits included.
        [[nodiscard]] Core::Result EnqueueImageUpload(std::unique_ptr<StagingBuffer> staging,
                                                      const ImageUploadDesc& desc);

        // `data.size()` must be a multiple of 4.
        [[nodiscard]] Core::Result UploadBufferWith(VkBuffer destination, VkDeviceSize offset,
                                                    std::span<const std::byte> data, ICommandEncoder& encoder);
        [[nodiscard]] Core::Result UploadImageWith(const ImageUploadDesc& desc, std::span<const std::byte> data,
                                                   ICommandEncoder& encoder);

        // On failure nothing is submitted and every queued upload stays queued.
        [[nodiscard]] Core::Result Flush(ICommandQueue& queue);

        [[nodiscard]] size_t GetPendingBufferUploads() const { return m_BufferUploads.size(); }
        [[nodiscard]] size_t GetPendingImageUploads() const { return m_ImageUploads.size(); }
        [[nodiscard]] bool HasPendingUploads() const { return !m_BufferUploads.empty() || !m_ImageUploads.empty(); }
        [[nodiscard]] uint64_t GetFlushCount() const { return m_FlushCount; }
        [[nodiscard]] const UploaderConfig& GetConfig() const { return m_Config; }

    private:
        [[nodiscard]] Core::Expected<UploadPath> ValidateImageUpload(const ImageUploadDesc& desc,
                                                                     VkDeviceSize payloadSize) const;
        [[nodiscard]] Core::Expected<std::unique_ptr<StagingBuffer>> StageImageData(
            const ImageUploadDesc& desc, std::span<const std::byte> data);

        void RecordBufferPhase(ICommandEncoder& encoder) const;
        [[nodiscard]] Core::Result RecordImagePhase(ICommandEncoder& encoder);
        [[nodiscard]] Core::Result RecordImageTransfer(const ImageUploadDesc& desc, const StagingBuffer& staging,
                                                       ICommandEncoder& encoder);

        IStagingAllocator& m_Staging;
        IPixelTranscoder& m_Transcoder;
        UploaderConfig m_Config;

        std::vector<BufferUpload> m_BufferUploads;
        std::vector<ImageUpload> m_ImageUploads;
        uint64_t m_FlushCount = 0;
    };
}
