module;
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "RHI/RHI.Vulkan.hpp"

export module Arcana.Graphics;

import Core;
import RHI;
import Arcana.Texture;

export namespace Arcana
{
    struct GraphicsConfig
    {
        std::string AppName = "Arcana";
        bool EnableValidation = true;
        // Where rgb2rgba.comp.spv lives. Empty = Core::Filesystem::GetShaderDirectory().
        std::filesystem::path ShaderDirectory{};
        RHI::UploaderConfig Uploads{};
    };

    // Owns the headless GPU stack and the upload engine on top of it.
    //
    // Construction order: context, device, command queue, staging allocator,
    // transcoder, uploader. Destruction waits for the device to go idle and
    // drains every deferred deletion before the device goes away.
    //
    // One recording thread at a time.
    class Graphics
    {
        // Only Create() can name this, so only Create() can construct.
        struct CreateToken
        {
            explicit CreateToken() = default;
        };

    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<Graphics>> Create(const GraphicsConfig& config = {});

        explicit Graphics(CreateToken) {}
        ~Graphics();

        Graphics(const Graphics&) = delete;
        Graphics& operator=(const Graphics&) = delete;
        Graphics(Graphics&&) = delete;
        Graphics& operator=(Graphics&&) = delete;

        // --- Accessors (non-owning references) ---
        [[nodiscard]] RHI::VulkanContext& GetContext() const { return *m_Context; }
        [[nodiscard]] RHI::VulkanDevice& GetDevice() const { return *m_Device; }
        [[nodiscard]] RHI::VulkanCommandQueue& GetQueue() const { return *m_Queue; }
        [[nodiscard]] RHI::VulkanStagingAllocator& GetStagingAllocator() const { return *m_Staging; }
        [[nodiscard]] RHI::Rgb2RgbaTranscoder& GetTranscoder() const { return *m_Transcoder; }
        [[nodiscard]] RHI::Uploader& GetUploader() const { return *m_Uploader; }

        // --- Uploads ---
        // Queued; `destination` stays alive until the flush that writes it.
        [[nodiscard]] Core::Result UploadBuffer(const std::shared_ptr<RHI::VulkanBuffer>& destination,
                                                VkDeviceSize offset, std::span<const std::byte> data);
        [[nodiscard]] Core::Result UploadBufferWith(VkBuffer destination, VkDeviceSize offset,
                                                    std::span<const std::byte> data,
                                                    RHI::ICommandEncoder& encoder);
        // `desc.Owner` must own `desc.Region.Image`.
        [[nodiscard]] Core::Result UploadImage(const RHI::ImageUploadDesc& desc, std::span<const std::byte> data);
        [[nodiscard]] Core::Result UploadImageWith(const RHI::ImageUploadDesc& desc,
                                                   std::span<const std::byte> data,
                                                   RHI::ICommandEncoder& encoder);

        // Records and submits everything queued so far.
        [[nodiscard]] Core::Result FlushUploads();

        // --- Static resources ---
        // Device-local image holding `data` (in `sourceFormat`) once the next
        // flush has executed. Left in `layout`.
        [[nodiscard]] Core::Expected<std::shared_ptr<RHI::VulkanImage>> CreateImageStatic(
            RHI::ImageInfo info, VkImageLayout layout, VkFormat sourceFormat, std::span<const std::byte> data);
        [[nodiscard]] Core::Expected<std::shared_ptr<RHI::VulkanBuffer>> CreateFastBufferStatic(
            RHI::BufferInfo info, std::span<const std::byte> data);

        // 1x1 opaque white RGBA8, for consumers whose own texture failed to load.
        [[nodiscard]] Core::Expected<Texture> CreateDefaultTexture();

        // --- Submission ---
        [[nodiscard]] Core::Expected<std::unique_ptr<RHI::ICommandEncoder>> CreateEncoder();
        // Flushes pending uploads first, so `encoders` observe them.
        [[nodiscard]] Core::Result Submit(std::vector<std::unique_ptr<RHI::ICommandEncoder>> encoders,
                                          const RHI::QueueSubmitSync& sync = {});

        // --- Frame maintenance ---
        // Releases what was deferred while `frameIndex` was current. The
        // caller's fence for that frame slot must have signalled.
        void RetireFrame(uint32_t frameIndex);
        void WaitIdle();

    private:
        std::unique_ptr<RHI::VulkanContext> m_Context;
        std::unique_ptr<RHI::VulkanDevice> m_Device;
        std::unique_ptr<RHI::VulkanCommandQueue> m_Queue;
        std::unique_ptr<RHI::VulkanStagingAllocator> m_Staging;
        std::unique_ptr<RHI::Rgb2RgbaTranscoder> m_Transcoder;
        // References m_Staging and m_Transcoder.
        std::unique_ptr<RHI::Uploader> m_Uploader;
    };

    // Sampled image in SHADER_READ_ONLY_OPTIMAL plus a linear repeat sampler.
    // 3-byte layouts go through the GPU transcoder on the next flush.
    [[nodiscard]] Core::Expected<Texture> CreateTexture(Graphics& graphics, const DecodedImage& image);
}
