module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "RHI/RHI.Vulkan.hpp"

module Arcana.Graphics;

import Core;
import RHI;
import Arcana.Texture;

namespace Arcana
{
    namespace
    {
        [[nodiscard]] Core::Expected<std::shared_ptr<RHI::Sampler>> CreateLinearRepeatSampler(RHI::VulkanDevice& device)
        {
            auto sampler = std::make_shared<RHI::Sampler>(device, RHI::SamplerInfo{});
            if (!sampler->IsValid())
                return std::unexpected(Core::ErrorCode::OutOfMemory);
            return sampler;
        }
    }

    Core::Expected<std::unique_ptr<Graphics>> Graphics::Create(const GraphicsConfig& config)
    {
        Core::Log::Info("Graphics: Initializing...");

        auto graphics = std::make_unique<Graphics>(CreateToken{});

        // 1. Vulkan context (no surface)
        RHI::ContextConfig ctxConfig{config.AppName, config.EnableValidation, true};
        graphics->m_Context = std::make_unique<RHI::VulkanContext>(ctxConfig);
        if (!graphics->m_Context->IsValid())
        {
            Core::Log::Error("Graphics: no Vulkan instance.");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        // 2. Device
        graphics->m_Device = std::make_unique<RHI::VulkanDevice>(*graphics->m_Context);
        if (!graphics->m_Device->IsValid())
        {
            Core::Log::Error("Graphics: no suitable Vulkan device.");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        // 3. Command queue
        graphics->m_Queue = std::make_unique<RHI::VulkanCommandQueue>(*graphics->m_Device);
        if (!graphics->m_Queue->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfMemory);

        // 4. Upload engine
        graphics->m_Staging = std::make_unique<RHI::VulkanStagingAllocator>(*graphics->m_Device);

        const auto shaderPath = Core::Filesystem::GetShaderPath(RHI::Rgb2RgbaTranscoder::ShaderFile,
                                                                config.ShaderDirectory);
        auto transcoder = RHI::Rgb2RgbaTranscoder::Create(*graphics->m_Device, shaderPath);
        if (!transcoder)
            return std::unexpected(transcoder.error());
        graphics->m_Transcoder = std::move(*transcoder);

        graphics->m_Uploader = std::make_unique<RHI::Uploader>(*graphics->m_Staging, *graphics->m_Transcoder,
                                                               config.Uploads);

        Core::Log::Info("Graphics: Initialization complete (validation {}).",
                        graphics->m_Context->IsValidationEnabled() ? "on" : "off");
        return graphics;
    }

    Graphics::~Graphics()
    {
        const bool hasDevice = m_Device && m_Device->IsValid();
        if (hasDevice)
        {
            m_Device->WaitIdle();
            // Descriptor frees and command buffer frees must run before their pools go.
            m_Device->FlushAllDeletionQueues();
        }

        // Queued uploads that were never flushed are dropped here.
        m_Uploader.reset();
        m_Transcoder.reset();
        m_Staging.reset();
        m_Queue.reset();

        if (hasDevice)
            m_Device->FlushAllDeletionQueues();

        m_Device.reset();
        m_Context.reset();

        Core::Log::Info("Graphics: Shutdown complete.");
    }

    Core::Result Graphics::UploadBuffer(const std::shared_ptr<RHI::VulkanBuffer>& destination, VkDeviceSize offset,
                                        std::span<const std::byte> data)
    {
        if (!destination)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        return m_Uploader->UploadBuffer(RHI::BufferTarget{destination->GetHandle(), destination}, offset, data,
                                        RHI::AccessAll, RHI::AccessAll);
    }

    Core::Result Graphics::UploadBufferWith(VkBuffer destination, VkDeviceSize offset,
                                            std::span<const std::byte> data, RHI::ICommandEncoder& encoder)
    {
        return m_Uploader->UploadBufferWith(destination, offset, data, encoder);
    }

    Core::Result Graphics::UploadImage(const RHI::ImageUploadDesc& desc, std::span<const std::byte> data)
    {
        return m_Uploader->UploadImage(desc, data);
    }

    Core::Result Graphics::UploadImageWith(const RHI::ImageUploadDesc& desc, std::span<const std::byte> data,
                                           RHI::ICommandEncoder& encoder)
    {
        return m_Uploader->UploadImageWith(desc, data, encoder);
    }

    Core::Result Graphics::FlushUploads()
    {
        return m_Uploader->Flush(*m_Queue);
    }

    Core::Expected<std::shared_ptr<RHI::VulkanImage>> Graphics::CreateImageStatic(
        RHI::ImageInfo info, VkImageLayout layout, VkFormat sourceFormat, std::span<const std::byte> data)
    {
        info.Usage |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;

        auto image = std::make_shared<RHI::VulkanImage>(*m_Device, info);
        if (!image->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        // Mip 0 of every layer. Remaining mips are left to the caller.
        RHI::ImageUploadDesc desc{};
        desc.Region.Image = image->GetHandle();
        desc.Owner = image;
        desc.Region.ImageExtent = info.Extent;
        desc.Region.Subresource = {info.Aspect, 0, 0, info.ArrayLayers};
        desc.Region.Offset = {0, 0, 0};
        desc.Region.Extent = info.Extent;
        desc.OldLayout = std::nullopt;
        desc.NewLayout = layout;
        desc.OldAccess = 0;
        desc.NewAccess = RHI::AccessAll;
        desc.SourceFormat = sourceFormat;
        desc.DestinationFormat = info.Format;

        if (auto queued = m_Uploader->UploadImage(desc, data); !queued)
            return std::unexpected(queued.error());

        return image;
    }

    Core::Expected<std::shared_ptr<RHI::VulkanBuffer>> Graphics::CreateFastBufferStatic(
        RHI::BufferInfo info, std::span<const std::byte> data)
    {
        info.Usage |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;

        auto buffer = std::make_shared<RHI::VulkanBuffer>(*m_Device, info);
        if (!buffer->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        if (auto queued = m_Uploader->UploadBuffer(RHI::BufferTarget{buffer->GetHandle(), buffer}, 0, data,
                                                  0, RHI::AccessAll); !queued)
            return std::unexpected(queued.error());

        return buffer;
    }

    Core::Expected<Texture> Graphics::CreateDefaultTexture()
    {
        static constexpr std::array<std::byte, 4> White{
            std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}};

        auto image = CreateImageStatic(RHI::ImageInfo{
                                           .Extent = {1, 1, 1},
                                           .Format = VK_FORMAT_R8G8B8A8_UNORM,
                                           .Usage = VK_IMAGE_USAGE_SAMPLED_BIT,
                                       },
                                       VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_FORMAT_R8G8B8A8_UNORM, White);
        if (!image)
        {
            Core::Log::Error("Graphics: default texture creation failed ({}).", Core::ErrorCodeToString(image.error()));
            return std::unexpected(image.error());
        }

        auto sampler = CreateLinearRepeatSampler(*m_Device);
        if (!sampler)
            return std::unexpected(sampler.error());

        return Texture{std::move(*image), std::move(*sampler), std::nullopt};
    }

    Core::Expected<std::unique_ptr<RHI::ICommandEncoder>> Graphics::CreateEncoder()
    {
        return m_Queue->CreateEncoder();
    }

    Core::Result Graphics::Submit(std::vector<std::unique_ptr<RHI::ICommandEncoder>> encoders,
                                  const RHI::QueueSubmitSync& sync)
    {
        if (auto flushed = FlushUploads(); !flushed)
            return flushed;

        return m_Queue->Submit(std::move(encoders), sync);
    }

    void Graphics::RetireFrame(uint32_t frameIndex)
    {
        m_Device->FlushDeletionQueue(frameIndex % m_Device->GetFramesInFlight());
    }

    void Graphics::WaitIdle()
    {
        m_Device->WaitIdle();
    }

    Core::Expected<Texture> CreateTexture(Graphics& graphics, const DecodedImage& image)
    {
        if (image.Width == 0 || image.Height == 0)
        {
            Core::Log::Error("CreateTexture: empty image.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const uint64_t expected = static_cast<uint64_t>(image.Width) * image.Height * GetBytesPerPixel(image.Layout);
        if (image.Pixels.size() < expected)
        {
            Core::Log::Error("CreateTexture: {}x{} image carries {} bytes, expected {}.",
                             image.Width, image.Height, image.Pixels.size(), expected);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        const TextureFormats formats = GetTextureFormats(image.Layout);

        auto gpuImage = graphics.CreateImageStatic(RHI::ImageInfo{
                                                       .Extent = {image.Width, image.Height, 1},
                                                       .Format = formats.Image,
                                                       .Usage = VK_IMAGE_USAGE_SAMPLED_BIT,
                                                   },
                                                   VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, formats.Source,
                                                   std::span(image.Pixels).first(expected));
        if (!gpuImage)
            return std::unexpected(gpuImage.error());

        auto sampler = CreateLinearRepeatSampler(graphics.GetDevice());
        if (!sampler)
            return std::unexpected(sampler.error());

        return Texture{std::move(*gpuImage), std::move(*sampler), std::nullopt};
    }
}
