module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <entt/entity/entity.hpp>

#include "RHI/RHI.Vulkan.hpp"

export module Arcana.Texture;

import RHI;

export namespace Arcana
{
    // Pixel layouts the image decoders hand over.
    enum class PixelLayout : uint8_t
    {
        Rgb,             // 3 bytes, linear
        Rgba,            // 4 bytes, linear
        Srgb,            // 3 bytes, sRGB color
        SrgbLinearAlpha  // 4 bytes, sRGB color with linear alpha
    };

    struct DecodedImage
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        PixelLayout Layout = PixelLayout::Rgba;
        // Tightly packed rows, top row first.
        std::vector<std::byte> Pixels;
    };

    struct TextureFormats
    {
        VkFormat Source;  // format of DecodedImage::Pixels
        VkFormat Image;   // format of the GPU image
    };

    // 3-byte layouts are widened to RGBA8 on the GPU; the color encoding is kept.
    [[nodiscard]] constexpr TextureFormats GetTextureFormats(PixelLayout layout)
    {
        switch (layout)
        {
        case PixelLayout::Rgb:             return {VK_FORMAT_R8G8B8_UNORM, VK_FORMAT_R8G8B8A8_UNORM};
        case PixelLayout::Rgba:            return {VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM};
        case PixelLayout::Srgb:            return {VK_FORMAT_R8G8B8_SRGB, VK_FORMAT_R8G8B8A8_SRGB};
        case PixelLayout::SrgbLinearAlpha: return {VK_FORMAT_R8G8B8A8_SRGB, VK_FORMAT_R8G8B8A8_SRGB};
        }
        return {VK_FORMAT_UNDEFINED, VK_FORMAT_UNDEFINED};
    }

    [[nodiscard]] constexpr uint32_t GetBytesPerPixel(PixelLayout layout)
    {
        return layout == PixelLayout::Rgb || layout == PixelLayout::Srgb ? 3u : 4u;
    }

    // A sampled image plus the sampler to read it with. Several textures may
    // share one image or one sampler.
    struct Texture
    {
        std::shared_ptr<RHI::VulkanImage> Image;
        std::shared_ptr<RHI::Sampler> Sampler;
        // Set when the image is rendered by the entity's camera instead of loaded.
        std::optional<entt::entity> Target;

        [[nodiscard]] VkImageView GetView() const { return Image ? Image->GetView() : VK_NULL_HANDLE; }
        [[nodiscard]] VkSampler GetSampler() const { return Sampler ? Sampler->GetHandle() : VK_NULL_HANDLE; }
    };
}
