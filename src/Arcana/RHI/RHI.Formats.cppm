module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <expected>
#include <optional>

export module RHI:Formats;

import Core;

export namespace RHI
{
    enum class UploadPath : uint8_t
    {
        Copy,      // source bytes already match the image format
        Transcode  // 3 bytes per texel in, 4 bytes per texel out, on the GPU
    };

    // Uncompressed formats the upload engine knows the texel size of.
    [[nodiscard]] constexpr std::optional<uint32_t> BytesPerTexel(VkFormat format)
    {
        switch (format)
        {
        case VK_FORMAT_R8_UNORM:
        case VK_FORMAT_R8_SRGB:
        case VK_FORMAT_R8_UINT:
            return 1;
        case VK_FORMAT_R8G8_UNORM:
        case VK_FORMAT_R8G8_SRGB:
        case VK_FORMAT_R16_SFLOAT:
        case VK_FORMAT_R16_UNORM:
            return 2;
        case VK_FORMAT_R8G8B8_UNORM:
        case VK_FORMAT_R8G8B8_SRGB:
        case VK_FORMAT_B8G8R8_UNORM:
        case VK_FORMAT_B8G8R8_SRGB:
            return 3;
        case VK_FORMAT_R8G8B8A8_UNORM:
        case VK_FORMAT_R8G8B8A8_SRGB:
        case VK_FORMAT_B8G8R8A8_UNORM:
        case VK_FORMAT_B8G8R8A8_SRGB:
        case VK_FORMAT_R16G16_SFLOAT:
        case VK_FORMAT_R32_SFLOAT:
        case VK_FORMAT_R32_UINT:
            return 4;
        case VK_FORMAT_R16G16B16A16_SFLOAT:
        case VK_FORMAT_R32G32_SFLOAT:
            return 8;
        case VK_FORMAT_R32G32B32A32_SFLOAT:
            return 16;
        default:
            return std::nullopt;
        }
    }

    // The only pairs the transcoder accepts. Color encoding is preserved and
    // alpha is forced opaque.
    [[nodiscard]] constexpr bool IsSupportedConversion(VkFormat source, VkFormat destination)
    {
        return (source == VK_FORMAT_R8G8B8_UNORM && destination == VK_FORMAT_R8G8B8A8_UNORM) ||
               (source == VK_FORMAT_R8G8B8_SRGB && destination == VK_FORMAT_R8G8B8A8_SRGB);
    }

    [[nodiscard]] constexpr Core::Expected<UploadPath> ClassifyUpload(VkFormat source, VkFormat destination)
    {
        if (source == VK_FORMAT_UNDEFINED || destination == VK_FORMAT_UNDEFINED)
            return std::unexpected(Core::ErrorCode::InvalidFormat);
        if (source == destination)
            return UploadPath::Copy;
        if (IsSupportedConversion(source, destination))
            return UploadPath::Transcode;
        return std::unexpected(Core::ErrorCode::UnsupportedConversion);
    }

    // Minimum number of source bytes a region read needs, honoring buffer row
    // length and image height (0 = tightly packed). nullopt when the texel size
    // of `format` is unknown (block-compressed and exotic formats).
    [[nodiscard]] constexpr std::optional<uint64_t> RequiredSourceBytes(VkFormat format, VkExtent3D extent,
                                                                        uint32_t layerCount,
                                                                        uint32_t rowLength, uint32_t imageHeight)
    {
        const std::optional<uint32_t> texelSize = BytesPerTexel(format);
        if (!texelSize || extent.width == 0 || extent.height == 0 || extent.depth == 0 || layerCount == 0)
            return std::nullopt;

        const uint64_t rowTexels = rowLength != 0 ? rowLength : extent.width;
        const uint64_t sliceRows = imageHeight != 0 ? imageHeight : extent.height;
        const uint64_t slices = static_cast<uint64_t>(extent.depth) * layerCount;

        // The last row of the last slice only needs `width` texels.
        const uint64_t texels = ((slices - 1) * sliceRows + (extent.height - 1)) * rowTexels + extent.width;
        return texels * *texelSize;
    }
}
