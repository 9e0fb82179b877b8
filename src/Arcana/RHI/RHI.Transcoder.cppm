module;
#include "RHI.Vulkan.hpp"
#include <filesystem>
#include <memory>

export module RHI:Transcoder;

import :Device;
import :CommandEncoder;
import :ComputePipeline;
import :Descriptors;
import :Staging;
import Core;

export namespace RHI
{
    // Part of one image that an upload writes.
    struct ImageRegion
    {
        VkImage Image = VK_NULL_HANDLE;
        // Full extent of `Image` (mip 0).
        VkExtent3D ImageExtent{0, 0, 0};
        VkImageSubresourceLayers Subresource{VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        VkOffset3D Offset{0, 0, 0};
        VkExtent3D Extent{0, 0, 0};
    };

    // InvalidArgument unless `region` is a non-empty, single-layer 2D rectangle
    // that lies inside its image.
    [[nodiscard]] Core::Result ValidateTranscodeRegion(const ImageRegion& region);

    // GPU pass that fills an image region from a staging buffer whose texel
    // layout the image format cannot take directly.
    class IPixelTranscoder
    {
    public:
        virtual ~IPixelTranscoder() = default;

        IPixelTranscoder(const IPixelTranscoder&) = delete;
        IPixelTranscoder& operator=(const IPixelTranscoder&) = delete;

        // Everything UploadSynchronized would reject about a request, checked
        // before any staging memory exists. `payloadSize` is the number of
        // source bytes the caller intends to stage.
        [[nodiscard]] virtual Core::Result Validate(const ImageRegion& region,
                                                    VkFormat sourceFormat,
                                                    VkFormat destinationFormat,
                                                    uint32_t rowLength,
                                                    uint32_t imageHeight,
                                                    VkDeviceSize payloadSize) const = 0;

        // Records the transcode into `encoder`. The destination must already be
        // in TRANSFER_DST_OPTIMAL; it stays there.
        [[nodiscard]] virtual Core::Result UploadSynchronized(const ImageRegion& region,
                                                              const StagingBuffer& source,
                                                              VkFormat sourceFormat,
                                                              VkFormat destinationFormat,
                                                              uint32_t rowLength,
                                                              uint32_t imageHeight,
                                                              ICommandEncoder& encoder) = 0;

    protected:
        IPixelTranscoder() = default;
    };

    // RGB8 -> RGBA8 (UNORM or SRGB) through rgb2rgba.comp.
    //
    // Per call: one intermediate RGBA8_UNORM storage image sized like the
    // destination, one R8_UNORM texel buffer view over the staging buffer and
    // one descriptor set. All three are released through deferred destruction
    // once the frame slot that recorded them retires. The final image-to-image
    // copy is a raw-bit copy, so SRGB destinations keep their encoded bytes.
    class Rgb2RgbaTranscoder final : public IPixelTranscoder
    {
    public:
        static constexpr const char* ShaderFile = "rgb2rgba.comp.spv";
        // Size of the first descriptor pool; the pool grows past it on demand.
        static constexpr uint32_t InitialDescriptorSets = 64;

        [[nodiscard]] static Core::Expected<std::unique_ptr<Rgb2RgbaTranscoder>> Create(
            VulkanDevice& device, const std::filesystem::path& shaderPath);

        Rgb2RgbaTranscoder(VulkanDevice& device,
                           std::unique_ptr<DescriptorLayout> layout,
                           std::unique_ptr<DescriptorPool> pool,
                           std::unique_ptr<ComputePipeline> pipeline);
        ~Rgb2RgbaTranscoder() override;

        [[nodiscard]] Core::Result Validate(const ImageRegion& region,
                                            VkFormat sourceFormat,
                                            VkFormat destinationFormat,
                                            uint32_t rowLength,
                                            uint32_t imageHeight,
                                            VkDeviceSize payloadSize) const override;

        [[nodiscard]] Core::Result UploadSynchronized(const ImageRegion& region,
                                                      const StagingBuffer& source,
                                                      VkFormat sourceFormat,
                                                      VkFormat destinationFormat,
                                                      uint32_t rowLength,
                                                      uint32_t imageHeight,
                                                      ICommandEncoder& encoder) override;

        [[nodiscard]] uint64_t GetDispatchCount() const { return m_DispatchCount; }
        [[nodiscard]] const DescriptorPool& GetDescriptorPool() const { return *m_Pool; }

    private:
        VulkanDevice& m_Device;
        std::unique_ptr<DescriptorLayout> m_Layout;
        std::unique_ptr<DescriptorPool> m_Pool;
        std::unique_ptr<ComputePipeline> m_Pipeline;
        uint64_t m_DispatchCount = 0;
    };
}
