module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <memory>
#include <vector>

export module RHI:ComputePipeline;

import :Device;
import :Shader;
import Core;

export namespace RHI
{
    // Compute pipeline and its layout. Both go through deferred destruction,
    // so a pipeline may be dropped while recorded dispatches are in flight.
    class ComputePipeline
    {
    public:
        ComputePipeline(VulkanDevice& device, VkPipeline pipeline, VkPipelineLayout layout,
                        uint32_t pushConstantSize)
            : m_Device(device), m_Pipeline(pipeline), m_Layout(layout), m_PushConstantSize(pushConstantSize)
        {
        }

        ~ComputePipeline();

        ComputePipeline(const ComputePipeline&) = delete;
        ComputePipeline& operator=(const ComputePipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }
        // Bytes covered by the push constant ranges, 0 if none.
        [[nodiscard]] uint32_t GetPushConstantSize() const { return m_PushConstantSize; }

    private:
        VulkanDevice& m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
        uint32_t m_PushConstantSize = 0;
    };

    class ComputePipelineBuilder
    {
    public:
        explicit ComputePipelineBuilder(VulkanDevice& device);

        ComputePipelineBuilder& SetShader(const ShaderModule& comp);
        ComputePipelineBuilder& AddDescriptorSetLayout(VkDescriptorSetLayout layout);
        ComputePipelineBuilder& AddPushConstantRange(VkPushConstantRange range);

        // ShaderCompilationFailed without a compute shader, InvalidArgument when
        // the push constants exceed the device limit, PipelineCreationFailed
        // when the driver refuses the layout or the pipeline.
        [[nodiscard]] Core::Expected<std::unique_ptr<ComputePipeline>> Build();

    private:
        VulkanDevice& m_Device;
        VkPipelineShaderStageCreateInfo m_ShaderStage{};
        std::vector<VkDescriptorSetLayout> m_DescriptorSetLayouts;
        std::vector<VkPushConstantRange> m_PushConstants;
    };
}
