module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:ComputePipeline.Impl;

import :ComputePipeline;
import :Device;
import :Shader;
import :Types;
import Core;

namespace RHI
{
    ComputePipeline::~ComputePipeline()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        if (m_Pipeline)
        {
            VkPipeline pipeline = m_Pipeline;
            m_Device.SafeDestroy([logicalDevice, pipeline]()
            {
                vkDestroyPipeline(logicalDevice, pipeline, nullptr);
            });
        }

        if (m_Layout)
        {
            VkPipelineLayout layout = m_Layout;
            m_Device.SafeDestroy([logicalDevice, layout]()
            {
                vkDestroyPipelineLayout(logicalDevice, layout, nullptr);
            });
        }
    }

    ComputePipelineBuilder::ComputePipelineBuilder(VulkanDevice& device)
        : m_Device(device)
    {
        m_ShaderStage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        m_ShaderStage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::SetShader(const ShaderModule& comp)
    {
        m_ShaderStage = comp.GetStageInfo();
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::AddDescriptorSetLayout(VkDescriptorSetLayout layout)
    {
        m_DescriptorSetLayouts.push_back(layout);
        return *this;
    }

    ComputePipelineBuilder& ComputePipelineBuilder::AddPushConstantRange(VkPushConstantRange range)
    {
        m_PushConstants.push_back(range);
        return *this;
    }

    Core::Expected<std::unique_ptr<ComputePipeline>> ComputePipelineBuilder::Build()
    {
        if (m_ShaderStage.module == VK_NULL_HANDLE || m_ShaderStage.stage != VK_SHADER_STAGE_COMPUTE_BIT)
        {
            Core::Log::Error("ComputePipelineBuilder: no compute shader set.");
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        uint32_t pushConstantSize = 0;
        for (const VkPushConstantRange& range : m_PushConstants)
            pushConstantSize = std::max(pushConstantSize, range.offset + range.size);

        const uint32_t pushConstantLimit = m_Device.GetLimits().maxPushConstantsSize;
        if (pushConstantSize > pushConstantLimit)
        {
            Core::Log::Error("ComputePipelineBuilder: {} push constant bytes exceed the device limit of {}.",
                             pushConstantSize, pushConstantLimit);
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
        pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(m_DescriptorSetLayouts.size());
        pipelineLayoutInfo.pSetLayouts = m_DescriptorSetLayouts.data();
        pipelineLayoutInfo.pushConstantRangeCount = static_cast<uint32_t>(m_PushConstants.size());
        pipelineLayoutInfo.pPushConstantRanges = m_PushConstants.data();

        VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;
        VkResult res = vkCreatePipelineLayout(m_Device.GetLogicalDevice(), &pipelineLayoutInfo, nullptr, &pipelineLayout);
        if (res != VK_SUCCESS)
        {
            Core::Log::Error("ComputePipelineBuilder: vkCreatePipelineLayout failed: {}", VkResultToString(res));
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        VkComputePipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
        pipelineInfo.stage = m_ShaderStage;
        pipelineInfo.layout = pipelineLayout;

        VkPipeline pipeline = VK_NULL_HANDLE;
        res = vkCreateComputePipelines(m_Device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
        if (res != VK_SUCCESS)
        {
            // Never handed out, so no deferred destruction needed.
            vkDestroyPipelineLayout(m_Device.GetLogicalDevice(), pipelineLayout, nullptr);
            Core::Log::Error("ComputePipelineBuilder: vkCreateComputePipelines failed: {}", VkResultToString(res));
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        return std::make_unique<ComputePipeline>(m_Device, pipeline, pipelineLayout, pushConstantSize);
    }
}
