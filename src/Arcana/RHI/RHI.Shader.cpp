module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <filesystem>
#include <fstream>
#include <vector>

module RHI:Shader.Impl;

import :Shader;
import Core;

namespace RHI
{
    ShaderModule::ShaderModule(VulkanDevice& device, const std::filesystem::path& filepath, ShaderStage stage)
        : m_Device(device), m_Stage(stage)
    {
        auto code = ReadFile(filepath);
        if (!code)
        {
            m_LoadError = code.error();
            return;
        }

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = code->size() * sizeof(uint32_t);
        createInfo.pCode = code->data();

        if (vkCreateShaderModule(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module: {}", filepath.string());
            m_Module = VK_NULL_HANDLE;
            m_LoadError = Core::ErrorCode::ShaderCompilationFailed;
        }
    }

    ShaderModule::~ShaderModule()
    {
        // Only referenced during pipeline creation, so no deferred destruction needed.
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        switch (m_Stage)
        {
        case ShaderStage::Vertex:   info.stage = VK_SHADER_STAGE_VERTEX_BIT; break;
        case ShaderStage::Fragment: info.stage = VK_SHADER_STAGE_FRAGMENT_BIT; break;
        case ShaderStage::Compute:  info.stage = VK_SHADER_STAGE_COMPUTE_BIT; break;
        }
        info.module = m_Module;
        info.pName = "main";
        return info;
    }

    Core::Expected<std::vector<uint32_t>> ShaderModule::ReadFile(const std::filesystem::path& filename)
    {
        std::ifstream file(filename, std::ios::ate | std::ios::binary);
        if (!file.is_open())
        {
            Core::Log::Error("Failed to open shader file: {}", filename.string());
            return std::unexpected(Core::ErrorCode::FileNotFound);
        }

        const auto end = file.tellg();
        if (end < 0)
        {
            Core::Log::Error("Failed to size shader file: {}", filename.string());
            return std::unexpected(Core::ErrorCode::FileReadError);
        }

        const size_t fileSize = static_cast<size_t>(end);
        if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0)
        {
            Core::Log::Error("Shader file is not valid SPIR-V ({} bytes): {}", fileSize, filename.string());
            return std::unexpected(Core::ErrorCode::FileReadError);
        }

        std::vector<uint32_t> buffer(fileSize / sizeof(uint32_t));
        file.seekg(0);
        if (!file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileSize)))
        {
            Core::Log::Error("Short read on shader file: {}", filename.string());
            return std::unexpected(Core::ErrorCode::FileReadError);
        }
        return buffer;
    }
}
