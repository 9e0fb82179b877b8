module;
#include "RHI.Vulkan.hpp"
#include <filesystem>
#include <vector>

export module RHI:Shader;

import :Device;
import Core;

export namespace RHI
{
    enum class ShaderStage { Vertex, Fragment, Compute };

    // Loads a precompiled SPIR-V blob (glslc output) from disk.
    class ShaderModule
    {
    public:
        ShaderModule(VulkanDevice& device, const std::filesystem::path& filepath, ShaderStage stage);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }
        // FileNotFound or FileReadError when the blob could not be loaded,
        // ShaderCompilationFailed when the driver rejected it, Success otherwise.
        [[nodiscard]] Core::ErrorCode GetLoadError() const { return m_LoadError; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;
        Core::ErrorCode m_LoadError = Core::ErrorCode::Success;

        [[nodiscard]] static Core::Expected<std::vector<uint32_t>> ReadFile(const std::filesystem::path& filename);
    };
}
