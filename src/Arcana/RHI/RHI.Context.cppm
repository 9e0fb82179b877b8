module;

#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

namespace RHI
{
    export struct ContextConfig
    {
        std::string_view AppName = "Arcana";
        bool EnableValidation = true;
        // No surface extensions; the device is picked without a presentation queue.
        bool Headless = true;
    };

    export class VulkanContext
    {
    public:
        explicit VulkanContext(const ContextConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }
        [[nodiscard]] bool IsValidationEnabled() const { return m_ValidationEnabled; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
        bool m_ValidationEnabled = false;

        void CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
