module;
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;

import :Device;
import :Context;
import :Types;
import Core;

namespace RHI
{
    VulkanDevice::VulkanDevice(VulkanContext& context)
    {
        if (!context.IsValid())
        {
            Core::Log::Error("VulkanDevice: context has no instance.");
            m_IsValid = false;
            return;
        }

        PickPhysicalDevice(context.GetInstance());
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);
        if (m_Device == VK_NULL_HANDLE)
        {
            m_IsValid = false;
        }
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);

        FlushAllDeletionQueues();

        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkResult VulkanDevice::SubmitToGraphicsQueue(const VkSubmitInfo2& submitInfo, VkFence fence)
    {
        std::scoped_lock lock(m_QueueMutex);
        return vkQueueSubmit2(m_GraphicsQueue, 1, &submitInfo, fence);
    }

    void VulkanDevice::WaitIdle()
    {
        if (m_Device) VK_CHECK(vkDeviceWaitIdle(m_Device));
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameIndex)
    {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard lock(m_DeletionMutex);
            m_CurrentFrameIndex = frameIndex % MAX_FRAMES_IN_FLIGHT;
            pending.swap(m_DeletionQueue[m_CurrentFrameIndex]);
        }
        // Run outside the lock: a deleter may release an object that defers again.
        for (auto& fn : pending) fn();
    }

    void VulkanDevice::FlushAllDeletionQueues()
    {
        for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i)
        {
            std::vector<std::function<void()>> pending;
            {
                std::lock_guard lock(m_DeletionMutex);
                pending.swap(m_DeletionQueue[i]);
            }
            for (auto& fn : pending) fn();
        }
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_DeletionQueue[m_CurrentFrameIndex].push_back(std::move(deleteFn));
    }

    size_t VulkanDevice::GetPendingDeletionCount() const
    {
        std::lock_guard lock(m_DeletionMutex);
        size_t count = 0;
        for (const auto& queue : m_DeletionQueue) count += queue.size();
        return count;
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        for (const auto& device : devices)
        {
            if (IsDeviceSuitable(device))
            {
                m_PhysicalDevice = device;
                break;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            return;
        }

        vkGetPhysicalDeviceProperties(m_PhysicalDevice, &m_Properties);
        Core::Log::Info("Selected GPU: {}", m_Properties.deviceName);
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;

        VkPhysicalDeviceVulkan12Features features12{};
        features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        features12.pNext = &features13;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features12;

        // Enable everything the GPU offers; the upload path only hard-requires sync2.
        vkGetPhysicalDeviceFeatures2(m_PhysicalDevice, &features2);

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;

        VkResult result = vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device! {}", VkResultToString(result));
            m_Device = VK_NULL_HANDLE;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
    }

    bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device)
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);

        if (props.apiVersion < VK_API_VERSION_1_3)
        {
            Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 not supported.", props.deviceName);
            return false;
        }

        QueueFamilyIndices indices = FindQueueFamilies(device);
        if (!indices.IsComplete())
        {
            Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);
            return false;
        }

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features13;
        vkGetPhysicalDeviceFeatures2(device, &features2);

        if (!features13.synchronization2)
        {
            Core::Log::Warn("GPU '{}' rejected: Sync2 not supported.", props.deviceName);
            return false;
        }

        return true;
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        // Uploads, transcodes and draws share one queue, so it must do graphics and compute.
        constexpr VkQueueFlags required = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if ((queueFamilies[i].queueFlags & required) == required)
            {
                indices.GraphicsFamily = i;
                break;
            }
        }
        return indices;
    }
}
