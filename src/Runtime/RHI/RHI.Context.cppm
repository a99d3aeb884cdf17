module;

#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

export namespace RHI
{
    struct ContextConfig
    {
        std::string_view AppName = "Meridian App";
        bool EnableValidation = true;
        // No window surface: the XR runtime owns the presentation swapchains.
        bool Headless = true;
    };

    class VulkanContext
    {
    public:
        explicit VulkanContext(const ContextConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;
        bool m_ValidationEnabled = false;

        void CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
