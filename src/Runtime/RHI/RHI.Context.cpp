module;

#include <string>
#include <vector>

#include "RHI.Vulkan.hpp"

module RHI:Context.Impl;
import :Context;
import Core;

namespace RHI
{
    namespace
    {
        const std::vector<const char*> VALIDATION_LAYERS = {
            "VK_LAYER_KHRONOS_validation"
        };

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
            void*)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
            {
                Core::Log::Error("[Vulkan Error]: {}", pCallbackData->pMessage);
            }
            else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
            {
                Core::Log::Warn("[Vulkan Validation]: {}", pCallbackData->pMessage);
            }
            return VK_FALSE;
        }

        bool IsLayerAvailable(const char* layerName)
        {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());

            for (const auto& layer : layers)
            {
                if (std::string(layer.layerName) == layerName) return true;
            }
            return false;
        }
    }

    VulkanContext::VulkanContext(const ContextConfig& config)
    {
        if (volkInitialize() != VK_SUCCESS)
        {
            Core::Log::Error("Failed to initialize Volk! Is a Vulkan loader installed?");
            return;
        }

        CreateInstance(config);
        if (m_Instance == VK_NULL_HANDLE) return;

        volkLoadInstance(m_Instance);

        if (m_ValidationEnabled)
        {
            SetupDebugMessenger();
        }

        Core::Log::Info("Vulkan Instance Initialized ({}).", config.Headless ? "headless" : "windowed");
    }

    VulkanContext::~VulkanContext()
    {
        if (m_Instance == VK_NULL_HANDLE) return;

        if (m_DebugMessenger != VK_NULL_HANDLE)
        {
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        }
        vkDestroyInstance(m_Instance, nullptr);
    }

    void VulkanContext::CreateInstance(const ContextConfig& config)
    {
        const std::string appName(config.AppName);

        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = appName.c_str();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "Meridian Engine";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_3;

        std::vector<const char*> extensions;
        const bool validation = config.EnableValidation && IsLayerAvailable(VALIDATION_LAYERS[0]);
        if (config.EnableValidation && !validation)
        {
            Core::Log::Warn("Validation requested but VK_LAYER_KHRONOS_validation is not available.");
        }
        if (validation)
        {
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo{};
        if (validation)
        {
            createInfo.enabledLayerCount = static_cast<uint32_t>(VALIDATION_LAYERS.size());
            createInfo.ppEnabledLayerNames = VALIDATION_LAYERS.data();

            debugCreateInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            debugCreateInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                              VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            debugCreateInfo.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                          VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
            debugCreateInfo.pfnUserCallback = DebugCallback;
            createInfo.pNext = &debugCreateInfo;
        }

        VkResult result = vkCreateInstance(&createInfo, nullptr, &m_Instance);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create Vulkan Instance! Error Code: {}", static_cast<int>(result));
            m_Instance = VK_NULL_HANDLE;
            return;
        }

        m_ValidationEnabled = validation;
    }

    void VulkanContext::SetupDebugMessenger()
    {
        if (vkCreateDebugUtilsMessengerEXT == nullptr) return;

        VkDebugUtilsMessengerCreateInfoEXT createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        createInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                     VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        createInfo.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                 VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                 VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
        createInfo.pfnUserCallback = DebugCallback;

        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to set up debug messenger!");
            m_DebugMessenger = VK_NULL_HANDLE;
        }
    }
}
