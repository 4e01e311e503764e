#include "fine2d/core/instance.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <GLFW/glfw3.h>

#include <cstring>

namespace fine2d {

static const char* const VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

// ============================================================================
// Validation messages
// ============================================================================

namespace {

LogLevel severityToLevel(VkDebugUtilsMessageSeverityFlagBitsEXT severity) {
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        return LogLevel::Error;
    }
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        return LogLevel::Warning;
    }
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
        return LogLevel::Debug;
    }
    return LogLevel::Trace;
}

VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
    VkDebugUtilsMessageTypeFlagsEXT messageType,
    const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
    void* /*pUserData*/)
{
    std::string message;
    if (messageType & VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT) {
        message = "[perf] ";
    }
    message += pCallbackData->pMessage;

    Logger::global().vulkanMessage(severityToLevel(messageSeverity), message);
    return VK_FALSE;
}

void populateDebugCreateInfo(VkDebugUtilsMessengerCreateInfoEXT& createInfo) {
    createInfo = {};
    createInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    createInfo.messageSeverity =
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    createInfo.messageType =
        VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    createInfo.pfnUserCallback = debugCallback;
}

} // anonymous namespace

// ============================================================================
// Builder implementation
// ============================================================================

Instance::Builder::Builder() {
#ifdef NDEBUG
    validationEnabled_ = false;
#else
    validationEnabled_ = true;
#endif
}

Instance::Builder& Instance::Builder::applicationName(std::string_view name) {
    appName_ = std::string(name);
    return *this;
}

Instance::Builder& Instance::Builder::applicationVersion(uint32_t major, uint32_t minor, uint32_t patch) {
    appVersion_ = VK_MAKE_VERSION(major, minor, patch);
    return *this;
}

Instance::Builder& Instance::Builder::apiVersion(uint32_t version) {
    apiVersion_ = version;
    return *this;
}

Instance::Builder& Instance::Builder::enableValidation(bool enable) {
    validationEnabled_ = enable;
    return *this;
}

Instance::Builder& Instance::Builder::addExtension(const char* extension) {
    extensions_.push_back(extension);
    return *this;
}

std::vector<const char*> Instance::Builder::requiredExtensions() const {
    uint32_t glfwExtensionCount = 0;
    const char** glfwExtensions = glfwGetRequiredInstanceExtensions(&glfwExtensionCount);
    if (!glfwExtensions) {
        throw DeviceError("GLFW reports no Vulkan surface support");
    }

    std::vector<const char*> extensions(glfwExtensions, glfwExtensions + glfwExtensionCount);
    extensions.insert(extensions.end(), extensions_.begin(), extensions_.end());

    if (validationEnabled_) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

#ifdef __APPLE__
    extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
    extensions.push_back("VK_KHR_get_physical_device_properties2");
#endif

    return extensions;
}

bool Instance::Builder::validationLayerAvailable() const {
    uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);

    std::vector<VkLayerProperties> availableLayers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

    for (const auto& layer : availableLayers) {
        if (std::strcmp(VALIDATION_LAYER, layer.layerName) == 0) {
            return true;
        }
    }
    return false;
}

InstancePtr Instance::Builder::build() {
    if (validationEnabled_ && !validationLayerAvailable()) {
        FINE2D_WARN(LogCategory::Vulkan, "Validation layers requested but not available");
        validationEnabled_ = false;
    }

    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = appName_.c_str();
    appInfo.applicationVersion = appVersion_;
    appInfo.pEngineName = "fine2d";
    appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.apiVersion = apiVersion_;

    auto extensions = requiredExtensions();

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    createInfo.ppEnabledExtensionNames = extensions.data();

#ifdef __APPLE__
    createInfo.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif

    // Messenger chained in so instance creation itself is validated
    VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo{};
    if (validationEnabled_) {
        createInfo.enabledLayerCount = 1;
        createInfo.ppEnabledLayerNames = &VALIDATION_LAYER;
        populateDebugCreateInfo(debugCreateInfo);
        createInfo.pNext = &debugCreateInfo;
        FINE2D_INFO(LogCategory::Vulkan, "Validation layers enabled");
    }

    VkInstance vkInstance;
    VkResult result = vkCreateInstance(&createInfo, nullptr, &vkInstance);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create Vulkan instance", result);
    }

    auto instance = InstancePtr(new Instance());
    instance->instance_ = vkInstance;
    instance->validationEnabled_ = validationEnabled_;

    if (validationEnabled_) {
        instance->createDebugMessenger();
    }

    FINE2D_INFO(LogCategory::Vulkan, "Vulkan instance created");
    return instance;
}

// ============================================================================
// Instance implementation
// ============================================================================

Instance::Builder Instance::create() {
    return Builder();
}

void Instance::createDebugMessenger() {
    VkDebugUtilsMessengerCreateInfoEXT createInfo;
    populateDebugCreateInfo(createInfo);

    auto func = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
    VkResult result = func ? func(instance_, &createInfo, nullptr, &debugMessenger_)
                           : VK_ERROR_EXTENSION_NOT_PRESENT;
    if (result != VK_SUCCESS) {
        // Validation is a debugging aid; run without it
        FINE2D_WARN(LogCategory::Vulkan, "Failed to create debug messenger");
        debugMessenger_ = VK_NULL_HANDLE;
    }
}

Instance::~Instance() {
    cleanup();
}

Instance::Instance(Instance&& other) noexcept
    : instance_(other.instance_)
    , debugMessenger_(other.debugMessenger_)
    , validationEnabled_(other.validationEnabled_) {
    other.instance_ = VK_NULL_HANDLE;
    other.debugMessenger_ = VK_NULL_HANDLE;
}

Instance& Instance::operator=(Instance&& other) noexcept {
    if (this != &other) {
        cleanup();
        instance_ = other.instance_;
        debugMessenger_ = other.debugMessenger_;
        validationEnabled_ = other.validationEnabled_;
        other.instance_ = VK_NULL_HANDLE;
        other.debugMessenger_ = VK_NULL_HANDLE;
    }
    return *this;
}

void Instance::cleanup() {
    if (debugMessenger_ != VK_NULL_HANDLE) {
        auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (func) {
            func(instance_, debugMessenger_, nullptr);
        }
        debugMessenger_ = VK_NULL_HANDLE;
    }

    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
        FINE2D_DEBUG(LogCategory::Vulkan, "Vulkan instance destroyed");
    }
}

} // namespace fine2d
