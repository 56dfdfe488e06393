//============================================================
// DeviceContext.cpp
//============================================================
#include "DeviceContext.hpp"

#include <atomic>
#include <cstring>

#include "Diagnostics.hpp"
#include "VkDebugNames.hpp"
#include "VkUtilities.hpp"

namespace
{
    constexpr uint32_t kNoFamily = 0xFFFFFFFFu;

    constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

    std::atomic<uint64_t> g_generation{0};

    bool hasExtInList(const std::vector<VkExtensionProperties>& exts, const char* name) noexcept
    {
        if (!name)
            return false;

        for (const auto& e : exts)
        {
            if (std::strcmp(e.extensionName, name) == 0)
                return true;
        }
        return false;
    }

    std::vector<VkExtensionProperties> enumerateDeviceExts(VkPhysicalDevice pd)
    {
        uint32_t extCount = 0;
        vkEnumerateDeviceExtensionProperties(pd, nullptr, &extCount, nullptr);

        std::vector<VkExtensionProperties> exts(extCount);
        if (extCount)
            vkEnumerateDeviceExtensionProperties(pd, nullptr, &extCount, exts.data());
        return exts;
    }

    bool hasInstanceLayer(const char* name)
    {
        uint32_t count = 0;
        if (vkEnumerateInstanceLayerProperties(&count, nullptr) != VK_SUCCESS || count == 0)
            return false;

        std::vector<VkLayerProperties> layers(count);
        vkEnumerateInstanceLayerProperties(&count, layers.data());

        for (const auto& l : layers)
        {
            if (std::strcmp(l.layerName, name) == 0)
                return true;
        }
        return false;
    }

    /// Graphics family; with a surface it must also present to it.
    uint32_t findGraphicsFamily(VkPhysicalDevice pd, VkSurfaceKHR surface)
    {
        uint32_t familyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(pd, &familyCount, nullptr);
        if (familyCount == 0)
            return kNoFamily;

        std::vector<VkQueueFamilyProperties> qprops(familyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(pd, &familyCount, qprops.data());

        for (uint32_t i = 0; i < familyCount; ++i)
        {
            if (!(qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT))
                continue;

            if (surface)
            {
                VkBool32 present = VK_FALSE;
                if (vkGetPhysicalDeviceSurfaceSupportKHR(pd, i, surface, &present) != VK_SUCCESS || !present)
                    continue;
            }
            return i;
        }
        return kNoFamily;
    }

    VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(VkDebugUtilsMessageSeverityFlagBitsEXT      severity,
                                                 VkDebugUtilsMessageTypeFlagsEXT             types,
                                                 const VkDebugUtilsMessengerCallbackDataEXT* data,
                                                 void*                                       user)
    {
        (void)types;
        (void)user;

        const char* msg = (data && data->pMessage) ? data->pMessage : "(no message)";

        if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
            diag::error("Vulkan: Uncaptured validation error.", {msg}, DiagCode::DeviceUncapturedError);
        else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
            diag::warn("Vulkan: Validation warning.", {msg}, DiagCode::DeviceUncapturedError);

        return VK_FALSE;
    }
} // namespace

// ============================================================================
// Selection policy
// ============================================================================

namespace vkutil
{
    int scoreAdapter(const VkPhysicalDeviceProperties& props, PowerPreference preference) noexcept
    {
        const bool lowPower = preference == PowerPreference::LowPower;

        int score = 0;

        switch (props.deviceType)
        {
            case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
                score += lowPower ? 300 : 1000;
                break;
            case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
                score += lowPower ? 1000 : 300;
                break;
            case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
                score += 150;
                break;
            case VK_PHYSICAL_DEVICE_TYPE_CPU:
                score += 10;
                break;
            default:
                score += 50;
                break;
        }

        // Prefer higher Vulkan API version
        score += int(VK_VERSION_MAJOR(props.apiVersion)) * 100;
        score += int(VK_VERSION_MINOR(props.apiVersion)) * 10;

        const VkSampleCountFlags msaa =
            props.limits.framebufferColorSampleCounts &
            props.limits.framebufferDepthSampleCounts;

        if (msaa & VK_SAMPLE_COUNT_8_BIT)
            score += 30;
        else if (msaa & VK_SAMPLE_COUNT_4_BIT)
            score += 20;
        else if (msaa & VK_SAMPLE_COUNT_2_BIT)
            score += 10;

        // Very rough signal
        score += int(props.limits.maxImageDimension2D / 1024);

        return score;
    }

    bool featureSupported(const VkPhysicalDeviceFeatures& feats, DeviceFeature f) noexcept
    {
        switch (f)
        {
            case DeviceFeature::SamplerAnisotropy:
                return feats.samplerAnisotropy;
            case DeviceFeature::FillModeNonSolid:
                return feats.fillModeNonSolid;
            case DeviceFeature::WideLines:
                return feats.wideLines;
            case DeviceFeature::GeometryShader:
                return feats.geometryShader;
            case DeviceFeature::SampleRateShading:
                return feats.sampleRateShading;
            case DeviceFeature::DepthClamp:
                return feats.depthClamp;
            case DeviceFeature::IndependentBlend:
                return feats.independentBlend;
            case DeviceFeature::MultiDrawIndirect:
                return feats.multiDrawIndirect;
            case DeviceFeature::TextureCompressionBC:
                return feats.textureCompressionBC;
        }
        return false;
    }

    void enableFeature(VkPhysicalDeviceFeatures& feats, DeviceFeature f) noexcept
    {
        switch (f)
        {
            case DeviceFeature::SamplerAnisotropy:
                feats.samplerAnisotropy = VK_TRUE;
                break;
            case DeviceFeature::FillModeNonSolid:
                feats.fillModeNonSolid = VK_TRUE;
                break;
            case DeviceFeature::WideLines:
                feats.wideLines = VK_TRUE;
                break;
            case DeviceFeature::GeometryShader:
                feats.geometryShader = VK_TRUE;
                break;
            case DeviceFeature::SampleRateShading:
                feats.sampleRateShading = VK_TRUE;
                break;
            case DeviceFeature::DepthClamp:
                feats.depthClamp = VK_TRUE;
                break;
            case DeviceFeature::IndependentBlend:
                feats.independentBlend = VK_TRUE;
                break;
            case DeviceFeature::MultiDrawIndirect:
                feats.multiDrawIndirect = VK_TRUE;
                break;
            case DeviceFeature::TextureCompressionBC:
                feats.textureCompressionBC = VK_TRUE;
                break;
        }
    }

    std::vector<DeviceFeature> missingFeatures(const VkPhysicalDeviceFeatures&   feats,
                                               const std::vector<DeviceFeature>& required)
    {
        std::vector<DeviceFeature> out;
        for (DeviceFeature f : required)
        {
            if (!featureSupported(feats, f))
                out.push_back(f);
        }
        return out;
    }

    std::vector<std::string> unmetLimits(const VkPhysicalDeviceLimits& limits, const DeviceLimits& required)
    {
        std::vector<std::string> out;

        auto check = [&](const char* name, const std::optional<uint32_t>& want, uint32_t have) {
            if (want && *want > have)
            {
                out.push_back(std::string(name) + ": required " + std::to_string(*want) +
                              ", supported " + std::to_string(have));
            }
        };

        check("maxImageDimension2D", required.maxImageDimension2D, limits.maxImageDimension2D);
        check("maxBoundDescriptorSets", required.maxBoundDescriptorSets, limits.maxBoundDescriptorSets);
        check("maxPushConstantsSize", required.maxPushConstantsSize, limits.maxPushConstantsSize);
        check("maxUniformBufferRange", required.maxUniformBufferRange, limits.maxUniformBufferRange);
        check("maxVertexInputBindings", required.maxVertexInputBindings, limits.maxVertexInputBindings);
        check("maxVertexInputAttributes", required.maxVertexInputAttributes, limits.maxVertexInputAttributes);
        check("maxColorAttachments", required.maxColorAttachments, limits.maxColorAttachments);

        return out;
    }

    const char* deviceTypeName(VkPhysicalDeviceType t) noexcept
    {
        switch (t)
        {
            case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
                return "Discrete";
            case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
                return "Integrated";
            case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
                return "Virtual";
            case VK_PHYSICAL_DEVICE_TYPE_CPU:
                return "CPU";
            default:
                return "Other";
        }
    }

    std::string versionString(uint32_t v)
    {
        return std::to_string(VK_VERSION_MAJOR(v)) + "." +
               std::to_string(VK_VERSION_MINOR(v)) + "." +
               std::to_string(VK_VERSION_PATCH(v));
    }
} // namespace vkutil

const char* toString(DeviceState s) noexcept
{
    switch (s)
    {
        case DeviceState::Idle:
            return "Idle";
        case DeviceState::Ready:
            return "Ready";
        case DeviceState::Lost:
            return "Lost";
        case DeviceState::Failed:
            return "Failed";
    }
    return "Unknown";
}

// ============================================================================
// DeviceContext
// ============================================================================

DeviceContext::~DeviceContext()
{
    destroy();
}

RenderStatus DeviceContext::fail(RenderStatus status)
{
    destroy();
    m_state = DeviceState::Failed;
    return status;
}

bool DeviceContext::createHeadlessInstance(bool enableValidation)
{
    std::vector<const char*> layers;
    std::vector<const char*> exts;

    if (enableValidation)
    {
        if (hasInstanceLayer(kValidationLayer))
        {
            layers.push_back(kValidationLayer);
            exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }
        else
        {
            diag::warn("DeviceContext: Validation requested but the Khronos validation layer is not installed.",
                       {},
                       DiagCode::DeviceCapabilityMissing);
        }
    }

    VkApplicationInfo app = {};
    app.sType             = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app.pApplicationName  = "Flux3D";
    app.pEngineName       = "Flux3D";
    app.apiVersion        = VK_API_VERSION_1_1;

    VkInstanceCreateInfo ci    = {};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &app;
    ci.enabledLayerCount       = uint32_t(layers.size());
    ci.ppEnabledLayerNames     = layers.empty() ? nullptr : layers.data();
    ci.enabledExtensionCount   = uint32_t(exts.size());
    ci.ppEnabledExtensionNames = exts.empty() ? nullptr : exts.data();

    VkInstance instance = VK_NULL_HANDLE;
    const VkResult res  = vkCreateInstance(&ci, nullptr, &instance);
    if (res != VK_SUCCESS)
    {
        vkutil::printVkResult(res, "vkCreateInstance");
        return false;
    }

    m_ctx.instance = instance;
    m_ownsInstance = true;
    return true;
}

void DeviceContext::installDebugMessenger()
{
    auto createFn = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(m_ctx.instance, "vkCreateDebugUtilsMessengerEXT"));

    if (!createFn)
    {
        diag::warn("DeviceContext: VK_EXT_debug_utils is not available, uncaptured errors will not be reported.",
                   {},
                   DiagCode::DeviceCapabilityMissing);
        return;
    }

    VkDebugUtilsMessengerCreateInfoEXT ci = {};
    ci.sType                              = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    ci.messageSeverity                    = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    ci.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    ci.pfnUserCallback = &debugCallback;

    if (createFn(m_ctx.instance, &ci, nullptr, &m_messenger) != VK_SUCCESS)
        m_messenger = VK_NULL_HANDLE;
}

RenderStatus DeviceContext::requestDevice(VkInstance instance, const DeviceRequest& request)
{
    if (m_state != DeviceState::Idle)
    {
        diag::error("DeviceContext: requestDevice() can only be called once per context.",
                    {std::string("Current state: ") + toString(m_state)},
                    DiagCode::DeviceUsage);
        return RenderStatus::UsageError;
    }

    // ------------------------------------------------------------
    // Instance
    // ------------------------------------------------------------
    if (instance)
    {
        m_ctx.instance = instance;
        m_ownsInstance = false;
    }
    else if (!createHeadlessInstance(request.enableValidation))
    {
        diag::error("DeviceContext: Vulkan is not available on this system.",
                    {"No Vulkan instance could be created.",
                     "Install a Vulkan driver and the Vulkan loader."},
                    DiagCode::DeviceCapabilityMissing);
        return fail(RenderStatus::CapabilityError);
    }

    if (request.enableValidation)
        installDebugMessenger();

    uint32_t devCount = 0;
    vkEnumeratePhysicalDevices(m_ctx.instance, &devCount, nullptr);
    if (devCount == 0)
    {
        diag::error("DeviceContext: Vulkan is available but no physical device was found.",
                    {},
                    DiagCode::DeviceCapabilityMissing);
        return fail(RenderStatus::CapabilityError);
    }

    std::vector<VkPhysicalDevice> devices(devCount);
    vkEnumeratePhysicalDevices(m_ctx.instance, &devCount, devices.data());

    // ------------------------------------------------------------
    // Candidate selection
    // ------------------------------------------------------------
    struct Candidate
    {
        VkPhysicalDevice           pd = VK_NULL_HANDLE;
        VkPhysicalDeviceProperties props{};
        VkPhysicalDeviceFeatures   feats{};
        uint32_t                   graphicsFamily = kNoFamily;
        int                        score          = -1;
    };

    std::vector<std::string> rejected;
    Candidate                best     = {};
    bool                     haveBest = false;

    for (VkPhysicalDevice pd : devices)
    {
        Candidate c = {};
        c.pd        = pd;

        vkGetPhysicalDeviceProperties(pd, &c.props);
        vkGetPhysicalDeviceFeatures(pd, &c.feats);

        // Hard requirement: graphics queue (able to present, when a surface is given)
        c.graphicsFamily = findGraphicsFamily(pd, request.surface);
        if (c.graphicsFamily == kNoFamily)
        {
            rejected.push_back(std::string(c.props.deviceName) + ": no suitable graphics queue");
            continue;
        }

        // Hard requirement: swapchain extension when presenting
        if (request.surface && !hasExtInList(enumerateDeviceExts(pd), VK_KHR_SWAPCHAIN_EXTENSION_NAME))
        {
            rejected.push_back(std::string(c.props.deviceName) + ": no VK_KHR_swapchain");
            continue;
        }

        c.score = vkutil::scoreAdapter(c.props, request.powerPreference);

        if (!haveBest || c.score > best.score)
        {
            best     = c;
            haveBest = true;
        }
    }

    if (!haveBest)
    {
        diag::error("DeviceContext: No adapter satisfies the rendering requirements.",
                    rejected,
                    DiagCode::DeviceNoAdapter);
        return fail(RenderStatus::AdapterUnavailable);
    }

    // ------------------------------------------------------------
    // Caller requirements
    // ------------------------------------------------------------
    const std::vector<DeviceFeature> missing = vkutil::missingFeatures(best.feats, request.requiredFeatures);
    const std::vector<std::string>   limits  = vkutil::unmetLimits(best.props.limits, request.requiredLimits);

    if (!missing.empty() || !limits.empty())
    {
        std::vector<std::string> details;
        details.push_back(std::string("Adapter: ") + best.props.deviceName);
        for (DeviceFeature f : missing)
            details.push_back(std::string("Missing feature: ") + toString(f));
        for (const std::string& l : limits)
            details.push_back("Unmet limit " + l);

        diag::error("DeviceContext: The selected adapter rejected the requested features or limits.",
                    details,
                    DiagCode::DeviceRequestRejected);
        return fail(RenderStatus::DeviceRequestError);
    }

    m_ctx.physicalDevice           = best.pd;
    m_ctx.deviceProps              = best.props;
    m_ctx.graphicsQueueFamilyIndex = best.graphicsFamily;

    diag::log(std::string("DeviceContext: Selected device: ") + best.props.deviceName +
                  " (" + vkutil::deviceTypeName(best.props.deviceType) + "), Vulkan " +
                  vkutil::versionString(best.props.apiVersion),
              {},
              DiagCode::DeviceSelected);

    // ------------------------------------------------------------
    // Logical device
    // ------------------------------------------------------------
    const float prio = 1.0f;

    VkDeviceQueueCreateInfo qci = {};
    qci.sType                   = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex        = m_ctx.graphicsQueueFamilyIndex;
    qci.queueCount              = 1;
    qci.pQueuePriorities        = &prio;

    m_enabledFeatures = {};
    for (DeviceFeature f : request.requiredFeatures)
        vkutil::enableFeature(m_enabledFeatures, f);

    std::vector<const char*> enabledExts;
    if (request.surface || hasExtInList(enumerateDeviceExts(best.pd), VK_KHR_SWAPCHAIN_EXTENSION_NAME))
        enabledExts.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

    VkDeviceCreateInfo dci      = {};
    dci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    dci.queueCreateInfoCount    = 1;
    dci.pQueueCreateInfos       = &qci;
    dci.enabledExtensionCount   = uint32_t(enabledExts.size());
    dci.ppEnabledExtensionNames = enabledExts.empty() ? nullptr : enabledExts.data();
    dci.pEnabledFeatures        = &m_enabledFeatures;

    const VkResult res = vkCreateDevice(m_ctx.physicalDevice, &dci, nullptr, &m_ctx.device);
    if (res != VK_SUCCESS)
    {
        m_ctx.device = VK_NULL_HANDLE;
        diag::error("DeviceContext: vkCreateDevice failed.",
                    {std::string("Result: ") + vkutil::resultName(res)},
                    DiagCode::DeviceRequestRejected);
        return fail(RenderStatus::DeviceRequestError);
    }

    vkGetDeviceQueue(m_ctx.device, m_ctx.graphicsQueueFamilyIndex, 0, &m_ctx.graphicsQueue);

    vkutil::init(m_ctx.instance, m_ctx.device);

    m_ctx.generation = ++g_generation;
    m_state          = DeviceState::Ready;
    return RenderStatus::Ok;
}

RenderStatus DeviceContext::configureSurface(VkSurfaceKHR surface, const SurfaceConfig& config)
{
    if (m_state == DeviceState::Lost)
        return RenderStatus::DeviceLost;

    if (m_state != DeviceState::Ready)
    {
        diag::error("DeviceContext: configureSurface() needs an acquired device.",
                    {std::string("Current state: ") + toString(m_state)},
                    DiagCode::DeviceUsage);
        return RenderStatus::UsageError;
    }

    // Minimized: keep the current swapchain and let the caller skip the frame.
    VkExtent2D extent = {};
    if (Swapchain::queryExtent(m_ctx.physicalDevice, surface, config.extent, extent) && !Swapchain::hasArea(extent))
        return RenderStatus::FrameSkipped;

    if (!m_swapchain.create(m_ctx, surface, config))
    {
        diag::error("DeviceContext: Could not configure the presentable surface.",
                    {"Extent: " + std::to_string(config.extent.width) + "x" + std::to_string(config.extent.height)},
                    DiagCode::DeviceRequestRejected);
        return RenderStatus::DeviceRequestError;
    }

    m_ctx.colorFormat = m_swapchain.format();
    return RenderStatus::Ok;
}

RenderStatus DeviceContext::checkResult(VkResult result, const char* where)
{
    if (result == VK_SUCCESS)
        return RenderStatus::Ok;

    if (result == VK_ERROR_DEVICE_LOST)
    {
        reportDeviceLost(std::string(where ? where : "?") + " returned VK_ERROR_DEVICE_LOST");
        return RenderStatus::DeviceLost;
    }

    vkutil::printVkResult(result, where);
    return RenderStatus::DeviceRequestError;
}

void DeviceContext::reportDeviceLost(const std::string& reason)
{
    if (m_state == DeviceState::Lost)
        return;

    m_state      = DeviceState::Lost;
    m_lostReason = reason;

    diag::error("DeviceContext: The Vulkan device was lost.",
                {reason, "Recreate the renderer to continue."},
                DiagCode::DeviceLost);

    // Snapshot: a listener may unregister itself.
    const std::vector<Listener> listeners = m_lostListeners;
    for (const Listener& l : listeners)
        l.fn(reason);
}

int DeviceContext::addDeviceLostListener(DeviceLostListener fn)
{
    if (!fn)
        return 0;

    const int id = m_nextListenerId++;
    m_lostListeners.push_back({id, std::move(fn)});
    return id;
}

void DeviceContext::removeDeviceLostListener(int id) noexcept
{
    std::erase_if(m_lostListeners, [id](const Listener& l) { return l.id == id; });
}

void DeviceContext::setTargetFormats(VkFormat color, VkFormat depth, VkSampleCountFlagBits samples) noexcept
{
    m_ctx.colorFormat = color;
    m_ctx.depthFormat = depth;
    m_ctx.sampleCount = samples;
}

VkSampleCountFlags DeviceContext::supportedSampleCounts() const noexcept
{
    if (!m_ctx.physicalDevice)
        return VK_SAMPLE_COUNT_1_BIT;

    return m_ctx.deviceProps.limits.framebufferColorSampleCounts &
           m_ctx.deviceProps.limits.framebufferDepthSampleCounts;
}

void DeviceContext::waitIdle() noexcept
{
    // A lost device returns an error here; teardown proceeds regardless.
    if (m_ctx.device)
        (void)vkDeviceWaitIdle(m_ctx.device);
}

void DeviceContext::destroy() noexcept
{
    waitIdle();

    m_swapchain.destroy();

    if (m_ctx.device)
    {
        vkutil::shutdown(m_ctx.device);
        vkDestroyDevice(m_ctx.device, nullptr);
        m_ctx.device = VK_NULL_HANDLE;
    }

    if (m_messenger && m_ctx.instance)
    {
        auto destroyFn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(m_ctx.instance, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyFn)
            destroyFn(m_ctx.instance, m_messenger, nullptr);
    }
    m_messenger = VK_NULL_HANDLE;

    if (m_ownsInstance && m_ctx.instance)
        vkDestroyInstance(m_ctx.instance, nullptr);

    m_ownsInstance                 = false;
    m_ctx.instance                 = VK_NULL_HANDLE;
    m_ctx.physicalDevice           = VK_NULL_HANDLE;
    m_ctx.graphicsQueue            = VK_NULL_HANDLE;
    m_ctx.graphicsQueueFamilyIndex = 0;

    // A released context can acquire again; Lost and Failed stay terminal.
    if (m_state == DeviceState::Ready)
        m_state = DeviceState::Idle;
}
