//============================================================
// VkDebugNames.hpp
//============================================================
// Debug-only Vulkan object naming (compiled out in Release).
// Names show up in validation messages and capture tools.

#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <unordered_map>
#include <vulkan/vulkan.h>

#if !defined(NDEBUG)
#define FLUX3D_DEBUG_NAMES 1
#else
#define FLUX3D_DEBUG_NAMES 0
#endif

namespace vkutil
{
    template<typename T>
    struct ObjectTypeOf;

#define FLUX3D_OBJECT_TYPE(Handle, Enum)                           \
    template<>                                                     \
    struct ObjectTypeOf<Handle>                                    \
    {                                                              \
        static constexpr VkObjectType value = Enum;                \
    }

    FLUX3D_OBJECT_TYPE(VkBuffer, VK_OBJECT_TYPE_BUFFER);
    FLUX3D_OBJECT_TYPE(VkImage, VK_OBJECT_TYPE_IMAGE);
    FLUX3D_OBJECT_TYPE(VkImageView, VK_OBJECT_TYPE_IMAGE_VIEW);
    FLUX3D_OBJECT_TYPE(VkDeviceMemory, VK_OBJECT_TYPE_DEVICE_MEMORY);
    FLUX3D_OBJECT_TYPE(VkPipeline, VK_OBJECT_TYPE_PIPELINE);
    FLUX3D_OBJECT_TYPE(VkPipelineLayout, VK_OBJECT_TYPE_PIPELINE_LAYOUT);
    FLUX3D_OBJECT_TYPE(VkDescriptorSet, VK_OBJECT_TYPE_DESCRIPTOR_SET);
    FLUX3D_OBJECT_TYPE(VkDescriptorSetLayout, VK_OBJECT_TYPE_DESCRIPTOR_SET_LAYOUT);
    FLUX3D_OBJECT_TYPE(VkDescriptorPool, VK_OBJECT_TYPE_DESCRIPTOR_POOL);
    FLUX3D_OBJECT_TYPE(VkCommandBuffer, VK_OBJECT_TYPE_COMMAND_BUFFER);
    FLUX3D_OBJECT_TYPE(VkCommandPool, VK_OBJECT_TYPE_COMMAND_POOL);
    FLUX3D_OBJECT_TYPE(VkSemaphore, VK_OBJECT_TYPE_SEMAPHORE);
    FLUX3D_OBJECT_TYPE(VkFence, VK_OBJECT_TYPE_FENCE);
    FLUX3D_OBJECT_TYPE(VkFramebuffer, VK_OBJECT_TYPE_FRAMEBUFFER);
    FLUX3D_OBJECT_TYPE(VkRenderPass, VK_OBJECT_TYPE_RENDER_PASS);
    FLUX3D_OBJECT_TYPE(VkSwapchainKHR, VK_OBJECT_TYPE_SWAPCHAIN_KHR);

#undef FLUX3D_OBJECT_TYPE

#if FLUX3D_DEBUG_NAMES

    // Per device: a short-lived context (capability checks) must not clear the
    // name function of a device that is still rendering.
    struct NamerRegistry
    {
        std::mutex                                                     mutex;
        std::unordered_map<VkDevice, PFN_vkSetDebugUtilsObjectNameEXT> fns;
    };

    inline NamerRegistry& namers() noexcept
    {
        static NamerRegistry registry;
        return registry;
    }

    inline void registerNamer(VkDevice device, PFN_vkSetDebugUtilsObjectNameEXT fn)
    {
        if (!device)
            return;

        NamerRegistry&              r = namers();
        std::lock_guard<std::mutex> lock(r.mutex);
        if (fn)
            r.fns[device] = fn;
        else
            r.fns.erase(device);
    }

    inline void unregisterNamer(VkDevice device) noexcept
    {
        NamerRegistry&              r = namers();
        std::lock_guard<std::mutex> lock(r.mutex);
        r.fns.erase(device);
    }

    [[nodiscard]] inline bool hasNamer(VkDevice device) noexcept
    {
        NamerRegistry&              r = namers();
        std::lock_guard<std::mutex> lock(r.mutex);
        return r.fns.find(device) != r.fns.end();
    }

    // Only resolves when VK_EXT_debug_utils was enabled on the instance.
    inline void init(VkInstance instance, VkDevice device)
    {
        if (!instance || !device)
            return;

        registerNamer(device,
                      reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
                          vkGetInstanceProcAddr(instance, "vkSetDebugUtilsObjectNameEXT")));
    }

    inline void shutdown(VkDevice device) noexcept
    {
        unregisterNamer(device);
    }

    inline void setObjectName(VkDevice     device,
                              VkObjectType type,
                              uint64_t     objectHandle,
                              const char*  baseName,
                              int32_t      index = -1) noexcept
    {
        if (!device || !objectHandle || !baseName)
            return;

        PFN_vkSetDebugUtilsObjectNameEXT setName = nullptr;
        {
            NamerRegistry&              r = namers();
            std::lock_guard<std::mutex> lock(r.mutex);
            const auto                  it = r.fns.find(device);
            if (it != r.fns.end())
                setName = it->second;
        }
        if (!setName)
            return;

        char nameBuf[160] = {};
        if (index >= 0)
            std::snprintf(nameBuf, sizeof(nameBuf), "%s [%d]", baseName, index);
        else
            std::snprintf(nameBuf, sizeof(nameBuf), "%s", baseName);

        VkDebugUtilsObjectNameInfoEXT info{};
        info.sType        = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
        info.objectType   = type;
        info.objectHandle = objectHandle;
        info.pObjectName  = nameBuf;

        setName(device, &info);
    }

    template<typename Handle>
    inline void name(VkDevice device, Handle obj, const char* baseName, int32_t index = -1) noexcept
    {
        setObjectName(device, ObjectTypeOf<Handle>::value, uint64_t(obj), baseName, index);
    }

#else

    // Release: everything is compiled out
    inline void init(VkInstance, VkDevice) noexcept
    {
    }
    inline void shutdown(VkDevice) noexcept
    {
    }

    inline void setObjectName(VkDevice, VkObjectType, uint64_t, const char*, int32_t = -1) noexcept
    {
    }

    template<typename Handle>
    inline void name(VkDevice, Handle, const char*, int32_t = -1) noexcept
    {
    }

#endif
} // namespace vkutil
