//============================================================
// VulkanSupport.cpp
//============================================================
#include "VulkanSupport.hpp"

#include "DeviceContext.hpp"

VulkanSupport checkVulkanSupport()
{
    VulkanSupport result = {};

    DeviceContext      device;
    const RenderStatus status = device.requestDevice(VK_NULL_HANDLE, DeviceRequest{});

    switch (status)
    {
        case RenderStatus::Ok:
            result.ok = true;
            break;
        case RenderStatus::CapabilityError:
            result.reason = "No Vulkan instance or physical device is available.";
            break;
        case RenderStatus::AdapterUnavailable:
            result.reason = "No adapter with a graphics queue was found.";
            break;
        case RenderStatus::DeviceRequestError:
            result.reason = "The adapter refused to create a logical device.";
            break;
        default:
            result.reason = std::string("Unexpected status: ") + toString(status);
            break;
    }

    device.destroy();
    return result;
}
