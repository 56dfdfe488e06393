#pragma once

#include <string>

struct VulkanSupport
{
    bool        ok = false;
    std::string reason; // empty when ok; otherwise the first failing step
};

/**
 * @brief Can this machine create an instance, pick an adapter and create a device?
 *
 * Builds and tears down a throwaway headless DeviceContext. Diagnostics
 * raised along the way go to the active sink as usual.
 */
[[nodiscard]] VulkanSupport checkVulkanSupport();
