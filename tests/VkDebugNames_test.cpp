#include <gtest/gtest.h>
#include <cstdint>
#include <string>

#include "VkDebugNames.hpp"

#if FLUX3D_DEBUG_NAMES

namespace
{
    int          g_calls      = 0;
    uint64_t     g_lastHandle = 0;
    VkObjectType g_lastType   = VK_OBJECT_TYPE_UNKNOWN;
    std::string  g_lastName;

    VKAPI_ATTR VkResult VKAPI_CALL recordName(VkDevice, const VkDebugUtilsObjectNameInfoEXT* info)
    {
        ++g_calls;
        g_lastHandle = info->objectHandle;
        g_lastType   = info->objectType;
        g_lastName   = info->pObjectName;
        return VK_SUCCESS;
    }

    VkDevice deviceHandle(uintptr_t value)
    {
        return reinterpret_cast<VkDevice>(value);
    }
} // namespace

TEST(VkDebugNames, ReleasingOneDeviceKeepsNamingTheOther)
{
    const VkDevice live       = deviceHandle(0x1000);
    const VkDevice shortLived = deviceHandle(0x2000);

    g_calls = 0;
    vkutil::registerNamer(live, &recordName);
    vkutil::registerNamer(shortLived, &recordName);

    // What a throwaway capability check does on teardown.
    vkutil::shutdown(shortLived);

    EXPECT_TRUE(vkutil::hasNamer(live));
    EXPECT_FALSE(vkutil::hasNamer(shortLived));

    const VkBuffer buffer = VkBuffer(uintptr_t(0x42));
    vkutil::name(live, buffer, "Mesh.Vertices", 2);

    EXPECT_EQ(g_calls, 1);
    EXPECT_EQ(g_lastHandle, 0x42u);
    EXPECT_EQ(g_lastType, VK_OBJECT_TYPE_BUFFER);
    EXPECT_EQ(g_lastName, "Mesh.Vertices [2]");

    vkutil::name(shortLived, buffer, "Mesh.Vertices");
    EXPECT_EQ(g_calls, 1);

    vkutil::shutdown(live);
    vkutil::name(live, buffer, "Mesh.Vertices");
    EXPECT_EQ(g_calls, 1);
}

TEST(VkDebugNames, NullHandlesAndMissingNamesAreSkipped)
{
    const VkDevice device = deviceHandle(0x3000);

    g_calls = 0;
    vkutil::registerNamer(device, &recordName);

    vkutil::name(device, VkFence(VK_NULL_HANDLE), "Frame.Fence");
    vkutil::name(device, VkFence(uintptr_t(0x7)), nullptr);
    EXPECT_EQ(g_calls, 0);

    vkutil::name(device, VkFence(uintptr_t(0x7)), "Frame.Fence");
    EXPECT_EQ(g_calls, 1);
    EXPECT_EQ(g_lastType, VK_OBJECT_TYPE_FENCE);
    EXPECT_EQ(g_lastName, "Frame.Fence");

    // No name function resolved: registering nothing removes the entry.
    vkutil::registerNamer(device, nullptr);
    EXPECT_FALSE(vkutil::hasNamer(device));
}

#else

TEST(VkDebugNames, CompiledOutInRelease)
{
    GTEST_SKIP() << "Object names are only set in debug builds";
}

#endif
