#pragma once

#include <cstdint>
#include <vulkan/vulkan.h>

/**
 * Lightweight RAII wrapper around a Vulkan buffer + its device memory.
 *
 * - No implicit allocation in default ctor.
 * - Explicit create() / destroy(); the destructor calls destroy().
 * - Move-only.
 * - Optional persistent mapping for HOST_VISIBLE buffers (camera UBOs).
 *
 * upload() never grows the buffer: writes past the end are rejected.
 * Buffers that back descriptor sets must keep their VkBuffer handle stable.
 */
class GpuBuffer
{
public:
    GpuBuffer() = default;
    ~GpuBuffer();

    GpuBuffer(const GpuBuffer&)            = delete;
    GpuBuffer& operator=(const GpuBuffer&) = delete;
    GpuBuffer(GpuBuffer&& other) noexcept;
    GpuBuffer& operator=(GpuBuffer&& other) noexcept;

    /// Returns false (and leaves the buffer invalid) on any Vulkan failure.
    bool create(VkDevice              device,
                VkPhysicalDevice      physicalDevice,
                VkDeviceSize          size,
                VkBufferUsageFlags    usage,
                VkMemoryPropertyFlags memoryFlags,
                bool                  persistentMap = false);

    void destroy() noexcept;

    /// Drops the handles without touching the device (it is already gone).
    void forget() noexcept;

    /// Copy into a HOST_VISIBLE buffer. Fails if [offset, offset+size) is out of range.
    bool upload(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

    [[nodiscard]] bool valid() const noexcept
    {
        return m_buffer != VK_NULL_HANDLE;
    }

    [[nodiscard]] VkBuffer buffer() const noexcept
    {
        return m_buffer;
    }

    [[nodiscard]] VkDeviceMemory memory() const noexcept
    {
        return m_memory;
    }

    [[nodiscard]] VkDeviceSize size() const noexcept
    {
        return m_size;
    }

    [[nodiscard]] const void* mapped() const noexcept
    {
        return m_mapped;
    }

private:
    void moveFrom(GpuBuffer&& other) noexcept;

private:
    VkDevice              m_device     = VK_NULL_HANDLE;
    VkBuffer              m_buffer     = VK_NULL_HANDLE;
    VkDeviceMemory        m_memory     = VK_NULL_HANDLE;
    void*                 m_mapped     = nullptr;
    VkDeviceSize          m_size       = 0;
    VkMemoryPropertyFlags m_memFlags   = 0;
    bool                  m_persistent = false;
};
