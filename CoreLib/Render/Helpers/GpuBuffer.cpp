#include "GpuBuffer.hpp"

#include <cstring>
#include <string>
#include <utility>

#include "Diagnostics.hpp"
#include "VkUtilities.hpp"

// --------------------------------------------------------
// Create / destroy
// --------------------------------------------------------
bool GpuBuffer::create(VkDevice              device,
                       VkPhysicalDevice      physicalDevice,
                       VkDeviceSize          size,
                       VkBufferUsageFlags    usage,
                       VkMemoryPropertyFlags memoryFlags,
                       bool                  persistentMap)
{
    destroy();

    if (!device || !physicalDevice || size == 0)
        return false;

    m_device     = device;
    m_size       = size;
    m_memFlags   = memoryFlags;
    m_persistent = persistentMap;

    VkBufferCreateInfo bi{};
    bi.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bi.size        = m_size;
    bi.usage       = usage;
    bi.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    if (vkCreateBuffer(m_device, &bi, nullptr, &m_buffer) != VK_SUCCESS)
    {
        m_buffer = VK_NULL_HANDLE;
        destroy();
        return false;
    }

    VkMemoryRequirements req{};
    vkGetBufferMemoryRequirements(m_device, m_buffer, &req);

    const uint32_t memType = vkutil::findMemoryType(physicalDevice, req.memoryTypeBits, m_memFlags);
    if (memType == UINT32_MAX)
    {
        diag::error("GpuBuffer: No memory type matches the requested properties.");
        destroy();
        return false;
    }

    VkMemoryAllocateInfo ai{};
    ai.sType           = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    ai.allocationSize  = req.size;
    ai.memoryTypeIndex = memType;

    if (vkAllocateMemory(m_device, &ai, nullptr, &m_memory) != VK_SUCCESS)
    {
        destroy();
        return false;
    }

    if (vkBindBufferMemory(m_device, m_buffer, m_memory, 0) != VK_SUCCESS)
    {
        destroy();
        return false;
    }

    if (m_persistent)
    {
        if ((m_memFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) == 0 ||
            vkMapMemory(m_device, m_memory, 0, m_size, 0, &m_mapped) != VK_SUCCESS)
        {
            diag::error("GpuBuffer: Persistent map requested but vkMapMemory failed.");
            m_mapped = nullptr;
            destroy();
            return false;
        }
    }

    return true;
}

void GpuBuffer::forget() noexcept
{
    m_device     = VK_NULL_HANDLE;
    m_buffer     = VK_NULL_HANDLE;
    m_memory     = VK_NULL_HANDLE;
    m_mapped     = nullptr;
    m_size       = 0;
    m_memFlags   = 0;
    m_persistent = false;
}

void GpuBuffer::destroy() noexcept
{
    if (!m_device)
        return;

    if (m_mapped)
    {
        vkUnmapMemory(m_device, m_memory);
        m_mapped = nullptr;
    }

    if (m_buffer)
    {
        vkDestroyBuffer(m_device, m_buffer, nullptr);
        m_buffer = VK_NULL_HANDLE;
    }

    if (m_memory)
    {
        vkFreeMemory(m_device, m_memory, nullptr);
        m_memory = VK_NULL_HANDLE;
    }

    m_device     = VK_NULL_HANDLE;
    m_size       = 0;
    m_memFlags   = 0;
    m_persistent = false;
}

// --------------------------------------------------------
// Host upload (HOST_VISIBLE only)
// --------------------------------------------------------

bool GpuBuffer::upload(const void* data, VkDeviceSize size, VkDeviceSize offset)
{
    if (!data || size == 0)
        return false;

    if (!valid())
    {
        diag::error("GpuBuffer: upload() called before create().");
        return false;
    }

    if ((m_memFlags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) == 0)
    {
        diag::error("GpuBuffer: upload() called on a buffer that is not host visible.",
                    {"Use vkutil::createDeviceLocalBuffer() for device-local data."});
        return false;
    }

    if (offset + size > m_size)
    {
        diag::error("GpuBuffer: upload() out of range.",
                    {"Write: " + std::to_string(size) + " bytes at " + std::to_string(offset),
                     "Capacity: " + std::to_string(m_size)});
        return false;
    }

    void* ptr = m_mapped;
    if (!ptr)
    {
        if (vkMapMemory(m_device, m_memory, offset, size, 0, &ptr) != VK_SUCCESS || !ptr)
        {
            diag::error("GpuBuffer: vkMapMemory failed during upload().");
            return false;
        }
        std::memcpy(ptr, data, static_cast<std::size_t>(size));
        vkUnmapMemory(m_device, m_memory);
        return true;
    }

    std::memcpy(static_cast<char*>(ptr) + static_cast<std::size_t>(offset),
                data,
                static_cast<std::size_t>(size));
    return true;
}

// --------------------------------------------------------
// Move / dtor
// --------------------------------------------------------

GpuBuffer::GpuBuffer(GpuBuffer&& o) noexcept
{
    moveFrom(std::move(o));
}

GpuBuffer& GpuBuffer::operator=(GpuBuffer&& o) noexcept
{
    if (this != &o)
    {
        destroy();
        moveFrom(std::move(o));
    }
    return *this;
}

void GpuBuffer::moveFrom(GpuBuffer&& o) noexcept
{
    m_device     = std::exchange(o.m_device, VK_NULL_HANDLE);
    m_buffer     = std::exchange(o.m_buffer, VK_NULL_HANDLE);
    m_memory     = std::exchange(o.m_memory, VK_NULL_HANDLE);
    m_mapped     = std::exchange(o.m_mapped, nullptr);
    m_size       = std::exchange(o.m_size, 0);
    m_memFlags   = std::exchange(o.m_memFlags, 0);
    m_persistent = std::exchange(o.m_persistent, false);
}

GpuBuffer::~GpuBuffer()
{
    destroy();
}
