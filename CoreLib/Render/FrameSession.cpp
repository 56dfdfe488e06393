//============================================================
// FrameSession.cpp
//============================================================
#include "FrameSession.hpp"

RenderStatus FrameSessionGuard::open() noexcept
{
    if (m_lost)
        return RenderStatus::DeviceLost;

    if (m_open)
        return RenderStatus::UsageError;

    m_open = true;
    ++m_serial;
    return RenderStatus::Ok;
}

RenderStatus FrameSessionGuard::close() noexcept
{
    if (!m_open)
        return RenderStatus::UsageError;

    m_open = false;
    return RenderStatus::Ok;
}

void FrameSessionGuard::markDeviceLost() noexcept
{
    m_lost = true;
    m_open = false;
}

void FrameSessionGuard::reset() noexcept
{
    m_lost = false;
    m_open = false;
}
