#include "ResultPump.hpp"

ResultPump::ResultPump(ResultChannel &channel, ResultRouter &router, int intervalMs, QObject *parent) :
    QObject(parent), m_channel(channel), m_router(router)
{
    m_timer.setInterval(intervalMs > 0 ? intervalMs : 30);
    connect(&m_timer, &QTimer::timeout, this, &ResultPump::onTimeout);
}

ResultPump::~ResultPump()
{
    stop();
}

void ResultPump::start()
{
    if (!m_timer.isActive())
        m_timer.start();
}

void ResultPump::stop()
{
    if (m_timer.isActive())
        m_timer.stop();
}

std::size_t ResultPump::pumpOnce()
{
    return m_router.pump(m_channel);
}

void ResultPump::onTimeout()
{
    if (m_channel.size() == 0)
        return;
    const std::size_t delivered = pumpOnce();
    if (delivered > 0)
        emit resultsDelivered(static_cast<int>(delivered));
}
