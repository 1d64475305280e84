#ifndef RESULTPUMP_H
#define RESULTPUMP_H

#include "PCH.h"
#include "ResultChannel.hpp"
#include "ResultRouter.hpp"

#include <QObject>
#include <QTimer>

/**
 * @brief 在 Qt 事件循环所在线程上定时清空结果队列并分发
 */
class ResultPump : public QObject
{
    Q_OBJECT

public:
    ResultPump(ResultChannel &channel, ResultRouter &router, int intervalMs = 30, QObject *parent = nullptr);
    ~ResultPump() override;

    void start();
    void stop();
    bool isActive() const
    {
        return m_timer.isActive();
    }

    // 立即执行一次，返回投递次数
    std::size_t pumpOnce();

signals:
    void resultsDelivered(int count);

private slots:
    void onTimeout();

private:
    ResultChannel &m_channel;
    ResultRouter &m_router;
    QTimer m_timer;
};

#endif // RESULTPUMP_H
