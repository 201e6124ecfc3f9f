#include "WriteBackBatcher.h"
#include "WriteBackEngine.h"

#include <QTimer>
#include <QDebug>

WriteBackBatcher::WriteBackBatcher(WriteBackEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    m_timer->setInterval(5000);
    connect(m_timer, &QTimer::timeout, this, &WriteBackBatcher::flush);
}

void WriteBackBatcher::setEnabled(bool enabled)
{
    m_enabled = enabled;
    if (!enabled) {
        m_timer->stop();
        m_pending.clear();
    }
}

void WriteBackBatcher::setDelay(int ms)
{
    m_timer->setInterval(qMax(0, ms));
}

void WriteBackBatcher::enqueue(const QString& bookId)
{
    if (!m_enabled || bookId.isEmpty())
        return;
    if (!m_pending.contains(bookId))
        m_pending.append(bookId);
    m_timer->start();  // restarts the quiet period
}

void WriteBackBatcher::flush()
{
    m_timer->stop();
    if (m_pending.isEmpty())
        return;

    const QStringList batch = m_pending;
    m_pending.clear();

    if (m_exportPath.isEmpty()) {
        qWarning() << "[WriteBack] No export path configured, dropping" << batch.size() << "queued updates";
        emit batchWritten(false, 0, QStringLiteral("no export path configured"));
        return;
    }

    WriteBackOptions options;
    options.exportPath = m_exportPath;
    options.updates = m_engine->updatesForBooks(batch);
    options.pathMappings = m_mappings;
    options.createBackup = false;

    if (options.updates.isEmpty()) {
        qDebug() << "[WriteBack] Batch of" << batch.size() << "books has no persistent ids, skipping";
        emit batchWritten(true, 0, QStringLiteral("nothing to write"));
        return;
    }

    WriteBackResult result = m_engine->writeBack(options);
    if (!result.success)
        qWarning() << "[WriteBack] Batch failed:" << result.message();
    emit batchWritten(result.success, result.updatedCount, result.message());
}
