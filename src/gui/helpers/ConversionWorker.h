#pragma once

#include <QThread>
#include <QString>

#include "src/core/ConversionTypes.h"

/**
 * @brief Runs one ConversionEngine pass off the GUI thread.
 *
 * The request is copied in at construction so the worker never reads
 * widget state. Results come back through queued signals.
 */
class ConversionWorker : public QThread
{
    Q_OBJECT

public:
    explicit ConversionWorker(const WebpConvert::ConversionRequest& request, QObject* parent = nullptr);

signals:
    void logMessage(const QString& line);
    void conversionDone(int converted, int skipped, int failed, const QString& report);
    void error(const QString& message);

protected:
    void run() override;

private:
    WebpConvert::ConversionRequest m_request;
};
