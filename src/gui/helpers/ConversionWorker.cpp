#include "ConversionWorker.h"
#include "src/core/ConversionEngine.h"
#include "src/core/ConversionReport.h"

using namespace WebpConvert;

ConversionWorker::ConversionWorker(const ConversionRequest& request, QObject* parent)
    : QThread(parent), m_request(request)
{
}

void ConversionWorker::run()
{
    ConversionEngine engine([this](ConversionEngine::LogLevel, const std::string& line) {
        emit logMessage(QString::fromStdString(line));
    });

    try {
        ConversionSummary summary = engine.convert(m_request);
        emit conversionDone(summary.converted, summary.skipped, summary.failed,
                            QString::fromStdString(ConversionReport::summaryText(summary)));
    } catch (const FatalConfigurationError& e) {
        emit error(QString::fromStdString(e.what()));
    } catch (const std::exception& e) {
        emit error(QString("Unexpected error: %1").arg(e.what()));
    }
}
