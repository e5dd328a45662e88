#ifndef CONVERSION_REPORT_H
#define CONVERSION_REPORT_H

#include <string>
#include <vector>

#include "ConversionTypes.h"

namespace WebpConvert
{
    // Text rendering of engine results, shared by the CLI and the GUI.
    namespace ConversionReport
    {
        /**
         * @brief One line per result, e.g. "[FAILED] b.webp: <reason>".
         */
        std::string describe(const ConversionResult& result);

        /**
         * @brief Count lines followed by the details of every failed, skipped
         * or warned entry, so the user can locate and retry them.
         */
        std::vector<std::string> summaryLines(const ConversionSummary& summary);

        std::string summaryText(const ConversionSummary& summary);
    }

} // namespace WebpConvert

#endif // CONVERSION_REPORT_H
