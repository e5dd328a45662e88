#include "ConversionReport.h"

#include <sstream>

namespace WebpConvert
{
    namespace ConversionReport
    {
        std::string describe(const ConversionResult& result)
        {
            std::ostringstream line;
            line << "[" << toString(result.status) << "] " << result.sourcePath.filename().string();

            switch (result.status) {
                case ConversionStatus::CONVERTED:
                    if (result.outputPath) {
                        line << " -> " << result.outputPath->filename().string();
                    }
                    if (!result.warning.empty()) {
                        line << " (warning: " << result.warning << ")";
                    }
                    break;
                case ConversionStatus::SKIPPED_NOT_AN_IMAGE:
                    line << ": not a regular image file";
                    break;
                case ConversionStatus::FAILED:
                    line << ": " << result.errorDetail;
                    break;
            }
            return line.str();
        }

        std::vector<std::string> summaryLines(const ConversionSummary& summary)
        {
            std::vector<std::string> lines;
            lines.push_back("Processing complete!");
            lines.push_back("WebP files converted: " + std::to_string(summary.converted));
            lines.push_back("Skipped (not an image): " + std::to_string(summary.skipped));
            lines.push_back("Failed: " + std::to_string(summary.failed));
            if (summary.deletionWarnings > 0) {
                lines.push_back("Originals that could not be deleted: " + std::to_string(summary.deletionWarnings));
            }
            if (!summary.destinationFolder.empty()) {
                lines.push_back("Output folder: " + summary.destinationFolder.string());
            }

            for (const auto& result : summary.results) {
                if (result.status != ConversionStatus::CONVERTED || !result.warning.empty()) {
                    lines.push_back("  " + describe(result));
                }
            }
            return lines;
        }

        std::string summaryText(const ConversionSummary& summary)
        {
            std::string text;
            for (const auto& line : summaryLines(summary)) {
                if (!text.empty()) {
                    text += '\n';
                }
                text += line;
            }
            return text;
        }
    }

} // namespace WebpConvert
