#include "CliRunner.h"
#include "src/core/ConversionEngine.h"
#include "src/core/ConversionReport.h"

namespace WebpConvert
{
    int runConversion(const ConversionRequest& request, std::ostream& out, std::ostream& err)
    {
        ConversionEngine engine([&out, &err](ConversionEngine::LogLevel level, const std::string& line) {
            if (level == ConversionEngine::LogLevel::INFO) {
                out << line << std::endl;
            } else {
                err << line << std::endl;
            }
        });

        try {
            ConversionSummary summary = engine.convert(request);

            out << "\n";
            for (const auto& line : ConversionReport::summaryLines(summary)) {
                out << line << "\n";
            }
            out << std::flush;
        } catch (const FatalConfigurationError& e) {
            err << "Error: " << e.what() << std::endl;
            return 1;
        } catch (const std::exception& e) {
            err << "Unexpected error: " << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

} // namespace WebpConvert
