#ifndef CONVERSION_ENGINE_H
#define CONVERSION_ENGINE_H

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "ConversionTypes.h"

namespace WebpConvert
{
    /**
     * @brief Batch-converts the WebP images of one folder to PNG or JPEG.
     *
     * Files are processed one at a time in filename order. A file that fails
     * to decode, encode or write is recorded and the batch carries on; only a
     * bad source folder or an unusable destination aborts the run, and that
     * happens before any file is touched.
     */
    class ConversionEngine
    {
    public:
        enum class LogLevel {
            INFO,
            WARNING,
            ERROR
        };

        using LogCallback = std::function<void(LogLevel, const std::string&)>;

        /**
         * @param logger Receives one line per event. When empty, lines go to
         *               std::cout (info) and std::cerr (warnings, errors).
         */
        explicit ConversionEngine(LogCallback logger = LogCallback());

        /**
         * @throws FatalConfigurationError if the source folder is missing or
         *         unreadable, the destination cannot be created, or the
         *         sequential prefix or start number is unusable.
         */
        ConversionSummary convert(const ConversionRequest& request);

        /**
         * @brief Builds "<prefix>_<NNN><ext>".
         */
        static std::string sequentialName(const std::string& prefix, int number, const std::string& extension);

        /**
         * @brief Highest N among "<prefix>_<N><ext>" files in 'directory', or 0.
         */
        static int highestSequenceNumber(const std::filesystem::path& directory,
                                         const std::string& prefix,
                                         const std::string& extension);

    private:
        void validateRequest(const ConversionRequest& request);
        std::vector<std::filesystem::path> collectSources(const std::filesystem::path& source);
        std::filesystem::path prepareDestination(const ConversionRequest& request);
        int firstSequenceNumber(const ConversionRequest& request, const std::filesystem::path& destination);
        ConversionResult convertOne(const std::filesystem::path& sourcePath,
                                    const std::filesystem::path& outputPath,
                                    const ConversionRequest& request);
        void log(LogLevel level, const std::string& message) const;

        LogCallback m_logger;
    };

} // namespace WebpConvert

#endif // CONVERSION_ENGINE_H
