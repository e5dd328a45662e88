#ifndef CONVERSION_TYPES_H
#define CONVERSION_TYPES_H

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/utils/Definitions.h"

namespace WebpConvert
{
    enum class TargetFormat {
        PNG,
        JPEG
    };

    enum class NamingPolicy {
        KEEP_ORIGINAL_NAME,
        SEQUENTIAL_NUMBERING
    };

    enum class ConversionStatus {
        CONVERTED,
        SKIPPED_NOT_AN_IMAGE,
        FAILED
    };

    /**
     * @brief Everything one engine run needs. Built by a front end, never shared.
     */
    struct ConversionRequest {
        std::filesystem::path sourceFolder;
        // Empty means "write next to the sources"
        std::filesystem::path destinationFolder;
        TargetFormat targetFormat = TargetFormat::PNG;
        bool preserveTransparency = true;
        NamingPolicy namingPolicy = NamingPolicy::SEQUENTIAL_NUMBERING;
        bool deleteOriginalsOnSuccess = false;

        std::string prefix = Definitions::DEFAULT_PREFIX;
        int startNumber = Definitions::DEFAULT_START_NUMBER;
        bool continueNumbering = true;
        int jpegQuality = Definitions::DEFAULT_JPEG_QUALITY;
    };

    struct ConversionResult {
        std::filesystem::path sourcePath;
        std::optional<std::filesystem::path> outputPath;
        ConversionStatus status = ConversionStatus::FAILED;
        std::string errorDetail;
        // Set when the source survived a requested deletion
        std::string warning;
    };

    struct ConversionSummary {
        int converted = 0;
        int skipped = 0;
        int failed = 0;
        int deletionWarnings = 0;
        std::filesystem::path destinationFolder;
        std::vector<ConversionResult> results;

        int total() const { return converted + skipped + failed; }
    };

    /**
     * @brief Base class for all converter errors.
     */
    class ConverterException : public std::runtime_error {
    public:
        explicit ConverterException(const std::string& message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Run-level failure: bad source folder or unusable destination.
     * Raised before any file is processed.
     */
    class FatalConfigurationError : public ConverterException {
    public:
        explicit FatalConfigurationError(const std::string& message)
            : ConverterException(message) {}
    };

    class DecodeFailure : public ConverterException {
    public:
        explicit DecodeFailure(const std::string& message)
            : ConverterException(message) {}
    };

    class EncodeOrWriteFailure : public ConverterException {
    public:
        explicit EncodeOrWriteFailure(const std::string& message)
            : ConverterException(message) {}
    };

    std::string toString(TargetFormat format);
    std::string toString(ConversionStatus status);

    /**
     * @brief Output extension (with dot) for a target format.
     */
    std::string extensionFor(TargetFormat format);

    /**
     * @brief Parses "png", "jpg" or "jpeg" (any case, optional leading dot).
     * @throws std::invalid_argument for anything else.
     */
    TargetFormat parseTargetFormat(const std::string& text);

    /**
     * @brief A sequential prefix must be non-empty and must not contain a path separator.
     */
    bool isValidPrefix(const std::string& prefix);

    bool isValidStartNumber(int number);

} // namespace WebpConvert

#endif // CONVERSION_TYPES_H
