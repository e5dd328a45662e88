#include "ConversionTypes.h"

#include <algorithm>
#include <cctype>

namespace WebpConvert
{
    std::string toString(TargetFormat format)
    {
        switch (format) {
            case TargetFormat::PNG: return "PNG";
            case TargetFormat::JPEG: return "JPEG";
        }
        return "UNKNOWN";
    }

    std::string toString(ConversionStatus status)
    {
        switch (status) {
            case ConversionStatus::CONVERTED: return "CONVERTED";
            case ConversionStatus::SKIPPED_NOT_AN_IMAGE: return "SKIPPED_NOT_AN_IMAGE";
            case ConversionStatus::FAILED: return "FAILED";
        }
        return "UNKNOWN";
    }

    std::string extensionFor(TargetFormat format)
    {
        return format == TargetFormat::JPEG ? Definitions::JPEG_EXTENSION
                                            : Definitions::PNG_EXTENSION;
    }

    TargetFormat parseTargetFormat(const std::string& text)
    {
        std::string fmt = text;
        if (!fmt.empty() && fmt[0] == '.') {
            fmt.erase(0, 1);
        }
        std::transform(fmt.begin(), fmt.end(), fmt.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

        if (fmt == "png") return TargetFormat::PNG;
        if (fmt == "jpg" || fmt == "jpeg") return TargetFormat::JPEG;
        throw std::invalid_argument("Unsupported output format: '" + text + "' (expected png or jpeg)");
    }

    bool isValidPrefix(const std::string& prefix)
    {
        return !prefix.empty() && prefix.find_first_of("/\\") == std::string::npos;
    }

    bool isValidStartNumber(int number)
    {
        return number >= 0 && number <= Definitions::MAX_START_NUMBER;
    }

} // namespace WebpConvert
