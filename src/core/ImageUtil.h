#ifndef IMAGE_UTIL_H
#define IMAGE_UTIL_H

#include <cstdint>
#include <filesystem>
#include <vector>
#include <opencv2/opencv.hpp> // Requires OpenCV dependency

#include "ConversionTypes.h"

namespace WebpConvert
{
    // Decode/encode helpers over OpenCV's imgcodecs
    class ImageUtil {
    public:
        /**
         * @brief Decodes an image file, keeping its alpha channel if it has one.
         * @return An 8-bit Mat with 1, 3 (BGR) or 4 (BGRA) channels.
         * @throws DecodeFailure if the file is unreadable or not valid image data.
         */
        static cv::Mat decodeImage(const std::filesystem::path& imagePath);

        /**
         * @brief Composites a BGRA image over an opaque background colour.
         * Images without alpha are returned as 3-channel BGR copies.
         */
        static cv::Mat flattenAlpha(const cv::Mat& src, const cv::Scalar& background = cv::Scalar(255, 255, 255));

        /**
         * @brief Prepares a decoded image for the target format.
         *
         * JPEG always gets an opaque BGR image. PNG keeps BGRA when
         * 'preserveTransparency' is set and flattens otherwise.
         */
        static cv::Mat prepareForFormat(const cv::Mat& img, TargetFormat format, bool preserveTransparency);

        /**
         * @brief Encodes an image in memory.
         * @param jpegQuality 1..100, ignored for PNG.
         * @throws EncodeOrWriteFailure if OpenCV rejects the image.
         */
        static std::vector<std::uint8_t> encodeImage(const cv::Mat& img, TargetFormat format, int jpegQuality);

        static bool hasAlpha(const cv::Mat& img) { return img.channels() == 4; }
    };

} // namespace WebpConvert

#endif // IMAGE_UTIL_H
