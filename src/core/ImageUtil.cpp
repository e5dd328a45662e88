#include "ImageUtil.h"

#include <algorithm>
#include <string>

namespace fs = std::filesystem;

namespace WebpConvert
{
    cv::Mat ImageUtil::decodeImage(const fs::path& imagePath)
    {
        cv::Mat img;
        try {
            img = cv::imread(imagePath.string(), cv::IMREAD_UNCHANGED);
        } catch (const cv::Exception& e) {
            throw DecodeFailure("failed to decode '" + imagePath.filename().string() + "': " + e.what());
        }
        if (img.empty()) {
            throw DecodeFailure("'" + imagePath.filename().string() + "' is not a readable image");
        }

        // Keep everything downstream on 8-bit data
        if (img.depth() == CV_16U) {
            img.convertTo(img, CV_8U, 1.0 / 257.0);
        } else if (img.depth() != CV_8U) {
            img.convertTo(img, CV_8U);
        }
        return img;
    }

    cv::Mat ImageUtil::flattenAlpha(const cv::Mat& src, const cv::Scalar& background)
    {
        if (src.channels() == 1) {
            cv::Mat bgr;
            cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR);
            return bgr;
        }
        if (src.channels() != 4) {
            return src.clone();
        }

        std::vector<cv::Mat> channels;
        cv::split(src, channels);

        cv::Mat alpha;
        channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
        cv::Mat inverse = 1.0 - alpha;

        // dst = src * alpha + bg * (1 - alpha), per channel
        std::vector<cv::Mat> blended(3);
        for (int i = 0; i < 3; ++i) {
            cv::Mat colour;
            channels[i].convertTo(colour, CV_32F);
            cv::Mat mixed = colour.mul(alpha) + inverse * background[i];
            mixed.convertTo(blended[i], CV_8U);
        }

        cv::Mat dst;
        cv::merge(blended, dst);
        return dst;
    }

    cv::Mat ImageUtil::prepareForFormat(const cv::Mat& img, TargetFormat format, bool preserveTransparency)
    {
        if (format == TargetFormat::PNG && preserveTransparency) {
            return img;
        }
        return flattenAlpha(img);
    }

    std::vector<std::uint8_t> ImageUtil::encodeImage(const cv::Mat& img, TargetFormat format, int jpegQuality)
    {
        std::vector<int> params;
        if (format == TargetFormat::JPEG) {
            params = {
                cv::IMWRITE_JPEG_QUALITY, std::clamp(jpegQuality, 1, 100),
                cv::IMWRITE_JPEG_OPTIMIZE, 1
            };
        } else {
            params = { cv::IMWRITE_PNG_COMPRESSION, Definitions::DEFAULT_PNG_COMPRESSION };
        }

        std::vector<uchar> buffer;
        try {
            if (!cv::imencode(extensionFor(format), img, buffer, params)) {
                throw EncodeOrWriteFailure("OpenCV could not encode image as " + toString(format));
            }
        } catch (const cv::Exception& e) {
            throw EncodeOrWriteFailure(std::string("encoding as ") + toString(format) + " failed: " + e.what());
        }
        return std::vector<std::uint8_t>(buffer.begin(), buffer.end());
    }

} // namespace WebpConvert
