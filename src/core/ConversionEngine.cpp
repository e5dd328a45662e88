#include "ConversionEngine.h"
#include "FileSystemUtil.h"
#include "ImageUtil.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
namespace def = Definitions;

namespace WebpConvert
{
    ConversionEngine::ConversionEngine(LogCallback logger)
        : m_logger(std::move(logger))
    {
    }

    void ConversionEngine::log(LogLevel level, const std::string& message) const
    {
        if (m_logger) {
            m_logger(level, message);
        } else if (level == LogLevel::INFO) {
            std::cout << message << std::endl;
        } else {
            std::cerr << message << std::endl;
        }
    }

    std::string ConversionEngine::sequentialName(const std::string& prefix, int number, const std::string& extension)
    {
        std::ostringstream name;
        name << prefix << '_' << std::setw(def::SEQUENCE_PAD_WIDTH) << std::setfill('0') << number << extension;
        return name.str();
    }

    int ConversionEngine::highestSequenceNumber(const fs::path& directory,
                                                const std::string& prefix,
                                                const std::string& extension)
    {
        const std::string head = prefix + "_";
        int highest = 0;

        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            return 0;
        }
        const fs::directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            const fs::path& p = it->path();
            if (!it->is_regular_file(ec) || !FileSystemUtil::hasExtension(p, {extension})) {
                continue;
            }
            const std::string stem = p.stem().string();
            if (stem.size() <= head.size() || stem.compare(0, head.size(), head) != 0) {
                continue;
            }
            const std::string digits = stem.substr(head.size());
            // Anything longer would not fit an int
            if (digits.size() > 9 || !std::all_of(digits.begin(), digits.end(),
                    [](unsigned char c){ return std::isdigit(c) != 0; })) {
                continue;
            }
            highest = std::max(highest, std::stoi(digits));
        }
        return highest;
    }

    void ConversionEngine::validateRequest(const ConversionRequest& request)
    {
        if (request.namingPolicy != NamingPolicy::SEQUENTIAL_NUMBERING) {
            return;
        }
        if (!isValidPrefix(request.prefix)) {
            throw FatalConfigurationError("Prefix '" + request.prefix + "' is empty or contains a path separator.");
        }
        if (!isValidStartNumber(request.startNumber)) {
            throw FatalConfigurationError("Start number " + std::to_string(request.startNumber) +
                " is outside 0-" + std::to_string(def::MAX_START_NUMBER) + ".");
        }
    }

    std::vector<fs::path> ConversionEngine::collectSources(const fs::path& source)
    {
        std::error_code ec;
        if (source.empty() || !fs::exists(source, ec)) {
            throw FatalConfigurationError("Source folder '" + source.string() + "' does not exist.");
        }
        if (!fs::is_directory(source, ec)) {
            throw FatalConfigurationError("Source path '" + source.string() + "' is not a directory.");
        }

        std::vector<fs::path> entries = FileSystemUtil::listEntriesByExtension(source, def::SOURCE_IMG_EXTENSIONS, ec);
        if (ec) {
            throw FatalConfigurationError("Source folder '" + source.string() + "' cannot be read: " + ec.message());
        }
        return entries;
    }

    fs::path ConversionEngine::prepareDestination(const ConversionRequest& request)
    {
        fs::path destination = request.destinationFolder.empty() ? request.sourceFolder : request.destinationFolder;
        std::error_code ec;
        const bool existed = fs::exists(destination, ec);
        std::string reason;
        if (!FileSystemUtil::createDirectory(destination, reason)) {
            throw FatalConfigurationError("Destination folder '" + destination.string() + "' cannot be created: " + reason);
        }
        if (!existed) {
            log(LogLevel::INFO, "Created directory: " + destination.string());
        }

        if (request.namingPolicy == NamingPolicy::KEEP_ORIGINAL_NAME &&
            FileSystemUtil::pathsEquivalent(request.sourceFolder, destination)) {
            log(LogLevel::WARNING, "Warning: converting in place - existing " + extensionFor(request.targetFormat) +
                " files with the same names as the sources will be overwritten.");
        }
        return destination;
    }

    int ConversionEngine::firstSequenceNumber(const ConversionRequest& request, const fs::path& destination)
    {
        if (!request.continueNumbering) {
            return request.startNumber;
        }
        const int highest = highestSequenceNumber(destination, request.prefix, extensionFor(request.targetFormat));
        if (highest >= request.startNumber) {
            log(LogLevel::INFO, "Continuing numbering after existing " + sequentialName(request.prefix, highest,
                extensionFor(request.targetFormat)));
            return highest + 1;
        }
        return request.startNumber;
    }

    ConversionResult ConversionEngine::convertOne(const fs::path& sourcePath,
                                                  const fs::path& outputPath,
                                                  const ConversionRequest& request)
    {
        ConversionResult result;
        result.sourcePath = sourcePath;

        try {
            cv::Mat img = ImageUtil::decodeImage(sourcePath);
            cv::Mat prepared = ImageUtil::prepareForFormat(img, request.targetFormat, request.preserveTransparency);
            std::vector<std::uint8_t> bytes = ImageUtil::encodeImage(prepared, request.targetFormat, request.jpegQuality);
            FileSystemUtil::writeFile(outputPath, bytes);

            result.outputPath = outputPath;
            result.status = ConversionStatus::CONVERTED;
        } catch (const ConverterException& e) {
            result.status = ConversionStatus::FAILED;
            result.errorDetail = e.what();
        } catch (const cv::Exception& e) {
            result.status = ConversionStatus::FAILED;
            result.errorDetail = std::string("image processing failed: ") + e.what();
        } catch (const std::exception& e) {
            result.status = ConversionStatus::FAILED;
            result.errorDetail = e.what();
        }
        return result;
    }

    ConversionSummary ConversionEngine::convert(const ConversionRequest& request)
    {
        validateRequest(request);
        // Source problems are reported before the destination is created
        std::vector<fs::path> entries = collectSources(request.sourceFolder);

        ConversionSummary summary;
        summary.destinationFolder = prepareDestination(request);

        if (entries.empty()) {
            log(LogLevel::INFO, "No WebP files found in '" + request.sourceFolder.string() + "'.");
            return summary;
        }
        log(LogLevel::INFO, "Found " + std::to_string(entries.size()) + " image files to process.");

        const std::string extension = extensionFor(request.targetFormat);
        int counter = request.namingPolicy == NamingPolicy::SEQUENTIAL_NUMBERING
                          ? firstSequenceNumber(request, summary.destinationFolder)
                          : request.startNumber;

        std::error_code ec;
        for (const auto& entry : entries) {
            const std::string name = entry.filename().string();

            if (!fs::is_regular_file(entry, ec)) {
                ConversionResult skipped;
                skipped.sourcePath = entry;
                skipped.status = ConversionStatus::SKIPPED_NOT_AN_IMAGE;
                log(LogLevel::WARNING, "Skipping " + name + " - not a regular file");
                summary.skipped++;
                summary.results.push_back(std::move(skipped));
                continue;
            }

            const std::string outputName = request.namingPolicy == NamingPolicy::SEQUENTIAL_NUMBERING
                                               ? sequentialName(request.prefix, counter, extension)
                                               : entry.stem().string() + extension;
            const fs::path outputPath = summary.destinationFolder / outputName;

            ConversionResult result = convertOne(entry, outputPath, request);

            if (result.status == ConversionStatus::CONVERTED) {
                log(LogLevel::INFO, "Converted: " + name + " -> " + outputName);
                summary.converted++;
                if (request.namingPolicy == NamingPolicy::SEQUENTIAL_NUMBERING) {
                    counter++;
                }

                if (request.deleteOriginalsOnSuccess) {
                    std::string reason;
                    if (!FileSystemUtil::deleteFile(entry, reason)) {
                        result.warning = "could not delete original file " + name + ": " + reason;
                        log(LogLevel::WARNING, "Warning: " + result.warning);
                        summary.deletionWarnings++;
                    }
                }
            } else {
                log(LogLevel::ERROR, "Error processing " + name + ": " + result.errorDetail);
                summary.failed++;
            }
            summary.results.push_back(std::move(result));
        }

        log(LogLevel::INFO, "Processing complete! Converted " + std::to_string(summary.converted) +
            ", skipped " + std::to_string(summary.skipped) +
            ", failed " + std::to_string(summary.failed) + ".");
        return summary;
    }

} // namespace WebpConvert
