#include "ArgParser.h"
#include "Definitions.h"
#include <stdexcept>

using namespace std;
namespace def = Definitions;
namespace fs = std::filesystem;
using WebpConvert::ConversionRequest;
using WebpConvert::NamingPolicy;

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options(def::APP_NAME, "Convert WebP images to PNG or JPEG and rename them with simple sequential names.")
{
    m_options.positional_help("FOLDER").show_positional_help();
    addConvertArgs(m_options);
    m_options.parse_positional({"folder"});
}

void ArgParser::addConvertArgs(cxxopts::Options& options) {
    options.add_options()
        ("folder", "Path to the folder containing images", cxxopts::value<std::string>())
        ("o,output", "Output folder path (default: the input folder)", cxxopts::value<std::string>())
        ("f,format", "Output format: png or jpeg", cxxopts::value<std::string>()->default_value("png"))
        ("p,prefix", "Prefix for renamed files", cxxopts::value<std::string>()->default_value(def::DEFAULT_PREFIX))
        ("s,start", "Starting number for sequential naming", cxxopts::value<int>()->default_value(std::to_string(def::DEFAULT_START_NUMBER)))
        ("r,rename", "Rename files with sequential numbers (default)")
        ("no-rename", "Keep original filenames (just convert format)")
        ("no-transparency", "Flatten transparency onto white for PNG output")
        ("create-converted", "Create a 'converted' folder beside the executable and write there")
        ("overwrite", "Delete original files after conversion (default: keep originals)")
        ("q,quality", "JPEG quality (1-100)", cxxopts::value<int>()->default_value(std::to_string(def::DEFAULT_JPEG_QUALITY)))
        ("h,help", "Display this help menu");
}

std::string ArgParser::help() {
    return m_options.help();
}

fs::path ArgParser::executableDirectory(const char* argv0) {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }
    if (argv0 == nullptr || *argv0 == '\0') {
        return fs::current_path();
    }
    return fs::absolute(argv0).parent_path();
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    Arguments args;
    if (argc <= 1) {
        args.interactive = true;
        return args;
    }

    const char* argv0 = argv[0];
    try {
        auto result = m_options.parse(argc, argv);

        if (result.count("help")) {
            args.showHelp = true;
            return args;
        }
        if (!result.count("folder")) {
            throw std::runtime_error("No input folder specified.");
        }
        args.request = mapResults(result, argv0);
        return args;

    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    } catch (const std::runtime_error&) {
        throw;
    } catch (const std::exception& e) {
        // cxxopts parse errors
        throw std::runtime_error(std::string("Error parsing arguments: ") + e.what());
    }
}

ConversionRequest ArgParser::mapResults(const cxxopts::ParseResult& result, const char* argv0) {
    ConversionRequest request;

    if (result.count("rename") && result.count("no-rename")) {
        throw std::runtime_error("--rename and --no-rename cannot be used together.");
    }
    if (result.count("output") && result.count("create-converted")) {
        throw std::runtime_error("--output and --create-converted cannot be used together.");
    }

    request.sourceFolder = result["folder"].as<std::string>();
    if (result.count("output")) {
        request.destinationFolder = result["output"].as<std::string>();
    } else if (result.count("create-converted")) {
        request.destinationFolder = executableDirectory(argv0) / def::CONVERTED_DIR_NAME;
    }

    request.targetFormat = WebpConvert::parseTargetFormat(result["format"].as<std::string>());
    request.preserveTransparency = result.count("no-transparency") == 0;
    request.namingPolicy = result.count("no-rename") ? NamingPolicy::KEEP_ORIGINAL_NAME
                                                      : NamingPolicy::SEQUENTIAL_NUMBERING;
    request.deleteOriginalsOnSuccess = result.count("overwrite") > 0;

    request.prefix = result["prefix"].as<std::string>();
    if (request.prefix.empty()) {
        request.prefix = def::DEFAULT_PREFIX;
    }
    if (!WebpConvert::isValidPrefix(request.prefix)) {
        throw std::runtime_error("--prefix must not contain a path separator.");
    }
    request.startNumber = result["start"].as<int>();
    if (!WebpConvert::isValidStartNumber(request.startNumber)) {
        throw std::runtime_error("--start must be between 0 and " + std::to_string(def::MAX_START_NUMBER) + ".");
    }
    request.jpegQuality = result["quality"].as<int>();
    if (request.jpegQuality < 1 || request.jpegQuality > 100) {
        throw std::runtime_error("--quality must be between 1 and 100.");
    }
    return request;
}
