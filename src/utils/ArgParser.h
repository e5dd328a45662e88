#ifndef ARG_PARSER_H
#define ARG_PARSER_H

#include <filesystem>
#include <string>
#include "cxxopts.hpp" // Requires cxxopts dependency

#include "src/core/ConversionTypes.h"

/**
 * @brief Utility class to parse command line arguments using cxxopts.
 */
class ArgParser {
public:
    /**
     * @brief Result of a parse: either a request to run, help, or the interactive flow.
     */
    struct Arguments {
        bool showHelp = false;
        // No arguments at all: the caller should prompt for everything
        bool interactive = false;
        WebpConvert::ConversionRequest request;
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws std::runtime_error on unknown options, bad values or conflicting flags.
     */
    Arguments parseArgs(int argc, char** argv);

    std::string help();

    /**
     * @brief Directory of the running executable, used by --create-converted.
     */
    static std::filesystem::path executableDirectory(const char* argv0);

private:
    cxxopts::Options m_options;

    void addConvertArgs(cxxopts::Options& options);

    /**
     * @brief Maps cxxopts results onto a ConversionRequest.
     */
    WebpConvert::ConversionRequest mapResults(const cxxopts::ParseResult& result, const char* argv0);
};

#endif // ARG_PARSER_H
