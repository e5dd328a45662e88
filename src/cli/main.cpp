#include "CliRunner.h"
#include "PromptFlow.h"
#include "src/utils/ArgParser.h"

#include <iostream>

using namespace WebpConvert;

int main(int argc, char** argv)
{
    ArgParser parser;
    ArgParser::Arguments args;
    try {
        args = parser.parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << parser.help() << std::endl;
        return 1;
    }

    if (args.showHelp) {
        std::cout << parser.help() << std::endl;
        return 0;
    }

    ConversionRequest request = args.request;
    if (args.interactive) {
        PromptFlow prompts(std::cin, std::cout, ArgParser::executableDirectory(argv[0]));
        request = prompts.run();
    }

    return runConversion(request, std::cout, std::cerr);
}
