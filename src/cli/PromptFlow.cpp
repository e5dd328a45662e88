#include "PromptFlow.h"
#include "src/utils/Definitions.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fs = std::filesystem;
namespace def = Definitions;

namespace WebpConvert
{
    namespace {

    std::string trim(const std::string& text)
    {
        auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c){ return std::isspace(c); });
        auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c){ return std::isspace(c); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    } // namespace

    PromptFlow::PromptFlow(std::istream& in, std::ostream& out, fs::path executableDir)
        : m_in(in), m_out(out), m_executableDir(std::move(executableDir))
    {
    }

    std::string PromptFlow::cleanPath(const std::string& text)
    {
        std::string path = trim(text);
        if (path.size() >= 2 && (path.front() == '"' || path.front() == '\'') && path.back() == path.front()) {
            path = path.substr(1, path.size() - 2);
        }
        return path;
    }

    std::string PromptFlow::ask(const std::string& question)
    {
        m_out << question << std::flush;
        std::string line;
        if (!std::getline(m_in, line)) {
            m_out << std::endl;
            return std::string();
        }
        return trim(line);
    }

    bool PromptFlow::askYesNo(const std::string& question, bool defaultValue)
    {
        std::string answer = ask(question);
        std::transform(answer.begin(), answer.end(), answer.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (answer.empty()) {
            return defaultValue;
        }
        return answer == "y" || answer == "yes";
    }

    ConversionRequest PromptFlow::run()
    {
        ConversionRequest request;

        m_out << def::APP_TITLE << "\n" << std::string(40, '=') << "\n";

        std::string folder = cleanPath(ask("Enter the path to the folder containing images to convert (press Enter for current directory): "));
        request.sourceFolder = folder.empty() ? fs::path(".") : fs::path(folder);

        m_out << "\nChoose output format:\n"
              << "1. PNG (preserve transparency, default)\n"
              << "2. JPEG (smaller, no transparency)\n";
        request.targetFormat = ask("Convert to (1=PNG, 2=JPEG)? [1]: ") == "2" ? TargetFormat::JPEG : TargetFormat::PNG;
        if (request.targetFormat == TargetFormat::PNG) {
            request.preserveTransparency = askYesNo("Preserve transparency? (Y/n): ", true);
        }

        const std::string ext = extensionFor(request.targetFormat);
        m_out << "\nRenaming options:\n"
              << "1. Rename files with sequential numbers (" << def::DEFAULT_PREFIX << "_001" << ext << " etc.)\n"
              << "2. Keep original filenames (just convert format)\n";
        request.namingPolicy = ask("Choose option (1 or 2): ") == "2" ? NamingPolicy::KEEP_ORIGINAL_NAME
                                                                      : NamingPolicy::SEQUENTIAL_NUMBERING;

        m_out << "\nOutput options:\n"
              << "1. Convert in place (write next to the original files)\n"
              << "2. Create '" << def::CONVERTED_DIR_NAME << "' folder in program directory\n"
              << "3. Specify custom output folder\n";
        const std::string outputChoice = ask("Choose option (1, 2, or 3): ");
        if (outputChoice == "2") {
            request.destinationFolder = m_executableDir / def::CONVERTED_DIR_NAME;
        } else if (outputChoice == "3") {
            std::string output = cleanPath(ask("Enter the path where converted images should be saved (press Enter for default location): "));
            if (!output.empty()) {
                request.destinationFolder = output;
            }
        }

        request.deleteOriginalsOnSuccess = askYesNo("Delete original files after conversion? (y/n): ", false);

        if (request.namingPolicy == NamingPolicy::SEQUENTIAL_NUMBERING) {
            std::string prefix = ask("Enter filename prefix (default: '" + def::DEFAULT_PREFIX + "'): ");
            if (isValidPrefix(prefix)) {
                request.prefix = prefix;
            } else if (!prefix.empty()) {
                m_out << "Invalid prefix, using default: " << def::DEFAULT_PREFIX << "\n";
            }
            std::string start = ask("Enter starting number (default: " + std::to_string(def::DEFAULT_START_NUMBER) + "): ");
            if (!start.empty()) {
                try {
                    std::size_t used = 0;
                    int number = std::stoi(start, &used);
                    if (used != start.size() || !isValidStartNumber(number)) {
                        throw std::invalid_argument(start);
                    }
                    request.startNumber = number;
                } catch (const std::logic_error&) {
                    m_out << "Invalid number, using default: " << def::DEFAULT_START_NUMBER << "\n";
                    request.startNumber = def::DEFAULT_START_NUMBER;
                }
            }
        }
        m_out << std::endl;
        return request;
    }

} // namespace WebpConvert
