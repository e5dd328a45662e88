#ifndef PROMPT_FLOW_H
#define PROMPT_FLOW_H

#include <filesystem>
#include <iostream>
#include <string>

#include "src/core/ConversionTypes.h"

namespace WebpConvert
{
    /**
     * @brief Interactive question sequence used when the CLI is started
     * without arguments. Pressing Enter accepts each default.
     */
    class PromptFlow
    {
    public:
        /**
         * @param executableDir Parent of the "converted" folder offered as an output option.
         */
        PromptFlow(std::istream& in, std::ostream& out, std::filesystem::path executableDir);

        ConversionRequest run();

        /**
         * @brief Trims whitespace and one pair of surrounding quotes.
         */
        static std::string cleanPath(const std::string& text);

    private:
        std::string ask(const std::string& question);
        bool askYesNo(const std::string& question, bool defaultValue);

        std::istream& m_in;
        std::ostream& m_out;
        std::filesystem::path m_executableDir;
    };

} // namespace WebpConvert

#endif // PROMPT_FLOW_H
