#ifndef CLI_RUNNER_H
#define CLI_RUNNER_H

#include <iostream>

#include "src/core/ConversionTypes.h"

namespace WebpConvert
{
    /**
     * @brief Runs one conversion for the command line and prints its summary.
     *
     * Progress lines go to 'out', warnings and errors to 'err'.
     *
     * @return 0 once the run completes, even with per-file failures;
     *         1 when the run could not start.
     */
    int runConversion(const ConversionRequest& request, std::ostream& out, std::ostream& err);

} // namespace WebpConvert

#endif // CLI_RUNNER_H
