#ifndef FILESYSTEM_UTIL_H
#define FILESYSTEM_UTIL_H

#include <cstdint>
#include <filesystem> // Requires C++17 or later
#include <string>
#include <system_error>
#include <vector>

namespace WebpConvert
{
    class FileSystemUtil {
    public:
        /**
         * @brief Creates a directory (and parents) if it doesn't exist.
         * @param reason Receives the failure reason when false is returned.
         * @return false if the directory could not be created or 'path' names an existing non-directory.
         */
        static bool createDirectory(const std::filesystem::path& path, std::string& reason);

        /**
         * @brief Resolves a path to its absolute, canonical form.
         * Falls back to the absolute form for paths that don't exist yet.
         */
        static std::filesystem::path resolvePath(const std::filesystem::path& path);

        /**
         * @brief True when both paths resolve to the same location.
         */
        static bool pathsEquivalent(const std::filesystem::path& a, const std::filesystem::path& b);

        /**
         * @brief Case-insensitive extension test.
         * @param extensions Lowercase extensions, with or without the leading dot.
         */
        static bool hasExtension(const std::filesystem::path& path, const std::vector<std::string>& extensions);

        /**
         * @brief Lists the direct entries of 'directory' whose extension matches.
         *
         * Entries of any type are returned (directories named "x.webp" included),
         * sorted by filename in ascending byte order. Subdirectories are not descended into.
         *
         * @param ec Set when the directory cannot be read; the returned list is then empty.
         */
        static std::vector<std::filesystem::path> listEntriesByExtension(const std::filesystem::path& directory,
                                                                         const std::vector<std::string>& extensions,
                                                                         std::error_code& ec);

        /**
         * @brief Writes 'data' to 'path', replacing any existing file.
         *
         * The bytes go to a hidden temporary file beside 'path' which is then
         * renamed over it, so a failed write leaves the old file untouched.
         *
         * @throws EncodeOrWriteFailure on any I/O error.
         */
        static void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

        /**
         * @brief Deletes a single file.
         * @param reason Receives the failure reason when false is returned.
         */
        static bool deleteFile(const std::filesystem::path& path, std::string& reason);
    };

} // namespace WebpConvert

#endif // FILESYSTEM_UTIL_H
