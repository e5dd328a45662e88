#include "FileSystemUtil.h"
#include "ConversionTypes.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace WebpConvert
{
    namespace {

    std::string toLower(std::string str)
    {
        std::transform(str.begin(), str.end(), str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return str;
    }

    } // namespace

    bool FileSystemUtil::createDirectory(const fs::path& path, std::string& reason)
    {
        if (path.empty()) {
            return true;
        }
        std::error_code ec;
        if (fs::exists(path, ec)) {
            if (fs::is_directory(path, ec)) {
                return true;
            }
            reason = "'" + path.string() + "' exists and is not a directory";
            return false;
        }
        fs::create_directories(path, ec);
        if (ec) {
            reason = ec.message();
            return false;
        }
        return true;
    }

    fs::path FileSystemUtil::resolvePath(const fs::path& path)
    {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            fs::path canonical = fs::canonical(path, ec);
            if (!ec) {
                return canonical;
            }
        }
        fs::path absolute = fs::absolute(path, ec);
        if (ec) {
            return path.lexically_normal();
        }
        return absolute.lexically_normal();
    }

    bool FileSystemUtil::pathsEquivalent(const fs::path& a, const fs::path& b)
    {
        std::error_code ec;
        if (fs::exists(a, ec) && fs::exists(b, ec)) {
            bool same = fs::equivalent(a, b, ec);
            if (!ec) {
                return same;
            }
        }
        return resolvePath(a) == resolvePath(b);
    }

    bool FileSystemUtil::hasExtension(const fs::path& path, const std::vector<std::string>& extensions)
    {
        const std::string fileExt = toLower(path.extension().string());
        if (fileExt.empty()) {
            return false;
        }
        for (const auto& ext : extensions) {
            std::string wanted = toLower(ext.find('.') == 0 ? ext : "." + ext);
            if (fileExt == wanted) {
                return true;
            }
        }
        return false;
    }

    std::vector<fs::path> FileSystemUtil::listEntriesByExtension(const fs::path& directory,
                                                                 const std::vector<std::string>& extensions,
                                                                 std::error_code& ec)
    {
        std::vector<fs::path> entries;
        ec.clear();

        fs::directory_iterator it(directory, ec);
        if (ec) {
            return entries;
        }
        const fs::directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            if (hasExtension(it->path(), extensions)) {
                entries.push_back(it->path());
            }
        }
        if (ec) {
            entries.clear();
            return entries;
        }

        std::sort(entries.begin(), entries.end(), [](const fs::path& lhs, const fs::path& rhs) {
            return lhs.filename().string() < rhs.filename().string();
        });
        return entries;
    }

    void FileSystemUtil::writeFile(const fs::path& path, const std::vector<std::uint8_t>& data)
    {
        const fs::path temp = path.parent_path() / ("." + path.filename().string() + ".tmp");
        std::error_code ec;

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw EncodeOrWriteFailure("cannot open '" + path.string() + "' for writing: " + std::strerror(errno));
            }
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            out.close();
            if (!out) {
                fs::remove(temp, ec);
                throw EncodeOrWriteFailure("failed writing '" + path.string() + "'");
            }
        }

        fs::rename(temp, path, ec);
        if (ec) {
            const std::string reason = ec.message();
            fs::remove(temp, ec);
            throw EncodeOrWriteFailure("cannot replace '" + path.string() + "': " + reason);
        }
    }

    bool FileSystemUtil::deleteFile(const fs::path& path, std::string& reason)
    {
        std::error_code ec;
        if (!fs::remove(path, ec)) {
            reason = ec ? ec.message() : "file no longer exists";
            return false;
        }
        return true;
    }

} // namespace WebpConvert
