#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Glob.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return listFilesInternal(dir_path, recursive);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            std::error_code ec;
                            if (entry.is_regular_file(ec))
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_symlink())
                    {
                        continue;
                    }
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // A subdirectory may vanish or be unreadable; the rest of the tree is still scanned
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.mode = static_cast<uint32_t>(st.st_mode & 07777);
    return metadata;
}

bool FileUtils::matchesAnyPattern(const std::string &file_name, const std::vector<std::string> &patterns)
{
    for (const auto &pattern : patterns)
    {
        try
        {
            Poco::Glob glob(pattern, Poco::Glob::GLOB_CASELESS);
            if (glob.match(file_name))
            {
                return true;
            }
        }
        catch (const Poco::Exception &e)
        {
            Logger::warn("Invalid file pattern '" + pattern + "': " + e.displayText());
        }
    }
    return false;
}

std::string FileUtils::normalizePath(const std::string &path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec)
    {
        absolute = fs::path(path);
    }
    std::string normal = absolute.lexically_normal().string();
    // "/a/b/" and "/a/b" must produce the same key
    while (normal.size() > 1 && normal.back() == '/')
    {
        normal.pop_back();
    }
    return normal;
}

bool FileUtils::isUnder(const std::string &path, const std::string &dir)
{
    std::string p = normalizePath(path);
    std::string d = normalizePath(dir);
    if (p == d)
    {
        return true;
    }
    if (d == "/")
    {
        return true;
    }
    return p.size() > d.size() && p.compare(0, d.size(), d) == 0 && p[d.size()] == '/';
}

bool FileUtils::copyAttributes(const std::string &source, const std::string &target,
                               bool permissions, bool timestamps, std::string &error)
{
    struct stat st;
    if (stat(source.c_str(), &st) != 0)
    {
        error = "stat " + source + ": " + std::strerror(errno);
        return false;
    }

    bool ok = true;
    if (permissions && chmod(target.c_str(), st.st_mode & 07777) != 0)
    {
        error = "chmod " + target + ": " + std::strerror(errno);
        ok = false;
    }
    if (timestamps)
    {
        struct timespec times[2] = {st.st_atim, st.st_mtim};
        if (utimensat(AT_FDCWD, target.c_str(), times, 0) != 0)
        {
            error = "utimensat " + target + ": " + std::strerror(errno);
            ok = false;
        }
    }
    return ok;
}
