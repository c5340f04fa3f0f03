#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <optional>
#include <ctime>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Size, mtime and permission bits of a regular file
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time = 0;
    uint64_t file_size = 0;
    uint32_t mode = 0; // permission bits only
};

/**
 * @brief Filesystem helpers shared by the watcher, gate and executor
 */
class FileUtils
{
public:
    /**
     * @brief stat() a regular file
     * @return nullopt if the path does not exist or is not a regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to descend into subdirectories
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Case-insensitive glob match of the file name against any pattern
     * @param file_name Base name only
     * @param patterns Shell globs such as "*.mkv"; an empty list matches nothing
     */
    static bool matchesAnyPattern(const std::string &file_name, const std::vector<std::string> &patterns);

    /**
     * @brief Lexically normal absolute form used as the de-duplication key
     */
    static std::string normalizePath(const std::string &path);

    /**
     * @brief True if path equals dir or lies below it (lexical comparison)
     */
    static bool isUnder(const std::string &path, const std::string &dir);

    /**
     * @brief Copy permission bits and/or timestamps from source to target
     * @return false if any requested attribute could not be applied
     */
    static bool copyAttributes(const std::string &source, const std::string &target,
                               bool permissions, bool timestamps, std::string &error);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive);
};
