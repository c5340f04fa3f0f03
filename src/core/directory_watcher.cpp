#include "core/directory_watcher.hpp"
#include "core/file_utils.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace
{
    const char *COMPONENT = "watcher";
    const char *PART_SUFFIX = ".part";

    constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO |
                                    IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

DirectoryWatcher::DirectoryWatcher(std::vector<WatchedPath> watch_paths, std::string output_dir,
                                   std::chrono::milliseconds rescan_interval, EventSink &events)
    : watch_paths_(std::move(watch_paths)), rescan_interval_(rescan_interval), events_(events)
{
    for (auto &watched : watch_paths_)
    {
        watched.root = FileUtils::normalizePath(watched.root);
        excluded_dirs_.push_back(resolveOutputDir(output_dir, watched.root));
    }
    root_armed_.assign(watch_paths_.size(), false);
}

DirectoryWatcher::~DirectoryWatcher()
{
    stop();
}

std::string DirectoryWatcher::resolveOutputDir(const std::string &output_dir, const std::string &root)
{
    if (output_dir.empty())
    {
        return "";
    }
    fs::path out(output_dir);
    if (out.is_relative())
    {
        out = fs::path(root) / out;
    }
    return FileUtils::normalizePath(out.string());
}

bool DirectoryWatcher::start(DiscoveryCallback callback)
{
    if (running_.load())
    {
        return true;
    }
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
    {
        events_.error(COMPONENT, "inotify_init1 failed", {{"error", std::strerror(errno)}});
        return false;
    }
    callback_ = std::move(callback);
    stop_requested_.store(false);
    running_.store(true);
    thread_ = std::thread(&DirectoryWatcher::run, this);
    return true;
}

void DirectoryWatcher::stop()
{
    stop_requested_.store(true);
    if (thread_.joinable())
    {
        thread_.join();
    }
    if (inotify_fd_ >= 0)
    {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    watches_.clear();
    running_.store(false);
}

void DirectoryWatcher::forget(const std::string &path)
{
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    discovered_.erase(FileUtils::normalizePath(path));
}

void DirectoryWatcher::ignore(const std::string &path)
{
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    discovered_.insert(FileUtils::normalizePath(path));
}

bool DirectoryWatcher::isKnown(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    return discovered_.count(FileUtils::normalizePath(path)) > 0;
}

size_t DirectoryWatcher::discoveredCount() const
{
    std::lock_guard<std::mutex> lock(discovered_mutex_);
    return discovered_.size();
}

void DirectoryWatcher::run()
{
    // Watches first so nothing written during the initial scan is missed
    for (size_t i = 0; i < watch_paths_.size(); ++i)
    {
        if (!watch_paths_[i].enabled)
        {
            continue;
        }
        if (armRoot(i))
        {
            scanRoot(i);
        }
    }
    events_.info(COMPONENT, "Initial scan complete", {{"discovered", discoveredCount()}});

    auto last_rescan = std::chrono::steady_clock::now();
    while (!stop_requested_.load())
    {
        struct pollfd pfd
        {
            inotify_fd_, POLLIN, 0
        };
        int ready = poll(&pfd, 1, 200);
        if (ready < 0 && errno != EINTR)
        {
            events_.error(COMPONENT, "poll on inotify failed", {{"error", std::strerror(errno)}});
            break;
        }
        if (ready > 0)
        {
            processEvents();
        }

        if (rescan_interval_.count() > 0 &&
            std::chrono::steady_clock::now() - last_rescan >= rescan_interval_)
        {
            rescan();
            last_rescan = std::chrono::steady_clock::now();
        }
    }
}

void DirectoryWatcher::rescan()
{
    for (size_t i = 0; i < watch_paths_.size(); ++i)
    {
        if (!watch_paths_[i].enabled || stop_requested_.load())
        {
            continue;
        }
        if (!root_armed_[i])
        {
            if (!FileUtils::isValidDirectory(watch_paths_[i].root) || !armRoot(i))
            {
                continue;
            }
            events_.info(COMPONENT, "Watched path restored", {{"path", watch_paths_[i].root}});
        }
        scanRoot(i);
    }
}

bool DirectoryWatcher::armRoot(size_t root_index)
{
    const auto &root = watch_paths_[root_index].root;
    if (!FileUtils::isValidDirectory(root))
    {
        events_.warn(COMPONENT, "Watched path missing, skipping",
                     {{"path", root}, {"kind", "PATH_LEVEL"}});
        return false;
    }
    addWatchTree(root, root_index);
    bool armed = false;
    for (const auto &[wd, entry] : watches_)
    {
        if (entry.dir == root)
        {
            armed = true;
            break;
        }
    }
    root_armed_[root_index] = armed;
    return armed;
}

void DirectoryWatcher::addWatchTree(const std::string &dir, size_t root_index)
{
    const std::string &excluded = excluded_dirs_[root_index];
    if (!excluded.empty() && FileUtils::isUnder(dir, excluded))
    {
        return;
    }

    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0)
    {
        events_.warn(COMPONENT, "Cannot watch directory",
                     {{"path", dir}, {"error", std::strerror(errno)}, {"kind", "PATH_LEVEL"}});
        return;
    }
    watches_[wd] = WatchEntry{FileUtils::normalizePath(dir), root_index};

    if (!watch_paths_[root_index].recursive)
    {
        return;
    }
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec))
        {
            addWatchTree(it->path().string(), root_index);
        }
    }
}

void DirectoryWatcher::scanRoot(size_t root_index)
{
    const auto &watched = watch_paths_[root_index];
    auto observable = FileUtils::listFilesAsObservable(watched.root, watched.recursive);
    observable.subscribe(
        [this, root_index](const std::string &file_path)
        {
            consider(file_path, root_index);
        },
        [this, &watched](const std::exception &e)
        {
            events_.warn(COMPONENT, "Scan of watched path failed",
                         {{"path", watched.root}, {"error", e.what()}, {"kind", "PATH_LEVEL"}});
        },
        nullptr);
}

void DirectoryWatcher::processEvents()
{
    alignas(struct inotify_event) char buffer[16 * 1024];
    bool overflow = false;

    for (;;)
    {
        ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
        if (len <= 0)
        {
            if (len < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }

        for (char *ptr = buffer; ptr < buffer + len;)
        {
            const auto *event = reinterpret_cast<const struct inotify_event *>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW)
            {
                overflow = true;
                continue;
            }

            auto it = watches_.find(event->wd);
            if (it == watches_.end())
            {
                continue;
            }
            const WatchEntry entry = it->second;
            const bool is_root = entry.dir == watch_paths_[entry.root_index].root;

            if (event->mask & IN_IGNORED)
            {
                watches_.erase(it);
                if (is_root)
                {
                    root_armed_[entry.root_index] = false;
                    events_.warn(COMPONENT, "Watched path vanished",
                                 {{"path", entry.dir}, {"kind", "PATH_LEVEL"}});
                }
                continue;
            }
            if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF))
            {
                // A moved directory keeps its watch; drop it so IN_IGNORED follows
                inotify_rm_watch(inotify_fd_, event->wd);
                continue;
            }
            if (event->len == 0)
            {
                continue;
            }

            std::string full_path = entry.dir + "/" + event->name;
            if (event->mask & IN_ISDIR)
            {
                if ((event->mask & (IN_CREATE | IN_MOVED_TO)) && watch_paths_[entry.root_index].recursive)
                {
                    addWatchTree(full_path, entry.root_index);
                    // Files may have landed before the watch existed
                    FileUtils::scanDirectoryRecursively(full_path, [this, &entry](const std::string &file_path)
                                                        { consider(file_path, entry.root_index); });
                }
                continue;
            }
            if (event->mask & (IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO))
            {
                consider(full_path, entry.root_index);
            }
        }
    }

    if (overflow)
    {
        events_.warn(COMPONENT, "inotify queue overflow, rescanning");
        rescan();
    }
}

void DirectoryWatcher::consider(const std::string &path, size_t root_index)
{
    if (stop_requested_.load())
    {
        return;
    }
    std::string normal = FileUtils::normalizePath(path);
    if (endsWith(normal, PART_SUFFIX))
    {
        return;
    }
    const std::string &excluded = excluded_dirs_[root_index];
    if (!excluded.empty() && FileUtils::isUnder(normal, excluded))
    {
        return;
    }
    const auto &watched = watch_paths_[root_index];
    if (!FileUtils::matchesAnyPattern(fs::path(normal).filename().string(), watched.file_patterns))
    {
        return;
    }
    auto metadata = FileUtils::getFileMetadata(normal);
    if (!metadata)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(discovered_mutex_);
        if (!discovered_.insert(normal).second)
        {
            return;
        }
    }

    DiscoveredFile file;
    file.path = normal;
    file.size = metadata->file_size;
    file.first_seen = std::chrono::system_clock::now();
    file.watch_root = watched.root;

    events_.debug(COMPONENT, "File discovered", {{"path", normal}, {"size", file.size}});
    if (callback_)
    {
        try
        {
            callback_(file);
        }
        catch (const std::exception &e)
        {
            events_.error(COMPONENT, "Discovery handler failed", {{"path", normal}, {"error", e.what()}});
        }
    }
}
