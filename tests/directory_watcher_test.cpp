#include <gtest/gtest.h>
#include "core/directory_watcher.hpp"
#include "test_base.hpp"
#include <map>

using namespace std::chrono_literals;

class DirectoryWatcherTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        fs::create_directories(path("watch"));
    }

    WatchedPath watched(bool recursive = true)
    {
        WatchedPath w;
        w.root = path("watch");
        w.recursive = recursive;
        w.file_patterns = {"*.mkv", "*.mp4"};
        return w;
    }

    DirectoryWatcher::DiscoveryCallback recorder()
    {
        return [this](const DiscoveredFile &file)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_[file.path]++;
            roots_[file.path] = file.watch_root;
        };
    }

    int timesSeen(const std::string &p)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = seen_.find(p);
        return it == seen_.end() ? 0 : it->second;
    }

    size_t distinctSeen()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.size();
    }

    RecordingEventSink events;
    std::mutex mutex_;
    std::map<std::string, int> seen_;
    std::map<std::string, std::string> roots_;
};

TEST_F(DirectoryWatcherTest, InitialScanReportsMatchingFiles)
{
    std::string a = writeFile("watch/a.mp4");
    std::string b = writeFile("watch/season1/b.MKV");
    writeFile("watch/notes.txt");
    writeFile("watch/c.mkv.part");

    DirectoryWatcher watcher({watched()}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    ASSERT_TRUE(waitUntil([this]
                          { return distinctSeen() >= 2; }));
    std::this_thread::sleep_for(100ms);
    watcher.stop();

    EXPECT_EQ(timesSeen(a), 1);
    EXPECT_EQ(timesSeen(b), 1);
    EXPECT_EQ(distinctSeen(), 2u);
    EXPECT_EQ(roots_[a], path("watch"));
}

TEST_F(DirectoryWatcherTest, NonRecursiveRootIgnoresSubdirectories)
{
    std::string a = writeFile("watch/a.mp4");
    writeFile("watch/sub/b.mp4");

    DirectoryWatcher watcher({watched(false)}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    ASSERT_TRUE(waitUntil([this]
                          { return distinctSeen() >= 1; }));
    std::this_thread::sleep_for(100ms);
    watcher.stop();

    EXPECT_EQ(timesSeen(a), 1);
    EXPECT_EQ(distinctSeen(), 1u);
}

TEST_F(DirectoryWatcherTest, LiveEventsAreReportedOnceDespiteManyWrites)
{
    DirectoryWatcher watcher({watched()}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    std::this_thread::sleep_for(100ms);

    std::string file = path("watch/new.mp4");
    {
        std::ofstream out(file);
        for (int i = 0; i < 20; ++i)
        {
            out << std::string(1024, 'x');
            out.flush();
        }
    }
    std::string nested = writeFile("watch/later/deep/ep.mkv");

    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(file) == 1 && timesSeen(nested) == 1; }));
    std::this_thread::sleep_for(100ms);
    watcher.stop();

    EXPECT_EQ(timesSeen(file), 1);
    EXPECT_EQ(timesSeen(nested), 1);
}

TEST_F(DirectoryWatcherTest, ForgottenPathIsReportedAgain)
{
    std::string file = writeFile("watch/a.mp4");
    DirectoryWatcher watcher({watched()}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(file) == 1; }));
    EXPECT_TRUE(watcher.isKnown(file));

    watcher.forget(file);
    EXPECT_FALSE(watcher.isKnown(file));
    std::ofstream(file, std::ios::app) << "more";

    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(file) == 2; }));
    watcher.stop();
}

TEST_F(DirectoryWatcherTest, IgnoredAndOutputPathsAreNeverReported)
{
    DirectoryWatcher watcher({watched()}, "converted", 0ms, events);
    watcher.ignore(path("watch/result.mkv"));
    ASSERT_TRUE(watcher.start(recorder()));
    std::this_thread::sleep_for(100ms);

    writeFile("watch/result.mkv");
    writeFile("watch/converted/out.mkv");
    writeFile("watch/tmp.mkv.part");
    std::string real = writeFile("watch/real.mp4");

    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(real) == 1; }));
    std::this_thread::sleep_for(100ms);
    watcher.stop();
    EXPECT_EQ(distinctSeen(), 1u);
}

TEST_F(DirectoryWatcherTest, MissingRootIsSkippedAndOthersStillWork)
{
    WatchedPath missing = watched();
    missing.root = path("does-not-exist");
    std::string file = writeFile("watch/a.mp4");

    DirectoryWatcher watcher({missing, watched()}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(file) == 1; }));
    watcher.stop();
    EXPECT_GE(events.count("watcher", "Watched path missing"), 1u);
}

TEST_F(DirectoryWatcherTest, RescanPicksUpRootCreatedLater)
{
    WatchedPath later = watched();
    later.root = path("later");

    DirectoryWatcher watcher({later}, "", 50ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    std::this_thread::sleep_for(100ms);

    std::string file = writeFile("later/a.mp4");
    ASSERT_TRUE(waitUntil([&]
                          { return timesSeen(file) == 1; }));
    watcher.stop();
    EXPECT_EQ(events.count("watcher", "Watched path restored"), 1u);
}

TEST_F(DirectoryWatcherTest, DisabledRootIsNotScanned)
{
    WatchedPath disabled = watched();
    disabled.enabled = false;
    writeFile("watch/a.mp4");

    DirectoryWatcher watcher({disabled}, "", 0ms, events);
    ASSERT_TRUE(watcher.start(recorder()));
    std::this_thread::sleep_for(150ms);
    watcher.stop();
    EXPECT_EQ(distinctSeen(), 0u);
}

TEST(DirectoryWatcherOutputDirTest, ResolvesRelativeToRoot)
{
    EXPECT_EQ(DirectoryWatcher::resolveOutputDir("", "/w"), "");
    EXPECT_EQ(DirectoryWatcher::resolveOutputDir("../converted", "/w/in"), "/w/converted");
    EXPECT_EQ(DirectoryWatcher::resolveOutputDir("/out/", "/w"), "/out");
}
