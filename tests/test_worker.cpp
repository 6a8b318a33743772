#include <gtest/gtest.h>
#include "fifo/client.hpp"
#include "fifo/errors.hpp"
#include "fifo/pipe.hpp"
#include "fifo/worker.hpp"
#include "temp_dir.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

class WorkerTest : public ::testing::Test {
protected:
    //  Opens the write end as soon as the worker listens
    FifoHandle WaitForReader(const std::string& path) {
        for (int i = 0; i < 500; ++i) {
            int err = 0;
            FifoHandle fifo = open_fifo_write(path, &err);
            if (fifo.is_open())
                return fifo;
            std::this_thread::sleep_for(10ms);
        }
        return FifoHandle();
    }

    TempDir root_;
    std::vector<std::pair<std::string, std::string>> received_;
};

TEST_F(WorkerTest, RoundTripDeliversWithLogicalName) {
    FifoWorker worker("bus.fifo", root_.path(), 9999);
    int idle = 0;

    worker.subscribe([&idle](const std::string&, const std::string&) { ++idle; }, "");
    worker.subscribe([this, &worker](const std::string& message, const std::string& origin) {
        received_.push_back({message, origin});
        worker.quit();
    }, "hello");

    std::thread runner([&worker] { worker.run(10ms); });

    FifoClient client("bus.fifo", root_.path(), 500, 10ms, true);
    EXPECT_TRUE(client.write("hello"));

    runner.join();

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].first, "hello");
    EXPECT_EQ(received_[0].second, "bus.fifo");
}

TEST_F(WorkerTest, CreatesPipeLazily) {
    FifoWorker worker("lazy.fifo", root_.path());
    const std::string path = root_.file("lazy.fifo");

    struct stat st;
    EXPECT_NE(stat(path.c_str(), &st), 0);

    worker.subscribe(worker.quit_handler());
    worker.run(10ms);

    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_TRUE(S_ISFIFO(st.st_mode));
}

TEST_F(WorkerTest, IdleTickDispatchesOneEmptyMessage) {
    FifoWorker worker("idle.fifo", root_.path());
    int wildcard = 0;

    worker.subscribe([this, &worker](const std::string& message, const std::string& origin) {
        received_.push_back({message, origin});
        worker.quit();
    }, "");
    worker.subscribe([&wildcard](const std::string&, const std::string&) { ++wildcard; });

    worker.run(10ms);

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].first, "");
    EXPECT_EQ(received_[0].second, "idle.fifo");
    EXPECT_EQ(wildcard, 0);
}

TEST_F(WorkerTest, RegularFileIsRejectedUntouched) {
    const std::string path = root_.file("plain.fifo");
    {
        std::ofstream out(path);
        out << "hello\n";
    }

    FifoWorker worker("plain.fifo", root_.path());
    bool called = false;
    worker.subscribe([&called](const std::string&, const std::string&) { called = true; });

    EXPECT_THROW(worker.run(10ms), NotFifoError);
    EXPECT_FALSE(called);
}

TEST_F(WorkerTest, NothingIsDispatchedAfterQuit) {
    FifoWorker worker("quit.fifo", root_.path());
    const std::string path = root_.file("quit.fifo");

    worker.subscribe([](const std::string&, const std::string&) {}, "");
    worker.subscribe(worker.quit_handler(), "quit");
    worker.subscribe([this](const std::string& message, const std::string& origin) {
        received_.push_back({message, origin});
    });

    std::thread runner([&worker] { EXPECT_NO_THROW(worker.run(10ms)); });

    FifoHandle writer = WaitForReader(path);
    ASSERT_TRUE(writer.is_open());

    //  One write: the worker sees all three lines in the same batch
    const std::string batch = "before\nquit\nafter\n";
    ASSERT_EQ(write(writer.fd(), batch.data(), batch.size()), static_cast<ssize_t>(batch.size()));

    runner.join();

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].first, "before");
}

TEST_F(WorkerTest, QuitFromAnotherThread) {
    FifoWorker worker("remote.fifo", root_.path());
    std::atomic<int> ticks{0};

    worker.subscribe([&ticks](const std::string&, const std::string&) { ++ticks; }, "");

    std::thread runner([&worker] { worker.run(10ms); });

    while (ticks < 3)
        std::this_thread::sleep_for(5ms);

    worker.quit();
    runner.join();

    //  Cleared for the next run
    EXPECT_FALSE(worker.quitting());
}

TEST_F(WorkerTest, QuitBeforeRunIsKept) {
    FifoWorker worker("early.fifo", root_.path());
    int dispatched = 0;

    worker.subscribe([&dispatched](const std::string&, const std::string&) { ++dispatched; });

    worker.quit();
    EXPECT_TRUE(worker.quitting());

    worker.run(10ms);
    EXPECT_EQ(dispatched, 0);
    EXPECT_FALSE(worker.quitting());

    //  The pipe is still set up by the stopped run
    struct stat st;
    ASSERT_EQ(stat(root_.file("early.fifo").c_str(), &st), 0);
    EXPECT_TRUE(S_ISFIFO(st.st_mode));
}

TEST_F(WorkerTest, HandlerErrorClosesPipe) {
    FifoWorker worker("fatal.fifo", root_.path());
    worker.subscribe([](const std::string&, const std::string&) {
        throw std::runtime_error("handler failed");
    });

    EXPECT_THROW(worker.run(10ms), std::runtime_error);

    //  The read end is gone: writers find no reader
    int err = 0;
    EXPECT_FALSE(open_fifo_write(root_.file("fatal.fifo"), &err).is_open());
    EXPECT_EQ(err, ENXIO);
}

TEST_F(WorkerTest, RunsAgainAfterQuit) {
    FifoWorker worker("again.fifo", root_.path());
    int runs = 0;

    worker.subscribe([&runs, &worker](const std::string&, const std::string&) {
        ++runs;
        worker.quit();
    });

    worker.run(10ms);
    worker.run(10ms);
    EXPECT_EQ(runs, 2);
}
