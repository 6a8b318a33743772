#include <gtest/gtest.h>
#include "fifo/client.hpp"
#include "fifo/errors.hpp"
#include "fifo/frame_reader.hpp"
#include "fifo/pipe.hpp"
#include "temp_dir.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Lines = std::vector<std::string>;

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = root_.file("client.fifo");
        create_pipe(path_);
    }

    TempDir root_;
    std::string path_;
};

TEST_F(ClientTest, WritesOneLinePerMessage) {
    FifoHandle reader = open_fifo_read(path_);
    FifoClient client("client.fifo", root_.path());

    EXPECT_TRUE(client.write("first"));
    EXPECT_TRUE(client.write("second"));

    EXPECT_EQ(read_batch(reader, 9999), (Lines{"first", "second"}));
}

TEST_F(ClientTest, DropsAfterRetriesAndStopsRetrying) {
    FifoClient client("client.fifo", root_.path(), 2, 200ms, false);

    //  Three attempts, then the message is dropped without an error
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.write("lost"));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 400ms);
    EXPECT_EQ(client.retries_left(), 0);

    //  The budget stays spent: one attempt, no wait, until a write gets through
    start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.write("lost too"));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(client.retries_left(), 0);

    FifoHandle reader = open_fifo_read(path_);
    EXPECT_TRUE(client.write("delivered"));
    EXPECT_EQ(client.retries_left(), 2);

    EXPECT_EQ(read_batch(reader, 9999), Lines{"delivered"});
}

TEST_F(ClientTest, GuaranteedDeliveryThrows) {
    FifoClient client("client.fifo", root_.path(), 2, 1ms, true);

    try {
        client.write("important");
        FAIL() << "FifoUnavailableError expected";
    } catch (const FifoUnavailableError& e) {
        EXPECT_EQ(e.name(), "client.fifo");
    }
}

TEST_F(ClientTest, MissingPipeCountsAsNoReader) {
    FifoClient client("absent.fifo", root_.path(), 1, 1ms, false);
    EXPECT_FALSE(client.write("nobody"));

    FifoClient strict("absent.fifo", root_.path(), 1, 1ms, true);
    EXPECT_THROW(strict.write("nobody"), FifoUnavailableError);
}

TEST_F(ClientTest, RetriesUntilReaderShowsUp) {
    FifoClient client("client.fifo", root_.path(), 200, 5ms, true);
    Lines received;

    std::thread reader_thread([&] {
        std::this_thread::sleep_for(30ms);
        FifoHandle reader = open_fifo_read(path_);
        for (int i = 0; i < 400 && received.empty(); ++i) {
            for (const auto& line : read_batch(reader, 9999))
                if (!line.empty())
                    received.push_back(line);
            std::this_thread::sleep_for(5ms);
        }
    });

    EXPECT_TRUE(client.write("late reader"));
    reader_thread.join();

    EXPECT_EQ(received, Lines{"late reader"});
    EXPECT_EQ(client.retries_left(), 200);
}

TEST_F(ClientTest, PutWaitsForReader) {
    FifoClient client("client.fifo", root_.path(), 0, 5ms, false);
    Lines received;

    std::thread reader_thread([&] {
        std::this_thread::sleep_for(50ms);
        FifoHandle reader = open_fifo_read(path_);
        for (int i = 0; i < 400 && received.empty(); ++i) {
            for (const auto& line : read_batch(reader, 9999))
                if (!line.empty())
                    received.push_back(line);
            std::this_thread::sleep_for(5ms);
        }
    });

    client.put("patient");
    reader_thread.join();

    EXPECT_EQ(received, Lines{"patient"});
}

TEST_F(ClientTest, NewlineInMessageIsRejected) {
    FifoHandle reader = open_fifo_read(path_);
    FifoClient client("client.fifo", root_.path());

    EXPECT_THROW(client.write("two\nlines"), std::invalid_argument);
    EXPECT_THROW(client.put("two\nlines"), std::invalid_argument);
    EXPECT_EQ(read_batch(reader, 9999), Lines{""});
}
