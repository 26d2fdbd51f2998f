#include <rangefetch/destination_file.hpp>
#include <rangefetch/errors.hpp>
#include <gtest/gtest.h>

#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using rangefetch::DestinationFile;
using rangefetch::DownloadError;
using rangefetch::OffsetWriter;
using rangefetch::mayWriteDestination;
using rangefetch::test::TempDir;
using rangefetch::test::readFile;
using rangefetch::test::writeFile;

class DestinationFileTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(DestinationFileTest, CreatesMissingFile) {
    const auto path = dir.file("new.bin");
    {
        DestinationFile file{path.string()};
        EXPECT_TRUE(file.isOpen());
        EXPECT_EQ(file.path(), path.string());
    }
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(DestinationFileTest, WritesInPlaceWithoutTruncating) {
    const auto path = dir.file("existing.bin");
    writeFile(path, "XXXXXXXXXX");
    {
        DestinationFile file{path.string()};
        EXPECT_FALSE(file.writeAt(2, "ab", 2));
    }
    EXPECT_EQ(readFile(path), "XXabXXXXXX");
}

TEST_F(DestinationFileTest, WritePastEndExtendsWithZeros) {
    const auto path = dir.file("sparse.bin");
    {
        DestinationFile file{path.string()};
        EXPECT_FALSE(file.writeAt(100, "z", 1));
    }
    const auto content = readFile(path);
    ASSERT_EQ(content.size(), 101u);
    EXPECT_EQ(content.substr(0, 100), std::string(100, '\0'));
    EXPECT_EQ(content.back(), 'z');
}

TEST_F(DestinationFileTest, OffsetWriterAppendsFromBase) {
    const auto path = dir.file("offset.bin");
    {
        DestinationFile file{path.string()};
        OffsetWriter writer{file, 3};
        EXPECT_FALSE(writer.write("ab", 2));
        EXPECT_FALSE(writer.write("cd", 2));
        EXPECT_EQ(writer.written(), 4u);
    }
    EXPECT_EQ(readFile(path), std::string(3, '\0') + "abcd");
}

TEST_F(DestinationFileTest, ConcurrentDisjointWritesDoNotInterfere) {
    constexpr int writers = 16;
    constexpr std::size_t region = 4096;
    const auto path = dir.file("concurrent.bin");
    {
        DestinationFile file{path.string()};
        std::vector<std::thread> threads;
        for (int i = 0; i < writers; ++i) {
            threads.emplace_back([&file, i] {
                const std::string data(region, static_cast<char>('a' + i));
                OffsetWriter writer{file, static_cast<std::uint64_t>(i) * region};
                for (std::size_t pos = 0; pos < region; pos += 100) {
                    const std::size_t n = std::min<std::size_t>(100, region - pos);
                    EXPECT_FALSE(writer.write(data.data() + pos, n));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    const auto content = readFile(path);
    ASSERT_EQ(content.size(), writers * region);
    for (int i = 0; i < writers; ++i) {
        EXPECT_EQ(content.substr(i * region, region), std::string(region, static_cast<char>('a' + i)));
    }
}

TEST_F(DestinationFileTest, MovedFromHandleRejectsWrites) {
    DestinationFile file{dir.file("moved.bin").string()};
    DestinationFile owner{std::move(file)};

    EXPECT_FALSE(file.isOpen());
    EXPECT_TRUE(owner.isOpen());
    EXPECT_TRUE(file.writeAt(0, "a", 1));
}

TEST_F(DestinationFileTest, OpenFailureThrows) {
    const auto path = dir.file("missing_dir") / "out.bin";
    EXPECT_THROW(DestinationFile{path.string()}, DownloadError);
}

TEST_F(DestinationFileTest, GateAllowsMissingPath) {
    EXPECT_TRUE(mayWriteDestination(dir.file("absent.bin"), false));
}

TEST_F(DestinationFileTest, GateRefusesExistingPathWithoutOverwrite) {
    const auto path = dir.file("present.bin");
    writeFile(path, "keep");
    EXPECT_FALSE(mayWriteDestination(path, false));
    EXPECT_TRUE(mayWriteDestination(path, true));
    EXPECT_EQ(readFile(path), "keep");
}
