#include "storage/append_log.hpp"
#include "storage/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace logkv::storage {

// ── Fixture ──────────────────────────────────────────────────────────────────

class AppendLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a unique temp directory for each test.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("append_log_test_" + std::string(info->name()));
        // Clean up any stale directory from a previous crashed run.
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        log_path_ = test_dir_ / "data.lkv";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void write_raw(const std::string& bytes) {
        std::ofstream out(log_path_, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::vector<Record> scan_all(AppendLog& log, ScanResult& result) {
        std::vector<Record> records;
        auto ec = log.scan(
            [&](uint64_t, uint64_t, const Record& r) { records.push_back(r); },
            result);
        EXPECT_FALSE(ec) << ec.message();
        return records;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path log_path_;
};

// ── Open / Close ─────────────────────────────────────────────────────────────

TEST_F(AppendLogTest, OpenCreatesFileWithHeader) {
    AppendLog log(log_path_);
    auto ec = log.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(log.is_open());
    EXPECT_EQ(log.size(), kLogHeaderSize);
    EXPECT_EQ(std::filesystem::file_size(log_path_), kLogHeaderSize);
}

TEST_F(AppendLogTest, OpenCreatesParentDirectories) {
    log_path_ = test_dir_ / "a" / "b" / "data.lkv";
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    EXPECT_TRUE(std::filesystem::exists(log_path_));
}

TEST_F(AppendLogTest, OpenIdempotentWhenAlreadyOpen) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    auto ec = log.open();
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_TRUE(log.is_open());
}

TEST_F(AppendLogTest, CloseMarksNotOpen) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    log.close();
    EXPECT_FALSE(log.is_open());
}

TEST_F(AppendLogTest, DirectoryIsNotAFile) {
    AppendLog log(test_dir_);
    EXPECT_EQ(log.open(), StoreErrc::not_a_file);
    EXPECT_FALSE(log.is_open());
}

TEST_F(AppendLogTest, BadMagicRejected) {
    write_raw(std::string("NOPE\x01\x00", 6));
    AppendLog log(log_path_);
    EXPECT_EQ(log.open(), StoreErrc::bad_header);
    EXPECT_FALSE(log.is_open());
    EXPECT_EQ(std::filesystem::file_size(log_path_), 6u);
}

TEST_F(AppendLogTest, UnknownVersionRejected) {
    write_raw(std::string("LKV1\x02\x00", 6));
    AppendLog log(log_path_);
    EXPECT_EQ(log.open(), StoreErrc::bad_header);
}

TEST_F(AppendLogTest, BadHeaderResetWhenAllowed) {
    write_raw("garbage that is not a log file");
    AppendLog log(log_path_);
    auto ec = log.open(true);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(log.size(), kLogHeaderSize);
    EXPECT_EQ(std::filesystem::file_size(log_path_), kLogHeaderSize);
}

TEST_F(AppendLogTest, TornHeaderReinitialised) {
    write_raw("LK");
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    EXPECT_EQ(log.size(), kLogHeaderSize);
}

TEST_F(AppendLogTest, SecondHandleIsLocked) {
    AppendLog first(log_path_);
    ASSERT_FALSE(first.open());

    AppendLog second(log_path_);
    EXPECT_EQ(second.open(), StoreErrc::locked);

    first.close();
    EXPECT_FALSE(second.open());
}

TEST_F(AppendLogTest, LockingCanBeDisabled) {
    AppendLog first(log_path_, false);
    ASSERT_FALSE(first.open());
    AppendLog second(log_path_, false);
    EXPECT_FALSE(second.open());
}

// ── Append / Read ────────────────────────────────────────────────────────────

TEST_F(AppendLogTest, AppendThenRead) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());

    auto frame = serialise_record("k", "v");
    uint64_t offset = 0;
    ASSERT_FALSE(log.append(frame, true, offset));
    EXPECT_EQ(offset, kLogHeaderSize);
    EXPECT_EQ(log.size(), kLogHeaderSize + frame.size());

    std::vector<uint8_t> out;
    ASSERT_FALSE(log.read(offset, frame.size(), out));
    EXPECT_EQ(out, frame);
}

TEST_F(AppendLogTest, ReadPastEndIsCorruption) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    std::vector<uint8_t> out;
    EXPECT_EQ(log.read(kLogHeaderSize, 1, out), StoreErrc::corruption);
}

TEST_F(AppendLogTest, AppendOnClosedLogFails) {
    AppendLog log(log_path_);
    uint64_t offset = 0;
    auto ec = log.append(serialise_record("k", "v"), false, offset);
    EXPECT_EQ(ec, std::errc::bad_file_descriptor);
}

TEST_F(AppendLogTest, TruncateBelowHeaderRejected) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    EXPECT_EQ(log.truncate_to(kLogHeaderSize - 1), std::errc::invalid_argument);
    EXPECT_FALSE(log.truncate_to(kLogHeaderSize));
}

// ── Scan ─────────────────────────────────────────────────────────────────────

TEST_F(AppendLogTest, ScanSurvivesReopen) {
    {
        AppendLog log(log_path_);
        ASSERT_FALSE(log.open());
        uint64_t offset = 0;
        ASSERT_FALSE(log.append(serialise_record("a", "1"), true, offset));
        ASSERT_FALSE(log.append(serialise_tombstone("a"), true, offset));
        ASSERT_FALSE(log.append(serialise_record("b", "22"), true, offset));
    }

    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    ScanResult result;
    auto records = scan_all(log, result);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].key, "a");
    EXPECT_EQ(records[0].value, "1");
    EXPECT_TRUE(records[1].tombstone);
    EXPECT_EQ(records[2].value, "22");
    EXPECT_EQ(result.frames, 3u);
    EXPECT_EQ(result.valid_end, log.size());
    EXPECT_EQ(result.discarded_bytes, 0u);
}

TEST_F(AppendLogTest, ScanTruncatesTornTail) {
    uint64_t good_end = 0;
    {
        AppendLog log(log_path_);
        ASSERT_FALSE(log.open());
        uint64_t offset = 0;
        ASSERT_FALSE(log.append(serialise_record("a", "1"), true, offset));
        good_end = log.size();
    }

    // Half a frame at the end of the file.
    auto frame = serialise_record("b", "2");
    {
        std::ofstream out(log_path_, std::ios::binary | std::ios::app);
        out.write(reinterpret_cast<const char*>(frame.data()), 7);
    }

    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    ScanResult result;
    auto records = scan_all(log, result);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(result.discarded_bytes, 7u);
    EXPECT_EQ(log.size(), good_end);
    EXPECT_EQ(std::filesystem::file_size(log_path_), good_end);
}

TEST_F(AppendLogTest, ScanStopsAtCorruptFrame) {
    uint64_t second = 0;
    {
        AppendLog log(log_path_);
        ASSERT_FALSE(log.open());
        uint64_t offset = 0;
        ASSERT_FALSE(log.append(serialise_record("a", "1"), true, offset));
        ASSERT_FALSE(log.append(serialise_record("b", "2"), true, second));
        ASSERT_FALSE(log.append(serialise_record("c", "3"), true, offset));
    }

    // Flip a byte of the second frame's value.
    {
        std::fstream f(log_path_, std::ios::binary | std::ios::in | std::ios::out);
        f.seekp(static_cast<std::streamoff>(second + kFrameHeaderSize + 1));
        f.put('X');
    }

    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    ScanResult result;
    auto records = scan_all(log, result);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].key, "a");
    EXPECT_EQ(log.size(), second);
}

TEST_F(AppendLogTest, ScanSeesExternalShrink) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    uint64_t offset = 0;
    ASSERT_FALSE(log.append(serialise_record("a", "1"), true, offset));
    const uint64_t end_of_a = log.size();
    ASSERT_FALSE(log.append(serialise_record("b", std::string(100, 'b')), true, offset));

    // Shrink the file behind the open handle.
    std::filesystem::resize_file(log_path_, end_of_a + 20);

    ScanResult result;
    auto records = scan_all(log, result);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(result.discarded_bytes, 20u);
    EXPECT_EQ(log.size(), end_of_a);
    EXPECT_EQ(std::filesystem::file_size(log_path_), end_of_a);

    // The next append lands right after the last good frame.
    ASSERT_FALSE(log.append(serialise_record("c", "3"), true, offset));
    EXPECT_EQ(offset, end_of_a);
}

TEST_F(AppendLogTest, ScanReinitialisesFileShrunkBelowHeader) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    uint64_t offset = 0;
    ASSERT_FALSE(log.append(serialise_record("a", "1"), true, offset));

    std::filesystem::resize_file(log_path_, 2);

    ScanResult result;
    auto records = scan_all(log, result);
    EXPECT_TRUE(records.empty());
    EXPECT_EQ(result.discarded_bytes, 2u);
    EXPECT_EQ(log.size(), kLogHeaderSize);
    EXPECT_EQ(std::filesystem::file_size(log_path_), kLogHeaderSize);
}

// ── Replace ──────────────────────────────────────────────────────────────────

TEST_F(AppendLogTest, ReplaceWithAdoptsFreshFile) {
    AppendLog log(log_path_);
    ASSERT_FALSE(log.open());
    uint64_t offset = 0;
    ASSERT_FALSE(log.append(serialise_record("old", "value"), true, offset));

    const auto tmp_path = test_dir_ / "data.lkv.tmp";
    AppendLog fresh(tmp_path);
    ASSERT_FALSE(fresh.create());
    ASSERT_FALSE(fresh.append(serialise_record("new", "v"), true, offset));
    const uint64_t fresh_size = fresh.size();

    EXPECT_EQ(log.generation(), 0u);
    auto ec = log.replace_with(fresh);
    ASSERT_FALSE(ec) << ec.message();

    EXPECT_EQ(log.generation(), 1u);
    EXPECT_EQ(log.size(), fresh_size);
    EXPECT_FALSE(fresh.is_open());
    EXPECT_FALSE(std::filesystem::exists(tmp_path));

    ScanResult result;
    auto records = scan_all(log, result);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].key, "new");
}

} // namespace logkv::storage
