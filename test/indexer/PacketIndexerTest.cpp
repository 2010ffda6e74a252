#include "PacketIndexer.hpp"
#include "packet/PacketBuilder.hpp"

#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SizeIs;

namespace {
class MockMessageStore : public MessageStore {
public:
  MOCK_METHOD(size_t, insertMessages,
              (const std::string &pkt_file,
               const std::vector<ExtractedMessage> &messages),
              (override));
};

class PacketIndexerTests : public ::testing::Test {
protected:
  void SetUp() override {
    folder_ = fs::temp_directory_path() /
              (std::string("pkt_indexer_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(folder_);
    fs::create_directories(folder_);

    settings_ = defaultIndexerSettings();
    settings_.folder = folder_.string();
  }

  void TearDown() override { fs::remove_all(folder_); }

  fs::path writePacket(const std::string &name,
                       const std::vector<uint8_t> &bytes) {
    const fs::path path = folder_ / name;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return path;
  }

  fs::path folder_;
  Config::IndexerSettings settings_;
  std::ostringstream out_;
};

std::vector<uint8_t> truncatedPacket() {
  auto pkt = makePacket({TestMessage{}}, false);
  auto record = makeMessage(TestMessage{});
  record.resize(PKT_MSG_FIXED_LEN + 3);
  pkt.insert(pkt.end(), record.begin(), record.end());
  return pkt;
}
} // namespace

TEST_F(PacketIndexerTests, FindsPacketFilesInPathOrder) {
  writePacket("b.pkt", makePacket({}));
  writePacket("a.PKT", makePacket({}));
  writePacket("notes.txt", {1, 2, 3});
  writePacket("sub/c.pkt", makePacket({}));

  settings_.test_mode = true;
  PacketIndexer listing(settings_, ParserOptions{}, nullptr);

  EXPECT_THAT(listing.findPacketFiles(),
              ElementsAre(folder_ / "a.PKT", folder_ / "b.pkt"));

  settings_.recursive = true;
  PacketIndexer recursive(settings_, ParserOptions{}, nullptr);
  EXPECT_THAT(recursive.findPacketFiles(), SizeIs(3));
}

TEST_F(PacketIndexerTests, RequiresStoreOutsideTestMode) {
  settings_.test_mode = false;
  EXPECT_THROW(PacketIndexer(settings_, ParserOptions{}, nullptr),
               std::invalid_argument);
}

TEST_F(PacketIndexerTests, MissingFolderThrows) {
  settings_.folder = (folder_ / "nope").string();
  settings_.test_mode = true;
  PacketIndexer indexer(settings_, ParserOptions{}, nullptr);

  EXPECT_THROW(indexer.run(), std::runtime_error);
}

TEST_F(PacketIndexerTests, TestModeListsAndTouchesNothing) {
  const auto path = writePacket("0001.pkt", makePacket({TestMessage{}}));
  settings_.test_mode = true;
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(_, _)).Times(0);

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.files_processed, 1u);
  EXPECT_EQ(summary.messages, 1u);
  EXPECT_EQ(summary.files_deleted, 0u);
  EXPECT_TRUE(fs::exists(path));
  EXPECT_THAT(out_.str(),
              HasSubstr("=== 0001.pkt: 1 messages (Complete) ==="));
  EXPECT_THAT(out_.str(),
              HasSubstr("packet type 2 from 2:250/1 to 2:250/0\n"));
  EXPECT_THAT(out_.str(), HasSubstr("echo='MIN_CHAT'"));
  EXPECT_THAT(out_.str(), HasSubstr("date_iso=2024-01-05 21:04:33"));
}

TEST_F(PacketIndexerTests, DeletesCompletelyStoredPacket) {
  const auto path =
      writePacket("0001.pkt", makePacket({TestMessage{}, TestMessage{}}));
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(path.string(), SizeIs(2)))
      .WillOnce(Return(2));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.inserted, 2u);
  EXPECT_EQ(summary.files_deleted, 1u);
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(PacketIndexerTests, KeepsPacketWhenStoreTookFewerMessages) {
  const auto path =
      writePacket("0001.pkt", makePacket({TestMessage{}, TestMessage{}}));
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(_, _)).WillOnce(Return(1));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.files_deleted, 0u);
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(PacketIndexerTests, KeepsPartiallyParsedPacket) {
  const auto path = writePacket("0001.pkt", truncatedPacket());
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(_, SizeIs(1))).WillOnce(Return(1));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.files_partial, 1u);
  EXPECT_EQ(summary.files_deleted, 0u);
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(PacketIndexerTests, NoDeleteWithoutDeleteSetting) {
  const auto path = writePacket("0001.pkt", makePacket({TestMessage{}}));

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(_, _)).WillOnce(Return(1));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  indexer.run();

  EXPECT_TRUE(fs::exists(path));
}

TEST_F(PacketIndexerTests, BadHeaderCountsAsFailedAndRunContinues) {
  auto bad = makePacket({TestMessage{}});
  putWord(bad, 18, 0x0001);
  const auto bad_path = writePacket("0001.pkt", bad);
  writePacket("0002.pkt", makePacket({TestMessage{}}));
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(HasSubstr("0002.pkt"), _))
      .WillOnce(Return(1));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_EQ(summary.files_processed, 1u);
  EXPECT_EQ(summary.files_deleted, 1u);
  EXPECT_TRUE(fs::exists(bad_path));
}

TEST_F(PacketIndexerTests, StoreFailureKeepsPacket) {
  const auto path = writePacket("0001.pkt", makePacket({TestMessage{}}));
  settings_.delete_processed = true;

  MockMessageStore store;
  EXPECT_CALL(store, insertMessages(_, _))
      .WillOnce(::testing::Throw(std::runtime_error("disk full")));

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();

  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(PacketIndexerTests, ParallelParsingKeepsPathOrder) {
  for (int i = 0; i < 5; ++i) {
    writePacket("000" + std::to_string(i) + ".pkt",
                makePacket({TestMessage{}}));
  }
  settings_.worker_threads = 3;

  MockMessageStore store;
  {
    ::testing::InSequence in_order;
    for (int i = 0; i < 5; ++i) {
      EXPECT_CALL(store,
                  insertMessages(HasSubstr("000" + std::to_string(i)), _))
          .WillOnce(Return(1));
    }
  }

  PacketIndexer indexer(settings_, ParserOptions{}, &store, out_);
  const IndexSummary summary = indexer.run();
  EXPECT_EQ(summary.files_processed, 5u);
  EXPECT_EQ(summary.inserted, 5u);
}
