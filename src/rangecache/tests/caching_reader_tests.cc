#include <gflags/gflags.h>
#include <gtest/gtest.h>
#include <rangecache/readers/caching_reader.h>
#include <rangecache/sources/errors.h>
#include <rangecache/sources/file_source.h>
#include <rangecache/sources/memory_source.h>
#include <rangecache/test_common/expectation_check_metrics_visitor.h>
#include <rangecache/test_common/test_environment.h>
#include <rangecache/test_common/test_fixture.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <utility>
#include <vector>

namespace rangecache {

TestEnvironment* test_environment = dynamic_cast<TestEnvironment*>(  // NOLINT
    testing::AddGlobalTestEnvironment(new TestEnvironment()));       // NOLINT

namespace {

using Seeks = std::vector<std::pair<std::streamoff, std::ios::seekdir>>;

// In-memory source whose bytes can be changed behind the reader's back, and
// which records how it is moved.
class ScriptedSource final : public Source {
public:
  std::vector<char> data;
  uint64_t position{};
  bool fail_reads{};
  Seeks seeks;

  explicit ScriptedSource(std::vector<char> bytes) : data(std::move(bytes)) {}

  std::streamsize Read(void* buffer, std::streamsize size) override {
    if (fail_reads) {
      throw SourceError("injected read failure");
    }
    std::streamsize count = 0;
    if (position < data.size()) {
      count = std::min<std::streamsize>(
          size,
          static_cast<std::streamsize>(data.size() - position));
      memcpy(buffer, data.data() + position, count);
      position += count;
    }
    return Source::Read(buffer, count);
  }

  uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) override {
    if (offset != 0 || whence != std::ios::cur) {
      seeks.emplace_back(offset, whence);
    }
    switch (whence) {
      case std::ios::beg:
        position = Offset(0, offset);
        break;
      case std::ios::cur:
        position = Offset(position, offset);
        break;
      default:
        position = Offset(data.size(), offset);
        break;
    }
    return position;
  }
};

}  // namespace

class CachingReaderTests : public Fixture {
protected:
  static constexpr uint64_t kSourceSize = 256;

  ScriptedSource* script_{};
  std::unique_ptr<CachingReader> reader_;

  void Open(std::streamsize chunk_size) {
    auto source = std::make_unique<ScriptedSource>(Sequence(0, kSourceSize));
    script_ = source.get();
    reader_ = CachingReader::Create(chunk_size, std::move(source));
  }

  std::vector<char> Read(std::streamsize size) {
    auto result = std::vector<char>(size);
    auto count = reader_->Read(result.data(), size);
    result.resize(count);
    return result;
  }

  [[nodiscard]] std::vector<std::pair<uint64_t, uint64_t>> Ranges() const {
    std::vector<std::pair<uint64_t, uint64_t>> result;
    for (const auto& buffer : reader_->GetCache().GetBuffers()) {
      result.emplace_back(buffer.GetStart(), buffer.GetEnd());
    }
    return result;
  }
};

using Ranges = std::vector<std::pair<uint64_t, uint64_t>>;

TEST_F(CachingReaderTests, ConsecutiveReads) {  // NOLINT
  Open(64);

  EXPECT_EQ(Read(64), Sequence(0, 64));
  EXPECT_EQ(Read(64), Sequence(64, 128));
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 128}}));

  std::vector<char> rest;
  EXPECT_EQ(reader_->ReadToEnd(rest), 128);
  EXPECT_EQ(rest, Sequence(128, 256));
  EXPECT_EQ(reader_->Tell(), 256);
}

TEST_F(CachingReaderTests, RepeatedOverlappingAndDisjointReads) {  // NOLINT
  Open(64);

  EXPECT_EQ(Read(64), Sequence(0, 64));

  // repeated
  EXPECT_EQ(reader_->Seek(0, std::ios::beg), 0);
  EXPECT_EQ(Read(64), Sequence(0, 64));
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 64}}));

  // partial overlap
  EXPECT_EQ(reader_->Seek(32, std::ios::beg), 32);
  EXPECT_EQ(Read(64), Sequence(32, 96));
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 96}}));

  // disjoint
  EXPECT_EQ(reader_->Seek(128, std::ios::beg), 128);
  EXPECT_EQ(Read(64), Sequence(128, 192));
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 96}, {128, 192}}));

  // the source only moved to catch up with the cursor before each fetch
  EXPECT_EQ(
      script_->seeks,
      (Seeks{{-32, std::ios::cur}, {32, std::ios::cur}}));

  ExpectationCheckMetricVisitor(
      *reader_,
      {
          {"//total_reads_", 4},
          {"//total_bytes_read_", 256},
          {"//cache_hits_", 1},
          {"//cache_misses_", 3},
          {"//fetches_", 3},
          {"//fetched_bytes_", 192},
          {"//short_reads_", 0},
          {"//cache/insertions_", 3},
          {"//cache/merges_", 1},
          {"//source/total_reads_", 3},
          {"//source/total_bytes_read_", 192},
      });
}

TEST_F(CachingReaderTests, HitsDoNotTouchTheSource) {  // NOLINT
  Open(8 * 1024);

  EXPECT_EQ(Read(16), Sequence(0, 16));
  // the first fetch read the whole source
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 256}}));

  for (auto offset : {200, 0, 100, 17, 240}) {
    reader_->Seek(offset, std::ios::beg);
    EXPECT_EQ(Read(16), Sequence(offset, offset + 16));
  }
  reader_->Seek(-32, std::ios::cur);
  EXPECT_EQ(Read(32), Sequence(224, 256));

  EXPECT_TRUE(script_->seeks.empty());
  ExpectationCheckMetricVisitor(
      *reader_,
      {
          {"//cache_hits_", 6},
          {"//cache_misses_", 1},
          {"//source/total_reads_", 1},
      });
}

TEST_F(CachingReaderTests, PartiallyCachedSpanIsFetchedAgain) {  // NOLINT
  Open(16);

  reader_->Seek(100, std::ios::beg);
  EXPECT_EQ(Read(16), Sequence(100, 116));
  reader_->Seek(90, std::ios::beg);
  EXPECT_EQ(Read(40), Sequence(90, 130));

  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{90, 130}}));
  EXPECT_EQ(
      script_->seeks,
      (Seeks{{100, std::ios::cur}, {-26, std::ios::cur}}));
  ExpectationCheckMetricVisitor(
      *reader_,
      {
          {"//fetched_bytes_", 56},
          {"//source/total_reads_", 2},
      });
}

TEST_F(CachingReaderTests, CachedBytesWinOverChangedSource) {  // NOLINT
  Open(10);

  EXPECT_EQ(Read(10), Sequence(0, 10));

  std::fill(script_->data.begin(), script_->data.end(), 'x');
  reader_->Seek(5, std::ios::beg);

  auto expected = Sequence(5, 10);
  expected.insert(expected.end(), 5, 'x');
  EXPECT_EQ(Read(10), expected);
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 15}}));
}

TEST_F(CachingReaderTests, ShortReadsAtEndOfData) {  // NOLINT
  Open(64);

  reader_->Seek(200, std::ios::beg);
  EXPECT_EQ(Read(100), Sequence(200, 256));
  EXPECT_EQ(reader_->Tell(), 256);

  // at the end, and past it
  EXPECT_TRUE(Read(10).empty());
  reader_->Seek(1000, std::ios::beg);
  EXPECT_TRUE(Read(10).empty());
  EXPECT_EQ(reader_->Tell(), 1000);

  // nothing empty was cached
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{200, 256}}));

  ExpectationCheckMetricVisitor(
      *reader_,
      {
          {"//short_reads_", 3},
          {"//fetches_", 3},
      });
}

TEST_F(CachingReaderTests, ShortReadServesCachedBytes) {  // NOLINT
  Open(64);

  reader_->Seek(224, std::ios::beg);
  EXPECT_EQ(Read(32), Sequence(224, 256));

  // the refetch at 192 ends where the cached range ends
  std::fill(script_->data.begin(), script_->data.end(), 'x');
  reader_->Seek(192, std::ios::beg);
  auto expected = Filled(32, 'x');
  auto tail = Sequence(224, 256);
  expected.insert(expected.end(), tail.begin(), tail.end());
  EXPECT_EQ(Read(100), expected);
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{192, 256}}));
}

TEST_F(CachingReaderTests, ReadToEndTerminates) {  // NOLINT
  Open(8 * 1024);

  std::vector<char> all;
  EXPECT_EQ(reader_->ReadToEnd(all), 256);
  EXPECT_EQ(all, Sequence(0, 256));

  std::vector<char> again;
  reader_->Seek(0, std::ios::beg);
  EXPECT_EQ(reader_->ReadToEnd(again), 256);
  EXPECT_EQ(again, all);
}

TEST_F(CachingReaderTests, ReadExact) {  // NOLINT
  Open(32);

  std::vector<char> buffer(100);
  reader_->Seek(10, std::ios::beg);
  reader_->ReadExact(buffer.data(), 100);
  EXPECT_EQ(buffer, Sequence(10, 110));

  reader_->Seek(200, std::ios::beg);
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(reader_->ReadExact(buffer.data(), 100), SourceError);
}

TEST_F(CachingReaderTests, ZeroSizedRead) {  // NOLINT
  Open(64);

  char c = 0;
  EXPECT_EQ(reader_->Read(&c, 0), 0);
  EXPECT_EQ(reader_->Tell(), 0);
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 64}}));

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(reader_->Read(&c, -1), std::invalid_argument);
}

TEST_F(CachingReaderTests, SeekFromEndSynchronizesTheSource) {  // NOLINT
  Open(64);

  EXPECT_EQ(reader_->Seek(-16, std::ios::end), 240);
  EXPECT_EQ(script_->position, 240);
  EXPECT_EQ(Read(16), Sequence(240, 256));

  // the source is already where the cursor was, no catch up seek needed
  EXPECT_EQ(script_->seeks, (Seeks{{-16, std::ios::end}}));
}

TEST_F(CachingReaderTests, SeekFromStartAndCurrentAreLogical) {  // NOLINT
  Open(64);

  EXPECT_EQ(reader_->Seek(50, std::ios::beg), 50);
  EXPECT_EQ(reader_->Seek(-20, std::ios::cur), 30);
  EXPECT_EQ(reader_->Seek(5, std::ios::cur), 35);
  EXPECT_EQ(reader_->Tell(), 35);

  EXPECT_TRUE(script_->seeks.empty());
  EXPECT_EQ(script_->position, 0);
}

TEST_F(CachingReaderTests, SeekOverflow) {  // NOLINT
  Open(64);

  reader_->Seek(10, std::ios::beg);
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(reader_->Seek(-11, std::ios::cur), SeekOverflowError);
  EXPECT_EQ(reader_->Tell(), 10);

  constexpr auto kMax = std::numeric_limits<std::streamoff>::max();
  reader_->Seek(kMax, std::ios::beg);
  EXPECT_EQ(reader_->Seek(kMax, std::ios::cur), 2 * uint64_t{kMax});
  EXPECT_EQ(
      reader_->Seek(1, std::ios::cur),
      std::numeric_limits<uint64_t>::max());
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(reader_->Seek(1, std::ios::cur), SeekOverflowError);
  EXPECT_EQ(reader_->Tell(), std::numeric_limits<uint64_t>::max());

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(reader_->Seek(-1, std::ios::beg), std::invalid_argument);
}

TEST_F(CachingReaderTests, SourceErrorsPropagate) {  // NOLINT
  Open(64);

  EXPECT_EQ(Read(64), Sequence(0, 64));

  script_->fail_reads = true;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto)
  EXPECT_THROW(Read(64), SourceError);
  EXPECT_EQ(reader_->Tell(), 64);
  EXPECT_EQ(Ranges(), (::rangecache::Ranges{{0, 64}}));

  // cached data is still served
  reader_->Seek(0, std::ios::beg);
  EXPECT_EQ(Read(64), Sequence(0, 64));

  script_->fail_reads = false;
  EXPECT_EQ(Read(64), Sequence(64, 128));
}

TEST_F(CachingReaderTests, ReleaseReturnsTheSource) {  // NOLINT
  Open(64);

  reader_->Seek(32, std::ios::beg);
  EXPECT_EQ(Read(64), Sequence(32, 96));
  reader_->Seek(0, std::ios::beg);

  auto source = reader_->Release();
  ASSERT_EQ(source.get(), script_);
  EXPECT_TRUE(reader_->GetCache().GetBuffers().empty());

  // left where the fetch put it, not at the cursor
  EXPECT_EQ(source->Tell(), 96);

  source->Seek(0, std::ios::beg);
  std::vector<char> all;
  EXPECT_EQ(source->ReadToEnd(all), 256);
  EXPECT_EQ(all, Sequence(0, 256));

  char c = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-goto,hicpp-avoid-goto,cppcoreguidelines-pro-type-vararg,hicpp-vararg)
  EXPECT_DEATH(reader_->Read(&c, 1), "reader used after Release");
}

TEST_F(CachingReaderTests, DefaultChunkSizeComesFromFlag) {  // NOLINT
  gflags::FlagSaver flag_saver;

  auto reader =
      CachingReader::Create(std::make_unique<MemorySource>(Sequence(0, 10)));
  EXPECT_EQ(reader->GetChunkSize(), 8 * 1024);

  FLAGS_rangecache_chunk_size = 4;
  reader =
      CachingReader::Create(std::make_unique<MemorySource>(Sequence(0, 10)));
  EXPECT_EQ(reader->GetChunkSize(), 4);

  char c = 0;
  EXPECT_EQ(reader->Read(&c, 1), 1);
  EXPECT_EQ(reader->GetCache().GetBuffers().front().GetEnd(), 4);
}

TEST_F(CachingReaderTests, CachesAFile) {  // NOLINT
  auto path = GetTempPath().WriteFile("data.bin", Sequence(0, 1000));
  auto reader = CachingReader::Create(100, std::make_unique<FileSource>(path));

  std::vector<char> buffer(50);
  reader->Seek(900, std::ios::beg);
  EXPECT_EQ(reader->Read(buffer.data(), 50), 50);
  EXPECT_EQ(buffer, Sequence(900, 950));

  reader->Seek(-150, std::ios::end);
  EXPECT_EQ(reader->Read(buffer.data(), 50), 50);
  EXPECT_EQ(buffer, Sequence(850, 900));

  reader->Seek(10, std::ios::beg);
  EXPECT_EQ(reader->Read(buffer.data(), 50), 50);
  EXPECT_EQ(buffer, Sequence(10, 60));

  std::vector<char> tail;
  reader->Seek(950, std::ios::beg);
  EXPECT_EQ(reader->ReadToEnd(tail), 50);
  EXPECT_EQ(tail, Sequence(950, 1000));

  ASSERT_EQ(reader->GetCache().GetBuffers().size(), 2);
  EXPECT_EQ(reader->GetCache().GetBuffers()[0].GetStart(), 10);
  EXPECT_EQ(reader->GetCache().GetBuffers()[1].GetStart(), 850);
  EXPECT_EQ(reader->GetCache().GetBuffers()[1].GetEnd(), 1000);
}

}  // namespace rangecache
