#include <gtest/gtest.h>
#include "memory_store.hpp"
#include "tiered_cache.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace ttlcache;
using namespace std::chrono_literals;

namespace {

struct TestData {
  std::string name;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TestData, name)

/** MemoryStore with call counters and injectable failures. */
class FakeSlowStore : public SlowStore {
 public:
  std::error_code Get(const Context& ctx, const std::string& key,
                      Bytes& value) override {
    ++gets;
    return mem.Get(ctx, key, value);
  }

  std::error_code Set(const Context& ctx, const std::string& key,
                      const Bytes& value, Duration ttl) override {
    ++sets;
    lastSetTtl = ttl;
    if (failSet) return std::make_error_code(std::errc::io_error);
    return mem.Set(ctx, key, value, ttl);
  }

  std::error_code TTL(const Context& ctx, const std::string& key,
                      Duration& ttl) override {
    ++ttls;
    if (failTtl) return std::make_error_code(std::errc::timed_out);
    if (fixedTtl) {
      ttl = *fixedTtl;
      return {};
    }
    return mem.TTL(ctx, key, ttl);
  }

  std::error_code Delete(const Context& ctx, const std::string& key,
                         int64_t& count) override {
    ++deletes;
    return mem.Delete(ctx, key, count);
  }

  MemoryStore mem;
  int gets = 0;
  int sets = 0;
  int ttls = 0;
  int deletes = 0;
  bool failSet = false;
  bool failTtl = false;
  std::optional<Duration> fixedTtl;
  Duration lastSetTtl{};
};

Bytes toBytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

class TieredCacheTest : public ::testing::Test {
 protected:
  void SetUp() override { slow_ = std::make_shared<FakeSlowStore>(); }

  std::unique_ptr<TieredCache> build(int maxEntries, Duration ttl,
                                     std::string prefix = "") {
    TieredCacheConfig cfg;
    cfg.maxEntries = maxEntries;
    cfg.defaultTtl = ttl;
    cfg.prefix = std::move(prefix);
    return TieredCache::New(slow_, cfg);
  }

  std::shared_ptr<FakeSlowStore> slow_;
  Context ctx_ = Context::Background();
};

}  // namespace

// ============================================================================
// Construction and keys
// ============================================================================

TEST_F(TieredCacheTest, RejectsInvalidConfig) {
  std::error_code ec;
  TieredCacheConfig cfg;
  EXPECT_EQ(TieredCache::New(nullptr, cfg, &ec), nullptr);
  EXPECT_EQ(ec, Errc::invalidConfig);

  cfg.defaultTtl = 500ms;
  EXPECT_EQ(TieredCache::New(slow_, cfg), nullptr);

  cfg.defaultTtl = 1s;
  cfg.maxEntries = 0;
  ec.clear();
  EXPECT_EQ(TieredCache::New(slow_, cfg, &ec), nullptr);
  EXPECT_EQ(ec, Errc::invalidConfig);
}

TEST_F(TieredCacheTest, ResolveKeyAddsPrefix) {
  auto l2 = build(1, 1s, "prefix:");
  std::string resolved;
  EXPECT_FALSE(l2->ResolveKey("1", resolved));
  EXPECT_EQ(resolved, "prefix:1");
}

TEST_F(TieredCacheTest, EmptyKeyTouchesNoTier) {
  auto l2 = build(10, 1min);
  Bytes buf;
  TestData data;
  Duration ttl{};
  int64_t count = 0;

  EXPECT_EQ(l2->GetBytes(ctx_, "", buf), Errc::keyIsEmpty);
  EXPECT_EQ(l2->Get(ctx_, "", data), Errc::keyIsEmpty);
  EXPECT_EQ(l2->SetBytes(ctx_, "", toBytes("x")), Errc::keyIsEmpty);
  EXPECT_EQ(l2->Set(ctx_, "", data), Errc::keyIsEmpty);
  EXPECT_EQ(l2->Delete(ctx_, "", count), Errc::keyIsEmpty);
  EXPECT_EQ(l2->TTL(ctx_, "", ttl), Errc::keyIsEmpty);

  EXPECT_EQ(slow_->gets + slow_->sets + slow_->ttls + slow_->deletes, 0);
  EXPECT_EQ(l2->Near().Len(), 0);
}

// ============================================================================
// Read and write paths
// ============================================================================

/**
 * @brief Typed round trip through both tiers with a one-entry near cache:
 * a miss reports the slow store's error, an evicted key is read back from the
 * slow store once and then served from the near cache.
 */
TEST_F(TieredCacheTest, ReadThroughAndNearHits) {
  auto l2 = build(1, 1s, "prefix:");
  TestData data;

  std::error_code err = l2->Get(ctx_, "abcd", data);
  EXPECT_EQ(err, Errc::notFound);

  ASSERT_FALSE(l2->Set(ctx_, "abcd", TestData{"test"}));
  ASSERT_FALSE(l2->Get(ctx_, "abcd", data));
  EXPECT_EQ(data.name, "test");
  EXPECT_EQ(slow_->gets, 1);

  // one-entry near cache: this evicts "abcd" from it
  ASSERT_FALSE(l2->Set(ctx_, "ab", TestData{}));

  data = TestData{};
  ASSERT_FALSE(l2->Get(ctx_, "abcd", data));
  EXPECT_EQ(data.name, "test");
  EXPECT_EQ(slow_->gets, 2);

  data = TestData{};
  ASSERT_FALSE(l2->Get(ctx_, "abcd", data));
  EXPECT_EQ(data.name, "test");
  EXPECT_EQ(slow_->gets, 2);

  std::map<std::string, std::string> m = {{"name", "newName"}};
  ASSERT_FALSE(l2->Set(ctx_, "abcd", m));
  std::map<std::string, std::string> got;
  ASSERT_FALSE(l2->Get(ctx_, "abcd", got));
  EXPECT_EQ(got["name"], "newName");
}

TEST_F(TieredCacheTest, FailedDurableWriteLeavesNearCacheUntouched) {
  auto l2 = build(10, 1min);
  slow_->failSet = true;

  EXPECT_EQ(l2->Set(ctx_, "k", TestData{"v"}), std::errc::io_error);
  Bytes buf;
  EXPECT_FALSE(l2->Near().Peek("k", buf));

  TestData data;
  EXPECT_EQ(l2->Get(ctx_, "k", data), Errc::notFound);
  EXPECT_EQ(slow_->gets, 1);
}

TEST_F(TieredCacheTest, FailedOverwriteKeepsPriorValue) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->Set(ctx_, "k", TestData{"old"}));

  slow_->failSet = true;
  EXPECT_TRUE(l2->Set(ctx_, "k", TestData{"new"}));

  TestData data;
  ASSERT_FALSE(l2->Get(ctx_, "k", data));
  EXPECT_EQ(data.name, "old");
}

TEST_F(TieredCacheTest, RepopulatesNearCacheWithSlowStoreTtl) {
  auto l2 = build(10, 1min, "p:");
  slow_->fixedTtl = 5s;
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("payload")));

  l2->Near().Remove("p:k");
  Bytes buf;
  ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
  EXPECT_EQ(buf, toBytes("payload"));

  Bytes cached;
  EXPECT_TRUE(l2->Near().Peek("p:k", cached));
  EXPECT_EQ(cached, toBytes("payload"));
  Duration nearTtl = l2->Near().TTL("p:k");
  EXPECT_GT(nearTtl, Duration::zero());
  EXPECT_LE(nearTtl, Duration(5s));
}

TEST_F(TieredCacheTest, NonPositiveSlowTtlSkipsRepopulation) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("v")));
  l2->Near().Remove("k");

  slow_->fixedTtl = Duration::zero();
  Bytes buf;
  ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
  EXPECT_EQ(l2->Near().TTL("k"), ttlAbsent);

  slow_->fixedTtl.reset();
  slow_->failTtl = true;
  buf.clear();
  ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
  EXPECT_EQ(buf, toBytes("v"));
  EXPECT_EQ(l2->Near().TTL("k"), ttlAbsent);
}

TEST_F(TieredCacheTest, NegativeSlowTtlNeverFillsNearCache) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("v")));
  l2->Near().Remove("k");

  slow_->fixedTtl = Duration(-1);
  for (int i = 0; i < 3; ++i) {
    Bytes buf;
    ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
    EXPECT_EQ(buf, toBytes("v"));
    EXPECT_EQ(l2->Near().TTL("k"), ttlAbsent);
  }
}

TEST_F(TieredCacheTest, MaxSlowTtlFillsNearCacheWithoutWrapping) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("v")));
  l2->Near().Remove("k");

  slow_->fixedTtl = Duration::max();
  Bytes buf;
  ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
  Bytes cached;
  EXPECT_TRUE(l2->Near().Peek("k", cached));
  EXPECT_EQ(cached, toBytes("v"));
  EXPECT_GT(l2->Near().TTL("k"), Duration(24h));
}

TEST_F(TieredCacheTest, ExpiredNearEntryFallsThroughWithoutTouchingSlowStore) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("durable")));

  l2->Near().Add("k", toBytes("stale"), 10ms);
  std::this_thread::sleep_for(50ms);

  Bytes buf;
  ASSERT_FALSE(l2->GetBytes(ctx_, "k", buf));
  EXPECT_EQ(buf, toBytes("durable"));
  EXPECT_EQ(slow_->gets, 1);
  EXPECT_EQ(slow_->deletes, 0);
  EXPECT_EQ(slow_->mem.Size(), 1u);
}

TEST_F(TieredCacheTest, ZeroTtlMeansDefault) {
  auto l2 = build(10, 30s);
  ASSERT_FALSE(l2->SetBytes(ctx_, "a", toBytes("1"), Duration::zero()));
  EXPECT_EQ(slow_->lastSetTtl, Duration(30s));
  ASSERT_FALSE(l2->SetBytes(ctx_, "b", toBytes("2"), Duration(2s)));
  EXPECT_EQ(slow_->lastSetTtl, Duration(2s));
}

// ============================================================================
// TTL and Delete
// ============================================================================

TEST_F(TieredCacheTest, TtlPrefersNearCache) {
  auto l2 = build(10, 10s);
  slow_->fixedTtl = 101ms;
  ASSERT_FALSE(l2->Set(ctx_, "test", std::string("value"), Duration(2s)));

  Duration ttl{};
  ASSERT_FALSE(l2->TTL(ctx_, "test", ttl));
  EXPECT_GT(ttl, Duration(1s));
  EXPECT_LE(ttl, Duration(2s));
  EXPECT_EQ(slow_->ttls, 0);

  l2->Near().Remove("test");
  ASSERT_FALSE(l2->TTL(ctx_, "test", ttl));
  EXPECT_EQ(ttl, Duration(101ms));
}

TEST_F(TieredCacheTest, DeleteClearsBothTiers) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "k", toBytes("v")));

  int64_t count = -1;
  ASSERT_FALSE(l2->Delete(ctx_, "k", count));
  EXPECT_EQ(count, 1);
  EXPECT_EQ(l2->Near().TTL("k"), ttlAbsent);

  ASSERT_FALSE(l2->Delete(ctx_, "k", count));
  EXPECT_EQ(count, 0);

  Bytes buf;
  EXPECT_EQ(l2->GetBytes(ctx_, "k", buf), Errc::notFound);
}

// ============================================================================
// Error policy and codecs
// ============================================================================

TEST_F(TieredCacheTest, GetIgnoreNotFoundMutesConfiguredError) {
  TieredCacheConfig cfg;
  cfg.notFound = Errc::notFound;
  auto l2 = TieredCache::New(slow_, cfg);
  ASSERT_NE(l2, nullptr);

  TestData data{"untouched"};
  EXPECT_FALSE(l2->GetIgnoreNotFound(ctx_, "missing", data));
  EXPECT_EQ(data.name, "untouched");

  EXPECT_EQ(l2->GetIgnoreNotFound(ctx_, "", data), Errc::keyIsEmpty);
}

TEST_F(TieredCacheTest, GetIgnoreNotFoundWithoutSentinelMutesNothing) {
  auto l2 = build(10, 1min);
  TestData data;
  EXPECT_EQ(l2->GetIgnoreNotFound(ctx_, "missing", data), Errc::notFound);
}

TEST_F(TieredCacheTest, EncodeFailureTouchesNeitherTier) {
  auto l2 = build(10, 1min);
  std::error_code err = l2->Set<int, BufferCodec>(ctx_, "k", 42);
  EXPECT_EQ(err, Errc::invalidType);
  EXPECT_EQ(slow_->sets, 0);
  EXPECT_EQ(l2->Near().Len(), 0);
}

TEST_F(TieredCacheTest, DecodeErrorsPropagate) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE(l2->SetBytes(ctx_, "text", toBytes("not json")));
  TestData data;
  EXPECT_EQ(l2->Get(ctx_, "text", data), Errc::unmarshalFailed);

  ASSERT_FALSE(l2->Set(ctx_, "num", 42));
  EXPECT_EQ(l2->Get(ctx_, "num", data), Errc::invalidType);
}

TEST_F(TieredCacheTest, BufferCodecPassesBytesThrough) {
  auto l2 = build(10, 1min);
  ASSERT_FALSE((l2->Set<std::string, BufferCodec>(ctx_, "raw", "abc")));

  std::string out;
  ASSERT_FALSE((l2->Get<std::string, BufferCodec>(ctx_, "raw", out)));
  EXPECT_EQ(out, "abc");

  Bytes buf;
  ASSERT_FALSE(l2->GetBytes(ctx_, "raw", buf));
  EXPECT_EQ(buf, toBytes("abc"));
}

TEST_F(TieredCacheTest, CancelledContextReachesSlowStore) {
  auto l2 = build(10, 1min);
  Context ctx = Context::Background();
  ctx.Cancel();

  EXPECT_EQ(l2->SetBytes(ctx, "k", toBytes("v")), Errc::cancelled);
  Bytes buf;
  EXPECT_EQ(l2->GetBytes(ctx, "k", buf), Errc::cancelled);
  EXPECT_EQ(l2->Near().Len(), 0);
}
