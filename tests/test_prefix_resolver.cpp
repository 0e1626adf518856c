#include "TestFixtures.h"
#include "analysis/PrefixResolver.h"
#include "core/ReferenceQuery.h"

#include <gtest/gtest.h>

#include <memory>

class PrefixResolverTest : public ::testing::Test {
protected:
  PrefixResolverTest()
      : table_(makeFixtureTable()),
        query_(makeReferenceQuery(table_, QueryBackend::Indexed)),
        resolver_(*query_) {}

  ReferenceTable table_;
  std::unique_ptr<ReferenceQuery> query_;
  PrefixResolver resolver_;
};

TEST_F(PrefixResolverTest, ExactPrefix) {
  auto m = resolver_.resolve("AB", fixtureTime());
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->prefix->call, "AB");
  EXPECT_EQ(m->removed, 0u);
}

TEST_F(PrefixResolverTest, LongestPrefixWins) {
  auto m = resolver_.resolve("AB9CD", fixtureTime());
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->prefix->call, "AB9");
  EXPECT_EQ(m->removed, 2u);

  auto shorter = resolver_.resolve("AB1CD", fixtureTime());
  ASSERT_TRUE(shorter.has_value());
  EXPECT_EQ(shorter->prefix->call, "AB");
  EXPECT_EQ(shorter->removed, 3u);
}

TEST_F(PrefixResolverTest, NoMatch) {
  EXPECT_FALSE(resolver_.resolve("X5ABC", fixtureTime()).has_value());
  EXPECT_FALSE(resolver_.resolve("", fixtureTime()).has_value());
}

TEST_F(PrefixResolverTest, RespectsTime) {
  auto old = resolver_.resolve("Y27ABC", utc("1985-01-01T00:00:00Z"));
  auto now = resolver_.resolve("Y27ABC", fixtureTime());
  ASSERT_TRUE(old.has_value());
  ASSERT_TRUE(now.has_value());
  EXPECT_EQ(old->prefix->adif, 229);
  EXPECT_EQ(now->prefix->adif, 230);
}

TEST_F(PrefixResolverTest, CompoundPrefixWithLetterAppendix) {
  auto plain = resolver_.resolve("CC1AB", fixtureTime());
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->prefix->call, "CC");

  auto compound = resolver_.resolve("CC1AB", fixtureTime(), {"P", "A"});
  ASSERT_TRUE(compound.has_value());
  EXPECT_EQ(compound->prefix->call, "CC/A");
  EXPECT_EQ(compound->prefix->adif, 400);
  EXPECT_EQ(compound->removed, 3u);
}

TEST_F(PrefixResolverTest, OnlySingleLetterAppendicesCompound) {
  // "A1" and "7" are not single letters, so CC/A is never tried
  auto m = resolver_.resolve("CC1AB", fixtureTime(), {"A1", "7", "QRP"});
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->prefix->call, "CC");
}

TEST_F(PrefixResolverTest, AlwaysKeepsAtLeastOneCharacter) {
  const char *calls[] = {"AB1CD", "AB9", "SV0ABC", "F5XYZ", "CC2345", "MM0ABC"};
  for (const char *c : calls) {
    std::string call = c;
    auto m = resolver_.resolve(call, fixtureTime());
    ASSERT_TRUE(m.has_value()) << call;
    EXPECT_LE(m->removed, call.size() - 1) << call;
    EXPECT_EQ(call.compare(0, m->prefix->call.size(), m->prefix->call), 0)
        << call;
  }
}
