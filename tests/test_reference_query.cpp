#include "TestFixtures.h"
#include "core/ReferenceQuery.h"

#include <gtest/gtest.h>

#include <memory>

TEST(TimeWindowTest, UnboundedContainsEverything) {
  TimeWindow w;
  EXPECT_TRUE(w.contains(utc("1900-01-01T00:00:00Z")));
  EXPECT_TRUE(w.contains(utc("2100-01-01T00:00:00Z")));
}

TEST(TimeWindowTest, BoundsAreInclusive) {
  TimeWindow w = window("2000-01-01T00:00:00Z", "2000-12-31T23:59:59Z");
  EXPECT_TRUE(w.contains(utc("2000-01-01T00:00:00Z")));
  EXPECT_TRUE(w.contains(utc("2000-12-31T23:59:59Z")));
  EXPECT_FALSE(w.contains(utc("1999-12-31T23:59:59Z")));
  EXPECT_FALSE(w.contains(utc("2001-01-01T00:00:00Z")));
}

TEST(TimeWindowTest, HalfOpenWindows) {
  TimeWindow from = window("2000-01-01T00:00:00Z", "");
  EXPECT_FALSE(from.contains(utc("1999-01-01T00:00:00Z")));
  EXPECT_TRUE(from.contains(utc("2099-01-01T00:00:00Z")));

  TimeWindow until = window("", "2000-01-01T00:00:00Z");
  EXPECT_TRUE(until.contains(utc("1950-01-01T00:00:00Z")));
  EXPECT_FALSE(until.contains(utc("2000-01-01T00:00:01Z")));
}

TEST(TimeWindowTest, Intersects) {
  TimeWindow a = window("2000-01-01T00:00:00Z", "2005-01-01T00:00:00Z");
  TimeWindow b = window("2005-01-01T00:00:00Z", "2010-01-01T00:00:00Z");
  TimeWindow c = window("2005-01-01T00:00:01Z", "");
  EXPECT_TRUE(a.intersects(b)); // shared end point
  EXPECT_TRUE(b.intersects(a));
  EXPECT_FALSE(a.intersects(c));
  EXPECT_TRUE(b.intersects(c));
  EXPECT_TRUE(TimeWindow{}.intersects(a));
}

class ReferenceQueryTest : public ::testing::TestWithParam<QueryBackend> {
protected:
  void SetUp() override {
    table_ = makeFixtureTable();
    query_ = makeReferenceQuery(table_, GetParam());
  }

  ReferenceTable table_;
  std::unique_ptr<ReferenceQuery> query_;
};

TEST_P(ReferenceQueryTest, PrefixFound) {
  const Prefix *p = query_->getPrefix("AB9", fixtureTime());
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->adif, 200);
  EXPECT_EQ(p->cqz, 20);
}

TEST_P(ReferenceQueryTest, PrefixNotFound) {
  EXPECT_EQ(query_->getPrefix("FOO", fixtureTime()), nullptr);
  EXPECT_EQ(query_->getPrefix("", fixtureTime()), nullptr);
}

TEST_P(ReferenceQueryTest, PrefixDependsOnTime) {
  const Prefix *before = query_->getPrefix("Y2", utc("1980-01-01T00:00:00Z"));
  const Prefix *after = query_->getPrefix("Y2", utc("1995-01-01T00:00:00Z"));
  ASSERT_NE(before, nullptr);
  ASSERT_NE(after, nullptr);
  EXPECT_EQ(before->adif, 229);
  EXPECT_EQ(after->adif, 230);
}

TEST_P(ReferenceQueryTest, ResultsBorrowFromTable) {
  const Prefix *p = query_->getPrefix("SV", fixtureTime());
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p, &table_.prefixes[2]);
}

TEST_P(ReferenceQueryTest, Entity) {
  const Entity *e = query_->getEntity(200, fixtureTime());
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->name, "E200");
  EXPECT_EQ(query_->getEntity(999, fixtureTime()), nullptr);

  // Deleted entity only valid up to its end date
  EXPECT_NE(query_->getEntity(229, utc("1985-01-01T00:00:00Z")), nullptr);
  EXPECT_EQ(query_->getEntity(229, fixtureTime()), nullptr);
}

TEST_P(ReferenceQueryTest, CallsignException) {
  const CallsignException *exc =
      query_->getCallsignException("AB1ZZ", fixtureTime());
  ASSERT_NE(exc, nullptr);
  EXPECT_EQ(exc->adif, 200);
  EXPECT_EQ(query_->getCallsignException("AB1QQ", fixtureTime()), nullptr);
  // Exact match only
  EXPECT_EQ(query_->getCallsignException("AB1ZZ/P", fixtureTime()), nullptr);
}

TEST_P(ReferenceQueryTest, InvalidOperation) {
  EXPECT_TRUE(query_->isInvalidOperation("AB3BAD", fixtureTime()));
  EXPECT_FALSE(
      query_->isInvalidOperation("AB3BAD", utc("2021-01-01T00:00:00Z")));
  EXPECT_FALSE(query_->isInvalidOperation("AB1CD", fixtureTime()));
}

TEST_P(ReferenceQueryTest, ZoneException) {
  EXPECT_EQ(query_->getZoneException("AB2WW", fixtureTime()), 99);
  EXPECT_FALSE(
      query_->getZoneException("AB2WW", utc("1999-01-01T00:00:00Z")).has_value());
  EXPECT_FALSE(query_->getZoneException("AB1CD", fixtureTime()).has_value());
}

TEST_P(ReferenceQueryTest, OverlappingWindowsTakeFirstRecord) {
  table_.prefixes.push_back(makePrefix(900, "QQ", "FIRST", 1, 1));
  table_.prefixes.push_back(makePrefix(901, "QQ", "SECOND", 2, 2));
  query_ = makeReferenceQuery(table_, GetParam());

  const Prefix *p = query_->getPrefix("QQ", fixtureTime());
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->record, 900);
}

INSTANTIATE_TEST_SUITE_P(Backends, ReferenceQueryTest,
                         ::testing::Values(QueryBackend::Scan,
                                           QueryBackend::Indexed),
                         [](const auto &info) {
                           return std::string(queryBackendName(info.param));
                         });

TEST(ReferenceQueryBackends, ScanAndIndexedAgree) {
  ReferenceTable table = makeFixtureTable();
  auto scan = makeReferenceQuery(table, QueryBackend::Scan);
  auto indexed = makeReferenceQuery(table, QueryBackend::Indexed);

  const char *keys[] = {"AB",    "AB9",   "SV",    "SV9",   "CC/A", "Y2",
                        "AB1ZZ", "AB1XX", "AB3BAD", "AB2WW", "NONE"};
  const char *times[] = {"1980-01-01T00:00:00Z", "1990-10-03T00:00:00Z",
                         "2005-06-01T12:00:00Z", "2021-01-01T00:00:00Z"};
  const int adifs[] = {100, 200, 229, 230, 0, 999};

  for (const char *ts : times) {
    Timestamp t = utc(ts);
    for (const char *key : keys) {
      EXPECT_EQ(scan->getPrefix(key, t), indexed->getPrefix(key, t)) << key;
      EXPECT_EQ(scan->getCallsignException(key, t),
                indexed->getCallsignException(key, t))
          << key;
      EXPECT_EQ(scan->getZoneException(key, t),
                indexed->getZoneException(key, t))
          << key;
      EXPECT_EQ(scan->isInvalidOperation(key, t),
                indexed->isInvalidOperation(key, t))
          << key;
    }
    for (int adif : adifs) {
      EXPECT_EQ(scan->getEntity(adif, t), indexed->getEntity(adif, t)) << adif;
    }
  }
}
