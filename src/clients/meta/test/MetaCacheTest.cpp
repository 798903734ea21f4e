/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include <folly/init/Init.h>
#include <gtest/gtest.h>

#include "clients/meta/MetaCache.h"
#include "common/base/Base.h"

namespace graphscan {
namespace meta {

namespace {

SpaceDesc mockSpace() {
  HostAddr h1("h1", 9779);
  HostAddr h2("h2", 9779);
  HostAddr h3("h3", 9779);
  SpaceDesc space;
  space.id = 1;
  space.name = "nba";
  space.parts[1] = {h1, h2, h3};
  space.parts[2] = {h2, h3, h1};
  space.parts[3] = {h3};
  space.edges["like"] = 101;
  space.edges["serve"] = 102;
  space.tags["player"] = 201;
  return space;
}

}  // namespace

TEST(MetaCacheTest, ResolveNames) {
  MetaCache cache({mockSpace()});

  auto spaceRet = cache.getSpaceIdByName("nba");
  ASSERT_TRUE(spaceRet.ok());
  ASSERT_EQ(1, spaceRet.value());
  ASSERT_TRUE(cache.getSpaceIdByName("wnba").status().isSpaceNotFound());

  auto edgeRet = cache.getEdgeTypeByName(1, "serve");
  ASSERT_TRUE(edgeRet.ok());
  ASSERT_EQ(102, edgeRet.value());
  ASSERT_TRUE(cache.getEdgeTypeByName(1, "teammate").status().isEdgeNotFound());
  ASSERT_TRUE(cache.getEdgeTypeByName(2, "serve").status().isSpaceNotFound());

  auto tagRet = cache.getTagIdByName(1, "player");
  ASSERT_TRUE(tagRet.ok());
  ASSERT_EQ(201, tagRet.value());
  ASSERT_TRUE(cache.getTagIdByName(1, "team").status().isTagNotFound());

  auto numRet = cache.partsNum(1);
  ASSERT_TRUE(numRet.ok());
  ASSERT_EQ(3, numRet.value());
  ASSERT_TRUE(cache.partsNum(2).status().isSpaceNotFound());
}

TEST(MetaCacheTest, LeaderCache) {
  MetaCache cache({mockSpace()});
  HostAddr h1("h1", 9779);
  HostAddr h2("h2", 9779);
  HostAddr h3("h3", 9779);

  // Nothing cached, the first peer is picked and kept
  auto leader = cache.getLeader(1, 1);
  ASSERT_TRUE(leader.ok());
  ASSERT_EQ(h1, leader.value());
  ASSERT_EQ(h1, cache.getLeader(1, 1).value());

  cache.updateLeader(1, 1, h3);
  ASSERT_EQ(h3, cache.getLeader(1, 1).value());

  // Another peer is tried once the leader is invalidated
  cache.invalidLeader(1, 1);
  ASSERT_EQ(h2, cache.getLeader(1, 1).value());
  cache.invalidLeader(1, 1);
  ASSERT_EQ(h3, cache.getLeader(1, 1).value());
  cache.invalidLeader(1, 1);
  ASSERT_EQ(h1, cache.getLeader(1, 1).value());

  ASSERT_EQ(h2, cache.getLeader(1, 2).value());
  ASSERT_TRUE(cache.getLeader(1, 4).status().isPartNotFound());
  ASSERT_TRUE(cache.getLeader(9, 1).status().isSpaceNotFound());
}

TEST(MetaCacheTest, AddAndRemoveSpace) {
  MetaCache cache;
  ASSERT_TRUE(cache.getSpaceIdByName("nba").status().isSpaceNotFound());

  ASSERT_TRUE(cache.addSpace(mockSpace()).ok());
  ASSERT_TRUE(cache.getSpaceIdByName("nba").ok());
  cache.updateLeader(1, 3, HostAddr("h9", 9779));

  // Renaming the space through a reload
  auto renamed = mockSpace();
  renamed.name = "basketball";
  ASSERT_TRUE(cache.addSpace(std::move(renamed)).ok());
  ASSERT_TRUE(cache.getSpaceIdByName("nba").status().isSpaceNotFound());
  ASSERT_EQ(1, cache.getSpaceIdByName("basketball").value());

  ASSERT_TRUE(cache.removeSpace("basketball").ok());
  ASSERT_TRUE(cache.removeSpace("basketball").isSpaceNotFound());
  ASSERT_TRUE(cache.getLeader(1, 3).status().isSpaceNotFound());
}

TEST(MetaCacheTest, PartsNumberedWithoutGaps) {
  MetaCache cache;
  auto sparse = mockSpace();
  sparse.parts.erase(2);
  auto status = cache.addSpace(sparse);
  ASSERT_TRUE(status.isInvalidArgument()) << status;
  ASSERT_TRUE(cache.getSpaceIdByName("nba").status().isSpaceNotFound());

  auto zero = mockSpace();
  zero.parts.erase(3);
  zero.parts[0] = {HostAddr("h1", 9779)};
  ASSERT_TRUE(cache.addSpace(std::move(zero)).isInvalidArgument());

  ASSERT_TRUE(cache.addSpace(mockSpace()).ok());
  ASSERT_EQ(3, cache.partsNum(1).value());
  for (PartitionID part = 1; part <= cache.partsNum(1).value(); ++part) {
    ASSERT_TRUE(cache.getLeader(1, part).ok()) << part;
  }
}

TEST(MetaCacheTest, ConcurrentLeaderUpdates) {
  MetaCache cache({mockSpace()});
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&cache, i]() {
      for (int j = 0; j < 1000; ++j) {
        auto part = 1 + (i + j) % 3;
        if (j % 3 == 0) {
          cache.invalidLeader(1, part);
        } else if (j % 3 == 1) {
          cache.updateLeader(1, part, HostAddr("h1", 9779));
        } else {
          auto leader = cache.getLeader(1, part);
          EXPECT_TRUE(leader.ok());
          EXPECT_TRUE(leader.value().isValid());
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace meta
}  // namespace graphscan

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  folly::init(&argc, &argv, true);
  google::SetStderrLogging(google::INFO);

  return RUN_ALL_TESTS();
}
