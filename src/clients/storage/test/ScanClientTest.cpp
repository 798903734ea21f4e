/* Copyright (c) 2021 vesoft inc. All rights reserved.
 *
 * This source code is licensed under Apache 2.0 License.
 */

#include <folly/init/Init.h>
#include <gtest/gtest.h>

#include "clients/meta/MetaCache.h"
#include "clients/storage/ScanClient.h"
#include "clients/storage/test/MockStorage.h"
#include "common/base/Base.h"

namespace graphscan {
namespace storage {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const HostAddr kHostA("a", 9779);
const HostAddr kHostB("b", 9779);

}  // namespace

class ScanClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_ = std::make_shared<FakeStorage>();
    conns_ = std::make_shared<FakeConnProvider>(storage_);

    meta::SpaceDesc space;
    space.id = 1;
    space.name = "nba";
    space.parts[1] = {kHostA, kHostB};
    space.parts[2] = {kHostA};
    space.parts[3] = {kHostB, kHostA};
    space.edges["like"] = 101;
    space.tags["player"] = 201;
    std::vector<meta::SpaceDesc> spaces;
    spaces.emplace_back(std::move(space));
    cache_ = std::make_shared<meta::MetaCache>(std::move(spaces));
    client_ = std::make_unique<ScanClient>(cache_, conns_);
  }

  std::shared_ptr<FakeStorage> storage_;
  std::shared_ptr<FakeConnProvider> conns_;
  std::shared_ptr<meta::MetaCache> cache_;
  std::unique_ptr<ScanClient> client_;
};

TEST_F(ScanClientTest, EdgeRequest) {
  ScanOptions options;
  options.limit = 10;
  options.filter = "like.degree > 90";
  options.startTime = 100;
  options.endTime = 200;
  options.onlyLatestVersion = true;
  options.enableReadFromFollower = false;
  options.partialSuccessAllowed = true;
  options.partsPerHost = 2;

  auto ret = client_->scanEdge("nba", "like", {"degree"}, options);
  ASSERT_TRUE(ret.ok()) << ret.status();
  auto it = std::move(ret).value();
  ASSERT_TRUE(it->hasNext());
  ASSERT_EQ("nba", it->spaceName());
  ASSERT_EQ("like", it->labelName());
  ASSERT_EQ(3, it->pendingParts());
  ASSERT_EQ(std::vector<HostAddr>({kHostA, kHostB}), it->addresses());

  const auto& req = it->request();
  ASSERT_EQ(1, req.spaceId);
  ASSERT_EQ(101, req.returnColumns.type);
  ASSERT_EQ(std::vector<std::string>({kSrc, kType, kRank, kDst, "degree"}),
            req.returnColumns.props);
  ASSERT_EQ(10, req.limit);
  ASSERT_EQ("like.degree > 90", req.filter);
  ASSERT_EQ(100, req.startTime);
  ASSERT_EQ(200, req.endTime);
  ASSERT_TRUE(req.onlyLatestVersion);
  ASSERT_FALSE(req.enableReadFromFollower);

  // Both partitions of host a go in the same round
  storage_->reply(kHostA, 1, scanSucceeded(likeEdges({{"Tim", "Tony"}}), false));
  storage_->reply(kHostA, 2, scanSucceeded(likeEdges({{"Tony", "Manu"}}), false));
  storage_->fail(kHostB, 3, "Connection reset by peer");
  auto result = it->next();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(ScanStatus::PART_SUCCESS, result.value().status());
  ASSERT_EQ(2, result.value().rowSize());
  ASSERT_EQ(std::vector<std::string>({kSrc, kType, kRank, kDst, "degree"}),
            result.value().propNames());

  auto edges = result.value().rows();
  ASSERT_TRUE(edges.ok()) << edges.status();
  ASSERT_EQ(2, edges.value().size());
  for (const auto& edge : edges.value()) {
    ASSERT_EQ(101, edge.type);
  }

  for (const auto& conn : conns_->connections()) {
    const auto& sent = conn->lastEdgeRequest();
    ASSERT_TRUE(sent.has_value());
    ASSERT_EQ(10, sent->limit);
    ASSERT_EQ("like.degree > 90", sent->filter);
    ASSERT_EQ("", sent->cursor);
  }
}

TEST_F(ScanClientTest, ScanAllEdges) {
  ScanOptions options;
  options.partsPerHost = 1;
  auto ret = client_->scanEdge("nba", "like", {}, options);
  ASSERT_TRUE(ret.ok()) << ret.status();
  auto it = std::move(ret).value();
  // Only the key columns
  ASSERT_EQ(std::vector<std::string>({kSrc, kType, kRank, kDst}),
            it->request().returnColumns.props);

  // Leaders are the first peers, host a owns parts 1 and 2, host b owns part 3
  storage_->reply(kHostA, 1, scanSucceeded(likeEdges({{"Tim", "Tony"}}), false));
  storage_->reply(kHostB, 3, scanSucceeded(likeEdges({{"Manu", "Tim"}}), true, "c3"));
  storage_->reply(kHostA, 2, scanSucceeded(likeEdges({{"Tony", "Manu"}}), false));
  storage_->reply(kHostB, 3, scanSucceeded(likeEdges({{"Manu", "Tony"}}), false));

  size_t rows = 0;
  int32_t rounds = 0;
  while (it->hasNext()) {
    auto result = it->next();
    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_TRUE(result.value().isAllSuccess());
    rows += result.value().rowSize();
    ++rounds;
  }
  ASSERT_EQ(2, rounds);
  ASSERT_EQ(4, rows);
  ASSERT_EQ(0, it->pendingParts());

  auto p3 = storage_->callsOf(3);
  ASSERT_EQ(2, p3.size());
  ASSERT_EQ("", p3[0].cursor);
  ASSERT_EQ("c3", p3[1].cursor);
  ASSERT_EQ(1, storage_->callsOf(1).size());
  ASSERT_EQ(1, storage_->callsOf(2).size());
  ASSERT_EQ(conns_->totalAcquired(), conns_->totalReleased());

  auto done = it->next();
  ASSERT_FALSE(done.ok());
  ASSERT_TRUE(done.status().isIteratorExhausted());
}

TEST_F(ScanClientTest, SelectedParts) {
  ScanOptions options;
  options.parts = {3};
  auto ret = client_->scanEdge("nba", "like", {"degree"}, options);
  ASSERT_TRUE(ret.ok()) << ret.status();
  auto it = std::move(ret).value();
  ASSERT_EQ(1, it->pendingParts());
  ASSERT_EQ(std::vector<HostAddr>({kHostB}), it->addresses());

  storage_->reply(kHostB, 3, scanSucceeded(likeEdges({{"Manu", "Tim"}}), false));
  auto result = it->next();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(1, result.value().rowSize());
  ASSERT_FALSE(it->hasNext());
  ASSERT_TRUE(storage_->callsOf(1).empty());

  for (PartitionID part : {0, 4, -1}) {
    options.parts = {1, part};
    auto bad = client_->scanEdge("nba", "like", {}, options);
    ASSERT_FALSE(bad.ok());
    ASSERT_TRUE(bad.status().isPartNotFound()) << bad.status();
  }
}

TEST_F(ScanClientTest, UnknownNames) {
  auto noSpace = client_->scanEdge("lakers", "like", {});
  ASSERT_FALSE(noSpace.ok());
  ASSERT_TRUE(noSpace.status().isSpaceNotFound());

  auto noEdge = client_->scanEdge("nba", "serve", {});
  ASSERT_FALSE(noEdge.ok());
  ASSERT_TRUE(noEdge.status().isEdgeNotFound());

  // A tag is not an edge
  ASSERT_TRUE(client_->scanEdge("nba", "player", {}).status().isEdgeNotFound());

  auto noTag = client_->scanVertex("nba", "team", {});
  ASSERT_FALSE(noTag.ok());
  ASSERT_TRUE(noTag.status().isTagNotFound());

  ASSERT_TRUE(client_->scanVertex("lakers", "player", {}).status().isSpaceNotFound());
  ASSERT_EQ(0, conns_->totalAcquired());
}

TEST_F(ScanClientTest, ScanVertices) {
  ScanOptions options;
  options.partsPerHost = 2;
  auto ret = client_->scanVertex("nba", "player", {"name"}, options);
  ASSERT_TRUE(ret.ok()) << ret.status();
  auto it = std::move(ret).value();
  ASSERT_EQ(201, it->request().returnColumns.tag);
  ASSERT_EQ(std::vector<std::string>({kVid, "name"}), it->request().returnColumns.props);

  storage_->reply(kHostA, 1, scanSucceeded(playerVertices({"p1"}), false));
  storage_->reply(kHostA, 2, scanSucceeded(playerVertices({"p2", "p3"}), false));
  storage_->reply(kHostB, 3, scanSucceeded(playerVertices({}), false));

  auto result = it->next();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_TRUE(result.value().isAllSuccess());
  auto vertices = result.value().rows();
  ASSERT_TRUE(vertices.ok()) << vertices.status();
  ASSERT_EQ(3, vertices.value().size());

  std::set<std::string> names;
  for (const auto& vertex : vertices.value()) {
    names.emplace(vertex.prop("name").getStr());
  }
  ASSERT_EQ(std::set<std::string>({"name_p1", "name_p2", "name_p3"}), names);
  ASSERT_FALSE(it->hasNext());

  for (const auto& conn : conns_->connections()) {
    ASSERT_TRUE(conn->lastVertexRequest().has_value());
    ASSERT_FALSE(conn->lastEdgeRequest().has_value());
  }
}

TEST_F(ScanClientTest, LeaderLookupFails) {
  auto meta = std::make_shared<NiceMock<MockMetaProvider>>();
  ON_CALL(*meta, getSpaceIdByName("nba")).WillByDefault(Return(StatusOr<GraphSpaceID>(1)));
  ON_CALL(*meta, getEdgeTypeByName(1, "like")).WillByDefault(Return(StatusOr<EdgeType>(101)));
  ON_CALL(*meta, partsNum(1)).WillByDefault(Return(StatusOr<int32_t>(2)));
  ON_CALL(*meta, getLeader(1, 1)).WillByDefault(Return(StatusOr<HostAddr>(kHostA)));
  ON_CALL(*meta, getLeader(1, 2))
      .WillByDefault(Return(StatusOr<HostAddr>(Status::HostNotFound("No peers"))));
  EXPECT_CALL(*meta, getLeader(1, _)).Times(2);

  ScanClient client(meta, conns_);
  auto ret = client.scanEdge("nba", "like", {});
  ASSERT_FALSE(ret.ok());
  ASSERT_TRUE(ret.status().isHostNotFound()) << ret.status();
}

}  // namespace storage
}  // namespace graphscan

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  folly::init(&argc, &argv, true);
  google::SetStderrLogging(google::INFO);

  return RUN_ALL_TESTS();
}
