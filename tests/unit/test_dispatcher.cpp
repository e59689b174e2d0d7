#include <gtest/gtest.h>
#include "fake_cluster.hpp"
#include "dispatcher/dispatcher.hpp"
#include <thread>

using namespace passive_kv;
using namespace passive_kv::fakes;

class DispatcherTest : public ::testing::Test
{
protected:
    FakeCluster cluster;

    std::unique_ptr<Dispatcher> makeDispatcher(ReplicaHandlePtr primary, std::vector<ReplicaHandlePtr> backups,
                                               std::chrono::milliseconds interval = std::chrono::milliseconds(5000))
    {
        return std::make_unique<Dispatcher>(cluster.registry, std::move(primary), std::move(backups),
                                            "replica", interval);
    }
};

TEST_F(DispatcherTest, ForwardsToPrimary)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});

    const auto put = dispatcher->put("a", "1");
    ASSERT_TRUE(put.ok());
    EXPECT_TRUE(put.value());

    const auto hit = dispatcher->get("a");
    ASSERT_TRUE(hit.ok());
    ASSERT_TRUE(hit.value().has_value());
    EXPECT_EQ(*hit.value(), "1");

    const auto miss = dispatcher->get("b");
    ASSERT_TRUE(miss.ok());
    EXPECT_FALSE(miss.value().has_value());
}

TEST_F(DispatcherTest, EmptyStringIsAFoundValue)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});

    ASSERT_TRUE(dispatcher->put("k", "").value());

    const auto result = dispatcher->get("k");
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_TRUE(result.value()->empty());
}

TEST_F(DispatcherTest, FailsOverToFirstBackupWithLastAcknowledgedState)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b1 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto b2 = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b1, b2});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    ASSERT_TRUE(dispatcher->put("b", "2").value());
    const auto last_acknowledged = stateOf(primary);

    primary->kill();

    const auto result = dispatcher->get("a");
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "1");

    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica2");
    EXPECT_TRUE(b1->replica()->isPrimary());
    EXPECT_FALSE(b2->replica()->isPrimary());
    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica3"});
    EXPECT_EQ(stateOf(b1), last_acknowledged);
}

TEST_F(DispatcherTest, WritesContinueAfterFailover)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b1 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto b2 = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b1, b2});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    primary->kill();

    const auto result = dispatcher->put("b", "2");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value());

    // The new primary replicates to the surviving backup and ignores the dead one
    const Snapshot expected{{"a", "1"}, {"b", "2"}};
    EXPECT_EQ(stateOf(b1), expected);
    EXPECT_EQ(stateOf(b2), expected);
    EXPECT_EQ(b1->replica()->getIgnoredNames(), std::vector<std::string>{"replica1"});
}

TEST_F(DispatcherTest, SkipsBackupsThatCannotBePromoted)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b1 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto b2 = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b1, b2});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    primary->kill();
    b1->kill();

    const auto result = dispatcher->get("a");
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "1");

    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica3");
    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    EXPECT_EQ(b1->promote_count.load(), 1);
}

TEST_F(DispatcherTest, UnavailableOnceBackupsAreExhausted)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    primary->kill();

    const auto first = dispatcher->get("a");
    EXPECT_EQ(first.status(), Status::UNAVAILABLE);
    EXPECT_FALSE(dispatcher->getCurrentPrimary());

    const auto second = dispatcher->put("b", "2");
    EXPECT_EQ(second.status(), Status::UNAVAILABLE);
}

TEST_F(DispatcherTest, PutWithoutAnyReplicaLeavesNoState)
{
    auto bystander = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(nullptr, {});

    const auto result = dispatcher->put("x", "y");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status(), Status::UNAVAILABLE);
    EXPECT_THROW(result.value(), std::runtime_error);

    EXPECT_TRUE(stateOf(bystander).empty());
    EXPECT_EQ(bystander->promote_count.load(), 0);
}

TEST_F(DispatcherTest, NotPrimaryAnswerIsReturnedAsIs)
{
    auto backup = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto other = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(backup, {other});

    const auto result = dispatcher->put("a", "1");
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value());

    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica2");
    EXPECT_EQ(other->promote_count.load(), 0);
}

TEST_F(DispatcherTest, FailoverRejectsNullCandidate)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});

    EXPECT_EQ(dispatcher->failoverToBackup(nullptr), Status::UNAVAILABLE);
    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica1");
}

TEST_F(DispatcherTest, FailedPromotionDoesNotInstallCandidate)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b1 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b1});

    b1->fail_promote = true;
    EXPECT_NE(dispatcher->failoverToBackup(b1), Status::OK);
    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica1");
    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica2"});

    b1->fail_promote = false;
    EXPECT_EQ(dispatcher->failoverToBackup(b1), Status::OK);
    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica2");
    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
}

TEST_F(DispatcherTest, ConcurrentRequestsShareOneFailover)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b1 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto b2 = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b1, b2});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    primary->kill();

    // Requests arriving while the promotion runs find it already done
    b1->promote_delay_ms = 50;

    constexpr int reader_count = 8;
    std::atomic<bool> go{false};
    std::atomic<int> found{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < reader_count; ++i)
    {
        readers.emplace_back([&]()
                             {
                                 while (!go)
                                 {
                                     std::this_thread::yield();
                                 }
                                 const auto result = dispatcher->get("a");
                                 if (result.ok() && result.value() == std::optional<Value>("1"))
                                 {
                                     ++found;
                                 }
                             });
    }
    go = true;
    for (auto &reader : readers)
    {
        reader.join();
    }

    EXPECT_EQ(found.load(), reader_count);
    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica2");
    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica3"});
    EXPECT_GE(b1->promote_count.load(), 1);
    EXPECT_EQ(b2->promote_count.load(), 0);
    EXPECT_TRUE(b1->replica()->isPrimary());
    EXPECT_FALSE(b2->replica()->isPrimary());
}

TEST_F(DispatcherTest, DiscoverySeedsNewReplicaWithPrimaryState)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});
    ASSERT_TRUE(dispatcher->put("a", "1").value());

    auto late = cluster.addReplica(4, ReplicaRole::BACKUP);
    dispatcher->discoverNewReplicas();

    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica4"});
    EXPECT_EQ(stateOf(late), stateOf(primary));
}

TEST_F(DispatcherTest, RepeatedDiscoveryDoesNotDuplicateQueueEntries)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto b2 = cluster.addReplica(2, ReplicaRole::BACKUP);
    cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {b2});

    dispatcher->discoverNewReplicas();
    const auto after_first = dispatcher->getBackupQueueNames();
    dispatcher->discoverNewReplicas();

    const std::vector<std::string> expected = {"replica2", "replica3"};
    EXPECT_EQ(after_first, expected);
    EXPECT_EQ(dispatcher->getBackupQueueNames(), expected);
}

TEST_F(DispatcherTest, DiscoveryIgnoresDeadAndUnresolvableNames)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dead = cluster.addReplica(2, ReplicaRole::BACKUP);
    cluster.registry->addDangling("replica7");
    cluster.registry->add("frontend", primary);
    dead->kill();

    auto dispatcher = makeDispatcher(primary, {});
    dispatcher->discoverNewReplicas();

    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    const std::vector<std::string> expected = {"replica2", "replica7"};
    EXPECT_EQ(dispatcher->getIgnoredNames(), expected);

    // Ignored names stay ignored
    dead->revive();
    const auto pings = dead->ping_count.load();
    dispatcher->discoverNewReplicas();
    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    EXPECT_EQ(dead->ping_count.load(), pings);
}

TEST_F(DispatcherTest, JoinerSeenDuringPrimaryOutageStaysIgnored)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto joiner = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {});

    // The joiner answers pings, but its state cannot be fetched from the primary
    primary->kill();
    dispatcher->discoverNewReplicas();

    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    EXPECT_EQ(dispatcher->getIgnoredNames(), std::vector<std::string>{"replica2"});
    EXPECT_EQ(joiner->push_count.load(), 0);

    primary->revive();
    dispatcher->discoverNewReplicas();

    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    EXPECT_EQ(joiner->push_count.load(), 0);
}

TEST_F(DispatcherTest, DiscoveryNeedsAPrimary)
{
    cluster.addReplica(2, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(nullptr, {});

    dispatcher->discoverNewReplicas();

    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());
    EXPECT_EQ(cluster.registry->lookup_count.load(), 0);
}

TEST_F(DispatcherTest, DiscoveryToleratesUnreachableRegistry)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    cluster.addReplica(2, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(primary, {});

    cluster.registry->reachable = false;
    dispatcher->discoverNewReplicas();
    EXPECT_TRUE(dispatcher->getBackupQueueNames().empty());

    cluster.registry->reachable = true;
    dispatcher->discoverNewReplicas();
    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica2"});
}

TEST_F(DispatcherTest, BackgroundLoopPicksUpLateJoiners)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {}, std::chrono::milliseconds(20));
    ASSERT_TRUE(dispatcher->put("a", "1").value());

    ASSERT_EQ(dispatcher->start(), Status::OK);
    EXPECT_TRUE(dispatcher->isRunning());

    auto late = cluster.addReplica(5, ReplicaRole::BACKUP);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (dispatcher->getBackupQueueNames().empty() && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    dispatcher->stop();
    EXPECT_FALSE(dispatcher->isRunning());

    EXPECT_EQ(dispatcher->getBackupQueueNames(), std::vector<std::string>{"replica5"});
    EXPECT_EQ(stateOf(late), stateOf(primary));
}

TEST_F(DispatcherTest, StopWithoutStartIsHarmless)
{
    auto dispatcher = makeDispatcher(nullptr, {});
    dispatcher->stop();
    EXPECT_FALSE(dispatcher->isRunning());
}

TEST_F(DispatcherTest, FailoverScenario)
{
    auto r1 = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto r2 = cluster.addReplica(2, ReplicaRole::BACKUP);
    auto r3 = cluster.addReplica(3, ReplicaRole::BACKUP);
    auto dispatcher = makeDispatcher(r1, {r2, r3});

    ASSERT_TRUE(dispatcher->put("a", "1").value());
    r1->kill();

    const auto result = dispatcher->get("a");
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "1");
    EXPECT_EQ(dispatcher->getCurrentPrimaryName(), "replica2");
}

TEST_F(DispatcherTest, ServesWireRequests)
{
    auto primary = cluster.addReplica(1, ReplicaRole::PRIMARY);
    auto dispatcher = makeDispatcher(primary, {});

    const PutRequestMessage put("k", "v");
    auto put_reply = dispatcher->handleMessage(put);
    ASSERT_EQ(put_reply->getType(), MessageType::PUT_RESPONSE);
    const auto &put_response = static_cast<const PutResponseMessage &>(*put_reply);
    EXPECT_EQ(put_response.getStatus(), Status::OK);
    EXPECT_TRUE(put_response.isAccepted());

    const GetRequestMessage get("k");
    auto get_reply = dispatcher->handleMessage(get);
    ASSERT_EQ(get_reply->getType(), MessageType::GET_RESPONSE);
    const auto &get_response = static_cast<const GetResponseMessage &>(*get_reply);
    EXPECT_EQ(get_response.getMessageId(), get.getMessageId());
    EXPECT_TRUE(get_response.isFound());
    EXPECT_EQ(get_response.getValue(), std::optional<Value>("v"));

    primary->kill();
    auto unavailable = dispatcher->handleMessage(GetRequestMessage("k"));
    const auto &unavailable_response = static_cast<const GetResponseMessage &>(*unavailable);
    EXPECT_EQ(unavailable_response.getStatus(), Status::UNAVAILABLE);
    EXPECT_FALSE(unavailable_response.isFound());
}
