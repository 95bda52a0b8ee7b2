#pragma once
#include <gmock/gmock.h>
#include "store.hpp"

class StoreMock : public StoreInterface {
public:
    MOCK_METHOD(E<void>, init, (), (override));
    MOCK_METHOD(E<std::optional<VirtualActor>>, getVirtualActor, (const std::string&), (override));
    MOCK_METHOD(E<bool>, insertVirtualActor, (const VirtualActor&), (override));
    MOCK_METHOD(E<void>, updateVirtualActorProfile, (const VirtualActor&), (override));
    MOCK_METHOD(E<std::optional<DerivedIdentity>>, getDerivedIdentityByUri, (const std::string&), (override));
    MOCK_METHOD(E<std::optional<DerivedIdentity>>, getDerivedIdentityByPubkey, (const std::string&), (override));
    MOCK_METHOD(E<std::vector<std::string>>, derivedPubkeys, (), (override));
    MOCK_METHOD(E<bool>, insertDerivedIdentity, (const DerivedIdentity&), (override));
    MOCK_METHOD(E<std::optional<RemoteActor>>, getRemoteActor, (const std::string&), (override));
    MOCK_METHOD(E<void>, putRemoteActor, (const RemoteActor&), (override));
    MOCK_METHOD(E<std::optional<int64_t>>, getSeen, (const std::string&), (override));
    MOCK_METHOD(E<void>, putSeen, (const std::string&, int64_t), (override));
    MOCK_METHOD(E<int>, purgeSeenBefore, (int64_t), (override));
    MOCK_METHOD(E<std::optional<FollowerRecord>>, getFollower, (const std::string&, const std::string&), (override));
    MOCK_METHOD(E<void>, putFollower, (const FollowerRecord&), (override));
    MOCK_METHOD(E<std::vector<FollowerRecord>>, activeFollowers, (const std::string&), (override));
    MOCK_METHOD(E<std::vector<std::string>>, followedSubjects, (), (override));
    MOCK_METHOD(E<std::vector<std::string>>, followedBy, (const std::string&), (override));
    MOCK_METHOD(E<void>, putInboundFollow, (const InboundFollow&), (override));
    MOCK_METHOD(E<std::optional<InboundFollow>>, getInboundFollow, (const std::string&), (override));
    MOCK_METHOD(E<std::optional<FollowingRecord>>, getFollowing, (const std::string&, const std::string&), (override));
    MOCK_METHOD(E<std::optional<FollowingRecord>>, getFollowingById, (const std::string&), (override));
    MOCK_METHOD(E<void>, putFollowing, (const FollowingRecord&), (override));
    MOCK_METHOD(E<void>, deleteFollowing, (const std::string&, const std::string&), (override));
    MOCK_METHOD(E<std::vector<FollowingRecord>>, followingOf, (const std::string&), (override));
    MOCK_METHOD(E<std::optional<std::string>>, eventIdForObject, (const std::string&), (override));
    MOCK_METHOD(E<std::optional<std::string>>, objectForEventId, (const std::string&), (override));
    MOCK_METHOD(E<void>, putObjectMapping, (const ObjectMapping&), (override));
    MOCK_METHOD(E<std::optional<int64_t>>, getRelayCursor, (const std::string&), (override));
    MOCK_METHOD(E<void>, advanceRelayCursor, (const std::string&, int64_t), (override));
    MOCK_METHOD(E<std::optional<std::string>>, getSystemConfig, (const std::string&), (override));
    MOCK_METHOD(E<void>, setSystemConfig, (const std::string&, const std::string&), (override));
};
