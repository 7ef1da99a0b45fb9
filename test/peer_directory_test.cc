#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "coordinator/peer_directory.h"

using namespace Sonar;

TEST(PeerDirectoryTest, ConnectAndResolve) {
	PeerDirectory directory;
	EXPECT_FALSE(directory.ResolveLivePeer("A").has_value());

	EXPECT_TRUE(directory.Connect("A", "10.0.0.1:50062"));
	auto peer = directory.ResolveLivePeer("A");
	ASSERT_TRUE(peer.has_value());
	EXPECT_EQ(peer->peer_id, "A");
	EXPECT_EQ(peer->address, "10.0.0.1:50062");
	EXPECT_EQ(directory.size(), 1u);
}

TEST(PeerDirectoryTest, SecondConnectKeepsFirstAddress) {
	PeerDirectory directory;
	ASSERT_TRUE(directory.Connect("A", "10.0.0.1:50062"));
	EXPECT_FALSE(directory.Connect("A", "10.0.0.7:50062"));
	EXPECT_EQ(directory.ResolveLivePeer("A")->address, "10.0.0.1:50062");
}

TEST(PeerDirectoryTest, DisconnectReturnsAddress) {
	PeerDirectory directory;
	ASSERT_TRUE(directory.Connect("A", "10.0.0.1:50062"));

	auto address = directory.Disconnect("A");
	ASSERT_TRUE(address.has_value());
	EXPECT_EQ(*address, "10.0.0.1:50062");
	EXPECT_FALSE(directory.ResolveLivePeer("A").has_value());
	EXPECT_EQ(directory.size(), 0u);

	EXPECT_FALSE(directory.Disconnect("A").has_value());
	EXPECT_TRUE(directory.Connect("A", "10.0.0.3:50062"));
}

TEST(PeerDirectoryTest, ConcurrentConnects) {
	PeerDirectory directory;
	std::vector<std::thread> threads;
	for (int t = 0; t < 4; t++) {
		threads.emplace_back([&directory, t]() {
			for (int i = 0; i < 100; i++) {
				std::string id = std::to_string(t) + "-" + std::to_string(i);
				EXPECT_TRUE(directory.Connect(id, "host:" + std::to_string(i)));
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}
	EXPECT_EQ(directory.size(), 400u);
}
