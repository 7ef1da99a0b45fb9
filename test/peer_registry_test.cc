#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "monitor/peer_registry.h"

using namespace Sonar;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

// Walks prev/next links and checks they agree with head/tail and the id table
void ExpectConsistentLinks(const PeerRegistry& registry) {
	EntryHandle prev;
	size_t count = 0;
	for (EntryHandle h = registry.Head(); h.valid(); h = registry.Next(h)) {
		const PeerEntry* entry = registry.Get(h);
		ASSERT_NE(entry, nullptr);
		EXPECT_EQ(entry->prev, prev);
		EXPECT_EQ(registry.HandleOf(entry->id), h);
		prev = h;
		count++;
	}
	EXPECT_EQ(prev, registry.Tail());
	EXPECT_EQ(count, registry.size());
}

} // namespace

TEST(PeerRegistryTest, StartsEmpty) {
	PeerRegistry registry;
	EXPECT_TRUE(registry.empty());
	EXPECT_FALSE(registry.Head().valid());
	EXPECT_FALSE(registry.Tail().valid());
	EXPECT_THAT(registry.Ids(), IsEmpty());
}

TEST(PeerRegistryTest, RegisterAppendsInInsertionOrder) {
	PeerRegistry registry;
	EXPECT_EQ(registry.Register("A"), RegistryStatus::kOk);
	EXPECT_EQ(registry.Register("B"), RegistryStatus::kOk);
	EXPECT_EQ(registry.Register("C"), RegistryStatus::kOk);

	EXPECT_THAT(registry.Ids(), ElementsAre("A", "B", "C"));
	EXPECT_EQ(registry.Get(registry.Head())->id, "A");
	EXPECT_EQ(registry.Get(registry.Tail())->id, "C");
	ExpectConsistentLinks(registry);
}

TEST(PeerRegistryTest, NewEntryHasZeroedStatistics) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	const PeerEntry* entry = registry.Lookup("A");
	ASSERT_NE(entry, nullptr);
	EXPECT_EQ(entry->sample_count, 0);
	EXPECT_DOUBLE_EQ(entry->avg_latency, 0.0);
	EXPECT_DOUBLE_EQ(entry->avg_clock_offset, 0.0);
}

TEST(PeerRegistryTest, DuplicateRegisterLeavesRegistryUnchanged) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	ASSERT_EQ(registry.Register("B"), RegistryStatus::kOk);
	registry.Get(registry.HandleOf("A"))->sample_count = 3;

	EXPECT_EQ(registry.Register("A"), RegistryStatus::kDuplicateEntry);
	EXPECT_EQ(registry.size(), 2u);
	EXPECT_THAT(registry.Ids(), ElementsAre("A", "B"));
	EXPECT_EQ(registry.Lookup("A")->sample_count, 3);
	ExpectConsistentLinks(registry);
}

TEST(PeerRegistryTest, UnregisterUnknownIdFails) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	EXPECT_EQ(registry.Unregister("Z"), RegistryStatus::kUnknownEntry);
	EXPECT_THAT(registry.Ids(), ElementsAre("A"));
}

TEST(PeerRegistryTest, UnregisterHeadMiddleAndTail) {
	PeerRegistry registry;
	for (const char* id : {"A", "B", "C", "D", "E"}) {
		ASSERT_EQ(registry.Register(id), RegistryStatus::kOk);
	}

	EXPECT_EQ(registry.Unregister("C"), RegistryStatus::kOk);
	EXPECT_THAT(registry.Ids(), ElementsAre("A", "B", "D", "E"));
	ExpectConsistentLinks(registry);

	EXPECT_EQ(registry.Unregister("A"), RegistryStatus::kOk);
	EXPECT_THAT(registry.Ids(), ElementsAre("B", "D", "E"));
	ExpectConsistentLinks(registry);

	EXPECT_EQ(registry.Unregister("E"), RegistryStatus::kOk);
	EXPECT_THAT(registry.Ids(), ElementsAre("B", "D"));
	ExpectConsistentLinks(registry);

	EXPECT_EQ(registry.Lookup("A"), nullptr);
	EXPECT_EQ(registry.Lookup("C"), nullptr);
	EXPECT_EQ(registry.Lookup("E"), nullptr);
}

TEST(PeerRegistryTest, UnregisterLastEntryEmptiesList) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	EXPECT_EQ(registry.Unregister("A"), RegistryStatus::kOk);
	EXPECT_TRUE(registry.empty());
	EXPECT_FALSE(registry.Head().valid());
	EXPECT_FALSE(registry.Tail().valid());

	// Registry is reusable afterwards
	ASSERT_EQ(registry.Register("B"), RegistryStatus::kOk);
	EXPECT_THAT(registry.Ids(), ElementsAre("B"));
	ExpectConsistentLinks(registry);
}

TEST(PeerRegistryTest, UnregisterReportsSuccessor) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	ASSERT_EQ(registry.Register("B"), RegistryStatus::kOk);

	EntryHandle successor;
	ASSERT_EQ(registry.Unregister("A", &successor), RegistryStatus::kOk);
	EXPECT_EQ(successor, registry.HandleOf("B"));

	ASSERT_EQ(registry.Unregister("B", &successor), RegistryStatus::kOk);
	EXPECT_FALSE(successor.valid());
}

TEST(PeerRegistryTest, StaleHandleDoesNotResolveAfterSlotReuse) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	EntryHandle old_handle = registry.HandleOf("A");
	ASSERT_EQ(registry.Unregister("A"), RegistryStatus::kOk);

	ASSERT_EQ(registry.Register("B"), RegistryStatus::kOk);
	EntryHandle new_handle = registry.HandleOf("B");
	EXPECT_EQ(new_handle.index, old_handle.index);
	EXPECT_NE(new_handle, old_handle);

	EXPECT_EQ(registry.Get(old_handle), nullptr);
	EXPECT_FALSE(registry.Next(old_handle).valid());
	ASSERT_NE(registry.Get(new_handle), nullptr);
	EXPECT_EQ(registry.Get(new_handle)->id, "B");
}

TEST(PeerRegistryTest, ReRegisteredIdMovesToTail) {
	PeerRegistry registry;
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);
	ASSERT_EQ(registry.Register("B"), RegistryStatus::kOk);
	registry.Get(registry.HandleOf("A"))->sample_count = 4;

	ASSERT_EQ(registry.Unregister("A"), RegistryStatus::kOk);
	ASSERT_EQ(registry.Register("A"), RegistryStatus::kOk);

	EXPECT_THAT(registry.Ids(), ElementsAre("B", "A"));
	EXPECT_EQ(registry.Lookup("A")->sample_count, 0);
	ExpectConsistentLinks(registry);
}

TEST(PeerRegistryTest, IterationMatchesInsertionOrderOfSurvivors) {
	PeerRegistry registry;
	std::vector<std::string> expected;

	// Interleave joins and leaves; survivors must stay in join order
	for (int i = 0; i < 40; i++) {
		std::string id = "peer-" + std::to_string(i);
		ASSERT_EQ(registry.Register(id), RegistryStatus::kOk);
		expected.push_back(id);
		if (i % 3 == 2) {
			std::string victim = expected[expected.size() / 2];
			ASSERT_EQ(registry.Unregister(victim), RegistryStatus::kOk);
			expected.erase(expected.begin() + expected.size() / 2);
		}
	}

	EXPECT_EQ(registry.Ids(), expected);
	ExpectConsistentLinks(registry);

	std::vector<PeerEntry> snapshot = registry.Snapshot();
	ASSERT_EQ(snapshot.size(), expected.size());
	for (size_t i = 0; i < snapshot.size(); i++) {
		EXPECT_EQ(snapshot[i].id, expected[i]);
	}
}

TEST(PeerRegistryTest, StatusNames) {
	EXPECT_STREQ(ToString(RegistryStatus::kOk), "OK");
	EXPECT_STREQ(ToString(RegistryStatus::kDuplicateEntry), "DuplicateEntry");
	EXPECT_STREQ(ToString(RegistryStatus::kUnknownEntry), "UnknownEntry");
}
