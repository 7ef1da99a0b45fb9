#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "monitor/observation_log.h"

using namespace Sonar;
using ::testing::HasSubstr;

namespace {

Observation MakeObservation() {
	Observation o;
	o.peer_id = "peer-7";
	o.send_timestamp = 100.0;
	o.remote_timestamp = 99.5;
	o.receive_timestamp = 100.2;
	o.latency = 0.2;
	o.avg_latency = 0.15;
	o.clock_offset = 0.7;
	o.avg_clock_offset = 0.65;
	o.sample_count = 3;
	return o;
}

} // namespace

TEST(ObservationLogTest, FormatCarriesEveryField) {
	std::string line = FormatObservation(MakeObservation());

	EXPECT_THAT(line, HasSubstr("Peer peer-7"));
	EXPECT_THAT(line, HasSubstr("PingTx: 100.000000"));
	EXPECT_THAT(line, HasSubstr("PeerClock: 99.500000"));
	EXPECT_THAT(line, HasSubstr("PongRx: 100.200000"));
	EXPECT_THAT(line, HasSubstr("; Latency: 0.200000"));
	EXPECT_THAT(line, HasSubstr("AvgLatency: 0.150000"));
	EXPECT_THAT(line, HasSubstr("; ClockOffset: 0.700000"));
	EXPECT_THAT(line, HasSubstr("AvgClockOffset: 0.650000"));
	EXPECT_THAT(line, HasSubstr("Samples: 3"));
}

TEST(ObservationLogTest, FieldsAppearInRecordOrder) {
	std::string line = FormatObservation(MakeObservation());
	const char* labels[] = {"Peer ", "PingTx", "PeerClock", "PongRx", "; Latency",
		"AvgLatency", "; ClockOffset", "AvgClockOffset", "Samples"};

	size_t previous = 0;
	for (const char* label : labels) {
		size_t pos = line.find(label);
		ASSERT_NE(pos, std::string::npos) << label;
		EXPECT_GE(pos, previous) << label;
		previous = pos;
	}
}

TEST(ObservationLogTest, NegativeOffsetIsPrinted) {
	Observation o = MakeObservation();
	o.clock_offset = -1.25;
	EXPECT_THAT(FormatObservation(o), HasSubstr("; ClockOffset: -1.250000"));
}

TEST(ObservationLogTest, SinkAcceptsObservationsAndFailures) {
	LogObservationSink sink;
	sink.OnObservation(MakeObservation());
	sink.OnProbeFailed("peer-7", "ReadClock to 127.0.0.1:1 failed (14): unavailable");
}

TEST(WallClockTest, TracksSystemClock) {
	double first = WallClockSeconds();
	double second = WallClockSeconds();
	EXPECT_GT(first, 1.6e9);
	EXPECT_GE(second, first);
}
