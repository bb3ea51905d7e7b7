#include "occupancy_detector.h"
#include "test_doubles.h"
#include <gtest/gtest.h>

using namespace seatsense;
using namespace seatsense_test;

namespace {

TemperatureGrid gridOf(const SeatFinderConfig &cfg, const std::vector<float> &temps) {
    return TemperatureGrid(cfg.layout.rows, cfg.layout.cols, temps);
}

SeatFinderConfig seatConfig(uint16_t minPixels = 4, uint8_t hysteresis = 2, uint8_t losses = 3) {
    SeatFinderConfig cfg;
    cfg.occupiedTempDelta = 5.0f;
    cfg.minOccupiedPixelCount = minPixels;
    cfg.hysteresisFrames = hysteresis;
    cfg.lossThreshold = losses;
    return cfg;
}

// Person: 2x3 block at 34 C on a 22 C seat
TemperatureGrid occupiedGrid(const SeatFinderConfig &cfg) {
    return gridOf(cfg, sceneTemps(cfg, 22.0f, 10, 14, 2, 3, 34.0f));
}

TemperatureGrid emptyGrid(const SeatFinderConfig &cfg) { return gridOf(cfg, sceneTemps(cfg, 22.0f)); }

DetectionState feed(const OccupancyDetector &det, DetectionState s, const TemperatureGrid &g, int times) {
    for (int i = 0; i < times; i++) s = det.detect(g, s);
    return s;
}

} // namespace

TEST(OccupancyDetectorTest, MedianHandlesOddAndEvenCounts) {
    EXPECT_FLOAT_EQ(OccupancyDetector::median({5.0f, 1.0f, 3.0f}), 3.0f);
    EXPECT_FLOAT_EQ(OccupancyDetector::median({4.0f, 1.0f, 3.0f, 2.0f}), 2.5f);
    EXPECT_FLOAT_EQ(OccupancyDetector::median({7.0f}), 7.0f);
}

TEST(OccupancyDetectorTest, SixCellClusterIsOccupied) {
    SeatFinderConfig cfg = seatConfig(4);
    OccupancyDetector det(cfg);
    DetectionState s = det.detect(occupiedGrid(cfg), DetectionState{});

    EXPECT_EQ(s.rawClassification, Occupancy::OCCUPIED);
    EXPECT_EQ(s.qualifyingCount, 6);
    EXPECT_NEAR(s.baseline, 22.0f, 1e-4);
    ASSERT_TRUE(s.focal.has_value());
    // Uniform cluster: the tie goes to its top-left cell
    EXPECT_EQ(*s.focal, (Cell{10, 14}));
    EXPECT_NEAR(s.confidence, 6.0f / 768.0f, 1e-6);
}

TEST(OccupancyDetectorTest, FocalCellIsHottestQualifyingCell) {
    SeatFinderConfig cfg = seatConfig(4);
    std::vector<float> temps = sceneTemps(cfg, 22.0f, 10, 14, 2, 3, 34.0f);
    temps[11 * 32 + 15] = 35.5f;
    DetectionState s = OccupancyDetector(cfg).detect(gridOf(cfg, temps), DetectionState{});
    ASSERT_TRUE(s.focal.has_value());
    EXPECT_EQ(*s.focal, (Cell{11, 15}));
}

TEST(OccupancyDetectorTest, FocalTiesPreferSmallestRowThenColumn) {
    SeatFinderConfig cfg = seatConfig(1);
    OccupancyDetector det(cfg);

    std::vector<float> temps = sceneTemps(cfg, 22.0f);
    temps[5 * 32 + 2] = 33.0f;
    temps[3 * 32 + 20] = 33.0f;
    DetectionState s = det.detect(gridOf(cfg, temps), DetectionState{});
    ASSERT_TRUE(s.focal.has_value());
    EXPECT_EQ(*s.focal, (Cell{3, 20}));

    temps = sceneTemps(cfg, 22.0f);
    temps[4 * 32 + 9] = 33.0f;
    temps[4 * 32 + 3] = 33.0f;
    s = det.detect(gridOf(cfg, temps), DetectionState{});
    ASSERT_TRUE(s.focal.has_value());
    EXPECT_EQ(*s.focal, (Cell{4, 3}));
}

TEST(OccupancyDetectorTest, SmallClusterBelowPixelMinimumIsVacant) {
    SeatFinderConfig cfg = seatConfig(10);
    DetectionState s = OccupancyDetector(cfg).detect(occupiedGrid(cfg), DetectionState{});
    EXPECT_EQ(s.rawClassification, Occupancy::VACANT);
    EXPECT_EQ(s.qualifyingCount, 6);
    EXPECT_NEAR(s.confidence, 6.0f / 768.0f, 1e-6);
}

TEST(OccupancyDetectorTest, NoHotCellsMeansNoFocalAndZeroConfidence) {
    SeatFinderConfig cfg = seatConfig(4);
    DetectionState s = OccupancyDetector(cfg).detect(emptyGrid(cfg), DetectionState{});
    EXPECT_EQ(s.rawClassification, Occupancy::VACANT);
    EXPECT_FALSE(s.focal.has_value());
    EXPECT_FLOAT_EQ(s.confidence, 0.0f);
}

TEST(OccupancyDetectorTest, DeltaIsInclusive) {
    SeatFinderConfig cfg = seatConfig(1);
    std::vector<float> temps = sceneTemps(cfg, 20.0f);
    temps[0] = 25.0f;
    DetectionState s = OccupancyDetector(cfg).detect(gridOf(cfg, temps), DetectionState{});
    EXPECT_EQ(s.qualifyingCount, 1);
    EXPECT_EQ(s.rawClassification, Occupancy::OCCUPIED);
}

TEST(OccupancyDetectorTest, MedianBaselineIgnoresHotRegion) {
    // A quarter of the grid is a warm body; a mean would drift, the median does not
    SeatFinderConfig cfg = seatConfig(4);
    std::vector<float> temps = sceneTemps(cfg, 21.0f, 0, 0, 12, 16, 33.0f);
    DetectionState s = OccupancyDetector(cfg).detect(gridOf(cfg, temps), DetectionState{});
    EXPECT_NEAR(s.baseline, 21.0f, 1e-4);
    EXPECT_EQ(s.qualifyingCount, 12 * 16);
    EXPECT_NEAR(s.confidence, 192.0f / 768.0f, 1e-6);
}

TEST(OccupancyDetectorTest, ConfidenceNeverDecreasesWithMoreHotCells) {
    SeatFinderConfig cfg = seatConfig(4);
    OccupancyDetector det(cfg);
    float previous = -1.0f;
    for (uint16_t hot = 5; hot <= 300; hot += 7) {
        std::vector<float> temps = sceneTemps(cfg, 22.0f);
        for (uint16_t i = 0; i < hot; i++) temps[i] = 30.0f;
        DetectionState s = det.detect(gridOf(cfg, temps), DetectionState{});
        EXPECT_GE(s.confidence, previous) << hot << " hot cells";
        EXPECT_LE(s.confidence, 1.0f);
        previous = s.confidence;
    }
}

TEST(OccupancyDetectorTest, OutputChangesOnlyAfterAgreement) {
    SeatFinderConfig cfg = seatConfig(4, 2);
    OccupancyDetector det(cfg);

    DetectionState s = det.detect(emptyGrid(cfg), DetectionState{});
    EXPECT_EQ(s.classification, Occupancy::UNKNOWN);
    EXPECT_EQ(s.agreement, 1);
    s = det.detect(emptyGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::VACANT);

    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::VACANT);
    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
}

TEST(OccupancyDetectorTest, SingleFrameFlipNeverChangesOutput) {
    SeatFinderConfig cfg = seatConfig(4, 3);
    OccupancyDetector det(cfg);
    DetectionState s = feed(det, DetectionState{}, emptyGrid(cfg), 3);
    ASSERT_EQ(s.classification, Occupancy::VACANT);

    // Flips that revert before three agreeing frames
    const bool hot[] = {true, false, false, true, true, false, true, false};
    for (bool h : hot) {
        s = det.detect(h ? occupiedGrid(cfg) : emptyGrid(cfg), s);
        EXPECT_EQ(s.classification, Occupancy::VACANT);
    }

    s = feed(det, s, occupiedGrid(cfg), 2);
    EXPECT_EQ(s.classification, Occupancy::VACANT);
    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
}

TEST(OccupancyDetectorTest, HysteresisOfOneFollowsEveryFrame) {
    SeatFinderConfig cfg = seatConfig(4, 1);
    OccupancyDetector det(cfg);
    DetectionState s = det.detect(occupiedGrid(cfg), DetectionState{});
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
    s = det.detect(emptyGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::VACANT);
}

TEST(OccupancyDetectorTest, RepeatedLossDegradesToUnknown) {
    SeatFinderConfig cfg = seatConfig(4, 2, 3);
    OccupancyDetector det(cfg);
    DetectionState s = feed(det, DetectionState{}, occupiedGrid(cfg), 2);
    ASSERT_EQ(s.classification, Occupancy::OCCUPIED);

    s = det.frameLost(s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
    s = det.frameLost(s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
    s = det.frameLost(s);
    EXPECT_EQ(s.classification, Occupancy::UNKNOWN);
    EXPECT_FALSE(s.focal.has_value());
    EXPECT_EQ(s.agreement, 0);

    // Recovery needs a fresh run of agreeing frames
    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::UNKNOWN);
    EXPECT_EQ(s.lossCount, 0);
    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
}

TEST(OccupancyDetectorTest, IsolatedLossKeepsVacantBetweenAgreeingFrames) {
    SeatFinderConfig cfg = seatConfig(4, 2, 3);
    OccupancyDetector det(cfg);
    DetectionState s = feed(det, DetectionState{}, emptyGrid(cfg), 2);
    ASSERT_EQ(s.classification, Occupancy::VACANT);

    s = det.frameLost(s);
    EXPECT_EQ(s.classification, Occupancy::VACANT);
    EXPECT_EQ(s.lossCount, 1);
    s = det.detect(emptyGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::VACANT);
    EXPECT_EQ(s.lossCount, 0);
}

TEST(OccupancyDetectorTest, LossBelowThresholdDoesNotBreakAgreementRun) {
    SeatFinderConfig cfg = seatConfig(4, 2, 3);
    OccupancyDetector det(cfg);
    DetectionState s = feed(det, DetectionState{}, emptyGrid(cfg), 2);

    s = det.detect(occupiedGrid(cfg), s);
    s = det.frameLost(s);
    s = det.detect(occupiedGrid(cfg), s);
    EXPECT_EQ(s.classification, Occupancy::OCCUPIED);
}
