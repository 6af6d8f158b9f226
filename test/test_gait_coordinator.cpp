#include <gtest/gtest.h>
#include <stdlib.h>
#include "GaitCoordinator.h"
#include "fakes.h"

namespace {

class GaitCoordinatorTest : public ::testing::Test {
protected:
    GaitCoordinatorTest() : cfg(defaultHexapodConfig()) {}

    int amplitude(const GaitCoordinator& gait, LegId leg) {
        return gait.oscillator(leg).getAmplitude();
    }

    HexapodConfig cfg;
    FakeServoDriver servo;
    FakeTrimStore store;
    LogCapture logCapture;
};

TEST_F(GaitCoordinatorTest, StartsPausedGoingForward) {
    GaitCoordinator gait(cfg, &servo, &store);

    EXPECT_TRUE(gait.isPaused());
    EXPECT_EQ(SteerDirection::FWD, gait.steer().direction);
    EXPECT_EQ(0, gait.steer().angle);
    EXPECT_EQ(2000, gait.period());
    EXPECT_EQ(30, gait.strokeDegrees());
    EXPECT_EQ(55, cfg.strokeMax());

    HexapodParams p = gait.params();
    EXPECT_EQ(40, p.speed);
    EXPECT_EQ(54, p.strokePct);
    EXPECT_EQ(10, p.midAmplitude);
    EXPECT_EQ(0, p.phase[0]);
    EXPECT_EQ(90, p.phase[1]);
    EXPECT_EQ(0, p.phase[2]);
    EXPECT_EQ(30, p.legAmplitude[0]);
    EXPECT_EQ(10, p.legAmplitude[1]);
    EXPECT_EQ(30, p.legAmplitude[2]);
    EXPECT_TRUE(p.paused);

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        EXPECT_TRUE(gait.oscillator((LegId)i).isPaused());
        EXPECT_EQ(cfg.pins[i], p.pins[i]);
    }
}

TEST_F(GaitCoordinatorTest, ConfiguredPeriodAndStrokeAreClamped) {
    cfg.periodMs = 100;
    cfg.stroke = 200;
    GaitCoordinator gait(cfg, &servo, &store);
    EXPECT_EQ(500, gait.period());
    EXPECT_EQ(55, gait.strokeDegrees());
}

TEST_F(GaitCoordinatorTest, SteerStrokesStayInRangeAndGrowWithAngle) {
    const int strokeMax = cfg.strokeMax();
    const int strokes[] = {0, 10, 30, 55};

    for (int s = 0; s < 4; s++) {
        int prevPos = -1;
        int prevNeg = -1;
        for (int angle = 0; angle <= 90; angle++) {
            int left = 0, right = 0;
            GaitCoordinator::steerStrokes(strokes[s], angle, strokeMax, left, right);
            EXPECT_GE(left, 0);
            EXPECT_GE(right, 0);
            EXPECT_LE(left, strokeMax);
            EXPECT_LE(right, strokeMax);
            EXPECT_GE(left, right);
            EXPECT_GE(abs(left - right), prevPos);
            prevPos = abs(left - right);

            GaitCoordinator::steerStrokes(strokes[s], -angle, strokeMax, left, right);
            EXPECT_GE(left, 0);
            EXPECT_GE(right, 0);
            EXPECT_LE(left, strokeMax);
            EXPECT_LE(right, strokeMax);
            EXPECT_LE(left, right);
            EXPECT_GE(abs(left - right), prevNeg);
            prevNeg = abs(left - right);
        }
    }
}

TEST_F(GaitCoordinatorTest, SteerStrokesUseExactFloorForWideStroke) {
    // Ход 0..180: STROKE_MAX = 90, поправка 70*90/90/2 = 35
    cfg.strokeMinAngle = 0;
    cfg.strokeMaxAngle = 180;
    ASSERT_EQ(90, cfg.strokeMax());

    int left = 0, right = 0;
    GaitCoordinator::steerStrokes(45, 70, cfg.strokeMax(), left, right);
    EXPECT_EQ(80, left);
    EXPECT_EQ(10, right);

    GaitCoordinator::steerStrokes(45, -70, cfg.strokeMax(), left, right);
    EXPECT_EQ(10, left);
    EXPECT_EQ(80, right);
}

TEST_F(GaitCoordinatorTest, FullTurnClampsOneLegToZero) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.setStroke(0).isOk());
    ASSERT_TRUE(gait.setSteerAngle(90).isOk());
    EXPECT_EQ(54, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(0, amplitude(gait, LegId::RIGHT));

    ASSERT_TRUE(gait.setSteerAngle(-90).isOk());
    EXPECT_EQ(0, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(54, amplitude(gait, LegId::RIGHT));
}

TEST_F(GaitCoordinatorTest, FullTurnWithDefaultStrokeKeepsDifference) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.setSteerAngle(90).isOk());
    EXPECT_EQ(55, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(1, amplitude(gait, LegId::RIGHT));
    EXPECT_EQ(10, amplitude(gait, LegId::MID));
}

TEST_F(GaitCoordinatorTest, StrokeChangeHonoursSteerAngle) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.setSteerAngle(40).isOk());
    EXPECT_EQ(42, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(18, amplitude(gait, LegId::RIGHT));

    ASSERT_TRUE(gait.setStroke(100).isOk());
    EXPECT_EQ(55, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(31, amplitude(gait, LegId::RIGHT));
    EXPECT_EQ(40, gait.steer().angle);
}

TEST_F(GaitCoordinatorTest, DirectionSetsPhasesAndResetsAngle) {
    GaitCoordinator gait(cfg, &servo, &store);
    ASSERT_TRUE(gait.setSteerAngle(45).isOk());

    ASSERT_TRUE(gait.setDirection(SteerDirection::ROTR).isOk());
    EXPECT_EQ(0, gait.steer().angle);
    EXPECT_EQ(0, gait.oscillator(LegId::LEFT).getPhaseShift());
    EXPECT_EQ(90, gait.oscillator(LegId::MID).getPhaseShift());
    EXPECT_EQ(180, gait.oscillator(LegId::RIGHT).getPhaseShift());
    EXPECT_EQ(30, amplitude(gait, LegId::LEFT));
    EXPECT_EQ(30, amplitude(gait, LegId::RIGHT));

    ASSERT_TRUE(gait.setDirection(SteerDirection::ROTL).isOk());
    EXPECT_EQ(180, gait.oscillator(LegId::LEFT).getPhaseShift());
    EXPECT_EQ(0, gait.oscillator(LegId::RIGHT).getPhaseShift());

    ASSERT_TRUE(gait.setDirection(SteerDirection::REV).isOk());
    EXPECT_EQ(90, gait.oscillator(LegId::LEFT).getPhaseShift());
    EXPECT_EQ(0, gait.oscillator(LegId::MID).getPhaseShift());
    EXPECT_EQ(90, gait.oscillator(LegId::RIGHT).getPhaseShift());
}

TEST_F(GaitCoordinatorTest, AngleRejectedWhileRotating) {
    GaitCoordinator gait(cfg, &servo, &store);
    ASSERT_TRUE(gait.setDirection(SteerDirection::ROTL).isOk());

    Status s = gait.setSteerAngle(10);
    EXPECT_EQ(Error::INVALID_PARAMETER, s.code());
    EXPECT_EQ(SteerDirection::ROTL, gait.steer().direction);
    EXPECT_EQ(0, gait.steer().angle);
}

TEST_F(GaitCoordinatorTest, SteerCommandAppliesDirectionThenAngle) {
    GaitCoordinator gait(cfg, &servo, &store);

    SteerCommand cmd;
    cmd.direction = "rev";
    cmd.hasAngle = true;
    cmd.angle = 30;
    ASSERT_TRUE(gait.setSteer(cmd).isOk());
    EXPECT_EQ(SteerDirection::REV, gait.steer().direction);
    EXPECT_EQ(30, gait.steer().angle);

    // Угол вместе с разворотом отклоняется целиком
    cmd.direction = "rotr";
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSteer(cmd).code());
    EXPECT_EQ(SteerDirection::REV, gait.steer().direction);
    EXPECT_EQ(30, gait.steer().angle);
}

TEST_F(GaitCoordinatorTest, InvalidSteerInputLeavesStateUntouched) {
    GaitCoordinator gait(cfg, &servo, &store);
    ASSERT_TRUE(gait.setSteerAngle(-20).isOk());

    SteerCommand bad;
    bad.direction = "left";
    EXPECT_EQ(Error::INVALID_DIRECTION, gait.setSteer(bad).code());

    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSteerAngle(91).code());
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSteerAngle(-91).code());

    SteerCommand empty;
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSteer(empty).code());

    EXPECT_EQ(SteerDirection::FWD, gait.steer().direction);
    EXPECT_EQ(-20, gait.steer().angle);
}

TEST_F(GaitCoordinatorTest, SpeedMapsToPeriod) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.setSpeed(0).isOk());
    EXPECT_EQ(3000, gait.period());
    ASSERT_TRUE(gait.setSpeed(100).isOk());
    EXPECT_EQ(500, gait.period());
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        EXPECT_EQ(500, gait.oscillator((LegId)i).getPeriod());
    }

    for (int pct = 0; pct <= 100; pct++) {
        ASSERT_TRUE(gait.setSpeed(pct).isOk());
        EXPECT_LE(abs(gait.speed() - pct), 1) << "pct=" << pct;
    }
}

TEST_F(GaitCoordinatorTest, SpeedOutOfRangeRejected) {
    GaitCoordinator gait(cfg, &servo, &store);
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSpeed(101).code());
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setSpeed(-1).code());
    EXPECT_EQ(2000, gait.period());
}

TEST_F(GaitCoordinatorTest, StrokeMapsToDegrees) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.setStroke(100).isOk());
    EXPECT_EQ(55, gait.strokeDegrees());
    EXPECT_EQ(100, gait.stroke());

    ASSERT_TRUE(gait.setStroke(0).isOk());
    EXPECT_EQ(0, gait.strokeDegrees());
    EXPECT_EQ(0, gait.stroke());

    ASSERT_TRUE(gait.setStroke(50).isOk());
    EXPECT_EQ(27, gait.strokeDegrees());
    EXPECT_LE(abs(gait.stroke() - 50), 1);

    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setStroke(101).code());
    EXPECT_EQ(27, gait.strokeDegrees());
}

TEST_F(GaitCoordinatorTest, PartialTrimUpdateSavesOnce) {
    GaitCoordinator gait(cfg, &servo, &store);

    TrimUpdate update;
    update.setLeg(LegId::LEFT, 5);
    update.setLeg(LegId::RIGHT, -3);
    Status s = gait.setTrim(update);
    ASSERT_TRUE(s.isOk());

    EXPECT_EQ(5, gait.getTrim(LegId::LEFT));
    EXPECT_EQ(0, gait.getTrim(LegId::MID));
    EXPECT_EQ(-3, gait.getTrim(LegId::RIGHT));
    EXPECT_EQ(5, gait.oscillator(LegId::LEFT).getTrim());
    EXPECT_EQ(-3, gait.oscillator(LegId::RIGHT).getTrim());

    EXPECT_EQ(1, store.saves);
    EXPECT_EQ(5, store.stored[0]);
    EXPECT_EQ(0, store.stored[1]);
    EXPECT_EQ(-3, store.stored[2]);
}

TEST_F(GaitCoordinatorTest, InvalidTrimRejectsWholeUpdate) {
    GaitCoordinator gait(cfg, &servo, &store);

    TrimUpdate update;
    update.setLeg(LegId::LEFT, 5);
    update.setLeg(LegId::MID, 11);
    EXPECT_EQ(Error::INVALID_PARAMETER, gait.setTrim(update).code());

    EXPECT_EQ(0, gait.getTrim(LegId::LEFT));
    EXPECT_EQ(0, gait.oscillator(LegId::LEFT).getTrim());
    EXPECT_EQ(0, store.saves);
}

TEST_F(GaitCoordinatorTest, TrimPersistenceFailureKeepsChange) {
    store.failSave = true;
    GaitCoordinator gait(cfg, &servo, &store);

    TrimUpdate update;
    update.setLeg(LegId::MID, -7);
    Status s = gait.setTrim(update);
    EXPECT_EQ(Error::PERSISTENCE_FAILURE, s.code());
    EXPECT_TRUE(s.applied());
    EXPECT_EQ(-7, gait.getTrim(LegId::MID));
    EXPECT_EQ(1, store.saves);
    EXPECT_EQ(1, logCapture.count("[TRIM] ОШИБКА сохранения"));
}

TEST_F(GaitCoordinatorTest, TrimWithoutStoreIsAppliedButNotPersisted) {
    GaitCoordinator gait(cfg, &servo, nullptr);

    TrimUpdate update;
    update.setLeg(LegId::RIGHT, 2);
    Status s = gait.setTrim(update);
    EXPECT_EQ(Error::PERSISTENCE_FAILURE, s.code());
    EXPECT_TRUE(s.applied());
    EXPECT_EQ(2, gait.getTrim(LegId::RIGHT));
}

TEST_F(GaitCoordinatorTest, SavedTrimOverridesConfiguration) {
    cfg.trim[0] = 1;
    cfg.trim[1] = 1;
    cfg.trim[2] = 1;
    store.preset(3, -2, 1);

    GaitCoordinator gait(cfg, &servo, &store);
    EXPECT_EQ(1, store.loads);
    EXPECT_EQ(3, gait.getTrim(LegId::LEFT));
    EXPECT_EQ(-2, gait.getTrim(LegId::MID));
    EXPECT_EQ(1, gait.getTrim(LegId::RIGHT));
    EXPECT_EQ(-2, gait.oscillator(LegId::MID).getTrim());
}

TEST_F(GaitCoordinatorTest, SavedTrimOutOfRangeIsIgnored) {
    cfg.trim[1] = 4;
    store.preset(3, -20, 1);

    GaitCoordinator gait(cfg, &servo, &store);
    EXPECT_EQ(0, gait.getTrim(LegId::LEFT));
    EXPECT_EQ(4, gait.getTrim(LegId::MID));
    EXPECT_EQ(0, gait.getTrim(LegId::RIGHT));
    EXPECT_EQ(1, logCapture.count("вне диапазона"));
}

TEST_F(GaitCoordinatorTest, PausePropagatesToOscillators) {
    GaitCoordinator gait(cfg, &servo, &store);

    gait.setPause(false);
    EXPECT_FALSE(gait.isPaused());
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        EXPECT_FALSE(gait.oscillator((LegId)i).isPaused());
    }

    gait.setPause(true);
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        EXPECT_TRUE(gait.oscillator((LegId)i).isPaused());
    }
}

TEST_F(GaitCoordinatorTest, CenterPausesAndWritesTrimmedCentre) {
    store.preset(4, 0, -6);
    GaitCoordinator gait(cfg, &servo, &store);
    gait.setPause(false);

    ASSERT_TRUE(gait.center(true).isOk());
    EXPECT_TRUE(gait.isPaused());
    EXPECT_EQ(94, servo.angles[cfg.pins[0]]);
    EXPECT_EQ(90, servo.angles[cfg.pins[1]]);
    EXPECT_EQ(84, servo.angles[cfg.pins[2]]);
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        EXPECT_TRUE(gait.oscillator((LegId)i).isPaused());
    }

    ASSERT_TRUE(gait.center(false).isOk());
    EXPECT_EQ(90, servo.angles[cfg.pins[0]]);
    EXPECT_EQ(90, servo.angles[cfg.pins[2]]);
}

TEST_F(GaitCoordinatorTest, CenterReportsActuatorFailure) {
    GaitCoordinator gait(cfg, &servo, &store);
    servo.fail = true;

    Status s = gait.center(true);
    EXPECT_EQ(Error::ACTUATOR_WRITE_FAILURE, s.code());
    EXPECT_TRUE(gait.isPaused());
}

TEST_F(GaitCoordinatorTest, GenericParameterAccess) {
    GaitCoordinator gait(cfg, &servo, &store);

    ASSERT_TRUE(gait.set(GaitParam::SPEED, 100).isOk());
    EXPECT_EQ(100, gait.get(GaitParam::SPEED));

    ASSERT_TRUE(gait.set(GaitParam::STROKE, 100).isOk());
    EXPECT_EQ(100, gait.get(GaitParam::STROKE));

    ASSERT_TRUE(gait.set(GaitParam::STEER_ANGLE, -30).isOk());
    EXPECT_EQ(-30, gait.get(GaitParam::STEER_ANGLE));

    ASSERT_TRUE(gait.set(GaitParam::PAUSE, 0).isOk());
    EXPECT_EQ(0, gait.get(GaitParam::PAUSE));
    EXPECT_FALSE(gait.isPaused());

    EXPECT_EQ(Error::INVALID_PARAMETER, gait.set(GaitParam::SPEED, 200).code());

    Status s = gait.set(GaitParam::PAUSE, 7);
    EXPECT_EQ(Error::INVALID_PARAMETER, s.code());
    EXPECT_STREQ("invalid pause value: 7", s.message());
    EXPECT_FALSE(gait.isPaused());
}

TEST_F(GaitCoordinatorTest, ParamsReadAmplitudesFromOscillators) {
    GaitCoordinator gait(cfg, &servo, &store);
    ASSERT_TRUE(gait.setSteerAngle(-40).isOk());

    HexapodParams p = gait.params();
    EXPECT_EQ(18, p.legAmplitude[0]);
    EXPECT_EQ(10, p.legAmplitude[1]);
    EXPECT_EQ(42, p.legAmplitude[2]);
    EXPECT_EQ(30, p.stroke);
    EXPECT_EQ(-40, p.steer.angle);
}

TEST_F(GaitCoordinatorTest, DirectionTokens) {
    SteerDirection dir;
    ASSERT_TRUE(parseDirection("rotl", dir));
    EXPECT_EQ(SteerDirection::ROTL, dir);
    EXPECT_STREQ("rotl", directionName(dir));
    EXPECT_FALSE(parseDirection("FWD", dir));
    EXPECT_FALSE(parseDirection(nullptr, dir));
}

}  // namespace
