/**
 * @file Oscillator.cpp
 * @brief Реализация осциллятора группы ног
 */

#include "Oscillator.h"
#include <math.h>

static const float OSC_TWO_PI = 6.28318530718f;
static const float DEG_TO_RAD_F = 0.01745329252f;

/**
 * @brief Конструктор
 */
Oscillator::Oscillator(LegId legId, const HexapodConfig& config, ServoDriver* servoCtrl)
    : leg(legId),
      channel(config.pins[legIndex(legId)]),
      maxAmplitude(config.maxAmplitude(legId)),
      trimLimit(config.trimLimit),
      servos(servoCtrl),
      period(config.periodMs > 0 ? config.periodMs : 1),
      amplitude(0),
      phaseShift(0),
      trim(0),
      paused(true),
      phaseMs(0),
      lastTick(0),
      clockSynced(false),
      lastAngle(-1),
      writeFailures(0)
{
}

Status Oscillator::set(uint16_t periodMs, int amplitudeDeg, int phaseShiftDeg) {
    if (periodMs == 0) {
        return Status::error(Error::INVALID_PARAMETER, "%s: period must be > 0", legName(leg));
    }
    if (amplitudeDeg < 0 || amplitudeDeg > maxAmplitude) {
        return Status::error(Error::INVALID_PARAMETER, "%s: amplitude %d not in 0..%d",
                             legName(leg), amplitudeDeg, maxAmplitude);
    }
    if (phaseShiftDeg < 0 || phaseShiftDeg > 359) {
        return Status::error(Error::INVALID_PARAMETER, "%s: phase shift %d not in 0..359",
                             legName(leg), phaseShiftDeg);
    }

    period = periodMs;
    amplitude = amplitudeDeg;
    phaseShift = phaseShiftDeg;
    return Status::ok();
}

Status Oscillator::setPeriod(uint16_t periodMs) {
    return set(periodMs, amplitude, phaseShift);
}

Status Oscillator::setTrim(int trimDeg) {
    if (trimDeg < -trimLimit || trimDeg > trimLimit) {
        return Status::error(Error::INVALID_PARAMETER, "%s: trim %d not in -%d..%d",
                             legName(leg), trimDeg, trimLimit, trimLimit);
    }
    trim = trimDeg;
    return Status::ok();
}

float Oscillator::waveform(float phase) const {
    float rad = OSC_TWO_PI * phase + phaseShift * DEG_TO_RAD_F;
    return SERVO_CENTER + trim + amplitude * sinf(rad);
}

/**
 * @brief Обновление угла по времени
 */
bool Oscillator::update(uint32_t nowMs) {
    if (paused) {
        // Угол держится, фаза не сбрасывается
        clockSynced = false;
        return true;
    }

    if (!clockSynced) {
        lastTick = nowMs;
        clockSynced = true;
    }
    phaseMs += nowMs - lastTick;
    lastTick = nowMs;

    float phase = (float)(phaseMs % period) / period;
    int angle = (int)lroundf(waveform(phase));
    return writeAngle(angle);
}

bool Oscillator::center(bool withTrim) {
    paused = true;
    clockSynced = false;
    return writeAngle(SERVO_CENTER + (withTrim ? trim : 0));
}

void Oscillator::setPaused(bool pause) {
    if (pause == paused) {
        return;
    }
    paused = pause;
    clockSynced = false;
}

bool Oscillator::writeAngle(int angle) {
    if (angle < SERVO_ANGLE_MIN) angle = SERVO_ANGLE_MIN;
    if (angle > SERVO_ANGLE_MAX) angle = SERVO_ANGLE_MAX;

    lastAngle = angle;
    if (!servos || !servos->setAngle(channel, (uint8_t)angle)) {
        writeFailures++;
        return false;
    }
    return true;
}
