/**
 * @file HexapodConfig.cpp
 * @brief Конфигурация по умолчанию
 */

#include "HexapodConfig.h"
#include "config.h"

const char* legName(LegId leg) {
    switch (leg) {
        case LegId::LEFT:  return "left";
        case LegId::MID:   return "mid";
        case LegId::RIGHT: return "right";
    }
    return "?";
}

HexapodConfig defaultHexapodConfig() {
    HexapodConfig cfg;

    cfg.pins[0] = SERVO_LEFT_CHANNEL;
    cfg.pins[1] = SERVO_MID_CHANNEL;
    cfg.pins[2] = SERVO_RIGHT_CHANNEL;

    cfg.periodMs = PERIOD_DEFAULT;
    // Ходьба вперед
    cfg.phase[0] = 0;
    cfg.phase[1] = 90;
    cfg.phase[2] = 0;
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        cfg.trim[i] = 0;
    }
    cfg.midAmplitude = MID_AMPLITUDE_DEFAULT;
    cfg.stroke = STROKE_DEFAULT;

    cfg.periodMin = PERIOD_MIN;
    cfg.periodMax = PERIOD_MAX;
    cfg.strokeMinAngle = STROKE_MIN_ANGLE;
    cfg.strokeMaxAngle = STROKE_MAX_ANGLE;
    cfg.midAmplitudeMax = MID_AMPLITUDE_MAX;
    cfg.trimLimit = TRIM_LIMIT;

    cfg.oscUpdateMs = OSC_UPDATE_MS;
    cfg.obsSampleDelayMs = OBS_SAMPLE_DELAY;
    cfg.obsSampleWindow = OBS_SAMPLE_WINDOW;
    cfg.obsReportIntervalMs = OBS_REPORT_INTERVAL;
    cfg.statusIntervalMs = STATUS_INTERVAL_MS;

    return cfg;
}
