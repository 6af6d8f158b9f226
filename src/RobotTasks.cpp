/**
 * @file RobotTasks.cpp
 * @brief Реализация задач планировщика
 */

#include "RobotTasks.h"
#include "Log.h"
#include <stdio.h>

static const uint32_t ERROR_LOG_INTERVAL_MS = 1000;

// ==================== ОСЦИЛЛЯТОР ====================

OscillatorTask::OscillatorTask(Oscillator& oscillator, uint16_t interval)
    : osc(oscillator),
      intervalMs(interval > 0 ? interval : 1),
      lastErrorLog(0),
      errorLogged(false)
{
}

const char* OscillatorTask::name() const {
    switch (osc.getLeg()) {
        case LegId::LEFT:  return "osc-left";
        case LegId::MID:   return "osc-mid";
        case LegId::RIGHT: return "osc-right";
    }
    return "osc";
}

uint32_t OscillatorTask::run(uint32_t nowMs) {
    if (!osc.update(nowMs)) {
        if (!errorLogged || nowMs - lastErrorLog >= ERROR_LOG_INTERVAL_MS) {
            logPrintf("[OSC][%s] ОШИБКА записи в серво (канал %d, угол %d), всего ошибок: %lu\n",
                      legName(osc.getLeg()), osc.getChannel(), osc.getLastAngle(),
                      (unsigned long)osc.getWriteFailures());
            lastErrorLog = nowMs;
            errorLogged = true;
        }
    }
    return intervalMs;
}

// ==================== ДАТЧИК ПРЕПЯТСТВИЙ ====================

ObstacleSampler::ObstacleSampler(DistanceSensor* distanceSensor, ObstacleFilter& window, uint16_t interval)
    : sensor(distanceSensor),
      filter(window),
      intervalMs(interval > 0 ? interval : 1),
      stopped(false)
{
}

uint32_t ObstacleSampler::run(uint32_t nowMs) {
    (void)nowMs;

    if (!sensor || !sensor->isConfigured()) {
        logPrintf("[OBST] Датчик не настроен (%s), опрос остановлен\n",
                  errorName(Error::SENSOR_UNAVAILABLE));
        filter.clear();
        stopped = true;
        return TASK_DONE;
    }

    float distance = 0;
    if (sensor->read(distance)) {
        filter.sample(distance);
    } else {
        // Нет эха - препятствие постепенно "стареет"
        filter.drain();
    }
    return intervalMs;
}

ObstacleReading ObstacleSampler::reading() const {
    if (stopped || !sensor || !sensor->isConfigured()) {
        return ObstacleReading(ObstacleState::UNCONFIGURED, 0);
    }
    float avg = 0;
    if (!filter.average(avg)) {
        return ObstacleReading(ObstacleState::NONE, 0);
    }
    return ObstacleReading(ObstacleState::DISTANCE, avg);
}

// ==================== ОТЧЕТ О ПРЕПЯТСТВИЯХ ====================

ObstacleReporter::ObstacleReporter(const ObstacleSampler& obstacleSampler, ReportWriter reportWriter, uint16_t interval)
    : sampler(obstacleSampler),
      writer(reportWriter),
      intervalMs(interval > 0 ? interval : 1),
      reported(false),
      lastDistance(0)
{
}

uint32_t ObstacleReporter::run(uint32_t nowMs) {
    (void)nowMs;

    ObstacleReading r = sampler.reading();
    if (r.state == ObstacleState::UNCONFIGURED) {
        logPrintf("[OBST] Датчик не настроен, отчеты остановлены\n");
        return TASK_DONE;
    }

    char line[24];
    if (r.state == ObstacleState::DISTANCE) {
        if (!reported || r.distanceMm != lastDistance) {
            snprintf(line, sizeof(line), "obst:%.2f", r.distanceMm);
            if (writer) writer(line);
            reported = true;
            lastDistance = r.distanceMm;
        }
    } else if (reported) {
        if (writer) writer("obst:clear");
        reported = false;
    }
    return intervalMs;
}

// ==================== СТАТУС ====================

StatusTask::StatusTask(const GaitCoordinator& coordinator, const ObstacleSampler& obstacleSampler, uint16_t interval)
    : gait(coordinator),
      sampler(obstacleSampler),
      intervalMs(interval > 0 ? interval : 1)
{
}

uint32_t StatusTask::run(uint32_t nowMs) {
    HexapodParams p = gait.params();
    char obst[16];
    formatObstacle(sampler.reading(), obst, sizeof(obst));

    logPrintf("[ROBOT][%lu ms] Dir: %s/%d | Speed: %d%% (%u ms) | Stroke: %d%% L=%d M=%d R=%d | %s | Obst: %s\n",
              (unsigned long)nowMs,
              directionName(p.steer.direction), p.steer.angle,
              p.speed, (unsigned)p.period,
              p.strokePct, p.legAmplitude[0], p.legAmplitude[1], p.legAmplitude[2],
              p.paused ? "PAUSED" : "RUN",
              obst);
    return intervalMs;
}

void formatObstacle(const ObstacleReading& reading, char* out, uint8_t outLen) {
    switch (reading.state) {
        case ObstacleState::UNCONFIGURED:
            snprintf(out, outLen, "unconfigured");
            break;
        case ObstacleState::NONE:
            snprintf(out, outLen, "clear");
            break;
        case ObstacleState::DISTANCE:
            snprintf(out, outLen, "%.2f", reading.distanceMm);
            break;
    }
}
