/**
 * @file Robot.cpp
 * @brief Реализация класса управления роботом
 */

#include "Robot.h"
#include "Log.h"

/**
 * @brief Конструктор
 */
Robot::Robot(const HexapodConfig& config,
             ServoDriver* servoCtrl,
             TrimStore* store,
             DistanceSensor* distanceSensor,
             ReportWriter reportWriter)
    : gait(config, servoCtrl, store),
      sensor(distanceSensor),
      obstacleFilter(config.obsSampleWindow),
      sampler(distanceSensor, obstacleFilter, config.obsSampleDelayMs),
      reporter(sampler, reportWriter, config.obsReportIntervalMs),
      oscTaskLeft(gait.oscillator(LegId::LEFT), config.oscUpdateMs),
      oscTaskMid(gait.oscillator(LegId::MID), config.oscUpdateMs),
      oscTaskRight(gait.oscillator(LegId::RIGHT), config.oscUpdateMs),
      statusTask(gait, sampler, config.statusIntervalMs),
      started(false)
{
}

/**
 * @brief Запуск задач
 */
void Robot::begin(uint32_t nowMs) {
    if (started) {
        return;
    }
    logPrintf("[ROBOT] Запуск задач осцилляторов...\n");

    scheduler.add(&oscTaskLeft, nowMs);
    scheduler.add(&oscTaskMid, nowMs);
    scheduler.add(&oscTaskRight, nowMs);

    if (sensor) {
        logPrintf("[ROBOT] Датчик препятствий: окно %d, опрос каждые %d мс\n",
                  obstacleFilter.capacity(), gait.config().obsSampleDelayMs);
        scheduler.add(&sampler, nowMs);
        scheduler.add(&reporter, nowMs, gait.config().obsReportIntervalMs);
    } else {
        logPrintf("[ROBOT] Датчик препятствий не подключен\n");
    }

    scheduler.add(&statusTask, nowMs, gait.config().statusIntervalMs);

    started = true;
    logPrintf("[ROBOT] Инициализация завершена (%s)\n", gait.isPaused() ? "пауза" : "движение");
}

/**
 * @brief Основной цикл обновления
 */
void Robot::update(uint32_t nowMs) {
    scheduler.tick(nowMs);
}
