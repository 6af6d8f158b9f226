/**
 * @file RobotTasks.h
 * @brief Задачи планировщика: осцилляторы, датчик препятствий, статус
 */

#ifndef ROBOT_TASKS_H
#define ROBOT_TASKS_H

#include <stdint.h>
#include "Scheduler.h"
#include "Oscillator.h"
#include "ObstacleFilter.h"
#include "DistanceSensor.h"
#include "GaitCoordinator.h"

/**
 * @brief Получатель строк отчета (obst:...)
 */
typedef void (*ReportWriter)(const char* line);

/**
 * @brief Периодическое обновление одного осциллятора
 *
 * Ошибки записи в серво логируются не чаще раза в секунду,
 * задача продолжает работу.
 */
class OscillatorTask : public Task {
private:
    Oscillator& osc;
    uint16_t intervalMs;
    uint32_t lastErrorLog;
    bool errorLogged;

public:
    OscillatorTask(Oscillator& oscillator, uint16_t interval);

    const char* name() const override;
    uint32_t run(uint32_t nowMs) override;
};

/**
 * @brief Опрос датчика и заполнение окна скользящего среднего
 *
 * Если датчик не настроен, задача завершается навсегда.
 */
class ObstacleSampler : public Task {
private:
    DistanceSensor* sensor;         // nullptr - датчика нет
    ObstacleFilter& filter;
    uint16_t intervalMs;
    bool stopped;

public:
    ObstacleSampler(DistanceSensor* distanceSensor, ObstacleFilter& window, uint16_t interval);

    const char* name() const override { return "obstacle"; }
    uint32_t run(uint32_t nowMs) override;

    /**
     * @brief Текущее состояние препятствия
     */
    ObstacleReading reading() const;

    bool isStopped() const { return stopped; }
};

/**
 * @brief Сообщает о появлении/исчезновении препятствия
 *
 * "obst:<мм>" при новом или изменившемся расстоянии, "obst:clear"
 * когда препятствие пропало.
 */
class ObstacleReporter : public Task {
private:
    const ObstacleSampler& sampler;
    ReportWriter writer;
    uint16_t intervalMs;
    bool reported;                  // Было ли сообщено о препятствии
    float lastDistance;

public:
    ObstacleReporter(const ObstacleSampler& obstacleSampler, ReportWriter reportWriter, uint16_t interval);

    const char* name() const override { return "obst-report"; }
    uint32_t run(uint32_t nowMs) override;
};

/**
 * @brief Периодический вывод состояния в лог
 */
class StatusTask : public Task {
private:
    const GaitCoordinator& gait;
    const ObstacleSampler& sampler;
    uint16_t intervalMs;

public:
    StatusTask(const GaitCoordinator& coordinator, const ObstacleSampler& obstacleSampler, uint16_t interval);

    const char* name() const override { return "status"; }
    uint32_t run(uint32_t nowMs) override;
};

/**
 * @brief Строка для состояния препятствия: "unconfigured", "clear" или мм
 */
void formatObstacle(const ObstacleReading& reading, char* out, uint8_t outLen);

#endif // ROBOT_TASKS_H
