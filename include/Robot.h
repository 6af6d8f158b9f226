/**
 * @file Robot.h
 * @brief Класс для управления всем роботом
 */

#ifndef ROBOT_H
#define ROBOT_H

#include <stdint.h>
#include "HexapodConfig.h"
#include "GaitCoordinator.h"
#include "ObstacleFilter.h"
#include "RobotTasks.h"
#include "Scheduler.h"
#include "ServoDriver.h"
#include "TrimStore.h"
#include "DistanceSensor.h"

/**
 * @brief Класс управления роботом
 *
 * Собирает координатор походки, датчик препятствий и задачи
 * в одном кооперативном планировщике.
 */
class Robot {
private:
    // Походка
    GaitCoordinator gait;               // Координатор (владеет осцилляторами)

    // Препятствия
    DistanceSensor* sensor;             // nullptr - датчика нет
    ObstacleFilter obstacleFilter;      // Скользящее среднее
    ObstacleSampler sampler;            // Задача опроса датчика
    ObstacleReporter reporter;          // Задача отчета о препятствиях

    // Задачи осцилляторов
    OscillatorTask oscTaskLeft;
    OscillatorTask oscTaskMid;
    OscillatorTask oscTaskRight;
    StatusTask statusTask;

    Scheduler scheduler;
    bool started;

    Robot(const Robot&);
    Robot& operator=(const Robot&);

public:
    /**
     * @brief Конструктор
     * @param config Конфигурация
     * @param servoCtrl Драйвер серво
     * @param store Хранилище калибровки
     * @param distanceSensor Датчик препятствий (nullptr - нет датчика)
     * @param reportWriter Получатель строк "obst:..."
     */
    Robot(const HexapodConfig& config,
          ServoDriver* servoCtrl,
          TrimStore* store,
          DistanceSensor* distanceSensor,
          ReportWriter reportWriter);

    /**
     * @brief Запуск задач
     * @param nowMs Текущее время (мс)
     */
    void begin(uint32_t nowMs);

    /**
     * @brief Один проход планировщика (вызывать в loop)
     */
    void update(uint32_t nowMs);

    /**
     * @brief Препятствие: нет датчика / нет измерений / расстояние
     */
    ObstacleReading obstacle() const { return sampler.reading(); }

    GaitCoordinator& getGait() { return gait; }
    const GaitCoordinator& getGait() const { return gait; }
    const ObstacleFilter& getObstacleFilter() const { return obstacleFilter; }
    const Scheduler& getScheduler() const { return scheduler; }
    bool isStarted() const { return started; }
};

#endif // ROBOT_H
