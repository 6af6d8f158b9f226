/**
 * @file DistanceSensor.h
 * @brief Интерфейс датчика расстояния и результат опроса препятствий
 */

#ifndef DISTANCE_SENSOR_H
#define DISTANCE_SENSOR_H

#include <stdint.h>

class DistanceSensor {
public:
    virtual ~DistanceSensor() {}

    /**
     * @brief Датчик подключен и настроен
     */
    virtual bool isConfigured() const = 0;

    /**
     * @brief Одно измерение
     * @param distanceMm Выход: расстояние (мм)
     * @return false если эхо не получено или вне диапазона
     */
    virtual bool read(float& distanceMm) = 0;
};

/**
 * @brief Таймаут ожидания эха для заданной дальности
 * @param maxRangeMm Максимальная дальность (мм)
 * @param capUs Верхний предел (мкс); ожидание блокирует цикл
 * @return Время прохода туда и обратно плюс запас 1 мс, не больше capUs
 */
uint32_t echoTimeoutUs(uint16_t maxRangeMm, uint32_t capUs);

/**
 * @brief Состояние датчика препятствий
 */
enum class ObstacleState : uint8_t {
    UNCONFIGURED = 0,   // Датчика нет
    NONE,               // Препятствие не обнаружено / нет измерений
    DISTANCE            // Есть среднее расстояние
};

struct ObstacleReading {
    ObstacleState state;
    float distanceMm;       // Только для DISTANCE

    ObstacleReading() : state(ObstacleState::UNCONFIGURED), distanceMm(0) {}
    ObstacleReading(ObstacleState s, float d) : state(s), distanceMm(d) {}
};

#endif // DISTANCE_SENSOR_H
