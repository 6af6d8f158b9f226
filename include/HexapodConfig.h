/**
 * @file HexapodConfig.h
 * @brief Неизменяемая конфигурация робота, передаваемая при создании
 */

#ifndef HEXAPOD_CONFIG_H
#define HEXAPOD_CONFIG_H

#include <stdint.h>

/**
 * @brief Группа ног (индекс в массивах из 3 элементов)
 */
enum class LegId : uint8_t {
    LEFT = 0,
    MID = 1,
    RIGHT = 2
};

static const uint8_t LEG_COUNT = 3;

inline uint8_t legIndex(LegId leg) { return static_cast<uint8_t>(leg); }

/**
 * @brief Имя ноги для логов
 */
const char* legName(LegId leg);

/**
 * @brief Параметры, задаваемые один раз при старте
 */
struct HexapodConfig {
    uint8_t pins[LEG_COUNT];        // Каналы серво: левая, средняя, правая

    // Походка по умолчанию
    uint16_t periodMs;              // Период колебания (мс)
    uint16_t phase[LEG_COUNT];      // Сдвиг фазы (градусы)
    int8_t trim[LEG_COUNT];         // Калибровка по умолчанию (градусы)
    uint8_t midAmplitude;           // Амплитуда средней ноги (градусы)
    uint8_t stroke;                 // Амплитуда левой/правой ноги (градусы)

    // Ограничения
    uint16_t periodMin;
    uint16_t periodMax;
    uint8_t strokeMinAngle;         // Минимальный угол хода левой/правой
    uint8_t strokeMaxAngle;         // Максимальный угол хода левой/правой
    uint8_t midAmplitudeMax;
    uint8_t trimLimit;

    // Задачи
    uint16_t oscUpdateMs;           // Интервал обновления осцилляторов
    uint16_t obsSampleDelayMs;      // Интервал опроса датчика
    uint8_t obsSampleWindow;        // Окно скользящего среднего
    uint16_t obsReportIntervalMs;   // Интервал отчета о препятствиях
    uint16_t statusIntervalMs;      // Интервал вывода статуса

    /**
     * @brief Максимальный ход (амплитуда) левой/правой ноги
     *
     * Разница углов делится вокруг точки 90°, поэтому доступна половина.
     */
    int strokeMax() const { return (strokeMaxAngle - strokeMinAngle) / 2; }

    /**
     * @brief Максимальная амплитуда для конкретной ноги
     */
    int maxAmplitude(LegId leg) const {
        return leg == LegId::MID ? midAmplitudeMax : strokeMax();
    }
};

/**
 * @brief Конфигурация из config.h
 */
HexapodConfig defaultHexapodConfig();

#endif // HEXAPOD_CONFIG_H
