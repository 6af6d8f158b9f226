/**
 * @file Oscillator.h
 * @brief Осциллятор одной группы ног: время -> угол серво
 */

#ifndef OSCILLATOR_H
#define OSCILLATOR_H

#include <stdint.h>
#include "HexapodConfig.h"
#include "ServoDriver.h"
#include "Status.h"

static const int SERVO_CENTER = 90;
static const int SERVO_ANGLE_MIN = 0;
static const int SERVO_ANGLE_MAX = 180;

/**
 * @brief Синусоидальный генератор угла для одного серво
 *
 * angle = 90 + trim + amplitude * sin(2π * фаза + phaseShift)
 *
 * Фаза накапливается только пока осциллятор не на паузе, поэтому после
 * снятия паузы нога продолжает движение с того места, где остановилась.
 */
class Oscillator {
private:
    LegId leg;                      // Группа ног
    uint8_t channel;                // Канал серво
    int maxAmplitude;               // Предел амплитуды для этой ноги
    int trimLimit;                  // Предел калибровки
    ServoDriver* servos;            // Драйвер серво

    uint16_t period;                // Период (мс)
    int amplitude;                  // Амплитуда (градусы)
    int phaseShift;                 // Сдвиг фазы (градусы)
    int trim;                       // Калибровка (градусы)
    bool paused;                    // Пауза

    uint32_t phaseMs;               // Накопленное время колебаний (мс)
    uint32_t lastTick;              // Время последнего обновления
    bool clockSynced;               // false - следующий update только синхронизирует часы

    int lastAngle;                  // Последний отправленный угол (-1 - еще не было)
    uint32_t writeFailures;         // Количество ошибок записи

public:
    /**
     * @brief Конструктор
     * @param legId Группа ног
     * @param config Конфигурация (пределы амплитуды и калибровки)
     * @param servoCtrl Драйвер серво
     */
    Oscillator(LegId legId, const HexapodConfig& config, ServoDriver* servoCtrl);

    /**
     * @brief Установить параметры колебания (без немедленного движения)
     * @param periodMs Период (мс), > 0
     * @param amplitudeDeg Амплитуда 0..maxAmplitude
     * @param phaseShiftDeg Сдвиг фазы 0..359
     */
    Status set(uint16_t periodMs, int amplitudeDeg, int phaseShiftDeg);

    /**
     * @brief Установить только период
     */
    Status setPeriod(uint16_t periodMs);

    /**
     * @brief Установить калибровку центра (±trimLimit)
     */
    Status setTrim(int trimDeg);

    /**
     * @brief Вычислить угол для момента now и отправить его в серво
     * @param nowMs Текущее время (мс)
     * @return false при ошибке записи в серво
     */
    bool update(uint32_t nowMs);

    /**
     * @brief Поставить на паузу и сразу выставить центр (90° [+ trim])
     */
    bool center(bool withTrim);

    void setPaused(bool pause);

    /**
     * @brief Угол для заданной фазы (0.0 ... 1.0), без ограничения 0..180
     */
    float waveform(float phase) const;

    LegId getLeg() const { return leg; }
    uint8_t getChannel() const { return channel; }
    uint16_t getPeriod() const { return period; }
    int getAmplitude() const { return amplitude; }
    int getPhaseShift() const { return phaseShift; }
    int getTrim() const { return trim; }
    bool isPaused() const { return paused; }
    int getLastAngle() const { return lastAngle; }
    uint32_t getWriteFailures() const { return writeFailures; }

private:
    bool writeAngle(int angle);
};

#endif // OSCILLATOR_H
