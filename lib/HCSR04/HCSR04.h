/**
 * @file HCSR04.h
 * @brief Ультразвуковой датчик расстояния HC-SR04
 */

#ifndef HCSR04_H
#define HCSR04_H

#include <Arduino.h>
#include "DistanceSensor.h"
#include "config.h"

class HCSR04 : public DistanceSensor {
private:
    int8_t trigPin;             // -1 - не подключен
    int8_t echoPin;             // -1 - не подключен
    uint16_t maxRangeMm;        // Дальше - "нет эха"
    unsigned long timeoutUs;    // Таймаут pulseIn
    bool configured;

public:
    HCSR04(int8_t trig, int8_t echo, uint16_t maxRange = HCSR04_MAX_RANGE_MM);

    /**
     * @brief Настройка пинов
     */
    void begin();

    bool isConfigured() const override { return configured; }

    /**
     * @brief Одно измерение (блокирует до timeoutUs)
     */
    bool read(float& distanceMm) override;
};

#endif // HCSR04_H
