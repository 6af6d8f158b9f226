/**
 * @file ServoDriver.h
 * @brief Интерфейс примитива "установить угол на канале"
 */

#ifndef SERVO_DRIVER_H
#define SERVO_DRIVER_H

#include <stdint.h>

class ServoDriver {
public:
    virtual ~ServoDriver() {}

    /**
     * @brief Установка угла сервопривода
     * @param channel Канал сервопривода
     * @param angle Угол в градусах (0-180)
     * @return false при аппаратной ошибке записи
     */
    virtual bool setAngle(uint8_t channel, uint8_t angle) = 0;
};

#endif // SERVO_DRIVER_H
