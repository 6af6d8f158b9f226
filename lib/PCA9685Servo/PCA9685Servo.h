/**
 * @file PCA9685Servo.h
 * @brief Управление сервоприводами ног через I2C (PCA9685)
 *
 * Обертка над Adafruit_PWMServoDriver
 */

#ifndef PCA9685_SERVO_H
#define PCA9685_SERVO_H

#include <Arduino.h>
#include <Wire.h>
#include <Adafruit_PWMServoDriver.h>
#include "ServoDriver.h"
#include "config.h"

class PCA9685Servo : public ServoDriver {
public:
    /**
     * @brief Конструктор
     * @param i2c Ссылка на I2C интерфейс
     * @param addr I2C адрес PCA9685
     */
    PCA9685Servo(TwoWire &i2c, uint8_t addr = PCA9685_ADDR);

    /**
     * @brief Инициализация PCA9685
     * @param freq Частота PWM (50 Hz для серво)
     * @return false если контроллер не ответил
     */
    bool begin(uint16_t freq = SERVO_FREQ);

    /**
     * @brief Установка угла сервопривода
     * @param channel Канал PCA9685 (0-15)
     * @param angle Угол в градусах (0-180)
     * @return false при ошибке I2C или до begin()
     */
    bool setAngle(uint8_t channel, uint8_t angle) override;

private:
    uint8_t addr;
    Adafruit_PWMServoDriver pwm;
    bool ready;
};

#endif // PCA9685_SERVO_H
