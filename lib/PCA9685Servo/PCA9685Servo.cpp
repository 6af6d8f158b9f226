#include "PCA9685Servo.h"
#include "Log.h"

PCA9685Servo::PCA9685Servo(TwoWire &i2c, uint8_t address)
    : addr(address),
      pwm(address, i2c),
      ready(false)
{
}

bool PCA9685Servo::begin(uint16_t freq) {
    if (!pwm.begin()) {
        logPrintf("[SERVO] ОШИБКА: PCA9685 не отвечает на адресе 0x%02X\n", addr);
        ready = false;
        return false;
    }
    pwm.setPWMFreq(freq);
    ready = true;
    logPrintf("[SERVO] Инициализирован на адресе 0x%02X, %d Hz\n", addr, freq);
    return true;
}

bool PCA9685Servo::setAngle(uint8_t channel, uint8_t angle) {
    if (!ready) {
        return false;
    }
    angle = constrain(angle, 0, 180);
    uint16_t pulse = map(angle, 0, 180, SERVO_MIN_PULSE, SERVO_MAX_PULSE);
    // setPWM возвращает 0 при успешной передаче
    return pwm.setPWM(channel, 0, pulse) == 0;
}

