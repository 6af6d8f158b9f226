#include "HCSR04.h"
#include "Log.h"

// Скорость звука: 0.343 мм/мкс, путь туда и обратно
static const float SOUND_MM_PER_US = 0.343f;
static const float MIN_RANGE_MM = 20.0f;

HCSR04::HCSR04(int8_t trig, int8_t echo, uint16_t maxRange)
    : trigPin(trig),
      echoPin(echo),
      maxRangeMm(maxRange),
      timeoutUs(echoTimeoutUs(maxRange, HCSR04_TIMEOUT_MAX_US)),
      configured(false)
{
}

void HCSR04::begin() {
    if (trigPin < 0 || echoPin < 0) {
        logPrintf("[HCSR04] Пины не заданы, датчик отключен\n");
        configured = false;
        return;
    }
    pinMode(trigPin, OUTPUT);
    pinMode(echoPin, INPUT);
    digitalWrite(trigPin, LOW);
    configured = true;
    logPrintf("[HCSR04] TRIG=%d ECHO=%d, дальность до %d мм (таймаут %lu мкс)\n",
              trigPin, echoPin, maxRangeMm, timeoutUs);
}

bool HCSR04::read(float& distanceMm) {
    if (!configured) {
        return false;
    }

    digitalWrite(trigPin, LOW);
    delayMicroseconds(2);
    digitalWrite(trigPin, HIGH);
    delayMicroseconds(10);
    digitalWrite(trigPin, LOW);

    unsigned long duration = pulseIn(echoPin, HIGH, timeoutUs);
    if (duration == 0) {
        return false;   // Таймаут - эха нет
    }

    float mm = duration * SOUND_MM_PER_US / 2.0f;
    if (mm < MIN_RANGE_MM || mm > maxRangeMm) {
        return false;
    }
    distanceMm = mm;
    return true;
}
