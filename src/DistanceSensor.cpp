#include "DistanceSensor.h"

// Скорость звука: 0.343 мм/мкс
static const float SOUND_MM_PER_US = 0.343f;
static const uint32_t ECHO_MARGIN_US = 1000;

uint32_t echoTimeoutUs(uint16_t maxRangeMm, uint32_t capUs) {
    uint32_t roundTrip = (uint32_t)(maxRangeMm * 2 / SOUND_MM_PER_US) + ECHO_MARGIN_US;
    return roundTrip < capUs ? roundTrip : capUs;
}
