/**
 * @file ObstacleFilter.cpp
 * @brief Реализация скользящего среднего
 */

#include "ObstacleFilter.h"
#include <math.h>

ObstacleFilter::ObstacleFilter(uint8_t windowSize)
    : window(windowSize),
      head(0),
      count(0),
      cachedAverage(0.0f),
      cacheValid(false)
{
    if (window == 0) window = 1;
    if (window > MAX_WINDOW) window = MAX_WINDOW;
}

void ObstacleFilter::sample(float distanceMm) {
    if (count == window) {
        // Перезаписываем самое старое
        samples[head] = distanceMm;
        head = (head + 1) % window;
    } else {
        samples[(head + count) % window] = distanceMm;
        count++;
    }
    cacheValid = false;
}

void ObstacleFilter::drain() {
    if (count == 0) {
        return;
    }
    head = (head + 1) % window;
    count--;
    cacheValid = false;
}

void ObstacleFilter::clear() {
    head = 0;
    count = 0;
    cacheValid = false;
}

bool ObstacleFilter::average(float& out) const {
    if (count == 0) {
        return false;
    }

    if (!cacheValid) {
        double sum = 0;
        for (uint8_t i = 0; i < count; i++) {
            sum += samples[(head + i) % window];
        }
        cachedAverage = (float)(round(sum / count * 100.0) / 100.0);
        cacheValid = true;
    }

    out = cachedAverage;
    return true;
}
