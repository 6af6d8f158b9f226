/**
 * @file ObstacleFilter.h
 * @brief Скользящее среднее расстояния до препятствия
 */

#ifndef OBSTACLE_FILTER_H
#define OBSTACLE_FILTER_H

#include <stdint.h>

/**
 * @brief Окно FIFO фиксированного размера с кешированным средним
 */
class ObstacleFilter {
public:
    static const uint8_t MAX_WINDOW = 32;

    /**
     * @brief Конструктор
     * @param windowSize Размер окна (1..MAX_WINDOW)
     */
    explicit ObstacleFilter(uint8_t windowSize);

    /**
     * @brief Добавить измерение; при переполнении удаляется самое старое
     */
    void sample(float distanceMm);

    /**
     * @brief Удалить самое старое измерение (если есть)
     */
    void drain();

    void clear();

    /**
     * @brief Среднее по окну, округленное до 0.01
     * @param out Среднее расстояние (мм)
     * @return false если измерений нет
     */
    bool average(float& out) const;

    uint8_t size() const { return count; }
    uint8_t capacity() const { return window; }
    bool empty() const { return count == 0; }

private:
    float samples[MAX_WINDOW];      // Кольцевой буфер
    uint8_t window;                 // Размер окна
    uint8_t head;                   // Индекс самого старого
    uint8_t count;                  // Количество измерений

    mutable float cachedAverage;
    mutable bool cacheValid;
};

#endif // OBSTACLE_FILTER_H
