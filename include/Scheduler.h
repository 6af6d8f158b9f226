/**
 * @file Scheduler.h
 * @brief Кооперативный планировщик: однопоточный, без вытеснения
 *
 * Задача выполняет один шаг в run() и возвращает паузу до следующего
 * шага. Переключение между задачами возможно только между шагами.
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <stdint.h>

/**
 * @brief Значение run(): задача завершена и больше не планируется
 */
static const uint32_t TASK_DONE = 0xFFFFFFFFUL;

/**
 * @brief Базовый класс задачи
 */
class Task {
public:
    virtual ~Task() {}

    /**
     * @brief Имя задачи для логов
     */
    virtual const char* name() const = 0;

    /**
     * @brief Один шаг задачи
     * @param nowMs Текущее время (мс)
     * @return Пауза до следующего шага (мс) или TASK_DONE
     */
    virtual uint32_t run(uint32_t nowMs) = 0;
};

class Scheduler {
public:
    static const uint8_t MAX_TASKS = 8;

    Scheduler();

    /**
     * @brief Добавить задачу
     * @param task Задача (не удаляется планировщиком)
     * @param nowMs Текущее время
     * @param firstDelayMs Задержка до первого запуска
     * @return false если таблица заполнена
     */
    bool add(Task* task, uint32_t nowMs, uint32_t firstDelayMs = 0);

    /**
     * @brief Выполнить все задачи, время которых наступило
     * @return Количество выполненных шагов
     */
    uint8_t tick(uint32_t nowMs);

    /**
     * @brief Количество активных задач
     */
    uint8_t activeCount() const;

    /**
     * @brief Задача еще планируется
     */
    bool isActive(const Task* task) const;

private:
    struct Slot {
        Task* task;
        uint32_t nextRun;
        bool active;
    };

    Slot slots[MAX_TASKS];
    uint8_t count;
};

#endif // SCHEDULER_H
