/**
 * @file Scheduler.cpp
 * @brief Реализация кооперативного планировщика
 */

#include "Scheduler.h"
#include "Log.h"

// Сравнение с учетом переполнения millis() (~49 дней)
static bool isDue(uint32_t nowMs, uint32_t at) {
    return (int32_t)(nowMs - at) >= 0;
}

Scheduler::Scheduler() : count(0) {
    for (uint8_t i = 0; i < MAX_TASKS; i++) {
        slots[i].task = nullptr;
        slots[i].nextRun = 0;
        slots[i].active = false;
    }
}

bool Scheduler::add(Task* task, uint32_t nowMs, uint32_t firstDelayMs) {
    if (!task) {
        return false;
    }
    if (count >= MAX_TASKS) {
        logPrintf("[SCHED] ОШИБКА: нет места для задачи %s\n", task->name());
        return false;
    }

    slots[count].task = task;
    slots[count].nextRun = nowMs + firstDelayMs;
    slots[count].active = true;
    count++;
    logPrintf("[SCHED] Задача %s запущена\n", task->name());
    return true;
}

uint8_t Scheduler::tick(uint32_t nowMs) {
    uint8_t ran = 0;
    for (uint8_t i = 0; i < count; i++) {
        Slot& slot = slots[i];
        if (!slot.active || !isDue(nowMs, slot.nextRun)) {
            continue;
        }

        uint32_t delayMs = slot.task->run(nowMs);
        ran++;

        if (delayMs == TASK_DONE) {
            slot.active = false;
            logPrintf("[SCHED] Задача %s завершена\n", slot.task->name());
            continue;
        }
        slot.nextRun = nowMs + delayMs;
    }
    return ran;
}

uint8_t Scheduler::activeCount() const {
    uint8_t n = 0;
    for (uint8_t i = 0; i < count; i++) {
        if (slots[i].active) n++;
    }
    return n;
}

bool Scheduler::isActive(const Task* task) const {
    for (uint8_t i = 0; i < count; i++) {
        if (slots[i].task == task) {
            return slots[i].active;
        }
    }
    return false;
}
