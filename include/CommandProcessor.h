/**
 * @file CommandProcessor.h
 * @brief Текстовые команды управления через Serial
 *
 * Формат: "команда[:арг[:арг...]]", ответ - одна строка.
 * Ошибки возвращаются как "err:<причина>".
 */

#ifndef COMMAND_PROCESSOR_H
#define COMMAND_PROCESSOR_H

#include <stddef.h>
#include <stdint.h>
#include "config.h"
#include "Robot.h"

/**
 * @brief Источник данных о куче: занято и свободно (байт)
 * @return false если данные недоступны
 */
typedef bool (*MemoryInfo)(uint32_t& usedBytes, uint32_t& freeBytes);

class CommandProcessor {
private:
    static const uint8_t MAX_TOKENS = 6;

    Robot& robot;
    MemoryInfo memoryInfo;

    // Разобранная команда
    char buffer[SERIAL_LINE_MAX + 1];
    char* tokens[MAX_TOKENS];
    uint8_t tokenCount;

    bool tokenize(const char* line);

    void handleParam(GaitParam param, const char* name, char* out, size_t outLen);
    void handleTrim(char* out, size_t outLen);
    void handleCenter(char* out, size_t outLen);
    void handleParams(char* out, size_t outLen);
    void handleMemory(char* out, size_t outLen);

    void reportError(const Status& status, char* out, size_t outLen);

public:
    static const size_t RESPONSE_MAX = 192;

    explicit CommandProcessor(Robot& target, MemoryInfo memory = nullptr);

    /**
     * @brief Обработать одну строку
     * @param line Строка без завершающего '\n'
     * @param out Буфер ответа
     * @param outLen Размер буфера (RESPONSE_MAX достаточно)
     * @return false если ответа нет (пустая строка)
     */
    bool handle(const char* line, char* out, size_t outLen);
};

/**
 * @brief Разбор целого числа со знаком (вся строка целиком)
 */
bool parseIntArg(const char* text, int& value);

/**
 * @brief Разбор "true"/"false" (также "1"/"0")
 */
bool parseBoolArg(const char* text, bool& value);

#endif // COMMAND_PROCESSOR_H
