/**
 * @file Log.h
 * @brief Единый вывод логов: "[TAG] сообщение"
 *
 * В прошивке вывод направляется в Serial, на хосте - в stdout.
 */

#ifndef LOG_H
#define LOG_H

/**
 * @brief Получатель готовой строки лога
 */
typedef void (*LogWriter)(const char* line);

/**
 * @brief Установить получателя строк (nullptr - вернуть stdout)
 */
void logSetWriter(LogWriter writer);

/**
 * @brief Форматированный вывод в стиле printf
 */
void logPrintf(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

#endif // LOG_H
