/**
 * @file Log.cpp
 * @brief Реализация вывода логов
 */

#include "Log.h"
#include <stdarg.h>
#include <stdio.h>

static const int LOG_LINE_MAX = 192;

static void stdoutWriter(const char* line) {
    fputs(line, stdout);
}

static LogWriter currentWriter = stdoutWriter;

void logSetWriter(LogWriter writer) {
    currentWriter = writer ? writer : stdoutWriter;
}

void logPrintf(const char* fmt, ...) {
    char line[LOG_LINE_MAX];

    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    currentWriter(line);
}
