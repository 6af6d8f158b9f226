/**
 * @file TrimStore.cpp
 * @brief Формат записи калибровки
 */

#include "TrimStore.h"
#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>

bool formatTrimRecord(const int trim[LEG_COUNT], char* out, size_t outLen) {
    int n = snprintf(out, outLen, "%d,%d,%d", trim[0], trim[1], trim[2]);
    return n > 0 && (size_t)n < outLen;
}

bool parseTrimRecord(const char* record, int trim[LEG_COUNT]) {
    if (!record) {
        return false;
    }

    int values[LEG_COUNT];
    const char* p = record;
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        while (isspace((unsigned char)*p)) p++;

        char* end = nullptr;
        errno = 0;
        long v = strtol(p, &end, 10);
        if (end == p || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
            return false;
        }
        values[i] = (int)v;
        p = end;

        while (isspace((unsigned char)*p)) p++;
        if (i < LEG_COUNT - 1) {
            if (*p != ',') return false;
            p++;
        }
    }
    if (*p != '\0') {
        return false;
    }

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        trim[i] = values[i];
    }
    return true;
}
