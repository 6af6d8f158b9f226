/**
 * @file TrimStore.h
 * @brief Хранилище калибровки (trim) между перезапусками
 */

#ifndef TRIM_STORE_H
#define TRIM_STORE_H

#include <stddef.h>
#include "HexapodConfig.h"

/**
 * @brief Интерфейс хранилища trim для трех ног
 */
class TrimStore {
public:
    virtual ~TrimStore() {}

    /**
     * @brief Прочитать сохраненные значения
     * @param trim Выход: левая, средняя, правая
     * @return false если записи нет или она повреждена
     */
    virtual bool load(int trim[LEG_COUNT]) = 0;

    /**
     * @brief Сохранить значения
     * @return false при ошибке записи
     */
    virtual bool save(const int trim[LEG_COUNT]) = 0;
};

/**
 * @brief Формат записи: "left,mid,right"
 * @return false если буфер мал
 */
bool formatTrimRecord(const int trim[LEG_COUNT], char* out, size_t outLen);

/**
 * @brief Разбор записи "left,mid,right" (ровно три целых числа)
 */
bool parseTrimRecord(const char* record, int trim[LEG_COUNT]);

#endif // TRIM_STORE_H
