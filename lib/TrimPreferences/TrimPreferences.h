/**
 * @file TrimPreferences.h
 * @brief Хранение калибровки в NVS (Preferences)
 */

#ifndef TRIM_PREFERENCES_H
#define TRIM_PREFERENCES_H

#include <Arduino.h>
#include <Preferences.h>
#include "TrimStore.h"
#include "config.h"

/**
 * @brief Запись "left,mid,right" в namespace/key NVS
 */
class TrimPreferences : public TrimStore {
private:
    Preferences prefs;
    const char* ns;
    const char* key;

public:
    TrimPreferences(const char* nameSpace = PREFS_NAMESPACE, const char* keyName = PREFS_TRIM_KEY);

    bool load(int trim[LEG_COUNT]) override;
    bool save(const int trim[LEG_COUNT]) override;
};

#endif // TRIM_PREFERENCES_H
