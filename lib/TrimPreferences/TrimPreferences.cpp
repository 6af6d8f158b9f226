#include "TrimPreferences.h"
#include "Log.h"

TrimPreferences::TrimPreferences(const char* nameSpace, const char* keyName)
    : ns(nameSpace),
      key(keyName)
{
}

bool TrimPreferences::load(int trim[LEG_COUNT]) {
    if (!prefs.begin(ns, true)) {
        logPrintf("[TRIM] NVS namespace '%s' недоступен\n", ns);
        return false;
    }
    if (!prefs.isKey(key)) {
        prefs.end();
        logPrintf("[TRIM] Сохраненной калибровки нет (%s/%s)\n", ns, key);
        return false;
    }
    String record = prefs.getString(key, "");
    prefs.end();

    if (!parseTrimRecord(record.c_str(), trim)) {
        logPrintf("[TRIM] Поврежденная запись: '%s'\n", record.c_str());
        return false;
    }
    return true;
}

bool TrimPreferences::save(const int trim[LEG_COUNT]) {
    char record[24];
    if (!formatTrimRecord(trim, record, sizeof(record))) {
        return false;
    }
    if (!prefs.begin(ns, false)) {
        logPrintf("[TRIM] NVS namespace '%s' недоступен для записи\n", ns);
        return false;
    }
    size_t written = prefs.putString(key, record);
    prefs.end();
    return written > 0;
}
