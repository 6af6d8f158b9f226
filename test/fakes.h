/**
 * @file fakes.h
 * @brief Заглушки драйверов и перехват логов для тестов
 */

#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include <string>
#include <vector>
#include "ServoDriver.h"
#include "TrimStore.h"
#include "DistanceSensor.h"
#include "Log.h"

class FakeServoDriver : public ServoDriver {
public:
    static const int CHANNELS = 16;

    int angles[CHANNELS];
    int writes;
    bool fail;

    FakeServoDriver() : writes(0), fail(false) {
        for (int i = 0; i < CHANNELS; i++) {
            angles[i] = -1;
        }
    }

    bool setAngle(uint8_t channel, uint8_t angle) override {
        writes++;
        if (fail || channel >= CHANNELS) {
            return false;
        }
        angles[channel] = angle;
        return true;
    }
};

class FakeTrimStore : public TrimStore {
public:
    bool hasRecord;
    bool failSave;
    int stored[LEG_COUNT];
    int loads;
    int saves;

    FakeTrimStore() : hasRecord(false), failSave(false), loads(0), saves(0) {
        for (int i = 0; i < LEG_COUNT; i++) {
            stored[i] = 0;
        }
    }

    void preset(int left, int mid, int right) {
        hasRecord = true;
        stored[0] = left;
        stored[1] = mid;
        stored[2] = right;
    }

    bool load(int trim[LEG_COUNT]) override {
        loads++;
        if (!hasRecord) {
            return false;
        }
        for (int i = 0; i < LEG_COUNT; i++) {
            trim[i] = stored[i];
        }
        return true;
    }

    bool save(const int trim[LEG_COUNT]) override {
        saves++;
        if (failSave) {
            return false;
        }
        for (int i = 0; i < LEG_COUNT; i++) {
            stored[i] = trim[i];
        }
        hasRecord = true;
        return true;
    }
};

class FakeDistanceSensor : public DistanceSensor {
public:
    bool configured;
    bool valid;
    float distance;
    int reads;

    FakeDistanceSensor() : configured(true), valid(false), distance(0), reads(0) {}

    bool isConfigured() const override { return configured; }

    bool read(float& distanceMm) override {
        reads++;
        if (!valid) {
            return false;
        }
        distanceMm = distance;
        return true;
    }
};

/**
 * @brief Перехват строк logPrintf на время жизни объекта
 */
class LogCapture {
public:
    LogCapture() {
        lines().clear();
        logSetWriter(&LogCapture::write);
    }

    ~LogCapture() {
        logSetWriter(nullptr);
    }

    static std::vector<std::string>& lines() {
        static std::vector<std::string> captured;
        return captured;
    }

    int count(const std::string& fragment) const {
        int n = 0;
        for (size_t i = 0; i < lines().size(); i++) {
            if (lines()[i].find(fragment) != std::string::npos) n++;
        }
        return n;
    }

private:
    static void write(const char* line) {
        lines().push_back(line);
    }
};

/**
 * @brief Перехват строк отчета о препятствиях
 */
class ReportCapture {
public:
    ReportCapture() { lines().clear(); }

    static std::vector<std::string>& lines() {
        static std::vector<std::string> captured;
        return captured;
    }

    static void write(const char* line) {
        lines().push_back(line);
    }
};

#endif // TEST_FAKES_H
