/**
 * @file GaitCoordinator.h
 * @brief Координатор походки: направление, скорость, ход, калибровка
 */

#ifndef GAIT_COORDINATOR_H
#define GAIT_COORDINATOR_H

#include <stdint.h>
#include "HexapodConfig.h"
#include "Oscillator.h"
#include "ServoDriver.h"
#include "Status.h"
#include "TrimStore.h"

/**
 * @brief Направление движения
 */
enum class SteerDirection : uint8_t {
    FWD = 0,    // Вперед
    REV,        // Назад
    ROTR,       // Разворот на месте вправо
    ROTL        // Разворот на месте влево
};

/**
 * @brief Токен направления: "fwd", "rev", "rotr", "rotl"
 */
const char* directionName(SteerDirection dir);

/**
 * @brief Разбор токена направления
 * @return false если токен неизвестен
 */
bool parseDirection(const char* token, SteerDirection& out);

/**
 * @brief Шаблон сдвигов фаз (левая, средняя, правая) для направления
 */
const uint16_t* directionPhases(SteerDirection dir);

/**
 * @brief Текущее направление и угол поворота
 */
struct SteerState {
    SteerDirection direction;
    int angle;
};

/**
 * @brief Команда руления: направление и/или угол
 */
struct SteerCommand {
    const char* direction;   // Токен направления, nullptr - не менять
    bool hasAngle;
    int angle;               // -90..90, только для fwd/rev

    SteerCommand() : direction(nullptr), hasAngle(false), angle(0) {}
};

/**
 * @brief Изменение калибровки: ноги без флага set не меняются
 */
struct TrimUpdate {
    bool set[LEG_COUNT];
    int value[LEG_COUNT];

    TrimUpdate() {
        for (uint8_t i = 0; i < LEG_COUNT; i++) {
            set[i] = false;
            value[i] = 0;
        }
    }

    void setLeg(LegId leg, int trimDeg) {
        set[legIndex(leg)] = true;
        value[legIndex(leg)] = trimDeg;
    }
};

/**
 * @brief Изменяемое состояние походки
 */
struct GaitState {
    uint16_t period;                // Период (мс)
    int stroke;                     // Базовый ход левой/правой (градусы)
    int midAmplitude;               // Амплитуда средней ноги
    uint16_t phase[LEG_COUNT];      // Сдвиги фаз текущего направления
    int trim[LEG_COUNT];            // Калибровка
    SteerDirection direction;
    int steerAngle;
    bool paused;
};

/**
 * @brief Снимок всех параметров для внешнего API
 */
struct HexapodParams {
    uint8_t pins[LEG_COUNT];
    uint16_t period;
    int speed;                      // % от диапазона периода
    uint16_t phase[LEG_COUNT];
    int trim[LEG_COUNT];
    int midAmplitude;
    int stroke;                     // градусы
    int strokePct;
    int legAmplitude[LEG_COUNT];    // Фактические амплитуды осцилляторов
    SteerState steer;
    bool paused;
};

/**
 * @brief Параметры, устанавливаемые через общий интерфейс set/get
 */
enum class GaitParam : uint8_t {
    PAUSE = 0,
    SPEED,
    STROKE,
    STEER_ANGLE
};

/**
 * @brief Координатор: единственный источник истины для движения
 */
class GaitCoordinator {
private:
    const HexapodConfig cfg;        // Конфигурация
    TrimStore* trimStore;           // Хранилище калибровки (может быть nullptr)
    GaitState state;                // Текущее состояние

    // Осцилляторы
    Oscillator oscLeft;             // Левая группа
    Oscillator oscMid;              // Средняя группа
    Oscillator oscRight;            // Правая группа
    Oscillator* legs[LEG_COUNT];    // Индексация по LegId

    void loadSavedTrim();
    void updateOscillators();

    GaitCoordinator(const GaitCoordinator&);
    GaitCoordinator& operator=(const GaitCoordinator&);

public:
    /**
     * @brief Конструктор
     * @param config Конфигурация
     * @param servoCtrl Драйвер серво
     * @param store Хранилище калибровки
     */
    GaitCoordinator(const HexapodConfig& config, ServoDriver* servoCtrl, TrimStore* store);

    const HexapodConfig& config() const { return cfg; }

    /**
     * @brief Полный снимок параметров (амплитуды берутся из осцилляторов)
     */
    HexapodParams params() const;

    /**
     * @brief Пауза для всех осцилляторов
     */
    void setPause(bool paused);
    bool isPaused() const { return state.paused; }

    /**
     * @brief Установить калибровку и сохранить ее
     * @return PERSISTENCE_FAILURE если сохранение не удалось (изменение применено)
     */
    Status setTrim(const TrimUpdate& update);
    int getTrim(LegId leg) const { return state.trim[legIndex(leg)]; }

    /**
     * @brief Выставить все серво в центр (включает паузу)
     */
    Status center(bool withTrim);

    /**
     * @brief Направление и/или угол поворота
     */
    Status setSteer(const SteerCommand& cmd);
    Status setDirection(SteerDirection dir);
    Status setSteerAngle(int angle);
    SteerState steer() const;

    /**
     * @brief Скорость в % (0 - PERIOD_MAX, 100 - PERIOD_MIN)
     */
    Status setSpeed(int pct);
    int speed() const;
    uint16_t period() const { return state.period; }

    /**
     * @brief Ход левой/правой ноги в % от STROKE_MAX
     */
    Status setStroke(int pct);
    int stroke() const;
    int strokeDegrees() const { return state.stroke; }

    /**
     * @brief Общий интерфейс для командного процессора
     */
    Status set(GaitParam param, int value);
    int get(GaitParam param) const;

    Oscillator& oscillator(LegId leg) { return *legs[legIndex(leg)]; }
    const Oscillator& oscillator(LegId leg) const { return *legs[legIndex(leg)]; }

    /**
     * @brief Распределение хода между левой и правой ногой при повороте
     *
     * Разница между ногами сохраняется при ограничении в 0..strokeMax.
     */
    static void steerStrokes(int stroke, int angle, int strokeMax, int& left, int& right);

    /**
     * @brief Период (мс) для скорости в %
     */
    static uint16_t speedToPeriod(int pct, uint16_t periodMin, uint16_t periodMax);

    /**
     * @brief Скорость в % для периода
     */
    static int periodToSpeed(uint16_t period, uint16_t periodMin, uint16_t periodMax);
};

#endif // GAIT_COORDINATOR_H
