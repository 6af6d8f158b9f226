/**
 * @file GaitCoordinator.cpp
 * @brief Реализация координатора походки
 */

#include "GaitCoordinator.h"
#include "Log.h"
#include <string.h>
#include <stdlib.h>

// Сдвиги фаз (левая, средняя, правая) для каждого направления
static const uint16_t PHASE_FWD[LEG_COUNT]  = {0, 90, 0};     // Вперед
static const uint16_t PHASE_REV[LEG_COUNT]  = {90, 0, 90};    // Назад
static const uint16_t PHASE_ROTR[LEG_COUNT] = {0, 90, 180};   // Разворот вправо
static const uint16_t PHASE_ROTL[LEG_COUNT] = {180, 90, 0};   // Разворот влево

static const int STEER_ANGLE_LIMIT = 90;

static int clampInt(int value, int minVal, int maxVal) {
    if (value < minVal) return minVal;
    if (value > maxVal) return maxVal;
    return value;
}

const char* directionName(SteerDirection dir) {
    switch (dir) {
        case SteerDirection::FWD:  return "fwd";
        case SteerDirection::REV:  return "rev";
        case SteerDirection::ROTR: return "rotr";
        case SteerDirection::ROTL: return "rotl";
    }
    return "?";
}

bool parseDirection(const char* token, SteerDirection& out) {
    if (!token) return false;
    if (!strcmp(token, "fwd"))  { out = SteerDirection::FWD;  return true; }
    if (!strcmp(token, "rev"))  { out = SteerDirection::REV;  return true; }
    if (!strcmp(token, "rotr")) { out = SteerDirection::ROTR; return true; }
    if (!strcmp(token, "rotl")) { out = SteerDirection::ROTL; return true; }
    return false;
}

const uint16_t* directionPhases(SteerDirection dir) {
    switch (dir) {
        case SteerDirection::FWD:  return PHASE_FWD;
        case SteerDirection::REV:  return PHASE_REV;
        case SteerDirection::ROTR: return PHASE_ROTR;
        case SteerDirection::ROTL: return PHASE_ROTL;
    }
    return PHASE_FWD;
}

static bool isRotation(SteerDirection dir) {
    return dir == SteerDirection::ROTR || dir == SteerDirection::ROTL;
}

/**
 * @brief Конструктор
 */
GaitCoordinator::GaitCoordinator(const HexapodConfig& config, ServoDriver* servoCtrl, TrimStore* store)
    : cfg(config),
      trimStore(store),
      oscLeft(LegId::LEFT, config, servoCtrl),
      oscMid(LegId::MID, config, servoCtrl),
      oscRight(LegId::RIGHT, config, servoCtrl)
{
    legs[legIndex(LegId::LEFT)] = &oscLeft;
    legs[legIndex(LegId::MID)] = &oscMid;
    legs[legIndex(LegId::RIGHT)] = &oscRight;

    state.period = (uint16_t)clampInt(cfg.periodMs, cfg.periodMin, cfg.periodMax);
    state.stroke = clampInt(cfg.stroke, 0, cfg.strokeMax());
    state.midAmplitude = clampInt(cfg.midAmplitude, 0, cfg.midAmplitudeMax);
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        state.phase[i] = cfg.phase[i] % 360;
        state.trim[i] = clampInt(cfg.trim[i], -cfg.trimLimit, cfg.trimLimit);
    }
    state.direction = SteerDirection::FWD;
    state.steerAngle = 0;
    state.paused = true;

    // Сохраненная калибровка важнее конфигурации
    loadSavedTrim();

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        logPrintf("[GAIT] Осциллятор %s: канал=%d trim=%d\n",
                  legName(legs[i]->getLeg()), legs[i]->getChannel(), state.trim[i]);
        Status s = legs[i]->setTrim(state.trim[i]);
        if (!s.isOk()) {
            logPrintf("[GAIT] ОШИБКА: %s\n", s.message());
        }
        legs[i]->setPaused(state.paused);
    }
    updateOscillators();
}

void GaitCoordinator::loadSavedTrim() {
    if (!trimStore) {
        logPrintf("[TRIM] Хранилище не задано, используется конфигурация\n");
        return;
    }

    int saved[LEG_COUNT];
    if (!trimStore->load(saved)) {
        logPrintf("[TRIM] Нет сохраненной калибровки\n");
        return;
    }

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        if (saved[i] < -cfg.trimLimit || saved[i] > cfg.trimLimit) {
            logPrintf("[TRIM] ОШИБКА: сохраненные значения вне диапазона ±%d: %d,%d,%d\n",
                      cfg.trimLimit, saved[0], saved[1], saved[2]);
            return;
        }
    }

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        state.trim[i] = saved[i];
    }
    logPrintf("[TRIM] Загружена калибровка: %d,%d,%d\n", saved[0], saved[1], saved[2]);
}

void GaitCoordinator::steerStrokes(int stroke, int angle, int strokeMax, int& left, int& right) {
    left = stroke;
    right = stroke;
    if (angle == 0) {
        return;
    }

    // Доля угла от 90° переводится в долю максимального хода,
    // половина поправки уходит на каждую ногу
    int adj = (abs(angle) * strokeMax / STEER_ANGLE_LIMIT) / 2;

    // Положительный угол - правая нога короче, левая длиннее
    if (angle > 0) {
        left = stroke + adj;
        right = stroke - adj;
    } else {
        left = stroke - adj;
        right = stroke + adj;
    }

    int hi = left > right ? left : right;
    if (hi > strokeMax) {
        int excess = hi - strokeMax;
        left -= excess;
        right -= excess;
    }
    int lo = left < right ? left : right;
    if (lo < 0) {
        int deficit = -lo;
        left += deficit;
        right += deficit;
    }
}

uint16_t GaitCoordinator::speedToPeriod(int pct, uint16_t periodMin, uint16_t periodMax) {
    // Скорость обратно пропорциональна периоду
    int slowness = 100 - pct;
    return (uint16_t)(periodMin + slowness * (periodMax - periodMin) / 100);
}

int GaitCoordinator::periodToSpeed(uint16_t period, uint16_t periodMin, uint16_t periodMax) {
    if (periodMax <= periodMin) {
        return 100;
    }
    int slowness = (period - periodMin) * 100 / (periodMax - periodMin);
    return 100 - slowness;
}

/**
 * @brief Пересчет параметров всех осцилляторов из состояния
 *
 * Вызывается синхронно, поэтому пара ходов левой/правой ноги
 * всегда согласована.
 */
void GaitCoordinator::updateOscillators() {
    int left = state.stroke;
    int right = state.stroke;
    if (!isRotation(state.direction)) {
        steerStrokes(state.stroke, state.steerAngle, cfg.strokeMax(), left, right);
    }
    const int amplitudes[LEG_COUNT] = {left, state.midAmplitude, right};

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        Status s = legs[i]->set(state.period, amplitudes[i], state.phase[i]);
        if (!s.isOk()) {
            logPrintf("[GAIT] ОШИБКА: %s\n", s.message());
        }
    }
}

HexapodParams GaitCoordinator::params() const {
    HexapodParams p;
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        p.pins[i] = legs[i]->getChannel();
        p.phase[i] = state.phase[i];
        p.trim[i] = state.trim[i];
        p.legAmplitude[i] = legs[i]->getAmplitude();
    }
    p.period = state.period;
    p.speed = speed();
    p.midAmplitude = state.midAmplitude;
    p.stroke = state.stroke;
    p.strokePct = stroke();
    p.steer = steer();
    p.paused = state.paused;
    return p;
}

void GaitCoordinator::setPause(bool paused) {
    logPrintf("[GAIT] Пауза: %s\n", paused ? "ON" : "OFF");
    state.paused = paused;
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        legs[i]->setPaused(paused);
    }
}

Status GaitCoordinator::setTrim(const TrimUpdate& update) {
    // Сначала проверка всех значений, чтобы не применить часть
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        if (!update.set[i]) continue;
        if (update.value[i] < -cfg.trimLimit || update.value[i] > cfg.trimLimit) {
            return Status::error(Error::INVALID_PARAMETER, "trim %s=%d not in -%d..%d",
                                 legName((LegId)i), update.value[i], cfg.trimLimit, cfg.trimLimit);
        }
    }

    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        if (!update.set[i]) {
            logPrintf("[TRIM] %s: без изменений\n", legName((LegId)i));
            continue;
        }
        Status s = legs[i]->setTrim(update.value[i]);
        if (!s.isOk()) {
            return s;
        }
        state.trim[i] = update.value[i];
        logPrintf("[TRIM] %s: %d\n", legName((LegId)i), update.value[i]);
    }

    if (!trimStore) {
        logPrintf("[TRIM] ОШИБКА: хранилище не задано, калибровка не сохранена\n");
        return Status::error(Error::PERSISTENCE_FAILURE, "no trim store");
    }
    if (!trimStore->save(state.trim)) {
        logPrintf("[TRIM] ОШИБКА сохранения: %d,%d,%d\n", state.trim[0], state.trim[1], state.trim[2]);
        return Status::error(Error::PERSISTENCE_FAILURE, "trim save failed");
    }
    logPrintf("[TRIM] Сохранено: %d,%d,%d\n", state.trim[0], state.trim[1], state.trim[2]);
    return Status::ok();
}

Status GaitCoordinator::center(bool withTrim) {
    logPrintf("[GAIT] Центрирование серво %s trim\n", withTrim ? "с" : "без");

    // Каждый осциллятор сам встает на паузу, здесь только синхронизируем флаг
    state.paused = true;

    bool allOk = true;
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        if (!legs[i]->center(withTrim)) {
            logPrintf("[GAIT] ОШИБКА записи центра: %s (канал %d)\n",
                      legName(legs[i]->getLeg()), legs[i]->getChannel());
            allOk = false;
        }
    }
    if (!allOk) {
        return Status::error(Error::ACTUATOR_WRITE_FAILURE, "servo write failed while centering");
    }
    return Status::ok();
}

Status GaitCoordinator::setSteer(const SteerCommand& cmd) {
    if (!cmd.direction && !cmd.hasAngle) {
        return Status::error(Error::INVALID_PARAMETER, "direction or angle required");
    }

    SteerDirection dir = state.direction;
    if (cmd.direction && !parseDirection(cmd.direction, dir)) {
        return Status::error(Error::INVALID_DIRECTION, "invalid steering direction: %s", cmd.direction);
    }

    if (cmd.hasAngle) {
        if (isRotation(dir)) {
            return Status::error(Error::INVALID_PARAMETER, "angle only allowed for fwd or rev");
        }
        if (cmd.angle < -STEER_ANGLE_LIMIT || cmd.angle > STEER_ANGLE_LIMIT) {
            return Status::error(Error::INVALID_PARAMETER, "invalid steering angle: %d", cmd.angle);
        }
    }

    if (cmd.direction) {
        // Любая смена направления сбрасывает угол
        state.direction = dir;
        state.steerAngle = 0;
        const uint16_t* phases = directionPhases(dir);
        for (uint8_t i = 0; i < LEG_COUNT; i++) {
            state.phase[i] = phases[i];
        }
    }
    if (cmd.hasAngle) {
        state.steerAngle = cmd.angle;
    }

    updateOscillators();
    logPrintf("[GAIT] Руление: %s угол=%d\n", directionName(state.direction), state.steerAngle);
    return Status::ok();
}

Status GaitCoordinator::setDirection(SteerDirection dir) {
    SteerCommand cmd;
    cmd.direction = directionName(dir);
    return setSteer(cmd);
}

Status GaitCoordinator::setSteerAngle(int angle) {
    SteerCommand cmd;
    cmd.hasAngle = true;
    cmd.angle = angle;
    return setSteer(cmd);
}

SteerState GaitCoordinator::steer() const {
    SteerState s;
    s.direction = state.direction;
    s.angle = state.steerAngle;
    return s;
}

Status GaitCoordinator::setSpeed(int pct) {
    if (pct < 0 || pct > 100) {
        return Status::error(Error::INVALID_PARAMETER, "invalid speed percentage value: %d", pct);
    }

    state.period = speedToPeriod(pct, cfg.periodMin, cfg.periodMax);
    for (uint8_t i = 0; i < LEG_COUNT; i++) {
        Status s = legs[i]->setPeriod(state.period);
        if (!s.isOk()) {
            logPrintf("[GAIT] ОШИБКА: %s\n", s.message());
        }
    }
    logPrintf("[GAIT] Скорость %d%% -> период %d мс\n", pct, state.period);
    return Status::ok();
}

int GaitCoordinator::speed() const {
    return periodToSpeed(state.period, cfg.periodMin, cfg.periodMax);
}

Status GaitCoordinator::setStroke(int pct) {
    if (pct < 0 || pct > 100) {
        return Status::error(Error::INVALID_PARAMETER, "invalid stroke percentage value: %d", pct);
    }

    state.stroke = pct * cfg.strokeMax() / 100;
    // Через полный пересчет, чтобы учесть текущий угол поворота
    updateOscillators();
    logPrintf("[GAIT] Ход %d%% -> %d°\n", pct, state.stroke);
    return Status::ok();
}

int GaitCoordinator::stroke() const {
    int strokeMax = cfg.strokeMax();
    if (strokeMax <= 0) {
        return 0;
    }
    return state.stroke * 100 / strokeMax;
}

Status GaitCoordinator::set(GaitParam param, int value) {
    switch (param) {
        case GaitParam::PAUSE:
            if (value != 0 && value != 1) {
                return Status::error(Error::INVALID_PARAMETER, "invalid pause value: %d", value);
            }
            setPause(value == 1);
            return Status::ok();
        case GaitParam::SPEED:
            return setSpeed(value);
        case GaitParam::STROKE:
            return setStroke(value);
        case GaitParam::STEER_ANGLE:
            return setSteerAngle(value);
    }
    return Status::error(Error::INVALID_PARAMETER, "unknown parameter");
}

int GaitCoordinator::get(GaitParam param) const {
    switch (param) {
        case GaitParam::PAUSE:       return state.paused ? 1 : 0;
        case GaitParam::SPEED:       return speed();
        case GaitParam::STROKE:      return stroke();
        case GaitParam::STEER_ANGLE: return state.steerAngle;
    }
    return 0;
}
