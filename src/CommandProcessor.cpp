/**
 * @file CommandProcessor.cpp
 * @brief Реализация текстовых команд управления
 */

#include "CommandProcessor.h"
#include "Log.h"
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>

// Команды, отображаемые на общий интерфейс set/get координатора
struct ParamCommand {
    const char* name;
    GaitParam param;
};

static const ParamCommand PARAM_COMMANDS[] = {
    {"pause",  GaitParam::PAUSE},
    {"speed",  GaitParam::SPEED},
    {"stroke", GaitParam::STROKE},
    {"steer",  GaitParam::STEER_ANGLE},
};

static const uint8_t PARAM_COMMAND_COUNT = sizeof(PARAM_COMMANDS) / sizeof(PARAM_COMMANDS[0]);

bool parseIntArg(const char* text, int& value) {
    if (!text || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || v < -32768 || v > 32767) {
        return false;
    }
    value = (int)v;
    return true;
}

bool parseBoolArg(const char* text, bool& value) {
    if (!text) {
        return false;
    }
    if (strcmp(text, "true") == 0 || strcmp(text, "1") == 0) {
        value = true;
        return true;
    }
    if (strcmp(text, "false") == 0 || strcmp(text, "0") == 0) {
        value = false;
        return true;
    }
    return false;
}

CommandProcessor::CommandProcessor(Robot& target, MemoryInfo memory)
    : robot(target),
      memoryInfo(memory),
      tokenCount(0)
{
    buffer[0] = '\0';
    for (uint8_t i = 0; i < MAX_TOKENS; i++) {
        tokens[i] = nullptr;
    }
}

/**
 * @brief Копирует строку без пробелов по краям и делит по ':'
 * @return false если строка слишком длинная или аргументов слишком много
 */
bool CommandProcessor::tokenize(const char* line) {
    tokenCount = 0;

    while (*line && isspace((unsigned char)*line)) {
        line++;
    }
    size_t len = strlen(line);
    while (len > 0 && isspace((unsigned char)line[len - 1])) {
        len--;
    }
    if (len > SERIAL_LINE_MAX) {
        return false;
    }
    memcpy(buffer, line, len);
    buffer[len] = '\0';

    char* p = buffer;
    tokens[tokenCount++] = p;
    while (*p) {
        if (*p == ':') {
            if (tokenCount >= MAX_TOKENS) {
                return false;
            }
            *p = '\0';
            tokens[tokenCount++] = p + 1;
        }
        p++;
    }
    return true;
}

bool CommandProcessor::handle(const char* line, char* out, size_t outLen) {
    if (!line || !out || outLen == 0) {
        return false;
    }
    out[0] = '\0';

    if (!tokenize(line)) {
        logPrintf("[CMD] Команда отклонена: слишком длинная или много аргументов\n");
        snprintf(out, outLen, "err:malformed command");
        return true;
    }

    const char* cmd = tokens[0];
    if (*cmd == '\0') {
        return false;
    }

    GaitCoordinator& gait = robot.getGait();

    if (strcmp(cmd, "ping") == 0) {
        snprintf(out, outLen, "pong");
    }
    else if (strcmp(cmd, "version") == 0) {
        snprintf(out, outLen, "version:%s", FIRMWARE_VERSION);
    }
    else if (strcmp(cmd, "run") == 0 || strcmp(cmd, "stop") == 0) {
        bool stop = cmd[0] == 's';
        gait.setPause(stop);
        logPrintf("[CMD] Осцилляторы %s\n", stop ? "ОСТАНОВЛЕНЫ" : "ЗАПУЩЕНЫ");
        snprintf(out, outLen, "%s", cmd);
    }
    else if (strcmp(cmd, "dir") == 0) {
        SteerState s = gait.steer();
        snprintf(out, outLen, "dir:%s:%d", directionName(s.direction), s.angle);
    }
    else if (strcmp(cmd, "trim") == 0) {
        handleTrim(out, outLen);
    }
    else if (strcmp(cmd, "center") == 0) {
        handleCenter(out, outLen);
    }
    else if (strcmp(cmd, "params") == 0) {
        handleParams(out, outLen);
    }
    else if (strcmp(cmd, "memory") == 0) {
        handleMemory(out, outLen);
    }
    else if (strcmp(cmd, "obst") == 0) {
        char obst[16];
        formatObstacle(robot.obstacle(), obst, sizeof(obst));
        snprintf(out, outLen, "obst:%s", obst);
    }
    else {
        // Направление движения
        SteerDirection dir;
        if (parseDirection(cmd, dir)) {
            if (tokenCount > 1) {
                snprintf(out, outLen, "err:%s takes no arguments", cmd);
                return true;
            }
            Status s = gait.setDirection(dir);
            if (!s.applied()) {
                reportError(s, out, outLen);
                return true;
            }
            logPrintf("[CMD] Направление: %s\n", directionName(dir));
            snprintf(out, outLen, "%s", directionName(dir));
            return true;
        }

        for (uint8_t i = 0; i < PARAM_COMMAND_COUNT; i++) {
            if (strcmp(cmd, PARAM_COMMANDS[i].name) == 0) {
                handleParam(PARAM_COMMANDS[i].param, PARAM_COMMANDS[i].name, out, outLen);
                return true;
            }
        }

        logPrintf("[CMD] Неизвестная команда: %s\n", cmd);
        snprintf(out, outLen, "err:unknown command %s", cmd);
    }
    return true;
}

/**
 * @brief speed / stroke / steer / pause: без аргумента - запрос
 */
void CommandProcessor::handleParam(GaitParam param, const char* name, char* out, size_t outLen) {
    GaitCoordinator& gait = robot.getGait();

    if (tokenCount > 2) {
        snprintf(out, outLen, "err:%s takes one argument", name);
        return;
    }
    if (tokenCount == 2) {
        int value = 0;
        if (param == GaitParam::PAUSE) {
            bool flag = false;
            if (!parseBoolArg(tokens[1], flag)) {
                snprintf(out, outLen, "err:invalid flag %s", tokens[1]);
                return;
            }
            value = flag ? 1 : 0;
        }
        else if (!parseIntArg(tokens[1], value)) {
            snprintf(out, outLen, "err:invalid number %s", tokens[1]);
            return;
        }
        Status s = gait.set(param, value);
        if (!s.applied()) {
            reportError(s, out, outLen);
            return;
        }
        logPrintf("[CMD] %s = %d\n", name, value);
    }
    snprintf(out, outLen, "%s:%d", name, gait.get(param));
}

void CommandProcessor::handleMemory(char* out, size_t outLen) {
    if (tokenCount > 1) {
        snprintf(out, outLen, "err:memory takes no arguments");
        return;
    }
    uint32_t used = 0;
    uint32_t freeBytes = 0;
    if (!memoryInfo || !memoryInfo(used, freeBytes)) {
        snprintf(out, outLen, "err:memory info unavailable");
        return;
    }
    snprintf(out, outLen, "memory:%lu:%lu", (unsigned long)used, (unsigned long)freeBytes);
}

/**
 * @brief trim[:l:m:r[:center]], "_" оставляет ногу без изменений
 */
void CommandProcessor::handleTrim(char* out, size_t outLen) {
    GaitCoordinator& gait = robot.getGait();

    if (tokenCount != 1 && tokenCount != 4 && tokenCount != 5) {
        snprintf(out, outLen, "err:trim expects l:m:r[:center]");
        return;
    }

    if (tokenCount > 1) {
        TrimUpdate update;
        for (uint8_t i = 0; i < LEG_COUNT; i++) {
            const char* arg = tokens[1 + i];
            if (strcmp(arg, "_") == 0) {
                continue;
            }
            int value = 0;
            if (!parseIntArg(arg, value)) {
                snprintf(out, outLen, "err:invalid number %s", arg);
                return;
            }
            update.setLeg((LegId)i, value);
        }

        bool centerAfter = false;
        if (tokenCount == 5 && !parseBoolArg(tokens[4], centerAfter)) {
            snprintf(out, outLen, "err:invalid flag %s", tokens[4]);
            return;
        }

        Status s = gait.setTrim(update);
        if (!s.applied()) {
            reportError(s, out, outLen);
            return;
        }
        if (!s.isOk()) {
            logPrintf("[CMD] ВНИМАНИЕ: trim применен, но не сохранен (%s)\n", s.message());
        }

        if (centerAfter) {
            Status c = gait.center(true);
            if (!c.isOk()) {
                reportError(c, out, outLen);
                return;
            }
        }
    }

    snprintf(out, outLen, "trim:%d:%d:%d",
             gait.getTrim(LegId::LEFT), gait.getTrim(LegId::MID), gait.getTrim(LegId::RIGHT));
}

/**
 * @brief center[:true|false], по умолчанию с учетом trim
 */
void CommandProcessor::handleCenter(char* out, size_t outLen) {
    bool withTrim = true;
    if (tokenCount > 2 || (tokenCount == 2 && !parseBoolArg(tokens[1], withTrim))) {
        snprintf(out, outLen, "err:center expects true|false");
        return;
    }
    Status s = robot.getGait().center(withTrim);
    if (!s.isOk()) {
        reportError(s, out, outLen);
        return;
    }
    snprintf(out, outLen, "center");
}

void CommandProcessor::handleParams(char* out, size_t outLen) {
    HexapodParams p = robot.getGait().params();
    snprintf(out, outLen,
             "params:pins=%d/%d/%d;period=%u;speed=%d;stroke=%d;stroke_pct=%d;mid=%d;"
             "phase=%u/%u/%u;trim=%d/%d/%d;amp=%d/%d/%d;dir=%s;angle=%d;paused=%d",
             p.pins[0], p.pins[1], p.pins[2],
             (unsigned)p.period, p.speed, p.stroke, p.strokePct, p.midAmplitude,
             (unsigned)p.phase[0], (unsigned)p.phase[1], (unsigned)p.phase[2],
             p.trim[0], p.trim[1], p.trim[2],
             p.legAmplitude[0], p.legAmplitude[1], p.legAmplitude[2],
             directionName(p.steer.direction), p.steer.angle,
             p.paused ? 1 : 0);
}

void CommandProcessor::reportError(const Status& status, char* out, size_t outLen) {
    logPrintf("[CMD] ОШИБКА %s: %s\n", errorName(status.code()), status.message());
    snprintf(out, outLen, "err:%s", status.message()[0] ? status.message() : errorName(status.code()));
}
