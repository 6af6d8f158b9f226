/**
 * @file main.cpp
 * @brief Контроллер шестиногого робота с тремя сервоприводами
 *
 * Функции:
 * - Генерация походки 3 осцилляторами (левая, средняя, правая группа ног)
 * - Направление, поворот, скорость и ход ног по командам Serial
 * - Калибровка (trim) с сохранением в NVS
 * - Опрос HC-SR04 и отчеты о препятствиях
 *
 * Все задачи выполняются кооперативно из loop(), без FreeRTOS задач.
 */

#include <Arduino.h>
#include <Wire.h>
#include "PCA9685Servo.h"
#include "HCSR04.h"
#include "TrimPreferences.h"
#include "CommandProcessor.h"
#include "Robot.h"
#include "Log.h"
#include "config.h"

// ==================== ГЛОБАЛЬНЫЕ ОБЪЕКТЫ ====================
PCA9685Servo servos(Wire, PCA9685_ADDR);                 // PCA9685 драйвер серво
HCSR04 rangeFinder(HCSR04_TRIG_PIN, HCSR04_ECHO_PIN);    // Датчик препятствий
TrimPreferences trimStore;                               // Калибровка в NVS

static Robot* robot = nullptr;
static CommandProcessor* console = nullptr;

// Буфер входящей команды
static char lineBuf[SERIAL_LINE_MAX + 1];
static uint8_t lineLen = 0;
static bool lineOverflow = false;

// ==================== ФУНКЦИИ ====================

static void serialLogWriter(const char* line) {
    Serial.print(line);
}

static void serialReportWriter(const char* line) {
    Serial.println(line);
}

static bool heapInfo(uint32_t& usedBytes, uint32_t& freeBytes) {
    uint32_t total = ESP.getHeapSize();
    freeBytes = ESP.getFreeHeap();
    usedBytes = total > freeBytes ? total - freeBytes : 0;
    return total > 0;
}

/**
 * @brief Чтение Serial без блокировки, команда выполняется по '\n'
 */
static void processSerial() {
    while (Serial.available()) {
        char c = (char)Serial.read();
        if (c == '\r') {
            continue;
        }
        if (c != '\n') {
            if (lineLen < SERIAL_LINE_MAX) {
                lineBuf[lineLen++] = c;
            } else {
                lineOverflow = true;
            }
            continue;
        }

        lineBuf[lineLen] = '\0';
        if (lineOverflow) {
            logPrintf("[CMD] Строка длиннее %d символов отброшена\n", SERIAL_LINE_MAX);
            Serial.println("err:malformed command");
        } else {
            char response[CommandProcessor::RESPONSE_MAX];
            if (console->handle(lineBuf, response, sizeof(response))) {
                Serial.println(response);
            }
        }
        lineLen = 0;
        lineOverflow = false;
    }
}

/**
 * @brief Инициализация
 */
void setup() {
    Serial.begin(SERIAL_BAUD);
    delay(500);
    logSetWriter(serialLogWriter);

    Serial.println("\n========================================");
    Serial.printf("  Hexapod controller v%s\n", FIRMWARE_VERSION);
    Serial.println("========================================");

    // Инициализация I2C
    Wire.begin(I2C_SDA_PIN, I2C_SCL_PIN, I2C_FREQ);

    // Инициализация серво
    if (!servos.begin(SERVO_FREQ)) {
        Serial.println("[MAIN] ВНИМАНИЕ: PCA9685 не найден, запись в серво будет с ошибками");
    }
    delay(100);  // Задержка для полной инициализации PCA9685

#if OBSTACLE_SENSOR_ENABLED
    rangeFinder.begin();
    DistanceSensor* sensor = &rangeFinder;
#else
    DistanceSensor* sensor = nullptr;
    Serial.println("[MAIN] Датчик препятствий отключен в config.h");
#endif

    // Конфигурация и робот создаются после Serial и NVS
    static HexapodConfig hexConfig = defaultHexapodConfig();
    static Robot robotInstance(hexConfig, &servos, &trimStore, sensor, serialReportWriter);
    static CommandProcessor consoleInstance(robotInstance, heapInfo);
    robot = &robotInstance;
    console = &consoleInstance;

    // Ноги в центр до старта походки
    Status s = robot->getGait().center(true);
    if (!s.isOk()) {
        logPrintf("[MAIN] ОШИБКА центрирования: %s\n", s.message());
    }
    delay(500);  // Даём время сервам доехать

    robot->begin(millis());

    Serial.println("[MAIN] Инициализация завершена!\n");
    Serial.println("Доступные команды (через Serial Monitor):");
    Serial.println("  run / stop                 - запуск / остановка");
    Serial.println("  fwd / rev / rotr / rotl    - направление");
    Serial.println("  speed:<0-100>              - скорость");
    Serial.println("  stroke:<0-100>             - ход ног");
    Serial.println("  steer:<-90..90>            - поворот");
    Serial.println("  trim:<l>:<m>:<r>[:true]    - калибровка ('_' - без изменений)");
    Serial.println("  center[:false]             - серво в центр");
    Serial.println("  params / dir / obst / ping - запросы");
    Serial.println("  memory                     - занято:свободно в куче");
    Serial.println("");
}

/**
 * @brief Основной цикл
 */
void loop() {
    processSerial();
    robot->update(millis());
}
