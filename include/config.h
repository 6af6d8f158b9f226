/**
 * @file config.h
 * @brief Конфигурация контроллера шестиногого робота (3 сервопривода)
 *
 * Контроллер отвечает за:
 * - Генерацию колебаний для 3 групп ног (левая, средняя, правая)
 * - Управление направлением, скоростью и ходом ног
 * - Калибровку (trim) с сохранением в NVS
 * - Опрос ультразвукового датчика препятствий HC-SR04
 * - Прием команд через Serial
 */

#ifndef CONFIG_H
#define CONFIG_H

#define FIRMWARE_VERSION "1.3.0"

// ==================== SERIAL ====================

#define SERIAL_BAUD 115200
#define SERIAL_LINE_MAX 64             // Максимальная длина команды

// ==================== I2C УСТРОЙСТВА ====================

#define I2C_SDA_PIN 21
#define I2C_SCL_PIN 22
#define I2C_FREQ 400000

// PCA9685 для сервоприводов ног
#define PCA9685_ADDR 0x40
#define SERVO_FREQ 50                  // 50 Hz для серво
#define SERVO_MIN_PULSE 150            // Ширина импульса для 0° (тики PCA9685)
#define SERVO_MAX_PULSE 600            // Ширина импульса для 180° (тики PCA9685)

// Каналы PCA9685 (порядок: левая, средняя, правая)
#define SERVO_LEFT_CHANNEL  0
#define SERVO_MID_CHANNEL   1
#define SERVO_RIGHT_CHANNEL 2

// ==================== ДАТЧИК ПРЕПЯТСТВИЙ ====================

#define OBSTACLE_SENSOR_ENABLED 1      // 0 - датчик не подключен
#define HCSR04_TRIG_PIN 13
#define HCSR04_ECHO_PIN 12
#define HCSR04_MAX_RANGE_MM 3000       // Максимальная дальность (мм)
#define HCSR04_TIMEOUT_MAX_US 18000    // Предел ожидания эха (мкс), меньше OSC_UPDATE_MS

#define OBS_SAMPLE_DELAY 10            // Интервал опроса датчика (мс)
#define OBS_SAMPLE_WINDOW 20           // Размер окна скользящего среднего
#define OBS_REPORT_INTERVAL 1000       // Интервал отчета о препятствиях (мс)

// ==================== ПОХОДКА ====================

// Период колебания (мс): больше - медленнее
#define PERIOD_MIN 500
#define PERIOD_MAX 3000
#define PERIOD_DEFAULT 2000

// Допустимый ход левой/правой ноги (градусы). Центр - 90°.
// Лучше держать симметрично: STROKE_MAX_ANGLE == 180 - STROKE_MIN_ANGLE
#define STROKE_MIN_ANGLE 35
#define STROKE_MAX_ANGLE 145
#define STROKE_DEFAULT 30

// Амплитуда средней ноги определяет, насколько поднимаются крайние ноги
#define MID_AMPLITUDE_DEFAULT 10
#define MID_AMPLITUDE_MAX 30

// Ограничение калибровки (градусы) в обе стороны
#define TRIM_LIMIT 10

// ==================== ЗАДАЧИ ====================

#define OSC_UPDATE_MS 20               // Обновление каждого осциллятора (мс)
#define STATUS_INTERVAL_MS 5000        // Вывод статуса (мс)

// ==================== NVS ====================

#define PREFS_NAMESPACE "hexapod"
#define PREFS_TRIM_KEY "trim"

#endif // CONFIG_H
