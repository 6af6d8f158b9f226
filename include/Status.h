/**
 * @file Status.h
 * @brief Коды ошибок и результат операций контроллера
 */

#ifndef STATUS_H
#define STATUS_H

#include <stdint.h>

/**
 * @brief Коды ошибок
 */
enum class Error : uint8_t {
    OK = 0,
    INVALID_PARAMETER,       // Значение вне допустимого диапазона
    INVALID_DIRECTION,       // Неизвестное направление движения
    PERSISTENCE_FAILURE,     // Не удалось сохранить trim (изменение применено)
    SENSOR_UNAVAILABLE,      // Датчик препятствий не подключен
    ACTUATOR_WRITE_FAILURE   // Ошибка записи угла в серво
};

/**
 * @brief Название кода ошибки
 */
const char* errorName(Error error);

/**
 * @brief Результат операции: код + описание причины
 */
class Status {
public:
    static const uint8_t MESSAGE_MAX = 72;

    Status() : code_(Error::OK) { message_[0] = '\0'; }

    /**
     * @brief Успешный результат
     */
    static Status ok() { return Status(); }

    /**
     * @brief Ошибка с форматированным описанием (printf)
     */
    static Status error(Error code, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 2, 3)))
#endif
        ;

    bool isOk() const { return code_ == Error::OK; }

    /**
     * @brief Изменение применено (в т.ч. если не удалось сохранить)
     */
    bool applied() const {
        return code_ == Error::OK || code_ == Error::PERSISTENCE_FAILURE;
    }

    Error code() const { return code_; }
    const char* message() const { return message_; }

private:
    Error code_;
    char message_[MESSAGE_MAX];
};

#endif // STATUS_H
