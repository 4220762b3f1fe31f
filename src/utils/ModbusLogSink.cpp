/**
 * @file ModbusLogSink.cpp
 * @brief Non-blocking log sink for MBCodec debug output
 */

#include "ModbusLogSink.hpp"
#include "ModbusDebug.hpp" // For printLog()

// Only debug builds print anything: printLog() stays unreferenced otherwise
#ifdef MBCODEC_DEBUG

namespace Modbus {

#if MBCODEC_RTOS

bool LogSink::initialized = false;
QueueHandle_t LogSink::logQueue = nullptr;
TaskHandle_t LogSink::logTaskHandle = nullptr;

/* @brief Initialize the log sink
 * @brief Creates the message queue and the logging task
 */
void LogSink::begin() {
    if (initialized) return;

    logQueue = xQueueCreate(QUEUE_SIZE, sizeof(LogMessage));
    if (!logQueue) return;

    BaseType_t taskCreated = xTaskCreate(
        logTask,
        "MBCodecLog",
        STACK_SIZE,
        NULL,
        TASK_PRIORITY,
        &logTaskHandle
    );

    if (taskCreated == pdPASS) {
        initialized = true;
    } else {
        vQueueDelete(logQueue);
        logQueue = nullptr;
    }
}

void LogSink::waitQueueFlushed() {
    if (xTaskGetSchedulerState() != taskSCHEDULER_RUNNING) return;
    while (initialized && uxQueueMessagesWaiting(logQueue) > 0) {
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    vTaskDelay(pdMS_TO_TICKS(10)); // Last message may still be printing
}

/* @brief Send a message to the queue
 * @note Never blocks: the message is discarded if the queue is full
 */
void LogSink::sendToQueue(const LogMessage& msg) {
    // If scheduler not started, use direct output
    if (xTaskGetSchedulerState() != taskSCHEDULER_RUNNING) {
        writeDirect(msg.msg);
        return;
    }

    if (!initialized) {
        begin();
        if (!initialized) return;
    }

    xQueueSend(logQueue, &msg, 0);
}

/* @brief Task that drains the queue through printLog()
 */
void LogSink::logTask(void*) {
    LogMessage msg;
    while (true) {
        if (xQueueReceive(logQueue, &msg, portMAX_DELAY) == pdTRUE) {
            writeDirect(msg.msg);
        }
        vTaskDelay(5); // Yield before processing next message
    }
}

#else // Hosted build: no scheduler, always synchronous

void LogSink::begin() {}

void LogSink::waitQueueFlushed() {}

void LogSink::sendToQueue(const LogMessage& msg) {
    writeDirect(msg.msg);
}

#endif // MBCODEC_RTOS

/* @brief Log a message with line ending
 * @param buffer The buffer to log, at least MAX_MSG_SIZE bytes
 * @note Strips any trailing CR/LF & appends exactly one "\r\n"
 *       (truncating the message if needed).
 */
void LogSink::logln(char* buffer) {
    LogMessage msg;

    if (buffer == nullptr || *buffer == '\0') {
        strcpy(msg.msg, "\r\n");
        sendToQueue(msg);
        return;
    }

    size_t len = strnlen(buffer, MAX_MSG_SIZE - 1);
    while (len > 0 && (buffer[len - 1] == '\r' || buffer[len - 1] == '\n')) {
        len--;
    }
    if (len > MAX_MSG_SIZE - 3) len = MAX_MSG_SIZE - 3;

    buffer[len] = '\r';
    buffer[len + 1] = '\n';
    buffer[len + 2] = '\0';

    memcpy(msg.msg, buffer, len + 3);
    sendToQueue(msg);
}

/* @brief Write a message through the user print function
 * @note -1 skips the message, 0 (busy) is retried until LOG_PRINT_TIMEOUT_MS
 *       elapses without progress, partial writes are resumed.
 */
void LogSink::writeDirect(const char* msg) {
    const char* ptr = msg;
    size_t remaining = strlen(msg);
    // TIME_US() does not depend on the scheduler tick
    uint64_t lastProgressUs = TIME_US();

    while (remaining > 0) {
        int result = Modbus::Debug::printLog(ptr, remaining);

        if (result < 0) break;

        if (result == 0) {
            if ((TIME_US() - lastProgressUs) / 1000 > LOG_PRINT_TIMEOUT_MS) break;
            #if MBCODEC_RTOS
            if (xTaskGetSchedulerState() == taskSCHEDULER_RUNNING) {
                vTaskDelay(pdMS_TO_TICKS(10));
            }
            #endif
            continue;
        }

        size_t written = static_cast<size_t>(result);
        if (written > remaining) break; // User function returned an invalid count
        ptr += written;
        remaining -= written;
        lastProgressUs = TIME_US();
    }
}

} // namespace Modbus

#endif // MBCODEC_DEBUG
