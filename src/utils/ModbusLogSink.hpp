/**
 * @file ModbusLogSink.hpp
 * @brief Non-blocking log sink for MBCodec debug output
 * @note FreeRTOS targets: messages go through a queue drained by a low-priority
 *       task. Before the scheduler starts, and on hosted builds, messages are
 *       written synchronously.
 */

#pragma once

#include "core/ModbusTypes.hpp"

#ifndef MBCODEC_LOG_Q_SIZE // Log queue size (# of messages)
    #define MBCODEC_LOG_Q_SIZE 32
#endif
#ifndef MBCODEC_LOG_MAX_MSG_SIZE // Maximum length for a formatted debug message (including null terminator)
    #define MBCODEC_LOG_MAX_MSG_SIZE 256
#endif
#if MBCODEC_RTOS
    #ifndef MBCODEC_LOG_TASK_PRIORITY // Log task priority
        #define MBCODEC_LOG_TASK_PRIORITY tskIDLE_PRIORITY + 1
    #endif
    #ifndef MBCODEC_LOG_TASK_STACK_SIZE // Log task stack size (bytes)
        #define MBCODEC_LOG_TASK_STACK_SIZE BYTES_TO_STACK_SIZE(4096)
    #endif
#endif

namespace Modbus {

class LogSink {

public:
    static constexpr size_t QUEUE_SIZE = (size_t)MBCODEC_LOG_Q_SIZE;
    static constexpr size_t MAX_MSG_SIZE = (size_t)MBCODEC_LOG_MAX_MSG_SIZE;
    static constexpr uint32_t LOG_PRINT_TIMEOUT_MS = 500;
    #if MBCODEC_RTOS
    static constexpr UBaseType_t TASK_PRIORITY = (UBaseType_t)(MBCODEC_LOG_TASK_PRIORITY);
    static constexpr uint32_t STACK_SIZE = (uint32_t)(MBCODEC_LOG_TASK_STACK_SIZE);
    #endif

    struct LogMessage {
        char msg[MAX_MSG_SIZE];
    };

    // Ensure buffer is large enough for truncation logic
    static_assert(MAX_MSG_SIZE >= 8, "Log buffer size must be at least 8 bytes");

    // Creates the queue & drain task (RTOS targets, called automatically)
    static void begin();

    // WARNING: modifies the caller's buffer (line ending normalisation).
    // The buffer MUST be at least MAX_MSG_SIZE bytes.
    static void logln(char* buffer);

    // Wait for queued messages to be printed (no-op on hosted builds)
    static void waitQueueFlushed();

private:
    #if MBCODEC_RTOS
    static bool initialized;
    static QueueHandle_t logQueue;
    static TaskHandle_t logTaskHandle;

    static void logTask(void* parameter);
    #endif

    static void sendToQueue(const LogMessage& msg);

    // Write a message with retry on busy & timeout on no progress
    static void writeDirect(const char* msg);
};

} // namespace Modbus
