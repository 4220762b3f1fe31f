/**
 * @file ModbusCore.h
 * @brief Modbus protocol enums, limits & their string names
 */

#pragma once

#include "core/ModbusTypes.hpp"

namespace Modbus {

// ===================================================================================
// PROTOCOL LIMITS
// ===================================================================================

    // PDU = function code + up to 252 bytes of payload
    constexpr size_t MAX_PDU_SIZE = 253;
    constexpr size_t MIN_PDU_SIZE = 1;
    constexpr size_t MAX_PDU_DATA_SIZE = MAX_PDU_SIZE - 1;

    // Largest ADU over any transport (MBAP header + PDU)
    constexpr size_t MAX_FRAME_SIZE = 7 + MAX_PDU_SIZE;

    constexpr uint16_t MAX_COILS_READ = 2000;
    constexpr uint16_t MAX_COILS_WRITE = 1968;
    constexpr uint16_t MAX_REGISTERS_READ = 125;
    constexpr uint16_t MAX_REGISTERS_WRITE = 123;
    constexpr uint16_t MAX_RW_REGISTERS_READ = 125;
    constexpr uint16_t MAX_RW_REGISTERS_WRITE = 121;
    constexpr uint16_t MAX_COMM_EVENTS = 64;
    constexpr uint16_t MAX_REG_ADDR = 0xFFFF;

    // Values of a single coil on the wire (WRITE_COIL)
    constexpr uint16_t COIL_ON = 0xFF00;
    constexpr uint16_t COIL_OFF = 0x0000;

    // Run indicator of a REPORT_SERVER_ID response
    constexpr uint8_t RUN_INDICATOR_ON = 0xFF;
    constexpr uint8_t RUN_INDICATOR_OFF = 0x00;

    constexpr uint8_t EXCEPTION_FLAG = 0x80;

// ===================================================================================
// FUNCTION CODES
// ===================================================================================

    // Codes without an enumerator are still legal "custom" functions
    // as long as they stay in the 0x01..0x7F range.
    enum FunctionCode : uint8_t {
        NULL_FC                       = 0x00,
        READ_COILS                    = 0x01,
        READ_DISCRETE_INPUTS          = 0x02,
        READ_HOLDING_REGISTERS        = 0x03,
        READ_INPUT_REGISTERS          = 0x04,
        WRITE_COIL                    = 0x05,
        WRITE_REGISTER                = 0x06,
        READ_EXCEPTION_STATUS         = 0x07,
        DIAGNOSTICS                   = 0x08,
        GET_COMM_EVENT_COUNTER        = 0x0B,
        GET_COMM_EVENT_LOG            = 0x0C,
        WRITE_MULTIPLE_COILS          = 0x0F,
        WRITE_MULTIPLE_REGISTERS      = 0x10,
        REPORT_SERVER_ID              = 0x11,
        MASK_WRITE_REGISTER           = 0x16,
        READ_WRITE_MULTIPLE_REGISTERS = 0x17,
        // No dedicated layout: carried as raw payload, delimited by the RTU length tables
        READ_FIFO_QUEUE               = 0x18
    };

    static constexpr const char* toString(const FunctionCode fc) {
        switch (fc) {
            case NULL_FC: return "NULL";
            case READ_COILS: return "READ_COILS";
            case READ_DISCRETE_INPUTS: return "READ_DISCRETE_INPUTS";
            case READ_HOLDING_REGISTERS: return "READ_HOLDING_REGISTERS";
            case READ_INPUT_REGISTERS: return "READ_INPUT_REGISTERS";
            case WRITE_COIL: return "WRITE_COIL";
            case WRITE_REGISTER: return "WRITE_REGISTER";
            case READ_EXCEPTION_STATUS: return "READ_EXCEPTION_STATUS";
            case DIAGNOSTICS: return "DIAGNOSTICS";
            case GET_COMM_EVENT_COUNTER: return "GET_COMM_EVENT_COUNTER";
            case GET_COMM_EVENT_LOG: return "GET_COMM_EVENT_LOG";
            case WRITE_MULTIPLE_COILS: return "WRITE_MULTIPLE_COILS";
            case WRITE_MULTIPLE_REGISTERS: return "WRITE_MULTIPLE_REGISTERS";
            case REPORT_SERVER_ID: return "REPORT_SERVER_ID";
            case MASK_WRITE_REGISTER: return "MASK_WRITE_REGISTER";
            case READ_WRITE_MULTIPLE_REGISTERS: return "READ_WRITE_MULTIPLE_REGISTERS";
            case READ_FIFO_QUEUE: return "READ_FIFO_QUEUE";
            default: return "CUSTOM";
        }
    }

    /* @brief Check if a function code is one of the standard codes handled by the codec
     * @param fc The function code to check
     * @return true if the function code has a dedicated payload layout
     */
    static constexpr bool isValid(const FunctionCode fc) {
        switch (fc) {
            case READ_COILS:
            case READ_DISCRETE_INPUTS:
            case READ_HOLDING_REGISTERS:
            case READ_INPUT_REGISTERS:
            case WRITE_COIL:
            case WRITE_REGISTER:
            case READ_EXCEPTION_STATUS:
            case DIAGNOSTICS:
            case GET_COMM_EVENT_COUNTER:
            case GET_COMM_EVENT_LOG:
            case WRITE_MULTIPLE_COILS:
            case WRITE_MULTIPLE_REGISTERS:
            case REPORT_SERVER_ID:
            case MASK_WRITE_REGISTER:
            case READ_WRITE_MULTIPLE_REGISTERS:
                return true;
            default:
                return false;
        }
    }

    /* @brief Check if a function code is a user-defined (custom) code
     * @note Custom codes are carried as opaque payload bytes
     */
    static constexpr bool isCustom(const FunctionCode fc) {
        return fc != NULL_FC && (uint8_t)fc < EXCEPTION_FLAG && !isValid(fc);
    }

    // Functions whose response carries data: never executed on a broadcast request
    static constexpr bool isReadFunction(const FunctionCode fc) {
        switch (fc) {
            case READ_COILS:
            case READ_DISCRETE_INPUTS:
            case READ_HOLDING_REGISTERS:
            case READ_INPUT_REGISTERS:
            case READ_EXCEPTION_STATUS:
            case GET_COMM_EVENT_COUNTER:
            case GET_COMM_EVENT_LOG:
            case REPORT_SERVER_ID:
            case READ_WRITE_MULTIPLE_REGISTERS:
            case READ_FIFO_QUEUE:
                return true;
            default:
                return false;
        }
    }

// ===================================================================================
// EXCEPTION CODES
// ===================================================================================

    enum ExceptionCode : uint8_t {
        NULL_EXCEPTION                          = 0x00,
        ILLEGAL_FUNCTION                        = 0x01,
        ILLEGAL_DATA_ADDRESS                    = 0x02,
        ILLEGAL_DATA_VALUE                      = 0x03,
        SLAVE_DEVICE_FAILURE                    = 0x04,
        ACKNOWLEDGE                             = 0x05,
        SLAVE_DEVICE_BUSY                       = 0x06,
        NEGATIVE_ACKNOWLEDGE                    = 0x07,
        MEMORY_PARITY_ERROR                     = 0x08,
        GATEWAY_PATH_UNAVAILABLE                = 0x0A,
        GATEWAY_TARGET_DEVICE_FAILED_TO_RESPOND = 0x0B
    };

    static constexpr const char* toString(const ExceptionCode ec) {
        switch (ec) {
            case NULL_EXCEPTION: return "no exception";
            case ILLEGAL_FUNCTION: return "illegal function";
            case ILLEGAL_DATA_ADDRESS: return "illegal data address";
            case ILLEGAL_DATA_VALUE: return "illegal data value";
            case SLAVE_DEVICE_FAILURE: return "slave device failure";
            case ACKNOWLEDGE: return "acknowledge";
            case SLAVE_DEVICE_BUSY: return "slave device busy";
            case NEGATIVE_ACKNOWLEDGE: return "negative acknowledge";
            case MEMORY_PARITY_ERROR: return "memory parity error";
            case GATEWAY_PATH_UNAVAILABLE: return "gateway path unavailable";
            case GATEWAY_TARGET_DEVICE_FAILED_TO_RESPOND: return "gateway target device failed to respond";
            default: return "unknown exception";
        }
    }

    // NULL_EXCEPTION is not a valid exception code on the wire
    static constexpr bool isValid(const ExceptionCode ec) {
        switch (ec) {
            case ILLEGAL_FUNCTION:
            case ILLEGAL_DATA_ADDRESS:
            case ILLEGAL_DATA_VALUE:
            case SLAVE_DEVICE_FAILURE:
            case ACKNOWLEDGE:
            case SLAVE_DEVICE_BUSY:
            case NEGATIVE_ACKNOWLEDGE:
            case MEMORY_PARITY_ERROR:
            case GATEWAY_PATH_UNAVAILABLE:
            case GATEWAY_TARGET_DEVICE_FAILED_TO_RESPOND:
                return true;
            default:
                return false;
        }
    }

// ===================================================================================
// REGISTER BYTE ORDER
// ===================================================================================

    // A = most significant byte of the value
    enum class ByteOrder : uint8_t {
        ABCD,   // 32-bit big endian
        CDAB,   // 32-bit word swap
        BADC,   // 32-bit byte swap
        DCBA,   // 32-bit little endian
        AB,     // 16-bit big endian
        BA      // 16-bit little endian
    };

} // namespace Modbus
