/**
 * @file ModbusFrame.hpp
 * @brief Modbus request & response values
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusData.hpp"

namespace Modbus {

/* @brief Modbus request, transport-independent
 * @note The function code selects which fields are meaningful:
 *   - READ_COILS / READ_DISCRETE_INPUTS / READ_*_REGISTERS: regAddress, regCount
 *   - WRITE_COIL: regAddress, value (0 = OFF, 1 = ON)
 *   - WRITE_REGISTER: regAddress, value
 *   - WRITE_MULTIPLE_COILS: regAddress, coils
 *   - WRITE_MULTIPLE_REGISTERS: regAddress, registers
 *   - DIAGNOSTICS: subFunction, registers (data words)
 *   - MASK_WRITE_REGISTER: regAddress, andMask, orMask
 *   - READ_WRITE_MULTIPLE_REGISTERS: regAddress & regCount (read part),
 *     writeAddress & registers (write part)
 *   - READ_EXCEPTION_STATUS / GET_COMM_EVENT_* / REPORT_SERVER_ID: no fields
 *   - custom codes: raw (payload after the function code)
 * @note Unused fields stay at their default value so that == is meaningful.
 */
struct Request {
    FunctionCode fc = NULL_FC;
    uint16_t regAddress = 0;
    uint16_t regCount = 0;
    uint16_t value = 0;
    uint16_t subFunction = 0;
    uint16_t andMask = 0;
    uint16_t orMask = 0;
    uint16_t writeAddress = 0;
    Registers registers;
    Coils coils;
    Bytes raw;

    void clear() { *this = Request(); }

    bool operator==(const Request& other) const {
        return fc == other.fc
            && regAddress == other.regAddress
            && regCount == other.regCount
            && value == other.value
            && subFunction == other.subFunction
            && andMask == other.andMask
            && orMask == other.orMask
            && writeAddress == other.writeAddress
            && registers == other.registers
            && coils == other.coils
            && raw == other.raw;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }

    // Named constructors, one per function code

    static Request readCoils(uint16_t address, uint16_t quantity) {
        return makeRead(READ_COILS, address, quantity);
    }
    static Request readDiscreteInputs(uint16_t address, uint16_t quantity) {
        return makeRead(READ_DISCRETE_INPUTS, address, quantity);
    }
    static Request readHoldingRegisters(uint16_t address, uint16_t quantity) {
        return makeRead(READ_HOLDING_REGISTERS, address, quantity);
    }
    static Request readInputRegisters(uint16_t address, uint16_t quantity) {
        return makeRead(READ_INPUT_REGISTERS, address, quantity);
    }
    static Request writeCoil(uint16_t address, bool state) {
        Request r;
        r.fc = WRITE_COIL;
        r.regAddress = address;
        r.value = state ? 1 : 0;
        return r;
    }
    static Request writeRegister(uint16_t address, uint16_t value) {
        Request r;
        r.fc = WRITE_REGISTER;
        r.regAddress = address;
        r.value = value;
        return r;
    }
    static Request writeMultipleCoils(uint16_t address, const Coils& coils) {
        Request r;
        r.fc = WRITE_MULTIPLE_COILS;
        r.regAddress = address;
        r.coils = coils;
        return r;
    }
    static Request writeMultipleRegisters(uint16_t address, const Registers& registers) {
        Request r;
        r.fc = WRITE_MULTIPLE_REGISTERS;
        r.regAddress = address;
        r.registers = registers;
        return r;
    }
    static Request maskWriteRegister(uint16_t address, uint16_t andMask, uint16_t orMask) {
        Request r;
        r.fc = MASK_WRITE_REGISTER;
        r.regAddress = address;
        r.andMask = andMask;
        r.orMask = orMask;
        return r;
    }
    static Request readWriteMultipleRegisters(uint16_t readAddress, uint16_t readQuantity,
                                              uint16_t writeAddress, const Registers& registers) {
        Request r;
        r.fc = READ_WRITE_MULTIPLE_REGISTERS;
        r.regAddress = readAddress;
        r.regCount = readQuantity;
        r.writeAddress = writeAddress;
        r.registers = registers;
        return r;
    }
    static Request diagnostics(uint16_t subFunction, const Registers& data) {
        Request r;
        r.fc = DIAGNOSTICS;
        r.subFunction = subFunction;
        r.registers = data;
        return r;
    }
    // READ_EXCEPTION_STATUS, GET_COMM_EVENT_COUNTER, GET_COMM_EVENT_LOG, REPORT_SERVER_ID
    static Request noPayload(FunctionCode fc) {
        Request r;
        r.fc = fc;
        return r;
    }
    static Request custom(FunctionCode fc, const uint8_t* payload, size_t len) {
        Request r;
        r.fc = fc;
        // Oversized payload: NULL_FC makes the request fail validation
        if (!r.raw.assign(payload, len)) r.fc = NULL_FC;
        return r;
    }

private:
    static Request makeRead(FunctionCode fc, uint16_t address, uint16_t quantity) {
        Request r;
        r.fc = fc;
        r.regAddress = address;
        r.regCount = quantity;
        return r;
    }
};

/* @brief Modbus response, transport-independent
 * @note A non-null exceptionCode makes this an exception response: only
 *       fc (the original function code, without the 0x80 flag) is then meaningful.
 * @note Otherwise the function code selects the fields:
 *   - READ_COILS / READ_DISCRETE_INPUTS: coils
 *   - READ_*_REGISTERS / READ_WRITE_MULTIPLE_REGISTERS: registers
 *   - WRITE_COIL: regAddress, value (0 = OFF, 1 = ON)
 *   - WRITE_REGISTER: regAddress, value
 *   - WRITE_MULTIPLE_COILS / WRITE_MULTIPLE_REGISTERS: regAddress, regCount
 *   - READ_EXCEPTION_STATUS: value (8-bit status)
 *   - DIAGNOSTICS: subFunction, registers (echoed data words)
 *   - GET_COMM_EVENT_COUNTER: status, eventCount
 *   - GET_COMM_EVENT_LOG: status, eventCount, messageCount, raw (events)
 *   - REPORT_SERVER_ID: raw (server ID bytes), runIndicator
 *   - MASK_WRITE_REGISTER: regAddress, andMask, orMask
 *   - custom codes: raw
 */
struct Response {
    FunctionCode fc = NULL_FC;
    ExceptionCode exceptionCode = NULL_EXCEPTION;
    uint16_t regAddress = 0;
    uint16_t regCount = 0;
    uint16_t value = 0;
    uint16_t subFunction = 0;
    uint16_t andMask = 0;
    uint16_t orMask = 0;
    uint16_t status = 0;
    uint16_t eventCount = 0;
    uint16_t messageCount = 0;
    bool runIndicator = false;
    Registers registers;
    Coils coils;
    Bytes raw;

    bool isException() const { return exceptionCode != NULL_EXCEPTION; }

    void clear() { *this = Response(); }

    bool operator==(const Response& other) const {
        return fc == other.fc
            && exceptionCode == other.exceptionCode
            && regAddress == other.regAddress
            && regCount == other.regCount
            && value == other.value
            && subFunction == other.subFunction
            && andMask == other.andMask
            && orMask == other.orMask
            && status == other.status
            && eventCount == other.eventCount
            && messageCount == other.messageCount
            && runIndicator == other.runIndicator
            && registers == other.registers
            && coils == other.coils
            && raw == other.raw;
    }
    bool operator!=(const Response& other) const { return !(*this == other); }

    static Response exception(FunctionCode fc, ExceptionCode ec) {
        Response r;
        r.fc = fc;
        r.exceptionCode = ec;
        return r;
    }
};

/* @brief Build the exception response answering a request
 * @param request The request that could not be served
 * @param ec The exception code to report
 * @return The exception response
 */
inline Response makeException(const Request& request, ExceptionCode ec) {
    return Response::exception(request.fc, ec);
}

/* @brief Build the normal "echo" part of a response from its request
 * @note Fills the fields a response copies from its request (write echoes,
 *       mask write, diagnostics). Read payloads are left for the caller.
 */
inline Response makeResponse(const Request& request) {
    Response r;
    r.fc = request.fc;
    switch (request.fc) {
        case WRITE_COIL:
        case WRITE_REGISTER:
            r.regAddress = request.regAddress;
            r.value = request.value;
            break;
        case WRITE_MULTIPLE_COILS:
            r.regAddress = request.regAddress;
            r.regCount = (uint16_t)request.coils.size();
            break;
        case WRITE_MULTIPLE_REGISTERS:
            r.regAddress = request.regAddress;
            r.regCount = (uint16_t)request.registers.size();
            break;
        case MASK_WRITE_REGISTER:
            r.regAddress = request.regAddress;
            r.andMask = request.andMask;
            r.orMask = request.orMask;
            break;
        case DIAGNOSTICS:
            r.subFunction = request.subFunction;
            r.registers = request.registers;
            break;
        default:
            break;
    }
    return r;
}

/* @brief Byte range [start, end) of a decoded frame inside the caller's buffer
 * @note Plain offsets: only meaningful against the buffer that was decoded.
 */
struct FrameLocation {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end - start; }
    bool operator==(const FrameLocation& other) const {
        return start == other.start && end == other.end;
    }
};

} // namespace Modbus
