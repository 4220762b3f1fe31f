/**
 * @file ModbusCodec.cpp
 * @brief Modbus PDU codec implementation
 */

#include "ModbusCodec.hpp"

namespace ModbusCodec {

using namespace Modbus;

namespace {

// Diagnostics: fc + sub-function + N data words
constexpr size_t DIAG_HEADER_SIZE = 3;
// Get Comm Event Log: status + event count + message count
constexpr size_t EVENT_LOG_HEADER_SIZE = 6;
// Report Server ID: fc + byte count + ID bytes + run indicator
constexpr size_t MAX_SERVER_ID_SIZE = MAX_PDU_SIZE - 3;

bool pushRegisters(const Registers& regs, ByteBuffer& bytes) {
    for (uint16_t reg : regs) {
        if (!bytes.push_u16(reg)) return false;
    }
    return true;
}

void readRegisters(const ByteBuffer& bytes, size_t offset, size_t count, Registers& regs) {
    for (size_t i = 0; i < count; ++i) {
        regs.push_back(bytes.getU16(offset + 2 * i));
    }
}

} // namespace

// ===================================================================================
// VALIDATION
// ===================================================================================

Result PDU::validate(const Request& request) {
    if (!isValidFunctionCode(request.fc)) return Error(ERR_INVALID_FC, "request function code");

    switch (request.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
            if (!isValidRegisterCount(request.regCount, request.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "read quantity");
            }
            break;

        case WRITE_COIL:
            if (request.value > 1) return Error(ERR_INVALID_DATA, "coil value must be 0 or 1");
            break;

        case WRITE_MULTIPLE_COILS:
            if (!isValidRegisterCount((uint16_t)request.coils.size(), request.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "coil count");
            }
            break;

        case WRITE_MULTIPLE_REGISTERS:
            if (!isValidRegisterCount((uint16_t)request.registers.size(), request.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "register count");
            }
            break;

        case READ_WRITE_MULTIPLE_REGISTERS:
            if (!isValidRegisterCount(request.regCount, request.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "read quantity");
            }
            if (!isValidWriteCount((uint16_t)request.registers.size())) {
                return Error(ERR_INVALID_REG_COUNT, "write quantity");
            }
            break;

        default: // Fixed layouts & custom payloads always fit
            break;
    }
    return SUCCESS;
}

Result PDU::validate(const Response& response) {
    if (!isValidFunctionCode(response.fc)) return Error(ERR_INVALID_FC, "response function code");

    if (response.isException()) {
        if (!isValidExceptionCode(response.exceptionCode)) {
            return Error(ERR_INVALID_EXCEPTION, "unknown exception code");
        }
        return SUCCESS;
    }

    switch (response.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
            if (!isValidRegisterCount((uint16_t)response.coils.size(), response.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "coil count");
            }
            break;

        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case READ_WRITE_MULTIPLE_REGISTERS:
            if (!isValidRegisterCount((uint16_t)response.registers.size(), response.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "register count");
            }
            break;

        case WRITE_COIL:
            if (response.value > 1) return Error(ERR_INVALID_DATA, "coil value must be 0 or 1");
            break;

        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            if (!isValidRegisterCount(response.regCount, response.fc)) {
                return Error(ERR_INVALID_REG_COUNT, "written quantity");
            }
            break;

        case READ_EXCEPTION_STATUS:
            if (response.value > 0xFF) return Error(ERR_INVALID_DATA, "status is one byte");
            break;

        case GET_COMM_EVENT_LOG:
            if (response.raw.size() > MAX_COMM_EVENTS) return Error(ERR_INVALID_DATA, "too many events");
            break;

        case REPORT_SERVER_ID:
            if (response.raw.size() > MAX_SERVER_ID_SIZE) return Error(ERR_INVALID_DATA, "server ID too long");
            break;

        default:
            break;
    }
    return SUCCESS;
}

// ===================================================================================
// LENGTH
// ===================================================================================

size_t PDU::length(const Request& request) {
    switch (request.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case WRITE_COIL:
        case WRITE_REGISTER:
            return 5;
        case READ_EXCEPTION_STATUS:
        case GET_COMM_EVENT_COUNTER:
        case GET_COMM_EVENT_LOG:
        case REPORT_SERVER_ID:
            return 1;
        case DIAGNOSTICS:
            return DIAG_HEADER_SIZE + 2 * request.registers.size();
        case WRITE_MULTIPLE_COILS:
            return 6 + request.coils.packedSize();
        case WRITE_MULTIPLE_REGISTERS:
            return 6 + 2 * request.registers.size();
        case MASK_WRITE_REGISTER:
            return 7;
        case READ_WRITE_MULTIPLE_REGISTERS:
            return 10 + 2 * request.registers.size();
        default:
            return 1 + request.raw.size();
    }
}

size_t PDU::length(const Response& response) {
    if (response.isException()) return 2;

    switch (response.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
            return 2 + response.coils.packedSize();
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case READ_WRITE_MULTIPLE_REGISTERS:
            return 2 + 2 * response.registers.size();
        case WRITE_COIL:
        case WRITE_REGISTER:
        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
        case GET_COMM_EVENT_COUNTER:
            return 5;
        case READ_EXCEPTION_STATUS:
            return 2;
        case DIAGNOSTICS:
            return DIAG_HEADER_SIZE + 2 * response.registers.size();
        case GET_COMM_EVENT_LOG:
            return 2 + EVENT_LOG_HEADER_SIZE + response.raw.size();
        case REPORT_SERVER_ID:
            return 2 + response.raw.size() + 1;
        case MASK_WRITE_REGISTER:
            return 7;
        default:
            return 1 + response.raw.size();
    }
}

// ===================================================================================
// ENCODING
// ===================================================================================

Result PDU::encode(const Request& request, ByteBuffer& bytes) {
    Result res = validate(request);
    if (res != SUCCESS) return res;

    const size_t len = length(request);
    if (bytes.free_space() < len) return Error(ERR_BUFFER_TOO_SMALL, "request PDU does not fit");

    const size_t start = bytes.size();
    if (!writeRequest(request, bytes) || bytes.size() - start != len) {
        bytes.trim(start);
        return Error(ERR_BUFFER_TOO_SMALL, "request PDU write");
    }
    return SUCCESS;
}

Result PDU::encode(const Response& response, ByteBuffer& bytes) {
    Result res = validate(response);
    if (res != SUCCESS) return res;

    const size_t len = length(response);
    if (bytes.free_space() < len) return Error(ERR_BUFFER_TOO_SMALL, "response PDU does not fit");

    const size_t start = bytes.size();
    if (!writeResponse(response, bytes) || bytes.size() - start != len) {
        bytes.trim(start);
        return Error(ERR_BUFFER_TOO_SMALL, "response PDU write");
    }
    return SUCCESS;
}

bool PDU::writeRequest(const Request& request, ByteBuffer& bytes) {
    if (!bytes.push_back((uint8_t)request.fc)) return false;

    switch (request.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16(request.regCount);

        case WRITE_COIL:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16(request.value ? COIL_ON : COIL_OFF);

        case WRITE_REGISTER:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16(request.value);

        case READ_EXCEPTION_STATUS:
        case GET_COMM_EVENT_COUNTER:
        case GET_COMM_EVENT_LOG:
        case REPORT_SERVER_ID:
            return true;

        case DIAGNOSTICS:
            return bytes.push_u16(request.subFunction)
                && pushRegisters(request.registers, bytes);

        case WRITE_MULTIPLE_COILS:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16((uint16_t)request.coils.size())
                && bytes.push_back((uint8_t)request.coils.packedSize())
                && bytes.push_back(request.coils.packed(), request.coils.packedSize());

        case WRITE_MULTIPLE_REGISTERS:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16((uint16_t)request.registers.size())
                && bytes.push_back((uint8_t)(request.registers.size() * 2))
                && pushRegisters(request.registers, bytes);

        case MASK_WRITE_REGISTER:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16(request.andMask)
                && bytes.push_u16(request.orMask);

        case READ_WRITE_MULTIPLE_REGISTERS:
            return bytes.push_u16(request.regAddress)
                && bytes.push_u16(request.regCount)
                && bytes.push_u16(request.writeAddress)
                && bytes.push_u16((uint16_t)request.registers.size())
                && bytes.push_back((uint8_t)(request.registers.size() * 2))
                && pushRegisters(request.registers, bytes);

        default: // Custom function
            return bytes.push_back(request.raw.data(), request.raw.size());
    }
}

bool PDU::writeResponse(const Response& response, ByteBuffer& bytes) {
    if (response.isException()) {
        return bytes.push_back((uint8_t)(response.fc | EXCEPTION_FLAG))
            && bytes.push_back((uint8_t)response.exceptionCode);
    }

    if (!bytes.push_back((uint8_t)response.fc)) return false;

    switch (response.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
            return bytes.push_back((uint8_t)response.coils.packedSize())
                && bytes.push_back(response.coils.packed(), response.coils.packedSize());

        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case READ_WRITE_MULTIPLE_REGISTERS:
            return bytes.push_back((uint8_t)(response.registers.size() * 2))
                && pushRegisters(response.registers, bytes);

        case WRITE_COIL:
            return bytes.push_u16(response.regAddress)
                && bytes.push_u16(response.value ? COIL_ON : COIL_OFF);

        case WRITE_REGISTER:
            return bytes.push_u16(response.regAddress)
                && bytes.push_u16(response.value);

        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            return bytes.push_u16(response.regAddress)
                && bytes.push_u16(response.regCount);

        case READ_EXCEPTION_STATUS:
            return bytes.push_back((uint8_t)response.value);

        case DIAGNOSTICS:
            return bytes.push_u16(response.subFunction)
                && pushRegisters(response.registers, bytes);

        case GET_COMM_EVENT_COUNTER:
            return bytes.push_u16(response.status)
                && bytes.push_u16(response.eventCount);

        case GET_COMM_EVENT_LOG:
            return bytes.push_back((uint8_t)(EVENT_LOG_HEADER_SIZE + response.raw.size()))
                && bytes.push_u16(response.status)
                && bytes.push_u16(response.eventCount)
                && bytes.push_u16(response.messageCount)
                && bytes.push_back(response.raw.data(), response.raw.size());

        case REPORT_SERVER_ID:
            return bytes.push_back((uint8_t)(response.raw.size() + 1))
                && bytes.push_back(response.raw.data(), response.raw.size())
                && bytes.push_back(response.runIndicator ? RUN_INDICATOR_ON : RUN_INDICATOR_OFF);

        case MASK_WRITE_REGISTER:
            return bytes.push_u16(response.regAddress)
                && bytes.push_u16(response.andMask)
                && bytes.push_u16(response.orMask);

        default: // Custom function
            return bytes.push_back(response.raw.data(), response.raw.size());
    }
}

// ===================================================================================
// DECODING
// ===================================================================================

Result PDU::decode(const ByteBuffer& bytes, Request& request) {
    request.clear();

    const size_t size = bytes.size();
    if (size < MIN_PDU_SIZE) return HandleError(request, ERR_INVALID_LEN, "empty PDU");
    if (size > MAX_PDU_SIZE) return HandleError(request, ERR_INVALID_LEN, "PDU too long");

    const uint8_t fc = bytes[0];
    if (!isValidFunctionCode(fc)) return HandleError(request, ERR_INVALID_FC, "request function code");
    request.fc = (FunctionCode)fc;

    switch (request.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
            if (size != 5) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            request.regCount = bytes.getU16(3);
            if (!isValidRegisterCount(request.regCount, fc)) {
                return HandleError(request, ERR_INVALID_REG_COUNT, "read quantity");
            }
            break;

        case WRITE_COIL: {
            if (size != 5) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            const uint16_t value = bytes.getU16(3);
            if (value != COIL_ON && value != COIL_OFF) {
                return HandleError(request, ERR_INVALID_DATA, "coil value must be 0xFF00 or 0x0000");
            }
            request.value = (value == COIL_ON) ? 1 : 0;
            break;
        }

        case WRITE_REGISTER:
            if (size != 5) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            request.value = bytes.getU16(3);
            break;

        case READ_EXCEPTION_STATUS:
        case GET_COMM_EVENT_COUNTER:
        case GET_COMM_EVENT_LOG:
        case REPORT_SERVER_ID:
            if (size != 1) return HandleError(request, ERR_INVALID_LEN);
            break;

        case DIAGNOSTICS:
            if (size < DIAG_HEADER_SIZE || (size - DIAG_HEADER_SIZE) % 2 != 0) {
                return HandleError(request, ERR_INVALID_LEN, "diagnostics data must be whole words");
            }
            request.subFunction = bytes.getU16(1);
            readRegisters(bytes, DIAG_HEADER_SIZE, (size - DIAG_HEADER_SIZE) / 2, request.registers);
            break;

        case WRITE_MULTIPLE_COILS: {
            if (size < 6) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            const uint16_t qty = bytes.getU16(3);
            if (!isValidRegisterCount(qty, fc)) return HandleError(request, ERR_INVALID_REG_COUNT, "coil count");
            const uint8_t byteCount = bytes[5];
            if (byteCount != packedCoilsSize(qty)) {
                return HandleError(request, ERR_INVALID_BYTE_COUNT, "byte count does not match coil count");
            }
            if (size != 6u + byteCount) return HandleError(request, ERR_INVALID_LEN);
            request.coils.assignPacked(bytes.data() + 6, qty);
            break;
        }

        case WRITE_MULTIPLE_REGISTERS: {
            if (size < 6) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            const uint16_t qty = bytes.getU16(3);
            if (!isValidRegisterCount(qty, fc)) return HandleError(request, ERR_INVALID_REG_COUNT, "register count");
            const uint8_t byteCount = bytes[5];
            if (byteCount != qty * 2) {
                return HandleError(request, ERR_INVALID_BYTE_COUNT, "byte count does not match register count");
            }
            if (size != 6u + byteCount) return HandleError(request, ERR_INVALID_LEN);
            readRegisters(bytes, 6, qty, request.registers);
            break;
        }

        case MASK_WRITE_REGISTER:
            if (size != 7) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            request.andMask = bytes.getU16(3);
            request.orMask = bytes.getU16(5);
            break;

        case READ_WRITE_MULTIPLE_REGISTERS: {
            if (size < 10) return HandleError(request, ERR_INVALID_LEN);
            request.regAddress = bytes.getU16(1);
            request.regCount = bytes.getU16(3);
            request.writeAddress = bytes.getU16(5);
            const uint16_t writeQty = bytes.getU16(7);
            if (!isValidRegisterCount(request.regCount, fc)) {
                return HandleError(request, ERR_INVALID_REG_COUNT, "read quantity");
            }
            if (!isValidWriteCount(writeQty)) return HandleError(request, ERR_INVALID_REG_COUNT, "write quantity");
            const uint8_t byteCount = bytes[9];
            if (byteCount != writeQty * 2) {
                return HandleError(request, ERR_INVALID_BYTE_COUNT, "byte count does not match write quantity");
            }
            if (size != 10u + byteCount) return HandleError(request, ERR_INVALID_LEN);
            readRegisters(bytes, 10, writeQty, request.registers);
            break;
        }

        default: // Custom function: opaque payload
            request.raw.assign(bytes.data() + 1, size - 1);
            break;
    }

    return SUCCESS;
}

Result PDU::decode(const ByteBuffer& bytes, Response& response) {
    response.clear();

    const size_t size = bytes.size();
    if (size < MIN_PDU_SIZE) return HandleError(response, ERR_INVALID_LEN, "empty PDU");
    if (size > MAX_PDU_SIZE) return HandleError(response, ERR_INVALID_LEN, "PDU too long");

    uint8_t fc = bytes[0];

    if (fc & EXCEPTION_FLAG) {
        if (size != 2) return HandleError(response, ERR_INVALID_LEN, "exception PDU is 2 bytes");
        fc &= (uint8_t)~EXCEPTION_FLAG;
        if (!isValidFunctionCode(fc)) return HandleError(response, ERR_INVALID_FC);
        if (!isValidExceptionCode(bytes[1])) {
            return HandleError(response, ERR_INVALID_EXCEPTION, "unknown exception code");
        }
        response.fc = (FunctionCode)fc;
        response.exceptionCode = (ExceptionCode)bytes[1];
        return SUCCESS;
    }

    if (!isValidFunctionCode(fc)) return HandleError(response, ERR_INVALID_FC, "response function code");
    response.fc = (FunctionCode)fc;

    switch (response.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS: {
            if (size < 2) return HandleError(response, ERR_INVALID_LEN);
            const uint8_t byteCount = bytes[1];
            if (byteCount == 0 || byteCount > COILS_CAPACITY_BYTES) {
                return HandleError(response, ERR_INVALID_BYTE_COUNT, "coil byte count");
            }
            if (size != 2u + byteCount) return HandleError(response, ERR_INVALID_LEN);
            // The coil count is not on the wire: every packed bit is returned
            response.coils.assignPacked(bytes.data() + 2, (size_t)byteCount * 8);
            break;
        }

        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case READ_WRITE_MULTIPLE_REGISTERS: {
            if (size < 2) return HandleError(response, ERR_INVALID_LEN);
            const uint8_t byteCount = bytes[1];
            if (byteCount == 0 || byteCount % 2 != 0 || byteCount / 2 > MAX_REGISTERS_READ) {
                return HandleError(response, ERR_INVALID_BYTE_COUNT, "register byte count");
            }
            if (size != 2u + byteCount) return HandleError(response, ERR_INVALID_LEN);
            readRegisters(bytes, 2, byteCount / 2, response.registers);
            break;
        }

        case WRITE_COIL: {
            if (size != 5) return HandleError(response, ERR_INVALID_LEN);
            response.regAddress = bytes.getU16(1);
            const uint16_t value = bytes.getU16(3);
            if (value != COIL_ON && value != COIL_OFF) {
                return HandleError(response, ERR_INVALID_DATA, "coil value must be 0xFF00 or 0x0000");
            }
            response.value = (value == COIL_ON) ? 1 : 0;
            break;
        }

        case WRITE_REGISTER:
            if (size != 5) return HandleError(response, ERR_INVALID_LEN);
            response.regAddress = bytes.getU16(1);
            response.value = bytes.getU16(3);
            break;

        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            if (size != 5) return HandleError(response, ERR_INVALID_LEN);
            response.regAddress = bytes.getU16(1);
            response.regCount = bytes.getU16(3);
            if (!isValidRegisterCount(response.regCount, fc)) {
                return HandleError(response, ERR_INVALID_REG_COUNT, "written quantity");
            }
            break;

        case READ_EXCEPTION_STATUS:
            if (size != 2) return HandleError(response, ERR_INVALID_LEN);
            response.value = bytes[1];
            break;

        case DIAGNOSTICS:
            if (size < DIAG_HEADER_SIZE || (size - DIAG_HEADER_SIZE) % 2 != 0) {
                return HandleError(response, ERR_INVALID_LEN, "diagnostics data must be whole words");
            }
            response.subFunction = bytes.getU16(1);
            readRegisters(bytes, DIAG_HEADER_SIZE, (size - DIAG_HEADER_SIZE) / 2, response.registers);
            break;

        case GET_COMM_EVENT_COUNTER:
            if (size != 5) return HandleError(response, ERR_INVALID_LEN);
            response.status = bytes.getU16(1);
            response.eventCount = bytes.getU16(3);
            break;

        case GET_COMM_EVENT_LOG: {
            if (size < 2) return HandleError(response, ERR_INVALID_LEN);
            const uint8_t byteCount = bytes[1];
            if (byteCount < EVENT_LOG_HEADER_SIZE || byteCount - EVENT_LOG_HEADER_SIZE > MAX_COMM_EVENTS) {
                return HandleError(response, ERR_INVALID_BYTE_COUNT, "event log byte count");
            }
            if (size != 2u + byteCount) return HandleError(response, ERR_INVALID_LEN);
            response.status = bytes.getU16(2);
            response.eventCount = bytes.getU16(4);
            response.messageCount = bytes.getU16(6);
            response.raw.assign(bytes.data() + 2 + EVENT_LOG_HEADER_SIZE, byteCount - EVENT_LOG_HEADER_SIZE);
            break;
        }

        case REPORT_SERVER_ID: {
            if (size < 2) return HandleError(response, ERR_INVALID_LEN);
            const uint8_t byteCount = bytes[1];
            if (byteCount == 0) return HandleError(response, ERR_INVALID_BYTE_COUNT, "missing run indicator");
            if (size != 2u + byteCount) return HandleError(response, ERR_INVALID_LEN);
            const uint8_t run = bytes[1 + byteCount];
            if (run != RUN_INDICATOR_ON && run != RUN_INDICATOR_OFF) {
                return HandleError(response, ERR_INVALID_DATA, "run indicator must be 0x00 or 0xFF");
            }
            response.raw.assign(bytes.data() + 2, byteCount - 1);
            response.runIndicator = (run == RUN_INDICATOR_ON);
            break;
        }

        case MASK_WRITE_REGISTER:
            if (size != 7) return HandleError(response, ERR_INVALID_LEN);
            response.regAddress = bytes.getU16(1);
            response.andMask = bytes.getU16(3);
            response.orMask = bytes.getU16(5);
            break;

        default: // Custom function: opaque payload
            response.raw.assign(bytes.data() + 1, size - 1);
            break;
    }

    return SUCCESS;
}

} // namespace ModbusCodec
