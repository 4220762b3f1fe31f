/**
 * @file ModbusCodecRTU.cpp
 * @brief Modbus RTU framing: address + PDU + CRC16
 */

#include "ModbusCodec.hpp"

namespace ModbusCodec {

using namespace Modbus;

// CRC-16/MODBUS (reflected polynomial 0xA001) lookup table
const uint16_t RTU::CRC16_TABLE[256] = {
    0x0000, 0xC0C1, 0xC181, 0x0140, 0xC301, 0x03C0, 0x0280, 0xC241,
    0xC601, 0x06C0, 0x0780, 0xC741, 0x0500, 0xC5C1, 0xC481, 0x0440,
    0xCC01, 0x0CC0, 0x0D80, 0xCD41, 0x0F00, 0xCFC1, 0xCE81, 0x0E40,
    0x0A00, 0xCAC1, 0xCB81, 0x0B40, 0xC901, 0x09C0, 0x0880, 0xC841,
    0xD801, 0x18C0, 0x1980, 0xD941, 0x1B00, 0xDBC1, 0xDA81, 0x1A40,
    0x1E00, 0xDEC1, 0xDF81, 0x1F40, 0xDD01, 0x1DC0, 0x1C80, 0xDC41,
    0x1400, 0xD4C1, 0xD581, 0x1540, 0xD701, 0x17C0, 0x1680, 0xD641,
    0xD201, 0x12C0, 0x1380, 0xD341, 0x1100, 0xD1C1, 0xD081, 0x1040,
    0xF001, 0x30C0, 0x3180, 0xF141, 0x3300, 0xF3C1, 0xF281, 0x3240,
    0x3600, 0xF6C1, 0xF781, 0x3740, 0xF501, 0x35C0, 0x3480, 0xF441,
    0x3C00, 0xFCC1, 0xFD81, 0x3D40, 0xFF01, 0x3FC0, 0x3E80, 0xFE41,
    0xFA01, 0x3AC0, 0x3B80, 0xFB41, 0x3900, 0xF9C1, 0xF881, 0x3840,
    0x2800, 0xE8C1, 0xE981, 0x2940, 0xEB01, 0x2BC0, 0x2A80, 0xEA41,
    0xEE01, 0x2EC0, 0x2F80, 0xEF41, 0x2D00, 0xEDC1, 0xEC81, 0x2C40,
    0xE401, 0x24C0, 0x2580, 0xE541, 0x2700, 0xE7C1, 0xE681, 0x2640,
    0x2200, 0xE2C1, 0xE381, 0x2340, 0xE101, 0x21C0, 0x2080, 0xE041,
    0xA001, 0x60C0, 0x6180, 0xA141, 0x6300, 0xA3C1, 0xA281, 0x6240,
    0x6600, 0xA6C1, 0xA781, 0x6740, 0xA501, 0x65C0, 0x6480, 0xA441,
    0x6C00, 0xACC1, 0xAD81, 0x6D40, 0xAF01, 0x6FC0, 0x6E80, 0xAE41,
    0xAA01, 0x6AC0, 0x6B80, 0xAB41, 0x6900, 0xA9C1, 0xA881, 0x6840,
    0x7800, 0xB8C1, 0xB981, 0x7940, 0xBB01, 0x7BC0, 0x7A80, 0xBA41,
    0xBE01, 0x7EC0, 0x7F80, 0xBF41, 0x7D00, 0xBDC1, 0xBC81, 0x7C40,
    0xB401, 0x74C0, 0x7580, 0xB541, 0x7700, 0xB7C1, 0xB681, 0x7640,
    0x7200, 0xB2C1, 0xB381, 0x7340, 0xB101, 0x71C0, 0x7080, 0xB041,
    0x5000, 0x90C1, 0x9181, 0x5140, 0x9301, 0x53C0, 0x5280, 0x9241,
    0x9601, 0x56C0, 0x5780, 0x9741, 0x5500, 0x95C1, 0x9481, 0x5440,
    0x9C01, 0x5CC0, 0x5D80, 0x9D41, 0x5F00, 0x9FC1, 0x9E81, 0x5E40,
    0x5A00, 0x9AC1, 0x9B81, 0x5B40, 0x9901, 0x59C0, 0x5880, 0x9841,
    0x8801, 0x48C0, 0x4980, 0x8941, 0x4B00, 0x8BC1, 0x8A81, 0x4A40,
    0x4E00, 0x8EC1, 0x8F81, 0x4F40, 0x8D01, 0x4DC0, 0x4C80, 0x8C41,
    0x4400, 0x84C1, 0x8581, 0x4540, 0x8701, 0x47C0, 0x4680, 0x8641,
    0x8201, 0x42C0, 0x4380, 0x8341, 0x4100, 0x81C1, 0x8081, 0x4040
};

namespace {

/* @brief Reject values whose PDU length the RTU decoder cannot derive back
 * @note Exception frames have a fixed length whatever the function code
 */
Result checkRtuLayout(FunctionCode fc, bool exception, const Registers& registers) {
    if (exception) return SUCCESS;
    if (isCustom(fc) && fc != READ_FIFO_QUEUE) {
        return Error(ERR_INVALID_FC, "custom function codes have no RTU length");
    }
    if (fc == DIAGNOSTICS && registers.size() != 1) {
        return Error(ERR_INVALID_DATA, "RTU diagnostics carry exactly one data word");
    }
    return SUCCESS;
}

Result checkRtuLayout(const Request& request) {
    Result res = checkRtuLayout(request.fc, false, request.registers);
    if (res != SUCCESS) return res;
    // FIFO pointer address only
    if (request.fc == READ_FIFO_QUEUE && request.raw.size() != 2) {
        return Error(ERR_INVALID_DATA, "FIFO queue request carries a 2-byte address");
    }
    return SUCCESS;
}

Result checkRtuLayout(const Response& response) {
    Result res = checkRtuLayout(response.fc, response.isException(), response.registers);
    if (res != SUCCESS) return res;
    // [byte count (2)][FIFO count (2)][values]: the byte count must match the payload
    if (response.fc == READ_FIFO_QUEUE && !response.isException()) {
        const Bytes& raw = response.raw;
        if (raw.size() < 4 || (size_t)((raw[0] << 8) | raw[1]) != raw.size() - 2) {
            return Error(ERR_INVALID_BYTE_COUNT, "FIFO queue byte count mismatch");
        }
    }
    return SUCCESS;
}

} // namespace

// ===================================================================================
// CRC
// ===================================================================================

uint16_t RTU::calculateCRC(const uint8_t* data, size_t len) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = (crc >> 8) ^ CRC16_TABLE[(crc ^ data[i]) & 0xFF];
    }
    return crc;
}

uint16_t RTU::calculateCRC(const ByteBuffer& bytes) {
    return calculateCRC(bytes.data(), bytes.size());
}

bool RTU::validateCRC(const ByteBuffer& frame) {
    if (frame.size() < CRC_SIZE) return false;
    const size_t len = frame.size() - CRC_SIZE;
    const uint16_t received = (uint16_t)(frame[len] | (frame[len + 1] << 8));
    return calculateCRC(frame.data(), len) == received;
}

bool RTU::appendCRC(ByteBuffer& bytes) {
    if (bytes.free_space() < CRC_SIZE) return false;
    const uint16_t crc = calculateCRC(bytes);
    return bytes.push_back((uint8_t)(crc & 0xFF))
        && bytes.push_back((uint8_t)(crc >> 8));
}

// ===================================================================================
// LENGTH DERIVATION
// ===================================================================================

Result RTU::requestPduLength(const ByteBuffer& bytes, size_t& pduLen) {
    pduLen = 0;
    if (bytes.size() < 2) return INCOMPLETE;

    size_t len = 0;
    switch (bytes[1]) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case WRITE_COIL:
        case WRITE_REGISTER:
        case DIAGNOSTICS:
            len = 5;
            break;
        case READ_EXCEPTION_STATUS:
        case GET_COMM_EVENT_COUNTER:
        case GET_COMM_EVENT_LOG:
        case REPORT_SERVER_ID:
            len = 1;
            break;
        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            if (bytes.size() < 7) return INCOMPLETE;
            len = 6 + (size_t)bytes[6];
            break;
        case MASK_WRITE_REGISTER:
            len = 7;
            break;
        case READ_FIFO_QUEUE:
            len = 3;
            break;
        case READ_WRITE_MULTIPLE_REGISTERS:
            if (bytes.size() < 11) return INCOMPLETE;
            len = 10 + (size_t)bytes[10];
            break;
        default:
            return Error(ERR_INVALID_FC, "request length cannot be derived");
    }

    if (len > MAX_PDU_SIZE) return Error(ERR_INVALID_BYTE_COUNT, "declared length exceeds PDU size");
    pduLen = len;
    return SUCCESS;
}

Result RTU::responsePduLength(const ByteBuffer& bytes, size_t& pduLen) {
    pduLen = 0;
    if (bytes.size() < 2) return INCOMPLETE;

    if (bytes[1] & EXCEPTION_FLAG) {
        pduLen = 2;
        return SUCCESS;
    }

    size_t len = 0;
    switch (bytes[1]) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case GET_COMM_EVENT_LOG:
        case REPORT_SERVER_ID:
        case READ_WRITE_MULTIPLE_REGISTERS:
            if (bytes.size() < 3) return INCOMPLETE;
            len = 2 + (size_t)bytes[2];
            break;
        case WRITE_COIL:
        case WRITE_REGISTER:
        case DIAGNOSTICS:
        case GET_COMM_EVENT_COUNTER:
        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            len = 5;
            break;
        case READ_EXCEPTION_STATUS:
            len = 2;
            break;
        case MASK_WRITE_REGISTER:
            len = 7;
            break;
        case READ_FIFO_QUEUE:
            // 16-bit byte count
            if (bytes.size() < 4) return INCOMPLETE;
            len = 3 + (size_t)bytes.getU16(2);
            break;
        default:
            return Error(ERR_INVALID_FC, "response length cannot be derived");
    }

    if (len > MAX_PDU_SIZE) return Error(ERR_INVALID_BYTE_COUNT, "declared length exceeds PDU size");
    pduLen = len;
    return SUCCESS;
}

// ===================================================================================
// DECODING
// ===================================================================================

template<typename T>
Result RTU::decodeFrame(const ByteBuffer& bytes, T& value, Slave& slave,
                        FrameLocation& location,
                        Result (*pduLength)(const ByteBuffer&, size_t&)) {
    value.clear();
    slave = Slave();
    location = FrameLocation();

    // Wait for address + function code + CRC
    if (bytes.size() < MIN_FRAME_SIZE) return INCOMPLETE;

    size_t pduLen = 0;
    Result res = pduLength(bytes, pduLen);
    if (res != SUCCESS) return res;

    const size_t frameLen = 1 + pduLen + CRC_SIZE;
    if (bytes.size() < frameLen) return INCOMPLETE;

    // The frame is delimited from here on: report its range even on error
    // so the caller can drop it and resynchronize
    location.start = 0;
    location.end = frameLen;

    ByteBuffer frame = bytes.slice(0, frameLen);
    if (!validateCRC(frame)) {
        Debug::LOG_HEXDUMP(frame);
        return Error(ERR_CRC_MISMATCH);
    }

    slave = Slave(bytes[0]);
    ByteBuffer pdu = bytes.slice(1, pduLen);
    res = PDU::decode(pdu, value);
    if (res != SUCCESS) return res;

    Debug::LOG_FRAME(value, "RTU frame decoded");
    return SUCCESS;
}

Result RTU::decodeRequest(const ByteBuffer& bytes, Request& request,
                          Slave& slave, FrameLocation& location) {
    return decodeFrame(bytes, request, slave, location, &RTU::requestPduLength);
}

Result RTU::decodeResponse(const ByteBuffer& bytes, Response& response,
                           Slave& slave, FrameLocation& location) {
    return decodeFrame(bytes, response, slave, location, &RTU::responsePduLength);
}

// ===================================================================================
// ENCODING
// ===================================================================================

template<typename T>
Result RTU::encodeFrame(const T& value, Slave slave, ByteBuffer& bytes) {
    Result res = PDU::validate(value);
    if (res != SUCCESS) return res;
    res = checkRtuLayout(value);
    if (res != SUCCESS) return res;

    const size_t frameLen = 1 + PDU::length(value) + CRC_SIZE;
    if (bytes.free_space() < frameLen) return Error(ERR_BUFFER_TOO_SMALL, "RTU frame does not fit");

    const size_t start = bytes.size();
    if (!bytes.push_back(slave.id())) return Error(ERR_BUFFER_TOO_SMALL);

    res = PDU::encode(value, bytes);
    if (res != SUCCESS) {
        bytes.trim(start);
        return res;
    }

    const uint16_t crc = calculateCRC(bytes.data() + start, bytes.size() - start);
    if (!bytes.push_back((uint8_t)(crc & 0xFF)) || !bytes.push_back((uint8_t)(crc >> 8))) {
        bytes.trim(start);
        return Error(ERR_BUFFER_TOO_SMALL, "no room for CRC");
    }
    return SUCCESS;
}

Result RTU::encodeRequest(const Request& request, Slave slave, ByteBuffer& bytes) {
    return encodeFrame(request, slave, bytes);
}

Result RTU::encodeResponse(const Response& response, Slave slave, ByteBuffer& bytes) {
    return encodeFrame(response, slave, bytes);
}

bool RTU::buildException(Slave slave, FunctionCode fc, ExceptionCode ec, ByteBuffer& bytes) {
    if (!isValidFunctionCode(fc) || !isValid(ec)) return false;
    if (bytes.free_space() < EXCEPTION_FRAME_SIZE) return false;

    const size_t start = bytes.size();
    const uint8_t head[] = { slave.id(), (uint8_t)(fc | EXCEPTION_FLAG), (uint8_t)ec };
    const uint16_t crc = calculateCRC(head, sizeof(head));
    const uint8_t tail[] = { (uint8_t)(crc & 0xFF), (uint8_t)(crc >> 8) };
    if (!bytes.push_back(head, sizeof(head)) || !bytes.push_back(tail, sizeof(tail))) {
        bytes.trim(start);
        return false;
    }
    return true;
}

} // namespace ModbusCodec
