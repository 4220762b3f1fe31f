/**
 * @file ModbusCodecTCP.cpp
 * @brief Modbus TCP framing: MBAP header + PDU
 */

#include "ModbusCodec.hpp"

namespace ModbusCodec {

using namespace Modbus;

// ===================================================================================
// HEADER
// ===================================================================================

Result TCP::frameLength(const ByteBuffer& bytes, size_t& frameLen) {
    frameLen = 0;

    // Reject foreign protocols as soon as the field is visible
    if (bytes.size() >= 4 && bytes.getU16(2) != 0) {
        return Error(ERR_INVALID_MBAP_PROTOCOL_ID, "protocol ID must be 0");
    }
    if (bytes.size() >= 6) {
        const uint16_t length = bytes.getU16(4);
        if (length < MIN_MBAP_LENGTH || length > MAX_MBAP_LENGTH) {
            return Error(ERR_INVALID_MBAP_LEN, "MBAP length out of range");
        }
    }
    if (bytes.size() < MBAP_SIZE) return INCOMPLETE;

    frameLen = (MBAP_SIZE - 1) + bytes.getU16(4);
    return SUCCESS;
}

// ===================================================================================
// DECODING
// ===================================================================================

template<typename T>
Result TCP::decodeFrame(const ByteBuffer& bytes, T& value, Slave& unit,
                        uint16_t& transactionId, FrameLocation& location) {
    value.clear();
    unit = Slave();
    transactionId = 0;
    location = FrameLocation();

    size_t frameLen = 0;
    Result res = frameLength(bytes, frameLen);
    if (res != SUCCESS) return res;
    if (bytes.size() < frameLen) return INCOMPLETE;

    // Header fields & range stay valid if the PDU is rejected:
    // a server still needs them to answer with an exception
    const MBAP mbap = MBAP::readFromBytes(bytes);
    unit = Slave(mbap.unitId);
    transactionId = mbap.transactionId;
    location.start = 0;
    location.end = frameLen;

    ByteBuffer pdu = bytes.slice(MBAP_SIZE, frameLen - MBAP_SIZE);
    res = PDU::decode(pdu, value);
    if (res != SUCCESS) return res;

    Debug::LOG_FRAME(value, "TCP frame decoded");
    return SUCCESS;
}

Result TCP::decodeRequest(const ByteBuffer& bytes, Request& request, Slave& unit,
                          uint16_t& transactionId, FrameLocation& location) {
    return decodeFrame(bytes, request, unit, transactionId, location);
}

Result TCP::decodeResponse(const ByteBuffer& bytes, Response& response, Slave& unit,
                           uint16_t& transactionId, FrameLocation& location) {
    return decodeFrame(bytes, response, unit, transactionId, location);
}

// ===================================================================================
// ENCODING
// ===================================================================================

template<typename T>
Result TCP::encodeFrame(const T& value, Slave unit, uint16_t transactionId, ByteBuffer& bytes) {
    Result res = PDU::validate(value);
    if (res != SUCCESS) return res;

    const size_t pduLen = PDU::length(value);
    if (bytes.free_space() < MBAP_SIZE + pduLen) return Error(ERR_BUFFER_TOO_SMALL, "TCP frame does not fit");

    MBAP mbap;
    mbap.transactionId = transactionId;
    mbap.protocolId = 0;
    mbap.length = (uint16_t)(1 + pduLen);
    mbap.unitId = unit.id();

    const size_t start = bytes.size();
    if (!mbap.writeToBytes(bytes)) return Error(ERR_BUFFER_TOO_SMALL, "no room for MBAP header");

    res = PDU::encode(value, bytes);
    if (res != SUCCESS) {
        bytes.trim(start);
        return res;
    }
    return SUCCESS;
}

Result TCP::encodeRequest(const Request& request, Slave unit, uint16_t transactionId,
                          ByteBuffer& bytes) {
    return encodeFrame(request, unit, transactionId, bytes);
}

Result TCP::encodeResponse(const Response& response, Slave unit, uint16_t transactionId,
                           ByteBuffer& bytes) {
    return encodeFrame(response, unit, transactionId, bytes);
}

bool TCP::buildException(uint16_t transactionId, Slave unit, FunctionCode fc,
                         ExceptionCode ec, ByteBuffer& bytes) {
    if (!isValidFunctionCode(fc) || !isValid(ec)) return false;
    if (bytes.free_space() < EXCEPTION_FRAME_SIZE) return false;

    MBAP mbap;
    mbap.transactionId = transactionId;
    mbap.length = 3;    // unit ID + fc + ec
    mbap.unitId = unit.id();

    const size_t start = bytes.size();
    if (!mbap.writeToBytes(bytes)
        || !bytes.push_back((uint8_t)(fc | EXCEPTION_FLAG))
        || !bytes.push_back((uint8_t)ec)) {
        bytes.trim(start);
        return false;
    }
    return true;
}

} // namespace ModbusCodec
