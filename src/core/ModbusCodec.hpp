/**
 * @file ModbusCodec.hpp
 * @brief Modbus codecs (PDU, RTU & TCP framing)
 * @note All functions are stateless: they only touch the buffers and
 *       values passed by the caller, and never allocate.
 */

#pragma once

#include "core/ModbusCore.h"
#include "core/ModbusFrame.hpp"
#include "core/ModbusSlave.hpp"
#include "utils/ModbusDebug.hpp"

namespace ModbusCodec {

    enum Result {
        SUCCESS,
        // Streaming
        INCOMPLETE,             // Not enough bytes yet, read more and retry
        // Encoding
        ERR_BUFFER_TOO_SMALL,
        // RTU
        ERR_CRC_MISMATCH,
        // Malformed content (InvalidData)
        ERR_INVALID_LEN,
        ERR_INVALID_FC,
        ERR_INVALID_REG_COUNT,
        ERR_INVALID_BYTE_COUNT,
        ERR_INVALID_DATA,
        ERR_INVALID_EXCEPTION,
        // TCP
        ERR_INVALID_MBAP_LEN,
        ERR_INVALID_MBAP_PROTOCOL_ID
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case INCOMPLETE: return "incomplete frame";
            case ERR_BUFFER_TOO_SMALL: return "buffer too small";
            case ERR_CRC_MISMATCH: return "CRC mismatch";
            case ERR_INVALID_LEN: return "invalid length";
            case ERR_INVALID_FC: return "invalid function code";
            case ERR_INVALID_REG_COUNT: return "invalid register count";
            case ERR_INVALID_BYTE_COUNT: return "invalid byte count";
            case ERR_INVALID_DATA: return "invalid data";
            case ERR_INVALID_EXCEPTION: return "invalid exception";
            case ERR_INVALID_MBAP_LEN: return "invalid MBAP length";
            case ERR_INVALID_MBAP_PROTOCOL_ID: return "invalid MBAP protocol ID";
            default: return "unknown error";
        }
    }

    /* @brief Check if a result reports malformed content
     * @note Excludes INCOMPLETE, ERR_BUFFER_TOO_SMALL and ERR_CRC_MISMATCH
     */
    inline bool isInvalidData(const Result result) {
        switch (result) {
            case ERR_INVALID_LEN:
            case ERR_INVALID_FC:
            case ERR_INVALID_REG_COUNT:
            case ERR_INVALID_BYTE_COUNT:
            case ERR_INVALID_DATA:
            case ERR_INVALID_EXCEPTION:
            case ERR_INVALID_MBAP_LEN:
            case ERR_INVALID_MBAP_PROTOCOL_ID:
                return true;
            default:
                return false;
        }
    }

    #include "core/ModbusResultHelpers.inl"

    // "Raw" validation methods - work both for encoding and decoding using
    // the raw values of the fields (allows on-the-fly validation for decoding)

    /* @brief Check the quantity of a quantity-bearing function
     * @param regCount Number of coils or registers
     * @param fc The function code
     * @return true if 1 <= regCount <= protocol limit for this function
     * @note For READ_WRITE_MULTIPLE_REGISTERS this checks the read part,
     *       see isValidWriteCount() for the write part.
     */
    inline bool isValidRegisterCount(const uint16_t regCount, const uint8_t fc) {
        switch ((Modbus::FunctionCode)fc) {
            case Modbus::READ_COILS:
            case Modbus::READ_DISCRETE_INPUTS:
                return regCount >= 1 && regCount <= Modbus::MAX_COILS_READ;
            case Modbus::READ_HOLDING_REGISTERS:
            case Modbus::READ_INPUT_REGISTERS:
                return regCount >= 1 && regCount <= Modbus::MAX_REGISTERS_READ;
            case Modbus::WRITE_MULTIPLE_COILS:
                return regCount >= 1 && regCount <= Modbus::MAX_COILS_WRITE;
            case Modbus::WRITE_MULTIPLE_REGISTERS:
                return regCount >= 1 && regCount <= Modbus::MAX_REGISTERS_WRITE;
            case Modbus::READ_WRITE_MULTIPLE_REGISTERS:
                return regCount >= 1 && regCount <= Modbus::MAX_RW_REGISTERS_READ;
            default:
                return false;
        }
    }

    // Write part of READ_WRITE_MULTIPLE_REGISTERS
    inline bool isValidWriteCount(const uint16_t regCount) {
        return regCount >= 1 && regCount <= Modbus::MAX_RW_REGISTERS_WRITE;
    }

    /* @brief Check if a function code can be encoded/decoded
     * @return true for standard & custom codes (0x01..0x7F)
     */
    inline bool isValidFunctionCode(const uint8_t fc) {
        return fc != Modbus::NULL_FC && fc < Modbus::EXCEPTION_FLAG;
    }

    inline bool isValidExceptionCode(const uint8_t ec) {
        return Modbus::isValid(static_cast<Modbus::ExceptionCode>(ec));
    }

/* @brief The Modbus PDU codec (function code + payload, no address, no checksum).
 * @note encode() appends at bytes.size(). On failure the buffer is left
 *       untouched: size & content are validated before the first byte is written.
 * @note decode() expects exactly one PDU in `bytes`. On failure the value is cleared.
 */
class PDU {

public:

    static Result encode(const Modbus::Request& request, ByteBuffer& bytes);
    static Result encode(const Modbus::Response& response, ByteBuffer& bytes);

    static Result decode(const ByteBuffer& bytes, Modbus::Request& request);
    static Result decode(const ByteBuffer& bytes, Modbus::Response& response);

    /* @brief Check that a value can be encoded (function code, quantities, data)
     */
    static Result validate(const Modbus::Request& request);
    static Result validate(const Modbus::Response& response);

    /* @brief Encoded length of a value, function code included
     * @note Only meaningful for values that pass validate()
     */
    static size_t length(const Modbus::Request& request);
    static size_t length(const Modbus::Response& response);

private:

    // Raw field writers, capacity already checked by the caller
    static bool writeRequest(const Modbus::Request& request, ByteBuffer& bytes);
    static bool writeResponse(const Modbus::Response& response, ByteBuffer& bytes);

    // Template function to clear an object + cast an error
    template<typename T>
    static Result HandleError(T& objectToClear, Result errorCode, const char* desc = nullptr
                    #ifdef MBCODEC_DEBUG
                    , CallCtx ctx = CallCtx()
                    #endif
                    ) {
        objectToClear.clear();
        #ifdef MBCODEC_DEBUG
            return Error(errorCode, desc, ctx);
        #else
            return Error(errorCode, desc);
        #endif
    }

}; // class PDU

/* @brief The Modbus RTU codec: [address][PDU][CRC16, low byte first]
 * @note Decoders find the frame starting at offset 0 of an arbitrary buffer,
 *       using content only (declared lengths + CRC), no inter-frame silence.
 */
class RTU {

public:

    static constexpr size_t CRC_SIZE = 2;
    static constexpr size_t MIN_FRAME_SIZE = 1 + Modbus::MIN_PDU_SIZE + CRC_SIZE;
    static constexpr size_t MAX_FRAME_SIZE = 1 + Modbus::MAX_PDU_SIZE + CRC_SIZE;
    static constexpr size_t EXCEPTION_FRAME_SIZE = 5;

    /* @brief Decode a request frame (server side)
     * @param bytes Received bytes, frame expected at offset 0 (may hold trailing bytes)
     * @param request Output request
     * @param slave Output address the request is sent to
     * @param location Output byte range consumed by the frame
     * @return SUCCESS, INCOMPLETE, ERR_CRC_MISMATCH or an ERR_INVALID_xxx code
     * @note Once the frame is delimited, location is set even on error
     *       (CRC mismatch, invalid PDU), so the caller can discard it.
     *       slave is set as well when the CRC matched.
     */
    static Result decodeRequest(const ByteBuffer& bytes, Modbus::Request& request,
                                Modbus::Slave& slave, Modbus::FrameLocation& location);

    /* @brief Decode a response frame (client side)
     * @note An exception response is a SUCCESS with response.isException()
     */
    static Result decodeResponse(const ByteBuffer& bytes, Modbus::Response& response,
                                 Modbus::Slave& slave, Modbus::FrameLocation& location);

    static Result encodeRequest(const Modbus::Request& request, Modbus::Slave slave, ByteBuffer& bytes);
    static Result encodeResponse(const Modbus::Response& response, Modbus::Slave slave, ByteBuffer& bytes);

    /* @brief Derive the PDU length of the frame at the start of a buffer
     * @param bytes Received bytes (address at index 0)
     * @param pduLen Output PDU length (function code included)
     * @return SUCCESS, INCOMPLETE if the length field is not there yet,
     *         ERR_INVALID_FC if the length cannot be derived from the content,
     *         ERR_INVALID_BYTE_COUNT if the declared length exceeds the PDU limit
     */
    static Result requestPduLength(const ByteBuffer& bytes, size_t& pduLen);
    static Result responsePduLength(const ByteBuffer& bytes, size_t& pduLen);

    static uint16_t calculateCRC(const uint8_t* data, size_t len);
    static uint16_t calculateCRC(const ByteBuffer& bytes);

    // Last 2 bytes of `frame` against the CRC of the bytes before them
    static bool validateCRC(const ByteBuffer& frame);

    /* @brief Append the CRC of the whole buffer (low byte first)
     * @return false if less than 2 bytes are free (buffer untouched)
     */
    static bool appendCRC(ByteBuffer& bytes);

    /* @brief Build a minimal exception frame (5 bytes), appended to bytes
     * @return false if the buffer has not enough free space (buffer untouched)
     */
    static bool buildException(Modbus::Slave slave, Modbus::FunctionCode fc,
                               Modbus::ExceptionCode ec, ByteBuffer& bytes);

private:

    static const uint16_t CRC16_TABLE[256];

    template<typename T>
    static Result decodeFrame(const ByteBuffer& bytes, T& value, Modbus::Slave& slave,
                              Modbus::FrameLocation& location,
                              Result (*pduLength)(const ByteBuffer&, size_t&));

    template<typename T>
    static Result encodeFrame(const T& value, Modbus::Slave slave, ByteBuffer& bytes);

}; // class RTU

/* @brief The Modbus TCP codec: [MBAP header (7 bytes)][PDU]
 */
class TCP {

public:

    /* @brief The Modbus Application Protocol header
     */
    struct MBAP {
        uint16_t transactionId = 0;
        uint16_t protocolId = 0;
        uint16_t length = 0;    // unit ID + PDU bytes
        uint8_t unitId = 0;

        // Caller checks that at least MBAP_SIZE bytes are available
        static MBAP readFromBytes(const ByteBuffer& bytes) {
            MBAP mbap;
            mbap.transactionId = bytes.getU16(0);
            mbap.protocolId = bytes.getU16(2);
            mbap.length = bytes.getU16(4);
            mbap.unitId = bytes[6];
            return mbap;
        }

        // Appends the 7 header bytes, all or nothing
        bool writeToBytes(ByteBuffer& bytes) const {
            if (bytes.free_space() < MBAP_SIZE) return false;
            bytes.push_u16(transactionId);
            bytes.push_u16(protocolId);
            bytes.push_u16(length);
            bytes.push_back(unitId);
            return true;
        }
    };

    static constexpr size_t MBAP_SIZE = 7;
    static constexpr size_t MIN_FRAME_SIZE = MBAP_SIZE + Modbus::MIN_PDU_SIZE;
    static constexpr size_t MAX_FRAME_SIZE = MBAP_SIZE + Modbus::MAX_PDU_SIZE;
    static constexpr size_t EXCEPTION_FRAME_SIZE = 9;
    static constexpr uint16_t MIN_MBAP_LENGTH = 1 + Modbus::MIN_PDU_SIZE;
    static constexpr uint16_t MAX_MBAP_LENGTH = 1 + Modbus::MAX_PDU_SIZE;

    static_assert(MAX_FRAME_SIZE == Modbus::MAX_FRAME_SIZE, "TCP frames are the largest ADU");

    /* @brief Client-side transaction ID source
     * @note Owned by the caller (one per connection), wraps after 0xFFFF
     */
    class TransactionCounter {
    public:
        explicit TransactionCounter(uint16_t first = 1) : _next(first) {}
        uint16_t next() { return _next++; }
        uint16_t peek() const { return _next; }
    private:
        uint16_t _next;
    };

    /* @brief Decode a request frame (server side)
     * @param bytes Received bytes, frame expected at offset 0 (may hold trailing bytes)
     * @param request Output request
     * @param unit Output unit ID
     * @param transactionId Output transaction ID, to be echoed in the response
     * @param location Output byte range consumed by the frame
     * @return SUCCESS, INCOMPLETE or an ERR_INVALID_xxx code
     * @note When the whole frame is available, unit, transactionId & location
     *       are set even if the PDU is invalid.
     */
    static Result decodeRequest(const ByteBuffer& bytes, Modbus::Request& request,
                                Modbus::Slave& unit, uint16_t& transactionId,
                                Modbus::FrameLocation& location);

    /* @brief Decode a response frame (client side)
     * @note An exception response is a SUCCESS with response.isException()
     */
    static Result decodeResponse(const ByteBuffer& bytes, Modbus::Response& response,
                                 Modbus::Slave& unit, uint16_t& transactionId,
                                 Modbus::FrameLocation& location);

    static Result encodeRequest(const Modbus::Request& request, Modbus::Slave unit,
                                uint16_t transactionId, ByteBuffer& bytes);
    static Result encodeResponse(const Modbus::Response& response, Modbus::Slave unit,
                                 uint16_t transactionId, ByteBuffer& bytes);

    /* @brief Total length of the frame at the start of a buffer, from its header
     * @return SUCCESS, INCOMPLETE, ERR_INVALID_MBAP_PROTOCOL_ID or ERR_INVALID_MBAP_LEN
     * @note The protocol ID is checked as soon as 4 bytes are available
     */
    static Result frameLength(const ByteBuffer& bytes, size_t& frameLen);

    /* @brief Build a minimal exception frame (9 bytes), appended to bytes
     * @return false if the buffer has not enough free space (buffer untouched)
     */
    static bool buildException(uint16_t transactionId, Modbus::Slave unit,
                               Modbus::FunctionCode fc, Modbus::ExceptionCode ec,
                               ByteBuffer& bytes);

private:

    template<typename T>
    static Result decodeFrame(const ByteBuffer& bytes, T& value, Modbus::Slave& unit,
                              uint16_t& transactionId, Modbus::FrameLocation& location);

    template<typename T>
    static Result encodeFrame(const T& value, Modbus::Slave unit, uint16_t transactionId,
                              ByteBuffer& bytes);

}; // class TCP

} // namespace ModbusCodec
