#include <unity.h>
#include <cstdio>
#include <cstring>
#include <cstdint>

#include "core/ModbusCodec.hpp"

using namespace Modbus;
using namespace ModbusCodec;

int Modbus::Debug::printLog(const char* msg, size_t len) {
    return (int)fwrite(msg, 1, len, stdout);
}

void setUp() {}
void tearDown() {}

// Write single register 0x0001 = 0x0003, transaction 1, unit 1
static const uint8_t WRITE_REGISTER_FRAME[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x01,
                                               0x06, 0x00, 0x01, 0x00, 0x03};

void test_tcp_encode_request() {
    uint8_t storage[TCP::MAX_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeRequest(Request::writeRegister(0x0001, 0x0003), Slave(1), 1, out));
    TEST_ASSERT_EQUAL(sizeof(WRITE_REGISTER_FRAME), out.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(WRITE_REGISTER_FRAME, out.data(), sizeof(WRITE_REGISTER_FRAME));
}

void test_tcp_decode_request() {
    ByteBuffer in(WRITE_REGISTER_FRAME, sizeof(WRITE_REGISTER_FRAME));

    Request req;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeRequest(in, req, unit, tid, loc));
    TEST_ASSERT_TRUE(req == Request::writeRegister(0x0001, 0x0003));
    TEST_ASSERT_EQUAL(1, unit.id());
    TEST_ASSERT_EQUAL(1, tid);
    TEST_ASSERT_EQUAL(0, loc.start);
    TEST_ASSERT_EQUAL(sizeof(WRITE_REGISTER_FRAME), loc.end);

    TCP::MBAP mbap = TCP::MBAP::readFromBytes(in);
    TEST_ASSERT_EQUAL(1, mbap.transactionId);
    TEST_ASSERT_EQUAL(0, mbap.protocolId);
    TEST_ASSERT_EQUAL(6, mbap.length);
    TEST_ASSERT_EQUAL(1, mbap.unitId);
}

void test_tcp_decode_incomplete() {
    Request req;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;

    for (size_t len = 0; len < sizeof(WRITE_REGISTER_FRAME); ++len) {
        ByteBuffer prefix(WRITE_REGISTER_FRAME, len);
        TEST_ASSERT_EQUAL_MESSAGE(INCOMPLETE, TCP::decodeRequest(prefix, req, unit, tid, loc),
                                  "strict prefix should be incomplete");
    }

    // Trailing bytes of the next frame are left to the caller
    uint8_t storage[64];
    ByteBuffer rx(storage, sizeof(storage));
    TEST_ASSERT_TRUE(rx.push_back(WRITE_REGISTER_FRAME, sizeof(WRITE_REGISTER_FRAME)));
    TEST_ASSERT_TRUE(rx.push_back(WRITE_REGISTER_FRAME, 5));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeRequest(rx, req, unit, tid, loc));
    TEST_ASSERT_EQUAL(sizeof(WRITE_REGISTER_FRAME), loc.end);
    TEST_ASSERT_TRUE(rx.pop_front(loc.end));
    TEST_ASSERT_EQUAL(INCOMPLETE, TCP::decodeRequest(rx, req, unit, tid, loc));
}

void test_tcp_protocol_id_guard() {
    static const uint8_t foreign[] = {0x00, 0x01, 0x00, 0x01};
    ByteBuffer in(foreign, sizeof(foreign));

    Request req;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    TEST_ASSERT_EQUAL_MESSAGE(ERR_INVALID_MBAP_PROTOCOL_ID, TCP::decodeRequest(in, req, unit, tid, loc),
                              "rejected as soon as the protocol ID is visible");
    TEST_ASSERT_TRUE(isInvalidData(ERR_INVALID_MBAP_PROTOCOL_ID));

    ByteBuffer partial(foreign, 3);
    TEST_ASSERT_EQUAL(INCOMPLETE, TCP::decodeRequest(partial, req, unit, tid, loc));
}

void test_tcp_mbap_length() {
    Request req;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;

    static const uint8_t tooShort[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0x01};
    ByteBuffer inShort(tooShort, sizeof(tooShort));
    TEST_ASSERT_EQUAL(ERR_INVALID_MBAP_LEN, TCP::decodeRequest(inShort, req, unit, tid, loc));

    static const uint8_t tooLong[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0xFF, 0x01};
    ByteBuffer inLong(tooLong, sizeof(tooLong));
    TEST_ASSERT_EQUAL(ERR_INVALID_MBAP_LEN, TCP::decodeRequest(inLong, req, unit, tid, loc));

    // Length 254 is the largest legal value: waits for the rest of the frame
    static const uint8_t largest[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0xFE, 0x01, 0x03};
    ByteBuffer inLargest(largest, sizeof(largest));
    TEST_ASSERT_EQUAL(INCOMPLETE, TCP::decodeRequest(inLargest, req, unit, tid, loc));

    size_t frameLen = 0;
    TEST_ASSERT_EQUAL(SUCCESS, TCP::frameLength(inLargest, frameLen));
    TEST_ASSERT_EQUAL(TCP::MAX_FRAME_SIZE, frameLen);

    // Declared length shorter than the PDU it announces
    static const uint8_t truncated[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0x04, 0x01,
                                        0x06, 0x00, 0x01, 0x00, 0x03};
    ByteBuffer inTrunc(truncated, sizeof(truncated));
    TEST_ASSERT_EQUAL(ERR_INVALID_LEN, TCP::decodeRequest(inTrunc, req, unit, tid, loc));
    TEST_ASSERT_EQUAL(NULL_FC, req.fc);
    // Header fields survive the PDU error
    TEST_ASSERT_EQUAL(10, loc.end);
    TEST_ASSERT_EQUAL(1, tid);
    TEST_ASSERT_EQUAL(1, unit.id());
}

void test_tcp_invalid_pdu_answerable() {
    // Read 126 holding registers: one over the limit
    static const uint8_t frame[] = {0x00, 0x07, 0x00, 0x00, 0x00, 0x06, 0x05,
                                    0x03, 0x00, 0x00, 0x00, 0x7E};
    ByteBuffer in(frame, sizeof(frame));

    Request req;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    TEST_ASSERT_EQUAL(ERR_INVALID_REG_COUNT, TCP::decodeRequest(in, req, unit, tid, loc));
    TEST_ASSERT_EQUAL_HEX16(0x0007, tid);
    TEST_ASSERT_EQUAL(5, unit.id());
    TEST_ASSERT_EQUAL(0, loc.start);
    TEST_ASSERT_EQUAL(sizeof(frame), loc.end);

    // Enough to answer with an exception
    uint8_t storage[TCP::EXCEPTION_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_TRUE(TCP::buildException(tid, unit, READ_HOLDING_REGISTERS, ILLEGAL_DATA_VALUE, out));
    static const uint8_t expected[] = {0x00, 0x07, 0x00, 0x00, 0x00, 0x03, 0x05, 0x83, 0x03};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out.data(), sizeof(expected));

    // Nothing is reported before the frame is complete
    ByteBuffer partial(frame, 9);
    TEST_ASSERT_EQUAL(INCOMPLETE, TCP::decodeRequest(partial, req, unit, tid, loc));
    TEST_ASSERT_EQUAL(0, tid);
    TEST_ASSERT_EQUAL(0, loc.end);
}

void test_tcp_response_round_trip() {
    Response rsp;
    rsp.fc = READ_COILS;
    rsp.coils = Coils{true, false, true, true, false, false, true, true};

    uint8_t storage[TCP::MAX_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeResponse(rsp, Slave(0x11), 0xBEEF, out));

    static const uint8_t expected[] = {0xBE, 0xEF, 0x00, 0x00, 0x00, 0x04, 0x11, 0x01, 0x01, 0xCD};
    TEST_ASSERT_EQUAL(sizeof(expected), out.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out.data(), sizeof(expected));

    Response decoded;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    ByteBuffer in(out.data(), out.size());
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeResponse(in, decoded, unit, tid, loc));
    TEST_ASSERT_TRUE(decoded == rsp);
    TEST_ASSERT_EQUAL_HEX16(0xBEEF, tid);
    TEST_ASSERT_EQUAL(0x11, unit.id());
}

// ===================================================================================
// ROUND TRIPS
// ===================================================================================

// Every request layout, plus what only TCP can delimit
static size_t buildRequests(Request* reqs) {
    static const uint8_t fifoPointer[] = {0x04, 0xDE};
    static const uint8_t customPayload[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x01};
    size_t n = 0;
    reqs[n++] = Request::readCoils(0x0013, 19);
    reqs[n++] = Request::readDiscreteInputs(0x00C4, 22);
    reqs[n++] = Request::readHoldingRegisters(0x006B, 3);
    reqs[n++] = Request::readInputRegisters(0x0008, 1);
    reqs[n++] = Request::writeCoil(0x00AC, true);
    reqs[n++] = Request::writeCoil(0x00AD, false);
    reqs[n++] = Request::writeRegister(0x0001, 0x0003);
    reqs[n++] = Request::noPayload(READ_EXCEPTION_STATUS);
    reqs[n++] = Request::diagnostics(0x0000, Registers{0xA537});
    reqs[n++] = Request::diagnostics(0x0004, Registers{});
    reqs[n++] = Request::diagnostics(0x0000, Registers{0x1234, 0x5678});
    reqs[n++] = Request::noPayload(GET_COMM_EVENT_COUNTER);
    reqs[n++] = Request::noPayload(GET_COMM_EVENT_LOG);
    reqs[n++] = Request::writeMultipleCoils(0x0013, Coils{true, false, true, true, false,
                                                          false, true, true, true, false});
    reqs[n++] = Request::writeMultipleRegisters(0x0001, Registers{0x000A, 0x0102});
    reqs[n++] = Request::noPayload(REPORT_SERVER_ID);
    reqs[n++] = Request::maskWriteRegister(0x0004, 0x00F2, 0x0025);
    reqs[n++] = Request::readWriteMultipleRegisters(0x0003, 6, 0x000E, Registers{0x00FF, 0x00FF, 0x00FF});
    reqs[n++] = Request::custom(READ_FIFO_QUEUE, fifoPointer, sizeof(fifoPointer));
    reqs[n++] = Request::custom((FunctionCode)0x41, customPayload, sizeof(customPayload));
    reqs[n++] = Request::custom((FunctionCode)0x64, nullptr, 0);
    return n;
}

static Response responseFor(FunctionCode fc) {
    Response rsp;
    rsp.fc = fc;
    return rsp;
}

static size_t buildResponses(Response* rsps) {
    static const uint8_t events[] = {0x20, 0x00};
    static const uint8_t serverId[] = {0x11, 0x22};
    static const uint8_t fifo[] = {0x00, 0x06, 0x00, 0x02, 0x01, 0xB8, 0x12, 0x84};
    static const uint8_t customPayload[] = {0x01, 0x02, 0x03};
    size_t n = 0;

    rsps[n] = responseFor(READ_COILS);
    rsps[n++].coils = Coils{true, false, true, true, false, false, true, true,
                            true, true, false, true, false, true, true, false};
    rsps[n] = responseFor(READ_DISCRETE_INPUTS);
    rsps[n++].coils = Coils{false, false, true, true, false, true, false, true};
    rsps[n] = responseFor(READ_HOLDING_REGISTERS);
    rsps[n++].registers = Registers{0x022B, 0x0000, 0x0064};
    rsps[n] = responseFor(READ_INPUT_REGISTERS);
    rsps[n++].registers = Registers{0x000A};
    rsps[n++] = makeResponse(Request::writeCoil(0x00AC, true));
    rsps[n++] = makeResponse(Request::writeRegister(0x0001, 0x0003));
    rsps[n] = responseFor(READ_EXCEPTION_STATUS);
    rsps[n++].value = 0x6D;
    rsps[n++] = makeResponse(Request::diagnostics(0x0000, Registers{0xA537}));
    rsps[n++] = makeResponse(Request::diagnostics(0x0000, Registers{0x1234, 0x5678}));
    rsps[n] = responseFor(GET_COMM_EVENT_COUNTER);
    rsps[n].status = 0xFFFF;
    rsps[n++].eventCount = 0x0108;
    rsps[n] = responseFor(GET_COMM_EVENT_LOG);
    rsps[n].eventCount = 0x0108;
    rsps[n].messageCount = 0x0121;
    rsps[n++].raw.assign(events, sizeof(events));
    rsps[n++] = makeResponse(Request::writeMultipleCoils(0x0013, Coils{true, false, true}));
    rsps[n++] = makeResponse(Request::writeMultipleRegisters(0x0001, Registers{0x000A, 0x0102}));
    rsps[n] = responseFor(REPORT_SERVER_ID);
    rsps[n++].raw.assign(serverId, sizeof(serverId));
    rsps[n++] = makeResponse(Request::maskWriteRegister(0x0004, 0x00F2, 0x0025));
    rsps[n] = responseFor(READ_WRITE_MULTIPLE_REGISTERS);
    rsps[n++].registers = Registers{0x00FE, 0x0ACD, 0x0001, 0x0003, 0x000D, 0x00FF};
    rsps[n] = responseFor(READ_FIFO_QUEUE);
    rsps[n++].raw.assign(fifo, sizeof(fifo));
    rsps[n] = responseFor((FunctionCode)0x41);
    rsps[n++].raw.assign(customPayload, sizeof(customPayload));
    rsps[n++] = Response::exception(READ_COILS, ILLEGAL_FUNCTION);
    rsps[n++] = Response::exception(WRITE_MULTIPLE_REGISTERS, SLAVE_DEVICE_FAILURE);
    rsps[n++] = Response::exception((FunctionCode)0x41, GATEWAY_TARGET_DEVICE_FAILED_TO_RESPOND);
    return n;
}

void test_tcp_request_round_trips() {
    static Request reqs[32];
    const size_t count = buildRequests(reqs);

    uint8_t storage[TCP::MAX_FRAME_SIZE];
    char msg[48];
    for (size_t i = 0; i < count; ++i) {
        snprintf(msg, sizeof(msg), "request #%u (fc 0x%02X)", (unsigned)i, (unsigned)reqs[i].fc);

        ByteBuffer out(storage, sizeof(storage));
        const uint16_t sentTid = (uint16_t)(0x0100 + i);
        TEST_ASSERT_EQUAL_MESSAGE(SUCCESS, TCP::encodeRequest(reqs[i], Slave(0x11), sentTid, out), msg);

        Request decoded;
        Slave unit;
        uint16_t tid = 0;
        FrameLocation loc;
        ByteBuffer in(out.data(), out.size());
        TEST_ASSERT_EQUAL_MESSAGE(SUCCESS, TCP::decodeRequest(in, decoded, unit, tid, loc), msg);
        TEST_ASSERT_TRUE_MESSAGE(decoded == reqs[i], msg);
        TEST_ASSERT_EQUAL_MESSAGE(sentTid, tid, msg);
        TEST_ASSERT_EQUAL_MESSAGE(0x11, unit.id(), msg);
        TEST_ASSERT_EQUAL_MESSAGE(out.size(), loc.end, msg);
    }
}

void test_tcp_response_round_trips() {
    static Response rsps[32];
    const size_t count = buildResponses(rsps);

    uint8_t storage[TCP::MAX_FRAME_SIZE];
    char msg[48];
    for (size_t i = 0; i < count; ++i) {
        snprintf(msg, sizeof(msg), "response #%u (fc 0x%02X)", (unsigned)i, (unsigned)rsps[i].fc);

        ByteBuffer out(storage, sizeof(storage));
        const uint16_t sentTid = (uint16_t)(0xFF00 + i);
        TEST_ASSERT_EQUAL_MESSAGE(SUCCESS, TCP::encodeResponse(rsps[i], Slave(0x22), sentTid, out), msg);

        Response decoded;
        Slave unit;
        uint16_t tid = 0;
        FrameLocation loc;
        ByteBuffer in(out.data(), out.size());
        TEST_ASSERT_EQUAL_MESSAGE(SUCCESS, TCP::decodeResponse(in, decoded, unit, tid, loc), msg);
        TEST_ASSERT_TRUE_MESSAGE(decoded == rsps[i], msg);
        TEST_ASSERT_EQUAL_MESSAGE(sentTid, tid, msg);
        TEST_ASSERT_EQUAL_MESSAGE(0x22, unit.id(), msg);
        TEST_ASSERT_EQUAL_MESSAGE(out.size(), loc.end, msg);
    }
}

void test_tcp_exception() {
    static const uint8_t expected[] = {0x00, 0x07, 0x00, 0x00, 0x00, 0x03, 0x01, 0x90, 0x04};

    uint8_t storage[TCP::EXCEPTION_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_TRUE(TCP::buildException(7, Slave(1), WRITE_MULTIPLE_REGISTERS, SLAVE_DEVICE_FAILURE, out));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out.data(), sizeof(expected));
    TEST_ASSERT_FALSE(TCP::buildException(7, Slave(1), WRITE_MULTIPLE_REGISTERS, SLAVE_DEVICE_FAILURE, out));

    Response decoded;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    ByteBuffer in(expected, sizeof(expected));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeResponse(in, decoded, unit, tid, loc));
    TEST_ASSERT_TRUE(decoded.isException());
    TEST_ASSERT_EQUAL(WRITE_MULTIPLE_REGISTERS, decoded.fc);
    TEST_ASSERT_EQUAL(SLAVE_DEVICE_FAILURE, decoded.exceptionCode);

    // Same frame through the generic encoder
    uint8_t storage2[TCP::MAX_FRAME_SIZE];
    ByteBuffer out2(storage2, sizeof(storage2));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeResponse(decoded, unit, tid, out2));
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out2.data(), sizeof(expected));
}

void test_tcp_custom_function() {
    static const uint8_t payload[] = {0xDE, 0xAD, 0xBE, 0xEF};
    Request req = Request::custom((FunctionCode)0x65, payload, sizeof(payload));

    uint8_t storage[TCP::MAX_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeRequest(req, Slave(0xFF), 42, out));
    TEST_ASSERT_EQUAL(TCP::MBAP_SIZE + 1 + sizeof(payload), out.size());

    Request decoded;
    Slave unit;
    uint16_t tid = 0;
    FrameLocation loc;
    ByteBuffer in(out.data(), out.size());
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeRequest(in, decoded, unit, tid, loc));
    TEST_ASSERT_TRUE(decoded == req);
    TEST_ASSERT_EQUAL(0xFF, unit.id());
    TEST_ASSERT_EQUAL(42, tid);
}

void test_tcp_encode_errors() {
    uint8_t storage[11];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_EQUAL(ERR_BUFFER_TOO_SMALL,
                      TCP::encodeRequest(Request::writeRegister(1, 3), Slave(1), 1, out));
    TEST_ASSERT_EQUAL(0, out.size());

    TEST_ASSERT_EQUAL(ERR_INVALID_REG_COUNT,
                      TCP::encodeRequest(Request::readCoils(0, 2001), Slave(1), 1, out));
    TEST_ASSERT_EQUAL(0, out.size());

    // Largest PDU fills the largest frame
    Response rsp;
    rsp.fc = READ_HOLDING_REGISTERS;
    TEST_ASSERT_TRUE(rsp.registers.resize(MAX_REGISTERS_READ));
    uint8_t big[TCP::MAX_FRAME_SIZE];
    ByteBuffer outBig(big, sizeof(big));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeResponse(rsp, Slave(1), 1, outBig));
    TEST_ASSERT_EQUAL(TCP::MBAP_SIZE + 2 + 2 * MAX_REGISTERS_READ, outBig.size());
}

void test_tcp_transaction_counter() {
    TCP::TransactionCounter counter;
    TEST_ASSERT_EQUAL(1, counter.next());
    TEST_ASSERT_EQUAL(2, counter.next());
    TEST_ASSERT_EQUAL(3, counter.peek());

    TCP::TransactionCounter wrapping(0xFFFF);
    TEST_ASSERT_EQUAL_HEX16(0xFFFF, wrapping.next());
    TEST_ASSERT_EQUAL_HEX16_MESSAGE(0x0000, wrapping.next(), "counter wraps after 0xFFFF");

    // Two counters are independent
    TCP::TransactionCounter other;
    TEST_ASSERT_EQUAL(1, other.next());
}

void test_tcp_broadcast_unit() {
    uint8_t storage[TCP::MAX_FRAME_SIZE];
    ByteBuffer out(storage, sizeof(storage));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::encodeRequest(Request::readInputRegisters(0, 1), Slave::broadcast(), 9, out));

    Request req;
    Slave unit(5);
    uint16_t tid = 0;
    FrameLocation loc;
    ByteBuffer in(out.data(), out.size());
    TEST_ASSERT_EQUAL(SUCCESS, TCP::decodeRequest(in, req, unit, tid, loc));
    TEST_ASSERT_TRUE(unit.isBroadcast());
    TEST_ASSERT_EQUAL(Slave::IGNORE, Slave(5).dispatch(unit, req.fc));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_tcp_encode_request);
    RUN_TEST(test_tcp_decode_request);
    RUN_TEST(test_tcp_decode_incomplete);
    RUN_TEST(test_tcp_protocol_id_guard);
    RUN_TEST(test_tcp_mbap_length);
    RUN_TEST(test_tcp_invalid_pdu_answerable);
    RUN_TEST(test_tcp_response_round_trip);
    RUN_TEST(test_tcp_request_round_trips);
    RUN_TEST(test_tcp_response_round_trips);
    RUN_TEST(test_tcp_exception);
    RUN_TEST(test_tcp_custom_function);
    RUN_TEST(test_tcp_encode_errors);
    RUN_TEST(test_tcp_transaction_counter);
    RUN_TEST(test_tcp_broadcast_unit);
    return UNITY_END();
}
