#include <unity.h>
#include <cstdio>
#include <cstring>

#include "core/ModbusSlave.hpp"
#include "core/ModbusFrame.hpp"
#include "utils/ModbusDebug.hpp"

using namespace Modbus;

int Modbus::Debug::printLog(const char* msg, size_t len) {
    return (int)fwrite(msg, 1, len, stdout);
}

void setUp() {}
void tearDown() {}

// Compile-time checks: Slave is a literal type
static_assert(Slave().isBroadcast(), "default slave is broadcast");
static_assert(Slave(17).dispatch(Slave(17), READ_HOLDING_REGISTERS) == Slave::PROCESS_AND_REPLY,
              "constexpr dispatch");

void test_slave_address_ranges() {
    TEST_ASSERT_TRUE(Slave::broadcast().isBroadcast());
    TEST_ASSERT_EQUAL(0, Slave::broadcast().id());
    TEST_ASSERT_FALSE(Slave(1).isBroadcast());

    TEST_ASSERT_TRUE(Slave(0).isValidRtuAddress());
    TEST_ASSERT_TRUE(Slave(247).isValidRtuAddress());
    TEST_ASSERT_FALSE_MESSAGE(Slave(248).isValidRtuAddress(), "248..255 are reserved on RTU");
    TEST_ASSERT_FALSE(Slave(255).isValidRtuAddress());

    TEST_ASSERT_TRUE(Slave(5) == Slave(5));
    TEST_ASSERT_TRUE(Slave(5) != Slave(6));
}

void test_slave_accepts() {
    Slave server(0x11);
    TEST_ASSERT_TRUE(server.accepts(Slave(0x11)));
    TEST_ASSERT_TRUE_MESSAGE(server.accepts(Slave::broadcast()), "broadcast reaches every server");
    TEST_ASSERT_FALSE(server.accepts(Slave(0x12)));

    // A server listening on the broadcast address catches everything
    Slave any = Slave::broadcast();
    TEST_ASSERT_TRUE(any.accepts(Slave(0x11)));
    TEST_ASSERT_TRUE(any.accepts(Slave(0xFF)));
    TEST_ASSERT_TRUE(any.accepts(Slave::broadcast()));
}

void test_slave_dispatch() {
    Slave server(0x11);

    TEST_ASSERT_EQUAL(Slave::PROCESS_AND_REPLY, server.dispatch(Slave(0x11), READ_HOLDING_REGISTERS));
    TEST_ASSERT_EQUAL(Slave::PROCESS_AND_REPLY, server.dispatch(Slave(0x11), WRITE_REGISTER));
    TEST_ASSERT_EQUAL(Slave::IGNORE, server.dispatch(Slave(0x12), WRITE_REGISTER));

    TEST_ASSERT_EQUAL_MESSAGE(Slave::PROCESS_NO_REPLY,
                              server.dispatch(Slave::broadcast(), WRITE_MULTIPLE_REGISTERS),
                              "broadcast write is executed without reply");
    TEST_ASSERT_EQUAL(Slave::PROCESS_NO_REPLY, server.dispatch(Slave::broadcast(), WRITE_COIL));
    TEST_ASSERT_EQUAL(Slave::PROCESS_NO_REPLY, server.dispatch(Slave::broadcast(), MASK_WRITE_REGISTER));

    TEST_ASSERT_EQUAL_MESSAGE(Slave::IGNORE,
                              server.dispatch(Slave::broadcast(), READ_COILS),
                              "broadcast read has no meaning");
    TEST_ASSERT_EQUAL(Slave::IGNORE, server.dispatch(Slave::broadcast(), READ_INPUT_REGISTERS));
    TEST_ASSERT_EQUAL(Slave::IGNORE, server.dispatch(Slave::broadcast(), READ_WRITE_MULTIPLE_REGISTERS));

    Slave any = Slave::broadcast();
    TEST_ASSERT_EQUAL(Slave::PROCESS_AND_REPLY, any.dispatch(Slave(42), READ_COILS));
}

void test_slave_action_strings() {
    TEST_ASSERT_EQUAL_STRING("ignore", toString(Slave::IGNORE));
    TEST_ASSERT_EQUAL_STRING("process (no reply)", toString(Slave::PROCESS_NO_REPLY));
    TEST_ASSERT_EQUAL_STRING("process & reply", toString(Slave::PROCESS_AND_REPLY));
    TEST_ASSERT_EQUAL_STRING("unknown", toString((Slave::Action)7));
}

// Typical server side flow: dispatch a decoded request, build the answer
void test_slave_server_flow() {
    Slave server(3);
    Request req = Request::writeRegister(0x0100, 0x00FF);

    Slave::Action action = server.dispatch(Slave(3), req.fc);
    TEST_ASSERT_EQUAL(Slave::PROCESS_AND_REPLY, action);

    Response rsp = makeResponse(req);
    TEST_ASSERT_EQUAL(WRITE_REGISTER, rsp.fc);
    TEST_ASSERT_EQUAL_HEX16(0x0100, rsp.regAddress);
    TEST_ASSERT_EQUAL_HEX16(0x00FF, rsp.value);

    Response ex = makeException(req, ILLEGAL_DATA_ADDRESS);
    TEST_ASSERT_TRUE(ex.isException());
    TEST_ASSERT_EQUAL(ILLEGAL_DATA_ADDRESS, ex.exceptionCode);
    TEST_ASSERT_EQUAL(WRITE_REGISTER, ex.fc);
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_slave_address_ranges);
    RUN_TEST(test_slave_accepts);
    RUN_TEST(test_slave_dispatch);
    RUN_TEST(test_slave_action_strings);
    RUN_TEST(test_slave_server_flow);
    return UNITY_END();
}
