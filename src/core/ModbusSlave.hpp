/**
 * @file ModbusSlave.hpp
 * @brief Slave (RTU station address / TCP unit ID) value type
 */

#pragma once

#include "core/ModbusCore.h"

namespace Modbus {

class Slave {
public:
    static constexpr uint8_t BROADCAST_ID = 0;
    static constexpr uint8_t MAX_RTU_ID = 247;

    // What a server does with a request addressed to a given slave
    enum Action : uint8_t {
        IGNORE,             // not for us, or a broadcast read
        PROCESS_NO_REPLY,   // broadcast write: execute silently
        PROCESS_AND_REPLY
    };

    constexpr Slave() : _id(BROADCAST_ID) {}
    constexpr explicit Slave(uint8_t id) : _id(id) {}

    static constexpr Slave broadcast() { return Slave(BROADCAST_ID); }

    constexpr uint8_t id() const { return _id; }
    constexpr bool isBroadcast() const { return _id == BROADCAST_ID; }

    // RTU addresses stop at 247 (248..255 are reserved), TCP accepts 0..255
    constexpr bool isValidRtuAddress() const { return _id <= MAX_RTU_ID; }

    constexpr bool operator==(const Slave& other) const { return _id == other._id; }
    constexpr bool operator!=(const Slave& other) const { return _id != other._id; }

    /* @brief Check if a server owning this address must look at a request
     * @param target The slave a decoded request is addressed to
     * @return true for our own address & broadcast. A server configured with
     *         the broadcast address catches every request.
     */
    constexpr bool accepts(const Slave& target) const {
        return isBroadcast() || target.isBroadcast() || target._id == _id;
    }

    /* @brief Decide how a server owning this address handles a request
     * @param target The slave the request is addressed to
     * @param fc The function code of the request
     * @return IGNORE, PROCESS_NO_REPLY or PROCESS_AND_REPLY
     * @note Broadcast requests never get a reply. Read functions make no
     *       sense without a reply, so a broadcast read is ignored.
     */
    constexpr Action dispatch(const Slave& target, FunctionCode fc) const {
        if (!accepts(target)) return IGNORE;
        if (target.isBroadcast()) {
            return isReadFunction(fc) ? IGNORE : PROCESS_NO_REPLY;
        }
        return PROCESS_AND_REPLY;
    }

private:
    uint8_t _id;
};

static constexpr const char* toString(const Slave::Action action) {
    switch (action) {
        case Slave::IGNORE: return "ignore";
        case Slave::PROCESS_NO_REPLY: return "process (no reply)";
        case Slave::PROCESS_AND_REPLY: return "process & reply";
        default: return "unknown";
    }
}

} // namespace Modbus
