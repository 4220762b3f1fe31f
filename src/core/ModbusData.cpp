/**
 * @file ModbusData.cpp
 * @brief Typed register conversions
 */

#include "ModbusData.hpp"

namespace Modbus {

bool Registers::is32BitOrder(ByteOrder order) {
    switch (order) {
        case ByteOrder::ABCD:
        case ByteOrder::CDAB:
        case ByteOrder::BADC:
        case ByteOrder::DCBA:
            return true;
        default:
            return false;
    }
}

bool Registers::is16BitOrder(ByteOrder order) {
    return order == ByteOrder::AB || order == ByteOrder::BA;
}

static inline uint16_t swapBytes(uint16_t v) {
    return (uint16_t)((v << 8) | (v >> 8));
}

// ===================================================================================
// 32-BIT VALUES
// ===================================================================================

size_t Registers::setUint32(uint32_t value, size_t index, ByteOrder order) {
    if (!is32BitOrder(order)) return 0;
    if (index + 2 > CAPACITY) return 0;

    uint16_t hi = (uint16_t)(value >> 16);  // AB
    uint16_t lo = (uint16_t)(value & 0xFFFF); // CD
    uint16_t r0, r1;
    switch (order) {
        case ByteOrder::ABCD: r0 = hi;            r1 = lo;            break;
        case ByteOrder::CDAB: r0 = lo;            r1 = hi;            break;
        case ByteOrder::BADC: r0 = swapBytes(hi); r1 = swapBytes(lo); break;
        default:              r0 = swapBytes(lo); r1 = swapBytes(hi); break; // DCBA
    }
    set(index, r0);
    set(index + 1, r1);
    return 2;
}

bool Registers::getUint32(uint32_t& value, size_t index, ByteOrder order) const {
    if (!is32BitOrder(order)) return false;
    if (index + 2 > size()) return false;

    uint16_t r0 = _data[index];
    uint16_t r1 = _data[index + 1];
    uint16_t hi, lo;
    switch (order) {
        case ByteOrder::ABCD: hi = r0;            lo = r1;            break;
        case ByteOrder::CDAB: hi = r1;            lo = r0;            break;
        case ByteOrder::BADC: hi = swapBytes(r0); lo = swapBytes(r1); break;
        default:              hi = swapBytes(r1); lo = swapBytes(r0); break; // DCBA
    }
    value = ((uint32_t)hi << 16) | lo;
    return true;
}

size_t Registers::setInt32(int32_t value, size_t index, ByteOrder order) {
    uint32_t raw;
    memcpy(&raw, &value, sizeof(raw));
    return setUint32(raw, index, order);
}

bool Registers::getInt32(int32_t& value, size_t index, ByteOrder order) const {
    uint32_t raw;
    if (!getUint32(raw, index, order)) return false;
    memcpy(&value, &raw, sizeof(value));
    return true;
}

// IEEE 754 single precision, bit pattern handled as a uint32
size_t Registers::setFloat(float value, size_t index, ByteOrder order) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32-bit");
    uint32_t raw;
    memcpy(&raw, &value, sizeof(raw));
    return setUint32(raw, index, order);
}

bool Registers::getFloat(float& value, size_t index, ByteOrder order) const {
    uint32_t raw;
    if (!getUint32(raw, index, order)) return false;
    memcpy(&value, &raw, sizeof(value));
    return true;
}

// ===================================================================================
// 16-BIT VALUES
// ===================================================================================

size_t Registers::setUint16(uint16_t value, size_t index, ByteOrder order) {
    if (!is16BitOrder(order)) return 0;
    if (index >= CAPACITY) return 0;
    set(index, order == ByteOrder::BA ? swapBytes(value) : value);
    return 1;
}

bool Registers::getUint16(uint16_t& value, size_t index, ByteOrder order) const {
    if (!is16BitOrder(order)) return false;
    if (index >= size()) return false;
    value = (order == ByteOrder::BA) ? swapBytes(_data[index]) : _data[index];
    return true;
}

size_t Registers::setInt16(int16_t value, size_t index, ByteOrder order) {
    uint16_t raw;
    memcpy(&raw, &value, sizeof(raw));
    return setUint16(raw, index, order);
}

bool Registers::getInt16(int16_t& value, size_t index, ByteOrder order) const {
    uint16_t raw;
    if (!getUint16(raw, index, order)) return false;
    memcpy(&value, &raw, sizeof(value));
    return true;
}

} // namespace Modbus
