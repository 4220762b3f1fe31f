/**
 * @file MBCodec.h
 * @brief Main include file for the MBCodec library
 */

#pragma once

// Core components
#include "core/ModbusCore.h"
#include "core/ModbusData.hpp"
#include "core/ModbusFrame.hpp"
#include "core/ModbusSlave.hpp"

// Codecs (PDU, RTU & TCP)
#include "core/ModbusCodec.hpp"
