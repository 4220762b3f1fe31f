/**
 * @file ModbusDebug.cpp
 * @brief Modbus debug utilities implementation
 */

#include "ModbusDebug.hpp"
#include <cstdarg>  // For va_list, va_start, va_end

#ifdef MBCODEC_DEBUG

namespace Modbus {
namespace Debug {

namespace {

static constexpr char HEX_LUT[] = "0123456789ABCDEF";

/* @brief Bounded line builder over a fixed char buffer
 * @note Manual formatting, no snprintf (low-resource MCU friendly).
 *       Characters that do not fit are dropped, the line stays terminated.
 */
struct Line {
    char buf[MAX_DEBUG_MSG_SIZE];
    size_t idx = 0;

    Line() { buf[0] = '\0'; }

    void put(char c) {
        if (idx < sizeof(buf) - 1) buf[idx++] = c;
        buf[idx] = '\0';
    }
    void str(const char* s) {
        for (const char* p = s ? s : ""; *p; ++p) put(*p);
    }
    void dec(uint32_t n) {
        char num[10];
        int len = 0;
        do {
            num[len++] = char('0' + (n % 10));
            n /= 10;
        } while (n && len < 10);
        while (len) put(num[--len]);
    }
    void hex8(uint8_t v) {
        put(HEX_LUT[v >> 4]);
        put(HEX_LUT[v & 0x0F]);
    }
    void hex16(uint16_t v) {
        hex8((uint8_t)(v >> 8));
        hex8((uint8_t)(v & 0xFF));
    }
    // Room left for n more chars + "..." before the terminator
    bool fits(size_t n) const { return idx + n + 3 < sizeof(buf) - 1; }
    void send() { Modbus::LogSink::logln(buf); }
};

void logField(const char* label, uint32_t value) {
    Line l;
    l.str("> ");
    l.str(label);
    l.str(": ");
    l.dec(value);
    l.send();
}

void logHeader(const char* desc, const char* fallback, const CallCtx& ctx) {
    Line l;
    l.idx = buildPrefix(l.buf, sizeof(l.buf), ctx);
    l.str(desc ? desc : fallback);
    l.put(':');
    l.send();
}

void logFunctionCode(FunctionCode fc) {
    Line l;
    l.str("> Function code  : 0x");
    l.hex8((uint8_t)fc);
    l.str(" (");
    l.str(Modbus::toString(fc));
    l.put(')');
    l.send();
}

void logRegisters(const Registers& regs) {
    if (regs.empty()) return;
    Line l;
    l.str("> Registers      : ");
    for (uint16_t reg : regs) {
        if (!l.fits(7)) { l.str("..."); break; }
        l.str("0x");
        l.hex16(reg);
        l.put(' ');
    }
    l.send();
}

void logCoils(const Coils& coils) {
    if (coils.empty()) return;
    Line l;
    l.str("> Coils          : ");
    for (size_t i = 0; i < coils.size(); ++i) {
        if (!l.fits(1)) { l.str("..."); break; }
        l.put(coils[i] ? '1' : '0');
    }
    l.send();
}

void logBytes(const Bytes& raw) {
    if (raw.empty()) return;
    Line l;
    l.str("> Payload        : ");
    for (uint8_t b : raw) {
        if (!l.fits(3)) { l.str("..."); break; }
        l.hex8(b);
        l.put(' ');
    }
    l.send();
}

} // namespace

/* @brief Copy the prefix into dst and return the number of characters written.
 * @brief Reduces calls to snprintf in logs (heavy overhead on RP2040)
 * @param dst Destination buffer
 * @param dstSize Size of the destination buffer
 * @param ctx Call context (file, function, line)
 * @return Number of characters written
 */
size_t buildPrefix(char* dst, size_t dstSize, const CallCtx& ctx) {
    if (dstSize == 0) return 0;

    size_t i = 0;
    auto put = [&](char c) {
        if (i < dstSize - 1) dst[i++] = c;   // Leave space for '\0'
    };
    auto putStr = [&](const char* s) {
        for (const char* p = s; *p; ++p) put(*p);
    };

    put('[');
    putStr(ctx.file ? ModbusTypeDef::getBasename(ctx.file) : "unknown");
    put(':'); put(':');
    putStr(ctx.function ? ctx.function : "unknown");
    put(':');

    char num[10];
    int len = 0;
    uint32_t n = ctx.line > 0 ? (uint32_t)ctx.line : 0;
    do {
        num[len++] = char('0' + (n % 10));
        n /= 10;
    } while (n && len < 10);
    while (len) put(num[--len]);

    put(']'); put(' ');

    dst[i] = '\0';
    return i;
}

/* @brief Log a simple debug message with context information
 * @param message Message to log
 * @param ctx Call context (file, function, line)
 */
void LOG_MSG(const char* message, CallCtx ctx) {
    Line l;
    l.idx = buildPrefix(l.buf, sizeof(l.buf), ctx);
    l.str(message);
    l.send();
}

/* @brief Format and log a debug message with printf-style formatting
 * @param ctx Call context (file, function, line)
 * @param userFmt Printf-style format string
 * @param ... Arguments for the format string
 * @note Uses vsnprintf internally
 */
void LOG_MSGF_CTX(CallCtx ctx, const char* userFmt, ...) {
    // Prefix first, user message formatted after it: the prefix is never
    // part of the format string
    Line l;
    l.idx = buildPrefix(l.buf, sizeof(l.buf), ctx);

    va_list args;
    va_start(args, userFmt);
    int written = vsnprintf(l.buf + l.idx, sizeof(l.buf) - l.idx, userFmt ? userFmt : "", args);
    va_end(args);
    if (written < 0) l.buf[l.idx] = '\0';

    l.send();
}

/* @brief Log a hexdump of a byte buffer with context information
 * @param bytes Byte buffer to log
 * @param ctx Call context (file, function, line)
 */
void LOG_HEXDUMP(const ByteBuffer& bytes, CallCtx ctx) {
    Line l;
    l.idx = buildPrefix(l.buf, sizeof(l.buf), ctx);
    l.str("Hexdump: ");

    if (bytes.empty()) {
        l.str("<empty>");
        l.send();
        return;
    }

    for (uint8_t b : bytes) {
        if (!l.fits(3)) { l.str("..."); break; }
        l.hex8(b);
        l.put(' ');
    }
    l.send();
}

/* @brief Log a Modbus request field by field
 * @param request Request to log
 * @param desc Description (optional)
 * @param ctx Call context (file, function, line)
 */
void LOG_FRAME(const Modbus::Request& request, const char* desc, CallCtx ctx) {
    logHeader(desc, "Request", ctx);
    logFunctionCode(request.fc);

    switch (request.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
            logField("Address        ", request.regAddress);
            logField("Quantity       ", request.regCount);
            break;
        case WRITE_COIL:
        case WRITE_REGISTER:
            logField("Address        ", request.regAddress);
            logField("Value          ", request.value);
            break;
        case WRITE_MULTIPLE_COILS:
            logField("Address        ", request.regAddress);
            logCoils(request.coils);
            break;
        case WRITE_MULTIPLE_REGISTERS:
            logField("Address        ", request.regAddress);
            logRegisters(request.registers);
            break;
        case DIAGNOSTICS:
            logField("Sub-function   ", request.subFunction);
            logRegisters(request.registers);
            break;
        case MASK_WRITE_REGISTER:
            logField("Address        ", request.regAddress);
            logField("AND mask       ", request.andMask);
            logField("OR mask        ", request.orMask);
            break;
        case READ_WRITE_MULTIPLE_REGISTERS:
            logField("Read address   ", request.regAddress);
            logField("Read quantity  ", request.regCount);
            logField("Write address  ", request.writeAddress);
            logRegisters(request.registers);
            break;
        default:
            logBytes(request.raw);
            break;
    }
}

/* @brief Log a Modbus response field by field
 * @param response Response to log
 * @param desc Description (optional)
 * @param ctx Call context (file, function, line)
 */
void LOG_FRAME(const Modbus::Response& response, const char* desc, CallCtx ctx) {
    logHeader(desc, "Response", ctx);
    logFunctionCode(response.fc);

    if (response.isException()) {
        Line l;
        l.str("> Exception      : 0x");
        l.hex8((uint8_t)response.exceptionCode);
        l.str(" (");
        l.str(Modbus::toString(response.exceptionCode));
        l.put(')');
        l.send();
        return;
    }

    switch (response.fc) {
        case READ_COILS:
        case READ_DISCRETE_INPUTS:
            logCoils(response.coils);
            break;
        case READ_HOLDING_REGISTERS:
        case READ_INPUT_REGISTERS:
        case READ_WRITE_MULTIPLE_REGISTERS:
            logRegisters(response.registers);
            break;
        case WRITE_COIL:
        case WRITE_REGISTER:
            logField("Address        ", response.regAddress);
            logField("Value          ", response.value);
            break;
        case WRITE_MULTIPLE_COILS:
        case WRITE_MULTIPLE_REGISTERS:
            logField("Address        ", response.regAddress);
            logField("Quantity       ", response.regCount);
            break;
        case READ_EXCEPTION_STATUS:
            logField("Status         ", response.value);
            break;
        case DIAGNOSTICS:
            logField("Sub-function   ", response.subFunction);
            logRegisters(response.registers);
            break;
        case GET_COMM_EVENT_COUNTER:
            logField("Status         ", response.status);
            logField("Event count    ", response.eventCount);
            break;
        case GET_COMM_EVENT_LOG:
            logField("Status         ", response.status);
            logField("Event count    ", response.eventCount);
            logField("Message count  ", response.messageCount);
            logBytes(response.raw);
            break;
        case REPORT_SERVER_ID:
            logBytes(response.raw);
            logField("Run indicator  ", response.runIndicator ? 1 : 0);
            break;
        case MASK_WRITE_REGISTER:
            logField("Address        ", response.regAddress);
            logField("AND mask       ", response.andMask);
            logField("OR mask        ", response.orMask);
            break;
        default:
            logBytes(response.raw);
            break;
    }
}

} // namespace Debug
} // namespace Modbus

#endif // MBCODEC_DEBUG
