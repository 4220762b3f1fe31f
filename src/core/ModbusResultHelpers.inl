// @file ModbusResultHelpers.inl
// @brief Helper functions for codec results (cast Success/Error)
// @brief Included inside the namespace that declares `Result`, `SUCCESS`
//        and a `toString(Result)` overload

// Helper to cast an error
// - Returns a Result
// - Captures point of call context & prints a log message when debug
// is enabled. No overhead when debug is disabled.
static inline Result Error(Result res, const char* desc = nullptr
                    #if defined(MBCODEC_DEBUG)
                    , CallCtx ctx = CallCtx()
                    #endif
                    ) {
    #if defined(MBCODEC_DEBUG)
        if (desc && *desc != '\0') {
            Modbus::Debug::LOG_MSGF_CTX(ctx, "Error: %s (%s)", toString(res), desc);
        } else {
            Modbus::Debug::LOG_MSGF_CTX(ctx, "Error: %s", toString(res));
        }
    #else
        (void)desc;
    #endif
    return res;
}

// Helper to cast a success
// - Returns Result::SUCCESS
// - Captures point of call context & prints a log message when debug
// is enabled and a description is given. No overhead when debug is disabled.
static inline Result Success(const char* desc = nullptr
                        #if defined(MBCODEC_DEBUG)
                        , CallCtx ctx = CallCtx()
                        #endif
                        ) {
    #if defined(MBCODEC_DEBUG)
        if (desc && *desc != '\0') {
            Modbus::Debug::LOG_MSGF_CTX(ctx, "Success: %s", desc);
        }
    #else
        (void)desc;
    #endif
    return SUCCESS;
}
