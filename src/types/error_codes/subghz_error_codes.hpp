// src/types/error_codes/subghz_error_codes.hpp
#pragma once

#include <string>
#include <system_error>

namespace subghz {

/**
 * @brief Error codes reported by the sub-GHz command-protocol driver
 */
enum class SubGhzErrorCode {
    kSuccess = 0,            ///< Operation completed successfully
    kBusTimeout,             ///< Busy signal never cleared
    kTransportError,         ///< Underlying byte transport reported a fault
    kBufferOverflow,         ///< Offset and length exceed buffer capacity
    kIllegalTransition,      ///< Command not permitted in the current mode
    kConfigurationMismatch,  ///< Parameters do not match the packet type
    kInvalidParameter,       ///< Invalid parameter provided
    kTimeout,                ///< Packet operation timed out
    kCommandFailed,          ///< Radio reported a command error in its status
    kHandleInUse,            ///< Another radio handle is still live
    kNotInitialized,         ///< Driver not initialized
    kRadioError              ///< Radio operation failed (wraps a cause)
};

/**
 * @brief Custom error category for sub-GHz driver errors
 */
class SubGhzErrorCategory : public std::error_category {
   public:
    /**
     * @brief Get the singleton instance of the error category
     * 
     * @return const SubGhzErrorCategory& Reference to the singleton instance
     */
    static const SubGhzErrorCategory& GetInstance() {
        static SubGhzErrorCategory instance;
        return instance;
    }

    /**
     * @brief Get the name of the error category
     * 
     * @return const char* Name of the error category
     */
    const char* name() const noexcept override { return "subghz_error"; }

    /**
     * @brief Get a human-readable error message for a given error code
     * 
     * @param condition The error code to get the message for
     * @return std::string Human-readable error message
     */
    std::string message(int condition) const override {
        switch (static_cast<SubGhzErrorCode>(condition)) {
            case SubGhzErrorCode::kSuccess:
                return "Success";
            case SubGhzErrorCode::kBusTimeout:
                return "Busy signal did not clear in time";
            case SubGhzErrorCode::kTransportError:
                return "Command bus transport fault";
            case SubGhzErrorCode::kBufferOverflow:
                return "Buffer overflow detected";
            case SubGhzErrorCode::kIllegalTransition:
                return "Command not permitted in current radio mode";
            case SubGhzErrorCode::kConfigurationMismatch:
                return "Parameters do not match the packet type";
            case SubGhzErrorCode::kInvalidParameter:
                return "Invalid parameter provided";
            case SubGhzErrorCode::kTimeout:
                return "Operation timed out";
            case SubGhzErrorCode::kCommandFailed:
                return "Radio reported a command failure";
            case SubGhzErrorCode::kHandleInUse:
                return "Radio handle already in use";
            case SubGhzErrorCode::kNotInitialized:
                return "Radio not initialized";
            case SubGhzErrorCode::kRadioError:
                return "Radio operation failed";
            default:
                return "Unknown error";
        }
    }

   private:
    SubGhzErrorCategory() = default;  // Private constructor for singleton
};

}  // namespace subghz
