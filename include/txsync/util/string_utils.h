#ifndef TXSYNC_STRING_UTILS_H
#define TXSYNC_STRING_UTILS_H

#include <txsync/txsync_export.h>
#include <txsync/util/date_time.h>

#include <exception>
#include <string>
#include <string_view>

namespace txsync {
    template<typename T>
    std::string to_string(const T &value);

    template<>
    TXSYNC_EXPORT std::string to_string(const bool &value);

    template<>
    TXSYNC_EXPORT std::string to_string(const engine_time_t &value);

    template<>
    TXSYNC_EXPORT std::string to_string(const engine_time_delta_t &value);

    template<>
    TXSYNC_EXPORT std::string to_string(const millis_t &value);

    /**
     * ASCII lower-casing, sufficient for the English wallet error messages matched against.
     */
    TXSYNC_EXPORT std::string to_lower(std::string_view value);

    TXSYNC_EXPORT bool contains(std::string_view haystack, std::string_view needle);

    /**
     * The message of the exception held by ``error``, "Unknown error" when it is empty or not a std::exception.
     */
    TXSYNC_EXPORT std::string exception_message(const std::exception_ptr &error);
} // namespace txsync

#endif  // TXSYNC_STRING_UTILS_H
