#include <txsync/util/string_utils.h>

#include <algorithm>
#include <cctype>
#include <ctime>

namespace txsync {
    template<>
    std::string to_string(const bool &value) { return value ? "true" : "false"; }

    template<>
    std::string to_string(const engine_time_t &value) {
        auto tt = std::chrono::system_clock::to_time_t(std::chrono::time_point_cast<engine_clock::duration>(value));
        auto tm = *std::gmtime(&tt);
        char buffer[32];
        std::strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &tm);
        return {buffer};
    }

    template<>
    std::string to_string(const engine_time_delta_t &value) {
        auto hours = std::chrono::duration_cast<std::chrono::hours>(value);
        auto mins = std::chrono::duration_cast<std::chrono::minutes>(value - hours);
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(value - hours - mins);
        return std::to_string(hours.count()) + ":" + std::to_string(mins.count()) + ":" + std::to_string(secs.count());
    }

    template<>
    std::string to_string(const millis_t &value) { return std::to_string(value.count()) + "ms"; }

    std::string to_lower(std::string_view value) {
        std::string result{value};
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    std::string exception_message(const std::exception_ptr &error) {
        if (!error) { return "Unknown error"; }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &e) {
            return e.what();
        } catch (...) {
            return "Unknown error";
        }
    }
} // namespace txsync
