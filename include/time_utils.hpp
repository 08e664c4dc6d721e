#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Current local time formatted as YYYY-MM-DD HH:MM:SS.mmm.
 */
std::string timestamp();

/**
 * @brief Format an elapsed duration as a short string like 1h2m3s.
 *
 * Durations below one second are rendered in milliseconds (e.g. 420ms).
 */
std::string format_duration_short(std::chrono::milliseconds dur);

#endif // TIME_UTILS_HPP
