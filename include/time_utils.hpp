#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Convert a git-annex metadata timestamp to display form.
 *
 * git-annex records `<field>-lastchanged` values as `YYYY-MM-DD@HH-MM-SS`.
 *
 * @return `YYYY-MM-DD HH:MM:SS`, or an empty string if @p stamp does not have
 *         that shape.
 */
std::string annex_time_display(const std::string& stamp);

/**
 * @brief Turn an ISO 8601 commit date into a file name suffix.
 *
 * `2019-07-07T12:34:56+02:00` becomes `2019-07-07-123456`. Anything shorter
 * than a full date-time is returned unchanged.
 */
std::string iso_date_suffix(const std::string& iso);

#endif // TIME_UTILS_HPP
