#include "time_utils.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

static bool digits_at(const std::string& s, std::initializer_list<size_t> positions) {
    for (size_t p : positions) {
        if (p >= s.size() || !std::isdigit(static_cast<unsigned char>(s[p])))
            return false;
    }
    return true;
}

std::string annex_time_display(const std::string& stamp) {
    // 2006-01-02@15-04-05
    if (stamp.size() < 19 || stamp[4] != '-' || stamp[7] != '-' || stamp[10] != '@' ||
        stamp[13] != '-' || stamp[16] != '-')
        return "";
    if (!digits_at(stamp, {0, 1, 2, 3, 5, 6, 8, 9, 11, 12, 14, 15, 17, 18}))
        return "";
    return stamp.substr(0, 10) + " " + stamp.substr(11, 2) + ":" + stamp.substr(14, 2) + ":" +
           stamp.substr(17, 2);
}

std::string iso_date_suffix(const std::string& iso) {
    if (iso.size() < 19 || iso[10] != 'T')
        return iso;
    return iso.substr(0, 10) + "-" + iso.substr(11, 2) + iso.substr(14, 2) + iso.substr(17, 2);
}
