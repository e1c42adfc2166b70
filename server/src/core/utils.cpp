#include "utils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace scripthub {
namespace utils {

std::string now_string() {
    return formatTimestampMs(std::chrono::system_clock::now());
}

long long now_millis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               system_clock::now().time_since_epoch()
           ).count();
}

std::string formatTimestampMs(const std::chrono::system_clock::time_point &ts)
{
    // 秒部分
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);

    // 毫秒部分
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;

    // localtime_r 线程安全
    std::tm buf{};
    localtime_r(&t, &buf);

    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string trim(const std::string &s)
{
    const char* ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace utils
} // namespace scripthub
