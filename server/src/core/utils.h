#pragma once

#include <chrono>
#include <string>

namespace scripthub {
namespace utils {

// 当前时间，格式：YYYY-MM-DD HH:MM:SS.mmm
std::string now_string();

// 当前时间戳（毫秒）
long long now_millis();

std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

// 去掉首尾空白（空格、\t、\r、\n）
std::string trim(const std::string& s);

} // namespace utils
} // namespace scripthub
