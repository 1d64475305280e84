#ifndef __PRECOMPILED_H__
#define __PRECOMPILED_H__

// Standard C++ Libraries
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <deque>
#include <list>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>
#include <cstring>
#include <cctype>
#include <unordered_set>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <future>
#include <cmath>
#include <utility>

namespace fs = std::filesystem;

// spdlog header
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

constexpr std::string_view LOG_NAME = "arkviewLogger";

#endif
