#pragma once

// Windows
#define NOMINMAX
#include <Windows.h>
#include <ShlObj.h>

// STL
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <unordered_map>
#include <span>
#include <sstream>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <cctype>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <iomanip>
#include <fstream>

// Third-party
#include <spdlog/spdlog.h>
#include <pugixml.hpp>
#include <sqlite3.h>
#include <pnq/pnq.h>
#include <pnq/regis3.h>
#include <pnq/sqlite/sqlite.h>
#include <miniz.h>
