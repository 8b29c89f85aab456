// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <thread>
#include <chrono>
#include <optional>
#include <memory>
#include <functional>
#include <atomic>
