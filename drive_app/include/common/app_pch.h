#pragma once
// app_pch.h

#include <thread>
#include <chrono>
#include <algorithm>
#include <string>
#include <memory>
#include <vector>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <PxPhysicsAPI.h>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <nlohmann/json.hpp>
