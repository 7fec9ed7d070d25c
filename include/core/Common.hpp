#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <functional>
#include <unordered_map>
#include <stdexcept>
#include <algorithm>
#include <iostream>
