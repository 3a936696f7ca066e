#pragma once
#include <array>
#include <optional>
#include <string>

// COCO labels in the index order the YOLO models emit (0 = person .. 79 = toothbrush)
namespace coco {

constexpr int kNumClasses = 80;

extern const std::array<const char*, kNumClasses> kClassNames;

/** Case-insensitive label -> class index. */
std::optional<int> class_index(const std::string& label);

/** "unknown" when `index` is out of range. */
const char* class_name(int index);

} // namespace coco
