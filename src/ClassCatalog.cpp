#include "ClassCatalog.hpp"
#include <algorithm>
#include <cctype>

namespace coco {

const std::array<const char*, kNumClasses> kClassNames = {{
    "person",         "bicycle",       "car",              "motorcycle",     "airplane",
    "bus",            "train",         "truck",            "boat",           "traffic light",
    "fire hydrant",   "stop sign",     "parking meter",    "bench",          "bird",
    "cat",            "dog",           "horse",            "sheep",          "cow",
    "elephant",       "bear",          "zebra",            "giraffe",        "backpack",
    "umbrella",       "handbag",       "tie",              "suitcase",       "frisbee",
    "skis",           "snowboard",     "sports ball",      "kite",           "baseball bat",
    "baseball glove", "skateboard",    "surfboard",        "tennis racket",  "bottle",
    "wine glass",     "cup",           "fork",             "knife",          "spoon",
    "bowl",           "banana",        "apple",            "sandwich",       "orange",
    "broccoli",       "carrot",        "hot dog",          "pizza",          "donut",
    "cake",           "chair",         "couch",            "potted plant",   "bed",
    "dining table",   "toilet",        "tv",               "laptop",         "mouse",
    "remote",         "keyboard",      "cell phone",       "microwave",      "oven",
    "toaster",        "sink",          "refrigerator",     "book",           "clock",
    "vase",           "scissors",      "teddy bear",       "hair drier",     "toothbrush"
}};

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int> class_index(const std::string& label)
{
    const std::string key = lower(label);
    for (int i = 0; i < kNumClasses; ++i) {
        if (key == kClassNames[i]) return i;
    }
    return std::nullopt;
}

const char* class_name(int index)
{
    if (index < 0 || index >= kNumClasses) return "unknown";
    return kClassNames[index];
}

} // namespace coco
