#pragma once
#include <string>

namespace corpus {

struct Document {
    std::string id;    // source path or caller-supplied key
    std::string text;  // decoded text, invalid UTF-8 already replaced
};

}
